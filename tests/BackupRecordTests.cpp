/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the DavBackup project.
 */

#include <gtest/gtest.h>
#include "DavBackup/Backup/BackupRecord.h"

using namespace DavBackup;
using namespace DavBackup::Backup;

namespace {

std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

TEST(BackupRecord, RemoteNames) {
    EXPECT_EQ(archiveName("abc123"), "ha_backup_abc123.tar");
    EXPECT_EQ(sidecarName("abc123"), "ha_backup_abc123.json");

    EXPECT_TRUE(isArchiveName("ha_backup_abc123.tar"));
    EXPECT_FALSE(isArchiveName("ha_backup_abc123.json"));
    EXPECT_FALSE(isArchiveName("backup_abc123.tar"));
    EXPECT_TRUE(isSidecarName("ha_backup_abc123.json"));
    EXPECT_FALSE(isSidecarName("notes.json"));

    EXPECT_EQ(idFromArchiveName(archiveName("x.y_z")).value_or(""), "x.y_z");
    EXPECT_EQ(idFromSidecarName(sidecarName("x.y_z")).value_or(""), "x.y_z");
    EXPECT_FALSE(idFromArchiveName("ha_backup_.json").has_value());
}

TEST(BackupRecord, FromSidecar_ReadsKnownFields) {
    auto rec = BackupRecord::fromSidecar(bytes(
        R"({"backup_id":"abc","name":"Nightly","date":"2024-06-01T12:00:00+00:00","size":4096,"protected":true})"));
    ASSERT_TRUE(rec.success()) << rec.errorMessage;
    EXPECT_EQ(rec.value.backupId, "abc");
    EXPECT_EQ(rec.value.name, "Nightly");
    EXPECT_EQ(rec.value.date, "2024-06-01T12:00:00+00:00");
    EXPECT_EQ(rec.value.size, 4096u);
    EXPECT_TRUE(rec.value.isProtected);
    EXPECT_TRUE(rec.value.extra.empty());
}

TEST(BackupRecord, UnknownKeysSurviveRoundTrip) {
    auto rec = BackupRecord::fromSidecar(bytes(
        R"({"backup_id":"abc","date":"2024-01-01T00:00:00+00:00","addons":[{"slug":"core_ssh"}],"homeassistant_version":"2024.6.0"})"));
    ASSERT_TRUE(rec.success()) << rec.errorMessage;
    ASSERT_TRUE(rec.value.extra.isMember("addons"));
    EXPECT_EQ(rec.value.extra["homeassistant_version"].asString(), "2024.6.0");

    auto again = BackupRecord::fromSidecar(rec.value.toSidecar());
    ASSERT_TRUE(again.success()) << again.errorMessage;
    EXPECT_EQ(again.value.backupId, "abc");
    EXPECT_EQ(again.value.extra["addons"][0]["slug"].asString(), "core_ssh");
    EXPECT_EQ(again.value.extra["homeassistant_version"].asString(), "2024.6.0");
}

TEST(BackupRecord, SidecarIsCompactUtf8) {
    BackupRecord rec;
    rec.backupId = "u1";
    rec.name = "Sauvegarde \xC3\xA9t\xC3\xA9";
    rec.date = "2024-06-01T12:00:00+00:00";
    rec.size = 10;

    auto raw = rec.toSidecar();
    std::string text(raw.begin(), raw.end());
    EXPECT_EQ(text.find('\n'), std::string::npos);
    EXPECT_NE(text.find("Sauvegarde \xC3\xA9t\xC3\xA9"), std::string::npos);
    EXPECT_NE(text.find("\"protected\":false"), std::string::npos);
}

TEST(BackupRecord, InvalidDescriptors) {
    EXPECT_EQ(BackupRecord::fromSidecar({}).error, StorageError::MetadataCorruption);
    EXPECT_EQ(BackupRecord::fromSidecar(bytes("{not json")).error, StorageError::MetadataCorruption);
    EXPECT_EQ(BackupRecord::fromSidecar(bytes("[]")).error, StorageError::MetadataCorruption);
    EXPECT_EQ(BackupRecord::fromSidecar(bytes(R"({"name":"no id"})")).error, StorageError::MetadataCorruption);
    EXPECT_EQ(BackupRecord::fromSidecar(bytes(R"({"backup_id":"a","size":"big"})")).error,
              StorageError::MetadataCorruption);
    EXPECT_EQ(BackupRecord::fromSidecar(bytes(R"({"backup_id":"a","size":-5})")).error,
              StorageError::MetadataCorruption);
    EXPECT_EQ(BackupRecord::fromSidecar(bytes(R"({"backup_id":"a","protected":"yes"})")).error,
              StorageError::MetadataCorruption);
}

TEST(BackupRecord, SynthesizedRecord) {
    auto rec = BackupRecord::synthesize("a1", "2024-06-01T12:00:00+00:00", 77);
    EXPECT_EQ(rec.backupId, "a1");
    EXPECT_EQ(rec.name, "ownCloud backup (a1)");
    EXPECT_EQ(rec.date, "2024-06-01T12:00:00+00:00");
    EXPECT_EQ(rec.size, 77u);
    EXPECT_FALSE(rec.isProtected);
}

TEST(BackupRecord, FromSidecar_RejectsInvalidUtf8) {
    const char* bad[] = {
        "{\"backup_id\":\"a\xff\"}",          // never valid in UTF-8
        "{\"backup_id\":\"a\",\"n\":\"\xc3\"}", // truncated sequence
        "{\"backup_id\":\"\xc0\xaf\"}",        // overlong slash
        "{\"backup_id\":\"\xed\xa0\x80\"}",    // encoded surrogate
        "{\"backup_id\":\"\xf4\x90\x80\x80\"}" // above U+10FFFF
    };
    for (const char* text : bad) {
        auto rec = BackupRecord::fromSidecar(bytes(text));
        EXPECT_EQ(rec.error, StorageError::MetadataCorruption) << text;
    }

    auto ok = BackupRecord::fromSidecar(bytes("{\"backup_id\":\"\xc3\xa9t\xc3\xa9\xf0\x9f\x93\xa6\"}"));
    ASSERT_TRUE(ok.success()) << ok.errorMessage;
    EXPECT_EQ(ok.value.backupId, "\xc3\xa9t\xc3\xa9\xf0\x9f\x93\xa6");
}

TEST(BackupRecord, FromSidecar_DeepNestingIsCorruptionNotException) {
    std::string text = "{\"backup_id\":\"d\",\"x\":" + std::string(5000, '[') + std::string(5000, ']') + "}";
    Result<BackupRecord> rec;
    EXPECT_NO_THROW(rec = BackupRecord::fromSidecar(bytes(text)));
    EXPECT_EQ(rec.error, StorageError::MetadataCorruption);
}
