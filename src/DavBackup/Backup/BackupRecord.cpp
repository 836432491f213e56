/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the DavBackup project.
 */

#include "DavBackup/Backup/BackupRecord.h"
#include <format>
#include <memory>

namespace DavBackup::Backup {

namespace {

std::optional<std::string> stripAffixes(std::string_view name, std::string_view suffix) {
    if (name.size() < kArchivePrefix.size() + suffix.size()) return std::nullopt;
    if (name.substr(0, kArchivePrefix.size()) != kArchivePrefix) return std::nullopt;
    if (name.substr(name.size() - suffix.size()) != suffix) return std::nullopt;
    return std::string(name.substr(kArchivePrefix.size(), name.size() - kArchivePrefix.size() - suffix.size()));
}

const char* const kKnownKeys[] = {"backup_id", "name", "date", "size", "protected"};

bool isKnownKey(const std::string& key) {
    for (const char* k : kKnownKeys) {
        if (key == k) return true;
    }
    return false;
}

// Strict decoder check: rejects overlong forms, surrogates and code points above U+10FFFF
bool isValidUtf8(const std::vector<uint8_t>& bytes) {
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        const uint8_t c = bytes[i];
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t len = 0;
        uint8_t lo = 0x80, hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0) lo = 0xA0;
            if (c == 0xED) hi = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0) lo = 0x90;
            if (c == 0xF4) hi = 0x8F;
        } else {
            return false;
        }

        if (n - i < len) return false;
        if (bytes[i + 1] < lo || bytes[i + 1] > hi) return false;
        for (size_t k = 2; k < len; ++k) {
            if ((bytes[i + k] & 0xC0) != 0x80) return false;
        }
        i += len;
    }
    return true;
}

} // namespace

std::string archiveName(std::string_view backupId) {
    return std::format("{}{}{}", kArchivePrefix, backupId, kArchiveSuffix);
}

std::string sidecarName(std::string_view backupId) {
    return std::format("{}{}{}", kArchivePrefix, backupId, kSidecarSuffix);
}

bool isArchiveName(std::string_view name) {
    return stripAffixes(name, kArchiveSuffix).has_value();
}

bool isSidecarName(std::string_view name) {
    return stripAffixes(name, kSidecarSuffix).has_value();
}

std::optional<std::string> idFromArchiveName(std::string_view name) {
    return stripAffixes(name, kArchiveSuffix);
}

std::optional<std::string> idFromSidecarName(std::string_view name) {
    return stripAffixes(name, kSidecarSuffix);
}

Result<BackupRecord> BackupRecord::fromJson(const Json::Value& value) {
    using R = Result<BackupRecord>;
    if (!value.isObject()) {
        return R::err(StorageError::MetadataCorruption, "Backup descriptor is not a JSON object");
    }

    BackupRecord rec;
    const auto& id = value["backup_id"];
    if (!id.isString() || id.asString().empty()) {
        return R::err(StorageError::MetadataCorruption, "Backup descriptor has no backup_id");
    }
    rec.backupId = id.asString();

    if (value.isMember("name")) {
        if (!value["name"].isString()) return R::err(StorageError::MetadataCorruption, "name must be a string");
        rec.name = value["name"].asString();
    }
    if (value.isMember("date")) {
        if (!value["date"].isString()) return R::err(StorageError::MetadataCorruption, "date must be a string");
        rec.date = value["date"].asString();
    }
    if (value.isMember("size")) {
        const auto& size = value["size"];
        if (!size.isIntegral() || (size.isInt64() && size.asInt64() < 0)) {
            return R::err(StorageError::MetadataCorruption, "size must be a non-negative integer");
        }
        rec.size = size.asUInt64();
    }
    if (value.isMember("protected")) {
        if (!value["protected"].isBool()) return R::err(StorageError::MetadataCorruption, "protected must be a boolean");
        rec.isProtected = value["protected"].asBool();
    }

    for (const auto& key : value.getMemberNames()) {
        if (!isKnownKey(key)) rec.extra[key] = value[key];
    }
    return R::ok(std::move(rec));
}

Result<BackupRecord> BackupRecord::fromSidecar(const std::vector<uint8_t>& bytes) {
    if (!isValidUtf8(bytes)) {
        return Result<BackupRecord>::err(StorageError::MetadataCorruption, "Sidecar is not valid UTF-8");
    }

    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errs;
    const char* begin = reinterpret_cast<const char*>(bytes.data());
    bool parsed = false;
    try {
        parsed = !bytes.empty() && reader->parse(begin, begin + bytes.size(), &root, &errs);
    } catch (const Json::Exception& e) {
        // Raised for documents nested deeper than the reader's stack limit
        return Result<BackupRecord>::err(StorageError::MetadataCorruption,
                                         std::format("Invalid sidecar JSON: {}", e.what()));
    }
    if (!parsed) {
        return Result<BackupRecord>::err(StorageError::MetadataCorruption,
                                         std::format("Invalid sidecar JSON: {}", errs.empty() ? "empty document" : errs));
    }
    return fromJson(root);
}

Json::Value BackupRecord::toJson() const {
    Json::Value out = extra.isObject() ? extra : Json::Value(Json::objectValue);
    out["backup_id"] = backupId;
    out["name"] = name;
    out["date"] = date;
    out["size"] = Json::Value::UInt64(size);
    out["protected"] = isProtected;
    return out;
}

std::vector<uint8_t> BackupRecord::toSidecar() const {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    std::string text = Json::writeString(builder, toJson());
    return std::vector<uint8_t>(text.begin(), text.end());
}

BackupRecord BackupRecord::synthesize(const std::string& backupId, std::string date, uint64_t size) {
    BackupRecord rec;
    rec.backupId = backupId;
    rec.name = std::format("ownCloud backup ({})", backupId);
    rec.date = std::move(date);
    rec.size = size;
    rec.isProtected = false;
    return rec;
}

} // namespace DavBackup::Backup
