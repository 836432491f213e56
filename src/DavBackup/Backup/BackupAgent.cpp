/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the DavBackup project.
 */

#include "DavBackup/Backup/BackupAgent.h"
#include <Logging/Logger.h>
#include <algorithm>
#include <atomic>
#include <format>
#include <mutex>
#include <set>
#include <thread>

namespace DavBackup::Backup {

BackupAgent::BackupAgent(std::shared_ptr<WebDAV::WebDAVClient> client, AgentOptions options)
    : _client(std::move(client)), _options(std::move(options)) {
    if (_options.maxConcurrentSidecarFetches == 0) {
        _options.maxConcurrentSidecarFetches = 1;
    }
}

Result<void> BackupAgent::uploadBackup(const BackupRecord& record, const Transfer::StreamFactory& openStream) {
    auto fail = [](const std::string& cause) {
        return Result<void>::err(StorageError::TransferFailure, std::format("Upload to ownCloud failed: {}", cause));
    };

    if (!openStream) {
        return fail("no backup stream provided");
    }
    auto stream = openStream();
    if (stream.failed()) {
        return fail(stream.describe());
    }
    if (!stream.value) {
        return fail("backup stream could not be opened");
    }

    auto spooled = Transfer::spoolToStagingFile(*stream.value, _options.spool);
    if (spooled.failed()) {
        return fail(spooled.describe());
    }
    stream.value.reset();

    const auto tarName = archiveName(record.backupId);
    auto put = _client->putFile(tarName, spooled.value.file.path(), static_cast<int64_t>(spooled.value.size));
    // Staging copy is no longer needed once the archive went out (or failed to)
    spooled.value.file.remove();
    if (put.failed()) {
        return fail(put.describe());
    }

    auto meta = _client->putBytes(sidecarName(record.backupId), record.toSidecar());
    if (meta.failed()) {
        return fail(meta.describe());
    }

    ENTROPY_LOG_INFO_CAT("BackupAgent", std::format("Uploaded backup {} ({} bytes)", record.backupId, spooled.value.size));
    return Result<void>::ok();
}

std::vector<BackupRecord> BackupAgent::fetchSidecars(const std::vector<std::string>& sidecarNames) {
    std::vector<BackupRecord> records;
    if (sidecarNames.empty()) return records;

    std::mutex resultsMutex;
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        for (;;) {
            size_t i = next.fetch_add(1);
            if (i >= sidecarNames.size()) return;
            const auto& name = sidecarNames[i];

            auto raw = _client->getBytes(name);
            if (raw.failed()) {
                ENTROPY_LOG_WARNING_CAT("BackupAgent", std::format("Skipping unreadable metadata {}: {}", name, raw.describe()));
                continue;
            }
            auto rec = BackupRecord::fromSidecar(raw.value);
            if (rec.failed()) {
                ENTROPY_LOG_WARNING_CAT("BackupAgent", std::format("Skipping invalid metadata {}: {}", name, rec.describe()));
                continue;
            }

            std::lock_guard<std::mutex> lock(resultsMutex);
            records.push_back(std::move(rec.value));
        }
    };

    size_t workerCount = std::min(_options.maxConcurrentSidecarFetches, sidecarNames.size());
    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (size_t w = 0; w < workerCount; ++w) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }
    return records;
}

Result<std::vector<BackupRecord>> BackupAgent::listBackups() {
    using R = Result<std::vector<BackupRecord>>;
    auto fail = [](StorageError error, const std::string& cause) {
        return R::err(error, std::format("Listing backups failed: {}", cause));
    };

    auto names = _client->listFolder();
    if (names.failed()) {
        return fail(names.error, names.describe());
    }

    std::vector<std::string> sidecars;
    std::vector<std::string> archives;
    for (const auto& n : names.value) {
        if (isSidecarName(n)) sidecars.push_back(n);
        else if (isArchiveName(n)) archives.push_back(n);
    }

    auto records = fetchSidecars(sidecars);

    std::set<std::string> archiveIds;
    for (const auto& a : archives) {
        if (auto id = idFromArchiveName(a)) archiveIds.insert(*id);
    }
    std::set<std::string> knownIds;
    for (const auto& r : records) {
        knownIds.insert(r.backupId);
        if (!archiveIds.count(r.backupId)) {
            ENTROPY_LOG_WARNING_CAT("BackupAgent", std::format("Metadata for backup {} has no archive", r.backupId));
        }
    }

    for (const auto& id : archiveIds) {
        if (knownIds.count(id)) continue;
        auto info = _client->stat(archiveName(id));
        if (info.failed()) {
            return fail(info.error, info.describe());
        }
        records.push_back(BackupRecord::synthesize(id, info.value.modifiedIso, info.value.size));
    }

    std::stable_sort(records.begin(), records.end(), [](const BackupRecord& a, const BackupRecord& b) {
        return a.date > b.date;
    });
    return R::ok(std::move(records));
}

Result<BackupRecord> BackupAgent::getBackup(const std::string& backupId) {
    using R = Result<BackupRecord>;

    auto raw = _client->getBytes(sidecarName(backupId));
    if (raw.success()) {
        auto rec = BackupRecord::fromSidecar(raw.value);
        if (rec.failed()) {
            return R::err(StorageError::MetadataCorruption,
                          std::format("Get backup metadata failed: {}", rec.describe()));
        }
        return rec;
    }
    if (!raw.notFound()) {
        return R::err(raw.error, std::format("Get backup metadata failed: {}", raw.describe()));
    }

    auto info = _client->stat(archiveName(backupId));
    if (info.notFound()) {
        return R::err(StorageError::NotFound, std::format("Backup not found: {}", backupId));
    }
    if (info.failed()) {
        return R::err(info.error, std::format("Get backup failed: {}", info.describe()));
    }
    return R::ok(BackupRecord::synthesize(backupId, info.value.modifiedIso, info.value.size));
}

Result<std::unique_ptr<WebDAV::DownloadStream>> BackupAgent::downloadBackup(const std::string& backupId) {
    using R = Result<std::unique_ptr<WebDAV::DownloadStream>>;

    auto stream = _client->getStream(archiveName(backupId));
    if (stream.notFound()) {
        return R::err(StorageError::NotFound, std::format("Backup not found: {}", backupId));
    }
    if (stream.failed()) {
        return R::err(StorageError::TransferFailure, std::format("Download failed: {}", stream.describe()));
    }
    return stream;
}

Result<void> BackupAgent::deleteBackup(const std::string& backupId) {
    auto fail = [](const Result<void>& cause) {
        return Result<void>::err(cause.error, std::format("Delete failed: {}", cause.describe()));
    };

    auto tar = _client->remove(archiveName(backupId));
    if (tar.failed() && !tar.notFound()) {
        return fail(tar);
    }
    auto meta = _client->remove(sidecarName(backupId));
    if (meta.failed() && !meta.notFound()) {
        return fail(meta);
    }

    if (tar.notFound() && meta.notFound()) {
        return Result<void>::err(StorageError::NotFound, std::format("Backup not found: {}", backupId));
    }
    ENTROPY_LOG_INFO_CAT("BackupAgent", std::format("Deleted backup {}", backupId));
    return Result<void>::ok();
}

} // namespace DavBackup::Backup
