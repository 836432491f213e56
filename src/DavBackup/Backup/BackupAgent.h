/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the DavBackup project.
 */

/**
 * @file BackupAgent.h
 * @brief Stores, lists, restores and deletes backups in a WebDAV folder
 *
 * Each backup is two files: the archive "ha_backup_<id>.tar" and a JSON
 * sidecar "ha_backup_<id>.json" holding its descriptor. Listing reconciles
 * the two so an archive whose sidecar is missing still shows up.
 */

#pragma once

#include "DavBackup/Backup/BackupRecord.h"
#include "DavBackup/Core/ErrorCodes.h"
#include "DavBackup/Transfer/ChunkSource.h"
#include "DavBackup/Transfer/Spooler.h"
#include "DavBackup/WebDAV/DownloadStream.h"
#include "DavBackup/WebDAV/WebDAVClient.h"
#include <memory>
#include <string>
#include <vector>

namespace DavBackup::Backup {

struct AgentOptions {
    size_t maxConcurrentSidecarFetches = 5;   ///< Parallel sidecar downloads while listing
    Transfer::SpoolOptions spool;             ///< Staging behaviour for uploads
};

/**
 * @brief Backup storage agent over one WebDAV client
 *
 * Operations block the calling thread. Only listing fans out internally.
 *
 * @code
 * auto client = std::make_shared<WebDAV::WebDAVClient>(cfg);
 * BackupAgent agent(client);
 * auto upload = agent.uploadBackup(record, [&]() -> Result<std::unique_ptr<Transfer::ChunkSource>> {
 *     return Result<std::unique_ptr<Transfer::ChunkSource>>::ok(std::make_unique<FileSource>(archivePath));
 * });
 * auto backups = agent.listBackups();
 * @endcode
 */
class BackupAgent {
public:
    static constexpr const char* kDisplayName = "ownCloud (WebDAV)";
    static constexpr const char* kUniqueId = "owncloud_webdav_backup_agent_v1";

    explicit BackupAgent(std::shared_ptr<WebDAV::WebDAVClient> client, AgentOptions options = {});

    /**
     * @brief Stores the archive produced by openStream, then the record's sidecar
     *
     * The stream is spooled to a staging file first so the archive goes out with
     * an exact Content-Length. The sidecar is only written after the archive
     * upload succeeded. The staging file is removed on every path.
     *
     * @return TransferFailure "Upload to ownCloud failed: <cause>" on any failure
     */
    Result<void> uploadBackup(const BackupRecord& record, const Transfer::StreamFactory& openStream);

    /**
     * @brief All backups in the folder, newest first
     *
     * Sidecars that cannot be fetched or parsed are logged and skipped. Archives
     * without a parsed sidecar are described from their file properties.
     */
    Result<std::vector<BackupRecord>> listBackups();

    /**
     * @brief Descriptor of one backup
     * @return NotFound "Backup not found: <id>" when neither file exists;
     *         MetadataCorruption when the sidecar exists but is invalid
     */
    Result<BackupRecord> getBackup(const std::string& backupId);

    /**
     * @brief Opens the archive of backupId for streaming
     * @return NotFound when the archive is absent; TransferFailure "Download failed: <cause>" otherwise
     */
    Result<std::unique_ptr<WebDAV::DownloadStream>> downloadBackup(const std::string& backupId);

    /**
     * @brief Deletes archive and sidecar
     *
     * Either file may already be gone. NotFound only when both were absent.
     */
    Result<void> deleteBackup(const std::string& backupId);

    WebDAV::WebDAVClient& client() { return *_client; }

private:
    std::shared_ptr<WebDAV::WebDAVClient> _client;
    AgentOptions _options;

    std::vector<BackupRecord> fetchSidecars(const std::vector<std::string>& sidecarNames);
};

} // namespace DavBackup::Backup
