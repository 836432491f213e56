/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the DavBackup project.
 */

/**
 * @file BackupRecord.h
 * @brief Backup descriptor, its JSON sidecar form and the remote naming scheme
 */

#pragma once

#include "DavBackup/Core/ErrorCodes.h"
#include <json/json.h>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace DavBackup::Backup {

inline constexpr std::string_view kArchivePrefix = "ha_backup_";
inline constexpr std::string_view kArchiveSuffix = ".tar";
inline constexpr std::string_view kSidecarSuffix = ".json";

/// "ha_backup_<id>.tar"
std::string archiveName(std::string_view backupId);

/// "ha_backup_<id>.json"
std::string sidecarName(std::string_view backupId);

bool isArchiveName(std::string_view name);
bool isSidecarName(std::string_view name);

/**
 * @brief Recovers the backup id from an archive name
 * @return nullopt unless name has the archive prefix and suffix
 */
std::optional<std::string> idFromArchiveName(std::string_view name);

/**
 * @brief Recovers the backup id from a sidecar name
 */
std::optional<std::string> idFromSidecarName(std::string_view name);

/**
 * @brief One stored backup as described by the host
 *
 * Keys the host adds beyond the fields below are kept in extra and written
 * back unchanged, so a sidecar always holds the full descriptor.
 */
struct BackupRecord {
    std::string backupId;
    std::string name;
    std::string date;            ///< ISO-8601 UTC; ordering key
    uint64_t size = 0;           ///< Archive byte length
    bool isProtected = false;    ///< Carried through, never interpreted
    Json::Value extra{Json::objectValue};

    /**
     * @brief Builds a record from a descriptor object
     *
     * Requires a string "backup_id". "name" and "date" must be strings, "size"
     * a non-negative integer and "protected" a boolean when present.
     *
     * @return MetadataCorruption describing the first offending key
     */
    static Result<BackupRecord> fromJson(const Json::Value& value);

    /**
     * @brief Parses sidecar bytes (UTF-8 JSON) into a record
     */
    static Result<BackupRecord> fromSidecar(const std::vector<uint8_t>& bytes);

    /**
     * @brief Full descriptor object, host keys included
     */
    Json::Value toJson() const;

    /**
     * @brief Compact UTF-8 JSON suitable for the sidecar file
     */
    std::vector<uint8_t> toSidecar() const;

    /**
     * @brief Record for an archive that has no sidecar
     *
     * Named "ownCloud backup (<id>)", not protected, dated by the archive's
     * modification time.
     */
    static BackupRecord synthesize(const std::string& backupId, std::string date, uint64_t size);
};

} // namespace DavBackup::Backup
