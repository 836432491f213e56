/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the DavBackup project.
 */

/**
 * @file Spooler.h
 * @brief Materialises a chunk stream of unknown length into a local staging file
 *
 * Uploading with an exact Content-Length requires knowing the size up front.
 * The spooler drains a ChunkSource into a temporary file in buffered writes and
 * reports the exact byte count.
 */

#pragma once

#include "DavBackup/Core/ErrorCodes.h"
#include "DavBackup/Transfer/ChunkSource.h"
#include <cstdint>
#include <filesystem>
#include <string>

namespace DavBackup::Transfer {

/**
 * @brief Temporary file removed when the owner goes away
 *
 * Move-only. A moved-from StagingFile owns nothing.
 */
class StagingFile {
public:
    StagingFile() = default;
    explicit StagingFile(std::filesystem::path path) : _path(std::move(path)) {}
    ~StagingFile();

    StagingFile(StagingFile&& other) noexcept;
    StagingFile& operator=(StagingFile&& other) noexcept;
    StagingFile(const StagingFile&) = delete;
    StagingFile& operator=(const StagingFile&) = delete;

    /**
     * @brief Creates an empty, uniquely named file in the system temp directory
     * @param prefix File name prefix
     */
    static Result<StagingFile> create(const std::string& prefix = "davbackup_");

    const std::filesystem::path& path() const { return _path; }
    bool valid() const { return !_path.empty(); }

    /**
     * @brief Deletes the file now; later calls are no-ops
     */
    void remove();

private:
    std::filesystem::path _path;
};

struct SpoolOptions {
    size_t flushThreshold = 1024 * 1024;   ///< Buffered bytes that trigger a write (1 MiB)
    size_t readChunkBytes = 256 * 1024;    ///< Size of each read from the source
    std::string filePrefix = "davbackup_"; ///< Staging file name prefix
};

/**
 * @brief Outcome of a completed spool
 */
struct SpoolResult {
    StagingFile file;     ///< Staging file holding exactly size bytes
    uint64_t size = 0;    ///< Sum of all chunk lengths
    size_t flushes = 0;   ///< Writes triggered by reaching the flush threshold (final remainder excluded)
};

/**
 * @brief Drains source into a new staging file
 *
 * Bytes accumulate in memory and are appended to the file whenever the buffer
 * reaches options.flushThreshold; the remainder is written at end of stream.
 * On any failure the partial file is deleted before the error is returned.
 *
 * @code
 * MemoryChunkSource src({bytesA, bytesB});
 * auto spooled = spoolToStagingFile(src);
 * if (spooled.success()) {
 *     client.putFile("ha_backup_x.tar", spooled.value.file.path(), spooled.value.size);
 * }
 * @endcode
 */
Result<SpoolResult> spoolToStagingFile(ChunkSource& source, const SpoolOptions& options = {});

} // namespace DavBackup::Transfer
