/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the DavBackup project.
 */

#include "DavBackup/Transfer/Spooler.h"
#include <Logging/Logger.h>
#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>
#include <vector>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace DavBackup::Transfer {

StagingFile::~StagingFile() {
    remove();
}

StagingFile::StagingFile(StagingFile&& other) noexcept
    : _path(std::move(other._path)) {
    other._path.clear();
}

StagingFile& StagingFile::operator=(StagingFile&& other) noexcept {
    if (this != &other) {
        remove();
        _path = std::move(other._path);
        other._path.clear();
    }
    return *this;
}

void StagingFile::remove() {
    if (_path.empty()) return;
    std::error_code ec;
    std::filesystem::remove(_path, ec);
    if (ec) {
        ENTROPY_LOG_WARNING_CAT("Spooler", std::format("Could not remove staging file {}: {}", _path.string(), ec.message()));
    }
    _path.clear();
}

Result<StagingFile> StagingFile::create(const std::string& prefix) {
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return Result<StagingFile>::err(StorageError::IoFailure,
                                        std::format("No temporary directory: {}", ec.message()));
    }

#ifdef _WIN32
    std::string pattern = (dir / (prefix + "XXXXXX")).string();
    if (_mktemp_s(pattern.data(), pattern.size() + 1) != 0) {
        return Result<StagingFile>::err(StorageError::IoFailure, "Could not create staging file name");
    }
    std::ofstream touch(pattern, std::ios::binary);
    if (!touch) {
        return Result<StagingFile>::err(StorageError::IoFailure,
                                        std::format("Could not create staging file {}", pattern));
    }
    return Result<StagingFile>::ok(StagingFile(pattern));
#else
    std::string pattern = (dir / (prefix + "XXXXXX")).string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    int fd = ::mkstemp(buf.data());
    if (fd < 0) {
        return Result<StagingFile>::err(StorageError::IoFailure,
                                        std::format("Could not create staging file in {}: {}", dir.string(), std::strerror(errno)));
    }
    ::close(fd);
    return Result<StagingFile>::ok(StagingFile(std::filesystem::path(buf.data())));
#endif
}

Result<SpoolResult> spoolToStagingFile(ChunkSource& source, const SpoolOptions& options) {
    using R = Result<SpoolResult>;

    auto created = StagingFile::create(options.filePrefix);
    if (created.failed()) {
        return R::err(created.error, created.errorMessage);
    }
    StagingFile file = std::move(created.value);

    std::ofstream out(file.path(), std::ios::binary | std::ios::trunc);
    if (!out) {
        return R::err(StorageError::IoFailure,
                      std::format("Could not open staging file {}", file.path().string()));
    }

    const size_t threshold = options.flushThreshold > 0 ? options.flushThreshold : 1;
    std::vector<uint8_t> pending;
    pending.reserve(threshold);
    std::vector<uint8_t> chunk(options.readChunkBytes > 0 ? options.readChunkBytes : 64 * 1024);

    uint64_t total = 0;
    size_t flushes = 0;

    auto writePending = [&]() -> bool {
        if (pending.empty()) return true;
        out.write(reinterpret_cast<const char*>(pending.data()), static_cast<std::streamsize>(pending.size()));
        pending.clear();
        return static_cast<bool>(out);
    };

    for (;;) {
        auto r = source.read(chunk.data(), chunk.size());
        if (r.failed()) {
            // StagingFile destructor removes the partial file
            return R::err(r.error, r.errorMessage);
        }
        if (r.value == 0) break;

        pending.insert(pending.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(r.value));
        total += r.value;

        if (pending.size() >= threshold) {
            if (!writePending()) {
                return R::err(StorageError::IoFailure,
                              std::format("Writing staging file {} failed", file.path().string()));
            }
            ++flushes;
        }
    }

    if (!writePending()) {
        return R::err(StorageError::IoFailure,
                      std::format("Writing staging file {} failed", file.path().string()));
    }
    out.close();
    if (!out) {
        return R::err(StorageError::IoFailure,
                      std::format("Closing staging file {} failed", file.path().string()));
    }

    ENTROPY_LOG_DEBUG_CAT("Spooler", std::format("Spooled {} bytes to {} ({} flushes)", total, file.path().string(), flushes));
    return R::ok(SpoolResult{std::move(file), total, flushes});
}

} // namespace DavBackup::Transfer
