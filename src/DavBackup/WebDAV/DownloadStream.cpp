/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the DavBackup project.
 */
#include "DavBackup/WebDAV/DownloadStream.h"

#include <format>

namespace DavBackup::WebDAV {

DownloadStream::DownloadStream(HTTP::StreamHandle handle, std::string name)
    : _handle(std::move(handle)), _name(std::move(name)) {}

DownloadStream::~DownloadStream() {
    close();
}

Result<size_t> DownloadStream::read(uint8_t* buffer, size_t size) {
    if (_finished || size == 0) {
        return Result<size_t>::ok(0);
    }

    size_t n = _handle.read(buffer, size);
    if (n > 0) {
        _bytesRead += n;
        return Result<size_t>::ok(n);
    }

    // Zero bytes: either clean end of body or a broken transfer
    _finished = true;
    if (_handle.failed()) {
        return Result<size_t>::err(StorageError::TransferFailure,
                                   std::format("Download of '{}' interrupted after {} bytes: {}",
                                               _name, _bytesRead, _handle.getFailureReason()));
    }
    return Result<size_t>::ok(0);
}

void DownloadStream::close() {
    _finished = true;
    // No-op once the worker has finished
    _handle.cancel();
}

} // namespace DavBackup::WebDAV
