/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the DavBackup project.
 */

/**
 * @file DownloadStream.h
 * @brief Chunk source over a live WebDAV GET response
 */

#pragma once

#include "DavBackup/HTTP/HttpClient.h"
#include "DavBackup/Transfer/ChunkSource.h"
#include <string>

namespace DavBackup::WebDAV {

/**
 * @brief Forward-only reader for a streaming GET
 *
 * Owns the transfer started by HttpClient::executeStream. The response status
 * has already been checked by the time a DownloadStream exists, so read() only
 * yields body bytes. Destroying the stream before the end cancels the transfer
 * and releases the connection.
 *
 * @code
 * auto dl = client.getStream("ha_backup_abc.tar");
 * if (dl.success()) {
 *     std::vector<uint8_t> chunk(256 * 1024);
 *     while (true) {
 *         auto r = dl.value->read(chunk.data(), chunk.size());
 *         if (r.failed() || r.value == 0) break;
 *         out.write(chunk.data(), r.value);
 *     }
 * }
 * @endcode
 */
class DownloadStream : public Transfer::ChunkSource {
public:
    DownloadStream(HTTP::StreamHandle handle, std::string name);
    ~DownloadStream() override;

    DownloadStream(const DownloadStream&) = delete;
    DownloadStream& operator=(const DownloadStream&) = delete;

    /**
     * @brief Reads the next bytes of the body
     * @return Bytes read (0 at end of body); TransferFailure if the connection failed midway
     */
    Result<size_t> read(uint8_t* buffer, size_t size) override;

    /**
     * @brief Stops the transfer; later reads report end of stream
     *
     * Safe to call more than once.
     */
    void close();

    /**
     * @brief Remote file name this stream reads
     */
    const std::string& name() const { return _name; }

    /**
     * @brief Total body bytes handed out so far
     */
    uint64_t bytesRead() const { return _bytesRead; }

private:
    HTTP::StreamHandle _handle;
    std::string _name;
    uint64_t _bytesRead = 0;
    bool _finished = false;
};

} // namespace DavBackup::WebDAV
