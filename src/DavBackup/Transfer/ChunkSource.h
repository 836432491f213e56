/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the DavBackup project.
 */

/**
 * @file ChunkSource.h
 * @brief Pull interface for finite, forward-only byte sequences
 */

#pragma once

#include "DavBackup/Core/ErrorCodes.h"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace DavBackup::Transfer {

/**
 * @brief Source of byte chunks of unknown total length
 *
 * Implementations hand out the next chunk on each read(). A successful read of
 * zero bytes marks the end of the sequence. Reads after the end keep returning zero.
 *
 * @code
 * std::vector<uint8_t> buf(256 * 1024);
 * for (;;) {
 *     auto r = source.read(buf.data(), buf.size());
 *     if (r.failed()) return r.error;
 *     if (r.value == 0) break;
 *     consume(buf.data(), r.value);
 * }
 * @endcode
 */
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    /**
     * @brief Reads up to size bytes of the next chunk
     * @return Bytes written to buffer; 0 at end of stream
     */
    virtual Result<size_t> read(uint8_t* buffer, size_t size) = 0;
};

/**
 * @brief Host-supplied factory that opens the backup byte stream
 */
using StreamFactory = std::function<Result<std::unique_ptr<ChunkSource>>()>;

/**
 * @brief ChunkSource over an in-memory list of chunks
 *
 * Each read returns at most one chunk (or the remainder of it). Used for small
 * payloads and in tests where chunk boundaries matter.
 */
class MemoryChunkSource : public ChunkSource {
public:
    explicit MemoryChunkSource(std::vector<std::vector<uint8_t>> chunks)
        : _chunks(std::move(chunks)) {}

    Result<size_t> read(uint8_t* buffer, size_t size) override {
        // Empty chunks are not end of stream; skip them
        while (_index < _chunks.size() && _offset >= _chunks[_index].size()) {
            ++_index;
            _offset = 0;
        }
        if (_index >= _chunks.size() || size == 0) {
            return Result<size_t>::ok(0);
        }
        const auto& chunk = _chunks[_index];
        size_t n = std::min(size, chunk.size() - _offset);
        std::copy(chunk.begin() + static_cast<std::ptrdiff_t>(_offset),
                  chunk.begin() + static_cast<std::ptrdiff_t>(_offset + n), buffer);
        _offset += n;
        return Result<size_t>::ok(n);
    }

private:
    std::vector<std::vector<uint8_t>> _chunks;
    size_t _index = 0;
    size_t _offset = 0;
};

} // namespace DavBackup::Transfer
