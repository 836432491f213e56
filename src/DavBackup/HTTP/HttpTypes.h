/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the DavBackup project.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace DavBackup::HTTP
{

// Lowercase header keys map (single value per key for convenience)
using HttpHeaders = std::unordered_map<std::string, std::string>;

enum class HttpMethod
{
    GET,
    HEAD,
    PUT,
    DELETE_,
    PROPFIND,
    MKCOL
};

const char* methodName(HttpMethod method);

struct HttpRequest
{
    HttpMethod method = HttpMethod::GET;
    std::string scheme = "https";  // "http" or "https" - defaults to HTTPS for security
    std::string host;              // may include ":port"
    std::string path;              // origin-form path, already percent-encoded
    HttpHeaders headers;           // sent as given; Host/User-Agent auto-filled by libcurl
    std::vector<uint8_t> body;
};

struct HttpResponse
{
    int statusCode = 0;         // 0 when the request never produced a status (transport failure)
    std::string statusMessage;  // "OK" or the transport error description
    HttpHeaders headers;        // lowercase keys (last-seen value)
    std::vector<uint8_t> body;  // aggregated body

    bool isSuccess() const {
        return statusCode >= 200 && statusCode < 300;
    }

    std::string bodyText() const {
        return std::string(body.begin(), body.end());
    }
};

struct RequestOptions
{
    // Zero disables the corresponding limit
    std::chrono::milliseconds connectTimeout{10000};
    std::chrono::milliseconds readIdleTimeout{15000};
    std::chrono::milliseconds totalDeadline{30000};
    size_t maxResponseBytes = 128ull * 1024ull * 1024ull;

    std::optional<std::string> explicitProxy;  // e.g. "http://proxy:8080"; unset = libcurl env detection

    // Retry policy for idempotent methods (GET/HEAD/PROPFIND)
    bool enableRetries = true;
    int maxRetries = 2;
    int retryBackoffBaseMs = 200;
    int retryBackoffCapMs = 2000;
    int retryAfterMaxMs = 5000;  // upper bound on a server-supplied Retry-After wait

    bool verifyPeer = true;                 // CURLOPT_SSL_VERIFYPEER / VERIFYHOST

    // Request body pulled through this callback instead of HttpRequest::body (PUT only).
    // Writes up to max bytes into dst and returns the count; 0 signals EOF.
    // Returning CURL_READFUNC_ABORT aborts the transfer.
    std::function<size_t(char* dst, size_t max)> uploadRead;  // empty = disabled
    std::optional<uint64_t> contentLength;  // sent as Content-Length; unset = chunked transfer
    bool expect100Continue = false;         // proxies commonly stall on Expect: 100-continue
};

/**
 * @brief Request options for long-running transfers
 *
 * Bounded connection setup, no total or idle deadline, no response cap.
 */
inline RequestOptions longTransferOptions(std::chrono::milliseconds connectTimeout) {
    RequestOptions opts;
    opts.connectTimeout = connectTimeout;
    opts.readIdleTimeout = std::chrono::milliseconds{0};
    opts.totalDeadline = std::chrono::milliseconds{0};
    opts.maxResponseBytes = 0;
    return opts;
}

}  // namespace DavBackup::HTTP
