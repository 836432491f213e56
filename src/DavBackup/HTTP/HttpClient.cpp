/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the DavBackup project.
 */

#include "DavBackup/HTTP/HttpClient.h"
#include <string>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <random>
#include <thread>

namespace DavBackup::HTTP {

const char* methodName(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::HEAD: return "HEAD";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE_: return "DELETE";
        case HttpMethod::PROPFIND: return "PROPFIND";
        case HttpMethod::MKCOL: return "MKCOL";
    }
    return "GET";
}

// Global libcurl initialization (thread-safe, one-time)
void HttpClient::initGlobalCurl() {
    static std::once_flag initFlag;
    std::call_once(initFlag, []() {
        curl_global_init(CURL_GLOBAL_ALL);
    });
}

namespace {
// libcurl share locking callbacks
void curlShareLock(CURL* /*handle*/, curl_lock_data data, curl_lock_access /*access*/, void* userptr) {
    auto* locks = static_cast<std::array<std::mutex, CURL_LOCK_DATA_LAST>*>(userptr);
    (*locks)[data].lock();
}
void curlShareUnlock(CURL* /*handle*/, curl_lock_data data, void* userptr) {
    auto* locks = static_cast<std::array<std::mutex, CURL_LOCK_DATA_LAST>*>(userptr);
    (*locks)[data].unlock();
}

std::string buildUrl(const HttpRequest& req) {
    std::string path = req.path.empty() ? "/" : (req.path[0] == '/' ? req.path : std::string("/") + req.path);
    return req.scheme + "://" + req.host + path;
}

// Parses "Name: Value\r\n" into a lowercase name and trimmed value
bool parseHeaderLine(const std::string& line, std::string& name, std::string& value) {
    auto colonPos = line.find(':');
    if (colonPos == std::string::npos) return false;
    name = line.substr(0, colonPos);
    value = line.substr(colonPos + 1);

    value.erase(0, value.find_first_not_of(" \t"));
    value.erase(value.find_last_not_of(" \t\r\n") + 1);

    std::transform(name.begin(), name.end(), name.begin(),
                  [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return true;
}

void applyTls(CURL* curl, bool verifyPeer) {
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verifyPeer ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verifyPeer ? 2L : 0L);
}

void applyProxy(CURL* curl, const std::optional<std::string>& explicitProxy) {
    if (explicitProxy && !explicitProxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, explicitProxy->c_str());
    }
    // Otherwise libcurl honours http_proxy/https_proxy/no_proxy from the environment
    curl_easy_setopt(curl, CURLOPT_PROXYAUTH, CURLAUTH_ANY);
}

bool isIdempotent(HttpMethod m) {
    return m == HttpMethod::GET || m == HttpMethod::HEAD || m == HttpMethod::PROPFIND;
}

uint64_t jitteredBackoffMs(int attempt, const RequestOptions& opts) {
    uint64_t base = (uint64_t)std::max(0, opts.retryBackoffBaseMs);
    uint64_t cap  = (uint64_t)std::max(0, opts.retryBackoffCapMs);
    uint64_t backoff = base * (1ull << attempt);
    if (cap > 0 && backoff > cap) backoff = cap;
    if (backoff == 0) return 0;
    // jitter: 50%-100%
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist(backoff / 2, backoff);
    return dist(rng);
}
}

HttpClient::HttpClient()
    : _connectionShare(nullptr) {
    initGlobalCurl();
    resetShare();
}

HttpClient::~HttpClient() {
    std::lock_guard<std::mutex> lock(_shareMutex);
    if (_connectionShare) {
        curl_share_cleanup(_connectionShare);
        _connectionShare = nullptr;
    }
}

void HttpClient::resetShare() {
    _connectionShare = curl_share_init();
    if (_connectionShare) {
        curl_share_setopt(_connectionShare, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
        curl_share_setopt(_connectionShare, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        curl_share_setopt(_connectionShare, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
        curl_share_setopt(_connectionShare, CURLSHOPT_LOCKFUNC, curlShareLock);
        curl_share_setopt(_connectionShare, CURLSHOPT_UNLOCKFUNC, curlShareUnlock);
        curl_share_setopt(_connectionShare, CURLSHOPT_USERDATA, &_curlShareLocks);
    }
}

// Callback for receiving response body
size_t HttpClient::writeCallback(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* respData = static_cast<ResponseData*>(userdata);
    size_t totalSize = size * nmemb;

    if (respData->cap && respData->body.size() + totalSize > respData->cap) {
        respData->abortedByCap = true;
        return 0; // abort transfer
    }

    respData->body.insert(respData->body.end(), reinterpret_cast<uint8_t*>(data), reinterpret_cast<uint8_t*>(data) + totalSize);

    return totalSize;
}

// Callback for receiving response headers
size_t HttpClient::headerCallback(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* respData = static_cast<ResponseData*>(userdata);
    size_t totalSize = size * nmemb;

    std::string line(data, totalSize);

    // A new status line starts a new header block (redirects, 100 Continue)
    if (line.find("HTTP/") == 0) {
        respData->headers.clear();
        return totalSize;
    }

    std::string name, value;
    if (parseHeaderLine(line, name, value)) {
        respData->headers[name] = value;
    }

    return totalSize;
}

void HttpClient::configureCurlHandle(CURL* curl, const HttpRequest& req,
                                        const RequestOptions& opts, ResponseData& respData,
                                        struct curl_slist* headers) {
    std::string url = buildUrl(req);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());

    applyProxy(curl, opts.explicitProxy);

    switch (req.method) {
        case HttpMethod::GET:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::HEAD:
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
            break;
        case HttpMethod::PUT:
            // Body is attached by execute() through the upload read callback
            curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
            break;
        default:
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, methodName(req.method));
            break;
    }

    // Request body (aggregated) for non-PUT methods, e.g. PROPFIND XML
    if (req.method != HttpMethod::PUT && !req.body.empty()) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, req.body.data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)req.body.size());
    }

    if (headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }

    if (req.scheme == "https") {
        curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, (long)CURL_HTTP_VERSION_2TLS);
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, (long)CURL_HTTP_VERSION_1_1);
    }

    applyTls(curl, opts.verifyPeer);

    // Callbacks
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &respData);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &respData);

    // Error buffer for richer diagnostics
    respData.errbuf[0] = '\0';
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, respData.errbuf);

    // Timeouts (0 = no limit for libcurl as well)
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, (long)opts.connectTimeout.count());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, (long)opts.totalDeadline.count());
    // Approximate idle timeout via low-speed options
    if (opts.readIdleTimeout.count() > 0) {
        long lowSpeedTimeSec = std::max<long>(1, (long)(opts.readIdleTimeout.count() / 1000));
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L); // bytes/sec
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, lowSpeedTimeSec);
    }

    // Avoid signals in multi-threaded apps
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    {
        std::lock_guard<std::mutex> lock(_shareMutex);
        if (_connectionShare) {
            curl_easy_setopt(curl, CURLOPT_SHARE, _connectionShare);
        }
    }

    respData.cap = opts.maxResponseBytes;

    // Only safe methods follow redirects; a redirected PUT would lose its body
    if (isIdempotent(req.method)) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    }

    curl_easy_setopt(curl, CURLOPT_USERAGENT, "DavBackup/1.0");

    // Accept compressed encodings; cURL will decompress automatically
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");

    if (std::getenv("DAVBACKUP_HTTP_DEBUG")) {
        curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
    }
}

HttpResponse HttpClient::execute(const HttpRequest& req, const RequestOptions& opts) {
    int attempts = (opts.enableRetries && isIdempotent(req.method)) ? (opts.maxRetries + 1) : 1;

    HttpResponse finalResp;
    auto startTime = std::chrono::steady_clock::now();
    bool hasTotalDeadline = opts.totalDeadline.count() > 0;

    for (int attempt = 0; attempt < attempts; ++attempt) {
        CURL* curl = curl_easy_init();
        if (!curl) {
            finalResp.statusCode = 0;
            finalResp.statusMessage = "Failed to initialize curl";
            return finalResp;
        }

        ResponseData respData;
        struct curl_slist* headers = nullptr;

        for (const auto& [name, value] : req.headers) {
            std::string header = name + ": " + value;
            headers = curl_slist_append(headers, header.c_str());
        }

        if (!opts.expect100Continue) {
            headers = curl_slist_append(headers, "Expect:");
        }

        // Upload body source: caller-supplied pull callback, or the in-memory body
        struct UploadSource {
            std::function<size_t(char*, size_t)> read;
        } uploadSrc;
        std::optional<uint64_t> uploadLength;
        if (req.method == HttpMethod::PUT) {
            if (opts.uploadRead) {
                uploadSrc.read = opts.uploadRead;
                uploadLength = opts.contentLength;
            } else {
                size_t offset = 0;
                uploadSrc.read = [&req, offset](char* dst, size_t max) mutable -> size_t {
                    size_t n = std::min(max, req.body.size() - offset);
                    if (n > 0) std::memcpy(dst, req.body.data() + offset, n);
                    offset += n;
                    return n;
                };
                uploadLength = req.body.size();
            }
            if (!uploadLength) {
                headers = curl_slist_append(headers, "Transfer-Encoding: chunked");
            }
        }

        configureCurlHandle(curl, req, opts, respData, headers);

        if (req.method == HttpMethod::PUT) {
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, +[](char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t {
                auto* src = static_cast<UploadSource*>(userdata);
                size_t max = size * nmemb;
                return src->read ? src->read(ptr, max) : 0; // 0 = EOF
            });
            curl_easy_setopt(curl, CURLOPT_READDATA, &uploadSrc);
            if (uploadLength) {
                curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, (curl_off_t)*uploadLength);
            } else {
                // Chunked transfer needs HTTP/1.1
                curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, (long)CURL_HTTP_VERSION_1_1);
                curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, (curl_off_t)-1);
            }
        }

        // Adjust per-attempt timeout to respect overall totalDeadline
        if (hasTotalDeadline) {
            auto now = std::chrono::steady_clock::now();
            auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(now - startTime).count();
            long remainingMs = (long)opts.totalDeadline.count() - (long)elapsedMs;
            if (remainingMs <= 0) {
                if (headers) curl_slist_free_all(headers);
                curl_easy_cleanup(curl);
                finalResp.statusCode = 0;
                finalResp.statusMessage = "cURL error: timeout";
                break;
            }
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, remainingMs);
            long connMs = (long)opts.connectTimeout.count();
            if (connMs > remainingMs) connMs = remainingMs;
            if (connMs > 0) curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, connMs);
        }

        CURLcode res = curl_easy_perform(curl);

        HttpResponse response;

        if (res != CURLE_OK) {
            response.statusCode = 0;
            std::string msg;
            if (respData.abortedByCap) {
                msg = "response exceeds maximum size";
            } else if (respData.errbuf[0] != '\0') {
                msg = respData.errbuf;
            } else {
                msg = curl_easy_strerror(res);
            }
            response.statusMessage = std::string("cURL error: ") + msg;
        } else {
            long statusCode = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &statusCode);

            response.statusCode = static_cast<int>(statusCode);
            response.statusMessage = "OK";
            response.headers = std::move(respData.headers);
            response.body = std::move(respData.body);
        }

        if (std::getenv("DAVBACKUP_HTTP_METRICS")) {
            curl_off_t szUp = 0, szDn = 0, totalUs = 0; long redirects = 0;
            curl_easy_getinfo(curl, CURLINFO_SIZE_UPLOAD_T, &szUp);
            curl_easy_getinfo(curl, CURLINFO_SIZE_DOWNLOAD_T, &szDn);
            curl_easy_getinfo(curl, CURLINFO_TOTAL_TIME_T, &totalUs);
            curl_easy_getinfo(curl, CURLINFO_REDIRECT_COUNT, &redirects);
            fprintf(stderr, "[DavBackupHTTP] method=%s status=%d up=%lld down=%lld totalMs=%lld redirects=%ld\n",
                methodName(req.method), response.statusCode, (long long)szUp, (long long)szDn,
                (long long)(totalUs / 1000), redirects);
        }

        if (headers) {
            curl_slist_free_all(headers);
        }
        curl_easy_cleanup(curl);

        bool shouldRetry = false;
        if (res != CURLE_OK && !respData.abortedByCap) {
            shouldRetry = true;
        } else {
            int s = response.statusCode;
            if (s == 408 || s == 429 || (s >= 500 && s != 501 && s != 505)) {
                shouldRetry = true;
            }
        }

        if (!shouldRetry || attempt == attempts - 1) {
            finalResp = std::move(response);
            break;
        }

        uint64_t delayMs = 0;
        auto itRA = response.headers.find("retry-after");
        if (itRA != response.headers.end()) {
            delayMs = (uint64_t)(std::strtoull(itRA->second.c_str(), nullptr, 10) * 1000ull);
            uint64_t maxWait = (uint64_t)std::max(0, opts.retryAfterMaxMs);
            if (delayMs > maxWait) delayMs = maxWait;
        }
        if (delayMs == 0) {
            delayMs = jitteredBackoffMs(attempt, opts);
        }
        if (hasTotalDeadline) {
            auto now2 = std::chrono::steady_clock::now();
            auto elapsed2 = std::chrono::duration_cast<std::chrono::milliseconds>(now2 - startTime).count();
            long remaining2 = (long)opts.totalDeadline.count() - (long)elapsed2;
            if (remaining2 <= 0) {
                finalResp = std::move(response);
                break;
            }
            if ((long)delayMs > remaining2) delayMs = (uint64_t)remaining2;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
    }

    return finalResp;
}

// ============================================================================
// Streaming Support
// ============================================================================

size_t HttpClient::streamWriteCallback(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* state = static_cast<StreamState*>(userdata);
    size_t totalSize = size * nmemb;

    std::lock_guard<std::mutex> lock(state->mutex);

    if (state->cancelRequested) {
        return 0; // abort transfer
    }

    // Pause if full (backpressure); libcurl re-delivers the same data on resume
    if (state->size + totalSize > state->capacity) {
        state->paused = true;
        state->cv.notify_all();
        return CURL_WRITEFUNC_PAUSE;
    }
    state->paused = false;

    // Write to ring buffer (may wrap around)
    size_t endSpace = state->capacity - state->tail;
    if (totalSize <= endSpace) {
        std::memcpy(&state->buffer[state->tail], data, totalSize);
    } else {
        std::memcpy(&state->buffer[state->tail], data, endSpace);
        std::memcpy(&state->buffer[0], data + endSpace, totalSize - endSpace);
    }

    state->tail = (state->tail + totalSize) % state->capacity;
    state->size += totalSize;
    state->totalReceived += totalSize;

    state->cv.notify_all();
    return totalSize;
}

size_t HttpClient::streamHeaderCallback(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* state = static_cast<StreamState*>(userdata);
    size_t totalSize = size * nmemb;

    std::string line(data, totalSize);

    // End of a header block: publish status unless this is an interim or redirect block
    if (line == "\r\n") {
        std::lock_guard<std::mutex> lock(state->mutex);
        long sc = 0;
        if (state->easy) {
            curl_easy_getinfo(state->easy, CURLINFO_RESPONSE_CODE, &sc);
        }
        state->statusCode = static_cast<int>(sc);
        if (state->statusCode >= 200 && !(state->statusCode >= 300 && state->statusCode < 400)) {
            state->headersReady = true;
            state->cv.notify_all();
        }
        return totalSize;
    }

    return totalSize;
}

// Progress callback used to support cancellation of streaming transfers
static int xferInfoCallback(void* clientp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/, curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* state = static_cast<StreamState*>(clientp);

    CURL* easyLocal = nullptr;
    bool doResume = false;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->cancelRequested) {
            return 1; // abort transfer
        }
        if (state->paused && state->resumeRequested && !state->failed && !state->done && state->easy != nullptr) {
            if (state->size < state->capacity) {
                doResume = true;
                easyLocal = state->easy;
                state->resumeRequested = false;
            }
        }
    }
    if (doResume && easyLocal) {
        // Call libcurl without holding the mutex to avoid deadlocks
        curl_easy_pause(easyLocal, CURLPAUSE_CONT);
    }
    return 0;
}

void HttpClient::configureStreamCurlHandle(CURL* curl, const HttpRequest& req,
                                          const StreamOptions& opts, StreamState& state,
                                          struct curl_slist* headers) {
    std::string url = buildUrl(req);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());

    applyProxy(curl, opts.explicitProxy);

    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);

    if (headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }

    if (req.scheme == "https") {
        curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, (long)CURL_HTTP_VERSION_2TLS);
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, (long)CURL_HTTP_VERSION_1_1);
    }

    applyTls(curl, opts.verifyPeer);

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, streamWriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, streamHeaderCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &state);

    // Progress callback for cancellation and resume
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferInfoCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &state);

    if (opts.connectTimeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, (long)opts.connectTimeout.count());
    }
    if (opts.totalDeadline.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, (long)opts.totalDeadline.count());
    }

    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Connection sharing intentionally disabled for streaming: the worker thread
    // may outlive the client that owns the share.

    curl_easy_setopt(curl, CURLOPT_USERAGENT, "DavBackup/1.0");
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

    if (std::getenv("DAVBACKUP_HTTP_DEBUG")) {
        curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
    }
}

StreamHandle HttpClient::executeStream(const HttpRequest& req, const StreamOptions& opts) {
    auto state = std::make_shared<StreamState>();
    state->capacity = std::max<size_t>(opts.bufferBytes, 64 * 1024); // min 64 KB
    state->buffer.resize(state->capacity);

    struct curl_slist* headersList = nullptr;
    for (const auto& [name, value] : req.headers) {
        std::string header = name + ": " + value;
        headersList = curl_slist_append(headersList, header.c_str());
    }

    std::thread([req, opts, state, headersList]() {
        CURL* curl = curl_easy_init();
        if (!curl) {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->failed = true;
            state->failureReason = "Failed to initialize curl";
            state->done = true;
            state->cv.notify_all();
            if (headersList) curl_slist_free_all(headersList);
            return;
        }

        {
            std::lock_guard<std::mutex> lk(state->mutex);
            state->easy = curl;
        }

        configureStreamCurlHandle(curl, req, opts, *state, headersList);

        CURLcode res = curl_easy_perform(curl);

        {
            std::lock_guard<std::mutex> lock(state->mutex);

            if (res != CURLE_OK) {
                state->failed = true;
                if (state->cancelRequested) {
                    state->failureReason = "cancelled";
                } else if (state->failureReason.empty()) {
                    state->failureReason = std::string("cURL error: ") + curl_easy_strerror(res);
                }
            } else {
                long statusCode = 0;
                curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &statusCode);
                state->statusCode = static_cast<int>(statusCode);
                state->headersReady = true;
            }

            state->done = true;
            // Invalidate easy handle for other threads before cleanup to avoid races
            state->easy = nullptr;
            state->cv.notify_all();
        }

        if (headersList) {
            curl_slist_free_all(headersList);
        }
        curl_easy_cleanup(curl);
    }).detach();

    return StreamHandle(state);
}

// ============================================================================
// StreamHandle Implementation
// ============================================================================

size_t StreamHandle::read(uint8_t* buffer, size_t size) {
    std::unique_lock<std::mutex> lock(_state->mutex);

    _state->cv.wait(lock, [this]() {
        return _state->size > 0 || _state->done || _state->failed;
    });

    if (_state->failed) {
        return 0;
    }

    size_t toRead = std::min(size, _state->size);
    if (toRead == 0) {
        return 0; // No data available and stream done
    }

    // Copy from ring buffer (may wrap)
    size_t endSpace = _state->capacity - _state->head;
    if (toRead <= endSpace) {
        std::memcpy(buffer, &_state->buffer[_state->head], toRead);
    } else {
        std::memcpy(buffer, &_state->buffer[_state->head], endSpace);
        std::memcpy(buffer + endSpace, &_state->buffer[0], toRead - endSpace);
    }

    _state->head = (_state->head + toRead) % _state->capacity;
    _state->size -= toRead;

    // Resume is performed on the worker thread via the progress callback
    if (_state->paused && _state->easy != nullptr && !_state->failed && !_state->done) {
        _state->resumeRequested = true;
    }

    _state->cv.notify_all();
    return toRead;
}

bool StreamHandle::isDone() const {
    std::lock_guard<std::mutex> lock(_state->mutex);
    return _state->done && _state->size == 0;
}

bool StreamHandle::failed() const {
    std::lock_guard<std::mutex> lock(_state->mutex);
    return _state->failed;
}

std::string StreamHandle::getFailureReason() const {
    std::lock_guard<std::mutex> lock(_state->mutex);
    return _state->failureReason;
}

int StreamHandle::getStatusCode() const {
    std::lock_guard<std::mutex> lock(_state->mutex);
    return _state->statusCode;
}

bool StreamHandle::waitForHeaders(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(_state->mutex);
    auto ready = [this]() {
        return _state->headersReady || _state->failed || _state->done;
    };
    if (timeout.count() <= 0) {
        _state->cv.wait(lock, ready);
        return true;
    }
    return _state->cv.wait_for(lock, timeout, ready);
}

void StreamHandle::cancel() {
    std::lock_guard<std::mutex> lock(_state->mutex);
    if (_state->done) return;
    _state->cancelRequested = true;
    _state->cv.notify_all();
}

} // namespace DavBackup::HTTP
