/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the DavBackup project.
 */

#pragma once

#include "DavBackup/HTTP/HttpTypes.h"
#include <curl/curl.h>
#include <mutex>
#include <memory>
#include <array>
#include <condition_variable>

namespace DavBackup::HTTP {

/**
 * @brief Streaming response state for incremental reads
 *
 * Ring buffer with producer/consumer pattern. libcurl writes to tail,
 * StreamHandle reads from head. Backpressure via CURL_WRITEFUNC_PAUSE.
 */
struct StreamState {
    std::mutex mutex;                                         ///< Protects ring buffer state
    std::condition_variable cv;                               ///< Signals data available/consumed
    bool headersReady = false;                                ///< true when final response headers parsed
    bool done = false;                                        ///< true when response complete
    bool failed = false;                                      ///< true on error
    std::string failureReason;                                ///< Error description
    int statusCode = 0;                                       ///< HTTP status code
    std::vector<uint8_t> buffer;                              ///< Ring buffer storage
    size_t head = 0;                                          ///< Read index
    size_t tail = 0;                                          ///< Write index
    size_t size = 0;                                          ///< Bytes currently stored
    size_t capacity = 0;                                      ///< Total capacity
    size_t totalReceived = 0;                                 ///< Total bytes received
    bool cancelRequested = false;                             ///< Cancellation requested by consumer
    bool paused = false;                                      ///< Transfer paused on a full buffer
    bool resumeRequested = false;                             ///< Consumer freed space; worker should resume
    CURL* easy = nullptr;                                     ///< Live easy handle (worker thread only)
};

/**
 * @brief Handle to active streaming HTTP request
 *
 * Provides incremental read access to response body. Copies share the same
 * transfer; the transfer itself lives on a worker thread until it completes
 * or cancel() is called.
 *
 * @code
 * auto handle = client.executeStream(req);
 * std::vector<uint8_t> chunk(64 * 1024);
 * while (!handle.isDone()) {
 *     size_t n = handle.read(chunk.data(), chunk.size());
 *     processChunk(chunk.data(), n);
 * }
 * @endcode
 */
class StreamHandle {
public:
    explicit StreamHandle(std::shared_ptr<StreamState> state)
        : _state(std::move(state)) {}

    /**
     * @brief Reads up to size bytes from stream
     *
     * Blocks until data is available, the response completes, or the transfer fails.
     *
     * @param buffer Destination buffer
     * @param size Maximum bytes to read
     * @return Number of bytes actually read (0 at end of stream or on failure)
     */
    size_t read(uint8_t* buffer, size_t size);

    /**
     * @brief Checks if stream has completed
     * @return true if all data received and consumed
     */
    bool isDone() const;

    /**
     * @brief Checks if stream failed
     * @return true on error
     */
    bool failed() const;

    /**
     * @brief Gets failure reason if failed
     * @return Error message
     */
    std::string getFailureReason() const;

    /**
     * @brief Gets HTTP status code (available after headers received)
     * @return Status code, or 0 if headers not yet ready
     */
    int getStatusCode() const;

    /**
     * @brief Waits for the final response headers
     * @param timeout Maximum time to wait; zero waits without limit
     * @return true if headers ready or the transfer ended, false on timeout
     */
    bool waitForHeaders(std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    /**
     * @brief Cancels the ongoing HTTP transfer
     *
     * Safe to call from any thread and more than once. The worker aborts on its
     * next progress tick and releases the connection.
     */
    void cancel();

private:
    std::shared_ptr<StreamState> _state;

    friend class HttpClient;
};

/**
 * @brief Options for streaming HTTP requests
 */
struct StreamOptions {
    size_t bufferBytes = 4ull * 1024ull * 1024ull;           ///< Ring buffer size (default 4 MiB)
    std::chrono::milliseconds connectTimeout{10000};          ///< Connection timeout
    std::chrono::milliseconds totalDeadline{0};               ///< Total timeout (0 = no timeout)
    bool verifyPeer = true;                                   ///< TLS peer/host verification
    std::optional<std::string> explicitProxy;                 ///< Proxy override (unset = env detection)
};

/**
 * @brief HTTP client using libcurl
 *
 * Connection, DNS and TLS session caches are shared between aggregated requests.
 *
 * Features:
 * - HTTP/1.1 and HTTP/2 with automatic fallback
 * - Retries with jittered backoff for idempotent methods
 * - Uploads from a pull callback with an explicit Content-Length when known
 * - Streaming downloads with backpressure and cancellation
 *
 * @code
 * HttpClient client;
 * HttpRequest req{.method = HttpMethod::GET, .host = "example.com", .path = "/remote.php/webdav/"};
 * HttpResponse resp = client.execute(req);
 * if (resp.isSuccess()) {
 *     processData(resp.body);
 * }
 * @endcode
 */
class HttpClient {
public:
    /**
     * @brief Constructs HTTP client with libcurl backend
     */
    HttpClient();

    /**
     * @brief Destructor - cleans up libcurl resources
     */
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * @brief Execute HTTP request synchronously (blocks calling thread)
     *
     * PUT requests are always sent with a Content-Length unless
     * RequestOptions::uploadRead is set without RequestOptions::contentLength.
     *
     * @param req HTTP request (method, host, path, headers, body)
     * @param opts Request options (timeouts, max response size, upload source)
     * @return HttpResponse with status code, headers, and body; statusCode 0 on transport failure
     */
    HttpResponse execute(const HttpRequest& req, const RequestOptions& opts = {});

    /**
     * @brief Execute streaming GET request for large downloads
     *
     * Returns immediately with StreamHandle. curl_easy_perform runs in a background
     * thread that owns the easy handle; it never touches this client, so the
     * handle may outlive the client.
     *
     * @param req HTTP request (method is forced to GET)
     * @param opts Streaming options (buffer size, limits, timeouts)
     * @return StreamHandle for incremental reading
     */
    StreamHandle executeStream(const HttpRequest& req, const StreamOptions& opts = {});

private:
    CURLSH* _connectionShare;  // Shared connection pool
    std::mutex _shareMutex;    // Protects connection share access
    std::array<std::mutex, CURL_LOCK_DATA_LAST> _curlShareLocks; // libcurl share locks (per data slot)

    static void initGlobalCurl();
    static size_t writeCallback(char* data, size_t size, size_t nmemb, void* userdata);
    static size_t headerCallback(char* data, size_t size, size_t nmemb, void* userdata);

    // Streaming callbacks
    static size_t streamWriteCallback(char* data, size_t size, size_t nmemb, void* userdata);
    static size_t streamHeaderCallback(char* data, size_t size, size_t nmemb, void* userdata);

    struct ResponseData {
        std::vector<uint8_t> body;
        HttpHeaders headers;         // last-seen value per key
        size_t cap = 0;              // max response bytes (0 = unlimited)
        bool abortedByCap = false;   // indicates we aborted due to cap
        char errbuf[CURL_ERROR_SIZE] = {0};
    };

    void resetShare();

    void configureCurlHandle(CURL* curl, const HttpRequest& req,
                            const RequestOptions& opts, ResponseData& respData,
                            struct curl_slist* headers);

    static void configureStreamCurlHandle(CURL* curl, const HttpRequest& req,
                                          const StreamOptions& opts, StreamState& state,
                                          struct curl_slist* headers);
};

} // namespace DavBackup::HTTP
