/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the DavBackup project.
 */

/**
 * @file WebDAVClient.h
 * @brief Name-based file operations on an ownCloud/Nextcloud WebDAV folder
 *
 * WebDAVClient discovers a working DAV root, makes sure the backup folder
 * exists and performs put/get/stat/delete/list on files inside it. All
 * requests carry HTTP Basic authentication.
 */

#pragma once

#include "DavBackup/Core/ClientConfig.h"
#include "DavBackup/Core/ErrorCodes.h"
#include "DavBackup/HTTP/HttpClient.h"
#include "DavBackup/Transfer/ChunkSource.h"
#include "DavBackup/WebDAV/DownloadStream.h"
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace DavBackup::WebDAV {

/**
 * @brief Size and modification time of a remote file
 */
struct StatInfo {
    uint64_t size = 0;           ///< getcontentlength, 0 when the server omits it
    std::string modifiedRaw;     ///< getlastmodified as sent, empty when absent
    std::string modifiedIso;     ///< "YYYY-MM-DDTHH:MM:SS+00:00", the raw text if unparseable, now if absent
};

/**
 * @brief WebDAV client bound to one server account and backup folder
 *
 * The DAV root is probed lazily on first use from two candidates,
 * "remote.php/dav/files/<user>/" then "remote.php/webdav/", and cached for the
 * lifetime of the client. Methods are blocking and safe to call from several
 * threads at once.
 *
 * @code
 * ClientConfig cfg{.baseUrl = "https://cloud.example.com", .username = "alice", .password = "pw"};
 * WebDAVClient client(cfg);
 * if (auto r = client.ensureFolder(); r.failed()) {
 *     ENTROPY_LOG_ERROR(r.errorMessage);
 * }
 * client.putBytes("notes.json", bytes);
 * @endcode
 */
class WebDAVClient {
public:
    explicit WebDAVClient(ClientConfig cfg);

    WebDAVClient(const WebDAVClient&) = delete;
    WebDAVClient& operator=(const WebDAVClient&) = delete;

    /**
     * @brief Returns the working DAV root path, probing candidates on first call
     *
     * @return Root path on the server (e.g. "/remote.php/webdav/"); Unauthorized if
     *         every candidate failed and at least one rejected the credentials,
     *         ConnectivityFailure with the last candidate's detail otherwise
     */
    Result<std::string> resolveRoot();

    /**
     * @brief Drops the cached DAV root so the next operation probes again
     */
    void invalidateRoot();

    /**
     * @brief Creates the backup folder and its parents if they do not exist
     *
     * Credential rejection is reported immediately and never masked by the
     * creation fallback.
     */
    Result<void> ensureFolder();

    /**
     * @brief Lists entry names directly inside the backup folder
     * @return Sorted, de-duplicated, percent-decoded names; the folder itself excluded
     */
    Result<std::vector<std::string>> listFolder();

    /**
     * @brief Stores bytes under name with an exact Content-Length
     */
    Result<void> putBytes(const std::string& name, const std::vector<uint8_t>& data);

    /**
     * @brief Streams a local file to name with an explicit Content-Length
     *
     * @param size Byte length to announce; 0 or less reads it from the file system,
     *             and if that fails the request goes out without a length
     */
    Result<void> putFile(const std::string& name, const std::filesystem::path& path, int64_t size = 0);

    /**
     * @brief Uploads from a chunk source using chunked transfer encoding
     *
     * Some proxies reject chunked uploads; prefer putFile for large payloads.
     */
    Result<void> putStream(const std::string& name, Transfer::ChunkSource& source);

    /**
     * @brief Downloads the full content of name
     * @return Body bytes; NotFound on 404
     */
    Result<std::vector<uint8_t>> getBytes(const std::string& name);

    /**
     * @brief Opens a streaming download of name
     *
     * Returns once response headers arrived, so a missing file is reported as
     * NotFound before any chunk is produced.
     */
    Result<std::unique_ptr<DownloadStream>> getStream(const std::string& name);

    /**
     * @brief Reads size and modification time of name (PROPFIND Depth 0)
     */
    Result<StatInfo> stat(const std::string& name);

    /**
     * @brief Deletes name
     * @return NotFound on 404; ProtocolFailure with the response text for other refusals
     */
    Result<void> remove(const std::string& name);

    /**
     * @brief Settings this client was built from
     */
    const ClientConfig& config() const { return _cfg; }

private:
    ClientConfig _cfg;
    Result<BaseUrlParts> _base;
    std::string _authHeader;
    HTTP::HttpClient _http;

    std::mutex _rootMutex;
    std::optional<std::string> _root;   ///< Cached DAV root, first successful probe wins

    HTTP::HttpRequest makeRequest(HTTP::HttpMethod method, std::string path) const;
    HTTP::RequestOptions transferOptions() const;
    HTTP::HttpResponse propfind(const std::string& path, int depth, const std::string& body,
                                const HTTP::RequestOptions& opts);

    /// Backup folder path below the root, percent-encoded, without surrounding slashes
    std::string folderRel() const;
    Result<std::string> folderPath();
    Result<std::string> filePath(const std::string& name);
    Result<void> put(const std::string& name, HTTP::RequestOptions opts);
};

} // namespace DavBackup::WebDAV
