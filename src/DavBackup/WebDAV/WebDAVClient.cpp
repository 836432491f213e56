/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the DavBackup project.
 */
#include "DavBackup/WebDAV/WebDAVClient.h"

#include <Logging/Logger.h>
#include <format>
#include <fstream>
#include <set>
#include "DavBackup/WebDAV/WebDAVPropfindParser.h"
#include "DavBackup/WebDAV/WebDAVUtils.h"

namespace DavBackup::WebDAV {

using HTTP::HttpMethod;
using HTTP::HttpRequest;
using HTTP::HttpResponse;
using HTTP::RequestOptions;

namespace {

constexpr const char* kRootProbeBody =
    "<?xml version=\"1.0\"?>"
    "<d:propfind xmlns:d=\"DAV:\"><d:prop><d:resourcetype/></d:prop></d:propfind>";

constexpr const char* kListBody =
    "<?xml version=\"1.0\"?>"
    "<d:propfind xmlns:d=\"DAV:\"><d:prop><d:displayname/></d:prop></d:propfind>";

constexpr const char* kStatBody =
    "<?xml version=\"1.0\"?>"
    "<d:propfind xmlns:d=\"DAV:\"><d:prop><d:getcontentlength/><d:getlastmodified/></d:prop></d:propfind>";

constexpr size_t kMaxErrorBodyChars = 512;

std::string responseDetail(const HttpResponse& resp) {
    if (resp.statusCode == 0) {
        return resp.statusMessage;
    }
    auto text = resp.bodyText();
    if (text.size() > kMaxErrorBodyChars) {
        text.resize(kMaxErrorBodyChars);
        text += "...";
    }
    return text.empty() ? std::format("HTTP {}", resp.statusCode)
                        : std::format("HTTP {}: {}", resp.statusCode, text);
}

// Maps a failed response onto the storage error taxonomy
template<typename T>
Result<T> failureFrom(const HttpResponse& resp, const std::string& what) {
    if (resp.statusCode == 0) {
        return Result<T>::err(StorageError::ConnectivityFailure,
                              std::format("{}: {}", what, resp.statusMessage));
    }
    if (resp.statusCode == 401 || resp.statusCode == 403) {
        return Result<T>::err(StorageError::Unauthorized,
                              std::format("{}: credentials rejected (HTTP {})", what, resp.statusCode));
    }
    if (resp.statusCode == 404) {
        return Result<T>::err(StorageError::NotFound, std::format("{}: not found", what));
    }
    return Result<T>::err(StorageError::ProtocolFailure,
                          std::format("{} failed ({})", what, responseDetail(resp)));
}

template<typename T, typename U>
Result<T> propagate(const Result<U>& r) {
    return Result<T>::err(r.error, r.errorMessage);
}

bool isUnauthorizedStatus(int status) {
    return status == 401 || status == 403;
}

} // namespace

WebDAVClient::WebDAVClient(ClientConfig cfg)
    : _cfg(std::move(cfg))
    , _base(parseBaseUrl(_cfg.baseUrl))
    , _authHeader(Utils::basicAuthHeader(_cfg.username, _cfg.password)) {
}

HttpRequest WebDAVClient::makeRequest(HttpMethod method, std::string path) const {
    HttpRequest req;
    req.method = method;
    req.scheme = _base.value.scheme;
    req.host = _base.value.host;
    req.path = std::move(path);
    req.headers["Authorization"] = _authHeader;
    return req;
}

RequestOptions WebDAVClient::transferOptions() const {
    auto opts = HTTP::longTransferOptions(_cfg.connectTimeout);
    opts.verifyPeer = _cfg.verifySsl;
    opts.explicitProxy = _cfg.proxy;
    return opts;
}

HttpResponse WebDAVClient::propfind(const std::string& path, int depth, const std::string& body,
                                    const RequestOptions& opts) {
    auto req = makeRequest(HttpMethod::PROPFIND, path);
    req.headers["Depth"] = std::to_string(depth);
    if (!body.empty()) {
        req.headers["Content-Type"] = "application/xml; charset=utf-8";
        req.body.assign(body.begin(), body.end());
    }
    return _http.execute(req, opts);
}

Result<std::string> WebDAVClient::resolveRoot() {
    {
        std::lock_guard<std::mutex> lock(_rootMutex);
        if (_root) return Result<std::string>::ok(*_root);
    }
    if (_base.failed()) {
        return Result<std::string>::err(StorageError::InvalidParameter, _base.errorMessage);
    }

    const std::string candidates[] = {
        _base.value.basePath + "remote.php/dav/files/" + Utils::percentEncode(_cfg.username, false) + "/",
        _base.value.basePath + "remote.php/webdav/",
    };

    // Probing is bounded even though transfers are not
    RequestOptions opts;
    opts.connectTimeout = _cfg.connectTimeout;
    opts.totalDeadline = std::chrono::milliseconds(60000);
    opts.verifyPeer = _cfg.verifySsl;
    opts.explicitProxy = _cfg.proxy;

    bool sawUnauthorized = false;
    std::string lastDetail;
    for (const auto& candidate : candidates) {
        auto resp = propfind(candidate, 0, kRootProbeBody, opts);
        if (resp.isSuccess()) {
            std::lock_guard<std::mutex> lock(_rootMutex);
            if (!_root) {
                _root = candidate;
                ENTROPY_LOG_INFO_CAT("WebDAVClient", std::format("Using DAV root {} on {}", candidate, _base.value.host));
            }
            return Result<std::string>::ok(*_root);
        }
        if (isUnauthorizedStatus(resp.statusCode)) {
            sawUnauthorized = true;
        }
        lastDetail = std::format("{}: {}", candidate, responseDetail(resp));
        ENTROPY_LOG_DEBUG_CAT("WebDAVClient", std::format("DAV root candidate rejected: {}", lastDetail));
    }

    if (sawUnauthorized) {
        return Result<std::string>::err(StorageError::Unauthorized,
                                        std::format("Credentials rejected by {}", _base.value.host));
    }
    return Result<std::string>::err(StorageError::ConnectivityFailure,
                                    std::format("No working DAV root found on {} ({})", _base.value.host, lastDetail));
}

void WebDAVClient::invalidateRoot() {
    std::lock_guard<std::mutex> lock(_rootMutex);
    _root.reset();
}

std::string WebDAVClient::folderRel() const {
    std::string rel;
    for (const auto& seg : Utils::splitPath(_cfg.backupPath)) {
        if (!rel.empty()) rel.push_back('/');
        rel += Utils::percentEncode(seg, false);
    }
    return rel;
}

Result<std::string> WebDAVClient::folderPath() {
    auto root = resolveRoot();
    if (root.failed()) return root;
    auto rel = folderRel();
    return Result<std::string>::ok(rel.empty() ? root.value : root.value + rel + "/");
}

Result<std::string> WebDAVClient::filePath(const std::string& name) {
    if (name.empty() || name.find('/') != std::string::npos) {
        return Result<std::string>::err(StorageError::InvalidParameter,
                                        std::format("Invalid remote file name '{}'", name));
    }
    auto folder = folderPath();
    if (folder.failed()) return folder;
    return Result<std::string>::ok(folder.value + Utils::percentEncode(name, false));
}

Result<void> WebDAVClient::ensureFolder() {
    auto root = resolveRoot();
    if (root.failed()) return propagate<void>(root);
    auto folder = folderPath();
    if (folder.failed()) return propagate<void>(folder);

    auto opts = transferOptions();
    auto existing = propfind(folder.value, 0, "", opts);
    if (existing.isSuccess()) {
        return Result<void>::ok();
    }
    if (isUnauthorizedStatus(existing.statusCode)) {
        return failureFrom<void>(existing, "Checking backup folder");
    }

    // Create each segment from the root down; intermediate ones may already exist
    std::string current = root.value;
    for (const auto& seg : Utils::splitPath(_cfg.backupPath)) {
        current += Utils::percentEncode(seg, false) + "/";

        auto probe = propfind(current, 0, "", opts);
        if (probe.isSuccess()) continue;
        if (isUnauthorizedStatus(probe.statusCode)) {
            return failureFrom<void>(probe, std::format("Checking folder {}", current));
        }

        auto resp = _http.execute(makeRequest(HttpMethod::MKCOL, current), opts);
        if (resp.statusCode == 201 || resp.statusCode == 405) {
            if (resp.statusCode == 201) {
                ENTROPY_LOG_INFO_CAT("WebDAVClient", std::format("Created folder {}", current));
            }
            continue;
        }
        if (resp.statusCode == 0 || isUnauthorizedStatus(resp.statusCode)) {
            return failureFrom<void>(resp, std::format("MKCOL {}", current));
        }
        return Result<void>::err(StorageError::ProtocolFailure,
                                 std::format("MKCOL failed ({}): {}", resp.statusCode, resp.bodyText()));
    }
    return Result<void>::ok();
}

Result<std::vector<std::string>> WebDAVClient::listFolder() {
    using R = Result<std::vector<std::string>>;
    auto folder = folderPath();
    if (folder.failed()) return propagate<std::vector<std::string>>(folder);

    auto resp = propfind(folder.value, 1, kListBody, transferOptions());
    if (!resp.isSuccess()) {
        return failureFrom<std::vector<std::string>>(resp, "Listing backup folder");
    }

    auto parsed = parsePropfindXml(resp.body);
    if (parsed.failed()) {
        return R::err(StorageError::ProtocolFailure,
                      std::format("Invalid PROPFIND response XML: {}", parsed.errorMessage));
    }

    auto decodedNorm = [](const std::string& href) {
        auto norm = Utils::normalizeHrefForCompare(href, true);
        auto decoded = Utils::percentDecode(norm);
        return decoded ? *decoded : norm;
    };
    const std::string selfPath = decodedNorm(folder.value);
    const auto segments = Utils::splitPath(_cfg.backupPath);
    const std::string folderLeaf = segments.empty() ? std::string() : segments.back();

    std::set<std::string> names;
    for (const auto& entry : parsed.value) {
        auto seg = Utils::lastSegment(entry.href);
        if (seg.empty()) continue;
        if (decodedNorm(entry.href) == selfPath) continue;
        if (entry.isCollection && seg == folderLeaf) continue;
        names.insert(std::move(seg));
    }
    return R::ok(std::vector<std::string>(names.begin(), names.end()));
}

Result<void> WebDAVClient::put(const std::string& name, RequestOptions opts) {
    auto path = filePath(name);
    if (path.failed()) return propagate<void>(path);

    auto req = makeRequest(HttpMethod::PUT, path.value);
    auto resp = _http.execute(req, opts);
    if (!resp.isSuccess()) {
        return failureFrom<void>(resp, std::format("PUT {}", name));
    }
    return Result<void>::ok();
}

Result<void> WebDAVClient::putBytes(const std::string& name, const std::vector<uint8_t>& data) {
    auto path = filePath(name);
    if (path.failed()) return propagate<void>(path);

    auto req = makeRequest(HttpMethod::PUT, path.value);
    req.body = data;
    auto resp = _http.execute(req, transferOptions());
    if (!resp.isSuccess()) {
        return failureFrom<void>(resp, std::format("PUT {}", name));
    }
    return Result<void>::ok();
}

Result<void> WebDAVClient::putFile(const std::string& name, const std::filesystem::path& path, int64_t size) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<void>::err(StorageError::IoFailure,
                                 std::format("Cannot open '{}' for upload", path.string()));
    }

    std::optional<uint64_t> length;
    if (size > 0) {
        length = static_cast<uint64_t>(size);
    } else {
        std::error_code ec;
        auto fsSize = std::filesystem::file_size(path, ec);
        if (!ec) {
            length = static_cast<uint64_t>(fsSize);
        } else {
            ENTROPY_LOG_WARNING_CAT("WebDAVClient",
                std::format("Size of '{}' unknown ({}); uploading without Content-Length", path.string(), ec.message()));
        }
    }

    auto opts = transferOptions();
    opts.contentLength = length;
    opts.uploadRead = [&in](char* dst, size_t max) -> size_t {
        in.read(dst, static_cast<std::streamsize>(max));
        if (in.bad()) return CURL_READFUNC_ABORT;
        return static_cast<size_t>(in.gcount());
    };

    auto r = put(name, std::move(opts));
    if (r.failed() && in.bad()) {
        return Result<void>::err(StorageError::IoFailure,
                                 std::format("Reading '{}' failed during upload", path.string()));
    }
    return r;
}

Result<void> WebDAVClient::putStream(const std::string& name, Transfer::ChunkSource& source) {
    std::optional<Result<size_t>> sourceError;

    auto opts = transferOptions();
    opts.contentLength.reset();
    opts.uploadRead = [&source, &sourceError](char* dst, size_t max) -> size_t {
        auto r = source.read(reinterpret_cast<uint8_t*>(dst), max);
        if (r.failed()) {
            sourceError = std::move(r);
            return CURL_READFUNC_ABORT;
        }
        return r.value;
    };

    auto r = put(name, std::move(opts));
    if (sourceError) {
        return propagate<void>(*sourceError);
    }
    return r;
}

Result<std::vector<uint8_t>> WebDAVClient::getBytes(const std::string& name) {
    using R = Result<std::vector<uint8_t>>;
    auto path = filePath(name);
    if (path.failed()) return propagate<std::vector<uint8_t>>(path);

    auto resp = _http.execute(makeRequest(HttpMethod::GET, path.value), transferOptions());
    if (resp.statusCode == 404) {
        return R::err(StorageError::NotFound, name);
    }
    if (!resp.isSuccess()) {
        return failureFrom<std::vector<uint8_t>>(resp, std::format("GET {}", name));
    }
    return R::ok(std::move(resp.body));
}

Result<std::unique_ptr<DownloadStream>> WebDAVClient::getStream(const std::string& name) {
    using R = Result<std::unique_ptr<DownloadStream>>;
    auto path = filePath(name);
    if (path.failed()) return propagate<std::unique_ptr<DownloadStream>>(path);

    HTTP::StreamOptions opts;
    opts.connectTimeout = _cfg.connectTimeout;
    opts.verifyPeer = _cfg.verifySsl;
    opts.explicitProxy = _cfg.proxy;

    auto handle = _http.executeStream(makeRequest(HttpMethod::GET, path.value), opts);
    handle.waitForHeaders();

    int status = handle.getStatusCode();
    if (status >= 200 && status < 300) {
        return R::ok(std::make_unique<DownloadStream>(std::move(handle), name));
    }

    handle.cancel();
    if (status == 404) {
        return R::err(StorageError::NotFound, name);
    }
    if (status == 0) {
        return R::err(StorageError::ConnectivityFailure,
                      std::format("GET {}: {}", name, handle.getFailureReason()));
    }
    if (isUnauthorizedStatus(status)) {
        return R::err(StorageError::Unauthorized,
                      std::format("GET {}: credentials rejected (HTTP {})", name, status));
    }
    return R::err(StorageError::ProtocolFailure, std::format("GET {} failed (HTTP {})", name, status));
}

Result<StatInfo> WebDAVClient::stat(const std::string& name) {
    using R = Result<StatInfo>;
    auto path = filePath(name);
    if (path.failed()) return propagate<StatInfo>(path);

    auto resp = propfind(path.value, 0, kStatBody, transferOptions());
    if (resp.statusCode == 404) {
        return R::err(StorageError::NotFound, name);
    }
    if (!resp.isSuccess()) {
        return failureFrom<StatInfo>(resp, std::format("PROPFIND {}", name));
    }

    auto parsed = parsePropfindXml(resp.body);
    if (parsed.failed()) {
        return R::err(StorageError::ProtocolFailure, parsed.errorMessage);
    }
    if (parsed.value.empty()) {
        return R::err(StorageError::ProtocolFailure, "Invalid PROPFIND stat response");
    }
    const auto& entry = parsed.value.front();
    if (!entry.hasProp) {
        return R::err(StorageError::ProtocolFailure, "Invalid PROPFIND stat response (no prop)");
    }

    StatInfo info;
    info.size = entry.contentLength.value_or(0);
    if (entry.lastModifiedRaw && !entry.lastModifiedRaw->empty()) {
        info.modifiedRaw = *entry.lastModifiedRaw;
        info.modifiedIso = entry.lastModified ? Utils::formatIsoUtc(*entry.lastModified) : info.modifiedRaw;
    } else {
        info.modifiedIso = Utils::formatIsoUtc(std::chrono::system_clock::now());
    }
    return R::ok(std::move(info));
}

Result<void> WebDAVClient::remove(const std::string& name) {
    auto path = filePath(name);
    if (path.failed()) return propagate<void>(path);

    auto resp = _http.execute(makeRequest(HttpMethod::DELETE_, path.value), transferOptions());
    switch (resp.statusCode) {
        case 200:
        case 202:
        case 204:
            return Result<void>::ok();
        case 404:
            return Result<void>::err(StorageError::NotFound, name);
        default:
            break;
    }
    if (resp.statusCode == 0 || isUnauthorizedStatus(resp.statusCode)) {
        return failureFrom<void>(resp, std::format("DELETE {}", name));
    }
    return Result<void>::err(StorageError::ProtocolFailure,
                             std::format("DELETE failed ({}): {}", resp.statusCode, resp.bodyText()));
}

} // namespace DavBackup::WebDAV
