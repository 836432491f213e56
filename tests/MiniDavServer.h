/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the DavBackup project.
 */

#pragma once

#include <string>
#include <thread>
#include <atomic>
#include <mutex>
#include <unordered_map>
#include <vector>
#include <optional>
#include <chrono>
#include <cstring>
#include <ctime>
#include <stdexcept>
#include <algorithm>

#ifdef _WIN32
  #define NOMINMAX
  #include <winsock2.h>
  #include <ws2tcpip.h>
  #pragma comment(lib, "Ws2_32.lib")
#else
  #include <sys/types.h>
  #include <sys/socket.h>
  #include <netinet/in.h>
  #include <arpa/inet.h>
  #include <unistd.h>
  #include <fcntl.h>
#endif

#include "DavTree.h"

/**
 * Minimal in-process WebDAV test server using raw sockets.
 * Supports PROPFIND (Depth 0/1), GET, HEAD, PUT, DELETE, MKCOL over an in-memory DavTree
 * that is mutated by the requests, plus optional Basic-auth checking.
 *
 * Only paths below the mount are served; everything else is 404, which lets tests
 * decide which DAV root candidate works. Requests are handled one at a time.
 */
class MiniDavServer {
public:
#ifdef _WIN32
    using Socket = SOCKET;
#else
    using Socket = int;
#endif

    struct RequestRecord {
        std::string method;
        std::string path;                        // decoded request path
        bool chunked = false;                    // Transfer-Encoding: chunked
        std::optional<size_t> contentLength;     // Content-Length header, if sent
        size_t bodySize = 0;                     // bytes actually received
        std::string authorization;               // Authorization header, if sent
        std::string depth;                       // Depth header, if sent
    };

    explicit MiniDavServer(DavTree& tree, std::string mount = "/remote.php/webdav/")
        : _tree(tree), _base(std::move(mount)) {
        if (_base.empty() || _base.back() != '/') _base.push_back('/');
        _tree.addDir(_base);
    }

    ~MiniDavServer() { stop(); }

    void start() {
#ifdef _WIN32
        WSADATA wsaData{};
        if (WSAStartup(MAKEWORD(2,2), &wsaData) != 0)
            throw std::runtime_error("WSAStartup failed");
#endif
        _running.store(true);
        _listenSock = ::socket(AF_INET, SOCK_STREAM, 0);
        if (_listenSock < 0) throw std::runtime_error("socket failed");

        int on = 1;
#ifdef _WIN32
        setsockopt(_listenSock, SOL_SOCKET, SO_REUSEADDR, (const char*)&on, sizeof(on));
#else
        setsockopt(_listenSock, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
#endif

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(0); // any available port
#ifdef _WIN32
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
#else
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
#endif
        if (::bind(_listenSock, (sockaddr*)&addr, sizeof(addr)) < 0)
            throw std::runtime_error("bind failed");
        if (::listen(_listenSock, 32) < 0)
            throw std::runtime_error("listen failed");

        socklen_t len = sizeof(addr);
        if (getsockname(_listenSock, (sockaddr*)&addr, &len) == 0) {
            _port = ntohs(addr.sin_port);
        }

        _thr = std::thread([this]{ this->acceptLoop(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    void stop() {
        bool exp = true;
        if (_running.compare_exchange_strong(exp, false)) {
#ifdef _WIN32
            shutdown(_listenSock, SD_BOTH);
            closesocket(_listenSock);
            _listenSock = INVALID_SOCKET;
#else
            shutdown(_listenSock, SHUT_RDWR);
            close(_listenSock);
            _listenSock = -1;
#endif
            if (_thr.joinable()) _thr.join();
#ifdef _WIN32
            WSACleanup();
#endif
        }
    }

    uint16_t port() const { return _port; }
    std::string baseUrl() const { return "http://127.0.0.1:" + std::to_string(_port); }

    // Every request must carry exactly this Authorization value, otherwise 401
    void requireAuthorization(std::string headerValue) {
        std::lock_guard<std::mutex> lk(_cfgMutex);
        _requiredAuth = std::move(headerValue);
    }

    // Serve GET bodies with chunked encoding in small pieces
    void setChunkedGet(bool on, size_t chunkSize = 5, int delayMs = 2) {
        std::lock_guard<std::mutex> lk(_cfgMutex);
        _chunkedGet = on;
        _chunkSize = chunkSize;
        _chunkDelayMs = delayMs;
    }

    // Emit absolute-URI hrefs ("http://host:port/path") in multistatus bodies
    void setAbsoluteHrefs(bool on) {
        std::lock_guard<std::mutex> lk(_cfgMutex);
        _absoluteHrefs = on;
    }

    // Answer any request for this decoded path with the given status and body
    void failPath(std::string path, int status, std::string body = {},
                  std::unordered_map<std::string,std::string> headers = {}) {
        std::lock_guard<std::mutex> lk(_cfgMutex);
        _failures[std::move(path)] = Failure{status, std::move(body), std::move(headers)};
    }

    void clearFailures() {
        std::lock_guard<std::mutex> lk(_cfgMutex);
        _failures.clear();
    }

    std::vector<RequestRecord> requests() const {
        std::lock_guard<std::mutex> lk(_cfgMutex);
        return _requests;
    }

    void clearRequests() {
        std::lock_guard<std::mutex> lk(_cfgMutex);
        _requests.clear();
    }

    static std::string encodePath(const std::string& s) {
        static const char* hex = "0123456789ABCDEF";
        std::string out;
        for (unsigned char c : s) {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
                out.push_back((char)c);
            } else {
                out.push_back('%');
                out.push_back(hex[c >> 4]);
                out.push_back(hex[c & 0x0F]);
            }
        }
        return out;
    }

private:
    struct Reply {
        int status = 200;
        std::string contentType = "text/plain";
        std::string body;
        std::unordered_map<std::string,std::string> headers;
        bool chunked = false;
    };

    void acceptLoop() {
        while (_running.load()) {
            Socket cs = ::accept(_listenSock, nullptr, nullptr);
#ifdef _WIN32
            if (cs == INVALID_SOCKET) break;
#else
            if (cs < 0) break;
#endif
#if defined(SO_NOSIGPIPE)
            int set = 1;
            setsockopt(cs, SOL_SOCKET, SO_NOSIGPIPE, &set, sizeof(set));
#endif
            handleClient(cs);
#ifdef _WIN32
            closesocket(cs);
#else
            close(cs);
#endif
        }
    }

    static bool starts_with(const std::string& s, const std::string& p) {
        return s.size() >= p.size() && std::equal(p.begin(), p.end(), s.begin());
    }

    static std::string decodePath(const std::string& s) {
        std::string out;
        for (size_t i = 0; i < s.size(); ++i) {
            if (s[i] == '%' && i + 2 < s.size()) {
                out.push_back((char)std::strtol(s.substr(i + 1, 2).c_str(), nullptr, 16));
                i += 2;
            } else {
                out.push_back(s[i]);
            }
        }
        return out;
    }

    static std::string parentOf(std::string p) {
        if (p.size() > 1 && p.back() == '/') p.pop_back();
        auto slash = p.find_last_of('/');
        if (slash == std::string::npos || slash == 0) return "/";
        return p.substr(0, slash);
    }

    void handleClient(Socket cs) {
        std::string req;
        char buf[4096];
        for (;;) {
#ifdef _WIN32
            int n = ::recv(cs, buf, sizeof(buf), 0);
#else
            ssize_t n = ::recv(cs, buf, sizeof(buf), 0);
#endif
            if (n <= 0) break;
            req.append(buf, buf + n);
            if (req.find("\r\n\r\n") != std::string::npos) break;
            if (req.size() > 64 * 1024) break; // header cap
        }
        if (req.empty()) return;

        auto sp1 = req.find(' ');
        auto sp2 = sp1 == std::string::npos ? std::string::npos : req.find(' ', sp1 + 1);
        auto hdrEnd = req.find("\r\n\r\n");
        if (sp1 == std::string::npos || sp2 == std::string::npos || hdrEnd == std::string::npos) {
            sendSimple(cs, 400);
            return;
        }
        std::string method = req.substr(0, sp1);
        std::string rawPath = req.substr(sp1 + 1, sp2 - (sp1 + 1));
        if (auto q = rawPath.find('?'); q != std::string::npos) rawPath.resize(q);
        std::string path = decodePath(rawPath);

        std::unordered_map<std::string,std::string> headers;
        auto hdrStart = req.find("\r\n") + 2;
        size_t i = hdrStart;
        while (i < hdrEnd) {
            auto lineEnd = req.find("\r\n", i);
            if (lineEnd == std::string::npos || lineEnd > hdrEnd) break;
            auto line = req.substr(i, lineEnd - i);
            auto col = line.find(':');
            if (col != std::string::npos) {
                std::string k = line.substr(0, col);
                for (auto& c : k) c = (char)tolower((unsigned char)c);
                std::string v = line.substr(col + 1);
                size_t p = 0;
                while (p < v.size() && (v[p] == ' ' || v[p] == '\t')) ++p;
                v.erase(0, p);
                headers[k] = v;
            }
            i = lineEnd + 2;
        }

        // Request body (Content-Length or Transfer-Encoding: chunked)
        RequestRecord record;
        record.method = method;
        record.path = path;
        if (auto it = headers.find("transfer-encoding"); it != headers.end()) {
            if (it->second.find("chunked") != std::string::npos) record.chunked = true;
        }
        if (auto it = headers.find("content-length"); it != headers.end()) {
            record.contentLength = (size_t)std::strtoull(it->second.c_str(), nullptr, 10);
        }
        if (auto it = headers.find("authorization"); it != headers.end()) record.authorization = it->second;
        if (auto it = headers.find("depth"); it != headers.end()) record.depth = it->second;

        std::string body;
        if (record.chunked) {
            size_t pos = hdrEnd + 4;
            auto readMore = [&]() -> bool {
#ifdef _WIN32
                int n = ::recv(cs, buf, sizeof(buf), 0);
#else
                ssize_t n = ::recv(cs, buf, sizeof(buf), 0);
#endif
                if (n <= 0) return false;
                req.append(buf, buf + n);
                return true;
            };
            auto readLine = [&]() -> std::string {
                for (;;) {
                    size_t crlf = req.find("\r\n", pos);
                    if (crlf != std::string::npos) {
                        std::string line = req.substr(pos, crlf - pos);
                        pos = crlf + 2;
                        return line;
                    }
                    if (!readMore()) return std::string();
                }
            };
            auto readExact = [&](size_t nbytes) -> bool {
                while (req.size() < pos + nbytes) {
                    if (!readMore()) return false;
                }
                body.append(req.data() + pos, nbytes);
                pos += nbytes;
                return true;
            };

            for (;;) {
                std::string sizeLine = readLine();
                if (sizeLine.empty()) break; // malformed
                auto sc = sizeLine.find(';');
                if (sc != std::string::npos) sizeLine = sizeLine.substr(0, sc);
                size_t chunkSize = (size_t)std::strtoull(sizeLine.c_str(), nullptr, 16);
                if (chunkSize == 0) {
                    (void)readLine();
                    break;
                }
                if (!readExact(chunkSize)) break;
                (void)readLine();
            }
        } else {
            size_t contentLen = record.contentLength.value_or(0);
            body.reserve(contentLen);
            auto have = req.size() - (hdrEnd + 4);
            if (have > 0) {
                size_t copy = std::min(have, contentLen);
                body.append(req.data() + hdrEnd + 4, copy);
            }
            while (body.size() < contentLen) {
#ifdef _WIN32
                int n = ::recv(cs, buf, sizeof(buf), 0);
#else
                ssize_t n = ::recv(cs, buf, sizeof(buf), 0);
#endif
                if (n <= 0) break;
                size_t remain = contentLen - body.size();
                size_t copy = (size_t)n > remain ? remain : (size_t)n;
                body.append(buf, buf + copy);
            }
        }
        record.bodySize = body.size();

        Reply reply = route(method, path, headers, body, record);
        {
            std::lock_guard<std::mutex> lk(_cfgMutex);
            _requests.push_back(std::move(record));
        }

        if (reply.chunked) {
            size_t chunkSize;
            int delayMs;
            {
                std::lock_guard<std::mutex> lk(_cfgMutex);
                chunkSize = _chunkSize;
                delayMs = _chunkDelayMs;
            }
            sendChunked(cs, reply.status, reply.contentType, reply.body, reply.headers, chunkSize, delayMs);
        } else {
            sendRaw(cs, reply.status, reply.contentType, reply.body, reply.headers);
        }
    }

    // Builds the reply while holding the tree lock; sending happens afterwards
    Reply route(const std::string& method, const std::string& path,
                const std::unordered_map<std::string,std::string>& headers,
                std::string& body, const RequestRecord& record) {
        Reply r;
        r.status = 405;

        std::string requiredAuth;
        bool chunkedGet = false;
        bool absoluteHrefs = false;
        {
            std::lock_guard<std::mutex> lk(_cfgMutex);
            requiredAuth = _requiredAuth;
            chunkedGet = _chunkedGet;
            absoluteHrefs = _absoluteHrefs;
            std::string trimmed = path;
            if (trimmed.size() > 1 && trimmed.back() == '/') trimmed.pop_back();
            auto f = _failures.find(trimmed);
            if (f == _failures.end()) f = _failures.find(path);
            if (f != _failures.end()) {
                r.status = f->second.status;
                r.body = f->second.body;
                r.headers = f->second.headers;
                return r;
            }
        }

        if (!requiredAuth.empty() && record.authorization != requiredAuth) {
            r.status = 401;
            r.headers["WWW-Authenticate"] = "Basic realm=\"test\"";
            return r;
        }

        std::string mountNoSlash = _base.substr(0, _base.size() - 1);
        if (!(starts_with(path, _base) || path == mountNoSlash)) {
            r.status = 404;
            return r;
        }
        if (path.find("..") != std::string::npos) {
            r.status = 400;
            return r;
        }

        std::lock_guard<std::recursive_mutex> treeLock(_tree.mutex());

        if (method == "PROPFIND") {
            int depth = 0;
            if (auto it = headers.find("depth"); it != headers.end()) {
                if (it->second == "1") depth = 1;
                else if (it->second == "infinity") {
                    r.status = 400;
                    return r;
                }
            }
            return propfind(path, depth, absoluteHrefs);
        }

        if (method == "GET" || method == "HEAD") {
            const DavNode* n = _tree.find(path);
            if (!n || n->isDir) {
                r.status = n ? 405 : 404;
                return r;
            }
            r.status = 200;
            r.contentType = "application/octet-stream";
            if (auto lm = httpDate(n->mtime); !lm.empty()) r.headers["Last-Modified"] = lm;
            if (method == "HEAD") {
                r.headers["Content-Length"] = std::to_string(n->content.size());
                return r;
            }
            r.body = n->content;
            r.chunked = chunkedGet;
            return r;
        }

        if (method == "PUT") {
            const DavNode* n = _tree.find(path);
            if (n && n->isDir) {
                r.status = 405;
                return r;
            }
            bool created = false;
            if (!_tree.putFile(path, std::move(body), &created)) {
                r.status = 409; // parent collection missing
                return r;
            }
            r.status = created ? 201 : 204;
            return r;
        }

        if (method == "DELETE") {
            r.status = _tree.remove(path) ? 204 : 404;
            return r;
        }

        if (method == "MKCOL") {
            if (_tree.find(path)) {
                r.status = 405;
                return r;
            }
            const DavNode* pn = _tree.find(parentOf(path));
            if (!pn || !pn->isDir) {
                r.status = 409;
                return r;
            }
            _tree.addDir(path);
            r.status = 201;
            return r;
        }

        r.headers["Allow"] = "PROPFIND, GET, HEAD, PUT, DELETE, MKCOL";
        return r;
    }

    Reply propfind(const std::string& path, int depth, bool absoluteHrefs) {
        Reply r;
        const DavNode* n = _tree.find(path);
        if (!n) {
            r.status = 404;
            return r;
        }

        std::string prefix = absoluteHrefs ? ("http://127.0.0.1:" + std::to_string(_port)) : std::string();
        std::string xml;
        xml += "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n";
        xml += "<D:multistatus xmlns:D=\"DAV:\">\n";

        auto appendResponse = [&](const std::string& href, const DavNode& node) {
            xml += "  <D:response>\n";
            xml += "    <D:href>" + prefix + encodePath(href) + "</D:href>\n";
            xml += "    <D:propstat><D:prop>";
            xml += "<D:displayname>" + node.name + "</D:displayname>";
            xml += "<D:resourcetype>";
            if (node.isDir) xml += "<D:collection/>";
            xml += "</D:resourcetype>";
            if (!node.isDir) {
                xml += "<D:getcontentlength>" + std::to_string(node.content.size()) + "</D:getcontentlength>";
            }
            if (auto d = httpDate(node.mtime); !d.empty()) {
                xml += "<D:getlastmodified>" + d + "</D:getlastmodified>";
            }
            xml += "</D:prop><D:status>HTTP/1.1 200 OK</D:status></D:propstat>\n";
            xml += "  </D:response>\n";
        };

        std::string selfHref = path;
        if (n->isDir && !selfHref.empty() && selfHref.back() != '/')
            selfHref.push_back('/');
        appendResponse(selfHref, *n);

        if (depth >= 1 && n->isDir) {
            for (auto& kv : n->children) {
                const auto& c = *kv.second;
                appendResponse(selfHref + c.name + (c.isDir ? "/" : ""), c);
            }
        }
        xml += "</D:multistatus>\n";

        r.status = 207;
        r.contentType = "application/xml; charset=utf-8";
        r.body = std::move(xml);
        return r;
    }

    static std::string httpDate(const std::optional<std::chrono::system_clock::time_point>& tp) {
        if (!tp) return {};
        std::time_t t = std::chrono::system_clock::to_time_t(*tp);
        char buf[64]{};
        std::tm g{};
#ifdef _WIN32
        gmtime_s(&g, &t);
#else
        gmtime_r(&t, &g);
#endif
        std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &g);
        return buf;
    }

    static std::string statusText(int status) {
        switch (status) {
            case 200: return "OK";
            case 201: return "Created";
            case 204: return "No Content";
            case 207: return "Multi-Status";
            case 400: return "Bad Request";
            case 401: return "Unauthorized";
            case 403: return "Forbidden";
            case 404: return "Not Found";
            case 405: return "Method Not Allowed";
            case 409: return "Conflict";
            case 500: return "Internal Server Error";
            case 503: return "Service Unavailable";
            default: return "";
        }
    }

    static void sendSimple(Socket cs, int status) {
        sendRaw(cs, status, "text/plain", "", {});
    }

    static void sendRaw(Socket cs, int status, const std::string& contentType, const std::string& body,
                        std::unordered_map<std::string,std::string> headers)
    {
        std::string resp = "HTTP/1.1 " + std::to_string(status) + " " + statusText(status) + "\r\n";
        headers["Content-Type"] = contentType;
        if (headers.find("Content-Length") == headers.end()) {
            headers["Content-Length"] = std::to_string(body.size());
        }
        headers["Connection"] = "close";  // Single request per connection
        for (auto& kv : headers) {
            resp += kv.first + ": " + kv.second + "\r\n";
        }
        resp += "\r\n";
        resp += body;
        sendAll(cs, resp.data(), resp.size());
    }

    static void sendChunked(Socket cs, int status, const std::string& contentType, const std::string& body,
                            std::unordered_map<std::string,std::string> headers, size_t chunkSize, int delayMs)
    {
        if (chunkSize == 0) chunkSize = 8192;
        std::string head = "HTTP/1.1 " + std::to_string(status) + " " + statusText(status) + "\r\n";
        headers["Content-Type"] = contentType;
        headers["Transfer-Encoding"] = "chunked";
        headers["Connection"] = "close";
        for (auto& kv : headers) {
            head += kv.first + ": " + kv.second + "\r\n";
        }
        head += "\r\n";
        if (!sendAll(cs, head.data(), head.size())) return;

        size_t off = 0;
        while (off < body.size()) {
            size_t n = std::min(chunkSize, body.size() - off);
            char sizeLine[32];
            int sl = std::snprintf(sizeLine, sizeof(sizeLine), "%zx\r\n", n);
            if (!sendAll(cs, sizeLine, (size_t)sl)) return;
            if (!sendAll(cs, body.data() + off, n)) return;
            if (!sendAll(cs, "\r\n", 2)) return;
            off += n;
            if (delayMs > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
            }
        }
        sendAll(cs, "0\r\n\r\n", 5);
    }

    static bool sendAll(Socket cs, const char* data, size_t len) {
        size_t sent = 0;
        while (sent < len) {
#ifdef _WIN32
            int n = ::send(cs, data + sent, (int)(len - sent), 0);
#else
            int flags = 0;
#ifdef MSG_NOSIGNAL
            flags |= MSG_NOSIGNAL;
#endif
            ssize_t n = ::send(cs, data + sent, len - sent, flags);
#endif
            if (n <= 0) return false;
            sent += (size_t)n;
        }
        return true;
    }

    DavTree& _tree;
    std::string _base;
    std::atomic<bool> _running{false};
#ifdef _WIN32
    SOCKET _listenSock = INVALID_SOCKET;
#else
    int _listenSock = -1;
#endif
    std::thread _thr;
    uint16_t _port = 0;

    mutable std::mutex _cfgMutex;
    std::string _requiredAuth;
    bool _chunkedGet = false;
    size_t _chunkSize = 5;
    int _chunkDelayMs = 2;
    bool _absoluteHrefs = false;
    struct Failure {
        int status = 500;
        std::string body;
        std::unordered_map<std::string,std::string> headers;
    };
    std::unordered_map<std::string, Failure> _failures;
    std::vector<RequestRecord> _requests;
};
