/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the DavBackup project.
 */
#include "DavBackup/WebDAV/WebDAVUtils.h"

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace DavBackup::WebDAV::Utils
{

std::string percentEncode(std::string_view s, bool keepSlashes) {
    auto isUnreserved = [](unsigned char c) { return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~'; };
    static const char* hexDigits = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (isUnreserved(c) || (keepSlashes && c == '/')) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hexDigits[c >> 4]);
            out.push_back(hexDigits[c & 0x0F]);
        }
    }
    return out;
}

std::optional<std::string> percentDecode(std::string_view s) {
    auto hex = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
        if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
        return -1;
    };
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char ch = s[i];
        if (ch != '%') {
            out.push_back(ch);
            continue;
        }
        if (i + 2 >= s.size()) return std::nullopt;
        int a = hex(s[i + 1]), b = hex(s[i + 2]);
        if (a < 0 || b < 0) return std::nullopt;
        out.push_back(static_cast<char>((a << 4) | b));
        i += 2;
    }
    return out;
}

std::string stripSchemeHost(std::string_view href) {
    if (href.rfind("http://", 0) == 0 || href.rfind("https://", 0) == 0) {
        auto pos = href.find('/', href.find("//") + 2);
        if (pos == std::string_view::npos) return std::string("/");
        return std::string(href.substr(pos));
    }
    return std::string(href);
}

std::string normalizeHrefForCompare(const std::string& href, bool ensureTrailingSlashIfCollection) {
    auto path = stripSchemeHost(href);
    auto q = path.find_first_of("?#");
    if (q != std::string::npos) path.resize(q);
    std::string norm;
    norm.reserve(path.size());
    bool prevSlash = false;
    for (char c : path) {
        if (c == '/') {
            if (!prevSlash) norm.push_back(c);
            prevSlash = true;
        } else {
            norm.push_back(c);
            prevSlash = false;
        }
    }
    if (ensureTrailingSlashIfCollection && !norm.empty() && norm.back() != '/') norm.push_back('/');
    return norm;
}

std::vector<std::string> splitPath(std::string_view path) {
    std::vector<std::string> parts;
    size_t i = 0;
    while (i < path.size()) {
        while (i < path.size() && path[i] == '/') ++i;
        size_t j = path.find('/', i);
        if (j == std::string_view::npos) j = path.size();
        if (j > i) parts.emplace_back(path.substr(i, j - i));
        i = j;
    }
    return parts;
}

std::string joinPath(std::string_view base, std::string_view rel) {
    while (!base.empty() && base.back() == '/') base.remove_suffix(1);
    while (!rel.empty() && rel.front() == '/') rel.remove_prefix(1);
    std::string out(base);
    out.push_back('/');
    out.append(rel);
    return out;
}

std::string lastSegment(std::string_view href) {
    auto path = normalizeHrefForCompare(std::string(href));
    while (!path.empty() && path.back() == '/') path.pop_back();
    auto pos = path.find_last_of('/');
    std::string seg = (pos == std::string::npos) ? path : path.substr(pos + 1);
    if (auto decoded = percentDecode(seg)) return *decoded;
    return seg;
}

std::optional<std::chrono::system_clock::time_point> parseHttpDate(const char* s) {
    if (!s) return std::nullopt;
    // IMF-fixdate: Sun, 06 Nov 1994 08:49:37 GMT
    std::tm tm{};
    char wk[4]{};
    char mon[4]{};
    char tz[8]{};
    int d = 0, y = 0, H = 0, M = 0, S = 0;
    if (std::sscanf(s, "%3[A-Za-z], %d %3s %d %d:%d:%d %7s", wk, &d, mon, &y, &H, &M, &S, tz) != 8) return std::nullopt;
    static const char* months = "JanFebMarAprMayJunJulAugSepOctNovDec";
    const char* m = std::strstr(months, mon);
    if (!m || std::strlen(mon) != 3 || (m - months) % 3 != 0) return std::nullopt;
    if (d < 1 || d > 31 || H < 0 || H > 23 || M < 0 || M > 59 || S < 0 || S > 60) return std::nullopt;

    long offsetSec = 0;
    if (std::strcmp(tz, "GMT") != 0 && std::strcmp(tz, "UTC") != 0 && std::strcmp(tz, "Z") != 0) {
        // Numeric zone: +HHMM or -HHMM
        if (std::strlen(tz) != 5 || (tz[0] != '+' && tz[0] != '-')) return std::nullopt;
        for (int i = 1; i < 5; ++i) {
            if (!std::isdigit(static_cast<unsigned char>(tz[i]))) return std::nullopt;
        }
        int hh = (tz[1] - '0') * 10 + (tz[2] - '0');
        int mm = (tz[3] - '0') * 10 + (tz[4] - '0');
        offsetSec = (hh * 3600L + mm * 60L) * (tz[0] == '-' ? -1 : 1);
    }

    tm.tm_mday = d;
    tm.tm_year = y - 1900;
    tm.tm_hour = H;
    tm.tm_min = M;
    tm.tm_sec = S;
    tm.tm_mon = int((m - months) / 3);
    tm.tm_isdst = 0;
#ifdef _WIN32
    time_t tt = _mkgmtime(&tm);
#else
    time_t tt = timegm(&tm);
#endif
    if (tt == -1) return std::nullopt;
    return std::chrono::system_clock::from_time_t(tt - offsetSec);
}

std::string formatIsoUtc(std::chrono::system_clock::time_point tp) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S+00:00", &tm);
    return buf;
}

std::string base64Encode(std::string_view data) {
    static const char* alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);
    size_t i = 0;
    while (i + 3 <= data.size()) {
        uint32_t v = (uint32_t(uint8_t(data[i])) << 16) | (uint32_t(uint8_t(data[i + 1])) << 8) | uint8_t(data[i + 2]);
        out.push_back(alphabet[(v >> 18) & 0x3F]);
        out.push_back(alphabet[(v >> 12) & 0x3F]);
        out.push_back(alphabet[(v >> 6) & 0x3F]);
        out.push_back(alphabet[v & 0x3F]);
        i += 3;
    }
    size_t rem = data.size() - i;
    if (rem == 1) {
        uint32_t v = uint32_t(uint8_t(data[i])) << 16;
        out.push_back(alphabet[(v >> 18) & 0x3F]);
        out.push_back(alphabet[(v >> 12) & 0x3F]);
        out.append("==");
    } else if (rem == 2) {
        uint32_t v = (uint32_t(uint8_t(data[i])) << 16) | (uint32_t(uint8_t(data[i + 1])) << 8);
        out.push_back(alphabet[(v >> 18) & 0x3F]);
        out.push_back(alphabet[(v >> 12) & 0x3F]);
        out.push_back(alphabet[(v >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::string basicAuthHeader(std::string_view username, std::string_view password) {
    std::string creds;
    creds.reserve(username.size() + password.size() + 1);
    creds.append(username);
    creds.push_back(':');
    creds.append(password);
    return "Basic " + base64Encode(creds);
}

}  // namespace DavBackup::WebDAV::Utils
