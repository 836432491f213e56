/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the DavBackup project.
 */

/**
 * @file WebDAVUtils.h
 * @brief Utility functions for WebDAV paths, dates and authentication
 *
 * Percent encoding/decoding, href normalisation, path joining, HTTP date
 * parsing, ISO-8601 formatting and Basic auth header construction.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace DavBackup::WebDAV::Utils
{

/**
 * @brief Percent-encodes a string for use in URLs
 *
 * Encodes everything except RFC 3986 unreserved characters as %XX. When
 * keepSlashes is true, '/' characters are preserved.
 *
 * @code
 * auto encoded = percentEncode("my file.txt");  // "my%20file.txt"
 * auto user = percentEncode("a@b.c", false);     // "a%40b.c"
 * @endcode
 */
std::string percentEncode(std::string_view s, bool keepSlashes = true);

/**
 * @brief Percent-decodes a URL-encoded string
 * @return Decoded string, or nullopt on malformed escapes (%ZZ, truncated %X)
 */
std::optional<std::string> percentDecode(std::string_view s);

/**
 * @brief Strips scheme and authority from URL
 *
 * @code
 * auto path = stripSchemeHost("https://example.com/dav/file.txt");  // "/dav/file.txt"
 * @endcode
 */
std::string stripSchemeHost(std::string_view href);

/**
 * @brief Normalizes href for string comparison
 *
 * Strips scheme and host, drops query and fragment, collapses repeated '/'
 * and optionally appends a trailing '/'.
 */
std::string normalizeHrefForCompare(const std::string& href, bool ensureTrailingSlashIfCollection = false);

/**
 * @brief Splits a slash-separated path into its non-empty segments
 *
 * @code
 * splitPath("/HomeAssistant//Backups/");  // {"HomeAssistant", "Backups"}
 * @endcode
 */
std::vector<std::string> splitPath(std::string_view path);

/**
 * @brief Joins a base path and a relative part with exactly one '/' between them
 */
std::string joinPath(std::string_view base, std::string_view rel);

/**
 * @brief Last non-empty segment of an href, percent-decoded
 *
 * Trailing slashes are ignored so "/dav/folder/" yields "folder". Malformed
 * escapes leave the segment as received.
 */
std::string lastSegment(std::string_view href);

/**
 * @brief Parses HTTP date header
 *
 * Accepts IMF-fixdate per RFC 7231 ("Mon, 15 Jan 2024 12:30:00 GMT"). The zone
 * may also be "UTC" or a numeric offset such as "+0200", which is applied.
 *
 * @param s Date string
 * @return Time point, or nullopt if parsing failed
 */
std::optional<std::chrono::system_clock::time_point> parseHttpDate(const char* s);

/**
 * @brief Formats a time point as ISO-8601 UTC with explicit offset
 *
 * @code
 * formatIsoUtc(*parseHttpDate("Mon, 15 Jan 2024 12:30:00 GMT"));  // "2024-01-15T12:30:00+00:00"
 * @endcode
 */
std::string formatIsoUtc(std::chrono::system_clock::time_point tp);

/**
 * @brief Standard base64 encoding with '=' padding
 */
std::string base64Encode(std::string_view data);

/**
 * @brief Builds the value of an HTTP Basic Authorization header
 * @return "Basic " followed by base64(username ":" password)
 */
std::string basicAuthHeader(std::string_view username, std::string_view password);

}  // namespace DavBackup::WebDAV::Utils
