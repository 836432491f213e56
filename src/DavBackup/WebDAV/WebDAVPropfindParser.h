/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the DavBackup project.
 */

/**
 * @file WebDAVPropfindParser.h
 * @brief Parser for WebDAV PROPFIND responses
 *
 * Parses RFC 4918 multi-status bodies into structured resource information.
 */

#pragma once

#include "DavBackup/Core/ErrorCodes.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace DavBackup::WebDAV
{

/**
 * @brief Resource information from WebDAV PROPFIND response
 *
 * One DAV:response element of a multi-status body.
 */
struct DavResourceInfo
{
    std::string href;            ///< Raw href from response (may be absolute or relative)
    bool isCollection = false;   ///< true if DAV:resourcetype contains DAV:collection
    bool hasProp = false;        ///< true if a DAV:prop element was present
    std::optional<uint64_t> contentLength;                              ///< getcontentlength (nullopt if missing)
    std::optional<std::string> lastModifiedRaw;                         ///< getlastmodified text as sent
    std::optional<std::chrono::system_clock::time_point> lastModified;  ///< Parsed getlastmodified (nullopt if missing or unparseable)
    std::optional<std::string> displayName;                             ///< displayname (nullopt if missing)
    std::optional<std::string> contentType;                             ///< MIME type (nullopt if missing)
};

/**
 * @brief Parses WebDAV PROPFIND response body (207 Multistatus)
 *
 * Namespace-tolerant (matches by local name, ignores prefixes). Prefers the
 * propstat carrying an HTTP 200 status. Entries without an href are skipped.
 *
 * @param xmlBytes Raw XML response body
 * @return Resources in document order; ProtocolFailure if the body is not
 *         well-formed XML or its root is not a multistatus element
 *
 * @code
 * auto resp = http.execute(propfindReq);
 * auto parsed = parsePropfindXml(resp.body);
 * if (parsed.success()) {
 *     for (const auto& res : parsed.value) {
 *         handle(res.href, res.isCollection);
 *     }
 * }
 * @endcode
 */
Result<std::vector<DavResourceInfo>> parsePropfindXml(const std::vector<uint8_t>& xmlBytes);

}  // namespace DavBackup::WebDAV
