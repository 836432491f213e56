/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the DavBackup project.
 */

/**
 * @file ClientConfig.h
 * @brief Connection settings for a WebDAV backup target
 */

#pragma once

#include "DavBackup/Core/ErrorCodes.h"
#include <chrono>
#include <optional>
#include <string>

namespace Json {
class Value;
}

namespace DavBackup {

/**
 * @brief Server connection and destination folder settings
 *
 * @code
 * ClientConfig cfg;
 * cfg.baseUrl = "https://cloud.example.com";
 * cfg.username = "alice";
 * cfg.password = "secret";
 * if (auto v = cfg.validate(); v.failed()) {
 *     report(v.errorMessage);
 * }
 * @endcode
 */
struct ClientConfig {
    std::string baseUrl;                                  ///< e.g. "https://cloud.example.com/owncloud"
    std::string username;                                 ///< Basic auth user, also used in the DAV root
    std::string password;                                 ///< Basic auth password (never logged)
    std::string backupPath = "/HomeAssistant/Backups";    ///< Destination folder below the DAV root
    bool verifySsl = true;                                ///< TLS peer/host verification
    std::optional<std::string> proxy;                     ///< Explicit proxy URL; unset = environment detection
    std::chrono::milliseconds connectTimeout{60000};      ///< Connect timeout for every operation

    /**
     * @brief Checks the settings are usable
     * @return InvalidParameter on an empty or non-http(s) base URL, an empty username,
     *         or an empty backup path
     */
    Result<void> validate() const;
};

/**
 * @brief Base URL split into request parts
 */
struct BaseUrlParts {
    std::string scheme;     ///< "http" or "https"
    std::string host;       ///< host with optional ":port"
    std::string basePath;   ///< path prefix, always ending in '/'
};

/**
 * @brief Splits a base URL into scheme, authority and path
 * @return InvalidParameter if the scheme is not http/https or the host is empty
 */
Result<BaseUrlParts> parseBaseUrl(const std::string& url);

/**
 * @brief Builds a configuration from a JSON object
 *
 * Keys: base_url, username, password, backup_path, verify_ssl, proxy,
 * connect_timeout_ms. Missing optional keys keep their defaults.
 */
Result<ClientConfig> parseClientConfig(const Json::Value& root);

/**
 * @brief Reads and parses a JSON configuration file
 */
Result<ClientConfig> loadClientConfig(const std::string& path);

} // namespace DavBackup
