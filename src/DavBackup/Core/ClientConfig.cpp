/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the DavBackup project.
 */

#include "DavBackup/Core/ClientConfig.h"
#include <json/json.h>
#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>

namespace DavBackup {

Result<BaseUrlParts> parseBaseUrl(const std::string& url) {
    BaseUrlParts parts;
    auto sep = url.find("://");
    if (sep == std::string::npos) {
        return Result<BaseUrlParts>::err(StorageError::InvalidParameter,
                                         std::format("Base URL has no scheme: '{}'", url));
    }
    parts.scheme = url.substr(0, sep);
    std::transform(parts.scheme.begin(), parts.scheme.end(), parts.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (parts.scheme != "http" && parts.scheme != "https") {
        return Result<BaseUrlParts>::err(StorageError::InvalidParameter,
                                         std::format("Unsupported URL scheme '{}'", parts.scheme));
    }

    auto rest = url.substr(sep + 3);
    auto slash = rest.find('/');
    parts.host = rest.substr(0, slash);
    if (parts.host.empty()) {
        return Result<BaseUrlParts>::err(StorageError::InvalidParameter,
                                         std::format("Base URL has no host: '{}'", url));
    }
    parts.basePath = (slash == std::string::npos) ? std::string("/") : rest.substr(slash);
    auto q = parts.basePath.find_first_of("?#");
    if (q != std::string::npos) parts.basePath.resize(q);
    if (parts.basePath.empty() || parts.basePath.back() != '/') parts.basePath.push_back('/');
    return Result<BaseUrlParts>::ok(std::move(parts));
}

Result<void> ClientConfig::validate() const {
    if (baseUrl.empty()) {
        return Result<void>::err(StorageError::InvalidParameter, "Base URL is required");
    }
    if (auto parts = parseBaseUrl(baseUrl); parts.failed()) {
        return Result<void>::err(parts.error, parts.errorMessage);
    }
    if (username.empty()) {
        return Result<void>::err(StorageError::InvalidParameter, "Username is required");
    }
    if (backupPath.find_first_not_of('/') == std::string::npos) {
        return Result<void>::err(StorageError::InvalidParameter, "Backup path must name a folder");
    }
    return Result<void>::ok();
}

Result<ClientConfig> parseClientConfig(const Json::Value& root) {
    using R = Result<ClientConfig>;
    if (!root.isObject()) {
        return R::err(StorageError::InvalidParameter, "Configuration must be a JSON object");
    }

    ClientConfig cfg;
    auto readString = [&root](const char* key, std::string& out) -> bool {
        if (!root.isMember(key)) return true;
        if (!root[key].isString()) return false;
        out = root[key].asString();
        return true;
    };

    if (!readString("base_url", cfg.baseUrl) || !readString("username", cfg.username) ||
        !readString("password", cfg.password) || !readString("backup_path", cfg.backupPath)) {
        return R::err(StorageError::InvalidParameter, "base_url, username, password and backup_path must be strings");
    }

    if (root.isMember("verify_ssl")) {
        if (!root["verify_ssl"].isBool()) {
            return R::err(StorageError::InvalidParameter, "verify_ssl must be a boolean");
        }
        cfg.verifySsl = root["verify_ssl"].asBool();
    }
    if (root.isMember("proxy") && !root["proxy"].isNull()) {
        if (!root["proxy"].isString()) {
            return R::err(StorageError::InvalidParameter, "proxy must be a string");
        }
        if (!root["proxy"].asString().empty()) cfg.proxy = root["proxy"].asString();
    }
    if (root.isMember("connect_timeout_ms")) {
        const auto& t = root["connect_timeout_ms"];
        if (!t.isInt64() || t.asInt64() <= 0) {
            return R::err(StorageError::InvalidParameter, "connect_timeout_ms must be a positive integer");
        }
        cfg.connectTimeout = std::chrono::milliseconds(t.asInt64());
    }

    if (auto v = cfg.validate(); v.failed()) {
        return R::err(v.error, v.errorMessage);
    }
    return R::ok(std::move(cfg));
}

Result<ClientConfig> loadClientConfig(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<ClientConfig>::err(StorageError::IoFailure,
                                         std::format("Cannot open configuration file '{}'", path));
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    if (!Json::parseFromStream(builder, in, &root, &errs)) {
        return Result<ClientConfig>::err(StorageError::InvalidParameter,
                                         std::format("Invalid configuration file '{}': {}", path, errs));
    }
    return parseClientConfig(root);
}

} // namespace DavBackup
