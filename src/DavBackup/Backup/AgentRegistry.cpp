/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the DavBackup project.
 */

#include "DavBackup/Backup/AgentRegistry.h"
#include <Logging/Logger.h>
#include <format>

namespace DavBackup::Backup {

AgentRegistry::ListenerId AgentRegistry::addListener(Listener listener) {
    std::lock_guard<std::mutex> lock(_mutex);
    ListenerId id = _nextListenerId++;
    _listeners.emplace(id, std::move(listener));
    return id;
}

bool AgentRegistry::removeListener(ListenerId id) {
    std::lock_guard<std::mutex> lock(_mutex);
    return _listeners.erase(id) > 0;
}

Result<std::shared_ptr<BackupAgent>> AgentRegistry::addEntry(const std::string& entryId, const ClientConfig& config) {
    using R = Result<std::shared_ptr<BackupAgent>>;
    if (auto v = config.validate(); v.failed()) {
        return R::err(v.error, std::format("Entry {}: {}", entryId, v.errorMessage));
    }
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_entries.count(entryId)) {
            return R::err(StorageError::InvalidParameter, std::format("Entry {} is already loaded", entryId));
        }
    }

    auto client = std::make_shared<WebDAV::WebDAVClient>(config);
    if (auto ensured = client->ensureFolder(); ensured.failed()) {
        ENTROPY_LOG_WARNING_CAT("AgentRegistry",
            std::format("Could not ensure backup folder exists for entry {}: {}", entryId, ensured.describe()));
    }

    auto agent = std::make_shared<BackupAgent>(std::move(client));
    {
        std::lock_guard<std::mutex> lock(_mutex);
        // Another thread may have loaded the same entry while the folder was checked
        if (!_entries.emplace(entryId, agent).second) {
            return R::err(StorageError::InvalidParameter, std::format("Entry {} is already loaded", entryId));
        }
    }

    ENTROPY_LOG_INFO_CAT("AgentRegistry", std::format("Loaded backup agent for entry {}", entryId));
    notifyListeners();
    return R::ok(std::move(agent));
}

bool AgentRegistry::removeEntry(const std::string& entryId) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_entries.erase(entryId) == 0) return false;
    }
    ENTROPY_LOG_INFO_CAT("AgentRegistry", std::format("Unloaded backup agent for entry {}", entryId));
    notifyListeners();
    return true;
}

std::vector<std::shared_ptr<BackupAgent>> AgentRegistry::agents() const {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<std::shared_ptr<BackupAgent>> out;
    out.reserve(_entries.size());
    for (const auto& [id, agent] : _entries) {
        out.push_back(agent);
    }
    return out;
}

std::shared_ptr<BackupAgent> AgentRegistry::agent(const std::string& entryId) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _entries.find(entryId);
    return it == _entries.end() ? nullptr : it->second;
}

void AgentRegistry::notifyListeners() {
    std::vector<Listener> snapshot;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        snapshot.reserve(_listeners.size());
        for (const auto& [id, listener] : _listeners) {
            snapshot.push_back(listener);
        }
    }
    for (auto& listener : snapshot) {
        if (listener) listener();
    }
}

Result<void> AgentRegistry::verifyConnection(const ClientConfig& config) {
    if (auto v = config.validate(); v.failed()) {
        return v;
    }
    WebDAV::WebDAVClient client(config);
    if (auto ensured = client.ensureFolder(); ensured.failed()) {
        return ensured;
    }
    auto listed = client.listFolder();
    if (listed.failed()) {
        return Result<void>::err(listed.error, listed.errorMessage);
    }
    return Result<void>::ok();
}

} // namespace DavBackup::Backup
