/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the DavBackup project.
 */

/**
 * @file AgentRegistry.h
 * @brief Host-owned set of configured backup agents with change notification
 */

#pragma once

#include "DavBackup/Backup/BackupAgent.h"
#include "DavBackup/Core/ClientConfig.h"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace DavBackup::Backup {

/**
 * @brief Tracks one BackupAgent per configured entry
 *
 * Listeners are told whenever the set of agents changes so the host can
 * reload its view. Callbacks run on the thread that made the change, after
 * the registry lock has been released, so a listener may call back into the
 * registry.
 *
 * @code
 * AgentRegistry registry;
 * auto id = registry.addListener([&] { refreshAgents(registry.agents()); });
 * registry.addEntry("home", cfg);
 * ...
 * registry.removeListener(id);
 * @endcode
 */
class AgentRegistry {
public:
    using ListenerId = uint64_t;
    using Listener = std::function<void()>;

    AgentRegistry() = default;
    AgentRegistry(const AgentRegistry&) = delete;
    AgentRegistry& operator=(const AgentRegistry&) = delete;

    /**
     * @brief Subscribes to agent set changes
     * @return Id for removeListener
     */
    ListenerId addListener(Listener listener);

    /**
     * @brief Unsubscribes a listener
     * @return false if the id was unknown
     */
    bool removeListener(ListenerId id);

    /**
     * @brief Creates the agent for an entry and notifies listeners
     *
     * The backup folder is created best-effort; a failure is logged as a
     * warning and the entry still loads.
     *
     * @return The new agent; InvalidParameter for an invalid config or an id already in use
     */
    Result<std::shared_ptr<BackupAgent>> addEntry(const std::string& entryId, const ClientConfig& config);

    /**
     * @brief Drops the agent of an entry and notifies listeners
     * @return false if the entry was unknown
     */
    bool removeEntry(const std::string& entryId);

    /**
     * @brief Snapshot of all live agents, ordered by entry id
     */
    std::vector<std::shared_ptr<BackupAgent>> agents() const;

    /**
     * @brief Agent of one entry, or nullptr
     */
    std::shared_ptr<BackupAgent> agent(const std::string& entryId) const;

    /**
     * @brief Checks a configuration before it is saved as an entry
     *
     * Creates the backup folder and lists it; both must succeed.
     */
    static Result<void> verifyConnection(const ClientConfig& config);

private:
    mutable std::mutex _mutex;
    std::map<std::string, std::shared_ptr<BackupAgent>> _entries;
    std::map<ListenerId, Listener> _listeners;
    ListenerId _nextListenerId = 1;

    void notifyListeners();
};

} // namespace DavBackup::Backup
