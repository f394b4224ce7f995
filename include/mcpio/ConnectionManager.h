//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionManager.h
// Purpose: Named server connections sharing one request tracker, subscription registry and progress tracker
//==========================================================================================================
#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "mcpio/ProcessChannel.hpp"
#include "mcpio/ProgressTracker.h"
#include "mcpio/Protocol.h"
#include "mcpio/RequestTracker.h"
#include "mcpio/ServerConnection.h"
#include "mcpio/SubscriptionRegistry.h"
#include "mcpio/async/OutstandingTasks.h"
#include "mcpio/async/Task.h"

namespace mcpio {

//==========================================================================================================
// ConnectionManager
// Purpose: Owns the connections of one client by server name and wires the shared components to them:
//          the tracker and registry send through the connection named in each call, and the registry
//          probes subscription support from the capabilities recorded at initialize.
// Notes:
//   Reconnect policy (backoff, retry counts) is left to the caller.
//==========================================================================================================
class ConnectionManager {
public:
    using NotificationHandler = std::function<void(const std::string& serverName, const std::string& method,
                                                   const JSONValue& params)>;
    using ServerClosedHandler = std::function<void(const std::string& serverName, std::optional<int> exitCode)>;

    struct Options {
        RequestTracker::Options tracker;
        ProgressTracker::Options progress;
        Implementation clientInfo; // defaults to CLIENT_NAME and the library version
    };

    ConnectionManager();
    explicit ConnectionManager(Options options);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    //==========================================================================================================
    // Connect
    // Purpose: Spawns and initializes a server under the given name and remembers its configuration.
    // Returns:
    //   Server capabilities. Fails with TransportError(AlreadyStarted) when the name is connected or still
    //   connecting, or with the connection's failure (the half-open connection is removed).
    //==========================================================================================================
    std::future<ServerCapabilities> Connect(const std::string& serverName, const ProcessConfig& config);

    // Cancels the server's requests, drops its subscriptions locally, then closes it
    std::future<void> Disconnect(const std::string& serverName);

    //==========================================================================================================
    // Reconnect
    // Purpose: Closes the server and connects again with the configuration given to Connect(), then
    //          replays its subscriptions.
    // Returns:
    //   One result per replayed subscription. Fails with TransportError(NotConnected) for an unknown name.
    //==========================================================================================================
    std::future<std::vector<ResubscribeResult>> Reconnect(const std::string& serverName);

    // Cancels everything with reason "shutdown", clears shared state and closes all servers
    std::future<void> Shutdown();

    std::shared_ptr<ServerConnection> Get(const std::string& serverName);
    std::vector<std::string> ServerNames();

    RequestTracker& Tracker() { return tracker; }
    SubscriptionRegistry& Subscriptions() { return subscriptions; }
    ProgressTracker& Progress() { return progress; }

    void SetNotificationHandler(NotificationHandler handler);
    void SetServerClosedHandler(ServerClosedHandler handler);

private:
    std::shared_ptr<ServerConnection> makeConnection(const std::string& serverName);
    std::future<errors::Outcome> sendOutbound(const std::string& serverName, const std::string& method,
                                              const JSONValue& params);
    std::future<ServerCapabilities> probeCapabilities(const std::string& serverName);

    async::Task<ServerCapabilities> coConnect(std::string serverName, ProcessConfig config);
    async::Task<void> coDisconnect(std::string serverName);
    async::Task<std::vector<ResubscribeResult>> coReconnect(std::string serverName);
    async::Task<void> coShutdown();

    async::OutstandingTasks tasks;
    Options options;
    RequestTracker tracker;
    SubscriptionRegistry subscriptions;
    ProgressTracker progress;
    std::shared_ptr<std::atomic<int64_t>> idCounter;

    std::mutex mutex;
    std::map<std::string, std::shared_ptr<ServerConnection>> connections;
    std::map<std::string, ProcessConfig> configs;
    std::set<std::string> connecting; // names reserved while their handshake is in flight
    NotificationHandler notificationHandler;
    ServerClosedHandler serverClosedHandler;
};

} // namespace mcpio
