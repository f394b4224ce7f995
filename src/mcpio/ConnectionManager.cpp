//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionManager.cpp
// Purpose: Connection lifecycle by server name and wiring of the shared client components
//==========================================================================================================

#include <format>

#include "logging/Logger.h"
#include "mcpio/ConnectionManager.h"
#include "mcpio/async/FutureAwaitable.h"
#include "mcpio/version.h"

namespace mcpio {

ConnectionManager::ConnectionManager() : ConnectionManager(Options{}) {}

ConnectionManager::ConnectionManager(Options opts)
    : options(std::move(opts)),
      tracker(options.tracker),
      progress(options.progress),
      idCounter(std::make_shared<std::atomic<int64_t>>(0)) {
    if (options.clientInfo.name.empty()) {
        options.clientInfo = Implementation(CLIENT_NAME, getVersionString());
    }
    tracker.SetOutboundSender([this](const std::string& serverName, const std::string& method, const JSONValue& params) {
        return sendOutbound(serverName, method, params);
    });
    subscriptions.SetOutboundSender([this](const std::string& serverName, const std::string& method,
                                           const JSONValue& params) {
        return sendOutbound(serverName, method, params);
    });
    subscriptions.SetCapabilityProbe([this](const std::string& serverName) {
        return probeCapabilities(serverName);
    });
}

ConnectionManager::~ConnectionManager() {
    std::map<std::string, std::shared_ptr<ServerConnection>> remaining;
    {
        std::lock_guard<std::mutex> lk(mutex);
        remaining.swap(connections);
    }
    for (auto& [name, conn] : remaining) {
        try {
            conn->Close().get();
        } catch (const std::exception& e) {
            LOG_ERROR("ConnectionManager: closing '{}' failed: {}", name, e.what());
        }
    }
    // Connects and shutdowns still in flight resume once their connection is closed
    tasks.WaitIdle();
}

void ConnectionManager::SetNotificationHandler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lk(mutex);
    notificationHandler = std::move(handler);
}

void ConnectionManager::SetServerClosedHandler(ServerClosedHandler handler) {
    std::lock_guard<std::mutex> lk(mutex);
    serverClosedHandler = std::move(handler);
}

std::shared_ptr<ServerConnection> ConnectionManager::Get(const std::string& serverName) {
    std::lock_guard<std::mutex> lk(mutex);
    auto it = connections.find(serverName);
    return it == connections.end() ? nullptr : it->second;
}

std::vector<std::string> ConnectionManager::ServerNames() {
    std::lock_guard<std::mutex> lk(mutex);
    std::vector<std::string> names;
    names.reserve(connections.size());
    for (const auto& [name, conn] : connections) {
        names.push_back(name);
    }
    return names;
}

std::future<errors::Outcome> ConnectionManager::sendOutbound(const std::string& serverName, const std::string& method,
                                                             const JSONValue& params) {
    auto conn = Get(serverName);
    if (!conn || !conn->IsConnected()) {
        return async::makeReadyFuture(errors::Outcome::Fail(errors::OutcomeCode::NotFound,
            std::format("Server {} is not connected", serverName)));
    }
    return conn->SendOutbound(method, params);
}

std::future<ServerCapabilities> ConnectionManager::probeCapabilities(const std::string& serverName) {
    auto conn = Get(serverName);
    if (!conn || !conn->IsInitialized()) {
        return async::makeExceptionalFuture<ServerCapabilities>(std::make_exception_ptr(
            errors::TransportError(errors::TransportErrc::NotConnected, std::format("server '{}' is not connected", serverName))));
    }
    return async::makeReadyFuture(conn->Capabilities());
}

std::shared_ptr<ServerConnection> ConnectionManager::makeConnection(const std::string& serverName) {
    auto conn = std::make_shared<ServerConnection>(serverName,
        ConnectionServices{&tracker, &subscriptions, &progress, idCounter});
    conn->SetNotificationHandler([this, serverName](const std::string& method, const JSONValue& params) {
        NotificationHandler handler;
        {
            std::lock_guard<std::mutex> lk(mutex);
            handler = notificationHandler;
        }
        if (handler) {
            handler(serverName, method, params);
        }
    });
    conn->SetCloseHandler([this, serverName](std::optional<int> exitCode) {
        LOG_INFO("ConnectionManager: server '{}' closed{}", serverName,
                 exitCode.has_value() ? std::format(" (exit {})", exitCode.value()) : std::string());
        ServerClosedHandler handler;
        {
            std::lock_guard<std::mutex> lk(mutex);
            handler = serverClosedHandler;
        }
        if (handler) {
            handler(serverName, exitCode);
        }
    });
    return conn;
}

std::future<ServerCapabilities> ConnectionManager::Connect(const std::string& serverName, const ProcessConfig& config) {
    FUNC_SCOPE();
    return coConnect(serverName, config).toFuture();
}

async::Task<ServerCapabilities> ConnectionManager::coConnect(std::string serverName, ProcessConfig config) {
    auto scope = tasks.Enter();
    std::shared_ptr<ServerConnection> conn;
    std::shared_ptr<ServerConnection> stale;
    {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = connections.find(serverName);
        if (connecting.count(serverName) > 0 || (it != connections.end() && it->second->IsConnected())) {
            throw errors::TransportError(errors::TransportErrc::AlreadyStarted,
                                         std::format("server '{}' is already connected", serverName));
        }
        if (it != connections.end()) {
            stale = it->second;
        }
        connecting.insert(serverName);
        conn = makeConnection(serverName);
        connections[serverName] = conn;
        configs[serverName] = config;
    }

    LOG_INFO("ConnectionManager: connecting '{}' ({})", serverName, config.command);
    std::exception_ptr failure;
    ServerCapabilities caps;
    try {
        if (stale) {
            co_await async::makeFutureAwaitable(stale->Close());
        }
        caps = co_await async::makeFutureAwaitable(conn->Connect(config, options.clientInfo));
    } catch (const std::exception& e) {
        LOG_ERROR("ConnectionManager: connecting '{}' failed: {}", serverName, e.what());
        failure = std::current_exception();
    }
    {
        std::lock_guard<std::mutex> lk(mutex);
        connecting.erase(serverName);
        if (failure) {
            auto it = connections.find(serverName);
            if (it != connections.end() && it->second == conn) {
                connections.erase(it);
            }
        }
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
    co_return caps;
}

std::future<void> ConnectionManager::Disconnect(const std::string& serverName) {
    FUNC_SCOPE();
    return coDisconnect(serverName).toFuture();
}

async::Task<void> ConnectionManager::coDisconnect(std::string serverName) {
    auto scope = tasks.Enter();
    auto conn = Get(serverName);
    if (!conn) {
        LOG_DEBUG("ConnectionManager: disconnect of unknown server '{}'", serverName);
        co_return;
    }
    LOG_INFO("ConnectionManager: disconnecting '{}'", serverName);
    auto cancelled = co_await async::makeFutureAwaitable(tracker.CancelByServer(serverName, "Server disconnected"));
    if (!cancelled.empty()) {
        LOG_INFO("ConnectionManager: cancelled {} requests on '{}'", cancelled.size(), serverName);
    }
    subscriptions.UnsubscribeAllForServer(serverName);
    co_await async::makeFutureAwaitable(conn->Close());
    {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = connections.find(serverName);
        if (it != connections.end() && it->second == conn) {
            connections.erase(it);
        }
        configs.erase(serverName);
    }
}

std::future<std::vector<ResubscribeResult>> ConnectionManager::Reconnect(const std::string& serverName) {
    FUNC_SCOPE();
    return coReconnect(serverName).toFuture();
}

async::Task<std::vector<ResubscribeResult>> ConnectionManager::coReconnect(std::string serverName) {
    auto scope = tasks.Enter();
    std::shared_ptr<ServerConnection> old;
    ProcessConfig config;
    {
        std::lock_guard<std::mutex> lk(mutex);
        auto cfg = configs.find(serverName);
        if (cfg == configs.end()) {
            throw errors::TransportError(errors::TransportErrc::NotConnected,
                                         std::format("no configuration for server '{}'", serverName));
        }
        config = cfg->second;
        auto it = connections.find(serverName);
        if (it != connections.end()) {
            old = it->second;
            connections.erase(it);
        }
    }

    LOG_INFO("ConnectionManager: reconnecting '{}'", serverName);
    if (old) {
        co_await async::makeFutureAwaitable(old->Close());
    }
    co_await async::makeFutureAwaitable(coConnect(serverName, config).toFuture());
    auto results = co_await async::makeFutureAwaitable(subscriptions.ResubscribeForServer(serverName));
    co_return results;
}

std::future<void> ConnectionManager::Shutdown() {
    FUNC_SCOPE();
    return coShutdown().toFuture();
}

async::Task<void> ConnectionManager::coShutdown() {
    auto scope = tasks.Enter();
    LOG_INFO("ConnectionManager: shutting down");
    auto cancelled = co_await async::makeFutureAwaitable(tracker.CancelAll("shutdown"));
    for (const auto& result : cancelled) {
        if (!result.success) {
            LOG_DEBUG("ConnectionManager: cancel of {} during shutdown: {}", IdToString(result.requestId),
                      result.error.value_or(""));
        }
    }
    tracker.CleanupAll();
    subscriptions.CleanupAll();
    progress.CleanupAll();

    std::map<std::string, std::shared_ptr<ServerConnection>> closing;
    {
        std::lock_guard<std::mutex> lk(mutex);
        closing.swap(connections);
        configs.clear();
    }
    for (auto& [name, conn] : closing) {
        try {
            co_await async::makeFutureAwaitable(conn->Close());
        } catch (const std::exception& e) {
            LOG_ERROR("ConnectionManager: closing '{}' failed: {}", name, e.what());
        }
    }
}

} // namespace mcpio
