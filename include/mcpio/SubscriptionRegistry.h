//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SubscriptionRegistry.h
// Purpose: Idempotent (server, uri) resource subscriptions that can be replayed after a reconnect
//==========================================================================================================
#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "mcpio/JSONRPCTypes.h"
#include "mcpio/Protocol.h"
#include "mcpio/async/OutstandingTasks.h"
#include "mcpio/async/Task.h"
#include "mcpio/errors/Errors.h"

namespace mcpio {

struct Subscription {
    std::string uri;
    std::string serverName;
    std::chrono::system_clock::time_point subscribedAt;
};

struct ResubscribeResult {
    std::string uri;
    errors::Outcome outcome;
};

//==========================================================================================================
// SubscriptionRegistry
// Purpose: Tracks which resources are subscribed on which server, sends resources/subscribe and
//          resources/unsubscribe through the connection layer, and filters update notifications.
// Notes:
//   Thread-safe. Event handlers run on the thread that caused the event, outside the registry lock.
//==========================================================================================================
class SubscriptionRegistry {
public:
    using OutboundSender = std::function<std::future<errors::Outcome>(
        const std::string& serverName, const std::string& method, const JSONValue& params)>;
    using CapabilityProbe = std::function<std::future<ServerCapabilities>(const std::string& serverName)>;
    using SubscriptionHandler = std::function<void(const std::string& uri, const std::string& serverName)>;
    using ListChangedHandler = std::function<void(const std::string& serverName)>;

    SubscriptionRegistry() = default;
    // Waits for subscribe/unsubscribe calls still awaiting the server
    ~SubscriptionRegistry();

    SubscriptionRegistry(const SubscriptionRegistry&) = delete;
    SubscriptionRegistry& operator=(const SubscriptionRegistry&) = delete;

    void SetOutboundSender(OutboundSender sender);
    void SetCapabilityProbe(CapabilityProbe probe);

    void SetSubscribedHandler(SubscriptionHandler handler);
    void SetUnsubscribedHandler(SubscriptionHandler handler);
    void SetResourceUpdatedHandler(SubscriptionHandler handler);
    void SetResourceListChangedHandler(ListChangedHandler handler);

    //==========================================================================================================
    // Subscribe
    // Purpose: Subscribes once per (server, uri); repeating it succeeds without another request.
    // Returns:
    //   Outcome: UnsupportedByServer when the capability probe says no, NotInitialized without a sender,
    //   otherwise the sender's failure. Nothing is recorded unless the request succeeded.
    //==========================================================================================================
    std::future<errors::Outcome> Subscribe(const std::string& serverName, const std::string& uri);

    //==========================================================================================================
    // Unsubscribe
    // Purpose: Forgets the subscription locally in every case; the remote request is best effort.
    //==========================================================================================================
    std::future<errors::Outcome> Unsubscribe(const std::string& serverName, const std::string& uri);

    //==========================================================================================================
    // ResubscribeForServer
    // Purpose: Replays every subscription of a reconnected server one by one. A failed replay drops that
    //          entry and is reported in its own result.
    //==========================================================================================================
    std::future<std::vector<ResubscribeResult>> ResubscribeForServer(const std::string& serverName);

    // Local cleanup only; emits unsubscribed for each removed entry
    void UnsubscribeAllForServer(const std::string& serverName);
    void CleanupAll();

    // Emits resource-updated only for tracked subscriptions; returns whether it was emitted
    bool HandleResourceUpdated(const std::string& serverName, const std::string& uri);
    void HandleResourceListChanged(const std::string& serverName);

    std::vector<Subscription> GetActiveSubscriptions();
    std::vector<Subscription> GetSubscriptionsForServer(const std::string& serverName);
    bool IsSubscribed(const std::string& serverName, const std::string& uri);
    std::size_t GetSubscriptionCount();

private:
    using Key = std::pair<std::string, std::string>; // (serverName, uri)

    async::Task<errors::Outcome> coSubscribe(std::string serverName, std::string uri);
    async::Task<errors::Outcome> coUnsubscribe(std::string serverName, std::string uri);
    async::Task<std::vector<ResubscribeResult>> coResubscribe(std::string serverName);
    void emit(const SubscriptionHandler& handler, const std::string& uri, const std::string& serverName);

    async::OutstandingTasks tasks;
    std::mutex mutex;
    std::map<Key, Subscription> subscriptions;
    OutboundSender sender;
    CapabilityProbe probe;
    SubscriptionHandler subscribedHandler;
    SubscriptionHandler unsubscribedHandler;
    SubscriptionHandler updatedHandler;
    ListChangedHandler listChangedHandler;
};

} // namespace mcpio
