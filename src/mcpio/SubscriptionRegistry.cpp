//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SubscriptionRegistry.cpp
// Purpose: Subscription bookkeeping, remote subscribe/unsubscribe and reconnect replay
//==========================================================================================================

#include <format>

#include "logging/Logger.h"
#include "mcpio/SubscriptionRegistry.h"
#include "mcpio/async/FutureAwaitable.h"

namespace mcpio {

namespace {
JSONValue uriParams(const std::string& uri) {
    JSONValue::Object params;
    params["uri"] = std::make_shared<JSONValue>(uri);
    return JSONValue(std::move(params));
}
} // namespace

SubscriptionRegistry::~SubscriptionRegistry() {
    tasks.WaitIdle();
}

void SubscriptionRegistry::SetOutboundSender(OutboundSender s) {
    std::lock_guard<std::mutex> lk(mutex);
    sender = std::move(s);
}

void SubscriptionRegistry::SetCapabilityProbe(CapabilityProbe p) {
    std::lock_guard<std::mutex> lk(mutex);
    probe = std::move(p);
}

void SubscriptionRegistry::SetSubscribedHandler(SubscriptionHandler handler) {
    std::lock_guard<std::mutex> lk(mutex);
    subscribedHandler = std::move(handler);
}

void SubscriptionRegistry::SetUnsubscribedHandler(SubscriptionHandler handler) {
    std::lock_guard<std::mutex> lk(mutex);
    unsubscribedHandler = std::move(handler);
}

void SubscriptionRegistry::SetResourceUpdatedHandler(SubscriptionHandler handler) {
    std::lock_guard<std::mutex> lk(mutex);
    updatedHandler = std::move(handler);
}

void SubscriptionRegistry::SetResourceListChangedHandler(ListChangedHandler handler) {
    std::lock_guard<std::mutex> lk(mutex);
    listChangedHandler = std::move(handler);
}

void SubscriptionRegistry::emit(const SubscriptionHandler& handler, const std::string& uri, const std::string& serverName) {
    if (!handler) {
        return;
    }
    try {
        handler(uri, serverName);
    } catch (const std::exception& e) {
        LOG_ERROR("SubscriptionRegistry: event handler threw: {}", e.what());
    }
}

std::future<errors::Outcome> SubscriptionRegistry::Subscribe(const std::string& serverName, const std::string& uri) {
    return coSubscribe(serverName, uri).toFuture();
}

std::future<errors::Outcome> SubscriptionRegistry::Unsubscribe(const std::string& serverName, const std::string& uri) {
    return coUnsubscribe(serverName, uri).toFuture();
}

std::future<std::vector<ResubscribeResult>> SubscriptionRegistry::ResubscribeForServer(const std::string& serverName) {
    return coResubscribe(serverName).toFuture();
}

async::Task<errors::Outcome> SubscriptionRegistry::coSubscribe(std::string serverName, std::string uri) {
    auto scope = tasks.Enter();
    CapabilityProbe capabilityProbe;
    OutboundSender send;
    {
        std::lock_guard<std::mutex> lk(mutex);
        if (subscriptions.count(Key{serverName, uri}) > 0) {
            co_return errors::Outcome::Ok();
        }
        capabilityProbe = probe;
        send = sender;
    }

    if (capabilityProbe) {
        bool supported = false;
        try {
            ServerCapabilities caps = co_await async::makeFutureAwaitable(capabilityProbe(serverName));
            supported = caps.supportsSubscriptions();
        } catch (const std::exception& e) {
            LOG_WARN("SubscriptionRegistry: capability probe for '{}' failed: {}", serverName, e.what());
            co_return errors::Outcome::Fail(errors::OutcomeCode::Exception,
                std::format("Capability check for {} failed: {}", serverName, e.what()));
        }
        if (!supported) {
            co_return errors::Outcome::Fail(errors::OutcomeCode::UnsupportedByServer,
                std::format("Server {} does not support resource subscriptions", serverName));
        }
    }

    if (!send) {
        co_return errors::Outcome::Fail(errors::OutcomeCode::NotInitialized, "Subscription registry not initialized");
    }

    errors::Outcome result;
    try {
        result = co_await async::makeFutureAwaitable(send(serverName, Methods::Subscribe, uriParams(uri)));
    } catch (const std::exception& e) {
        result = errors::Outcome::Fail(errors::OutcomeCode::SendFailed, e.what());
    }
    if (!result.success) {
        LOG_WARN("SubscriptionRegistry: subscribe to {} on '{}' failed ({}): {}", uri, serverName,
                 errors::outcomeCodeName(result.code), result.message);
        co_return result;
    }

    bool inserted = false;
    SubscriptionHandler handler;
    {
        std::lock_guard<std::mutex> lk(mutex);
        inserted = subscriptions.emplace(Key{serverName, uri},
            Subscription{uri, serverName, std::chrono::system_clock::now()}).second;
        handler = subscribedHandler;
    }
    if (inserted) {
        LOG_INFO("SubscriptionRegistry: subscribed to {} on '{}'", uri, serverName);
        emit(handler, uri, serverName);
    }
    co_return errors::Outcome::Ok();
}

async::Task<errors::Outcome> SubscriptionRegistry::coUnsubscribe(std::string serverName, std::string uri) {
    auto scope = tasks.Enter();
    OutboundSender send;
    {
        std::lock_guard<std::mutex> lk(mutex);
        if (subscriptions.count(Key{serverName, uri}) == 0) {
            co_return errors::Outcome::Ok();
        }
        send = sender;
    }

    if (send) {
        try {
            errors::Outcome r = co_await async::makeFutureAwaitable(send(serverName, Methods::Unsubscribe, uriParams(uri)));
            if (!r.success) {
                LOG_WARN("SubscriptionRegistry: failed to unsubscribe from {} on '{}': {}", uri, serverName, r.message);
            }
        } catch (const std::exception& e) {
            LOG_WARN("SubscriptionRegistry: failed to unsubscribe from {} on '{}': {}", uri, serverName, e.what());
        }
    }

    bool erased = false;
    SubscriptionHandler handler;
    {
        std::lock_guard<std::mutex> lk(mutex);
        erased = subscriptions.erase(Key{serverName, uri}) > 0;
        handler = unsubscribedHandler;
    }
    if (erased) {
        emit(handler, uri, serverName);
    }
    co_return errors::Outcome::Ok();
}

async::Task<std::vector<ResubscribeResult>> SubscriptionRegistry::coResubscribe(std::string serverName) {
    auto scope = tasks.Enter();
    std::vector<ResubscribeResult> results;
    for (const Subscription& sub : GetSubscriptionsForServer(serverName)) {
        {
            std::lock_guard<std::mutex> lk(mutex);
            subscriptions.erase(Key{serverName, sub.uri});
        }
        errors::Outcome outcome;
        try {
            outcome = co_await async::makeFutureAwaitable(Subscribe(serverName, sub.uri));
        } catch (const std::exception& e) {
            outcome = errors::Outcome::Fail(errors::OutcomeCode::Exception, e.what());
        }
        if (!outcome.success) {
            LOG_WARN("SubscriptionRegistry: resubscribe to {} on '{}' failed: {}", sub.uri, serverName, outcome.message);
        }
        results.push_back(ResubscribeResult{sub.uri, std::move(outcome)});
    }
    co_return results;
}

void SubscriptionRegistry::UnsubscribeAllForServer(const std::string& serverName) {
    std::vector<Subscription> removed;
    SubscriptionHandler handler;
    {
        std::lock_guard<std::mutex> lk(mutex);
        for (auto it = subscriptions.begin(); it != subscriptions.end();) {
            if (it->first.first == serverName) {
                removed.push_back(std::move(it->second));
                it = subscriptions.erase(it);
            } else {
                ++it;
            }
        }
        handler = unsubscribedHandler;
    }
    LOG_DEBUG("SubscriptionRegistry: dropped {} subscriptions of '{}'", removed.size(), serverName);
    for (const auto& sub : removed) {
        emit(handler, sub.uri, sub.serverName);
    }
}

void SubscriptionRegistry::CleanupAll() {
    std::map<Key, Subscription> removed;
    SubscriptionHandler handler;
    {
        std::lock_guard<std::mutex> lk(mutex);
        removed.swap(subscriptions);
        handler = unsubscribedHandler;
    }
    for (const auto& [key, sub] : removed) {
        emit(handler, sub.uri, sub.serverName);
    }
}

bool SubscriptionRegistry::HandleResourceUpdated(const std::string& serverName, const std::string& uri) {
    SubscriptionHandler handler;
    {
        std::lock_guard<std::mutex> lk(mutex);
        if (subscriptions.count(Key{serverName, uri}) == 0) {
            LOG_DEBUG("SubscriptionRegistry: ignoring update for untracked {} on '{}'", uri, serverName);
            return false;
        }
        handler = updatedHandler;
    }
    emit(handler, uri, serverName);
    return true;
}

void SubscriptionRegistry::HandleResourceListChanged(const std::string& serverName) {
    ListChangedHandler handler;
    {
        std::lock_guard<std::mutex> lk(mutex);
        handler = listChangedHandler;
    }
    if (!handler) {
        return;
    }
    try {
        handler(serverName);
    } catch (const std::exception& e) {
        LOG_ERROR("SubscriptionRegistry: list-changed handler threw: {}", e.what());
    }
}

std::vector<Subscription> SubscriptionRegistry::GetActiveSubscriptions() {
    std::lock_guard<std::mutex> lk(mutex);
    std::vector<Subscription> out;
    out.reserve(subscriptions.size());
    for (const auto& [key, sub] : subscriptions) {
        out.push_back(sub);
    }
    return out;
}

std::vector<Subscription> SubscriptionRegistry::GetSubscriptionsForServer(const std::string& serverName) {
    std::lock_guard<std::mutex> lk(mutex);
    std::vector<Subscription> out;
    for (const auto& [key, sub] : subscriptions) {
        if (key.first == serverName) {
            out.push_back(sub);
        }
    }
    return out;
}

bool SubscriptionRegistry::IsSubscribed(const std::string& serverName, const std::string& uri) {
    std::lock_guard<std::mutex> lk(mutex);
    return subscriptions.count(Key{serverName, uri}) > 0;
}

std::size_t SubscriptionRegistry::GetSubscriptionCount() {
    std::lock_guard<std::mutex> lk(mutex);
    return subscriptions.size();
}

} // namespace mcpio
