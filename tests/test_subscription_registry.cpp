//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_subscription_registry.cpp
// Purpose: Idempotent subscriptions, capability gating and resubscription after reconnect
//==========================================================================================================

#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "mcpio/SubscriptionRegistry.h"

using namespace mcpio;

namespace {
struct FakeServerSide {
    std::mutex mutex;
    std::vector<std::string> calls;      // "method uri"
    std::set<std::string> failingUris;   // subscribe requests that fail
    bool supportsSubscriptions{true};

    void wire(SubscriptionRegistry& reg) {
        reg.SetOutboundSender([this](const std::string& server, const std::string& method, const JSONValue& params) {
            const std::string uri = GetStringMember(params, "uri").value_or("");
            std::lock_guard<std::mutex> lk(mutex);
            calls.push_back(method + " " + server + " " + uri);
            if (method == Methods::Subscribe && failingUris.count(uri) > 0) {
                return async::makeReadyFuture(errors::Outcome::Fail(errors::OutcomeCode::RemoteError, "no such resource"));
            }
            return async::makeReadyFuture(errors::Outcome::Ok());
        });
        reg.SetCapabilityProbe([this](const std::string&) {
            ServerCapabilities caps;
            if (supportsSubscriptions) {
                caps.resources = ResourcesCapability{true, false};
            }
            return async::makeReadyFuture(std::move(caps));
        });
    }

    std::size_t count() {
        std::lock_guard<std::mutex> lk(mutex);
        return calls.size();
    }
};
} // namespace

TEST(SubscriptionRegistryTest, SubscribeIsIdempotent) {
    SubscriptionRegistry reg;
    FakeServerSide server;
    server.wire(reg);
    int subscribedEvents = 0;
    reg.SetSubscribedHandler([&](const std::string&, const std::string&) { ++subscribedEvents; });

    EXPECT_TRUE(reg.Subscribe("alpha", "file:///a").get().success);
    EXPECT_TRUE(reg.Subscribe("alpha", "file:///a").get().success);
    EXPECT_EQ(server.count(), 1u);
    EXPECT_EQ(subscribedEvents, 1);
    EXPECT_EQ(reg.GetSubscriptionCount(), 1u);
    EXPECT_TRUE(reg.IsSubscribed("alpha", "file:///a"));
    EXPECT_FALSE(reg.IsSubscribed("beta", "file:///a"));
}

TEST(SubscriptionRegistryTest, UnsupportedServerRejectedWithoutRequest) {
    SubscriptionRegistry reg;
    FakeServerSide server;
    server.supportsSubscriptions = false;
    server.wire(reg);

    auto outcome = reg.Subscribe("alpha", "file:///a").get();
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.code, errors::OutcomeCode::UnsupportedByServer);
    EXPECT_EQ(server.count(), 0u);
    EXPECT_EQ(reg.GetSubscriptionCount(), 0u);
}

TEST(SubscriptionRegistryTest, NoSenderIsNotInitialized) {
    SubscriptionRegistry reg;
    auto outcome = reg.Subscribe("alpha", "file:///a").get();
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.code, errors::OutcomeCode::NotInitialized);
}

TEST(SubscriptionRegistryTest, FailedSubscribeIsNotRecorded) {
    SubscriptionRegistry reg;
    FakeServerSide server;
    server.failingUris.insert("file:///missing");
    server.wire(reg);

    auto outcome = reg.Subscribe("alpha", "file:///missing").get();
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.code, errors::OutcomeCode::RemoteError);
    EXPECT_FALSE(reg.IsSubscribed("alpha", "file:///missing"));
}

TEST(SubscriptionRegistryTest, ThrowingProbeBecomesFailedOutcome) {
    SubscriptionRegistry reg;
    FakeServerSide server;
    server.wire(reg);
    reg.SetCapabilityProbe([](const std::string&) {
        return async::makeExceptionalFuture<ServerCapabilities>(std::make_exception_ptr(std::runtime_error("gone")));
    });
    auto outcome = reg.Subscribe("alpha", "file:///a").get();
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.code, errors::OutcomeCode::Exception);
}

TEST(SubscriptionRegistryTest, UnsubscribeAlwaysRemovesLocally) {
    SubscriptionRegistry reg;
    FakeServerSide server;
    server.wire(reg);
    ASSERT_TRUE(reg.Subscribe("alpha", "file:///a").get().success);

    std::vector<std::string> unsubscribed;
    reg.SetUnsubscribedHandler([&](const std::string& uri, const std::string&) { unsubscribed.push_back(uri); });
    // Remote failure does not keep the subscription alive
    reg.SetOutboundSender([](const std::string&, const std::string&, const JSONValue&) {
        return async::makeReadyFuture(errors::Outcome::Fail(errors::OutcomeCode::SendFailed, "closed"));
    });
    EXPECT_TRUE(reg.Unsubscribe("alpha", "file:///a").get().success);
    EXPECT_FALSE(reg.IsSubscribed("alpha", "file:///a"));
    ASSERT_EQ(unsubscribed.size(), 1u);

    // Not subscribed: succeeds without a request or event
    EXPECT_TRUE(reg.Unsubscribe("alpha", "file:///a").get().success);
    EXPECT_EQ(unsubscribed.size(), 1u);
}

TEST(SubscriptionRegistryTest, ResubscribeReportsPartialFailure) {
    SubscriptionRegistry reg;
    FakeServerSide server;
    server.wire(reg);
    ASSERT_TRUE(reg.Subscribe("alpha", "file:///a").get().success);
    ASSERT_TRUE(reg.Subscribe("alpha", "file:///b").get().success);
    ASSERT_TRUE(reg.Subscribe("beta", "file:///c").get().success);

    {
        std::lock_guard<std::mutex> lk(server.mutex);
        server.failingUris.insert("file:///b");
        server.calls.clear();
    }
    auto results = reg.ResubscribeForServer("alpha").get();
    ASSERT_EQ(results.size(), 2u);
    for (const auto& r : results) {
        if (r.uri == "file:///a") {
            EXPECT_TRUE(r.outcome.success);
        } else {
            EXPECT_EQ(r.uri, "file:///b");
            EXPECT_FALSE(r.outcome.success);
        }
    }
    EXPECT_TRUE(reg.IsSubscribed("alpha", "file:///a"));
    EXPECT_FALSE(reg.IsSubscribed("alpha", "file:///b"));
    EXPECT_TRUE(reg.IsSubscribed("beta", "file:///c"));
    EXPECT_EQ(server.count(), 2u);
}

TEST(SubscriptionRegistryTest, UpdatesOnlyForTrackedSubscriptions) {
    SubscriptionRegistry reg;
    FakeServerSide server;
    server.wire(reg);
    ASSERT_TRUE(reg.Subscribe("alpha", "file:///a").get().success);

    std::vector<std::string> updates;
    reg.SetResourceUpdatedHandler([&](const std::string& uri, const std::string& srv) { updates.push_back(srv + ":" + uri); });
    EXPECT_TRUE(reg.HandleResourceUpdated("alpha", "file:///a"));
    EXPECT_FALSE(reg.HandleResourceUpdated("alpha", "file:///other"));
    EXPECT_FALSE(reg.HandleResourceUpdated("beta", "file:///a"));
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0], "alpha:file:///a");

    std::string listChangedFor;
    reg.SetResourceListChangedHandler([&](const std::string& srv) { listChangedFor = srv; });
    reg.HandleResourceListChanged("alpha");
    EXPECT_EQ(listChangedFor, "alpha");
}

TEST(SubscriptionRegistryTest, LocalCleanupEmitsUnsubscribed) {
    SubscriptionRegistry reg;
    FakeServerSide server;
    server.wire(reg);
    ASSERT_TRUE(reg.Subscribe("alpha", "file:///a").get().success);
    ASSERT_TRUE(reg.Subscribe("alpha", "file:///b").get().success);
    ASSERT_TRUE(reg.Subscribe("beta", "file:///c").get().success);
    const std::size_t requestsBefore = server.count();

    int events = 0;
    reg.SetUnsubscribedHandler([&](const std::string&, const std::string&) { ++events; });
    reg.UnsubscribeAllForServer("alpha");
    EXPECT_EQ(events, 2);
    EXPECT_EQ(reg.GetSubscriptionsForServer("alpha").size(), 0u);
    EXPECT_EQ(reg.GetActiveSubscriptions().size(), 1u);

    reg.CleanupAll();
    EXPECT_EQ(events, 3);
    EXPECT_EQ(reg.GetSubscriptionCount(), 0u);
    EXPECT_EQ(server.count(), requestsBefore);
}
