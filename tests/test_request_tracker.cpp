//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_request_tracker.cpp
// Purpose: Cancellation, correlation and recently-cancelled bookkeeping of RequestTracker
//==========================================================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "mcpio/Protocol.h"
#include "mcpio/RequestTracker.h"
#include "mcpio/async/Task.h"

using namespace mcpio;
using namespace std::chrono_literals;

namespace {
struct FakeClock {
    std::shared_ptr<std::chrono::steady_clock::time_point> t =
        std::make_shared<std::chrono::steady_clock::time_point>(std::chrono::steady_clock::time_point{} + 1h);
    RequestTracker::Clock fn() const {
        auto p = t;
        return [p]() { return *p; };
    }
    void advance(std::chrono::milliseconds d) { *t += d; }
};

// Moves forward one millisecond on every read
RequestTracker::Clock tickingClock() {
    auto ticks = std::make_shared<std::atomic<int64_t>>(0);
    return [ticks]() {
        return std::chrono::steady_clock::time_point{} + 1h + std::chrono::milliseconds(ticks->fetch_add(1));
    };
}

struct SentNotification {
    std::string server;
    std::string method;
    JSONValue params;
};

struct RecordingSender {
    std::shared_ptr<std::mutex> mutex = std::make_shared<std::mutex>();
    std::shared_ptr<std::vector<SentNotification>> sent = std::make_shared<std::vector<SentNotification>>();

    RequestTracker::OutboundSender fn() const {
        auto m = mutex;
        auto s = sent;
        return [m, s](const std::string& server, const std::string& method, const JSONValue& params) {
            std::lock_guard<std::mutex> lk(*m);
            s->push_back(SentNotification{server, method, params});
            return async::makeReadyFuture(errors::Outcome::Ok());
        };
    }
    std::size_t count() const {
        std::lock_guard<std::mutex> lk(*mutex);
        return sent->size();
    }
};

JSONRPCId intId(int64_t v) { return JSONRPCId{v}; }
} // namespace

TEST(RequestTrackerTest, CancelStopsTokenAndNotifiesServer) {
    RecordingSender sender;
    RequestTracker tracker;
    tracker.SetOutboundSender(sender.fn());

    std::stop_token token = tracker.Register(intId(1), "alpha", "search");
    EXPECT_FALSE(token.stop_requested());
    EXPECT_EQ(tracker.GetState(intId(1)), RequestState::Pending);

    auto result = tracker.Cancel(intId(1), std::string("user abort")).get();
    EXPECT_TRUE(result.success);
    EXPECT_EQ(std::get<int64_t>(result.requestId), 1);
    EXPECT_EQ(result.reason.value_or(""), "user abort");
    EXPECT_TRUE(token.stop_requested());
    EXPECT_TRUE(tracker.IsCancelled(intId(1)));
    EXPECT_EQ(tracker.GetState(intId(1)), RequestState::Cancelled);
    EXPECT_FALSE(tracker.HasActiveRequests());

    ASSERT_EQ(sender.count(), 1u);
    const auto& n = sender.sent->front();
    EXPECT_EQ(n.server, "alpha");
    EXPECT_EQ(n.method, Methods::Cancelled);
    EXPECT_EQ(GetIntMember(n.params, "requestId").value_or(0), 1);
    EXPECT_EQ(GetStringMember(n.params, "reason").value_or(""), "user abort");
}

TEST(RequestTrackerTest, CancelWithoutReasonOmitsReasonField) {
    RecordingSender sender;
    RequestTracker tracker;
    tracker.SetOutboundSender(sender.fn());
    tracker.Register(JSONRPCId{std::string("req-a")}, "alpha", "t");
    auto result = tracker.Cancel(JSONRPCId{std::string("req-a")}).get();
    EXPECT_TRUE(result.success);
    ASSERT_EQ(sender.count(), 1u);
    EXPECT_EQ(GetStringMember(sender.sent->front().params, "requestId").value_or(""), "req-a");
    EXPECT_EQ(FindMember(sender.sent->front().params, "reason"), nullptr);
}

TEST(RequestTrackerTest, CancelUnknownOrFinishedFails) {
    RequestTracker tracker;
    auto unknown = tracker.Cancel(intId(99)).get();
    EXPECT_FALSE(unknown.success);
    EXPECT_EQ(unknown.error.value_or(""), "Request not found or already completed");

    tracker.Register(intId(2), "alpha", "t");
    EXPECT_TRUE(tracker.Complete(intId(2)));
    auto done = tracker.Cancel(intId(2)).get();
    EXPECT_FALSE(done.success);
    EXPECT_FALSE(tracker.IsCancelled(intId(2)));
}

TEST(RequestTrackerTest, ConcurrentCancelsSucceedExactlyOnce) {
    RecordingSender sender;
    RequestTracker tracker;
    tracker.SetOutboundSender(sender.fn());
    tracker.Register(intId(7), "alpha", "t");

    std::atomic<int> successes{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            if (tracker.Cancel(intId(7)).get().success) {
                ++successes;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(successes.load(), 1);
    EXPECT_EQ(sender.count(), 1u);
}

TEST(RequestTrackerTest, CompleteAfterCancelIsRejected) {
    RequestTracker tracker;
    tracker.Register(intId(3), "alpha", "t");
    ASSERT_TRUE(tracker.Cancel(intId(3)).get().success);
    EXPECT_FALSE(tracker.Complete(intId(3)));
    EXPECT_TRUE(tracker.IsCancelled(intId(3)));
}

TEST(RequestTrackerTest, CancelledIdForgottenAfterGraceWindow) {
    FakeClock clock;
    RequestTracker tracker(RequestTracker::Options{5000ms, clock.fn()});
    tracker.Register(intId(4), "alpha", "t");
    ASSERT_TRUE(tracker.Cancel(intId(4)).get().success);
    clock.advance(4999ms);
    EXPECT_TRUE(tracker.IsCancelled(intId(4)));
    clock.advance(1ms);
    EXPECT_FALSE(tracker.IsCancelled(intId(4)));
    EXPECT_FALSE(tracker.GetState(intId(4)).has_value());
}

TEST(RequestTrackerTest, ExpiredIdIsForgottenWhateverCallObservesExpiry) {
    for (auto window : {10ms, 11ms, 12ms}) {
        RequestTracker tracker(RequestTracker::Options{window, tickingClock()});
        tracker.Register(intId(5), "alpha", "t");
        ASSERT_TRUE(tracker.Cancel(intId(5)).get().success);
        int reads = 0;
        while (tracker.IsCancelled(intId(5)) && reads < 100) {
            ++reads;
        }
        ASSERT_LT(reads, 100) << "window " << window.count();
        EXPECT_FALSE(tracker.GetState(intId(5)).has_value()) << "window " << window.count();
    }
}

TEST(RequestTrackerTest, FailingSenderStillCancelsLocally) {
    RequestTracker tracker;
    tracker.SetOutboundSender([](const std::string&, const std::string&, const JSONValue&) {
        return async::makeExceptionalFuture<errors::Outcome>(
            std::make_exception_ptr(std::runtime_error("pipe closed")));
    });
    std::stop_token token = tracker.Register(intId(5), "alpha", "t");
    auto result = tracker.Cancel(intId(5)).get();
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(token.stop_requested());
    EXPECT_TRUE(tracker.IsCancelled(intId(5)));
}

TEST(RequestTrackerTest, CancelAllReturnsOneResultPerRequest) {
    RecordingSender sender;
    RequestTracker tracker;
    tracker.SetOutboundSender(sender.fn());
    tracker.Register(intId(10), "alpha", "a");
    tracker.Register(intId(11), "beta", "b");
    tracker.Register(intId(12), "alpha", "c");

    auto results = tracker.CancelAll(std::string("shutdown")).get();
    ASSERT_EQ(results.size(), 3u);
    std::vector<int64_t> ids;
    for (const auto& r : results) {
        EXPECT_TRUE(r.success);
        EXPECT_EQ(r.reason.value_or(""), "shutdown");
        ids.push_back(std::get<int64_t>(r.requestId));
    }
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, (std::vector<int64_t>{10, 11, 12}));
    EXPECT_EQ(tracker.GetActiveRequestCount(), 0u);
    EXPECT_EQ(sender.count(), 3u);
}

TEST(RequestTrackerTest, CancelByServerOnlyTouchesThatServer) {
    RecordingSender sender;
    RequestTracker tracker;
    tracker.SetOutboundSender(sender.fn());
    tracker.Register(intId(20), "alpha", "a");
    tracker.Register(intId(21), "beta", "b");

    auto results = tracker.CancelByServer("alpha").get();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(std::get<int64_t>(results[0].requestId), 20);
    EXPECT_EQ(tracker.GetState(intId(21)), RequestState::Pending);
}

TEST(RequestTrackerTest, RemoteCancellationNotificationRetiresWithoutEcho) {
    RecordingSender sender;
    RequestTracker tracker;
    tracker.SetOutboundSender(sender.fn());
    std::stop_token token = tracker.Register(intId(30), "alpha", "t");

    JSONValue msg = ParseJSON(R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":30,"reason":"server busy"}})");
    EXPECT_FALSE(tracker.HandleInbound("beta", msg)); // not the owning server
    EXPECT_FALSE(token.stop_requested());

    std::optional<std::string> seenReason;
    tracker.SetRequestCancelledHandler([&](const RequestInfo&, const std::optional<std::string>& reason, RequestState) {
        seenReason = reason;
    });
    EXPECT_TRUE(tracker.HandleInbound("alpha", msg));
    EXPECT_TRUE(token.stop_requested());
    EXPECT_TRUE(tracker.IsCancelled(intId(30)));
    EXPECT_EQ(seenReason.value_or(""), "server busy");
    EXPECT_EQ(sender.count(), 0u);
}

TEST(RequestTrackerTest, CancelledErrorResponseRetiresRequest) {
    RequestTracker tracker;
    std::stop_token token = tracker.Register(intId(31), "alpha", "t");
    JSONValue resp = ParseJSON(R"({"jsonrpc":"2.0","id":31,"error":{"code":-32800,"message":"Request cancelled"}})");
    EXPECT_TRUE(tracker.HandleInbound("alpha", resp));
    EXPECT_TRUE(token.stop_requested());

    tracker.Register(intId(32), "alpha", "t");
    JSONValue other = ParseJSON(R"({"jsonrpc":"2.0","id":32,"error":{"code":-32603,"message":"boom"}})");
    EXPECT_FALSE(tracker.HandleInbound("alpha", other));
    EXPECT_EQ(tracker.GetState(intId(32)), RequestState::Pending);
}

TEST(RequestTrackerTest, TimeOutRecordsTimedOutState) {
    RequestTracker tracker;
    std::stop_token token = tracker.Register(intId(40), "alpha", "t");
    auto result = tracker.TimeOut(intId(40), std::string("deadline")).get();
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(token.stop_requested());
    EXPECT_EQ(tracker.GetState(intId(40)), RequestState::TimedOut);
}

TEST(RequestTrackerTest, DuplicateRegisterKeepsExistingEntry) {
    RequestTracker tracker;
    std::stop_token first = tracker.Register(intId(50), "alpha", "one");
    std::stop_token second = tracker.Register(intId(50), "beta", "two");
    EXPECT_EQ(tracker.GetActiveRequestCount(), 1u);
    auto active = tracker.GetActiveRequests();
    ASSERT_EQ(active.size(), 1u);
    EXPECT_EQ(active[0].serverName, "alpha");
    ASSERT_TRUE(tracker.Cancel(intId(50)).get().success);
    EXPECT_TRUE(first.stop_requested());
    EXPECT_TRUE(second.stop_requested());
}

TEST(RequestTrackerTest, ReusedIdStartsFresh) {
    RequestTracker tracker;
    tracker.Register(intId(60), "alpha", "t");
    ASSERT_TRUE(tracker.Cancel(intId(60)).get().success);
    ASSERT_TRUE(tracker.IsCancelled(intId(60)));
    std::stop_token token = tracker.Register(intId(60), "alpha", "t");
    EXPECT_FALSE(tracker.IsCancelled(intId(60)));
    EXPECT_FALSE(token.stop_requested());
    EXPECT_EQ(tracker.GetState(intId(60)), RequestState::Pending);
}

TEST(RequestTrackerTest, MostRecentAndActiveQueries) {
    RequestTracker tracker;
    EXPECT_FALSE(tracker.GetMostRecentRequest().has_value());
    tracker.Register(intId(70), "alpha", "first");
    tracker.Register(intId(71), "beta", "second");
    auto recent = tracker.GetMostRecentRequest();
    ASSERT_TRUE(recent.has_value());
    EXPECT_EQ(recent->toolName, "second");
    auto active = tracker.GetActiveRequests();
    ASSERT_EQ(active.size(), 2u);
    EXPECT_EQ(active[0].toolName, "first");
    tracker.CleanupAll();
    EXPECT_FALSE(tracker.HasActiveRequests());
}

TEST(RequestTrackerTest, RegisteredHandlerSeesRequest) {
    RequestTracker tracker;
    std::string seenTool;
    tracker.SetRequestRegisteredHandler([&](const RequestInfo& info) { seenTool = info.toolName; });
    tracker.Register(intId(80), "alpha", "lookup");
    EXPECT_EQ(seenTool, "lookup");
}

TEST(RequestTrackerTest, CancelFromRemoteSkipsServerNotification) {
    RecordingSender sender;
    RequestTracker tracker;
    tracker.SetOutboundSender(sender.fn());
    std::stop_token token = tracker.Register(intId(90), "alpha", "t");
    auto result = tracker.CancelFromRemote(intId(90), std::string("server shutdown"));
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(token.stop_requested());
    EXPECT_EQ(tracker.GetState(intId(90)), RequestState::Cancelled);
    EXPECT_EQ(sender.count(), 0u);
    EXPECT_FALSE(tracker.CancelFromRemote(intId(90), std::nullopt).success);
}

TEST(RequestTrackerTest, DestructionWaitsForUndeliveredCancelNotification) {
    auto delivered = std::make_shared<std::promise<errors::Outcome>>();
    auto sharedDelivery = std::make_shared<std::shared_future<errors::Outcome>>(delivered->get_future().share());
    auto tracker = std::make_unique<RequestTracker>();
    tracker->SetOutboundSender([sharedDelivery](const std::string&, const std::string&, const JSONValue&) {
        auto copy = sharedDelivery;
        return std::async(std::launch::async, [copy]() { return copy->get(); });
    });
    tracker->Register(intId(100), "alpha", "t");
    auto cancelled = tracker->Cancel(intId(100), std::string("stop"));

    auto destroyed = std::async(std::launch::async, [&tracker]() { tracker.reset(); });
    EXPECT_EQ(destroyed.wait_for(200ms), std::future_status::timeout);

    delivered->set_value(errors::Outcome::Ok());
    ASSERT_EQ(destroyed.wait_for(5s), std::future_status::ready);
    destroyed.get();
    ASSERT_EQ(cancelled.wait_for(0s), std::future_status::ready);
    EXPECT_TRUE(cancelled.get().success);
}
