//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_server_connection.cpp
// Purpose: End-to-end tests of ServerConnection against the scriptable fake server process
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "mcpio/ServerConnection.h"

using namespace mcpio;
using namespace std::chrono_literals;

namespace {

ProcessConfig fakeServer(std::vector<std::string> args = {}) {
    ProcessConfig cfg;
    cfg.command = MCPIO_FAKE_SERVER_PATH;
    cfg.args = std::move(args);
    cfg.startupTimeout = 5000ms;
    cfg.killTimeout = 2000ms;
    return cfg;
}

JSONValue args(const std::string& key, const std::string& value) {
    JSONValue::Object o;
    o[key] = std::make_shared<JSONValue>(value);
    return JSONValue(std::move(o));
}

JSONValue noArgs() { return JSONValue(JSONValue::Object{}); }

std::string textOf(const JSONRPCResponse& response) {
    if (!response.result.has_value()) {
        return {};
    }
    const JSONValue* content = FindMember(response.result.value(), "content");
    if (!content || !std::holds_alternative<JSONValue::Array>(content->value)) {
        return {};
    }
    const auto& items = std::get<JSONValue::Array>(content->value);
    return items.empty() ? std::string() : GetStringMember(*items.front(), "text").value_or("");
}

std::string errorMessageOf(const JSONRPCResponse& response) {
    auto err = errors::mcpErrorFromResponse(response);
    return err.has_value() ? err->message : std::string();
}

// One connection wired to its own tracker, registry and progress tracker
struct Wired {
    RequestTracker tracker;
    SubscriptionRegistry subscriptions;
    ProgressTracker progress;
    std::shared_ptr<ServerConnection> conn;

    explicit Wired(const std::string& name = "fake") {
        conn = std::make_shared<ServerConnection>(name, ConnectionServices{&tracker, &subscriptions, &progress, nullptr});
        std::weak_ptr<ServerConnection> weak = conn;
        auto sender = [weak](const std::string&, const std::string& method, const JSONValue& params) {
            if (auto c = weak.lock()) {
                return c->SendOutbound(method, params);
            }
            return async::makeReadyFuture(errors::Outcome::Fail(errors::OutcomeCode::NotFound, "gone"));
        };
        tracker.SetOutboundSender(sender);
        subscriptions.SetOutboundSender(sender);
        subscriptions.SetCapabilityProbe([weak](const std::string&) {
            auto c = weak.lock();
            return async::makeReadyFuture(c ? c->Capabilities() : ServerCapabilities{});
        });
    }

    ~Wired() {
        if (conn) {
            conn->Close().get();
        }
    }

    // The cancellation notification is written after the caller is answered; poll until the server saw it
    JSONValue waitForServerCancel() {
        for (int i = 0; i < 40; ++i) {
            auto response = conn->CallTool("last_cancel", noArgs()).response.get();
            if (response.result.has_value() && !response.result->isNull()) {
                return response.result.value();
            }
            std::this_thread::sleep_for(50ms);
        }
        return JSONValue(nullptr);
    }
};

} // namespace

TEST(ServerConnectionE2E, HandshakeReportsCapabilitiesAndServerInfo) {
    Wired w;
    auto caps = w.conn->Connect(fakeServer()).get();
    EXPECT_TRUE(caps.supportsSubscriptions());
    EXPECT_TRUE(w.conn->IsInitialized());
    auto info = w.conn->ServerInfo();
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->name, "fake-server");
    EXPECT_GT(w.conn->Pid(), 0);
}

TEST(ServerConnectionE2E, LineAndMixedWireFormats) {
    for (const char* flag : {"--line", "--mixed"}) {
        Wired w;
        ASSERT_NO_THROW(w.conn->Connect(fakeServer({flag})).get()) << flag;
        for (int i = 0; i < 4; ++i) {
            auto call = w.conn->CallTool("echo", args("text", "hello " + std::to_string(i)));
            ASSERT_EQ(call.response.wait_for(5s), std::future_status::ready) << flag;
            EXPECT_EQ(textOf(call.response.get()), "hello " + std::to_string(i)) << flag;
        }
    }
}

TEST(ServerConnectionE2E, UnknownMethodIsMethodNotFound) {
    Wired w;
    w.conn->Connect(fakeServer()).get();
    auto response = w.conn->SendRequest("does/not/exist").get();
    ASSERT_TRUE(response.IsError());
    EXPECT_EQ(errors::mcpErrorFromResponse(response)->code, JSONRPCErrorCodes::MethodNotFound);
}

TEST(ServerConnectionE2E, CancelAnswersCallerAndNotifiesServer) {
    Wired w;
    w.conn->Connect(fakeServer()).get();
    auto call = w.conn->CallTool("slow", noArgs());
    EXPECT_EQ(w.tracker.GetActiveRequestCount(), 1u);

    auto result = w.tracker.Cancel(call.id, std::string("user aborted")).get();
    EXPECT_TRUE(result.success);
    ASSERT_EQ(call.response.wait_for(2s), std::future_status::ready);
    auto response = call.response.get();
    ASSERT_TRUE(response.IsError());
    EXPECT_TRUE(errors::IsRequestCancelledError(response.error.value()));
    EXPECT_EQ(w.conn->PendingRequestCount(), 0u);

    auto seen = w.waitForServerCancel();
    ASSERT_FALSE(seen.isNull());
    EXPECT_EQ(GetIntMember(seen, "requestId").value_or(-1), std::get<int64_t>(call.id));
    EXPECT_EQ(GetStringMember(seen, "reason").value_or(""), "user aborted");
}

TEST(ServerConnectionE2E, LateResponseAfterCancelIsDropped) {
    Wired w;
    w.conn->Connect(fakeServer()).get();
    auto call = w.conn->CallTool("late", noArgs());
    ASSERT_TRUE(w.tracker.Cancel(call.id).get().success);
    auto response = call.response.get();
    EXPECT_TRUE(response.IsError());

    // The server answers after the cancellation; the connection keeps working
    auto next = w.conn->CallTool("echo", args("text", "still here"));
    EXPECT_EQ(textOf(next.response.get()), "still here");
    EXPECT_EQ(w.tracker.GetState(call.id), std::optional<RequestState>(RequestState::Cancelled));
    EXPECT_EQ(w.conn->PendingRequestCount(), 0u);
}

TEST(ServerConnectionE2E, ServerReportedCancellationRetiresRequest) {
    Wired w;
    w.conn->Connect(fakeServer()).get();
    auto call = w.conn->CallTool("cancel_me", noArgs());
    ASSERT_EQ(call.response.wait_for(5s), std::future_status::ready);
    auto response = call.response.get();
    ASSERT_TRUE(response.IsError());
    EXPECT_EQ(errors::mcpErrorFromResponse(response)->code, JSONRPCErrorCodes::RequestCancelled);
    EXPECT_TRUE(w.tracker.IsCancelled(call.id));
    EXPECT_FALSE(w.tracker.HasActiveRequests());
}

TEST(ServerConnectionE2E, TrackedTimeoutCancelsWithReason) {
    Wired w;
    w.conn->Connect(fakeServer()).get();
    CallToolOptions opts;
    opts.timeout = 200ms;
    auto call = w.conn->CallTool("slow", noArgs(), opts);
    ASSERT_EQ(call.response.wait_for(5s), std::future_status::ready);
    auto response = call.response.get();
    ASSERT_TRUE(response.IsError());
    EXPECT_EQ(errorMessageOf(response), "Request cancelled: timed out after 200ms");
    EXPECT_EQ(w.tracker.GetState(call.id), std::optional<RequestState>(RequestState::TimedOut));

    auto seen = w.waitForServerCancel();
    EXPECT_EQ(GetStringMember(seen, "reason").value_or(""), "Request timed out after 200ms");
}

TEST(ServerConnectionE2E, UntrackedRequestTimeout) {
    Wired w;
    w.conn->Connect(fakeServer()).get();
    JSONValue::Object params;
    params["name"] = std::make_shared<JSONValue>("slow");
    auto response = w.conn->SendRequest(Methods::CallTool, JSONValue(std::move(params)), 150ms).get();
    ASSERT_TRUE(response.IsError());
    EXPECT_EQ(errors::mcpErrorFromResponse(response)->code, JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(errorMessageOf(response), "Request timeout");
}

TEST(ServerConnectionE2E, CallWithoutTimeoutWaitsUntilCancelled) {
    ::unsetenv("MCPIO_REQUEST_TIMEOUT_MS");
    EXPECT_FALSE(DefaultRequestTimeout().has_value());

    Wired w;
    w.conn->Connect(fakeServer()).get();
    auto call = w.conn->CallTool("slow", noArgs());
    EXPECT_EQ(call.response.wait_for(1500ms), std::future_status::timeout);
    EXPECT_EQ(w.tracker.GetState(call.id), std::optional<RequestState>(RequestState::Pending));
    EXPECT_EQ(w.conn->PendingRequestCount(), 1u);

    ASSERT_TRUE(w.tracker.Cancel(call.id).get().success);
    ASSERT_EQ(call.response.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(errorMessageOf(call.response.get()), "Request cancelled");
}

TEST(ServerConnectionE2E, EnvironmentDeadlineAppliesToCallsWithoutTimeout) {
    ::setenv("MCPIO_REQUEST_TIMEOUT_MS", "150", 1);
    EXPECT_EQ(DefaultRequestTimeout(), std::optional<std::chrono::milliseconds>(150ms));
    Wired w;
    w.conn->Connect(fakeServer()).get();
    JSONValue::Object params;
    params["name"] = std::make_shared<JSONValue>("slow");
    auto response = w.conn->SendRequest(Methods::CallTool, JSONValue(std::move(params))).get();
    ::unsetenv("MCPIO_REQUEST_TIMEOUT_MS");
    ASSERT_TRUE(response.IsError());
    EXPECT_EQ(errorMessageOf(response), "Request timeout");
}

TEST(ServerConnectionE2E, ProgressNotificationsReachCallback) {
    Wired w;
    w.conn->Connect(fakeServer()).get();
    std::mutex m;
    std::vector<ProgressUpdate> updates;
    CallToolOptions opts;
    opts.onProgress = [&](const ProgressUpdate& u) {
        std::lock_guard<std::mutex> lk(m);
        updates.push_back(u);
    };
    auto call = w.conn->CallTool("progress", noArgs(), opts);
    ASSERT_FALSE(call.progressToken.empty());
    EXPECT_EQ(textOf(call.response.get()), "finished");

    std::lock_guard<std::mutex> lk(m);
    ASSERT_EQ(updates.size(), 2u);
    EXPECT_EQ(updates[0].token, call.progressToken);
    EXPECT_EQ(updates[0].current.value_or(-1), 5);
    EXPECT_EQ(updates[0].message.value_or(""), "halfway");
    EXPECT_DOUBLE_EQ(updates[1].progress, 1.0);
    EXPECT_FALSE(w.progress.IsTracking(call.progressToken));
}

TEST(ServerConnectionE2E, ResourceNotificationsRouteToSubscriptions) {
    Wired w;
    w.conn->Connect(fakeServer()).get();
    std::mutex m;
    std::vector<std::string> updated;
    int listChanged = 0;
    w.subscriptions.SetResourceUpdatedHandler([&](const std::string& uri, const std::string& server) {
        std::lock_guard<std::mutex> lk(m);
        updated.push_back(server + ":" + uri);
    });
    w.subscriptions.SetResourceListChangedHandler([&](const std::string&) {
        std::lock_guard<std::mutex> lk(m);
        ++listChanged;
    });

    ASSERT_TRUE(w.subscriptions.Subscribe("fake", "file:///watched").get().success);
    EXPECT_FALSE(w.subscriptions.Subscribe("fake", "fail:missing").get().success);
    EXPECT_EQ(textOf(w.conn->CallTool("notify", args("uri", "file:///watched")).response.get()), "notified");
    EXPECT_EQ(textOf(w.conn->CallTool("notify", args("uri", "file:///other")).response.get()), "notified");

    std::lock_guard<std::mutex> lk(m);
    ASSERT_EQ(updated.size(), 1u);
    EXPECT_EQ(updated[0], "fake:file:///watched");
    EXPECT_EQ(listChanged, 2);
}

TEST(ServerConnectionE2E, AnswersServerPing) {
    Wired w;
    w.conn->Connect(fakeServer()).get();
    auto call = w.conn->CallTool("ping_client", noArgs());
    ASSERT_EQ(call.response.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(textOf(call.response.get()), "pong");
}

TEST(ServerConnectionE2E, CrashFailsOutstandingRequests) {
    Wired w;
    auto closed = std::make_shared<std::promise<std::optional<int>>>();
    auto closedFut = closed->get_future();
    w.conn->SetCloseHandler([closed](std::optional<int> code) { closed->set_value(code); });
    w.conn->Connect(fakeServer()).get();

    auto pendingCall = w.conn->CallTool("slow", noArgs());
    auto crash = w.conn->CallTool("crash", noArgs());
    ASSERT_EQ(closedFut.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(closedFut.get(), std::optional<int>(3));
    EXPECT_THROW(pendingCall.response.get(), errors::TransportError);
    EXPECT_THROW(crash.response.get(), errors::TransportError);
    EXPECT_FALSE(w.conn->IsInitialized());
    EXPECT_FALSE(w.tracker.HasActiveRequests());
}

TEST(ServerConnectionE2E, ServerExitingBeforeHandshakeFailsConnect) {
    Wired w;
    ProcessConfig cfg;
    cfg.command = "/bin/sh";
    cfg.args = {"-c", "exit 0"};
    EXPECT_THROW(w.conn->Connect(cfg).get(), errors::TransportError);
    EXPECT_FALSE(w.conn->IsInitialized());
}

TEST(ServerConnectionE2E, MissingBinaryFailsConnect) {
    Wired w;
    ProcessConfig cfg;
    cfg.command = "/nonexistent/mcpio-server";
    try {
        w.conn->Connect(cfg).get();
        FAIL() << "expected TransportError";
    } catch (const errors::TransportError& e) {
        EXPECT_EQ(e.code(), errors::TransportErrc::ProcessExitedEarly);
    }
}
