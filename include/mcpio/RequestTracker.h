//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestTracker.h
// Purpose: Correlation and cancellation of in-flight requests across one or more server connections
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "mcpio/GraceWindow.h"
#include "mcpio/JSONRPCTypes.h"
#include "mcpio/async/OutstandingTasks.h"
#include "mcpio/async/Task.h"
#include "mcpio/errors/Errors.h"

namespace mcpio {

// Grace window default, overridable through MCPIO_CANCEL_GRACE_MS
std::chrono::milliseconds DefaultCancelGraceWindow();

enum class RequestState {
    Pending,
    Completed,
    Cancelled,
    TimedOut
};

const char* requestStateName(RequestState state);

// Snapshot of one outstanding request
struct RequestInfo {
    JSONRPCId requestId;
    std::string serverName;
    std::string toolName;
    std::chrono::steady_clock::time_point startedAt;
};

//==========================================================================================================
// RequestTracker
// Purpose: Owns every Pending request from send until it completes, times out or is cancelled, and
//          reconciles local cancellation with the best-effort notification sent to the server.
// Notes:
//   All state is behind one mutex; a tracker may be shared by several connections as long as request
//   ids are unique across them.
//   State changes and token firing happen before Cancel() returns; only the remote notification is
//   awaited afterwards.
//==========================================================================================================
class RequestTracker {
public:
    using Clock = GraceWindow::Clock;
    using OutboundSender = std::function<std::future<errors::Outcome>(
        const std::string& serverName, const std::string& method, const JSONValue& params)>;
    using RequestRegisteredHandler = std::function<void(const RequestInfo& request)>;
    using RequestCancelledHandler = std::function<void(const RequestInfo& request,
        const std::optional<std::string>& reason, RequestState state)>;

    struct Options {
        std::chrono::milliseconds graceWindow{DefaultCancelGraceWindow()};
        Clock clock; // steady_clock::now when empty
    };

    RequestTracker();
    explicit RequestTracker(Options options);
    // Waits for cancellations still delivering their server notification
    ~RequestTracker();

    RequestTracker(const RequestTracker&) = delete;
    RequestTracker& operator=(const RequestTracker&) = delete;

    void SetOutboundSender(OutboundSender sender);
    void SetRequestRegisteredHandler(RequestRegisteredHandler handler);
    void SetRequestCancelledHandler(RequestCancelledHandler handler);

    //==========================================================================================================
    // Register
    // Purpose: Records a Pending request with a fresh cancellation token.
    // Returns:
    //   Token that is stopped when the request is cancelled. An id that is already pending is not
    //   overwritten; its existing token is returned.
    //==========================================================================================================
    std::stop_token Register(const JSONRPCId& id, const std::string& serverName, const std::string& toolName);

    //==========================================================================================================
    // Cancel
    // Purpose: Retires a Pending request as Cancelled, stops its token, then notifies the server with
    //          notifications/cancelled. A failed notification is logged and does not change the result.
    // Returns:
    //   {success:false, error:"Request not found or already completed"} for unknown or finished ids.
    //==========================================================================================================
    std::future<errors::CancellationResult> Cancel(const JSONRPCId& id,
                                                   std::optional<std::string> reason = std::nullopt);

    // Same as Cancel() but records the TimedOut state
    std::future<errors::CancellationResult> TimeOut(const JSONRPCId& id,
                                                    std::optional<std::string> reason = std::nullopt);

    //==========================================================================================================
    // CancelAll / CancelByServer
    // Purpose: Cancels every matching Pending request concurrently.
    // Returns:
    //   One result per request; a cancel that throws becomes a failed entry.
    //==========================================================================================================
    std::future<std::vector<errors::CancellationResult>> CancelAll(std::optional<std::string> reason = std::nullopt);
    std::future<std::vector<errors::CancellationResult>> CancelByServer(const std::string& serverName,
                                                                        std::optional<std::string> reason = std::nullopt);

    // Cancellation that originated at the server: retired locally, nothing is sent back
    errors::CancellationResult CancelFromRemote(const JSONRPCId& id, std::optional<std::string> reason = std::nullopt);

    //==========================================================================================================
    // HandleInbound
    // Purpose: Applies remote cancellation rules to a decoded message: notifications/cancelled, or an
    //          error/notification carrying code -32800 or a "cancelled" message.
    // Returns:
    //   true when the message cancelled a request tracked for serverName.
    //==========================================================================================================
    bool HandleInbound(const std::string& serverName, const JSONValue& message);

    // Retires a Pending request as Completed. Returns false when it was not pending (e.g. cancelled).
    bool Complete(const JSONRPCId& id);

    std::optional<RequestState> GetState(const JSONRPCId& id);
    bool IsCancelled(const JSONRPCId& id);

    //==========================================================================================================
    // Cleanup
    // Purpose: Removes the Pending entry (if any) and restarts the recently-cancelled window for the id.
    //==========================================================================================================
    void Cleanup(const JSONRPCId& id);
    void CleanupAll();

    std::vector<RequestInfo> GetActiveRequests();
    std::optional<RequestInfo> GetMostRecentRequest();
    bool HasActiveRequests();
    std::size_t GetActiveRequestCount();
    std::chrono::milliseconds GraceWindowDuration() const { return grace.Window(); }

private:
    struct PendingRequest {
        RequestInfo info;
        std::stop_source stopSource;
        uint64_t sequence{0};
    };

    // Removes a Pending entry and marks it recently cancelled; nullopt when not pending
    std::optional<PendingRequest> claim(const JSONRPCId& id, RequestState terminal);
    void sweepLocked();
    std::chrono::steady_clock::time_point now() const;

    async::Task<errors::CancellationResult> coCancel(JSONRPCId id, std::optional<std::string> reason,
                                                     RequestState terminal);
    async::Task<std::vector<errors::CancellationResult>> coCancelMany(std::vector<JSONRPCId> ids,
                                                                      std::optional<std::string> reason);

    async::OutstandingTasks tasks;
    Clock clock;
    std::mutex mutex;
    std::unordered_map<std::string, PendingRequest> pending;     // IdToKey -> request
    std::unordered_map<std::string, RequestState> retired;       // recently cancelled/timed out
    GraceWindow grace;
    uint64_t sequence{0};
    OutboundSender outboundSender;
    RequestRegisteredHandler registeredHandler;
    RequestCancelledHandler cancelledHandler;
};

} // namespace mcpio
