//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConnection.h
// Purpose: One MCP server reached over a ProcessChannel: handshake, request correlation and routing
//==========================================================================================================
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "mcpio/JSONRPCTypes.h"
#include "mcpio/ProcessChannel.hpp"
#include "mcpio/ProgressTracker.h"
#include "mcpio/Protocol.h"
#include "mcpio/RequestTracker.h"
#include "mcpio/SubscriptionRegistry.h"
#include "mcpio/errors/Errors.h"

namespace mcpio {

// Deadline for requests without an explicit timeout: MCPIO_REQUEST_TIMEOUT_MS when set, otherwise none
std::optional<std::chrono::milliseconds> DefaultRequestTimeout();

//==========================================================================================================
// ConnectionServices
// Purpose: Components shared between the connections of one ConnectionManager. Any pointer may be null,
//          in which case the corresponding routing is skipped.
// Fields:
//   idCounter: Source of request ids; sharing it keeps ids unique across connections using one tracker.
//==========================================================================================================
struct ConnectionServices {
    RequestTracker* tracker{nullptr};
    SubscriptionRegistry* subscriptions{nullptr};
    ProgressTracker* progress{nullptr};
    std::shared_ptr<std::atomic<int64_t>> idCounter;
};

struct CallToolOptions {
    std::optional<std::chrono::milliseconds> timeout;
    ProgressTracker::Callback onProgress;
};

//==========================================================================================================
// ToolCall
// Purpose: Handle of an issued tools/call request.
// Fields:
//   id: Request id, usable with RequestTracker::Cancel().
//   response: Completes with the server's response, or with a -32800 error response as soon as the
//             request is cancelled or times out locally.
//   progressToken: Token attached as _meta.progressToken; empty without a progress callback.
//==========================================================================================================
struct ToolCall {
    JSONRPCId id;
    std::future<JSONRPCResponse> response;
    std::string progressToken;
};

//==========================================================================================================
// ServerConnection
// Purpose: Owns the ProcessChannel of one named server. Assigns request ids, correlates responses,
//          performs the initialize handshake and routes inbound notifications:
//            notifications/cancelled            -> RequestTracker
//            notifications/resources/updated    -> SubscriptionRegistry
//            notifications/resources/list_changed -> SubscriptionRegistry
//            notifications/progress             -> ProgressTracker
//            anything else                      -> notification handler
// Threading:
//   Handlers run on the channel's I/O thread. Set them before Connect().
//==========================================================================================================
class ServerConnection {
public:
    using NotificationHandler = std::function<void(const std::string& method, const JSONValue& params)>;
    using CloseHandler = ProcessChannel::CloseHandler;
    using ErrorHandler = ProcessChannel::ErrorHandler;

    ServerConnection(std::string name, ConnectionServices services);
    ~ServerConnection();

    ServerConnection(const ServerConnection&) = delete;
    ServerConnection& operator=(const ServerConnection&) = delete;

    //==========================================================================================================
    // Connect
    // Purpose: Starts the server process, sends initialize and then notifications/initialized.
    // Returns:
    //   Server capabilities. Fails with TransportError from the channel, or std::runtime_error when the
    //   server rejects initialize.
    //==========================================================================================================
    std::future<ServerCapabilities> Connect(const ProcessConfig& config,
                                            Implementation clientInfo = Implementation{});

    // Closes the channel; outstanding requests fail with TransportError(Closed)
    std::future<void> Close();

    //==========================================================================================================
    // SendRequest
    // Purpose: Sends one request and correlates its response by id.
    // Returns:
    //   The response (result or error). An expired deadline yields an InternalError response; a failed
    //   write or a closed channel fails the future with TransportError.
    //==========================================================================================================
    std::future<JSONRPCResponse> SendRequest(const std::string& method, std::optional<JSONValue> params = std::nullopt,
                                             std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    std::future<void> SendNotification(const std::string& method, std::optional<JSONValue> params = std::nullopt);

    //==========================================================================================================
    // CallTool
    // Purpose: Issues tools/call tracked by the RequestTracker so it can be cancelled by id or by server.
    //==========================================================================================================
    ToolCall CallTool(const std::string& toolName, const JSONValue& arguments, CallToolOptions options = {});

    //==========================================================================================================
    // SendOutbound
    // Purpose: Adapter for the tracker and subscription registry: methods under "notifications/" are sent
    //          as notifications, anything else as a request whose error response becomes RemoteError.
    //==========================================================================================================
    std::future<errors::Outcome> SendOutbound(const std::string& method, const JSONValue& params);

    const std::string& Name() const;
    bool IsConnected() const;
    bool IsInitialized() const;
    int Pid() const;
    std::optional<int> ExitCode() const;
    ServerCapabilities Capabilities() const;
    std::optional<Implementation> ServerInfo() const;
    std::size_t PendingRequestCount() const;

    void SetNotificationHandler(NotificationHandler handler);
    void SetCloseHandler(CloseHandler handler);
    void SetErrorHandler(ErrorHandler handler);

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcpio
