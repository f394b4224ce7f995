//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConnection.cpp
// Purpose: Request correlation, initialize handshake and inbound routing for one server process
//==========================================================================================================

#include <condition_variable>
#include <format>
#include <mutex>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <vector>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpio/ServerConnection.h"
#include "mcpio/async/FutureAwaitable.h"
#include "mcpio/async/Task.h"
#include "mcpio/version.h"

namespace mcpio {

namespace {
constexpr std::chrono::milliseconds kTimeoutPoll{50};

// Logs the fate of a fire-and-forget write (responses to server requests)
async::Task<void> coWatchSend(std::future<void> sent, std::string what) {
    try {
        co_await async::makeFutureAwaitable(std::move(sent));
    } catch (const std::exception& e) {
        LOG_WARN("ServerConnection: failed to send {}: {}", what, e.what());
    }
}
} // namespace

std::optional<std::chrono::milliseconds> DefaultRequestTimeout() {
    const std::string raw = GetEnvOrDefault("MCPIO_REQUEST_TIMEOUT_MS", "");
    if (raw.empty()) {
        return std::nullopt;
    }
    auto v = GetEnvUInt64("MCPIO_REQUEST_TIMEOUT_MS");
    if (!v.has_value() || v.value() == 0) {
        LOG_WARN("Ignoring malformed MCPIO_REQUEST_TIMEOUT_MS='{}'", raw);
        return std::nullopt;
    }
    return std::chrono::milliseconds(v.value());
}

class ServerConnection::Impl : public std::enable_shared_from_this<ServerConnection::Impl> {
public:
    using StopCallback = std::stop_callback<std::function<void()>>;

    struct PendingCall {
        JSONRPCId id;
        std::shared_ptr<std::promise<JSONRPCResponse>> promise;
        std::optional<std::chrono::steady_clock::time_point> deadline; // none: waits until answered or cancelled
        std::chrono::milliseconds timeout{0};
        bool tracked{false};
        std::string progressToken;
        std::unique_ptr<StopCallback> onCancel;
    };

    std::string name;
    ConnectionServices services;
    ProcessChannel channel;

    mutable std::mutex mutex;
    std::unordered_map<std::string, PendingCall> pending; // IdToKey -> call
    ServerCapabilities capabilities;
    std::optional<Implementation> serverInfo;
    std::atomic<bool> initialized{false};

    NotificationHandler notificationHandler;
    CloseHandler closeHandler;
    ErrorHandler errorHandler;

    // Deadline sweeper
    std::mutex timeoutMutex;
    std::condition_variable timeoutCv;
    std::thread timeoutThread;
    bool timeoutsRunning{false};
    bool timeoutsStopped{false};

    Impl(std::string n, ConnectionServices s) : name(std::move(n)), services(std::move(s)) {
        if (!services.idCounter) {
            services.idCounter = std::make_shared<std::atomic<int64_t>>(0);
        }
        channel.SetMessageHandler([this](const JSONValue& message) { onMessage(message); });
        channel.SetErrorHandler([this](const errors::EngineError& error) {
            LOG_DEBUG("ServerConnection '{}': {} error: {}", name, errors::errorClassName(error.errorClass), error.message);
            if (errorHandler) {
                errorHandler(error);
            }
        });
        channel.SetCloseHandler([this](std::optional<int> exitCode) {
            initialized.store(false);
            failAllPending(errors::TransportErrc::Closed, std::format("server '{}' closed", name));
            if (closeHandler) {
                closeHandler(exitCode);
            }
        });
    }

    ~Impl() {
        stopTimeouts();
        failAllPending(errors::TransportErrc::Closed, std::format("connection to '{}' destroyed", name));
    }

    JSONRPCId nextId() {
        return JSONRPCId{services.idCounter->fetch_add(1) + 1};
    }

    //////////////////////////////////////// Pending calls ////////////////////////////////////////
    std::future<JSONRPCResponse> registerPending(PendingCall call) {
        auto fut = call.promise->get_future();
        const bool hasDeadline = call.deadline.has_value();
        {
            std::lock_guard<std::mutex> lk(mutex);
            pending.emplace(IdToKey(call.id), std::move(call));
        }
        if (hasDeadline) {
            ensureTimeouts();
        }
        return fut;
    }

    std::optional<PendingCall> extractPending(const std::string& key) {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = pending.find(key);
        if (it == pending.end()) {
            return std::nullopt;
        }
        PendingCall call = std::move(it->second);
        pending.erase(it);
        return call;
    }

    void resolve(PendingCall& call, JSONRPCResponse response) {
        call.promise->set_value(std::move(response));
        if (!call.progressToken.empty() && services.progress) {
            services.progress->Cleanup(call.progressToken);
        }
    }

    void fail(PendingCall& call, std::exception_ptr error) {
        if (call.tracked && services.tracker) {
            services.tracker->Cleanup(call.id);
        }
        call.promise->set_exception(std::move(error));
        if (!call.progressToken.empty() && services.progress) {
            services.progress->Cleanup(call.progressToken);
        }
    }

    void failPending(const std::string& key, std::exception_ptr error) {
        auto call = extractPending(key);
        if (call.has_value()) {
            fail(call.value(), std::move(error));
        }
    }

    void failAllPending(errors::TransportErrc code, const std::string& what) {
        std::vector<PendingCall> calls;
        {
            std::lock_guard<std::mutex> lk(mutex);
            for (auto& [key, call] : pending) {
                calls.push_back(std::move(call));
            }
            pending.clear();
        }
        if (!calls.empty()) {
            LOG_DEBUG("ServerConnection '{}': failing {} outstanding requests", name, calls.size());
        }
        for (auto& call : calls) {
            fail(call, std::make_exception_ptr(errors::TransportError(code, what)));
        }
    }

    // Runs from the tracker's stop token: the caller learns about the cancellation immediately
    void onRequestStopped(const JSONRPCId& id) {
        auto call = extractPending(IdToKey(id));
        if (!call.has_value()) {
            return;
        }
        std::optional<std::string> reason;
        if (services.tracker && services.tracker->GetState(id) == RequestState::TimedOut) {
            reason = std::format("timed out after {}ms", call->timeout.count());
        }
        LOG_DEBUG("ServerConnection '{}': request {} aborted locally", name, IdToString(id));
        resolve(call.value(), JSONRPCResponse(id, errors::CreateCancellationError(reason), true));
    }

    static async::Task<void> coWatchRequestSend(std::shared_ptr<Impl> self, std::string key, std::future<void> sent) {
        try {
            co_await async::makeFutureAwaitable(std::move(sent));
        } catch (const std::exception& e) {
            LOG_WARN("ServerConnection '{}': request write failed: {}", self->name, e.what());
            self->failPending(key, std::current_exception());
        }
    }

    static void setDeadline(PendingCall& call, std::optional<std::chrono::milliseconds> timeout) {
        if (timeout.has_value()) {
            call.timeout = timeout.value();
            call.deadline = std::chrono::steady_clock::now() + call.timeout;
        }
    }

    std::future<JSONRPCResponse> sendRequest(const std::string& method, std::optional<JSONValue> params,
                                             std::optional<std::chrono::milliseconds> timeout) {
        PendingCall call;
        call.id = nextId();
        call.promise = std::make_shared<std::promise<JSONRPCResponse>>();
        setDeadline(call, timeout ? timeout : DefaultRequestTimeout());

        JSONRPCRequest request(call.id, method, std::move(params));
        const std::string key = IdToKey(call.id);
        auto fut = registerPending(std::move(call));
        LOG_DEBUG("ServerConnection '{}': -> {} ({})", name, method, IdToString(request.id));
        coWatchRequestSend(shared_from_this(), key, channel.Send(request.ToJSON()));
        return fut;
    }

    ToolCall callTool(const std::string& toolName, const JSONValue& arguments, CallToolOptions options) {
        PendingCall call;
        call.id = nextId();
        call.promise = std::make_shared<std::promise<JSONRPCResponse>>();
        setDeadline(call, options.timeout ? options.timeout : DefaultRequestTimeout());
        call.tracked = services.tracker != nullptr;

        JSONValue::Object params;
        params["name"] = std::make_shared<JSONValue>(toolName);
        params["arguments"] = std::make_shared<JSONValue>(arguments);
        if (options.onProgress && services.progress) {
            call.progressToken = services.progress->CreateToken();
            services.progress->OnProgress(call.progressToken, std::move(options.onProgress));
            JSONValue::Object meta;
            meta["progressToken"] = std::make_shared<JSONValue>(call.progressToken);
            params["_meta"] = std::make_shared<JSONValue>(std::move(meta));
        }

        const JSONRPCId id = call.id;
        const std::string key = IdToKey(id);
        const std::string token = call.progressToken;
        std::stop_token stopToken;
        if (services.tracker) {
            stopToken = services.tracker->Register(id, name, toolName);
        }
        auto fut = registerPending(std::move(call));

        if (services.tracker) {
            // Constructed outside the lock: an already stopped token runs the callback right here
            std::weak_ptr<Impl> weak = weak_from_this();
            auto onCancel = std::make_unique<StopCallback>(stopToken, [weak, id]() {
                if (auto self = weak.lock()) {
                    self->onRequestStopped(id);
                }
            });
            std::unique_ptr<StopCallback> unused;
            {
                std::lock_guard<std::mutex> lk(mutex);
                auto it = pending.find(key);
                if (it != pending.end()) {
                    it->second.onCancel = std::move(onCancel);
                } else {
                    unused = std::move(onCancel);
                }
            }
            if (stopToken.stop_requested()) {
                LOG_DEBUG("ServerConnection '{}': {} cancelled before it was sent", name, IdToString(id));
                return ToolCall{id, std::move(fut), token};
            }
        }

        LOG_DEBUG("ServerConnection '{}': -> tools/call {} ({})", name, toolName, IdToString(id));
        JSONRPCRequest request(id, Methods::CallTool, JSONValue(std::move(params)));
        coWatchRequestSend(shared_from_this(), key, channel.Send(request.ToJSON()));
        return ToolCall{id, std::move(fut), token};
    }

    //////////////////////////////////////// Inbound ////////////////////////////////////////
    void onMessage(const JSONValue& message) {
        try {
            switch (ClassifyMessage(message)) {
                case MessageKind::Response:
                    onResponse(message);
                    break;
                case MessageKind::Notification:
                    onNotification(message);
                    break;
                case MessageKind::Request:
                    onServerRequest(message);
                    break;
                case MessageKind::Invalid:
                    LOG_WARN("ServerConnection '{}': ignoring non JSON-RPC message: {}", name, SerializeJSON(message));
                    break;
            }
        } catch (const std::exception& e) {
            LOG_ERROR("ServerConnection '{}': inbound message handling failed: {}", name, e.what());
        }
    }

    void onResponse(const JSONValue& message) {
        const JSONValue* idValue = FindMember(message, "id");
        std::optional<JSONRPCId> id = idValue ? IdFromJSON(*idValue) : std::nullopt;
        if (!id.has_value()) {
            LOG_WARN("ServerConnection '{}': response without a usable id", name);
            return;
        }
        // A cancelled error retires the request; its stop callback answers the caller
        if (services.tracker && services.tracker->HandleInbound(name, message)) {
            LOG_DEBUG("ServerConnection '{}': server reported {} as cancelled", name, IdToString(id.value()));
            return;
        }

        const std::string key = IdToKey(id.value());
        std::optional<bool> tracked;
        {
            std::lock_guard<std::mutex> lk(mutex);
            auto it = pending.find(key);
            if (it != pending.end()) {
                tracked = it->second.tracked;
            }
        }
        if (!tracked.has_value()) {
            if (services.tracker && services.tracker->IsCancelled(id.value())) {
                LOG_DEBUG("ServerConnection '{}': dropping late response for cancelled request {}", name,
                          IdToString(id.value()));
            } else {
                LOG_WARN("ServerConnection '{}': response for unknown request {}", name, IdToString(id.value()));
            }
            return;
        }
        if (tracked.value() && !services.tracker->Complete(id.value())) {
            LOG_DEBUG("ServerConnection '{}': dropping response for retired request {}", name, IdToString(id.value()));
            return;
        }

        auto call = extractPending(key);
        if (!call.has_value()) {
            return;
        }
        JSONRPCResponse response;
        if (!response.FromJSON(message)) {
            response = JSONRPCResponse(id.value(),
                CreateErrorObject(JSONRPCErrorCodes::InternalError, "Malformed response from server"), true);
        }
        LOG_DEBUG("ServerConnection '{}': <- response {}{}", name, IdToString(id.value()),
                  response.IsError() ? " (error)" : "");
        resolve(call.value(), std::move(response));
    }

    void onNotification(const JSONValue& message) {
        const std::string method = GetStringMember(message, "method").value_or("");
        const JSONValue* paramsValue = FindMember(message, "params");
        const JSONValue params = paramsValue ? *paramsValue : JSONValue(JSONValue::Object{});

        if (method == Methods::Cancelled && services.tracker) {
            if (!services.tracker->HandleInbound(name, message)) {
                LOG_DEBUG("ServerConnection '{}': cancellation for unknown request ignored", name);
            }
            return;
        }
        if (method == Methods::Progress && services.progress) {
            services.progress->HandleNotification(params);
            return;
        }
        if (method == Methods::ResourceUpdated && services.subscriptions) {
            auto uri = GetStringMember(params, "uri");
            if (!uri.has_value()) {
                LOG_WARN("ServerConnection '{}': resource update without uri", name);
                return;
            }
            services.subscriptions->HandleResourceUpdated(name, uri.value());
            return;
        }
        if (method == Methods::ResourceListChanged && services.subscriptions) {
            services.subscriptions->HandleResourceListChanged(name);
            return;
        }
        if (notificationHandler) {
            notificationHandler(method, params);
        } else {
            LOG_DEBUG("ServerConnection '{}': unhandled notification {}", name, method);
        }
    }

    // The engine answers ping and rejects any other server-initiated request
    void onServerRequest(const JSONValue& message) {
        JSONRPCRequest request;
        if (!request.FromJSON(message)) {
            LOG_WARN("ServerConnection '{}': malformed server request", name);
            return;
        }
        JSONRPCResponse response;
        if (request.method == Methods::Ping) {
            response = JSONRPCResponse(request.id, JSONValue(JSONValue::Object{}));
        } else {
            LOG_DEBUG("ServerConnection '{}': rejecting server request {}", name, request.method);
            response = JSONRPCResponse(request.id,
                CreateErrorObject(JSONRPCErrorCodes::MethodNotFound, std::format("Method not found: {}", request.method)),
                true);
        }
        coWatchSend(channel.Send(response.ToJSON()), std::format("response to {}", request.method));
    }

    //////////////////////////////////////// Deadlines ////////////////////////////////////////
    void ensureTimeouts() {
        std::lock_guard<std::mutex> lk(timeoutMutex);
        if (timeoutsRunning || timeoutsStopped) {
            return;
        }
        timeoutsRunning = true;
        timeoutThread = std::thread([this]() { timeoutLoop(); });
    }

    void timeoutLoop() {
        std::unique_lock<std::mutex> lk(timeoutMutex);
        while (timeoutsRunning) {
            timeoutCv.wait_for(lk, kTimeoutPoll, [this]() { return !timeoutsRunning; });
            if (!timeoutsRunning) {
                break;
            }
            lk.unlock();
            expireDeadlines();
            lk.lock();
        }
    }

    void stopTimeouts() {
        std::thread sweeper;
        {
            std::lock_guard<std::mutex> lk(timeoutMutex);
            timeoutsRunning = false;
            timeoutsStopped = true;
            sweeper = std::move(timeoutThread);
        }
        timeoutCv.notify_all();
        if (sweeper.joinable()) {
            if (sweeper.get_id() == std::this_thread::get_id()) {
                sweeper.detach();
            } else {
                sweeper.join();
            }
        }
    }

    void expireDeadlines() {
        const auto now = std::chrono::steady_clock::now();
        std::vector<std::pair<JSONRPCId, std::chrono::milliseconds>> trackedExpired;
        std::vector<PendingCall> expired;
        {
            std::lock_guard<std::mutex> lk(mutex);
            for (auto it = pending.begin(); it != pending.end();) {
                if (!it->second.deadline.has_value() || it->second.deadline.value() > now) {
                    ++it;
                } else if (it->second.tracked) {
                    trackedExpired.emplace_back(it->second.id, it->second.timeout);
                    ++it;
                } else {
                    expired.push_back(std::move(it->second));
                    it = pending.erase(it);
                }
            }
        }

        for (auto& call : expired) {
            LOG_WARN("ServerConnection '{}': request {} timed out", name, IdToString(call.id));
            resolve(call, JSONRPCResponse(call.id,
                CreateErrorObject(JSONRPCErrorCodes::InternalError, "Request timeout"), true));
        }

        using namespace std::chrono_literals;
        for (const auto& [id, timeout] : trackedExpired) {
            LOG_WARN("ServerConnection '{}': request {} timed out after {}ms", name, IdToString(id), timeout.count());
            // Retiring the request fires its stop callback; the notification to the server completes later
            auto result = services.tracker->TimeOut(id, std::format("Request timed out after {}ms", timeout.count()));
            if (result.wait_for(0s) == std::future_status::ready && !result.get().success) {
                auto call = extractPending(IdToKey(id));
                if (call.has_value()) {
                    resolve(call.value(), JSONRPCResponse(id,
                        errors::CreateCancellationError(std::format("timed out after {}ms", timeout.count())), true));
                }
            }
        }
    }

    //////////////////////////////////////// Handshake ////////////////////////////////////////
    static async::Task<ServerCapabilities> coHandshake(std::shared_ptr<Impl> self, Implementation clientInfo) {
        JSONValue::Object params;
        params["protocolVersion"] = std::make_shared<JSONValue>(std::string(PROTOCOL_VERSION));
        params["capabilities"] = std::make_shared<JSONValue>(JSONValue::Object{});
        JSONValue::Object ci;
        ci["name"] = std::make_shared<JSONValue>(clientInfo.name);
        ci["version"] = std::make_shared<JSONValue>(clientInfo.version);
        params["clientInfo"] = std::make_shared<JSONValue>(std::move(ci));

        LOG_INFO("Initializing MCP session with '{}' (pid {})", self->name, self->channel.Pid());
        JSONRPCResponse response = co_await async::makeFutureAwaitable(
            self->sendRequest(Methods::Initialize, JSONValue(std::move(params)), std::nullopt));
        if (response.IsError() || !response.result.has_value()) {
            auto err = errors::mcpErrorFromResponse(response);
            const std::string detail = err.has_value()
                ? std::format("{} ({})", err->message, err->code) : std::string("missing result");
            LOG_ERROR("Initialize with '{}' failed: {}", self->name, detail);
            throw std::runtime_error(std::format("initialize rejected by '{}': {}", self->name, detail));
        }

        const JSONValue& result = response.result.value();
        ServerCapabilities caps;
        if (const JSONValue* c = FindMember(result, "capabilities")) {
            caps = ParseServerCapabilities(*c);
        }
        std::optional<Implementation> info;
        if (const JSONValue* si = FindMember(result, "serverInfo")) {
            info = Implementation(GetStringMember(*si, "name").value_or(""), GetStringMember(*si, "version").value_or(""));
        }
        {
            std::lock_guard<std::mutex> lk(self->mutex);
            self->capabilities = caps;
            self->serverInfo = info;
        }

        co_await async::makeFutureAwaitable(self->channel.Send(JSONRPCNotification(Methods::Initialized).ToJSON()));
        self->initialized.store(true);
        LOG_INFO("Connected to '{}'{} (subscriptions {})", self->name,
                 info.has_value() ? std::format(" ({} {})", info->name, info->version) : std::string(),
                 caps.supportsSubscriptions() ? "supported" : "unsupported");
        co_return caps;
    }

    static async::Task<ServerCapabilities> coConnect(std::shared_ptr<Impl> self, ProcessConfig config,
                                                     Implementation clientInfo) {
        if (clientInfo.name.empty()) {
            clientInfo = Implementation(CLIENT_NAME, getVersionString());
        }
        co_await async::makeFutureAwaitable(self->channel.Start(config));

        std::exception_ptr failure;
        ServerCapabilities caps;
        try {
            caps = co_await async::makeFutureAwaitable(coHandshake(self, std::move(clientInfo)).toFuture());
        } catch (const std::exception& e) {
            LOG_ERROR("Handshake with '{}' failed: {}", self->name, e.what());
            failure = std::current_exception();
        }
        if (failure) {
            self->close().get();
            std::rethrow_exception(failure);
        }
        co_return caps;
    }

    static async::Task<errors::Outcome> coSendOutbound(std::shared_ptr<Impl> self, std::string method, JSONValue params) {
        if (method.rfind("notifications/", 0) == 0) {
            try {
                co_await async::makeFutureAwaitable(self->channel.Send(JSONRPCNotification(method, params).ToJSON()));
            } catch (const std::exception& e) {
                co_return errors::Outcome::Fail(errors::OutcomeCode::SendFailed, e.what());
            }
            co_return errors::Outcome::Ok();
        }

        JSONRPCResponse response;
        try {
            response = co_await async::makeFutureAwaitable(self->sendRequest(method, params, std::nullopt));
        } catch (const std::exception& e) {
            co_return errors::Outcome::Fail(errors::OutcomeCode::SendFailed, e.what());
        }
        if (response.IsError()) {
            auto err = errors::mcpErrorFromResponse(response);
            co_return errors::Outcome::Fail(errors::OutcomeCode::RemoteError,
                err.has_value() ? err->message : SerializeJSON(response.error.value()));
        }
        co_return errors::Outcome::Ok();
    }

    std::future<void> close() {
        initialized.store(false);
        auto closed = channel.Close();
        failAllPending(errors::TransportErrc::Closed, std::format("connection to '{}' closed", name));
        stopTimeouts();
        return closed;
    }
};

ServerConnection::ServerConnection(std::string name, ConnectionServices services)
    : pImpl(std::make_shared<Impl>(std::move(name), std::move(services))) {}

ServerConnection::~ServerConnection() {
    if (pImpl) {
        try {
            pImpl->close().get();
        } catch (const std::exception& e) {
            LOG_ERROR("ServerConnection '{}': close during destruction failed: {}", pImpl->name, e.what());
        }
    }
}

std::future<ServerCapabilities> ServerConnection::Connect(const ProcessConfig& config, Implementation clientInfo) {
    FUNC_SCOPE();
    return Impl::coConnect(pImpl, config, std::move(clientInfo)).toFuture();
}

std::future<void> ServerConnection::Close() {
    FUNC_SCOPE();
    LOG_INFO("Closing connection to '{}'", pImpl->name);
    return pImpl->close();
}

std::future<JSONRPCResponse> ServerConnection::SendRequest(const std::string& method, std::optional<JSONValue> params,
                                                           std::optional<std::chrono::milliseconds> timeout) {
    return pImpl->sendRequest(method, std::move(params), timeout);
}

std::future<void> ServerConnection::SendNotification(const std::string& method, std::optional<JSONValue> params) {
    return pImpl->channel.Send(JSONRPCNotification(method, std::move(params)).ToJSON());
}

ToolCall ServerConnection::CallTool(const std::string& toolName, const JSONValue& arguments, CallToolOptions options) {
    return pImpl->callTool(toolName, arguments, std::move(options));
}

std::future<errors::Outcome> ServerConnection::SendOutbound(const std::string& method, const JSONValue& params) {
    return Impl::coSendOutbound(pImpl, method, params).toFuture();
}

const std::string& ServerConnection::Name() const { return pImpl->name; }
bool ServerConnection::IsConnected() const { return pImpl->channel.IsConnected(); }
bool ServerConnection::IsInitialized() const { return pImpl->initialized.load() && pImpl->channel.IsConnected(); }
int ServerConnection::Pid() const { return pImpl->channel.Pid(); }
std::optional<int> ServerConnection::ExitCode() const { return pImpl->channel.ExitCode(); }

ServerCapabilities ServerConnection::Capabilities() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->capabilities;
}

std::optional<Implementation> ServerConnection::ServerInfo() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->serverInfo;
}

std::size_t ServerConnection::PendingRequestCount() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->pending.size();
}

void ServerConnection::SetNotificationHandler(NotificationHandler handler) { pImpl->notificationHandler = std::move(handler); }
void ServerConnection::SetCloseHandler(CloseHandler handler) { pImpl->closeHandler = std::move(handler); }
void ServerConnection::SetErrorHandler(ErrorHandler handler) { pImpl->errorHandler = std::move(handler); }

} // namespace mcpio
