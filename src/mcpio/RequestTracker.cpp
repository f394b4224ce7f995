//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestTracker.cpp
// Purpose: Pending-request bookkeeping, local/remote cancellation and the recently-cancelled window
//==========================================================================================================

#include <algorithm>
#include <format>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpio/Protocol.h"
#include "mcpio/RequestTracker.h"
#include "mcpio/async/FutureAwaitable.h"

namespace mcpio {

namespace {
constexpr const char* kNotFound = "Request not found or already completed";
constexpr std::chrono::milliseconds kDefaultGraceWindow{5000};
} // namespace

std::chrono::milliseconds DefaultCancelGraceWindow() {
    const std::string raw = GetEnvOrDefault("MCPIO_CANCEL_GRACE_MS", "");
    if (raw.empty()) {
        return kDefaultGraceWindow;
    }
    auto v = GetEnvUInt64("MCPIO_CANCEL_GRACE_MS");
    if (!v.has_value()) {
        LOG_WARN("Ignoring malformed MCPIO_CANCEL_GRACE_MS='{}'", raw);
        return kDefaultGraceWindow;
    }
    return std::chrono::milliseconds(v.value());
}

const char* requestStateName(RequestState state) {
    switch (state) {
        case RequestState::Pending: return "pending";
        case RequestState::Completed: return "completed";
        case RequestState::Cancelled: return "cancelled";
        case RequestState::TimedOut: return "timed-out";
    }
    return "unknown";
}

RequestTracker::RequestTracker() : RequestTracker(Options{}) {}

RequestTracker::RequestTracker(Options options)
    : clock(options.clock), grace(options.graceWindow, options.clock) {}

RequestTracker::~RequestTracker() {
    tasks.WaitIdle();
}

void RequestTracker::SetOutboundSender(OutboundSender sender) {
    std::lock_guard<std::mutex> lk(mutex);
    outboundSender = std::move(sender);
}

void RequestTracker::SetRequestRegisteredHandler(RequestRegisteredHandler handler) {
    std::lock_guard<std::mutex> lk(mutex);
    registeredHandler = std::move(handler);
}

void RequestTracker::SetRequestCancelledHandler(RequestCancelledHandler handler) {
    std::lock_guard<std::mutex> lk(mutex);
    cancelledHandler = std::move(handler);
}

std::chrono::steady_clock::time_point RequestTracker::now() const {
    return clock ? clock() : std::chrono::steady_clock::now();
}

void RequestTracker::sweepLocked() {
    for (const auto& key : grace.Sweep()) {
        retired.erase(key);
    }
}

std::stop_token RequestTracker::Register(const JSONRPCId& id, const std::string& serverName,
                                         const std::string& toolName) {
    RequestInfo info;
    RequestRegisteredHandler handler;
    std::stop_token token;
    {
        std::lock_guard<std::mutex> lk(mutex);
        sweepLocked();
        const std::string key = IdToKey(id);
        auto it = pending.find(key);
        if (it != pending.end()) {
            LOG_WARN("RequestTracker: request {} is already pending on '{}'; keeping the existing entry",
                     IdToString(id), it->second.info.serverName);
            return it->second.stopSource.get_token();
        }
        // A reused id starts fresh
        grace.Remove(key);
        retired.erase(key);

        PendingRequest req;
        req.info = RequestInfo{id, serverName, toolName, now()};
        req.sequence = ++sequence;
        token = req.stopSource.get_token();
        info = req.info;
        pending.emplace(key, std::move(req));
        handler = registeredHandler;
    }
    LOG_DEBUG("RequestTracker: registered {} ({} on '{}')", IdToString(id), toolName, serverName);
    if (handler) {
        try {
            handler(info);
        } catch (const std::exception& e) {
            LOG_ERROR("RequestTracker: registered handler threw: {}", e.what());
        }
    }
    return token;
}

std::optional<RequestTracker::PendingRequest> RequestTracker::claim(const JSONRPCId& id, RequestState terminal) {
    std::lock_guard<std::mutex> lk(mutex);
    sweepLocked();
    const std::string key = IdToKey(id);
    auto it = pending.find(key);
    if (it == pending.end()) {
        return std::nullopt;
    }
    PendingRequest req = std::move(it->second);
    pending.erase(it);
    grace.Arm(key);
    retired[key] = terminal;
    return req;
}

std::future<errors::CancellationResult> RequestTracker::Cancel(const JSONRPCId& id, std::optional<std::string> reason) {
    return coCancel(id, std::move(reason), RequestState::Cancelled).toFuture();
}

std::future<errors::CancellationResult> RequestTracker::TimeOut(const JSONRPCId& id, std::optional<std::string> reason) {
    return coCancel(id, std::move(reason), RequestState::TimedOut).toFuture();
}

async::Task<errors::CancellationResult> RequestTracker::coCancel(JSONRPCId id, std::optional<std::string> reason,
                                                                 RequestState terminal) {
    auto scope = tasks.Enter();
    auto claimed = claim(id, terminal);
    if (!claimed.has_value()) {
        LOG_DEBUG("RequestTracker: cancel of {} ignored: {}", IdToString(id), kNotFound);
        co_return errors::CancellationResult{false, id, reason, std::string(kNotFound)};
    }

    // Local abort is authoritative and visible before any suspension
    claimed->stopSource.request_stop();
    LOG_INFO("RequestTracker: {} request {} ({} on '{}'){}", requestStateName(terminal), IdToString(id),
             claimed->info.toolName, claimed->info.serverName, reason ? std::format(": {}", *reason) : std::string());

    RequestCancelledHandler handler;
    OutboundSender sender;
    {
        std::lock_guard<std::mutex> lk(mutex);
        handler = cancelledHandler;
        sender = outboundSender;
    }
    if (handler) {
        try {
            handler(claimed->info, reason, terminal);
        } catch (const std::exception& e) {
            LOG_ERROR("RequestTracker: cancelled handler threw: {}", e.what());
        }
    }

    if (sender) {
        JSONValue::Object params;
        params["requestId"] = std::make_shared<JSONValue>(IdToJSON(id));
        if (reason.has_value()) {
            params["reason"] = std::make_shared<JSONValue>(reason.value());
        }
        try {
            errors::Outcome outcome = co_await async::makeFutureAwaitable(
                sender(claimed->info.serverName, Methods::Cancelled, JSONValue(std::move(params))));
            if (!outcome.success) {
                LOG_WARN("RequestTracker: cancel notification for {} to '{}' not delivered ({}): {}", IdToString(id),
                         claimed->info.serverName, errors::outcomeCodeName(outcome.code), outcome.message);
            }
        } catch (const std::exception& e) {
            LOG_WARN("RequestTracker: cancel notification for {} to '{}' failed: {}", IdToString(id),
                     claimed->info.serverName, e.what());
        }
    }

    Cleanup(id);
    co_return errors::CancellationResult{true, id, reason, std::nullopt};
}

std::future<std::vector<errors::CancellationResult>> RequestTracker::CancelAll(std::optional<std::string> reason) {
    std::vector<JSONRPCId> ids;
    {
        std::lock_guard<std::mutex> lk(mutex);
        for (const auto& [key, req] : pending) {
            ids.push_back(req.info.requestId);
        }
    }
    LOG_INFO("RequestTracker: cancelling all {} pending requests", ids.size());
    return coCancelMany(std::move(ids), std::move(reason)).toFuture();
}

std::future<std::vector<errors::CancellationResult>> RequestTracker::CancelByServer(const std::string& serverName,
                                                                                    std::optional<std::string> reason) {
    std::vector<JSONRPCId> ids;
    {
        std::lock_guard<std::mutex> lk(mutex);
        for (const auto& [key, req] : pending) {
            if (req.info.serverName == serverName) {
                ids.push_back(req.info.requestId);
            }
        }
    }
    LOG_INFO("RequestTracker: cancelling {} pending requests for '{}'", ids.size(), serverName);
    return coCancelMany(std::move(ids), std::move(reason)).toFuture();
}

async::Task<std::vector<errors::CancellationResult>> RequestTracker::coCancelMany(std::vector<JSONRPCId> ids,
                                                                                  std::optional<std::string> reason) {
    auto scope = tasks.Enter();
    // Start every cancel before awaiting any of them
    std::vector<std::pair<JSONRPCId, std::optional<std::future<errors::CancellationResult>>>> inFlight;
    std::vector<std::optional<errors::CancellationResult>> early(ids.size());
    inFlight.reserve(ids.size());
    for (std::size_t i = 0; i < ids.size(); ++i) {
        try {
            inFlight.emplace_back(ids[i], Cancel(ids[i], reason));
        } catch (const std::exception& e) {
            inFlight.emplace_back(ids[i], std::nullopt);
            early[i] = errors::CancellationResult{false, ids[i], reason, std::string(e.what())};
        }
    }

    std::vector<errors::CancellationResult> results;
    results.reserve(ids.size());
    for (std::size_t i = 0; i < inFlight.size(); ++i) {
        if (early[i].has_value()) {
            results.push_back(std::move(early[i].value()));
            continue;
        }
        try {
            results.push_back(co_await async::makeFutureAwaitable(std::move(inFlight[i].second.value())));
        } catch (const std::exception& e) {
            results.push_back(errors::CancellationResult{false, inFlight[i].first, reason, std::string(e.what())});
        }
    }
    co_return results;
}

errors::CancellationResult RequestTracker::CancelFromRemote(const JSONRPCId& id, std::optional<std::string> reason) {
    auto claimed = claim(id, RequestState::Cancelled);
    if (!claimed.has_value()) {
        return errors::CancellationResult{false, id, reason, std::string(kNotFound)};
    }
    claimed->stopSource.request_stop();
    LOG_INFO("RequestTracker: server '{}' cancelled request {}{}", claimed->info.serverName, IdToString(id),
             reason ? std::format(": {}", *reason) : std::string());

    RequestCancelledHandler handler;
    {
        std::lock_guard<std::mutex> lk(mutex);
        handler = cancelledHandler;
    }
    if (handler) {
        try {
            handler(claimed->info, reason, RequestState::Cancelled);
        } catch (const std::exception& e) {
            LOG_ERROR("RequestTracker: cancelled handler threw: {}", e.what());
        }
    }
    Cleanup(id);
    return errors::CancellationResult{true, id, reason, std::nullopt};
}

bool RequestTracker::HandleInbound(const std::string& serverName, const JSONValue& message) {
    std::optional<JSONRPCId> id;
    std::optional<std::string> reason;

    switch (ClassifyMessage(message)) {
        case MessageKind::Notification: {
            const JSONValue* params = FindMember(message, "params");
            if (!params) {
                return false;
            }
            const std::string method = GetStringMember(message, "method").value_or("");
            if (method != Methods::Cancelled && !errors::IsRequestCancelledError(*params)) {
                return false;
            }
            if (const JSONValue* rid = FindMember(*params, "requestId")) {
                id = IdFromJSON(*rid);
            }
            reason = GetStringMember(*params, "reason");
            if (!reason.has_value()) {
                reason = GetStringMember(*params, "message");
            }
            break;
        }
        case MessageKind::Response: {
            const JSONValue* error = FindMember(message, "error");
            if (!error || !errors::IsRequestCancelledError(*error)) {
                return false;
            }
            id = IdFromJSON(*FindMember(message, "id"));
            reason = GetStringMember(*error, "message");
            break;
        }
        default:
            return false;
    }

    if (!id.has_value()) {
        LOG_DEBUG("RequestTracker: cancellation from '{}' without a usable request id", serverName);
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = pending.find(IdToKey(id.value()));
        if (it == pending.end()) {
            return false;
        }
        if (it->second.info.serverName != serverName) {
            LOG_WARN("RequestTracker: '{}' tried to cancel request {} owned by '{}'", serverName,
                     IdToString(id.value()), it->second.info.serverName);
            return false;
        }
    }
    return CancelFromRemote(id.value(), reason).success;
}

bool RequestTracker::Complete(const JSONRPCId& id) {
    std::lock_guard<std::mutex> lk(mutex);
    sweepLocked();
    auto it = pending.find(IdToKey(id));
    if (it == pending.end()) {
        return false;
    }
    pending.erase(it);
    return true;
}

std::optional<RequestState> RequestTracker::GetState(const JSONRPCId& id) {
    std::lock_guard<std::mutex> lk(mutex);
    sweepLocked();
    const std::string key = IdToKey(id);
    if (pending.count(key) > 0) {
        return RequestState::Pending;
    }
    auto it = retired.find(key);
    if (it != retired.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool RequestTracker::IsCancelled(const JSONRPCId& id) {
    std::lock_guard<std::mutex> lk(mutex);
    sweepLocked();
    return grace.Contains(IdToKey(id));
}

void RequestTracker::Cleanup(const JSONRPCId& id) {
    std::lock_guard<std::mutex> lk(mutex);
    sweepLocked();
    const std::string key = IdToKey(id);
    pending.erase(key);
    if (grace.Contains(key)) {
        grace.Arm(key);
    }
}

void RequestTracker::CleanupAll() {
    std::lock_guard<std::mutex> lk(mutex);
    LOG_DEBUG("RequestTracker: clearing {} pending and {} recently cancelled ids", pending.size(), retired.size());
    pending.clear();
    retired.clear();
    grace.Clear();
}

std::vector<RequestInfo> RequestTracker::GetActiveRequests() {
    std::lock_guard<std::mutex> lk(mutex);
    std::vector<const PendingRequest*> ordered;
    ordered.reserve(pending.size());
    for (const auto& [key, req] : pending) {
        ordered.push_back(&req);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const PendingRequest* a, const PendingRequest* b) { return a->sequence < b->sequence; });
    std::vector<RequestInfo> out;
    out.reserve(ordered.size());
    for (const PendingRequest* req : ordered) {
        out.push_back(req->info);
    }
    return out;
}

std::optional<RequestInfo> RequestTracker::GetMostRecentRequest() {
    std::lock_guard<std::mutex> lk(mutex);
    const PendingRequest* latest = nullptr;
    for (const auto& [key, req] : pending) {
        if (!latest || req.sequence > latest->sequence) {
            latest = &req;
        }
    }
    if (!latest) {
        return std::nullopt;
    }
    return latest->info;
}

bool RequestTracker::HasActiveRequests() {
    std::lock_guard<std::mutex> lk(mutex);
    return !pending.empty();
}

std::size_t RequestTracker::GetActiveRequestCount() {
    std::lock_guard<std::mutex> lk(mutex);
    return pending.size();
}

} // namespace mcpio
