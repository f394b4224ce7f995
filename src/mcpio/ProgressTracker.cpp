//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProgressTracker.cpp
// Purpose: Progress token bookkeeping and text rendering of progress updates
//==========================================================================================================

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <random>

#include "logging/Logger.h"
#include "mcpio/ProgressTracker.h"

namespace mcpio {

namespace {
std::optional<std::string> tokenFromJSON(const JSONValue& value) {
    if (const auto* s = std::get_if<std::string>(&value.value)) {
        return *s;
    }
    if (const auto* i = std::get_if<int64_t>(&value.value)) {
        return std::to_string(*i);
    }
    return std::nullopt;
}
} // namespace

ProgressTracker::ProgressTracker() : ProgressTracker(Options{}) {}

ProgressTracker::ProgressTracker(Options options)
    : clock(options.clock), cleanedUp(options.retention, options.clock) {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    tokenPrefix = std::format("progress-{:016x}-", gen());
}

std::chrono::steady_clock::time_point ProgressTracker::now() const {
    return clock ? clock() : std::chrono::steady_clock::now();
}

void ProgressTracker::sweepLocked() {
    for (const auto& token : cleanedUp.Sweep()) {
        lastUpdates.erase(token);
    }
}

std::string ProgressTracker::CreateToken() {
    std::lock_guard<std::mutex> lk(mutex);
    return tokenPrefix + std::to_string(++tokenCounter);
}

void ProgressTracker::OnProgress(const std::string& token, Callback callback) {
    std::lock_guard<std::mutex> lk(mutex);
    sweepLocked();
    cleanedUp.Remove(token);
    callbacks[token] = std::move(callback);
    startTimes[token] = now();
}

void ProgressTracker::SetProgressHandler(Callback handler) {
    std::lock_guard<std::mutex> lk(mutex);
    globalHandler = std::move(handler);
}

bool ProgressTracker::HandleNotification(const JSONValue& params) {
    const JSONValue* tokenValue = FindMember(params, "progressToken");
    std::optional<std::string> token = tokenValue ? tokenFromJSON(*tokenValue) : std::nullopt;
    std::optional<double> progress = GetNumberMember(params, "progress");
    if (!token || !progress) {
        LOG_WARN("ProgressTracker: ignoring malformed progress notification: {}", SerializeJSON(params));
        return false;
    }

    ProgressUpdate update;
    update.token = *token;
    update.progress = std::clamp(*progress, 0.0, 1.0);
    update.total = GetNumberMember(params, "total");
    if (update.total) {
        const double scaled = std::floor(update.progress * *update.total);
        // 2^63 is exact as a double; anything at or beyond it does not fit int64_t
        constexpr double kLimit = static_cast<double>(std::numeric_limits<int64_t>::max());
        if (std::isfinite(scaled) && scaled >= -kLimit && scaled < kLimit) {
            update.current = static_cast<int64_t>(scaled);
        } else {
            LOG_WARN("ProgressTracker: total {} out of range for token {}", *update.total, update.token);
        }
    }
    update.message = GetStringMember(params, "message");
    update.timestamp = std::chrono::system_clock::now();

    Callback callback;
    Callback global;
    {
        std::lock_guard<std::mutex> lk(mutex);
        sweepLocked();
        if (cleanedUp.Contains(*token)) {
            LOG_DEBUG("ProgressTracker: late progress for finished token {}", *token);
            return false;
        }
        // Only tracked tokens keep their last update; unknown ones reach the global handler alone
        auto it = callbacks.find(*token);
        if (it != callbacks.end()) {
            lastUpdates[*token] = update;
            callback = it->second;
        }
        global = globalHandler;
    }

    try {
        if (callback) {
            callback(update);
        }
        if (global) {
            global(update);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("ProgressTracker: progress callback threw: {}", e.what());
    }
    return true;
}

std::optional<ProgressUpdate> ProgressTracker::GetLastUpdate(const std::string& token) {
    std::lock_guard<std::mutex> lk(mutex);
    sweepLocked();
    auto it = lastUpdates.find(token);
    if (it == lastUpdates.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::chrono::milliseconds> ProgressTracker::GetElapsedTime(const std::string& token) {
    std::lock_guard<std::mutex> lk(mutex);
    auto it = startTimes.find(token);
    if (it == startTimes.end()) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(now() - it->second);
}

std::optional<std::chrono::milliseconds> ProgressTracker::EstimateRemainingTime(const std::string& token) {
    std::optional<std::chrono::milliseconds> elapsed = GetElapsedTime(token);
    std::optional<ProgressUpdate> update = GetLastUpdate(token);
    if (!elapsed || elapsed->count() <= 0 || !update || update->progress <= 0.0 || update->progress >= 1.0) {
        return std::nullopt;
    }
    const double totalEstimate = static_cast<double>(elapsed->count()) / update->progress;
    const double remaining = std::max(0.0, totalEstimate - static_cast<double>(elapsed->count()));
    return std::chrono::milliseconds(static_cast<int64_t>(remaining));
}

bool ProgressTracker::IsTracking(const std::string& token) {
    std::lock_guard<std::mutex> lk(mutex);
    return callbacks.count(token) > 0;
}

std::vector<std::string> ProgressTracker::GetActiveTokens() {
    std::lock_guard<std::mutex> lk(mutex);
    std::vector<std::string> tokens;
    tokens.reserve(callbacks.size());
    for (const auto& [token, cb] : callbacks) {
        tokens.push_back(token);
    }
    return tokens;
}

void ProgressTracker::Cleanup(const std::string& token) {
    std::lock_guard<std::mutex> lk(mutex);
    sweepLocked();
    callbacks.erase(token);
    startTimes.erase(token);
    cleanedUp.Arm(token);
}

void ProgressTracker::CleanupAll() {
    std::lock_guard<std::mutex> lk(mutex);
    callbacks.clear();
    startTimes.clear();
    lastUpdates.clear();
    cleanedUp.Clear();
}

std::string FormatProgress(const ProgressUpdate& update, const ProgressFormatOptions& options) {
    const double fraction = std::clamp(update.progress, 0.0, 1.0);
    const int width = std::max(0, options.width);
    const int percentage = static_cast<int>(std::floor(fraction * 100.0));
    const int filled = static_cast<int>(std::floor(fraction * width));

    std::string result = "[";
    for (int i = 0; i < filled; ++i) {
        result += "█";
    }
    for (int i = filled; i < width; ++i) {
        result += "░";
    }
    result += "]";

    if (options.showPercentage) {
        result += std::format(" {}%", percentage);
    }
    if (options.showCount && update.total && update.current) {
        result += std::format(" ({}/{})", *update.current, *update.total);
    }
    if (options.showMessage && update.message && !update.message->empty()) {
        result += "\n" + *update.message;
    }
    return result;
}

std::string FormatElapsedTime(std::chrono::milliseconds elapsed) {
    const auto ms = elapsed.count();
    if (ms < 1000) {
        return std::format("{}ms", ms);
    }
    const auto seconds = ms / 1000;
    if (seconds < 60) {
        return std::format("{}s", seconds);
    }
    return std::format("{}m {}s", seconds / 60, seconds % 60);
}

} // namespace mcpio
