//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProgressTracker.h
// Purpose: Correlates notifications/progress with the progress tokens attached to outgoing requests
//==========================================================================================================
#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcpio/GraceWindow.h"
#include "mcpio/JSONRPCTypes.h"

namespace mcpio {

//==========================================================================================================
// ProgressUpdate
// Fields:
//   token: Progress token the update belongs to (integer tokens are kept in decimal form).
//   progress: Fraction in [0, 1].
//   total/current: Item counts; current = floor(progress * total) when total is reported.
//   message: Optional status text from the server.
//==========================================================================================================
struct ProgressUpdate {
    std::string token;
    double progress{0.0};
    std::optional<double> total;
    std::optional<int64_t> current;
    std::optional<std::string> message;
    std::chrono::system_clock::time_point timestamp;
};

struct ProgressFormatOptions {
    int width{30};
    bool showPercentage{true};
    bool showCount{true};
    bool showMessage{true};
};

// "[█████░░░░░] 50% (5/10)" followed by the message on its own line when present
std::string FormatProgress(const ProgressUpdate& update, const ProgressFormatOptions& options = {});
// "850ms", "42s", "3m 5s"
std::string FormatElapsedTime(std::chrono::milliseconds elapsed);

//==========================================================================================================
// ProgressTracker
// Purpose: Dispatches progress updates to the callback registered for their token and to a global
//          handler. After Cleanup() a token's last update stays queryable for the retention window and
//          late notifications for it are ignored.
// Notes:
//   Thread-safe. Callbacks run outside the tracker lock.
//==========================================================================================================
class ProgressTracker {
public:
    using Callback = std::function<void(const ProgressUpdate& update)>;
    using Clock = GraceWindow::Clock;

    struct Options {
        std::chrono::milliseconds retention{5000};
        Clock clock; // steady_clock::now when empty
    };

    ProgressTracker();
    explicit ProgressTracker(Options options);

    // Unique token suitable for _meta.progressToken
    std::string CreateToken();

    void OnProgress(const std::string& token, Callback callback);
    void SetProgressHandler(Callback handler);

    //==========================================================================================================
    // HandleNotification
    // Purpose: Applies the params of a notifications/progress message.
    // Returns:
    //   false when the params are malformed or the token was cleaned up recently.
    //==========================================================================================================
    bool HandleNotification(const JSONValue& params);

    std::optional<ProgressUpdate> GetLastUpdate(const std::string& token);
    std::optional<std::chrono::milliseconds> GetElapsedTime(const std::string& token);
    // elapsed / progress - elapsed; nullopt before any progress or once complete
    std::optional<std::chrono::milliseconds> EstimateRemainingTime(const std::string& token);
    bool IsTracking(const std::string& token);
    std::vector<std::string> GetActiveTokens();

    void Cleanup(const std::string& token);
    void CleanupAll();

private:
    std::chrono::steady_clock::time_point now() const;
    void sweepLocked();

    Clock clock;
    std::mutex mutex;
    std::unordered_map<std::string, Callback> callbacks;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> startTimes;
    std::unordered_map<std::string, ProgressUpdate> lastUpdates;
    GraceWindow cleanedUp;
    Callback globalHandler;
    uint64_t tokenCounter{0};
    std::string tokenPrefix;
};

} // namespace mcpio
