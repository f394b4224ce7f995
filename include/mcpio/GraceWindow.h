//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GraceWindow.h
// Purpose: Time-bounded set of keys backed by one monotonic clock and a min-heap of expirations
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcpio {

//==========================================================================================================
// GraceWindow
// Purpose: Remembers keys for a fixed window after they were last armed. No timer exists per key:
//          queries compare against the clock, and only Sweep() removes expired keys, returning them
//          so the owner can drop whatever it keeps alongside.
// Notes:
//   Re-arming a key bumps its generation; the older heap entry is skipped when it surfaces.
//   Not thread-safe; owners serialize access.
//==========================================================================================================
class GraceWindow {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit GraceWindow(std::chrono::milliseconds window, Clock clock = {});

    // Adds the key, or restarts its window when already present
    void Arm(const std::string& key);
    bool Contains(const std::string& key) const;
    bool Remove(const std::string& key);

    // Drops expired keys and returns them
    std::vector<std::string> Sweep();

    std::size_t Size() const;
    void Clear();
    std::chrono::milliseconds Window() const { return window; }

private:
    struct Expiry {
        std::chrono::steady_clock::time_point at;
        uint64_t generation;
        std::string key;
    };
    struct Entry {
        uint64_t generation;
        std::chrono::steady_clock::time_point at;
    };
    struct Later {
        bool operator()(const Expiry& a, const Expiry& b) const { return a.at > b.at; }
    };

    std::chrono::steady_clock::time_point now() const;

    std::chrono::milliseconds window;
    Clock clock;
    std::priority_queue<Expiry, std::vector<Expiry>, Later> heap;
    std::unordered_map<std::string, Entry> live; // key -> its current expiry
    uint64_t nextGeneration{0};
};

} // namespace mcpio
