//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GraceWindow.cpp
// Purpose: Lazy-sweep expiry set
//==========================================================================================================

#include "mcpio/GraceWindow.h"

namespace mcpio {

GraceWindow::GraceWindow(std::chrono::milliseconds window, Clock clock)
    : window(window), clock(std::move(clock)) {}

std::chrono::steady_clock::time_point GraceWindow::now() const {
    return clock ? clock() : std::chrono::steady_clock::now();
}

void GraceWindow::Arm(const std::string& key) {
    const uint64_t generation = ++nextGeneration;
    const auto at = now() + window;
    live[key] = Entry{generation, at};
    heap.push(Expiry{at, generation, key});
}

bool GraceWindow::Contains(const std::string& key) const {
    auto it = live.find(key);
    return it != live.end() && it->second.at > now();
}

bool GraceWindow::Remove(const std::string& key) {
    // The heap entry stays behind and is discarded when it expires
    return live.erase(key) > 0;
}

std::vector<std::string> GraceWindow::Sweep() {
    std::vector<std::string> expired;
    const auto t = now();
    while (!heap.empty() && heap.top().at <= t) {
        const Expiry& top = heap.top();
        auto it = live.find(top.key);
        if (it != live.end() && it->second.generation == top.generation) {
            expired.push_back(top.key);
            live.erase(it);
        }
        heap.pop();
    }
    return expired;
}

std::size_t GraceWindow::Size() const {
    const auto t = now();
    std::size_t count = 0;
    for (const auto& [key, entry] : live) {
        if (entry.at > t) {
            ++count;
        }
    }
    return count;
}

void GraceWindow::Clear() {
    live.clear();
    heap = {};
}

} // namespace mcpio
