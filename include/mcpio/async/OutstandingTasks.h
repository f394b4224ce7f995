//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OutstandingTasks.h
// Purpose: Counts coroutines that still use their owner so the owner can outlive them
//==========================================================================================================

#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace mcpio {
namespace async {

//==========================================================================================================
// OutstandingTasks
// Purpose: Lets an object that starts member coroutines wait for them before it is destroyed.
// Notes:
//   A member coroutine takes a Guard as its first statement and holds it until it returns; because
//   Task is eager the guard exists before the caller receives the future. The owner's destructor calls
//   WaitIdle(). A guard must never be released from inside that destructor's own call chain.
//==========================================================================================================
class OutstandingTasks {
public:
    class Guard {
    public:
        explicit Guard(OutstandingTasks* owner) : owner(owner) {}
        Guard(Guard&& other) noexcept : owner(other.owner) { other.owner = nullptr; }
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard& operator=(Guard&&) = delete;
        ~Guard() {
            if (owner) {
                owner->leave();
            }
        }

    private:
        OutstandingTasks* owner;
    };

    Guard Enter() {
        std::lock_guard<std::mutex> lk(mutex);
        ++count;
        return Guard(this);
    }

    // Blocks until every guard has been released
    void WaitIdle() {
        std::unique_lock<std::mutex> lk(mutex);
        idle.wait(lk, [this]() { return count == 0; });
    }

    std::size_t Count() {
        std::lock_guard<std::mutex> lk(mutex);
        return count;
    }

private:
    void leave() {
        // Notify under the lock: WaitIdle() cannot return, and the owner cannot be destroyed, before unlock
        std::lock_guard<std::mutex> lk(mutex);
        --count;
        idle.notify_all();
    }

    std::mutex mutex;
    std::condition_variable idle;
    std::size_t count{0};
};

} // namespace async
} // namespace mcpio
