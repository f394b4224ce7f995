//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FutureAwaitable.h
// Purpose: co_await support for std::future inside mcpio::async::Task coroutines
//==========================================================================================================

#pragma once

#include <chrono>
#include <coroutine>
#include <future>
#include <thread>
#include <type_traits>
#include <utility>

namespace mcpio {
namespace async {

//==========================================================================================================
// FutureAwaitable<T>
// Purpose: Suspends a coroutine on a std::future.
// Notes:
//   A future that is already ready resumes inline on the awaiting thread. Otherwise a detached waiter
//   thread blocks on the future and resumes the coroutine itself, so the code after co_await runs on
//   that waiter thread. Exceptions stored in the future are rethrown from await_resume().
//   Futures fulfilled on a channel's I/O thread therefore never resume coroutines on that thread unless
//   they were ready before the co_await.
//==========================================================================================================
template <typename T>
class FutureAwaitable {
public:
    explicit FutureAwaitable(std::future<T>&& f) : fut(std::move(f)) {}

    bool await_ready() const noexcept {
        return fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    void await_suspend(std::coroutine_handle<> handle) {
        std::thread([this, handle]() {
            fut.wait();
            handle.resume();
        }).detach();
    }

    T await_resume() {
        if constexpr (std::is_void_v<T>) {
            fut.get();
        } else {
            return fut.get();
        }
    }

private:
    std::future<T> fut;
};

template <typename T>
inline FutureAwaitable<T> makeFutureAwaitable(std::future<T>&& fut) {
    return FutureAwaitable<T>(std::move(fut));
}

} // namespace async
} // namespace mcpio
