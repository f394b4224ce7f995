//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Task.h
// Purpose: Eager coroutine Task type bridging to std::future, plus ready-future helpers
//==========================================================================================================

#pragma once

#include <coroutine>
#include <concepts>
#include <exception>
#include <future>
#include <type_traits>
#include <utility>

namespace mcpio {
namespace async {

//==========================================================================================================
// Task<T>
// Purpose: Coroutine return type. The body starts running immediately on the calling thread and the
//          result (or exception) is published through a std::future.
// Usage: Task<T> foo() { co_return value; } -> foo().toFuture()
//==========================================================================================================
template <typename T>
class Task {
public:
    using value_type = T;

    struct promise_type {
        std::promise<T> promise;
        Task get_return_object() noexcept { return Task{ promise.get_future() }; }
        std::suspend_never initial_suspend() noexcept { return {}; }
        std::suspend_never final_suspend() noexcept { return {}; }
        void unhandled_exception() { promise.set_exception(std::current_exception()); }
        template <typename U>
        requires std::convertible_to<U, T>
        void return_value(U&& v) { promise.set_value(std::forward<U>(v)); }
    };

    Task(Task&& other) noexcept : fut(std::move(other.fut)) {}
    Task& operator=(Task&& other) noexcept { fut = std::move(other.fut); return *this; }
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<T> toFuture() { return std::move(fut); }

private:
    explicit Task(std::future<T>&& f) : fut(std::move(f)) {}
    std::future<T> fut;
};

template <>
class Task<void> {
public:
    struct promise_type {
        std::promise<void> promise;
        Task get_return_object() noexcept { return Task{ promise.get_future() }; }
        std::suspend_never initial_suspend() noexcept { return {}; }
        std::suspend_never final_suspend() noexcept { return {}; }
        void unhandled_exception() { promise.set_exception(std::current_exception()); }
        void return_void() { promise.set_value(); }
    };

    Task(Task&& other) noexcept : fut(std::move(other.fut)) {}
    Task& operator=(Task&& other) noexcept { fut = std::move(other.fut); return *this; }
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<void> toFuture() { return std::move(fut); }

private:
    explicit Task(std::future<void>&& f) : fut(std::move(f)) {}
    std::future<void> fut;
};

// Already-resolved futures for synchronous fast paths
template <typename T>
inline std::future<std::decay_t<T>> makeReadyFuture(T&& value) {
    std::promise<std::decay_t<T>> p;
    p.set_value(std::forward<T>(value));
    return p.get_future();
}

inline std::future<void> makeReadyFuture() {
    std::promise<void> p;
    p.set_value();
    return p.get_future();
}

template <typename T>
inline std::future<T> makeExceptionalFuture(std::exception_ptr ep) {
    std::promise<T> p;
    p.set_exception(std::move(ep));
    return p.get_future();
}

} // namespace async
} // namespace mcpio
