//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Task.h
// Purpose: Eager coroutine Task bridged to std::future, and co_await support for std::future
//==========================================================================================================

#pragma once

#include <chrono>
#include <concepts>
#include <coroutine>
#include <exception>
#include <future>
#include <thread>
#include <type_traits>
#include <utility>

namespace toolgw {
namespace async {

template <typename T>
class Task;

namespace detail {

// Shared promise plumbing. The coroutine runs eagerly and its frame is destroyed at completion; the
// std::promise is the only channel back to the caller.
template <typename T>
struct PromiseBase {
    std::promise<T> promise;

    Task<T> get_return_object() noexcept;
    std::suspend_never initial_suspend() noexcept { return {}; }
    std::suspend_never final_suspend() noexcept { return {}; }
    void unhandled_exception() { promise.set_exception(std::current_exception()); }
};

template <typename T>
struct TaskPromise : PromiseBase<T> {
    template <typename U>
    requires std::convertible_to<U, T>
    void return_value(U&& v) { this->promise.set_value(std::forward<U>(v)); }
};

template <>
struct TaskPromise<void> : PromiseBase<void> {
    void return_void() { this->promise.set_value(); }
};

} // namespace detail

//==========================================================================================================
// Task
// Purpose: Return type for gateway coroutines. toFuture() hands the result (or the escaped exception) to
//          a synchronous caller.
//==========================================================================================================
template <typename T>
class Task {
public:
    using value_type = T;
    using promise_type = detail::TaskPromise<T>;

    Task(Task&&) noexcept = default;
    Task& operator=(Task&&) noexcept = default;
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<T> toFuture() { return std::move(fut_); }

private:
    friend struct detail::PromiseBase<T>;
    explicit Task(std::future<T>&& f) : fut_(std::move(f)) {}
    std::future<T> fut_;
};

template <typename T>
Task<T> detail::PromiseBase<T>::get_return_object() noexcept {
    return Task<T>{ promise.get_future() };
}

//==========================================================================================================
// FutureAwaitable
// Purpose: co_await on a std::future. A ready future resumes inline; otherwise a detached helper thread
//          waits and resumes the coroutine. Exceptions stored in the future surface from await_resume().
//==========================================================================================================
template <typename T>
class FutureAwaitable {
public:
    explicit FutureAwaitable(std::future<T>&& f) : fut_(std::move(f)) {}

    bool await_ready() const noexcept {
        return fut_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    void await_suspend(std::coroutine_handle<> h) {
        std::thread([this, h]() mutable {
            fut_.wait();
            h.resume();
        }).detach();
    }

    T await_resume() {
        if constexpr (std::is_void_v<T>) {
            fut_.get();
        } else {
            return fut_.get();
        }
    }

private:
    std::future<T> fut_;
};

template <typename T>
inline FutureAwaitable<T> makeFutureAwaitable(std::future<T>&& fut) {
    return FutureAwaitable<T>(std::move(fut));
}

} // namespace async
} // namespace toolgw
