//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FutureAwaitable.h
// Purpose: Stop-aware awaiter enabling co_await on std::future for C++20 coroutines
//==========================================================================================================

#pragma once

#include <chrono>
#include <coroutine>
#include <future>
#include <optional>
#include <stop_token>
#include <thread>
#include <utility>

namespace courier {
namespace async {

//==========================================================================================================
// FutureAwaitable<T>
// Purpose: co_await a std::future<T> while watching a std::stop_token.
// Returns (from co_await):
//   The future's value, or std::nullopt when stop was requested before the future became ready.
//   Exceptions stored in the future are rethrown.
// Notes:
//   The wait is offloaded to a detached thread that polls the future every pollInterval; the coroutine is
//   resumed on that thread. A future abandoned on stop is destroyed with the awaiter.
//==========================================================================================================
template <typename T>
class FutureAwaitable {
public:
    FutureAwaitable(std::future<T>&& f, std::stop_token st, std::chrono::milliseconds pollInterval)
        : fut(std::move(f)), stop(std::move(st)), poll(pollInterval) {}

    bool await_ready() const noexcept {
        using namespace std::chrono_literals;
        return fut.wait_for(0s) == std::future_status::ready;
    }

    void await_suspend(std::coroutine_handle<> h) {
        std::thread waiter([this, h]() mutable {
            while (fut.wait_for(poll) != std::future_status::ready) {
                if (stop.stop_requested()) {
                    cancelled = true;
                    break;
                }
            }
            h.resume();
        });
        waiter.detach();
    }

    std::optional<T> await_resume() {
        if (cancelled) {
            return std::nullopt;
        }
        return std::optional<T>(fut.get());
    }

private:
    std::future<T> fut;
    std::stop_token stop;
    std::chrono::milliseconds poll;
    bool cancelled{false};
};

// Helper factory
template <typename T>
inline FutureAwaitable<T> makeFutureAwaitable(std::future<T>&& fut, std::stop_token st,
                                              std::chrono::milliseconds pollInterval) {
    return FutureAwaitable<T>(std::move(fut), std::move(st), pollInterval);
}

} // namespace async
} // namespace courier
