//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_cancellation.cpp
// Purpose: Tests for stop_token cancellation of in-flight client calls
//==========================================================================================================

#include <gtest/gtest.h>
#include "courier/Client.h"
#include "courier/InMemoryTransport.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

using namespace courier;

namespace {

ClientOptions options() {
    ClientOptions opts;
    opts.host = "https://slow.example.com";
    opts.cache = IsolatedCache{};
    opts.cancelPollMs = 5;
    return opts;
}

} // namespace

TEST(Cancellation, CooperativeHandlerObservesStop) {
    std::atomic<bool> stopObserved{false};
    auto transport = std::make_shared<InMemoryTransport>([&stopObserved](const TransportRequest&, std::stop_token st) {
        std::mutex m;
        std::condition_variable_any cv;
        std::unique_lock<std::mutex> lk(m);
        cv.wait_for(lk, st, std::chrono::seconds(5), [] { return false; });
        stopObserved = st.stop_requested();
        TransportResponse r;
        r.statusCode = 200;
        r.body = "{}";
        return r;
    });
    Client client(options(), transport);
    client.Connect().get();

    std::stop_source src;
    auto fut = client.Get<JSONValue>("/slow", {}, src.get_token());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    src.request_stop();

    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto result = fut.get();
    ASSERT_TRUE(result.IsFailure());
    EXPECT_EQ(result.failure().error.kind, errors::ErrorKind::Cancelled);
    EXPECT_NE(result.canonicalString(), "");
    EXPECT_NE(result.signature(), "");

    client.Disconnect().get();
    EXPECT_TRUE(stopObserved.load());
}

TEST(Cancellation, StopBeforeSendSkipsTransport) {
    auto transport = std::make_shared<InMemoryTransport>([](const TransportRequest&, std::stop_token) {
        TransportResponse r;
        r.statusCode = 200;
        return r;
    });
    Client client(options(), transport);
    client.Connect().get();

    std::stop_source src;
    src.request_stop();
    auto result = client.Get<Empty>("/never", {}, src.get_token()).get();
    ASSERT_TRUE(result.IsFailure());
    EXPECT_EQ(result.failure().error.kind, errors::ErrorKind::Cancelled);
    EXPECT_EQ(transport->RequestCount(), 0u);
    client.Disconnect().get();
}

TEST(Cancellation, NonCooperativeHandlerDoesNotDelayOutcome) {
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    auto transport = std::make_shared<InMemoryTransport>([released](const TransportRequest&, std::stop_token) {
        released.wait_for(std::chrono::seconds(5));
        TransportResponse r;
        r.statusCode = 200;
        r.body = "{}";
        return r;
    });
    Client client(options(), transport);
    client.Connect().get();

    std::stop_source src;
    auto fut = client.Get<JSONValue>("/stuck", {}, src.get_token());
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    src.request_stop();

    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto result = fut.get();
    ASSERT_TRUE(result.IsFailure());
    EXPECT_EQ(result.failure().error.kind, errors::ErrorKind::Cancelled);

    release.set_value();
    client.Disconnect().get();
}

TEST(Cancellation, UnstoppedCallCompletes) {
    auto transport = std::make_shared<InMemoryTransport>([](const TransportRequest&, std::stop_token) {
        TransportResponse r;
        r.statusCode = 200;
        r.body = "\"done\"";
        return r;
    });
    Client client(options(), transport);
    client.Connect().get();

    std::stop_source src;
    auto result = client.Get<JSONValue>("/fast", {}, src.get_token()).get();
    ASSERT_TRUE(result.IsSuccess());
    EXPECT_EQ(result.success().value, JSONValue("done"));
    client.Disconnect().get();
}
