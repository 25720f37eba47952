//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_transport_factories.cpp
// Purpose: Validate transport factories parse their config strings and create working transports
//==========================================================================================================

#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "courier/Transport.h"
#include "courier/BeastTransport.hpp"
#include "courier/InMemoryTransport.hpp"

using namespace courier;

TEST(TransportFactories, BeastTransportFactory_ParsesOptions) {
    BeastTransportFactory factory;
    const std::string cfg =
        " connectTimeoutMs = 250 ; readTimeoutMs=900;caFile=/tmp/ca.pem; serverName=api.local;"
        "userAgent=courier-test;maxBodyBytes=1024;unknown=ignored";
    auto t = factory.CreateTransport(cfg);
    ASSERT_NE(t, nullptr);
    auto* beast = dynamic_cast<BeastTransport*>(t.get());
    ASSERT_NE(beast, nullptr);
    const auto& o = beast->GetOptions();
    EXPECT_EQ(o.connectTimeoutMs, 250u);
    EXPECT_EQ(o.readTimeoutMs, 900u);
    EXPECT_EQ(o.caFile, "/tmp/ca.pem");
    EXPECT_EQ(o.caPath, "");
    EXPECT_EQ(o.serverName, "api.local");
    EXPECT_EQ(o.userAgent, "courier-test");
    EXPECT_EQ(o.maxBodyBytes, 1024u);
}

TEST(TransportFactories, BeastTransportFactory_MalformedNumbersKeepDefaults) {
    BeastTransportFactory factory;
    auto t = factory.CreateTransport("connectTimeoutMs=abc;readTimeoutMs=-5;maxBodyBytes=");
    auto* beast = dynamic_cast<BeastTransport*>(t.get());
    ASSERT_NE(beast, nullptr);
    const BeastTransport::Options defaults;
    EXPECT_EQ(beast->GetOptions().connectTimeoutMs, defaults.connectTimeoutMs);
    EXPECT_EQ(beast->GetOptions().readTimeoutMs, defaults.readTimeoutMs);
    EXPECT_EQ(beast->GetOptions().maxBodyBytes, defaults.maxBodyBytes);
}

TEST(TransportFactories, BeastTransportFactory_StartClose) {
    BeastTransportFactory factory;
    auto t = factory.CreateTransport("connectTimeoutMs=500");
    ASSERT_NE(t, nullptr);
    // Start/Close perform no network I/O
    EXPECT_FALSE(t->IsConnected());
    EXPECT_NO_THROW({ t->Start().get(); });
    EXPECT_TRUE(t->IsConnected());
    EXPECT_EQ(t->GetSessionId().rfind("http-", 0), 0u);
    EXPECT_NO_THROW({ t->Close().get(); });
    EXPECT_FALSE(t->IsConnected());
}

TEST(TransportFactories, BeastTransport_SendBeforeStartFails) {
    BeastTransport t;
    TransportRequest req;
    req.url = "http://127.0.0.1:1/";
    auto fut = t.Send(req, {});
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(1)), std::future_status::ready);
    EXPECT_THROW(fut.get(), TransportError);
}

TEST(TransportFactories, BeastTransport_UnsupportedSchemeFails) {
    BeastTransport t;
    t.Start().get();
    std::string reported;
    t.SetErrorHandler([&reported](const std::string& e) { reported = e; });
    TransportRequest req;
    req.url = "ftp://example.com/file";
    auto fut = t.Send(req, {});
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(1)), std::future_status::ready);
    EXPECT_THROW(fut.get(), TransportError);
    EXPECT_NE(reported.find("ftp"), std::string::npos);
    t.Close().get();
}

TEST(TransportFactories, InMemoryTransportFactory_StartSendClose) {
    InMemoryTransportFactory factory;
    auto t = factory.CreateTransport("status=202; body=accepted");
    ASSERT_NE(t, nullptr);
    EXPECT_NO_THROW({ t->Start().get(); });
    EXPECT_TRUE(t->IsConnected());
    EXPECT_EQ(t->GetSessionId().rfind("memory-", 0), 0u);

    TransportRequest req;
    req.method = Method::Post;
    req.url = "mem://anything";
    auto fut = t->Send(req, {});
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    const TransportResponse resp = fut.get();
    EXPECT_EQ(resp.statusCode, 202);
    EXPECT_EQ(resp.body, "accepted");

    EXPECT_NO_THROW({ t->Close().get(); });
    EXPECT_FALSE(t->IsConnected());
}

TEST(TransportFactories, InMemoryTransportFactory_MethodFilter) {
    InMemoryTransportFactory factory;
    auto t = factory.CreateTransport("status=200;body=ok;method=PUT");
    t->Start().get();

    TransportRequest put;
    put.method = Method::Put;
    put.url = "mem://x";
    const TransportResponse accepted = t->Send(put, {}).get();
    EXPECT_EQ(accepted.statusCode, 200);
    EXPECT_EQ(accepted.body, "ok");

    TransportRequest get;
    get.method = Method::Get;
    get.url = "mem://x";
    const TransportResponse rejected = t->Send(get, {}).get();
    EXPECT_EQ(rejected.statusCode, 405);
    EXPECT_EQ(rejected.headers.at("Allow"), "PUT");
    EXPECT_EQ(rejected.body, "");
    t->Close().get();
}

TEST(TransportFactories, InMemoryTransportFactory_UnknownMethodIsIgnored) {
    InMemoryTransportFactory factory;
    // Method names are case-sensitive; "put" is not recognised so every verb is answered.
    auto t = factory.CreateTransport("status=201;method=put");
    t->Start().get();
    TransportRequest get;
    get.method = Method::Get;
    get.url = "mem://x";
    EXPECT_EQ(t->Send(get, {}).get().statusCode, 201);
    t->Close().get();
}

TEST(TransportFactories, InMemoryTransport_DefaultHandlerIs404) {
    InMemoryTransport t;
    t.Start().get();
    auto resp = t.Send(TransportRequest{}, {}).get();
    EXPECT_EQ(resp.statusCode, 404);
    EXPECT_EQ(t.RequestCount(), 1u);
    t.Close().get();
}

TEST(TransportFactories, InMemoryTransport_HandlerExceptionReachesFuture) {
    InMemoryTransport t([](const TransportRequest&, std::stop_token) -> TransportResponse {
        throw TransportError("boom");
    });
    std::string reported;
    t.SetErrorHandler([&reported](const std::string& e) { reported = e; });
    t.Start().get();
    auto fut = t.Send(TransportRequest{}, {});
    EXPECT_THROW(fut.get(), TransportError);
    EXPECT_NE(reported.find("boom"), std::string::npos);
    t.Close().get();
}

TEST(TransportFactories, InMemoryTransport_StoppedRequestSkipsHandler) {
    InMemoryTransport t([](const TransportRequest&, std::stop_token) {
        TransportResponse r;
        r.statusCode = 200;
        return r;
    });
    t.Start().get();
    std::stop_source src;
    src.request_stop();
    auto fut = t.Send(TransportRequest{}, src.get_token());
    EXPECT_THROW(fut.get(), TransportError);
    EXPECT_EQ(t.RequestCount(), 0u);
    t.Close().get();
}

TEST(TransportFactories, InMemoryTransport_SendRacingCloseNeverHangs) {
    for (int round = 0; round < 50; ++round) {
        InMemoryTransport t([](const TransportRequest&, std::stop_token) {
            TransportResponse r;
            r.statusCode = 200;
            return r;
        });
        t.Start().get();

        std::vector<std::future<TransportResponse>> futures;
        std::thread sender([&]() {
            for (int i = 0; i < 40; ++i) {
                TransportRequest req;
                req.url = "mem://race";
                futures.push_back(t.Send(req, {}));
            }
        });
        t.Close().get();
        sender.join();

        for (auto& fut : futures) {
            ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready) << "round " << round;
            try {
                EXPECT_EQ(fut.get().statusCode, 200);
            } catch (const TransportError& e) {
                const std::string what = e.what();
                EXPECT_TRUE(what == "Transport closed" || what == "Transport not connected") << what;
            }
        }
    }
}
