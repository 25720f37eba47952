//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_beast_transport.cpp
// Purpose: BeastTransport tests against a loopback Beast mini server (success, errors, timeouts, cancel)
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "courier/BeastTransport.hpp"
#include "courier/Client.h"

using namespace courier;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

using Request = http::request<http::string_body>;

struct MiniServer {
    using Responder = std::function<void(boost::beast::tcp_stream&, const Request&)>;

    boost::asio::io_context io;
    tcp::acceptor acceptor{io};
    std::thread thr;
    std::atomic<bool> running{false};
    unsigned short port{0};
    Responder responder;

    std::mutex seenMutex;
    Request lastRequest;
    int requestCount{0};

    explicit MiniServer(Responder r) : responder(std::move(r)) {}
    ~MiniServer() { stop(); }

    static void writeResponse(boost::beast::tcp_stream& stream, const Request& req, http::status status,
                              const std::string& body, const std::string& contentType = "application/json") {
        http::response<http::string_body> res{status, req.version()};
        res.set(http::field::server, "mini-server");
        res.set(http::field::content_type, contentType);
        res.keep_alive(false);
        res.body() = body;
        res.prepare_payload();
        http::write(stream, res);
    }

    void runOnce() {
        try {
            tcp::socket socket{io};
            acceptor.accept(socket);
            if (!running.load()) {
                return;
            }
            boost::beast::tcp_stream stream{std::move(socket)};
            boost::beast::flat_buffer buffer;
            Request req;
            http::read(stream, buffer, req);
            {
                std::lock_guard<std::mutex> lk(seenMutex);
                lastRequest = req;
                ++requestCount;
            }
            responder(stream, req);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        } catch (const std::exception& e) {
            // Client-side aborts surface here; the loop keeps serving
            (void)e;
        }
    }

    void start() {
        tcp::endpoint ep{boost::asio::ip::make_address("127.0.0.1"), 0};
        acceptor.open(ep.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(ep);
        acceptor.listen();
        port = acceptor.local_endpoint().port();
        running.store(true);
        thr = std::thread([this]() {
            while (running.load()) {
                runOnce();
            }
        });
    }

    void stop() {
        if (!running.exchange(false)) {
            if (thr.joinable()) {
                thr.join();
            }
            return;
        }
        boost::system::error_code ec;
        tcp::socket poke{io};
        poke.connect(tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), port}, ec);
        poke.close(ec);
        if (thr.joinable()) {
            thr.join();
        }
        acceptor.close(ec);
    }

    std::string url(const std::string& target) const {
        return "http://127.0.0.1:" + std::to_string(port) + target;
    }

    Request seen() {
        std::lock_guard<std::mutex> lk(seenMutex);
        return lastRequest;
    }
};

TransportRequest makeRequest(Method method, const std::string& url) {
    TransportRequest req;
    req.method = method;
    req.url = url;
    return req;
}

unsigned short closedPort() {
    boost::asio::io_context io;
    tcp::acceptor a{io, tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0}};
    const unsigned short p = a.local_endpoint().port();
    a.close();
    return p;
}

struct User {
    static constexpr const char* kTypeName = "User";
    std::string name;
    int age{0};

    static User FromJSON(const codec::Decoder& d) {
        return User{d.Decode<std::string>("name"), d.Decode<int>("age")};
    }
};

} // namespace

TEST(BeastTransport, GetReturnsStatusHeadersAndBody) {
    MiniServer srv([](boost::beast::tcp_stream& s, const Request& req) {
        MiniServer::writeResponse(s, req, http::status::ok, R"({"ok":true})");
    });
    srv.start();

    BeastTransport t;
    t.Start().get();
    TransportRequest req = makeRequest(Method::Get, srv.url("/items?page=2#frag"));
    req.headers = {{"X-Trace", "abc"}};
    auto fut = t.Send(req, {});
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    const TransportResponse resp = fut.get();
    EXPECT_EQ(resp.statusCode, 200);
    EXPECT_EQ(resp.body, R"({"ok":true})");
    ASSERT_EQ(resp.headers.count("Server"), 1u);
    EXPECT_EQ(resp.headers.at("Server"), "mini-server");

    const Request seen = srv.seen();
    EXPECT_EQ(seen.method(), http::verb::get);
    EXPECT_EQ(std::string(seen.target()), "/items?page=2");
    EXPECT_EQ(std::string(seen[http::field::host]), "127.0.0.1:" + std::to_string(srv.port));
    EXPECT_EQ(std::string(seen[http::field::user_agent]), "courier");
    EXPECT_EQ(std::string(seen["X-Trace"]), "abc");

    t.Close().get();
    srv.stop();
}

TEST(BeastTransport, PostSendsBody) {
    MiniServer srv([](boost::beast::tcp_stream& s, const Request& req) {
        MiniServer::writeResponse(s, req, http::status::created, req.body());
    });
    srv.start();

    BeastTransport t;
    t.Start().get();
    TransportRequest req = makeRequest(Method::Post, srv.url("/items"));
    req.body = std::string(R"({"name":"x"})");
    req.headers = {{"Content-Type", "application/json"}, {"User-Agent", "custom"}};
    const TransportResponse resp = t.Send(req, {}).get();
    EXPECT_EQ(resp.statusCode, 201);
    EXPECT_EQ(resp.body, R"({"name":"x"})");
    const Request seen = srv.seen();
    EXPECT_EQ(seen.method(), http::verb::post);
    EXPECT_EQ(std::string(seen[http::field::user_agent]), "custom");

    t.Close().get();
    srv.stop();
}

TEST(BeastTransport, ErrorStatusIsAResponse) {
    MiniServer srv([](boost::beast::tcp_stream& s, const Request& req) {
        MiniServer::writeResponse(s, req, http::status::internal_server_error, "oops", "text/plain");
    });
    srv.start();

    BeastTransport t;
    t.Start().get();
    const TransportResponse resp = t.Send(makeRequest(Method::Delete, srv.url("/x")), {}).get();
    EXPECT_EQ(resp.statusCode, 500);
    EXPECT_EQ(resp.body, "oops");
    EXPECT_EQ(srv.seen().method(), http::verb::delete_);

    t.Close().get();
    srv.stop();
}

TEST(BeastTransport, NonHttpReplyHasNoStatus) {
    MiniServer srv([](boost::beast::tcp_stream& s, const Request&) {
        boost::asio::write(s.socket(), boost::asio::buffer(std::string("SSH-2.0-OpenSSH\r\n\r\n")));
    });
    srv.start();

    BeastTransport t;
    t.Start().get();
    auto fut = t.Send(makeRequest(Method::Get, srv.url("/")), {});
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    const TransportResponse resp = fut.get();
    EXPECT_FALSE(resp.statusCode.has_value());

    t.Close().get();
    srv.stop();
}

TEST(BeastTransport, ConnectionRefusedIsTransportError) {
    BeastTransport::Options opts;
    opts.connectTimeoutMs = 1000;
    BeastTransport t(opts);
    t.Start().get();
    const std::string url = "http://127.0.0.1:" + std::to_string(closedPort()) + "/";
    auto fut = t.Send(makeRequest(Method::Get, url), {});
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_THROW(fut.get(), TransportError);
    t.Close().get();
}

TEST(BeastTransport, ReadTimeoutIsTransportError) {
    MiniServer srv([](boost::beast::tcp_stream& s, const Request& req) {
        std::this_thread::sleep_for(std::chrono::milliseconds(600));
        boost::system::error_code ec;
        (void)req;
        s.socket().close(ec);
    });
    srv.start();

    BeastTransport::Options opts;
    opts.readTimeoutMs = 150;
    BeastTransport t(opts);
    t.Start().get();
    auto fut = t.Send(makeRequest(Method::Get, srv.url("/slow")), {});
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    try {
        (void)fut.get();
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_NE(std::string(e.what()).find("timed out"), std::string::npos) << e.what();
    }

    t.Close().get();
    srv.stop();
}

TEST(BeastTransport, StopTokenAbortsExchange) {
    MiniServer srv([](boost::beast::tcp_stream& s, const Request& req) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        boost::system::error_code ec;
        (void)req;
        s.socket().close(ec);
    });
    srv.start();

    BeastTransport t;
    t.Start().get();
    std::stop_source src;
    auto fut = t.Send(makeRequest(Method::Get, srv.url("/hang")), src.get_token());
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    src.request_stop();
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    try {
        (void)fut.get();
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_STREQ(e.what(), "Request cancelled");
    }

    t.Close().get();
    srv.stop();
}

TEST(BeastTransport, ClientEndToEnd) {
    MiniServer srv([](boost::beast::tcp_stream& s, const Request& req) {
        if (req.target() == "/api/users/1") {
            MiniServer::writeResponse(s, req, http::status::ok, R"({"name":"Josh","age":40})");
        } else {
            MiniServer::writeResponse(s, req, http::status::not_found, "missing", "text/plain");
        }
    });
    srv.start();

    ClientOptions opts;
    opts.host = "http://127.0.0.1:" + std::to_string(srv.port) + "/api";
    opts.cache = IsolatedCache{};
    Client client(opts, std::make_shared<BeastTransport>());
    client.Connect().get();

    auto ok = client.Get<User>("users/1").get();
    ASSERT_TRUE(ok.IsSuccess()) << ok.failure().error.describe();
    EXPECT_EQ(ok.success().value.name, "Josh");
    EXPECT_EQ(std::string(srv.seen()[http::field::accept]), "application/json");

    auto missing = client.Get<User>("users/2").get();
    ASSERT_TRUE(missing.IsFailure());
    EXPECT_EQ(missing.failure().error.kind, errors::ErrorKind::Server);
    EXPECT_EQ(missing.failure().error.body, "missing");

    client.Disconnect().get();
    srv.stop();
}
