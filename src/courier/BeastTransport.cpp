//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/courier/BeastTransport.cpp
// Purpose: HTTP/HTTPS client transport using Boost.Beast coroutines (TLS 1.2+ for HTTPS)
//==========================================================================================================

//==========================================================================================================
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "courier/BeastTransport.hpp"
#include "courier/cache/CachePolicy.h"
#include "courier/errors/Errors.h"
#include "ConfigString.h"

#include <openssl/ssl.h>
#include <openssl/x509v3.h>

namespace courier {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

// ------------------------------------------------------------------------------------------------------
// URL parsing (absolute http/https URLs as produced by ComposeURL)
// ------------------------------------------------------------------------------------------------------
struct UrlParts {
    std::string scheme;
    std::string host;       // without IPv6 brackets, for the resolver and TLS
    std::string port;
    std::string hostHeader; // authority as written in the URL
    std::string target;     // path + query, never empty
};

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;
    const std::size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw TransportError("Malformed URL: " + url);
    }
    parts.scheme = ToLowerAscii(url.substr(0, schemeEnd));
    std::string rest = url.substr(schemeEnd + 3);
    const std::size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        rest.resize(hash);
    }

    const std::size_t pathStart = rest.find_first_of("/?");
    const std::string authority = rest.substr(0, pathStart);
    parts.target = pathStart == std::string::npos ? std::string("/") : rest.substr(pathStart);
    if (parts.target.front() == '?') {
        parts.target.insert(parts.target.begin(), '/');
    }
    parts.hostHeader = authority;

    if (!authority.empty() && authority.front() == '[') {
        const std::size_t close = authority.find(']');
        if (close == std::string::npos) {
            throw TransportError("Malformed IPv6 literal in URL: " + url);
        }
        parts.host = authority.substr(1, close - 1);
        const std::string after = authority.substr(close + 1);
        if (!after.empty() && after.front() == ':') {
            parts.port = after.substr(1);
        }
    } else {
        const std::size_t colon = authority.find(':');
        parts.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            parts.port = authority.substr(colon + 1);
        }
    }

    if (parts.scheme != "http" && parts.scheme != "https") {
        throw TransportError("Unsupported URL scheme: " + parts.scheme);
    }
    if (parts.host.empty()) {
        throw TransportError("URL has no host: " + url);
    }
    if (parts.port.empty()) {
        parts.port = parts.scheme == "https" ? "443" : "80";
    }
    return parts;
}

bool isIpLiteral(const std::string& host) {
    boost::system::error_code ec;
    (void)net::ip::make_address(host, ec);
    return !ec;
}

HeaderMap collectHeaders(const http::response<http::string_body>& res) {
    HeaderMap out;
    for (const auto& field : res) {
        std::string name(field.name_string());
        auto it = out.find(name);
        if (it == out.end()) {
            out.emplace(std::move(name), std::string(field.value()));
        } else {
            it->second += ", " + std::string(field.value());
        }
    }
    return out;
}

// Parser errors that mean "the peer did not speak HTTP", as opposed to a cut-off or oversized reply.
bool isMalformedHttp(const boost::system::error_code& ec) {
    if (ec.category() != http::make_error_code(http::error::bad_version).category()) {
        return false;
    }
    return ec != http::error::end_of_stream && ec != http::error::partial_message &&
           ec != http::error::body_limit && ec != http::error::header_limit &&
           ec != http::error::buffer_overflow;
}

} // namespace

class BeastTransport::Impl {
public:
    struct PendingExchange {
        std::promise<TransportResponse> promise;
        std::atomic<bool> settled{false};

        void resolve(TransportResponse r) {
            if (!settled.exchange(true)) {
                promise.set_value(std::move(r));
            }
        }
        void reject(std::exception_ptr e) {
            if (!settled.exchange(true)) {
                promise.set_exception(std::move(e));
            }
        }
    };

    // Aborts the I/O of one exchange. Only touched on the io thread.
    struct CancelHook {
        std::function<void()> abort;
    };

    struct HookRelease {
        std::shared_ptr<CancelHook> hook;
        ~HookRelease() { hook->abort = nullptr; }
    };

    BeastTransport::Options opts;
    std::string sessionId;
    std::atomic<bool> connected{false};
    std::unique_ptr<ssl::context> sslCtx;
    bool caInitOk{true};
    BeastTransport::ErrorHandler errorHandler;

    std::mutex pendingMutex;
    std::unordered_map<std::uint64_t, std::shared_ptr<PendingExchange>> pending;
    std::atomic<std::uint64_t> exchangeCounter{0};

    net::io_context ioc;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::thread ioThread;

    explicit Impl(const BeastTransport::Options& o) : opts(o) {
        std::random_device rd; std::mt19937 gen(rd()); std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "http-" + std::to_string(dis(gen));

        sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
        ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_2_VERSION);
        const bool userProvidedCA = !opts.caFile.empty() || !opts.caPath.empty();
        try {
            if (userProvidedCA) {
                if (!opts.caFile.empty()) { sslCtx->load_verify_file(opts.caFile); }
                if (!opts.caPath.empty()) { sslCtx->add_verify_path(opts.caPath); }
            } else {
                sslCtx->set_default_verify_paths();
            }
        } catch (const boost::system::system_error& e) {
            if (userProvidedCA) {
                LOG_ERROR("HTTPS: failed to load user-provided CA file/path: {}", e.what());
                caInitOk = false;
            } else {
                LOG_DEBUG("HTTPS: set_default_verify_paths failed: {}", e.what());
            }
        }
        sslCtx->set_verify_mode(ssl::verify_peer);
    }

    ~Impl() {
        stopLoop();
        failPending("Transport destroyed");
    }

    void setError(const std::string& msg) {
        if (errorHandler) { errorHandler(msg); }
    }

    void stopLoop() {
        if (workGuard) {
            workGuard->reset(); workGuard.reset();
        }
        ioc.stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }
    }

    void failPending(const std::string& reason) {
        std::unordered_map<std::uint64_t, std::shared_ptr<PendingExchange>> drained;
        {
            std::lock_guard<std::mutex> lk(pendingMutex);
            drained.swap(pending);
        }
        for (auto& kv : drained) {
            kv.second->reject(std::make_exception_ptr(TransportError(reason)));
        }
    }

    void complete(std::uint64_t id, std::exception_ptr eptr, TransportResponse response) {
        std::shared_ptr<PendingExchange> ex;
        {
            std::lock_guard<std::mutex> lk(pendingMutex);
            auto it = pending.find(id);
            if (it == pending.end()) {
                return;
            }
            ex = std::move(it->second);
            pending.erase(it);
        }
        if (eptr) {
            ex->reject(eptr);
        } else {
            ex->resolve(std::move(response));
        }
    }

    void configureTls(beast::ssl_stream<beast::tcp_stream>& stream, const UrlParts& u) {
        const std::string name = opts.serverName.empty() ? u.host : opts.serverName;
        if (isIpLiteral(name)) {
            ::X509_VERIFY_PARAM_set1_ip_asc(::SSL_get0_param(stream.native_handle()), name.c_str());
            return;
        }
        if (!::SSL_set_tlsext_host_name(stream.native_handle(), name.c_str())) {
            setError("HTTPS: failed to set SNI hostname");
        }
        (void)::SSL_set1_host(stream.native_handle(), name.c_str());
    }

    // Coroutine: write the request and read one response on an established stream
    template <typename Stream>
    net::awaitable<TransportResponse> coRoundTrip(Stream& stream, beast::tcp_stream& lowest,
                                                  http::request<http::string_body>& req) {
        lowest.expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
        co_await http::async_write(stream, req, net::use_awaitable);
        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(static_cast<std::uint64_t>(opts.maxBodyBytes));
        co_await http::async_read(stream, buffer, parser, net::use_awaitable);
        http::response<http::string_body> res = parser.release();
        TransportResponse out;
        out.statusCode = static_cast<int>(res.result_int());
        out.headers = collectHeaders(res);
        out.body = std::move(res.body());
        co_return out;
    }

    // Coroutine: one complete exchange (resolve, connect, [handshake], write, read)
    net::awaitable<TransportResponse> coExchange(TransportRequest request, UrlParts u, std::stop_token stop) {
        auto executor = co_await net::this_coro::executor;
        auto hook = std::make_shared<CancelHook>();
        std::stop_callback onStop(stop, [hook, executor]() {
            net::post(executor, [hook]() {
                if (hook->abort) { hook->abort(); }
            });
        });

        tcp::resolver resolver(executor);
        std::optional<beast::tcp_stream> plain;
        std::optional<beast::ssl_stream<beast::tcp_stream>> tls;
        HookRelease release{hook};
        hook->abort = [&resolver, &plain, &tls]() {
            resolver.cancel();
            if (plain) { plain->cancel(); }
            if (tls) { beast::get_lowest_layer(*tls).cancel(); }
        };
        auto throwIfStopped = [&stop]() {
            if (stop.stop_requested()) {
                throw TransportError("Request cancelled");
            }
        };

        TransportResponse out;
        bool malformed = false;
        try {
            http::request<http::string_body> req{http::string_to_verb(ToString(request.method)), u.target, 11};
            req.set(http::field::host, u.hostHeader);
            req.set(http::field::user_agent, opts.userAgent);
            for (const auto& [name, value] : request.headers) {
                req.set(name, value);
            }
            req.set(http::field::connection, "close");
            if (request.body) {
                req.body() = *request.body;
            }
            req.prepare_payload();

            throwIfStopped();
            auto results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);
            throwIfStopped();

            if (u.scheme == "https") {
                tls.emplace(executor, *sslCtx);
                configureTls(*tls, u);
                auto& lowest = beast::get_lowest_layer(*tls);
                lowest.expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
                co_await lowest.async_connect(results, net::use_awaitable);
                throwIfStopped();
                co_await tls->async_handshake(ssl::stream_base::client, net::use_awaitable);
                throwIfStopped();
                out = co_await coRoundTrip(*tls, lowest, req);
                boost::system::error_code ec;
                lowest.socket().shutdown(tcp::socket::shutdown_both, ec);
            } else {
                plain.emplace(executor);
                plain->expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
                co_await plain->async_connect(results, net::use_awaitable);
                throwIfStopped();
                out = co_await coRoundTrip(*plain, *plain, req);
                boost::system::error_code ec;
                plain->socket().shutdown(tcp::socket::shutdown_both, ec);
            }
        } catch (const boost::system::system_error& e) {
            const auto ec = e.code();
            if (stop.stop_requested()) {
                LOG_DEBUG("BeastTransport: {} {} cancelled", ToString(request.method), request.url);
                throw TransportError("Request cancelled");
            }
            if (isMalformedHttp(ec)) {
                LOG_WARN("BeastTransport: non-HTTP reply from {}: {}", request.url, ec.message());
                malformed = true;
            } else if (ec == beast::error::timeout) {
                LOG_WARN("BeastTransport: timed out talking to {}", request.url);
                throw TransportError("Request timed out: " + request.url);
            } else {
                LOG_WARN("BeastTransport: {} {} failed: {}", ToString(request.method), request.url, e.what());
                throw TransportError(std::string("HTTP exchange failed: ") + e.what());
            }
        }
        if (malformed) {
            co_return TransportResponse{};
        }
        cache::StoreInCache(request, out);
        co_return out;
    }
};

BeastTransport::BeastTransport()
    : pImpl(std::make_unique<Impl>(Options{})) {}

BeastTransport::BeastTransport(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

BeastTransport::~BeastTransport() = default;

std::future<void> BeastTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> ready; auto fut = ready.get_future();
    if (pImpl->connected.exchange(true)) {
        ready.set_value();
        return fut;
    }
    if (pImpl->ioc.stopped()) {
        pImpl->ioc.restart();
    }
    pImpl->workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(pImpl->ioc));
    pImpl->ioThread = std::thread([this, pr = std::move(ready)]() mutable {
        pr.set_value();
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("BeastTransport: io loop terminated: {}", e.what());
            pImpl->setError(e.what());
        }
    });
    return fut;
}

std::future<void> BeastTransport::Close() {
    FUNC_SCOPE();
    std::promise<void> done; auto fut = done.get_future();
    LOG_DEBUG("BeastTransport {}: closing", pImpl->sessionId);
    pImpl->connected.store(false);
    pImpl->stopLoop();
    pImpl->failPending("Transport closed");
    done.set_value();
    return fut;
}

bool BeastTransport::IsConnected() const {
    FUNC_SCOPE(); return pImpl->connected.load();
}

std::string BeastTransport::GetSessionId() const {
    FUNC_SCOPE(); return pImpl->sessionId;
}

const BeastTransport::Options& BeastTransport::GetOptions() const {
    return pImpl->opts;
}

std::future<TransportResponse> BeastTransport::Send(TransportRequest request, std::stop_token stop) {
    FUNC_SCOPE();
    auto exchange = std::make_shared<Impl::PendingExchange>();
    auto fut = exchange->promise.get_future();

    if (!pImpl->connected.load()) {
        exchange->reject(std::make_exception_ptr(TransportError("Transport not connected")));
        return fut;
    }

    UrlParts u;
    try {
        if (auto cached = cache::ServeFromCache(request)) {
            exchange->resolve(std::move(*cached));
            return fut;
        }
        u = parseUrl(request.url);
        if (u.scheme == "https" && !pImpl->caInitOk) {
            throw TransportError("HTTPS: CA initialization failed (bad caFile/caPath)");
        }
    } catch (const std::exception& e) {
        pImpl->setError(e.what());
        exchange->reject(std::current_exception());
        return fut;
    }

    const std::uint64_t id = ++pImpl->exchangeCounter;
    {
        std::lock_guard<std::mutex> lk(pImpl->pendingMutex);
        pImpl->pending.emplace(id, exchange);
    }

    Impl* impl = pImpl.get();
    net::co_spawn(pImpl->ioc, pImpl->coExchange(std::move(request), std::move(u), std::move(stop)),
        [impl, id](std::exception_ptr eptr, TransportResponse response) {
            if (eptr) {
                impl->setError(errors::describeException(eptr));
            }
            impl->complete(id, eptr, std::move(response));
        });

    return fut;
}

void BeastTransport::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    pImpl->errorHandler = std::move(handler);
}

//==========================================================================================================
// BeastTransportFactory::CreateTransport
// Purpose: Parse semicolon-delimited key=value config into Options and create transport.
//==========================================================================================================
std::unique_ptr<ITransport> BeastTransportFactory::CreateTransport(const std::string& config) {
    BeastTransport::Options opts;
    detail::ForEachConfigEntry(config, [&opts](const std::string& key, const std::string& val) {
        if (key == "connectTimeoutMs") {
            detail::ParseUnsigned(val, opts.connectTimeoutMs);
        }
        else if (key == "readTimeoutMs") {
            detail::ParseUnsigned(val, opts.readTimeoutMs);
        }
        else if (key == "caFile") {
            opts.caFile = val;
        }
        else if (key == "caPath") {
            opts.caPath = val;
        }
        else if (key == "serverName") {
            opts.serverName = val;
        }
        else if (key == "userAgent") {
            opts.userAgent = val;
        }
        else if (key == "maxBodyBytes") {
            detail::ParseUnsigned(val, opts.maxBodyBytes);
        }
    });
    return std::make_unique<BeastTransport>(opts);
}

} // namespace courier
