//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.h
// Purpose: HTTP convenience client - builds requests from a base host, signs them and maps transport
//          outcomes into typed Success/Failure results
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>
#include <variant>

#include "logging/Logger.h"
#include "courier/Canonicalizer.h"
#include "courier/Headers.h"
#include "courier/HostParser.h"
#include "courier/RequestDescriptor.h"
#include "courier/Result.h"
#include "courier/Signature.h"
#include "courier/Transport.h"
#include "courier/URLComposer.h"
#include "courier/async/FutureAwaitable.h"
#include "courier/async/Task.h"
#include "courier/cache/ICacheProvider.h"
#include "courier/cache/MemoryCache.hpp"
#include "courier/codec/Codec.h"
#include "courier/codec/Decoder.h"
#include "courier/codec/Payload.h"
#include "courier/errors/DecodeErrorMapper.h"
#include "courier/errors/Errors.h"

namespace courier {

// Use the process-wide MemoryCache::Shared() instance.
struct SharedCache {};

// Use a cache owned by this client only.
struct IsolatedCache {
    std::size_t memoryCapacityBytes{cache::MemoryCache::kDefaultCapacityBytes};
};

using CacheMode = std::variant<SharedCache, IsolatedCache>;

//==========================================================================================================
// ClientOptions
// Purpose: Immutable client configuration.
// Fields:
//   host: Free-form base host ("https://api.example.com:8443/v1", "example.com", "[::1]:9000/x").
//   port: Overrides any port parsed from host.
//   defaultHeaders: Headers sent with every call unless overridden per call.
//   defaultCachePolicy: Used when a call does not name a policy.
//   cache: Shared or isolated response cache.
//   codec: Body codec; JsonCodec when null.
//   cancelPollMs: How often an in-flight call checks its stop token.
//==========================================================================================================
struct ClientOptions {
    std::string host;
    std::optional<int> port;
    HeaderMap defaultHeaders{{"Accept", "application/json"}, {"Content-Type", "application/json"}};
    CachePolicy defaultCachePolicy{CachePolicy::UseProtocolCachePolicy};
    CacheMode cache{SharedCache{}};
    std::shared_ptr<codec::ICodec> codec;
    unsigned int cancelPollMs{20};
};

// Per-call overrides.
struct CallOptions {
    HeaderMap headers;
    std::optional<QueryMap> query;
    std::optional<std::string> fragment;
    std::optional<CachePolicy> cachePolicy;
};

namespace detail {

// Everything a call reads; never written after the client is constructed.
struct ClientState {
    ParsedHost baseHost;
    HeaderMap defaultHeaders;
    CachePolicy defaultCachePolicy{CachePolicy::UseProtocolCachePolicy};
    std::shared_ptr<cache::ICacheProvider> cache;
    bool isolatedCache{false};
    std::shared_ptr<codec::ICodec> codec;
    std::shared_ptr<ITransport> transport;
    std::chrono::milliseconds cancelPoll{20};
};

template <typename R>
std::future<ExecutionResult<R>> ReadyResult(ExecutionResult<R> result) {
    std::promise<ExecutionResult<R>> p;
    p.set_value(std::move(result));
    return p.get_future();
}

// Failure before any descriptor existed: no canonical string, no signature.
inline Failure EarlyFailure(errors::RequestError error) {
    return Failure{std::move(error), std::nullopt, std::string(), std::string()};
}

//==========================================================================================================
// coExecute
// Purpose: compose URL -> canonicalize + sign -> transport -> classify status -> decode.
// Notes:
//   Every failure is returned as data. The coroutine suspends only on the transport exchange.
//==========================================================================================================
template <typename R>
async::Task<ExecutionResult<R>> coExecute(std::shared_ptr<const ClientState> state, RequestDescriptor d,
                                          std::stop_token stop) {
    if (d.host.empty()) {
        LOG_DEBUG("Rejecting {} {}: no usable host", ToString(d.method), d.path);
        co_return EarlyFailure(errors::invalidURL());
    }
    const ParsedHost target{d.scheme, d.host, d.port, std::string()};
    std::optional<std::string> url = ComposeURL(target, d.path, d.query, d.fragment);
    if (!url) {
        co_return EarlyFailure(errors::invalidURL());
    }

    std::string canonical;
    std::string signature;
    std::exception_ptr signError;
    try {
        canonical = Canonicalize(d);
        signature = Sign(CanonicalizeForSigning(d));
    } catch (...) {
        signError = std::current_exception();
    }
    if (signError) {
        co_return EarlyFailure(errors::encoding(signError));
    }

    auto fail = [&canonical, &signature](errors::RequestError error,
                                         std::optional<StatusMetadata> status = std::nullopt) {
        return ExecutionResult<R>(Failure{std::move(error), std::move(status), canonical, signature});
    };

    if (stop.stop_requested()) {
        co_return fail(errors::cancelled());
    }

    TransportRequest request;
    request.method = d.method;
    request.url = *url;
    request.headers = d.headers;
    request.body = d.body;
    request.cachePolicy = d.cachePolicy;
    request.cacheKey = signature;
    request.cache = state->cache;

    std::optional<TransportResponse> response;
    std::exception_ptr transportError;
    try {
        response = co_await async::makeFutureAwaitable(state->transport->Send(std::move(request), stop), stop,
                                                       state->cancelPoll);
    } catch (const std::exception& e) {
        LOG_DEBUG("Transport failed for {}: {}", canonical, e.what());
        transportError = std::current_exception();
    } catch (...) {
        LOG_DEBUG("Transport failed for {} with a non-standard exception", canonical);
        transportError = std::current_exception();
    }
    if (transportError) {
        if (stop.stop_requested()) {
            co_return fail(errors::cancelled());
        }
        co_return fail(errors::transport(transportError));
    }
    if (!response || stop.stop_requested()) {
        co_return fail(errors::cancelled());
    }
    if (!response->statusCode) {
        co_return fail(errors::invalidResponse());
    }

    StatusMetadata status{*response->statusCode, response->headers};
    if (status.statusCode < 200 || status.statusCode > 299) {
        co_return fail(errors::server(status.statusCode, response->body), std::move(status));
    }

    std::exception_ptr decodeError;
    try {
        R value = codec::DecodePayload<R>(*state->codec, response->body);
        co_return Success<R>{std::move(value), std::move(status), canonical, signature};
    } catch (...) {
        decodeError = std::current_exception();
    }
    co_return fail(errors::mapDecodingError(decodeError, codec::TypeName<R>()), std::move(status));
}

} // namespace detail

//==========================================================================================================
// Client
// Purpose: Request builder and executor bound to one base host and one transport.
// Notes:
//   - The client is immutable after construction; concurrent calls share nothing but the transport.
//   - Results are futures; they never hold exceptions for request failures.
//==========================================================================================================
class Client {
public:
    //==========================================================================================================
    // Constructs a client.
    // Args:
    //   options: Base host, default headers, cache and codec configuration.
    //   transport: Transport performing the exchanges (required).
    // Throws:
    //   std::invalid_argument when transport is null.
    //==========================================================================================================
    Client(ClientOptions options, std::shared_ptr<ITransport> transport);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    ////////////////////////////////////////// Connection management ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport. Calls made before the transport runs fail with a transport error.
    //==========================================================================================================
    std::future<void> Connect();

    //==========================================================================================================
    // Closes the transport; calls in flight fail with a transport error.
    //==========================================================================================================
    std::future<void> Disconnect();

    bool IsConnected() const;

    // Parsed base host (port override applied).
    const ParsedHost& BaseHost() const;

    ////////////////////////////////////////// Request building ////////////////////////////////////////////////
    //==========================================================================================================
    // Builds the descriptor for a call: joined path, merged headers, per-call query/fragment and policy.
    // Args:
    //   method/path: Verb and path relative to the base path.
    //   body: Encoded request body bytes, if any.
    //   options: Per-call overrides.
    //==========================================================================================================
    RequestDescriptor MakeDescriptor(Method method, const std::string& path, std::optional<std::string> body,
                                     const CallOptions& options = {}) const;

    RequestDescriptor BuildRequest(Method method, const std::string& path, const CallOptions& options = {}) const {
        return MakeDescriptor(method, path, std::nullopt, options);
    }

    //==========================================================================================================
    // Builds the descriptor for a call with a body encoded by the client's codec.
    // Throws:
    //   errors::RequestException carrying an Encoding error when the body cannot be encoded.
    //==========================================================================================================
    template <codec::EncodableBody B>
    RequestDescriptor BuildRequest(Method method, const std::string& path, const B& body,
                                   const CallOptions& options = {}) const {
        std::string encoded;
        try {
            encoded = codec::EncodePayload(*state->codec, body);
        } catch (const std::exception& e) {
            LOG_DEBUG("Body encoding failed for {} {}: {}", ToString(method), path, e.what());
            throw errors::RequestException(errors::encoding(std::current_exception()));
        } catch (...) {
            LOG_DEBUG("Body encoding failed for {} {} with a non-standard exception", ToString(method), path);
            throw errors::RequestException(errors::encoding(std::current_exception()));
        }
        return MakeDescriptor(method, path, std::move(encoded), options);
    }

    ////////////////////////////////////////// Execution /////////////////////////////////////////////////////
    //==========================================================================================================
    // Executes a pre-built descriptor and decodes a 2xx body into R.
    // Args:
    //   descriptor: Request to execute.
    //   stop: Cancels the call; the result is then a Cancelled failure.
    // Returns:
    //   Future resolving to Success<R> or Failure.
    //==========================================================================================================
    template <typename R>
    std::future<ExecutionResult<R>> Execute(RequestDescriptor descriptor, std::stop_token stop = {}) const {
        return detail::coExecute<R>(state, std::move(descriptor), std::move(stop)).toFuture();
    }

    // Build + execute without a body.
    template <typename R>
    std::future<ExecutionResult<R>> Send(Method method, const std::string& path, const CallOptions& options = {},
                                         std::stop_token stop = {}) const {
        if (state->baseHost.host.empty()) {
            return detail::ReadyResult<R>(detail::EarlyFailure(errors::invalidURL()));
        }
        return Execute<R>(MakeDescriptor(method, path, std::nullopt, options), std::move(stop));
    }

    // Build + execute with a body; encoding failures come back as Encoding failures.
    template <typename R, codec::EncodableBody B>
    std::future<ExecutionResult<R>> Send(Method method, const std::string& path, const B& body,
                                         const CallOptions& options = {}, std::stop_token stop = {}) const {
        if (state->baseHost.host.empty()) {
            return detail::ReadyResult<R>(detail::EarlyFailure(errors::invalidURL()));
        }
        std::optional<RequestDescriptor> descriptor;
        try {
            descriptor = BuildRequest(method, path, body, options);
        } catch (const errors::RequestException& e) {
            return detail::ReadyResult<R>(detail::EarlyFailure(e.error()));
        }
        return Execute<R>(std::move(*descriptor), std::move(stop));
    }

    ////////////////////////////////////////// Verb wrappers /////////////////////////////////////////////////
    template <typename R>
    std::future<ExecutionResult<R>> Get(const std::string& path, const CallOptions& options = {},
                                        std::stop_token stop = {}) const {
        return Send<R>(Method::Get, path, options, std::move(stop));
    }

    template <typename R, codec::EncodableBody B>
    std::future<ExecutionResult<R>> Post(const std::string& path, const B& body, const CallOptions& options = {},
                                         std::stop_token stop = {}) const {
        return Send<R>(Method::Post, path, body, options, std::move(stop));
    }

    template <typename R, codec::EncodableBody B>
    std::future<ExecutionResult<R>> Put(const std::string& path, const B& body, const CallOptions& options = {},
                                        std::stop_token stop = {}) const {
        return Send<R>(Method::Put, path, body, options, std::move(stop));
    }

    template <typename R, codec::EncodableBody B>
    std::future<ExecutionResult<R>> Patch(const std::string& path, const B& body, const CallOptions& options = {},
                                          std::stop_token stop = {}) const {
        return Send<R>(Method::Patch, path, body, options, std::move(stop));
    }

    template <typename R>
    std::future<ExecutionResult<R>> Delete(const std::string& path, const CallOptions& options = {},
                                           std::stop_token stop = {}) const {
        return Send<R>(Method::Delete, path, options, std::move(stop));
    }

    ////////////////////////////////////////// Cache /////////////////////////////////////////////////////////
    // Clears this client's isolated cache; no-op for clients on the shared cache.
    void ClearCache() const;

    // Clears the process-wide shared cache.
    static void ClearSharedCache();

private:
    std::shared_ptr<const detail::ClientState> state;
};

} // namespace courier
