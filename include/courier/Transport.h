//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: HTTP transport provider interfaces and the request/response values exchanged with them
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>

#include "courier/Headers.h"
#include "courier/RequestDescriptor.h"

namespace courier {

namespace cache {
class ICacheProvider;
}

//==========================================================================================================
// TransportRequest
// Purpose: One outgoing HTTP exchange.
// Fields:
//   method/url/headers/body: What goes on the wire. url is absolute and already percent-encoded.
//   cachePolicy: Cache behaviour requested by the caller.
//   cacheKey: Key for cache lookups/stores (the request signature).
//   cache: Cache provider to use; null disables caching regardless of policy.
//==========================================================================================================
struct TransportRequest {
    Method method{Method::Get};
    std::string url;
    HeaderMap headers;
    std::optional<std::string> body;
    CachePolicy cachePolicy{CachePolicy::UseProtocolCachePolicy};
    std::string cacheKey;
    std::shared_ptr<cache::ICacheProvider> cache;
};

//==========================================================================================================
// TransportResponse
// Purpose: What came back. statusCode is absent when the peer's reply could not be read as an HTTP
//          response; such replies classify as invalid responses.
//==========================================================================================================
struct TransportResponse {
    std::optional<int> statusCode;
    HeaderMap headers;
    std::string body;
};

//==========================================================================================================
// TransportError
// Purpose: Connection-class failure (resolve, connect, TLS, timeout, closed transport, cache-only miss).
//==========================================================================================================
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

//==========================================================================================================
// Transport interface
// Purpose: Provider of HTTP exchanges. Implementations are thread-safe for concurrent Send calls.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport I/O loop.
    // Returns:
    //   A future that completes when the transport accepts requests.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Closes the transport. Requests still in flight fail with TransportError.
    // Returns:
    //   A future that completes when the transport has closed.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    //==========================================================================================================
    // Indicates whether the transport is running.
    //==========================================================================================================
    virtual bool IsConnected() const = 0;

    //==========================================================================================================
    // Returns a transport session identifier for diagnostics.
    //==========================================================================================================
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Exchanges ///////////////////////////////////////////
    //==========================================================================================================
    // Performs one HTTP exchange.
    // Args:
    //   request: Request to send, including cache instructions.
    //   stop: Cancellation; a stopped exchange is abandoned and its future fails with TransportError.
    // Returns:
    //   Future resolving to the response, or holding TransportError.
    //==========================================================================================================
    virtual std::future<TransportResponse> Send(TransportRequest request, std::stop_token stop) = 0;

    /////////////////////////////////////////// Error handling ///////////////////////////////////////////
    //==========================================================================================================
    // Registers a callback receiving diagnostic error strings.
    //==========================================================================================================
    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

//==========================================================================================================
// Transport factory interface
// Purpose: Factory for creating transports from configuration strings.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    //==========================================================================================================
    // Creates a transport instance using the provided configuration.
    // Args:
    //   config: Transport-specific "key=value;key=value" configuration.
    // Returns:
    //   A unique_ptr to a newly created (not yet started) ITransport.
    //==========================================================================================================
    virtual std::unique_ptr<ITransport> CreateTransport(const std::string& config) = 0;
};

} // namespace courier
