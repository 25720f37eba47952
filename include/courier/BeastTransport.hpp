//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BeastTransport.hpp
// Purpose: Coroutine-based HTTP/HTTPS client transport using Boost.Beast (TLS 1.2+ for HTTPS)
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <future>

#include "courier/Transport.h"

namespace courier {

//==========================================================================================================
// BeastTransport
// Purpose: Concrete HTTP/1.1 transport implementing ITransport with Boost.Beast coroutines running on a
//          private io_context thread. One connection per exchange ("Connection: close").
//==========================================================================================================
class BeastTransport : public ITransport {
public:
    //==========================================================================================================
    // Options
    // Purpose: Timeouts and TLS verification settings.
    // Fields:
    //   connectTimeoutMs: Resolve + connect + TLS handshake budget in milliseconds
    //   readTimeoutMs: Write + read budget in milliseconds
    //   caFile/caPath: Optional CA bundle/path for the trust store (system defaults otherwise)
    //   serverName: TLS SNI and hostname verification name override (defaults to the URL host)
    //   userAgent: User-Agent header sent unless the request sets one
    //   maxBodyBytes: Largest accepted response body
    //==========================================================================================================
    struct Options {
        unsigned int connectTimeoutMs{10000};
        unsigned int readTimeoutMs{30000};
        std::string caFile;
        std::string caPath;
        std::string serverName;
        std::string userAgent{"courier"};
        std::size_t maxBodyBytes{64u * 1024u * 1024u};
    };

    BeastTransport();
    explicit BeastTransport(const Options& opts);
    ~BeastTransport() override;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport I/O loop. Returns when the worker is ready to accept requests.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Closes the transport, stops the I/O loop and fails exchanges still in flight.
    //==========================================================================================================
    std::future<void> Close() override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;

    //==========================================================================================================
    // Performs one exchange against request.url ("http" or "https" schemes).
    // Notes:
    //   - Connection, DNS, TLS and timeout failures resolve the future with TransportError.
    //   - A reply that is not parseable HTTP resolves with a response whose statusCode is absent.
    //   - Stopping the token aborts the socket; the future then holds TransportError.
    //==========================================================================================================
    std::future<TransportResponse> Send(TransportRequest request, std::stop_token stop) override;

    void SetErrorHandler(ErrorHandler handler) override;

    const Options& GetOptions() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// BeastTransportFactory
// Purpose: Parses "connectTimeoutMs=..;readTimeoutMs=..;caFile=..;caPath=..;serverName=..;userAgent=..;
//          maxBodyBytes=.." into Options. Unknown keys are ignored; malformed numbers keep defaults.
//==========================================================================================================
class BeastTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

} // namespace courier
