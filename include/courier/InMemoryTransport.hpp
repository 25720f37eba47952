//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: In-process HTTP transport driven by a handler function, for tests and embedding
//==========================================================================================================
#pragma once

#include <functional>
#include <memory>
#include <vector>

#include "courier/Transport.h"

namespace courier {

//==========================================================================================================
// InMemoryTransport
// Purpose: Implements ITransport without networking. Requests are queued to a worker thread which applies
//          the request's cache policy and otherwise hands the request to the installed handler. Every
//          request that reaches the handler is recorded.
// Notes:
//   - A handler may throw TransportError (or any std::exception) to simulate a connection failure; the
//     exception is delivered through the returned future.
//   - Without a handler every loaded request answers 404 with an empty body.
//==========================================================================================================
class InMemoryTransport : public ITransport {
public:
    using Handler = std::function<TransportResponse(const TransportRequest&, std::stop_token)>;

    InMemoryTransport();
    explicit InMemoryTransport(Handler handler);
    ~InMemoryTransport() override;

    // Replaces the handler used for subsequent requests.
    void SetHandler(Handler handler);

    // Requests that reached the handler, in arrival order.
    std::vector<TransportRequest> ReceivedRequests() const;
    std::size_t RequestCount() const;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    //==========================================================================================================
    // Starts the worker thread.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops the worker and fails queued requests with TransportError.
    //==========================================================================================================
    std::future<void> Close() override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;

    //==========================================================================================================
    // Queues the exchange. Requests whose stop token fired before the worker reached them fail with
    // TransportError without invoking the handler.
    //==========================================================================================================
    std::future<TransportResponse> Send(TransportRequest request, std::stop_token stop) override;

    void SetErrorHandler(ErrorHandler handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// InMemoryTransportFactory
// Purpose: Creates handler-less in-memory transports. Config keys: "status" (answer status code, default
//          404), "body" (answer body) and "method" (only this verb is answered; others get 405 with Allow).
//==========================================================================================================
class InMemoryTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

} // namespace courier
