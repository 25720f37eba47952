//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Basic example issuing one GET through Client + BeastTransport and printing the outcome
//==========================================================================================================

#include <iostream>
#include <memory>
#include <string>

#include "courier/BeastTransport.hpp"
#include "courier/Client.h"
#include "courier/version.h"
#include "logging/Logger.h"

using namespace courier;

// Usage: courier_basic [host] [path] [transport-config]
//   e.g. courier_basic https://httpbin.org/ get "readTimeoutMs=5000;userAgent=courier-basic"
int main(int argc, char** argv) {
    FUNC_SCOPE();
    const std::string host = argc > 1 ? argv[1] : "https://httpbin.org";
    const std::string path = argc > 2 ? argv[2] : "get";
    const std::string config = argc > 3 ? argv[3] : "";

    LOG_INFO("courier {} -> GET {} {}", getVersionString(), host, path);

    BeastTransportFactory factory;
    std::shared_ptr<ITransport> transport = factory.CreateTransport(config);
    transport->SetErrorHandler([](const std::string& err) { LOG_WARN("transport: {}", err); });

    ClientOptions opts;
    opts.host = host;
    Client client(opts, transport);
    client.Connect().get();

    CallOptions call;
    call.query = QueryMap{{"source", "courier"}};
    auto result = client.Get<JSONValue>(path, call).get();

    std::cout << "canonical: " << result.canonicalString() << std::endl;
    std::cout << "signature: " << result.signature() << std::endl;
    int rc = 0;
    if (result.IsSuccess()) {
        const auto& ok = result.success();
        std::cout << "status: " << ok.status.statusCode << std::endl;
        std::cout << SerializeJSON(ok.value) << std::endl;
    } else {
        std::cout << "error: " << result.failure().error.describe() << std::endl;
        rc = 1;
    }

    client.Disconnect().get();
    return rc;
}
