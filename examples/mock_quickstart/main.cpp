//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: MockClient quick-start: stub typed responses, call them, inspect the call log
//==========================================================================================================

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include "courier/testing/MockClient.h"

using namespace courier;

struct Todo {
    static constexpr const char* kTypeName = "Todo";
    int id{0};
    std::string title;
    bool done{false};

    static Todo FromJSON(const codec::Decoder& d) {
        return Todo{d.Decode<int>("id"), d.Decode<std::string>("title"),
                    d.DecodeIfPresent<bool>("done").value_or(false)};
    }

    JSONValue ToJSON() const {
        JSONValue::Object o;
        o["id"] = std::make_shared<JSONValue>(static_cast<int64_t>(id));
        o["title"] = std::make_shared<JSONValue>(title);
        o["done"] = std::make_shared<JSONValue>(done);
        return JSONValue(std::move(o));
    }
};

int main() {
    testing::MockClient mock;
    mock.Stub<Todo>(Method::Get, "todos/1", Todo{1, "write docs", false});
    mock.Stub<Todo>(Method::Post, "todos", Todo{2, "ship it", false}, 201);
    mock.StubFailure<Todo>(Method::Get, "todos/404", errors::server(404, std::string("not found")));

    auto first = mock.Get<Todo>("todos/1").get();
    if (first.IsSuccess()) {
        std::cout << "GET todos/1 -> " << first.success().value.title << std::endl;
    }

    auto created = mock.Post<Todo>("todos", Todo{0, "ship it", false}).get();
    if (created.IsSuccess()) {
        std::cout << "POST todos -> " << created.success().status.statusCode << " id=" << created.success().value.id
                  << std::endl;
    }

    auto missing = mock.Get<Todo>("todos/404").get();
    if (missing.IsFailure()) {
        std::cout << "GET todos/404 -> " << missing.failure().error.describe() << std::endl;
    }

    auto unstubbed = mock.Delete<Todo>("todos/1").get();
    std::cout << "DELETE todos/1 -> " << errors::toString(unstubbed.failure().error.kind) << std::endl;

    std::cout << "calls recorded: " << mock.CallCount() << std::endl;
    std::cout << "GET todos/1 called: " << std::boolalpha << mock.WasCalled(Method::Get, "todos/1") << std::endl;
    return 0;
}
