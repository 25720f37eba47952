//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.cpp
// Purpose: Client construction, request descriptor building and cache control
//==========================================================================================================

#include <stdexcept>
#include <type_traits>

#include "logging/Logger.h"
#include "courier/Client.h"

namespace courier {

namespace {

std::shared_ptr<const detail::ClientState> makeState(ClientOptions options, std::shared_ptr<ITransport> transport) {
    if (!transport) {
        throw std::invalid_argument("Client requires a transport");
    }
    auto state = std::make_shared<detail::ClientState>();
    state->baseHost = ParseHost(options.host);
    if (options.port) {
        state->baseHost.port = options.port;
    }
    state->defaultHeaders = std::move(options.defaultHeaders);
    state->defaultCachePolicy = options.defaultCachePolicy;
    std::visit([&state](const auto& mode) {
        using M = std::decay_t<decltype(mode)>;
        if constexpr (std::is_same_v<M, IsolatedCache>) {
            state->cache = std::make_shared<cache::MemoryCache>(mode.memoryCapacityBytes);
            state->isolatedCache = true;
        } else {
            state->cache = cache::MemoryCache::Shared();
        }
    }, options.cache);
    state->codec = options.codec ? std::move(options.codec) : std::make_shared<codec::JsonCodec>();
    state->transport = std::move(transport);
    state->cancelPoll = std::chrono::milliseconds(options.cancelPollMs == 0 ? 1 : options.cancelPollMs);
    return state;
}

} // namespace

Client::Client(ClientOptions options, std::shared_ptr<ITransport> transport)
    : state(makeState(std::move(options), std::move(transport))) {
    if (state->baseHost.host.empty()) {
        LOG_WARN("Client created without a usable host; every call will fail with invalidURL");
    } else {
        LOG_DEBUG("Client created for {}://{}{}", state->baseHost.scheme,
                  FormatAuthority(state->baseHost.host, state->baseHost.port), state->baseHost.basePath);
    }
}

Client::~Client() = default;

std::future<void> Client::Connect() {
    FUNC_SCOPE();
    return state->transport->Start();
}

std::future<void> Client::Disconnect() {
    FUNC_SCOPE();
    return state->transport->Close();
}

bool Client::IsConnected() const {
    return state->transport->IsConnected();
}

const ParsedHost& Client::BaseHost() const {
    return state->baseHost;
}

RequestDescriptor Client::MakeDescriptor(Method method, const std::string& path, std::optional<std::string> body,
                                         const CallOptions& options) const {
    RequestDescriptor d;
    d.method = method;
    d.scheme = state->baseHost.scheme;
    d.host = state->baseHost.host;
    d.port = state->baseHost.port;
    d.path = JoinPath(state->baseHost.basePath, path);
    d.headers = MergeHeaders(state->defaultHeaders, options.headers);
    d.query = options.query;
    d.fragment = options.fragment;
    d.body = std::move(body);
    d.cachePolicy = options.cachePolicy.value_or(state->defaultCachePolicy);
    return d;
}

void Client::ClearCache() const {
    if (state->isolatedCache) {
        state->cache->Clear();
    }
}

void Client::ClearSharedCache() {
    cache::MemoryCache::Shared()->Clear();
}

} // namespace courier
