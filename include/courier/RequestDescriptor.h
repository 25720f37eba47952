//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestDescriptor.h
// Purpose: HTTP method, cache policy and the fully resolved per-call request description
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "courier/Headers.h"

namespace courier {

enum class Method {
    Get,
    Post,
    Put,
    Patch,
    Delete
};

// "GET", "POST", ...
const char* ToString(Method method);
// Case-sensitive inverse of ToString.
std::optional<Method> MethodFromString(const std::string& name);

//==========================================================================================================
// CachePolicy
// Purpose: Per-request cache behaviour forwarded to the transport.
//   UseProtocolCachePolicy: Serve a stored response when present, otherwise load and store.
//   ReloadIgnoringLocalCacheData: Always load; store the fresh response.
//   ReturnCacheDataElseLoad: Same lookup as UseProtocolCachePolicy (stored entries are not revalidated).
//   ReturnCacheDataDontLoad: Serve a stored response or fail without touching the network.
//==========================================================================================================
enum class CachePolicy {
    UseProtocolCachePolicy,
    ReloadIgnoringLocalCacheData,
    ReturnCacheDataElseLoad,
    ReturnCacheDataDontLoad
};

const char* ToString(CachePolicy policy);

//==========================================================================================================
// RequestDescriptor
// Purpose: Immutable value describing one call after host parsing, path joining, header merging and body
//          encoding. Built fresh per call and consumed by the executor.
// Fields:
//   path: Joined base path + call path ("/a/b"), unencoded.
//   headers: Merged headers (defaults overlaid with per-call headers).
//   query/fragment: Per-call URL parts, unencoded.
//   body: Encoded request body, when the call has one.
//==========================================================================================================
struct RequestDescriptor {
    Method method{Method::Get};
    std::string scheme{"https"};
    std::string host;
    std::optional<int> port;
    std::string path{"/"};
    HeaderMap headers;
    std::optional<QueryMap> query;
    std::optional<std::string> fragment;
    std::optional<std::string> body;
    CachePolicy cachePolicy{CachePolicy::UseProtocolCachePolicy};
};

} // namespace courier
