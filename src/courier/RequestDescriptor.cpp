//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestDescriptor.cpp
// Purpose: String forms for Method and CachePolicy
//==========================================================================================================

#include "courier/RequestDescriptor.h"

namespace courier {

const char* ToString(Method method) {
    switch (method) {
        case Method::Get: return "GET";
        case Method::Post: return "POST";
        case Method::Put: return "PUT";
        case Method::Patch: return "PATCH";
        case Method::Delete: return "DELETE";
    }
    return "GET";
}

std::optional<Method> MethodFromString(const std::string& name) {
    if (name == "GET") return Method::Get;
    if (name == "POST") return Method::Post;
    if (name == "PUT") return Method::Put;
    if (name == "PATCH") return Method::Patch;
    if (name == "DELETE") return Method::Delete;
    return std::nullopt;
}

const char* ToString(CachePolicy policy) {
    switch (policy) {
        case CachePolicy::UseProtocolCachePolicy: return "useProtocolCachePolicy";
        case CachePolicy::ReloadIgnoringLocalCacheData: return "reloadIgnoringLocalCacheData";
        case CachePolicy::ReturnCacheDataElseLoad: return "returnCacheDataElseLoad";
        case CachePolicy::ReturnCacheDataDontLoad: return "returnCacheDataDontLoad";
    }
    return "useProtocolCachePolicy";
}

} // namespace courier
