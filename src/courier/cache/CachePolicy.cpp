//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CachePolicy.cpp
// Purpose: Cache lookup/store decisions applied by transports
//==========================================================================================================

#include "courier/cache/CachePolicy.h"
#include "courier/cache/ICacheProvider.h"
#include "logging/Logger.h"

namespace courier {
namespace cache {

bool IsStorable(Method method, int statusCode, const HeaderMap& headers) {
    if (method != Method::Get || statusCode < 200 || statusCode > 299) {
        return false;
    }
    if (auto cc = FindHeader(headers, "Cache-Control")) {
        if (ToLowerAscii(*cc).find("no-store") != std::string::npos) {
            return false;
        }
    }
    return true;
}

std::optional<TransportResponse> ServeFromCache(const TransportRequest& request) {
    const bool cacheOnly = request.cachePolicy == CachePolicy::ReturnCacheDataDontLoad;
    const bool usable = request.cache && request.method == Method::Get && !request.cacheKey.empty();
    if (usable && request.cachePolicy != CachePolicy::ReloadIgnoringLocalCacheData) {
        if (auto hit = request.cache->Lookup(request.cacheKey)) {
            LOG_DEBUG("Cache hit for {} ({})", request.url, ToString(request.cachePolicy));
            return hit;
        }
    }
    if (cacheOnly) {
        throw TransportError("No cached response for " + request.url + " and policy forbids loading");
    }
    return std::nullopt;
}

void StoreInCache(const TransportRequest& request, const TransportResponse& response) {
    if (!request.cache || request.cacheKey.empty() || !response.statusCode) {
        return;
    }
    if (!IsStorable(request.method, *response.statusCode, response.headers)) {
        return;
    }
    request.cache->Store(request.cacheKey, response);
}

} // namespace cache
} // namespace courier
