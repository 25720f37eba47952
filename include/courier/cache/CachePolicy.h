//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CachePolicy.h
// Purpose: Cache policy rules shared by every transport
//==========================================================================================================

#pragma once

#include <optional>

#include "courier/Transport.h"

namespace courier {
namespace cache {

// True when a response to this method/status/headers may be stored (GET, 2xx, no "no-store").
bool IsStorable(Method method, int statusCode, const HeaderMap& headers);

//==========================================================================================================
// ServeFromCache
// Purpose: Consults request.cache according to request.cachePolicy before any network I/O.
// Returns:
//   The cached response to serve, or std::nullopt when the transport should load.
// Throws:
//   TransportError for ReturnCacheDataDontLoad when nothing is cached.
//==========================================================================================================
std::optional<TransportResponse> ServeFromCache(const TransportRequest& request);

// Stores a freshly loaded response when the request carries a cache and the response is storable.
void StoreInCache(const TransportRequest& request, const TransportResponse& response);

} // namespace cache
} // namespace courier
