//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ICacheProvider.h
// Purpose: Response cache provider interface keyed by request signature
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "courier/Transport.h"

namespace courier {
namespace cache {

//==========================================================================================================
// ICacheProvider
// Purpose: Thread-safe store of prior responses.
// Methods:
//   Lookup(key): Stored response for key, if any.
//   Store(key, response): Inserts or replaces the entry for key.
//   Clear(): Drops every entry.
//==========================================================================================================
class ICacheProvider {
public:
    virtual ~ICacheProvider() = default;
    virtual std::optional<TransportResponse> Lookup(const std::string& key) = 0;
    virtual void Store(const std::string& key, const TransportResponse& response) = 0;
    virtual void Clear() = 0;
};

} // namespace cache
} // namespace courier
