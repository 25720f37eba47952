//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MemoryCache.hpp
// Purpose: Byte-budgeted in-memory LRU response cache
//==========================================================================================================

#pragma once

#include <cstddef>
#include <memory>

#include "courier/cache/ICacheProvider.h"

namespace courier {
namespace cache {

//==========================================================================================================
// MemoryCache
// Purpose: Thread-safe LRU cache. An entry costs its body, header and key bytes; inserting beyond the
//          capacity evicts least recently used entries. Entries larger than the capacity are not kept.
//==========================================================================================================
class MemoryCache : public ICacheProvider {
public:
    static constexpr std::size_t kDefaultCapacityBytes = 4 * 1024 * 1024;

    explicit MemoryCache(std::size_t capacityBytes = kDefaultCapacityBytes);
    ~MemoryCache() override;

    std::optional<TransportResponse> Lookup(const std::string& key) override;
    void Store(const std::string& key, const TransportResponse& response) override;
    void Clear() override;

    std::size_t Count() const;
    std::size_t SizeBytes() const;
    std::size_t CapacityBytes() const;

    // Process-wide cache used by clients configured with the shared cache.
    static std::shared_ptr<MemoryCache> Shared();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace cache
} // namespace courier
