//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MemoryCache.cpp
// Purpose: LRU list + index implementation of the in-memory response cache
//==========================================================================================================

#include <list>
#include <mutex>
#include <unordered_map>

#include "courier/cache/MemoryCache.hpp"
#include "logging/Logger.h"

namespace courier {
namespace cache {

class MemoryCache::Impl {
public:
    struct Entry {
        std::string key;
        TransportResponse response;
        std::size_t cost{0};
    };

    explicit Impl(std::size_t capacity) : capacityBytes(capacity) {}

    static std::size_t costOf(const std::string& key, const TransportResponse& r) {
        std::size_t cost = key.size() + r.body.size();
        for (const auto& [k, v] : r.headers) {
            cost += k.size() + v.size();
        }
        return cost;
    }

    void evictUntilFits() {
        while (sizeBytes > capacityBytes && !lru.empty()) {
            Entry& victim = lru.back();
            LOG_DEBUG("MemoryCache: evicting {} ({} bytes)", victim.key, victim.cost);
            sizeBytes -= victim.cost;
            index.erase(victim.key);
            lru.pop_back();
        }
    }

    mutable std::mutex mutex;
    std::size_t capacityBytes;
    std::size_t sizeBytes{0};
    std::list<Entry> lru; // front = most recently used
    std::unordered_map<std::string, std::list<Entry>::iterator> index;
};

MemoryCache::MemoryCache(std::size_t capacityBytes)
    : pImpl(std::make_unique<Impl>(capacityBytes)) {}

MemoryCache::~MemoryCache() = default;

std::optional<TransportResponse> MemoryCache::Lookup(const std::string& key) {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    auto it = pImpl->index.find(key);
    if (it == pImpl->index.end()) {
        return std::nullopt;
    }
    pImpl->lru.splice(pImpl->lru.begin(), pImpl->lru, it->second);
    return it->second->response;
}

void MemoryCache::Store(const std::string& key, const TransportResponse& response) {
    const std::size_t cost = Impl::costOf(key, response);
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    auto it = pImpl->index.find(key);
    if (it != pImpl->index.end()) {
        pImpl->sizeBytes -= it->second->cost;
        pImpl->lru.erase(it->second);
        pImpl->index.erase(it);
    }
    if (cost > pImpl->capacityBytes) {
        LOG_DEBUG("MemoryCache: {} bytes exceeds capacity {}; not stored", cost, pImpl->capacityBytes);
        return;
    }
    pImpl->lru.push_front(Impl::Entry{key, response, cost});
    pImpl->index[key] = pImpl->lru.begin();
    pImpl->sizeBytes += cost;
    pImpl->evictUntilFits();
}

void MemoryCache::Clear() {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    pImpl->lru.clear();
    pImpl->index.clear();
    pImpl->sizeBytes = 0;
}

std::size_t MemoryCache::Count() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->lru.size();
}

std::size_t MemoryCache::SizeBytes() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->sizeBytes;
}

std::size_t MemoryCache::CapacityBytes() const {
    return pImpl->capacityBytes;
}

std::shared_ptr<MemoryCache> MemoryCache::Shared() {
    static std::shared_ptr<MemoryCache> shared = std::make_shared<MemoryCache>();
    return shared;
}

} // namespace cache
} // namespace courier
