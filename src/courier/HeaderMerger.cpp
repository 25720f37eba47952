//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HeaderMerger.cpp
// Purpose: Case-insensitive default/per-call header merge
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <vector>
#include "courier/Headers.h"

namespace courier {

namespace {

std::vector<std::string> sortedKeys(const HeaderMap& m) {
    std::vector<std::string> keys;
    keys.reserve(m.size());
    for (const auto& kv : m) {
        keys.push_back(kv.first);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

// Applies every entry of src onto out, tracking the spelling in use per lowered key.
void overlay(HeaderMap& out, std::unordered_map<std::string, std::string>& spelling, const HeaderMap& src) {
    for (const auto& key : sortedKeys(src)) {
        const std::string lowered = ToLowerAscii(key);
        auto it = spelling.find(lowered);
        if (it != spelling.end()) {
            out.erase(it->second);
            it->second = key;
        } else {
            spelling.emplace(lowered, key);
        }
        out[key] = src.at(key);
    }
}

} // namespace

std::string ToLowerAscii(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

HeaderMap MergeHeaders(const HeaderMap& defaults, const HeaderMap& overrides) {
    HeaderMap out;
    std::unordered_map<std::string, std::string> spelling;
    overlay(out, spelling, defaults);
    overlay(out, spelling, overrides);
    return out;
}

std::optional<std::string> FindHeader(const HeaderMap& headers, const std::string& name) {
    const auto exact = headers.find(name);
    if (exact != headers.end()) {
        return exact->second;
    }
    const std::string lowered = ToLowerAscii(name);
    for (const auto& [k, v] : headers) {
        if (ToLowerAscii(k) == lowered) {
            return v;
        }
    }
    return std::nullopt;
}

} // namespace courier
