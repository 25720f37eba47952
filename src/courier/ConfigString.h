//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConfigString.h
// Purpose: Parsing of semicolon-delimited key=value transport configuration strings
//==========================================================================================================

#pragma once

#include <charconv>
#include <string>
#include <type_traits>

namespace courier {
namespace detail {

//==========================================================================================================
// ForEachConfigEntry
// Purpose: Invokes fn(key, value) for each "key=value" entry of "k1=v1; k2=v2". Keys and values are
//          trimmed of spaces/tabs; entries without '=' or with an empty key are skipped.
//==========================================================================================================
template <typename Fn>
void ForEachConfigEntry(const std::string& config, Fn&& fn) {
    auto trim = [](const std::string& s) -> std::string {
        std::size_t b = 0, e = s.size();
        while (b < e && (s[b] == ' ' || s[b] == '\t')) {
            ++b;
        }
        while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) {
            --e;
        }
        return s.substr(b, e - b);
    };

    std::size_t start = 0;
    while (start < config.size()) {
        std::size_t sep = config.find(';', start);
        if (sep == std::string::npos) {
            sep = config.size();
        }
        const std::string kv = trim(config.substr(start, sep - start));
        const std::size_t eq = kv.find('=');
        if (eq != std::string::npos) {
            const std::string key = trim(kv.substr(0, eq));
            if (!key.empty()) {
                fn(key, trim(kv.substr(eq + 1)));
            }
        }
        start = sep + 1;
    }
}

// Parses a decimal number into out. Leaves out untouched and returns false on malformed input.
template <typename T>
bool ParseUnsigned(const std::string& text, T& out) {
    static_assert(std::is_integral_v<T>);
    T value{};
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc() || ptr != last || value < T{}) {
        return false;
    }
    out = value;
    return true;
}

} // namespace detail
} // namespace courier
