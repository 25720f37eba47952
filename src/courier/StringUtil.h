//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StringUtil.h
// Purpose: Internal string helpers shared by host parsing, URL composition and canonicalization
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

namespace courier {
namespace detail {

inline bool IsWhitespace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

inline std::string TrimWhitespace(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && IsWhitespace(s[b])) {
        ++b;
    }
    while (e > b && IsWhitespace(s[e - 1])) {
        --e;
    }
    return s.substr(b, e - b);
}

// Splits on '/', dropping empty pieces (collapses runs of '/' and strips leading/trailing '/').
inline std::vector<std::string> SplitSegments(const std::string& path) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= path.size()) {
        std::size_t sep = path.find('/', start);
        if (sep == std::string::npos) {
            sep = path.size();
        }
        std::string seg = path.substr(start, sep - start);
        if (!seg.empty()) {
            out.push_back(std::move(seg));
        }
        start = sep + 1;
    }
    return out;
}

inline std::string JoinSegments(const std::vector<std::string>& segs) {
    std::string out;
    for (std::size_t i = 0; i < segs.size(); ++i) {
        if (i > 0) {
            out.push_back('/');
        }
        out += segs[i];
    }
    return out;
}

} // namespace detail
} // namespace courier
