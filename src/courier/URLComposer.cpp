//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: URLComposer.cpp
// Purpose: Path joining, percent-encoding and URL assembly
//==========================================================================================================

#include <algorithm>
#include <sstream>
#include <vector>
#include "courier/URLComposer.h"
#include "StringUtil.h"

namespace courier {

namespace {

bool isUnreserved(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_' || c == '.' || c == '~';
}

bool isPathChar(unsigned char c) {
    static const std::string kExtra = "!$&'()*+,;=:@/";
    return isUnreserved(c) || kExtra.find(static_cast<char>(c)) != std::string::npos;
}

template <typename Pred>
std::string encodeWhere(const std::string& s, Pred keep) {
    static const char* hex = "0123456789ABCDEF";
    std::ostringstream oss;
    for (char ch : s) {
        const unsigned char c = static_cast<unsigned char>(ch);
        if (keep(c)) {
            oss << ch;
        } else {
            oss << '%' << hex[(c >> 4) & 0xFu] << hex[c & 0xFu];
        }
    }
    return oss.str();
}

std::string trimSlashesAndWhitespace(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && (s[b] == '/' || detail::IsWhitespace(s[b]))) {
        ++b;
    }
    while (e > b && (s[e - 1] == '/' || detail::IsWhitespace(s[e - 1]))) {
        --e;
    }
    return s.substr(b, e - b);
}

} // namespace

std::string JoinPath(const std::string& basePath, const std::string& path) {
    std::vector<std::string> parts;
    for (const std::string* side : {&basePath, &path}) {
        std::string trimmed = trimSlashesAndWhitespace(*side);
        if (!trimmed.empty()) {
            parts.push_back(std::move(trimmed));
        }
    }
    // Re-split so interior runs of '/' collapse too
    return "/" + detail::JoinSegments(detail::SplitSegments(detail::JoinSegments(parts)));
}

std::string FormatAuthority(const std::string& host, const std::optional<int>& port) {
    if (!port) {
        return host;
    }
    return host + ":" + std::to_string(*port);
}

std::string PercentEncodeComponent(const std::string& s) {
    return encodeWhere(s, isUnreserved);
}

std::string PercentEncodePath(const std::string& path) {
    return encodeWhere(path, isPathChar);
}

std::optional<std::string> ComposeURL(const ParsedHost& parsed,
                                      const std::string& path,
                                      const std::optional<QueryMap>& query,
                                      const std::optional<std::string>& fragment) {
    if (parsed.host.empty()) {
        return std::nullopt;
    }
    std::string url = parsed.scheme + "://" + FormatAuthority(parsed.host, parsed.port);
    url += PercentEncodePath(JoinPath(parsed.basePath, path));
    if (query && !query->empty()) {
        std::vector<std::pair<std::string, std::string>> pairs(query->begin(), query->end());
        std::sort(pairs.begin(), pairs.end());
        url.push_back('?');
        for (std::size_t i = 0; i < pairs.size(); ++i) {
            if (i > 0) {
                url.push_back('&');
            }
            url += PercentEncodeComponent(pairs[i].first) + "=" + PercentEncodeComponent(pairs[i].second);
        }
    }
    if (fragment) {
        url += "#" + *fragment;
    }
    return url;
}

} // namespace courier
