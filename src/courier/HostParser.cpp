//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HostParser.cpp
// Purpose: Base host parsing (scheme detection, IPv6-aware host/port split, base path normalization)
//==========================================================================================================

#include <cctype>
#include <charconv>
#include "courier/HostParser.h"
#include "StringUtil.h"

namespace courier {

namespace {

// Length of a leading "scheme://" token, or 0 when the input has none.
// scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
std::size_t schemePrefixLength(const std::string& s) {
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0]))) {
        return 0;
    }
    std::size_t i = 1;
    while (i < s.size()) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        if (std::isalnum(c) || c == '+' || c == '-' || c == '.') {
            ++i;
        } else {
            break;
        }
    }
    if (s.compare(i, 3, "://") != 0) {
        return 0;
    }
    return i;
}

void splitHostAndPort(const std::string& token, ParsedHost& out) {
    if (!token.empty() && token.front() == '[') {
        const std::size_t close = token.find(']');
        if (close != std::string::npos) {
            const std::string rest = token.substr(close + 1);
            if (rest.empty()) {
                out.host = token;
                return;
            }
            if (rest.front() == ':') {
                if (auto port = ParsePortDigits(rest.substr(1))) {
                    out.host = token.substr(0, close + 1);
                    out.port = port;
                    return;
                }
            }
            // Malformed suffix is kept as part of the host
            out.host = token;
            return;
        }
    }
    const std::size_t colon = token.find(':');
    if (colon == std::string::npos) {
        out.host = token;
        return;
    }
    if (auto port = ParsePortDigits(token.substr(colon + 1))) {
        out.host = token.substr(0, colon);
        out.port = port;
        return;
    }
    out.host = token;
}

} // namespace

std::optional<int> ParsePortDigits(const std::string& digits) {
    if (digits.empty()) {
        return std::nullopt;
    }
    for (char c : digits) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
    }
    int value = 0;
    const char* first = digits.data();
    const char* last = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return value;
}

ParsedHost ParseHost(const std::string& raw) {
    ParsedHost out;
    std::string rest = raw;
    if (const std::size_t len = schemePrefixLength(raw); len > 0) {
        out.scheme = raw.substr(0, len);
        rest = raw.substr(len + 3);
    }

    rest = detail::TrimWhitespace(rest);
    const std::size_t slash = rest.find('/');
    const std::string hostPort = slash == std::string::npos ? rest : rest.substr(0, slash);
    const std::string pathPart = slash == std::string::npos ? std::string() : rest.substr(slash);

    splitHostAndPort(hostPort, out);

    const std::string joined = detail::JoinSegments(detail::SplitSegments(pathPart));
    out.basePath = joined.empty() ? std::string() : "/" + joined;
    return out;
}

} // namespace courier
