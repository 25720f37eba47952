//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Canonicalizer.cpp
// Purpose: Request canonical forms (observable and signing variants)
//==========================================================================================================

#include <algorithm>
#include <utility>
#include <vector>
#include "courier/Canonicalizer.h"
#include "courier/Signature.h"
#include "courier/URLComposer.h"

namespace courier {

namespace {

using Pairs = std::vector<std::pair<std::string, std::string>>;

std::string joinPairs(Pairs pairs, char kvSep) {
    std::sort(pairs.begin(), pairs.end());
    std::string out;
    for (std::size_t i = 0; i < pairs.size(); ++i) {
        if (i > 0) {
            out.push_back('&');
        }
        out += pairs[i].first;
        out.push_back(kvSep);
        out += pairs[i].second;
    }
    return out;
}

std::string urlPart(const RequestDescriptor& d) {
    std::string out = d.scheme + "://" + FormatAuthority(d.host, d.port) + d.path;
    if (d.query && !d.query->empty()) {
        out += "?" + CanonicalQuery(*d.query);
    }
    if (d.fragment && !d.fragment->empty()) {
        out += "#" + *d.fragment;
    }
    return out;
}

std::string headersPart(const RequestDescriptor& d) {
    if (d.headers.empty()) {
        return std::string();
    }
    return "|headers:" + CanonicalHeaders(d.headers);
}

} // namespace

std::string CanonicalQuery(const QueryMap& query) {
    return joinPairs(Pairs(query.begin(), query.end()), '=');
}

std::string CanonicalHeaders(const HeaderMap& headers) {
    Pairs lowered;
    lowered.reserve(headers.size());
    for (const auto& [k, v] : headers) {
        lowered.emplace_back(ToLowerAscii(k), v);
    }
    return joinPairs(std::move(lowered), ':');
}

std::string Canonicalize(const RequestDescriptor& descriptor) {
    return std::string(ToString(descriptor.method)) + "|" + urlPart(descriptor) + headersPart(descriptor);
}

std::string CanonicalizeForSigning(const RequestDescriptor& descriptor) {
    std::string out = std::string(ToString(descriptor.method)) + "|" + urlPart(descriptor);
    if (descriptor.body && !descriptor.body->empty()) {
        out += "|body:" + Sha256Hex(*descriptor.body);
    }
    return out + headersPart(descriptor);
}

} // namespace courier
