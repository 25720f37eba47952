//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Headers.h
// Purpose: Header/query map types and case-insensitive header merging
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace courier {

// Header names keep the caller's casing; identity is case-insensitive.
using HeaderMap = std::unordered_map<std::string, std::string>;
using QueryMap = std::unordered_map<std::string, std::string>;

// ASCII lower-casing (header names are ASCII tokens).
std::string ToLowerAscii(const std::string& s);

//==========================================================================================================
// MergeHeaders
// Purpose: Overlays per-call headers on the defaults.
// Args:
//   defaults: Base headers.
//   overrides: Per-call headers. A key equal to a default key ignoring case replaces that entry, and the
//              override's spelling of the key is the one kept.
// Returns:
//   Merged map with one entry per case-insensitive key. When a single input map holds several spellings
//   of one key, the lexicographically greatest spelling wins so the outcome does not depend on hashing.
//==========================================================================================================
HeaderMap MergeHeaders(const HeaderMap& defaults, const HeaderMap& overrides);

// Case-insensitive lookup; an exact-case match is preferred.
std::optional<std::string> FindHeader(const HeaderMap& headers, const std::string& name);

} // namespace courier
