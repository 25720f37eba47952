//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: URLComposer.h
// Purpose: Compose absolute request URLs from a parsed base host and per-call path/query/fragment
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "courier/Headers.h"
#include "courier/HostParser.h"

namespace courier {

//==========================================================================================================
// JoinPath
// Purpose: Joins base path and call path into "/seg/seg". Each side is trimmed of surrounding whitespace
//          and '/', empty parts are dropped and runs of '/' collapse to one. Both empty yields "/".
//==========================================================================================================
std::string JoinPath(const std::string& basePath, const std::string& path);

// "host" or "host:port".
std::string FormatAuthority(const std::string& host, const std::optional<int>& port);

// Percent-encodes every byte outside the RFC 3986 unreserved set.
std::string PercentEncodeComponent(const std::string& s);

// Percent-encodes a path, keeping '/', ':', '@' and the sub-delims.
std::string PercentEncodePath(const std::string& path);

//==========================================================================================================
// ComposeURL
// Purpose: Builds "scheme://host[:port]/path[?k=v&...][#fragment]".
// Args:
//   parsed: Base host configuration.
//   path: Call path, joined onto parsed.basePath.
//   query: Optional query pairs; encoded and written in key order. Empty maps add nothing.
//   fragment: Optional fragment, appended verbatim after '#'.
// Returns:
//   The URL string, or std::nullopt when parsed.host is empty.
//==========================================================================================================
std::optional<std::string> ComposeURL(const ParsedHost& parsed,
                                      const std::string& path,
                                      const std::optional<QueryMap>& query = std::nullopt,
                                      const std::optional<std::string>& fragment = std::nullopt);

} // namespace courier
