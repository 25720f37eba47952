//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HostParser.h
// Purpose: Parse a free-form base host string into scheme, host, port and base path
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

namespace courier {

//==========================================================================================================
// ParsedHost
// Purpose: Normalized base host of a client. Immutable once the client is built.
// Fields:
//   scheme: URL scheme as written by the caller (case preserved); "https" when none was given.
//   host: Host name, IPv4 literal or bracketed IPv6 literal. Empty when the input carried no host.
//   port: Explicit port when one parsed cleanly.
//   basePath: "" or "/seg[/seg...]" (single leading slash, no trailing slash, no empty segments).
//==========================================================================================================
struct ParsedHost {
    std::string scheme{"https"};
    std::string host;
    std::optional<int> port;
    std::string basePath;

    bool operator==(const ParsedHost&) const = default;
};

//==========================================================================================================
// ParseHost
// Purpose: Parses raw input of the form [scheme://]host[:port][/base/path]. Never throws.
// Notes:
//   - A port suffix that is not all digits (e.g. "host:8080x", "host:") is not stripped: the whole
//     host-and-port token becomes the host and no port is set.
//   - "[v6]" literals keep their brackets; "[v6]:port" yields the port.
//==========================================================================================================
ParsedHost ParseHost(const std::string& raw);

// Parses a decimal port made only of ASCII digits that fits in int. Returns nullopt otherwise.
std::optional<int> ParsePortDigits(const std::string& digits);

} // namespace courier
