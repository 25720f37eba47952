//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_host_parser.cpp
// Purpose: GoogleTests for base host parsing (scheme, host, port, base path)
//==========================================================================================================

#include <gtest/gtest.h>
#include "courier/HostParser.h"

using namespace courier;

TEST(HostParser, FullUrlWithPortAndPath) {
    const ParsedHost p = ParseHost("https://example.com:8080/api/v1");
    EXPECT_EQ(p.scheme, "https");
    EXPECT_EQ(p.host, "example.com");
    ASSERT_TRUE(p.port.has_value());
    EXPECT_EQ(*p.port, 8080);
    EXPECT_EQ(p.basePath, "/api/v1");
}

TEST(HostParser, EmptyInput) {
    const ParsedHost p = ParseHost("");
    EXPECT_EQ(p.scheme, "https");
    EXPECT_EQ(p.host, "");
    EXPECT_FALSE(p.port.has_value());
    EXPECT_EQ(p.basePath, "");
}

TEST(HostParser, BareHostDefaultsToHttps) {
    const ParsedHost p = ParseHost("api.example.com");
    EXPECT_EQ(p, (ParsedHost{"https", "api.example.com", std::nullopt, ""}));
}

TEST(HostParser, SchemeCaseIsPreserved) {
    const ParsedHost p = ParseHost("HTTP://Example.com");
    EXPECT_EQ(p.scheme, "HTTP");
    EXPECT_EQ(p.host, "Example.com");
}

TEST(HostParser, CustomSchemeTokens) {
    EXPECT_EQ(ParseHost("git+ssh://repo.local/x").scheme, "git+ssh");
    EXPECT_EQ(ParseHost("my-app.v2://host").scheme, "my-app.v2");
    // Not a scheme: must start with a letter
    const ParsedHost p = ParseHost("1http://host");
    EXPECT_EQ(p.scheme, "https");
    EXPECT_EQ(p.host, "1http:");
}

TEST(HostParser, BracketedIPv6WithPort) {
    const ParsedHost p = ParseHost("http://[::1]:9000/x");
    EXPECT_EQ(p, (ParsedHost{"http", "[::1]", 9000, "/x"}));
}

TEST(HostParser, BracketedIPv6WithoutPort) {
    const ParsedHost p = ParseHost("[2001:db8::1]/v1/");
    EXPECT_EQ(p.host, "[2001:db8::1]");
    EXPECT_FALSE(p.port.has_value());
    EXPECT_EQ(p.basePath, "/v1");
}

TEST(HostParser, BracketedIPv6WithMalformedPortKeepsSuffix) {
    const ParsedHost p = ParseHost("[::1]:90x0");
    EXPECT_EQ(p.host, "[::1]:90x0");
    EXPECT_FALSE(p.port.has_value());
}

TEST(HostParser, NonNumericPortIsKeptInHost) {
    const ParsedHost p = ParseHost("host:notaport/p");
    EXPECT_EQ(p.host, "host:notaport");
    EXPECT_FALSE(p.port.has_value());
    EXPECT_EQ(p.basePath, "/p");
}

TEST(HostParser, TrailingGarbageAfterDigitsIsNotAPort) {
    const ParsedHost p = ParseHost("host:8080x");
    EXPECT_EQ(p.host, "host:8080x");
    EXPECT_FALSE(p.port.has_value());
}

TEST(HostParser, EmptyPortIsKeptInHost) {
    const ParsedHost p = ParseHost("host:");
    EXPECT_EQ(p.host, "host:");
    EXPECT_FALSE(p.port.has_value());
}

TEST(HostParser, PortOutOfIntRangeIsNotAPort) {
    const ParsedHost p = ParseHost("host:99999999999");
    EXPECT_EQ(p.host, "host:99999999999");
    EXPECT_FALSE(p.port.has_value());
}

TEST(HostParser, SplitsOnFirstColon) {
    const ParsedHost p = ParseHost("a:1:2");
    EXPECT_EQ(p.host, "a:1:2");
    EXPECT_FALSE(p.port.has_value());
}

TEST(HostParser, SurroundingWhitespaceIsTrimmed) {
    const ParsedHost p = ParseHost("https://  example.com:443/api  ");
    EXPECT_EQ(p.host, "example.com");
    EXPECT_EQ(p.port, 443);
    EXPECT_EQ(p.basePath, "/api");
}

TEST(HostParser, BasePathIsNormalized) {
    EXPECT_EQ(ParseHost("example.com//a///b//").basePath, "/a/b");
    EXPECT_EQ(ParseHost("example.com/").basePath, "");
    EXPECT_EQ(ParseHost("example.com///").basePath, "");
    EXPECT_EQ(ParseHost("example.com/single").basePath, "/single");
}

TEST(HostParser, PortDigits) {
    EXPECT_EQ(ParsePortDigits("0"), 0);
    EXPECT_EQ(ParsePortDigits("65535"), 65535);
    EXPECT_FALSE(ParsePortDigits("").has_value());
    EXPECT_FALSE(ParsePortDigits("-1").has_value());
    EXPECT_FALSE(ParsePortDigits("+80").has_value());
    EXPECT_FALSE(ParsePortDigits(" 80").has_value());
}
