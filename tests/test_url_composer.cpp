//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_url_composer.cpp
// Purpose: GoogleTests for path joining and URL composition
//==========================================================================================================

#include <gtest/gtest.h>
#include "courier/URLComposer.h"

using namespace courier;

TEST(URLComposer, JoinPathTrimsAndCollapses) {
    EXPECT_EQ(JoinPath("/api/v1", "users"), "/api/v1/users");
    EXPECT_EQ(JoinPath("/api/v1", "/users/"), "/api/v1/users");
    EXPECT_EQ(JoinPath("", "users//42"), "/users/42");
    EXPECT_EQ(JoinPath("/api", "  /users  "), "/api/users");
    EXPECT_EQ(JoinPath("", ""), "/");
    EXPECT_EQ(JoinPath("/api", ""), "/api");
    EXPECT_EQ(JoinPath("", "///"), "/");
}

TEST(URLComposer, ComposeBasic) {
    const ParsedHost host = ParseHost("https://example.com:8080/api");
    const auto url = ComposeURL(host, "/users/42");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(*url, "https://example.com:8080/api/users/42");
}

TEST(URLComposer, ComposeWithoutPort) {
    const auto url = ComposeURL(ParseHost("example.com"), "items");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(*url, "https://example.com/items");
}

TEST(URLComposer, EmptyHostIsInvalid) {
    EXPECT_FALSE(ComposeURL(ParseHost(""), "/x").has_value());
    EXPECT_FALSE(ComposeURL(ParseHost("https:///only/path"), "/x").has_value());
}

TEST(URLComposer, QueryIsEncodedAndSorted) {
    QueryMap q{{"z", "last"}, {"a", "hello world"}, {"m", "x&y=z"}};
    const auto url = ComposeURL(ParseHost("example.com"), "/search", q);
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(*url, "https://example.com/search?a=hello%20world&m=x%26y%3Dz&z=last");
}

TEST(URLComposer, EmptyQueryAddsNothing) {
    const auto url = ComposeURL(ParseHost("example.com"), "/search", QueryMap{});
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(*url, "https://example.com/search");
}

TEST(URLComposer, FragmentIsAppendedVerbatim) {
    const auto url = ComposeURL(ParseHost("example.com"), "/doc", std::nullopt, std::string("section 2"));
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(*url, "https://example.com/doc#section 2");

    const auto empty = ComposeURL(ParseHost("example.com"), "/doc", std::nullopt, std::string());
    ASSERT_TRUE(empty.has_value());
    EXPECT_EQ(*empty, "https://example.com/doc#");
}

TEST(URLComposer, PathCharactersAreEncoded) {
    const auto url = ComposeURL(ParseHost("example.com"), "/files/my file.txt");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(*url, "https://example.com/files/my%20file.txt");
    EXPECT_EQ(PercentEncodePath("/a:b@c"), "/a:b@c");
    EXPECT_EQ(PercentEncodeComponent("a/b"), "a%2Fb");
    EXPECT_EQ(PercentEncodeComponent("\xC3\xA9"), "%C3%A9");
}

TEST(URLComposer, IPv6Authority) {
    const auto url = ComposeURL(ParseHost("http://[::1]:9000/x"), "y");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(*url, "http://[::1]:9000/x/y");
}

TEST(URLComposer, FormatAuthority) {
    EXPECT_EQ(FormatAuthority("h", std::nullopt), "h");
    EXPECT_EQ(FormatAuthority("h", 81), "h:81");
}
