//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_header_merger.cpp
// Purpose: GoogleTests for case-insensitive default/per-call header merging
//==========================================================================================================

#include <gtest/gtest.h>
#include "courier/Headers.h"

using namespace courier;

TEST(HeaderMerger, OverrideCasingWins) {
    const HeaderMap merged = MergeHeaders({{"Accept", "a"}}, {{"accept", "b"}});
    ASSERT_EQ(merged.size(), 1u);
    ASSERT_EQ(merged.count("accept"), 1u);
    EXPECT_EQ(merged.at("accept"), "b");
    EXPECT_EQ(merged.count("Accept"), 0u);
}

TEST(HeaderMerger, DisjointKeysAreUnion) {
    const HeaderMap merged = MergeHeaders({{"Accept", "application/json"}}, {{"X-Trace", "1"}});
    EXPECT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged.at("Accept"), "application/json");
    EXPECT_EQ(merged.at("X-Trace"), "1");
}

TEST(HeaderMerger, EmptyOverridesKeepDefaults) {
    const HeaderMap defaults{{"Accept", "a"}, {"Content-Type", "b"}};
    EXPECT_EQ(MergeHeaders(defaults, {}), defaults);
}

TEST(HeaderMerger, EmptyDefaultsTakeOverrides) {
    const HeaderMap overrides{{"X-One", "1"}};
    EXPECT_EQ(MergeHeaders({}, overrides), overrides);
}

TEST(HeaderMerger, DuplicateSpellingsWithinOneMapCollapse) {
    const HeaderMap merged = MergeHeaders({}, {{"X-Key", "upper"}, {"x-key", "lower"}});
    ASSERT_EQ(merged.size(), 1u);
    // Spellings are applied in sorted order, so the lexicographically greatest one remains
    EXPECT_EQ(merged.count("x-key"), 1u);
    EXPECT_EQ(merged.at("x-key"), "lower");
}

TEST(HeaderMerger, OverrideReplacesOnlyMatchingKey) {
    const HeaderMap merged = MergeHeaders({{"Accept", "a"}, {"Content-Type", "json"}},
                                          {{"CONTENT-TYPE", "text/plain"}});
    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged.at("Accept"), "a");
    EXPECT_EQ(merged.at("CONTENT-TYPE"), "text/plain");
}

TEST(HeaderMerger, FindHeaderIsCaseInsensitive) {
    const HeaderMap h{{"Content-Type", "application/json"}};
    EXPECT_EQ(FindHeader(h, "content-type"), "application/json");
    EXPECT_EQ(FindHeader(h, "Content-Type"), "application/json");
    EXPECT_FALSE(FindHeader(h, "Accept").has_value());
}

TEST(HeaderMerger, ToLowerAscii) {
    EXPECT_EQ(ToLowerAscii("X-Request-ID"), "x-request-id");
    EXPECT_EQ(ToLowerAscii(""), "");
}
