/*
 * test_time_utils.cpp - Tests for timestamp helpers
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>

#include "utils/time_utils.hpp"

using namespace simdeck::utils;
using namespace testing;

namespace {

// 2024-12-01T08:30:00Z
const auto kSample = std::chrono::system_clock::from_time_t(1733041800);

}  // namespace

TEST(TimeUtilsTest, FormatRfc3339) {
    EXPECT_EQ(formatRfc3339(std::chrono::system_clock::from_time_t(0)),
              "1970-01-01T00:00:00Z");
    EXPECT_EQ(formatRfc3339(kSample), "2024-12-01T08:30:00Z");
}

TEST(TimeUtilsTest, FormatRfc3339_DropsSubseconds) {
    EXPECT_EQ(formatRfc3339(kSample + std::chrono::milliseconds(999)),
              "2024-12-01T08:30:00Z");
}

TEST(TimeUtilsTest, NowRfc3339_Shape) {
    EXPECT_THAT(nowRfc3339(),
                MatchesRegex("[0-9]{4}-[0-9]{2}-[0-9]{2}T[0-9]{2}:[0-9]{2}:"
                             "[0-9]{2}Z"));
}

TEST(TimeUtilsTest, FileTimestamp) {
    EXPECT_EQ(fileTimestamp(kSample), "20241201-083000");
}

TEST(TimeUtilsTest, ParseRfc3339_RoundTrip) {
    std::chrono::system_clock::time_point parsed;
    ASSERT_TRUE(parseRfc3339("2024-12-01T08:30:00Z", parsed));
    EXPECT_EQ(parsed, kSample);
}

TEST(TimeUtilsTest, ParseRfc3339_Rejects) {
    std::chrono::system_clock::time_point parsed;
    EXPECT_FALSE(parseRfc3339("2024-12-01 08:30:00", parsed));
    EXPECT_FALSE(parseRfc3339("2024-12-01T08:30:00", parsed));
    EXPECT_FALSE(parseRfc3339("2024-12-01T08:30:00Z trailing", parsed));
    EXPECT_FALSE(parseRfc3339("yesterday", parsed));
}
