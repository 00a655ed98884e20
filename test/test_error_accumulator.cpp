// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include "fs_maintenance/utils/ErrorAccumulator.hpp"

using fs_maintenance::OpResult;
using fs_maintenance::utils::ErrorAccumulator;

TEST(ErrorAccumulatorTest, StartsEmpty) {
    ErrorAccumulator acc;
    EXPECT_TRUE(acc.empty());
    EXPECT_EQ(0u, acc.count());
    EXPECT_TRUE(acc.toResult().success);
}

TEST(ErrorAccumulatorTest, AddsMessagesWithDelimiter) {
    ErrorAccumulator acc;
    acc.add("first");
    acc.add("");
    acc.add("second");

    EXPECT_EQ(2u, acc.count());
    EXPECT_EQ("first; second", acc.str());
}

TEST(ErrorAccumulatorTest, IgnoresSuccessfulResults) {
    ErrorAccumulator acc;
    acc.add(OpResult::ok());
    acc.add(OpResult::failure("copy failed"));
    acc.add(OpResult::failure(""));

    EXPECT_EQ(2u, acc.count());
    EXPECT_EQ("copy failed; unknown error", acc.str());

    const auto result = acc.toResult();
    EXPECT_FALSE(result);
    EXPECT_EQ(acc.str(), result.error_message);
}
