// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "strikeopt/optimizer/strike_grid.hpp"

using namespace strikeopt;

TEST(StrikeGridTest, EndpointsAreExact) {
    StrikeGrid grid(28.0, 840.0, 1000);
    EXPECT_EQ(grid.size(), 1000u);
    EXPECT_EQ(grid[0], 28.0);
    EXPECT_EQ(grid[999], 840.0);
}

TEST(StrikeGridTest, EvenSpacing) {
    StrikeGrid grid(28.0, 840.0, 100);
    EXPECT_NEAR(grid.step(), 812.0 / 99.0, 1e-12);
    for (size_t i = 1; i < grid.size(); ++i) {
        EXPECT_NEAR(grid[i] - grid[i - 1], grid.step(), 1e-9) << "i=" << i;
    }
}

TEST(StrikeGridTest, StrictlyIncreasing) {
    StrikeGrid grid(0.5, 0.6, 1000);
    for (size_t i = 1; i < grid.size(); ++i) {
        ASSERT_LT(grid[i - 1], grid[i]) << "i=" << i;
    }
}

TEST(StrikeGridTest, TwoPointGrid) {
    StrikeGrid grid(10.0, 20.0, 2);
    EXPECT_EQ(grid[0], 10.0);
    EXPECT_EQ(grid[1], 20.0);
    EXPECT_EQ(grid.step(), 10.0);
}

TEST(StrikeGridTest, KnownInteriorPoint) {
    StrikeGrid grid(28.0, 840.0, 1000);
    EXPECT_NEAR(grid[330], 296.228228228228, 1e-9);
}
