#include <gtest/gtest.h>
#include "gi/expected_points.h"

using namespace gi;

TEST(ExpectedPoints, GoalLineBand) {
    ExpectedPointsModel model;
    EXPECT_NEAR(model.baseValue(1, 1), 6.5, 1e-9);
    EXPECT_NEAR(model.baseValue(1, 3), 5.9, 1e-9);
    EXPECT_NEAR(model.baseValue(1, 5), 5.3, 1e-9);
}

TEST(ExpectedPoints, RedZoneBand) {
    ExpectedPointsModel model;
    EXPECT_NEAR(model.baseValue(1, 6), 3.6, 1e-9);
    EXPECT_NEAR(model.baseValue(1, 10), 3.0, 1e-9);
    EXPECT_NEAR(model.baseValue(1, 20), 1.5, 1e-9);
}

TEST(ExpectedPoints, OpenFieldBand) {
    ExpectedPointsModel model;
    EXPECT_NEAR(model.baseValue(1, 50), 3.5, 1e-9);
    EXPECT_NEAR(model.baseValue(1, 99), 0.07, 1e-9);
    EXPECT_NEAR(model.baseValue(1, 100), 0.0, 1e-9);
}

TEST(ExpectedPoints, DownMultipliers) {
    ExpectedPointsModel model;
    EXPECT_DOUBLE_EQ(downMultiplier(1), 1.00);
    EXPECT_DOUBLE_EQ(downMultiplier(2), 0.85);
    EXPECT_DOUBLE_EQ(downMultiplier(3), 0.60);
    EXPECT_DOUBLE_EQ(downMultiplier(4), 0.30);

    EXPECT_NEAR(model.baseValue(2, 10), 2.55, 1e-9);
    EXPECT_NEAR(model.baseValue(3, 50), 2.1, 1e-9);
    EXPECT_NEAR(model.baseValue(4, 50), 1.05, 1e-9);
}

TEST(ExpectedPoints, OutsideTableIsZero) {
    ExpectedPointsModel model;
    EXPECT_DOUBLE_EQ(model.baseValue(0, 50), 0.0);
    EXPECT_DOUBLE_EQ(model.baseValue(5, 50), 0.0);
    EXPECT_DOUBLE_EQ(model.baseValue(1, 0), 0.0);
    EXPECT_DOUBLE_EQ(model.baseValue(1, 101), 0.0);
}

TEST(ExpectedPoints, TouchbackSpotIsZero) {
    // Situation clamps yardline 0 into range, but 0 has no table row
    ExpectedPointsModel model;
    EXPECT_DOUBLE_EQ(model.expectedPoints(Situation(1, 10, 0, 2, 1800, 0)), 0.0);
}

TEST(ExpectedPoints, NeutralTimeHasNoAdjustment) {
    ExpectedPointsModel model;
    EXPECT_NEAR(model.expectedPoints(Situation(1, 10, 50, 2, 1800, 0)), 3.5, 1e-9);
    EXPECT_NEAR(model.expectedPoints(Situation(1, 10, 50, 1, 3000, 0)), 3.5, 1e-9);
    EXPECT_NEAR(model.expectedPoints(Situation(1, 10, 50, 4, 120, 0)), 3.5, 1e-9);
}

TEST(ExpectedPoints, LateGameBoost) {
    ExpectedPointsModel model;
    EXPECT_NEAR(model.expectedPoints(Situation(1, 10, 50, 4, 100, 0)), 3.5 * 1.15, 1e-9);
}

TEST(ExpectedPoints, OpeningDriveDiscount) {
    ExpectedPointsModel model;
    EXPECT_NEAR(model.expectedPoints(Situation(1, 10, 50, 1, 3100, 0)), 3.5 * 0.95, 1e-9);
}

TEST(ExpectedPoints, BlowoutDiscount) {
    ExpectedPointsModel model;
    EXPECT_NEAR(model.expectedPoints(Situation(1, 10, 50, 3, 1500, 21)), 3.5 * 0.8, 1e-9);
    EXPECT_NEAR(model.expectedPoints(Situation(1, 10, 50, 3, 1500, -15)), 3.5 * 0.8, 1e-9);
    // Exactly two scores is not a blowout
    EXPECT_NEAR(model.expectedPoints(Situation(1, 10, 50, 3, 1500, 14)), 3.5, 1e-9);
}

TEST(ExpectedPoints, LateBlowoutStacks) {
    ExpectedPointsModel model;
    EXPECT_NEAR(model.expectedPoints(Situation(1, 10, 50, 4, 100, -21)), 3.5 * 1.15 * 0.8, 1e-9);
}

TEST(ExpectedPoints, NonIncreasingWithinBands) {
    ExpectedPointsModel model;
    for (int down = 1; down <= MAX_DOWN; ++down) {
        for (int yl = 2; yl <= 5; ++yl) {
            EXPECT_LE(model.baseValue(down, yl), model.baseValue(down, yl - 1));
        }
        for (int yl = 7; yl <= 20; ++yl) {
            EXPECT_LE(model.baseValue(down, yl), model.baseValue(down, yl - 1));
        }
        for (int yl = 22; yl <= 100; ++yl) {
            EXPECT_LE(model.baseValue(down, yl), model.baseValue(down, yl - 1));
        }
    }
}

TEST(ExpectedPoints, LaterDownsWorthLess) {
    ExpectedPointsModel model;
    for (int yl = 1; yl <= 99; ++yl) {
        for (int down = 2; down <= MAX_DOWN; ++down) {
            EXPECT_LT(model.baseValue(down, yl), model.baseValue(down - 1, yl));
        }
    }
}
