#include <gtest/gtest.h>
#include "gi/win_probability.h"
#include <cmath>

using namespace gi;

TEST(WinProbability, TimeFactorBoundaries) {
    EXPECT_DOUBLE_EQ(WinProbabilityModel::timeFactor(3600), 0.8);
    EXPECT_DOUBLE_EQ(WinProbabilityModel::timeFactor(1801), 0.8);
    EXPECT_DOUBLE_EQ(WinProbabilityModel::timeFactor(1800), 1.0);
    EXPECT_DOUBLE_EQ(WinProbabilityModel::timeFactor(901), 1.0);
    EXPECT_DOUBLE_EQ(WinProbabilityModel::timeFactor(900), 1.3);
    EXPECT_DOUBLE_EQ(WinProbabilityModel::timeFactor(121), 1.3);
    EXPECT_DOUBLE_EQ(WinProbabilityModel::timeFactor(120), 2.0);
    EXPECT_DOUBLE_EQ(WinProbabilityModel::timeFactor(0), 2.0);
}

TEST(WinProbability, ConversionProbabilityByDown) {
    EXPECT_NEAR(WinProbabilityModel::conversionProbability(1, 10), 0.55, 1e-9);
    EXPECT_NEAR(WinProbabilityModel::conversionProbability(2, 5), 0.50, 1e-9);
    EXPECT_NEAR(WinProbabilityModel::conversionProbability(3, 5), 0.25, 1e-9);
    EXPECT_NEAR(WinProbabilityModel::conversionProbability(4, 1), 0.20, 1e-9);
}

TEST(WinProbability, TiedAtMidfield) {
    WinProbabilityModel model;
    // 0.5 + 50 * 0.002 + (0.55 - 0.5) * 0.1
    EXPECT_NEAR(model.winProbability(Situation(1, 10, 50, 1, 3600, 0)), 0.605, 1e-9);
    EXPECT_NEAR(model.winProbability(Situation(1, 10, 50, 4, 60, 0)), 0.605, 1e-9);
}

TEST(WinProbability, LeadScaledByClock) {
    WinProbabilityModel model;
    // 0.5 + 0.14 + 0.14 * 1.0 + 0.1 + 0.005
    EXPECT_NEAR(model.winProbability(Situation(1, 10, 50, 3, 1000, 7)), 0.885, 1e-9);
    // First half: score term weighted 0.8
    EXPECT_NEAR(model.winProbability(Situation(1, 10, 50, 1, 3000, 3)), 0.5 + 0.06 + 0.048 + 0.105, 1e-9);
}

TEST(WinProbability, ClampedToBounds) {
    WinProbabilityModel model;
    EXPECT_DOUBLE_EQ(model.winProbability(Situation(1, 10, 50, 4, 100, 30)), MAX_WIN_PROBABILITY);
    EXPECT_DOUBLE_EQ(model.winProbability(Situation(1, 10, 50, 4, 100, -30)), MIN_WIN_PROBABILITY);
}

TEST(WinProbability, AlwaysWithinBounds) {
    WinProbabilityModel model;
    for (int down = 1; down <= 4; ++down) {
        for (int yl = 0; yl <= 100; yl += 10) {
            for (int diff = -35; diff <= 35; diff += 7) {
                for (int secs : {3600, 1800, 900, 60}) {
                    double wp = model.winProbability(Situation(down, 10, yl, 1, secs, diff));
                    EXPECT_GE(wp, MIN_WIN_PROBABILITY);
                    EXPECT_LE(wp, MAX_WIN_PROBABILITY);
                }
            }
        }
    }
}

TEST(WinProbability, IncreasesWithLead) {
    WinProbabilityModel model;
    double trailing = model.winProbability(Situation(1, 10, 50, 3, 1200, -3));
    double tied = model.winProbability(Situation(1, 10, 50, 3, 1200, 0));
    double leading = model.winProbability(Situation(1, 10, 50, 3, 1200, 3));
    EXPECT_LT(trailing, tied);
    EXPECT_LT(tied, leading);
}

TEST(WinProbability, BetterFieldPositionHelps) {
    WinProbabilityModel model;
    EXPECT_GT(model.winProbability(Situation(1, 10, 20, 2, 2000, 0)),
              model.winProbability(Situation(1, 10, 80, 2, 2000, 0)));
}

TEST(WinProbability, SameLeadMattersMoreLate) {
    WinProbabilityModel model;
    for (int diff : {7, -7}) {
        double early = model.winProbability(Situation(1, 10, 80, 1, 3600, diff));
        double late = model.winProbability(Situation(1, 10, 80, 1, 60, diff));
        EXPECT_GT(std::abs(late - 0.5), std::abs(early - 0.5)) << diff;
    }
    // +7 at own 20: 0.5 + 0.14 + 0.14 * 0.8 + 0.04 + 0.005 early, 0.14 * 2.0 late
    EXPECT_NEAR(model.winProbability(Situation(1, 10, 80, 1, 3600, 7)), 0.797, 1e-9);
    EXPECT_NEAR(model.winProbability(Situation(1, 10, 80, 1, 60, 7)), 0.965, 1e-9);
}

TEST(WinProbability, FieldPositionCanOutweighSmallDeficit) {
    WinProbabilityModel model;
    // Down 1 at the 2: 0.5 - 0.02 - 0.02 * 1.3 + 0.196 + (0.73 - 0.5) * 0.1
    double wp = model.winProbability(Situation(1, 1, 2, 4, 600, -1));
    EXPECT_NEAR(wp, 0.673, 1e-9);
    EXPECT_GT(wp, 0.5);
}
