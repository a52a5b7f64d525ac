#include <gtest/gtest.h>
#include "gi/play_metrics.h"
#include <cmath>

using namespace gi;

static PlayInput makePlay(int down, int togo, int yardline, int quarter, int seconds,
                          int scoreDiff, int gained, const std::string& type = "pass") {
    PlayInput p;
    p.down = down;
    p.ydstogo = togo;
    p.yardline100 = yardline;
    p.quarter = quarter;
    p.gameSecondsRemaining = seconds;
    p.scoreDifferential = scoreDiff;
    p.yardsGained = gained;
    p.playType = type;
    return p;
}

// --- Success / clutch rules ---

TEST(PlayMetrics, SuccessBarEarlyDowns) {
    EXPECT_TRUE(isSuccessfulPlay(1, 10, 5));
    EXPECT_FALSE(isSuccessfulPlay(1, 10, 4));
    EXPECT_TRUE(isSuccessfulPlay(2, 6, 4));     // floor of 4 yards
    EXPECT_FALSE(isSuccessfulPlay(2, 6, 3));
}

TEST(PlayMetrics, SuccessBarLateDowns) {
    EXPECT_FALSE(isSuccessfulPlay(3, 5, 4));
    EXPECT_TRUE(isSuccessfulPlay(3, 5, 5));
    EXPECT_TRUE(isSuccessfulPlay(4, 1, 1));
}

TEST(PlayMetrics, ClutchMultiplier) {
    EXPECT_NEAR(clutchMultiplier(Situation(1, 10, 50, 4, 200, 3), true), 1.5 * 1.3, 1e-9);
    EXPECT_NEAR(clutchMultiplier(Situation(1, 10, 50, 4, 200, 10), false), 0.75, 1e-9);
    EXPECT_NEAR(clutchMultiplier(Situation(1, 10, 50, 2, 2000, 10), true), 1.0, 1e-9);
    EXPECT_NEAR(clutchMultiplier(Situation(1, 10, 50, 2, 2000, 0), false), 0.65, 1e-9);
}

// --- Outcome classification ---

TEST(PlayOutcome, TouchdownWins) {
    PlayInput p = makePlay(1, 10, 30, 2, 2000, 0, 30);
    p.touchdown = true;
    p.interception = true;
    EXPECT_EQ(classifyOutcome(p, situationBefore(p)).kind, OutcomeKind::TOUCHDOWN);
}

TEST(PlayOutcome, InterceptionAndFumbleAreTurnovers) {
    PlayInput p = makePlay(1, 10, 30, 2, 2000, 0, 0);
    p.interception = true;
    EXPECT_EQ(classifyOutcome(p, situationBefore(p)).kind, OutcomeKind::TURNOVER);

    PlayInput f = makePlay(1, 10, 30, 2, 2000, 0, 4);
    f.fumbleLost = true;
    PlayOutcome outcome = classifyOutcome(f, situationBefore(f));
    EXPECT_EQ(outcome.kind, OutcomeKind::TURNOVER);
    EXPECT_FALSE(outcome.after.has_value());
}

TEST(PlayOutcome, FirstDownResetsDistance) {
    PlayInput p = makePlay(3, 3, 40, 2, 2000, 0, 5);
    PlayOutcome outcome = classifyOutcome(p, situationBefore(p));

    ASSERT_EQ(outcome.kind, OutcomeKind::NORMAL_GAIN);
    ASSERT_TRUE(outcome.after.has_value());
    EXPECT_EQ(outcome.after->down(), 1);
    EXPECT_EQ(outcome.after->ydstogo(), 10);
    EXPECT_EQ(outcome.after->yardline100(), 35);
    EXPECT_EQ(outcome.after->gameSecondsRemaining(), 1960);
}

TEST(PlayOutcome, ShortGainAdvancesDown) {
    PlayInput p = makePlay(2, 8, 40, 2, 2000, 0, 3);
    PlayOutcome outcome = classifyOutcome(p, situationBefore(p));

    ASSERT_TRUE(outcome.after.has_value());
    EXPECT_EQ(outcome.after->down(), 3);
    EXPECT_EQ(outcome.after->ydstogo(), 5);
    EXPECT_EQ(outcome.after->yardline100(), 37);
}

TEST(PlayOutcome, FloorsYardlineAndClock) {
    PlayInput p = makePlay(1, 10, 5, 4, 20, 0, 12);
    PlayOutcome outcome = classifyOutcome(p, situationBefore(p));

    ASSERT_TRUE(outcome.after.has_value());
    EXPECT_EQ(outcome.after->yardline100(), 0);
    EXPECT_EQ(outcome.after->gameSecondsRemaining(), 0);
}

TEST(PlayOutcome, FailedFourthDownTurnsOver) {
    PlayInput p = makePlay(4, 2, 30, 3, 1000, 0, 1);
    PlayOutcome outcome = classifyOutcome(p, situationBefore(p));

    EXPECT_EQ(outcome.kind, OutcomeKind::TURNOVER_ON_DOWNS);
    ASSERT_TRUE(outcome.after.has_value());
    EXPECT_EQ(outcome.after->yardline100(), 29);
}

TEST(PlayOutcome, Names) {
    EXPECT_STREQ(outcomeName(OutcomeKind::TOUCHDOWN), "touchdown");
    EXPECT_STREQ(outcomeName(OutcomeKind::TURNOVER_ON_DOWNS), "turnover_on_downs");
}

// --- Full metrics ---

TEST(PlayMetricsEngine, RedZoneTouchdown) {
    // 1st-and-5 at the 8 early in the second quarter, tied, 8-yard touchdown
    PlayMetricsEngine engine;
    PlayInput p = makePlay(1, 5, 8, 2, 2700, 0, 8);
    p.touchdown = true;
    MetricBundle m = engine.computeMetrics(p);

    EXPECT_NEAR(m.expectedPointsBefore, 3.3, 1e-9);
    EXPECT_DOUBLE_EQ(m.expectedPointsAfter, 7.0);
    EXPECT_NEAR(m.epa, 3.7, 1e-9);
    EXPECT_GT(m.epa, 0.0);
    EXPECT_NEAR(m.winProbBefore, 0.699, 1e-9);
    EXPECT_NEAR(m.winProbAfter, 0.849, 1e-9);
    EXPECT_NEAR(m.wpa, 0.15, 1e-9);
    EXPECT_NEAR(m.leverage, 0.15, 1e-9);
    EXPECT_DOUBLE_EQ(m.successRate, 1.0);
    EXPECT_TRUE(m.explosivePlay);
    EXPECT_NEAR(m.clutchIndex, 3.7 * 1.3, 1e-9);
    EXPECT_EQ(m.outcome, OutcomeKind::TOUCHDOWN);
}

TEST(PlayMetricsEngine, TouchdownWinProbabilityCapped) {
    PlayMetricsEngine engine;
    PlayInput p = makePlay(1, 10, 20, 4, 600, 14, 20);
    p.touchdown = true;
    MetricBundle m = engine.computeMetrics(p);

    EXPECT_DOUBLE_EQ(m.winProbAfter, 0.95);
}

TEST(PlayMetricsEngine, Interception) {
    PlayMetricsEngine engine;
    PlayInput p = makePlay(2, 8, 60, 1, 3000, 0, 0);
    p.interception = true;
    MetricBundle m = engine.computeMetrics(p);

    EXPECT_NEAR(m.expectedPointsBefore, 2.38, 1e-9);
    EXPECT_NEAR(m.expectedPointsAfter, -2.38, 1e-9);
    EXPECT_NEAR(m.epa, -4.76, 1e-9);
    EXPECT_NEAR(m.winProbBefore, 0.571, 1e-9);
    EXPECT_NEAR(m.winProbAfter, 0.429, 1e-9);
    EXPECT_LT(m.wpa, 0.0);
    EXPECT_DOUBLE_EQ(m.successRate, 0.0);
    EXPECT_NEAR(m.clutchIndex, -4.76 * 1.3 * 0.5, 1e-9);
    EXPECT_EQ(m.outcome, OutcomeKind::TURNOVER);
}

TEST(PlayMetricsEngine, NormalGainUsesAdvancedSituation) {
    PlayMetricsEngine engine;
    MetricBundle m = engine.computeMetrics(makePlay(1, 10, 50, 2, 1800, 0, 6, "run"));

    // 2nd-and-4 at the 44 with 1760s left
    EXPECT_NEAR(m.expectedPointsBefore, 3.5, 1e-9);
    EXPECT_NEAR(m.expectedPointsAfter, (7.0 - 44 * 0.07) * 0.85, 1e-9);
    EXPECT_NEAR(m.winProbBefore, 0.605, 1e-9);
    EXPECT_NEAR(m.winProbAfter, 0.615, 1e-9);
    EXPECT_DOUBLE_EQ(m.successRate, 1.0);
    EXPECT_FALSE(m.explosivePlay);
    EXPECT_EQ(m.outcome, OutcomeKind::NORMAL_GAIN);
}

TEST(PlayMetricsEngine, LeverageFloor) {
    PlayMetricsEngine engine;
    MetricBundle m = engine.computeMetrics(makePlay(1, 10, 50, 2, 1800, 0, 6, "run"));

    EXPECT_LT(std::abs(m.wpa), MIN_LEVERAGE);
    EXPECT_DOUBLE_EQ(m.leverage, MIN_LEVERAGE);
}

TEST(PlayMetricsEngine, TurnoverOnDowns) {
    PlayMetricsEngine engine;
    MetricBundle m = engine.computeMetrics(makePlay(4, 2, 30, 3, 1000, 0, 1));

    // Opponent takes over on the 29 as the clamped 4th-and-1 situation
    EXPECT_EQ(m.outcome, OutcomeKind::TURNOVER_ON_DOWNS);
    EXPECT_NEAR(m.expectedPointsBefore, 4.9 * 0.3, 1e-9);
    EXPECT_NEAR(m.expectedPointsAfter, -(7.0 - 29 * 0.07) * 0.3, 1e-9);
    EXPECT_NEAR(m.winProbAfter, 1.0 - 0.612, 1e-9);
    EXPECT_LT(m.epa, 0.0);
}

TEST(PlayMetricsEngine, ExplosiveByYardage) {
    PlayMetricsEngine engine;
    EXPECT_TRUE(engine.computeMetrics(makePlay(1, 10, 80, 2, 2000, 0, 20)).explosivePlay);
    EXPECT_FALSE(engine.computeMetrics(makePlay(1, 10, 80, 2, 2000, 0, 19)).explosivePlay);
}

TEST(PlayMetricsEngine, EmptyPlayUsesDefaults) {
    PlayMetricsEngine engine;
    MetricBundle m = engine.computeMetrics(PlayInput{});

    // 1st-and-10 at midfield, 3600s left, no gain
    EXPECT_NEAR(m.expectedPointsBefore, 3.5 * 0.95, 1e-9);
    EXPECT_NEAR(m.expectedPointsAfter, 3.5 * 0.85 * 0.95, 1e-9);
    EXPECT_DOUBLE_EQ(m.successRate, 0.0);
    EXPECT_FALSE(m.explosivePlay);
}

TEST(PlayMetricsEngine, InvariantsOverSituations) {
    PlayMetricsEngine engine;
    for (int down = 1; down <= 4; ++down) {
        for (int yl = 5; yl <= 95; yl += 15) {
            for (int diff : {-10, 0, 10}) {
                for (int gained : {-3, 0, 4, 12, 25}) {
                    MetricBundle m = engine.computeMetrics(makePlay(down, 10, yl, 2, 1500, diff, gained));
                    EXPECT_GE(m.leverage, MIN_LEVERAGE);
                    EXPECT_GE(m.winProbBefore, MIN_WIN_PROBABILITY);
                    EXPECT_LE(m.winProbBefore, MAX_WIN_PROBABILITY);
                    EXPECT_NEAR(m.epa, m.expectedPointsAfter - m.expectedPointsBefore, 1e-12);
                    EXPECT_NEAR(m.wpa, m.winProbAfter - m.winProbBefore, 1e-12);
                    EXPECT_TRUE(m.successRate == 0.0 || m.successRate == 1.0);
                }
            }
        }
    }
}

TEST(PlayMetricsEngine, TurnoverHurtsFavoredOffense) {
    PlayMetricsEngine engine;
    PlayInput p = makePlay(1, 10, 50, 2, 2000, 0, 0);
    p.fumbleLost = true;
    MetricBundle m = engine.computeMetrics(p);

    EXPECT_LT(m.epa, 0.0);
    EXPECT_LT(m.wpa, 0.0);
}
