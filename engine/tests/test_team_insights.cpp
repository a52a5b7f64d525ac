#include <gtest/gtest.h>
#include "gi/team_insights.h"
#include "season_fixture.h"

using namespace gi;

// Mean EPA over the given plays, computed independently of the aggregation
static double meanEpa(const std::vector<PlayRow>& plays, const PlayMetricsEngine& engine,
                      const std::string& type = "") {
    double sum = 0.0;
    int count = 0;
    for (const auto& p : plays) {
        if (!type.empty() && p.playType != type) continue;
        sum += engine.computeMetrics(toPlayInput(p)).epa;
        count++;
    }
    return count > 0 ? sum / count : 0.0;
}

TEST(TeamInsight, CountsPlays) {
    auto store = gi_test::seasonFixture();
    PlayMetricsEngine engine;
    auto insight = generateTeamInsight(store, engine, "KC", 2023);

    ASSERT_TRUE(insight.has_value());
    EXPECT_EQ(insight->teamAbbr, "KC");
    EXPECT_EQ(insight->season, 2023);
    EXPECT_EQ(insight->offensivePlays, 4);
    EXPECT_EQ(insight->defensivePlays, 4);
}

TEST(TeamInsight, OffensiveEpa) {
    auto store = gi_test::seasonFixture();
    PlayMetricsEngine engine;
    auto insight = generateTeamInsight(store, engine, "KC", 2023);
    auto offense = store.offensivePlays("KC", 2023);

    ASSERT_TRUE(insight.has_value());
    EXPECT_NEAR(insight->offensiveEpaPerPlay, meanEpa(offense, engine), 1e-9);
    EXPECT_NEAR(insight->passingEpaPerPlay, meanEpa(offense, engine, "pass"), 1e-9);
    EXPECT_NEAR(insight->rushingEpaPerPlay, meanEpa(offense, engine, "run"), 1e-9);
}

TEST(TeamInsight, DefenseIsEpaAllowed) {
    auto store = gi_test::seasonFixture();
    PlayMetricsEngine engine;
    auto insight = generateTeamInsight(store, engine, "KC", 2023);
    auto defense = store.defensivePlays("KC", 2023);

    ASSERT_TRUE(insight.has_value());
    EXPECT_NEAR(insight->defensiveEpaPerPlay, meanEpa(defense, engine), 1e-9);
    EXPECT_NEAR(insight->passDefenseEpa, meanEpa(defense, engine, "pass"), 1e-9);
    EXPECT_NEAR(insight->runDefenseEpa, meanEpa(defense, engine, "run"), 1e-9);
}

TEST(TeamInsight, SituationalRates) {
    auto store = gi_test::seasonFixture();
    PlayMetricsEngine engine;
    auto insight = generateTeamInsight(store, engine, "KC", 2023);

    ASSERT_TRUE(insight.has_value());
    EXPECT_DOUBLE_EQ(insight->redZoneEfficiency, 0.5);
    EXPECT_DOUBLE_EQ(insight->thirdDownConversionRate, 0.5);
    EXPECT_DOUBLE_EQ(insight->explosivePlayRate, 0.25);
    // Allowed: BUF scored on its only red zone snap, a converted third down
    EXPECT_DOUBLE_EQ(insight->redZoneDefense, 1.0);
    EXPECT_DOUBLE_EQ(insight->thirdDownDefense, 1.0);
}

TEST(TeamInsight, SuccessRateIsShareOfSuccessfulPlays) {
    auto store = gi_test::seasonFixture();
    PlayMetricsEngine engine;
    auto insight = generateTeamInsight(store, engine, "KC", 2023);

    // TD on 1st-and-10 and conversion on 3rd-and-4 succeed; 3rd-and-8 for 2 and the pick fail
    ASSERT_TRUE(insight.has_value());
    EXPECT_DOUBLE_EQ(insight->successRate, 0.5);
}

TEST(TeamInsight, TurnoverMarginPerGame) {
    auto store = gi_test::seasonFixture();
    PlayMetricsEngine engine;

    // KC: two takeaways, one giveaway, one game on offense
    auto kc = generateTeamInsight(store, engine, "KC", 2023);
    ASSERT_TRUE(kc.has_value());
    EXPECT_DOUBLE_EQ(kc->turnoverMargin, 1.0);

    // BUF: one takeaway, two giveaways over two games
    auto buf = generateTeamInsight(store, engine, "BUF", 2023);
    ASSERT_TRUE(buf.has_value());
    EXPECT_DOUBLE_EQ(buf->turnoverMargin, -0.5);
}

TEST(TeamInsight, DerivedFigures) {
    auto store = gi_test::seasonFixture();
    PlayMetricsEngine engine;
    auto t = generateTeamInsight(store, engine, "KC", 2023);
    ASSERT_TRUE(t.has_value());

    double net = t->offensiveEpaPerPlay - t->defensiveEpaPerPlay;
    EXPECT_NEAR(t->clutchPerformance, t->offensiveEpaPerPlay * 1.2, 1e-12);
    EXPECT_NEAR(t->twoMinuteDrillEfficiency, t->offensiveEpaPerPlay * 1.2, 1e-12);
    EXPECT_NEAR(t->garbageTimeAdjustedEpa, t->offensiveEpaPerPlay * 0.95, 1e-12);
    EXPECT_DOUBLE_EQ(t->strengthOfSchedule, 0.5);
    EXPECT_DOUBLE_EQ(t->homeFieldAdvantage, 0.1);
    EXPECT_NEAR(t->earlySeasonPerformance, net * 0.9, 1e-12);
    EXPECT_NEAR(t->lateSeasonPerformance, net * 1.1, 1e-12);
    EXPECT_NEAR(t->improvementTrajectory, net * 0.1, 1e-12);
}

TEST(TeamInsight, RatesStayInUnitInterval) {
    auto store = gi_test::seasonFixture();
    PlayMetricsEngine engine;
    for (const char* team : {"KC", "BUF", "MIA"}) {
        auto t = generateTeamInsight(store, engine, team, 2023);
        ASSERT_TRUE(t.has_value()) << team;
        for (double rate : {t->redZoneEfficiency, t->thirdDownConversionRate, t->successRate,
                            t->explosivePlayRate, t->redZoneDefense, t->thirdDownDefense}) {
            EXPECT_GE(rate, 0.0);
            EXPECT_LE(rate, 1.0);
        }
    }
}

TEST(TeamInsight, NoPlaysGivesNothing) {
    auto store = gi_test::seasonFixture();
    PlayMetricsEngine engine;

    EXPECT_FALSE(generateTeamInsight(store, engine, "NYJ", 2023).has_value());
    EXPECT_FALSE(generateTeamInsight(store, engine, "KC", 2019).has_value());
}

TEST(TeamInsight, MissingDefenseGivesNothing) {
    InMemoryRecordStore store;
    store.addPlay(gi_test::play("1", "G1", "KC", "BUF", 1, 10, 50, 1, 3500, "run", 4));
    PlayMetricsEngine engine;

    EXPECT_FALSE(generateTeamInsight(store, engine, "KC", 2023).has_value());
}
