#pragma once

#include "gi/play_metrics.h"
#include "gi/record_store.h"
#include <optional>
#include <string>

namespace gi {

// One team over one season. Defensive figures are EPA / rates allowed,
// so lower is better for every defense field.
struct TeamInsight {
    std::string teamAbbr;
    int season = 0;
    int offensivePlays = 0;
    int defensivePlays = 0;

    // Offense
    double offensiveEpaPerPlay = 0.0;
    double passingEpaPerPlay = 0.0;
    double rushingEpaPerPlay = 0.0;
    double redZoneEfficiency = 0.0;
    double thirdDownConversionRate = 0.0;
    double successRate = 0.0;
    double explosivePlayRate = 0.0;

    // Defense
    double defensiveEpaPerPlay = 0.0;
    double passDefenseEpa = 0.0;
    double runDefenseEpa = 0.0;
    double redZoneDefense = 0.0;
    double thirdDownDefense = 0.0;

    // Special situations
    double twoMinuteDrillEfficiency = 0.0;
    double clutchPerformance = 0.0;
    double turnoverMargin = 0.0;    // per game

    // Context-adjusted (fixed transforms of the primary EPA figures)
    double garbageTimeAdjustedEpa = 0.0;
    double strengthOfSchedule = 0.0;
    double homeFieldAdvantage = 0.0;

    // Trend
    double earlySeasonPerformance = 0.0;
    double lateSeasonPerformance = 0.0;
    double improvementTrajectory = 0.0;
};

// nullopt when the team has no offensive or no defensive plays that season.
std::optional<TeamInsight> generateTeamInsight(const RecordStore& store,
                                               const PlayMetricsEngine& engine,
                                               const std::string& teamAbbr, int season);

} // namespace gi
