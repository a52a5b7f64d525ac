#include "gi/rankings.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace gi {

namespace {

struct MetricField {
    MetricInfo info;
    double TeamInsight::* field;
};

const std::vector<MetricField>& metricFields() {
    static const std::vector<MetricField> fields = {
        {{"offensive_epa_per_play", "offense", "Expected Points Added per offensive play"},
         &TeamInsight::offensiveEpaPerPlay},
        {{"passing_epa_per_play", "offense", "Expected Points Added per passing play"},
         &TeamInsight::passingEpaPerPlay},
        {{"rushing_epa_per_play", "offense", "Expected Points Added per rushing play"},
         &TeamInsight::rushingEpaPerPlay},
        {{"red_zone_efficiency", "offense", "Touchdowns per play inside the 20"},
         &TeamInsight::redZoneEfficiency},
        {{"third_down_conversion_rate", "offense", "Third down conversion rate"},
         &TeamInsight::thirdDownConversionRate},
        {{"success_rate", "offense", "Share of plays meeting the down-specific yardage bar"},
         &TeamInsight::successRate},
        {{"explosive_play_rate", "offense", "Share of plays gaining 20+ yards or scoring"},
         &TeamInsight::explosivePlayRate},
        {{"defensive_epa_per_play", "defense", "EPA allowed per defensive play (lower is better)"},
         &TeamInsight::defensiveEpaPerPlay},
        {{"pass_defense_epa", "defense", "EPA allowed on passing plays (lower is better)"},
         &TeamInsight::passDefenseEpa},
        {{"run_defense_epa", "defense", "EPA allowed on rushing plays (lower is better)"},
         &TeamInsight::runDefenseEpa},
        {{"red_zone_defense", "defense", "Red zone touchdown rate allowed (lower is better)"},
         &TeamInsight::redZoneDefense},
        {{"third_down_defense", "defense", "Third down conversion rate allowed (lower is better)"},
         &TeamInsight::thirdDownDefense},
        {{"two_minute_drill_efficiency", "situational", "Performance in two-minute drill situations"},
         &TeamInsight::twoMinuteDrillEfficiency},
        {{"clutch_performance", "situational", "Performance in high-leverage situations"},
         &TeamInsight::clutchPerformance},
        {{"turnover_margin", "situational", "Takeaways minus giveaways per game"},
         &TeamInsight::turnoverMargin},
        {{"garbage_time_adjusted_epa", "contextual", "EPA adjusted for garbage time scenarios"},
         &TeamInsight::garbageTimeAdjustedEpa},
        {{"strength_of_schedule", "contextual", "Average opponent strength faced"},
         &TeamInsight::strengthOfSchedule},
        {{"home_field_advantage", "contextual", "Home vs away performance differential"},
         &TeamInsight::homeFieldAdvantage},
        {{"early_season_performance", "trend", "Performance in first half of season"},
         &TeamInsight::earlySeasonPerformance},
        {{"late_season_performance", "trend", "Performance in second half of season"},
         &TeamInsight::lateSeasonPerformance},
        {{"improvement_trajectory", "trend", "Rate of improvement throughout season"},
         &TeamInsight::improvementTrajectory},
    };
    return fields;
}

const MetricField& findMetric(const std::string& metric) {
    const auto& fields = metricFields();
    auto it = std::find_if(fields.begin(), fields.end(),
                           [&](const MetricField& f) { return metric == f.info.name; });
    if (it == fields.end()) {
        throw std::invalid_argument("Unknown team metric: " + metric);
    }
    return *it;
}

} // anonymous namespace

const std::vector<MetricInfo>& availableMetrics() {
    static const std::vector<MetricInfo> infos = [] {
        std::vector<MetricInfo> result;
        for (const auto& f : metricFields()) result.push_back(f.info);
        return result;
    }();
    return infos;
}

bool lowerIsBetter(const std::string& metric) {
    // "defens" covers both defense_* and defensive_* names
    return metric.find("defens") != std::string::npos
        || metric.find("allowed") != std::string::npos;
}

double teamMetric(const TeamInsight& insight, const std::string& metric) {
    return insight.*(findMetric(metric).field);
}

std::vector<LeaderEntry> leagueLeaders(const RecordStore& store, const PlayMetricsEngine& engine,
                                       int season, const std::string& metric, int limit) {
    const MetricField& field = findMetric(metric);

    std::vector<LeaderEntry> leaders;
    for (const auto& team : store.teams()) {
        std::optional<TeamInsight> insight = generateTeamInsight(store, engine, team.abbr, season);
        if (!insight) continue;
        leaders.push_back({team.abbr, team.fullName(), metric, (*insight).*(field.field)});
    }

    bool ascending = lowerIsBetter(metric);
    std::stable_sort(leaders.begin(), leaders.end(),
                     [ascending](const LeaderEntry& a, const LeaderEntry& b) {
                         return ascending ? a.value < b.value : a.value > b.value;
                     });

    if (limit >= 0 && static_cast<int>(leaders.size()) > limit) {
        leaders.resize(limit);
    }
    return leaders;
}

const std::vector<std::string>& headlineMetrics() {
    static const std::vector<std::string> metrics = {
        "offensive_epa_per_play",
        "defensive_epa_per_play",
        "red_zone_efficiency",
        "third_down_conversion_rate",
        "clutch_performance",
    };
    return metrics;
}

std::optional<TeamComparison> compareTeams(const RecordStore& store, const PlayMetricsEngine& engine,
                                           const std::string& team1, const std::string& team2,
                                           int season, double advantageThreshold) {
    std::optional<TeamInsight> insight1 = generateTeamInsight(store, engine, team1, season);
    std::optional<TeamInsight> insight2 = generateTeamInsight(store, engine, team2, season);
    if (!insight1 || !insight2) {
        spdlog::warn("Cannot compare {} and {} in {}: missing insight", team1, team2, season);
        return std::nullopt;
    }

    TeamComparison comparison;
    comparison.team1 = team1;
    comparison.team2 = team2;
    comparison.season = season;

    for (const auto& metric : headlineMetrics()) {
        MetricComparison c;
        c.metric = metric;
        c.value1 = teamMetric(*insight1, metric);
        c.value2 = teamMetric(*insight2, metric);
        c.difference = std::abs(c.value1 - c.value2);

        // Flip the comparison where lower is better
        double score1 = lowerIsBetter(metric) ? -c.value1 : c.value1;
        double score2 = lowerIsBetter(metric) ? -c.value2 : c.value2;
        if (score1 > score2) c.leader = team1;
        else if (score2 > score1) c.leader = team2;
        else c.leader = "Even";

        c.significant = c.difference > advantageThreshold;
        if (c.significant) {
            (c.leader == team1 ? comparison.advantages1 : comparison.advantages2).push_back(metric);
        }
        comparison.metrics.push_back(c);
    }
    return comparison;
}

} // namespace gi
