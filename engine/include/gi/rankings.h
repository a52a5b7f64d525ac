#pragma once

#include "gi/team_insights.h"
#include <optional>
#include <string>
#include <vector>

namespace gi {

constexpr double DEFAULT_ADVANTAGE_THRESHOLD = 0.05;

struct MetricInfo {
    const char* name;
    const char* category;
    const char* description;
};

// Every metric name accepted by teamMetric()
const std::vector<MetricInfo>& availableMetrics();

// Defense metrics and "...allowed..." metrics rank ascending
bool lowerIsBetter(const std::string& metric);

// Throws std::invalid_argument for an unknown metric name
double teamMetric(const TeamInsight& insight, const std::string& metric);

struct LeaderEntry {
    std::string teamAbbr;
    std::string teamName;
    std::string metric;
    double value = 0.0;
};

std::vector<LeaderEntry> leagueLeaders(const RecordStore& store, const PlayMetricsEngine& engine,
                                       int season, const std::string& metric, int limit = 10);

struct MetricComparison {
    std::string metric;
    double value1 = 0.0;
    double value2 = 0.0;
    std::string leader;     // team abbr, or "Even"
    double difference = 0.0;
    bool significant = false;
};

struct TeamComparison {
    std::string team1;
    std::string team2;
    int season = 0;
    std::vector<MetricComparison> metrics;
    std::vector<std::string> advantages1;
    std::vector<std::string> advantages2;
};

// Headline metrics compared by compareTeams()
const std::vector<std::string>& headlineMetrics();

// nullopt unless both teams have an insight for the season
std::optional<TeamComparison> compareTeams(const RecordStore& store, const PlayMetricsEngine& engine,
                                           const std::string& team1, const std::string& team2,
                                           int season,
                                           double advantageThreshold = DEFAULT_ADVANTAGE_THRESHOLD);

} // namespace gi
