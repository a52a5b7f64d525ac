#pragma once

#include "gi/game_insights.h"
#include "gi/market.h"
#include "gi/play_metrics.h"
#include "gi/rankings.h"
#include "gi/team_insights.h"
#include "gi/validation.h"
#include "gi/value_betting.h"
#include <nlohmann/json.hpp>

namespace gi {

// Rounds half away from zero to the given number of decimals
double roundTo(double value, int decimals);

void to_json(nlohmann::json& j, const MetricBundle& m);
void to_json(nlohmann::json& j, const TeamInsight& t);
void to_json(nlohmann::json& j, const GameSummary& s);
void to_json(nlohmann::json& j, const GameInsight& g);
void to_json(nlohmann::json& j, const LeaderEntry& e);
void to_json(nlohmann::json& j, const MetricComparison& c);
void to_json(nlohmann::json& j, const TeamComparison& c);
void to_json(nlohmann::json& j, const VegasLine& l);
void to_json(nlohmann::json& j, const Prediction& p);
void to_json(nlohmann::json& j, const ValueBet& b);
void to_json(nlohmann::json& j, const ValidationMetrics& m);

} // namespace gi
