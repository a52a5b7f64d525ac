#include "gi/serialization.h"
#include <cmath>

namespace gi {

double roundTo(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

namespace {

double r3(double v) { return roundTo(v, 3); }
double r4(double v) { return roundTo(v, 4); }

template<typename T>
nlohmann::json optionalValue(const std::optional<T>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

} // anonymous namespace

void to_json(nlohmann::json& j, const MetricBundle& m) {
    j = {
        {"expected_points_before", r3(m.expectedPointsBefore)},
        {"expected_points_after", r3(m.expectedPointsAfter)},
        {"epa", r3(m.epa)},
        {"win_prob_before", r3(m.winProbBefore)},
        {"win_prob_after", r3(m.winProbAfter)},
        {"wpa", r3(m.wpa)},
        {"leverage", r3(m.leverage)},
        {"clutch_index", r3(m.clutchIndex)},
        {"success_rate", r3(m.successRate)},
        {"explosive_play", m.explosivePlay},
        {"outcome", outcomeName(m.outcome)},
    };
}

void to_json(nlohmann::json& j, const TeamInsight& t) {
    j = {
        {"team_abbr", t.teamAbbr},
        {"season", t.season},
        {"offensive_plays", t.offensivePlays},
        {"defensive_plays", t.defensivePlays},
        {"offensive_epa_per_play", r3(t.offensiveEpaPerPlay)},
        {"passing_epa_per_play", r3(t.passingEpaPerPlay)},
        {"rushing_epa_per_play", r3(t.rushingEpaPerPlay)},
        {"red_zone_efficiency", r3(t.redZoneEfficiency)},
        {"third_down_conversion_rate", r3(t.thirdDownConversionRate)},
        {"success_rate", r3(t.successRate)},
        {"explosive_play_rate", r3(t.explosivePlayRate)},
        {"defensive_epa_per_play", r3(t.defensiveEpaPerPlay)},
        {"pass_defense_epa", r3(t.passDefenseEpa)},
        {"run_defense_epa", r3(t.runDefenseEpa)},
        {"red_zone_defense", r3(t.redZoneDefense)},
        {"third_down_defense", r3(t.thirdDownDefense)},
        {"two_minute_drill_efficiency", r3(t.twoMinuteDrillEfficiency)},
        {"clutch_performance", r3(t.clutchPerformance)},
        {"turnover_margin", r3(t.turnoverMargin)},
        {"garbage_time_adjusted_epa", r3(t.garbageTimeAdjustedEpa)},
        {"strength_of_schedule", r3(t.strengthOfSchedule)},
        {"home_field_advantage", r3(t.homeFieldAdvantage)},
        {"early_season_performance", r3(t.earlySeasonPerformance)},
        {"late_season_performance", r3(t.lateSeasonPerformance)},
        {"improvement_trajectory", r3(t.improvementTrajectory)},
    };
}

void to_json(nlohmann::json& j, const GameSummary& s) {
    j = {
        {"home_score", s.homeScore},
        {"away_score", s.awayScore},
        {"total_points", s.totalPoints},
        {"point_differential", s.pointDifferential},
        {"is_high_scoring", s.isHighScoring},
        {"is_close_game", s.isCloseGame},
        {"game_conditions", {
            {"surface", s.surface},
            {"roof", s.roof},
            {"temperature", optionalValue(s.temperature)},
            {"wind", optionalValue(s.wind)},
        }},
    };
}

void to_json(nlohmann::json& j, const GameInsight& g) {
    j = {
        {"game_id", g.gameId},
        {"home_team", g.homeTeam},
        {"away_team", g.awayTeam},
        {"game_date", g.gameDate},
        {"has_play_by_play", g.hasPlayByPlay},
        {"summary", g.summary},
    };
    if (!g.hasPlayByPlay) return;

    j["home_team_epa"] = r3(g.homeTeamEpa);
    j["away_team_epa"] = r3(g.awayTeamEpa);
    j["excitement_index"] = r3(g.excitementIndex);
    j["competitiveness"] = r3(g.competitiveness);
    j["momentum_swings"] = g.momentumSwings;
    j["passing_game_dominance"] = r3(g.passingGameDominance);
    j["rushing_game_dominance"] = r3(g.rushingGameDominance);
    j["biggest_play_epa"] = r3(g.biggestPlayEpa);
    j["biggest_epa_play_id"] = g.biggestEpaPlayId;
    j["biggest_play_wpa"] = r3(g.biggestPlayWpa);
    j["biggest_wpa_play_id"] = g.biggestWpaPlayId;
    j["turning_point_quarter"] = g.turningPointQuarter;
    j["red_zone_battle"] = g.redZoneBattle;
    j["third_down_battle"] = g.thirdDownBattle;
    j["turnover_battle"] = g.turnoverBattle;
}

void to_json(nlohmann::json& j, const LeaderEntry& e) {
    j = {
        {"team_abbr", e.teamAbbr},
        {"team_name", e.teamName},
        {"metric", e.metric},
        {"value", r3(e.value)},
    };
}

void to_json(nlohmann::json& j, const MetricComparison& c) {
    j = {
        {"metric", c.metric},
        {"value1", r3(c.value1)},
        {"value2", r3(c.value2)},
        {"advantage", c.leader},
        {"difference", r3(c.difference)},
        {"significant", c.significant},
    };
}

void to_json(nlohmann::json& j, const TeamComparison& c) {
    j = {
        {"team1", c.team1},
        {"team2", c.team2},
        {"season", c.season},
        {"metrics_comparison", c.metrics},
        {"advantages", {{c.team1, c.advantages1}, {c.team2, c.advantages2}}},
    };
}

void to_json(nlohmann::json& j, const VegasLine& l) {
    j = {
        {"game_id", l.gameId},
        {"sportsbook", l.sportsbook},
        {"bet_type", betTypeName(l.betType)},
        {"home_line", optionalValue(l.homeLine)},
        {"away_line", optionalValue(l.awayLine)},
        {"home_odds", optionalValue(l.homeOdds)},
        {"away_odds", optionalValue(l.awayOdds)},
        {"total", optionalValue(l.total)},
        {"over_odds", optionalValue(l.overOdds)},
        {"under_odds", optionalValue(l.underOdds)},
        {"timestamp", l.timestamp},
    };
}

void to_json(nlohmann::json& j, const Prediction& p) {
    j = {
        {"game_id", p.gameId},
        {"home_team", p.homeTeam},
        {"away_team", p.awayTeam},
        {"game_date", p.gameDate},
        {"predicted_winner", p.predictedWinner},
        {"win_probability", r4(p.winProbability)},
        {"home_win_prob", r4(p.homeWinProb)},
        {"away_win_prob", r4(p.awayWinProb)},
        {"confidence", r4(p.confidence)},
    };
}

void to_json(nlohmann::json& j, const ValueBet& b) {
    j = {
        {"game_id", b.gameId},
        {"home_team", b.homeTeam},
        {"away_team", b.awayTeam},
        {"game_date", b.gameDate},
        {"bet_type", betTypeName(b.betType)},
        {"recommendation", betSideName(b.side)},
        {"odds", b.odds},
        {"sportsbook", b.sportsbook},
        {"model_probability", r4(b.modelProbability)},
        {"vegas_probability", r4(b.marketProbability)},
        {"edge", r4(b.edge)},
        {"expected_value", r4(b.expectedValue)},
        {"kelly_fraction", r4(b.kellyFraction)},
        {"confidence", r4(b.confidence)},
        {"reasoning", b.reasoning},
    };
}

void to_json(nlohmann::json& j, const ValidationMetrics& m) {
    j = {
        {"total_predictions", m.totalPredictions},
        {"agreement_rate", r4(m.agreementRate)},
        {"avg_probability_difference", r4(m.avgProbabilityDifference)},
        {"calibration_error", r4(m.calibrationError)},
        {"value_bet_accuracy", r4(m.valueBetAccuracy)},
        {"kelly_criterion_roi", r4(m.kellyRoi)},
        {"sharpe_ratio", r4(m.sharpeRatio)},
        {"max_drawdown", r4(m.maxDrawdown)},
        {"bets_placed", m.betsPlaced},
    };
}

} // namespace gi
