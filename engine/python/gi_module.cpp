#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "gi/situation.h"
#include "gi/expected_points.h"
#include "gi/win_probability.h"
#include "gi/play_metrics.h"
#include "gi/records.h"
#include "gi/record_store.h"
#include "gi/team_insights.h"
#include "gi/game_insights.h"
#include "gi/rankings.h"
#include "gi/narrative.h"
#include "gi/odds.h"
#include "gi/market.h"
#include "gi/value_betting.h"
#include "gi/validation.h"
#include "gi/baseline_classifier.h"
#include "gi/config.h"
#include "gi/serialization.h"

namespace py = pybind11;

namespace {

// Lets a trained Python model stand in as the classifier
class PyWinProbabilityClassifier : public gi::WinProbabilityClassifier {
public:
    using gi::WinProbabilityClassifier::WinProbabilityClassifier;

    std::optional<double> homeWinProbability(const std::string& homeTeam,
                                             const std::string& awayTeam,
                                             const std::string& gameDate,
                                             int season) const override {
        PYBIND11_OVERRIDE_PURE_NAME(std::optional<double>, gi::WinProbabilityClassifier,
                                    "home_win_probability", homeWinProbability,
                                    homeTeam, awayTeam, gameDate, season);
    }
};

template<typename T>
std::string toJsonString(const T& value) {
    return nlohmann::json(value).dump();
}

} // anonymous namespace

PYBIND11_MODULE(gi_engine, m) {
    m.doc() = "Gridiron analytics engine - Python bindings";

    // --- Enums ---
    py::enum_<gi::OutcomeKind>(m, "OutcomeKind")
        .value("TOUCHDOWN", gi::OutcomeKind::TOUCHDOWN)
        .value("TURNOVER", gi::OutcomeKind::TURNOVER)
        .value("NORMAL_GAIN", gi::OutcomeKind::NORMAL_GAIN)
        .value("TURNOVER_ON_DOWNS", gi::OutcomeKind::TURNOVER_ON_DOWNS);

    py::enum_<gi::BetType>(m, "BetType")
        .value("MONEYLINE", gi::BetType::MONEYLINE)
        .value("SPREAD", gi::BetType::SPREAD)
        .value("TOTAL", gi::BetType::TOTAL);

    py::enum_<gi::BetSide>(m, "BetSide")
        .value("HOME", gi::BetSide::HOME)
        .value("AWAY", gi::BetSide::AWAY)
        .value("OVER", gi::BetSide::OVER)
        .value("UNDER", gi::BetSide::UNDER);

    // --- Situation / estimators ---
    py::class_<gi::Situation>(m, "Situation")
        .def(py::init<int, int, int, int, int, int, int, std::string>(),
             py::arg("down"), py::arg("ydstogo"), py::arg("yardline_100"), py::arg("quarter"),
             py::arg("game_seconds_remaining"), py::arg("score_differential"),
             py::arg("timeouts_remaining") = 3, py::arg("play_type") = "pass")
        .def_property_readonly("down", &gi::Situation::down)
        .def_property_readonly("ydstogo", &gi::Situation::ydstogo)
        .def_property_readonly("yardline_100", &gi::Situation::yardline100)
        .def_property_readonly("quarter", &gi::Situation::quarter)
        .def_property_readonly("game_seconds_remaining", &gi::Situation::gameSecondsRemaining)
        .def_property_readonly("score_differential", &gi::Situation::scoreDifferential)
        .def_property_readonly("timeouts_remaining", &gi::Situation::timeoutsRemaining)
        .def_property_readonly("play_type", &gi::Situation::playType)
        .def("in_red_zone", &gi::Situation::inRedZone)
        .def("is_close_game", &gi::Situation::isCloseGame);

    py::class_<gi::ExpectedPointsModel>(m, "ExpectedPointsModel")
        .def(py::init<>())
        .def("base_value", &gi::ExpectedPointsModel::baseValue)
        .def("expected_points", &gi::ExpectedPointsModel::expectedPoints);

    py::class_<gi::WinProbabilityModel>(m, "WinProbabilityModel")
        .def(py::init<>())
        .def("win_probability", &gi::WinProbabilityModel::winProbability)
        .def_static("time_factor", &gi::WinProbabilityModel::timeFactor);

    // --- Play metrics ---
    py::class_<gi::PlayInput>(m, "PlayInput")
        .def(py::init<>())
        .def_readwrite("down", &gi::PlayInput::down)
        .def_readwrite("ydstogo", &gi::PlayInput::ydstogo)
        .def_readwrite("yardline_100", &gi::PlayInput::yardline100)
        .def_readwrite("quarter", &gi::PlayInput::quarter)
        .def_readwrite("game_seconds_remaining", &gi::PlayInput::gameSecondsRemaining)
        .def_readwrite("score_differential", &gi::PlayInput::scoreDifferential)
        .def_readwrite("timeouts_remaining", &gi::PlayInput::timeoutsRemaining)
        .def_readwrite("play_type", &gi::PlayInput::playType)
        .def_readwrite("yards_gained", &gi::PlayInput::yardsGained)
        .def_readwrite("touchdown", &gi::PlayInput::touchdown)
        .def_readwrite("interception", &gi::PlayInput::interception)
        .def_readwrite("fumble_lost", &gi::PlayInput::fumbleLost);

    py::class_<gi::MetricBundle>(m, "MetricBundle")
        .def_readonly("expected_points_before", &gi::MetricBundle::expectedPointsBefore)
        .def_readonly("expected_points_after", &gi::MetricBundle::expectedPointsAfter)
        .def_readonly("epa", &gi::MetricBundle::epa)
        .def_readonly("win_prob_before", &gi::MetricBundle::winProbBefore)
        .def_readonly("win_prob_after", &gi::MetricBundle::winProbAfter)
        .def_readonly("wpa", &gi::MetricBundle::wpa)
        .def_readonly("leverage", &gi::MetricBundle::leverage)
        .def_readonly("clutch_index", &gi::MetricBundle::clutchIndex)
        .def_readonly("success_rate", &gi::MetricBundle::successRate)
        .def_readonly("explosive_play", &gi::MetricBundle::explosivePlay)
        .def_readonly("outcome", &gi::MetricBundle::outcome)
        .def("to_json", &toJsonString<gi::MetricBundle>);

    py::class_<gi::PlayMetricsEngine>(m, "PlayMetricsEngine")
        .def(py::init<>())
        .def("compute_metrics", &gi::PlayMetricsEngine::computeMetrics);

    // --- Records ---
    py::class_<gi::TeamRow>(m, "TeamRow")
        .def(py::init<>())
        .def_readwrite("abbr", &gi::TeamRow::abbr)
        .def_readwrite("name", &gi::TeamRow::name)
        .def_readwrite("nickname", &gi::TeamRow::nickname)
        .def_readwrite("conference", &gi::TeamRow::conference)
        .def_readwrite("division", &gi::TeamRow::division)
        .def("full_name", &gi::TeamRow::fullName);

    py::class_<gi::GameRow>(m, "GameRow")
        .def(py::init<>())
        .def_readwrite("game_id", &gi::GameRow::gameId)
        .def_readwrite("season", &gi::GameRow::season)
        .def_readwrite("week", &gi::GameRow::week)
        .def_readwrite("game_date", &gi::GameRow::gameDate)
        .def_readwrite("home_team", &gi::GameRow::homeTeam)
        .def_readwrite("away_team", &gi::GameRow::awayTeam)
        .def_readwrite("home_score", &gi::GameRow::homeScore)
        .def_readwrite("away_score", &gi::GameRow::awayScore)
        .def_readwrite("surface", &gi::GameRow::surface)
        .def_readwrite("roof", &gi::GameRow::roof)
        .def_readwrite("temperature", &gi::GameRow::temperature)
        .def_readwrite("wind", &gi::GameRow::wind);

    py::class_<gi::PlayRow>(m, "PlayRow")
        .def(py::init<>())
        .def_readwrite("play_id", &gi::PlayRow::playId)
        .def_readwrite("game_id", &gi::PlayRow::gameId)
        .def_readwrite("season", &gi::PlayRow::season)
        .def_readwrite("week", &gi::PlayRow::week)
        .def_readwrite("posteam", &gi::PlayRow::posteam)
        .def_readwrite("defteam", &gi::PlayRow::defteam)
        .def_readwrite("quarter", &gi::PlayRow::quarter)
        .def_readwrite("game_seconds_remaining", &gi::PlayRow::gameSecondsRemaining)
        .def_readwrite("down", &gi::PlayRow::down)
        .def_readwrite("ydstogo", &gi::PlayRow::ydstogo)
        .def_readwrite("yardline_100", &gi::PlayRow::yardline100)
        .def_readwrite("score_differential", &gi::PlayRow::scoreDifferential)
        .def_readwrite("play_type", &gi::PlayRow::playType)
        .def_readwrite("yards_gained", &gi::PlayRow::yardsGained)
        .def_readwrite("touchdown", &gi::PlayRow::touchdown)
        .def_readwrite("interception", &gi::PlayRow::interception)
        .def_readwrite("fumble_lost", &gi::PlayRow::fumbleLost);

    py::class_<gi::RecordStore>(m, "RecordStore")
        .def("teams", &gi::RecordStore::teams)
        .def("find_game", &gi::RecordStore::findGame)
        .def("games_in_window", &gi::RecordStore::gamesInWindow)
        .def("game_plays", &gi::RecordStore::gamePlays);

    py::class_<gi::InMemoryRecordStore, gi::RecordStore>(m, "InMemoryRecordStore")
        .def(py::init<>())
        .def("add_team", &gi::InMemoryRecordStore::addTeam)
        .def("add_game", &gi::InMemoryRecordStore::addGame)
        .def("add_play", &gi::InMemoryRecordStore::addPlay)
        .def("play_count", &gi::InMemoryRecordStore::playCount)
        .def("game_count", &gi::InMemoryRecordStore::gameCount);

    m.def("load_record_store", &gi::loadRecordStore, py::arg("path"));
    m.def("load_record_store_from_string", &gi::loadRecordStoreFromString, py::arg("json"));

    // --- Insights ---
    py::class_<gi::TeamInsight>(m, "TeamInsight")
        .def_readonly("team_abbr", &gi::TeamInsight::teamAbbr)
        .def_readonly("season", &gi::TeamInsight::season)
        .def_readonly("offensive_plays", &gi::TeamInsight::offensivePlays)
        .def_readonly("defensive_plays", &gi::TeamInsight::defensivePlays)
        .def_readonly("offensive_epa_per_play", &gi::TeamInsight::offensiveEpaPerPlay)
        .def_readonly("defensive_epa_per_play", &gi::TeamInsight::defensiveEpaPerPlay)
        .def_readonly("red_zone_efficiency", &gi::TeamInsight::redZoneEfficiency)
        .def_readonly("third_down_conversion_rate", &gi::TeamInsight::thirdDownConversionRate)
        .def_readonly("turnover_margin", &gi::TeamInsight::turnoverMargin)
        .def("metric", &gi::teamMetric)
        .def("to_json", &toJsonString<gi::TeamInsight>);

    py::class_<gi::GameInsight>(m, "GameInsight")
        .def_readonly("game_id", &gi::GameInsight::gameId)
        .def_readonly("has_play_by_play", &gi::GameInsight::hasPlayByPlay)
        .def_readonly("home_team_epa", &gi::GameInsight::homeTeamEpa)
        .def_readonly("away_team_epa", &gi::GameInsight::awayTeamEpa)
        .def_readonly("excitement_index", &gi::GameInsight::excitementIndex)
        .def_readonly("momentum_swings", &gi::GameInsight::momentumSwings)
        .def_readonly("red_zone_battle", &gi::GameInsight::redZoneBattle)
        .def_readonly("third_down_battle", &gi::GameInsight::thirdDownBattle)
        .def_readonly("turnover_battle", &gi::GameInsight::turnoverBattle)
        .def("to_json", &toJsonString<gi::GameInsight>);

    m.def("generate_team_insight", &gi::generateTeamInsight,
          py::arg("store"), py::arg("engine"), py::arg("team"), py::arg("season"));
    m.def("generate_game_insight", &gi::generateGameInsight,
          py::arg("store"), py::arg("engine"), py::arg("game_id"),
          py::arg("momentum_threshold") = gi::DEFAULT_MOMENTUM_THRESHOLD);
    m.def("season_narrative", &gi::seasonNarrative, py::arg("insight"), py::arg("team_name"));

    // --- Rankings ---
    py::class_<gi::LeaderEntry>(m, "LeaderEntry")
        .def_readonly("team_abbr", &gi::LeaderEntry::teamAbbr)
        .def_readonly("team_name", &gi::LeaderEntry::teamName)
        .def_readonly("value", &gi::LeaderEntry::value);

    py::class_<gi::TeamComparison>(m, "TeamComparison")
        .def_readonly("advantages1", &gi::TeamComparison::advantages1)
        .def_readonly("advantages2", &gi::TeamComparison::advantages2)
        .def("to_json", &toJsonString<gi::TeamComparison>);

    m.def("available_metrics", [] {
        std::vector<std::string> names;
        for (const auto& info : gi::availableMetrics()) names.push_back(info.name);
        return names;
    });
    m.def("league_leaders", &gi::leagueLeaders,
          py::arg("store"), py::arg("engine"), py::arg("season"), py::arg("metric"),
          py::arg("limit") = 10);
    m.def("compare_teams", &gi::compareTeams,
          py::arg("store"), py::arg("engine"), py::arg("team1"), py::arg("team2"),
          py::arg("season"), py::arg("advantage_threshold") = gi::DEFAULT_ADVANTAGE_THRESHOLD);

    // --- Odds ---
    m.def("odds_to_probability", &gi::oddsToProbability);
    m.def("probability_to_odds", &gi::probabilityToOdds);
    m.def("expected_value", &gi::expectedValue,
          py::arg("probability"), py::arg("odds"), py::arg("stake") = 1.0);
    m.def("kelly_criterion", &gi::kellyCriterion);

    // --- Market / betting ---
    py::class_<gi::VegasLine>(m, "VegasLine")
        .def(py::init<>())
        .def_readwrite("game_id", &gi::VegasLine::gameId)
        .def_readwrite("sportsbook", &gi::VegasLine::sportsbook)
        .def_readwrite("bet_type", &gi::VegasLine::betType)
        .def_readwrite("home_odds", &gi::VegasLine::homeOdds)
        .def_readwrite("away_odds", &gi::VegasLine::awayOdds)
        .def_readwrite("timestamp", &gi::VegasLine::timestamp);

    py::class_<gi::MarketConfig>(m, "MarketConfig")
        .def(py::init<>())
        .def_readwrite("team_strengths", &gi::MarketConfig::teamStrengths)
        .def_readwrite("home_advantage", &gi::MarketConfig::homeAdvantage)
        .def_readwrite("game_noise", &gi::MarketConfig::gameNoise)
        .def_readwrite("book_noise", &gi::MarketConfig::bookNoise)
        .def_readwrite("sportsbooks", &gi::MarketConfig::sportsbooks);

    py::class_<gi::MockMarket>(m, "MockMarket")
        .def(py::init([](gi::MarketConfig config) { return gi::MockMarket(std::move(config)); }),
             py::arg("config") = gi::MarketConfig{})
        .def("team_strength", &gi::MockMarket::teamStrength)
        .def("create_mock_lines", &gi::MockMarket::createMockLines);

    py::class_<gi::WinProbabilityClassifier, PyWinProbabilityClassifier>(m, "WinProbabilityClassifier")
        .def(py::init<>())
        .def("home_win_probability", &gi::WinProbabilityClassifier::homeWinProbability);

    py::class_<gi::NetEpaClassifier, gi::WinProbabilityClassifier>(m, "NetEpaClassifier")
        .def(py::init<const gi::RecordStore&, const gi::PlayMetricsEngine&, double, double>(),
             py::arg("store"), py::arg("engine"), py::arg("scale") = 4.0, py::arg("home_edge") = 0.1,
             py::keep_alive<1, 2>(), py::keep_alive<1, 3>());

    py::class_<gi::Prediction>(m, "Prediction")
        .def_readonly("game_id", &gi::Prediction::gameId)
        .def_readonly("predicted_winner", &gi::Prediction::predictedWinner)
        .def_readonly("win_probability", &gi::Prediction::winProbability)
        .def_readonly("home_win_prob", &gi::Prediction::homeWinProb)
        .def_readonly("confidence", &gi::Prediction::confidence);

    py::class_<gi::ValueBetConfig>(m, "ValueBetConfig")
        .def(py::init<>())
        .def_readwrite("min_edge", &gi::ValueBetConfig::minEdge)
        .def_readwrite("min_confidence", &gi::ValueBetConfig::minConfidence);

    py::class_<gi::ValueBet>(m, "ValueBet")
        .def_readonly("game_id", &gi::ValueBet::gameId)
        .def_readonly("side", &gi::ValueBet::side)
        .def_readonly("odds", &gi::ValueBet::odds)
        .def_readonly("sportsbook", &gi::ValueBet::sportsbook)
        .def_readonly("edge", &gi::ValueBet::edge)
        .def_readonly("expected_value", &gi::ValueBet::expectedValue)
        .def_readonly("kelly_fraction", &gi::ValueBet::kellyFraction)
        .def_readonly("reasoning", &gi::ValueBet::reasoning)
        .def("to_json", &toJsonString<gi::ValueBet>);

    py::class_<gi::ValidationMetrics>(m, "ValidationMetrics")
        .def_readonly("total_predictions", &gi::ValidationMetrics::totalPredictions)
        .def_readonly("agreement_rate", &gi::ValidationMetrics::agreementRate)
        .def_readonly("calibration_error", &gi::ValidationMetrics::calibrationError)
        .def_readonly("kelly_roi", &gi::ValidationMetrics::kellyRoi)
        .def_readonly("sharpe_ratio", &gi::ValidationMetrics::sharpeRatio)
        .def_readonly("max_drawdown", &gi::ValidationMetrics::maxDrawdown)
        .def("to_json", &toJsonString<gi::ValidationMetrics>);

    m.def("make_prediction", &gi::makePrediction, py::arg("game"), py::arg("home_win_prob"));
    m.def("upcoming_value_bets", &gi::upcomingValueBets,
          py::arg("store"), py::arg("classifier"), py::arg("market"), py::arg("season"),
          py::arg("start_date"), py::arg("end_date"), py::arg("as_of"),
          py::arg("config") = gi::ValueBetConfig{});
    m.def("validate_window", &gi::validateWindow,
          py::arg("store"), py::arg("classifier"), py::arg("market"), py::arg("season"),
          py::arg("start_date"), py::arg("end_date"), py::arg("as_of"),
          py::arg("min_edge") = gi::DEFAULT_VALIDATION_EDGE);

    m.attr("MAX_KELLY_FRACTION") = gi::MAX_KELLY_FRACTION;
}
