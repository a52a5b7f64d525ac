#include "gi/config.h"
#include <nlohmann/json.hpp>
#include <fstream>

namespace gi {

namespace {

template<typename T>
void readIfPresent(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key) && !j[key].is_null()) {
        out = j[key].get<T>();
    }
}

void parseMarket(const nlohmann::json& j, MarketConfig& market) {
    readIfPresent(j, "home_advantage", market.homeAdvantage);
    readIfPresent(j, "max_home_strength", market.maxHomeStrength);
    readIfPresent(j, "game_noise", market.gameNoise);
    readIfPresent(j, "book_noise", market.bookNoise);
    readIfPresent(j, "min_probability", market.minProbability);
    readIfPresent(j, "max_probability", market.maxProbability);
    readIfPresent(j, "default_strength", market.defaultStrength);
    readIfPresent(j, "sportsbooks", market.sportsbooks);

    // Listed teams override or extend the built-in strength table
    if (j.contains("team_strengths")) {
        for (auto& [team, strength] : j["team_strengths"].items()) {
            market.teamStrengths[team] = strength.get<double>();
        }
    }
}

std::unique_ptr<AnalyticsConfig> parseJson(const nlohmann::json& j) {
    auto config = std::make_unique<AnalyticsConfig>();
    if (!j.is_object()) return config;

    if (j.contains("value_bets")) {
        readIfPresent(j["value_bets"], "min_edge", config->valueBets.minEdge);
        readIfPresent(j["value_bets"], "min_confidence", config->valueBets.minConfidence);
    }
    if (j.contains("validation")) {
        readIfPresent(j["validation"], "min_edge", config->validationMinEdge);
    }
    if (j.contains("market")) {
        parseMarket(j["market"], config->market);
    }
    if (j.contains("games")) {
        readIfPresent(j["games"], "momentum_threshold", config->momentumThreshold);
    }
    if (j.contains("rankings")) {
        readIfPresent(j["rankings"], "advantage_threshold", config->advantageThreshold);
    }
    return config;
}

} // anonymous namespace

std::unique_ptr<AnalyticsConfig> loadConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return nullptr;
    nlohmann::json j = nlohmann::json::parse(file);
    return parseJson(j);
}

std::unique_ptr<AnalyticsConfig> loadConfigFromString(const std::string& json) {
    auto j = nlohmann::json::parse(json);
    return parseJson(j);
}

} // namespace gi
