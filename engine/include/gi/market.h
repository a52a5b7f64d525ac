#pragma once

#include "gi/noise.h"
#include "gi/records.h"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gi {

enum class BetType : uint8_t { MONEYLINE, SPREAD, TOTAL };

const char* betTypeName(BetType type);

// One sportsbook quote for one game
struct VegasLine {
    std::string gameId;
    std::string sportsbook;
    BetType betType = BetType::MONEYLINE;
    std::optional<double> homeLine;
    std::optional<double> awayLine;
    std::optional<int> homeOdds;
    std::optional<int> awayOdds;
    std::optional<double> total;
    std::optional<int> overOdds;
    std::optional<int> underOdds;
    int64_t timestamp = 0;  // unix seconds
};

struct MarketConfig {
    std::map<std::string, double> teamStrengths = {
        {"KC", 0.65}, {"BUF", 0.62}, {"SF", 0.60}, {"DAL", 0.58},
        {"PHI", 0.56}, {"MIA", 0.54}, {"CIN", 0.52}, {"JAX", 0.50},
    };
    double defaultStrength = 0.50;
    double homeAdvantage = 0.03;
    double maxHomeStrength = 0.85;
    double gameNoise = 0.05;    // +/- per game
    double bookNoise = 0.02;    // +/- per sportsbook
    double minProbability = 0.1;
    double maxProbability = 0.9;
    std::vector<std::string> sportsbooks = {"DraftKings", "FanDuel", "BetMGM", "Caesars"};
};

// Synthetic moneyline market for games without a live odds feed.
// Noise is seeded from the game id (and the book name) so quotes are reproducible.
class MockMarket {
    MarketConfig config_;
    NoiseFactory noiseFactory_;

public:
    explicit MockMarket(MarketConfig config = MarketConfig{},
                        NoiseFactory noiseFactory = seededNoiseFactory());

    double teamStrength(const std::string& team) const;

    // Home win probability before any noise
    double baseHomeProbability(const std::string& homeTeam, const std::string& awayTeam) const;

    // One quote per sportsbook, stamped 1-48 hours before asOf
    std::vector<VegasLine> quoteGame(const GameRow& game, int64_t asOf) const;

    std::vector<VegasLine> createMockLines(const std::vector<GameRow>& games, int64_t asOf) const;

    const MarketConfig& config() const { return config_; }
};

} // namespace gi
