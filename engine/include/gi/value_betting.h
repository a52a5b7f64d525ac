#pragma once

#include "gi/market.h"
#include "gi/record_store.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gi {

// Output of the external win-probability classifier for one matchup
struct Prediction {
    std::string gameId;
    std::string homeTeam;
    std::string awayTeam;
    std::string gameDate;
    int season = 0;
    std::string predictedWinner;
    double winProbability = 0.5;    // probability of the predicted winner
    double homeWinProb = 0.5;
    double awayWinProb = 0.5;
    double confidence = 0.0;        // |home - 0.5| * 2
};

// Throws std::invalid_argument unless 0 <= homeWinProb <= 1
Prediction makePrediction(const GameRow& game, double homeWinProb);

// Externally trained predictor; only its output probability is consumed.
class WinProbabilityClassifier {
public:
    virtual ~WinProbabilityClassifier() = default;

    // Home-team win probability, or nullopt when the matchup can't be predicted
    virtual std::optional<double> homeWinProbability(const std::string& homeTeam,
                                                     const std::string& awayTeam,
                                                     const std::string& gameDate,
                                                     int season) const = 0;
};

enum class BetSide : uint8_t { HOME, AWAY, OVER, UNDER };

const char* betSideName(BetSide side);

struct ValueBet {
    std::string gameId;
    std::string homeTeam;
    std::string awayTeam;
    std::string gameDate;
    BetType betType = BetType::MONEYLINE;
    BetSide side = BetSide::HOME;
    int odds = 0;
    std::string sportsbook;
    double modelProbability = 0.0;
    double marketProbability = 0.0;
    double edge = 0.0;
    double expectedValue = 0.0;
    double kellyFraction = 0.0;
    double confidence = 0.0;
    std::string reasoning;
};

struct ValueBetConfig {
    double minEdge = 0.05;
    double minConfidence = 0.6;
};

struct BestOdds {
    int odds = 0;
    std::string sportsbook;
};

// Highest odds offered for a side across the moneyline quotes of one game
std::optional<BestOdds> bestAvailableOdds(const std::vector<VegasLine>& lines,
                                          const std::string& gameId, BetSide side);

// Sorted by expected value, descending
std::vector<ValueBet> findValueBets(const std::vector<Prediction>& predictions,
                                    const std::vector<VegasLine>& lines,
                                    const ValueBetConfig& config = ValueBetConfig{});

// Unplayed games of the window, priced by the mock market
std::vector<ValueBet> upcomingValueBets(const RecordStore& store,
                                        const WinProbabilityClassifier& classifier,
                                        const MockMarket& market, int season,
                                        const std::string& startDate, const std::string& endDate,
                                        int64_t asOf,
                                        const ValueBetConfig& config = ValueBetConfig{});

} // namespace gi
