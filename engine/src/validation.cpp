#include "gi/validation.h"
#include "gi/odds.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace gi {

double sharpeRatio(const std::vector<double>& returns) {
    if (returns.size() < 2) return 0.0;
    double n = static_cast<double>(returns.size());
    double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / n;
    double ss = 0.0;
    for (double r : returns) ss += (r - mean) * (r - mean);
    double stdev = std::sqrt(ss / (n - 1.0));
    return stdev > 0.0 ? mean / stdev : 0.0;
}

double maxDrawdown(const std::vector<double>& returns) {
    if (returns.empty()) return 0.0;
    double cumulative = returns.front();
    double peak = cumulative;
    double worst = 0.0;
    for (size_t i = 1; i < returns.size(); ++i) {
        cumulative += returns[i];
        peak = std::max(peak, cumulative);
        worst = std::max(worst, peak - cumulative);
    }
    return worst;
}

ValidationMetrics validatePredictions(const std::vector<Prediction>& predictions,
                                      const std::vector<VegasLine>& lines,
                                      const std::vector<GameOutcome>& outcomes,
                                      double minEdge) {
    if (predictions.size() != outcomes.size()) {
        throw std::invalid_argument("Predictions and outcomes must have the same length");
    }

    int evaluated = 0;
    int agreements = 0;
    int correct = 0;
    double probabilityGap = 0.0;
    double statedConfidence = 0.0;
    int betWins = 0;
    std::vector<double> returns;

    for (size_t i = 0; i < predictions.size(); ++i) {
        const Prediction& p = predictions[i];
        std::optional<BestOdds> homeOdds = bestAvailableOdds(lines, p.gameId, BetSide::HOME);
        std::optional<BestOdds> awayOdds = bestAvailableOdds(lines, p.gameId, BetSide::AWAY);
        if (!homeOdds || !awayOdds) continue;

        double marketHome = oddsToProbability(homeOdds->odds);
        double marketAway = oddsToProbability(awayOdds->odds);
        const std::string& marketFavorite = marketHome > marketAway ? p.homeTeam : p.awayTeam;
        bool modelPicksHome = p.predictedWinner == p.homeTeam;

        evaluated++;
        if (marketFavorite == p.predictedWinner) agreements++;

        double modelProb = modelPicksHome ? p.homeWinProb : p.awayWinProb;
        double marketProb = modelPicksHome ? marketHome : marketAway;
        probabilityGap += std::abs(modelProb - marketProb);
        statedConfidence += p.winProbability;

        bool hit = outcomes[i].winner == p.predictedWinner;
        if (hit) correct++;

        int odds = modelPicksHome ? homeOdds->odds : awayOdds->odds;
        if (modelProb > marketProb + minEdge) {
            double stake = kellyCriterion(modelProb, odds);
            returns.push_back(hit ? stake * payoutPerUnit(odds) : -stake);
            if (hit) betWins++;
        }
    }

    ValidationMetrics m;
    if (evaluated == 0) {
        return m;
    }

    double accuracy = static_cast<double>(correct) / evaluated;
    m.totalPredictions = evaluated;
    m.agreementRate = static_cast<double>(agreements) / evaluated;
    m.avgProbabilityDifference = probabilityGap / evaluated;
    m.calibrationError = std::abs(accuracy - statedConfidence / evaluated);
    m.betsPlaced = static_cast<int>(returns.size());
    m.valueBetAccuracy = returns.empty() ? 0.0 : static_cast<double>(betWins) / returns.size();
    m.kellyRoi = std::accumulate(returns.begin(), returns.end(), 0.0);
    m.sharpeRatio = sharpeRatio(returns);
    m.maxDrawdown = maxDrawdown(returns);
    return m;
}

ValidationMetrics validateWindow(const RecordStore& store,
                                 const WinProbabilityClassifier& classifier,
                                 const MockMarket& market, int season,
                                 const std::string& startDate, const std::string& endDate,
                                 int64_t asOf, double minEdge) {
    std::vector<GameRow> completed;
    std::vector<Prediction> predictions;
    std::vector<GameOutcome> outcomes;

    for (const auto& game : store.gamesInWindow(season, startDate, endDate)) {
        if (!game.isCompleted() || *game.homeScore == *game.awayScore) continue;

        std::optional<double> homeProb = classifier.homeWinProbability(
            game.homeTeam, game.awayTeam, game.gameDate, season);
        if (!homeProb) {
            spdlog::warn("No prediction for {} ({} at {})", game.gameId, game.awayTeam, game.homeTeam);
            continue;
        }

        bool homeWon = *game.homeScore > *game.awayScore;
        completed.push_back(game);
        predictions.push_back(makePrediction(game, *homeProb));
        outcomes.push_back(homeWon ? GameOutcome{game.homeTeam, game.awayTeam}
                                   : GameOutcome{game.awayTeam, game.homeTeam});
    }

    if (completed.empty()) {
        spdlog::info("No completed games in {} between {} and {}", season, startDate, endDate);
        return ValidationMetrics{};
    }

    return validatePredictions(predictions, market.createMockLines(completed, asOf), outcomes, minEdge);
}

const char* agreementLabel(double agreementRate) {
    if (agreementRate > 0.7) return "High";
    if (agreementRate > 0.5) return "Medium";
    return "Low";
}

const char* calibrationLabel(double calibrationError) {
    if (calibrationError < 0.1) return "Good";
    if (calibrationError < 0.2) return "Fair";
    return "Poor";
}

const char* valuePotentialLabel(double kellyRoi) {
    if (kellyRoi > 0.1) return "High";
    if (kellyRoi > 0.05) return "Medium";
    return "Low";
}

} // namespace gi
