#include "gi/value_betting.h"
#include "gi/odds.h"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>

namespace gi {

Prediction makePrediction(const GameRow& game, double homeWinProb) {
    if (!(homeWinProb >= 0.0 && homeWinProb <= 1.0)) {
        throw std::invalid_argument(fmt::format("Home win probability out of [0, 1] for {}: {}",
                                                game.gameId, homeWinProb));
    }
    Prediction p;
    p.gameId = game.gameId;
    p.homeTeam = game.homeTeam;
    p.awayTeam = game.awayTeam;
    p.gameDate = game.gameDate;
    p.season = game.season;
    p.homeWinProb = homeWinProb;
    p.awayWinProb = 1.0 - homeWinProb;
    p.predictedWinner = p.homeWinProb > p.awayWinProb ? game.homeTeam : game.awayTeam;
    p.winProbability = std::max(p.homeWinProb, p.awayWinProb);
    p.confidence = std::abs(homeWinProb - 0.5) * 2.0;
    return p;
}

const char* betSideName(BetSide side) {
    switch (side) {
        case BetSide::HOME: return "home";
        case BetSide::AWAY: return "away";
        case BetSide::OVER: return "over";
        case BetSide::UNDER: return "under";
    }
    return "unknown";
}

namespace {

std::optional<int> sideOdds(const VegasLine& line, BetSide side) {
    switch (side) {
        case BetSide::HOME: return line.homeOdds;
        case BetSide::AWAY: return line.awayOdds;
        case BetSide::OVER: return line.overOdds;
        case BetSide::UNDER: return line.underOdds;
    }
    return std::nullopt;
}

} // anonymous namespace

std::optional<BestOdds> bestAvailableOdds(const std::vector<VegasLine>& lines,
                                          const std::string& gameId, BetSide side) {
    std::optional<BestOdds> best;
    for (const auto& line : lines) {
        if (line.gameId != gameId || line.betType != BetType::MONEYLINE) continue;
        std::optional<int> odds = sideOdds(line, side);
        if (!odds || *odds == 0) continue;
        if (!best || *odds > best->odds) {
            best = BestOdds{*odds, line.sportsbook};
        }
    }
    return best;
}

std::vector<ValueBet> findValueBets(const std::vector<Prediction>& predictions,
                                    const std::vector<VegasLine>& lines,
                                    const ValueBetConfig& config) {
    std::map<std::string, std::vector<VegasLine>> linesByGame;
    for (const auto& line : lines) {
        if (line.betType == BetType::MONEYLINE) linesByGame[line.gameId].push_back(line);
    }

    std::vector<ValueBet> bets;
    for (const auto& prediction : predictions) {
        auto it = linesByGame.find(prediction.gameId);
        if (it == linesByGame.end()) continue;

        for (BetSide side : {BetSide::HOME, BetSide::AWAY}) {
            double modelProb = side == BetSide::HOME ? prediction.homeWinProb : prediction.awayWinProb;
            std::optional<BestOdds> best = bestAvailableOdds(it->second, prediction.gameId, side);
            if (!best || modelProb < config.minConfidence) continue;

            double marketProb = oddsToProbability(best->odds);
            double edge = modelProb - marketProb;
            if (edge < config.minEdge) continue;

            double ev = expectedValue(modelProb, best->odds);
            if (ev <= 0.0) continue;

            ValueBet bet;
            bet.gameId = prediction.gameId;
            bet.homeTeam = prediction.homeTeam;
            bet.awayTeam = prediction.awayTeam;
            bet.gameDate = prediction.gameDate;
            bet.betType = BetType::MONEYLINE;
            bet.side = side;
            bet.odds = best->odds;
            bet.sportsbook = best->sportsbook;
            bet.modelProbability = modelProb;
            bet.marketProbability = marketProb;
            bet.edge = edge;
            bet.expectedValue = ev;
            bet.kellyFraction = kellyCriterion(modelProb, best->odds);
            bet.confidence = prediction.confidence;
            bet.reasoning = fmt::format("Model: {:.3f} vs market: {:.3f} (Edge: {:.3f}) at {:+d} with {}",
                                        modelProb, marketProb, edge, best->odds, best->sportsbook);
            bets.push_back(std::move(bet));
        }
    }

    std::stable_sort(bets.begin(), bets.end(), [](const ValueBet& a, const ValueBet& b) {
        return a.expectedValue > b.expectedValue;
    });
    return bets;
}

std::vector<ValueBet> upcomingValueBets(const RecordStore& store,
                                        const WinProbabilityClassifier& classifier,
                                        const MockMarket& market, int season,
                                        const std::string& startDate, const std::string& endDate,
                                        int64_t asOf, const ValueBetConfig& config) {
    std::vector<GameRow> upcoming;
    for (auto& game : store.gamesInWindow(season, startDate, endDate)) {
        if (!game.isCompleted()) upcoming.push_back(std::move(game));
    }
    if (upcoming.empty()) {
        spdlog::info("No unplayed games in {} between {} and {}", season, startDate, endDate);
        return {};
    }

    std::vector<Prediction> predictions;
    for (const auto& game : upcoming) {
        std::optional<double> homeProb = classifier.homeWinProbability(
            game.homeTeam, game.awayTeam, game.gameDate, season);
        if (!homeProb) {
            spdlog::warn("No prediction for {} ({} at {})", game.gameId, game.awayTeam, game.homeTeam);
            continue;
        }
        predictions.push_back(makePrediction(game, *homeProb));
    }

    return findValueBets(predictions, market.createMockLines(upcoming, asOf), config);
}

} // namespace gi
