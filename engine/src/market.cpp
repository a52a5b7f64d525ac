#include "gi/market.h"
#include "gi/odds.h"
#include <algorithm>

namespace gi {

const char* betTypeName(BetType type) {
    switch (type) {
        case BetType::MONEYLINE: return "moneyline";
        case BetType::SPREAD: return "spread";
        case BetType::TOTAL: return "total";
    }
    return "unknown";
}

MockMarket::MockMarket(MarketConfig config, NoiseFactory noiseFactory)
    : config_(std::move(config)), noiseFactory_(std::move(noiseFactory)) {}

double MockMarket::teamStrength(const std::string& team) const {
    auto it = config_.teamStrengths.find(team);
    return it != config_.teamStrengths.end() ? it->second : config_.defaultStrength;
}

double MockMarket::baseHomeProbability(const std::string& homeTeam,
                                       const std::string& awayTeam) const {
    double home = std::min(config_.maxHomeStrength, teamStrength(homeTeam) + config_.homeAdvantage);
    double away = teamStrength(awayTeam);
    double total = home + away;
    return total > 0.0 ? home / total : 0.5;
}

std::vector<VegasLine> MockMarket::quoteGame(const GameRow& game, int64_t asOf) const {
    std::unique_ptr<NoiseSourceBase> gameNoise = noiseFactory_(stableSeed(game.gameId));
    double homeProb = baseHomeProbability(game.homeTeam, game.awayTeam)
                    + gameNoise->uniform(-config_.gameNoise, config_.gameNoise);
    homeProb = std::clamp(homeProb, config_.minProbability, config_.maxProbability);

    std::vector<VegasLine> lines;
    lines.reserve(config_.sportsbooks.size());
    for (const auto& book : config_.sportsbooks) {
        std::unique_ptr<NoiseSourceBase> bookNoise = noiseFactory_(stableSeed(game.gameId + "|" + book));
        double bookHome = std::clamp(homeProb + bookNoise->uniform(-config_.bookNoise, config_.bookNoise),
                                     config_.minProbability, config_.maxProbability);
        int hoursBack = bookNoise->uniformInt(1, 48);

        VegasLine line;
        line.gameId = game.gameId;
        line.sportsbook = book;
        line.betType = BetType::MONEYLINE;
        line.homeOdds = probabilityToOdds(bookHome);
        line.awayOdds = probabilityToOdds(1.0 - bookHome);
        line.timestamp = asOf - static_cast<int64_t>(hoursBack) * 3600;
        lines.push_back(line);
    }
    return lines;
}

std::vector<VegasLine> MockMarket::createMockLines(const std::vector<GameRow>& games,
                                                   int64_t asOf) const {
    std::vector<VegasLine> lines;
    for (const auto& game : games) {
        std::vector<VegasLine> quotes = quoteGame(game, asOf);
        lines.insert(lines.end(), quotes.begin(), quotes.end());
    }
    return lines;
}

} // namespace gi
