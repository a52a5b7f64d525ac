#include "gi/game_insights.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <vector>

namespace gi {

double SituationalTally::redZoneRate() const {
    return redZonePlays > 0 ? static_cast<double>(redZoneTouchdowns) / redZonePlays : 0.0;
}

double SituationalTally::thirdDownRate() const {
    return thirdDownAttempts > 0
        ? static_cast<double>(thirdDownConversions) / thirdDownAttempts : 0.0;
}

double SituationalTally::passEpaPerPlay() const {
    return passPlays > 0 ? passEpa / passPlays : 0.0;
}

double SituationalTally::runEpaPerPlay() const {
    return runPlays > 0 ? runEpa / runPlays : 0.0;
}

namespace {

GameSummary summarize(const GameRow& game) {
    GameSummary s;
    s.surface = game.surface;
    s.roof = game.roof;
    s.temperature = game.temperature;
    s.wind = game.wind;
    if (game.isCompleted()) {
        s.homeScore = *game.homeScore;
        s.awayScore = *game.awayScore;
        s.totalPoints = s.homeScore + s.awayScore;
        s.pointDifferential = std::abs(s.homeScore - s.awayScore);
        s.isHighScoring = s.totalPoints > 50;
        s.isCloseGame = s.pointDifferential <= 7;
    }
    return s;
}

void tally(SituationalTally& t, const PlayRow& row, const MetricBundle& m) {
    t.plays++;
    if (row.isRedZone()) {
        t.redZonePlays++;
        if (row.touchdown) t.redZoneTouchdowns++;
    }
    if (row.isThirdDown()) {
        t.thirdDownAttempts++;
        if (row.convertedDown()) t.thirdDownConversions++;
    }
    if (row.isTurnover()) t.giveaways++;
    if (row.isPass()) {
        t.passPlays++;
        t.passEpa += m.epa;
    } else if (row.isRun()) {
        t.runPlays++;
        t.runEpa += m.epa;
    }
}

// Higher value wins; equal is "Even"
std::string battleWinner(double home, double away, const GameRow& game) {
    if (home > away) return game.homeTeam;
    if (away > home) return game.awayTeam;
    return EVEN_BATTLE;
}

} // anonymous namespace

GameInsight basicGameInsight(const GameRow& game) {
    GameInsight g;
    g.gameId = game.gameId;
    g.homeTeam = game.homeTeam;
    g.awayTeam = game.awayTeam;
    g.gameDate = game.gameDate;
    g.hasPlayByPlay = false;
    g.summary = summarize(game);
    return g;
}

std::optional<GameInsight> generateGameInsight(const RecordStore& store,
                                               const PlayMetricsEngine& engine,
                                               const std::string& gameId,
                                               double momentumThreshold) {
    std::optional<GameRow> game = store.findGame(gameId);
    if (!game) {
        spdlog::warn("Game {} not found", gameId);
        return std::nullopt;
    }

    std::vector<PlayRow> plays = store.gamePlays(gameId);
    if (plays.empty()) {
        spdlog::warn("No plays found for game {}, using final score only", gameId);
        return basicGameInsight(*game);
    }

    GameInsight g = basicGameInsight(*game);
    g.hasPlayByPlay = true;

    double lastWp = 0.5;
    int biggestWpaQuarter = 0;
    for (const auto& row : plays) {
        MetricBundle m = engine.computeMetrics(toPlayInput(row));

        if (row.posteam == game->homeTeam) {
            g.homeTeamEpa += m.epa;
            tally(g.homeTally, row, m);
        } else if (row.posteam == game->awayTeam) {
            g.awayTeamEpa += m.epa;
            tally(g.awayTally, row, m);
        }

        if (std::abs(m.epa) > std::abs(g.biggestPlayEpa)) {
            g.biggestPlayEpa = m.epa;
            g.biggestEpaPlayId = row.playId;
        }
        if (std::abs(m.wpa) > std::abs(g.biggestPlayWpa)) {
            g.biggestPlayWpa = m.wpa;
            g.biggestWpaPlayId = row.playId;
            biggestWpaQuarter = row.quarter.value_or(1);
        }

        // Compared against the previous play, not the game's overall spread
        if (std::abs(m.winProbAfter - lastWp) > momentumThreshold) {
            g.momentumSwings++;
        }
        lastWp = m.winProbAfter;
    }

    g.excitementIndex = std::min(10.0, std::abs(g.homeTeamEpa) + std::abs(g.awayTeamEpa)
                                           + g.momentumSwings);
    g.competitiveness = game->isCompleted()
        ? std::max(0.0, 1.0 - g.summary.pointDifferential / 35.0)
        : 0.5;

    g.passingGameDominance = g.homeTally.passEpaPerPlay() - g.awayTally.passEpaPerPlay();
    g.rushingGameDominance = g.homeTally.runEpaPerPlay() - g.awayTally.runEpaPerPlay();
    g.turningPointQuarter = biggestWpaQuarter;

    g.redZoneBattle = battleWinner(g.homeTally.redZoneRate(), g.awayTally.redZoneRate(), *game);
    g.thirdDownBattle = battleWinner(g.homeTally.thirdDownRate(), g.awayTally.thirdDownRate(), *game);
    // Fewer giveaways wins
    g.turnoverBattle = battleWinner(-g.homeTally.giveaways, -g.awayTally.giveaways, *game);

    return g;
}

} // namespace gi
