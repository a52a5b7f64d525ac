#pragma once

#include "gi/play_metrics.h"
#include "gi/record_store.h"
#include <optional>
#include <string>

namespace gi {

constexpr double DEFAULT_MOMENTUM_THRESHOLD = 0.15;
constexpr const char* EVEN_BATTLE = "Even";

// Final-score facts available with or without play-by-play
struct GameSummary {
    int homeScore = 0;
    int awayScore = 0;
    int totalPoints = 0;
    int pointDifferential = 0;  // absolute
    bool isHighScoring = false; // > 50 total
    bool isCloseGame = false;   // <= 7 apart
    std::string surface;
    std::string roof;
    std::optional<int> temperature;
    std::optional<int> wind;
};

// Per-team situational tallies used to decide the battles
struct SituationalTally {
    int plays = 0;
    int redZonePlays = 0;
    int redZoneTouchdowns = 0;
    int thirdDownAttempts = 0;
    int thirdDownConversions = 0;
    int giveaways = 0;
    int passPlays = 0;
    int runPlays = 0;
    double passEpa = 0.0;
    double runEpa = 0.0;

    double redZoneRate() const;
    double thirdDownRate() const;
    double passEpaPerPlay() const;
    double runEpaPerPlay() const;
};

struct GameInsight {
    std::string gameId;
    std::string homeTeam;
    std::string awayTeam;
    std::string gameDate;
    bool hasPlayByPlay = false;
    GameSummary summary;

    // Play-dependent fields; zero / empty without play-by-play
    double homeTeamEpa = 0.0;
    double awayTeamEpa = 0.0;
    double excitementIndex = 0.0;
    double competitiveness = 0.0;
    int momentumSwings = 0;
    double passingGameDominance = 0.0;  // home minus away pass EPA per play
    double rushingGameDominance = 0.0;
    double biggestPlayEpa = 0.0;
    std::string biggestEpaPlayId;
    double biggestPlayWpa = 0.0;
    std::string biggestWpaPlayId;
    int turningPointQuarter = 0;
    std::string redZoneBattle;
    std::string thirdDownBattle;
    std::string turnoverBattle;
    SituationalTally homeTally;
    SituationalTally awayTally;
};

// nullopt when the game is unknown; basic summary only when it has no plays.
std::optional<GameInsight> generateGameInsight(const RecordStore& store,
                                               const PlayMetricsEngine& engine,
                                               const std::string& gameId,
                                               double momentumThreshold = DEFAULT_MOMENTUM_THRESHOLD);

// Final-score-only insight
GameInsight basicGameInsight(const GameRow& game);

} // namespace gi
