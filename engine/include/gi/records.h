#pragma once

#include "gi/play_metrics.h"
#include <optional>
#include <string>

namespace gi {

struct TeamRow {
    std::string abbr;       // e.g. "SF", "KC"
    std::string name;       // e.g. "San Francisco"
    std::string nickname;   // e.g. "49ers"
    std::string conference;
    std::string division;

    std::string fullName() const;
};

struct GameRow {
    std::string gameId;
    int season = 0;
    int week = 0;
    std::string gameDate;   // ISO YYYY-MM-DD
    std::string homeTeam;
    std::string awayTeam;
    std::optional<int> homeScore;
    std::optional<int> awayScore;
    std::string surface;
    std::string roof;
    std::optional<int> temperature;
    std::optional<int> wind;

    bool isCompleted() const { return homeScore.has_value() && awayScore.has_value(); }
};

struct PlayRow {
    std::string playId;
    std::string gameId;
    int season = 0;
    int week = 0;
    std::string posteam;
    std::string defteam;
    std::optional<int> quarter;
    std::optional<int> gameSecondsRemaining;
    std::optional<int> down;
    std::optional<int> ydstogo;
    std::optional<int> yardline100;
    std::optional<int> scoreDifferential;
    std::optional<std::string> playType;
    std::optional<int> yardsGained;
    bool touchdown = false;
    bool interception = false;
    bool fumbleLost = false;

    bool isTurnover() const { return interception || fumbleLost; }
    bool isPass() const { return playType && *playType == "pass"; }
    bool isRun() const { return playType && *playType == "run"; }
    bool isRedZone() const { return yardline100.value_or(50) <= 20; }
    bool isThirdDown() const { return down && *down == 3; }
    bool convertedDown() const { return yardsGained.value_or(0) >= ydstogo.value_or(10); }
};

// Missing clock is approximated from the quarter: 3600 - (quarter - 1) * 900.
PlayInput toPlayInput(const PlayRow& row);

} // namespace gi
