#pragma once

#include <optional>
#include <string>

namespace gi {

constexpr int MAX_DOWN = 4;
constexpr int FIELD_LENGTH = 100;
constexpr int GAME_SECONDS = 3600;
constexpr int HALF_SECONDS = 1800;
constexpr int QUARTER_SECONDS = 900;

// Raw situation fields as they arrive from a play row; any of them may be missing.
struct SituationFields {
    std::optional<int> down;
    std::optional<int> ydstogo;
    std::optional<int> yardline100;
    std::optional<int> quarter;
    std::optional<int> gameSecondsRemaining;
    std::optional<int> scoreDifferential;
    std::optional<int> timeoutsRemaining;
    std::optional<std::string> playType;
};

// One game situation from the offense's point of view.
// Bounded fields are clamped once, at construction.
class Situation {
    int down_;
    int ydstogo_;
    int yardline100_;       // distance to the opponent's goal line
    int quarter_;
    int gameSecondsRemaining_;
    int scoreDifferential_; // positive when the offense leads
    int timeoutsRemaining_;
    std::string playType_;

public:
    Situation(int down, int ydstogo, int yardline100, int quarter,
              int gameSecondsRemaining, int scoreDifferential,
              int timeoutsRemaining = 3, std::string playType = "pass");

    // Missing fields default to 1st-and-10 at midfield, start of the 2nd half, tied.
    static Situation fromFields(const SituationFields& fields);

    int down() const { return down_; }
    int ydstogo() const { return ydstogo_; }
    int yardline100() const { return yardline100_; }
    int quarter() const { return quarter_; }
    int gameSecondsRemaining() const { return gameSecondsRemaining_; }
    int scoreDifferential() const { return scoreDifferential_; }
    int timeoutsRemaining() const { return timeoutsRemaining_; }
    const std::string& playType() const { return playType_; }

    bool inRedZone() const { return yardline100_ <= 20; }
    bool inGoalToGo() const { return yardline100_ <= 5; }
    bool isCloseGame() const;
};

} // namespace gi
