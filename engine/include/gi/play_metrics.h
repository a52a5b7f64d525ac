#pragma once

#include "gi/situation.h"
#include "gi/expected_points.h"
#include "gi/win_probability.h"
#include <cstdint>
#include <optional>
#include <string>

namespace gi {

constexpr int PLAY_CLOCK_SECONDS = 40;
constexpr int EXPLOSIVE_YARDS = 20;
constexpr double TOUCHDOWN_POINTS = 7.0;
constexpr double MIN_LEVERAGE = 0.02;

// Raw attributes of one play. Missing values default to
// 1st-and-10 at midfield, 3600s left, tied, 3 timeouts, "pass", no gain.
struct PlayInput {
    std::optional<int> down;
    std::optional<int> ydstogo;
    std::optional<int> yardline100;
    std::optional<int> quarter;
    std::optional<int> gameSecondsRemaining;
    std::optional<int> scoreDifferential;
    std::optional<int> timeoutsRemaining;
    std::optional<std::string> playType;
    std::optional<int> yardsGained;
    bool touchdown = false;
    bool interception = false;
    bool fumbleLost = false;
};

// The "before" situation with play defaults applied
Situation situationBefore(const PlayInput& play);

enum class OutcomeKind : uint8_t {
    TOUCHDOWN,
    TURNOVER,           // interception or lost fumble
    NORMAL_GAIN,
    TURNOVER_ON_DOWNS
};

const char* outcomeName(OutcomeKind kind);

// NORMAL_GAIN and TURNOVER_ON_DOWNS carry the advanced situation.
struct PlayOutcome {
    OutcomeKind kind = OutcomeKind::NORMAL_GAIN;
    std::optional<Situation> after;
};

PlayOutcome classifyOutcome(const PlayInput& play, const Situation& before);

struct MetricBundle {
    double expectedPointsBefore = 0.0;
    double expectedPointsAfter = 0.0;
    double epa = 0.0;
    double winProbBefore = 0.0;
    double winProbAfter = 0.0;
    double wpa = 0.0;
    double leverage = MIN_LEVERAGE;
    double clutchIndex = 0.0;
    double successRate = 0.0;   // 1.0 or 0.0
    bool explosivePlay = false;
    OutcomeKind outcome = OutcomeKind::NORMAL_GAIN;
};

// Down-specific yardage bar: downs 1-2 need max(4, half the distance), 3-4 need it all.
bool isSuccessfulPlay(int down, int ydstogo, int yardsGained);

// 1.5x inside five minutes, another 1.3x within one score; halved for unsuccessful plays.
double clutchMultiplier(const Situation& before, bool success);

class PlayMetricsEngine {
    ExpectedPointsModel epModel_;
    WinProbabilityModel wpModel_;

public:
    MetricBundle computeMetrics(const PlayInput& play) const;

    const ExpectedPointsModel& expectedPointsModel() const { return epModel_; }
    const WinProbabilityModel& winProbabilityModel() const { return wpModel_; }
};

} // namespace gi
