#pragma once

#include "gi/situation.h"

namespace gi {

constexpr double MIN_WIN_PROBABILITY = 0.01;
constexpr double MAX_WIN_PROBABILITY = 0.99;

class WinProbabilityModel {
public:
    // Offense win probability, clamped to [0.01, 0.99].
    double winProbability(const Situation& situation) const;

    // Weight applied to the score term: 0.8 first half, 1.0 / 1.3 later, 2.0 inside two minutes.
    static double timeFactor(int gameSecondsRemaining);

    // Chance of converting the current down; feeds the down/distance term only.
    static double conversionProbability(int down, int ydstogo);
};

} // namespace gi
