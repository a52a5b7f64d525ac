#include "gi/win_probability.h"
#include <algorithm>

namespace gi {

double WinProbabilityModel::timeFactor(int gameSecondsRemaining) {
    if (gameSecondsRemaining > 1800) return 0.8;
    if (gameSecondsRemaining > 900) return 1.0;
    if (gameSecondsRemaining > 120) return 1.3;
    return 2.0;
}

double WinProbabilityModel::conversionProbability(int down, int ydstogo) {
    switch (down) {
        case 1: return 0.75 - ydstogo * 0.02;
        case 2: return 0.65 - ydstogo * 0.03;
        case 3: return 0.45 - ydstogo * 0.04;
        default: return 0.25 - ydstogo * 0.05;
    }
}

double WinProbabilityModel::winProbability(const Situation& situation) const {
    int scoreDiff = situation.scoreDifferential();

    double base = 0.5 + scoreDiff * 0.02;
    double scoreTerm = scoreDiff * 0.02 * timeFactor(situation.gameSecondsRemaining());
    double fieldPosition = (FIELD_LENGTH - situation.yardline100()) * 0.002;
    double downBonus = (conversionProbability(situation.down(), situation.ydstogo()) - 0.5) * 0.1;

    double wp = base + scoreTerm + fieldPosition + downBonus;
    return std::clamp(wp, MIN_WIN_PROBABILITY, MAX_WIN_PROBABILITY);
}

} // namespace gi
