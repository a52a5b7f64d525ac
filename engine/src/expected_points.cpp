#include "gi/expected_points.h"
#include <algorithm>
#include <cstdlib>

namespace gi {

double downMultiplier(int down) {
    switch (down) {
        case 1: return 1.00;
        case 2: return 0.85;
        case 3: return 0.60;
        default: return 0.30;
    }
}

ExpectedPointsModel::ExpectedPointsModel() {
    for (int yardline = 1; yardline <= FIELD_LENGTH; ++yardline) {
        double base;
        if (yardline <= 5) {            // goal line
            base = 6.8 - yardline * 0.3;
        } else if (yardline <= 20) {    // red zone
            base = 4.5 - yardline * 0.15;
        } else {
            base = std::max(0.0, 7.0 - yardline * 0.07);
        }
        for (int down = 1; down <= MAX_DOWN; ++down) {
            table_[down - 1][yardline - 1] = base * downMultiplier(down);
        }
    }
}

double ExpectedPointsModel::baseValue(int down, int yardline100) const {
    if (down < 1 || down > MAX_DOWN || yardline100 < 1 || yardline100 > FIELD_LENGTH) {
        return 0.0;
    }
    return table_[down - 1][yardline100 - 1];
}

double ExpectedPointsModel::expectedPoints(const Situation& situation) const {
    double base = baseValue(situation.down(), situation.yardline100());

    double adjustment = 1.0;
    int seconds = situation.gameSecondsRemaining();
    if (seconds < 120) {
        adjustment = 1.15;
    } else if (seconds > 3000) {
        adjustment = 0.95;
    }

    // Blowout
    if (std::abs(situation.scoreDifferential()) > 14) {
        adjustment *= 0.8;
    }

    return base * adjustment;
}

} // namespace gi
