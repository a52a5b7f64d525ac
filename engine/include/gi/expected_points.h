#pragma once

#include "gi/situation.h"
#include <array>

namespace gi {

// Heuristic expected-points table indexed by (down, yardline).
class ExpectedPointsModel {
    // [down - 1][yardline - 1], yardlines 1-100
    std::array<std::array<double, FIELD_LENGTH>, MAX_DOWN> table_{};

public:
    ExpectedPointsModel();

    // Table value before time/score adjustments; 0.0 for a key outside the table.
    double baseValue(int down, int yardline100) const;

    double expectedPoints(const Situation& situation) const;
};

// Down multipliers applied to the distance baseline: 1.00 / 0.85 / 0.60 / 0.30
double downMultiplier(int down);

} // namespace gi
