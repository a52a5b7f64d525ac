#include "gi/odds.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace gi {

namespace {

void requireOdds(int odds) {
    if (odds == 0) {
        throw std::invalid_argument("American odds cannot be 0");
    }
    if (odds > -100 && odds < 100) {
        throw std::invalid_argument("American odds must be at least 100 in magnitude: " +
                                    std::to_string(odds));
    }
}

void requireProbability(double p) {
    if (!(p >= 0.0 && p <= 1.0)) {
        throw std::invalid_argument("Probability out of [0, 1]: " + std::to_string(p));
    }
}

} // anonymous namespace

double oddsToProbability(int odds) {
    requireOdds(odds);
    if (odds > 0) {
        return 100.0 / (odds + 100.0);
    }
    double a = std::abs(static_cast<double>(odds));
    return a / (a + 100.0);
}

int probabilityToOdds(double probability) {
    if (!(probability > 0.0 && probability < 1.0)) {
        throw std::invalid_argument("Probability must be in (0, 1): " + std::to_string(probability));
    }
    double odds = probability >= 0.5 ? -100.0 * probability / (1.0 - probability)
                                     : 100.0 * (1.0 - probability) / probability;
    double limit = static_cast<double>(MAX_AMERICAN_ODDS);
    return static_cast<int>(std::clamp(odds, -limit, limit));
}

double payoutPerUnit(int odds) {
    requireOdds(odds);
    if (odds > 0) {
        return odds / 100.0;
    }
    return 100.0 / std::abs(static_cast<double>(odds));
}

double decimalOdds(int odds) {
    return payoutPerUnit(odds) + 1.0;
}

double expectedValue(double modelProbability, int odds, double stake) {
    requireProbability(modelProbability);
    if (stake <= 0.0) {
        throw std::invalid_argument("Stake must be positive");
    }
    double win = stake * payoutPerUnit(odds);
    return modelProbability * win - (1.0 - modelProbability) * stake;
}

double kellyCriterion(double modelProbability, int odds) {
    requireProbability(modelProbability);
    // No edge over the price: nothing to stake
    if (modelProbability <= oddsToProbability(odds)) {
        return 0.0;
    }
    double b = payoutPerUnit(odds);
    double p = modelProbability;
    double q = 1.0 - p;
    double fraction = (b * p - q) / b;
    return std::clamp(fraction, 0.0, MAX_KELLY_FRACTION);
}

const char* favoriteLabel(double probability) {
    return probability > 0.5 ? "Favorite" : "Underdog";
}

const char* confidenceLevel(double probability) {
    if (probability > 0.8) return "Very High";
    if (probability > 0.65) return "High";
    if (probability > 0.35) return "Medium";
    return "Low";
}

} // namespace gi
