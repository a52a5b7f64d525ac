#pragma once

namespace gi {

constexpr double MAX_KELLY_FRACTION = 0.25;

// Longest price quoted in either direction
constexpr int MAX_AMERICAN_ODDS = 100000;

// American odds -> implied probability.
// Throws std::invalid_argument for |odds| < 100, which has no American-odds meaning.
double oddsToProbability(int odds);

// Probability in (0, 1) -> American odds, truncated toward zero.
// p >= 0.5 gives favorite (negative) odds. The magnitude is capped at MAX_AMERICAN_ODDS.
int probabilityToOdds(double probability);

// Profit per unit staked on a win (decimal odds minus one)
double payoutPerUnit(int odds);

double decimalOdds(int odds);

// model p * payout - (1 - p) * stake
double expectedValue(double modelProbability, int odds, double stake = 1.0);

// Kelly fraction in [0, 0.25]; exactly 0 when the model shows no edge over the price.
double kellyCriterion(double modelProbability, int odds);

// "Favorite" / "Underdog" and a coarse confidence bucket
const char* favoriteLabel(double probability);
const char* confidenceLevel(double probability);

} // namespace gi
