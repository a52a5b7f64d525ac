#pragma once

#include "gi/value_betting.h"
#include <string>
#include <vector>

namespace gi {

constexpr double DEFAULT_VALIDATION_EDGE = 0.05;

struct GameOutcome {
    std::string winner;
    std::string loser;
};

struct ValidationMetrics {
    int totalPredictions = 0;
    double agreementRate = 0.0;
    double avgProbabilityDifference = 0.0;
    double calibrationError = 0.0;
    double valueBetAccuracy = 0.0;
    double kellyRoi = 0.0;
    double sharpeRatio = 0.0;
    double maxDrawdown = 0.0;
    int betsPlaced = 0;
};

// Back-test predictions against market quotes and known outcomes.
// predictions[i] pairs with outcomes[i]; throws std::invalid_argument on a length mismatch.
ValidationMetrics validatePredictions(const std::vector<Prediction>& predictions,
                                      const std::vector<VegasLine>& lines,
                                      const std::vector<GameOutcome>& outcomes,
                                      double minEdge = DEFAULT_VALIDATION_EDGE);

// Completed, non-tied games of the window; all-zero metrics when there are none
ValidationMetrics validateWindow(const RecordStore& store,
                                 const WinProbabilityClassifier& classifier,
                                 const MockMarket& market, int season,
                                 const std::string& startDate, const std::string& endDate,
                                 int64_t asOf, double minEdge = DEFAULT_VALIDATION_EDGE);

// Mean / sample stdev; 0 for fewer than two returns or zero spread
double sharpeRatio(const std::vector<double>& returns);

// Largest drop of the running cumulative sum below its running peak
double maxDrawdown(const std::vector<double>& returns);

const char* agreementLabel(double agreementRate);
const char* calibrationLabel(double calibrationError);
const char* valuePotentialLabel(double kellyRoi);

} // namespace gi
