#pragma once

#include "gi/play_metrics.h"
#include "gi/record_store.h"
#include "gi/value_betting.h"
#include <optional>
#include <string>

namespace gi {

// Logistic fit on the net EPA gap between two teams, for use when no
// trained classifier is available.
class NetEpaClassifier : public WinProbabilityClassifier {
    const RecordStore& store_;
    const PlayMetricsEngine& engine_;
    double scale_;
    double homeEdge_;

public:
    NetEpaClassifier(const RecordStore& store, const PlayMetricsEngine& engine,
                     double scale = 4.0, double homeEdge = 0.1);

    // nullopt when either team has no insight for the season
    std::optional<double> homeWinProbability(const std::string& homeTeam,
                                             const std::string& awayTeam,
                                             const std::string& gameDate,
                                             int season) const override;
};

// Same home probability for every matchup
class FixedClassifier : public WinProbabilityClassifier {
    double homeWinProb_;

public:
    explicit FixedClassifier(double homeWinProb) : homeWinProb_(homeWinProb) {}

    std::optional<double> homeWinProbability(const std::string&, const std::string&,
                                             const std::string&, int) const override {
        return homeWinProb_;
    }
};

} // namespace gi
