#include "gi/baseline_classifier.h"
#include "gi/team_insights.h"
#include <cmath>

namespace gi {

NetEpaClassifier::NetEpaClassifier(const RecordStore& store, const PlayMetricsEngine& engine,
                                   double scale, double homeEdge)
    : store_(store), engine_(engine), scale_(scale), homeEdge_(homeEdge) {}

std::optional<double> NetEpaClassifier::homeWinProbability(const std::string& homeTeam,
                                                           const std::string& awayTeam,
                                                           const std::string& /*gameDate*/,
                                                           int season) const {
    std::optional<TeamInsight> home = generateTeamInsight(store_, engine_, homeTeam, season);
    std::optional<TeamInsight> away = generateTeamInsight(store_, engine_, awayTeam, season);
    if (!home || !away) return std::nullopt;

    double homeNet = home->offensiveEpaPerPlay - home->defensiveEpaPerPlay;
    double awayNet = away->offensiveEpaPerPlay - away->defensiveEpaPerPlay;
    double z = scale_ * (homeNet - awayNet) + homeEdge_;
    return 1.0 / (1.0 + std::exp(-z));
}

} // namespace gi
