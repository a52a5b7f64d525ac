#include "gi/narrative.h"
#include <fmt/format.h>
#include <string>
#include <vector>

namespace gi {

std::string seasonNarrative(const TeamInsight& t, const std::string& teamName) {
    std::vector<std::string> parts;
    parts.push_back(fmt::format("**{} - {} Season Analysis**\n", teamName, t.season));

    if (t.offensiveEpaPerPlay > 0.1) {
        parts.push_back(fmt::format("The {} boasted a highly efficient offense, averaging {:.3f} EPA per play.",
                                    teamName, t.offensiveEpaPerPlay));
    } else if (t.offensiveEpaPerPlay < -0.05) {
        parts.push_back(fmt::format("The {} struggled offensively, posting a concerning {:.3f} EPA per play.",
                                    teamName, t.offensiveEpaPerPlay));
    } else {
        parts.push_back(fmt::format("The {} offense was adequate, generating {:.3f} EPA per play.",
                                    teamName, t.offensiveEpaPerPlay));
    }

    if (t.passingEpaPerPlay > t.rushingEpaPerPlay + 0.1) {
        parts.push_back("Their aerial attack was particularly potent, significantly outperforming their ground game.");
    } else if (t.rushingEpaPerPlay > t.passingEpaPerPlay + 0.05) {
        parts.push_back("They established themselves as a run-first team, finding more success on the ground than through the air.");
    } else {
        parts.push_back("They maintained a balanced offensive approach with both passing and rushing contributing.");
    }

    if (t.redZoneEfficiency > 0.6) {
        parts.push_back(fmt::format("In the red zone, they were lethal, converting {:.1f}% of their opportunities into touchdowns.",
                                    t.redZoneEfficiency * 100.0));
    } else if (t.redZoneEfficiency < 0.4) {
        parts.push_back(fmt::format("Red zone struggles plagued the team, managing only a {:.1f}% touchdown conversion rate.",
                                    t.redZoneEfficiency * 100.0));
    }

    // EPA allowed: negative is good
    if (t.defensiveEpaPerPlay < -0.05) {
        parts.push_back("Defensively, they were dominant, consistently putting opponents in difficult situations.");
    } else if (t.defensiveEpaPerPlay > 0.05) {
        parts.push_back("Their defense was a liability, allowing opponents to move the ball with ease.");
    } else {
        parts.push_back("Their defense was serviceable, providing adequate resistance to opposing offenses.");
    }

    if (t.clutchPerformance > 0.15) {
        parts.push_back("When the stakes were highest, this team delivered, excelling in clutch situations.");
    } else if (t.clutchPerformance < -0.1) {
        parts.push_back("Unfortunately, they often wilted under pressure, struggling in crucial moments.");
    }

    if (t.improvementTrajectory > 0.05) {
        parts.push_back("The team showed encouraging signs of improvement as the season progressed.");
    } else if (t.improvementTrajectory < -0.05) {
        parts.push_back("Concerning regression was evident as the season wore on.");
    }

    std::string narrative;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) narrative += ' ';
        narrative += parts[i];
    }
    return narrative;
}

} // namespace gi
