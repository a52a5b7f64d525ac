#pragma once

#include "gi/team_insights.h"
#include <string>

namespace gi {

// Templated season summary built from a team insight
std::string seasonNarrative(const TeamInsight& insight, const std::string& teamName);

} // namespace gi
