#pragma once

#include "gi/game_insights.h"
#include "gi/market.h"
#include "gi/rankings.h"
#include "gi/validation.h"
#include "gi/value_betting.h"
#include <memory>
#include <string>

namespace gi {

struct AnalyticsConfig {
    ValueBetConfig valueBets;
    double validationMinEdge = DEFAULT_VALIDATION_EDGE;
    MarketConfig market;
    double momentumThreshold = DEFAULT_MOMENTUM_THRESHOLD;
    double advantageThreshold = DEFAULT_ADVANTAGE_THRESHOLD;
};

// Load from JSON file; missing keys keep their defaults. nullptr if unreadable.
std::unique_ptr<AnalyticsConfig> loadConfig(const std::string& path);

// Load from JSON string (for testing)
std::unique_ptr<AnalyticsConfig> loadConfigFromString(const std::string& json);

} // namespace gi
