#pragma once

#include "ResultCodes.h"
#include "Rng.h"
#include "TierCatalog.h"

#include <map>
#include <string>

namespace scout {

// configuration id -> option index
using ConfigSelection = std::map<std::string, int>;

// Found item received a catalog-chosen option instead of the requested one.
constexpr int kUnmatchedOption = -1;

// Added to the lifetime of a failing search so tts never fires first.
constexpr int kFailureTtsOffset = 999;

struct Outcome {
    double cost = 0.0;
    int duration = 0;     // ttl at creation
    bool success = false;
    int tts = 0;
    // Zero unless success.
    double condition = 0.0;
    double price = 0.0;
    ConfigSelection matched_configs;
};

struct ResolveResult {
    ResultCode code = ResultCode::Ok;
    Outcome outcome{};

    bool ok() const { return code == ResultCode::Ok; }
};

// floor(base * fee * (1 + creditModifier)); never negative.
double computeSearchCost(const TierDefinition& tier, double base_price, double credit_modifier);

// Draw order: duration, warm-up, success roll; on success: tts, warm-up,
// condition, price variance, then per requested configuration in ascending
// id order a warm-up followed by the match roll.
Outcome resolve(const TierDefinition& tier,
                const QualityTier& quality,
                double base_price,
                double credit_modifier,
                const ConfigSelection& requested,
                RandomSource& rng);

// Catalog lookup wrapper; ConfigurationError on unknown ids (no draws).
ResolveResult resolveOutcome(const TierCatalog& catalog,
                             int tier_id,
                             int quality_id,
                             double base_price,
                             double credit_modifier,
                             const ConfigSelection& requested,
                             RandomSource& rng);

} // namespace scout
