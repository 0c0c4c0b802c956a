#include "OutcomeResolver.h"

#include <algorithm>
#include <cmath>

namespace scout {

namespace {

constexpr double kPriceVarianceLo = 0.9;
constexpr double kPriceVarianceHi = 1.1;

// Success lands in the back half of the window.
constexpr double kSuccessWindowFraction = 0.5;

static inline double finiteOr(double x, double fallback) {
    return std::isfinite(x) ? x : fallback;
}

} // namespace

double computeSearchCost(const TierDefinition& tier, double base_price, double credit_modifier) {
    const double base = std::max(0.0, finiteOr(base_price, 0.0));
    const double mod = finiteOr(credit_modifier, 0.0);
    const double cost = std::floor(base * tier.fee_fraction * (1.0 + mod));
    return std::max(0.0, cost);
}

Outcome resolve(const TierDefinition& tier,
                const QualityTier& quality,
                double base_price,
                double credit_modifier,
                const ConfigSelection& requested,
                RandomSource& rng) {
    Outcome o{};
    o.cost = computeSearchCost(tier, base_price, credit_modifier);

    const int min_d = std::max(1, tier.min_duration);
    const int max_d = std::max(min_d, tier.max_duration);
    o.duration = rng.uniformInt(min_d, max_d);

    const double p = effectiveSuccessProbability(tier, quality);
    (void)rng.nextUnit(); // warm-up
    const double roll = rng.nextUnit();
    o.success = (roll <= p);

    if (!o.success) {
        o.tts = o.duration + kFailureTtsOffset;
        return o;
    }

    const int earliest = std::max(1, static_cast<int>(std::floor(o.duration * kSuccessWindowFraction)));
    o.tts = rng.uniformInt(earliest, o.duration);

    (void)rng.nextUnit(); // warm-up
    o.condition = rng.uniformReal(quality.min_condition, quality.max_condition);

    const double variance = rng.uniformReal(kPriceVarianceLo, kPriceVarianceHi);
    const double cond_ratio = (quality.max_condition > 0.0) ? (o.condition / quality.max_condition) : 0.0;
    const double base = std::max(0.0, finiteOr(base_price, 0.0));
    o.price = std::floor(base * quality.price_multiplier * cond_ratio * variance);

    for (const auto& kv : requested) {
        (void)rng.nextUnit(); // warm-up
        const bool matched = rng.nextUnit() <= tier.match_chance;
        o.matched_configs[kv.first] = matched ? kv.second : kUnmatchedOption;
    }
    return o;
}

ResolveResult resolveOutcome(const TierCatalog& catalog,
                             int tier_id,
                             int quality_id,
                             double base_price,
                             double credit_modifier,
                             const ConfigSelection& requested,
                             RandomSource& rng) {
    ResolveResult r{};
    const TierDefinition* tier = catalog.findTier(tier_id);
    const QualityTier* quality = catalog.findQuality(quality_id);
    if (!tier || !quality) {
        r.code = ResultCode::ConfigurationError;
        return r;
    }
    r.outcome = resolve(*tier, *quality, base_price, credit_modifier, requested, rng);
    return r;
}

} // namespace scout
