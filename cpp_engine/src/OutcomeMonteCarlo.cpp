#include "OutcomeMonteCarlo.h"

#include "OutcomeResolver.h"
#include "Rng.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <string>
#include <utility>

namespace scout {

namespace {
std::vector<double> latinHypercubeSamples(double min_val, double max_val, int samples, std::mt19937& rng) {
    std::vector<double> bins;
    bins.reserve(static_cast<std::size_t>(samples));

    std::uniform_real_distribution<double> unit_dist(0.0, 1.0);
    for (int i = 0; i < samples; ++i) {
        const double u = (static_cast<double>(i) + unit_dist(rng)) / static_cast<double>(samples);
        bins.push_back(u);
    }
    std::shuffle(bins.begin(), bins.end(), rng);

    const double span = max_val - min_val;
    for (double& v : bins) {
        v = min_val + span * v;
    }
    return bins;
}

int clampSamples(int samples) {
    return samples < 1 ? 1 : samples;
}

ConfigSelection syntheticRequest(int count) {
    ConfigSelection sel;
    for (int i = 0; i < count; ++i) {
        sel["option_" + std::to_string(i)] = i + 1;
    }
    return sel;
}
} // namespace

OutcomeMonteCarlo::OutcomeMonteCarlo(TierCatalog catalog) : catalog_(std::move(catalog)) {}

void OutcomeMonteCarlo::setScenario(const ScenarioConfig& scenario) {
    scenario_ = scenario;
}

OutcomeMonteCarlo::UQResult OutcomeMonteCarlo::summarize(const std::vector<double>& values) {
    UQResult result{};
    if (values.empty()) {
        return result;
    }

    const double mean = std::accumulate(values.begin(), values.end(), 0.0) / values.size();
    double variance = 0.0;
    for (double v : values) {
        const double d = v - mean;
        variance += d * d;
    }
    variance /= static_cast<double>(values.size());

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    auto percentile = [&](double p) {
        if (sorted.size() == 1) return sorted.front();
        const double pos = p * (sorted.size() - 1);
        const std::size_t idx = static_cast<std::size_t>(pos);
        const double frac = pos - static_cast<double>(idx);
        if (idx + 1 >= sorted.size()) return sorted.back();
        return sorted[idx] * (1.0 - frac) + sorted[idx + 1] * frac;
    };

    result.mean = mean;
    result.median = percentile(0.5);
    result.ci_lower_95 = percentile(0.025);
    result.ci_upper_95 = percentile(0.975);
    result.std_dev = std::sqrt(variance);
    return result;
}

OutcomeMonteCarlo::UQSummary OutcomeMonteCarlo::runMonteCarlo(const ScenarioConfig& scenario, int num_samples) const {
    UQSummary summary{};
    const TierDefinition* tier = catalog_.findTier(scenario.tier_id);
    const QualityTier* quality = catalog_.findQuality(scenario.quality_id);
    if (!tier || !quality) {
        summary.code = ResultCode::ConfigurationError;
        return summary;
    }

    const int samples = clampSamples(num_samples);
    std::mt19937 lhs_rng(scenario.seed);
    Mt19937Random draw(scenario.seed ^ 0x5BD1E995u);

    const double lo = std::min(scenario.base_price.min, scenario.base_price.max);
    const double hi = std::max(scenario.base_price.min, scenario.base_price.max);
    const auto price_samples = latinHypercubeSamples(lo, hi, samples, lhs_rng);
    const ConfigSelection request = syntheticRequest(std::max(0, scenario.requested_configs));

    std::vector<double> cost;
    std::vector<double> duration;
    std::vector<double> tts;
    std::vector<double> price;
    std::vector<double> condition;
    cost.reserve(static_cast<std::size_t>(samples));
    duration.reserve(static_cast<std::size_t>(samples));

    int requested_total = 0;
    int matched_total = 0;

    for (int i = 0; i < samples; ++i) {
        const Outcome o = resolve(*tier, *quality, price_samples[i], scenario.credit_modifier, request, draw);
        cost.push_back(o.cost);
        duration.push_back(static_cast<double>(o.duration));
        if (!o.success) continue;

        ++summary.successes;
        tts.push_back(static_cast<double>(o.tts));
        price.push_back(o.price);
        condition.push_back(o.condition);
        for (const auto& kv : o.matched_configs) {
            ++requested_total;
            if (kv.second != kUnmatchedOption) ++matched_total;
        }
    }

    summary.samples = samples;
    summary.success_rate = static_cast<double>(summary.successes) / static_cast<double>(samples);
    summary.config_match_rate =
        requested_total > 0 ? static_cast<double>(matched_total) / static_cast<double>(requested_total) : 0.0;
    summary.cost = summarize(cost);
    summary.duration = summarize(duration);
    summary.tts_success = summarize(tts);
    summary.found_price = summarize(price);
    summary.found_condition = summarize(condition);
    return summary;
}

OutcomeMonteCarlo::UQSummary OutcomeMonteCarlo::runMonteCarlo(int num_samples) const {
    return runMonteCarlo(scenario_, num_samples);
}

} // namespace scout
