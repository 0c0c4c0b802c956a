#include "TierBalanceAnalysis.h"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <utility>

namespace scout {

TierBalanceAnalyzer::TierBalanceAnalyzer(TierCatalog catalog) : catalog_(std::move(catalog)) {}

void TierBalanceAnalyzer::setScenario(const ScenarioConfig& scenario) {
    scenario_ = scenario;
}

void TierBalanceAnalyzer::clearResults() {
    results_.clear();
}

std::vector<double> TierBalanceAnalyzer::sampleValues(const ParameterRange& range) const {
    std::vector<double> values;
    if (range.samples <= 1 || range.max <= range.min) {
        values.push_back(range.nominal);
        return values;
    }

    values.reserve(static_cast<std::size_t>(range.samples));
    const double span = range.max - range.min;
    const int steps = range.samples - 1;
    for (int i = 0; i < range.samples; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(steps);
        values.push_back(range.min + span * t);
    }
    return values;
}

void TierBalanceAnalyzer::runAllTiers(const char* name,
                                      double value,
                                      int quality_id,
                                      double base_price,
                                      double credit_modifier) {
    OutcomeMonteCarlo mc(catalog_);
    for (const auto& tier : catalog_.tiers()) {
        OutcomeMonteCarlo::ScenarioConfig sc;
        sc.tier_id = tier.id;
        sc.quality_id = quality_id;
        sc.credit_modifier = credit_modifier;
        sc.base_price = {base_price, base_price};
        sc.requested_configs = 0;
        sc.seed = scenario_.seed;

        const auto s = mc.runMonteCarlo(sc, scenario_.trials);
        if (s.code != ResultCode::Ok) continue;

        SampleResult m;
        m.success_rate = s.success_rate;
        m.mean_cost = s.cost.mean;
        m.mean_duration = s.duration.mean;
        m.mean_found_price = s.found_price.mean;
        m.fee_per_success = (s.success_rate > 0.0) ? s.cost.mean / s.success_rate : 0.0;
        results_.push_back({name, value, tier.id, m});
    }
}

void TierBalanceAnalyzer::analyzeQuality() {
    clearResults();
    for (const auto& q : catalog_.qualities()) {
        runAllTiers("quality_id", static_cast<double>(q.id), q.id, scenario_.base_price, scenario_.credit_modifier);
    }
}

void TierBalanceAnalyzer::analyzeCreditScore(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        const int score = static_cast<int>(std::lround(value));
        runAllTiers("credit_score", static_cast<double>(score), scenario_.quality_id, scenario_.base_price,
                    catalog_.creditModifierForScore(score));
    }
}

void TierBalanceAnalyzer::analyzeCreditModifier(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        runAllTiers("credit_modifier", value, scenario_.quality_id, scenario_.base_price, value);
    }
}

void TierBalanceAnalyzer::analyzeBasePrice(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        runAllTiers("base_price", value, scenario_.quality_id, value, scenario_.credit_modifier);
    }
}

bool TierBalanceAnalyzer::exportBalanceMatrixCSV(const std::string& filename) const {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    out << "parameter,value,tier_id,success_rate,mean_cost,mean_duration,mean_found_price,fee_per_success\n";
    out << std::fixed << std::setprecision(6);
    for (const auto& row : results_) {
        out << row.parameter_name << ','
            << row.parameter_value << ','
            << row.tier_id << ','
            << row.metrics.success_rate << ','
            << row.metrics.mean_cost << ','
            << row.metrics.mean_duration << ','
            << row.metrics.mean_found_price << ','
            << row.metrics.fee_per_success << '\n';
    }
    return static_cast<bool>(out);
}

const std::vector<TierBalanceAnalyzer::BalanceRow>& TierBalanceAnalyzer::results() const {
    return results_;
}

} // namespace scout
