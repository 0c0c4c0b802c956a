#pragma once

#include "OutcomeMonteCarlo.h"
#include "TierCatalog.h"

#include <string>
#include <vector>

namespace scout {

// Sweeps one input for every search tier and records what a consumer pays
// per successful search.
class TierBalanceAnalyzer {
public:
    struct ParameterRange {
        double nominal = 0.0;
        double min = 0.0;
        double max = 0.0;
        int samples = 0;
    };

    struct ScenarioConfig {
        int quality_id = 3;
        double base_price = 100000.0;
        double credit_modifier = 0.0;
        int trials = 2000;
        std::uint32_t seed = 1337u;
    };

    struct SampleResult {
        double success_rate = 0.0;
        double mean_cost = 0.0;
        double mean_duration = 0.0;
        double mean_found_price = 0.0;
        double fee_per_success = 0.0; // mean_cost / success_rate
    };

    struct BalanceRow {
        std::string parameter_name;
        double parameter_value = 0.0;
        int tier_id = 0;
        SampleResult metrics{};
    };

    explicit TierBalanceAnalyzer(TierCatalog catalog = TierCatalog::defaults());

    void setScenario(const ScenarioConfig& scenario);
    void clearResults();

    void analyzeQuality();
    void analyzeCreditScore(const ParameterRange& range);
    void analyzeCreditModifier(const ParameterRange& range);
    void analyzeBasePrice(const ParameterRange& range);

    bool exportBalanceMatrixCSV(const std::string& filename) const;
    const std::vector<BalanceRow>& results() const;

private:
    TierCatalog catalog_;
    ScenarioConfig scenario_{};
    std::vector<BalanceRow> results_{};

    void runAllTiers(const char* name, double value, int quality_id, double base_price, double credit_modifier);
    std::vector<double> sampleValues(const ParameterRange& range) const;
};

} // namespace scout
