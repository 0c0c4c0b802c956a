#pragma once

#include "ResultCodes.h"
#include "TierCatalog.h"

#include <cstdint>
#include <vector>

namespace scout {

// Repeated outcome resolution for one tier / quality / credit setting, with
// base price uncertainty drawn by Latin hypercube sampling.
class OutcomeMonteCarlo {
public:
    struct ParameterRange {
        double min = 0.0;
        double max = 0.0;
    };

    struct ScenarioConfig {
        int tier_id = 2;
        int quality_id = 3;
        double credit_modifier = 0.0;
        ParameterRange base_price{100000.0, 100000.0};
        int requested_configs = 2;
        std::uint32_t seed = 1337u;
    };

    struct UQResult {
        double mean = 0.0;
        double median = 0.0;
        double ci_lower_95 = 0.0;
        double ci_upper_95 = 0.0;
        double std_dev = 0.0;
    };

    struct UQSummary {
        ResultCode code = ResultCode::Ok;
        int samples = 0;
        int successes = 0;
        double success_rate = 0.0;
        double config_match_rate = 0.0;
        UQResult cost{};
        UQResult duration{};
        UQResult tts_success{};     // successful samples only
        UQResult found_price{};     // successful samples only
        UQResult found_condition{}; // successful samples only
    };

    explicit OutcomeMonteCarlo(TierCatalog catalog = TierCatalog::defaults());

    void setScenario(const ScenarioConfig& scenario);
    const TierCatalog& catalog() const { return catalog_; }

    UQSummary runMonteCarlo(const ScenarioConfig& scenario, int num_samples = 1000) const;
    UQSummary runMonteCarlo(int num_samples = 1000) const;

    static UQResult summarize(const std::vector<double>& values);

private:
    TierCatalog catalog_;
    ScenarioConfig scenario_{};
};

} // namespace scout
