#include "Log.h"
#include "OutcomeMonteCarlo.h"
#include "OutcomeResolver.h"
#include "TierCatalog.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct CheckRow {
    std::string name;
    double predicted = 0.0;
    double expected = 0.0;
    double low = 0.0;
    double high = 0.0;
    bool in_range = false;
};

static double relError(double predicted, double target) {
    if (target == 0.0) return 0.0;
    return std::fabs(predicted - target) / std::fabs(target);
}

static std::string yesno(bool v) { return v ? "YES" : "NO"; }

// Binomial 4-sigma band around p for n trials.
static void binomialBand(double p, int n, double& low, double& high) {
    const double sigma = std::sqrt(p * (1.0 - p) / static_cast<double>(n));
    low = std::max(0.0, p - 4.0 * sigma);
    high = std::min(1.0, p + 4.0 * sigma);
}

} // namespace

int main() {
    scout::setLogLevel(scout::LogLevel::Warn);

    std::cout << "=== SCOUT OUTCOME VALIDATION SUITE ===\n";
    std::cout << "Empirical rates vs. configured tier tables\n\n";

    const scout::TierCatalog catalog = scout::TierCatalog::defaults();
    scout::OutcomeMonteCarlo mc(catalog);
    const int trials = 20000;

    std::vector<CheckRow> rows;

    for (const auto& tier : catalog.tiers()) {
        for (const auto& quality : catalog.qualities()) {
            scout::OutcomeMonteCarlo::ScenarioConfig sc;
            sc.tier_id = tier.id;
            sc.quality_id = quality.id;
            sc.base_price = {100000.0, 100000.0};
            sc.requested_configs = 3;
            sc.seed = 1337u + static_cast<std::uint32_t>(tier.id * 16 + quality.id);
            const auto s = mc.runMonteCarlo(sc, trials);

            CheckRow r;
            r.name = tier.name + " / " + quality.name + " success";
            r.expected = scout::effectiveSuccessProbability(tier, quality);
            r.predicted = s.success_rate;
            binomialBand(r.expected, trials, r.low, r.high);
            r.in_range = (r.predicted >= r.low && r.predicted <= r.high);
            rows.push_back(r);

            if (s.successes > 0) {
                CheckRow c;
                c.name = tier.name + " / " + quality.name + " condition";
                c.expected = 0.5 * (quality.min_condition + quality.max_condition);
                c.predicted = s.found_condition.mean;
                c.low = quality.min_condition;
                c.high = quality.max_condition;
                c.in_range = (s.found_condition.ci_lower_95 >= quality.min_condition &&
                              s.found_condition.ci_upper_95 < quality.max_condition &&
                              relError(c.predicted, c.expected) < 0.05);
                rows.push_back(c);

                const int n_cfg = s.successes * sc.requested_configs;
                CheckRow m;
                m.name = tier.name + " / " + quality.name + " match";
                m.expected = tier.match_chance;
                m.predicted = s.config_match_rate;
                binomialBand(m.expected, n_cfg, m.low, m.high);
                m.in_range = (m.predicted >= m.low && m.predicted <= m.high);
                rows.push_back(m);
            }
        }

        // Fee is deterministic: floor(base * fee * (1 + mod)).
        for (double mod : {-0.15, -0.08, 0.0, 0.10, 0.20}) {
            CheckRow f;
            f.name = tier.name + " fee @" + std::to_string(mod).substr(0, 5);
            f.expected = std::floor(100000.0 * tier.fee_fraction * (1.0 + mod));
            f.predicted = scout::computeSearchCost(tier, 100000.0, mod);
            f.low = f.expected;
            f.high = f.expected;
            f.in_range = (f.predicted == f.expected);
            rows.push_back(f);
        }
    }

    int pass = 0;
    std::cout << "Check                                    | Predicted  | Expected   | In Range | Status\n";
    std::cout << "--------------------------------------------------------------------------------------\n";
    for (const auto& r : rows) {
        if (r.in_range) ++pass;
        std::cout << std::left << std::setw(40) << r.name << " | "
                  << std::setw(10) << std::fixed << std::setprecision(4) << r.predicted << " | "
                  << std::setw(10) << r.expected << " | "
                  << std::setw(8) << yesno(r.in_range) << " | "
                  << (r.in_range ? "PASS" : "FAIL") << "\n";
    }
    std::cout << "\nTOTAL: " << pass << "/" << rows.size() << " checks within tolerance\n\n";

    const std::string csv_name = "validation_results.csv";
    std::ofstream csv(csv_name);
    if (csv) {
        csv << "Check,Predicted,Expected,Error_%,Lower_Bound,Upper_Bound,Within_Range\n";
        for (const auto& r : rows) {
            csv << r.name << "," << r.predicted << "," << r.expected << "," << (relError(r.predicted, r.expected) * 100.0)
                << "," << r.low << "," << r.high << "," << yesno(r.in_range) << "\n";
        }
        csv.close();
        std::cout << "Results exported to: " << csv_name << "\n";
    }

    return (pass == static_cast<int>(rows.size())) ? 0 : 1;
}
