#include "Log.h"
#include "TierBalanceAnalysis.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {
std::string toLower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

void printUsage() {
    std::cout << "SweepTool usage:\n"
              << "  SweepTool --param <quality|credit_score|credit|price> [--min v] [--max v] [--samples n]\n"
              << "            [--trials n] [--quality id] [--price v] [--seed n] [--out file]\n";
}
} // namespace

int main(int argc, char** argv) {
    std::string param;
    double min_val = 0.0;
    double max_val = 0.0;
    int samples = 5;
    std::string out = "tier_balance.csv";
    bool min_set = false;
    bool max_set = false;

    scout::TierBalanceAnalyzer::ScenarioConfig scenario;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--param" && i + 1 < argc) {
                param = toLower(argv[++i]);
            } else if (arg == "--min" && i + 1 < argc) {
                min_val = std::stod(argv[++i]);
                min_set = true;
            } else if (arg == "--max" && i + 1 < argc) {
                max_val = std::stod(argv[++i]);
                max_set = true;
            } else if (arg == "--samples" && i + 1 < argc) {
                samples = std::stoi(argv[++i]);
            } else if (arg == "--trials" && i + 1 < argc) {
                scenario.trials = std::stoi(argv[++i]);
            } else if (arg == "--quality" && i + 1 < argc) {
                scenario.quality_id = std::stoi(argv[++i]);
            } else if (arg == "--price" && i + 1 < argc) {
                scenario.base_price = std::stod(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                scenario.seed = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--out" && i + 1 < argc) {
                out = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                printUsage();
                return 0;
            } else {
                std::cout << "Unknown argument: " << arg << "\n";
                printUsage();
                return 1;
            }
        }
    } catch (const std::logic_error& e) {
        std::cout << "Bad numeric argument (" << e.what() << ")\n";
        printUsage();
        return 1;
    }

    if (param.empty()) {
        printUsage();
        return 1;
    }

    scout::setLogLevel(scout::LogLevel::Warn);

    scout::TierBalanceAnalyzer analyzer;
    analyzer.setScenario(scenario);

    scout::TierBalanceAnalyzer::ParameterRange range;
    range.samples = samples;

    if (param == "quality" || param == "quality_id") {
        analyzer.analyzeQuality();
    } else {
        if (param == "credit_score" || param == "score") {
            range.nominal = 650.0;
            if (!min_set) min_val = 550.0;
            if (!max_set) max_val = 800.0;
        } else if (param == "credit" || param == "credit_modifier") {
            range.nominal = scenario.credit_modifier;
            if (!min_set) min_val = -0.15;
            if (!max_set) max_val = 0.20;
        } else if (param == "price" || param == "base_price") {
            range.nominal = scenario.base_price;
            if (!min_set) min_val = range.nominal * 0.25;
            if (!max_set) max_val = range.nominal * 4.0;
        } else {
            std::cout << "Unsupported parameter: " << param << "\n";
            printUsage();
            return 1;
        }

        range.min = min_val;
        range.max = max_val;

        if (param == "credit_score" || param == "score") {
            analyzer.analyzeCreditScore(range);
        } else if (param == "credit" || param == "credit_modifier") {
            analyzer.analyzeCreditModifier(range);
        } else {
            analyzer.analyzeBasePrice(range);
        }
    }

    if (!analyzer.exportBalanceMatrixCSV(out)) {
        std::cerr << "Failed to write: " << out << "\n";
        return 1;
    }
    std::cout << "Wrote tier balance sweep (" << analyzer.results().size() << " rows) to: " << out << "\n";
    return 0;
}
