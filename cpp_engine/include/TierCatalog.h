#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace scout {

// Success probability after combining tier base with the quality modifier.
constexpr double kMinSuccessProbability = 0.05;
constexpr double kMaxSuccessProbability = 0.95;

// Search service level. Durations are in time units (hours).
struct TierDefinition {
    int id = 0;
    std::string name;
    double fee_fraction = 0.0;   // of base price
    int min_duration = 0;
    int max_duration = 0;
    double base_success = 0.0;
    double match_chance = 0.0;   // per requested configuration
    bool premium_agent = false;
};

// Condition bracket [min_condition, max_condition).
struct QualityTier {
    int id = 0;
    std::string name;
    double min_condition = 0.0;
    double max_condition = 1.0;
    double price_multiplier = 1.0;
    double success_modifier = 0.0; // additive to TierDefinition::base_success
};

// Listing inspection service; the hourly completion class.
struct InspectionTier {
    int id = 0;
    std::string name;
    double base_cost = 0.0;
    double percent_of_price = 0.0;
    double max_cost = 0.0;
    int duration_units = 0;
};

// Rating score -> signed fee modifier. Bands are evaluated highest first.
struct CreditBand {
    int min_score = 0;
    double fee_modifier = 0.0;
};

class TierCatalog {
public:
    // Stock Local / Regional / National tables.
    static TierCatalog defaults();

    // Replaces an existing entry with the same id.
    void addTier(const TierDefinition& tier);
    void addQuality(const QualityTier& quality);
    void addInspection(const InspectionTier& inspection);
    void setCreditBands(std::vector<CreditBand> bands, double floor_modifier);

    // nullptr on unknown id.
    const TierDefinition* findTier(int id) const;
    const QualityTier* findQuality(int id) const;
    const InspectionTier* findInspection(int id) const;

    const std::vector<TierDefinition>& tiers() const { return tiers_; }
    const std::vector<QualityTier>& qualities() const { return qualities_; }
    const std::vector<InspectionTier>& inspections() const { return inspections_; }

    double creditModifierForScore(int score) const;

    std::uint32_t fnvHash() const;

private:
    std::vector<TierDefinition> tiers_;
    std::vector<QualityTier> qualities_;
    std::vector<InspectionTier> inspections_;
    std::vector<CreditBand> credit_bands_;
    double credit_floor_modifier_ = 0.0;
};

double effectiveSuccessProbability(const TierDefinition& tier, const QualityTier& quality);
double inspectionCost(const InspectionTier& inspection, double listing_price);

} // namespace scout
