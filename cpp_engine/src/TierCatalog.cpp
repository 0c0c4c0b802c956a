#include "TierCatalog.h"
#include "Digest.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace scout {

namespace {

// One month of search time is one in-world day.
constexpr int kUnitsPerMonth = 24;

template <typename T>
void upsertById(std::vector<T>& v, const T& item) {
    for (auto& e : v) {
        if (e.id == item.id) {
            e = item;
            return;
        }
    }
    v.push_back(item);
    std::sort(v.begin(), v.end(), [](const T& a, const T& b) { return a.id < b.id; });
}

template <typename T>
const T* findById(const std::vector<T>& v, int id) {
    for (const auto& e : v) {
        if (e.id == id) return &e;
    }
    return nullptr;
}

} // namespace

TierCatalog TierCatalog::defaults() {
    TierCatalog c;

    c.addTier({1, "Local Search",    0.04, 1 * kUnitsPerMonth, 1 * kUnitsPerMonth, 0.25, 0.25, false});
    c.addTier({2, "Regional Search", 0.06, 1 * kUnitsPerMonth, 2 * kUnitsPerMonth, 0.55, 0.50, false});
    c.addTier({3, "National Search", 0.10, 2 * kUnitsPerMonth, 4 * kUnitsPerMonth, 0.80, 0.70, true});

    c.addQuality({1, "Poor",      0.05, 0.30, 0.15,  0.15});
    c.addQuality({2, "Any",       0.10, 0.40, 0.30,  0.08});
    c.addQuality({3, "Fair",      0.40, 0.60, 0.48,  0.00});
    c.addQuality({4, "Good",      0.60, 0.80, 0.65, -0.08});
    c.addQuality({5, "Excellent", 0.80, 0.95, 0.80, -0.15});

    c.addInspection({1, "Quick Glance",  1000.0, 0.02,  2500.0,  2});
    c.addInspection({2, "Standard",      2000.0, 0.03,  5000.0,  6});
    c.addInspection({3, "Comprehensive", 4000.0, 0.05, 10000.0, 12});

    c.setCreditBands({{750, -0.15}, {700, -0.08}, {650, 0.00}, {600, 0.10}, {300, 0.20}}, 0.20);
    return c;
}

void TierCatalog::addTier(const TierDefinition& tier) { upsertById(tiers_, tier); }
void TierCatalog::addQuality(const QualityTier& quality) { upsertById(qualities_, quality); }
void TierCatalog::addInspection(const InspectionTier& inspection) { upsertById(inspections_, inspection); }

void TierCatalog::setCreditBands(std::vector<CreditBand> bands, double floor_modifier) {
    std::sort(bands.begin(), bands.end(), [](const CreditBand& a, const CreditBand& b) {
        return a.min_score > b.min_score;
    });
    credit_bands_ = std::move(bands);
    credit_floor_modifier_ = floor_modifier;
}

const TierDefinition* TierCatalog::findTier(int id) const { return findById(tiers_, id); }
const QualityTier* TierCatalog::findQuality(int id) const { return findById(qualities_, id); }
const InspectionTier* TierCatalog::findInspection(int id) const { return findById(inspections_, id); }

double TierCatalog::creditModifierForScore(int score) const {
    for (const auto& band : credit_bands_) {
        if (score >= band.min_score) return band.fee_modifier;
    }
    return credit_floor_modifier_;
}

std::uint32_t TierCatalog::fnvHash() const {
    std::uint32_t h = fnv1a32_begin();
    for (const auto& t : tiers_) {
        h = fnv1a32_add_i32(h, t.id);
        h = fnv1a32_add_f64(h, t.fee_fraction);
        h = fnv1a32_add_i32(h, t.min_duration);
        h = fnv1a32_add_i32(h, t.max_duration);
        h = fnv1a32_add_f64(h, t.base_success);
        h = fnv1a32_add_f64(h, t.match_chance);
    }
    for (const auto& q : qualities_) {
        h = fnv1a32_add_i32(h, q.id);
        h = fnv1a32_add_f64(h, q.min_condition);
        h = fnv1a32_add_f64(h, q.max_condition);
        h = fnv1a32_add_f64(h, q.price_multiplier);
        h = fnv1a32_add_f64(h, q.success_modifier);
    }
    for (const auto& b : credit_bands_) {
        h = fnv1a32_add_i32(h, b.min_score);
        h = fnv1a32_add_f64(h, b.fee_modifier);
    }
    return h;
}

double effectiveSuccessProbability(const TierDefinition& tier, const QualityTier& quality) {
    const double p = tier.base_success + quality.success_modifier;
    if (!std::isfinite(p)) return kMinSuccessProbability;
    return std::clamp(p, kMinSuccessProbability, kMaxSuccessProbability);
}

double inspectionCost(const InspectionTier& inspection, double listing_price) {
    const double raw = inspection.base_cost + listing_price * inspection.percent_of_price;
    return std::floor(std::min(inspection.max_cost, raw));
}

} // namespace scout
