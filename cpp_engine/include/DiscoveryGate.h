#pragma once

#include "Collaborators.h"
#include "RecordCodec.h"
#include "ResultCodes.h"
#include "Rng.h"

#include <cstdint>
#include <map>
#include <string>

namespace scout {

// Versioned, hashable gate contract. Times are in simulated units (hours).
struct GateConfigV1 {
    std::uint32_t version_u32 = 1;
    std::uint32_t size_bytes_u32 = sizeof(GateConfigV1);
    std::uint32_t fnv_hash_u32 = 0;

    double base_chance = 0.20;
    std::int32_t pity_threshold_i32 = 10;
    std::int32_t required_usage_i32 = 3;
    std::int32_t required_rating_i32 = 700;
    double ceiling_threshold = 0.90;   // some owned resource must sit below this
    double list_price = 75000.0;
    double premium_price = 67500.0;    // charged on accept
    std::int64_t window_units_i64 = 30 * 24;
    std::int32_t units_per_day_i32 = 24;
};

// Stable reason strings reported by checkPrerequisites().
namespace gate_reason {
constexpr const char* kAlreadyDiscovered = "already_discovered";
constexpr const char* kOpportunityActive = "opportunity_active";
constexpr const char* kUsage = "obd_uses";
constexpr const char* kRating = "credit_score";
constexpr const char* kNoDegradedResource = "no_degraded_ceiling";
constexpr const char* kEligible = "eligible";
} // namespace gate_reason

struct PrerequisiteCheck {
    bool eligible = false;
    std::string reason;
    int detail = 0; // usage count or rating score where relevant
};

struct GateState {
    bool discovered = false;
    bool purchased = false;
    bool opportunity_active = false;
    std::int64_t opportunity_expiry = 0;
    std::int32_t eligible_events = 0; // pity accumulator

    // Display only.
    PrerequisiteCheck last_check{};
};

enum class QualifyingEventKind : int {
    Purchase = 0,
    Lease,
    Finance,
    Sale,
};

const char* toString(QualifyingEventKind kind);

struct GateStatus {
    bool discovered = false;
    bool purchased = false;
    bool opportunity_active = false;
    int days_remaining = 0;
    std::int32_t eligible_events = 0;
    double price = 0.0;
    double list_price = 0.0;
    PrerequisiteCheck prerequisites{};
};

// Per-consumer probability-gated unlock with a pity timer. A consumer gets a
// single discovery; an expired opportunity is never re-armed.
class DiscoveryGate {
public:
    DiscoveryGate(const GateConfigV1& config,
                  std::string catalog_key,
                  const ConsumerProfileSource& profiles,
                  const RatingSource* rating,
                  Ledger& ledger,
                  Acquisition& acquisition,
                  RandomSource& rng,
                  bool authoritative = true);

    // Refreshes the cached display check only for consumers that already
    // have gate state; never creates one.
    PrerequisiteCheck checkPrerequisites(int consumer_id);

    // True when this event opened an opportunity.
    bool onQualifyingEvent(int consumer_id, QualifyingEventKind kind, std::int64_t now);

    ResultCode accept(int consumer_id);
    ResultCode decline(int consumer_id);

    // Returns the number of opportunities closed.
    int expireCheck(std::int64_t now);

    GateStatus status(int consumer_id, std::int64_t now) const;
    const GateState* find(int consumer_id) const;
    void resetConsumer(int consumer_id);

    void save(AttributeDocument& doc) const;
    LoadReport load(const AttributeDocument& doc);

    // Replicates discovered / purchased flags for every consumer.
    void writeSync(WireWriter& w) const;
    bool readSync(WireReader& r);

    std::uint32_t stateDigest() const;
    int exportConfigText(char* buf, int cap) const;

    const GateConfigV1& config() const { return config_; }
    const std::string& catalogKey() const { return catalog_key_; }

private:
    PrerequisiteCheck evaluate(int consumer_id, const GateState* st) const;

    GateConfigV1 config_{};
    std::string catalog_key_;
    const ConsumerProfileSource& profiles_;
    const RatingSource* rating_ = nullptr;
    Ledger& ledger_;
    Acquisition& acquisition_;
    RandomSource& rng_;
    bool authoritative_ = true;

    std::map<int, GateState> states_;
};

} // namespace scout
