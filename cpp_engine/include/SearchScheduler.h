#pragma once

#include "Collaborators.h"
#include "OutcomeResolver.h"
#include "RecordCodec.h"
#include "ResultCodes.h"
#include "Rng.h"
#include "SearchRecord.h"
#include "TierCatalog.h"

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace scout {

// Versioned, hashable scheduler contract.
struct SchedulerConfigV1 {
    std::uint32_t version_u32 = 1;
    std::uint32_t size_bytes_u32 = sizeof(SchedulerConfigV1);
    std::uint32_t fnv_hash_u32 = 0;

    std::int32_t units_per_day_i32 = 24;
    std::int32_t listing_lifetime_units_i32 = 72;
    std::uint32_t authoritative_u32 = 1;
};

// Simulated time; hour is absolute (day * units_per_day + hour-of-day).
// Monotonic non-decreasing across tick() calls.
struct SimClock {
    std::int64_t day = 0;
    std::int64_t hour = 0;
};

enum class ListingStatus : std::uint8_t {
    Available = 0,
    Purchased = 1,
    Declined = 2,
    Expired = 3,
};

enum class InspectionState : std::uint8_t {
    None = 0,
    Pending = 1,
    Complete = 2,
};

const char* toString(ListingStatus status);
const char* toString(InspectionState state);

// Purchasable result of a successful search.
struct Listing {
    std::uint32_t id = 0;
    std::uint32_t search_id = 0;
    int consumer_id = 0;
    ItemRef item{};
    int tier_id = 0;
    int quality_id = 0;
    double base_price = 0.0;
    double price = 0.0;
    double condition = 0.0;
    ConfigSelection configs;
    std::int32_t expiry_units = 0;
    ListingStatus status = ListingStatus::Available;

    InspectionState inspection = InspectionState::None;
    int inspection_tier_id = 0;
    double inspection_cost = 0.0;
    std::int64_t inspection_completes_at = 0;
    std::int64_t inspection_requested_at = 0;

    void writeAttributes(AttributeSection& s) const;
    static ResultCode readAttributes(const AttributeSection& s, Listing& out);
    void writeWire(WireWriter& w) const;
    static Listing readWire(WireReader& r);

    bool operator==(const Listing& o) const;
};

struct ConsumerStats {
    int searches_started = 0;
    int searches_succeeded = 0;
    int searches_failed = 0;
    int searches_cancelled = 0;
    int listings_purchased = 0;
    int listings_declined = 0;
    int listings_expired = 0;
    int inspections_purchased = 0;
    double total_search_fees = 0.0;
    double total_inspection_fees = 0.0;
};

enum class SchedulerEventKind : int {
    SearchSucceeded = 0,
    SearchFailed,
    ListingExpired,
    InspectionCompleted,
};

const char* toString(SchedulerEventKind kind);

struct SchedulerEvent {
    SchedulerEventKind kind = SchedulerEventKind::SearchSucceeded;
    int consumer_id = 0;
    std::uint32_t search_id = 0;
    std::uint32_t listing_id = 0; // 0 for SearchFailed
    std::int64_t day = 0;
};

struct SubmitResult {
    ResultCode code = ResultCode::Ok;
    SearchRecord record{};
    bool ok() const { return code == ResultCode::Ok; }
};

struct QuoteResult {
    ResultCode code = ResultCode::Ok;
    double cost = 0.0;
    double credit_modifier = 0.0;
    int rating_score = kNeutralRatingScore;
};

struct PurchaseResult {
    ResultCode code = ResultCode::Ok;
    Listing listing{};
};

struct InspectionResult {
    ResultCode code = ResultCode::Ok;
    double cost = 0.0;
    std::int64_t completes_at = 0;
};

// Read-only replica of one consumer's searches and listings.
struct ConsumerSnapshot {
    int consumer_id = 0;
    std::vector<SearchRecord> records;
    std::vector<Listing> listings;
    bool ok = false;
};

// Owns every in-flight SearchRecord and every published Listing. Mutations
// are only accepted on the authoritative instance.
class SearchScheduler {
public:
    SearchScheduler(const SchedulerConfigV1& config,
                    TierCatalog catalog,
                    Ledger& ledger,
                    Acquisition* acquisition,
                    const RatingSource* rating,
                    RandomSource& rng);

    SubmitResult submit(int consumer_id,
                        const ItemRef& item,
                        double base_price,
                        int tier_id,
                        int quality_id,
                        const ConfigSelection& requested);

    // Fee the consumer would pay now; no side effects.
    QuoteResult quote(int consumer_id, double base_price, int tier_id) const;

    // Day rollup plus the hourly inspection pass. Events are returned only
    // after the whole batch is computed.
    std::vector<SchedulerEvent> tick(const SimClock& now);

    ResultCode cancel(std::uint32_t search_id);

    PurchaseResult purchaseListing(std::uint32_t listing_id);
    ResultCode declineListing(std::uint32_t listing_id);
    InspectionResult requestInspection(std::uint32_t listing_id, int inspection_tier_id);

    const SearchRecord* findRecord(std::uint32_t search_id) const;
    const Listing* findListing(std::uint32_t listing_id) const;
    std::vector<const SearchRecord*> records(int consumer_id) const;
    std::vector<const Listing*> listings(int consumer_id) const;
    std::vector<int> consumers() const;
    ConsumerStats stats(int consumer_id) const;
    std::size_t recordCount() const { return records_.size(); }
    std::size_t listingCount() const { return listings_.size(); }

    std::int64_t lastProcessedDay() const { return last_processed_day_; }
    std::int64_t lastHour() const { return last_hour_; }
    std::uint32_t nextId() const { return next_id_; }
    const TierCatalog& catalog() const { return catalog_; }
    const SchedulerConfigV1& config() const { return config_; }
    bool authoritative() const { return config_.authoritative_u32 != 0u; }

    // Durable state. Clears current state; corrupt entries are skipped.
    void save(AttributeDocument& doc) const;
    LoadReport load(const AttributeDocument& doc);

    void writeConsumerSnapshot(int consumer_id, WireWriter& w) const;
    static ConsumerSnapshot readConsumerSnapshot(WireReader& r);

    // FNV-1a32 over the full ordered state.
    std::uint32_t stateDigest() const;

    int exportConfigText(char* buf, int cap) const;

private:
    bool requireAuthority(const char* op) const;
    void removeFromActiveSet(const SearchRecord& rec);
    void retireRecord(std::uint32_t search_id, SearchStatus final_status);

    void runInspections(std::int64_t hour, std::int64_t day, std::vector<SchedulerEvent>& events);
    void ageListings(std::map<std::uint32_t, Listing>& listings,
                     std::int64_t day,
                     std::vector<SchedulerEvent>& events);
    void advanceRecords(std::int64_t day,
                        std::map<std::uint32_t, Listing>& staged,
                        std::vector<SchedulerEvent>& events);

    SchedulerConfigV1 config_{};
    TierCatalog catalog_;
    Ledger& ledger_;
    Acquisition* acquisition_ = nullptr;
    const RatingSource* rating_ = nullptr;
    RandomSource& rng_;

    std::map<std::uint32_t, SearchRecord> records_;
    std::map<int, std::vector<std::uint32_t>> active_by_consumer_;
    std::map<std::uint32_t, Listing> listings_;
    std::map<int, ConsumerStats> stats_;

    std::uint32_t next_id_ = 1;
    std::int64_t last_processed_day_ = -1; // -1 until the first tick
    std::int64_t last_hour_ = 0;
};

} // namespace scout
