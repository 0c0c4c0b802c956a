#pragma once

#include "OutcomeResolver.h"
#include "RecordCodec.h"
#include "ResultCodes.h"
#include "Rng.h"
#include "TierCatalog.h"

#include <cstdint>
#include <string>

namespace scout {

enum class SearchStatus : std::uint8_t {
    Active = 0,
    Success = 1,
    Failed = 2,
    Cancelled = 3,
    Completed = 4, // listing purchased
};

enum class CompletionCheck : int {
    None = 0,
    Success,
    Failed,
};

const char* toString(SearchStatus status);
bool parseSearchStatus(const std::string& text, SearchStatus& out);

struct ItemRef {
    std::string catalog_key;
    std::string display_name;
};

// A single in-flight search. The outcome is resolved once in create() and
// never re-rolled; advance() only moves the countdowns.
class SearchRecord {
public:
    SearchRecord() = default;

    // Single OutcomeResolver call. ConfigurationError leaves `out` untouched.
    static ResultCode create(std::uint32_t id,
                             int consumer_id,
                             const ItemRef& item,
                             double base_price,
                             int tier_id,
                             int quality_id,
                             const ConfigSelection& requested,
                             double credit_modifier,
                             std::int64_t created_at,
                             const TierCatalog& catalog,
                             RandomSource& rng,
                             SearchRecord& out);

    // No clamping; callers inspect the sign.
    void advance(int delta_units);

    // Pure evaluation; the scheduler commits the transition.
    CompletionCheck checkCompletion() const;

    // Idempotent; the fee stays sunk.
    void cancel();

    void markSuccess();
    void markFailed();
    void markCompleted();

    std::uint32_t id() const { return id_; }
    int consumerId() const { return consumer_id_; }
    const ItemRef& item() const { return item_; }
    double basePrice() const { return base_price_; }
    int tierId() const { return tier_id_; }
    int qualityId() const { return quality_id_; }
    const ConfigSelection& requestedConfigs() const { return requested_; }
    double cost() const { return cost_; }
    int ttl() const { return ttl_; }
    int tts() const { return tts_; }
    SearchStatus status() const { return status_; }
    std::int64_t createdAt() const { return created_at_; }
    bool isActive() const { return status_ == SearchStatus::Active; }

    // Frozen outcome, independent of status.
    bool willSucceed() const { return tts_ <= ttl_; }

    // Found details; zero / empty until the success resolves.
    bool hasFoundItem() const;
    double foundCondition() const { return hasFoundItem() ? found_condition_ : 0.0; }
    double foundPrice() const { return hasFoundItem() ? found_price_ : 0.0; }
    ConfigSelection foundConfigs() const { return hasFoundItem() ? found_configs_ : ConfigSelection{}; }

    // Durable form (flat attributes). Missing identity -> CorruptRecord.
    void writeAttributes(AttributeSection& s) const;
    static ResultCode readAttributes(const AttributeSection& s, SearchRecord& out);

    // Replication form; field order is fixed and shared by both paths.
    void writeWire(WireWriter& w) const;
    static SearchRecord readWire(WireReader& r);

    std::uint32_t digest(std::uint32_t h) const;

    bool operator==(const SearchRecord& o) const;
    bool operator!=(const SearchRecord& o) const { return !(*this == o); }

private:
    std::uint32_t id_ = 0;
    int consumer_id_ = 0;
    ItemRef item_{};
    double base_price_ = 0.0;
    int tier_id_ = 0;
    int quality_id_ = 1;
    ConfigSelection requested_;

    double cost_ = 0.0;
    int ttl_ = 0;
    int tts_ = 0;
    SearchStatus status_ = SearchStatus::Active;
    std::int64_t created_at_ = 0;

    double found_condition_ = 0.0;
    double found_price_ = 0.0;
    ConfigSelection found_configs_;
};

} // namespace scout
