#include "SearchScheduler.h"
#include "Digest.h"
#include "Log.h"

#include <algorithm>
#include <cstdio>
#include <utility>

namespace scout {

namespace {

constexpr std::int32_t kDefaultListingLifetime = 72;

// Upper bound on entries accepted from a replication stream.
constexpr std::uint32_t kMaxSnapshotEntries = 100000u;

const char* kSchedulerSection = "scheduler";
const char* kSearchSection = "search";
const char* kListingSection = "listing";
const char* kStatsSection = "stats";

bool parseListingStatus(const std::string& s, ListingStatus& out) {
    if (s == "available") { out = ListingStatus::Available; return true; }
    if (s == "purchased") { out = ListingStatus::Purchased; return true; }
    if (s == "declined")  { out = ListingStatus::Declined;  return true; }
    if (s == "expired")   { out = ListingStatus::Expired;   return true; }
    return false;
}

bool parseInspectionState(const std::string& s, InspectionState& out) {
    if (s == "none")     { out = InspectionState::None;     return true; }
    if (s == "pending")  { out = InspectionState::Pending;  return true; }
    if (s == "complete") { out = InspectionState::Complete; return true; }
    return false;
}

std::uint32_t hashSchedulerConfig(const SchedulerConfigV1& c) {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_u32(h, c.version_u32);
    h = fnv1a32_add_u32(h, c.size_bytes_u32);
    h = fnv1a32_add_i32(h, c.units_per_day_i32);
    h = fnv1a32_add_i32(h, c.listing_lifetime_units_i32);
    h = fnv1a32_add_u32(h, c.authoritative_u32);
    return h;
}

} // namespace

const char* toString(ListingStatus status) {
    switch (status) {
    case ListingStatus::Available: return "available";
    case ListingStatus::Purchased: return "purchased";
    case ListingStatus::Declined:  return "declined";
    case ListingStatus::Expired:   return "expired";
    }
    return "available";
}

const char* toString(InspectionState state) {
    switch (state) {
    case InspectionState::None:     return "none";
    case InspectionState::Pending:  return "pending";
    case InspectionState::Complete: return "complete";
    }
    return "none";
}

const char* toString(SchedulerEventKind kind) {
    switch (kind) {
    case SchedulerEventKind::SearchSucceeded:     return "search_succeeded";
    case SchedulerEventKind::SearchFailed:        return "search_failed";
    case SchedulerEventKind::ListingExpired:      return "listing_expired";
    case SchedulerEventKind::InspectionCompleted: return "inspection_completed";
    }
    return "unknown";
}

// ---- Listing ----

void Listing::writeAttributes(AttributeSection& s) const {
    s.setInt("id", id);
    s.setInt("search_id", search_id);
    s.setInt("consumer_id", consumer_id);
    s.set("catalog_key", item.catalog_key);
    s.set("display_name", item.display_name);
    s.setInt("tier_id", tier_id);
    s.setInt("quality_id", quality_id);
    s.setDouble("base_price", base_price);
    s.setDouble("price", price);
    s.setDouble("condition", condition);
    s.setInt("expiry_units", expiry_units);
    s.set("status", toString(status));
    s.set("inspection", toString(inspection));
    s.setInt("inspection_tier_id", inspection_tier_id);
    s.setDouble("inspection_cost", inspection_cost);
    s.setInt("inspection_completes_at", inspection_completes_at);
    s.setInt("inspection_requested_at", inspection_requested_at);
    for (const auto& kv : configs) {
        s.setInt("config." + kv.first, kv.second);
    }
}

ResultCode Listing::readAttributes(const AttributeSection& s, Listing& out) {
    const std::int64_t id = s.getInt("id", -1);
    if (id <= 0 || id > static_cast<std::int64_t>(UINT32_MAX)) return ResultCode::CorruptRecord;

    Listing l;
    l.id = static_cast<std::uint32_t>(id);
    l.search_id = static_cast<std::uint32_t>(s.getInt("search_id", 0));
    l.consumer_id = static_cast<int>(s.getInt("consumer_id", 0));
    l.item.catalog_key = s.get("catalog_key");
    l.item.display_name = s.get("display_name");
    l.tier_id = static_cast<int>(s.getInt("tier_id", 1));
    l.quality_id = static_cast<int>(s.getInt("quality_id", 1));
    l.base_price = s.getDouble("base_price", 0.0);
    l.price = s.getDouble("price", 0.0);
    l.condition = s.getDouble("condition", 0.0);
    l.expiry_units = static_cast<std::int32_t>(s.getInt("expiry_units", kDefaultListingLifetime));
    if (!parseListingStatus(s.get("status", "available"), l.status)) l.status = ListingStatus::Available;
    if (!parseInspectionState(s.get("inspection", "none"), l.inspection)) l.inspection = InspectionState::None;
    l.inspection_tier_id = static_cast<int>(s.getInt("inspection_tier_id", 0));
    l.inspection_cost = s.getDouble("inspection_cost", 0.0);
    l.inspection_completes_at = s.getInt("inspection_completes_at", 0);
    l.inspection_requested_at = s.getInt("inspection_requested_at", 0);

    const std::string prefix = "config.";
    for (const auto& kv : s.values) {
        if (kv.first.compare(0, prefix.size(), prefix) != 0 || kv.first.size() == prefix.size()) continue;
        l.configs[kv.first.substr(prefix.size())] = static_cast<int>(s.getInt(kv.first, kUnmatchedOption));
    }
    out = std::move(l);
    return ResultCode::Ok;
}

void Listing::writeWire(WireWriter& w) const {
    w.writeU32(id);
    w.writeU32(search_id);
    w.writeI32(consumer_id);
    w.writeString(item.catalog_key);
    w.writeString(item.display_name);
    w.writeI32(tier_id);
    w.writeI32(quality_id);
    w.writeF64(base_price);
    w.writeF64(price);
    w.writeF64(condition);
    w.writeI32(expiry_units);
    w.writeU8(static_cast<std::uint8_t>(status));
    w.writeU8(static_cast<std::uint8_t>(inspection));
    w.writeI32(inspection_tier_id);
    w.writeF64(inspection_cost);
    w.writeI64(inspection_completes_at);
    w.writeI64(inspection_requested_at);
    w.writeU32(static_cast<std::uint32_t>(configs.size()));
    for (const auto& kv : configs) {
        w.writeString(kv.first);
        w.writeI32(kv.second);
    }
}

Listing Listing::readWire(WireReader& r) {
    Listing l;
    l.id = r.readU32();
    l.search_id = r.readU32();
    l.consumer_id = r.readI32();
    l.item.catalog_key = r.readString();
    l.item.display_name = r.readString();
    l.tier_id = r.readI32();
    l.quality_id = r.readI32();
    l.base_price = r.readF64();
    l.price = r.readF64();
    l.condition = r.readF64();
    l.expiry_units = r.readI32();
    const std::uint8_t st = r.readU8();
    l.status = (st <= static_cast<std::uint8_t>(ListingStatus::Expired)) ? static_cast<ListingStatus>(st)
                                                                        : ListingStatus::Available;
    const std::uint8_t insp = r.readU8();
    l.inspection = (insp <= static_cast<std::uint8_t>(InspectionState::Complete))
                       ? static_cast<InspectionState>(insp)
                       : InspectionState::None;
    l.inspection_tier_id = r.readI32();
    l.inspection_cost = r.readF64();
    l.inspection_completes_at = r.readI64();
    l.inspection_requested_at = r.readI64();
    const std::uint32_t n = r.readU32();
    for (std::uint32_t i = 0; i < n && !r.failed(); ++i) {
        std::string key = r.readString();
        const std::int32_t v = r.readI32();
        if (!r.failed()) l.configs[key] = v;
    }
    return l;
}

bool Listing::operator==(const Listing& o) const {
    return id == o.id && search_id == o.search_id && consumer_id == o.consumer_id &&
           item.catalog_key == o.item.catalog_key && item.display_name == o.item.display_name &&
           tier_id == o.tier_id && quality_id == o.quality_id && base_price == o.base_price &&
           price == o.price && condition == o.condition && configs == o.configs &&
           expiry_units == o.expiry_units && status == o.status && inspection == o.inspection &&
           inspection_tier_id == o.inspection_tier_id && inspection_cost == o.inspection_cost &&
           inspection_completes_at == o.inspection_completes_at &&
           inspection_requested_at == o.inspection_requested_at;
}

// ---- SearchScheduler ----

SearchScheduler::SearchScheduler(const SchedulerConfigV1& config,
                                 TierCatalog catalog,
                                 Ledger& ledger,
                                 Acquisition* acquisition,
                                 const RatingSource* rating,
                                 RandomSource& rng)
    : config_(config),
      catalog_(std::move(catalog)),
      ledger_(ledger),
      acquisition_(acquisition),
      rating_(rating),
      rng_(rng) {
    if (config_.units_per_day_i32 <= 0) config_.units_per_day_i32 = 24;
    if (config_.listing_lifetime_units_i32 <= 0) config_.listing_lifetime_units_i32 = kDefaultListingLifetime;
    config_.size_bytes_u32 = sizeof(SchedulerConfigV1);
    config_.fnv_hash_u32 = hashSchedulerConfig(config_);
}

bool SearchScheduler::requireAuthority(const char* op) const {
    if (authoritative()) return true;
    SCOUT_LOG_WARN("scheduler: %s rejected on non-authoritative instance", op);
    return false;
}

QuoteResult SearchScheduler::quote(int consumer_id, double base_price, int tier_id) const {
    QuoteResult q;
    const TierDefinition* tier = catalog_.findTier(tier_id);
    if (!tier) {
        q.code = ResultCode::ConfigurationError;
        return q;
    }
    q.rating_score = ratingOrNeutral(rating_, consumer_id);
    q.credit_modifier = catalog_.creditModifierForScore(q.rating_score);
    q.cost = computeSearchCost(*tier, base_price, q.credit_modifier);
    return q;
}

SubmitResult SearchScheduler::submit(int consumer_id,
                                     const ItemRef& item,
                                     double base_price,
                                     int tier_id,
                                     int quality_id,
                                     const ConfigSelection& requested) {
    SubmitResult res;
    if (!requireAuthority("submit")) {
        res.code = ResultCode::NotAuthoritative;
        return res;
    }
    if (!catalog_.findQuality(quality_id)) {
        res.code = ResultCode::ConfigurationError;
        return res;
    }
    const QuoteResult q = quote(consumer_id, base_price, tier_id);
    if (q.code != ResultCode::Ok) {
        res.code = q.code;
        return res;
    }

    // Charge before any draw so a rejected submit leaves the stream untouched.
    const ResultCode charged = ledger_.charge(consumer_id, q.cost);
    if (charged != ResultCode::Ok) {
        SCOUT_LOG_INFO("scheduler: submit for consumer %d rejected (%s, fee %.0f)",
                       consumer_id, toString(charged), q.cost);
        res.code = charged;
        return res;
    }

    SearchRecord rec;
    const ResultCode created = SearchRecord::create(next_id_, consumer_id, item, base_price, tier_id, quality_id,
                                                    requested, q.credit_modifier, last_hour_, catalog_, rng_, rec);
    if (created != ResultCode::Ok) {
        ledger_.credit(consumer_id, q.cost);
        res.code = created;
        return res;
    }
    ++next_id_;

    ConsumerStats& st = stats_[consumer_id];
    st.searches_started += 1;
    st.total_search_fees += rec.cost();

    active_by_consumer_[consumer_id].push_back(rec.id());
    res.record = rec;
    records_.emplace(rec.id(), std::move(rec));

    SCOUT_LOG_INFO("scheduler: search %u started for consumer %d (%s, tier %d, quality %d, fee %.0f)",
                   res.record.id(), consumer_id, item.catalog_key.c_str(), tier_id, quality_id, res.record.cost());
    return res;
}

void SearchScheduler::removeFromActiveSet(const SearchRecord& rec) {
    auto it = active_by_consumer_.find(rec.consumerId());
    if (it == active_by_consumer_.end()) return;
    auto& ids = it->second;
    ids.erase(std::remove(ids.begin(), ids.end(), rec.id()), ids.end());
    if (ids.empty()) active_by_consumer_.erase(it);
}

void SearchScheduler::retireRecord(std::uint32_t search_id, SearchStatus final_status) {
    auto it = records_.find(search_id);
    if (it == records_.end()) return;
    if (final_status == SearchStatus::Completed) it->second.markCompleted();
    removeFromActiveSet(it->second);
    records_.erase(it);
}

ResultCode SearchScheduler::cancel(std::uint32_t search_id) {
    if (!requireAuthority("cancel")) return ResultCode::NotAuthoritative;
    auto it = records_.find(search_id);
    if (it == records_.end()) return ResultCode::NotFound;
    SearchRecord& rec = it->second;
    if (!rec.isActive()) return ResultCode::InvalidState;

    rec.cancel();
    stats_[rec.consumerId()].searches_cancelled += 1;
    SCOUT_LOG_INFO("scheduler: search %u cancelled by consumer %d", search_id, rec.consumerId());
    removeFromActiveSet(rec);
    records_.erase(it);
    return ResultCode::Ok;
}

void SearchScheduler::runInspections(std::int64_t hour, std::int64_t day, std::vector<SchedulerEvent>& events) {
    for (auto& kv : listings_) {
        Listing& l = kv.second;
        if (l.inspection != InspectionState::Pending || hour < l.inspection_completes_at) continue;
        l.inspection = InspectionState::Complete;
        events.push_back({SchedulerEventKind::InspectionCompleted, l.consumer_id, l.search_id, l.id, day});
        SCOUT_LOG_DEBUG("scheduler: inspection of listing %u completed at hour %lld",
                        l.id, static_cast<long long>(hour));
    }
}

void SearchScheduler::ageListings(std::map<std::uint32_t, Listing>& listings,
                                  std::int64_t day,
                                  std::vector<SchedulerEvent>& events) {
    const std::int64_t upd = config_.units_per_day_i32;
    for (auto it = listings.begin(); it != listings.end();) {
        Listing& l = it->second;
        // On hold while inspected. The day whose window (day-1, day] holds the
        // completion hour is not aged either, whenever the completion was observed.
        const bool completed_this_day = l.inspection == InspectionState::Complete &&
                                        l.inspection_completes_at > (day - 1) * upd &&
                                        l.inspection_completes_at <= day * upd;
        if (l.status != ListingStatus::Available || l.inspection == InspectionState::Pending || completed_this_day) {
            ++it;
            continue;
        }
        l.expiry_units -= config_.units_per_day_i32;
        if (l.expiry_units > 0) {
            ++it;
            continue;
        }
        l.status = ListingStatus::Expired;
        stats_[l.consumer_id].listings_expired += 1;
        events.push_back({SchedulerEventKind::ListingExpired, l.consumer_id, l.search_id, l.id, day});
        SCOUT_LOG_INFO("scheduler: listing %u for consumer %d expired", l.id, l.consumer_id);
        retireRecord(l.search_id, SearchStatus::Success);
        it = listings.erase(it);
    }
}

void SearchScheduler::advanceRecords(std::int64_t day,
                                     std::map<std::uint32_t, Listing>& staged,
                                     std::vector<SchedulerEvent>& events) {
    const int upd = config_.units_per_day_i32;
    // Copy: failures mutate the per-consumer vectors.
    const std::map<int, std::vector<std::uint32_t>> active = active_by_consumer_;

    for (const auto& entry : active) {
        for (std::uint32_t search_id : entry.second) {
            auto it = records_.find(search_id);
            if (it == records_.end() || !it->second.isActive()) continue;
            SearchRecord& rec = it->second;

            rec.advance(upd);
            const CompletionCheck check = rec.checkCompletion();

            if (check == CompletionCheck::Success) {
                rec.markSuccess();

                Listing l;
                l.id = next_id_++;
                l.search_id = rec.id();
                l.consumer_id = rec.consumerId();
                l.item = rec.item();
                l.tier_id = rec.tierId();
                l.quality_id = rec.qualityId();
                l.base_price = rec.basePrice();
                l.price = rec.foundPrice();
                l.condition = rec.foundCondition();
                l.configs = rec.foundConfigs();
                l.expiry_units = config_.listing_lifetime_units_i32;

                stats_[rec.consumerId()].searches_succeeded += 1;
                events.push_back({SchedulerEventKind::SearchSucceeded, rec.consumerId(), rec.id(), l.id, day});
                SCOUT_LOG_INFO("scheduler: search %u succeeded, listing %u (condition %.2f, price %.0f)",
                               rec.id(), l.id, l.condition, l.price);
                staged.emplace(l.id, std::move(l));
            } else if (check == CompletionCheck::Failed) {
                rec.markFailed();
                stats_[rec.consumerId()].searches_failed += 1;
                events.push_back({SchedulerEventKind::SearchFailed, rec.consumerId(), rec.id(), 0u, day});
                SCOUT_LOG_INFO("scheduler: search %u for consumer %d failed", rec.id(), rec.consumerId());
                removeFromActiveSet(rec);
                records_.erase(it);
            }
        }
    }
}

std::vector<SchedulerEvent> SearchScheduler::tick(const SimClock& now) {
    std::vector<SchedulerEvent> events;
    if (!requireAuthority("tick")) return events;

    if (last_processed_day_ < 0) last_processed_day_ = now.day;
    const std::int64_t days = now.day - last_processed_day_;
    const std::int64_t upd = config_.units_per_day_i32;

    // Not visible until the batch completes.
    std::map<std::uint32_t, Listing> staged;

    for (std::int64_t k = 1; k <= days; ++k) {
        const std::int64_t day = last_processed_day_ + k;
        const std::int64_t boundary = std::min(day * upd, now.hour);

        runInspections(boundary, day, events);
        ageListings(listings_, day, events);
        ageListings(staged, day, events);
        advanceRecords(day, staged, events);
    }
    if (days > 0) last_processed_day_ = now.day;

    runInspections(now.hour, now.day, events);
    last_hour_ = std::max(last_hour_, now.hour);

    for (auto& kv : staged) {
        listings_.emplace(kv.first, std::move(kv.second));
    }
    return events;
}

PurchaseResult SearchScheduler::purchaseListing(std::uint32_t listing_id) {
    PurchaseResult res;
    if (!requireAuthority("purchaseListing")) {
        res.code = ResultCode::NotAuthoritative;
        return res;
    }
    auto it = listings_.find(listing_id);
    if (it == listings_.end()) {
        res.code = ResultCode::NotFound;
        return res;
    }
    Listing& l = it->second;
    if (l.status != ListingStatus::Available || l.inspection == InspectionState::Pending) {
        res.code = ResultCode::InvalidState;
        return res;
    }

    const ResultCode charged = ledger_.charge(l.consumer_id, l.price);
    if (charged != ResultCode::Ok) {
        res.code = charged;
        return res;
    }

    const ResultCode spawned =
        acquisition_ ? acquisition_->materialize(l.item.catalog_key, l.consumer_id) : ResultCode::SpawnFailure;
    if (spawned != ResultCode::Ok) {
        ledger_.credit(l.consumer_id, l.price);
        SCOUT_LOG_WARN("scheduler: listing %u acquisition failed (%s); refunded %.0f to consumer %d",
                       l.id, toString(spawned), l.price, l.consumer_id);
        res.code = ResultCode::SpawnFailure;
        return res;
    }

    l.status = ListingStatus::Purchased;
    stats_[l.consumer_id].listings_purchased += 1;
    SCOUT_LOG_INFO("scheduler: listing %u purchased by consumer %d for %.0f", l.id, l.consumer_id, l.price);

    res.listing = l;
    retireRecord(l.search_id, SearchStatus::Completed);
    listings_.erase(it);
    return res;
}

ResultCode SearchScheduler::declineListing(std::uint32_t listing_id) {
    if (!requireAuthority("declineListing")) return ResultCode::NotAuthoritative;
    auto it = listings_.find(listing_id);
    if (it == listings_.end()) return ResultCode::NotFound;
    Listing& l = it->second;
    if (l.status != ListingStatus::Available) return ResultCode::InvalidState;

    l.status = ListingStatus::Declined;
    stats_[l.consumer_id].listings_declined += 1;
    SCOUT_LOG_INFO("scheduler: listing %u declined by consumer %d", l.id, l.consumer_id);
    retireRecord(l.search_id, SearchStatus::Success);
    listings_.erase(it);
    return ResultCode::Ok;
}

InspectionResult SearchScheduler::requestInspection(std::uint32_t listing_id, int inspection_tier_id) {
    InspectionResult res;
    if (!requireAuthority("requestInspection")) {
        res.code = ResultCode::NotAuthoritative;
        return res;
    }
    const InspectionTier* tier = catalog_.findInspection(inspection_tier_id);
    if (!tier) {
        res.code = ResultCode::ConfigurationError;
        return res;
    }
    auto it = listings_.find(listing_id);
    if (it == listings_.end()) {
        res.code = ResultCode::NotFound;
        return res;
    }
    Listing& l = it->second;
    if (l.status != ListingStatus::Available || l.inspection != InspectionState::None) {
        res.code = ResultCode::InvalidState;
        return res;
    }

    const double cost = inspectionCost(*tier, l.price);
    const ResultCode charged = ledger_.charge(l.consumer_id, cost);
    if (charged != ResultCode::Ok) {
        res.code = charged;
        return res;
    }

    l.inspection = InspectionState::Pending;
    l.inspection_tier_id = tier->id;
    l.inspection_cost = cost;
    l.inspection_requested_at = last_hour_;
    l.inspection_completes_at = last_hour_ + tier->duration_units;

    ConsumerStats& st = stats_[l.consumer_id];
    st.inspections_purchased += 1;
    st.total_inspection_fees += cost;

    SCOUT_LOG_INFO("scheduler: %s inspection of listing %u requested (fee %.0f, ready at hour %lld)",
                   tier->name.c_str(), l.id, cost, static_cast<long long>(l.inspection_completes_at));
    res.cost = cost;
    res.completes_at = l.inspection_completes_at;
    return res;
}

const SearchRecord* SearchScheduler::findRecord(std::uint32_t search_id) const {
    const auto it = records_.find(search_id);
    return (it == records_.end()) ? nullptr : &it->second;
}

const Listing* SearchScheduler::findListing(std::uint32_t listing_id) const {
    const auto it = listings_.find(listing_id);
    return (it == listings_.end()) ? nullptr : &it->second;
}

std::vector<const SearchRecord*> SearchScheduler::records(int consumer_id) const {
    std::vector<const SearchRecord*> out;
    const auto it = active_by_consumer_.find(consumer_id);
    if (it == active_by_consumer_.end()) return out;
    for (std::uint32_t id : it->second) {
        if (const SearchRecord* r = findRecord(id)) out.push_back(r);
    }
    return out;
}

std::vector<const Listing*> SearchScheduler::listings(int consumer_id) const {
    std::vector<const Listing*> out;
    for (const auto& kv : listings_) {
        if (kv.second.consumer_id == consumer_id) out.push_back(&kv.second);
    }
    return out;
}

std::vector<int> SearchScheduler::consumers() const {
    std::set<int> ids;
    for (const auto& kv : active_by_consumer_) ids.insert(kv.first);
    for (const auto& kv : stats_) ids.insert(kv.first);
    return std::vector<int>(ids.begin(), ids.end());
}

ConsumerStats SearchScheduler::stats(int consumer_id) const {
    const auto it = stats_.find(consumer_id);
    return (it == stats_.end()) ? ConsumerStats{} : it->second;
}

void SearchScheduler::save(AttributeDocument& doc) const {
    AttributeSection& head = doc.addSection(kSchedulerSection);
    head.setInt("next_id", next_id_);
    head.setInt("last_processed_day", last_processed_day_);
    head.setInt("last_hour", last_hour_);
    std::uint32_t stream = 0;
    if (rng_.saveState(stream)) head.setInt("rng_state", stream);

    for (const auto& kv : records_) {
        kv.second.writeAttributes(doc.addSection(kSearchSection));
    }
    for (const auto& kv : listings_) {
        kv.second.writeAttributes(doc.addSection(kListingSection));
    }
    for (const auto& kv : stats_) {
        const ConsumerStats& st = kv.second;
        AttributeSection& s = doc.addSection(kStatsSection);
        s.setInt("consumer_id", kv.first);
        s.setInt("searches_started", st.searches_started);
        s.setInt("searches_succeeded", st.searches_succeeded);
        s.setInt("searches_failed", st.searches_failed);
        s.setInt("searches_cancelled", st.searches_cancelled);
        s.setInt("listings_purchased", st.listings_purchased);
        s.setInt("listings_declined", st.listings_declined);
        s.setInt("listings_expired", st.listings_expired);
        s.setInt("inspections_purchased", st.inspections_purchased);
        s.setDouble("total_search_fees", st.total_search_fees);
        s.setDouble("total_inspection_fees", st.total_inspection_fees);
    }
}

LoadReport SearchScheduler::load(const AttributeDocument& doc) {
    LoadReport report;
    records_.clear();
    active_by_consumer_.clear();
    listings_.clear();
    stats_.clear();
    next_id_ = 1;
    last_processed_day_ = -1;
    last_hour_ = 0;

    const auto heads = doc.sectionsNamed(kSchedulerSection);
    if (!heads.empty()) {
        const AttributeSection& head = *heads.front();
        next_id_ = static_cast<std::uint32_t>(std::max<std::int64_t>(1, head.getInt("next_id", 1)));
        last_processed_day_ = head.getInt("last_processed_day", -1);
        last_hour_ = head.getInt("last_hour", 0);
        const std::int64_t stream = head.getInt("rng_state", -1);
        if (stream > 0 && stream <= static_cast<std::int64_t>(UINT32_MAX)) {
            if (!rng_.loadState(static_cast<std::uint32_t>(stream))) {
                SCOUT_LOG_WARN("scheduler: random source cannot resume; continuing from its current position");
            }
        }
    }

    for (const AttributeSection* s : doc.sectionsNamed(kSearchSection)) {
        SearchRecord rec;
        if (SearchRecord::readAttributes(*s, rec) != ResultCode::Ok || records_.count(rec.id()) != 0) {
            SCOUT_LOG_WARN("scheduler: skipping corrupt search entry (id '%s')", s->get("id").c_str());
            report.skipped += 1;
            continue;
        }
        // Terminal records are not carried.
        if (rec.status() != SearchStatus::Active && rec.status() != SearchStatus::Success) continue;
        next_id_ = std::max(next_id_, rec.id() + 1u);
        records_.emplace(rec.id(), std::move(rec));
        report.loaded += 1;
    }
    for (const auto& kv : records_) {
        active_by_consumer_[kv.second.consumerId()].push_back(kv.first);
    }

    for (const AttributeSection* s : doc.sectionsNamed(kListingSection)) {
        Listing l;
        if (Listing::readAttributes(*s, l) != ResultCode::Ok || listings_.count(l.id) != 0) {
            SCOUT_LOG_WARN("scheduler: skipping corrupt listing entry (id '%s')", s->get("id").c_str());
            report.skipped += 1;
            continue;
        }
        next_id_ = std::max(next_id_, l.id + 1u);
        listings_.emplace(l.id, std::move(l));
        report.loaded += 1;
    }

    // A succeeded search lives only as long as its listing.
    std::set<std::uint32_t> listed;
    for (const auto& kv : listings_) listed.insert(kv.second.search_id);
    std::vector<std::uint32_t> orphans;
    for (const auto& kv : records_) {
        if (kv.second.status() == SearchStatus::Success && listed.count(kv.first) == 0) orphans.push_back(kv.first);
    }
    for (std::uint32_t id : orphans) {
        SCOUT_LOG_WARN("scheduler: retiring search %u for consumer %d; its listing was not loaded", id,
                       records_.at(id).consumerId());
        retireRecord(id, SearchStatus::Success);
        report.loaded -= 1;
        report.retired += 1;
    }

    for (const AttributeSection* s : doc.sectionsNamed(kStatsSection)) {
        if (!s->has("consumer_id")) {
            SCOUT_LOG_WARN("scheduler: skipping stats entry without consumer_id");
            report.skipped += 1;
            continue;
        }
        ConsumerStats& st = stats_[static_cast<int>(s->getInt("consumer_id", 0))];
        st.searches_started = static_cast<int>(s->getInt("searches_started", 0));
        st.searches_succeeded = static_cast<int>(s->getInt("searches_succeeded", 0));
        st.searches_failed = static_cast<int>(s->getInt("searches_failed", 0));
        st.searches_cancelled = static_cast<int>(s->getInt("searches_cancelled", 0));
        st.listings_purchased = static_cast<int>(s->getInt("listings_purchased", 0));
        st.listings_declined = static_cast<int>(s->getInt("listings_declined", 0));
        st.listings_expired = static_cast<int>(s->getInt("listings_expired", 0));
        st.inspections_purchased = static_cast<int>(s->getInt("inspections_purchased", 0));
        st.total_search_fees = s->getDouble("total_search_fees", 0.0);
        st.total_inspection_fees = s->getDouble("total_inspection_fees", 0.0);
    }

    SCOUT_LOG_INFO("scheduler: loaded %d entries, skipped %d, retired %d", report.loaded, report.skipped,
                   report.retired);
    return report;
}

void SearchScheduler::writeConsumerSnapshot(int consumer_id, WireWriter& w) const {
    const auto recs = records(consumer_id);
    const auto lists = listings(consumer_id);
    w.writeI32(consumer_id);
    w.writeU32(static_cast<std::uint32_t>(recs.size()));
    for (const SearchRecord* r : recs) r->writeWire(w);
    w.writeU32(static_cast<std::uint32_t>(lists.size()));
    for (const Listing* l : lists) l->writeWire(w);
}

ConsumerSnapshot SearchScheduler::readConsumerSnapshot(WireReader& r) {
    ConsumerSnapshot snap;
    snap.consumer_id = r.readI32();

    const std::uint32_t nrec = r.readU32();
    if (nrec > kMaxSnapshotEntries) return snap;
    snap.records.reserve(nrec);
    for (std::uint32_t i = 0; i < nrec && !r.failed(); ++i) {
        snap.records.push_back(SearchRecord::readWire(r));
    }

    const std::uint32_t nlist = r.readU32();
    if (nlist > kMaxSnapshotEntries) return snap;
    snap.listings.reserve(nlist);
    for (std::uint32_t i = 0; i < nlist && !r.failed(); ++i) {
        snap.listings.push_back(Listing::readWire(r));
    }

    snap.ok = !r.failed();
    return snap;
}

std::uint32_t SearchScheduler::stateDigest() const {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_u32(h, next_id_);
    h = fnv1a32_add_i64(h, last_processed_day_);
    h = fnv1a32_add_i64(h, last_hour_);
    for (const auto& kv : records_) {
        h = kv.second.digest(h);
    }
    for (const auto& kv : active_by_consumer_) {
        h = fnv1a32_add_i32(h, kv.first);
        for (std::uint32_t id : kv.second) h = fnv1a32_add_u32(h, id);
    }
    for (const auto& kv : listings_) {
        const Listing& l = kv.second;
        h = fnv1a32_add_u32(h, l.id);
        h = fnv1a32_add_u32(h, l.search_id);
        h = fnv1a32_add_i32(h, l.consumer_id);
        h = fnv1a32_add_str(h, l.item.catalog_key);
        h = fnv1a32_add_str(h, l.item.display_name);
        h = fnv1a32_add_i32(h, l.tier_id);
        h = fnv1a32_add_i32(h, l.quality_id);
        h = fnv1a32_add_f64(h, l.base_price);
        h = fnv1a32_add_f64(h, l.price);
        h = fnv1a32_add_f64(h, l.condition);
        for (const auto& c : l.configs) {
            h = fnv1a32_add_str(h, c.first);
            h = fnv1a32_add_i32(h, c.second);
        }
        h = fnv1a32_add_i32(h, l.expiry_units);
        h = fnv1a32_add_u32(h, static_cast<std::uint32_t>(l.status));
        h = fnv1a32_add_u32(h, static_cast<std::uint32_t>(l.inspection));
        h = fnv1a32_add_i32(h, l.inspection_tier_id);
        h = fnv1a32_add_f64(h, l.inspection_cost);
        h = fnv1a32_add_i64(h, l.inspection_requested_at);
        h = fnv1a32_add_i64(h, l.inspection_completes_at);
    }
    for (const auto& kv : stats_) {
        const ConsumerStats& st = kv.second;
        h = fnv1a32_add_i32(h, kv.first);
        h = fnv1a32_add_i32(h, st.searches_started);
        h = fnv1a32_add_i32(h, st.searches_succeeded);
        h = fnv1a32_add_i32(h, st.searches_failed);
        h = fnv1a32_add_i32(h, st.searches_cancelled);
        h = fnv1a32_add_i32(h, st.listings_purchased);
        h = fnv1a32_add_i32(h, st.listings_declined);
        h = fnv1a32_add_i32(h, st.listings_expired);
        h = fnv1a32_add_i32(h, st.inspections_purchased);
        h = fnv1a32_add_f64(h, st.total_search_fees);
        h = fnv1a32_add_f64(h, st.total_inspection_fees);
    }
    return h;
}

int SearchScheduler::exportConfigText(char* buf, int cap) const {
    if (!buf || cap <= 0) return 0;

    int n = 0;
    auto app = [&](const char* fmt, auto... args) {
        if (n >= cap) return;
        const int w = std::snprintf(buf + n, (size_t)(cap - n), fmt, args...);
        if (w > 0) n += std::min(w, cap - n);
    };

    app("SchedulerConfigV1\n");
    app("  version_u32=%u\n", config_.version_u32);
    app("  size_bytes_u32=%u\n", config_.size_bytes_u32);
    app("  units_per_day_i32=%d\n", config_.units_per_day_i32);
    app("  listing_lifetime_units_i32=%d\n", config_.listing_lifetime_units_i32);
    app("  authoritative_u32=%u\n", config_.authoritative_u32);
    app("  fnv_hash_u32=0x%08X\n", config_.fnv_hash_u32);

    app("TierCatalog\n");
    for (const auto& t : catalog_.tiers()) {
        app("  tier %d %s fee=%.4f dur=[%d,%d] success=%.2f match=%.2f\n", t.id, t.name.c_str(), t.fee_fraction,
            t.min_duration, t.max_duration, t.base_success, t.match_chance);
    }
    for (const auto& q : catalog_.qualities()) {
        app("  quality %d %s cond=[%.2f,%.2f) mult=%.2f mod=%+.2f\n", q.id, q.name.c_str(), q.min_condition,
            q.max_condition, q.price_multiplier, q.success_modifier);
    }
    app("  fnv_hash_u32=0x%08X\n", catalog_.fnvHash());

    if (n >= cap) n = cap - 1;
    buf[n] = '\0';
    return n;
}

} // namespace scout
