#include "SearchRecord.h"
#include "Digest.h"

#include <cstdint>
#include <utility>

namespace scout {

namespace {

const char* kConfigPrefix = "config.";
const char* kMatchedPrefix = "matched.";

void writeSelection(AttributeSection& s, const char* prefix, const ConfigSelection& sel) {
    for (const auto& kv : sel) {
        s.setInt(std::string(prefix) + kv.first, kv.second);
    }
}

ConfigSelection readSelection(const AttributeSection& s, const std::string& prefix) {
    ConfigSelection sel;
    for (const auto& kv : s.values) {
        if (kv.first.compare(0, prefix.size(), prefix) != 0 || kv.first.size() == prefix.size()) continue;
        sel[kv.first.substr(prefix.size())] =
            static_cast<int>(s.getInt(kv.first, kUnmatchedOption));
    }
    return sel;
}

void writeSelectionWire(WireWriter& w, const ConfigSelection& sel) {
    w.writeU32(static_cast<std::uint32_t>(sel.size()));
    for (const auto& kv : sel) {
        w.writeString(kv.first);
        w.writeI32(kv.second);
    }
}

ConfigSelection readSelectionWire(WireReader& r) {
    ConfigSelection sel;
    const std::uint32_t n = r.readU32();
    for (std::uint32_t i = 0; i < n && !r.failed(); ++i) {
        std::string key = r.readString();
        const std::int32_t v = r.readI32();
        if (!r.failed()) sel[key] = v;
    }
    return sel;
}

} // namespace

const char* toString(SearchStatus status) {
    switch (status) {
    case SearchStatus::Active:    return "active";
    case SearchStatus::Success:   return "success";
    case SearchStatus::Failed:    return "failed";
    case SearchStatus::Cancelled: return "cancelled";
    case SearchStatus::Completed: return "completed";
    }
    return "active";
}

bool parseSearchStatus(const std::string& text, SearchStatus& out) {
    if (text == "active")    { out = SearchStatus::Active;    return true; }
    if (text == "success")   { out = SearchStatus::Success;   return true; }
    if (text == "failed")    { out = SearchStatus::Failed;    return true; }
    if (text == "cancelled") { out = SearchStatus::Cancelled; return true; }
    if (text == "completed") { out = SearchStatus::Completed; return true; }
    return false;
}

ResultCode SearchRecord::create(std::uint32_t id,
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
                                SearchRecord& out) {
    const ResolveResult rr =
        resolveOutcome(catalog, tier_id, quality_id, base_price, credit_modifier, requested, rng);
    if (!rr.ok()) return rr.code;

    SearchRecord r;
    r.id_ = id;
    r.consumer_id_ = consumer_id;
    r.item_ = item;
    r.base_price_ = base_price;
    r.tier_id_ = tier_id;
    r.quality_id_ = quality_id;
    r.requested_ = requested;
    r.cost_ = rr.outcome.cost;
    r.ttl_ = rr.outcome.duration;
    r.tts_ = rr.outcome.tts;
    r.status_ = SearchStatus::Active;
    r.created_at_ = created_at;
    r.found_condition_ = rr.outcome.condition;
    r.found_price_ = rr.outcome.price;
    r.found_configs_ = rr.outcome.matched_configs;
    out = std::move(r);
    return ResultCode::Ok;
}

void SearchRecord::advance(int delta_units) {
    ttl_ -= delta_units;
    tts_ -= delta_units;
}

CompletionCheck SearchRecord::checkCompletion() const {
    if (status_ != SearchStatus::Active) return CompletionCheck::None;
    if (tts_ <= 0) return CompletionCheck::Success;
    if (ttl_ <= 0) return CompletionCheck::Failed;
    return CompletionCheck::None;
}

void SearchRecord::cancel() {
    if (status_ == SearchStatus::Active || status_ == SearchStatus::Cancelled) {
        status_ = SearchStatus::Cancelled;
    }
}

void SearchRecord::markSuccess() { status_ = SearchStatus::Success; }

void SearchRecord::markFailed() {
    status_ = SearchStatus::Failed;
    found_condition_ = 0.0;
    found_price_ = 0.0;
    found_configs_.clear();
}

void SearchRecord::markCompleted() { status_ = SearchStatus::Completed; }

bool SearchRecord::hasFoundItem() const {
    return status_ == SearchStatus::Success || status_ == SearchStatus::Completed;
}

void SearchRecord::writeAttributes(AttributeSection& s) const {
    s.setInt("id", id_);
    s.setInt("consumer_id", consumer_id_);
    s.set("catalog_key", item_.catalog_key);
    s.set("display_name", item_.display_name);
    s.setDouble("base_price", base_price_);
    s.setInt("tier_id", tier_id_);
    s.setInt("quality_id", quality_id_);
    s.setDouble("cost", cost_);
    s.setInt("ttl", ttl_);
    s.setInt("tts", tts_);
    s.set("status", toString(status_));
    s.setInt("created_at", created_at_);
    s.setDouble("found_condition", found_condition_);
    s.setDouble("found_price", found_price_);
    writeSelection(s, kConfigPrefix, requested_);
    writeSelection(s, kMatchedPrefix, found_configs_);
}

ResultCode SearchRecord::readAttributes(const AttributeSection& s, SearchRecord& out) {
    const std::int64_t id = s.getInt("id", -1);
    if (id <= 0 || id > static_cast<std::int64_t>(UINT32_MAX)) return ResultCode::CorruptRecord;

    SearchRecord r;
    r.id_ = static_cast<std::uint32_t>(id);
    r.consumer_id_ = static_cast<int>(s.getInt("consumer_id", 0));
    r.item_.catalog_key = s.get("catalog_key");
    r.item_.display_name = s.get("display_name");
    r.base_price_ = s.getDouble("base_price", 0.0);
    r.tier_id_ = static_cast<int>(s.getInt("tier_id", 1));
    r.quality_id_ = static_cast<int>(s.getInt("quality_id", 1));
    r.cost_ = s.getDouble("cost", 0.0);
    r.ttl_ = static_cast<int>(s.getInt("ttl", 0));
    r.tts_ = static_cast<int>(s.getInt("tts", 0));
    if (!parseSearchStatus(s.get("status", "active"), r.status_)) r.status_ = SearchStatus::Active;
    r.created_at_ = s.getInt("created_at", 0);
    r.found_condition_ = s.getDouble("found_condition", 0.0);
    r.found_price_ = s.getDouble("found_price", 0.0);
    r.requested_ = readSelection(s, kConfigPrefix);
    r.found_configs_ = readSelection(s, kMatchedPrefix);
    out = std::move(r);
    return ResultCode::Ok;
}

void SearchRecord::writeWire(WireWriter& w) const {
    w.writeU32(id_);
    w.writeI32(consumer_id_);
    w.writeString(item_.catalog_key);
    w.writeString(item_.display_name);
    w.writeF64(base_price_);
    w.writeI32(tier_id_);
    w.writeI32(quality_id_);
    w.writeF64(cost_);
    w.writeI32(ttl_);
    w.writeI32(tts_);
    w.writeU8(static_cast<std::uint8_t>(status_));
    w.writeI64(created_at_);
    w.writeF64(found_condition_);
    w.writeF64(found_price_);
    writeSelectionWire(w, requested_);
    writeSelectionWire(w, found_configs_);
}

SearchRecord SearchRecord::readWire(WireReader& r) {
    SearchRecord s;
    s.id_ = r.readU32();
    s.consumer_id_ = r.readI32();
    s.item_.catalog_key = r.readString();
    s.item_.display_name = r.readString();
    s.base_price_ = r.readF64();
    s.tier_id_ = r.readI32();
    s.quality_id_ = r.readI32();
    s.cost_ = r.readF64();
    s.ttl_ = r.readI32();
    s.tts_ = r.readI32();
    const std::uint8_t st = r.readU8();
    s.status_ = (st <= static_cast<std::uint8_t>(SearchStatus::Completed)) ? static_cast<SearchStatus>(st)
                                                                          : SearchStatus::Active;
    s.created_at_ = r.readI64();
    s.found_condition_ = r.readF64();
    s.found_price_ = r.readF64();
    s.requested_ = readSelectionWire(r);
    s.found_configs_ = readSelectionWire(r);
    return s;
}

std::uint32_t SearchRecord::digest(std::uint32_t h) const {
    h = fnv1a32_add_u32(h, id_);
    h = fnv1a32_add_i32(h, consumer_id_);
    h = fnv1a32_add_str(h, item_.catalog_key);
    h = fnv1a32_add_str(h, item_.display_name);
    h = fnv1a32_add_f64(h, base_price_);
    h = fnv1a32_add_i32(h, tier_id_);
    h = fnv1a32_add_i32(h, quality_id_);
    h = fnv1a32_add_f64(h, cost_);
    h = fnv1a32_add_i32(h, ttl_);
    h = fnv1a32_add_i32(h, tts_);
    h = fnv1a32_add_u32(h, static_cast<std::uint32_t>(status_));
    h = fnv1a32_add_i64(h, created_at_);
    h = fnv1a32_add_f64(h, found_condition_);
    h = fnv1a32_add_f64(h, found_price_);
    for (const auto& kv : requested_) {
        h = fnv1a32_add_str(h, kv.first);
        h = fnv1a32_add_i32(h, kv.second);
    }
    for (const auto& kv : found_configs_) {
        h = fnv1a32_add_str(h, kv.first);
        h = fnv1a32_add_i32(h, kv.second);
    }
    return h;
}

bool SearchRecord::operator==(const SearchRecord& o) const {
    return id_ == o.id_ && consumer_id_ == o.consumer_id_ && item_.catalog_key == o.item_.catalog_key &&
           item_.display_name == o.item_.display_name && base_price_ == o.base_price_ &&
           tier_id_ == o.tier_id_ && quality_id_ == o.quality_id_ && requested_ == o.requested_ &&
           cost_ == o.cost_ && ttl_ == o.ttl_ && tts_ == o.tts_ && status_ == o.status_ &&
           created_at_ == o.created_at_ && found_condition_ == o.found_condition_ &&
           found_price_ == o.found_price_ && found_configs_ == o.found_configs_;
}

} // namespace scout
