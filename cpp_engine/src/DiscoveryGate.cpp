#include "DiscoveryGate.h"
#include "Digest.h"
#include "Log.h"

#include <algorithm>
#include <cstdio>
#include <utility>

namespace scout {

namespace {

const char* kGateSection = "gate";
const char* kGateStreamSection = "gate_stream";

constexpr std::uint32_t kMaxSyncEntries = 100000u;

std::uint32_t hashGateConfig(const GateConfigV1& c) {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_u32(h, c.version_u32);
    h = fnv1a32_add_u32(h, c.size_bytes_u32);
    h = fnv1a32_add_f64(h, c.base_chance);
    h = fnv1a32_add_i32(h, c.pity_threshold_i32);
    h = fnv1a32_add_i32(h, c.required_usage_i32);
    h = fnv1a32_add_i32(h, c.required_rating_i32);
    h = fnv1a32_add_f64(h, c.ceiling_threshold);
    h = fnv1a32_add_f64(h, c.list_price);
    h = fnv1a32_add_f64(h, c.premium_price);
    h = fnv1a32_add_i64(h, c.window_units_i64);
    h = fnv1a32_add_i32(h, c.units_per_day_i32);
    return h;
}

} // namespace

const char* toString(QualifyingEventKind kind) {
    switch (kind) {
    case QualifyingEventKind::Purchase: return "purchase";
    case QualifyingEventKind::Lease:    return "lease";
    case QualifyingEventKind::Finance:  return "finance";
    case QualifyingEventKind::Sale:     return "sale";
    }
    return "unknown";
}

DiscoveryGate::DiscoveryGate(const GateConfigV1& config,
                             std::string catalog_key,
                             const ConsumerProfileSource& profiles,
                             const RatingSource* rating,
                             Ledger& ledger,
                             Acquisition& acquisition,
                             RandomSource& rng,
                             bool authoritative)
    : config_(config),
      catalog_key_(std::move(catalog_key)),
      profiles_(profiles),
      rating_(rating),
      ledger_(ledger),
      acquisition_(acquisition),
      rng_(rng),
      authoritative_(authoritative) {
    if (config_.units_per_day_i32 <= 0) config_.units_per_day_i32 = 24;
    config_.size_bytes_u32 = sizeof(GateConfigV1);
    config_.fnv_hash_u32 = hashGateConfig(config_);
}

PrerequisiteCheck DiscoveryGate::evaluate(int consumer_id, const GateState* st) const {
    PrerequisiteCheck c;

    if (st && (st->discovered || st->purchased)) {
        c.reason = st->opportunity_active ? gate_reason::kOpportunityActive : gate_reason::kAlreadyDiscovered;
        return c;
    }

    const int uses = profiles_.usageCount(consumer_id);
    if (uses < config_.required_usage_i32) {
        c.reason = gate_reason::kUsage;
        c.detail = uses;
        return c;
    }

    const int score = ratingOrNeutral(rating_, consumer_id);
    if (score < config_.required_rating_i32) {
        c.reason = gate_reason::kRating;
        c.detail = score;
        return c;
    }

    const std::vector<double> ceilings = profiles_.resourceCeilings(consumer_id);
    const bool degraded = std::any_of(ceilings.begin(), ceilings.end(),
                                      [&](double v) { return v < config_.ceiling_threshold; });
    if (!degraded) {
        c.reason = gate_reason::kNoDegradedResource;
        return c;
    }

    c.eligible = true;
    c.reason = gate_reason::kEligible;
    return c;
}

PrerequisiteCheck DiscoveryGate::checkPrerequisites(int consumer_id) {
    const auto it = states_.find(consumer_id);
    if (it == states_.end()) return evaluate(consumer_id, nullptr);
    it->second.last_check = evaluate(consumer_id, &it->second);
    return it->second.last_check;
}

bool DiscoveryGate::onQualifyingEvent(int consumer_id, QualifyingEventKind kind, std::int64_t now) {
    if (!authoritative_) return false;
    const PrerequisiteCheck check = checkPrerequisites(consumer_id);
    if (!check.eligible) return false;

    GateState& st = states_[consumer_id];
    st.last_check = check;
    st.eligible_events += 1;

    const bool pity = st.eligible_events >= config_.pity_threshold_i32;
    const double threshold = pity ? 1.0 : config_.base_chance;
    const double roll = rng_.nextUnit();

    SCOUT_LOG_DEBUG("gate: consumer %d %s event #%d roll=%.3f threshold=%.2f%s", consumer_id, toString(kind),
                    st.eligible_events, roll, threshold, pity ? " (pity)" : "");

    if (roll > threshold) return false;

    st.discovered = true;
    st.opportunity_active = true;
    st.opportunity_expiry = now + config_.window_units_i64;
    SCOUT_LOG_INFO("gate: consumer %d discovered premium offer after %d eligible events%s, expires at %lld",
                   consumer_id, st.eligible_events, pity ? " (pity)" : "",
                   static_cast<long long>(st.opportunity_expiry));
    return true;
}

ResultCode DiscoveryGate::accept(int consumer_id) {
    if (!authoritative_) return ResultCode::NotAuthoritative;
    auto it = states_.find(consumer_id);
    if (it == states_.end() || !it->second.opportunity_active) return ResultCode::NoOpportunity;
    GateState& st = it->second;

    const ResultCode charged = ledger_.charge(consumer_id, config_.premium_price);
    if (charged != ResultCode::Ok) return charged;

    const ResultCode spawned = acquisition_.materialize(catalog_key_, consumer_id);
    if (spawned != ResultCode::Ok) {
        ledger_.credit(consumer_id, config_.premium_price);
        SCOUT_LOG_WARN("gate: acquisition for consumer %d failed (%s); refunded %.0f", consumer_id,
                       toString(spawned), config_.premium_price);
        return ResultCode::SpawnFailure;
    }

    st.purchased = true;
    st.opportunity_active = false;
    st.opportunity_expiry = 0;
    SCOUT_LOG_INFO("gate: consumer %d accepted premium offer for %.0f", consumer_id, config_.premium_price);
    return ResultCode::Ok;
}

ResultCode DiscoveryGate::decline(int consumer_id) {
    if (!authoritative_) return ResultCode::NotAuthoritative;
    const auto it = states_.find(consumer_id);
    if (it == states_.end() || !it->second.opportunity_active) return ResultCode::NoOpportunity;
    SCOUT_LOG_INFO("gate: consumer %d declined for now; offer stays open", consumer_id);
    return ResultCode::Ok;
}

int DiscoveryGate::expireCheck(std::int64_t now) {
    if (!authoritative_) return 0;
    int closed = 0;
    for (auto& kv : states_) {
        GateState& st = kv.second;
        if (!st.opportunity_active || now < st.opportunity_expiry) continue;
        st.opportunity_active = false;
        st.opportunity_expiry = 0;
        ++closed;
        SCOUT_LOG_INFO("gate: offer for consumer %d expired", kv.first);
    }
    return closed;
}

GateStatus DiscoveryGate::status(int consumer_id, std::int64_t now) const {
    GateStatus s;
    s.price = config_.premium_price;
    s.list_price = config_.list_price;
    const auto it = states_.find(consumer_id);
    if (it == states_.end()) {
        s.prerequisites = evaluate(consumer_id, nullptr);
        return s;
    }

    const GateState& st = it->second;
    s.discovered = st.discovered;
    s.purchased = st.purchased;
    s.opportunity_active = st.opportunity_active;
    s.eligible_events = st.eligible_events;
    s.prerequisites = st.last_check;
    if (st.opportunity_active) {
        const std::int64_t left = std::max<std::int64_t>(0, st.opportunity_expiry - now);
        const std::int64_t upd = config_.units_per_day_i32;
        s.days_remaining = static_cast<int>((left + upd - 1) / upd);
    }
    return s;
}

const GateState* DiscoveryGate::find(int consumer_id) const {
    const auto it = states_.find(consumer_id);
    return (it == states_.end()) ? nullptr : &it->second;
}

void DiscoveryGate::resetConsumer(int consumer_id) {
    states_.erase(consumer_id);
    SCOUT_LOG_INFO("gate: consumer %d reset", consumer_id);
}

void DiscoveryGate::save(AttributeDocument& doc) const {
    std::uint32_t stream = 0;
    if (rng_.saveState(stream)) doc.addSection(kGateStreamSection).setInt("rng_state", stream);
    for (const auto& kv : states_) {
        const GateState& st = kv.second;
        AttributeSection& s = doc.addSection(kGateSection);
        s.setInt("consumer_id", kv.first);
        s.setBool("discovered", st.discovered);
        s.setBool("purchased", st.purchased);
        s.setBool("opportunity_active", st.opportunity_active);
        s.setInt("opportunity_expiry", st.opportunity_expiry);
        s.setInt("eligible_events", st.eligible_events);
    }
}

LoadReport DiscoveryGate::load(const AttributeDocument& doc) {
    LoadReport report;
    states_.clear();
    const auto streams = doc.sectionsNamed(kGateStreamSection);
    if (!streams.empty()) {
        const std::int64_t stream = streams.front()->getInt("rng_state", -1);
        if (stream > 0 && stream <= static_cast<std::int64_t>(UINT32_MAX) &&
            !rng_.loadState(static_cast<std::uint32_t>(stream))) {
            SCOUT_LOG_WARN("gate: random source cannot resume; continuing from its current position");
        }
    }
    for (const AttributeSection* s : doc.sectionsNamed(kGateSection)) {
        if (!s->has("consumer_id")) {
            SCOUT_LOG_WARN("gate: skipping entry without consumer_id");
            report.skipped += 1;
            continue;
        }
        GateState st;
        st.discovered = s->getBool("discovered", false);
        st.purchased = s->getBool("purchased", false);
        st.opportunity_active = s->getBool("opportunity_active", false);
        st.opportunity_expiry = s->getInt("opportunity_expiry", 0);
        st.eligible_events = static_cast<std::int32_t>(s->getInt("eligible_events", 0));
        // An active offer always carries the discovered flag.
        if (st.opportunity_active) st.discovered = true;
        states_[static_cast<int>(s->getInt("consumer_id", 0))] = st;
        report.loaded += 1;
    }
    return report;
}

void DiscoveryGate::writeSync(WireWriter& w) const {
    w.writeU32(static_cast<std::uint32_t>(states_.size()));
    for (const auto& kv : states_) {
        w.writeI32(kv.first);
        w.writeBool(kv.second.discovered);
        w.writeBool(kv.second.purchased);
    }
}

bool DiscoveryGate::readSync(WireReader& r) {
    const std::uint32_t n = r.readU32();
    if (r.failed() || n > kMaxSyncEntries) return false;
    std::map<int, std::pair<bool, bool>> incoming;
    for (std::uint32_t i = 0; i < n; ++i) {
        const int consumer = r.readI32();
        const bool discovered = r.readBool();
        const bool purchased = r.readBool();
        if (r.failed()) return false;
        incoming[consumer] = {discovered, purchased};
    }
    for (const auto& kv : incoming) {
        GateState& st = states_[kv.first];
        st.discovered = kv.second.first;
        st.purchased = kv.second.second;
    }
    return true;
}

std::uint32_t DiscoveryGate::stateDigest() const {
    std::uint32_t h = fnv1a32_begin();
    for (const auto& kv : states_) {
        const GateState& st = kv.second;
        h = fnv1a32_add_i32(h, kv.first);
        h = fnv1a32_add_u32(h, st.discovered ? 1u : 0u);
        h = fnv1a32_add_u32(h, st.purchased ? 1u : 0u);
        h = fnv1a32_add_u32(h, st.opportunity_active ? 1u : 0u);
        h = fnv1a32_add_i64(h, st.opportunity_expiry);
        h = fnv1a32_add_i32(h, st.eligible_events);
    }
    return h;
}

int DiscoveryGate::exportConfigText(char* buf, int cap) const {
    if (!buf || cap <= 0) return 0;

    int n = 0;
    auto app = [&](const char* fmt, auto... args) {
        if (n >= cap) return;
        const int w = std::snprintf(buf + n, (size_t)(cap - n), fmt, args...);
        if (w > 0) n += std::min(w, cap - n);
    };

    app("GateConfigV1\n");
    app("  version_u32=%u\n", config_.version_u32);
    app("  size_bytes_u32=%u\n", config_.size_bytes_u32);
    app("  base_chance=%.4f\n", config_.base_chance);
    app("  pity_threshold_i32=%d\n", config_.pity_threshold_i32);
    app("  required_usage_i32=%d\n", config_.required_usage_i32);
    app("  required_rating_i32=%d\n", config_.required_rating_i32);
    app("  ceiling_threshold=%.4f\n", config_.ceiling_threshold);
    app("  list_price=%.2f\n", config_.list_price);
    app("  premium_price=%.2f\n", config_.premium_price);
    app("  window_units_i64=%lld\n", static_cast<long long>(config_.window_units_i64));
    app("  catalog_key=%s\n", catalog_key_.c_str());
    app("  fnv_hash_u32=0x%08X\n", config_.fnv_hash_u32);

    if (n >= cap) n = cap - 1;
    buf[n] = '\0';
    return n;
}

} // namespace scout
