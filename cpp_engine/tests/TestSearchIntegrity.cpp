#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "OutcomeMonteCarlo.h"
#include "OutcomeResolver.h"
#include "RecordCodec.h"
#include "Rng.h"
#include "SearchRecord.h"
#include "TierBalanceAnalysis.h"
#include "TierCatalog.h"

namespace {

// Always-on requirement: never compiled out in Release.
#define REQUIRE(cond, msg)                                                      \
    do {                                                                        \
        if (!(cond)) {                                                          \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg \
                      << "\n";                                                  \
            std::exit(1);                                                       \
        }                                                                       \
    } while (0)

static inline void REQUIRE_NEAR(double a, double b, double tol, const char* name) {
    if (!std::isfinite(a) || !std::isfinite(b) || std::fabs(a - b) > tol) {
        std::cerr << "[FAIL] " << name << ": " << a << " vs " << b << " (tol " << tol << ")\n";
        std::exit(1);
    }
}

// Replays a fixed list of unit draws, then a constant.
class ScriptedRandom final : public scout::RandomSource {
public:
    explicit ScriptedRandom(std::vector<double> values, double fallback = 0.5)
        : values_(std::move(values)), fallback_(fallback) {}

    double nextUnit() override {
        ++draws_;
        if (idx_ < values_.size()) return values_[idx_++];
        return fallback_;
    }

    int draws() const { return draws_; }

private:
    std::vector<double> values_;
    std::size_t idx_ = 0;
    double fallback_;
    int draws_ = 0;
};

const scout::TierCatalog& catalog() {
    static const scout::TierCatalog c = scout::TierCatalog::defaults();
    return c;
}

// Regional (24..48) + Fair, two requested configurations.
std::vector<double> regionalSuccessScript() {
    return {0.5,  // duration -> 36
            0.0,  // warm-up
            0.1,  // success roll
            0.0,  // tts -> 18
            0.0,  // warm-up
            0.5,  // condition -> 0.5
            0.5,  // price variance -> 1.0
            0.0, 0.1,   // "a": match
            0.0, 0.9};  // "b": miss
}

scout::SearchRecord makeRecord(std::vector<double> script,
                               int tier_id,
                               int quality_id,
                               const scout::ConfigSelection& requested) {
    ScriptedRandom rng(std::move(script));
    scout::SearchRecord rec;
    const scout::ResultCode rc = scout::SearchRecord::create(
        7u, 3, {"tractor_small", "Small Tractor"}, 100000.0, tier_id, quality_id, requested, 0.0, 48, catalog(), rng,
        rec);
    REQUIRE(rc == scout::ResultCode::Ok, "record create failed");
    return rec;
}

} // namespace

// =======================
// Step 1: TierCatalog
// =======================

static void runCatalogDefaults_1A() {
    const auto& c = catalog();
    REQUIRE(c.tiers().size() == 3, "expected three search tiers");
    REQUIRE(c.qualities().size() == 5, "expected five quality tiers");
    REQUIRE(c.inspections().size() == 3, "expected three inspection tiers");

    const auto* local = c.findTier(1);
    const auto* national = c.findTier(3);
    REQUIRE(local && national, "tier lookup");
    REQUIRE(local->min_duration == 24 && local->max_duration == 24, "local duration is one day");
    REQUIRE(national->min_duration == 48 && national->max_duration == 96, "national duration 2..4 days");
    REQUIRE(national->premium_agent && !local->premium_agent, "premium agent flag");

    REQUIRE(c.findTier(0) == nullptr, "unknown tier id must be null");
    REQUIRE(c.findTier(4) == nullptr, "unknown tier id must be null");
    REQUIRE(c.findQuality(6) == nullptr, "unknown quality id must be null");
    REQUIRE(c.findInspection(-1) == nullptr, "unknown inspection id must be null");

    std::cout << "[PASS] 1A catalog defaults + unknown-id lookups\n";
}

static void runCreditBands_1B() {
    const auto& c = catalog();
    REQUIRE(c.creditModifierForScore(820) == -0.15, "score 820");
    REQUIRE(c.creditModifierForScore(750) == -0.15, "score 750 boundary");
    REQUIRE(c.creditModifierForScore(749) == -0.08, "score 749");
    REQUIRE(c.creditModifierForScore(700) == -0.08, "score 700 boundary");
    REQUIRE(c.creditModifierForScore(650) == 0.0, "neutral score 650");
    REQUIRE(c.creditModifierForScore(610) == 0.10, "score 610");
    REQUIRE(c.creditModifierForScore(420) == 0.20, "score 420");
    REQUIRE(c.creditModifierForScore(100) == 0.20, "score below every band");
    std::cout << "[PASS] 1B credit fee bands\n";
}

static void runSuccessClamp_1C() {
    scout::TierCatalog c;
    c.addTier({1, "Certain", 0.05, 24, 24, 0.99, 1.0, false});
    c.addTier({2, "Hopeless", 0.05, 24, 24, 0.01, 0.0, false});
    c.addQuality({1, "Easy", 0.1, 0.2, 1.0, 0.5});
    c.addQuality({2, "Hard", 0.1, 0.2, 1.0, -0.5});

    REQUIRE(scout::effectiveSuccessProbability(*c.findTier(1), *c.findQuality(1)) == scout::kMaxSuccessProbability,
            "upper clamp");
    REQUIRE(scout::effectiveSuccessProbability(*c.findTier(2), *c.findQuality(2)) == scout::kMinSuccessProbability,
            "lower clamp");

    for (const auto& t : catalog().tiers()) {
        for (const auto& q : catalog().qualities()) {
            const double p = scout::effectiveSuccessProbability(t, q);
            REQUIRE(p >= 0.05 && p <= 0.95, "effective probability outside [0.05,0.95]");
        }
    }
    REQUIRE_NEAR(scout::effectiveSuccessProbability(*catalog().findTier(3), *catalog().findQuality(1)), 0.95, 1e-12,
                 "national+poor clamps to 0.95");

    // Replacing an entry keeps the id unique.
    c.addTier({1, "Certain v2", 0.05, 24, 24, 0.50, 1.0, false});
    REQUIRE(c.tiers().size() == 2 && c.findTier(1)->name == "Certain v2", "addTier replaces by id");

    std::cout << "[PASS] 1C success probability clamped for extreme modifiers\n";
}

static void runSearchCost_1D() {
    const auto& local = *catalog().findTier(1);
    REQUIRE(scout::computeSearchCost(local, 10000.0, 0.0) == 400.0, "fee 0.04 of 10000 must be 400");
    REQUIRE(scout::computeSearchCost(local, 10000.0, -0.15) == 340.0, "discounted fee");
    REQUIRE(scout::computeSearchCost(local, 12345.0, 0.0) == std::floor(12345.0 * 0.04), "fee floors");
    REQUIRE(scout::computeSearchCost(local, -5.0, 0.0) == 0.0, "negative base price costs nothing");

    const auto* quick = catalog().findInspection(1);
    const auto* full = catalog().findInspection(3);
    REQUIRE(scout::inspectionCost(*quick, 50000.0) == 2000.0, "quick inspection 1000 + 2%");
    REQUIRE(scout::inspectionCost(*quick, 500000.0) == 2500.0, "quick inspection capped");
    REQUIRE(scout::inspectionCost(*full, 100000.0) == 9000.0, "comprehensive 4000 + 5%");
    std::cout << "[PASS] 1D search and inspection cost formulas\n";
}

// =======================
// Step 2: OutcomeResolver
// =======================

static void runResolverScriptedSuccess_2A() {
    ScriptedRandom rng(regionalSuccessScript());
    const scout::ConfigSelection req{{"a", 2}, {"b", 5}};
    const auto r = scout::resolveOutcome(catalog(), 2, 3, 100000.0, 0.0, req, rng);

    REQUIRE(r.ok(), "resolve ok");
    REQUIRE(rng.draws() == 11, "draw count for success with two configurations");
    REQUIRE(r.outcome.duration == 36, "duration draw");
    REQUIRE(r.outcome.success, "roll 0.1 <= 0.55 must succeed");
    REQUIRE(r.outcome.tts == 18, "tts starts at floor(duration/2)");
    REQUIRE_NEAR(r.outcome.condition, 0.5, 1e-12, "condition");
    REQUIRE(r.outcome.price >= 39999.0 && r.outcome.price <= 40000.0, "price = base*mult*cond/max*variance");
    REQUIRE(r.outcome.matched_configs.at("a") == 2, "matched configuration keeps requested option");
    REQUIRE(r.outcome.matched_configs.at("b") == scout::kUnmatchedOption, "missed configuration is unmatched");
    std::cout << "[PASS] 2A scripted success: draw order + derived values\n";
}

static void runResolverScriptedFailure_2B() {
    ScriptedRandom rng({0.5, 0.0, 0.99});
    const auto r = scout::resolveOutcome(catalog(), 2, 3, 100000.0, 0.0, {{"a", 2}}, rng);
    REQUIRE(r.ok(), "resolve ok");
    REQUIRE(rng.draws() == 3, "failure stops after the success roll");
    REQUIRE(!r.outcome.success, "roll 0.99 > 0.55 must fail");
    REQUIRE(r.outcome.tts == r.outcome.duration + scout::kFailureTtsOffset, "failure tts unreachable");
    REQUIRE(r.outcome.condition == 0.0 && r.outcome.price == 0.0, "failure has no found item");
    REQUIRE(r.outcome.matched_configs.empty(), "failure has no matched configs");

    // Boundary: roll equal to the probability succeeds.
    ScriptedRandom edge({0.0, 0.0, 0.25});
    const auto e = scout::resolveOutcome(catalog(), 1, 3, 1000.0, 0.0, {}, edge);
    REQUIRE(e.ok() && e.outcome.success, "roll == probability succeeds");
    std::cout << "[PASS] 2B scripted failure + inclusive success boundary\n";
}

static void runResolverConfigurationError_2C() {
    ScriptedRandom rng({});
    REQUIRE(scout::resolveOutcome(catalog(), 9, 3, 1000.0, 0.0, {}, rng).code == scout::ResultCode::ConfigurationError,
            "bad tier");
    REQUIRE(scout::resolveOutcome(catalog(), 1, 0, 1000.0, 0.0, {}, rng).code == scout::ResultCode::ConfigurationError,
            "bad quality");
    REQUIRE(rng.draws() == 0, "configuration errors draw nothing");
    std::cout << "[PASS] 2C invalid tier/quality -> ConfigurationError\n";
}

static void runResolverInvariantSweep_2D() {
    scout::XorShiftRandom rng(0xC0FFEEu);
    const scout::ConfigSelection req{{"engine", 1}, {"tires", 3}, {"color", 0}};
    int successes = 0;
    int failures = 0;
    for (int i = 0; i < 6000; ++i) {
        const int tier_id = 1 + (i % 3);
        const int quality_id = 1 + (i % 5);
        const auto* tier = catalog().findTier(tier_id);
        const auto* q = catalog().findQuality(quality_id);
        const auto o = scout::resolve(*tier, *q, 50000.0 + 10.0 * i, 0.0, req, rng);

        REQUIRE(o.duration >= tier->min_duration && o.duration <= tier->max_duration, "duration in tier range");
        if (o.success) {
            ++successes;
            REQUIRE(o.tts >= 1 && o.tts <= o.duration, "success: 1 <= tts <= ttl");
            REQUIRE(o.tts >= o.duration / 2, "success lands in the back half");
            REQUIRE(o.condition >= q->min_condition && o.condition < q->max_condition, "condition in bracket");
            REQUIRE(o.price >= 0.0, "price non-negative");
            REQUIRE(o.matched_configs.size() == req.size(), "one match entry per request");
        } else {
            ++failures;
            REQUIRE(o.tts > o.duration, "failure: tts > ttl");
        }
    }
    REQUIRE(successes > 0 && failures > 0, "sweep should see both outcomes");
    std::cout << "[PASS] 2D resolver invariants over 6000 seeded draws\n";
}

// =======================
// Step 3: SearchRecord
// =======================

static void runRecordAdvanceAndCompletion_3A() {
    // Local: ttl 24; tts = 12 + floor(0.62 * 13) = 20.
    scout::SearchRecord rec = makeRecord({0.3, 0.0, 0.1, 0.62, 0.0, 0.5, 0.5}, 1, 3, {});
    REQUIRE(rec.ttl() == 24 && rec.tts() == 20, "ttl=24, tts=20");
    REQUIRE(rec.willSucceed(), "frozen success");

    for (int i = 0; i < 5; ++i) rec.advance(0);
    REQUIRE(rec.ttl() == 24 && rec.tts() == 20, "advance(0) is idempotent");

    scout::SearchRecord jump = rec;
    jump.advance(20);
    REQUIRE(jump.checkCompletion() == scout::CompletionCheck::Success, "advance(20) -> success");
    REQUIRE(jump.status() == scout::SearchStatus::Active, "checkCompletion does not mutate");

    rec.advance(19);
    REQUIRE(rec.checkCompletion() == scout::CompletionCheck::None, "one unit short");
    rec.advance(1);
    REQUIRE(rec.checkCompletion() == scout::CompletionCheck::Success, "stepwise success");

    // Overshoot is allowed; counters go negative.
    rec.advance(30);
    REQUIRE(rec.tts() < 0 && rec.ttl() < 0, "no clamping on advance");
    REQUIRE(rec.checkCompletion() == scout::CompletionCheck::Success, "success wins once tts fired");
    std::cout << "[PASS] 3A advance/checkCompletion (ttl=24, tts=20)\n";
}

static void runRecordFailureNeverSucceedsEarly_3B() {
    scout::SearchRecord rec = makeRecord({0.3, 0.0, 0.99}, 1, 3, {{"a", 1}});
    REQUIRE(!rec.willSucceed() && rec.tts() > rec.ttl(), "frozen failure");

    int steps = 0;
    while (rec.ttl() > 0) {
        REQUIRE(rec.checkCompletion() == scout::CompletionCheck::None, "failure must not complete early");
        rec.advance(1);
        ++steps;
    }
    REQUIRE(steps == 24, "failure after full lifetime");
    REQUIRE(rec.checkCompletion() == scout::CompletionCheck::Failed, "ttl <= 0 -> failed");
    std::cout << "[PASS] 3B failure outcome never reports success before ttl expiry\n";
}

static void runRecordCancelAndReveal_3C() {
    scout::SearchRecord rec = makeRecord(regionalSuccessScript(), 2, 3, {{"a", 2}, {"b", 5}});
    REQUIRE(!rec.hasFoundItem() && rec.foundPrice() == 0.0, "found item hidden while active");
    REQUIRE(rec.foundConfigs().empty(), "configs hidden while active");

    scout::SearchRecord done = rec;
    done.markSuccess();
    REQUIRE(done.hasFoundItem() && done.foundPrice() > 0.0, "found item visible on success");
    REQUIRE(done.foundConfigs().size() == 2, "configs visible on success");

    rec.cancel();
    rec.cancel();
    REQUIRE(rec.status() == scout::SearchStatus::Cancelled, "cancel idempotent");
    rec.advance(1000);
    REQUIRE(rec.checkCompletion() == scout::CompletionCheck::None, "cancelled records never complete");
    REQUIRE(rec.cost() > 0.0, "fee stays sunk");
    std::cout << "[PASS] 3C cancel idempotence + success-only reveal\n";
}

static void runRecordAttributeRoundTrip_3D() {
    scout::SearchRecord success = makeRecord(regionalSuccessScript(), 2, 3, {{"a", 2}, {"b", 5}});
    success.advance(24);
    success.markSuccess();

    scout::SearchRecord failed = makeRecord({0.3, 0.0, 0.99}, 1, 4, {{"a", 1}});
    failed.advance(24);
    failed.markFailed();
    REQUIRE(failed.foundPrice() == 0.0 && failed.foundCondition() == 0.0, "failed record zeroed");

    scout::AttributeDocument doc;
    success.writeAttributes(doc.addSection("search"));
    failed.writeAttributes(doc.addSection("search"));

    scout::AttributeDocument parsed;
    std::string err;
    REQUIRE(scout::AttributeDocument::parseText(doc.toText(), parsed, &err), "parse text: " << err);
    const auto sections = parsed.sectionsNamed("search");
    REQUIRE(sections.size() == 2, "two search sections");

    scout::SearchRecord a;
    scout::SearchRecord b;
    REQUIRE(scout::SearchRecord::readAttributes(*sections[0], a) == scout::ResultCode::Ok, "read success");
    REQUIRE(scout::SearchRecord::readAttributes(*sections[1], b) == scout::ResultCode::Ok, "read failed");
    REQUIRE(a == success, "success record round-trip");
    REQUIRE(b == failed, "failed record round-trip");
    REQUIRE(b.status() == scout::SearchStatus::Failed, "status preserved");
    std::cout << "[PASS] 3D attribute form round-trip (success + failed)\n";
}

static void runRecordCorruptAndDefaults_3E() {
    scout::SearchRecord out;

    scout::AttributeSection missing{"search", {}};
    missing.setInt("consumer_id", 4);
    REQUIRE(scout::SearchRecord::readAttributes(missing, out) == scout::ResultCode::CorruptRecord, "missing id");

    scout::AttributeSection garbage{"search", {}};
    garbage.set("id", "SEARCH_x");
    REQUIRE(scout::SearchRecord::readAttributes(garbage, out) == scout::ResultCode::CorruptRecord, "unparsable id");

    scout::AttributeSection minimal{"search", {}};
    minimal.setInt("id", 12);
    REQUIRE(scout::SearchRecord::readAttributes(minimal, out) == scout::ResultCode::Ok, "id alone is enough");
    REQUIRE(out.qualityId() == 1, "quality defaults to 1");
    REQUIRE(out.status() == scout::SearchStatus::Active, "status defaults to active");
    REQUIRE(out.foundPrice() == 0.0, "found price defaults to 0");
    std::cout << "[PASS] 3E corrupt identity rejected + optional field defaults\n";
}

static void runRecordWireRoundTrip_3F() {
    scout::SearchRecord rec = makeRecord(regionalSuccessScript(), 2, 3, {{"a", 2}, {"b", 5}});
    rec.advance(10);

    scout::WireWriter w;
    rec.writeWire(w);
    {
        scout::WireReader r(w.bytes());
        const scout::SearchRecord copy = scout::SearchRecord::readWire(r);
        REQUIRE(!r.failed() && r.atEnd(), "reader consumed exactly the record");
        REQUIRE(copy == rec, "wire round-trip");
    }
    {
        std::vector<std::uint8_t> cut(w.bytes().begin(), w.bytes().begin() + w.bytes().size() / 2);
        scout::WireReader r(cut);
        (void)scout::SearchRecord::readWire(r);
        REQUIRE(r.failed(), "truncated stream flagged");
    }
    std::cout << "[PASS] 3F replication form round-trip + truncation detection\n";
}

// =======================
// Step 4: Codec
// =======================

static void runDocumentText_4A() {
    scout::AttributeDocument doc;
    auto& s = doc.addSection("search");
    s.set("display_name", "Loader\nline two \\ slash = eq");
    s.setDouble("price", 0.1);
    s.setBool("flag", true);

    scout::AttributeDocument back;
    std::string err;
    REQUIRE(scout::AttributeDocument::parseText(doc.toText(), back, &err), "parse: " << err);
    const auto* t = back.sectionsNamed("search").front();
    REQUIRE(t->get("display_name") == "Loader\nline two \\ slash = eq", "escaped value round-trip");
    REQUIRE(t->getDouble("price", 0.0) == 0.1, "double is exact");
    REQUIRE(t->getBool("flag", false), "bool");
    REQUIRE(t->getInt("missing", 42) == 42, "fallback");

    // Caller-supplied names: blanks at either end, '=' inside keys, comment/header markers.
    scout::AttributeDocument odd;
    auto& o = odd.addSection("search");
    o.set("display_name", "Tractor ");
    o.set("config.a=b", "2");
    o.set(" padded key\t", "  lead and trail \t");
    o.set("#hash", "x");
    o.set("[bracket", "y");
    o.set("empty", "");
    const std::string odd_text = odd.toText();
    REQUIRE(scout::AttributeDocument::parseText(odd_text, back, &err), "parse odd: " << err);
    const auto* u = back.sectionsNamed("search").front();
    REQUIRE(u->values == o.values, "odd keys and values round-trip exactly");
    REQUIRE(u->get("display_name") == "Tractor " && u->get("config.a=b") == "2", "trailing blank and '=' key");

    // CRLF line ends do not leak into values.
    std::string crlf;
    for (char ch : odd_text) {
        if (ch == '\n') crlf += '\r';
        crlf += ch;
    }
    REQUIRE(scout::AttributeDocument::parseText(crlf, back, &err), "parse crlf: " << err);
    REQUIRE(back.sectionsNamed("search").front()->values == o.values, "CRLF round-trip");

    scout::AttributeDocument bad;
    REQUIRE(!scout::AttributeDocument::parseText("orphan=1\n", bad, &err), "attribute outside section");
    REQUIRE(!scout::AttributeDocument::parseText("[open\n", bad, &err), "malformed header");
    REQUIRE(!scout::AttributeDocument::parseText("[ok]\nnovalue\n", bad, &err), "line without '='");
    std::cout << "[PASS] 4A attribute document text form\n";
}

static void runWirePrimitives_4B() {
    scout::WireWriter w;
    w.writeU32(0xA1B2C3D4u);
    w.writeI32(-7);
    w.writeI64(-1234567890123LL);
    w.writeF64(3.25);
    w.writeBool(true);
    w.writeString("listing");
    REQUIRE(w.bytes()[0] == 0xD4, "little endian");

    scout::WireReader r(w.bytes());
    REQUIRE(r.readU32() == 0xA1B2C3D4u, "u32");
    REQUIRE(r.readI32() == -7, "i32");
    REQUIRE(r.readI64() == -1234567890123LL, "i64");
    REQUIRE(r.readF64() == 3.25, "f64");
    REQUIRE(r.readBool(), "bool");
    REQUIRE(r.readString() == "listing", "string");
    REQUIRE(!r.failed() && r.atEnd(), "clean end");
    REQUIRE(r.readU32() == 0u && r.failed(), "read past end yields zero + failed");
    std::cout << "[PASS] 4B wire primitives\n";
}

// =======================
// Step 5: Analysis
// =======================

static void runMonteCarlo_5A() {
    const auto s = scout::OutcomeMonteCarlo::summarize({1.0, 2.0, 3.0, 4.0});
    REQUIRE_NEAR(s.mean, 2.5, 1e-12, "mean");
    REQUIRE_NEAR(s.median, 2.5, 1e-12, "median");
    REQUIRE_NEAR(s.std_dev, std::sqrt(1.25), 1e-12, "std_dev");

    scout::OutcomeMonteCarlo mc;
    scout::OutcomeMonteCarlo::ScenarioConfig sc;
    sc.tier_id = 2;
    sc.quality_id = 3;
    sc.base_price = {50000.0, 150000.0};
    const auto u = mc.runMonteCarlo(sc, 8000);
    REQUIRE(u.code == scout::ResultCode::Ok, "monte carlo ok");
    REQUIRE(std::fabs(u.success_rate - 0.55) < 0.03, "regional/fair success rate near 0.55");
    REQUIRE(std::fabs(u.config_match_rate - 0.50) < 0.04, "regional match rate near 0.50");
    REQUIRE(u.found_condition.ci_lower_95 >= 0.40 && u.found_condition.ci_upper_95 < 0.60, "condition bracket");
    REQUIRE(u.duration.ci_lower_95 >= 24.0 && u.duration.ci_upper_95 <= 48.0, "duration range");

    sc.tier_id = 42;
    REQUIRE(mc.runMonteCarlo(sc, 10).code == scout::ResultCode::ConfigurationError, "bad tier");
    std::cout << "[PASS] 5A Monte Carlo summary statistics\n";
}

static void runTierBalance_5B() {
    scout::TierBalanceAnalyzer analyzer;
    scout::TierBalanceAnalyzer::ScenarioConfig sc;
    sc.trials = 500;
    analyzer.setScenario(sc);

    analyzer.analyzeQuality();
    REQUIRE(analyzer.results().size() == 15, "5 qualities x 3 tiers");
    for (const auto& row : analyzer.results()) {
        REQUIRE(row.metrics.success_rate > 0.0, "every combination can succeed");
        REQUIRE(row.metrics.fee_per_success >= row.metrics.mean_cost, "fee per success >= fee");
    }

    scout::TierBalanceAnalyzer::ParameterRange range;
    range.min = 600.0;
    range.max = 800.0;
    range.samples = 3;
    analyzer.analyzeCreditScore(range);
    REQUIRE(analyzer.results().size() == 9, "3 scores x 3 tiers");
    // Rows are score-major: [600 x tiers][700 x tiers][800 x tiers].
    REQUIRE(analyzer.results()[0].tier_id == 1 && analyzer.results()[6].tier_id == 1, "row layout");
    REQUIRE(analyzer.results()[0].metrics.mean_cost > analyzer.results()[6].metrics.mean_cost,
            "better rating pays a lower fee");
    std::cout << "[PASS] 5B tier balance sweeps\n";
}

int main() {
    // Step 1: catalog
    runCatalogDefaults_1A();
    runCreditBands_1B();
    runSuccessClamp_1C();
    runSearchCost_1D();

    // Step 2: resolver
    runResolverScriptedSuccess_2A();
    runResolverScriptedFailure_2B();
    runResolverConfigurationError_2C();
    runResolverInvariantSweep_2D();

    // Step 3: record
    runRecordAdvanceAndCompletion_3A();
    runRecordFailureNeverSucceedsEarly_3B();
    runRecordCancelAndReveal_3C();
    runRecordAttributeRoundTrip_3D();
    runRecordCorruptAndDefaults_3E();
    runRecordWireRoundTrip_3F();

    // Step 4: codec
    runDocumentText_4A();
    runWirePrimitives_4B();

    // Step 5: analysis
    runMonteCarlo_5A();
    runTierBalance_5B();

    std::cout << "[PASS] TestSearchIntegrity\n";
    return 0;
}
