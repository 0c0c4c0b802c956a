// main_vis.cpp: live dashboard over one authoritative SearchScheduler + DiscoveryGate.
// - Drives the scheduler clock from a wall-time accumulator (one step = one simulated hour)
// - Forwards scheduler events and log lines into an on-screen event log
// - Plots forcing X axis limits to the current window [t0, t1] for each plot

#include <vector>
#include <deque>
#include <string>
#include <cmath>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstdint>

#include "DiscoveryGate.h"
#include "LocalCollaborators.h"
#include "Log.h"
#include "RecordCodec.h"
#include "Rng.h"
#include "SearchScheduler.h"
#include "TierCatalog.h"

#include "imgui.h"
// ---- Docking compatibility shim (older ImGui builds do not define docking flags/APIs)
#ifndef ImGuiConfigFlags_DockingEnable
#define SCOUT_NO_IMGUI_DOCKING 1
#endif
#include "implot.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"

// Platform GL headers: on Windows, <GL/gl.h> requires Windows types/macros (APIENTRY/WINGDIAPI).
#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  include <windows.h>
#endif

#include <GLFW/glfw3.h>

#ifdef __APPLE__
#  include <OpenGL/gl.h>
#else
#  include <GL/gl.h>
#endif

static void glfw_error_callback(int error, const char* description) {
    std::fprintf(stderr, "GLFW Error %d: %s\n", error, description ? description : "(null)");
}

static int fail(const char* msg) {
    std::fprintf(stderr, "FATAL: %s\n", msg ? msg : "(null)");
    std::fprintf(stderr, "\n");
    return EXIT_FAILURE;
}

static const char* kStateFile = "scout_state.txt";
static const char* kPremiumKey = "premium_service_unit";

struct VisualUIState {
    bool show_hud = true;
    bool show_controls = true;
    bool show_log = true;
};

static void plot_line_with_xlimits(const char* title,
                                   const char* label,
                                   const double* xs,
                                   const double* ys,
                                   int count,
                                   double t0,
                                   double t1)
{
    if (count <= 1)
        return;

    if (ImPlot::BeginPlot(title)) {

        // --- X-axis handling (robust across ImPlot versions) ---
#if defined(ImAxis_X1)
        ImPlot::SetupAxisLimits(ImAxis_X1, t0, t1, ImGuiCond_Always);
#elif defined(ImPlotAxis_X1)
        ImPlot::SetupAxisLimits(ImPlotAxis_X1, t0, t1, ImGuiCond_Always);
#else
        // Very old ImPlot: auto-fit fallback.
#endif

        ImPlot::PlotLine(label, xs, ys, count);

        ImPlot::EndPlot();
    }
}

static ImVec4 status_color(scout::SearchStatus s) {
    switch (s) {
        case scout::SearchStatus::Active:    return ImVec4(0.5f, 0.8f, 1.0f, 1.0f);
        case scout::SearchStatus::Success:   return ImVec4(0.0f, 1.0f, 0.0f, 1.0f);
        case scout::SearchStatus::Failed:    return ImVec4(1.0f, 0.2f, 0.2f, 1.0f);
        default:                             return ImVec4(0.7f, 0.7f, 0.7f, 1.0f);
    }
}

int main(int argc, char** argv) {
    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) return fail("glfwInit failed");

    const char* glsl_version = "#version 130";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

    GLFWwindow* window = glfwCreateWindow(1280, 720, "Scout Dashboard", nullptr, nullptr);
    if (!window) {
        glfwTerminate();
        return fail("glfwCreateWindow failed");
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1); // vsync

    const GLubyte* gl_version = glGetString(GL_VERSION);
    if (!gl_version) {
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("OpenGL context validation failed (glGetString(GL_VERSION) returned null)");
    }
    std::fprintf(stderr, "OpenGL Version:  %s\n", gl_version);

    bool imgui_ctx = false;
    bool implot_ctx = false;
    bool imgui_glfw = false;
    bool imgui_gl3 = false;

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    imgui_ctx = true;

    ImGuiIO& io = ImGui::GetIO();
#ifndef SCOUT_NO_IMGUI_DOCKING
    io.ConfigFlags |= ImGuiConfigFlags_DockingEnable;
#endif
    io.IniFilename = nullptr;
    ImGui::GetStyle().ScaleAllSizes(1.25f);

    ImPlot::CreateContext();
    implot_ctx = true;

    ImGui::StyleColorsDark();

    if (!ImGui_ImplGlfw_InitForOpenGL(window, true)) {
        if (implot_ctx) ImPlot::DestroyContext();
        if (imgui_ctx) ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplGlfw_InitForOpenGL failed");
    }
    imgui_glfw = true;

    if (!ImGui_ImplOpenGL3_Init(glsl_version)) {
        if (imgui_glfw) ImGui_ImplGlfw_Shutdown();
        if (implot_ctx) ImPlot::DestroyContext();
        if (imgui_ctx) ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplOpenGL3_Init failed");
    }
    imgui_gl3 = true;

    // --- CLI flags ---
    std::uint32_t seed = 0x9E3779B9u;
    bool start_from_file = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? argv[i] : "";
        if (arg == "--load") {
            start_from_file = true;
        } else if (arg == "--seed" && i + 1 < argc) {
            seed = static_cast<std::uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        }
    }

    // --- Event log (scheduler events + log lines) ---
    std::deque<std::string> log_lines;
    constexpr size_t kMaxLogLines = 400;
    auto push_log = [&](const std::string& line) {
        log_lines.push_back(line);
        while (log_lines.size() > kMaxLogLines) log_lines.pop_front();
    };
    scout::setLogLevel(scout::LogLevel::Info);
    scout::setLogSink([&](scout::LogLevel level, const char* msg) {
        std::fprintf(stderr, "[%s] %s\n", scout::toString(level), msg);
        push_log(std::string("[") + scout::toString(level) + "] " + msg);
    });

    // --- Collaborators + engine ---
    constexpr int kConsumers = 4;
    scout::LocalLedger ledger;
    scout::LocalAcquisition acquisition;
    scout::FixedRatingSource rating;
    scout::LocalProfileSource profiles;
    scout::XorShiftRandom rng(seed);

    scout::SchedulerConfigV1 sched_cfg;
    scout::SearchScheduler sched(sched_cfg, scout::TierCatalog::defaults(), ledger, &acquisition, &rating, rng);
    scout::GateConfigV1 gate_cfg;
    scout::DiscoveryGate gate(gate_cfg, kPremiumKey, profiles, &rating, ledger, acquisition, rng);

    int scores[kConsumers] = {650, 700, 760, 590};
    int usage[kConsumers] = {0, 3, 5, 1};
    float ceilings[kConsumers][2] = {{1.0f, 1.0f}, {0.95f, 0.85f}, {1.0f, 0.70f}, {0.92f, 1.0f}};

    auto apply_profiles = [&]() {
        for (int c = 0; c < kConsumers; ++c) {
            rating.setScore(c + 1, scores[c]);
            profiles.setUsageCount(c + 1, usage[c]);
            profiles.setResourceCeilings(c + 1, {(double)ceilings[c][0], (double)ceilings[c][1]});
        }
    };
    auto reset_balances = [&]() {
        for (int c = 1; c <= kConsumers; ++c) ledger.setBalance(c, 250000.0);
    };
    apply_profiles();
    reset_balances();

    std::int64_t sim_hour = 0;
    bool running = false;
    float hours_per_second = 24.0f;

    double wall_prev = glfwGetTime();
    double accum_h = 0.0;
    int last_substeps = 0;
    bool dropped_accum = false;

    VisualUIState ui;

    // History buffers
    std::vector<double> t_hist, Active_hist, Listings_hist, Balance_hist, Fees_hist, SuccessRate_hist;
    t_hist.reserve(20000);
    Active_hist.reserve(20000);
    Listings_hist.reserve(20000);
    Balance_hist.reserve(20000);
    Fees_hist.reserve(20000);
    SuccessRate_hist.reserve(20000);

    constexpr size_t kMaxHistory = 200000;
    constexpr size_t kTrimChunk  = 10000;
    constexpr int kPlotWindowN   = 5000;

    auto trim_history_if_needed = [&]() {
        if (t_hist.size() <= kMaxHistory) return;
        const size_t drop = std::min(kTrimChunk, t_hist.size());
        auto erase_front = [&](std::vector<double>& v) {
            v.erase(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(drop));
        };
        erase_front(t_hist);
        erase_front(Active_hist);
        erase_front(Listings_hist);
        erase_front(Balance_hist);
        erase_front(Fees_hist);
        erase_front(SuccessRate_hist);
    };

    auto clear_history = [&]() {
        t_hist.clear(); Active_hist.clear(); Listings_hist.clear();
        Balance_hist.clear(); Fees_hist.clear(); SuccessRate_hist.clear();
    };

    auto push_sample = [&]() {
        double balance = 0.0;
        double fees = 0.0;
        int succeeded = 0;
        int resolved = 0;
        for (int c = 1; c <= kConsumers; ++c) {
            balance += ledger.balance(c);
            const auto st = sched.stats(c);
            fees += st.total_search_fees + st.total_inspection_fees;
            succeeded += st.searches_succeeded;
            resolved += st.searches_succeeded + st.searches_failed;
        }
        t_hist.push_back((double)sim_hour / 24.0);
        Active_hist.push_back((double)sched.recordCount());
        Listings_hist.push_back((double)sched.listingCount());
        Balance_hist.push_back(balance);
        Fees_hist.push_back(fees);
        SuccessRate_hist.push_back(resolved > 0 ? (double)succeeded / (double)resolved : 0.0);
        trim_history_if_needed();
    };

    auto advance_to = [&](std::int64_t hour) {
        sim_hour = hour;
        const auto events = sched.tick({sim_hour / 24, sim_hour});
        for (const auto& e : events) {
            char line[160];
            std::snprintf(line, sizeof(line), "day %lld  %-20s consumer %d search %u listing %u",
                          static_cast<long long>(e.day), scout::toString(e.kind), e.consumer_id, e.search_id,
                          e.listing_id);
            push_log(line);
        }
        gate.expireCheck(sim_hour);
        push_sample();
    };
    auto step_hour = [&]() { advance_to(sim_hour + 1); };

    auto reset_all = [&]() {
        scout::AttributeDocument empty;
        sched.load(empty);
        gate.load(empty);
        reset_balances();
        sim_hour = 0;
        sched.tick({0, 0});
        running = false;
        accum_h = 0.0;
        clear_history();
        push_sample();
        last_substeps = 0;
        dropped_accum = false;
    };

    auto save_state = [&]() {
        scout::AttributeDocument doc;
        sched.save(doc);
        gate.save(doc);
        if (!doc.saveFile(kStateFile)) SCOUT_LOG_ERROR("vis: could not write %s", kStateFile);
    };

    auto load_state = [&]() {
        scout::AttributeDocument doc;
        std::string err;
        if (!doc.loadFile(kStateFile, &err)) {
            SCOUT_LOG_ERROR("vis: could not read %s (%s)", kStateFile, err.c_str());
            return;
        }
        sched.load(doc);
        gate.load(doc);
        sim_hour = sched.lastHour();
        running = false;
        accum_h = 0.0;
        clear_history();
        push_sample();
    };

    sched.tick({0, 0});
    push_sample();
    if (start_from_file) load_state();

    // Search form
    static const char* item_keys[] = {"loader_mid", "harvester_large", "excavator_compact", "tractor_utility"};
    static const char* item_names[] = {"Mid Loader", "Large Harvester", "Compact Excavator", "Utility Tractor"};
    int form_consumer = 1;
    int form_item = 0;
    int form_tier = 1;
    int form_quality = 3;
    float form_price = 100000.0f;
    bool form_cfg_engine = false;
    int form_engine = 1;
    bool form_cfg_tires = false;
    int form_tires = 1;
    int form_inspection = 1;
    int gate_consumer = 1;
    scout::ResultCode last_code = scout::ResultCode::Ok;

    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();

        // --- advance sim (wall-time accumulator) ---
        const double wall_now = glfwGetTime();
        double wall_dt = wall_now - wall_prev;
        wall_prev = wall_now;

        wall_dt = std::clamp(wall_dt, 0.0, 0.1);
        hours_per_second = std::clamp(hours_per_second, 1.0f, 720.0f);

        if (running) {
            accum_h += wall_dt * (double)hours_per_second;

            constexpr int kMaxSubstepsPerFrame = 48;
            int substeps = 0;
            dropped_accum = false;

            while (accum_h >= 1.0 && substeps < kMaxSubstepsPerFrame) {
                step_hour();
                accum_h -= 1.0;
                ++substeps;
            }

            last_substeps = substeps;

            if (substeps == kMaxSubstepsPerFrame) {
                accum_h = 0.0;
                dropped_accum = true;
            }
        } else {
            last_substeps = 0;
            dropped_accum = false;
        }

        // --- ImGui frame ---
        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

#ifndef SCOUT_NO_IMGUI_DOCKING
        ImGui::DockSpaceOverViewport(ImGui::GetMainViewport());
#endif

        const ImVec4 header_col  = ImVec4(0.0f, 1.0f, 0.0f, 1.0f);
        const ImVec4 status_ok   = ImVec4(0.0f, 1.0f, 0.0f, 1.0f);
        const ImVec4 status_warn = ImVec4(1.0f, 1.0f, 0.0f, 1.0f);
        const ImVec4 status_fail = ImVec4(1.0f, 0.2f, 0.2f, 1.0f);

        if (ui.show_hud) {
            ImGuiWindowFlags dashboard_flags =
                ImGuiWindowFlags_NoDecoration |
                ImGuiWindowFlags_AlwaysAutoResize |
                ImGuiWindowFlags_NoSavedSettings |
                ImGuiWindowFlags_NoFocusOnAppearing |
                ImGuiWindowFlags_NoNav;

            ImVec2 viewport_size = ImGui::GetMainViewport()->Size;
            ImGui::SetNextWindowPos(ImVec2(viewport_size.x - 12, 12), ImGuiCond_Always, ImVec2(1.0f, 0.0f));
            ImGui::SetNextWindowBgAlpha(0.85f);

            if (ImGui::Begin("##Dashboard", &ui.show_hud, dashboard_flags)) {
                ImGui::TextColored(header_col, "[ SCOUT PROCUREMENT ]");
                ImGui::Separator();

                ImGui::Text("DAY: %lld  HOUR: %02lld", static_cast<long long>(sim_hour / 24),
                            static_cast<long long>(sim_hour % 24));
                ImGui::SameLine(220);
                ImGui::TextColored(running ? status_ok : ImVec4(0.5f, 0.8f, 1.0f, 1.0f), "[%s]",
                                   running ? "RUNNING" : "PAUSED");
                ImGui::Spacing();

                ImGui::TextColored(header_col, "=== PIPELINE ===");
                ImGui::Text("Active searches: %d", (int)sched.recordCount());
                ImGui::Text("Open listings:   %d", (int)sched.listingCount());
                ImGui::Text("Deliveries:      %d", (int)acquisition.deliveries().size());
                ImGui::Spacing();

                ImGui::TextColored(header_col, "=== CONSUMERS ===");
                for (int c = 1; c <= kConsumers; ++c) {
                    const auto gs = gate.status(c, sim_hour);
                    const ImVec4 col = gs.opportunity_active ? status_warn : (gs.purchased ? status_ok : header_col);
                    ImGui::TextColored(col, "#%d  %10.0f  rating %d  pity %d/%d%s", c, ledger.balance(c),
                                       rating.score(c), gs.eligible_events, gate_cfg.pity_threshold_i32,
                                       gs.opportunity_active ? "  OFFER" : "");
                }

                if (dropped_accum) {
                    ImGui::Separator();
                    ImGui::TextColored(status_fail, ">> REALTIME DROPPED");
                }
            }
            ImGui::End();
        }

        if (ui.show_controls) {
            ImGui::SetNextWindowSize(ImVec2(640, 760), ImGuiCond_FirstUseEver);
            ImGui::Begin(">> CONTROL CONSOLE", &ui.show_controls);

            ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(0.2f, 1.0f, 0.2f, 1.0f));
            ImGui::PushStyleColor(ImGuiCol_FrameBg, ImVec4(0.05f, 0.05f, 0.05f, 1.0f));
            ImGui::PushStyleColor(ImGuiCol_Button, ImVec4(0.1f, 0.3f, 0.1f, 1.0f));
            ImGui::PushStyleColor(ImGuiCol_ButtonHovered, ImVec4(0.2f, 0.6f, 0.2f, 1.0f));

            const ImVec4 cmd_header = ImVec4(0.0f, 1.0f, 0.0f, 1.0f);

            if (ImGui::BeginTabBar("ControlTabs", ImGuiTabBarFlags_None)) {

                // ===== TAB 1: EXECUTION =====
                if (ImGui::BeginTabItem("  EXEC  ")) {
                    ImGui::TextColored(cmd_header, "[EXEC] Clock Controls");
                    ImGui::Separator();

                    if (ImGui::Button(running ? "  PAUSE  " : "   RUN   ", ImVec2(100, 0))) running = !running;
                    ImGui::SameLine();
                    if (ImGui::Button(" +1 HOUR ", ImVec2(100, 0))) {
                        step_hour();
                        accum_h = 0.0;
                    }
                    ImGui::SameLine();
                    if (ImGui::Button(" +1 DAY ", ImVec2(100, 0))) {
                        for (int h = 0; h < 24; ++h) step_hour();
                        accum_h = 0.0;
                    }
                    ImGui::SameLine();
                    if (ImGui::Button(" RESET ", ImVec2(100, 0))) reset_all();

                    static int jump_days = 7;
                    ImGui::SliderInt("##jump_days", &jump_days, 1, 60, "%d days");
                    ImGui::SameLine();
                    if (ImGui::Button(" +N DAYS ", ImVec2(100, 0))) {
                        // Single multi-day tick; the scheduler rolls the skipped days up itself.
                        advance_to(sim_hour + 24 * (std::int64_t)jump_days);
                        accum_h = 0.0;
                    }

                    ImGui::SliderFloat("Hours / second", &hours_per_second, 1.0f, 720.0f, "%.0f");
                    ImGui::Spacing();

                    ImGui::TextColored(cmd_header, "[STATE] Persistence");
                    ImGui::Separator();
                    if (ImGui::Button("[ SAVE ]", ImVec2(150, 0))) save_state();
                    ImGui::SameLine();
                    if (ImGui::Button("[ LOAD ]", ImVec2(150, 0))) load_state();
                    ImGui::Text("State digest: 0x%08X / 0x%08X", sched.stateDigest(), gate.stateDigest());
                    if (last_substeps > 0) {
                        ImGui::TextColored(ImVec4(0.0f, 1.0f, 1.0f, 1.0f), "Substeps:    %d", last_substeps);
                    }
                    ImGui::Spacing();

                    ImGui::TextColored(cmd_header, "[CONFIG]");
                    ImGui::Separator();
                    static char cfg_text[4096];
                    sched.exportConfigText(cfg_text, (int)sizeof(cfg_text));
                    ImGui::TextUnformatted(cfg_text);

                    ImGui::EndTabItem();
                }

                // ===== TAB 2: SEARCH =====
                if (ImGui::BeginTabItem("  SEARCH  ")) {
                    const scout::TierCatalog& cat = sched.catalog();
                    ImGui::TextColored(cmd_header, "[SEARCH] New Request");
                    ImGui::Separator();

                    ImGui::SliderInt("Consumer", &form_consumer, 1, kConsumers);
                    ImGui::Combo("Item", &form_item, item_names, IM_ARRAYSIZE(item_names));
                    ImGui::InputFloat("Base price", &form_price, 1000.0f, 10000.0f, "%.0f");
                    if (ImGui::BeginCombo("Tier", cat.findTier(form_tier) ? cat.findTier(form_tier)->name.c_str() : "?")) {
                        for (const auto& t : cat.tiers()) {
                            if (ImGui::Selectable(t.name.c_str(), t.id == form_tier)) form_tier = t.id;
                        }
                        ImGui::EndCombo();
                    }
                    if (ImGui::BeginCombo("Quality",
                                          cat.findQuality(form_quality) ? cat.findQuality(form_quality)->name.c_str() : "?")) {
                        for (const auto& q : cat.qualities()) {
                            if (ImGui::Selectable(q.name.c_str(), q.id == form_quality)) form_quality = q.id;
                        }
                        ImGui::EndCombo();
                    }
                    ImGui::Checkbox("engine", &form_cfg_engine);
                    ImGui::SameLine(120);
                    ImGui::SliderInt("##engine", &form_engine, 1, 4);
                    ImGui::Checkbox("tires", &form_cfg_tires);
                    ImGui::SameLine(120);
                    ImGui::SliderInt("##tires", &form_tires, 1, 4);

                    const auto q = sched.quote(form_consumer, (double)form_price, form_tier);
                    const scout::TierDefinition* tier = cat.findTier(form_tier);
                    const scout::QualityTier* quality = cat.findQuality(form_quality);
                    if (q.code == scout::ResultCode::Ok && tier && quality) {
                        ImGui::Text("Fee: %.0f  (rating %d, modifier %+.2f)", q.cost, q.rating_score, q.credit_modifier);
                        ImGui::Text("Success chance: %.0f %%  Duration: %d-%d h",
                                    100.0 * scout::effectiveSuccessProbability(*tier, *quality),
                                    tier->min_duration, tier->max_duration);
                    }

                    if (ImGui::Button("[ SUBMIT ]", ImVec2(-1, 0))) {
                        scout::ConfigSelection req;
                        if (form_cfg_engine) req["engine"] = form_engine;
                        if (form_cfg_tires) req["tires"] = form_tires;
                        const auto r = sched.submit(form_consumer, {item_keys[form_item], item_names[form_item]},
                                                    (double)form_price, form_tier, form_quality, req);
                        last_code = r.code;
                    }
                    ImGui::Text("Last result: %s", scout::toString(last_code));
                    ImGui::Spacing();

                    ImGui::TextColored(cmd_header, "[SEARCH] In Flight");
                    ImGui::Separator();
                    for (int c = 1; c <= kConsumers; ++c) {
                        for (const scout::SearchRecord* r : sched.records(c)) {
                            ImGui::PushID((int)r->id());
                            ImGui::TextColored(status_color(r->status()), "#%u c%d %-18s %-8s ttl %3d h",
                                               r->id(), c, r->item().display_name.c_str(),
                                               scout::toString(r->status()), std::max(0, r->ttl()));
                            if (r->isActive()) {
                                ImGui::SameLine();
                                if (ImGui::SmallButton("cancel")) last_code = sched.cancel(r->id());
                            }
                            ImGui::PopID();
                        }
                    }
                    ImGui::EndTabItem();
                }

                // ===== TAB 3: LISTINGS =====
                if (ImGui::BeginTabItem("  LISTINGS  ")) {
                    const scout::TierCatalog& cat = sched.catalog();
                    ImGui::TextColored(cmd_header, "[LISTINGS] Available");
                    ImGui::Separator();
                    if (ImGui::BeginCombo("Inspection",
                                          cat.findInspection(form_inspection)
                                              ? cat.findInspection(form_inspection)->name.c_str() : "?")) {
                        for (const auto& it : cat.inspections()) {
                            if (ImGui::Selectable(it.name.c_str(), it.id == form_inspection)) form_inspection = it.id;
                        }
                        ImGui::EndCombo();
                    }

                    for (int c = 1; c <= kConsumers; ++c) {
                        for (const scout::Listing* l : sched.listings(c)) {
                            ImGui::PushID((int)(l->id + 100000u));
                            ImGui::Separator();
                            ImGui::Text("#%u c%d %s  price %.0f  cond %.2f  expires in %d h", l->id, c,
                                        l->item.display_name.c_str(), l->price, l->condition, l->expiry_units);
                            for (const auto& kv : l->configs) {
                                ImGui::SameLine();
                                ImGui::TextColored(kv.second == scout::kUnmatchedOption ? status_fail : status_ok,
                                                   "%s", kv.first.c_str());
                            }
                            ImGui::Text("inspection: %s", scout::toString(l->inspection));
                            if (l->inspection == scout::InspectionState::Pending) {
                                ImGui::SameLine();
                                ImGui::Text("(ready at hour %lld)", static_cast<long long>(l->inspection_completes_at));
                            }
                            const std::uint32_t lid = l->id;
                            if (ImGui::SmallButton("purchase")) last_code = sched.purchaseListing(lid).code;
                            ImGui::SameLine();
                            if (ImGui::SmallButton("decline")) last_code = sched.declineListing(lid);
                            ImGui::SameLine();
                            if (ImGui::SmallButton("inspect")) last_code = sched.requestInspection(lid, form_inspection).code;
                            ImGui::PopID();
                        }
                    }
                    ImGui::Text("Last result: %s", scout::toString(last_code));
                    ImGui::EndTabItem();
                }

                // ===== TAB 4: GATE =====
                if (ImGui::BeginTabItem("  GATE  ")) {
                    ImGui::TextColored(cmd_header, "[GATE] Consumer Profile");
                    ImGui::Separator();
                    ImGui::SliderInt("Consumer##gate", &gate_consumer, 1, kConsumers);
                    const int gi = gate_consumer - 1;
                    bool changed = false;
                    changed |= ImGui::SliderInt("Rating", &scores[gi], 300, 850);
                    changed |= ImGui::SliderInt("Diagnostic uses", &usage[gi], 0, 10);
                    changed |= ImGui::SliderFloat2("Resource ceilings", ceilings[gi], 0.5f, 1.0f, "%.2f");
                    if (changed) apply_profiles();

                    const auto pre = gate.checkPrerequisites(gate_consumer);
                    ImGui::TextColored(pre.eligible ? status_ok : status_warn, "Prerequisites: %s (%d)",
                                       pre.reason.c_str(), pre.detail);
                    ImGui::Spacing();

                    ImGui::TextColored(cmd_header, "[GATE] Qualifying Events");
                    ImGui::Separator();
                    static const char* kinds[] = {"Purchase", "Lease", "Finance", "Sale"};
                    static int kind_idx = 0;
                    ImGui::Combo("Event", &kind_idx, kinds, IM_ARRAYSIZE(kinds));
                    if (ImGui::Button("[ FIRE EVENT ]", ImVec2(-1, 0))) {
                        gate.onQualifyingEvent(gate_consumer, (scout::QualifyingEventKind)kind_idx, sim_hour);
                    }

                    const auto gs = gate.status(gate_consumer, sim_hour);
                    ImGui::Text("Pity counter: %d / %d", gs.eligible_events, gate_cfg.pity_threshold_i32);
                    ImGui::ProgressBar((float)std::min(1.0, (double)gs.eligible_events / gate_cfg.pity_threshold_i32),
                                       ImVec2(-1, 12), "");
                    ImGui::Text("Discovered: %s  Purchased: %s", gs.discovered ? "YES" : "NO",
                                gs.purchased ? "YES" : "NO");
                    if (gs.opportunity_active) {
                        ImGui::TextColored(status_warn, "OFFER: %.0f (list %.0f), %d days left", gs.price,
                                           gs.list_price, gs.days_remaining);
                        if (ImGui::Button("[ ACCEPT ]", ImVec2(150, 0))) last_code = gate.accept(gate_consumer);
                        ImGui::SameLine();
                        if (ImGui::Button("[ LATER ]", ImVec2(150, 0))) last_code = gate.decline(gate_consumer);
                    }
                    if (ImGui::Button("[ RESET CONSUMER ]", ImVec2(-1, 0))) gate.resetConsumer(gate_consumer);
                    ImGui::Text("Last result: %s", scout::toString(last_code));
                    ImGui::EndTabItem();
                }

                // ===== TAB 5: PLOTS =====
                if (ImGui::BeginTabItem("  PLOTS  ")) {
                    const int N = (int)t_hist.size();
                    const int start = (N > kPlotWindowN) ? (N - kPlotWindowN) : 0;
                    const int count = N - start;

                    if (count > 1) {
                        const double t0 = t_hist[start];
                        const double t1 = t_hist[start + count - 1];
                        ImGui::Text("Samples: %d   Window: [%0.2f, %0.2f] days", N, t0, t1);
                        ImGui::Separator();

                        if (ImPlot::BeginPlot("Pipeline")) {
                            #if defined(ImAxis_X1)
                            ImPlot::SetupAxisLimits(ImAxis_X1, t0, t1, ImGuiCond_Always);
                            #elif defined(ImPlotAxis_X1)
                            ImPlot::SetupAxisLimits(ImPlotAxis_X1, t0, t1, ImGuiCond_Always);
                            #else
                            #endif

                            ImPlot::PlotLine("active", t_hist.data() + start, Active_hist.data() + start, count);
                            ImPlot::PlotLine("listings", t_hist.data() + start, Listings_hist.data() + start, count);

                            ImPlot::EndPlot();
                        }

                        plot_line_with_xlimits("Total balance", "balance",
                                               t_hist.data() + start, Balance_hist.data() + start, count, t0, t1);

                        plot_line_with_xlimits("Fees paid", "fees",
                                               t_hist.data() + start, Fees_hist.data() + start, count, t0, t1);

                        plot_line_with_xlimits("Search success rate", "rate",
                                               t_hist.data() + start, SuccessRate_hist.data() + start, count, t0, t1);
                    } else {
                        ImGui::Text("Samples: %d", N);
                        ImGui::TextUnformatted("No data yet (press Run or +1 Hour).");
                    }

                    ImGui::EndTabItem();
                }

                ImGui::EndTabBar();
            }

            ImGui::PopStyleColor(4);
            ImGui::End();
        }

        if (ui.show_log) {
            ImGui::SetNextWindowSize(ImVec2(640, 240), ImGuiCond_FirstUseEver);
            if (ImGui::Begin(">> EVENT LOG", &ui.show_log)) {
                if (ImGui::SmallButton("clear")) log_lines.clear();
                ImGui::Separator();
                ImGui::BeginChild("##log_scroll");
                for (const auto& line : log_lines) ImGui::TextUnformatted(line.c_str());
                if (ImGui::GetScrollY() >= ImGui::GetScrollMaxY()) ImGui::SetScrollHereY(1.0f);
                ImGui::EndChild();
            }
            ImGui::End();
        }

        ImGui::Render();

        int fb_w = 0, fb_h = 0;
        glfwGetFramebufferSize(window, &fb_w, &fb_h);

        if (fb_w > 0 && fb_h > 0) {
            glViewport(0, 0, fb_w, fb_h);
            glClearColor(0.06f, 0.06f, 0.07f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        }

        glfwSwapBuffers(window);
    }

    // Detach the sink before the captured log buffer goes away.
    scout::setLogSink(scout::LogSink());

    // Cleanup
    if (implot_ctx) ImPlot::DestroyContext();
    if (imgui_gl3) ImGui_ImplOpenGL3_Shutdown();
    if (imgui_glfw) ImGui_ImplGlfw_Shutdown();
    if (imgui_ctx) ImGui::DestroyContext();

    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}
