#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "ScenarioBatch.h"
#include "ScenarioIO.h"
#include "ScenarioNaming.h"
#include "TripAggregator.h"
#include "demand_generator.h"
#include "road_network.h"

namespace fs = std::filesystem;

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

static void requireClose(const char* name, double a, double b, double absTol) {
    if (!std::isfinite(a) || !std::isfinite(b) || std::abs(a - b) > absTol) {
        std::cerr << "[FAIL] " << name << ": " << a << " vs " << b << " (tol " << absTol << ")\n";
        std::exit(1);
    }
}

static bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

static void writeText(const fs::path& path, const std::string& text) {
    std::ofstream out(path);
    REQUIRE(out.is_open(), "cannot write " << path.string());
    out << text;
}

// Fresh scratch directory per test, removed on scope exit.
class ScratchDir {
public:
    explicit ScratchDir(const char* name)
        : path_(fs::temp_directory_path() / (std::string("evtoll_") + name)) {
        std::error_code ec;
        fs::remove_all(path_, ec);
        fs::create_directories(path_, ec);
        REQUIRE(!ec, "cannot create scratch dir " << path_.string());
    }
    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

static const char* kTripinfoTwoIceOneEv =
    "<?xml version=\"1.0\"?>\n"
    "<tripinfos>\n"
    "  <tripinfo id=\"0\" vType=\"ICE\">\n"
    "    <emissions CO2_abs=\"1500000\" electricity_abs=\"0\"/>\n"
    "  </tripinfo>\n"
    "  <tripinfo id=\"1\" vType=\"ICE\">\n"
    "    <emissions CO2_abs=\"500000\" electricity_abs=\"0\"/>\n"
    "  </tripinfo>\n"
    "  <tripinfo id=\"2\" vType=\"EV\">\n"
    "    <emissions CO2_abs=\"0\" electricity_abs=\"4000\"/>\n"
    "  </tripinfo>\n"
    "</tripinfos>\n";

// ============================================================================
// 1. Tripinfo aggregation
// ============================================================================

static void runTripinfoDocument_1A() {
    const evtoll::AggregateOutcome out = evtoll::aggregateTripinfoDocument(kTripinfoTwoIceOneEv);
    REQUIRE(out.status == evtoll::AggregateStatus::Ok, "parse failed: " << out.message);
    REQUIRE(out.totals.ice_count == 2 && out.totals.ev_count == 1, "trip counts");
    requireClose("co2", out.totals.total_co2_mg, 2000000.0, 1e-6);
    requireClose("energy", out.totals.total_energy_wh, 4000.0, 1e-9);

    // No emissions child: classified by the declared type only.
    const evtoll::AggregateOutcome hintOnly = evtoll::aggregateTripinfoDocument(
        "<tripinfos><tripinfo id=\"a\" vType=\"EV_urban\"/><tripinfo id=\"b\" vType=\"bus\"/></tripinfos>");
    REQUIRE(hintOnly.status == evtoll::AggregateStatus::Ok, "hint-only parse failed");
    REQUIRE(hintOnly.totals.ev_count == 1, "EV hint not counted");
    REQUIRE(hintOnly.totals.unclassified_count == 1, "unknown type not left unclassified");

    const evtoll::AggregateOutcome empty = evtoll::aggregateTripinfoDocument("<tripinfos/>");
    REQUIRE(empty.status == evtoll::AggregateStatus::Ok, "empty document rejected");
    REQUIRE(empty.totals.ice_count + empty.totals.ev_count == 0, "empty document counted trips");
    std::cout << "[PASS] 1A tripinfo aggregation from a document\n";
}

static void runTripinfoMalformed_1B() {
    const evtoll::AggregateOutcome truncated = evtoll::aggregateTripinfoDocument(
        "<tripinfos><tripinfo id=\"0\" vType=\"ICE\"><emissions CO2_abs=\"1\"/>");
    REQUIRE(truncated.status == evtoll::AggregateStatus::MalformedInput, "truncated document accepted");
    REQUIRE(!truncated.message.empty(), "malformed without message");
    REQUIRE(truncated.totals.ice_count == 0, "malformed totals not zeroed");

    const evtoll::AggregateOutcome badNumber = evtoll::aggregateTripinfoDocument(
        "<tripinfos><tripinfo id=\"0\" vType=\"ICE\"><emissions CO2_abs=\"lots\"/></tripinfo></tripinfos>");
    REQUIRE(badNumber.status == evtoll::AggregateStatus::MalformedInput, "non-numeric CO2 accepted");

    const evtoll::AggregateOutcome missing =
        evtoll::aggregateTripinfoFile((fs::temp_directory_path() / "evtoll_no_such_tripinfo.xml").string());
    REQUIRE(missing.status == evtoll::AggregateStatus::MissingArtifact, "missing file not reported");
    std::cout << "[PASS] 1B malformed and missing tripinfo\n";
}

// ============================================================================
// 2. Demand and scenario files
// ============================================================================

static void runDemandDocument_2A() {
    const evtoll::DemandLoadResult r = evtoll::loadDemandDocument(
        "<routes>\n"
        "  <vType id=\"car\" accel=\"2.6\"/>\n"
        "  <trip id=\"t0\" type=\"car\" depart=\"32400.00\" from=\"e1\" to=\"e2\"/>\n"
        "  <vehicle id=\"v1\" depart=\"32401.5\">\n"
        "    <route edges=\"e3 e4 e5\"/>\n"
        "  </vehicle>\n"
        "</routes>\n");
    REQUIRE(r.ok, "demand parse failed: " << r.message);
    REQUIRE(r.vehicles.size() == 2, "vehicle count " << r.vehicles.size());
    REQUIRE(r.vehicles[0].id == "t0" && r.vehicles[0].from_edge == "e1" && r.vehicles[0].to_edge == "e2",
            "trip fields");
    REQUIRE(r.vehicles[0].route_edges.empty(), "trip has route edges");
    REQUIRE(r.vehicles[1].id == "v1", "vehicle id");
    REQUIRE(r.vehicles[1].route_edges == "e3 e4 e5", "route edges");
    REQUIRE(r.vehicles[1].from_edge == "e3" && r.vehicles[1].to_edge == "e5", "route endpoints");
    requireClose("depart", r.vehicles[1].depart_s, 32401.5, 1e-9);

    const evtoll::DemandLoadResult noId = evtoll::loadDemandDocument(
        "<routes><trip depart=\"1\" from=\"a\" to=\"b\"/></routes>");
    REQUIRE(!noId.ok, "trip without id accepted");

    const evtoll::DemandLoadResult badDepart = evtoll::loadDemandDocument(
        "<routes><trip id=\"x\" depart=\"soon\" from=\"a\" to=\"b\"/></routes>");
    REQUIRE(!badDepart.ok, "non-numeric depart accepted");

    const evtoll::DemandLoadResult missing =
        evtoll::loadDemandFile((fs::temp_directory_path() / "evtoll_no_such_demand.xml").string());
    REQUIRE(!missing.ok && !missing.message.empty(), "missing demand file accepted");
    std::cout << "[PASS] 2A base demand parsing\n";
}

static void runDemandRouteReferences_2A2() {
    const evtoll::DemandLoadResult r = evtoll::loadDemandDocument(
        "<routes>\n"
        "  <route id=\"r0\" edges=\"e1 e2 e3\"/>\n"
        "  <route id=\"r1\" edges=\"e7 e8\"/>\n"
        "  <vehicle id=\"v0\" depart=\"32400\" route=\"r0\"/>\n"
        "  <vehicle id=\"v1\" depart=\"32460\" route=\"r1\"></vehicle>\n"
        "</routes>\n");
    REQUIRE(r.ok, "route references rejected: " << r.message);
    REQUIRE(r.vehicles.size() == 2, "vehicle count " << r.vehicles.size());
    REQUIRE(r.vehicles[0].route_edges == "e1 e2 e3", "r0 not resolved");
    REQUIRE(r.vehicles[0].from_edge == "e1" && r.vehicles[0].to_edge == "e3", "r0 endpoints");
    REQUIRE(r.vehicles[1].route_edges == "e7 e8", "r1 not resolved");

    // Written back with the resolved edges, never as an empty trip.
    const auto artifact = evtoll::synthesizeScenario(r.vehicles, 1.0, evtoll::AdoptionModel{}, 3u);
    std::ostringstream routes;
    evtoll::writeRoutes(routes, artifact);
    REQUIRE(contains(routes.str(), "<route edges=\"e1 e2 e3\"/>"), "resolved route not written");
    REQUIRE(!contains(routes.str(), "from=\"\""), "vehicle written without origin");

    const evtoll::DemandLoadResult unknown = evtoll::loadDemandDocument(
        "<routes><vehicle id=\"v0\" depart=\"1\" route=\"missing\"/></routes>");
    REQUIRE(!unknown.ok, "unknown route reference accepted");
    REQUIRE(contains(unknown.message, "missing"), "message does not name the route: " << unknown.message);

    const evtoll::DemandLoadResult noRoute = evtoll::loadDemandDocument(
        "<routes><vehicle id=\"v0\" depart=\"1\"/></routes>");
    REQUIRE(!noRoute.ok, "vehicle without route accepted");

    const evtoll::DemandLoadResult flow = evtoll::loadDemandDocument(
        "<routes><flow id=\"f0\" begin=\"0\" end=\"60\" number=\"5\" from=\"a\" to=\"b\"/></routes>");
    REQUIRE(!flow.ok, "flow silently dropped");
    std::cout << "[PASS] 2A2 route references resolved, unrunnable entries rejected\n";
}

static void runDemandReferenceInBatch_2A3() {
    // A batch whose demand cannot be written back stops before any scenario work.
    ScratchDir scratch("batch_badref");
    const fs::path& dir = scratch.path();
    writeText(dir / "demand.xml", "<routes><vehicle id=\"v0\" depart=\"1\" route=\"r9\"/></routes>");

    evtoll::BatchConfig cfg;
    cfg.toll_grid = {0.0};
    cfg.demand_file = (dir / "demand.xml").string();
    cfg.scenarios_dir = (dir / "scenarios").string();
    evtoll::BatchRunner runner(cfg);
    runner.setLogStream(nullptr);

    class NeverRun : public evtoll::SimulatorRunner {
    public:
        int run(const evtoll::ScenarioFiles&) override { return 1; }
    } sim;
    const evtoll::BatchResult result = runner.run(sim);
    REQUIRE(result.status == evtoll::BatchStatus::DemandUnavailable, "bad route reference not fatal");
    REQUIRE(contains(result.message, "r9"), "message does not name the route");
    REQUIRE(!fs::exists(dir / "scenarios" / evtoll::routesFileName(0.0)), "scenario written from bad demand");
    std::cout << "[PASS] 2A3 unresolvable demand reported as unavailable\n";
}

static void runRoutesRoundTrip_2B() {
    std::vector<evtoll::VehicleRecord> fleet(3);
    fleet[0].id = "a"; fleet[0].from_edge = "e1"; fleet[0].to_edge = "e2"; fleet[0].depart_s = 32400.0;
    fleet[1].id = "b&c"; fleet[1].from_edge = "e2"; fleet[1].to_edge = "e3"; fleet[1].depart_s = 32410.25;
    fleet[2].id = "d"; fleet[2].route_edges = "e1 e2 e3"; fleet[2].from_edge = "e1"; fleet[2].to_edge = "e3";
    fleet[2].depart_s = 32420.0;

    const auto artifact = evtoll::synthesizeScenario(fleet, 1.5, evtoll::AdoptionModel{}, 9u);
    std::ostringstream routes;
    evtoll::writeRoutes(routes, artifact);
    const std::string text = routes.str();
    REQUIRE(contains(text, "<vType id=\"ICE\""), "ICE vType missing");
    REQUIRE(contains(text, "<vType id=\"EV\""), "EV vType missing");
    REQUIRE(contains(text, "device.emissions.probability"), "emissions device param missing");
    REQUIRE(contains(text, "b&amp;c"), "id not escaped");
    REQUIRE(contains(text, "depart=\"32410.25\""), "depart formatting");

    const evtoll::DemandLoadResult back = evtoll::loadDemandDocument(text);
    REQUIRE(back.ok, "written routes did not reload: " << back.message);
    REQUIRE(back.vehicles.size() == fleet.size(), "reloaded count");
    for (std::size_t i = 0; i < fleet.size(); ++i) {
        REQUIRE(back.vehicles[i].id == fleet[i].id, "reloaded id at " << i);
        REQUIRE(back.vehicles[i].from_edge == fleet[i].from_edge, "reloaded from at " << i);
        REQUIRE(back.vehicles[i].to_edge == fleet[i].to_edge, "reloaded to at " << i);
        requireClose("reloaded depart", back.vehicles[i].depart_s, fleet[i].depart_s, 1e-9);
    }
    REQUIRE(back.vehicles[2].route_edges == "e1 e2 e3", "explicit route lost");
    std::cout << "[PASS] 2B labeled routes written and reloaded\n";
}

static void runSimulationConfig_2C() {
    const auto artifact = evtoll::synthesizeScenario({}, 2.5, evtoll::AdoptionModel{}, 1u);
    evtoll::ConfigPaths paths;
    paths.net_file = "../vci.net.xml";
    paths.routes_file = evtoll::routesFileName(2.5);
    paths.tripinfo_file = artifact.tripinfo_output;

    std::ostringstream cfg;
    evtoll::writeSimulationConfig(cfg, artifact, paths);
    const std::string text = cfg.str();
    REQUIRE(contains(text, "<net-file value=\"../vci.net.xml\"/>"), "net file");
    REQUIRE(contains(text, "<route-files value=\"routes_toll_2_5.xml\"/>"), "route files");
    REQUIRE(contains(text, "<begin value=\"32400\"/>"), "begin");
    REQUIRE(contains(text, "<end value=\"39600\"/>"), "end");
    REQUIRE(contains(text, "<tripinfo-output value=\"tripinfo_toll_2_5.xml\"/>"), "tripinfo output");
    std::cout << "[PASS] 2C simulation config content\n";
}

// ============================================================================
// 3. Road network and demand generation
// ============================================================================

static const char* kNetwork =
    "<net>\n"
    "  <edge id=\":j0_0\" function=\"internal\"/>\n"
    "  <edge id=\"1135405\" from=\"a\" to=\"b\"/>\n"
    "  <edge id=\"e2\" from=\"b\" to=\"c\"/>\n"
    "  <edge id=\"e3\" from=\"c\" to=\"d\"/>\n"
    "  <edge id=\"x9\" function=\"internal\"/>\n"
    "  <edge id=\"e2\" from=\"b\" to=\"c\"/>\n"
    "  <junction id=\"a\"/>\n"
    "</net>\n";

static void runRoadNetwork_3A() {
    evtoll::world::RoadNetwork net;
    REQUIRE(!net.isValid(), "fresh network valid");
    REQUIRE(net.loadDocument(kNetwork), "network parse failed: " << net.lastError());
    REQUIRE(net.isValid(), "loaded network invalid");
    REQUIRE(net.edges().size() == 3, "edge count " << net.edges().size());
    REQUIRE(net.edges()[0] == "1135405" && net.edges()[1] == "e2" && net.edges()[2] == "e3", "edge order");
    REQUIRE(!net.hasEdge(":j0_0") && !net.hasEdge("x9"), "internal edge kept");

    REQUIRE(!net.loadDocument("<net><edge id=\"a\">"), "truncated network accepted");
    REQUIRE(!net.isValid() && net.edges().empty(), "failed load kept stale edges");
    REQUIRE(!net.lastError().empty(), "failed load without error");
    std::cout << "[PASS] 3A road network edge filter\n";
}

static void runDemandGenerator_3B() {
    evtoll::world::RoadNetwork net;
    REQUIRE(net.loadDocument(kNetwork), "network parse failed");

    evtoll::world::DemandConfig cfg;
    cfg.num_vehicles = 200;
    const auto trips = evtoll::world::generateTrips(net, cfg);
    REQUIRE(trips.size() == 200, "trip count");
    double prev = -1.0;
    for (std::size_t i = 0; i < trips.size(); ++i) {
        REQUIRE(trips[i].id == std::to_string(i), "trip id at " << i);
        REQUIRE(net.hasEdge(trips[i].from_edge) && net.hasEdge(trips[i].to_edge), "endpoint not in network");
        REQUIRE(trips[i].depart_s >= cfg.begin_s && trips[i].depart_s < cfg.end_s, "depart outside window");
        REQUIRE(trips[i].depart_s >= prev, "departures not ordered");
        prev = trips[i].depart_s;
    }
    requireClose("first depart", trips[0].depart_s, cfg.begin_s, 1e-9);
    requireClose("second depart", trips[1].depart_s, cfg.begin_s + 36.0, 1e-9);

    const auto again = evtoll::world::generateTrips(net, cfg);
    for (std::size_t i = 0; i < trips.size(); ++i) {
        REQUIRE(again[i].from_edge == trips[i].from_edge && again[i].to_edge == trips[i].to_edge,
                "generator not deterministic at " << i);
    }

    evtoll::world::RoadNetwork empty;
    REQUIRE(empty.loadDocument("<net/>"), "empty network rejected");
    REQUIRE(evtoll::world::generateTrips(empty, cfg).empty(), "trips generated without edges");
    std::cout << "[PASS] 3B synthetic base demand\n";
}

// ============================================================================
// 4. Batch runner
// ============================================================================

// Stands in for the simulator: writes (or withholds) the tripinfo output and
// returns a scripted exit status per toll token.
class ScriptedSimulator : public evtoll::SimulatorRunner {
public:
    enum class Action { WriteValid, WriteMalformed, WriteNothing, Fail };

    std::map<std::string, Action> actions;
    std::vector<double> calls;

    int run(const evtoll::ScenarioFiles& files) override {
        calls.push_back(files.toll_eur);
        REQUIRE(fs::exists(files.routes_path), "routes not written before simulation");
        REQUIRE(fs::exists(files.config_path), "config not written before simulation");

        const auto it = actions.find(evtoll::encodeTollToken(files.toll_eur));
        const Action action = (it == actions.end()) ? Action::WriteValid : it->second;
        switch (action) {
            case Action::WriteValid: writeText(files.tripinfo_path, kTripinfoTwoIceOneEv); return 0;
            case Action::WriteMalformed: writeText(files.tripinfo_path, "<tripinfos><tripinfo"); return 0;
            case Action::WriteNothing: return 0;
            case Action::Fail: return 3;
        }
        return 0;
    }
};

static evtoll::BatchConfig batchConfig(const ScratchDir& dir, std::vector<double> grid) {
    const fs::path demand = dir.path() / "demand.xml";
    writeText(demand,
              "<routes>\n"
              "  <trip id=\"0\" depart=\"32400\" from=\"e1\" to=\"e2\"/>\n"
              "  <trip id=\"1\" depart=\"32500\" from=\"e2\" to=\"e3\"/>\n"
              "  <trip id=\"2\" depart=\"32600\" from=\"e3\" to=\"e1\"/>\n"
              "</routes>\n");
    evtoll::BatchConfig cfg;
    cfg.toll_grid = std::move(grid);
    cfg.demand_file = demand.string();
    cfg.net_file = (dir.path() / "net.xml").string();
    cfg.scenarios_dir = (dir.path() / "scenarios").string();
    return cfg;
}

static void runBatchSweep_4A() {
    ScratchDir dir("batch_sweep");
    evtoll::BatchRunner runner(batchConfig(dir, {2.0, 0.0, 1.0, 1.5}));
    std::ostringstream log;
    runner.setLogStream(&log);

    ScriptedSimulator sim;
    sim.actions["1_0"] = ScriptedSimulator::Action::WriteNothing;
    sim.actions["1_5"] = ScriptedSimulator::Action::WriteMalformed;

    const evtoll::BatchResult r = runner.run(sim);
    REQUIRE(r.ok(), "sweep failed: " << evtoll::batchStatusName(r.status) << " " << r.message);
    REQUIRE(sim.calls.size() == 4, "simulator call count");

    // 1.0 skipped (missing), 1.5 kept as a zeroed row.
    REQUIRE(r.rows.size() == 3, "row count " << r.rows.size());
    requireClose("row 0 toll", r.rows[0].toll_eur, 0.0, 0.0);
    requireClose("row 1 toll", r.rows[1].toll_eur, 1.5, 0.0);
    requireClose("row 2 toll", r.rows[2].toll_eur, 2.0, 0.0);
    REQUIRE(r.rows[1].total_vehicles == 0 && r.rows[1].total_co2_kg == 0.0, "malformed row not zeroed");
    requireClose("revenue at 2.0", r.rows[2].toll_revenue_eur, 4.0, 1e-12);
    requireClose("co2 at 2.0", r.rows[2].total_co2_kg, 2.0, 1e-12);
    requireClose("grid cost at 2.0", r.rows[2].grid_cost_eur, 0.8, 1e-12);

    REQUIRE(r.notes.size() == 2, "note count " << r.notes.size());
    REQUIRE(r.notes[0].issue == evtoll::ScenarioIssue::MissingArtifact, "1.0 note kind");
    REQUIRE(r.notes[1].issue == evtoll::ScenarioIssue::MalformedInput, "1.5 note kind");
    REQUIRE(r.skippedCount() == 1, "skipped count");

    const std::string text = log.str();
    REQUIRE(contains(text, "[INFO]"), "no info lines logged");
    REQUIRE(contains(text, "[WARN]"), "skip not logged as warning");

    const evtoll::ScenarioFiles files = evtoll::scenarioFiles(runner.config(), 2.0);
    std::ifstream cfgFile(files.config_path);
    std::stringstream cfgText;
    cfgText << cfgFile.rdbuf();
    REQUIRE(contains(cfgText.str(), "<net-file value=\"../net.xml\"/>"), "net path not relative to config");
    std::cout << "[PASS] 4A batch sweep with skipped and malformed prices\n";
}

static void runBatchSimulatorFailure_4B() {
    ScratchDir dir("batch_failure");
    evtoll::BatchRunner runner(batchConfig(dir, {0.0, 0.5, 1.0}));
    std::ostringstream log;
    runner.setLogStream(&log);

    ScriptedSimulator sim;
    sim.actions["0_5"] = ScriptedSimulator::Action::Fail;
    const evtoll::BatchResult r = runner.run(sim);
    REQUIRE(r.status == evtoll::BatchStatus::SimulatorFailure, "nonzero exit not fatal");
    requireClose("failed toll", r.failed_toll_eur, 0.5, 0.0);
    REQUIRE(sim.calls.size() == 2, "sweep continued after failure");
    REQUIRE(r.rows.empty(), "rows reported after failure");
    REQUIRE(contains(log.str(), "[ERROR]"), "failure not logged as error");
    std::cout << "[PASS] 4B simulator failure aborts the sweep\n";
}

static void runBatchRejections_4C() {
    ScratchDir dir("batch_reject");
    ScriptedSimulator sim;

    evtoll::BatchRunner emptyGrid(batchConfig(dir, {}));
    emptyGrid.setLogStream(nullptr);
    REQUIRE(emptyGrid.run(sim).status == evtoll::BatchStatus::NoTollPrices, "empty grid status");

    evtoll::BatchConfig bad = batchConfig(dir, {0.0, 1.0});
    bad.model.params.baseline_share = 0.95;
    evtoll::BatchRunner badModel(bad);
    badModel.setLogStream(nullptr);
    REQUIRE(badModel.run(sim).status == evtoll::BatchStatus::InvalidParameters, "bad model accepted");

    evtoll::BatchRunner lossy(batchConfig(dir, {1.25}));
    lossy.setLogStream(nullptr);
    REQUIRE(lossy.run(sim).status == evtoll::BatchStatus::InvalidParameters, "lossy toll accepted");

    evtoll::BatchRunner dup(batchConfig(dir, {1.0, 1.0}));
    dup.setLogStream(nullptr);
    REQUIRE(dup.run(sim).status == evtoll::BatchStatus::InvalidParameters, "duplicate toll accepted");

    evtoll::BatchConfig noDemand = batchConfig(dir, {0.0});
    noDemand.demand_file = (dir.path() / "absent.xml").string();
    evtoll::BatchRunner missingDemand(noDemand);
    missingDemand.setLogStream(nullptr);
    REQUIRE(missingDemand.run(sim).status == evtoll::BatchStatus::DemandUnavailable, "missing demand accepted");
    REQUIRE(sim.calls.empty(), "simulator ran despite rejection");

    evtoll::BatchRunner allSkipped(batchConfig(dir, {0.0, 0.5}));
    allSkipped.setLogStream(nullptr);
    sim.actions["0_0"] = ScriptedSimulator::Action::WriteNothing;
    sim.actions["0_5"] = ScriptedSimulator::Action::WriteNothing;
    const evtoll::BatchResult r = allSkipped.run(sim);
    REQUIRE(r.status == evtoll::BatchStatus::NoResults, "all-skipped status");
    REQUIRE(r.skippedCount() == 2, "all-skipped notes");
    std::cout << "[PASS] 4C batch rejections and empty results\n";
}

static void runAnalyzeExisting_4D() {
    ScratchDir dir("batch_analyze");
    evtoll::BatchConfig cfg = batchConfig(dir, {0.0, 0.5, 1.0});
    fs::create_directories(cfg.scenarios_dir);
    const fs::path scenarios(cfg.scenarios_dir);
    writeText(scenarios / evtoll::tripinfoFileName(1.0), kTripinfoTwoIceOneEv);
    writeText(scenarios / evtoll::tripinfoFileName(0.0), kTripinfoTwoIceOneEv);
    writeText(scenarios / "tripinfo_toll_x.xml", kTripinfoTwoIceOneEv);
    writeText(scenarios / "notes.txt", "unrelated");

    evtoll::BatchRunner runner(cfg);
    runner.setLogStream(nullptr);

    const evtoll::BatchResult dirResult = runner.analyzeDirectory();
    REQUIRE(dirResult.ok(), "directory analysis failed: " << dirResult.message);
    REQUIRE(dirResult.rows.size() == 2, "directory rows " << dirResult.rows.size());
    requireClose("dir row 0", dirResult.rows[0].toll_eur, 0.0, 0.0);
    requireClose("dir row 1", dirResult.rows[1].toll_eur, 1.0, 0.0);
    requireClose("dir revenue", dirResult.rows[1].toll_revenue_eur, 2.0, 1e-12);

    const evtoll::BatchResult gridResult = runner.analyzeGrid();
    REQUIRE(gridResult.ok(), "grid analysis failed");
    REQUIRE(gridResult.rows.size() == 2, "grid rows");
    REQUIRE(gridResult.notes.size() == 1 && gridResult.notes[0].toll_eur == 0.5, "grid missing note");

    evtoll::BatchConfig emptyCfg = cfg;
    emptyCfg.scenarios_dir = (dir.path() / "nothing_here").string();
    evtoll::BatchRunner emptyRunner(emptyCfg);
    emptyRunner.setLogStream(nullptr);
    REQUIRE(emptyRunner.analyzeDirectory().status == evtoll::BatchStatus::NoTollPrices, "missing dir status");

    // A scenarios path that is not a directory is reported, not thrown.
    evtoll::BatchConfig fileCfg = cfg;
    fileCfg.scenarios_dir = (dir.path() / "demand.xml").string();
    evtoll::BatchRunner fileRunner(fileCfg);
    fileRunner.setLogStream(nullptr);
    const evtoll::BatchResult notDir = fileRunner.analyzeDirectory();
    REQUIRE(notDir.status == evtoll::BatchStatus::NoTollPrices, "non-directory scan status");
    REQUIRE(!notDir.message.empty(), "non-directory scan without message");
    std::cout << "[PASS] 4D analysis of existing outputs\n";
}

} // namespace

int main() {
    // =======================
    // 1: Tripinfo aggregation
    // =======================
    runTripinfoDocument_1A();
    runTripinfoMalformed_1B();

    // =======================
    // 2: Demand / scenario files
    // =======================
    runDemandDocument_2A();
    runDemandRouteReferences_2A2();
    runDemandReferenceInBatch_2A3();
    runRoutesRoundTrip_2B();
    runSimulationConfig_2C();

    // =======================
    // 3: Road network / generator
    // =======================
    runRoadNetwork_3A();
    runDemandGenerator_3B();

    // =======================
    // 4: Batch runner
    // =======================
    runBatchSweep_4A();
    runBatchSimulatorFailure_4B();
    runBatchRejections_4C();
    runAnalyzeExisting_4D();

    return 0;
}
