#include "ScenarioBatch.h"

#include "ScenarioIO.h"
#include "ScenarioNaming.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <set>
#include <sstream>
#include <system_error>
#include <utility>

namespace evtoll {

namespace fs = std::filesystem;

namespace {

std::string formatToll(double toll_eur) {
    std::ostringstream s;
    s << toll_eur << " EUR";
    return s.str();
}

// Net file as seen from the directory holding the config.
std::string netPathFromConfigDir(const std::string& net_file, const std::string& scenarios_dir) {
    std::error_code ec;
    const fs::path net = fs::absolute(net_file, ec);
    if (ec) return net_file;
    const fs::path dir = fs::absolute(scenarios_dir, ec);
    if (ec) return net.string();
    const fs::path rel = net.lexically_relative(dir);
    return rel.empty() ? net.string() : rel.generic_string();
}

} // namespace

ScenarioFiles scenarioFiles(const BatchConfig& cfg, double toll_eur) {
    const fs::path dir(cfg.scenarios_dir);
    ScenarioFiles files;
    files.toll_eur = toll_eur;
    files.routes_path = (dir / routesFileName(toll_eur)).string();
    files.config_path = (dir / configFileName(toll_eur)).string();
    files.tripinfo_path = (dir / tripinfoFileName(toll_eur)).string();
    return files;
}

SumoProcessRunner::SumoProcessRunner(std::string binary) : binary_(std::move(binary)) {}

std::string SumoProcessRunner::commandLine(const ScenarioFiles& files) const {
    return "\"" + binary_ + "\" -c \"" + files.config_path + "\" --xml-validation never";
}

int SumoProcessRunner::run(const ScenarioFiles& files) {
    const int rc = std::system(commandLine(files).c_str());
    return rc;
}

const char* batchStatusName(BatchStatus status) {
    switch (status) {
        case BatchStatus::Ok: return "ok";
        case BatchStatus::NoTollPrices: return "no toll prices requested";
        case BatchStatus::NoResults: return "no scenario produced results";
        case BatchStatus::InvalidParameters: return "invalid parameters";
        case BatchStatus::DemandUnavailable: return "base demand unavailable";
        case BatchStatus::SimulatorFailure: return "simulator failure";
    }
    return "unknown";
}

const char* scenarioIssueName(ScenarioIssue issue) {
    switch (issue) {
        case ScenarioIssue::MalformedInput: return "malformed trip records";
        case ScenarioIssue::MissingArtifact: return "missing simulator output";
        case ScenarioIssue::WriteFailed: return "scenario files could not be written";
    }
    return "unknown";
}

std::size_t BatchResult::skippedCount() const {
    return static_cast<std::size_t>(std::count_if(notes.begin(), notes.end(), [](const ScenarioNote& n) {
        return n.issue != ScenarioIssue::MalformedInput;
    }));
}

BatchRunner::BatchRunner(BatchConfig cfg) : cfg_(std::move(cfg)), log_(&std::cerr) {}

void BatchRunner::log(const char* level, const std::string& line) const {
    if (log_ != nullptr) {
        (*log_) << level << ' ' << line << '\n';
    }
}

ParameterCheck BatchRunner::validate() const {
    ParameterCheck check = validateAdoptionModel(cfg_.model);
    if (!check.ok) {
        return check;
    }
    if (!std::isfinite(cfg_.grid_cost_eur_per_kwh) || cfg_.grid_cost_eur_per_kwh < 0.0) {
        check.ok = false;
        check.message = "grid cost rate must be a nonnegative EUR/kWh value";
        return check;
    }
    std::set<std::string> tokens;
    for (double toll : cfg_.toll_grid) {
        if (!tollRoundTrips(toll)) {
            check.ok = false;
            check.message = "toll price " + std::to_string(toll) +
                            " is negative or not representable with one decimal";
            return check;
        }
        if (!tokens.insert(encodeTollToken(toll)).second) {
            check.ok = false;
            check.message = "duplicate toll price " + formatToll(toll);
            return check;
        }
    }
    return check;
}

bool BatchRunner::generateScenario(const std::vector<VehicleRecord>& demand,
                                   double toll_eur,
                                   ScenarioArtifact* artifact,
                                   std::string* error) const {
    ScenarioArtifact local = synthesizeScenario(demand, toll_eur, cfg_.model,
                                                scenarioSeed(cfg_.seed, toll_eur), cfg_.window);

    std::error_code ec;
    fs::create_directories(cfg_.scenarios_dir, ec);
    if (ec) {
        if (error) *error = "cannot create " + cfg_.scenarios_dir + ": " + ec.message();
        return false;
    }

    const ScenarioFiles files = scenarioFiles(cfg_, toll_eur);
    ConfigPaths paths;
    paths.net_file = netPathFromConfigDir(cfg_.net_file, cfg_.scenarios_dir);
    paths.routes_file = routesFileName(toll_eur);
    paths.tripinfo_file = local.tripinfo_output;

    if (!writeRoutesFile(local, files.routes_path, error) ||
        !writeSimulationConfigFile(local, paths, files.config_path, error)) {
        return false;
    }

    std::ostringstream line;
    line << "toll " << formatToll(toll_eur) << ": target EV share " << local.target_ev_share
         << ", labeled " << local.evCount() << " EV / " << local.iceCount() << " ICE -> "
         << files.routes_path;
    log("[INFO]", line.str());

    if (artifact) *artifact = std::move(local);
    return true;
}

BatchRunner::UnitOutcome BatchRunner::aggregateUnit(double toll_eur, const std::string& tripinfo_path) const {
    UnitOutcome unit;
    const AggregateOutcome agg = aggregateTripinfoFile(tripinfo_path);
    switch (agg.status) {
        case AggregateStatus::Ok:
            unit.has_row = true;
            unit.row = computeKpi(toll_eur, cfg_.grid_cost_eur_per_kwh, agg.totals);
            break;
        case AggregateStatus::MalformedInput:
            // Kept as an all-zero row so the price stays visible in the table.
            unit.has_row = true;
            unit.row = computeKpi(toll_eur, cfg_.grid_cost_eur_per_kwh, TripTotals{});
            unit.has_note = true;
            unit.note = {toll_eur, ScenarioIssue::MalformedInput, agg.message};
            log("[WARN]", "toll " + formatToll(toll_eur) + ": KPIs zeroed, " +
                              scenarioIssueName(ScenarioIssue::MalformedInput) + " (" + agg.message + ")");
            break;
        case AggregateStatus::MissingArtifact:
            unit.has_note = true;
            unit.note = {toll_eur, ScenarioIssue::MissingArtifact, agg.message};
            log("[WARN]", "toll " + formatToll(toll_eur) + " skipped: " +
                              scenarioIssueName(ScenarioIssue::MissingArtifact) + " (" + agg.message + ")");
            break;
    }
    return unit;
}

void BatchRunner::finish(BatchResult& result, std::vector<UnitOutcome>& units) const {
    for (auto& u : units) {
        if (u.has_row) result.rows.push_back(u.row);
        if (u.has_note) result.notes.push_back(std::move(u.note));
    }
    std::stable_sort(result.rows.begin(), result.rows.end(), [](const KpiResult& a, const KpiResult& b) {
        return a.toll_eur < b.toll_eur;
    });
    std::stable_sort(result.notes.begin(), result.notes.end(), [](const ScenarioNote& a, const ScenarioNote& b) {
        return a.toll_eur < b.toll_eur;
    });

    if (result.rows.empty()) {
        result.status = BatchStatus::NoResults;
        result.message = "every requested toll price was skipped";
        log("[WARN]", result.message);
        return;
    }
    std::ostringstream line;
    line << result.rows.size() << " scenario(s) aggregated, " << result.skippedCount() << " skipped";
    log("[INFO]", line.str());
}

BatchResult BatchRunner::run(SimulatorRunner& simulator) const {
    BatchResult result;
    if (cfg_.toll_grid.empty()) {
        result.status = BatchStatus::NoTollPrices;
        result.message = "toll grid is empty";
        log("[WARN]", result.message);
        return result;
    }
    const ParameterCheck check = validate();
    if (!check.ok) {
        result.status = BatchStatus::InvalidParameters;
        result.message = check.message;
        log("[ERROR]", "invalid parameters: " + check.message);
        return result;
    }

    const DemandLoadResult demand = loadDemandFile(cfg_.demand_file);
    if (!demand.ok) {
        result.status = BatchStatus::DemandUnavailable;
        result.message = demand.message;
        log("[ERROR]", "cannot load base demand: " + demand.message);
        return result;
    }
    log("[INFO]", "loaded " + std::to_string(demand.vehicles.size()) + " vehicles from " + cfg_.demand_file);

    // Each price is an independent unit; only `units` is shared and it is
    // merged and sorted after the loop.
    std::vector<UnitOutcome> units;
    units.reserve(cfg_.toll_grid.size());
    for (double toll : cfg_.toll_grid) {
        std::string error;
        if (!generateScenario(demand.vehicles, toll, nullptr, &error)) {
            UnitOutcome unit;
            unit.has_note = true;
            unit.note = {toll, ScenarioIssue::WriteFailed, error};
            log("[WARN]", "toll " + formatToll(toll) + " skipped: " +
                              scenarioIssueName(ScenarioIssue::WriteFailed) + " (" + error + ")");
            units.push_back(std::move(unit));
            continue;
        }

        const ScenarioFiles files = scenarioFiles(cfg_, toll);
        const int rc = simulator.run(files);
        if (rc != 0) {
            std::ostringstream msg;
            msg << "simulator exited with status " << rc << " for toll " << formatToll(toll);
            result.status = BatchStatus::SimulatorFailure;
            result.failed_toll_eur = toll;
            result.message = msg.str();
            log("[ERROR]", msg.str() + "; sweep aborted");
            return result;
        }
        units.push_back(aggregateUnit(toll, files.tripinfo_path));
    }

    finish(result, units);
    return result;
}

BatchResult BatchRunner::analyzeGrid() const {
    BatchResult result;
    if (cfg_.toll_grid.empty()) {
        result.status = BatchStatus::NoTollPrices;
        result.message = "toll grid is empty";
        log("[WARN]", result.message);
        return result;
    }
    const ParameterCheck check = validate();
    if (!check.ok) {
        result.status = BatchStatus::InvalidParameters;
        result.message = check.message;
        log("[ERROR]", "invalid parameters: " + check.message);
        return result;
    }

    std::vector<UnitOutcome> units;
    for (double toll : cfg_.toll_grid) {
        units.push_back(aggregateUnit(toll, scenarioFiles(cfg_, toll).tripinfo_path));
    }
    finish(result, units);
    return result;
}

BatchResult BatchRunner::analyzeDirectory() const {
    BatchResult result;
    std::error_code ec;
    fs::directory_iterator it(cfg_.scenarios_dir, ec);
    if (ec) {
        result.status = BatchStatus::NoTollPrices;
        result.message = "cannot read " + cfg_.scenarios_dir + ": " + ec.message();
        log("[WARN]", result.message);
        return result;
    }

    // Sorted by file name so duplicate tokens resolve the same way every run.
    std::vector<fs::path> candidates;
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) candidates.push_back(it->path());
    }
    if (ec) {
        result.status = BatchStatus::NoTollPrices;
        result.message = "cannot read " + cfg_.scenarios_dir + ": " + ec.message();
        log("[WARN]", result.message);
        return result;
    }
    std::sort(candidates.begin(), candidates.end());

    std::set<double> seen;
    std::vector<UnitOutcome> units;
    for (const auto& path : candidates) {
        const auto toll = tollFromTripinfoFileName(path.filename().string());
        if (!toll) continue;
        if (!seen.insert(*toll).second) {
            log("[WARN]", "ignoring " + path.string() + ": toll " + formatToll(*toll) + " already analysed");
            continue;
        }
        log("[INFO]", "analysing scenario: toll " + formatToll(*toll));
        units.push_back(aggregateUnit(*toll, path.string()));
    }

    if (units.empty()) {
        result.status = BatchStatus::NoTollPrices;
        result.message = "no tripinfo_toll_*.xml outputs in " + cfg_.scenarios_dir;
        log("[WARN]", result.message);
        return result;
    }
    finish(result, units);
    return result;
}

} // namespace evtoll
