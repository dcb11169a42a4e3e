#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include "AdoptionModel.h"
#include "FleetSynthesizer.h"
#include "TripAggregator.h"

namespace evtoll {

struct BatchConfig {
    std::vector<double> toll_grid {0.0, 0.5, 1.0, 1.5, 2.0, 2.5, 3.0};
    AdoptionModel model{};
    double grid_cost_eur_per_kwh = 0.20;
    std::string demand_file = "routes_vci_generated.xml";
    std::string net_file = "vci.net.xml";
    std::string scenarios_dir = "scenarios";
    SimulationWindow window{};
    std::uint32_t seed = 1337u;
};

// Files belonging to one toll price. Paths include scenarios_dir.
struct ScenarioFiles {
    double toll_eur = 0.0;
    std::string routes_path;
    std::string config_path;
    std::string tripinfo_path;
};

ScenarioFiles scenarioFiles(const BatchConfig& cfg, double toll_eur);

// External simulator seam. run() blocks until the simulator exits and
// returns its exit status (0 = success).
class SimulatorRunner {
public:
    virtual ~SimulatorRunner() = default;
    virtual int run(const ScenarioFiles& files) = 0;
};

// Invokes `<binary> -c <config> --xml-validation never` through the shell.
class SumoProcessRunner : public SimulatorRunner {
public:
    explicit SumoProcessRunner(std::string binary);
    int run(const ScenarioFiles& files) override;

    std::string commandLine(const ScenarioFiles& files) const;

private:
    std::string binary_;
};

enum class BatchStatus : std::uint8_t {
    Ok,
    NoTollPrices,       // empty grid
    NoResults,          // grid ran, every price was skipped
    InvalidParameters,
    DemandUnavailable,
    SimulatorFailure,
};

const char* batchStatusName(BatchStatus status);

enum class ScenarioIssue : std::uint8_t {
    MalformedInput,     // row kept, KPIs zeroed
    MissingArtifact,    // row dropped
    WriteFailed,        // row dropped
};

const char* scenarioIssueName(ScenarioIssue issue);

struct ScenarioNote {
    double toll_eur = 0.0;
    ScenarioIssue issue = ScenarioIssue::MissingArtifact;
    std::string message;
};

struct BatchResult {
    BatchStatus status = BatchStatus::Ok;
    std::string message;
    double failed_toll_eur = 0.0;        // set for SimulatorFailure
    std::vector<KpiResult> rows;          // ascending toll
    std::vector<ScenarioNote> notes;      // ascending toll

    bool ok() const { return status == BatchStatus::Ok; }
    std::size_t skippedCount() const;
};

class BatchRunner {
public:
    explicit BatchRunner(BatchConfig cfg);

    // Log sink for [INFO]/[WARN]/[ERROR] lines; nullptr silences the runner.
    void setLogStream(std::ostream* log) { log_ = log; }
    const BatchConfig& config() const { return cfg_; }

    // Validates the grid and the adoption model before any scenario work.
    ParameterCheck validate() const;

    // Synthesize and write the scenario files for one price.
    bool generateScenario(const std::vector<VehicleRecord>& demand,
                          double toll_eur,
                          ScenarioArtifact* artifact,
                          std::string* error) const;

    // Full sweep: synthesize -> simulate -> aggregate for every grid price.
    BatchResult run(SimulatorRunner& simulator) const;

    // Aggregate the simulator outputs already present for the grid prices.
    BatchResult analyzeGrid() const;

    // Aggregate every tripinfo_toll_<token>.xml found in scenarios_dir.
    BatchResult analyzeDirectory() const;

private:
    // Outcome of one independent per-price unit.
    struct UnitOutcome {
        bool has_row = false;
        KpiResult row{};
        bool has_note = false;
        ScenarioNote note{};
    };

    UnitOutcome aggregateUnit(double toll_eur, const std::string& tripinfo_path) const;
    void finish(BatchResult& result, std::vector<UnitOutcome>& units) const;
    void log(const char* level, const std::string& line) const;

    BatchConfig cfg_;
    std::ostream* log_;
};

} // namespace evtoll
