#include "KpiReport.h"
#include "ScenarioBatch.h"
#include "ScenarioIO.h"
#include "ScenarioNaming.h"
#include "demand_generator.h"
#include "road_network.h"

#include <cstdint>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void printUsage() {
    std::cout << "TollBatch usage:\n"
              << "  TollBatch demand   --net file [--vehicles n] [--out trips.xml]\n"
              << "  TollBatch generate [--toll v | --tolls a,b,...] --demand file --net file [--dir scenarios]\n"
              << "  TollBatch run      --sumo binary --demand file --net file [--tolls a,b,...] [--dir scenarios]\n"
              << "  TollBatch analyze  [--dir scenarios] [--tolls a,b,...]\n"
              << "Options: [--rate eur_per_kwh] [--seed n] [--begin s] [--end s]\n"
              << "         [--csv simulation_results.csv] [--report simulation_report.md]\n"
              << "Model:   [--baseline v] [--max-share v] [--midpoint v] [--steepness v] [--zero-toll-share v]\n";
}

std::vector<double> parseList(const std::string& text) {
    std::vector<double> values;
    std::istringstream in(text);
    std::string cell;
    while (std::getline(in, cell, ',')) {
        if (!cell.empty()) values.push_back(std::stod(cell));
    }
    return values;
}

int reportBatch(const evtoll::BatchResult& result, const std::string& csv, const std::string& report) {
    if (result.status == evtoll::BatchStatus::SimulatorFailure) {
        std::cout << "Sweep aborted at toll " << result.failed_toll_eur << " EUR: " << result.message << "\n";
        return 2;
    }
    if (result.status == evtoll::BatchStatus::NoTollPrices) {
        std::cout << "No toll prices to process: " << result.message << "\n";
        return 1;
    }
    if (result.status != evtoll::BatchStatus::Ok && result.status != evtoll::BatchStatus::NoResults) {
        std::cout << evtoll::batchStatusName(result.status) << ": " << result.message << "\n";
        return 1;
    }

    for (const auto& note : result.notes) {
        std::cout << "  toll " << note.toll_eur << " EUR: " << evtoll::scenarioIssueName(note.issue) << "\n";
    }
    if (result.status == evtoll::BatchStatus::NoResults) {
        std::cout << "No results found.\n";
        return 1;
    }

    if (!evtoll::exportKpiCsv(csv, result.rows)) {
        std::cout << "Cannot write " << csv << "\n";
        return 1;
    }
    std::cout << "Results saved to " << csv << "\n";
    if (!evtoll::exportKpiMarkdown(report, result.rows)) {
        std::cout << "Cannot write " << report << "\n";
        return 1;
    }
    std::cout << "Report saved to " << report << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage();
        return 1;
    }

    const std::string mode = argv[1];
    if (mode == "--help" || mode == "-h") {
        printUsage();
        return 0;
    }

    evtoll::BatchConfig cfg;
    evtoll::world::DemandConfig demand_cfg;
    std::string sumo_binary = "sumo";
    std::string trips_out = "trips_generated.xml";
    std::string csv = "simulation_results.csv";
    std::string report = "simulation_report.md";
    bool tolls_set = false;

    try {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--toll" && i + 1 < argc) {
                cfg.toll_grid = {std::stod(argv[++i])};
                tolls_set = true;
            } else if (arg == "--tolls" && i + 1 < argc) {
                cfg.toll_grid = parseList(argv[++i]);
                tolls_set = true;
            } else if (arg == "--demand" && i + 1 < argc) {
                cfg.demand_file = argv[++i];
            } else if (arg == "--net" && i + 1 < argc) {
                cfg.net_file = argv[++i];
            } else if (arg == "--dir" && i + 1 < argc) {
                cfg.scenarios_dir = argv[++i];
            } else if (arg == "--sumo" && i + 1 < argc) {
                sumo_binary = argv[++i];
            } else if (arg == "--rate" && i + 1 < argc) {
                cfg.grid_cost_eur_per_kwh = std::stod(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                cfg.seed = static_cast<std::uint32_t>(std::stoul(argv[++i]));
                demand_cfg.seed = cfg.seed;
            } else if (arg == "--begin" && i + 1 < argc) {
                cfg.window.begin_s = std::stod(argv[++i]);
                demand_cfg.begin_s = cfg.window.begin_s;
            } else if (arg == "--end" && i + 1 < argc) {
                cfg.window.end_s = std::stod(argv[++i]);
                demand_cfg.end_s = cfg.window.end_s;
            } else if (arg == "--vehicles" && i + 1 < argc) {
                demand_cfg.num_vehicles = std::stoi(argv[++i]);
            } else if (arg == "--out" && i + 1 < argc) {
                trips_out = argv[++i];
            } else if (arg == "--csv" && i + 1 < argc) {
                csv = argv[++i];
            } else if (arg == "--report" && i + 1 < argc) {
                report = argv[++i];
            } else if (arg == "--baseline" && i + 1 < argc) {
                cfg.model.params.baseline_share = std::stod(argv[++i]);
            } else if (arg == "--max-share" && i + 1 < argc) {
                cfg.model.params.max_share = std::stod(argv[++i]);
            } else if (arg == "--midpoint" && i + 1 < argc) {
                cfg.model.params.midpoint_eur = std::stod(argv[++i]);
            } else if (arg == "--steepness" && i + 1 < argc) {
                cfg.model.params.steepness = std::stod(argv[++i]);
            } else if (arg == "--zero-toll-share" && i + 1 < argc) {
                cfg.model.zero_toll_override = std::stod(argv[++i]);
            } else {
                std::cout << "Unknown argument: " << arg << "\n";
                printUsage();
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cout << "Invalid numeric argument (" << e.what() << ")\n";
        printUsage();
        return 1;
    }

    if (mode == "demand") {
        evtoll::world::RoadNetwork network;
        if (!network.loadFile(cfg.net_file)) {
            std::cout << "Cannot read network: " << network.lastError() << "\n";
            return 1;
        }
        std::cout << "Found " << network.edges().size() << " edges\n";
        const auto trips = evtoll::world::generateTrips(network, demand_cfg);
        if (trips.empty()) {
            std::cout << "Network has no usable edges; no trips generated\n";
            return 1;
        }
        std::string error;
        if (!evtoll::writeTripsFile(trips, trips_out, &error)) {
            std::cout << error << "\n";
            return 1;
        }
        std::cout << "Created " << trips.size() << " trips in " << trips_out << "\n";
        return 0;
    }

    evtoll::BatchRunner runner(cfg);

    if (mode == "generate") {
        if (cfg.toll_grid.empty()) {
            std::cout << "No toll prices requested\n";
            return 1;
        }
        const evtoll::ParameterCheck check = runner.validate();
        if (!check.ok) {
            std::cout << "Invalid parameters: " << check.message << "\n";
            return 1;
        }
        const evtoll::DemandLoadResult demand = evtoll::loadDemandFile(cfg.demand_file);
        if (!demand.ok) {
            std::cout << "Error processing routes file: " << demand.message << "\n";
            return 1;
        }
        for (double toll : cfg.toll_grid) {
            evtoll::ScenarioArtifact artifact;
            std::string error;
            if (!runner.generateScenario(demand.vehicles, toll, &artifact, &error)) {
                std::cout << "Scenario for toll " << toll << " EUR failed: " << error << "\n";
                return 1;
            }
            std::cout << "Generated " << evtoll::scenarioName(toll) << ": EV share "
                      << artifact.target_ev_share * 100.0 << "%\n";
        }
        return 0;
    }

    if (mode == "run") {
        evtoll::SumoProcessRunner simulator(sumo_binary);
        return reportBatch(runner.run(simulator), csv, report);
    }

    if (mode == "analyze") {
        return reportBatch(tolls_set ? runner.analyzeGrid() : runner.analyzeDirectory(), csv, report);
    }

    std::cout << "Unknown mode: " << mode << "\n";
    printUsage();
    return 1;
}
