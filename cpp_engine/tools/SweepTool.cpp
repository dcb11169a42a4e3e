#include "SensitivityAnalysis.h"
#include "UncertaintyQuantification.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {
std::string toLower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

void printUsage() {
    std::cout << "SweepTool usage:\n"
              << "  SweepTool --param <midpoint|steepness|baseline|max_share> [--min v] [--max v] [--samples n] [--out file]\n"
              << "  SweepTool --tornado [--ref-toll v] [--step r] [--out file] [--curves file] [--report file]\n"
              << "  SweepTool --uq --toll v [--vehicles n] [--runs n] [--seed n]\n"
              << "Model: [--baseline v] [--max-share v] [--midpoint v] [--steepness v] [--zero-toll-share v]\n";
}

bool parseParameter(const std::string& name, evtoll::SensitivityAnalyzer::Parameter& out) {
    using P = evtoll::SensitivityAnalyzer::Parameter;
    if (name == "midpoint") {
        out = P::Midpoint;
    } else if (name == "steepness" || name == "k") {
        out = P::Steepness;
    } else if (name == "baseline" || name == "baseline_share") {
        out = P::BaselineShare;
    } else if (name == "max_share" || name == "max" || name == "saturation") {
        out = P::MaxShare;
    } else {
        return false;
    }
    return true;
}
} // namespace

int main(int argc, char** argv) {
    std::string param;
    double min_val = 0.0;
    double max_val = 0.0;
    int samples = 6;
    bool min_set = false;
    bool max_set = false;
    bool tornado = false;
    bool uq = false;
    double uq_toll = 0.0;
    int uq_vehicles = 10000;
    int uq_runs = 100;
    unsigned long seed = 1337ul;
    std::string out;
    std::string curves_out;
    std::string report_out;

    evtoll::SensitivityAnalyzer::Config config;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--param" && i + 1 < argc) {
                param = toLower(argv[++i]);
            } else if (arg == "--min" && i + 1 < argc) {
                min_val = std::stod(argv[++i]);
                min_set = true;
            } else if (arg == "--max" && i + 1 < argc) {
                max_val = std::stod(argv[++i]);
                max_set = true;
            } else if (arg == "--samples" && i + 1 < argc) {
                samples = std::stoi(argv[++i]);
            } else if (arg == "--out" && i + 1 < argc) {
                out = argv[++i];
            } else if (arg == "--tornado") {
                tornado = true;
            } else if (arg == "--ref-toll" && i + 1 < argc) {
                config.reference_toll_eur = std::stod(argv[++i]);
            } else if (arg == "--step" && i + 1 < argc) {
                config.relative_step = std::stod(argv[++i]);
            } else if (arg == "--curves" && i + 1 < argc) {
                curves_out = argv[++i];
            } else if (arg == "--report" && i + 1 < argc) {
                report_out = argv[++i];
            } else if (arg == "--uq") {
                uq = true;
            } else if (arg == "--toll" && i + 1 < argc) {
                uq_toll = std::stod(argv[++i]);
            } else if (arg == "--vehicles" && i + 1 < argc) {
                uq_vehicles = std::stoi(argv[++i]);
            } else if (arg == "--runs" && i + 1 < argc) {
                uq_runs = std::stoi(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = std::stoul(argv[++i]);
            } else if (arg == "--baseline" && i + 1 < argc) {
                config.reference.params.baseline_share = std::stod(argv[++i]);
            } else if (arg == "--max-share" && i + 1 < argc) {
                config.reference.params.max_share = std::stod(argv[++i]);
            } else if (arg == "--midpoint" && i + 1 < argc) {
                config.reference.params.midpoint_eur = std::stod(argv[++i]);
            } else if (arg == "--steepness" && i + 1 < argc) {
                config.reference.params.steepness = std::stod(argv[++i]);
            } else if (arg == "--zero-toll-share" && i + 1 < argc) {
                config.reference.zero_toll_override = std::stod(argv[++i]);
            } else if (arg == "--help" || arg == "-h") {
                printUsage();
                return 0;
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

    if (param.empty() && !tornado && !uq) {
        printUsage();
        return 1;
    }

    evtoll::SensitivityAnalyzer analyzer;
    analyzer.setConfig(config);
    const evtoll::ParameterCheck check = analyzer.validate();
    if (!check.ok) {
        std::cout << "Invalid parameters: " << check.message << "\n";
        return 1;
    }

    if (!param.empty()) {
        evtoll::SensitivityAnalyzer::Parameter parameter;
        if (!parseParameter(param, parameter)) {
            std::cout << "Unsupported parameter: " << param << "\n";
            printUsage();
            return 1;
        }
        auto range = evtoll::SensitivityAnalyzer::defaultRange(parameter);
        range.nominal = evtoll::SensitivityAnalyzer::parameterValue(config.reference.params, parameter);
        range.samples = samples;
        if (min_set) range.min = min_val;
        if (max_set) range.max = max_val;

        analyzer.analyze(parameter, range);
        const std::string file = out.empty() ? "sensitivity_" + param + ".csv" : out;
        if (!analyzer.exportSensitivityMatrixCSV(file)) {
            std::cout << "Cannot write " << file << "\n";
            return 1;
        }
        std::cout << "Wrote sensitivity sweep to: " << file << "\n";

        if (parameter == evtoll::SensitivityAnalyzer::Parameter::Steepness) {
            double last = -1.0;
            for (const auto& row : analyzer.results()) {
                if (row.parameter_value == last) continue;
                last = row.parameter_value;
                evtoll::AdoptionParameters p = config.reference.params;
                p.steepness = row.parameter_value;
                std::cout << "  k=" << row.parameter_value << ": slope at midpoint "
                          << evtoll::transitionSlopeAtMidpoint(p) * 100.0 << " %/EUR\n";
            }
        }
    }

    if (tornado) {
        std::cout << "=== SENSITIVITY RANKING (EV share at " << config.reference_toll_eur << " EUR) ===\n";
        std::cout << std::fixed << std::setprecision(2);
        for (const auto& e : analyzer.tornado()) {
            std::cout << "  " << evtoll::parameterName(e.parameter) << ": +/-"
                      << (e.impact * 100.0 / 2.0) << "% EV share change\n";
        }
        const std::string file = out.empty() || !param.empty() ? "tornado.csv" : out;
        if (!analyzer.exportTornadoCSV(file)) {
            std::cout << "Cannot write " << file << "\n";
            return 1;
        }
        std::cout << "Wrote tornado ranking to: " << file << "\n";
        if (!curves_out.empty()) {
            if (!analyzer.exportCurvesCSV(curves_out)) {
                std::cout << "Cannot write " << curves_out << "\n";
                return 1;
            }
            std::cout << "Wrote adoption curves to: " << curves_out << "\n";
        }
        if (!report_out.empty()) {
            if (!analyzer.exportReportMarkdown(report_out)) {
                std::cout << "Cannot write " << report_out << "\n";
                return 1;
            }
            std::cout << "Wrote sensitivity report to: " << report_out << "\n";
        }
    }

    if (uq) {
        if (uq_vehicles < 0) {
            std::cout << "--vehicles must be nonnegative\n";
            return 1;
        }
        evtoll::MonteCarloUQ mc;
        mc.setModel(config.reference);
        mc.setBaseSeed(static_cast<std::uint32_t>(seed));
        const auto fleet = evtoll::MonteCarloUQ::placeholderFleet(static_cast<std::size_t>(uq_vehicles));
        const auto s = mc.runMonteCarlo(fleet, uq_toll, uq_runs);
        std::cout << std::fixed << std::setprecision(4)
                  << "Fleet sampling at " << s.toll_eur << " EUR (N=" << s.fleet_size << ", runs=" << s.runs << ")\n"
                  << "  target EV share:   " << s.target_ev_share << "\n"
                  << "  realised mean:     " << s.ev_share.mean << "\n"
                  << "  realised median:   " << s.ev_share.median << "\n"
                  << "  95% band:          [" << s.ev_share.ci_lower_95 << ", " << s.ev_share.ci_upper_95 << "]\n"
                  << "  std dev:           " << s.ev_share.std_dev << "\n"
                  << "  binomial std dev:  " << s.expected_share_std_dev << "\n";
    }
    return 0;
}
