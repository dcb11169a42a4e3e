#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "AdoptionModel.h"

namespace evtoll {

class SensitivityAnalyzer {
public:
    enum class Parameter : std::uint8_t {
        Midpoint,
        Steepness,
        BaselineShare,
        MaxShare,
    };

    static constexpr int kParameterCount = 4;
    static const Parameter kAllParameters[kParameterCount];

    struct ParameterRange {
        double nominal = 0.0;
        double min = 0.0;
        double max = 0.0;
        int samples = 0;
    };

    struct Config {
        AdoptionModel reference{};
        double reference_toll_eur = 0.0;   // no-toll baseline
        double relative_step = 0.20;
        std::vector<double> toll_grid {0.0, 0.5, 1.0, 1.5, 2.0, 2.5, 3.0, 3.5, 4.0, 4.5, 5.0};
        double fleet_size = 2505.0;   // for the revenue estimate of value sweeps
    };

    // One (value, toll) point of a value sweep.
    struct SensitivityRow {
        std::string parameter_name;
        double parameter_value = 0.0;
        double toll_eur = 0.0;
        double ev_share = 0.0;
        double ice_share = 0.0;               // normalised CO2 factor
        double estimated_revenue_eur = 0.0;   // toll * ice_share * fleet_size
    };

    // Low/high values used for the tornado: nominal -/+ relative_step * nominal,
    // each side clamped to the parameter's valid range on its own
    // (max_share 0.90 -> 0.72 / 1.00).
    struct Perturbation {
        Parameter parameter = Parameter::Midpoint;
        double nominal = 0.0;
        double low_value = 0.0;
        double high_value = 0.0;
    };

    // One (parameter, side, toll) evaluation under a perturbed model.
    struct SensitivityRecord {
        Parameter parameter = Parameter::Midpoint;
        bool high_side = false;
        double parameter_value = 0.0;
        double toll_eur = 0.0;
        double ev_share = 0.0;
        double delta_vs_reference = 0.0;
    };

    struct TornadoEntry {
        Parameter parameter = Parameter::Midpoint;
        double low_value = 0.0;
        double high_value = 0.0;
        double low_delta = 0.0;
        double high_delta = 0.0;
        double impact = 0.0;    // |high_delta - low_delta|
    };

    SensitivityAnalyzer();

    void setConfig(const Config& config);
    const Config& config() const;
    void clearResults();

    ParameterCheck validate() const;

    void analyzeMidpoint(const ParameterRange& range);
    void analyzeSteepness(const ParameterRange& range);
    void analyzeBaselineShare(const ParameterRange& range);
    void analyzeMaxShare(const ParameterRange& range);
    void analyze(Parameter parameter, const ParameterRange& range);

    // Ranges mirroring the hand-picked sweeps used during calibration.
    static ParameterRange defaultRange(Parameter parameter);

    Perturbation perturbation(Parameter parameter) const;

    // Ranked by impact, largest first. Ties keep kAllParameters order.
    std::vector<TornadoEntry> tornado() const;

    // Low and high adoption curves over toll_grid for every parameter.
    std::vector<SensitivityRecord> perturbationCurves() const;

    bool exportSensitivityMatrixCSV(const std::string& filename) const;
    bool exportTornadoCSV(const std::string& filename) const;
    bool exportCurvesCSV(const std::string& filename) const;
    bool exportReportMarkdown(const std::string& filename) const;

    const std::vector<SensitivityRow>& results() const;

    static double parameterValue(const AdoptionParameters& params, Parameter parameter);
    static AdoptionModel withParameter(const AdoptionModel& model, Parameter parameter, double value);

private:
    Config config_{};
    std::vector<SensitivityRow> results_{};

    std::vector<double> sampleValues(const ParameterRange& range) const;
};

const char* parameterName(SensitivityAnalyzer::Parameter parameter);

} // namespace evtoll
