#include "SensitivityAnalysis.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>

namespace evtoll {

const SensitivityAnalyzer::Parameter SensitivityAnalyzer::kAllParameters[SensitivityAnalyzer::kParameterCount] = {
    Parameter::Midpoint,
    Parameter::Steepness,
    Parameter::BaselineShare,
    Parameter::MaxShare,
};

const char* parameterName(SensitivityAnalyzer::Parameter parameter) {
    switch (parameter) {
        case SensitivityAnalyzer::Parameter::Midpoint: return "midpoint";
        case SensitivityAnalyzer::Parameter::Steepness: return "steepness";
        case SensitivityAnalyzer::Parameter::BaselineShare: return "baseline_share";
        case SensitivityAnalyzer::Parameter::MaxShare: return "max_share";
    }
    return "unknown";
}

SensitivityAnalyzer::SensitivityAnalyzer() = default;

void SensitivityAnalyzer::setConfig(const Config& config) {
    config_ = config;
}

const SensitivityAnalyzer::Config& SensitivityAnalyzer::config() const {
    return config_;
}

void SensitivityAnalyzer::clearResults() {
    results_.clear();
}

ParameterCheck SensitivityAnalyzer::validate() const {
    ParameterCheck check = validateAdoptionModel(config_.reference);
    if (!check.ok) return check;
    if (!std::isfinite(config_.relative_step) || config_.relative_step <= 0.0 || config_.relative_step >= 1.0) {
        check.ok = false;
        check.message = "relative_step must be in (0,1)";
    } else if (!std::isfinite(config_.reference_toll_eur) || config_.reference_toll_eur < 0.0) {
        check.ok = false;
        check.message = "reference toll must be a nonnegative price";
    }
    return check;
}

double SensitivityAnalyzer::parameterValue(const AdoptionParameters& params, Parameter parameter) {
    switch (parameter) {
        case Parameter::Midpoint: return params.midpoint_eur;
        case Parameter::Steepness: return params.steepness;
        case Parameter::BaselineShare: return params.baseline_share;
        case Parameter::MaxShare: return params.max_share;
    }
    return 0.0;
}

AdoptionModel SensitivityAnalyzer::withParameter(const AdoptionModel& model, Parameter parameter, double value) {
    AdoptionModel out = model;
    switch (parameter) {
        case Parameter::Midpoint: out.params.midpoint_eur = value; break;
        case Parameter::Steepness: out.params.steepness = value; break;
        case Parameter::BaselineShare: out.params.baseline_share = value; break;
        case Parameter::MaxShare: out.params.max_share = value; break;
    }
    return out;
}

std::vector<double> SensitivityAnalyzer::sampleValues(const ParameterRange& range) const {
    std::vector<double> values;
    if (range.samples <= 1 || range.max <= range.min) {
        values.push_back(range.nominal);
        return values;
    }

    values.reserve(static_cast<std::size_t>(range.samples));
    const double span = range.max - range.min;
    const int steps = range.samples - 1;
    for (int i = 0; i < range.samples; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(steps);
        values.push_back(range.min + span * t);
    }
    return values;
}

SensitivityAnalyzer::ParameterRange SensitivityAnalyzer::defaultRange(Parameter parameter) {
    const AdoptionParameters defaults{};
    ParameterRange range;
    range.nominal = parameterValue(defaults, parameter);
    range.samples = 6;
    switch (parameter) {
        case Parameter::Midpoint:      range.min = 1.0;  range.max = 3.5;  break;
        case Parameter::Steepness:     range.min = 0.2;  range.max = 1.5;  break;
        case Parameter::BaselineShare: range.min = 0.0;  range.max = 0.25; break;
        case Parameter::MaxShare:      range.min = 0.70; range.max = 1.0;  break;
    }
    return range;
}

void SensitivityAnalyzer::analyze(Parameter parameter, const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        const AdoptionModel model = withParameter(config_.reference, parameter, value);
        if (!validateAdoptionModel(model).ok) {
            continue;
        }
        for (double toll : config_.toll_grid) {
            SensitivityRow row;
            row.parameter_name = parameterName(parameter);
            row.parameter_value = value;
            row.toll_eur = toll;
            row.ev_share = model.share(toll);
            row.ice_share = 1.0 - row.ev_share;
            row.estimated_revenue_eur = toll * row.ice_share * config_.fleet_size;
            results_.push_back(row);
        }
    }
}

void SensitivityAnalyzer::analyzeMidpoint(const ParameterRange& range) {
    analyze(Parameter::Midpoint, range);
}

void SensitivityAnalyzer::analyzeSteepness(const ParameterRange& range) {
    analyze(Parameter::Steepness, range);
}

void SensitivityAnalyzer::analyzeBaselineShare(const ParameterRange& range) {
    analyze(Parameter::BaselineShare, range);
}

void SensitivityAnalyzer::analyzeMaxShare(const ParameterRange& range) {
    analyze(Parameter::MaxShare, range);
}

SensitivityAnalyzer::Perturbation SensitivityAnalyzer::perturbation(Parameter parameter) const {
    const AdoptionParameters& p = config_.reference.params;
    const double inf = std::numeric_limits<double>::infinity();

    double lo = 0.0;
    double hi = inf;
    switch (parameter) {
        case Parameter::Midpoint:      lo = 0.0;              hi = inf;          break;
        case Parameter::Steepness:     lo = 0.0;              hi = inf;          break;
        case Parameter::BaselineShare: lo = 0.0;              hi = p.max_share;  break;
        case Parameter::MaxShare:      lo = p.baseline_share; hi = 1.0;          break;
    }

    Perturbation out;
    out.parameter = parameter;
    out.nominal = parameterValue(p, parameter);

    // Each side is clamped to the valid range on its own.
    const double step = std::fabs(out.nominal) * config_.relative_step;
    out.low_value = std::max(lo, out.nominal - step);
    out.high_value = std::min(hi, out.nominal + step);
    return out;
}

std::vector<SensitivityAnalyzer::TornadoEntry> SensitivityAnalyzer::tornado() const {
    std::vector<TornadoEntry> entries;
    const double toll = config_.reference_toll_eur;
    const double reference = config_.reference.share(toll);

    for (Parameter parameter : kAllParameters) {
        const Perturbation pert = perturbation(parameter);
        TornadoEntry e;
        e.parameter = parameter;
        e.low_value = pert.low_value;
        e.high_value = pert.high_value;
        e.low_delta = withParameter(config_.reference, parameter, pert.low_value).share(toll) - reference;
        e.high_delta = withParameter(config_.reference, parameter, pert.high_value).share(toll) - reference;
        e.impact = std::fabs(e.high_delta - e.low_delta);
        entries.push_back(e);
    }

    std::stable_sort(entries.begin(), entries.end(), [](const TornadoEntry& a, const TornadoEntry& b) {
        return a.impact > b.impact;
    });
    return entries;
}

std::vector<SensitivityAnalyzer::SensitivityRecord> SensitivityAnalyzer::perturbationCurves() const {
    std::vector<SensitivityRecord> records;
    records.reserve(static_cast<std::size_t>(kParameterCount) * 2u * config_.toll_grid.size());

    for (Parameter parameter : kAllParameters) {
        const Perturbation pert = perturbation(parameter);
        for (int side = 0; side < 2; ++side) {
            const bool high = (side == 1);
            const double value = high ? pert.high_value : pert.low_value;
            const AdoptionModel model = withParameter(config_.reference, parameter, value);
            for (double toll : config_.toll_grid) {
                SensitivityRecord r;
                r.parameter = parameter;
                r.high_side = high;
                r.parameter_value = value;
                r.toll_eur = toll;
                r.ev_share = model.share(toll);
                r.delta_vs_reference = r.ev_share - config_.reference.share(toll);
                records.push_back(r);
            }
        }
    }
    return records;
}

bool SensitivityAnalyzer::exportSensitivityMatrixCSV(const std::string& filename) const {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    out << "parameter,value,toll_eur,ev_share,ice_share,estimated_revenue_eur\n";
    out << std::fixed << std::setprecision(6);
    for (const auto& row : results_) {
        out << row.parameter_name << ','
            << row.parameter_value << ','
            << row.toll_eur << ','
            << row.ev_share << ','
            << row.ice_share << ','
            << row.estimated_revenue_eur << '\n';
    }
    return static_cast<bool>(out);
}

bool SensitivityAnalyzer::exportTornadoCSV(const std::string& filename) const {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    out << "parameter,low_value,high_value,low_delta,high_delta,impact\n";
    out << std::fixed << std::setprecision(6);
    for (const auto& e : tornado()) {
        out << parameterName(e.parameter) << ','
            << e.low_value << ','
            << e.high_value << ','
            << e.low_delta << ','
            << e.high_delta << ','
            << e.impact << '\n';
    }
    return static_cast<bool>(out);
}

bool SensitivityAnalyzer::exportCurvesCSV(const std::string& filename) const {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    out << "parameter,side,value,toll_eur,ev_share,delta_vs_reference\n";
    out << std::fixed << std::setprecision(6);
    for (const auto& r : perturbationCurves()) {
        out << parameterName(r.parameter) << ','
            << (r.high_side ? "high" : "low") << ','
            << r.parameter_value << ','
            << r.toll_eur << ','
            << r.ev_share << ','
            << r.delta_vs_reference << '\n';
    }
    return static_cast<bool>(out);
}

bool SensitivityAnalyzer::exportReportMarkdown(const std::string& filename) const {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    const AdoptionParameters& p = config_.reference.params;
    const auto ranking = tornado();

    out << "# Sensitivity Analysis Report\n\n";
    out << "## Reference Parameters\n\n";
    out << std::fixed << std::setprecision(2);
    out << "- Baseline EV share: " << p.baseline_share * 100.0 << "%\n";
    out << "- Maximum EV share: " << p.max_share * 100.0 << "%\n";
    out << "- Midpoint: " << p.midpoint_eur << " EUR\n";
    out << "- Steepness (k): " << p.steepness << "\n";
    if (config_.reference.zero_toll_override) {
        out << "- Share at zero toll (override): " << *config_.reference.zero_toll_override * 100.0 << "%\n";
    }
    out << "- Transition slope at midpoint: " << transitionSlopeAtMidpoint(p) * 100.0 << " %/EUR\n\n";

    out << "## Tornado Ranking (EV share at " << config_.reference_toll_eur << " EUR, +/-"
        << config_.relative_step * 100.0 << "%)\n\n";
    out << "| Parameter | Low | High | Low delta (pp) | High delta (pp) | Impact (pp) |\n";
    out << "|---|---:|---:|---:|---:|---:|\n";
    out << std::setprecision(3);
    for (const auto& e : ranking) {
        out << "| " << parameterName(e.parameter)
            << " | " << e.low_value
            << " | " << e.high_value
            << " | " << e.low_delta * 100.0
            << " | " << e.high_delta * 100.0
            << " | " << e.impact * 100.0 << " |\n";
    }
    if (!ranking.empty()) {
        out << "\nMost influential parameter: **" << parameterName(ranking.front().parameter) << "**\n";
    }
    return static_cast<bool>(out);
}

const std::vector<SensitivityAnalyzer::SensitivityRow>& SensitivityAnalyzer::results() const {
    return results_;
}

} // namespace evtoll
