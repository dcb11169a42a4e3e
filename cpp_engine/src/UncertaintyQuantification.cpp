#include "UncertaintyQuantification.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <string>

namespace evtoll {

namespace {
int clampRuns(int runs) {
    return runs < 1 ? 1 : runs;
}
} // namespace

MonteCarloUQ::MonteCarloUQ() = default;

void MonteCarloUQ::setModel(const AdoptionModel& model) {
    model_ = model;
}

void MonteCarloUQ::setBaseSeed(std::uint32_t seed) {
    base_seed_ = seed;
}

std::vector<VehicleRecord> MonteCarloUQ::placeholderFleet(std::size_t n) {
    std::vector<VehicleRecord> fleet(n);
    for (std::size_t i = 0; i < n; ++i) {
        fleet[i].id = std::to_string(i);
    }
    return fleet;
}

MonteCarloUQ::UQResult MonteCarloUQ::summarize(const std::vector<double>& values) const {
    UQResult result{};
    if (values.empty()) {
        return result;
    }

    const double mean = std::accumulate(values.begin(), values.end(), 0.0) / values.size();
    double variance = 0.0;
    for (double v : values) {
        const double d = v - mean;
        variance += d * d;
    }
    variance /= static_cast<double>(values.size());

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    auto percentile = [&](double p) {
        if (sorted.size() == 1) return sorted.front();
        const double pos = p * (sorted.size() - 1);
        const std::size_t idx = static_cast<std::size_t>(pos);
        const double frac = pos - static_cast<double>(idx);
        if (idx + 1 >= sorted.size()) return sorted.back();
        return sorted[idx] * (1.0 - frac) + sorted[idx + 1] * frac;
    };

    result.mean = mean;
    result.median = percentile(0.5);
    result.ci_lower_95 = percentile(0.025);
    result.ci_upper_95 = percentile(0.975);
    result.std_dev = std::sqrt(variance);
    return result;
}

MonteCarloUQ::UQSummary MonteCarloUQ::runMonteCarlo(const std::vector<VehicleRecord>& fleet,
                                                    double toll_eur,
                                                    int num_runs) const {
    const int runs = clampRuns(num_runs);
    // Seeds for the individual runs come from one generator so the whole
    // study is reproducible from base_seed_.
    std::mt19937 seeder(base_seed_);

    std::vector<double> shares;
    std::vector<double> counts;
    shares.reserve(static_cast<std::size_t>(runs));
    counts.reserve(static_cast<std::size_t>(runs));

    for (int i = 0; i < runs; ++i) {
        const ScenarioArtifact artifact = synthesizeScenario(fleet, toll_eur, model_, seeder());
        shares.push_back(artifact.realizedEvShare());
        counts.push_back(static_cast<double>(artifact.evCount()));
    }

    UQSummary summary{};
    summary.toll_eur = toll_eur;
    summary.target_ev_share = model_.share(toll_eur);
    summary.fleet_size = fleet.size();
    summary.runs = runs;
    summary.ev_share = summarize(shares);
    summary.ev_count = summarize(counts);
    if (!fleet.empty()) {
        const double p = summary.target_ev_share;
        summary.expected_share_std_dev = std::sqrt(p * (1.0 - p) / static_cast<double>(fleet.size()));
    }
    return summary;
}

} // namespace evtoll
