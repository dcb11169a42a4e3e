#pragma once

#include <cstdint>
#include <vector>

#include "AdoptionModel.h"
#include "FleetSynthesizer.h"

namespace evtoll {

// Sampling noise of the synthesized fleet: repeat the stochastic labelling
// with different seeds and summarise the realised EV share.
class MonteCarloUQ {
public:
    struct UQResult {
        double mean = 0.0;
        double median = 0.0;
        double ci_lower_95 = 0.0;
        double ci_upper_95 = 0.0;
        double std_dev = 0.0;
    };

    struct UQSummary {
        double toll_eur = 0.0;
        double target_ev_share = 0.0;
        std::size_t fleet_size = 0;
        int runs = 0;
        UQResult ev_share{};
        UQResult ev_count{};
        // Binomial standard deviation of the share, sqrt(p(1-p)/N).
        double expected_share_std_dev = 0.0;
    };

    MonteCarloUQ();

    void setModel(const AdoptionModel& model);
    void setBaseSeed(std::uint32_t seed);

    UQSummary runMonteCarlo(const std::vector<VehicleRecord>& fleet, double toll_eur, int num_runs = 100) const;

    // Fleet of n placeholder vehicles, for studies without a demand file.
    static std::vector<VehicleRecord> placeholderFleet(std::size_t n);

private:
    AdoptionModel model_{};
    std::uint32_t base_seed_ = 1337u;

    UQResult summarize(const std::vector<double>& values) const;
};

} // namespace evtoll
