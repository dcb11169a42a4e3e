// world/demand_generator.cpp

#include "demand_generator.h"

#include "road_network.h"

#include <cmath>
#include <random>
#include <utility>
#include <string>

namespace evtoll {
namespace world {

static inline double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

std::vector<VehicleRecord> generateTrips(const RoadNetwork& network, const DemandConfig& cfg) {
    std::vector<VehicleRecord> trips;
    const std::vector<std::string>& all_edges = network.edges();
    if (all_edges.empty() || cfg.num_vehicles <= 0) {
        return trips;
    }

    std::vector<std::string> main_edges;
    for (const auto& e : cfg.main_edges) {
        if (network.hasEdge(e)) main_edges.push_back(e);
    }

    std::mt19937 rng(cfg.seed);
    std::uniform_real_distribution<double> unit_dist(0.0, 1.0);
    std::uniform_int_distribution<std::size_t> pick_all(0, all_edges.size() - 1);
    std::uniform_int_distribution<std::size_t> pick_main(0, main_edges.empty() ? 0 : main_edges.size() - 1);

    const double duration = (cfg.end_s > cfg.begin_s) ? (cfg.end_s - cfg.begin_s) : 0.0;
    const double n = static_cast<double>(cfg.num_vehicles);

    trips.reserve(static_cast<std::size_t>(cfg.num_vehicles));
    for (int i = 0; i < cfg.num_vehicles; ++i) {
        VehicleRecord t;
        t.id = std::to_string(i);
        t.depart_s = round2(cfg.begin_s + (static_cast<double>(i) / n) * duration);

        const bool use_main = !main_edges.empty() && unit_dist(rng) < cfg.main_edge_fraction;
        if (use_main) {
            t.from_edge = main_edges[pick_main(rng)];
            t.to_edge = main_edges[pick_main(rng)];
        } else {
            t.from_edge = all_edges[pick_all(rng)];
            t.to_edge = all_edges[pick_all(rng)];
        }
        trips.push_back(std::move(t));
    }
    return trips;
}

} // namespace world
} // namespace evtoll
