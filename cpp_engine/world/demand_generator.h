#pragma once

// world/demand_generator.h
//
// Synthetic base demand over a road network.
//
//   depart_i = begin + (i / N) * (end - begin), rounded to 0.01 s
//   endpoints: with probability main_edge_fraction both ends are drawn from
//              main_edges (high-connectivity corridor edges), otherwise from
//              all network edges
//
// Main edges missing from the network are ignored; with none left every trip
// uses the full edge list.

#include <cstdint>
#include <string>
#include <vector>

#include "FleetSynthesizer.h"

namespace evtoll {
namespace world {

class RoadNetwork;

struct DemandConfig {
    int num_vehicles = 5000;
    double begin_s = 32400.0;
    double end_s = 39600.0;
    double main_edge_fraction = 0.7;
    std::vector<std::string> main_edges {
        "1135405", "1302641", "1051139", "1181568", "1181543", "1398689"
    };
    std::uint32_t seed = 1337u;
};

// Returns an empty list when the network has no usable edges.
std::vector<VehicleRecord> generateTrips(const RoadNetwork& network, const DemandConfig& cfg);

} // namespace world
} // namespace evtoll
