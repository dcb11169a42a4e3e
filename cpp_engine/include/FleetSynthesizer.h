#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "AdoptionModel.h"

namespace evtoll {

enum class VehicleType : std::uint8_t {
    ICE = 0,
    EV = 1,
};

const char* vehicleTypeId(VehicleType type);

// One vehicle of the base demand. route_edges is the space-separated edge
// list when the demand carries explicit routes; empty for plain trips.
struct VehicleRecord {
    std::string id;
    std::string from_edge;
    std::string to_edge;
    double depart_s = 0.0;
    std::string route_edges;
};

struct LabeledVehicle {
    VehicleRecord vehicle;
    VehicleType type = VehicleType::ICE;
};

// Vehicle class descriptor handed to the simulator once per scenario.
struct VehicleTypeProfile {
    VehicleType type = VehicleType::ICE;
    std::string emission_class;
    std::string color;
    double emissions_device_probability = 1.0;
    bool tailpipe_emissions = true;   // false => energy accounting only
};

VehicleTypeProfile iceProfile();
VehicleTypeProfile evProfile();

struct SimulationWindow {
    double begin_s = 32400.0;   // 09:00
    double end_s = 39600.0;     // 11:00
    double step_length_s = 1.0;
};

// Everything the simulator needs for one toll price.
struct ScenarioArtifact {
    double toll_eur = 0.0;
    double target_ev_share = 0.0;
    std::uint32_t seed = 0u;
    std::vector<LabeledVehicle> vehicles;
    std::array<VehicleTypeProfile, 2> profiles{};
    SimulationWindow window{};
    std::string tripinfo_output;

    std::size_t evCount() const;
    std::size_t iceCount() const;
    // Realised fraction of EVs; 0 for an empty fleet.
    double realizedEvShare() const;
};

// Label every vehicle EV with probability model.share(toll), one uniform
// draw per vehicle in fleet order. Same seed + same ordering => same labels.
ScenarioArtifact synthesizeScenario(const std::vector<VehicleRecord>& fleet,
                                    double toll_eur,
                                    const AdoptionModel& model,
                                    std::uint32_t seed,
                                    const SimulationWindow& window = SimulationWindow{});

// Per-price seed derived from the batch seed and the price's file token, so
// a scenario's labels do not depend on which other prices run or in what order.
std::uint32_t scenarioSeed(std::uint32_t batch_seed, double toll_eur);

} // namespace evtoll
