#include "FleetSynthesizer.h"

#include "ScenarioNaming.h"

#include <random>
#include <utility>

namespace evtoll {

namespace {
constexpr std::uint32_t kFnvOffset = 2166136261u;
constexpr std::uint32_t kFnvPrime = 16777619u;

std::uint32_t fnv1a32(const std::string& text, std::uint32_t h = kFnvOffset) {
    for (unsigned char c : text) {
        h ^= c;
        h *= kFnvPrime;
    }
    return h;
}
} // namespace

const char* vehicleTypeId(VehicleType type) {
    return type == VehicleType::EV ? "EV" : "ICE";
}

VehicleTypeProfile iceProfile() {
    VehicleTypeProfile p;
    p.type = VehicleType::ICE;
    p.emission_class = "HBEFA3/PC_G_EU4";
    p.color = "1,0,0";
    p.tailpipe_emissions = true;
    return p;
}

VehicleTypeProfile evProfile() {
    VehicleTypeProfile p;
    p.type = VehicleType::EV;
    p.emission_class = "Energy/unknown";
    p.color = "0,1,0";
    p.tailpipe_emissions = false;
    return p;
}

std::size_t ScenarioArtifact::evCount() const {
    std::size_t n = 0;
    for (const auto& v : vehicles) {
        if (v.type == VehicleType::EV) ++n;
    }
    return n;
}

std::size_t ScenarioArtifact::iceCount() const {
    return vehicles.size() - evCount();
}

double ScenarioArtifact::realizedEvShare() const {
    if (vehicles.empty()) return 0.0;
    return static_cast<double>(evCount()) / static_cast<double>(vehicles.size());
}

ScenarioArtifact synthesizeScenario(const std::vector<VehicleRecord>& fleet,
                                    double toll_eur,
                                    const AdoptionModel& model,
                                    std::uint32_t seed,
                                    const SimulationWindow& window) {
    ScenarioArtifact artifact;
    artifact.toll_eur = toll_eur;
    artifact.target_ev_share = model.share(toll_eur);
    artifact.seed = seed;
    artifact.profiles = {iceProfile(), evProfile()};
    artifact.window = window;
    artifact.tripinfo_output = tripinfoFileName(toll_eur);

    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> unit_dist(0.0, 1.0);

    artifact.vehicles.reserve(fleet.size());
    for (const auto& vehicle : fleet) {
        const double u = unit_dist(rng);
        LabeledVehicle labeled;
        labeled.vehicle = vehicle;
        labeled.type = (u < artifact.target_ev_share) ? VehicleType::EV : VehicleType::ICE;
        artifact.vehicles.push_back(std::move(labeled));
    }
    return artifact;
}

std::uint32_t scenarioSeed(std::uint32_t batch_seed, double toll_eur) {
    std::uint32_t h = kFnvOffset;
    for (int shift = 0; shift < 32; shift += 8) {
        h ^= static_cast<std::uint8_t>(batch_seed >> shift);
        h *= kFnvPrime;
    }
    return fnv1a32(encodeTollToken(toll_eur), h);
}

} // namespace evtoll
