#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "FleetSynthesizer.h"

namespace evtoll {

struct DemandLoadResult {
    bool ok = false;
    std::string message;
    std::vector<VehicleRecord> vehicles;
};

// Reads <trip id from to depart/> and <vehicle id depart><route edges/></vehicle>
// elements from a routes document, in document order. <vehicle route="r0">
// resolves a top-level <route id="r0" edges=".."/> defined earlier. vType
// definitions and any existing type attributes are ignored.
//
// Fails (ok=false) on entries that could not be written back as a runnable
// trip: unknown route references, vehicles without a route, trips without
// from/to, and <flow> elements.
DemandLoadResult loadDemandFile(const std::string& path);
DemandLoadResult loadDemandDocument(const std::string& xml);

struct ConfigPaths {
    std::string net_file;      // as referenced from the config's directory
    std::string routes_file;
    std::string tripinfo_file;
};

std::string escapeXmlAttribute(const std::string& text);

// Routes document: both vType profiles, then every labeled vehicle in order.
void writeRoutes(std::ostream& out, const ScenarioArtifact& artifact);
void writeSimulationConfig(std::ostream& out, const ScenarioArtifact& artifact, const ConfigPaths& paths);

// Plain <routes> of <trip> elements (unlabeled base demand).
void writeTrips(std::ostream& out, const std::vector<VehicleRecord>& trips);

bool writeRoutesFile(const ScenarioArtifact& artifact, const std::string& path, std::string* error);
bool writeSimulationConfigFile(const ScenarioArtifact& artifact,
                               const ConfigPaths& paths,
                               const std::string& path,
                               std::string* error);
bool writeTripsFile(const std::vector<VehicleRecord>& trips, const std::string& path, std::string* error);

} // namespace evtoll
