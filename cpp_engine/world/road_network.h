#pragma once

// world/road_network.h
//
// Read-only view of a road network description: the ids of the edges a trip
// may start or end on. No topology is kept; routing is the simulator's job.
//
// Edge filter:
//   - ids starting with ':' are internal junction edges and are skipped
//   - edges with function="internal" are skipped for the same reason
//   - duplicate ids are kept once, in first-seen order

#include <string>
#include <vector>

namespace evtoll {
namespace world {

class RoadNetwork {
public:
    RoadNetwork() = default;

    // Streams the file once. On failure isValid() is false and lastError()
    // names the cause; previously loaded edges are discarded.
    bool loadFile(const std::string& path);
    bool loadDocument(const std::string& xml);

    bool isValid() const { return valid_; }
    const std::string& lastError() const { return error_; }

    const std::vector<std::string>& edges() const { return edges_; }
    bool hasEdge(const std::string& id) const;

private:
    std::vector<std::string> edges_{};
    std::string error_{};
    bool valid_ = false;
};

} // namespace world
} // namespace evtoll
