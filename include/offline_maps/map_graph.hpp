// === Map Graph ===============================================================
//
// Parsed road-network primitives (intersections and road segments) produced
// by the map-description parser and captured by the snapshot cache.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "offline_maps/types.hpp"

namespace offline_maps {

/** @brief Graph vertex such as an intersection or point of interest. */
struct MapNode final {
    std::string id{};
    GeoPoint position{};
    std::optional<std::string> name{};
    std::string type{"intersection"};
    std::vector<std::string> connections{};  /**< Identifiers of adjacent road segments. */
};

/** @brief Directed or bidirectional road between two nodes. */
struct RoadSegment final {
    std::string id{};
    std::string name{};
    std::string start_node_id{};
    std::string end_node_id{};
    std::vector<GeoPoint> path{};
    double distance_m{};
    double speed_limit_kph{};
    std::string road_type{"major_road"};
    bool one_way{false};
    int traffic_level{};
};

/** @brief In-memory road network handed to and returned by the snapshot cache. */
struct MapGraph final {
    std::vector<MapNode> nodes{};
    std::vector<RoadSegment> road_segments{};
};

}  // namespace offline_maps
