#include "offline_maps/json_codec.hpp"

#include <fmt/format.h>

namespace offline_maps {

namespace {

template <typename Enum>
Enum parse_enum(const nlohmann::json& json,
                const char* key,
                Enum fallback,
                std::optional<Enum> (*parser)(std::string_view) noexcept) {
    if (!json.contains(key)) {
        return fallback;
    }
    const std::string raw_value = json.at(key).get<std::string>();
    const std::optional<Enum> parsed_value = parser(raw_value);
    if (!parsed_value.has_value()) {
        throw ParseError(fmt::format("Unknown value '{}' for field {}", raw_value, key));
    }
    return parsed_value.value();
}

}  // namespace

long long to_epoch_ms(Timestamp timestamp) noexcept {
    return timestamp.time_since_epoch().count();
}

Timestamp from_epoch_ms(long long epoch_ms) noexcept {
    return Timestamp{std::chrono::milliseconds{epoch_ms}};
}

void to_json(nlohmann::json& json, const GeoPoint& point) {
    json = nlohmann::json{{"latitude", point.latitude}, {"longitude", point.longitude}};
}

void from_json(const nlohmann::json& json, GeoPoint& point) {
    json.at("latitude").get_to(point.latitude);
    json.at("longitude").get_to(point.longitude);
}

void to_json(nlohmann::json& json, const GeoBounds& bounds) {
    json = nlohmann::json{{"northeast", bounds.northeast}, {"southwest", bounds.southwest}};
}

void from_json(const nlohmann::json& json, GeoBounds& bounds) {
    json.at("northeast").get_to(bounds.northeast);
    json.at("southwest").get_to(bounds.southwest);
}

void to_json(nlohmann::json& json, const OfflineRegion& region) {
    json = nlohmann::json{
        {"id", region.id},
        {"name", region.name},
        {"bounds", region.bounds},
        {"sizeInMB", region.size_mb},
        {"status", std::string{to_string(region.status)}},
    };
    if (region.download_progress.has_value()) {
        json["downloadProgress"] = region.download_progress.value();
    }
    if (region.last_updated.has_value()) {
        json["lastUpdated"] = to_epoch_ms(region.last_updated.value());
    }
}

void from_json(const nlohmann::json& json, OfflineRegion& region) {
    json.at("id").get_to(region.id);
    region.name = json.value("name", region.id);
    json.at("bounds").get_to(region.bounds);
    region.size_mb = json.value("sizeInMB", 0.0);
    region.status = parse_enum(json, "status", RegionStatus::None, &region_status_from_string);
    region.download_progress.reset();
    if (json.contains("downloadProgress") && !json.at("downloadProgress").is_null()) {
        region.download_progress = json.at("downloadProgress").get<int>();
    }
    region.last_updated.reset();
    if (json.contains("lastUpdated") && !json.at("lastUpdated").is_null()) {
        region.last_updated = from_epoch_ms(json.at("lastUpdated").get<long long>());
    }
}

void to_json(nlohmann::json& json, const MapTile& tile) {
    json = nlohmann::json{{"z", tile.z}, {"x", tile.x}, {"y", tile.y}, {"url", tile.url}};
    if (tile.path.has_value()) {
        json["path"] = tile.path.value();
    }
}

void from_json(const nlohmann::json& json, MapTile& tile) {
    json.at("z").get_to(tile.z);
    json.at("x").get_to(tile.x);
    json.at("y").get_to(tile.y);
    tile.url = json.value("url", std::string{});
    tile.path.reset();
    if (json.contains("path") && json.at("path").is_string()) {
        tile.path = json.at("path").get<std::string>();
    }
}

void to_json(nlohmann::json& json, const AutoUpdateSettings& settings) {
    json = nlohmann::json{
        {"enabled", settings.enabled},
        {"wifiOnly", settings.wifi_only},
        {"updateInterval", std::string{to_string(settings.update_interval)}},
        {"timeOfDay", settings.time_of_day},
        {"lastAutoCheck", to_epoch_ms(settings.last_auto_check)},
    };
}

void from_json(const nlohmann::json& json, AutoUpdateSettings& settings) {
    settings.enabled = json.value("enabled", settings.enabled);
    settings.wifi_only = json.value("wifiOnly", settings.wifi_only);
    settings.update_interval = parse_enum(json, "updateInterval", settings.update_interval, &update_interval_from_string);
    settings.time_of_day = json.value("timeOfDay", settings.time_of_day);
    settings.last_auto_check = from_epoch_ms(json.value("lastAutoCheck", to_epoch_ms(settings.last_auto_check)));
}

void to_json(nlohmann::json& json, const MapCacheInfo& info) {
    json = nlohmann::json{
        {"timestamp", to_epoch_ms(info.timestamp)},
        {"size", info.size},
        {"name", info.name},
        {"nodeCount", info.node_count},
        {"roadSegmentCount", info.road_segment_count},
    };
}

void from_json(const nlohmann::json& json, MapCacheInfo& info) {
    info.timestamp = from_epoch_ms(json.at("timestamp").get<long long>());
    json.at("size").get_to(info.size);
    json.at("name").get_to(info.name);
    info.node_count = json.value("nodeCount", std::size_t{0});
    info.road_segment_count = json.value("roadSegmentCount", std::size_t{0});
}

void to_json(nlohmann::json& json, const MapNode& node) {
    json = nlohmann::json{
        {"id", node.id},
        {"position", node.position},
        {"type", node.type},
        {"connections", node.connections},
    };
    if (node.name.has_value()) {
        json["name"] = node.name.value();
    }
}

void from_json(const nlohmann::json& json, MapNode& node) {
    json.at("id").get_to(node.id);
    json.at("position").get_to(node.position);
    node.type = json.value("type", std::string{"intersection"});
    node.connections = json.value("connections", std::vector<std::string>{});
    node.name.reset();
    if (json.contains("name") && json.at("name").is_string()) {
        node.name = json.at("name").get<std::string>();
    }
}

void to_json(nlohmann::json& json, const RoadSegment& segment) {
    json = nlohmann::json{
        {"id", segment.id},
        {"name", segment.name},
        {"startNodeId", segment.start_node_id},
        {"endNodeId", segment.end_node_id},
        {"path", segment.path},
        {"distance", segment.distance_m},
        {"speedLimit", segment.speed_limit_kph},
        {"roadType", segment.road_type},
        {"oneWay", segment.one_way},
        {"trafficLevel", segment.traffic_level},
    };
}

void from_json(const nlohmann::json& json, RoadSegment& segment) {
    json.at("id").get_to(segment.id);
    segment.name = json.value("name", std::string{});
    json.at("startNodeId").get_to(segment.start_node_id);
    json.at("endNodeId").get_to(segment.end_node_id);
    segment.path = json.value("path", std::vector<GeoPoint>{});
    segment.distance_m = json.value("distance", 0.0);
    segment.speed_limit_kph = json.value("speedLimit", 0.0);
    segment.road_type = json.value("roadType", std::string{"major_road"});
    segment.one_way = json.value("oneWay", false);
    segment.traffic_level = json.value("trafficLevel", 0);
}

void to_json(nlohmann::json& json, const MapGraph& graph) {
    json = nlohmann::json{{"nodes", graph.nodes}, {"roadSegments", graph.road_segments}};
}

void from_json(const nlohmann::json& json, MapGraph& graph) {
    json.at("nodes").get_to(graph.nodes);
    json.at("roadSegments").get_to(graph.road_segments);
}

}  // namespace offline_maps
