#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"
#include "offline_maps/json_codec.hpp"

using namespace offline_maps;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    offline_maps::test::ensure_logger_initialized();
    return true;
}();
}  // namespace

TEST_CASE("Region records serialize with the stored field names") {
    OfflineRegion region{};
    region.id = "seoul";
    region.name = "Seoul";
    region.bounds.southwest = GeoPoint{37.50, 126.90};
    region.bounds.northeast = GeoPoint{37.60, 127.00};
    region.size_mb = 50.0;
    region.status = RegionStatus::Available;
    region.download_progress = 100;
    region.last_updated = from_epoch_ms(1'700'000'000'000);

    const nlohmann::json json = region;
    CHECK(json.at("sizeInMB").get<double>() == 50.0);
    CHECK(json.at("status").get<std::string>() == "available");
    CHECK(json.at("downloadProgress").get<int>() == 100);
    CHECK(json.at("lastUpdated").get<long long>() == 1'700'000'000'000);
    CHECK(json.at("bounds").at("northeast").at("latitude").get<double>() == 37.60);

    const OfflineRegion decoded = json.get<OfflineRegion>();
    CHECK(decoded.id == "seoul");
    CHECK(decoded.status == RegionStatus::Available);
    REQUIRE(decoded.last_updated.has_value());
    CHECK(to_epoch_ms(decoded.last_updated.value()) == 1'700'000'000'000);
}

TEST_CASE("Optional region fields stay absent") {
    OfflineRegion region{};
    region.id = "empty";
    region.status = RegionStatus::Error;

    const nlohmann::json json = region;
    CHECK_FALSE(json.contains("downloadProgress"));
    CHECK_FALSE(json.contains("lastUpdated"));
}

TEST_CASE("Stored auto-update settings merge over defaults") {
    const AutoUpdateSettings settings = decode_json<AutoUpdateSettings>(R"({"enabled":true,"updateInterval":"daily"})");
    CHECK(settings.enabled);
    CHECK(settings.wifi_only);
    CHECK(settings.update_interval == UpdateInterval::Daily);
    CHECK(settings.time_of_day == "02:00");
    CHECK(to_epoch_ms(settings.last_auto_check) == 0);
}

TEST_CASE("Corrupt payloads surface as ParseError") {
    CHECK_THROWS_AS(decode_json<std::vector<OfflineRegion>>("{not json"), ParseError);
    CHECK_THROWS_AS(decode_json<OfflineRegion>(R"({"id":"a","bounds":{"northeast":{"latitude":1,"longitude":1},"southwest":{"latitude":0,"longitude":0}},"status":"vanished"})"),
                    ParseError);
    CHECK_THROWS_AS(decode_json<MapCacheInfo>(R"({"size":1})"), ParseError);
}

TEST_CASE("Text that is not valid UTF-8 fails to encode as ParseError") {
    OfflineRegion region{};
    region.id = "cafe";
    region.name = "caf\xe9";
    CHECK_THROWS_AS(encode_json(region), ParseError);
    CHECK_THROWS_AS(encode_json(std::vector<OfflineRegion>{region}), ParseError);

    region.name = "caf\xc3\xa9";
    CHECK(decode_json<OfflineRegion>(encode_json(region)).name == region.name);
}

TEST_CASE("Map graphs keep node and segment attributes") {
    MapGraph graph{};
    MapNode node{};
    node.id = "n1";
    node.position = GeoPoint{37.55, 126.95};
    node.connections = {"s1"};
    graph.nodes.push_back(node);

    RoadSegment segment{};
    segment.id = "s1";
    segment.name = "Sejong-daero";
    segment.start_node_id = "n1";
    segment.end_node_id = "n2";
    segment.path = {GeoPoint{37.55, 126.95}, GeoPoint{37.56, 126.96}};
    segment.distance_m = 1400.0;
    segment.speed_limit_kph = 50.0;
    segment.one_way = true;
    segment.traffic_level = 2;
    graph.road_segments.push_back(segment);

    const nlohmann::json json = graph;
    CHECK(json.at("roadSegments").at(0).at("startNodeId").get<std::string>() == "n1");
    CHECK(json.at("roadSegments").at(0).at("oneWay").get<bool>());
    CHECK_FALSE(json.at("nodes").at(0).contains("name"));

    const MapGraph decoded = decode_json<MapGraph>(encode_json(graph));
    REQUIRE(decoded.road_segments.size() == 1);
    CHECK(decoded.road_segments.front().path.size() == 2);
    CHECK(decoded.road_segments.front().traffic_level == 2);
    CHECK(decoded.nodes.front().type == "intersection");
}
