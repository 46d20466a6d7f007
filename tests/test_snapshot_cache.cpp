#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"
#include "offline_maps/snapshot_cache.hpp"

using namespace offline_maps;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    offline_maps::test::ensure_logger_initialized();
    return true;
}();

MapGraph make_graph(std::size_t node_count) {
    MapGraph graph{};
    for (std::size_t index = 0; index < node_count; ++index) {
        MapNode node{};
        node.id = "n" + std::to_string(index);
        node.position = GeoPoint{37.5 + 0.01 * static_cast<double>(index), 127.0};
        graph.nodes.push_back(node);
    }
    if (node_count > 1) {
        RoadSegment segment{};
        segment.id = "s0";
        segment.name = "Teheran-ro";
        segment.start_node_id = "n0";
        segment.end_node_id = "n1";
        segment.path = {graph.nodes.at(0).position, graph.nodes.at(1).position};
        segment.distance_m = 1100.0;
        segment.speed_limit_kph = 60.0;
        graph.road_segments.push_back(segment);
    }
    return graph;
}
}  // namespace

TEST_CASE("Saved snapshots become the current graph and join the catalog") {
    test::MemoryKeyValueStore store;
    SnapshotCache cache{store};

    const std::optional<MapCacheInfo> info = cache.save(make_graph(3), "gangnam");
    REQUIRE(info.has_value());
    CHECK(info->name == "gangnam");
    CHECK(info->node_count == 3);
    CHECK(info->road_segment_count == 1);
    CHECK(info->size == store.get(k_snapshot_data_key).value().size());

    const std::optional<MapGraph> loaded = cache.load();
    REQUIRE(loaded.has_value());
    CHECK(loaded->nodes.size() == 3);
    CHECK(loaded->road_segments.front().name == "Teheran-ro");

    REQUIRE(cache.cache_info().has_value());
    CHECK(cache.cache_info()->name == "gangnam");
    CHECK(cache.cache_list().count("gangnam") == 1);
}

TEST_CASE("The catalog accumulates while the current snapshot is replaced") {
    test::MemoryKeyValueStore store;
    SnapshotCache cache{store};

    REQUIRE(cache.save(make_graph(2)).has_value());
    REQUIRE(cache.save(make_graph(4), "jongno").has_value());

    const SnapshotCatalog catalog = cache.cache_list();
    CHECK(catalog.size() == 2);
    CHECK(catalog.count(k_default_snapshot_name) == 1);
    CHECK(cache.load()->nodes.size() == 4);

    const SnapshotCacheStatus status = cache.cache_status();
    CHECK(status.item_count == 2);
    CHECK(status.total_size == catalog.at("jongno").size + catalog.at(k_default_snapshot_name).size);
    REQUIRE(status.last_updated.has_value());
    CHECK(status.last_updated.value() == catalog.at("jongno").timestamp);
}

TEST_CASE("Clearing a named snapshot drops the current payload only when it matches") {
    test::MemoryKeyValueStore store;
    SnapshotCache cache{store};
    REQUIRE(cache.save(make_graph(2), "older").has_value());
    REQUIRE(cache.save(make_graph(3), "newer").has_value());

    CHECK(cache.clear(std::string{"older"}));
    CHECK(cache.cache_list().size() == 1);
    CHECK(cache.load().has_value());

    CHECK(cache.clear(std::string{"newer"}));
    CHECK(cache.cache_list().empty());
    CHECK_FALSE(cache.load().has_value());
    CHECK_FALSE(cache.cache_info().has_value());
}

TEST_CASE("Clearing everything removes all snapshot keys") {
    test::MemoryKeyValueStore store;
    SnapshotCache cache{store};
    REQUIRE(cache.save(make_graph(2)).has_value());

    CHECK(cache.clear());
    CHECK_FALSE(store.contains(k_snapshot_data_key));
    CHECK_FALSE(store.contains(k_snapshot_info_key));
    CHECK_FALSE(store.contains(k_snapshot_catalog_key));
    CHECK(cache.cache_status().item_count == 0);
    CHECK_FALSE(cache.cache_status().last_updated.has_value());
}

TEST_CASE("Corrupt or unreadable snapshots read as absent") {
    test::MemoryKeyValueStore store;
    SnapshotCache cache{store};

    store.set(k_snapshot_data_key, R"({"nodes":[{"id":"n0"}]})");
    store.set(k_snapshot_catalog_key, "[1,2");
    CHECK_FALSE(cache.load().has_value());
    CHECK(cache.cache_list().empty());

    store.fail_writes(true);
    CHECK_FALSE(cache.save(make_graph(2)).has_value());
    CHECK_FALSE(cache.clear());

    store.fail_writes(false);
    store.fail_reads(true);
    CHECK_FALSE(cache.load().has_value());
    CHECK_FALSE(cache.cache_info().has_value());
}

TEST_CASE("Snapshots with text that cannot be encoded are not saved") {
    test::MemoryKeyValueStore store;
    SnapshotCache cache{store};
    REQUIRE(cache.save(make_graph(2), "gangnam").has_value());
    const std::string data_before = store.get(k_snapshot_data_key).value();

    std::optional<MapCacheInfo> info;
    CHECK_NOTHROW(info = cache.save(make_graph(3), "caf\xe9"));
    CHECK_FALSE(info.has_value());

    MapGraph graph = make_graph(2);
    graph.road_segments.front().name = "Teheran-ro \xff";
    CHECK_NOTHROW(info = cache.save(graph, "teheran"));
    CHECK_FALSE(info.has_value());

    CHECK(store.get(k_snapshot_data_key).value() == data_before);
    CHECK(cache.cache_info()->name == "gangnam");
    CHECK(cache.cache_list().size() == 1);
}
