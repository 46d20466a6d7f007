#include <map>
#include <set>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"
#include "offline_maps/tile_math.hpp"

using namespace offline_maps;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    offline_maps::test::ensure_logger_initialized();
    return true;
}();

constexpr std::string_view k_template{"https://tile.example.org/{z}/{x}/{y}.png"};

GeoBounds seoul_bounds() {
    GeoBounds bounds{};
    bounds.southwest = GeoPoint{37.50, 126.90};
    bounds.northeast = GeoPoint{37.60, 127.00};
    return bounds;
}
}  // namespace

TEST_CASE("Tile indices round-trip to within one tile") {
    const std::vector<GeoPoint> list_points{
        GeoPoint{37.5665, 126.9780},
        GeoPoint{-33.8688, 151.2093},
        GeoPoint{51.5074, -0.1278},
        GeoPoint{0.0, 0.0},
        GeoPoint{-54.8019, -68.3030},
    };

    for (int zoom : {0, 5, 10, 14, 18}) {
        for (const GeoPoint& point : list_points) {
            const std::uint32_t x = lon2tile(point.longitude, zoom);
            const std::uint32_t y = lat2tile(point.latitude, zoom);
            CHECK(tile2lon(x, zoom) <= point.longitude);
            CHECK(point.longitude < tile2lon(x + 1, zoom));
            CHECK(tile2lat(y, zoom) >= point.latitude);
            CHECK(point.latitude > tile2lat(y + 1, zoom));
        }
    }
}

TEST_CASE("Latitudes beyond the Mercator limit clamp to the edge rows") {
    CHECK(lat2tile(89.9, 8) == 0);
    CHECK(lat2tile(-89.9, 8) == 255);
    CHECK(lon2tile(180.0, 8) == 255);
    CHECK(lon2tile(-180.0, 8) == 0);
    CHECK(tile2lat(0, 0) == Catch::Approx(k_max_mercator_latitude_deg).margin(1e-9));
}

TEST_CASE("URL templates and file names carry z, x and y") {
    CHECK(resolve_tile_url(k_template, 12, 3493, 1586) == "https://tile.example.org/12/3493/1586.png");
    CHECK(resolve_tile_url("{z}-{z}/{y}", 3, 1, 2) == "3-3/2");
    CHECK(tile_file_name(12, 3493, 1586) == "12_3493_1586.png");
}

TEST_CASE("Tile enumeration covers a known rectangle exactly") {
    const GeoBounds bounds = test::bounds_for_tiles(10, 500, 504, 400, 401);
    const std::vector<MapTile> list_tiles = tiles_for_region(bounds, 10, 10, k_template);

    REQUIRE(list_tiles.size() == 10);
    std::set<std::pair<std::uint32_t, std::uint32_t>> set_cells;
    for (const MapTile& tile : list_tiles) {
        CHECK(tile.z == 10);
        CHECK(tile.x >= 500);
        CHECK(tile.x <= 504);
        CHECK(tile.y >= 400);
        CHECK(tile.y <= 401);
        CHECK_FALSE(tile.path.has_value());
        CHECK(tile.url == resolve_tile_url(k_template, tile.z, tile.x, tile.y));
        set_cells.emplace(tile.x, tile.y);
    }
    CHECK(set_cells.size() == 10);
}

TEST_CASE("Inverted zoom range yields no tiles") {
    CHECK(tiles_for_region(seoul_bounds(), 12, 11, k_template).empty());
}

TEST_CASE("Oversized zoom levels are skipped except the three finest") {
    const int min_zoom = 10;
    const int max_zoom = 18;
    const GeoBounds bounds = seoul_bounds();
    const std::vector<MapTile> list_tiles = tiles_for_region(bounds, min_zoom, max_zoom, k_template);
    REQUIRE_FALSE(list_tiles.empty());

    std::map<int, std::size_t> map_counts;
    for (const MapTile& tile : list_tiles) {
        ++map_counts[tile.z];
    }

    const double per_zoom_budget = k_region_tile_budget / static_cast<double>(max_zoom - min_zoom + 1);
    for (int zoom = min_zoom; zoom <= max_zoom; ++zoom) {
        const std::size_t expected = (lon2tile(bounds.northeast.longitude, zoom) - lon2tile(bounds.southwest.longitude, zoom) + 1)
                                   * (lat2tile(bounds.southwest.latitude, zoom) - lat2tile(bounds.northeast.latitude, zoom) + 1);
        if (zoom >= max_zoom - 2) {
            CHECK(map_counts[zoom] == expected);
        } else if (static_cast<double>(expected) > per_zoom_budget) {
            CHECK(map_counts.count(zoom) == 0);
        } else {
            CHECK(map_counts[zoom] == expected);
        }
    }
}
