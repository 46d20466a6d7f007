// === Tile Math ===============================================================
//
// Pure Web-Mercator helpers converting geographic coordinates to slippy-map
// tile indices and back, plus the per-region tile enumeration used by the
// download scheduler. Nothing here touches state or I/O.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "offline_maps/types.hpp"

namespace offline_maps {

/** @brief Latitude limit of the Web-Mercator projection in degrees. */
inline constexpr double k_max_mercator_latitude_deg{85.0511287798066};

/** @brief Soft cap on the number of tiles enumerated for one region. */
inline constexpr double k_region_tile_budget{1000.0};

/** @brief Column index of the tile containing @p longitude at @p zoom. */
[[nodiscard]] std::uint32_t lon2tile(double longitude, int zoom);
/** @brief Row index of the tile containing @p latitude at @p zoom. */
[[nodiscard]] std::uint32_t lat2tile(double latitude, int zoom);
/** @brief Longitude of the west edge of column @p x. */
[[nodiscard]] double tile2lon(std::uint32_t x, int zoom);
/** @brief Latitude of the north edge of row @p y. */
[[nodiscard]] double tile2lat(std::uint32_t y, int zoom);

/** @brief Substitute `{z}`, `{x}` and `{y}` placeholders in a URL template. */
[[nodiscard]] std::string resolve_tile_url(std::string_view url_template, int z, std::uint32_t x, std::uint32_t y);

/** @brief Deterministic file name for a tile: `<z>_<x>_<y>.png`. */
[[nodiscard]] std::string tile_file_name(int z, std::uint32_t x, std::uint32_t y);

/**
 * @brief Enumerate the tiles covering @p bounds for every zoom in
 *        [@p min_zoom, @p max_zoom].
 *
 * A zoom level whose tile count exceeds `k_region_tile_budget / levels` is
 * skipped unless it is one of the three finest levels (`z >= max_zoom - 2`).
 */
[[nodiscard]] std::vector<MapTile> tiles_for_region(const GeoBounds& bounds,
                                                    int min_zoom,
                                                    int max_zoom,
                                                    std::string_view url_template);

}  // namespace offline_maps
