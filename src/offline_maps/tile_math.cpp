#include "offline_maps/tile_math.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

#include <fmt/format.h>

namespace offline_maps {

namespace {

double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

double radians_to_degrees(double radians) {
    return radians * 180.0 / std::numbers::pi;
}

std::uint32_t clamp_index(double raw_index, int zoom) {
    const double max_index = std::exp2(zoom) - 1.0;
    return static_cast<std::uint32_t>(std::clamp(std::floor(raw_index), 0.0, max_index));
}

void replace_all(std::string& target, std::string_view placeholder, const std::string& value) {
    std::size_t position = target.find(placeholder);
    while (position != std::string::npos) {
        target.replace(position, placeholder.size(), value);
        position = target.find(placeholder, position + value.size());
    }
}

}  // namespace

std::uint32_t lon2tile(double longitude, int zoom) {
    return clamp_index((longitude + 180.0) / 360.0 * std::exp2(zoom), zoom);
}

std::uint32_t lat2tile(double latitude, int zoom) {
    const double lat_rad = degrees_to_radians(std::clamp(latitude, -k_max_mercator_latitude_deg, k_max_mercator_latitude_deg));
    const double projected = std::log(std::tan(lat_rad) + 1.0 / std::cos(lat_rad));
    return clamp_index((1.0 - projected / std::numbers::pi) / 2.0 * std::exp2(zoom), zoom);
}

double tile2lon(std::uint32_t x, int zoom) {
    return static_cast<double>(x) / std::exp2(zoom) * 360.0 - 180.0;
}

double tile2lat(std::uint32_t y, int zoom) {
    const double n = std::numbers::pi - 2.0 * std::numbers::pi * static_cast<double>(y) / std::exp2(zoom);
    return radians_to_degrees(std::atan(std::sinh(n)));
}

std::string resolve_tile_url(std::string_view url_template, int z, std::uint32_t x, std::uint32_t y) {
    std::string url{url_template};
    replace_all(url, "{z}", std::to_string(z));
    replace_all(url, "{x}", std::to_string(x));
    replace_all(url, "{y}", std::to_string(y));
    return url;
}

std::string tile_file_name(int z, std::uint32_t x, std::uint32_t y) {
    return fmt::format("{}_{}_{}.png", z, x, y);
}

std::vector<MapTile> tiles_for_region(const GeoBounds& bounds,
                                      int min_zoom,
                                      int max_zoom,
                                      std::string_view url_template) {
    std::vector<MapTile> list_tiles;
    if (max_zoom < min_zoom) {
        return list_tiles;
    }

    const double max_tiles_for_zoom = k_region_tile_budget / static_cast<double>(max_zoom - min_zoom + 1);
    for (int zoom = min_zoom; zoom <= max_zoom; ++zoom) {
        const std::uint32_t min_x = lon2tile(bounds.southwest.longitude, zoom);
        const std::uint32_t max_x = lon2tile(bounds.northeast.longitude, zoom);
        const std::uint32_t min_y = lat2tile(bounds.northeast.latitude, zoom);
        const std::uint32_t max_y = lat2tile(bounds.southwest.latitude, zoom);
        if (max_x < min_x || max_y < min_y) {
            continue;
        }

        const double tiles_for_zoom = static_cast<double>(max_x - min_x + 1) * static_cast<double>(max_y - min_y + 1);
        if (tiles_for_zoom > max_tiles_for_zoom && zoom < max_zoom - 2) {
            continue;
        }

        for (std::uint32_t x = min_x; x <= max_x; ++x) {
            for (std::uint32_t y = min_y; y <= max_y; ++y) {
                MapTile tile{};
                tile.z = static_cast<std::uint8_t>(zoom);
                tile.x = x;
                tile.y = y;
                tile.url = resolve_tile_url(url_template, zoom, x, y);
                list_tiles.push_back(std::move(tile));
            }
        }
    }
    return list_tiles;
}

}  // namespace offline_maps
