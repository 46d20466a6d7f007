// === JSON Codec ==============================================================
//
// nlohmann::json conversions for every persisted record. Field names follow
// the on-disk format shared with existing installations (camelCase keys,
// timestamps as epoch milliseconds).

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "offline_maps/errors.hpp"
#include "offline_maps/map_graph.hpp"
#include "offline_maps/types.hpp"

namespace offline_maps {

void to_json(nlohmann::json& json, const GeoPoint& point);
void from_json(const nlohmann::json& json, GeoPoint& point);

void to_json(nlohmann::json& json, const GeoBounds& bounds);
void from_json(const nlohmann::json& json, GeoBounds& bounds);

void to_json(nlohmann::json& json, const OfflineRegion& region);
void from_json(const nlohmann::json& json, OfflineRegion& region);

void to_json(nlohmann::json& json, const MapTile& tile);
void from_json(const nlohmann::json& json, MapTile& tile);

void to_json(nlohmann::json& json, const AutoUpdateSettings& settings);
void from_json(const nlohmann::json& json, AutoUpdateSettings& settings);

void to_json(nlohmann::json& json, const MapCacheInfo& info);
void from_json(const nlohmann::json& json, MapCacheInfo& info);

void to_json(nlohmann::json& json, const MapNode& node);
void from_json(const nlohmann::json& json, MapNode& node);

void to_json(nlohmann::json& json, const RoadSegment& segment);
void from_json(const nlohmann::json& json, RoadSegment& segment);

void to_json(nlohmann::json& json, const MapGraph& graph);
void from_json(const nlohmann::json& json, MapGraph& graph);

/** @brief Timestamp as epoch milliseconds. */
[[nodiscard]] long long to_epoch_ms(Timestamp timestamp) noexcept;
/** @brief Timestamp from epoch milliseconds. */
[[nodiscard]] Timestamp from_epoch_ms(long long epoch_ms) noexcept;

/**
 * @brief Parse @p payload and convert it to @p T.
 *
 * @throws ParseError when the payload is not valid JSON or does not match the
 *         expected shape.
 */
template <typename T>
[[nodiscard]] T decode_json(const std::string& payload) {
    try {
        return nlohmann::json::parse(payload).get<T>();
    } catch (const nlohmann::json::exception& exc) {
        throw ParseError(exc.what());
    }
}

/**
 * @brief Serialize @p value to a compact JSON string.
 *
 * @throws ParseError when a string field is not valid UTF-8.
 */
template <typename T>
[[nodiscard]] std::string encode_json(const T& value) {
    try {
        return nlohmann::json(value).dump();
    } catch (const nlohmann::json::exception& exc) {
        throw ParseError(exc.what());
    }
}

}  // namespace offline_maps
