// === Core Types ==============================================================
//
// Collects shared type aliases and plain structs/enums used throughout the
// offline map engine (clock primitives, geographic bounds, region records,
// tiles, auto-update settings and snapshot catalog entries).

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace offline_maps {

/**
 * @brief Wall clock used for persisted timestamps.
 */
using SystemClock = std::chrono::system_clock;

/**
 * @brief Millisecond-resolution timestamp; serialized as epoch milliseconds.
 */
using Timestamp = std::chrono::time_point<SystemClock, std::chrono::milliseconds>;

/**
 * @brief Monotonic clock used for deadlines and ticks.
 */
using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Current wall-clock time truncated to milliseconds.
 */
inline Timestamp now_timestamp() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(SystemClock::now());
}

/**
 * @brief WGS84 latitude/longitude pair in decimal degrees.
 */
struct GeoPoint final {
    double latitude{};   /**< Latitude in decimal degrees. */
    double longitude{};  /**< Longitude in decimal degrees. */
};

/**
 * @brief Axis-aligned geographic rectangle. Northeast must dominate southwest.
 */
struct GeoBounds final {
    GeoPoint northeast{};
    GeoPoint southwest{};
};

/**
 * @brief Lifecycle states for a cached region.
 */
enum class RegionStatus {
    None,         /**< Known but never downloaded. */
    Downloading,  /**< Queued or actively fetching tiles. */
    Available,    /**< Tiles cached and usable offline. */
    Outdated,     /**< Older than the staleness threshold; pending refresh. */
    Error         /**< Last download failed or timed out. */
};

/**
 * @brief Caller-supplied description of a region to download.
 */
struct RegionRequest final {
    std::string id{};
    std::string name{};
    GeoBounds bounds{};
    double size_mb{};  /**< Estimated footprint used for quota checks. */
};

/**
 * @brief Registry record describing a downloadable rectangular area.
 */
struct OfflineRegion final {
    std::string id{};                          /**< Unique registry key. */
    std::string name{};                        /**< Display label. */
    GeoBounds bounds{};                        /**< Covered area. */
    double size_mb{};                          /**< Caller-estimated footprint in MB. */
    RegionStatus status{RegionStatus::None};   /**< Lifecycle state. */
    std::optional<int> download_progress{};    /**< Percentage 0-100 while downloading. */
    std::optional<Timestamp> last_updated{};   /**< Set on transition to Available. */
};

/**
 * @brief Single Web-Mercator tile scheduled for (or stored by) a download.
 */
struct MapTile final {
    std::uint8_t z{};
    std::uint32_t x{};
    std::uint32_t y{};
    std::string url{};
    std::optional<std::string> path{};  /**< Local file once fetched. */
};

/**
 * @brief How often the auto-update scheduler refreshes stale regions.
 */
enum class UpdateInterval {
    Daily,
    Weekly,
    Monthly,
    Never
};

/**
 * @brief Persisted auto-update preferences.
 */
struct AutoUpdateSettings final {
    bool enabled{false};
    bool wifi_only{true};
    UpdateInterval update_interval{UpdateInterval::Weekly};
    std::string time_of_day{"02:00"};  /**< Local "HH:MM" target time. */
    Timestamp last_auto_check{};
};

/**
 * @brief Partial settings update; unset fields keep their current value.
 */
struct AutoUpdateSettingsPatch final {
    std::optional<bool> enabled{};
    std::optional<bool> wifi_only{};
    std::optional<UpdateInterval> update_interval{};
    std::optional<std::string> time_of_day{};
    std::optional<Timestamp> last_auto_check{};
};

/**
 * @brief Catalog entry describing a stored map-graph snapshot.
 */
struct MapCacheInfo final {
    Timestamp timestamp{};
    std::size_t size{};  /**< Serialized payload length in bytes. */
    std::string name{};
    std::size_t node_count{};
    std::size_t road_segment_count{};
};

/**
 * @brief Classes of connectivity reported by the network monitor.
 */
enum class NetworkClass {
    Wifi,
    Cellular,
    Offline
};

/**
 * @brief Snapshot of the device network state.
 */
struct NetworkState final {
    NetworkClass network_class{NetworkClass::Offline};
    bool connected{false};
};

std::string_view to_string(RegionStatus status) noexcept;
std::optional<RegionStatus> region_status_from_string(std::string_view value) noexcept;

std::string_view to_string(UpdateInterval interval) noexcept;
std::optional<UpdateInterval> update_interval_from_string(std::string_view value) noexcept;

std::string_view to_string(NetworkClass network_class) noexcept;
std::optional<NetworkClass> network_class_from_string(std::string_view value) noexcept;

}  // namespace offline_maps
