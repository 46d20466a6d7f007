// === Snapshot Cache ==========================================================
//
// Named cache of parsed map graphs. The most recently saved graph is kept as
// the "current" snapshot (payload plus info record) and every save is
// indexed in a catalog keyed by snapshot name. Independent of tile caching.
// Storage and parse failures are logged and reported as empty results.

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "offline_maps/key_value_store.hpp"
#include "offline_maps/logging.hpp"
#include "offline_maps/map_graph.hpp"
#include "offline_maps/types.hpp"

namespace offline_maps {

inline constexpr char k_snapshot_data_key[] = "@navigation_app/map_data";
inline constexpr char k_snapshot_info_key[] = "@navigation_app/map_info";
inline constexpr char k_snapshot_catalog_key[] = "@navigation_app/map_cache_list";
inline constexpr char k_default_snapshot_name[] = "default_map";

/** @brief Catalog entries keyed by snapshot name. */
using SnapshotCatalog = std::map<std::string, MapCacheInfo>;

/** @brief Aggregate view over the catalog. */
struct SnapshotCacheStatus final {
    std::size_t total_size{};
    std::size_t item_count{};
    std::optional<Timestamp> last_updated{};
};

/** @brief Persists and restores map-graph snapshots. */
class SnapshotCache final {
  public:
    explicit SnapshotCache(KeyValueStore& store);

    /**
     * @brief Store @p graph as the current snapshot under @p name.
     * @return The catalog entry written, or nullopt if storage failed.
     */
    std::optional<MapCacheInfo> save(const MapGraph& graph, const std::string& name = k_default_snapshot_name);
    /** @brief The current snapshot, or nullopt when absent or unreadable. */
    [[nodiscard]] std::optional<MapGraph> load() const;
    /** @brief Info record of the current snapshot. */
    [[nodiscard]] std::optional<MapCacheInfo> cache_info() const;
    /** @brief Every catalog entry (empty when absent or unreadable). */
    [[nodiscard]] SnapshotCatalog cache_list() const;
    /** @brief Totals across the catalog. */
    [[nodiscard]] SnapshotCacheStatus cache_status() const;
    /**
     * @brief Remove @p name from the catalog (and the current snapshot if it
     *        is the one named), or wipe everything when @p name is absent.
     */
    bool clear(const std::optional<std::string>& name = std::nullopt);

  private:
    [[nodiscard]] SnapshotCatalog cache_list_locked() const;
    [[nodiscard]] std::optional<MapCacheInfo> cache_info_locked() const;

    KeyValueStore& store_;
    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace offline_maps
