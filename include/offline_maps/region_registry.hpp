// === Region Registry =========================================================
//
// Owns every offline region record, persists them to the key-value store and
// enforces the region lifecycle:
//
//   none/error/outdated --admit--> downloading --complete--> available
//                                              \--fail/timeout--> error
//   available --staleness scan--> outdated
//
// All state lives behind a single mutex; callers receive copies of records.

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <map>
#include <vector>

#include "offline_maps/capacity_manager.hpp"
#include "offline_maps/key_value_store.hpp"
#include "offline_maps/logging.hpp"
#include "offline_maps/types.hpp"

namespace offline_maps {

/** @brief Storage key holding the array of region records. */
inline constexpr char k_regions_storage_key[] = "offline_map_regions";
/** @brief Prefix of the per-region tile list key (`<prefix>_<id>`). */
inline constexpr char k_tiles_storage_key_prefix[] = "offline_map_tiles";

/** @brief Age after which an available region is considered stale. */
inline constexpr std::chrono::milliseconds k_region_max_age{std::chrono::hours{24 * 30}};

/** @brief Storage key of the persisted tile list for @p region_id. */
[[nodiscard]] std::string tile_storage_key(const std::string& region_id);

/** @brief Closed-interval containment of @p point in @p bounds. */
[[nodiscard]] bool is_point_in_bounds(const GeoPoint& point, const GeoBounds& bounds) noexcept;

/** @brief True iff @p target lies entirely inside @p container (inclusive). */
[[nodiscard]] bool is_region_covered(const GeoBounds& target, const GeoBounds& container) noexcept;

/** @brief Outcome of a download admission. */
enum class AdmissionResult {
    Started,          /**< A fresh `downloading` record was inserted. */
    AlreadyAvailable  /**< The region is already cached; nothing to do. */
};

/**
 * @brief Admission outcome plus the record as it stands afterwards.
 *
 * A started admission carries a generation unique within the registry's
 * lifetime. Download transitions must present it, so work belonging to a
 * deleted and re-requested region cannot land in the new record.
 */
struct Admission final {
    AdmissionResult result{AdmissionResult::Started};
    OfflineRegion region{};
    std::uint64_t generation{0};
};

/** @brief Thread-safe region store backed by durable key-value storage. */
class RegionRegistry final {
  public:
    RegionRegistry(KeyValueStore& store, CapacityManager& capacity_manager);

    /**
     * @brief Reload records from storage, replacing the in-memory map.
     *
     * Records persisted mid-download belong to a previous process and are
     * demoted to Error so they can be requested again.
     */
    void load();

    /** @brief Copies of every known record. */
    [[nodiscard]] std::vector<OfflineRegion> all_regions() const;
    /** @brief Copy of the record for @p region_id, if known. */
    [[nodiscard]] std::optional<OfflineRegion> region(const std::string& region_id) const;

    /**
     * @brief Gate and register a download request.
     *
     * @throws AlreadyDownloadingError when the id is mid-download.
     * @throws QuotaExceededError when the estimate does not fit the quota.
     * @throws ParseError when the request text is not valid UTF-8.
     * The registry is left untouched whenever this throws.
     */
    Admission admit_download(const RegionRequest& request);

    /** @brief True while @p region_id is downloading under @p generation. */
    [[nodiscard]] bool is_current_download(const std::string& region_id, std::uint64_t generation) const;

    /** @brief Record progress for the admission @p generation of @p region_id. */
    bool update_progress(const std::string& region_id, std::uint64_t generation, int progress);
    /**
     * @brief Transition a downloading region to Available and persist its
     *        fetched tiles. Returns false if @p generation is no longer the
     *        current download (deleted, re-requested or timed out meanwhile).
     */
    bool complete_download(const std::string& region_id,
                           std::uint64_t generation,
                           const std::vector<MapTile>& fetched_tiles,
                           Timestamp completed_at);
    /** @brief Transition the current download of @p region_id to Error. */
    bool fail_download(const std::string& region_id, std::uint64_t generation);

    /**
     * @brief Delete tile files, the tile list and the record for
     *        @p region_id. Returns false for unknown ids.
     *
     * Tile file removal is best-effort; failures are logged and the record is
     * removed regardless.
     */
    bool remove_region(const std::string& region_id);
    /** @brief Identifiers of every known record. */
    [[nodiscard]] std::vector<std::string> region_ids() const;

    /**
     * @brief Mark Available regions older than @p max_age as Outdated.
     * @return Identifiers of the regions transitioned by this call.
     */
    std::vector<std::string> mark_outdated(Timestamp now, std::chrono::milliseconds max_age = k_region_max_age);

    /** @brief Estimated megabytes held by Available and Outdated regions. */
    [[nodiscard]] double total_cache_size() const;
    /** @brief True if any Available region contains @p point. */
    [[nodiscard]] bool is_point_covered(const GeoPoint& point) const;
    /** @brief True if any Available region fully contains @p bounds. */
    [[nodiscard]] bool is_region_available_offline(const GeoBounds& bounds) const;

    /** @brief Persisted tile list for @p region_id (empty when absent or unreadable). */
    [[nodiscard]] std::vector<MapTile> load_tile_data(const std::string& region_id) const;

  private:
    [[nodiscard]] bool is_current_locked(const std::string& region_id, std::uint64_t generation) const;
    [[nodiscard]] OfflineRegion* find_current_locked(const std::string& region_id, std::uint64_t generation);
    [[nodiscard]] std::vector<OfflineRegion> snapshot_locked() const;
    void persist_locked() const;
    void save_tile_data_locked(const std::string& region_id, const std::vector<MapTile>& tiles) const;
    void delete_tile_files_locked(const std::string& region_id) const;

    KeyValueStore& store_;
    CapacityManager& capacity_manager_;
    mutable std::mutex mutex_;
    std::map<std::string, OfflineRegion> map_regions_;
    std::map<std::string, std::uint64_t> map_generations_;
    std::uint64_t next_generation_{1};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace offline_maps
