// === Offline Map Service =====================================================
//
// Composition root of the offline map engine. Owns the registry, capacity
// manager, download scheduler, auto-update scheduler and snapshot cache, and
// exposes the public request/delete/query API. Collaborators (storage, tile
// fetcher, network monitor) are injected by reference and must outlive the
// service.

#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "offline_maps/auto_update_scheduler.hpp"
#include "offline_maps/capacity_manager.hpp"
#include "offline_maps/download_scheduler.hpp"
#include "offline_maps/key_value_store.hpp"
#include "offline_maps/logging.hpp"
#include "offline_maps/network_monitor.hpp"
#include "offline_maps/progress_notifier.hpp"
#include "offline_maps/region_registry.hpp"
#include "offline_maps/snapshot_cache.hpp"
#include "offline_maps/tile_fetcher.hpp"

namespace offline_maps {

/** @brief Engine-level knobs assembled by the configuration loader. */
struct ServiceConfig final {
    SchedulerConfig scheduler{};
    AutoUpdateConfig auto_update{};
    double max_cache_size_mb{k_default_max_cache_size_mb};
    bool enable_auto_update{true};  /**< Start the auto-update tick thread in start(). */
};

/** @brief Public facade of the offline map engine. */
class OfflineMapService final {
  public:
    OfflineMapService(ServiceConfig config,
                      KeyValueStore& store,
                      TileFetcher& tile_fetcher,
                      NetworkMonitor& network_monitor);
    ~OfflineMapService();

    OfflineMapService(const OfflineMapService&) = delete;
    OfflineMapService& operator=(const OfflineMapService&) = delete;

    /** @brief Load persisted state and launch the background threads. */
    void start();
    /** @brief Stop background threads; pending downloads fail with Cancelled. */
    void shutdown();

    [[nodiscard]] std::vector<OfflineRegion> get_all_regions() const;
    [[nodiscard]] std::optional<OfflineRegion> get_region(const std::string& region_id) const;

    /**
     * @brief Request a region download.
     *
     * Returns a ready future holding the existing record when the region is
     * already available.
     *
     * @throws AlreadyDownloadingError if the id is mid-download.
     * @throws QuotaExceededError if the estimate does not fit the quota.
     * @throws ParseError if the id or name is not valid UTF-8.
     */
    [[nodiscard]] std::future<OfflineRegion> request_download(const RegionRequest& request);

    /** @brief Delete a region, its queued work and its tile files. */
    bool delete_region(const std::string& region_id);
    /** @brief Delete every region and clear the queue. */
    bool delete_all_regions();

    [[nodiscard]] bool is_point_covered(const GeoPoint& point) const;
    [[nodiscard]] bool is_region_available_offline(const GeoBounds& bounds) const;

    [[nodiscard]] double total_cache_size() const;
    [[nodiscard]] double max_cache_size() const noexcept;
    void set_max_cache_size(double max_cache_size_mb) noexcept;

    /** @brief Tile list persisted for @p region_id. */
    [[nodiscard]] std::vector<MapTile> load_tile_data(const std::string& region_id) const;
    /** @brief Mark stale regions outdated; returns the ids transitioned. */
    std::vector<std::string> check_for_updates();

    ListenerId add_progress_listener(ProgressListener listener);
    bool remove_progress_listener(ListenerId listener_id);

    [[nodiscard]] AutoUpdateSettings auto_update_settings() const;
    void update_auto_update_settings(const AutoUpdateSettingsPatch& patch);

    [[nodiscard]] AutoUpdateScheduler& auto_updater() noexcept;
    [[nodiscard]] DownloadScheduler& download_scheduler() noexcept;
    [[nodiscard]] SnapshotCache& snapshot_cache() noexcept;

  private:
    void refresh_region(const OfflineRegion& region);

    ServiceConfig config_;
    CapacityManager capacity_manager_;
    RegionRegistry registry_;
    ProgressNotifier progress_notifier_;
    DownloadScheduler download_scheduler_;
    AutoUpdateScheduler auto_updater_;
    SnapshotCache snapshot_cache_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace offline_maps
