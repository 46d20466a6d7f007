// === Download Scheduler ======================================================
//
// Serializes region downloads through a single worker thread (one active
// region at a time) fed by a FIFO queue. Each region's tiles are fetched in
// concurrent batches; a batch fully settles before the next one starts.
// Completion is reported through per-request futures, and a watchdog thread
// enforces the hard per-region deadline.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "offline_maps/logging.hpp"
#include "offline_maps/progress_notifier.hpp"
#include "offline_maps/region_registry.hpp"
#include "offline_maps/tile_fetcher.hpp"
#include "offline_maps/types.hpp"

namespace offline_maps {

/** @brief Tunables for tile enumeration, batching and completion policy. */
struct SchedulerConfig final {
    std::string tile_url_template{"https://tile.openstreetmap.org/{z}/{x}/{y}.png"};
    std::filesystem::path tile_base_path{"map_tiles"};
    int min_zoom{10};
    int max_zoom{18};
    std::size_t batch_size{10};
    double max_failure_ratio{0.2};  /**< Regions fail when failed/total exceeds this. */
    std::chrono::seconds region_timeout{std::chrono::minutes{10}};
};

/** @brief Tile counters for a region once every tile has settled. */
struct DownloadTally final {
    std::size_t total_tiles{};
    std::size_t downloaded_tiles{};
    std::size_t failed_tiles{};
};

/** @brief True when the failure ratio of @p tally exceeds @p max_failure_ratio. */
[[nodiscard]] bool exceeds_failure_threshold(const DownloadTally& tally, double max_failure_ratio) noexcept;

/** @brief Single-slot region download queue. */
class DownloadScheduler final {
  public:
    DownloadScheduler(SchedulerConfig config,
                      RegionRegistry& registry,
                      TileFetcher& tile_fetcher,
                      ProgressNotifier& progress_notifier);
    ~DownloadScheduler();

    DownloadScheduler(const DownloadScheduler&) = delete;
    DownloadScheduler& operator=(const DownloadScheduler&) = delete;

    /** @brief Launch the worker and watchdog threads. */
    void start();
    /**
     * @brief Stop both threads; pending requests fail with Cancelled and
     *        their records move to Error. Later enqueues fail the same way.
     */
    void shutdown();

    /**
     * @brief Queue admission @p generation of @p region_id.
     *
     * The future yields the Available record, or fails with
     * `DownloadFailedError`, `DownloadTimeoutError` or
     * `DownloadCancelledError`. An entry whose admission is no longer the
     * registry's current download when the worker reaches it fails with
     * `DownloadCancelledError`.
     */
    [[nodiscard]] std::future<OfflineRegion> enqueue(const std::string& region_id, std::uint64_t generation);

    /**
     * @brief Withdraw @p region_id: drop it from the queue if it has not
     *        started and fail its pending future. An in-flight download stops
     *        at the next batch boundary.
     */
    bool cancel(const std::string& region_id);
    /** @brief Withdraw every queued and pending request. */
    void cancel_all();

    /** @brief Number of regions waiting for the active slot. */
    [[nodiscard]] std::size_t queued_count() const;
    /** @brief Region currently holding the active slot, if any. */
    [[nodiscard]] std::optional<std::string> active_region() const;
    /** @brief Active configuration. */
    [[nodiscard]] const SchedulerConfig& config() const noexcept;

  private:
    struct QueuedDownload final {
        std::string region_id;
        std::uint64_t generation{};
    };

    struct PendingCompletion final {
        std::promise<OfflineRegion> promise;
        SteadyClock::time_point deadline;
        std::uint64_t generation{};
    };

    void worker_loop();
    void watchdog_loop();
    void download_region(const OfflineRegion& region, std::uint64_t generation);
    [[nodiscard]] bool fetch_tile(MapTile& tile);
    [[nodiscard]] bool should_continue(const std::string& region_id, std::uint64_t generation) const;
    [[nodiscard]] bool is_active_locked(const std::string& region_id, std::uint64_t generation) const;
    void erase_queued_locked(const std::string& region_id);
    /** @brief Settle the pending future of @p region_id if it still belongs to @p generation. */
    void resolve(const std::string& region_id, std::uint64_t generation, const OfflineRegion& region);
    void reject(const std::string& region_id, std::uint64_t generation, std::exception_ptr error);

    SchedulerConfig config_;
    RegionRegistry& registry_;
    TileFetcher& tile_fetcher_;
    ProgressNotifier& progress_notifier_;

    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable watchdog_cv_;
    std::deque<QueuedDownload> queue_downloads_;
    std::map<std::string, PendingCompletion> map_pending_;
    std::optional<QueuedDownload> optional_active_;
    std::atomic<bool> flag_running_{false};
    std::atomic<bool> flag_stopped_{false};
    std::thread worker_thread_;
    std::thread watchdog_thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace offline_maps
