#include "offline_maps/download_scheduler.hpp"

#include <algorithm>
#include <exception>
#include <iterator>

#include "offline_maps/errors.hpp"
#include "offline_maps/tile_math.hpp"

namespace offline_maps {

bool exceeds_failure_threshold(const DownloadTally& tally, double max_failure_ratio) noexcept {
    if (tally.total_tiles == 0) {
        return true;
    }
    const double failure_ratio = static_cast<double>(tally.failed_tiles) / static_cast<double>(tally.total_tiles);
    return failure_ratio > max_failure_ratio;
}

DownloadScheduler::DownloadScheduler(SchedulerConfig config,
                                     RegionRegistry& registry,
                                     TileFetcher& tile_fetcher,
                                     ProgressNotifier& progress_notifier)
    : config_(std::move(config)),
      registry_(registry),
      tile_fetcher_(tile_fetcher),
      progress_notifier_(progress_notifier),
      logger_(get_logger()) {
    config_.batch_size = std::max<std::size_t>(1, config_.batch_size);
}

DownloadScheduler::~DownloadScheduler() {
    shutdown();
}

void DownloadScheduler::start() {
    if (flag_running_.exchange(true)) {
        return;
    }
    logger_->info(
        R"({{"component":"scheduler","action":"start","zoom":"{}-{}","batch":{},"timeout_s":{}}})",
        config_.min_zoom,
        config_.max_zoom,
        config_.batch_size,
        config_.region_timeout.count()
    );
    worker_thread_ = std::thread(&DownloadScheduler::worker_loop, this);
    watchdog_thread_ = std::thread(&DownloadScheduler::watchdog_loop, this);
}

void DownloadScheduler::shutdown() {
    flag_stopped_.store(true);
    if (flag_running_.exchange(false)) {
        logger_->info(R"({"component":"scheduler","action":"shutdown"})");
        {
            std::scoped_lock lock(mutex_);
            queue_cv_.notify_all();
            watchdog_cv_.notify_all();
        }
        if (worker_thread_.joinable()) {
            worker_thread_.join();
        }
        if (watchdog_thread_.joinable()) {
            watchdog_thread_.join();
        }
    }

    std::scoped_lock lock(mutex_);
    queue_downloads_.clear();
    for (auto& [region_id, pending] : map_pending_) {
        registry_.fail_download(region_id, pending.generation);
        pending.promise.set_exception(std::make_exception_ptr(DownloadCancelledError(region_id, "engine stopped")));
    }
    map_pending_.clear();
}

std::future<OfflineRegion> DownloadScheduler::enqueue(const std::string& region_id, std::uint64_t generation) {
    std::scoped_lock lock(mutex_);
    PendingCompletion pending{};
    pending.generation = generation;
    if (flag_stopped_.load()) {
        registry_.fail_download(region_id, generation);
        pending.promise.set_exception(std::make_exception_ptr(DownloadCancelledError(region_id, "engine stopped")));
        return pending.promise.get_future();
    }
    if (!registry_.is_current_download(region_id, generation)) {
        logger_->warn(
            R"({{"component":"scheduler","region":"{}","action":"reject_stale_enqueue","generation":{}}})",
            region_id,
            generation
        );
        pending.promise.set_exception(
            std::make_exception_ptr(DownloadCancelledError(region_id, "region no longer downloading"))
        );
        return pending.promise.get_future();
    }
    pending.deadline = SteadyClock::now() + config_.region_timeout;
    std::future<OfflineRegion> future = pending.promise.get_future();
    map_pending_.insert_or_assign(region_id, std::move(pending));
    queue_downloads_.push_back(QueuedDownload{region_id, generation});
    logger_->info(
        R"({{"component":"scheduler","region":"{}","action":"enqueue","generation":{},"queue_depth":{}}})",
        region_id,
        generation,
        queue_downloads_.size()
    );
    queue_cv_.notify_one();
    watchdog_cv_.notify_one();
    return future;
}

bool DownloadScheduler::cancel(const std::string& region_id) {
    std::scoped_lock lock(mutex_);
    const std::size_t queued_before = queue_downloads_.size();
    erase_queued_locked(region_id);
    const bool was_queued = queue_downloads_.size() != queued_before;
    const auto iterator_pending = map_pending_.find(region_id);
    const bool had_pending = iterator_pending != map_pending_.end();
    if (had_pending) {
        iterator_pending->second.promise.set_exception(
            std::make_exception_ptr(DownloadCancelledError(region_id, "region deleted"))
        );
        map_pending_.erase(iterator_pending);
    }
    if (was_queued || had_pending) {
        logger_->info(R"({{"component":"scheduler","region":"{}","action":"cancel"}})", region_id);
    }
    return was_queued || had_pending;
}

void DownloadScheduler::cancel_all() {
    std::scoped_lock lock(mutex_);
    queue_downloads_.clear();
    for (auto& [region_id, pending] : map_pending_) {
        pending.promise.set_exception(std::make_exception_ptr(DownloadCancelledError(region_id, "queue cleared")));
    }
    map_pending_.clear();
}

std::size_t DownloadScheduler::queued_count() const {
    std::scoped_lock lock(mutex_);
    return queue_downloads_.size();
}

std::optional<std::string> DownloadScheduler::active_region() const {
    std::scoped_lock lock(mutex_);
    if (!optional_active_.has_value()) {
        return std::nullopt;
    }
    return optional_active_->region_id;
}

const SchedulerConfig& DownloadScheduler::config() const noexcept {
    return config_;
}

void DownloadScheduler::worker_loop() {
    while (true) {
        QueuedDownload entry{};
        {
            std::unique_lock lock(mutex_);
            queue_cv_.wait(lock, [this]() { return !flag_running_.load() || !queue_downloads_.empty(); });
            if (!flag_running_.load()) {
                break;
            }
            entry = queue_downloads_.front();
            queue_downloads_.pop_front();
            optional_active_ = entry;
        }

        const std::optional<OfflineRegion> optional_region = registry_.region(entry.region_id);
        if (!optional_region.has_value() || !registry_.is_current_download(entry.region_id, entry.generation)) {
            logger_->warn(
                R"({{"component":"scheduler","region":"{}","action":"skip_stale_entry","generation":{}}})",
                entry.region_id,
                entry.generation
            );
            reject(
                entry.region_id,
                entry.generation,
                std::make_exception_ptr(DownloadCancelledError(entry.region_id, "region no longer downloading"))
            );
        } else {
            try {
                download_region(optional_region.value(), entry.generation);
            } catch (const std::exception& exc) {
                logger_->error(
                    R"({{"component":"scheduler","region":"{}","action":"download","error":"{}"}})",
                    entry.region_id,
                    exc.what()
                );
                registry_.fail_download(entry.region_id, entry.generation);
                reject(entry.region_id, entry.generation, std::current_exception());
            }
        }

        std::scoped_lock lock(mutex_);
        optional_active_.reset();
    }
}

void DownloadScheduler::watchdog_loop() {
    std::unique_lock lock(mutex_);
    while (flag_running_.load()) {
        auto next_deadline = SteadyClock::time_point::max();
        for (const auto& [region_id, pending] : map_pending_) {
            next_deadline = std::min(next_deadline, pending.deadline);
        }
        if (next_deadline == SteadyClock::time_point::max()) {
            watchdog_cv_.wait(lock);
        } else {
            watchdog_cv_.wait_until(lock, next_deadline);
        }
        if (!flag_running_.load()) {
            break;
        }

        const auto now = SteadyClock::now();
        for (auto iterator_pending = map_pending_.begin(); iterator_pending != map_pending_.end();) {
            const std::string& region_id = iterator_pending->first;
            PendingCompletion& pending = iterator_pending->second;
            if (pending.deadline > now) {
                ++iterator_pending;
                continue;
            }
            if (!registry_.fail_download(region_id, pending.generation)
                && is_active_locked(region_id, pending.generation)) {
                // The worker holds this entry and settles it on its way out.
                pending.deadline = SteadyClock::time_point::max();
                ++iterator_pending;
                continue;
            }
            std::erase_if(queue_downloads_, [&region_id, &pending](const QueuedDownload& queued) {
                return queued.region_id == region_id && queued.generation == pending.generation;
            });
            logger_->error(
                R"({{"component":"scheduler","region":"{}","action":"timeout","timeout_s":{}}})",
                region_id,
                config_.region_timeout.count()
            );
            pending.promise.set_exception(
                std::make_exception_ptr(DownloadTimeoutError(region_id, config_.region_timeout.count()))
            );
            iterator_pending = map_pending_.erase(iterator_pending);
        }
    }
}

void DownloadScheduler::download_region(const OfflineRegion& region, std::uint64_t generation) {
    std::vector<MapTile> list_tiles = tiles_for_region(region.bounds, config_.min_zoom, config_.max_zoom, config_.tile_url_template);
    DownloadTally tally{};
    tally.total_tiles = list_tiles.size();
    logger_->info(
        R"({{"component":"scheduler","region":"{}","action":"download_start","name":"{}","tiles":{}}})",
        region.id,
        region.name,
        tally.total_tiles
    );

    if (tally.total_tiles == 0) {
        registry_.fail_download(region.id, generation);
        reject(region.id, generation, std::make_exception_ptr(DownloadFailedError(0, 0)));
        return;
    }

    int last_progress = 0;
    for (std::size_t batch_start = 0; batch_start < list_tiles.size(); batch_start += config_.batch_size) {
        if (!should_continue(region.id, generation)) {
            logger_->warn(
                R"({{"component":"scheduler","region":"{}","action":"abandon","settled":{},"total":{}}})",
                region.id,
                tally.downloaded_tiles + tally.failed_tiles,
                tally.total_tiles
            );
            reject(
                region.id,
                generation,
                std::make_exception_ptr(DownloadCancelledError(region.id, "download abandoned"))
            );
            return;
        }

        const std::size_t batch_end = std::min(batch_start + config_.batch_size, list_tiles.size());
        std::vector<std::future<bool>> list_fetches;
        list_fetches.reserve(batch_end - batch_start);
        for (std::size_t index = batch_start; index < batch_end; ++index) {
            list_fetches.push_back(std::async(std::launch::async, [this, &tile = list_tiles[index]]() {
                return fetch_tile(tile);
            }));
        }

        for (std::future<bool>& fetch : list_fetches) {
            if (fetch.get()) {
                ++tally.downloaded_tiles;
            } else {
                ++tally.failed_tiles;
            }
            last_progress = static_cast<int>(tally.downloaded_tiles * 100 / tally.total_tiles);
            if (registry_.update_progress(region.id, generation, last_progress)) {
                progress_notifier_.notify(region.id, last_progress);
            }
        }
    }

    logger_->info(
        R"({{"component":"scheduler","region":"{}","action":"download_settled","downloaded":{},"failed":{}}})",
        region.id,
        tally.downloaded_tiles,
        tally.failed_tiles
    );

    if (exceeds_failure_threshold(tally, config_.max_failure_ratio)) {
        registry_.fail_download(region.id, generation);
        reject(
            region.id,
            generation,
            std::make_exception_ptr(DownloadFailedError(tally.failed_tiles, tally.total_tiles))
        );
        return;
    }

    std::vector<MapTile> list_fetched;
    list_fetched.reserve(tally.downloaded_tiles);
    std::copy_if(list_tiles.begin(), list_tiles.end(), std::back_inserter(list_fetched), [](const MapTile& tile) {
        return tile.path.has_value();
    });

    if (!registry_.complete_download(region.id, generation, list_fetched, now_timestamp())) {
        logger_->warn(R"({{"component":"scheduler","region":"{}","action":"late_completion_ignored"}})", region.id);
        reject(
            region.id,
            generation,
            std::make_exception_ptr(DownloadCancelledError(region.id, "region no longer downloading"))
        );
        return;
    }
    if (last_progress < 100) {
        progress_notifier_.notify(region.id, 100);
    }

    const std::optional<OfflineRegion> optional_completed = registry_.region(region.id);
    if (optional_completed.has_value()) {
        resolve(region.id, generation, optional_completed.value());
    }
}

bool DownloadScheduler::fetch_tile(MapTile& tile) {
    const std::filesystem::path path_tile = config_.tile_base_path / tile_file_name(tile.z, tile.x, tile.y);
    try {
        if (!tile_fetcher_.fetch(tile.url, path_tile)) {
            return false;
        }
    } catch (const std::exception& exc) {
        logger_->error(R"({{"component":"scheduler","url":"{}","error":"{}"}})", tile.url, exc.what());
        return false;
    }
    tile.path = path_tile.string();
    return true;
}

bool DownloadScheduler::should_continue(const std::string& region_id, std::uint64_t generation) const {
    return flag_running_.load() && registry_.is_current_download(region_id, generation);
}

bool DownloadScheduler::is_active_locked(const std::string& region_id, std::uint64_t generation) const {
    return optional_active_.has_value()
        && optional_active_->region_id == region_id
        && optional_active_->generation == generation;
}

void DownloadScheduler::erase_queued_locked(const std::string& region_id) {
    std::erase_if(queue_downloads_, [&region_id](const QueuedDownload& queued) {
        return queued.region_id == region_id;
    });
}

void DownloadScheduler::resolve(const std::string& region_id, std::uint64_t generation, const OfflineRegion& region) {
    std::scoped_lock lock(mutex_);
    const auto iterator_pending = map_pending_.find(region_id);
    if (iterator_pending == map_pending_.end() || iterator_pending->second.generation != generation) {
        return;
    }
    iterator_pending->second.promise.set_value(region);
    map_pending_.erase(iterator_pending);
}

void DownloadScheduler::reject(const std::string& region_id, std::uint64_t generation, std::exception_ptr error) {
    std::scoped_lock lock(mutex_);
    const auto iterator_pending = map_pending_.find(region_id);
    if (iterator_pending == map_pending_.end() || iterator_pending->second.generation != generation) {
        return;
    }
    iterator_pending->second.promise.set_exception(std::move(error));
    map_pending_.erase(iterator_pending);
}

}  // namespace offline_maps
