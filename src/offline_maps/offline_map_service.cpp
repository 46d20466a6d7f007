#include "offline_maps/offline_map_service.hpp"

#include <filesystem>

#include "offline_maps/errors.hpp"

namespace offline_maps {

OfflineMapService::OfflineMapService(ServiceConfig config,
                                     KeyValueStore& store,
                                     TileFetcher& tile_fetcher,
                                     NetworkMonitor& network_monitor)
    : config_(std::move(config)),
      capacity_manager_(config_.max_cache_size_mb),
      registry_(store, capacity_manager_),
      progress_notifier_(),
      download_scheduler_(config_.scheduler, registry_, tile_fetcher, progress_notifier_),
      auto_updater_(config_.auto_update,
                    store,
                    registry_,
                    network_monitor,
                    [this](const OfflineRegion& region) { refresh_region(region); }),
      snapshot_cache_(store),
      logger_(get_logger()) {}

OfflineMapService::~OfflineMapService() {
    shutdown();
}

void OfflineMapService::start() {
    logger_->info("Starting offline map service");
    registry_.load();
    auto_updater_.load_settings();

    const std::filesystem::path& tile_base_path = config_.scheduler.tile_base_path;
    std::error_code error_directory;
    std::filesystem::create_directories(tile_base_path, error_directory);
    if (error_directory) {
        logger_->error("Unable to create tile directory {}: {}", tile_base_path.string(), error_directory.message());
    }

    download_scheduler_.start();
    if (config_.enable_auto_update) {
        auto_updater_.start();
    }
}

void OfflineMapService::shutdown() {
    auto_updater_.request_stop();
    download_scheduler_.shutdown();
    auto_updater_.stop();
}

std::vector<OfflineRegion> OfflineMapService::get_all_regions() const {
    return registry_.all_regions();
}

std::optional<OfflineRegion> OfflineMapService::get_region(const std::string& region_id) const {
    return registry_.region(region_id);
}

std::future<OfflineRegion> OfflineMapService::request_download(const RegionRequest& request) {
    const Admission admission = registry_.admit_download(request);
    if (admission.result == AdmissionResult::AlreadyAvailable) {
        logger_->info(R"({{"component":"service","region":"{}","action":"already_available"}})", request.id);
        std::promise<OfflineRegion> ready;
        ready.set_value(admission.region);
        return ready.get_future();
    }
    return download_scheduler_.enqueue(request.id, admission.generation);
}

bool OfflineMapService::delete_region(const std::string& region_id) {
    download_scheduler_.cancel(region_id);
    return registry_.remove_region(region_id);
}

bool OfflineMapService::delete_all_regions() {
    download_scheduler_.cancel_all();
    for (const std::string& region_id : registry_.region_ids()) {
        registry_.remove_region(region_id);
    }
    logger_->info("Deleted all offline regions");
    return true;
}

bool OfflineMapService::is_point_covered(const GeoPoint& point) const {
    return registry_.is_point_covered(point);
}

bool OfflineMapService::is_region_available_offline(const GeoBounds& bounds) const {
    return registry_.is_region_available_offline(bounds);
}

double OfflineMapService::total_cache_size() const {
    return registry_.total_cache_size();
}

double OfflineMapService::max_cache_size() const noexcept {
    return capacity_manager_.max_cache_size_mb();
}

void OfflineMapService::set_max_cache_size(double max_cache_size_mb) noexcept {
    capacity_manager_.set_max_cache_size_mb(max_cache_size_mb);
}

std::vector<MapTile> OfflineMapService::load_tile_data(const std::string& region_id) const {
    return registry_.load_tile_data(region_id);
}

std::vector<std::string> OfflineMapService::check_for_updates() {
    return registry_.mark_outdated(now_timestamp(), config_.auto_update.region_max_age);
}

ListenerId OfflineMapService::add_progress_listener(ProgressListener listener) {
    return progress_notifier_.add_listener(std::move(listener));
}

bool OfflineMapService::remove_progress_listener(ListenerId listener_id) {
    return progress_notifier_.remove_listener(listener_id);
}

AutoUpdateSettings OfflineMapService::auto_update_settings() const {
    return auto_updater_.settings();
}

void OfflineMapService::update_auto_update_settings(const AutoUpdateSettingsPatch& patch) {
    auto_updater_.update_settings(patch);
}

AutoUpdateScheduler& OfflineMapService::auto_updater() noexcept {
    return auto_updater_;
}

DownloadScheduler& OfflineMapService::download_scheduler() noexcept {
    return download_scheduler_;
}

SnapshotCache& OfflineMapService::snapshot_cache() noexcept {
    return snapshot_cache_;
}

void OfflineMapService::refresh_region(const OfflineRegion& region) {
    logger_->info(R"({{"component":"service","region":"{}","action":"refresh","name":"{}"}})", region.id, region.name);
    delete_region(region.id);

    RegionRequest request{};
    request.id = region.id;
    request.name = region.name;
    request.bounds = region.bounds;
    request.size_mb = region.size_mb;
    request_download(request).get();
}

}  // namespace offline_maps
