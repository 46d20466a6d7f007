#include "offline_maps/region_registry.hpp"

#include <filesystem>

#include <fmt/format.h>

#include "offline_maps/errors.hpp"
#include "offline_maps/json_codec.hpp"

namespace offline_maps {

std::string tile_storage_key(const std::string& region_id) {
    return fmt::format("{}_{}", k_tiles_storage_key_prefix, region_id);
}

bool is_point_in_bounds(const GeoPoint& point, const GeoBounds& bounds) noexcept {
    return point.latitude <= bounds.northeast.latitude
        && point.latitude >= bounds.southwest.latitude
        && point.longitude <= bounds.northeast.longitude
        && point.longitude >= bounds.southwest.longitude;
}

bool is_region_covered(const GeoBounds& target, const GeoBounds& container) noexcept {
    return target.southwest.latitude >= container.southwest.latitude
        && target.southwest.longitude >= container.southwest.longitude
        && target.northeast.latitude <= container.northeast.latitude
        && target.northeast.longitude <= container.northeast.longitude;
}

RegionRegistry::RegionRegistry(KeyValueStore& store, CapacityManager& capacity_manager)
    : store_(store),
      capacity_manager_(capacity_manager),
      logger_(get_logger()) {}

void RegionRegistry::load() {
    std::scoped_lock lock(mutex_);
    map_regions_.clear();
    map_generations_.clear();

    std::vector<OfflineRegion> list_stored;
    try {
        const std::optional<std::string> payload = store_.get(k_regions_storage_key);
        if (!payload.has_value()) {
            logger_->info("No stored offline regions");
            return;
        }
        list_stored = decode_json<std::vector<OfflineRegion>>(payload.value());
    } catch (const OfflineMapError& exc) {
        logger_->error(R"({{"component":"registry","action":"load","error":"{}"}})", exc.what());
        return;
    }

    bool demoted_any = false;
    for (OfflineRegion& region : list_stored) {
        if (region.status == RegionStatus::Downloading) {
            region.status = RegionStatus::Error;
            region.download_progress.reset();
            demoted_any = true;
            logger_->warn(R"({{"component":"registry","region":"{}","action":"demote_interrupted"}})", region.id);
        }
        map_regions_[region.id] = std::move(region);
    }
    logger_->info("Loaded {} offline regions", map_regions_.size());

    if (demoted_any) {
        persist_locked();
    }
}

std::vector<OfflineRegion> RegionRegistry::all_regions() const {
    std::scoped_lock lock(mutex_);
    return snapshot_locked();
}

std::optional<OfflineRegion> RegionRegistry::region(const std::string& region_id) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_region = map_regions_.find(region_id);
    if (iterator_region == map_regions_.end()) {
        return std::nullopt;
    }
    return iterator_region->second;
}

Admission RegionRegistry::admit_download(const RegionRequest& request) {
    std::scoped_lock lock(mutex_);
    const auto iterator_existing = map_regions_.find(request.id);
    if (iterator_existing != map_regions_.end()) {
        const OfflineRegion& existing = iterator_existing->second;
        if (existing.status == RegionStatus::Downloading) {
            throw AlreadyDownloadingError(request.id);
        }
        if (existing.status == RegionStatus::Available) {
            return Admission{AdmissionResult::AlreadyAvailable, existing, 0};
        }
    }

    capacity_manager_.ensure_capacity(snapshot_locked(), request.size_mb);

    OfflineRegion region{};
    region.id = request.id;
    region.name = request.name;
    region.bounds = request.bounds;
    region.size_mb = request.size_mb;
    region.status = RegionStatus::Downloading;
    region.download_progress = 0;

    // Rejects text the store cannot hold before the record becomes visible.
    static_cast<void>(encode_json(region));

    const std::uint64_t generation = next_generation_++;
    map_regions_[region.id] = region;
    map_generations_[region.id] = generation;
    persist_locked();

    logger_->info(
        R"({{"component":"registry","region":"{}","action":"admit","generation":{},"size_mb":{}}})",
        region.id,
        generation,
        region.size_mb
    );
    return Admission{AdmissionResult::Started, region, generation};
}

bool RegionRegistry::is_current_download(const std::string& region_id, std::uint64_t generation) const {
    std::scoped_lock lock(mutex_);
    return is_current_locked(region_id, generation);
}

bool RegionRegistry::update_progress(const std::string& region_id, std::uint64_t generation, int progress) {
    std::scoped_lock lock(mutex_);
    OfflineRegion* region = find_current_locked(region_id, generation);
    if (region == nullptr) {
        return false;
    }
    region->download_progress = progress;
    return true;
}

bool RegionRegistry::complete_download(const std::string& region_id,
                                       std::uint64_t generation,
                                       const std::vector<MapTile>& fetched_tiles,
                                       Timestamp completed_at) {
    std::scoped_lock lock(mutex_);
    OfflineRegion* current = find_current_locked(region_id, generation);
    if (current == nullptr) {
        return false;
    }
    OfflineRegion& region = *current;
    region.status = RegionStatus::Available;
    region.download_progress = 100;
    region.last_updated = completed_at;
    persist_locked();
    save_tile_data_locked(region_id, fetched_tiles);
    return true;
}

bool RegionRegistry::fail_download(const std::string& region_id, std::uint64_t generation) {
    std::scoped_lock lock(mutex_);
    OfflineRegion* region = find_current_locked(region_id, generation);
    if (region == nullptr) {
        return false;
    }
    region->status = RegionStatus::Error;
    persist_locked();
    return true;
}

bool RegionRegistry::remove_region(const std::string& region_id) {
    std::scoped_lock lock(mutex_);
    const auto iterator_region = map_regions_.find(region_id);
    if (iterator_region == map_regions_.end()) {
        return false;
    }

    delete_tile_files_locked(region_id);
    map_regions_.erase(iterator_region);
    map_generations_.erase(region_id);
    persist_locked();
    logger_->info(R"({{"component":"registry","region":"{}","action":"remove"}})", region_id);
    return true;
}

std::vector<std::string> RegionRegistry::region_ids() const {
    std::scoped_lock lock(mutex_);
    std::vector<std::string> list_ids;
    list_ids.reserve(map_regions_.size());
    for (const auto& [region_id, region] : map_regions_) {
        list_ids.push_back(region_id);
    }
    return list_ids;
}

std::vector<std::string> RegionRegistry::mark_outdated(Timestamp now, std::chrono::milliseconds max_age) {
    std::scoped_lock lock(mutex_);
    std::vector<std::string> list_outdated;
    for (auto& [region_id, region] : map_regions_) {
        if (region.status != RegionStatus::Available || !region.last_updated.has_value()) {
            continue;
        }
        if (now - region.last_updated.value() > max_age) {
            region.status = RegionStatus::Outdated;
            list_outdated.push_back(region_id);
        }
    }
    if (!list_outdated.empty()) {
        persist_locked();
        logger_->info("Marked {} regions outdated", list_outdated.size());
    }
    return list_outdated;
}

double RegionRegistry::total_cache_size() const {
    std::scoped_lock lock(mutex_);
    return CapacityManager::total_cache_size(snapshot_locked());
}

bool RegionRegistry::is_point_covered(const GeoPoint& point) const {
    std::scoped_lock lock(mutex_);
    for (const auto& [region_id, region] : map_regions_) {
        if (region.status == RegionStatus::Available && is_point_in_bounds(point, region.bounds)) {
            return true;
        }
    }
    return false;
}

bool RegionRegistry::is_region_available_offline(const GeoBounds& bounds) const {
    std::scoped_lock lock(mutex_);
    for (const auto& [region_id, region] : map_regions_) {
        if (region.status == RegionStatus::Available && is_region_covered(bounds, region.bounds)) {
            return true;
        }
    }
    return false;
}

std::vector<MapTile> RegionRegistry::load_tile_data(const std::string& region_id) const {
    try {
        const std::optional<std::string> payload = store_.get(tile_storage_key(region_id));
        if (!payload.has_value()) {
            return {};
        }
        return decode_json<std::vector<MapTile>>(payload.value());
    } catch (const OfflineMapError& exc) {
        logger_->error(
            R"({{"component":"registry","region":"{}","action":"load_tiles","error":"{}"}})",
            region_id,
            exc.what()
        );
    }
    return {};
}

std::vector<OfflineRegion> RegionRegistry::snapshot_locked() const {
    std::vector<OfflineRegion> list_regions;
    list_regions.reserve(map_regions_.size());
    for (const auto& [region_id, region] : map_regions_) {
        list_regions.push_back(region);
    }
    return list_regions;
}

bool RegionRegistry::is_current_locked(const std::string& region_id, std::uint64_t generation) const {
    const auto iterator_region = map_regions_.find(region_id);
    if (iterator_region == map_regions_.end() || iterator_region->second.status != RegionStatus::Downloading) {
        return false;
    }
    const auto iterator_generation = map_generations_.find(region_id);
    return iterator_generation != map_generations_.end() && iterator_generation->second == generation;
}

OfflineRegion* RegionRegistry::find_current_locked(const std::string& region_id, std::uint64_t generation) {
    if (!is_current_locked(region_id, generation)) {
        return nullptr;
    }
    return &map_regions_.at(region_id);
}

void RegionRegistry::persist_locked() const {
    try {
        store_.set(k_regions_storage_key, encode_json(snapshot_locked()));
    } catch (const OfflineMapError& exc) {
        logger_->error(R"({{"component":"registry","action":"persist","error":"{}"}})", exc.what());
    }
}

void RegionRegistry::save_tile_data_locked(const std::string& region_id, const std::vector<MapTile>& tiles) const {
    try {
        store_.set(tile_storage_key(region_id), encode_json(tiles));
    } catch (const OfflineMapError& exc) {
        logger_->error(
            R"({{"component":"registry","region":"{}","action":"save_tiles","error":"{}"}})",
            region_id,
            exc.what()
        );
    }
}

void RegionRegistry::delete_tile_files_locked(const std::string& region_id) const {
    const std::vector<MapTile> list_tiles = load_tile_data(region_id);
    std::size_t removed_count = 0;
    for (const MapTile& tile : list_tiles) {
        if (!tile.path.has_value()) {
            continue;
        }
        std::error_code error_remove;
        if (std::filesystem::remove(tile.path.value(), error_remove)) {
            ++removed_count;
        } else if (error_remove) {
            logger_->warn(
                R"({{"component":"registry","region":"{}","action":"remove_tile","path":"{}","error":"{}"}})",
                region_id,
                tile.path.value(),
                error_remove.message()
            );
        }
    }

    try {
        store_.remove(tile_storage_key(region_id));
    } catch (const OfflineMapError& exc) {
        logger_->error(
            R"({{"component":"registry","region":"{}","action":"remove_tiles","error":"{}"}})",
            region_id,
            exc.what()
        );
    }
    logger_->debug("Removed {} of {} tile files for {}", removed_count, list_tiles.size(), region_id);
}

}  // namespace offline_maps
