#include "offline_maps/capacity_manager.hpp"

#include "offline_maps/errors.hpp"

namespace offline_maps {

CapacityManager::CapacityManager(double max_cache_size_mb)
    : max_cache_size_mb_(max_cache_size_mb) {}

double CapacityManager::max_cache_size_mb() const noexcept {
    return max_cache_size_mb_.load();
}

void CapacityManager::set_max_cache_size_mb(double max_cache_size_mb) noexcept {
    max_cache_size_mb_.store(max_cache_size_mb);
}

double CapacityManager::total_cache_size(const std::vector<OfflineRegion>& regions) noexcept {
    double total_mb = 0.0;
    for (const OfflineRegion& region : regions) {
        if (region.status == RegionStatus::Available || region.status == RegionStatus::Outdated) {
            total_mb += region.size_mb;
        }
    }
    return total_mb;
}

void CapacityManager::ensure_capacity(const std::vector<OfflineRegion>& regions, double requested_mb) const {
    const double limit_mb = max_cache_size_mb();
    const double current_mb = total_cache_size(regions);
    if (current_mb + requested_mb > limit_mb) {
        throw QuotaExceededError(limit_mb, current_mb, requested_mb);
    }
}

}  // namespace offline_maps
