// === Capacity Manager ========================================================
//
// Enforces the offline cache quota. Sizes are the caller-supplied estimates
// stored on each region record; bytes actually written to disk are never
// reconciled against them.

#pragma once

#include <atomic>
#include <vector>

#include "offline_maps/types.hpp"

namespace offline_maps {

/** @brief Default quota applied when no override is configured. */
inline constexpr double k_default_max_cache_size_mb{2000.0};

/** @brief Tracks the quota and evaluates admission of new regions. */
class CapacityManager final {
  public:
    explicit CapacityManager(double max_cache_size_mb = k_default_max_cache_size_mb);

    /** @brief Configured quota in megabytes. */
    [[nodiscard]] double max_cache_size_mb() const noexcept;
    /** @brief Replace the quota; existing regions are never evicted. */
    void set_max_cache_size_mb(double max_cache_size_mb) noexcept;

    /** @brief Sum of estimated sizes over Available and Outdated regions. */
    [[nodiscard]] static double total_cache_size(const std::vector<OfflineRegion>& regions) noexcept;

    /**
     * @brief Throw `QuotaExceededError` if admitting @p requested_mb on top of
     *        @p regions would exceed the quota.
     */
    void ensure_capacity(const std::vector<OfflineRegion>& regions, double requested_mb) const;

  private:
    std::atomic<double> max_cache_size_mb_;
};

}  // namespace offline_maps
