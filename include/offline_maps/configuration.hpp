// === Configuration ===========================================================
//
// Strongly-typed runtime settings for the offline map engine: storage
// locations, tile source, download policy, auto-update cadence and logging.
// `ConfigurationLoader` translates environment variables into these
// structures so downstream modules never touch `std::getenv` directly.

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "offline_maps/auto_update_scheduler.hpp"
#include "offline_maps/download_scheduler.hpp"
#include "offline_maps/logging.hpp"
#include "offline_maps/offline_map_service.hpp"
#include "offline_maps/tile_fetcher.hpp"
#include "offline_maps/types.hpp"

namespace offline_maps {

/**
 * @brief Immutable bundle of runtime knobs for the offline map engine.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative and avoid consulting environment variables directly.
 */
struct Configuration final {
    LogSettings logging{};                                /**< Log directory, rotation and verbosity. */
    std::filesystem::path data_directory{};               /**< Root of the key-value store. */
    ServiceConfig service{};                              /**< Scheduler, quota and auto-update settings. */
    CurlFetcherConfig fetcher{};                          /**< HTTP client settings. */
    std::optional<NetworkClass> forced_network_class{};   /**< Overrides sysfs detection when set. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    static Configuration load();

  private:
    static LogSettings load_logging();
    static SchedulerConfig load_scheduler(const std::filesystem::path& data_directory);
    static std::optional<NetworkClass> load_forced_network_class();
};

}  // namespace offline_maps
