// === Auto-Update Scheduler ===================================================
//
// Periodically decides whether cached regions should be refreshed. A check
// runs on every tick, immediately on start, whenever the settings change and
// whenever the network class changes. When every gate passes (enabled,
// network policy, interval elapsed, inside the time-of-day window) the
// scheduler records the check time, marks stale regions outdated and hands
// each one to the refresher, which deletes and re-downloads it.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "offline_maps/key_value_store.hpp"
#include "offline_maps/logging.hpp"
#include "offline_maps/network_monitor.hpp"
#include "offline_maps/region_registry.hpp"
#include "offline_maps/types.hpp"

namespace offline_maps {

/** @brief Storage key holding the persisted auto-update settings. */
inline constexpr char k_auto_update_storage_key[] = "offline_map_autoupdate";

/** @brief Deletes and re-downloads one outdated region; throws on failure. */
using RegionRefresher = std::function<void(const OfflineRegion&)>;

/** @brief Timing knobs for the auto-update loop. */
struct AutoUpdateConfig final {
    std::chrono::seconds tick_interval{std::chrono::hours{1}};
    std::chrono::minutes time_window{30};  /**< Allowed distance from `time_of_day`. */
    std::chrono::milliseconds region_max_age{k_region_max_age};
};

/** @brief Result of evaluating the auto-update gates. */
enum class AutoUpdateDecision {
    Disabled,
    NetworkUnsuitable,
    IntervalNever,
    IntervalNotElapsed,
    InvalidTimeOfDay,
    OutsideTimeWindow,
    Run
};

std::string_view to_string(AutoUpdateDecision decision) noexcept;

/** @brief Parse "HH:MM" into minutes after midnight. */
[[nodiscard]] std::optional<int> parse_time_of_day(std::string_view time_of_day) noexcept;
/** @brief Local-time minutes after midnight for @p time_point. */
[[nodiscard]] int local_minute_of_day(SystemClock::time_point time_point);
/** @brief Distance in minutes between two minute-of-day values, wrapping midnight. */
[[nodiscard]] int circular_minute_distance(int lhs_minutes, int rhs_minutes) noexcept;
/** @brief Period for @p interval, or nullopt for `Never`. */
[[nodiscard]] std::optional<std::chrono::milliseconds> interval_period(UpdateInterval interval) noexcept;

/** @brief Condition-driven refresher of stale regions. */
class AutoUpdateScheduler final {
  public:
    AutoUpdateScheduler(AutoUpdateConfig config,
                        KeyValueStore& store,
                        RegionRegistry& registry,
                        NetworkMonitor& network_monitor,
                        RegionRefresher refresher);
    ~AutoUpdateScheduler();

    AutoUpdateScheduler(const AutoUpdateScheduler&) = delete;
    AutoUpdateScheduler& operator=(const AutoUpdateScheduler&) = delete;

    /** @brief Merge persisted settings over the defaults. */
    void load_settings();
    /** @brief Copy of the current settings. */
    [[nodiscard]] AutoUpdateSettings settings() const;
    /** @brief Apply @p patch, persist, and request an immediate check. */
    void update_settings(const AutoUpdateSettingsPatch& patch);

    /** @brief Start the tick thread (runs a check immediately). */
    void start();
    /** @brief Stop refreshing further regions without waiting for the tick thread. */
    void request_stop();
    /** @brief Stop the tick thread. */
    void stop();
    /** @brief Wake the tick thread for an out-of-band check. */
    void request_check();

    /** @brief Evaluate the gates for @p now without side effects. */
    [[nodiscard]] AutoUpdateDecision evaluate(SystemClock::time_point now) const;
    /**
     * @brief Evaluate the gates and, when they pass, persist the check time
     *        and run the refresh.
     */
    AutoUpdateDecision check(SystemClock::time_point now);
    /**
     * @brief Mark stale regions outdated and refresh every outdated region.
     * @return Identifiers refreshed successfully.
     */
    std::vector<std::string> run_update(Timestamp now);

  private:
    void tick_loop();
    void persist_settings_locked() const;

    AutoUpdateConfig config_;
    KeyValueStore& store_;
    RegionRegistry& registry_;
    NetworkMonitor& network_monitor_;
    RegionRefresher refresher_;

    mutable std::mutex settings_mutex_;
    AutoUpdateSettings settings_{};

    std::mutex check_mutex_;
    std::mutex tick_mutex_;
    std::condition_variable tick_cv_;
    bool flag_check_requested_{false};
    std::atomic<bool> flag_running_{false};
    std::atomic<bool> flag_stop_requested_{false};
    std::thread tick_thread_;
    std::optional<SubscriptionId> optional_network_subscription_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace offline_maps
