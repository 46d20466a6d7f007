// === Network Monitor =========================================================
//
// Reports the device's current connectivity class and notifies subscribers
// when it changes. The auto-update scheduler consults it before refreshing
// regions on Wi-Fi-only policies.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

#include "offline_maps/logging.hpp"
#include "offline_maps/types.hpp"

namespace offline_maps {

/** @brief Callback invoked with the new state after a change. */
using NetworkListener = std::function<void(const NetworkState&)>;

/** @brief Handle used to cancel a network subscription. */
using SubscriptionId = std::uint64_t;

/** @brief Connectivity oracle with change notifications. */
class NetworkMonitor {
  public:
    NetworkMonitor();
    virtual ~NetworkMonitor() = default;

    NetworkMonitor(const NetworkMonitor&) = delete;
    NetworkMonitor& operator=(const NetworkMonitor&) = delete;

    /** @brief Current connectivity snapshot. */
    [[nodiscard]] virtual NetworkState current_state() const = 0;

    /** @brief Register @p listener for state changes. */
    SubscriptionId subscribe(NetworkListener listener);
    /** @brief Cancel a subscription; unknown ids are ignored. */
    void unsubscribe(SubscriptionId subscription_id);

  protected:
    /** @brief Deliver @p state to every subscriber. */
    void publish(const NetworkState& state);

    std::shared_ptr<spdlog::logger> logger_;

  private:
    std::mutex subscribers_mutex_;
    SubscriptionId next_subscription_id_{1};
    std::vector<std::pair<SubscriptionId, NetworkListener>> list_subscribers_;
};

/** @brief Monitor returning a caller-controlled state. */
class FixedNetworkMonitor final : public NetworkMonitor {
  public:
    explicit FixedNetworkMonitor(NetworkState state);

    [[nodiscard]] NetworkState current_state() const override;
    /** @brief Replace the reported state and notify subscribers if it changed. */
    void set_state(NetworkState state);

  private:
    mutable std::mutex state_mutex_;
    NetworkState state_;
};

/**
 * @brief Linux monitor reading interface state from `/sys/class/net`.
 *
 * An interface counts when its `operstate` is `up`. `wwan*`, `rmnet*` and
 * `ppp*` report as Cellular; any other interface (wireless or wired) reports
 * as Wifi, i.e. unmetered.
 */
class SysfsNetworkMonitor final : public NetworkMonitor {
  public:
    explicit SysfsNetworkMonitor(std::filesystem::path sysfs_root = "/sys/class/net",
                                 std::chrono::seconds poll_interval = std::chrono::seconds{30});
    ~SysfsNetworkMonitor() override;

    [[nodiscard]] NetworkState current_state() const override;

    /** @brief Start the background poller that publishes changes. */
    void start();
    /** @brief Stop the background poller. */
    void stop();
    /** @brief Re-read sysfs once and publish if the state changed. */
    void poll();

  private:
    void poll_loop();

    std::filesystem::path sysfs_root_;
    std::chrono::seconds poll_interval_;
    std::mutex poll_mutex_;
    std::condition_variable poll_cv_;
    std::optional<NetworkState> optional_last_state_;
    std::atomic<bool> flag_running_{false};
    std::thread poll_thread_;
};

}  // namespace offline_maps
