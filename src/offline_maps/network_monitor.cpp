#include "offline_maps/network_monitor.hpp"

#include <algorithm>
#include <fstream>
#include <initializer_list>
#include <string>
#include <string_view>

namespace offline_maps {

namespace {

bool starts_with_any(std::string_view name, std::initializer_list<std::string_view> prefixes) {
    return std::any_of(prefixes.begin(), prefixes.end(), [name](std::string_view prefix) {
        return name.substr(0, prefix.size()) == prefix;
    });
}

std::string read_operstate(const std::filesystem::path& interface_dir) {
    std::ifstream input(interface_dir / "operstate");
    std::string state;
    if (input.is_open()) {
        std::getline(input, state);
    }
    return state;
}

bool same_state(const NetworkState& lhs, const NetworkState& rhs) noexcept {
    return lhs.network_class == rhs.network_class && lhs.connected == rhs.connected;
}

}  // namespace

NetworkMonitor::NetworkMonitor()
    : logger_(get_logger()) {}

SubscriptionId NetworkMonitor::subscribe(NetworkListener listener) {
    std::scoped_lock lock(subscribers_mutex_);
    const SubscriptionId subscription_id = next_subscription_id_++;
    list_subscribers_.emplace_back(subscription_id, std::move(listener));
    return subscription_id;
}

void NetworkMonitor::unsubscribe(SubscriptionId subscription_id) {
    std::scoped_lock lock(subscribers_mutex_);
    std::erase_if(list_subscribers_, [subscription_id](const auto& entry) { return entry.first == subscription_id; });
}

void NetworkMonitor::publish(const NetworkState& state) {
    std::vector<std::pair<SubscriptionId, NetworkListener>> snapshot;
    {
        std::scoped_lock lock(subscribers_mutex_);
        snapshot = list_subscribers_;
    }
    logger_->info(
        R"({{"component":"network","class":"{}","connected":{}}})",
        to_string(state.network_class),
        state.connected ? "true" : "false"
    );
    for (const auto& [subscription_id, listener] : snapshot) {
        try {
            listener(state);
        } catch (const std::exception& exc) {
            logger_->error("Network subscriber {} failed: {}", subscription_id, exc.what());
        }
    }
}

FixedNetworkMonitor::FixedNetworkMonitor(NetworkState state)
    : state_(state) {}

NetworkState FixedNetworkMonitor::current_state() const {
    std::scoped_lock lock(state_mutex_);
    return state_;
}

void FixedNetworkMonitor::set_state(NetworkState state) {
    {
        std::scoped_lock lock(state_mutex_);
        if (same_state(state_, state)) {
            return;
        }
        state_ = state;
    }
    publish(state);
}

SysfsNetworkMonitor::SysfsNetworkMonitor(std::filesystem::path sysfs_root, std::chrono::seconds poll_interval)
    : sysfs_root_(std::move(sysfs_root)),
      poll_interval_(poll_interval) {}

SysfsNetworkMonitor::~SysfsNetworkMonitor() {
    stop();
}

NetworkState SysfsNetworkMonitor::current_state() const {
    std::error_code error_iterate;
    std::filesystem::directory_iterator iterator_interfaces{sysfs_root_, error_iterate};
    if (error_iterate) {
        logger_->warn("Unable to enumerate {}: {}", sysfs_root_.string(), error_iterate.message());
        return NetworkState{};
    }

    bool cellular_up = false;
    for (const auto& entry : iterator_interfaces) {
        const std::string name = entry.path().filename().string();
        if (name == "lo" || read_operstate(entry.path()) != "up") {
            continue;
        }
        if (starts_with_any(name, {"wwan", "rmnet", "ppp"})) {
            cellular_up = true;
            continue;
        }
        return NetworkState{NetworkClass::Wifi, true};
    }
    if (cellular_up) {
        return NetworkState{NetworkClass::Cellular, true};
    }
    return NetworkState{};
}

void SysfsNetworkMonitor::start() {
    if (flag_running_.exchange(true)) {
        return;
    }
    poll();
    poll_thread_ = std::thread(&SysfsNetworkMonitor::poll_loop, this);
}

void SysfsNetworkMonitor::stop() {
    if (!flag_running_.exchange(false)) {
        return;
    }
    poll_cv_.notify_all();
    if (poll_thread_.joinable()) {
        poll_thread_.join();
    }
}

void SysfsNetworkMonitor::poll() {
    const NetworkState state = current_state();
    {
        std::scoped_lock lock(poll_mutex_);
        if (optional_last_state_.has_value() && same_state(optional_last_state_.value(), state)) {
            return;
        }
        optional_last_state_ = state;
    }
    publish(state);
}

void SysfsNetworkMonitor::poll_loop() {
    while (flag_running_.load()) {
        {
            std::unique_lock lock(poll_mutex_);
            poll_cv_.wait_for(lock, poll_interval_, [this]() { return !flag_running_.load(); });
        }
        if (!flag_running_.load()) {
            break;
        }
        poll();
    }
}

}  // namespace offline_maps
