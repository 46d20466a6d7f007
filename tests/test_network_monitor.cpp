#include <fstream>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"
#include "offline_maps/network_monitor.hpp"

using namespace offline_maps;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    offline_maps::test::ensure_logger_initialized();
    return true;
}();

void write_interface(const std::filesystem::path& root, const std::string& name, const std::string& operstate) {
    std::filesystem::create_directories(root / name);
    std::ofstream(root / name / "operstate") << operstate << '\n';
}
}  // namespace

TEST_CASE("Sysfs interfaces map to network classes") {
    const auto root = test::make_temp_directory("sysfs_classes");
    SysfsNetworkMonitor monitor{root};

    write_interface(root, "lo", "unknown");
    CHECK(monitor.current_state().network_class == NetworkClass::Offline);
    CHECK_FALSE(monitor.current_state().connected);

    write_interface(root, "wwan0", "up");
    CHECK(monitor.current_state().network_class == NetworkClass::Cellular);
    CHECK(monitor.current_state().connected);

    write_interface(root, "wlan0", "up");
    CHECK(monitor.current_state().network_class == NetworkClass::Wifi);

    write_interface(root, "wlan0", "down");
    write_interface(root, "wwan0", "dormant");
    CHECK(monitor.current_state().network_class == NetworkClass::Offline);
}

TEST_CASE("Missing sysfs roots read as offline") {
    SysfsNetworkMonitor monitor{std::filesystem::temp_directory_path() / "offline_maps_tests_no_such_sysfs"};
    CHECK_FALSE(monitor.current_state().connected);
}

TEST_CASE("Polling publishes only changes") {
    const auto root = test::make_temp_directory("sysfs_poll");
    SysfsNetworkMonitor monitor{root};
    std::vector<NetworkClass> list_published;
    const SubscriptionId subscription_id =
        monitor.subscribe([&list_published](const NetworkState& state) { list_published.push_back(state.network_class); });

    monitor.poll();
    monitor.poll();
    write_interface(root, "eth0", "up");
    monitor.poll();
    monitor.unsubscribe(subscription_id);
    write_interface(root, "eth0", "down");
    monitor.poll();

    CHECK(list_published == std::vector<NetworkClass>{NetworkClass::Offline, NetworkClass::Wifi});
}

TEST_CASE("Fixed monitors notify subscribers on change and contain listener errors") {
    FixedNetworkMonitor monitor{NetworkState{NetworkClass::Wifi, true}};
    int notifications = 0;
    monitor.subscribe([](const NetworkState&) { throw std::runtime_error("subscriber failure"); });
    monitor.subscribe([&notifications](const NetworkState&) { ++notifications; });

    monitor.set_state(NetworkState{NetworkClass::Wifi, true});
    CHECK(notifications == 0);
    CHECK_NOTHROW(monitor.set_state(NetworkState{NetworkClass::Cellular, true}));
    CHECK(notifications == 1);
    CHECK(monitor.current_state().network_class == NetworkClass::Cellular);
}
