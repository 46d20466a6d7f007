#include <mutex>
#include <stdexcept>

#include <catch2/catch_test_macros.hpp>
#include <fmt/format.h>

#include "test_support.hpp"
#include "offline_maps/auto_update_scheduler.hpp"
#include "offline_maps/capacity_manager.hpp"
#include "offline_maps/json_codec.hpp"
#include "offline_maps/network_monitor.hpp"
#include "offline_maps/region_registry.hpp"

using namespace offline_maps;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    offline_maps::test::ensure_logger_initialized();
    return true;
}();

NetworkState make_network(NetworkClass network_class) {
    NetworkState state{};
    state.network_class = network_class;
    state.connected = network_class != NetworkClass::Offline;
    return state;
}

std::string format_minute_of_day(int minute_of_day) {
    return fmt::format("{:02}:{:02}", minute_of_day / 60, minute_of_day % 60);
}

struct AutoUpdateHarness {
    AutoUpdateHarness()
        : updater(AutoUpdateConfig{}, store, registry, network, [this](const OfflineRegion& region) { refresh(region); }) {}

    void refresh(const OfflineRegion& region) {
        std::scoped_lock lock(mutex);
        list_refreshed.push_back(region.id);
        stored_settings_at_refresh = store.get(k_auto_update_storage_key);
        if (region.id == failing_region_id) {
            throw std::runtime_error("refresh failed");
        }
    }

    void add_region(const std::string& id, Timestamp completed_at) {
        GeoBounds bounds{};
        bounds.southwest = GeoPoint{0.0, 0.0};
        bounds.northeast = GeoPoint{1.0, 1.0};
        const Admission admission = registry.admit_download(test::make_request(id, bounds));
        REQUIRE(registry.complete_download(id, admission.generation, {}, completed_at));
    }

    /** @brief Settings that pass every gate at the current local time. */
    void enable_now() {
        AutoUpdateSettingsPatch patch{};
        patch.enabled = true;
        patch.wifi_only = true;
        patch.update_interval = UpdateInterval::Daily;
        patch.time_of_day = format_minute_of_day(local_minute_of_day(SystemClock::now()));
        updater.update_settings(patch);
    }

    [[nodiscard]] std::vector<std::string> refreshed() {
        std::scoped_lock lock(mutex);
        return list_refreshed;
    }

    test::MemoryKeyValueStore store;
    CapacityManager capacity{};
    RegionRegistry registry{store, capacity};
    FixedNetworkMonitor network{make_network(NetworkClass::Wifi)};
    std::mutex mutex;
    std::vector<std::string> list_refreshed;
    std::optional<std::string> stored_settings_at_refresh;
    std::string failing_region_id;
    AutoUpdateScheduler updater;
};

const auto k_stale_age = std::chrono::hours{24 * 31};
}  // namespace

TEST_CASE("Time-of-day parsing accepts HH:MM only") {
    CHECK(parse_time_of_day("02:00") == 120);
    CHECK(parse_time_of_day("23:59") == 23 * 60 + 59);
    CHECK(parse_time_of_day("7:05") == 425);
    CHECK_FALSE(parse_time_of_day("24:00").has_value());
    CHECK_FALSE(parse_time_of_day("12:60").has_value());
    CHECK_FALSE(parse_time_of_day("noon").has_value());
    CHECK_FALSE(parse_time_of_day("12:3x").has_value());
}

TEST_CASE("Minute distance wraps around midnight") {
    CHECK(circular_minute_distance(23 * 60 + 50, 10) == 20);
    CHECK(circular_minute_distance(120, 90) == 30);
    CHECK(circular_minute_distance(0, 12 * 60) == 12 * 60);
}

TEST_CASE("Update intervals map to day counts") {
    CHECK(interval_period(UpdateInterval::Daily) == std::chrono::milliseconds{std::chrono::hours{24}});
    CHECK(interval_period(UpdateInterval::Weekly) == std::chrono::milliseconds{std::chrono::hours{24 * 7}});
    CHECK(interval_period(UpdateInterval::Monthly) == std::chrono::milliseconds{std::chrono::hours{24 * 30}});
    CHECK_FALSE(interval_period(UpdateInterval::Never).has_value());
}

TEST_CASE("Auto-update gates are evaluated in order") {
    AutoUpdateHarness harness;
    const auto now = SystemClock::now();

    CHECK(harness.updater.evaluate(now) == AutoUpdateDecision::Disabled);

    harness.enable_now();
    CHECK(harness.updater.evaluate(now) == AutoUpdateDecision::Run);

    SECTION("cellular networks are rejected on wifi-only policies") {
        harness.network.set_state(make_network(NetworkClass::Cellular));
        CHECK(harness.updater.evaluate(now) == AutoUpdateDecision::NetworkUnsuitable);

        AutoUpdateSettingsPatch patch{};
        patch.wifi_only = false;
        harness.updater.update_settings(patch);
        CHECK(harness.updater.evaluate(now) == AutoUpdateDecision::Run);
    }

    SECTION("offline networks are rejected on wifi-only policies") {
        harness.network.set_state(make_network(NetworkClass::Offline));
        CHECK(harness.updater.evaluate(now) == AutoUpdateDecision::NetworkUnsuitable);
    }

    SECTION("never disables the check") {
        AutoUpdateSettingsPatch patch{};
        patch.update_interval = UpdateInterval::Never;
        harness.updater.update_settings(patch);
        CHECK(harness.updater.evaluate(now) == AutoUpdateDecision::IntervalNever);
    }

    SECTION("recent checks wait for the interval") {
        AutoUpdateSettingsPatch patch{};
        patch.last_auto_check = std::chrono::time_point_cast<std::chrono::milliseconds>(now - std::chrono::hours{3});
        harness.updater.update_settings(patch);
        CHECK(harness.updater.evaluate(now) == AutoUpdateDecision::IntervalNotElapsed);
        CHECK(harness.updater.evaluate(now + std::chrono::hours{22}) != AutoUpdateDecision::IntervalNotElapsed);
    }

    SECTION("checks outside the time window are skipped") {
        AutoUpdateSettingsPatch patch{};
        patch.time_of_day = format_minute_of_day((local_minute_of_day(now) + 120) % (24 * 60));
        harness.updater.update_settings(patch);
        CHECK(harness.updater.evaluate(now) == AutoUpdateDecision::OutsideTimeWindow);
    }
}

TEST_CASE("Settings updates merge, persist and reject malformed times") {
    AutoUpdateHarness harness;

    AutoUpdateSettingsPatch patch{};
    patch.enabled = true;
    patch.time_of_day = "25:61";
    harness.updater.update_settings(patch);

    const AutoUpdateSettings settings = harness.updater.settings();
    CHECK(settings.enabled);
    CHECK(settings.wifi_only);
    CHECK(settings.update_interval == UpdateInterval::Weekly);
    CHECK(settings.time_of_day == "02:00");

    const auto persisted = decode_json<AutoUpdateSettings>(harness.store.get(k_auto_update_storage_key).value());
    CHECK(persisted.enabled);

    AutoUpdateScheduler reloaded{AutoUpdateConfig{}, harness.store, harness.registry, harness.network, [](const OfflineRegion&) {}};
    reloaded.load_settings();
    CHECK(reloaded.settings().enabled);
}

TEST_CASE("A passing check records the check time before refreshing stale regions") {
    AutoUpdateHarness harness;
    harness.add_region("fresh", now_timestamp());
    harness.add_region("stale", now_timestamp() - k_stale_age);
    harness.enable_now();

    const auto now = SystemClock::now();
    REQUIRE(harness.updater.check(now) == AutoUpdateDecision::Run);

    CHECK(harness.refreshed() == std::vector<std::string>{"stale"});
    REQUIRE(harness.stored_settings_at_refresh.has_value());
    const auto stored = decode_json<AutoUpdateSettings>(harness.stored_settings_at_refresh.value());
    CHECK(stored.last_auto_check == std::chrono::time_point_cast<std::chrono::milliseconds>(now));

    CHECK(harness.updater.check(now + std::chrono::minutes{1}) == AutoUpdateDecision::IntervalNotElapsed);
    CHECK(harness.refreshed().size() == 1);
}

TEST_CASE("A failing refresh does not stop the remaining regions") {
    AutoUpdateHarness harness;
    harness.add_region("first", now_timestamp() - k_stale_age);
    harness.add_region("second", now_timestamp() - k_stale_age);
    harness.failing_region_id = "first";

    const std::vector<std::string> refreshed = harness.updater.run_update(now_timestamp());
    CHECK(refreshed == std::vector<std::string>{"second"});
    CHECK(harness.refreshed().size() == 2);
}

TEST_CASE("Disabled auto-update never refreshes") {
    AutoUpdateHarness harness;
    harness.add_region("stale", now_timestamp() - k_stale_age);

    CHECK(harness.updater.check(SystemClock::now()) == AutoUpdateDecision::Disabled);
    CHECK(harness.refreshed().empty());
    CHECK(harness.registry.region("stale")->status == RegionStatus::Available);
}

TEST_CASE("Switching to wifi triggers a check") {
    AutoUpdateHarness harness;
    harness.add_region("stale", now_timestamp() - k_stale_age);
    harness.network.set_state(make_network(NetworkClass::Cellular));
    harness.enable_now();

    harness.updater.start();
    CHECK(test::wait_until([&harness]() { return harness.updater.evaluate(SystemClock::now()) == AutoUpdateDecision::NetworkUnsuitable; }));
    CHECK(harness.refreshed().empty());

    harness.network.set_state(make_network(NetworkClass::Wifi));
    CHECK(test::wait_until([&harness]() { return harness.refreshed().size() == 1; }));
    harness.updater.stop();
}
