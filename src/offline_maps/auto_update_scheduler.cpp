#include "offline_maps/auto_update_scheduler.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <ctime>
#include <exception>

#include "offline_maps/errors.hpp"
#include "offline_maps/json_codec.hpp"

namespace offline_maps {

namespace {
constexpr int k_minutes_per_day{24 * 60};
}  // namespace

std::string_view to_string(AutoUpdateDecision decision) noexcept {
    switch (decision) {
        case AutoUpdateDecision::Disabled:
            return "disabled";
        case AutoUpdateDecision::NetworkUnsuitable:
            return "network_unsuitable";
        case AutoUpdateDecision::IntervalNever:
            return "interval_never";
        case AutoUpdateDecision::IntervalNotElapsed:
            return "interval_not_elapsed";
        case AutoUpdateDecision::InvalidTimeOfDay:
            return "invalid_time_of_day";
        case AutoUpdateDecision::OutsideTimeWindow:
            return "outside_time_window";
        case AutoUpdateDecision::Run:
            return "run";
    }
    return "unknown";
}

std::optional<int> parse_time_of_day(std::string_view time_of_day) noexcept {
    const std::size_t separator = time_of_day.find(':');
    if (separator == std::string_view::npos) {
        return std::nullopt;
    }
    int hours = 0;
    int minutes = 0;
    const std::string_view hours_text = time_of_day.substr(0, separator);
    const std::string_view minutes_text = time_of_day.substr(separator + 1);
    const auto hours_result = std::from_chars(hours_text.data(), hours_text.data() + hours_text.size(), hours);
    const auto minutes_result = std::from_chars(minutes_text.data(), minutes_text.data() + minutes_text.size(), minutes);
    if (hours_result.ec != std::errc{} || hours_result.ptr != hours_text.data() + hours_text.size()
        || minutes_result.ec != std::errc{} || minutes_result.ptr != minutes_text.data() + minutes_text.size()) {
        return std::nullopt;
    }
    if (hours < 0 || hours > 23 || minutes < 0 || minutes > 59) {
        return std::nullopt;
    }
    return hours * 60 + minutes;
}

int local_minute_of_day(SystemClock::time_point time_point) {
    const std::time_t raw_time = SystemClock::to_time_t(time_point);
    std::tm local_time{};
    localtime_r(&raw_time, &local_time);
    return local_time.tm_hour * 60 + local_time.tm_min;
}

int circular_minute_distance(int lhs_minutes, int rhs_minutes) noexcept {
    const int distance = std::abs(lhs_minutes - rhs_minutes) % k_minutes_per_day;
    return std::min(distance, k_minutes_per_day - distance);
}

std::optional<std::chrono::milliseconds> interval_period(UpdateInterval interval) noexcept {
    switch (interval) {
        case UpdateInterval::Daily:
            return std::chrono::hours{24};
        case UpdateInterval::Weekly:
            return std::chrono::hours{24 * 7};
        case UpdateInterval::Monthly:
            return std::chrono::hours{24 * 30};
        case UpdateInterval::Never:
            return std::nullopt;
    }
    return std::nullopt;
}

AutoUpdateScheduler::AutoUpdateScheduler(AutoUpdateConfig config,
                                         KeyValueStore& store,
                                         RegionRegistry& registry,
                                         NetworkMonitor& network_monitor,
                                         RegionRefresher refresher)
    : config_(config),
      store_(store),
      registry_(registry),
      network_monitor_(network_monitor),
      refresher_(std::move(refresher)),
      logger_(get_logger()) {}

AutoUpdateScheduler::~AutoUpdateScheduler() {
    stop();
}

void AutoUpdateScheduler::load_settings() {
    std::scoped_lock lock(settings_mutex_);
    try {
        const std::optional<std::string> payload = store_.get(k_auto_update_storage_key);
        if (!payload.has_value()) {
            return;
        }
        settings_ = decode_json<AutoUpdateSettings>(payload.value());
    } catch (const OfflineMapError& exc) {
        logger_->error(R"({{"component":"auto_update","action":"load_settings","error":"{}"}})", exc.what());
        return;
    }
    logger_->info(
        R"({{"component":"auto_update","enabled":{},"wifi_only":{},"interval":"{}","time_of_day":"{}"}})",
        settings_.enabled ? "true" : "false",
        settings_.wifi_only ? "true" : "false",
        to_string(settings_.update_interval),
        settings_.time_of_day
    );
}

AutoUpdateSettings AutoUpdateScheduler::settings() const {
    std::scoped_lock lock(settings_mutex_);
    return settings_;
}

void AutoUpdateScheduler::update_settings(const AutoUpdateSettingsPatch& patch) {
    {
        std::scoped_lock lock(settings_mutex_);
        if (patch.enabled.has_value()) {
            settings_.enabled = patch.enabled.value();
        }
        if (patch.wifi_only.has_value()) {
            settings_.wifi_only = patch.wifi_only.value();
        }
        if (patch.update_interval.has_value()) {
            settings_.update_interval = patch.update_interval.value();
        }
        if (patch.time_of_day.has_value()) {
            if (!parse_time_of_day(patch.time_of_day.value()).has_value()) {
                logger_->warn("Ignoring invalid time of day '{}'", patch.time_of_day.value());
            } else {
                settings_.time_of_day = patch.time_of_day.value();
            }
        }
        if (patch.last_auto_check.has_value()) {
            settings_.last_auto_check = patch.last_auto_check.value();
        }
        persist_settings_locked();
    }
    request_check();
}

void AutoUpdateScheduler::start() {
    if (flag_running_.exchange(true)) {
        return;
    }
    flag_stop_requested_.store(false);
    optional_network_subscription_ = network_monitor_.subscribe([this](const NetworkState&) { request_check(); });
    tick_thread_ = std::thread(&AutoUpdateScheduler::tick_loop, this);
    logger_->info(R"({{"component":"auto_update","action":"start","tick_s":{}}})", config_.tick_interval.count());
}

void AutoUpdateScheduler::request_stop() {
    flag_stop_requested_.store(true);
    std::scoped_lock lock(tick_mutex_);
    tick_cv_.notify_all();
}

void AutoUpdateScheduler::stop() {
    request_stop();
    if (!flag_running_.exchange(false)) {
        return;
    }
    if (optional_network_subscription_.has_value()) {
        network_monitor_.unsubscribe(optional_network_subscription_.value());
        optional_network_subscription_.reset();
    }
    {
        std::scoped_lock lock(tick_mutex_);
        tick_cv_.notify_all();
    }
    if (tick_thread_.joinable()) {
        tick_thread_.join();
    }
}

void AutoUpdateScheduler::request_check() {
    std::scoped_lock lock(tick_mutex_);
    flag_check_requested_ = true;
    tick_cv_.notify_all();
}

AutoUpdateDecision AutoUpdateScheduler::evaluate(SystemClock::time_point now) const {
    const AutoUpdateSettings current = settings();
    if (!current.enabled) {
        return AutoUpdateDecision::Disabled;
    }

    if (current.wifi_only) {
        const NetworkState network_state = network_monitor_.current_state();
        if (!network_state.connected || network_state.network_class != NetworkClass::Wifi) {
            return AutoUpdateDecision::NetworkUnsuitable;
        }
    }

    const std::optional<std::chrono::milliseconds> optional_period = interval_period(current.update_interval);
    if (!optional_period.has_value()) {
        return AutoUpdateDecision::IntervalNever;
    }
    if (now - current.last_auto_check < optional_period.value()) {
        return AutoUpdateDecision::IntervalNotElapsed;
    }

    const std::optional<int> optional_target_minutes = parse_time_of_day(current.time_of_day);
    if (!optional_target_minutes.has_value()) {
        return AutoUpdateDecision::InvalidTimeOfDay;
    }
    const int distance = circular_minute_distance(local_minute_of_day(now), optional_target_minutes.value());
    if (distance > config_.time_window.count()) {
        return AutoUpdateDecision::OutsideTimeWindow;
    }
    return AutoUpdateDecision::Run;
}

AutoUpdateDecision AutoUpdateScheduler::check(SystemClock::time_point now) {
    std::scoped_lock check_lock(check_mutex_);
    const AutoUpdateDecision decision = evaluate(now);
    if (decision != AutoUpdateDecision::Run) {
        logger_->debug(R"({{"component":"auto_update","decision":"{}"}})", to_string(decision));
        return decision;
    }

    const Timestamp checked_at = std::chrono::time_point_cast<std::chrono::milliseconds>(now);
    {
        std::scoped_lock lock(settings_mutex_);
        settings_.last_auto_check = checked_at;
        persist_settings_locked();
    }

    logger_->info(R"({"component":"auto_update","decision":"run"})");
    run_update(checked_at);
    return decision;
}

std::vector<std::string> AutoUpdateScheduler::run_update(Timestamp now) {
    registry_.mark_outdated(now, config_.region_max_age);

    std::vector<OfflineRegion> list_outdated;
    for (const OfflineRegion& region : registry_.all_regions()) {
        if (region.status == RegionStatus::Outdated) {
            list_outdated.push_back(region);
        }
    }
    if (list_outdated.empty()) {
        logger_->info("No regions require an update");
        return {};
    }

    logger_->info("Refreshing {} outdated regions", list_outdated.size());
    std::vector<std::string> list_refreshed;
    for (const OfflineRegion& region : list_outdated) {
        if (flag_stop_requested_.load()) {
            logger_->warn("Auto update interrupted by shutdown");
            break;
        }
        try {
            refresher_(region);
            list_refreshed.push_back(region.id);
            logger_->info(R"({{"component":"auto_update","region":"{}","action":"refreshed"}})", region.id);
        } catch (const std::exception& exc) {
            logger_->error(
                R"({{"component":"auto_update","region":"{}","action":"refresh","error":"{}"}})",
                region.id,
                exc.what()
            );
        }
    }
    logger_->info("Auto update finished: {}/{} regions refreshed", list_refreshed.size(), list_outdated.size());
    return list_refreshed;
}

void AutoUpdateScheduler::tick_loop() {
    std::unique_lock lock(tick_mutex_);
    while (flag_running_.load() && !flag_stop_requested_.load()) {
        flag_check_requested_ = false;
        lock.unlock();
        try {
            check(SystemClock::now());
        } catch (const std::exception& exc) {
            logger_->error(R"({{"component":"auto_update","action":"check","error":"{}"}})", exc.what());
        }
        lock.lock();
        tick_cv_.wait_for(lock, config_.tick_interval, [this]() {
            return !flag_running_.load() || flag_stop_requested_.load() || flag_check_requested_;
        });
    }
}

void AutoUpdateScheduler::persist_settings_locked() const {
    try {
        store_.set(k_auto_update_storage_key, encode_json(settings_));
    } catch (const OfflineMapError& exc) {
        logger_->error(R"({{"component":"auto_update","action":"persist_settings","error":"{}"}})", exc.what());
    }
}

}  // namespace offline_maps
