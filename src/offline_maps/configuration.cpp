// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings that feed
// the offline map service. Every variable is optional; malformed values are
// reported through the logging subsystem and replaced by their defaults.
//
// Note: This file does not read from disk; callers are expected to populate
// the process environment ahead of time (e.g. a shell-sourced `.env`).

#include "offline_maps/configuration.hpp"

#include <charconv>
#include <cstdlib>
#include <string_view>
#include <system_error>

#include <fmt/format.h>

#include "offline_maps/logging.hpp"
#include "offline_maps/version.hpp"

namespace offline_maps {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_data_directory{"offline_maps_data"};
constexpr std::string_view k_tile_directory_name{"map_tiles"};
constexpr int k_max_supported_zoom{22};

double parse_double(const char* name, double fallback) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        if (parsed_value <= 0.0) {
            get_logger()->warn("{} must be positive; using fallback {}", name, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse double from {}; using fallback {}", name, fallback);
        return fallback;
    }
}

int parse_int(const char* name, int fallback, int minimum, int maximum) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const int parsed_value = std::stoi(raw_value);
        if (parsed_value < minimum || parsed_value > maximum) {
            get_logger()->warn("{}={} outside [{}, {}]; using fallback {}", name, parsed_value, minimum, maximum, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse integer from {}; using fallback {}", name, fallback);
        return fallback;
    }
}

std::string parse_string(const char* name, std::string_view fallback) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

std::optional<int> parse_log_max_mb() {
    const char* raw_value = std::getenv("OFFLINE_MAPS_LOG_MAX_MB");
    if (raw_value == nullptr) {
        return std::nullopt;
    }
    const std::string_view raw{raw_value};
    int max_mb = 0;
    const auto [end, error] = std::from_chars(raw.data(), raw.data() + raw.size(), max_mb);
    if (error != std::errc{} || end != raw.data() + raw.size() || max_mb < 1 || max_mb > 1024) {
        return std::nullopt;
    }
    return max_mb;
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.logging = load_logging();

    auto logger = initialize_logger(config.logging);
    logger->info("Loading configuration from environment");
    const std::string requested_level = parse_string("OFFLINE_MAPS_LOG_LEVEL", "info");
    if (!parse_log_level(requested_level).has_value()) {
        logger->warn("Unknown OFFLINE_MAPS_LOG_LEVEL '{}'; using info", requested_level);
    }
    if (std::getenv("OFFLINE_MAPS_LOG_MAX_MB") != nullptr && !parse_log_max_mb().has_value()) {
        logger->warn("OFFLINE_MAPS_LOG_MAX_MB must be an integer in [1, 1024]; using {} bytes",
                     config.logging.max_file_size_bytes);
    }

    config.data_directory = parse_string("OFFLINE_MAPS_DATA_DIR", k_default_data_directory);
    config.service.scheduler = load_scheduler(config.data_directory);
    config.service.max_cache_size_mb = parse_double("OFFLINE_MAPS_MAX_CACHE_MB", k_default_max_cache_size_mb);
    config.service.auto_update.tick_interval =
        std::chrono::seconds{parse_int("OFFLINE_MAPS_AUTO_UPDATE_TICK_S", 3600, 1, 7 * 24 * 3600)};

    config.fetcher.user_agent = parse_string("OFFLINE_MAPS_USER_AGENT", fmt::format("OfflineMaps/{}", k_version));
    config.fetcher.request_timeout = std::chrono::seconds{parse_int("OFFLINE_MAPS_HTTP_TIMEOUT_S", 30, 1, 600)};

    config.forced_network_class = load_forced_network_class();

    logger->info("Configuration loaded: data_dir={} tile_dir={} zoom={}..{} batch={} quota_mb={} timeout_s={}",
                 config.data_directory.string(),
                 config.service.scheduler.tile_base_path.string(),
                 config.service.scheduler.min_zoom,
                 config.service.scheduler.max_zoom,
                 config.service.scheduler.batch_size,
                 config.service.max_cache_size_mb,
                 config.service.scheduler.region_timeout.count());

    return config;
}

// Runs before the logger exists, so bad values fall back silently and are
// reported by load() once logging is up.
LogSettings ConfigurationLoader::load_logging() {
    LogSettings logging{};
    logging.log_directory = parse_string("OFFLINE_MAPS_LOG_DIR", k_default_log_directory);
    logging.level = parse_log_level(parse_string("OFFLINE_MAPS_LOG_LEVEL", "info")).value_or(spdlog::level::info);
    if (const std::optional<int> max_mb = parse_log_max_mb(); max_mb.has_value()) {
        logging.max_file_size_bytes = static_cast<std::size_t>(max_mb.value()) * 1024 * 1024;
    }
    return logging;
}

SchedulerConfig ConfigurationLoader::load_scheduler(const std::filesystem::path& data_directory) {
    SchedulerConfig scheduler{};
    scheduler.tile_url_template = parse_string("OFFLINE_MAPS_TILE_URL", scheduler.tile_url_template);
    scheduler.tile_base_path =
        parse_string("OFFLINE_MAPS_TILE_DIR", (data_directory / std::string{k_tile_directory_name}).string());
    scheduler.min_zoom = parse_int("OFFLINE_MAPS_MIN_ZOOM", scheduler.min_zoom, 0, k_max_supported_zoom);
    scheduler.max_zoom = parse_int("OFFLINE_MAPS_MAX_ZOOM", scheduler.max_zoom, 0, k_max_supported_zoom);
    if (scheduler.max_zoom < scheduler.min_zoom) {
        get_logger()->warn("OFFLINE_MAPS_MAX_ZOOM {} below OFFLINE_MAPS_MIN_ZOOM {}; using defaults 10..18",
                           scheduler.max_zoom,
                           scheduler.min_zoom);
        scheduler.min_zoom = 10;
        scheduler.max_zoom = 18;
    }
    scheduler.batch_size = static_cast<std::size_t>(parse_int("OFFLINE_MAPS_BATCH_SIZE", 10, 1, 64));
    scheduler.region_timeout = std::chrono::seconds{parse_int("OFFLINE_MAPS_DOWNLOAD_TIMEOUT_S", 600, 1, 24 * 3600)};
    return scheduler;
}

std::optional<NetworkClass> ConfigurationLoader::load_forced_network_class() {
    const char* raw_value = std::getenv("OFFLINE_MAPS_NETWORK");
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::nullopt;
    }
    const std::optional<NetworkClass> network_class = network_class_from_string(raw_value);
    if (!network_class) {
        get_logger()->warn("Unknown OFFLINE_MAPS_NETWORK value '{}'; using interface detection", raw_value);
    }
    return network_class;
}

}  // namespace offline_maps
