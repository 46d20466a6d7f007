#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "offline_maps/configuration.hpp"
#include "offline_maps/errors.hpp"
#include "offline_maps/json_codec.hpp"
#include "offline_maps/key_value_store.hpp"
#include "offline_maps/logging.hpp"
#include "offline_maps/network_monitor.hpp"
#include "offline_maps/offline_map_service.hpp"
#include "offline_maps/tile_fetcher.hpp"
#include "offline_maps/version.hpp"

namespace {
std::atomic<bool> should_terminate{false};

void handle_signal(int) {
    should_terminate.store(true);
}

using namespace offline_maps;
using Arguments = std::vector<std::string>;

constexpr int k_exit_usage{2};

void print_usage() {
    fmt::print(stderr,
               "offline_maps_cli {}\n"
               "usage: offline_maps_cli <command> [args]\n"
               "  list\n"
               "  show <id>\n"
               "  download <id> <name> <sw_lat> <sw_lon> <ne_lat> <ne_lon> <size_mb>\n"
               "  delete <id>\n"
               "  delete-all\n"
               "  covered <lat> <lon>\n"
               "  usage\n"
               "  check-updates\n"
               "  auto-update [enabled=true|false] [wifi_only=true|false] [interval=daily|weekly|monthly|never] [time=HH:MM]\n"
               "  snapshots\n"
               "  clear-snapshot [name]\n"
               "  daemon\n",
               k_version);
}

double parse_number(const std::string& raw_value, std::string_view label) {
    try {
        std::size_t consumed = 0;
        const double parsed_value = std::stod(raw_value, &consumed);
        if (consumed != raw_value.size()) {
            throw std::invalid_argument(raw_value);
        }
        return parsed_value;
    } catch (const std::logic_error&) {
        throw std::invalid_argument(fmt::format("invalid {} '{}'", label, raw_value));
    }
}

bool parse_flag(const std::string& raw_value, std::string_view label) {
    if (raw_value == "true" || raw_value == "1" || raw_value == "on") {
        return true;
    }
    if (raw_value == "false" || raw_value == "0" || raw_value == "off") {
        return false;
    }
    throw std::invalid_argument(fmt::format("invalid {} '{}'", label, raw_value));
}

std::string format_timestamp(const std::optional<Timestamp>& timestamp) {
    if (!timestamp) {
        return "-";
    }
    return std::to_string(to_epoch_ms(*timestamp));
}

void print_region(const OfflineRegion& region) {
    fmt::print("{:<20} {:<11} {:>4}% {:>9.1f} MB  [{:.4f},{:.4f}]-[{:.4f},{:.4f}]  updated={}  {}\n",
               region.id,
               to_string(region.status),
               region.download_progress.value_or(0),
               region.size_mb,
               region.bounds.southwest.latitude,
               region.bounds.southwest.longitude,
               region.bounds.northeast.latitude,
               region.bounds.northeast.longitude,
               format_timestamp(region.last_updated),
               region.name);
}

std::unique_ptr<NetworkMonitor> make_network_monitor(const Configuration& configuration) {
    if (configuration.forced_network_class) {
        NetworkState state{};
        state.network_class = *configuration.forced_network_class;
        state.connected = state.network_class != NetworkClass::Offline;
        return std::make_unique<FixedNetworkMonitor>(state);
    }
    return std::make_unique<SysfsNetworkMonitor>();
}

int run_download(OfflineMapService& service, const Arguments& args) {
    if (args.size() != 8) {
        print_usage();
        return k_exit_usage;
    }
    RegionRequest request{};
    request.id = args[1];
    request.name = args[2];
    request.bounds.southwest = GeoPoint{parse_number(args[3], "sw_lat"), parse_number(args[4], "sw_lon")};
    request.bounds.northeast = GeoPoint{parse_number(args[5], "ne_lat"), parse_number(args[6], "ne_lon")};
    request.size_mb = parse_number(args[7], "size_mb");

    const ListenerId listener_id = service.add_progress_listener([&request](const std::string& region_id, int progress) {
        if (region_id == request.id) {
            fmt::print("\r{}: {:>3}%", region_id, progress);
            std::fflush(stdout);
        }
    });

    try {
        std::future<OfflineRegion> completion = service.request_download(request);
        const OfflineRegion region = completion.get();
        service.remove_progress_listener(listener_id);
        fmt::print("\n");
        print_region(region);
        fmt::print("{} tiles cached\n", service.load_tile_data(region.id).size());
    } catch (const OfflineMapError& exc) {
        service.remove_progress_listener(listener_id);
        fmt::print(stderr, "\n{}\n", exc.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

int run_auto_update(OfflineMapService& service, const Arguments& args) {
    AutoUpdateSettingsPatch patch{};
    for (std::size_t index = 1; index < args.size(); ++index) {
        const std::string& assignment = args[index];
        const std::size_t separator = assignment.find('=');
        if (separator == std::string::npos) {
            throw std::invalid_argument(fmt::format("expected key=value, got '{}'", assignment));
        }
        const std::string key = assignment.substr(0, separator);
        const std::string value = assignment.substr(separator + 1);
        if (key == "enabled") {
            patch.enabled = parse_flag(value, key);
        } else if (key == "wifi_only") {
            patch.wifi_only = parse_flag(value, key);
        } else if (key == "interval") {
            patch.update_interval = update_interval_from_string(value);
            if (!patch.update_interval) {
                throw std::invalid_argument(fmt::format("invalid interval '{}'", value));
            }
        } else if (key == "time") {
            if (!parse_time_of_day(value)) {
                throw std::invalid_argument(fmt::format("invalid time '{}'", value));
            }
            patch.time_of_day = value;
        } else {
            throw std::invalid_argument(fmt::format("unknown setting '{}'", key));
        }
    }
    if (args.size() > 1) {
        service.update_auto_update_settings(patch);
    }

    const AutoUpdateSettings settings = service.auto_update_settings();
    fmt::print("enabled={} wifi_only={} interval={} time={} last_check={}\n",
               settings.enabled,
               settings.wifi_only,
               to_string(settings.update_interval),
               settings.time_of_day,
               format_timestamp(settings.last_auto_check));
    return EXIT_SUCCESS;
}

int run_snapshots(OfflineMapService& service) {
    const SnapshotCacheStatus status = service.snapshot_cache().cache_status();
    fmt::print("{} snapshots, {} bytes, last updated {}\n",
               status.item_count,
               status.total_size,
               format_timestamp(status.last_updated));
    for (const auto& [name, info] : service.snapshot_cache().cache_list()) {
        fmt::print("  {:<24} {:>10} bytes  nodes={} segments={} saved={}\n",
                   name,
                   info.size,
                   info.node_count,
                   info.road_segment_count,
                   to_epoch_ms(info.timestamp));
    }
    return EXIT_SUCCESS;
}

int run_daemon(OfflineMapService& service, NetworkMonitor& network_monitor) {
    auto* sysfs_monitor = dynamic_cast<SysfsNetworkMonitor*>(&network_monitor);
    if (sysfs_monitor != nullptr) {
        sysfs_monitor->start();
    }
    get_logger()->info("Daemon running; waiting for SIGINT/SIGTERM");
    while (!should_terminate.load()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    if (sysfs_monitor != nullptr) {
        sysfs_monitor->stop();
    }
    return EXIT_SUCCESS;
}

int dispatch(OfflineMapService& service, NetworkMonitor& network_monitor, const Arguments& args) {
    const std::string& command = args.front();

    if (command == "list") {
        for (const OfflineRegion& region : service.get_all_regions()) {
            print_region(region);
        }
        return EXIT_SUCCESS;
    }
    if (command == "show" && args.size() == 2) {
        const std::optional<OfflineRegion> region = service.get_region(args[1]);
        if (!region) {
            fmt::print(stderr, "Region {} not found\n", args[1]);
            return EXIT_FAILURE;
        }
        fmt::print("{}\n", nlohmann::json(*region).dump(2));
        fmt::print("{} tiles cached\n", service.load_tile_data(region->id).size());
        return EXIT_SUCCESS;
    }
    if (command == "download") {
        return run_download(service, args);
    }
    if (command == "delete" && args.size() == 2) {
        return service.delete_region(args[1]) ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    if (command == "delete-all") {
        return service.delete_all_regions() ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    if (command == "covered" && args.size() == 3) {
        const GeoPoint point{parse_number(args[1], "lat"), parse_number(args[2], "lon")};
        const bool covered = service.is_point_covered(point);
        fmt::print("{}\n", covered ? "covered" : "not covered");
        return covered ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    if (command == "usage") {
        fmt::print("{:.1f} / {:.1f} MB\n", service.total_cache_size(), service.max_cache_size());
        return EXIT_SUCCESS;
    }
    if (command == "check-updates") {
        const std::vector<std::string> outdated = service.check_for_updates();
        fmt::print("{} region(s) marked outdated\n", outdated.size());
        for (const std::string& region_id : outdated) {
            fmt::print("  {}\n", region_id);
        }
        return EXIT_SUCCESS;
    }
    if (command == "auto-update") {
        return run_auto_update(service, args);
    }
    if (command == "snapshots") {
        return run_snapshots(service);
    }
    if (command == "clear-snapshot" && args.size() <= 2) {
        const std::optional<std::string> name =
            args.size() == 2 ? std::optional<std::string>{args[1]} : std::nullopt;
        return service.snapshot_cache().clear(name) ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    if (command == "daemon") {
        return run_daemon(service, network_monitor);
    }

    print_usage();
    return k_exit_usage;
}
}  // namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    const Arguments args(argv + 1, argv + argc);
    if (args.empty()) {
        print_usage();
        return k_exit_usage;
    }

    try {
        Configuration configuration = ConfigurationLoader::load();
        configuration.service.enable_auto_update = args.front() == "daemon";

        FileKeyValueStore store{configuration.data_directory};
        CurlTileFetcher tile_fetcher{configuration.fetcher};
        std::unique_ptr<NetworkMonitor> network_monitor = make_network_monitor(configuration);

        OfflineMapService service{configuration.service, store, tile_fetcher, *network_monitor};
        service.start();
        const int exit_code = dispatch(service, *network_monitor, args);
        service.shutdown();
        return exit_code;
    } catch (const std::invalid_argument& exc) {
        std::cerr << exc.what() << '\n';
        return k_exit_usage;
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }
}
