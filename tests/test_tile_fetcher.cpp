#include <fstream>
#include <sstream>

#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"
#include "offline_maps/tile_fetcher.hpp"

using namespace offline_maps;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    offline_maps::test::ensure_logger_initialized();
    return true;
}();

// Nothing listens on the discard port, so the connection is refused without
// touching the network.
constexpr char k_refused_url[] = "http://127.0.0.1:9/12/3493/1586.png";

CurlFetcherConfig make_fetcher_config() {
    CurlFetcherConfig config{};
    config.user_agent = "OfflineMapsTests";
    config.request_timeout = std::chrono::seconds{5};
    return config;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}
}  // namespace

TEST_CASE("A failed re-fetch keeps the tile already on disk") {
    const auto directory = test::make_temp_directory("fetcher_keep_existing");
    const std::filesystem::path destination = directory / "12_3493_1586.png";
    std::ofstream(destination, std::ios::binary) << "cached tile bytes";

    CurlTileFetcher fetcher{make_fetcher_config()};
    CHECK_FALSE(fetcher.fetch(k_refused_url, destination));

    REQUIRE(std::filesystem::exists(destination));
    CHECK(read_file(destination) == "cached tile bytes");
    std::filesystem::path path_partial = destination;
    path_partial += k_partial_tile_suffix;
    CHECK_FALSE(std::filesystem::exists(path_partial));
}

TEST_CASE("A failed first fetch leaves no file behind") {
    const auto directory = test::make_temp_directory("fetcher_no_leftovers");
    const std::filesystem::path destination = directory / "nested" / "12_3494_1586.png";

    CurlTileFetcher fetcher{make_fetcher_config()};
    CHECK_FALSE(fetcher.fetch(k_refused_url, destination));

    CHECK(std::filesystem::is_directory(destination.parent_path()));
    CHECK(std::filesystem::is_empty(destination.parent_path()));
}
