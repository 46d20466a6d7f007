#include <algorithm>
#include <memory>
#include <sstream>

#include <catch2/catch_test_macros.hpp>
#include <spdlog/sinks/ostream_sink.h>

#include "test_support.hpp"
#include "offline_maps/capacity_manager.hpp"
#include "offline_maps/logging.hpp"
#include "offline_maps/region_registry.hpp"

using namespace offline_maps;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    offline_maps::test::ensure_logger_initialized();
    return true;
}();

/** @brief Copies every line the shared logger emits while in scope. */
class CapturedLog final {
  public:
    CapturedLog()
        : sink_(std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_)) {
        sink_->set_pattern("%v");
        get_logger()->sinks().push_back(sink_);
    }

    ~CapturedLog() {
        auto& list_sinks = get_logger()->sinks();
        list_sinks.erase(std::remove(list_sinks.begin(), list_sinks.end(), sink_), list_sinks.end());
    }

    CapturedLog(const CapturedLog&) = delete;
    CapturedLog& operator=(const CapturedLog&) = delete;

    [[nodiscard]] std::string text() const {
        return stream_.str();
    }

  private:
    std::ostringstream stream_;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
};
}  // namespace

TEST_CASE("Structured component logs render as JSON objects") {
    CapturedLog captured;
    test::MemoryKeyValueStore store;
    CapacityManager capacity{};
    RegionRegistry registry{store, capacity};

    const Admission admission = registry.admit_download(test::make_request("logged", test::bounds_for_tiles(10, 500, 501, 400, 401), 12.5));
    REQUIRE(registry.remove_region("logged"));

    const std::string text = captured.text();
    CHECK(text.find(
              R"({"component":"registry","region":"logged","action":"admit","generation":)"
              + std::to_string(admission.generation) + R"(,"size_mb":12.5})")
          != std::string::npos);
    CHECK(text.find(R"({"component":"registry","region":"logged","action":"remove"})") != std::string::npos);
}

TEST_CASE("File sink message field is always a JSON value") {
    CHECK(json_log_field(R"({"component":"scheduler","action":"shutdown"})")
          == R"({"component":"scheduler","action":"shutdown"})");
    CHECK(json_log_field("Loaded 3 offline regions") == R"("Loaded 3 offline regions")");
    CHECK(json_log_field(R"(Unknown level "loud")") == R"("Unknown level \"loud\"")");
    CHECK(json_log_field("{") == R"("{")");
    CHECK_NOTHROW(static_cast<void>(json_log_field("caf\xe9")));
}

TEST_CASE("Log level names are parsed without side effects") {
    CHECK(parse_log_level("debug") == spdlog::level::debug);
    CHECK(parse_log_level("warning") == spdlog::level::warn);
    CHECK(parse_log_level("off") == spdlog::level::off);
    CHECK_FALSE(parse_log_level("loud").has_value());
    CHECK(get_logger()->level() == spdlog::level::info);
}
