#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/common.h>
#include <spdlog/logger.h>

namespace offline_maps {

/** @brief Sink layout and verbosity for the process-wide logger. */
struct LogSettings final {
    std::string log_directory{"logs"};
    std::string file_name{"offline_maps.log"};
    std::size_t max_file_size_bytes{10 * 1024 * 1024};
    std::size_t max_files{5};
    spdlog::level::level_enum level{spdlog::level::info};
    spdlog::level::level_enum flush_level{spdlog::level::warn};  /**< File sink flushes at this level and above. */
};

/**
 * @brief Create the shared "offline_maps" logger: a console sink plus a
 *        rotating file sink writing one JSON object per line.
 *
 * Only the first call configures sinks; later calls return the same logger.
 */
std::shared_ptr<spdlog::logger> initialize_logger(const LogSettings& settings);

std::shared_ptr<spdlog::logger> get_logger();

/** @brief Level named by @p str_level, or nullopt for unknown names. */
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view str_level);

/**
 * @brief Render a log payload as the file sink's "msg" value: structured
 *        `{...}` payloads verbatim, anything else as a JSON string.
 */
[[nodiscard]] std::string json_log_field(std::string_view message);

}  // namespace offline_maps
