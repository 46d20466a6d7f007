#include "offline_maps/logging.hpp"

#include <ctime>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace offline_maps {

namespace {
std::once_flag logger_once_flag;
std::shared_ptr<spdlog::logger> shared_logger;
constexpr char k_logger_name[] = "offline_maps";
constexpr char k_file_pattern[] = R"({"ts":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","thread":%t,"msg":%*})";

/** @brief `%*` flag: the payload as a JSON value. */
class JsonMessageFlag final : public spdlog::custom_flag_formatter {
  public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        const std::string field = json_log_field(std::string_view{msg.payload.data(), msg.payload.size()});
        dest.append(field.data(), field.data() + field.size());
    }

    [[nodiscard]] std::unique_ptr<custom_flag_formatter> clone() const override {
        return std::make_unique<JsonMessageFlag>();
    }
};
}  // namespace

std::shared_ptr<spdlog::logger> initialize_logger(const LogSettings& settings) {
    std::call_once(
        logger_once_flag,
        [&settings]() {
            const std::filesystem::path path_log_dir{settings.log_directory};
            std::error_code error_directory;
            std::filesystem::create_directories(path_log_dir, error_directory);
            if (error_directory) {
                throw std::runtime_error("Unable to create log directory at " + path_log_dir.string());
            }

            const std::filesystem::path path_log_file = path_log_dir / settings.file_name;

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("[%l] %v");
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path_log_file.string(),
                settings.max_file_size_bytes,
                settings.max_files
            );
            auto file_formatter = std::make_unique<spdlog::pattern_formatter>();
            file_formatter->add_flag<JsonMessageFlag>('*').set_pattern(k_file_pattern);
            file_sink->set_formatter(std::move(file_formatter));

            spdlog::sinks_init_list sinks{console_sink, file_sink};
            shared_logger = std::make_shared<spdlog::logger>(k_logger_name, sinks);
            shared_logger->set_level(settings.level);
            shared_logger->flush_on(settings.flush_level);
            spdlog::register_logger(shared_logger);
        }
    );
    return shared_logger;
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (!shared_logger) {
        throw std::runtime_error("Logger not initialized");
    }
    return shared_logger;
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view str_level) {
    const auto level = spdlog::level::from_str(std::string{str_level});
    // from_str maps unknown names to off.
    if (level == spdlog::level::off && str_level != "off") {
        return std::nullopt;
    }
    return level;
}

std::string json_log_field(std::string_view message) {
    if (message.size() >= 2 && message.front() == '{' && message.back() == '}') {
        return std::string{message};
    }
    return nlohmann::json(std::string{message}).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace offline_maps
