#pragma once

#include "offline_maps/logging.hpp"

#include <filesystem>
#include <memory>

namespace offline_maps::test {

inline void ensure_logger_initialized() {
    static const std::shared_ptr<spdlog::logger> logger_handle = []() {
        offline_maps::LogSettings settings{};
        settings.log_directory = (std::filesystem::temp_directory_path() / "offline_maps_tests_logs").string();
        return offline_maps::initialize_logger(settings);
    }();
    (void)logger_handle;
}

}  // namespace offline_maps::test
