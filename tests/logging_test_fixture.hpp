#pragma once

#include "campus_dispatch/logging.hpp"

#include <filesystem>
#include <memory>

namespace campus_dispatch::test {

/** @brief Route engine logs to a temp directory and keep test output to warnings. */
inline void ensure_logger_initialized() {
    static const std::shared_ptr<spdlog::logger> logger_handle = []() {
        const auto log_dir = std::filesystem::temp_directory_path() / "campus_dispatch_tests_logs";
        auto logger = campus_dispatch::initialize_logger(log_dir.string());
        campus_dispatch::set_log_level("warn");
        return logger;
    }();
    (void)logger_handle;
}

}  // namespace campus_dispatch::test
