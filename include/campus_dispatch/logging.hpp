// === Logging =================================================================
//
// One rotating JSON-lines file plus the console. Each engine component logs
// through a child of the root "campus_dispatch" logger named after the
// component, so the file carries a "component" field without every message
// spelling it out. Messages that are already JSON objects are embedded as-is
// under "event"; anything else is embedded as a quoted string.

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/formatter.h>
#include <spdlog/logger.h>

namespace campus_dispatch {

/**
 * @brief Create the shared "campus_dispatch" logger exactly once.
 *
 * Later calls return the logger built by the first one.
 */
std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

/** @brief Root logger; throws std::runtime_error before initialize_logger(). */
std::shared_ptr<spdlog::logger> get_logger();

/** @brief Child logger for @p component, sharing the root sinks and level. */
std::shared_ptr<spdlog::logger> get_logger(std::string_view component);

/** @brief Apply @p str_level to the root logger and every component logger. */
void set_log_level(const std::string& str_level);

/** @brief Formatter producing one JSON object per record. */
[[nodiscard]] std::unique_ptr<spdlog::formatter> make_json_line_formatter();

/** @brief @p text as a quoted JSON string literal. */
[[nodiscard]] std::string json_quote(std::string_view text);

}  // namespace campus_dispatch
