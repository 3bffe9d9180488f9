// === Configuration ===========================================================
//
// Strongly-typed runtime settings for the dispatch daemon. ConfigurationLoader
// translates environment variables into these structures so downstream modules
// never touch `std::getenv` directly.

#pragma once

#include <string>

#include "campus_dispatch/dispatch_orchestrator.hpp"

namespace campus_dispatch {

/**
 * @brief Immutable bundle of runtime knobs for the dispatch engine.
 *
 * Every field is populated by ConfigurationLoader; consumers treat the values
 * as authoritative.
 */
struct Configuration final {
    std::string log_directory{};   /**< Destination directory for structured logs. */
    DispatchConfig dispatch{};     /**< Alert policy, sweep cadence and AI thresholds. */
};

/**
 * @brief Hydrates Configuration from CAMPUS_DISPATCH_* environment variables
 *        and initializes the shared logger.
 */
class ConfigurationLoader final {
  public:
    static Configuration load();

  private:
    static DispatchConfig load_dispatch_config();
};

}  // namespace campus_dispatch
