// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings that feed
// the dispatch runtime.
//
// Responsibilities
// - Enforce defaults and bounds for alert batch size, response deadline, sweep
//   cadence and AI confidence thresholds. Non-finite numbers are rejected.
// - Surface diagnostics via the logging subsystem whenever input cannot be
//   parsed or is out of range.
//
// Callers populate the process environment ahead of time (service unit, shell
// `.env`); nothing is read from disk here.

#include "campus_dispatch/configuration.hpp"

#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "campus_dispatch/logging.hpp"

namespace campus_dispatch {

namespace {
constexpr int k_default_max_guards{3};
constexpr double k_default_response_deadline_s{45.0};
constexpr double k_default_sweep_interval_s{10.0};
constexpr double k_max_response_deadline_s{3600.0};
constexpr double k_max_sweep_interval_s{3600.0};
constexpr double k_default_ai_vision_threshold{0.75};
constexpr double k_default_ai_audio_threshold{0.80};
constexpr std::string_view k_default_log_directory{"logs"};

double parse_positive_double(const char* variable_name, double fallback, double maximum) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        if (!std::isfinite(parsed_value) || parsed_value <= 0.0 || parsed_value > maximum) {
            get_logger("config")->warn("{} must lie in (0, {}], got {}; using fallback {}", variable_name, maximum, raw_value, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger("config")->warn("Failed to parse {} from environment; using fallback {}", variable_name, fallback);
        return fallback;
    }
}

int parse_positive_int(const char* variable_name, int fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const int parsed_value = std::stoi(raw_value);
        if (parsed_value <= 0) {
            get_logger("config")->warn("{} must be positive, got {}; using fallback {}", variable_name, parsed_value, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger("config")->warn("Failed to parse {} from environment; using fallback {}", variable_name, fallback);
        return fallback;
    }
}

double parse_threshold(const char* variable_name, double fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        if (!std::isfinite(parsed_value) || parsed_value < 0.0 || parsed_value > 1.0) {
            get_logger("config")->warn("{} must lie in [0, 1], got {}; using fallback {}", variable_name, raw_value, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger("config")->warn("Failed to parse {} from environment; using fallback {}", variable_name, fallback);
        return fallback;
    }
}

std::string parse_log_directory() {
    const char* raw_directory = std::getenv("CAMPUS_DISPATCH_LOG_DIR");
    if (raw_directory == nullptr || std::string_view{raw_directory}.empty()) {
        return std::string{k_default_log_directory};
    }
    return std::string{raw_directory};
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_log_directory();

    initialize_logger(config.log_directory);
    auto logger = get_logger("config");
    logger->info("Loading configuration from environment");

    config.dispatch = load_dispatch_config();

    logger->info("Configuration loaded: max_guards={} response_deadline_s={} sweep_interval_s={} ai_vision={} ai_audio={}",
                 config.dispatch.alert_policy.max_guards,
                 config.dispatch.alert_policy.response_deadline.count(),
                 config.dispatch.sweep_interval.count(),
                 config.dispatch.ai_vision_threshold,
                 config.dispatch.ai_audio_threshold);

    return config;
}

DispatchConfig ConfigurationLoader::load_dispatch_config() {
    DispatchConfig dispatch{};
    dispatch.alert_policy.max_guards =
        static_cast<std::size_t>(parse_positive_int("CAMPUS_DISPATCH_MAX_GUARDS", k_default_max_guards));
    dispatch.alert_policy.response_deadline =
        Duration{parse_positive_double("CAMPUS_DISPATCH_RESPONSE_DEADLINE_S", k_default_response_deadline_s, k_max_response_deadline_s)};
    dispatch.sweep_interval = Duration{parse_positive_double("CAMPUS_DISPATCH_SWEEP_INTERVAL_S", k_default_sweep_interval_s, k_max_sweep_interval_s)};
    dispatch.ai_vision_threshold = parse_threshold("CAMPUS_DISPATCH_AI_VISION_THRESHOLD", k_default_ai_vision_threshold);
    dispatch.ai_audio_threshold = parse_threshold("CAMPUS_DISPATCH_AI_AUDIO_THRESHOLD", k_default_ai_audio_threshold);
    return dispatch;
}

}  // namespace campus_dispatch
