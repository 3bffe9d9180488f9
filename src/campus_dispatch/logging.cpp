#include "campus_dispatch/logging.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <stdexcept>
#include <fmt/format.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace campus_dispatch {

namespace {
std::once_flag logger_once_flag;
std::shared_ptr<spdlog::logger> shared_logger;
std::mutex component_mutex;
std::map<std::string, std::shared_ptr<spdlog::logger>, std::less<>> map_component_loggers;
constexpr std::size_t k_max_file_size_bytes{10 * 1024 * 1024};
constexpr std::size_t k_max_files{5};
constexpr const char* k_json_line_pattern{
    R"({"ts":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","component":"%n","thread":%t,"event":%*})"
};

/** @brief `%*`: the payload verbatim when it is a JSON object, quoted otherwise. */
class JsonEventFlag final : public spdlog::custom_flag_formatter {
  public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        const std::string_view payload{msg.payload.data(), msg.payload.size()};
        if (!payload.empty() && payload.front() == '{' && payload.back() == '}') {
            dest.append(payload.data(), payload.data() + payload.size());
            return;
        }
        const std::string quoted = json_quote(payload);
        dest.append(quoted.data(), quoted.data() + quoted.size());
    }

    [[nodiscard]] std::unique_ptr<spdlog::custom_flag_formatter> clone() const override {
        return std::make_unique<JsonEventFlag>();
    }
};
}  // namespace

std::unique_ptr<spdlog::formatter> make_json_line_formatter() {
    auto formatter = std::make_unique<spdlog::pattern_formatter>(spdlog::pattern_time_type::utc);
    formatter->add_flag<JsonEventFlag>('*').set_pattern(k_json_line_pattern);
    return formatter;
}

std::string json_quote(std::string_view text) {
    std::string quoted;
    quoted.reserve(text.size() + 2);
    quoted.push_back('"');
    for (const char character : text) {
        switch (character) {
            case '"':
                quoted += "\\\"";
                break;
            case '\\':
                quoted += "\\\\";
                break;
            case '\n':
                quoted += "\\n";
                break;
            case '\r':
                quoted += "\\r";
                break;
            case '\t':
                quoted += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(character) < 0x20) {
                    quoted += fmt::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(character)));
                } else {
                    quoted.push_back(character);
                }
                break;
        }
    }
    quoted.push_back('"');
    return quoted;
}

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory) {
    std::call_once(
        logger_once_flag,
        [&log_directory]() {
            const std::filesystem::path path_log_dir{log_directory};
            std::error_code error_directory;
            std::filesystem::create_directories(path_log_dir, error_directory);
            if (error_directory) {
                throw std::runtime_error("Unable to create log directory at " + path_log_dir.string());
            }

            const std::filesystem::path path_log_file = path_log_dir / "campus_dispatch.log";

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("[%l] [%n] %v");
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path_log_file.string(),
                k_max_file_size_bytes,
                k_max_files
            );
            file_sink->set_formatter(make_json_line_formatter());

            spdlog::sinks_init_list sinks{console_sink, file_sink};
            shared_logger = std::make_shared<spdlog::logger>("campus_dispatch", sinks);
            shared_logger->set_level(spdlog::level::info);
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

std::shared_ptr<spdlog::logger> get_logger(std::string_view component) {
    auto root = get_logger();
    std::scoped_lock lock(component_mutex);
    const auto iterator_logger = map_component_loggers.find(component);
    if (iterator_logger != map_component_loggers.end()) {
        return iterator_logger->second;
    }
    auto component_logger = root->clone(std::string{component});
    map_component_loggers.emplace(std::string{component}, component_logger);
    return component_logger;
}

void set_log_level(const std::string& str_level) {
    if (!shared_logger) {
        return;
    }
    auto level = spdlog::level::from_str(str_level);
    if (level == spdlog::level::off && str_level != "off") {
        shared_logger->warn("Unknown log level {}; defaulting to info", str_level);
        level = spdlog::level::info;
    }
    shared_logger->set_level(level);
    std::scoped_lock lock(component_mutex);
    for (auto& [component, component_logger] : map_component_loggers) {
        component_logger->set_level(level);
    }
}

}  // namespace campus_dispatch
