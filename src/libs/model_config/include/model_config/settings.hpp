#pragma once

#include <spdlog/spdlog.h>
#include <istream>
#include <memory>
#include <optional>
#include <string>

namespace model_config {

struct Settings {
    std::string log_level = "info";
    // Empty: log to stderr.
    std::string log_file;
    std::string log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";
    std::string sample = "library";
};

// Missing or wrongly typed keys keep their defaults; malformed JSON or a
// non-object document yields nullopt.
std::optional<Settings> load_settings_from_json(std::istream& in);
std::optional<Settings> load_settings_from_json_file(const std::string& path);

// spdlog level names ("trace" .. "off"); anything else is info.
spdlog::level::level_enum parse_log_level(const std::string& name);

// Builds the "metamodel" logger from settings and installs it for the library.
std::shared_ptr<spdlog::logger> configure_logging(const Settings& settings);

} // namespace model_config
