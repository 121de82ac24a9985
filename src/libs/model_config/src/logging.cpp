#include <model_config/settings.hpp>
#include <metamodel/log.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <system_error>

namespace model_config {

spdlog::level::level_enum parse_log_level(const std::string& name) {
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") return spdlog::level::info;
    return level;
}

std::shared_ptr<spdlog::logger> configure_logging(const Settings& settings) {
    spdlog::sink_ptr sink;
    std::string sink_error;
    if (!settings.log_file.empty()) {
        try {
            const std::filesystem::path log_file(settings.log_file);
            if (log_file.has_parent_path()) {
                std::error_code ec;
                std::filesystem::create_directories(log_file.parent_path(), ec);
            }
            sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), true);
        } catch (const spdlog::spdlog_ex& e) {
            sink_error = e.what();
        }
    }
    if (!sink) sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();

    auto logger = std::make_shared<spdlog::logger>("metamodel", sink);
    const auto level = parse_log_level(settings.log_level);
    logger->set_level(level);
    logger->flush_on(level);
    logger->set_pattern(settings.log_pattern);
    metamodel::set_logger(logger);

    if (!sink_error.empty())
        logger->warn("Cannot open log file '{}' ({}); logging to stderr.", settings.log_file, sink_error);
    logger->debug("Logger initialized. level={} file={}", spdlog::level::to_string_view(level),
        settings.log_file.empty() ? std::string("<stderr>") : settings.log_file);
    return logger;
}

} // namespace model_config
