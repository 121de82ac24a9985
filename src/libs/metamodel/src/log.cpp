#include <metamodel/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <utility>

namespace metamodel {

namespace {

std::shared_ptr<spdlog::logger>& logger_slot() {
    static std::shared_ptr<spdlog::logger> logger;
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    auto& slot = logger_slot();
    if (slot) return slot;

    try {
        slot = spdlog::get("metamodel");
        if (!slot) {
            slot = spdlog::stderr_color_mt("metamodel");
            slot->set_level(spdlog::level::warn);
        }
    } catch (const spdlog::spdlog_ex&) {
        slot = spdlog::default_logger();
    }
    return slot;
}

void set_logger(std::shared_ptr<spdlog::logger> logger) {
    logger_slot() = std::move(logger);
}

} // namespace metamodel
