#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace metamodel {

// Logger shared by the whole library. Created on first use with a stderr sink
// at level warn unless a logger was installed with set_logger().
std::shared_ptr<spdlog::logger> logger();

void set_logger(std::shared_ptr<spdlog::logger> logger);

} // namespace metamodel
