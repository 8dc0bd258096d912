#include "util/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace hive::util {

void init_logger() {
    auto console = spdlog::get("console");
    if (!console) {
        console = spdlog::stdout_color_mt("console");
    }
    spdlog::set_default_logger(console);
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

void set_log_level(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        spdlog::warn("Unknown log level '{}', using info", name);
        level = spdlog::level::info;
    }
    set_log_level(level);
}

} // namespace hive::util
