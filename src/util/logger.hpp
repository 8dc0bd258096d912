#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace hive::util {

// Initialize logging with console output
void init_logger();

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Set log level from a config string ("trace", "debug", "info", ...).
// Unknown names fall back to info.
void set_log_level(const std::string& name);

} // namespace hive::util
