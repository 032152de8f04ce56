#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace voxgate::core {

// Initialize logging. Output goes to stderr so stdout stays free for responses.
void init_logger();

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Parse "debug", "info", "warn", ... ; unknown names map to info.
spdlog::level::level_enum log_level_from_string(const std::string& name);

} // namespace voxgate::core
