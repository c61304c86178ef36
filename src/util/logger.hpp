#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace agentflow::util {

// Initialize logging with console output
void init_logger();

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Map a level name ("trace", "debug", "info", ...) to an spdlog level.
// Unknown names map to info.
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace agentflow::util
