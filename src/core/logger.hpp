#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace zero::core {

// Initialize logging: colour console sink, plus a file sink when log_file is set
void init_logger(const std::string& log_file = "");

// Set log level on every registered logger
void set_log_level(spdlog::level::level_enum level);

// Parse "trace".."off"; unknown names fall back to info
spdlog::level::level_enum parse_log_level(const std::string& name);

// Logger for SYS_DEBUG / SYS_CONSOLE_WRITE output, created on first use
std::shared_ptr<spdlog::logger> console_logger();

} // namespace zero::core
