#pragma once
#include <memory>
#include <spdlog/spdlog.h>

namespace mcpkit {

/// Library-wide diagnostic logger. Writes to stderr by default because
/// stdout usually carries the protocol stream.
std::shared_ptr<spdlog::logger> logger();

/// Replace the library logger (e.g. with a file or test sink).
void set_logger(std::shared_ptr<spdlog::logger> l);

void set_log_level(spdlog::level::level_enum level);

} // namespace mcpkit
