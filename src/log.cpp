#include "mcpkit/log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace mcpkit {

namespace {

std::mutex logger_mutex;
std::shared_ptr<spdlog::logger> current_logger;

std::shared_ptr<spdlog::logger> make_default_logger() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    // Not registered globally so embedding applications can own "mcpkit".
    auto l = std::make_shared<spdlog::logger>("mcpkit", std::move(sink));
    l->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    l->set_level(spdlog::level::info);
    return l;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (!current_logger) current_logger = make_default_logger();
    return current_logger;
}

void set_logger(std::shared_ptr<spdlog::logger> l) {
    std::lock_guard<std::mutex> lock(logger_mutex);
    current_logger = l ? std::move(l) : make_default_logger();
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace mcpkit
