#include "collapsex/logger.hpp"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace collapsex {

namespace {
const char* kLoggerName = "collapsex";
std::once_flag g_logger_once;
}

std::shared_ptr<spdlog::logger> logger() {
    std::call_once(g_logger_once, []() {
        if (!spdlog::get(kLoggerName)) {
            auto log = spdlog::stdout_color_mt(kLoggerName);
            log->set_level(spdlog::level::info);
            log->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        }
    });
    return spdlog::get(kLoggerName);
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

void set_log_level(const std::string& level) {
    set_log_level(spdlog::level::from_str(level));
}

} // namespace collapsex
