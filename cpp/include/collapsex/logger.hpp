#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace collapsex {

/**
 * @brief Shared logger used by all collapsex components
 *
 * Lazily creates a thread-safe console logger named "collapsex" on first
 * use. Defaults to the info level; per-step progress is logged at debug.
 *
 * @return Shared pointer to the spdlog logger
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the minimum level emitted by the collapsex logger
 * @param level spdlog level (trace, debug, info, warn, err, critical, off)
 */
void set_log_level(spdlog::level::level_enum level);

/**
 * @brief Set the level from its name ("debug", "info", "warn", ...)
 * @param level Level name as understood by spdlog::level::from_str
 */
void set_log_level(const std::string& level);

} // namespace collapsex
