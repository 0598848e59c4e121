/**
 * @file log.h
 * @brief spdlog logger shared by libpasteboard and pasteboardd
 */

#ifndef PASTEBOARD_LOG_H
#define PASTEBOARD_LOG_H

#include "platform.h"
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>

namespace pasteboard {
namespace logging {

using Logger = std::shared_ptr<spdlog::logger>;

/// Name under which the library logger is registered with spdlog
constexpr const char *LOGGER_NAME = "pasteboard";

/**
 * @brief Get the library logger, creating it on first use
 *
 * The logger writes to stderr through a colored sink. Creation is
 * thread-safe; later calls return the registered instance.
 */
PASTEBOARD_API Logger get();

/// Set the library logger level
PASTEBOARD_API void set_level(spdlog::level::level_enum level);

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error",
 * "critical", "off")
 * @return The level, or nullopt for an unknown name
 */
PASTEBOARD_API std::optional<spdlog::level::level_enum>
parse_level(const std::string &name);

} // namespace logging
} // namespace pasteboard

#endif // PASTEBOARD_LOG_H
