/**
 * @file log.cpp
 * @brief Library logger setup
 */

#include "pasteboard/log.h"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace pasteboard {
namespace logging {

namespace {
std::mutex g_register_mutex;
}

Logger get() {
  auto logger = spdlog::get(LOGGER_NAME);
  if (logger) {
    return logger;
  }

  std::lock_guard<std::mutex> lock(g_register_mutex);

  // Check again in case another thread registered it in between
  logger = spdlog::get(LOGGER_NAME);
  if (logger) {
    return logger;
  }

  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sink);
  logger->set_pattern("%^[%l]%$ [%Y-%m-%d %T.%e] [%n] %v");
  logger->set_level(spdlog::level::info);
  logger->flush_on(spdlog::level::err);
  spdlog::register_logger(logger);
  return logger;
}

void set_level(spdlog::level::level_enum level) { get()->set_level(level); }

std::optional<spdlog::level::level_enum> parse_level(const std::string &name) {
  // from_str() maps unknown names to off
  auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    return std::nullopt;
  }
  return level;
}

} // namespace logging
} // namespace pasteboard
