/**
 * @file config.cpp
 * @brief Configuration implementation
 */

#include <cstdlib>
#include <string>

#include "pasteboard/config.h"
#include "pasteboard/log.h"

namespace pasteboard {

namespace {

const char *env_value(const char *name) {
  const char *value = std::getenv(name);
  if (value && value[0] != '\0') {
    return value;
  }
  return nullptr;
}

// D-Bus names: dot-separated elements of [A-Za-z0-9_-], 2+ elements, max 255
bool is_valid_bus_name(const std::string &name) {
  if (name.empty() || name.size() > 255 || name[0] == '.' ||
      name[0] == ':') {
    return false;
  }

  int elements = 1;
  bool element_start = true;
  for (char c : name) {
    if (c == '.') {
      if (element_start) {
        return false;
      }
      ++elements;
      element_start = true;
      continue;
    }
    bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_' ||
              c == '-' || (c >= '0' && c <= '9');
    if (!ok || (element_start && c >= '0' && c <= '9')) {
      return false;
    }
    element_start = false;
  }

  return !element_start && elements >= 2;
}

} // namespace

// ============================================================================
// Backend Names
// ============================================================================

const char *service_backend_name(ServiceBackend backend) {
  switch (backend) {
  case ServiceBackend::Auto:
    return "auto";
  case ServiceBackend::Local:
    return "local";
  case ServiceBackend::DBus:
    return "dbus";
  default:
    return "invalid";
  }
}

std::optional<ServiceBackend> parse_service_backend(const std::string &name) {
  if (name == "auto")
    return ServiceBackend::Auto;
  if (name == "local")
    return ServiceBackend::Local;
  if (name == "dbus")
    return ServiceBackend::DBus;
  return std::nullopt;
}

// ============================================================================
// PasteboardConfig Methods
// ============================================================================

void PasteboardConfig::load_defaults() { *this = PasteboardConfig(); }

Result<void> PasteboardConfig::validate() const {
  if (!is_valid_bus_name(bus_name)) {
    return Error(ErrorCode::InvalidArgument,
                 "Invalid D-Bus name: '" + bus_name + "'");
  }

  if (object_path.empty() || object_path[0] != '/') {
    return Error(ErrorCode::InvalidArgument,
                 "Object path must be absolute: '" + object_path + "'");
  }

  if (call_timeout_ms <= 0) {
    return Error(ErrorCode::InvalidArgument,
                 "Call timeout must be positive");
  }

  if (!logging::parse_level(log_level)) {
    return Error(ErrorCode::InvalidArgument,
                 "Unknown log level: '" + log_level + "'");
  }

  return Result<void>::ok();
}

ServiceBackend PasteboardConfig::resolved_backend() const {
  if (backend != ServiceBackend::Auto) {
    return backend;
  }

#ifdef PASTEBOARD_HAS_DBUS
  if (env_value("DBUS_SESSION_BUS_ADDRESS")) {
    return ServiceBackend::DBus;
  }
#endif

  return ServiceBackend::Local;
}

PasteboardConfig PasteboardConfig::from_environment() {
  PasteboardConfig config;
  auto log = logging::get();

  if (const char *value = env_value("PASTEBOARD_BACKEND")) {
    auto backend = parse_service_backend(value);
    if (backend) {
      config.backend = *backend;
    } else {
      log->warn("Ignoring unknown PASTEBOARD_BACKEND '{}'", value);
    }
  }

  if (const char *value = env_value("PASTEBOARD_BUS_NAME")) {
    config.bus_name = value;
  }

  if (const char *value = env_value("PASTEBOARD_CALL_TIMEOUT_MS")) {
    char *end = nullptr;
    long timeout = std::strtol(value, &end, 10);
    if (end && *end == '\0' && timeout > 0 && timeout <= 600000) {
      config.call_timeout_ms = static_cast<int>(timeout);
    } else {
      log->warn("Ignoring invalid PASTEBOARD_CALL_TIMEOUT_MS '{}'", value);
    }
  }

  if (const char *value = env_value("PASTEBOARD_LOG_LEVEL")) {
    if (logging::parse_level(value)) {
      config.log_level = value;
    } else {
      log->warn("Ignoring unknown PASTEBOARD_LOG_LEVEL '{}'", value);
    }
  }

  if (const char *value = env_value("PASTEBOARD_DESKTOP_BRIDGE")) {
    std::string flag(value);
    config.desktop_bridge = flag == "1" || flag == "true" || flag == "yes";
  }

  return config;
}

} // namespace pasteboard
