/**
 * @file config.h
 * @brief Service selection and daemon configuration for libpasteboard
 */

#ifndef PASTEBOARD_CONFIG_H
#define PASTEBOARD_CONFIG_H

#include "error.h"
#include "platform.h"
#include <cstdint>
#include <optional>
#include <string>

namespace pasteboard {

// ============================================================================
// Backend Selection
// ============================================================================

/**
 * @brief Which ClipboardService the process default binds to
 */
enum class ServiceBackend : uint8_t {
  /// D-Bus if available and a session bus is advertised, else Local
  Auto = 0,

  /// In-process pasteboard server
  Local = 1,

  /// pasteboardd over the session bus
  DBus = 2
};

/// Get human-readable name for a backend ("auto", "local", "dbus")
PASTEBOARD_API const char *service_backend_name(ServiceBackend backend);

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Configuration shared by the library and pasteboardd
 */
struct PasteboardConfig {
  // ========================================================================
  // Service
  // ========================================================================

  /// Backend used by default_service()
  ServiceBackend backend = ServiceBackend::Auto;

  /// Well-known bus name owned by pasteboardd
  std::string bus_name = "org.pasteboard.Server";

  /// Object path exported by pasteboardd
  std::string object_path = "/org/pasteboard/Server";

  /// Timeout for a single D-Bus call in milliseconds
  int call_timeout_ms = 2000;

  // ========================================================================
  // Daemon
  // ========================================================================

  /// Mirror general-pasteboard text into the X11/Wayland clipboard
  bool desktop_bridge = false;

  // ========================================================================
  // Logging
  // ========================================================================

  /// spdlog level name
  std::string log_level = "info";

  // ========================================================================
  // Methods
  // ========================================================================

  /// Reset every field to its default
  void load_defaults();

  /// Validate configuration
  Result<void> validate() const;

  /// Resolve Auto into a concrete backend for this process
  ServiceBackend resolved_backend() const;

  /**
   * @brief Defaults overridden by PASTEBOARD_* environment variables
   *
   * Reads PASTEBOARD_BACKEND, PASTEBOARD_BUS_NAME,
   * PASTEBOARD_CALL_TIMEOUT_MS, PASTEBOARD_LOG_LEVEL and
   * PASTEBOARD_DESKTOP_BRIDGE. Unparseable values are logged and ignored.
   */
  static PasteboardConfig from_environment();
};

/// Parse a backend name; nullopt when unknown
PASTEBOARD_API std::optional<ServiceBackend>
parse_service_backend(const std::string &name);

} // namespace pasteboard

#endif // PASTEBOARD_CONFIG_H
