/**
 * @file service.h
 * @brief Narrow interface to the pasteboard server
 *
 * Every Pasteboard operation becomes one call on a ClipboardService.
 * LocalClipboardService serves an in-process PasteboardServer and
 * DBusClipboardService talks to pasteboardd; tests may supply their own.
 *
 * Pasteboards are addressed by name. Values are stored per type
 * identifier, either as a single string or as an ordered list of items.
 */

#ifndef PASTEBOARD_SERVICE_H
#define PASTEBOARD_SERVICE_H

#include "config.h"
#include "error.h"
#include "platform.h"
#include "types.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pasteboard {

/**
 * @brief Calls into a pasteboard server
 *
 * Implementations must be safe to call from several threads. Mutating
 * calls have no failure channel: a service that cannot deliver a write
 * logs it and drops it.
 */
class PASTEBOARD_API ClipboardService {
public:
  virtual ~ClipboardService() = default;

  // ========================================================================
  // Bindings
  // ========================================================================

  /// Bind a handle to a pasteboard, creating the pasteboard if absent
  virtual void retain(const std::string &name) = 0;

  /// Create a pasteboard with a fresh unique name and bind to it
  virtual std::string retain_unique() = 0;

  /// Drop one binding made by retain() or retain_unique()
  virtual void release(const std::string &name) = 0;

  // ========================================================================
  // Writes
  // ========================================================================

  /// Replace the string value stored for a type identifier
  virtual void set_string(const std::string &name, const std::string &type_id,
                          const std::string &value) = 0;

  /// Replace the item list stored for a type identifier
  virtual void write_objects(const std::string &name,
                             const std::string &type_id,
                             const std::vector<std::string> &items) = 0;

  /// Remove every value and advance the change count
  virtual ChangeCount clear_contents(const std::string &name) = 0;

  /// Allow the server to reclaim the pasteboard once it is unbound
  virtual void release_globally(const std::string &name) = 0;

  // ========================================================================
  // Reads
  // ========================================================================

  /**
   * @brief Items stored under any of the given type identifiers
   * @return Items in server order, or nullopt when the server returned no
   *         data at all (distinct from an empty list)
   */
  virtual std::optional<std::vector<std::string>>
  read_objects(const std::string &name,
               const std::vector<std::string> &type_ids) = 0;

  /// String stored for a type identifier, nullopt if none
  virtual std::optional<std::string>
  string_for_type(const std::string &name, const std::string &type_id) = 0;

  /// Current change count
  virtual ChangeCount change_count(const std::string &name) = 0;

  /// Type identifiers currently holding a value
  virtual std::vector<std::string> types(const std::string &name) = 0;
};

// ============================================================================
// Process Default Service
// ============================================================================

/**
 * @brief Create a service for the given configuration
 * @return The service, or NotSupported when D-Bus is requested but this
 *         build has no D-Bus transport
 */
PASTEBOARD_API Result<std::shared_ptr<ClipboardService>>
make_service(const PasteboardConfig &config);

/**
 * @brief Service used by handles created without an explicit one
 *
 * Built on first use from PasteboardConfig::from_environment(). If that
 * fails, the in-process server is used and a warning is logged.
 */
PASTEBOARD_API std::shared_ptr<ClipboardService> default_service();

/// Replace the process default service (nullptr resets to lazy creation)
PASTEBOARD_API void
set_default_service(std::shared_ptr<ClipboardService> service);

} // namespace pasteboard

#endif // PASTEBOARD_SERVICE_H
