/**
 * @file pasteboard.h
 * @brief Main libpasteboard API Header
 *
 * libpasteboard - typed access to a shared pasteboard server, used for
 * copy/paste and drag-and-drop exchange between applications.
 *
 * Quick Start:
 * @code
 *   #include <pasteboard/pasteboard.h>
 *
 *   // Get the general (system clipboard) pasteboard
 *   auto board = pasteboard::Pasteboard::general();
 *
 *   // Copy a piece of text
 *   board.copy_text("My message here");
 *
 *   // Read file URLs dropped by another application
 *   auto urls = pasteboard::Pasteboard::named(
 *       pasteboard::PasteboardName::drag()).get_file_urls();
 *   if (urls.is_error()) {
 *       // Server fault: retry or report, this is not "no files"
 *   }
 * @endcode
 */

#ifndef PASTEBOARD_PASTEBOARD_H
#define PASTEBOARD_PASTEBOARD_H

// Core headers (in dependency order)
#include "error.h"
#include "platform.h"
#include "types.h"

// Feature modules
#include "codec.h"
#include "config.h"
#include "log.h"
#include "server.h"
#include "service.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pasteboard {

// ============================================================================
// Version Information
// ============================================================================

/// libpasteboard major version
constexpr int VERSION_MAJOR = 1;

/// libpasteboard minor version
constexpr int VERSION_MINOR = 0;

/// libpasteboard patch version
constexpr int VERSION_PATCH = 0;

/// libpasteboard version string
constexpr const char *VERSION_STRING = "1.0.0";

// ============================================================================
// Pasteboard Handle
// ============================================================================

/**
 * @brief Shared handle to a server-side pasteboard
 *
 * Copies share one binding to the server; the last copy to go away
 * releases it. The handle never owns the pasteboard's contents, which
 * stay on the server after every handle is gone.
 *
 * Handles can be copied and used from several threads. Each operation is
 * one call into the server, so sequences such as "read, clear, write" are
 * not atomic: another handle or process may change the pasteboard between
 * the steps.
 *
 * Writes cannot fail from the caller's point of view. If the service
 * cannot deliver one it is logged and dropped. Only reads report errors.
 */
class PASTEBOARD_API Pasteboard {
public:
  // ========================================================================
  // Construction
  // ========================================================================

  /// The general pasteboard on the default service
  static Pasteboard general();
  static Pasteboard general(std::shared_ptr<ClipboardService> service);

  /// The pasteboard with this name, created server-side if absent
  static Pasteboard named(const PasteboardName &name);
  static Pasteboard named(std::shared_ptr<ClipboardService> service,
                          const PasteboardName &name);

  /// A new pasteboard whose name is unique among live pasteboards
  static Pasteboard unique();
  static Pasteboard unique(std::shared_ptr<ClipboardService> service);

  /**
   * @brief Wrap a pasteboard handed back by another subsystem
   *
   * Used for pasteboards delivered by e.g. a drag-and-drop callback. The
   * name is not validated.
   */
  static Pasteboard with(std::shared_ptr<ClipboardService> service,
                         const std::string &existing_name);

  // ========================================================================
  // Writes
  // ========================================================================

  /// Store text as the plain-string type
  void copy_text(const std::string &text) const;

  /// Store a string under an explicit type
  void copy_clipboard(const std::string &value, PasteboardType type) const;

  /**
   * @brief Store filesystem paths as a file URL list
   *
   * Each path becomes "file://" + path (percent-encoded). Order is
   * preserved and the previous file URL list is replaced. An empty input
   * writes an empty list.
   */
  void copy_files(const std::vector<std::string> &paths) const;

  /// Remove every type and value, advancing the change count
  void clear_contents() const;

  /**
   * @brief Let the server reclaim this pasteboard once it is unbound
   *
   * Contents stay visible to existing handles. Has no effect on the
   * standard pasteboards.
   */
  void release_globally() const;

  // ========================================================================
  // Reads
  // ========================================================================

  /**
   * @brief File URLs currently on the pasteboard, in server order
   * @return The URLs (possibly none), or ServerNoData when the server
   *         returned no data at all
   */
  Result<std::vector<Url>> get_file_urls() const;

  /// Like get_file_urls(), decoded to filesystem paths
  Result<std::vector<std::string>> get_file_paths() const;

  /// Plain-string value, nullopt if none
  std::optional<std::string> get_text() const;

  /// String value stored for a type, nullopt if none
  std::optional<std::string> get_string(PasteboardType type) const;

  /// Current change count
  ChangeCount change_count() const;

  /// Type identifiers currently holding a value
  std::vector<std::string> types() const;

  // ========================================================================
  // Identity
  // ========================================================================

  /// Server-side name of this pasteboard
  const std::string &name() const;

  /// Service this handle is bound through
  const std::shared_ptr<ClipboardService> &service() const;

  /// Number of handle copies sharing this binding
  long use_count() const { return binding_.use_count(); }

  /// Same pasteboard name on the same service
  bool operator==(const Pasteboard &other) const;
  bool operator!=(const Pasteboard &other) const { return !(*this == other); }

private:
  class Binding;

  explicit Pasteboard(std::shared_ptr<const Binding> binding)
      : binding_(std::move(binding)) {}

  std::shared_ptr<const Binding> binding_;
};

} // namespace pasteboard

#endif // PASTEBOARD_PASTEBOARD_H
