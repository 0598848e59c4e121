/**
 * @file server.h
 * @brief In-memory pasteboard server and the in-process service over it
 *
 * PasteboardServer owns the stores for every live pasteboard. It is the
 * serialization point for all handles in a process (LocalClipboardService)
 * or, hosted by pasteboardd, for every process on the session bus.
 */

#ifndef PASTEBOARD_SERVER_H
#define PASTEBOARD_SERVER_H

#include "platform.h"
#include "service.h"
#include "types.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pasteboard {

// ============================================================================
// Change Notification
// ============================================================================

/**
 * @brief Kind of mutation reported to a change listener
 */
enum class ChangeKind : uint8_t {
  StringWritten = 0,
  ObjectsWritten = 1,
  Cleared = 2
};

/**
 * @brief A mutation applied to one pasteboard
 */
struct ChangeEvent {
  std::string name;
  ChangeKind kind = ChangeKind::StringWritten;

  /// Type identifier written (empty for Cleared)
  std::string type_id;

  /// String written (StringWritten only)
  std::string value;

  /// Change count after the mutation
  ChangeCount change_count = 0;
};

using ChangeCallback = std::function<void(const ChangeEvent &)>;

// ============================================================================
// Pasteboard Server
// ============================================================================

/**
 * @brief Thread-safe store of named pasteboards
 *
 * The standard pasteboards (general, drag, find, font, ruler) exist from
 * construction and are never reclaimed. Other pasteboards are created on
 * first use and reclaimed once release_globally() has been called and no
 * binding remains.
 *
 * Writes to a name that is not live create it. Reads from a name that is
 * not live behave as reads from an empty pasteboard.
 */
class PASTEBOARD_API PasteboardServer {
public:
  PasteboardServer();
  ~PasteboardServer();

  // Non-copyable
  PasteboardServer(const PasteboardServer &) = delete;
  PasteboardServer &operator=(const PasteboardServer &) = delete;

  // ========================================================================
  // Bindings
  // ========================================================================

  void retain(const std::string &name);
  std::string retain_unique();
  void release(const std::string &name);

  // ========================================================================
  // Contents
  // ========================================================================

  void set_string(const std::string &name, const std::string &type_id,
                  const std::string &value);

  void write_objects(const std::string &name, const std::string &type_id,
                     const std::vector<std::string> &items);

  ChangeCount clear_contents(const std::string &name);

  void release_globally(const std::string &name);

  /**
   * @brief Items for the given identifiers, in identifier order
   *
   * A string value contributes one item. Never returns nullopt; the
   * optional mirrors ClipboardService::read_objects.
   */
  std::optional<std::vector<std::string>>
  read_objects(const std::string &name,
               const std::vector<std::string> &type_ids) const;

  /// String value for a type; for item lists, the first item
  std::optional<std::string> string_for_type(const std::string &name,
                                             const std::string &type_id) const;

  ChangeCount change_count(const std::string &name) const;

  std::vector<std::string> types(const std::string &name) const;

  // ========================================================================
  // Introspection
  // ========================================================================

  /// Whether a pasteboard with this name is live
  bool contains(const std::string &name) const;

  /// Number of live pasteboards, standard ones included
  size_t pasteboard_count() const;

  /// Bindings currently held on a pasteboard
  size_t retain_count(const std::string &name) const;

  // ========================================================================
  // Callbacks
  // ========================================================================

  /**
   * @brief Set callback invoked after every mutation
   *
   * Runs on the mutating thread, outside the server lock.
   */
  void on_change(ChangeCallback callback);

  /**
   * @brief Random name for a new pasteboard
   *
   * 16 bytes from libsodium rendered as hex, prefixed with "unique-".
   */
  static std::string generate_unique_name();

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

// ============================================================================
// In-Process Service
// ============================================================================

/**
 * @brief ClipboardService backed by a PasteboardServer in this process
 */
class PASTEBOARD_API LocalClipboardService : public ClipboardService {
public:
  /// Serve the process-wide shared server
  LocalClipboardService();

  /// Serve a specific server
  explicit LocalClipboardService(std::shared_ptr<PasteboardServer> server);

  void retain(const std::string &name) override;
  std::string retain_unique() override;
  void release(const std::string &name) override;

  void set_string(const std::string &name, const std::string &type_id,
                  const std::string &value) override;
  void write_objects(const std::string &name, const std::string &type_id,
                     const std::vector<std::string> &items) override;
  ChangeCount clear_contents(const std::string &name) override;
  void release_globally(const std::string &name) override;

  std::optional<std::vector<std::string>>
  read_objects(const std::string &name,
               const std::vector<std::string> &type_ids) override;
  std::optional<std::string>
  string_for_type(const std::string &name,
                  const std::string &type_id) override;
  ChangeCount change_count(const std::string &name) override;
  std::vector<std::string> types(const std::string &name) override;

  const std::shared_ptr<PasteboardServer> &server() const { return server_; }

  /// Server shared by every default-constructed LocalClipboardService
  static std::shared_ptr<PasteboardServer> shared_server();

private:
  std::shared_ptr<PasteboardServer> server_;
};

} // namespace pasteboard

#endif // PASTEBOARD_SERVER_H
