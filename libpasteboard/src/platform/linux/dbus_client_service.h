/**
 * @file dbus_client_service.h
 * @brief ClipboardService talking to pasteboardd over the session bus
 */

#ifndef PASTEBOARD_PLATFORM_LINUX_DBUS_CLIENT_SERVICE_H
#define PASTEBOARD_PLATFORM_LINUX_DBUS_CLIENT_SERVICE_H

#include "dbus_helpers.h"
#include "pasteboard/config.h"
#include "pasteboard/service.h"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pasteboard {
namespace platform {

/**
 * @brief Client side of the org.pasteboard.Server1 interface
 *
 * Connects to the session bus on first use and reconnects after a
 * disconnect. Every call blocks for its reply, so a write is visible to
 * any reader once it returns.
 *
 * A call that cannot be delivered or answered is a transport fault: reads
 * report it as "no data" (nullopt), writes log it and drop it.
 */
class DBusClipboardService : public ClipboardService {
public:
  explicit DBusClipboardService(PasteboardConfig config);
  ~DBusClipboardService() override;

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

  const PasteboardConfig &config() const { return config_; }

private:
  using Marshaller = std::function<bool(DBusMessageIter *)>;

  Result<DBusConnectionWrapper> connection();
  Result<DBusMessageWrapper> call(const char *method,
                                  const Marshaller &append);

  /// Issue a call whose reply carries no value, logging a failure
  void call_and_log(const char *method, const std::string &name,
                    const Marshaller &append);

  PasteboardConfig config_;
  std::mutex mutex_;
  DBusConnectionWrapper conn_;
};

// ============================================================================
// Reply Parsing
// ============================================================================

/// Reply of Types: (as)
Result<std::vector<std::string>> parse_string_list_reply(DBusMessage *reply);

/// Reply of ReadObjects: (aay)
Result<std::vector<std::string>> parse_items_reply(DBusMessage *reply);

/// Reply of StringForType: (bay)
Result<std::optional<std::string>> parse_optional_string_reply(
    DBusMessage *reply);

/// Reply of ClearContents and ChangeCount: (t)
Result<ChangeCount> parse_change_count_reply(DBusMessage *reply);

/// Reply of RetainUnique: (s)
Result<std::string> parse_name_reply(DBusMessage *reply);

} // namespace platform
} // namespace pasteboard

#endif // PASTEBOARD_PLATFORM_LINUX_DBUS_CLIENT_SERVICE_H
