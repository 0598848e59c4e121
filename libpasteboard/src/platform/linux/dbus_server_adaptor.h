/**
 * @file dbus_server_adaptor.h
 * @brief Exports a PasteboardServer on the session bus
 */

#ifndef PASTEBOARD_PLATFORM_LINUX_DBUS_SERVER_ADAPTOR_H
#define PASTEBOARD_PLATFORM_LINUX_DBUS_SERVER_ADAPTOR_H

#include "dbus_helpers.h"
#include "pasteboard/config.h"
#include "pasteboard/server.h"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace pasteboard {
namespace platform {

/**
 * @brief Server side of the org.pasteboard.Server1 interface
 *
 * Retains are recorded per bus client so that a client leaving the bus
 * (crash included) releases every pasteboard it still held.
 */
class DBusPasteboardAdaptor {
public:
  DBusPasteboardAdaptor(std::shared_ptr<PasteboardServer> server,
                        PasteboardConfig config);
  ~DBusPasteboardAdaptor();

  // Non-copyable
  DBusPasteboardAdaptor(const DBusPasteboardAdaptor &) = delete;
  DBusPasteboardAdaptor &operator=(const DBusPasteboardAdaptor &) = delete;

  /**
   * @brief Connect, own the bus name and export the object
   * @return Success, or an error if the name is already owned
   */
  Result<void> start();

  /**
   * @brief Dispatch messages until stop is requested or the bus goes away
   */
  Result<void> run(const std::atomic<bool> &stop_requested);

  /**
   * @brief Execute one method call against the server
   *
   * Does not touch the bus; the returned reply (method return or error)
   * is sent by the caller.
   */
  DBusMessageWrapper dispatch(DBusMessage *call);

  /**
   * @brief Drop every retain held by a bus client
   */
  void client_vanished(const std::string &sender);

  /// Retains currently recorded for a client on a pasteboard
  size_t client_retains(const std::string &sender,
                        const std::string &name) const;

private:
  static DBusHandlerResult message_function(DBusConnection *conn,
                                            DBusMessage *message,
                                            void *user_data);
  static DBusHandlerResult filter_function(DBusConnection *conn,
                                           DBusMessage *message,
                                           void *user_data);

  void record_retain(const std::string &sender, const std::string &name);
  bool record_release(const std::string &sender, const std::string &name);

  std::shared_ptr<PasteboardServer> server_;
  PasteboardConfig config_;
  DBusConnectionWrapper conn_;
  bool registered_ = false;

  // sender -> pasteboard name -> retain count
  mutable std::mutex retains_mutex_;
  std::map<std::string, std::map<std::string, size_t>> retains_;
};

} // namespace platform
} // namespace pasteboard

#endif // PASTEBOARD_PLATFORM_LINUX_DBUS_SERVER_ADAPTOR_H
