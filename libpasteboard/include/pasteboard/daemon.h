/**
 * @file daemon.h
 * @brief Session daemon hosting a PasteboardServer on D-Bus
 *
 * Available when libpasteboard is built with D-Bus support
 * (PASTEBOARD_HAS_DBUS).
 *
 * @code
 *   pasteboard::PasteboardDaemon daemon(config);
 *   auto started = daemon.start();
 *   if (started.is_ok()) {
 *       daemon.run();   // until stop() is called
 *   }
 * @endcode
 */

#ifndef PASTEBOARD_DAEMON_H
#define PASTEBOARD_DAEMON_H

#include "config.h"
#include "error.h"
#include "platform.h"
#include "server.h"
#include <memory>

namespace pasteboard {

class PASTEBOARD_API PasteboardDaemon {
public:
  explicit PasteboardDaemon(PasteboardConfig config);
  ~PasteboardDaemon();

  // Non-copyable
  PasteboardDaemon(const PasteboardDaemon &) = delete;
  PasteboardDaemon &operator=(const PasteboardDaemon &) = delete;

  /**
   * @brief Validate the config, own the bus name and export the server
   *
   * Installs the desktop bridge when the config enables it.
   */
  Result<void> start();

  /**
   * @brief Serve requests until stop() is called
   */
  Result<void> run();

  /**
   * @brief Ask run() to return
   *
   * Only sets a flag, so it may be called from a signal handler.
   */
  void stop();

  /// The hosted server
  std::shared_ptr<PasteboardServer> server() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace pasteboard

#endif // PASTEBOARD_DAEMON_H
