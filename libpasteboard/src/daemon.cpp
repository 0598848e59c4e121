/**
 * @file daemon.cpp
 * @brief PasteboardDaemon implementation
 */

#include "pasteboard/daemon.h"
#include "pasteboard/log.h"
#include "platform/linux/dbus_server_adaptor.h"
#include "platform/linux/desktop_clipboard.h"
#include <atomic>

namespace pasteboard {

class PasteboardDaemon::Impl {
public:
  explicit Impl(PasteboardConfig cfg)
      : config(std::move(cfg)),
        server(std::make_shared<PasteboardServer>()),
        adaptor(server, config) {}

  PasteboardConfig config;
  std::shared_ptr<PasteboardServer> server;
  platform::DBusPasteboardAdaptor adaptor;
  std::atomic<bool> stop_requested{false};
  bool started = false;
};

PasteboardDaemon::PasteboardDaemon(PasteboardConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

PasteboardDaemon::~PasteboardDaemon() = default;

Result<void> PasteboardDaemon::start() {
  PASTEBOARD_TRY(impl_->config.validate());
  PASTEBOARD_TRY(impl_->adaptor.start());

  if (impl_->config.desktop_bridge) {
    if (platform::detect_display_server() == platform::DisplayServer::None) {
      logging::get()->warn(
          "Desktop bridge enabled but no display server detected");
    }
    impl_->server->on_change(platform::make_desktop_bridge());
    logging::get()->info("Mirroring general pasteboard text to the desktop");
  }

  impl_->started = true;
  return Result<void>::ok();
}

Result<void> PasteboardDaemon::run() {
  PASTEBOARD_REQUIRE(impl_->started, ErrorCode::InvalidState,
                     "Daemon not started");

  auto result = impl_->adaptor.run(impl_->stop_requested);
  logging::get()->info("pasteboardd stopping, {} pasteboard(s) live",
                       impl_->server->pasteboard_count());
  return result;
}

void PasteboardDaemon::stop() { impl_->stop_requested.store(true); }

std::shared_ptr<PasteboardServer> PasteboardDaemon::server() const {
  return impl_->server;
}

} // namespace pasteboard
