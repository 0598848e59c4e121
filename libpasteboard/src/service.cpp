/**
 * @file service.cpp
 * @brief Service construction and the process default service
 */

#include "pasteboard/service.h"
#include "pasteboard/log.h"
#include "pasteboard/server.h"
#include <mutex>

#ifdef PASTEBOARD_HAS_DBUS
#include "platform/linux/dbus_client_service.h"
#endif

namespace pasteboard {

namespace {
std::mutex g_default_mutex;
std::shared_ptr<ClipboardService> g_default_service;
} // namespace

Result<std::shared_ptr<ClipboardService>>
make_service(const PasteboardConfig &config) {
  auto validation = config.validate();
  if (validation.is_error()) {
    return validation.error();
  }

  switch (config.resolved_backend()) {
  case ServiceBackend::DBus:
#ifdef PASTEBOARD_HAS_DBUS
    return std::shared_ptr<ClipboardService>(
        std::make_shared<platform::DBusClipboardService>(config));
#else
    return Error(ErrorCode::NotSupported,
                 "libpasteboard was built without D-Bus support");
#endif

  case ServiceBackend::Local:
  default:
    return std::shared_ptr<ClipboardService>(
        std::make_shared<LocalClipboardService>());
  }
}

std::shared_ptr<ClipboardService> default_service() {
  std::lock_guard<std::mutex> lock(g_default_mutex);
  if (g_default_service) {
    return g_default_service;
  }

  auto config = PasteboardConfig::from_environment();
  auto level = logging::parse_level(config.log_level);
  if (level) {
    logging::set_level(*level);
  }

  auto result = make_service(config);
  if (result.is_ok()) {
    g_default_service = result.value();
    logging::get()->debug("Default pasteboard service: {}",
                          service_backend_name(config.resolved_backend()));
  } else {
    logging::get()->warn("Falling back to in-process pasteboard server: {}",
                         result.error().to_string());
    g_default_service = std::make_shared<LocalClipboardService>();
  }

  return g_default_service;
}

void set_default_service(std::shared_ptr<ClipboardService> service) {
  std::lock_guard<std::mutex> lock(g_default_mutex);
  g_default_service = std::move(service);
}

} // namespace pasteboard
