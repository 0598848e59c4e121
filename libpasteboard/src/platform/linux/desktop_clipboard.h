/**
 * @file desktop_clipboard.h
 * @brief Mirror of the general pasteboard into the X11/Wayland clipboard
 *
 * Uses the wl-clipboard / xclip / xsel command-line tools, whichever the
 * session provides.
 */

#ifndef PASTEBOARD_PLATFORM_LINUX_DESKTOP_CLIPBOARD_H
#define PASTEBOARD_PLATFORM_LINUX_DESKTOP_CLIPBOARD_H

#include "pasteboard/error.h"
#include "pasteboard/server.h"
#include <functional>
#include <string>

namespace pasteboard {
namespace platform {

/**
 * @brief Display server of the current session
 */
enum class DisplayServer {
  None,
  X11,
  Wayland
};

/**
 * @brief Detect the display server from WAYLAND_DISPLAY and DISPLAY
 */
DisplayServer detect_display_server();

/**
 * @brief Write text to the desktop clipboard
 * @return NotSupported when no display server or tool is available
 */
Result<void> write_desktop_text(const std::string &text);

using DesktopWriter = std::function<Result<void>(const std::string &)>;

/**
 * @brief Change listener forwarding general-pasteboard text
 *
 * Only String writes on the general pasteboard are forwarded. Writer
 * failures are logged.
 */
ChangeCallback make_desktop_bridge(DesktopWriter writer = write_desktop_text);

} // namespace platform
} // namespace pasteboard

#endif // PASTEBOARD_PLATFORM_LINUX_DESKTOP_CLIPBOARD_H
