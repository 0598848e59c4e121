/**
 * @file desktop_clipboard.cpp
 * @brief Desktop clipboard writes through command-line tools
 */

#include "desktop_clipboard.h"
#include "pasteboard/log.h"
#include "pasteboard/types.h"
#include <cstdio>
#include <cstdlib>
#include <memory>

namespace pasteboard {
namespace platform {

// ============================================================================
// Display Server Detection
// ============================================================================

DisplayServer detect_display_server() {
  const char *wayland = std::getenv("WAYLAND_DISPLAY");
  if (wayland && wayland[0] != '\0') {
    return DisplayServer::Wayland;
  }

  const char *display = std::getenv("DISPLAY");
  if (display && display[0] != '\0') {
    return DisplayServer::X11;
  }

  return DisplayServer::None;
}

// ============================================================================
// Command Execution Helper
// ============================================================================

namespace {

Result<void> execute_command_with_input(const std::string &cmd,
                                        const std::string &input) {
  FILE *raw = popen(cmd.c_str(), "w");
  if (!raw) {
    return Error(ErrorCode::PlatformError, "Failed to execute command: " + cmd);
  }
  std::unique_ptr<FILE, decltype(&pclose)> pipe(raw, pclose);

  if (fwrite(input.data(), 1, input.size(), pipe.get()) != input.size()) {
    return Error(ErrorCode::PlatformError, "Failed to write to pipe");
  }

  int status = pclose(pipe.release());
  if (status != 0) {
    return Error(ErrorCode::PlatformError,
                 "Command exited with status " + std::to_string(status),
                 cmd);
  }

  return Result<void>::ok();
}

bool command_exists(const char *cmd) {
  std::string check = "command -v ";
  check += cmd;
  check += " >/dev/null 2>&1";
  return std::system(check.c_str()) == 0;
}

} // namespace

// ============================================================================
// Clipboard Operations
// ============================================================================

Result<void> write_desktop_text(const std::string &text) {
  std::string cmd;

  switch (detect_display_server()) {
  case DisplayServer::Wayland:
    if (!command_exists("wl-copy")) {
      return Error(ErrorCode::NotSupported,
                   "wl-copy not found. Install wl-clipboard package.");
    }
    cmd = "wl-copy 2>/dev/null";
    break;

  case DisplayServer::X11:
    if (command_exists("xclip")) {
      cmd = "xclip -selection clipboard 2>/dev/null";
    } else if (command_exists("xsel")) {
      cmd = "xsel --clipboard --input 2>/dev/null";
    } else {
      return Error(ErrorCode::NotSupported,
                   "xclip or xsel not found. Install one of them.");
    }
    break;

  case DisplayServer::None:
    return Error(ErrorCode::NotSupported,
                 "No display server detected (headless session?)");
  }

  return execute_command_with_input(cmd, text);
}

ChangeCallback make_desktop_bridge(DesktopWriter writer) {
  const std::string general = PasteboardName::general().value();
  const std::string text_type = type_identifier(PasteboardType::String);

  return [writer = std::move(writer), general,
          text_type](const ChangeEvent &event) {
    if (event.kind != ChangeKind::StringWritten || event.name != general ||
        event.type_id != text_type) {
      return;
    }

    auto result = writer(event.value);
    if (result.is_error()) {
      logging::get()->warn("Desktop clipboard not updated: {}",
                           result.error().to_string());
    } else {
      logging::get()->debug("Mirrored {} bytes to the desktop clipboard",
                            event.value.size());
    }
  };
}

} // namespace platform
} // namespace pasteboard
