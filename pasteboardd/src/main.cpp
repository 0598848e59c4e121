/**
 * @file main.cpp
 * @brief pasteboardd entry point
 *
 * Hosts the session's pasteboards on D-Bus until SIGINT or SIGTERM.
 */

#include <pasteboard/daemon.h>
#include <pasteboard/log.h>
#include <pasteboard/pasteboard.h>

#include <csignal>
#include <cstdio>
#include <cstring>
#include <string>

namespace {

pasteboard::PasteboardDaemon *g_daemon = nullptr;

void handle_signal(int) {
  if (g_daemon) {
    g_daemon->stop();
  }
}

void print_usage(const char *argv0) {
  std::printf("Usage: %s [options]\n"
              "\n"
              "Options:\n"
              "  --bus-name NAME     Well-known bus name to own\n"
              "  --desktop-bridge    Mirror general pasteboard text to the "
              "desktop clipboard\n"
              "  --log-level LEVEL   trace, debug, info, warn, error, "
              "critical or off\n"
              "  --help              Show this help\n",
              argv0);
}

/// Apply command line options over the environment config
bool parse_arguments(int argc, char *argv[],
                     pasteboard::PasteboardConfig &config, bool &show_help) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      show_help = true;
    } else if (arg == "--desktop-bridge") {
      config.desktop_bridge = true;
    } else if (arg == "--bus-name" || arg == "--log-level") {
      if (i + 1 >= argc) {
        std::fprintf(stderr, "%s requires a value\n", arg.c_str());
        return false;
      }
      (arg == "--bus-name" ? config.bus_name : config.log_level) = argv[++i];
    } else {
      std::fprintf(stderr, "Unknown option: %s\n", arg.c_str());
      return false;
    }
  }
  return true;
}

} // namespace

int main(int argc, char *argv[]) {
  auto config = pasteboard::PasteboardConfig::from_environment();

  bool show_help = false;
  if (!parse_arguments(argc, argv, config, show_help)) {
    print_usage(argv[0]);
    return 2;
  }
  if (show_help) {
    print_usage(argv[0]);
    return 0;
  }

  auto valid = config.validate();
  if (valid.is_error()) {
    std::fprintf(stderr, "Invalid configuration: %s\n",
                 valid.error().to_string().c_str());
    return 2;
  }

  auto level = pasteboard::logging::parse_level(config.log_level);
  if (level) {
    pasteboard::logging::set_level(*level);
  }

  auto log = pasteboard::logging::get();
  log->info("pasteboardd {} starting", pasteboard::VERSION_STRING);

  pasteboard::PasteboardDaemon daemon(config);

  auto started = daemon.start();
  if (started.is_error()) {
    log->error("Cannot start: {}", started.error().to_string());
    return 1;
  }

  g_daemon = &daemon;
  struct sigaction action;
  std::memset(&action, 0, sizeof(action));
  action.sa_handler = handle_signal;
  sigemptyset(&action.sa_mask);
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);

  auto result = daemon.run();
  g_daemon = nullptr;

  if (result.is_error()) {
    log->error("Stopped: {}", result.error().to_string());
    return 1;
  }

  log->info("pasteboardd exited cleanly");
  return 0;
}
