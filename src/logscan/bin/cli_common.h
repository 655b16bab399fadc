#ifndef LOGSCAN_BIN_CLI_COMMON_H
#define LOGSCAN_BIN_CLI_COMMON_H

#include <logscan/common/error.h>
#include <logscan/utils/cancellation.h>
#include <logscan/utils/logger.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <string>

namespace logscan::cli {

constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_PATTERN = 2;
constexpr int EXIT_REMOTE = 3;
constexpr int EXIT_CANCELLED = 130;

inline CancellationToken *g_active_token = nullptr;

inline void handle_sigint(int) {
  if (g_active_token) {
    g_active_token->cancel();
  }
}

// SIGINT cancels `token` so scans and follow loops stop at the next line
inline void install_sigint_handler(CancellationToken &token) {
  g_active_token = &token;
  std::signal(SIGINT, handle_sigint);
}

inline int exit_code_for(const Error &e) {
  switch (e.type()) {
    case Error::CANCELLED:
      return EXIT_CANCELLED;
    case Error::PATTERN_ERROR:
      return EXIT_PATTERN;
    case Error::INVALID_ARGUMENT:
      return EXIT_USAGE;
    default:
      return EXIT_REMOTE;
  }
}

/**
 * stderr-based logger so logs don't interfere with data output. Returns
 * false when `log_level` is not a known level name.
 */
inline bool init_logging(const std::string &name, const std::string &log_level) {
  logger::init_stderr_logger(name);
  if (logger::set_log_level(log_level) != 0) {
    spdlog::error("Unknown log level: {}", log_level);
    return false;
  }
  spdlog::debug("Log level set to: {}", log_level);
  return true;
}

}  // namespace logscan::cli

#endif  // LOGSCAN_BIN_CLI_COMMON_H
