/**
 * @file logging.h
 * @brief Named spdlog loggers for WebClip
 *
 * Every logger created here writes to one shared distribution sink
 * (stderr, plus an optional log file), so redirecting output affects all
 * modules at once.
 *
 * Level selection, first match wins:
 * - LOG_<name> environment variable (e.g. LOG_webclip.write=debug)
 * - LOG environment variable
 * - the level passed to set_default_level() (initially "warn")
 */

#ifndef WEBCLIP_LOGGING_H
#define WEBCLIP_LOGGING_H

#include "error.h"
#include "platform.h"
#include <memory>
#include <optional>
#include <shared_mutex>
#include <spdlog/spdlog.h>
#include <string>

namespace webclip::logging {

typedef std::shared_ptr<spdlog::logger> Logger;

// Sets the log level for this logger from LOG_<name>, LOG, or the default
WEBCLIP_API void init_log_level(Logger logger);

// Redirects this logger to the shared sink
WEBCLIP_API void init_sinks(Logger logger);

// Level applied to loggers without an environment override
WEBCLIP_API void set_default_level(spdlog::level::level_enum level);
WEBCLIP_API spdlog::level::level_enum get_default_level();

// Also write every logger's output to the given file (truncated on open)
WEBCLIP_API Result<void> set_log_file(const std::string &path);

// Parse "trace", "debug", "info", "warn", "err"/"error", "critical", "off"
WEBCLIP_API std::optional<spdlog::level::level_enum>
parse_level(const std::string &name);

namespace detail {

// !! Do not call directly since this registers the logger
// !! use get_or_create instead to prevent races
WEBCLIP_API void register_logger(Logger logger);

WEBCLIP_API std::shared_mutex &register_mutex();

} // namespace detail

template <typename T> Logger get_or_create(const std::string &name, T init) {
  auto &m = detail::register_mutex();
  std::shared_lock<std::shared_mutex> l(m);
  auto logger = spdlog::get(name);
  if (!logger) {
    // Swap to write lock
    l.unlock();
    std::unique_lock<std::shared_mutex> ul(m);

    // Another thread may have created it in between
    logger = spdlog::get(name);
    if (logger)
      return logger;

    logger = std::make_shared<spdlog::logger>(name);
    init(logger);
    detail::register_logger(logger);
  }
  return logger;
}

inline Logger get_or_create(const std::string &name) {
  return get_or_create(name, [](Logger) {});
}

} // namespace webclip::logging

#endif // WEBCLIP_LOGGING_H
