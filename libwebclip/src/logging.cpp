/**
 * @file logging.cpp
 * @brief Shared sink setup for WebClip loggers
 */

#include "webclip/logging.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace webclip::logging {

namespace {

constexpr const char *LOG_PATTERN = "[%d/%m %T.%e][T-%t][%n]%^[%l]%$ %v";

std::atomic<spdlog::level::level_enum> default_level{spdlog::level::warn};

std::optional<spdlog::level::level_enum>
get_log_level_from_env_var(const std::string &var_name) {
  const char *val = std::getenv(var_name.c_str());
  if (!val) {
    return std::nullopt;
  }
  return parse_level(val);
}

struct Sinks {
  std::mutex lock;

  std::shared_ptr<spdlog::sinks::dist_sink_mt> dist_sink;
  std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> stderr_sink;
  std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink;

  Sinks() {
    dist_sink = std::make_shared<spdlog::sinks::dist_sink_mt>();
    stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    dist_sink->add_sink(stderr_sink);
    dist_sink->set_pattern(LOG_PATTERN);

    if (auto filter = get_log_level_from_env_var("LOG_STDERR_FILTER")) {
      stderr_sink->set_level(*filter);
    }
  }

  Result<void> init_log_file(const std::string &path) {
    std::lock_guard<std::mutex> l(lock);
    std::shared_ptr<spdlog::sinks::basic_file_sink_mt> sink;
    try {
      sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, true);
      sink->set_pattern(LOG_PATTERN);
    } catch (const spdlog::spdlog_ex &e) {
      return Error(ErrorCode::InvalidArgument, "Cannot open log file", e.what());
    }

    if (file_sink) {
      dist_sink->remove_sink(file_sink);
    }
    file_sink = std::move(sink);
    dist_sink->add_sink(file_sink);
    return Result<void>::ok();
  }
};

Sinks &global_sinks() {
  static Sinks sinks;
  return sinks;
}

} // namespace

namespace detail {

std::shared_mutex &register_mutex() {
  static std::shared_mutex m;
  return m;
}

void register_logger(Logger logger) {
  spdlog::register_logger(logger);
  logger->flush_on(spdlog::level::err);
  init_log_level(logger);
  init_sinks(logger);
}

} // namespace detail

std::optional<spdlog::level::level_enum> parse_level(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "error") {
    return spdlog::level::err;
  }
  if (lower == "warning") {
    return spdlog::level::warn;
  }

  // from_str maps anything unknown to "off"
  auto level = spdlog::level::from_str(lower);
  if (level == spdlog::level::off && lower != "off") {
    return std::nullopt;
  }
  return level;
}

void init_log_level(Logger logger) {
  if (auto level = get_log_level_from_env_var("LOG_" + logger->name())) {
    logger->set_level(*level);
    return;
  }

  // Use "LOG" var to set global log level
  if (auto level = get_log_level_from_env_var("LOG")) {
    logger->set_level(*level);
    return;
  }

  logger->set_level(default_level.load());
}

void init_sinks(Logger logger) {
  logger->sinks().clear();
  logger->sinks().push_back(global_sinks().dist_sink);
}

void set_default_level(spdlog::level::level_enum level) {
  default_level.store(level);
  spdlog::apply_all([](Logger logger) { init_log_level(logger); });
}

spdlog::level::level_enum get_default_level() { return default_level.load(); }

Result<void> set_log_file(const std::string &path) {
  return global_sinks().init_log_file(path);
}

} // namespace webclip::logging
