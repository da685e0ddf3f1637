/**
 * @file config.cpp
 * @brief Configuration management implementation
 */

// Standard library includes FIRST, before any project headers
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>

#ifndef _WIN32
#include <pwd.h>
#include <unistd.h>
#endif

// Project includes LAST
#include "webclip/config.h"
#include "webclip/logging.h"

namespace fs = ::std::filesystem;

namespace webclip {

namespace {

logging::Logger get_logger() { return logging::get_or_create("webclip.config"); }

std::string trim(const std::string &str) {
  size_t start = str.find_first_not_of(" \t\r\n");
  size_t end = str.find_last_not_of(" \t\r\n");
  return (start == std::string::npos) ? "" : str.substr(start, end - start + 1);
}

std::string parse_string(const std::string &value) {
  std::string v = trim(value);
  if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
    return v.substr(1, v.size() - 2);
  }
  return v;
}

std::optional<bool> parse_bool(const std::string &value) {
  std::string v = trim(value);
  if (v == "true" || v == "1") {
    return true;
  }
  if (v == "false" || v == "0") {
    return false;
  }
  return std::nullopt;
}

std::optional<size_t> parse_size(const std::string &value) {
  std::string v = trim(value);
  if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  try {
    return static_cast<size_t>(std::stoull(v));
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

std::vector<std::string> parse_list(const std::string &value) {
  std::vector<std::string> items;
  std::istringstream iss(parse_string(value));
  std::string item;
  while (std::getline(iss, item, ',')) {
    item = trim(item);
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

Error parse_error(size_t line_no, const std::string &key,
                  const std::string &value) {
  return Error(ErrorCode::ConfigParseError, "Invalid value for '" + key + "'",
               "line " + std::to_string(line_no) + ": " + value);
}

} // namespace

// ============================================================================
// PicklingConfig Methods
// ============================================================================

void PicklingConfig::load_defaults() {
  target_platform = host_target_platform();

  enable_pickling = true;
  pickled_only_policy = PickledOnlyPolicy::Hide;
  sanitized_types = {"text/plain", "text/html", "image/png"};

  max_pickled_formats = DEFAULT_MAX_PICKLED_FORMATS;
  max_format_length = DEFAULT_MAX_FORMAT_LENGTH;
  max_payload_size = 0; // Unlimited

  log_level = "warn";
}

Result<void> PicklingConfig::validate() const {
  if (max_pickled_formats == 0) {
    return Error(ErrorCode::InvalidArgument,
                 "max_pickled_formats must be at least 1");
  }

  // Shortest valid content type is "a/b"
  if (max_format_length < 3) {
    return Error(ErrorCode::InvalidArgument,
                 "max_format_length must be at least 3");
  }

  if (!logging::parse_level(log_level)) {
    return Error(ErrorCode::InvalidArgument, "Unknown log level", log_level);
  }

  auto registry = make_registry();
  if (registry.is_error()) {
    return registry.error();
  }

  return Result<void>::ok();
}

Result<SanitizedFormatRegistry> PicklingConfig::make_registry() const {
  return SanitizedFormatRegistry::from_type_list(sanitized_types);
}

UnsanitizeLimits PicklingConfig::unsanitize_limits() const {
  UnsanitizeLimits limits;
  limits.max_format_length = max_format_length;
  limits.max_formats = max_pickled_formats;
  return limits;
}

WriteLimits PicklingConfig::write_limits() const {
  WriteLimits limits;
  limits.max_format_length = max_format_length;
  limits.max_pickled_formats = max_pickled_formats;
  limits.max_payload_size = max_payload_size;
  return limits;
}

fs::path PicklingConfig::get_default_config_dir() {
#ifdef _WIN32
  const char *appdata = std::getenv("APPDATA");
  if (appdata) {
    return fs::path(appdata) / "WebClip";
  }
  return fs::path("C:\\ProgramData\\WebClip");
#elif defined(__APPLE__)
  const char *home = std::getenv("HOME");
  if (home) {
    return fs::path(home) / "Library" / "Application Support" / "WebClip";
  }
  return fs::path("/tmp/WebClip");
#else
  // Linux: Use XDG_CONFIG_HOME or ~/.config
  const char *xdg_config = std::getenv("XDG_CONFIG_HOME");
  if (xdg_config && xdg_config[0] != '\0') {
    return fs::path(xdg_config) / "webclip";
  }

  const char *home = std::getenv("HOME");
  if (!home) {
    struct passwd *pw = getpwuid(getuid());
    if (pw) {
      home = pw->pw_dir;
    }
  }
  if (home) {
    return fs::path(home) / ".config" / "webclip";
  }

  return fs::path("/tmp/webclip");
#endif
}

// ============================================================================
// Text Form
// ============================================================================

Result<PicklingConfig> parse_config(const std::string &text) {
  PicklingConfig config;
  config.load_defaults();

  std::istringstream input(text);
  std::string line;
  size_t line_no = 0;

  while (std::getline(input, line)) {
    ++line_no;
    line = trim(line);

    // Skip comments, section headers and empty lines
    if (line.empty() || line[0] == '#' || line[0] == '[') {
      continue;
    }

    size_t eq = line.find('=');
    if (eq == std::string::npos) {
      return Error(ErrorCode::ConfigParseError, "Expected 'key = value'",
                   "line " + std::to_string(line_no) + ": " + line);
    }

    std::string key = trim(line.substr(0, eq));
    std::string value = trim(line.substr(eq + 1));

    if (key == "target_platform") {
      auto platform = parse_target_platform(parse_string(value));
      if (!platform) {
        return parse_error(line_no, key, value);
      }
      config.target_platform = *platform;
    } else if (key == "enable_pickling") {
      auto enabled = parse_bool(value);
      if (!enabled) {
        return parse_error(line_no, key, value);
      }
      config.enable_pickling = *enabled;
    } else if (key == "pickled_only_policy") {
      auto policy = parse_pickled_only_policy(parse_string(value));
      if (!policy) {
        return parse_error(line_no, key, value);
      }
      config.pickled_only_policy = *policy;
    } else if (key == "sanitized_types") {
      config.sanitized_types = parse_list(value);
    } else if (key == "max_pickled_formats" || key == "max_format_length" ||
               key == "max_payload_size") {
      auto number = parse_size(value);
      if (!number) {
        return parse_error(line_no, key, value);
      }
      if (key == "max_pickled_formats") {
        config.max_pickled_formats = *number;
      } else if (key == "max_format_length") {
        config.max_format_length = *number;
      } else {
        config.max_payload_size = *number;
      }
    } else if (key == "log_level") {
      config.log_level = parse_string(value);
    } else {
      SPDLOG_LOGGER_WARN(get_logger(), "Ignoring unknown setting '{}' (line {})",
                         key, line_no);
    }
  }

  auto validation = config.validate();
  if (validation.is_error()) {
    Error err = validation.error();
    err.code = ErrorCode::ConfigParseError;
    return err;
  }

  return config;
}

std::string format_config(const PicklingConfig &config) {
  std::ostringstream out;

  out << "# WebClip Configuration\n\n";
  out << "[platform]\n";
  out << "target_platform = \"" << target_platform_name(config.target_platform)
      << "\"\n\n";

  out << "[pickling]\n";
  out << "enable_pickling = " << (config.enable_pickling ? "true" : "false")
      << "\n";
  out << "pickled_only_policy = \""
      << pickled_only_policy_name(config.pickled_only_policy) << "\"\n";
  out << "sanitized_types = \"";
  for (size_t i = 0; i < config.sanitized_types.size(); ++i) {
    out << (i ? ", " : "") << config.sanitized_types[i];
  }
  out << "\"\n\n";

  out << "[limits]\n";
  out << "max_pickled_formats = " << config.max_pickled_formats << "\n";
  out << "max_format_length = " << config.max_format_length << "\n";
  out << "max_payload_size = " << config.max_payload_size << "\n\n";

  out << "[logging]\n";
  out << "log_level = \"" << config.log_level << "\"\n";

  return out.str();
}

// ============================================================================
// ConfigManager Implementation
// ============================================================================

class ConfigManager::Impl {
public:
  PicklingConfig config;
  fs::path config_path;
  mutable std::mutex mutex;
  bool initialized = false;

  Result<void> load_locked() {
    std::ifstream file(config_path);
    if (!file.is_open()) {
      return Error(ErrorCode::ConfigReadError, "Cannot open config file",
                   config_path.string());
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
      return Error(ErrorCode::ConfigReadError, "Error reading config file",
                   config_path.string());
    }

    auto parsed = parse_config(content.str());
    if (parsed.is_error()) {
      parsed.error().location = config_path.string();
      return parsed.error();
    }

    config = std::move(parsed).value();
    return Result<void>::ok();
  }

  Result<void> save_locked() {
    auto dir = config_path.parent_path();
    if (!dir.empty()) {
      std::error_code ec;
      fs::create_directories(dir, ec);
      if (ec) {
        return Error(ErrorCode::ConfigWriteError,
                     "Cannot create config directory", ec.message());
      }
    }

    std::ofstream file(config_path, std::ios::trunc);
    if (!file.is_open()) {
      return Error(ErrorCode::ConfigWriteError, "Cannot open config file",
                   config_path.string());
    }

    file << format_config(config);
    file.flush();
    if (!file) {
      return Error(ErrorCode::ConfigWriteError, "Error writing config file",
                   config_path.string());
    }
    return Result<void>::ok();
  }
};

ConfigManager::ConfigManager() : impl_(std::make_unique<Impl>()) {
  impl_->config.load_defaults();
  impl_->config_path = PicklingConfig::get_default_config_dir() / "webclip.conf";
}

ConfigManager::~ConfigManager() = default;

Result<void> ConfigManager::init(const fs::path &config_path) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  if (impl_->initialized) {
    return Error(ErrorCode::AlreadyInitialized, "Config already initialized");
  }

  if (!config_path.empty()) {
    impl_->config_path = config_path;
  }

  std::error_code ec;
  if (fs::exists(impl_->config_path, ec)) {
    WEBCLIP_TRY(impl_->load_locked());
  } else {
    SPDLOG_LOGGER_DEBUG(get_logger(), "No config at {}, using defaults",
                        impl_->config_path.string());
  }

  impl_->initialized = true;
  return Result<void>::ok();
}

PicklingConfig ConfigManager::get() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->config;
}

fs::path ConfigManager::path() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->config_path;
}

Result<void> ConfigManager::set(const PicklingConfig &config) {
  auto validation = config.validate();
  if (validation.is_error()) {
    return validation;
  }

  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config = config;
  return Result<void>::ok();
}

Result<void> ConfigManager::load() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->load_locked();
}

Result<void> ConfigManager::save() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->save_locked();
}

void ConfigManager::reset_defaults() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config.load_defaults();
}

Result<void> ConfigManager::set_target_platform(TargetPlatform platform) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config.target_platform = platform;
  return impl_->save_locked();
}

Result<void> ConfigManager::set_enable_pickling(bool enabled) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config.enable_pickling = enabled;
  return impl_->save_locked();
}

Result<void> ConfigManager::set_pickled_only_policy(PickledOnlyPolicy policy) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config.pickled_only_policy = policy;
  return impl_->save_locked();
}

} // namespace webclip
