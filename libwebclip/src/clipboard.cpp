/**
 * @file clipboard.cpp
 * @brief Pickling-aware clipboard implementation
 */

#include "webclip/clipboard.h"
#include "webclip/gesture_gate.h"
#include "webclip/logging.h"
#include "webclip/read_resolver.h"
#include "webclip/unsanitize_list.h"
#include "webclip/write_resolver.h"
#include <mutex>

namespace webclip {

namespace {

logging::Logger get_logger() {
  return logging::get_or_create("webclip.clipboard");
}

/**
 * @brief Everything one call needs, fixed when the call starts
 */
struct CallState {
  PicklingConfig config;
  SanitizedFormatRegistry registry;
  std::shared_ptr<NativeClipboard> native;
};

using StatePtr = std::shared_ptr<const CallState>;

Result<StatePtr> make_state(const PicklingConfig &config,
                            std::shared_ptr<NativeClipboard> native) {
  WEBCLIP_TRY(config.validate());

  auto registry = config.make_registry();
  if (registry.is_error()) {
    return registry.error();
  }

  auto state = std::make_shared<CallState>();
  state->config = config;
  state->registry = std::move(registry).value();
  state->native = std::move(native);
  return StatePtr(std::move(state));
}

Error cancelled() {
  return Error(ErrorCode::Cancelled, "Clipboard operation cancelled");
}

Error native_failure(Error err, const char *operation) {
  SPDLOG_LOGGER_ERROR(get_logger(), "Native clipboard {} failed: {}",
                      operation, err.to_string());
  return err;
}

Result<void> check_pickling_enabled(const PicklingConfig &config,
                                    bool requests_pickling) {
  if (requests_pickling && !config.enable_pickling) {
    return Error(ErrorCode::NotSupported, "Unsanitized formats are disabled");
  }
  return Result<void>::ok();
}

Result<void> run_write(const CallState &state,
                       const std::vector<ClipboardItem> &items,
                       bool has_transient_activation,
                       const CancellationToken &token) {
  bool requests_pickling = false;
  for (const auto &item : items) {
    requests_pickling = requests_pickling || !item.unsanitize.empty();
  }

  WEBCLIP_TRY(check_gesture_gate(has_transient_activation, requests_pickling));
  WEBCLIP_TRY(check_pickling_enabled(state.config, requests_pickling));

  std::vector<UnsanitizeList> lists;
  lists.reserve(items.size());
  for (const auto &item : items) {
    auto list = validate_unsanitize_list(item.unsanitize,
                                         state.config.unsanitize_limits());
    if (list.is_error()) {
      return list.error();
    }
    lists.push_back(std::move(list).value());
  }

  WriteResolver resolver(state.config.target_platform, state.registry,
                         state.config.write_limits());
  auto entries = resolver.resolve(items, lists);
  if (entries.is_error()) {
    return entries.error();
  }

  if (token.is_cancelled()) {
    return cancelled();
  }

  auto written = state.native->write(entries.value());
  if (written.is_error()) {
    return native_failure(written.error(), "write");
  }

  SPDLOG_LOGGER_DEBUG(get_logger(), "Wrote {} native entries from {} item(s)",
                      entries.value().size(), items.size());
  return Result<void>::ok();
}

Result<std::vector<ClipboardReadItem>>
run_read(const CallState &state, const std::vector<std::string> &unsanitize,
         bool has_transient_activation, const CancellationToken &token) {
  bool requests_pickling = !unsanitize.empty();

  WEBCLIP_TRY(check_gesture_gate(has_transient_activation, requests_pickling));
  WEBCLIP_TRY(check_pickling_enabled(state.config, requests_pickling));

  auto list =
      validate_unsanitize_list(unsanitize, state.config.unsanitize_limits());
  if (list.is_error()) {
    return list.error();
  }

  if (token.is_cancelled()) {
    return cancelled();
  }

  auto snapshot = state.native->read();
  if (snapshot.is_error()) {
    return native_failure(snapshot.error(), "read");
  }

  if (token.is_cancelled()) {
    return cancelled();
  }

  // Unrequested pickled-only types surface only inside a gesture window and
  // only while pickling is enabled
  PickledOnlyPolicy policy =
      (state.config.enable_pickling && has_transient_activation)
          ? state.config.pickled_only_policy
          : PickledOnlyPolicy::Hide;
  ReadResolver resolver(state.config.target_platform, state.registry, policy);
  ResolvedReadResult resolved = resolver.resolve(snapshot.value(), list.value());

  std::vector<ClipboardReadItem> items;
  if (resolved.empty()) {
    return items;
  }

  std::vector<std::pair<ContentType, Bytes>> data;
  data.reserve(resolved.size());
  for (auto &entry : resolved.entries) {
    data.emplace_back(std::move(entry.type), std::move(entry.data));
  }
  items.emplace_back(std::move(data));
  return items;
}

} // namespace

// ============================================================================
// PicklingClipboard Implementation
// ============================================================================

class PicklingClipboard::Impl {
public:
  mutable std::mutex mutex;
  StatePtr state;

  Result<StatePtr> current() const {
    std::lock_guard<std::mutex> lock(mutex);
    if (!state) {
      return Error(ErrorCode::NotInitialized, "Clipboard not initialized");
    }
    return state;
  }
};

PicklingClipboard::PicklingClipboard() : impl_(std::make_unique<Impl>()) {}
PicklingClipboard::~PicklingClipboard() { shutdown(); }

Result<void> PicklingClipboard::init(const PicklingConfig &config,
                                     std::shared_ptr<NativeClipboard> native) {
  WEBCLIP_REQUIRE(native != nullptr, ErrorCode::InvalidArgument,
                  "Native clipboard is required");

  std::lock_guard<std::mutex> lock(impl_->mutex);

  if (impl_->state) {
    return Error(ErrorCode::AlreadyInitialized, "Clipboard already initialized");
  }

  auto state = make_state(config, std::move(native));
  if (state.is_error()) {
    return state.error();
  }

  logging::set_default_level(*logging::parse_level(config.log_level));
  impl_->state = std::move(state).value();

  SPDLOG_LOGGER_INFO(get_logger(), "Clipboard ready for {} (pickling {})",
                     target_platform_name(config.target_platform),
                     config.enable_pickling ? "enabled" : "disabled");
  return Result<void>::ok();
}

void PicklingClipboard::shutdown() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->state.reset();
}

bool PicklingClipboard::is_initialized() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->state != nullptr;
}

Result<void> PicklingClipboard::write(const std::vector<ClipboardItem> &items,
                                      bool has_transient_activation,
                                      CancellationToken token) {
  auto state = impl_->current();
  if (state.is_error()) {
    return state.error();
  }
  return run_write(*state.value(), items, has_transient_activation, token);
}

std::future<Result<void>>
PicklingClipboard::write_async(std::vector<ClipboardItem> items,
                               bool has_transient_activation,
                               CancellationToken token) {
  auto state = impl_->current();
  if (state.is_error()) {
    std::promise<Result<void>> failed;
    failed.set_value(state.error());
    return failed.get_future();
  }

  return std::async(std::launch::async,
                    [state = state.value(), items = std::move(items),
                     has_transient_activation, token]() {
                      return run_write(*state, items, has_transient_activation,
                                       token);
                    });
}

Result<std::vector<ClipboardReadItem>>
PicklingClipboard::read(const std::vector<std::string> &unsanitize,
                        bool has_transient_activation,
                        CancellationToken token) {
  auto state = impl_->current();
  if (state.is_error()) {
    return state.error();
  }
  return run_read(*state.value(), unsanitize, has_transient_activation, token);
}

std::future<Result<std::vector<ClipboardReadItem>>>
PicklingClipboard::read_async(std::vector<std::string> unsanitize,
                              bool has_transient_activation,
                              CancellationToken token) {
  auto state = impl_->current();
  if (state.is_error()) {
    std::promise<Result<std::vector<ClipboardReadItem>>> failed;
    failed.set_value(state.error());
    return failed.get_future();
  }

  return std::async(std::launch::async,
                    [state = state.value(), unsanitize = std::move(unsanitize),
                     has_transient_activation, token]() {
                      return run_read(*state, unsanitize,
                                      has_transient_activation, token);
                    });
}

Result<std::vector<std::string>>
PicklingClipboard::available_types(bool has_transient_activation) {
  auto state = impl_->current();
  if (state.is_error()) {
    return state.error();
  }
  const CallState &call = *state.value();

  auto snapshot = call.native->read();
  if (snapshot.is_error()) {
    return native_failure(snapshot.error(), "read");
  }

  ReadResolver resolver(call.config.target_platform, call.registry,
                        call.config.pickled_only_policy);
  bool include_pickled =
      has_transient_activation && call.config.enable_pickling;

  std::vector<std::string> types;
  for (const auto &type :
       resolver.available_types(snapshot.value(), include_pickled)) {
    types.push_back(type.to_string());
  }
  return types;
}

PicklingConfig PicklingClipboard::get_config() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  if (!impl_->state) {
    PicklingConfig defaults;
    defaults.load_defaults();
    return defaults;
  }
  return impl_->state->config;
}

Result<void> PicklingClipboard::set_config(const PicklingConfig &config) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  if (!impl_->state) {
    return Error(ErrorCode::NotInitialized, "Clipboard not initialized");
  }

  auto state = make_state(config, impl_->state->native);
  if (state.is_error()) {
    return state.error();
  }

  logging::set_default_level(*logging::parse_level(config.log_level));
  impl_->state = std::move(state).value();
  return Result<void>::ok();
}

} // namespace webclip
