/**
 * @file commands.cpp
 * @brief webclip-qt command implementations
 */

#include "commands.h"

namespace webclip {
namespace qt {

Result<void> run_types(PicklingClipboard &clipboard,
                       const CommandOptions &options, QTextStream &out) {
  auto types = clipboard.available_types(options.gesture);
  if (types.is_error()) {
    return types.error();
  }
  for (const auto &type : types.value()) {
    out << QString::fromStdString(type) << '\n';
  }
  return Result<void>::ok();
}

Result<void> run_read(PicklingClipboard &clipboard,
                      const CommandOptions &options, QTextStream &out) {
  auto items = clipboard.read(options.unsanitize, options.gesture);
  if (items.is_error()) {
    return items.error();
  }
  for (const auto &item : items.value()) {
    for (const auto &type : item.types()) {
      auto data = item.get_type(type);
      if (data.is_error()) {
        return data.error();
      }
      out << QString::fromStdString(type) << ": "
          << QString::fromStdString(to_text(data.value())) << '\n';
    }
  }
  return Result<void>::ok();
}

Result<ClipboardItem> parse_write_entries(const QStringList &entries,
                                          const CommandOptions &options) {
  ClipboardItem item;
  for (const QString &arg : entries) {
    int eq = arg.indexOf('=');
    if (eq <= 0) {
      return Error(ErrorCode::InvalidArgument, "Expected TYPE=TEXT",
                   arg.toStdString());
    }
    item.set(arg.left(eq).toStdString(),
             to_bytes(arg.mid(eq + 1).toStdString()));
  }
  item.unsanitize = options.unsanitize;
  return item;
}

Result<void> run_write(PicklingClipboard &clipboard,
                       const QStringList &entries,
                       const CommandOptions &options) {
  auto item = parse_write_entries(entries, options);
  if (item.is_error()) {
    return item.error();
  }
  return clipboard.write({item.value()}, options.gesture);
}

} // namespace qt
} // namespace webclip
