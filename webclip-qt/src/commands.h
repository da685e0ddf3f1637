/**
 * @file commands.h
 * @brief Commands of the webclip-qt tool
 *
 * Every command takes the activation flag from the command line, so
 * unsanitized types need --gesture for all of them.
 */

#ifndef WEBCLIP_QT_COMMANDS_H
#define WEBCLIP_QT_COMMANDS_H

#include <QStringList>
#include <QTextStream>
#include <string>
#include <vector>
#include <webclip/clipboard.h>

namespace webclip {
namespace qt {

/**
 * @brief Options shared by all commands
 */
struct CommandOptions {
  std::vector<std::string> unsanitize;
  bool gesture = false;
};

/// Print the available types, one per line
Result<void> run_types(PicklingClipboard &clipboard,
                       const CommandOptions &options, QTextStream &out);

/// Print "type: payload" for every type of every item read
Result<void> run_read(PicklingClipboard &clipboard,
                      const CommandOptions &options, QTextStream &out);

/**
 * @brief Build one write item from TYPE=TEXT arguments
 * @return The item, or InvalidArgument for an argument without a type
 */
Result<ClipboardItem> parse_write_entries(const QStringList &entries,
                                          const CommandOptions &options);

/// Write the item built from TYPE=TEXT arguments
Result<void> run_write(PicklingClipboard &clipboard,
                       const QStringList &entries,
                       const CommandOptions &options);

} // namespace qt
} // namespace webclip

#endif // WEBCLIP_QT_COMMANDS_H
