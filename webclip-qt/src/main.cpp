/**
 * @file main.cpp
 * @brief WebClip Qt clipboard tool entry point
 *
 * Usage:
 *   webclip-qt types [--gesture]
 *   webclip-qt read [--gesture] [--unsanitize TYPE]...
 *   webclip-qt write TYPE=TEXT... [--gesture] [--unsanitize TYPE]...
 *
 * --gesture marks the call as made inside a user gesture. Without it,
 * unsanitized types are refused and pickled types are not listed.
 */

#include "commands.h"
#include "qt_clipboard.h"
#include <QCommandLineParser>
#include <QGuiApplication>
#include <QTextStream>
#include <memory>
#include <webclip/webclip.h>

namespace {

std::vector<std::string> to_std(const QStringList &list) {
  std::vector<std::string> out;
  for (const QString &s : list) {
    out.push_back(s.toStdString());
  }
  return out;
}

int report(const webclip::Error &err) {
  QTextStream(stderr) << QString::fromStdString(err.to_string()) << '\n';
  return 1;
}

} // namespace

int main(int argc, char *argv[]) {
  QGuiApplication app(argc, argv);

  // Application metadata
  app.setApplicationName("webclip-qt");
  app.setApplicationVersion(webclip::VERSION_STRING);

  QCommandLineParser parser;
  parser.setApplicationDescription("Read and write web clipboard formats");
  parser.addHelpOption();
  parser.addVersionOption();
  parser.addPositionalArgument("command", "types, read or write");
  parser.addPositionalArgument("entries", "TYPE=TEXT pairs for write",
                               "[entries...]");

  QCommandLineOption unsanitize("unsanitize", "Request a type unsanitized.",
                                "type");
  QCommandLineOption gesture("gesture",
                             "Act inside a user gesture (unsanitized types).");
  QCommandLineOption config_path("config", "Settings file.", "path");
  parser.addOption(unsanitize);
  parser.addOption(gesture);
  parser.addOption(config_path);
  parser.process(app);

  const QStringList args = parser.positionalArguments();
  if (args.isEmpty()) {
    parser.showHelp(1);
  }

  webclip::ConfigManager settings;
  auto loaded = settings.init(parser.value(config_path).toStdString());
  if (loaded.is_error()) {
    return report(loaded.error());
  }

  webclip::PicklingClipboard clipboard;
  auto ready = clipboard.init(settings.get(),
                              std::make_shared<webclip::qt::QtClipboard>());
  if (ready.is_error()) {
    return report(ready.error());
  }

  webclip::qt::CommandOptions options;
  options.unsanitize = to_std(parser.values(unsanitize));
  options.gesture = parser.isSet(gesture);

  QTextStream out(stdout);
  const QString command = args.first();

  if (command == "types") {
    auto listed = webclip::qt::run_types(clipboard, options, out);
    return listed.is_error() ? report(listed.error()) : 0;
  }

  if (command == "read") {
    auto read = webclip::qt::run_read(clipboard, options, out);
    return read.is_error() ? report(read.error()) : 0;
  }

  if (command == "write") {
    auto written = webclip::qt::run_write(clipboard, args.mid(1), options);
    if (written.is_error()) {
      return report(written.error());
    }
    // The clipboard stays ours only while the process runs
    QObject::connect(QGuiApplication::clipboard(), &QClipboard::dataChanged,
                     &app, &QCoreApplication::quit);
    return app.exec();
  }

  parser.showHelp(1);
  return 1;
}
