/**
 * @file qt_clipboard.cpp
 * @brief QClipboard adapter implementation
 */

#include "qt_clipboard.h"
#include <QGuiApplication>
#include <QMetaObject>
#include <QMimeData>
#include <QStringList>
#include <QThread>
#include <QVariant>
#include <QtGlobal>
#if defined(Q_OS_MACOS) && QT_VERSION >= QT_VERSION_CHECK(6, 5, 0)
#include <QUtiMimeConverter>
#endif
#include <utility>
#include <webclip/logging.h>
#include <webclip/types.h>

namespace webclip {
namespace qt {

namespace {

logging::Logger get_logger() { return logging::get_or_create("webclip.qt"); }

const QString WINDOWS_MIME_PREFIX =
    QStringLiteral("application/x-qt-windows-mime;value=\"");
const QString MAC_UTI_MIME_PREFIX =
    QStringLiteral("application/x-webclip-uti;value=\"");

// Native formats Qt converts from MIME types on its own
struct FormatAlias {
  const char *native;
  const char *mime;
};

constexpr FormatAlias WINDOWS_ALIASES[] = {
    {"CF_UNICODETEXT", "text/plain"},
    {"HTML Format", "text/html"},
    {"PNG", "image/png"},
    {"UniformResourceLocatorW", "text/uri-list"},
};

constexpr FormatAlias MAC_ALIASES[] = {
    {"public.utf8-plain-text", "text/plain"},
    {"public.html", "text/html"},
};

template <size_t N>
const char *alias_mime(const FormatAlias (&aliases)[N],
                       const std::string &native_name) {
  for (const auto &alias : aliases) {
    if (native_name == alias.native) {
      return alias.mime;
    }
  }
  return nullptr;
}

template <size_t N>
const char *alias_native(const FormatAlias (&aliases)[N],
                         const QString &format) {
  for (const auto &alias : aliases) {
    if (format == QLatin1String(alias.mime)) {
      return alias.native;
    }
  }
  return nullptr;
}

QString wrap(const QString &prefix, const std::string &native_name) {
  return prefix + QString::fromStdString(native_name) + QLatin1Char('"');
}

// Returns an empty string when the format does not carry the prefix
QString unwrap(const QString &prefix, const QString &format) {
  if (format.size() <= prefix.size() || !format.startsWith(prefix) ||
      !format.endsWith(QLatin1Char('"'))) {
    return QString();
  }
  return format.mid(prefix.size(), format.size() - prefix.size() - 1);
}

#if defined(Q_OS_MACOS) && QT_VERSION >= QT_VERSION_CHECK(6, 5, 0)
/**
 * @brief Puts wrapped UTIs on the pasteboard under their bare name
 *
 * Without it, Qt stores unknown MIME formats under its own
 * com.trolltech.anymime.* types.
 */
class VerbatimUtiConverter : public QUtiMimeConverter {
public:
  bool canConvert(const QString &mime, const QString &uti) const override {
    return !uti.isEmpty() && utiForMime(mime) == uti;
  }

  QString mimeForUti(const QString &uti) const override {
    const std::string name = uti.toStdString();
    bool pickled = name.rfind(REVERSE_DNS_PREFIX, 0) == 0;
    bool standard = name.rfind("public.", 0) == 0 &&
                    alias_mime(MAC_ALIASES, name) == nullptr;
    if (!pickled && !standard) {
      return QString();
    }
    return wrap(MAC_UTI_MIME_PREFIX, name);
  }

  QString utiForMime(const QString &mime) const override {
    return unwrap(MAC_UTI_MIME_PREFIX, mime);
  }

  QVariant convertToMime(const QString &, const QList<QByteArray> &data,
                         const QString &) const override {
    if (data.isEmpty()) {
      return QVariant();
    }
    return QVariant(data.first());
  }

  QList<QByteArray> convertFromMime(const QString &, const QVariant &data,
                                    const QString &) const override {
    return {data.toByteArray()};
  }
};

// Constructing a converter registers it with Qt
void register_uti_converter() { static VerbatimUtiConverter converter; }
#endif

Result<void> require_application() {
  if (QGuiApplication::instance() == nullptr) {
    return Error(ErrorCode::NativeClipboardFailure,
                 "QGuiApplication is not running");
  }
#if defined(Q_OS_MACOS) && QT_VERSION < QT_VERSION_CHECK(6, 5, 0)
  return Error(ErrorCode::NotSupported,
               "Verbatim pasteboard types need Qt 6.5 or newer");
#else
  return Result<void>::ok();
#endif
}

// Run on the application thread; QClipboard is not thread-safe
template <typename F> void run_on_app_thread(F &&fn) {
  QCoreApplication *app = QGuiApplication::instance();
  if (QThread::currentThread() == app->thread()) {
    fn();
  } else {
    QMetaObject::invokeMethod(app, std::forward<F>(fn),
                              Qt::BlockingQueuedConnection);
  }
}

} // namespace

QtClipboard::QtClipboard(QClipboard::Mode mode) : mode_(mode) {
#if defined(Q_OS_MACOS) && QT_VERSION >= QT_VERSION_CHECK(6, 5, 0)
  register_uti_converter();
#endif
}

NamingScheme QtClipboard::host_scheme() {
  return naming_scheme_for(host_target_platform());
}

QString QtClipboard::to_mime_format(const std::string &native_name,
                                    NamingScheme scheme) {
  switch (scheme) {
  case NamingScheme::CapitalizedWords:
    if (const char *mime = alias_mime(WINDOWS_ALIASES, native_name)) {
      return QString::fromLatin1(mime);
    }
    return wrap(WINDOWS_MIME_PREFIX, native_name);
  case NamingScheme::ReverseDns:
    if (const char *mime = alias_mime(MAC_ALIASES, native_name)) {
      return QString::fromLatin1(mime);
    }
    return wrap(MAC_UTI_MIME_PREFIX, native_name);
  case NamingScheme::MimeNamespaced:
  default:
    return QString::fromStdString(native_name);
  }
}

std::string QtClipboard::from_mime_format(const QString &format,
                                          NamingScheme scheme) {
  const QString &prefix = scheme == NamingScheme::ReverseDns
                              ? MAC_UTI_MIME_PREFIX
                              : WINDOWS_MIME_PREFIX;
  QString wrapped = unwrap(prefix, format);
  if (!wrapped.isEmpty()) {
    return wrapped.toStdString();
  }

  const char *native = nullptr;
  if (scheme == NamingScheme::CapitalizedWords) {
    native = alias_native(WINDOWS_ALIASES, format);
  } else if (scheme == NamingScheme::ReverseDns) {
    native = alias_native(MAC_ALIASES, format);
  }
  return native ? std::string(native) : format.toStdString();
}

Result<void> QtClipboard::write(const ClipboardSnapshot &entries) {
  WEBCLIP_TRY(require_application());

  const NamingScheme scheme = host_scheme();

  // QClipboard takes ownership of the mime data
  auto *mime = new QMimeData();
  for (const auto &entry : entries) {
    QByteArray data(reinterpret_cast<const char *>(entry.data.data()),
                    static_cast<qsizetype>(entry.data.size()));
    mime->setData(to_mime_format(entry.format, scheme), data);
  }

  QClipboard::Mode mode = mode_;
  run_on_app_thread(
      [mime, mode]() { QGuiApplication::clipboard()->setMimeData(mime, mode); });

  SPDLOG_LOGGER_DEBUG(get_logger(), "Installed {} formats on the Qt clipboard",
                      entries.size());
  return Result<void>::ok();
}

Result<ClipboardSnapshot> QtClipboard::read() {
  WEBCLIP_TRY(require_application());

  ClipboardSnapshot snapshot;
  bool available = false;
  QClipboard::Mode mode = mode_;

  const NamingScheme scheme = host_scheme();

  run_on_app_thread([&snapshot, &available, mode, scheme]() {
    const QMimeData *mime = QGuiApplication::clipboard()->mimeData(mode);
    if (mime == nullptr) {
      return;
    }
    available = true;

    const QStringList formats = mime->formats();
    for (const QString &format : formats) {
      QByteArray data = mime->data(format);
      NativeEntry entry;
      entry.format = from_mime_format(format, scheme);
      entry.data.assign(data.begin(), data.end());
      snapshot.push_back(std::move(entry));
    }
  });

  if (!available) {
    return Error(ErrorCode::NativeClipboardFailure,
                 "Clipboard mode not supported on this platform");
  }
  return snapshot;
}

} // namespace qt
} // namespace webclip
