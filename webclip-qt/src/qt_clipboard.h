/**
 * @file qt_clipboard.h
 * @brief Native clipboard backed by QClipboard
 */

#ifndef WEBCLIP_QT_CLIPBOARD_H
#define WEBCLIP_QT_CLIPBOARD_H

#include <QClipboard>
#include <QString>
#include <webclip/format_translator.h>
#include <webclip/native_clipboard.h>

namespace webclip {
namespace qt {

/**
 * @brief NativeClipboard over the Qt application clipboard
 *
 * Requires a QGuiApplication. Calls from other threads are marshalled to
 * the application thread and block until done.
 *
 * Native format names are mapped to QMimeData formats so they reach the
 * OS clipboard verbatim:
 * - Windows: standard formats go through Qt's own MIME conversions; every
 *   other name travels as `application/x-qt-windows-mime;value="<name>"`.
 * - macOS: plain text and HTML go through Qt's own conversions; every
 *   other UTI travels as `application/x-webclip-uti;value="<uti>"`, which a
 *   converter registered by this class writes under the bare UTI. On read
 *   the converter claims `com.web.*` and `public.*` pasteboard types.
 *   Needs Qt 6.5 or newer; older Qt returns NotSupported.
 * - Elsewhere the native name is the MIME format.
 */
class QtClipboard : public NativeClipboard {
public:
  explicit QtClipboard(QClipboard::Mode mode = QClipboard::Clipboard);

  Result<void> write(const ClipboardSnapshot &entries) override;
  Result<ClipboardSnapshot> read() override;

  /// QMimeData format used for a native name under a naming scheme
  static QString to_mime_format(const std::string &native_name,
                                NamingScheme scheme);

  /// Native name for a QMimeData format under a naming scheme
  static std::string from_mime_format(const QString &format,
                                      NamingScheme scheme);

  /// Naming scheme of the platform Qt is running on
  static NamingScheme host_scheme();

private:
  QClipboard::Mode mode_;
};

} // namespace qt
} // namespace webclip

#endif // WEBCLIP_QT_CLIPBOARD_H
