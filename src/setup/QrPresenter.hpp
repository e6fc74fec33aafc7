#ifndef __NOMAD_QR_PRESENTER__
#define __NOMAD_QR_PRESENTER__

#include "Headers.hpp"
#include "SubprocessUtils.hpp"

namespace nomad {
struct QrPresentation {
  bool renderedInTerminal = false;
  optional<string> htmlPath;
  bool openedInBrowser = false;
};

/**
 * @brief Shows the payload as a QR code.
 *
 * With `qrencode` installed the code is drawn in the terminal.  Otherwise an
 * HTML page embedding an image from a public QR service is written and,
 * unless disabled, opened with `open`/`xdg-open`.
 */
class QrPresenter {
 public:
  QrPresenter(shared_ptr<SubprocessUtils> subprocessUtils,
              const string& htmlPath, bool openBrowser);

  /**
   * @brief Never throws for display problems; a page that cannot be opened
   * is only a warning.
   *
   * @throws runtime_error if the HTML page cannot be written, including when
   * its path is a symbolic link.
   */
  QrPresentation present(const string& payload, const string& title);

  /** @brief QR image URL for the payload on the public QR service. */
  static string remoteImageUrl(const string& payload);

  static string renderHtmlPage(const string& payload, const string& title);

  static string htmlEscape(const string& text);

  static const string QR_SERVICE_URL;

 private:
  void writePage(const string& html);
  bool openFile(const string& path);

  shared_ptr<SubprocessUtils> subprocessUtils;
  string htmlPath;
  bool openBrowser;
};
}  // namespace nomad

#endif  // __NOMAD_QR_PRESENTER__
