#include "QrPresenter.hpp"

#include "UrlEncoding.hpp"

namespace nomad {
const string QrPresenter::QR_SERVICE_URL =
    "https://api.qrserver.com/v1/create-qr-code/?size=320x320&data=";

QrPresenter::QrPresenter(shared_ptr<SubprocessUtils> _subprocessUtils,
                         const string& _htmlPath, bool _openBrowser)
    : subprocessUtils(_subprocessUtils),
      htmlPath(_htmlPath),
      openBrowser(_openBrowser) {}

string QrPresenter::remoteImageUrl(const string& payload) {
  return QR_SERVICE_URL + percentEncode(payload, "/");
}

string QrPresenter::htmlEscape(const string& text) {
  string escaped;
  escaped.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':
        escaped += "&amp;";
        break;
      case '<':
        escaped += "&lt;";
        break;
      case '>':
        escaped += "&gt;";
        break;
      case '"':
        escaped += "&quot;";
        break;
      case '\'':
        escaped += "&#39;";
        break;
      default:
        escaped.push_back(c);
    }
  }
  return escaped;
}

string QrPresenter::renderHtmlPage(const string& payload,
                                   const string& title) {
  const string escapedTitle = htmlEscape(title);
  stringstream ss;
  ss << "<!doctype html>\n"
     << "<html lang=\"en\">\n"
     << "<meta charset=\"utf-8\" />\n"
     << "<title>" << escapedTitle << "</title>\n"
     << "<style>\n"
     << "body { font-family: -apple-system, BlinkMacSystemFont, \"SF Pro "
        "Text\", sans-serif; background: #0b0c0e; color: #e7e9ee; display: "
        "flex; align-items: center; justify-content: center; height: 100vh; "
        "}\n"
     << ".card { background: #14161b; padding: 24px; border-radius: 16px; "
        "text-align: center; box-shadow: 0 20px 60px rgba(0,0,0,0.4); }\n"
     << "code { display: block; margin-top: 12px; font-size: 12px; "
        "word-break: break-all; color: #a0a6b1; }\n"
     << "img { width: 260px; height: 260px; }\n"
     << "</style>\n"
     << "<div class=\"card\">\n"
     << "  <h2>" << escapedTitle << "</h2>\n"
     << "  <img src=\"" << htmlEscape(remoteImageUrl(payload))
     << "\" alt=\"Nomad QR\" />\n"
     << "  <code>" << htmlEscape(payload) << "</code>\n"
     << "</div>\n"
     << "</html>\n";
  return ss.str();
}

QrPresentation QrPresenter::present(const string& payload,
                                    const string& title) {
  QrPresentation presentation;
  if (subprocessUtils->commandExists("qrencode")) {
    int rc = subprocessUtils->subprocessInteractive(
        "qrencode", {"-t", "ANSIUTF8", payload});
    if (rc == 0) {
      presentation.renderedInTerminal = true;
      return presentation;
    }
    LOG(WARNING) << "qrencode exited with " << rc
                 << ", falling back to the HTML page";
  }

  writePage(renderHtmlPage(payload, title));
  presentation.htmlPath = htmlPath;
  LOG(INFO) << "Wrote QR page " << htmlPath;

  if (openBrowser) {
    STATUS << "Opening QR code in browser...";
    presentation.openedInBrowser = openFile(htmlPath);
    if (!presentation.openedInBrowser) {
      STATUS << "Could not open a browser. Open " << htmlPath
             << " manually.";
    }
  } else {
    STATUS << "QR page written to " << htmlPath;
  }
  return presentation;
}

void QrPresenter::writePage(const string& html) {
  // The default path is in the shared temp directory; never follow a link
  int fd = ::open(htmlPath.c_str(),
                  O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_NONBLOCK, 0644);
  if (fd < 0) {
    throw runtime_error("Cannot write QR page " + htmlPath + ": " +
                        strerror(errno));
  }
  struct stat pageStat;
  if (::fstat(fd, &pageStat) != 0 || !S_ISREG(pageStat.st_mode)) {
    ::close(fd);
    throw runtime_error("QR page " + htmlPath + " is not a regular file");
  }
  size_t written = 0;
  while (written < html.size()) {
    ssize_t rc = ::write(fd, html.data() + written, html.size() - written);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      int err = errno;
      ::close(fd);
      throw runtime_error("Cannot write QR page " + htmlPath + ": " +
                          strerror(err));
    }
    written += rc;
  }
  ::close(fd);
}

bool QrPresenter::openFile(const string& path) {
  for (const string& opener : {"open", "xdg-open"}) {
    if (subprocessUtils->commandExists(opener)) {
      int rc = subprocessUtils->subprocessToString(opener, {path}).exitCode;
      if (rc != 0) {
        LOG(WARNING) << opener << " exited with " << rc;
      }
      return rc == 0;
    }
  }
  LOG(WARNING) << "Neither open nor xdg-open is available";
  return false;
}
}  // namespace nomad
