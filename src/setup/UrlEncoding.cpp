#include "UrlEncoding.hpp"

#include "SetupErrors.hpp"

namespace nomad {
namespace {
const char HEX_DIGITS[] = "0123456789ABCDEF";

bool isUnreserved(unsigned char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '-' || c == '.' || c == '_' ||
         c == '~';
}

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}

void appendEscape(string* out, unsigned char c) {
  out->push_back('%');
  out->push_back(HEX_DIGITS[c >> 4]);
  out->push_back(HEX_DIGITS[c & 0x0F]);
}
}  // namespace

string formEncode(const string& value) {
  string out;
  out.reserve(value.size() * 3);
  for (unsigned char c : value) {
    if (isUnreserved(c)) {
      out.push_back(c);
    } else if (c == ' ') {
      out.push_back('+');
    } else {
      appendEscape(&out, c);
    }
  }
  return out;
}

string formDecode(const string& encoded) {
  string out;
  out.reserve(encoded.size());
  for (size_t i = 0; i < encoded.size(); i++) {
    char c = encoded[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%') {
      if (i + 2 >= encoded.size()) {
        throw InvalidArgument("Truncated percent escape in: " + encoded);
      }
      int high = hexValue(encoded[i + 1]);
      int low = hexValue(encoded[i + 2]);
      if (high < 0 || low < 0) {
        throw InvalidArgument("Invalid percent escape in: " + encoded);
      }
      out.push_back(static_cast<char>((high << 4) | low));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

string percentEncode(const string& value, const string& safe) {
  string out;
  out.reserve(value.size() * 3);
  for (unsigned char c : value) {
    if (isUnreserved(c) || (c != '%' && safe.find(c) != string::npos)) {
      out.push_back(c);
    } else {
      appendEscape(&out, c);
    }
  }
  return out;
}
}  // namespace nomad
