#include "PublicKeyDecoder.hpp"

namespace nomad {
namespace {
bool isBase64Char(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '+' || c == '/';
}

// Base64::Decode does not reject foreign characters, so check the alphabet
// and padding first.
bool isStrictBase64(const string& s) {
  if (s.empty() || s.size() % 4 != 0) {
    return false;
  }
  size_t padding = 0;
  while (padding < 2 && s[s.size() - 1 - padding] == '=') {
    padding++;
  }
  for (size_t i = 0; i < s.size() - padding; i++) {
    if (!isBase64Char(s[i])) {
      return false;
    }
  }
  return true;
}
}  // namespace

bool isValidUtf8(const string& bytes) {
  size_t i = 0;
  while (i < bytes.size()) {
    unsigned char c = bytes[i];
    int continuation;
    uint32_t codepoint;
    if (c < 0x80) {
      i++;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      continuation = 1;
      codepoint = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      continuation = 2;
      codepoint = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      continuation = 3;
      codepoint = c & 0x07;
    } else {
      return false;
    }
    if (i + continuation >= bytes.size()) {
      return false;
    }
    for (int k = 1; k <= continuation; k++) {
      unsigned char next = bytes[i + k];
      if ((next & 0xC0) != 0x80) {
        return false;
      }
      codepoint = (codepoint << 6) | (next & 0x3F);
    }
    static const uint32_t MIN_FOR_LENGTH[] = {0, 0x80, 0x800, 0x10000};
    if (codepoint < MIN_FOR_LENGTH[continuation] || codepoint > 0x10FFFF ||
        (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
      return false;
    }
    i += continuation + 1;
  }
  return true;
}

optional<string> decodeKey(const string& base64Blob) {
  // base64(1) wraps its output at 76 columns
  string input;
  input.reserve(base64Blob.size());
  for (char c : base64Blob) {
    if (!isspace(static_cast<unsigned char>(c))) {
      input.push_back(c);
    }
  }
  if (!isStrictBase64(input)) {
    LOG(WARNING) << "Public key is not valid base64";
    return nullopt;
  }

  string decoded;
  if (!Base64::Decode(input, &decoded)) {
    LOG(WARNING) << "Public key failed to decode";
    return nullopt;
  }
  if (!isValidUtf8(decoded)) {
    LOG(WARNING) << "Decoded public key is not UTF-8";
    return nullopt;
  }

  decoded.erase(std::remove(decoded.begin(), decoded.end(), '\r'),
                decoded.end());
  while (!decoded.empty() && decoded.back() == '\n') {
    decoded.pop_back();
  }
  if (decoded.empty()) {
    LOG(WARNING) << "Decoded public key is empty";
    return nullopt;
  }
  if (decoded.find('\n') != string::npos) {
    LOG(WARNING) << "Decoded public key spans more than one line";
    return nullopt;
  }
  return decoded;
}
}  // namespace nomad
