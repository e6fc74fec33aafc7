#ifndef __NOMAD_PUBLIC_KEY_DECODER__
#define __NOMAD_PUBLIC_KEY_DECODER__

#include "Headers.hpp"

namespace nomad {
/**
 * @brief Decodes a base64-encoded public key line.
 *
 * Whitespace anywhere in the blob is ignored.  Carriage returns are
 * dropped and trailing newlines stripped from the decoded text.  Returns nullopt when
 * the input is not strict base64, does not decode to UTF-8, or does not
 * yield exactly one non-empty line.  Never throws.
 */
optional<string> decodeKey(const string& base64Blob);

/**
 * @brief True if `bytes` is well-formed UTF-8 (no overlongs, no surrogates,
 * nothing above U+10FFFF).
 */
bool isValidUtf8(const string& bytes);
}  // namespace nomad

#endif  // __NOMAD_PUBLIC_KEY_DECODER__
