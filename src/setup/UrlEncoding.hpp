#ifndef __NOMAD_URL_ENCODING__
#define __NOMAD_URL_ENCODING__

#include "Headers.hpp"

namespace nomad {
/**
 * Encodes a query component the way HTML forms do
 * (application/x-www-form-urlencoded): `A-Z a-z 0-9 - . _ ~` pass through,
 * space becomes `+`, every other byte becomes `%XX` (upper-case hex).
 */
string formEncode(const string& value);

/**
 * Inverse of formEncode.  `+` decodes to space.  Throws InvalidArgument on a
 * truncated or non-hex escape.
 */
string formDecode(const string& encoded);

/**
 * Percent-encodes every byte except the unreserved set and the characters
 * in `safe`.  Space becomes `%20`.
 */
string percentEncode(const string& value, const string& safe = "/");
}  // namespace nomad

#endif  // __NOMAD_URL_ENCODING__
