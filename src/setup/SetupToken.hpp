#ifndef __NOMAD_SETUP_TOKEN__
#define __NOMAD_SETUP_TOKEN__

#include "Headers.hpp"

namespace nomad {
/**
 * @brief Returns a fresh random (v4) UUID, canonical lower-case form.
 *
 * The token is single use: it is never stored and a new one is drawn for
 * every payload.
 */
inline string newToken() { return sole::uuid4().str(); }
}  // namespace nomad

#endif  // __NOMAD_SETUP_TOKEN__
