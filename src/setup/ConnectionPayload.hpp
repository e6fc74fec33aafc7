#ifndef __NOMAD_CONNECTION_PAYLOAD__
#define __NOMAD_CONNECTION_PAYLOAD__

#include "Headers.hpp"

namespace nomad {
/**
 * @brief A pending connection request, as shown to the Nomad app.
 *
 * Never persisted.  The token correlates the QR code with the app's
 * connection attempt and is regenerated on every run.
 */
struct ConnectionRequest {
  string host;
  string user;
  int port = DEFAULT_SSH_PORT;
  string token;
  bool mosh = true;
};

/**
 * Builds
 * `nomad://connect?host=..&port=..&user=..&mosh=true&setup_token=..`.
 *
 * host and user are trimmed first.  Every value is form-encoded
 * independently, so no raw `&`, `=` or space reaches the query string.
 * `mosh` is always the literal `true`.
 *
 * @throws InvalidArgument if host, user or token is empty, or the port is
 * outside 1..65535.
 */
string buildPayload(const string& host, const string& user, int port,
                    const string& token);

inline string buildPayload(const ConnectionRequest& request) {
  return buildPayload(request.host, request.user, request.port,
                      request.token);
}

/**
 * Parses a payload produced by buildPayload back into its fields.
 *
 * @throws InvalidArgument if the scheme, a field or an escape is malformed.
 */
ConnectionRequest parsePayload(const string& uri);
}  // namespace nomad

#endif  // __NOMAD_CONNECTION_PAYLOAD__
