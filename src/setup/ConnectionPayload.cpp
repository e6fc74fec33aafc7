#include "ConnectionPayload.hpp"

#include "SetupErrors.hpp"
#include "UrlEncoding.hpp"

namespace nomad {
namespace {
const string PAYLOAD_PREFIX = PAYLOAD_SCHEME + "://" + PAYLOAD_AUTHORITY + "?";

const int MAX_PORT = 65535;

int parsePort(const string& portString) {
  if (portString.empty() || portString.size() > 5 ||
      portString.find_first_not_of("0123456789") != string::npos) {
    throw InvalidArgument("Invalid port in payload: " + portString);
  }
  int port = stoi(portString);
  if (port < 1 || port > MAX_PORT) {
    throw InvalidArgument("Port out of range in payload: " + portString);
  }
  return port;
}
}  // namespace

string buildPayload(const string& host, const string& user, int port,
                    const string& token) {
  string trimmedHost = trim(host);
  string trimmedUser = trim(user);
  if (trimmedHost.empty()) {
    throw InvalidArgument("Host must not be empty");
  }
  if (trimmedUser.empty()) {
    throw InvalidArgument("User must not be empty");
  }
  if (port < 1 || port > MAX_PORT) {
    throw InvalidArgument("Port must be between 1 and 65535, got " +
                          to_string(port));
  }
  if (token.empty()) {
    throw InvalidArgument("Setup token must not be empty");
  }

  // Field order is part of the contract with the app
  string uri = PAYLOAD_PREFIX;
  uri += "host=" + formEncode(trimmedHost);
  uri += "&port=" + formEncode(to_string(port));
  uri += "&user=" + formEncode(trimmedUser);
  uri += "&mosh=true";
  uri += "&setup_token=" + formEncode(token);
  VLOG(1) << "Built payload for " << trimmedUser << "@" << trimmedHost << ":"
          << port;
  return uri;
}

ConnectionRequest parsePayload(const string& uri) {
  if (uri.compare(0, PAYLOAD_PREFIX.size(), PAYLOAD_PREFIX) != 0) {
    throw InvalidArgument("Not a " + PAYLOAD_PREFIX + " payload: " + uri);
  }

  unordered_map<string, string> fields;
  for (const auto& pair : split(uri.substr(PAYLOAD_PREFIX.size()), '&')) {
    auto equalsIndex = pair.find('=');
    if (equalsIndex == string::npos) {
      throw InvalidArgument("Malformed query field: " + pair);
    }
    string key = formDecode(pair.substr(0, equalsIndex));
    if (fields.count(key)) {
      throw InvalidArgument("Duplicate query field: " + key);
    }
    fields[key] = formDecode(pair.substr(equalsIndex + 1));
  }

  for (const string& required : {"host", "port", "user", "setup_token"}) {
    if (!fields.count(required)) {
      throw InvalidArgument("Payload is missing " + required);
    }
  }

  ConnectionRequest request;
  request.host = fields["host"];
  request.user = fields["user"];
  request.port = parsePort(fields["port"]);
  request.token = fields["setup_token"];
  request.mosh = !fields.count("mosh") || fields["mosh"] == "true";
  return request;
}
}  // namespace nomad
