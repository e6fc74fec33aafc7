#include "LanAddressDetector.hpp"

namespace nomad {
bool isUsableLanAddress(const string& address) {
  in_addr parsed;
  if (inet_pton(AF_INET, address.c_str(), &parsed) != 1) {
    return false;
  }
  uint32_t hostOrder = ntohl(parsed.s_addr);
  if (hostOrder == 0) {
    return false;
  }
  if ((hostOrder >> 24) == 127) {
    return false;
  }
  if ((hostOrder >> 16) == ((169u << 8) | 254u)) {
    return false;
  }
  return true;
}

optional<string> parseDefaultRouteInterface(const string& routeTable) {
  // Iface Destination Gateway Flags RefCnt Use Metric Mask ...
  bool header = true;
  for (const auto& line : split(routeTable, '\n')) {
    if (header) {
      header = false;
      continue;
    }
    auto fields = splitWhitespace(line);
    if (fields.size() < 8) {
      continue;
    }
    if (fields[1] == "00000000" && fields[7] == "00000000") {
      return fields[0];
    }
  }
  return nullopt;
}

vector<string> parseRouteGetSource(const string& output) {
  vector<string> addresses;
  auto fields = splitWhitespace(output);
  for (size_t i = 0; i + 1 < fields.size(); i++) {
    if (fields[i] == "src") {
      addresses.push_back(fields[i + 1]);
    }
  }
  return addresses;
}

vector<string> parseHostnameAddresses(const string& output) {
  return splitWhitespace(output);
}

vector<string> parseIfconfigAddresses(const string& output) {
  vector<string> addresses;
  for (const auto& line : split(output, '\n')) {
    auto fields = splitWhitespace(line);
    for (size_t i = 0; i + 1 < fields.size(); i++) {
      if (fields[i] != "inet") {
        continue;
      }
      string address = fields[i + 1];
      // net-tools style: "inet addr:192.168.1.2"
      if (address.compare(0, 5, "addr:") == 0) {
        address = address.substr(5);
      }
      addresses.push_back(address);
    }
  }
  return addresses;
}

DefaultRouteInterfaceStrategy::DefaultRouteInterfaceStrategy(
    const string& _routeTablePath)
    : routeTablePath(_routeTablePath) {}

vector<string> DefaultRouteInterfaceStrategy::interfaceNames() {
#if __APPLE__
  return {"en0", "en1"};
#else
  ifstream in(routeTablePath);
  if (!in.is_open()) {
    VLOG(1) << "Cannot read route table " << routeTablePath;
    return {};
  }
  stringstream content;
  content << in.rdbuf();
  auto iface = parseDefaultRouteInterface(content.str());
  if (!iface) {
    return {};
  }
  return {*iface};
#endif
}

vector<string> DefaultRouteInterfaceStrategy::candidates() {
  vector<string> names = interfaceNames();
  if (names.empty()) {
    return {};
  }

  ifaddrs* interfaces = NULL;
  if (::getifaddrs(&interfaces) == -1) {
    LOG(WARNING) << "getifaddrs failed: " << strerror(errno);
    return {};
  }
  std::unique_ptr<ifaddrs, decltype(&::freeifaddrs)> interfacesGuard(
      interfaces, &::freeifaddrs);

  vector<string> addresses;
  for (const auto& wanted : names) {
    for (ifaddrs* it = interfaces; it != NULL; it = it->ifa_next) {
      if (it->ifa_addr == NULL || it->ifa_addr->sa_family != AF_INET ||
          wanted != it->ifa_name) {
        continue;
      }
      char buffer[INET_ADDRSTRLEN];
      auto* inAddr = reinterpret_cast<sockaddr_in*>(it->ifa_addr);
      if (inet_ntop(AF_INET, &inAddr->sin_addr, buffer, sizeof(buffer))) {
        addresses.push_back(buffer);
      }
    }
  }
  return addresses;
}

CommandOutputStrategy::CommandOutputStrategy(
    const string& _command, const vector<string>& _args,
    std::function<vector<string>(const string&)> _parser,
    shared_ptr<SubprocessUtils> _subprocessUtils)
    : command(_command),
      args(_args),
      parser(_parser),
      subprocessUtils(_subprocessUtils) {}

string CommandOutputStrategy::name() const {
  string fullCommand = command;
  for (const auto& arg : args) {
    fullCommand += " " + arg;
  }
  return fullCommand;
}

vector<string> CommandOutputStrategy::candidates() {
  if (!subprocessUtils->commandExists(command)) {
    VLOG(1) << command << " not found";
    return {};
  }
  auto result = subprocessUtils->subprocessToString(command, args);
  if (!result.succeeded()) {
    VLOG(1) << name() << " exited with " << result.exitCode;
    return {};
  }
  return parser(result.output);
}

LanAddressDetector::LanAddressDetector(
    const vector<shared_ptr<AddressStrategy>>& _strategies)
    : strategies(_strategies) {}

LanAddressDetector LanAddressDetector::createDefault(
    shared_ptr<SubprocessUtils> subprocessUtils) {
  vector<shared_ptr<AddressStrategy>> strategies = {
      make_shared<DefaultRouteInterfaceStrategy>(),
      make_shared<CommandOutputStrategy>(
          "ip", vector<string>{"-4", "route", "get", "1.1.1.1"},
          parseRouteGetSource, subprocessUtils),
      make_shared<CommandOutputStrategy>("hostname", vector<string>{"-I"},
                                         parseHostnameAddresses,
                                         subprocessUtils),
      make_shared<CommandOutputStrategy>("ifconfig", vector<string>{},
                                         parseIfconfigAddresses,
                                         subprocessUtils),
  };
  return LanAddressDetector(strategies);
}

optional<string> LanAddressDetector::detectPrimaryIPv4() {
  for (auto& strategy : strategies) {
    vector<string> candidates;
    try {
      candidates = strategy->candidates();
    } catch (const std::exception& e) {
      LOG(WARNING) << "Address strategy " << strategy->name()
                   << " failed: " << e.what();
      continue;
    }
    for (const auto& candidate : candidates) {
      if (isUsableLanAddress(candidate)) {
        LOG(INFO) << "Detected LAN address " << candidate << " via "
                  << strategy->name();
        return candidate;
      }
      VLOG(1) << "Skipping " << candidate << " from " << strategy->name();
    }
  }
  LOG(WARNING) << "No usable LAN address found";
  return nullopt;
}
}  // namespace nomad
