#ifndef __NOMAD_LAN_ADDRESS_DETECTOR__
#define __NOMAD_LAN_ADDRESS_DETECTOR__

#include "Headers.hpp"
#include "SubprocessUtils.hpp"

namespace nomad {
/**
 * @brief One way of finding candidate LAN addresses.
 *
 * candidates() reports failure as an empty list and must not throw.
 */
class AddressStrategy {
 public:
  virtual ~AddressStrategy() = default;

  virtual string name() const = 0;

  virtual vector<string> candidates() = 0;
};

/**
 * @brief Addresses of the interface that carries the default route.
 *
 * On Linux the interface comes from the kernel route table; on macOS en0 and
 * en1 are tried.  Addresses are enumerated with getifaddrs(3).
 */
class DefaultRouteInterfaceStrategy : public AddressStrategy {
 public:
  explicit DefaultRouteInterfaceStrategy(
      const string& routeTablePath = "/proc/net/route");

  string name() const override { return "default-route interface"; }

  vector<string> candidates() override;

 private:
  vector<string> interfaceNames();

  string routeTablePath;
};

/**
 * @brief Runs a network command and parses addresses out of its output.
 */
class CommandOutputStrategy : public AddressStrategy {
 public:
  CommandOutputStrategy(const string& command, const vector<string>& args,
                        std::function<vector<string>(const string&)> parser,
                        shared_ptr<SubprocessUtils> subprocessUtils);

  string name() const override;

  vector<string> candidates() override;

 private:
  string command;
  vector<string> args;
  std::function<vector<string>(const string&)> parser;
  shared_ptr<SubprocessUtils> subprocessUtils;
};

/**
 * @brief Walks the strategies in order and returns the first usable address.
 */
class LanAddressDetector {
 public:
  explicit LanAddressDetector(
      const vector<shared_ptr<AddressStrategy>>& strategies);

  /**
   * @brief Default-route interface, then `ip -4 route get`, then
   * `hostname -I`, then `ifconfig`.
   */
  static LanAddressDetector createDefault(
      shared_ptr<SubprocessUtils> subprocessUtils);

  /**
   * @brief Returns nullopt if no strategy produced a usable address; the
   * caller then has to ask for an explicit host.
   */
  optional<string> detectPrimaryIPv4();

 private:
  vector<shared_ptr<AddressStrategy>> strategies;
};

/**
 * @brief Dotted-quad IPv4 that is neither loopback (127/8), link-local
 * (169.254/16) nor 0.0.0.0.
 */
bool isUsableLanAddress(const string& address);

/** @brief Interface of the first default route in a /proc/net/route dump. */
optional<string> parseDefaultRouteInterface(const string& routeTable);

/** @brief The `src` address of `ip -4 route get` output. */
vector<string> parseRouteGetSource(const string& output);

/** @brief The whitespace-separated list printed by `hostname -I`. */
vector<string> parseHostnameAddresses(const string& output);

/** @brief `inet X` / `inet addr:X` entries from `ifconfig` output. */
vector<string> parseIfconfigAddresses(const string& output);
}  // namespace nomad

#endif  // __NOMAD_LAN_ADDRESS_DETECTOR__
