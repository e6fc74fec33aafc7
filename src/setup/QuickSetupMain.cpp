#include "CommandLine.hpp"
#include "LogHandler.hpp"
#include "SetupFlow.hpp"

using namespace nomad;

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  el::Loggers::reconfigureLogger("default", defaultConf);
  LogHandler::setupStdoutLogger();

  nomad::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, nomad::InterruptSignalHandler);

  cxxopts::Options options(
      "nomad-quick-setup",
      "Prepare this host for the Nomad app and show a setup QR code");
  SetupConfig config;
  try {
    addCommonOptions(&options);
    options.add_options()  //
        ("host", "Address to advertise instead of the detected LAN IP",
         cxxopts::value<std::string>())  //
        ("user", "Login name to advertise", cxxopts::value<std::string>())  //
        ("p,port", "ssh port to advertise", cxxopts::value<int>())          //
        ("skip-system-setup",
         "Do not install packages or touch the ssh service")  //
        ("no-open", "Do not open the QR page in a browser")    //
        ("pubkey-b64",
         "Base64-encoded public key line (overrides NOMAD_PUBKEY_B64)",
         cxxopts::value<std::string>())  //
        ;

    auto result = options.parse(argc, argv);
    handleInfoOptions(result, options, "nomad-quick-setup");

    config = loadConfig(result);
    if (result.count("host")) {
      config.host = result["host"].as<string>();
    }
    if (result.count("user")) {
      config.user = result["user"].as<string>();
    }
    if (result.count("port")) {
      config.port = result["port"].as<int>();
    }
    if (result.count("skip-system-setup")) {
      config.skipSystemSetup = true;
    }
    if (result.count("no-open")) {
      config.openBrowser = false;
    }
    if (result.count("pubkey-b64")) {
      config.pubkeyB64 = result["pubkey-b64"].as<string>();
    }
  } catch (const cxxopts::OptionException& oe) {
    handleParseException(oe, options);
  }

  configureLogging(&defaultConf, config, "nomad-quick-setup");
  LOG(INFO) << "nomad-quick-setup " << NOMAD_VERSION << " starting";

  auto subprocessUtils = make_shared<SubprocessUtils>();
  SetupFlow flow(
      config, make_shared<HostSystemSetup>(subprocessUtils),
      make_shared<LanAddressDetector>(
          LanAddressDetector::createDefault(subprocessUtils)),
      make_shared<QrPresenter>(subprocessUtils, config.htmlPath,
                               config.openBrowser));
  int rc = flow.runQuickSetup();

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return rc;
}
