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

  cxxopts::Options options("nomad-qr",
                           "Show a Nomad connection QR code for this host");
  SetupConfig config;
  try {
    options.custom_help("--auto | --host <ip> [--user <name>] [--port <port>]");
    addCommonOptions(&options);
    options.add_options()                                                   //
        ("host", "Address to advertise", cxxopts::value<std::string>())    //
        ("user", "Login name to advertise", cxxopts::value<std::string>())  //
        ("p,port", "ssh port to advertise", cxxopts::value<int>())          //
        ("auto", "Detect the LAN IP when --host is not given")             //
        ("no-open", "Do not open the QR page in a browser")                //
        ;

    auto result = options.parse(argc, argv);
    handleInfoOptions(result, options, "nomad-qr");

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
    if (result.count("auto")) {
      config.autoDetect = true;
    }
    if (result.count("no-open")) {
      config.openBrowser = false;
    }
  } catch (const cxxopts::OptionException& oe) {
    handleParseException(oe, options);
  }

  configureLogging(&defaultConf, config, "nomad-qr");

  auto subprocessUtils = make_shared<SubprocessUtils>();
  SetupFlow flow(
      config, make_shared<HostSystemSetup>(subprocessUtils),
      make_shared<LanAddressDetector>(
          LanAddressDetector::createDefault(subprocessUtils)),
      make_shared<QrPresenter>(subprocessUtils, config.htmlPath,
                               config.openBrowser));
  int rc = flow.runGenerateQr();
  if (rc != 0) {
    CLOG(INFO, "stdout") << options.help({}) << endl;
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return rc;
}
