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
      "nomad-migrate-key",
      "Replace legacy Nomad ECDSA keys in authorized_keys with a new key");
  SetupConfig config;
  try {
    addCommonOptions(&options);
    options.add_options()  //
        ("pubkey", "Full public key line (ssh-ed25519 ...)",
         cxxopts::value<std::string>())  //
        ("pubkey-b64", "Base64-encoded public key line",
         cxxopts::value<std::string>())  //
        ("comment-prefix", "Prefix used to identify legacy Nomad keys",
         cxxopts::value<std::string>())  //
        ("no-prune", "Keep legacy ecdsa-sha2-nistp256 lines")  //
        ("prune-only", "Only back up and prune, do not add a key")  //
        ("user", "Account whose authorized_keys is updated",
         cxxopts::value<std::string>())  //
        ;

    auto result = options.parse(argc, argv);
    handleInfoOptions(result, options, "nomad-migrate-key");

    config = loadConfig(result);
    // The environment key belongs to quick setup, migration takes it
    // explicitly
    config.pubkeyB64.clear();
    if (result.count("pubkey")) {
      config.pubkey = result["pubkey"].as<string>();
    }
    if (result.count("pubkey-b64")) {
      config.pubkeyB64 = result["pubkey-b64"].as<string>();
    }
    if (result.count("comment-prefix")) {
      config.prunePrefix = result["comment-prefix"].as<string>();
    }
    if (result.count("no-prune")) {
      config.prune = false;
    }
    if (result.count("prune-only")) {
      config.pruneOnly = true;
    }
    if (result.count("user")) {
      config.targetUser = result["user"].as<string>();
    }
  } catch (const cxxopts::OptionException& oe) {
    handleParseException(oe, options);
  }

  configureLogging(&defaultConf, config, "nomad-migrate-key");

  auto subprocessUtils = make_shared<SubprocessUtils>();
  SetupFlow flow(
      config, make_shared<HostSystemSetup>(subprocessUtils),
      make_shared<LanAddressDetector>(
          LanAddressDetector::createDefault(subprocessUtils)),
      make_shared<QrPresenter>(subprocessUtils, config.htmlPath,
                               config.openBrowser));
  int rc = flow.runMigration();
  if (rc != 0 && config.pubkey.empty() && config.pubkeyB64.empty()) {
    CLOG(INFO, "stdout") << options.help({}) << endl;
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return rc;
}
