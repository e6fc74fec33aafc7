#include "CommandLine.hpp"

#include "LogHandler.hpp"
#include "SetupErrors.hpp"

namespace nomad {
void addCommonOptions(cxxopts::Options* options) {
  string tmpDir = GetTempDirectory();
  options->add_options()            //
      ("h,help", "Print help")      //
      ("version", "Print version")  //
      ("cfgfile", "Location of the config file",
       cxxopts::value<std::string>())  //
      ("v,verbose", "Enable verbose logging",
       cxxopts::value<int>()->default_value("0"), "LEVEL")  //
      ("l,logdir", "Base directory for log files.",
       cxxopts::value<std::string>()->default_value(tmpDir))  //
      ("logtostdout", "Write log to stdout")                  //
      ("silent", "Disable logging")                           //
      ;
}

SetupConfig loadConfig(const cxxopts::ParseResult& result) {
  SetupConfig config;
  try {
    if (result.count("cfgfile")) {
      string cfgfilename = result["cfgfile"].as<string>();
      if (!config.loadIniFile(cfgfilename)) {
        CLOG(INFO, "stdout") << "Invalid config file: " << cfgfilename
                             << endl;
        exit(1);
      }
    } else {
      string defaultPath = SetupConfig::defaultConfigPath();
      if (fs::exists(defaultPath) && !config.loadIniFile(defaultPath)) {
        LOG(WARNING) << "Ignoring unreadable config file " << defaultPath;
      }
    }
  } catch (const InvalidArgument& e) {
    CLOG(INFO, "stdout") << "Invalid config file: " << e.what() << endl;
    exit(1);
  }
  config.loadEnvironment();

  // Command line wins over the config file
  if (result.count("verbose")) {
    config.verbose = result["verbose"].as<int>();
  }
  if (result.count("silent")) {
    config.silent = true;
  }
  config.logToStdout = result.count("logtostdout") > 0;
  config.logDirectory = result["logdir"].as<string>();
  return config;
}

void configureLogging(el::Configurations* defaultConf,
                      const SetupConfig& config, const string& logPrefix) {
  LogSettings settings;
  settings.directory = config.logDirectory;
  settings.prefix = logPrefix;
  settings.verbose = config.verbose;
  settings.silent = config.silent;
  settings.toStdout = config.logToStdout;
  settings.maxLogSize = config.maxLogSize;
  string logPath = LogHandler::applySettings(defaultConf, settings);
  if (!logPath.empty()) {
    VLOG(1) << "Logging to " << logPath;
  }
}

void handleInfoOptions(const cxxopts::ParseResult& result,
                       const cxxopts::Options& options, const string& name) {
  if (result.count("help")) {
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(0);
  }
  if (result.count("version")) {
    CLOG(INFO, "stdout") << name << " version " << NOMAD_VERSION << endl;
    exit(0);
  }
}

void handleParseException(const std::exception& e,
                          const cxxopts::Options& options) {
  CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(1);
}
}  // namespace nomad
