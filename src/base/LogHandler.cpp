#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace nomad {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // Verbosity comes from cxxopts, not from easylogging's own argv parsing
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  // doc says %thread_name, but %thread is the right one
  defaultConf.setGlobally(el::ConfigurationType::Format,
                          "[%level %datetime %thread %fbase:%line] %msg");
  defaultConf.setGlobally(el::ConfigurationType::Enabled, "true");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  // Until a log file is chosen, keep diagnostics off the user's terminal
  defaultConf.setGlobally(el::ConfigurationType::ToStandardOutput, "false");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  return defaultConf;
}

string LogHandler::applySettings(el::Configurations *defaultConf,
                                 const LogSettings &settings) {
  el::Loggers::setVerboseLevel(settings.verbose);
  string logPath;
  if (settings.silent) {
    defaultConf->setGlobally(el::ConfigurationType::Enabled, "false");
  } else {
    removeStaleLogs(settings.directory, settings.prefix,
                    std::max(settings.keepLogs - 1, 0));
    logPath = setupLogFiles(defaultConf, settings);
  }
  el::Loggers::reconfigureLogger("default", *defaultConf);
  el::Helpers::setThreadName(settings.prefix + "-main");
  el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);
  return logPath;
}

string LogHandler::setupLogFiles(el::Configurations *defaultConf,
                                 const LogSettings &settings) {
  time_t rawtime;
  char buffer[80];
  time(&rawtime);
  strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", localtime(&rawtime));
  string logFilename = settings.prefix + "-" + string(buffer) + "_" +
                       std::to_string(getpid()) + ".log";
  string fullFname = createLogFile(settings.directory, logFilename);

  // Enable strict log file size check
  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, fullFname);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize,
                           settings.maxLogSize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           settings.toStdout ? "true" : "false");
  return fullFname;
}

int LogHandler::removeStaleLogs(const string &directory, const string &prefix,
                                int keep) {
  if (keep < 0) {
    keep = 0;
  }
  std::error_code ec;
  fs::directory_iterator it(directory, ec);
  if (ec) {
    return 0;
  }

  // The timestamp in the name sorts chronologically
  vector<fs::path> logs;
  for (const auto &entry : it) {
    const string name = entry.path().filename().string();
    if (name.compare(0, prefix.size() + 1, prefix + "-") == 0 &&
        name.size() > 4 && name.compare(name.size() - 4, 4, ".log") == 0 &&
        entry.is_regular_file(ec)) {
      logs.push_back(entry.path());
    }
  }
  if (int(logs.size()) <= keep) {
    return 0;
  }
  std::sort(logs.begin(), logs.end());

  int removed = 0;
  for (size_t i = 0; i + keep < logs.size(); i++) {
    if (fs::remove(logs[i], ec)) {
      removed++;
    }
  }
  return removed;
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // SHOULD NOT LOG ANYTHING HERE BECAUSE LOG FILE IS CLOSED!
  remove(filename);
}

void LogHandler::setupStdoutLogger() {
  el::Logger *stdoutLogger = el::Loggers::getLogger("stdout");
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  // Values are always std::string
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(stdoutLogger, stdoutConf);
}

string LogHandler::createLogFile(const string &path, const string &filename) {
  string fullFname = path + "/" + filename;
  try {
    fs::create_directories(path);
  } catch (const fs::filesystem_error &fse) {
    CLOG(ERROR, "stdout") << "Cannot create logfile directory: " << fse.what()
                          << endl;
    exit(1);
  }
  int fd = ::open(fullFname.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  FATAL_FAIL(fd);
  ::close(fd);
  return fullFname;
}
}  // namespace nomad
