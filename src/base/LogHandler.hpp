#ifndef __NOMAD_LOG_HANDLER__
#define __NOMAD_LOG_HANDLER__

#include "Headers.hpp"

namespace nomad {
/**
 * @brief Where and how much a tool logs.
 */
struct LogSettings {
  string directory = GetTempDirectory();
  // Log files are named <prefix>-<time>_<pid>.log
  string prefix = "nomad";
  int verbose = 0;
  // Disables the default logger entirely
  bool silent = false;
  // Mirror the file log on stdout
  bool toStdout = false;
  string maxLogSize = "20971520";
  // Older logs with the same prefix beyond this count are deleted
  int keepLogs = 10;
};

/**
 * @brief Configures easylogging++ for the setup tools.
 *
 * Every tool run is short, so each one gets its own log file and old files
 * are cleaned up on the next run.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Applies verbosity, file output and rollover to `defaultConf` and
   * reconfigures the default logger with it.
   *
   * @return The log file path, or an empty string when silent.
   */
  static string applySettings(el::Configurations *defaultConf,
                              const LogSettings &settings);

  /**
   * @brief Creates a fresh log file and points `defaultConf` at it.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const LogSettings &settings);

  /**
   * @brief Deletes all but the newest `keep` log files for `prefix` in
   * `directory`.  Returns how many were removed.
   */
  static int removeStaleLogs(const string &directory, const string &prefix,
                             int keep);

  /**
   * @brief Performs log rotation by removing the supplied filename.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the easylogging stdout logger so it just writes
   * messages.
   */
  static void setupStdoutLogger();

 private:
  /**
   * @brief Ensures the directory exists and creates a new log file.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace nomad
#endif  // __NOMAD_LOG_HANDLER__
