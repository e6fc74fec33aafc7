#ifndef __NOMAD_SUBPROCESS_UTILS__
#define __NOMAD_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace nomad {
/**
 * @brief Exit status and captured stdout of a finished subprocess.
 *
 * `exitCode` is -1 when the process could not be started or did not exit
 * normally.
 */
struct SubprocessResult {
  int exitCode;
  string output;

  bool succeeded() const { return exitCode == 0; }
};

/**
 * @brief Utility class for executing subprocesses without a shell.
 *
 * Everything that touches the host (package managers, service managers,
 * network commands, qrencode, browser openers) goes through this class so
 * tests can substitute a fake.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Runs a command with arguments while capturing its stdout. stderr
   * is discarded.
   */
  virtual SubprocessResult subprocessToString(const string& command,
                                              const vector<string>& args);

  /**
   * @brief Runs a command attached to the current terminal and returns its
   * exit code.
   */
  virtual int subprocessInteractive(const string& command,
                                    const vector<string>& args);

  /**
   * @brief True if `name` resolves to an executable on the PATH.
   */
  virtual bool commandExists(const string& name);
};
}  // namespace nomad

#endif  // __NOMAD_SUBPROCESS_UTILS__
