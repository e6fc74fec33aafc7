#ifndef __NOMAD_SETUP_CONFIG__
#define __NOMAD_SETUP_CONFIG__

#include "Headers.hpp"

namespace nomad {
/**
 * @brief Everything a setup run needs, gathered once at startup.
 *
 * Filled from defaults, then the INI file, then the environment, then the
 * command line, each layer overriding the previous one.  Nothing below the
 * drivers reads the environment directly.
 */
struct SetupConfig {
  // Connection payload
  string host;
  string user;
  int port = DEFAULT_SSH_PORT;
  bool autoDetect = false;

  // Key provisioning
  string pubkey;
  string pubkeyB64;
  string targetUser;
  string prunePrefix = "Nomad-";
  bool prune = true;
  bool pruneOnly = false;

  // Host preparation and display
  bool skipSystemSetup = false;
  bool openBrowser = true;
  string htmlPath = GetTempDirectory() + "nomad-qr.html";

  // Logging
  int verbose = 0;
  bool silent = false;
  bool logToStdout = false;
  string logDirectory = GetTempDirectory();
  string maxLogSize = "20971520";

  /** @brief <config home>/nomad/nomad.ini */
  static string defaultConfigPath();

  /**
   * @brief Applies the [Connection], [Keys], [Display] and [Debug] sections.
   *
   * @return false if the file cannot be loaded.
   * @throws InvalidArgument on a malformed numeric value.
   */
  bool loadIniFile(const string& path);

  /** @brief Picks up NOMAD_PUBKEY_B64. */
  void loadEnvironment();
};
}  // namespace nomad

#endif  // __NOMAD_SETUP_CONFIG__
