#ifndef __NOMAD_SYSTEM_SETUP__
#define __NOMAD_SYSTEM_SETUP__

#include "Headers.hpp"
#include "SubprocessUtils.hpp"

namespace nomad {
/**
 * @brief Host capabilities the setup flow needs but does not own.
 *
 * Every method is best effort: failures are logged and reported through the
 * return value, never thrown.
 */
class SystemSetup {
 public:
  virtual ~SystemSetup() = default;

  virtual bool commandExists(const string& name) = 0;

  /**
   * @brief Installs the given packages with the first available package
   * manager.  Returns false if nothing could be installed.
   */
  virtual bool installPackages(const vector<string>& packages) = 0;

  /**
   * @brief Makes sure the ssh daemon is enabled and running.
   */
  virtual bool ensureServiceRunning() = 0;

  /**
   * @brief Packages for the tools among mosh, tmux and sshd that are
   * missing.  Empty when everything is already installed.
   */
  vector<string> missingPackages();

  /**
   * @brief Installs missing tools (and qrencode alongside them).
   */
  void installDependencies();
};

/**
 * @brief SystemSetup backed by the host's package and service managers.
 *
 * Supports brew, apt-get, yum and dnf for packages, and macOS
 * `systemsetup`, systemd and SysV `service` for the ssh daemon.
 */
class HostSystemSetup : public SystemSetup {
 public:
  explicit HostSystemSetup(shared_ptr<SubprocessUtils> subprocessUtils);

  bool commandExists(const string& name) override;

  bool installPackages(const vector<string>& packages) override;

  bool ensureServiceRunning() override;

 protected:
  /** @brief Runs a command through sudo unless already root. */
  int runPrivileged(const string& command, const vector<string>& args);

  virtual bool isRoot();

 private:
  bool ensureRemoteLoginMac();
  string systemdSshService();
  bool ensureSystemdService(const string& service);
  bool ensureSysVService();

  shared_ptr<SubprocessUtils> subprocessUtils;
};
}  // namespace nomad

#endif  // __NOMAD_SYSTEM_SETUP__
