#include "SystemSetup.hpp"

namespace nomad {
namespace {
// Tools the app needs on the host, keyed by the binary we probe for
const vector<pair<string, string>> REQUIRED_TOOLS = {
    {"mosh", "mosh"},
    {"tmux", "tmux"},
    {"sshd", "openssh-server"},
};

// Installed alongside the required tools whenever we install anything
const vector<string> FULL_PACKAGE_SET = {"mosh", "tmux", "qrencode",
                                         "openssh-server"};

string joinPackages(const vector<string>& packages) {
  string joined;
  for (const auto& package : packages) {
    if (!joined.empty()) joined += " ";
    joined += package;
  }
  return joined;
}

bool hasUnitFile(const string& unitFiles, const string& unit) {
  for (const auto& line : split(unitFiles, '\n')) {
    if (line.compare(0, unit.size(), unit) == 0) {
      return true;
    }
  }
  return false;
}
}  // namespace

HostSystemSetup::HostSystemSetup(shared_ptr<SubprocessUtils> _subprocessUtils)
    : subprocessUtils(_subprocessUtils) {}

bool HostSystemSetup::commandExists(const string& name) {
  return subprocessUtils->commandExists(name);
}

bool HostSystemSetup::isRoot() { return ::geteuid() == 0; }

int HostSystemSetup::runPrivileged(const string& command,
                                   const vector<string>& args) {
  if (!isRoot() && commandExists("sudo")) {
    vector<string> sudoArgs = {command};
    sudoArgs.insert(sudoArgs.end(), args.begin(), args.end());
    return subprocessUtils->subprocessInteractive("sudo", sudoArgs);
  }
  return subprocessUtils->subprocessInteractive(command, args);
}

vector<string> SystemSetup::missingPackages() {
  vector<string> missing;
  for (const auto& it : REQUIRED_TOOLS) {
    if (!commandExists(it.first)) {
      missing.push_back(it.second);
    }
  }
  return missing;
}

void SystemSetup::installDependencies() {
  auto missing = missingPackages();
  if (missing.empty()) {
    LOG(INFO) << "All dependencies already installed";
    return;
  }
  STATUS << "Installing dependencies: " << joinPackages(missing);
  if (!installPackages(FULL_PACKAGE_SET)) {
    LOG(WARNING) << "Dependency installation did not complete";
  }
}

bool HostSystemSetup::installPackages(const vector<string>& packages) {
  if (packages.empty()) {
    return true;
  }

  if (commandExists("brew")) {
    // openssh ships with macOS, brew has no server package
    vector<string> args = {"install"};
    for (const auto& package : packages) {
      if (package != "openssh-server") {
        args.push_back(package);
      }
    }
    // brew refuses to run as root, so never through sudo
    int rc = subprocessUtils->subprocessInteractive("brew", args);
    if (rc != 0) {
      LOG(WARNING) << "brew install exited with " << rc;
    }
    return rc == 0;
  }

  vector<string> installArgs = {"install", "-y"};
  installArgs.insert(installArgs.end(), packages.begin(), packages.end());

  if (commandExists("apt-get")) {
    int rc = runPrivileged("apt-get", {"update"});
    if (rc != 0) {
      LOG(WARNING) << "apt-get update exited with " << rc;
    }
    rc = runPrivileged("apt-get", installArgs);
    if (rc != 0) {
      LOG(WARNING) << "apt-get install exited with " << rc;
    }
    return rc == 0;
  }

  for (const string& manager : {"yum", "dnf"}) {
    if (commandExists(manager)) {
      int rc = runPrivileged(manager, installArgs);
      if (rc != 0) {
        LOG(WARNING) << manager << " install exited with " << rc;
      }
      return rc == 0;
    }
  }

  STATUS << "No supported package manager found. Please install: mosh tmux "
            "(and optional qrencode).";
  return false;
}

bool HostSystemSetup::ensureServiceRunning() {
  if (commandExists("systemsetup")) {
    return ensureRemoteLoginMac();
  }
  if (commandExists("systemctl")) {
    string service = systemdSshService();
    if (!service.empty()) {
      return ensureSystemdService(service);
    }
  }
  if (commandExists("service")) {
    return ensureSysVService();
  }
  LOG(WARNING) << "No known service manager, cannot check the ssh daemon";
  return false;
}

bool HostSystemSetup::ensureRemoteLoginMac() {
  auto status =
      subprocessUtils->subprocessToString("systemsetup", {"-getremotelogin"});
  if (status.output.find("On") != string::npos) {
    return true;
  }
  STATUS << "Enabling Remote Login (SSH)";
  int rc = runPrivileged("systemsetup", {"-setremotelogin", "on"});
  if (rc != 0) {
    LOG(WARNING) << "systemsetup -setremotelogin exited with " << rc;
  }
  return rc == 0;
}

string HostSystemSetup::systemdSshService() {
  auto unitFiles =
      subprocessUtils->subprocessToString("systemctl", {"list-unit-files"});
  if (hasUnitFile(unitFiles.output, "sshd.service")) {
    return "sshd";
  }
  if (hasUnitFile(unitFiles.output, "ssh.service")) {
    return "ssh";
  }
  VLOG(1) << "No ssh unit file known to systemd";
  return "";
}

bool HostSystemSetup::ensureSystemdService(const string& service) {
  bool ok = true;
  if (!subprocessUtils
           ->subprocessToString("systemctl", {"is-enabled", "--quiet", service})
           .succeeded()) {
    STATUS << "Enabling SSH service (" << service << ")";
    int rc = runPrivileged("systemctl", {"enable", service});
    if (rc != 0) {
      LOG(WARNING) << "systemctl enable " << service << " exited with " << rc;
      ok = false;
    }
  }
  if (!subprocessUtils
           ->subprocessToString("systemctl", {"is-active", "--quiet", service})
           .succeeded()) {
    STATUS << "Starting SSH service (" << service << ")";
    int rc = runPrivileged("systemctl", {"start", service});
    if (rc != 0) {
      LOG(WARNING) << "systemctl start " << service << " exited with " << rc;
      ok = false;
    }
  }
  return ok;
}

bool HostSystemSetup::ensureSysVService() {
  if (subprocessUtils->subprocessToString("service", {"ssh", "status"})
          .succeeded()) {
    return true;
  }
  STATUS << "Starting SSH service (ssh)";
  int rc = runPrivileged("service", {"ssh", "start"});
  if (rc != 0) {
    LOG(WARNING) << "service ssh start exited with " << rc;
  }
  return rc == 0;
}
}  // namespace nomad
