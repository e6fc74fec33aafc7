#include "TargetAccount.hpp"

#include "SetupErrors.hpp"

namespace nomad {
namespace {
string nonEmptyEnv(const char* name) {
  const char* value = ::getenv(name);
  if (value == NULL) {
    return "";
  }
  return string(value);
}
}  // namespace

string AccountResolver::resolveAccountName(const string& explicitName) {
  if (!explicitName.empty()) {
    return explicitName;
  }
  string name = nonEmptyEnv("SUDO_USER");
  if (name.empty()) {
    name = nonEmptyEnv("USER");
  }
  if (name.empty()) {
    passwd* pwd = getpwuid(geteuid());
    if (pwd != NULL && pwd->pw_name != NULL) {
      name = pwd->pw_name;
    }
  }
  if (name.empty()) {
    name = "root";
  }
  return name;
}

TargetAccount AccountResolver::resolve(const string& explicitName) {
  TargetAccount account;
  account.name = resolveAccountName(explicitName);

  passwd* pwd = getpwnam(account.name.c_str());
  if (pwd != NULL && pwd->pw_dir != NULL && pwd->pw_dir[0] != '\0') {
    account.home = pwd->pw_dir;
    account.uid = pwd->pw_uid;
    account.gid = pwd->pw_gid;
  } else {
    LOG(INFO) << "No password entry for " << account.name
              << ", falling back to $HOME";
    account.home = nonEmptyEnv("HOME");
    account.uid = geteuid();
    account.gid = getegid();
  }

  if (account.home.empty()) {
    throw ResolutionError("Cannot resolve home directory for account " +
                          account.name);
  }

  account.privilegedOnBehalf = (geteuid() == 0 && account.uid != 0);
  VLOG(1) << "Target account " << account.name << " home " << account.home
          << (account.privilegedOnBehalf ? " (privileged)" : "");
  return account;
}
}  // namespace nomad
