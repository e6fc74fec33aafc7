#include "SetupConfig.hpp"

#include "SetupErrors.hpp"
#include "SimpleIni.h"

namespace nomad {
namespace {
int parseIntValue(const char* section, const char* key, const char* value) {
  try {
    size_t consumed = 0;
    int parsed = stoi(value, &consumed);
    if (consumed != strlen(value)) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw InvalidArgument(string("Invalid value for [") + section + "] " +
                          key + ": " + value);
  }
}

void readString(const CSimpleIniA& ini, const char* section, const char* key,
                string* out) {
  const char* value = ini.GetValue(section, key, NULL);
  if (value) {
    *out = string(value);
  }
}

void readInt(const CSimpleIniA& ini, const char* section, const char* key,
             int* out) {
  const char* value = ini.GetValue(section, key, NULL);
  if (value) {
    *out = parseIntValue(section, key, value);
  }
}

void readBool(const CSimpleIniA& ini, const char* section, const char* key,
              bool* out) {
  const char* value = ini.GetValue(section, key, NULL);
  if (value) {
    *out = parseIntValue(section, key, value) != 0;
  }
}
}  // namespace

string SetupConfig::defaultConfigPath() {
  return sago::getConfigHome() + "/nomad/nomad.ini";
}

bool SetupConfig::loadIniFile(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    LOG(ERROR) << "Cannot load config file " << path << " (" << rc << ")";
    return false;
  }

  readString(ini, "Connection", "host", &host);
  readString(ini, "Connection", "user", &user);
  readInt(ini, "Connection", "port", &port);

  readString(ini, "Keys", "comment_prefix", &prunePrefix);
  readBool(ini, "Keys", "prune", &prune);

  readBool(ini, "Display", "open_browser", &openBrowser);
  readString(ini, "Display", "html_path", &htmlPath);

  readInt(ini, "Debug", "verbose", &verbose);
  readBool(ini, "Debug", "silent", &silent);
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && parseIntValue("Debug", "logsize", logsize) > 0) {
    maxLogSize = string(logsize);
  }

  LOG(INFO) << "Loaded config file " << path;
  return true;
}

void SetupConfig::loadEnvironment() {
  const char* pubkeyEnv = ::getenv(PUBKEY_ENV_VAR.c_str());
  if (pubkeyEnv != NULL && pubkeyEnv[0] != '\0') {
    pubkeyB64 = string(pubkeyEnv);
  }
}
}  // namespace nomad
