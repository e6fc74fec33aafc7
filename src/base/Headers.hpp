#ifndef __NOMAD_HEADERS__
#define __NOMAD_HEADERS__

#if __FreeBSD__
#define _WITH_GETLINE
#endif

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <paths.h>
#include <pwd.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <ctype.h>
#include <errno.h>
#include <fcntl.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <algorithm>
#include <array>
#include <ctime>
#include <exception>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#if __has_include(<filesystem>)
#include <filesystem>
namespace fs = std::filesystem;
#else
#include <experimental/filesystem>
namespace fs = std::experimental::filesystem;
#endif

#include "base64.h"
#include "easylogging++.h"
#include "sago/platform_folders.h"
#include "sole.hpp"
#include "ust.hpp"

using namespace std;

// Fixed parts of the connection payload understood by the Nomad app
const string PAYLOAD_SCHEME = "nomad";
const string PAYLOAD_AUTHORITY = "connect";

// Default ssh port advertised in the payload
const int DEFAULT_SSH_PORT = 22;

// Environment variable carrying the base64-encoded public key line
const string PUBKEY_ENV_VAR = "NOMAD_PUBKEY_B64";

// Prefix for every user-facing status line
const string STATUS_PREFIX = "[Nomad] ";

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

// User-facing status output on the stdout logger
#define STATUS CLOG(INFO, "stdout") << STATUS_PREFIX

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << errno << "): " << strerror(errno);

#ifndef NOMAD_VERSION
#define NOMAD_VERSION "unknown"
#endif

namespace nomad {
template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

// Splits on runs of spaces and tabs, dropping empty fields
inline std::vector<std::string> splitWhitespace(const std::string &s) {
  std::vector<std::string> fields;
  std::istringstream ss(s);
  std::string field;
  while (ss >> field) {
    fields.push_back(field);
  }
  return fields;
}

inline string trim(const string &s) {
  const char *ws = " \t\n\r\f\v";
  auto start = s.find_first_not_of(ws);
  if (start == string::npos) return "";
  auto end = s.find_last_not_of(ws);
  return s.substr(start, end - start + 1);
}

inline int replaceAll(std::string &str, const std::string &from,
                      const std::string &to) {
  if (from.empty()) return 0;
  int retval = 0;
  size_t start_pos = 0;
  while ((start_pos = str.find(from, start_pos)) != std::string::npos) {
    retval++;
    str.replace(start_pos, from.length(), to);
    start_pos += to.length();  // In case 'to' contains 'from', like replacing
                               // 'x' with 'yx'
  }
  return retval;
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}

inline void InterruptSignalHandler(int signum) {
  STERROR << "Got interrupt";
  CLOG(INFO, "stdout") << endl
                       << "Got interrupt (perhaps ctrl+c?).  Exiting." << endl;
  ::exit(signum);
}
}  // namespace nomad

#endif
