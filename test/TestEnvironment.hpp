#ifndef __NOMAD_TEST_ENVIRONMENT__
#define __NOMAD_TEST_ENVIRONMENT__

#include "SubprocessUtils.hpp"
#include "TestHeaders.hpp"

namespace nomad {
struct FileInfo {
  bool exists = false;
  mode_t mode = 0;

  mode_t fileMode() const { return mode & 0777; }
};

/**
 * Temporary directories and environment overrides, undone on destruction.
 */
class TestEnvironment {
 public:
  string createTempDir() {
    string tmpPath = GetTempDirectory() + string("nomad_test_XXXXXXXX");
    const string dir = string(mkdtemp(&tmpPath[0]));

    temporaryDirs.push_back(dir);
    return dir;
  }

  FileInfo getFileInfo(const string& name) {
    struct stat fileStat;
    const int statResult = ::stat(name.c_str(), &fileStat);
    if (statResult != 0) {
      return FileInfo{};
    }

    FileInfo result;
    result.exists = true;
    result.mode = fileStat.st_mode;
    return result;
  }

  void setEnv(const char* name, const string& value) {
    saveEnv(name);
    const int replace = 1;  // non-zero to replace.
    ::setenv(name, value.c_str(), replace);
  }

  void unsetEnv(const char* name) {
    saveEnv(name);
    ::unsetenv(name);
  }

  static string readFile(const string& path) {
    ifstream in(path, ios::in | ios::binary);
    stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  static void writeFile(const string& path, const string& content) {
    ofstream out(path, ios::out | ios::trunc | ios::binary);
    out << content;
  }

  ~TestEnvironment() {
    for (const string& dir : temporaryDirs) {
      std::error_code ec;
      fs::remove_all(dir, ec);
      if (ec) {
        LOG(ERROR) << "Error when removing dir: " << dir << ": "
                   << ec.message();
      }
    }

    for (const auto& [name, value] : savedEnvs) {
      if (value) {
        ::setenv(name.c_str(), value->c_str(), 1);
      } else {
        ::unsetenv(name.c_str());
      }
    }
  }

 private:
  void saveEnv(const char* name) {
    if (!savedEnvs.count(name)) {
      const char* previousValue = ::getenv(name);
      if (previousValue) {
        savedEnvs[name] = string(previousValue);
      } else {
        savedEnvs[name] = std::nullopt;
      }
    }
  }

  vector<string> temporaryDirs;
  map<string, optional<string>> savedEnvs;
};

/**
 * SubprocessUtils that runs nothing.  Commands listed in `installed` exist;
 * canned results are keyed by the full command line.
 */
class FakeSubprocessUtils : public SubprocessUtils {
 public:
  SubprocessResult subprocessToString(const string& command,
                                      const vector<string>& args) override {
    string commandLine = join(command, args);
    calls.push_back(commandLine);
    auto it = results.find(commandLine);
    if (it == results.end()) {
      return SubprocessResult{1, ""};
    }
    return it->second;
  }

  int subprocessInteractive(const string& command,
                            const vector<string>& args) override {
    string commandLine = join(command, args);
    calls.push_back(commandLine);
    interactiveCalls.push_back(commandLine);
    auto it = results.find(commandLine);
    if (it == results.end()) {
      return 0;
    }
    return it->second.exitCode;
  }

  bool commandExists(const string& name) override {
    return installed.count(name) > 0;
  }

  bool called(const string& commandLine) const {
    return std::find(calls.begin(), calls.end(), commandLine) != calls.end();
  }

  static string join(const string& command, const vector<string>& args) {
    string commandLine = command;
    for (const auto& arg : args) {
      commandLine += " " + arg;
    }
    return commandLine;
  }

  set<string> installed;
  map<string, SubprocessResult> results;
  vector<string> calls;
  vector<string> interactiveCalls;
};
}  // namespace nomad

#endif  // __NOMAD_TEST_ENVIRONMENT__
