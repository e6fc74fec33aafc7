#include "SubprocessUtils.hpp"

namespace nomad {
namespace {
[[noreturn]] void execOrDie(const string& command, const vector<string>& args) {
  vector<char*> argsArray;
  argsArray.push_back(strdup(command.c_str()));
  for (const auto& arg : args) {
    argsArray.push_back(strdup(arg.c_str()));
  }
  argsArray.push_back(NULL);
  execvp(command.c_str(), argsArray.data());

  // Only reached if execvp failed.  Do not log here, the logger belongs to
  // the parent.
  _exit(127);
}

int waitForExit(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      LOG(ERROR) << "waitpid failed: " << strerror(errno);
      return -1;
    }
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  return -1;
}
}  // namespace

SubprocessResult SubprocessUtils::subprocessToString(
    const string& command, const vector<string>& args) {
  int link_client[2];
  char buf_client[4096];
  if (pipe(link_client) == -1) {
    LOG(ERROR) << "pipe failed: " << strerror(errno);
    return SubprocessResult{-1, ""};
  }

  pid_t pid = fork();
  if (pid == 0) {
    // child process
    dup2(link_client[1], STDOUT_FILENO);
    close(link_client[0]);
    close(link_client[1]);
    int devNull = ::open("/dev/null", O_WRONLY);
    if (devNull >= 0) {
      dup2(devNull, STDERR_FILENO);
      close(devNull);
    }
    execOrDie(command, args);
  } else if (pid > 0) {
    // parent process
    close(link_client[1]);
    string buffer;
    while (true) {
      ssize_t nbytes = read(link_client[0], buf_client, sizeof(buf_client));
      if (nbytes < 0 && errno == EINTR) {
        continue;
      }
      if (nbytes <= 0) {
        break;
      }
      buffer += string(buf_client, nbytes);
    }
    close(link_client[0]);
    int exitCode = waitForExit(pid);
    VLOG(1) << "Ran " << command << " (exit " << exitCode << ")";
    return SubprocessResult{exitCode, buffer};
  }

  LOG(ERROR) << "Failed to fork: " << strerror(errno);
  close(link_client[0]);
  close(link_client[1]);
  return SubprocessResult{-1, ""};
}

int SubprocessUtils::subprocessInteractive(const string& command,
                                           const vector<string>& args) {
  pid_t pid = fork();
  if (pid == 0) {
    execOrDie(command, args);
  } else if (pid > 0) {
    int exitCode = waitForExit(pid);
    VLOG(1) << "Ran " << command << " interactively (exit " << exitCode
            << ")";
    return exitCode;
  }
  LOG(ERROR) << "Failed to fork: " << strerror(errno);
  return -1;
}

bool SubprocessUtils::commandExists(const string& name) {
  if (name.empty()) {
    return false;
  }
  if (name.find('/') != string::npos) {
    return ::access(name.c_str(), X_OK) == 0;
  }
  const char* pathEnv = getenv("PATH");
  if (pathEnv == NULL) {
    return false;
  }
  for (const auto& dir : split(string(pathEnv), ':')) {
    if (dir.empty()) {
      continue;
    }
    string candidate = dir + "/" + name;
    struct stat candidateStat;
    if (::stat(candidate.c_str(), &candidateStat) == 0 &&
        S_ISREG(candidateStat.st_mode) &&
        ::access(candidate.c_str(), X_OK) == 0) {
      return true;
    }
  }
  return false;
}

}  // namespace nomad
