#include "AuthorizedKeyProvisioner.hpp"

#include "SetupErrors.hpp"

namespace nomad {
const string AuthorizedKeyProvisioner::LEGACY_KEY_ALGORITHM =
    "ecdsa-sha2-nistp256";

namespace {
string stripCarriageReturn(const string& line) {
  if (!line.empty() && line.back() == '\r') {
    return line.substr(0, line.size() - 1);
  }
  return line;
}

void writeAllOrThrow(int fd, const string& data, const string& path) {
  size_t written = 0;
  while (written < data.size()) {
    ssize_t rc = ::write(fd, data.data() + written, data.size() - written);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw PermissionError("Cannot write", path, errno);
    }
    written += rc;
  }
}

string joinLines(const vector<string>& lines) {
  string content;
  for (const auto& line : lines) {
    content += line;
    content += '\n';
  }
  return content;
}
}  // namespace

string toString(ProvisionOutcome outcome) {
  switch (outcome) {
    case ProvisionOutcome::Added:
      return "Added";
    case ProvisionOutcome::AlreadyPresent:
      return "AlreadyPresent";
    case ProvisionOutcome::PrunedAndAdded:
      return "Pruned+Added";
    case ProvisionOutcome::PrunedAndAlreadyPresent:
      return "Pruned+AlreadyPresent";
  }
  return "Unknown";
}

AuthorizedKeyProvisioner::AuthorizedKeyProvisioner(
    const TargetAccount& _account)
    : account(_account) {}

bool AuthorizedKeyProvisioner::isLegacyKeyLine(const string& line,
                                               const string& prefix) {
  if (prefix.empty()) {
    return false;
  }
  auto fields = splitWhitespace(line);
  if (fields.empty() || fields[0] != LEGACY_KEY_ALGORITHM) {
    return false;
  }
  return line.find(prefix) != string::npos;
}

ProvisionResult AuthorizedKeyProvisioner::provisionKey(
    const string& keyLine, const ProvisionOptions& options) {
  if (keyLine.empty() || keyLine.find('\n') != string::npos) {
    throw InvalidArgument("Key line must be a single non-empty line");
  }

  ProvisionResult result = pruneLegacyKeys(options);
  vector<string> lines = readLines();

  bool present = false;
  for (const auto& line : lines) {
    if (stripCarriageReturn(line) == keyLine) {
      present = true;
      break;
    }
  }

  if (present) {
    LOG(INFO) << "Key already present in " << result.authorizedKeysPath;
    result.outcome = options.prune ? ProvisionOutcome::PrunedAndAlreadyPresent
                                   : ProvisionOutcome::AlreadyPresent;
    return result;
  }

  lines.push_back(keyLine);
  writeAtomically(lines);
  LOG(INFO) << "Added key to " << result.authorizedKeysPath;
  result.outcome = options.prune ? ProvisionOutcome::PrunedAndAdded
                                 : ProvisionOutcome::Added;
  return result;
}

ProvisionResult AuthorizedKeyProvisioner::pruneLegacyKeys(
    const ProvisionOptions& options) {
  ensureFiles();

  ProvisionResult result;
  result.authorizedKeysPath = account.authorizedKeysPath();
  if (options.backup) {
    result.backupPath = writeBackup();
  }
  if (!options.prune) {
    return result;
  }

  vector<string> lines = readLines();
  result.prunedCount = pruneInPlace(&lines, options.prunePrefix);
  if (result.prunedCount > 0) {
    writeAtomically(lines);
  }
  LOG(INFO) << "Pruned " << result.prunedCount << " legacy "
            << LEGACY_KEY_ALGORITHM << " keys (prefix: " << options.prunePrefix
            << ") from " << result.authorizedKeysPath;
  return result;
}

int AuthorizedKeyProvisioner::pruneInPlace(vector<string>* lines,
                                           const string& prefix) const {
  auto survivorsEnd = std::remove_if(
      lines->begin(), lines->end(),
      [&prefix](const string& line) { return isLegacyKeyLine(line, prefix); });
  int pruned = int(std::distance(survivorsEnd, lines->end()));
  lines->erase(survivorsEnd, lines->end());
  return pruned;
}

void AuthorizedKeyProvisioner::ensureFiles() const {
  const string sshDir = account.sshDirectory();
  if (::mkdir(sshDir.c_str(), 0700) == -1 && errno != EEXIST) {
    throw PermissionError("Cannot create directory", sshDir, errno);
  }
  struct stat sshDirStat;
  if (::stat(sshDir.c_str(), &sshDirStat) != 0) {
    throw PermissionError("Cannot stat", sshDir, errno);
  }
  if (!S_ISDIR(sshDirStat.st_mode)) {
    throw PermissionError("Not a directory", sshDir, ENOTDIR);
  }
  // mkdir is subject to the umask, and an existing directory may be too open
  if (::chmod(sshDir.c_str(), 0700) == -1) {
    throw PermissionError("Cannot chmod", sshDir, errno);
  }
  if (account.privilegedOnBehalf &&
      ::chown(sshDir.c_str(), account.uid, account.gid) == -1) {
    throw PermissionError("Cannot chown", sshDir, errno);
  }

  const string authKeys = account.authorizedKeysPath();
  int fd = ::open(authKeys.c_str(), O_WRONLY | O_CREAT | O_NOFOLLOW, 0600);
  if (fd < 0) {
    throw PermissionError("Cannot open", authKeys, errno);
  }
  if (::fchmod(fd, 0600) == -1) {
    int err = errno;
    ::close(fd);
    throw PermissionError("Cannot chmod", authKeys, err);
  }
  handOver(fd, authKeys);
  ::close(fd);
}

vector<string> AuthorizedKeyProvisioner::readLines() const {
  const string authKeys = account.authorizedKeysPath();
  ifstream in(authKeys, ios::in | ios::binary);
  if (!in.is_open()) {
    throw PermissionError("Cannot read", authKeys, errno ? errno : EACCES);
  }
  vector<string> lines;
  string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  if (in.bad()) {
    throw PermissionError("Cannot read", authKeys, EIO);
  }
  return lines;
}

void AuthorizedKeyProvisioner::writeAtomically(
    const vector<string>& lines) const {
  const string authKeys = account.authorizedKeysPath();
  string tmpPath = authKeys + ".tmp-XXXXXX";
  int fd = ::mkstemp(&tmpPath[0]);
  if (fd < 0) {
    throw PermissionError("Cannot create temporary file beside", authKeys,
                          errno);
  }
  try {
    if (::fchmod(fd, 0600) == -1) {
      throw PermissionError("Cannot chmod", tmpPath, errno);
    }
    handOver(fd, tmpPath);
    writeAllOrThrow(fd, joinLines(lines), tmpPath);
    if (::fsync(fd) == -1) {
      throw PermissionError("Cannot sync", tmpPath, errno);
    }
  } catch (const PermissionError&) {
    ::close(fd);
    ::unlink(tmpPath.c_str());
    throw;
  }
  ::close(fd);

  if (::rename(tmpPath.c_str(), authKeys.c_str()) == -1) {
    int err = errno;
    ::unlink(tmpPath.c_str());
    throw PermissionError("Cannot replace", authKeys, err);
  }
  VLOG(1) << "Rewrote " << authKeys << " with " << lines.size() << " lines";
}

string AuthorizedKeyProvisioner::writeBackup() const {
  const string authKeys = account.authorizedKeysPath();
  ifstream in(authKeys, ios::in | ios::binary);
  if (!in.is_open()) {
    throw PermissionError("Cannot read", authKeys, errno ? errno : EACCES);
  }
  stringstream content;
  content << in.rdbuf();

  time_t rawtime;
  time(&rawtime);
  char buffer[32];
  strftime(buffer, sizeof(buffer), "%Y%m%d-%H%M%S", localtime(&rawtime));
  const string basePath = authKeys + ".bak-" + string(buffer);

  // Two runs within the same second must not clobber each other's backup
  string backupPath = basePath;
  int fd = -1;
  for (int attempt = 1; attempt < 100; attempt++) {
    fd = ::open(backupPath.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW,
                0600);
    if (fd >= 0 || errno != EEXIST) {
      break;
    }
    backupPath = basePath + "-" + to_string(attempt);
  }
  if (fd < 0) {
    throw PermissionError("Cannot create backup", backupPath, errno);
  }
  try {
    handOver(fd, backupPath);
    writeAllOrThrow(fd, content.str(), backupPath);
  } catch (const PermissionError&) {
    ::close(fd);
    throw;
  }
  ::close(fd);
  LOG(INFO) << "Backup saved: " << backupPath;
  return backupPath;
}

void AuthorizedKeyProvisioner::handOver(int fd, const string& path) const {
  if (!account.privilegedOnBehalf) {
    return;
  }
  if (::fchown(fd, account.uid, account.gid) == -1) {
    throw PermissionError("Cannot chown", path, errno);
  }
}
}  // namespace nomad
