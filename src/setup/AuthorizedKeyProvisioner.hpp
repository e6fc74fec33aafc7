#ifndef __NOMAD_AUTHORIZED_KEY_PROVISIONER__
#define __NOMAD_AUTHORIZED_KEY_PROVISIONER__

#include "Headers.hpp"
#include "TargetAccount.hpp"

namespace nomad {
enum class ProvisionOutcome {
  Added,
  AlreadyPresent,
  PrunedAndAdded,
  PrunedAndAlreadyPresent,
};

string toString(ProvisionOutcome outcome);

struct ProvisionOptions {
  // Comment marker of keys handed out by older Nomad releases
  string prunePrefix = "Nomad-";
  bool prune = true;
  // Keep a timestamped copy of authorized_keys before touching it
  bool backup = false;
};

struct ProvisionResult {
  ProvisionOutcome outcome = ProvisionOutcome::Added;
  int prunedCount = 0;
  string authorizedKeysPath;
  optional<string> backupPath;
};

/**
 * @brief Idempotently adds a public key to an account's authorized_keys.
 *
 * The .ssh directory (0700) and authorized_keys (0600) are created on first
 * use.  Edits read the whole file, compute the new content and replace the
 * file through a temporary sibling and rename(2), so the original name never
 * points at a partial file.  Concurrent runs can still lose an update; there
 * is no locking.
 */
class AuthorizedKeyProvisioner {
 public:
  explicit AuthorizedKeyProvisioner(const TargetAccount& account);

  /**
   * @brief Optionally backs up and prunes, then appends keyLine unless an
   * identical line is already present.
   *
   * @throws PermissionError when a filesystem step fails.
   */
  ProvisionResult provisionKey(const string& keyLine,
                               const ProvisionOptions& options);

  /**
   * @brief Backup (if requested) and prune without adding a key.
   */
  ProvisionResult pruneLegacyKeys(const ProvisionOptions& options);

  /**
   * @brief True for `ecdsa-sha2-nistp256 ... <prefix>...` lines.  An empty
   * prefix matches nothing.
   */
  static bool isLegacyKeyLine(const string& line, const string& prefix);

  /** @brief Algorithm of the keys earlier Nomad releases generated. */
  static const string LEGACY_KEY_ALGORITHM;

 private:
  vector<string> readLines() const;
  void writeAtomically(const vector<string>& lines) const;
  void ensureFiles() const;
  string writeBackup() const;
  int pruneInPlace(vector<string>* lines, const string& prefix) const;
  void handOver(int fd, const string& path) const;

  TargetAccount account;
};

inline ProvisionResult provisionKey(const TargetAccount& account,
                                    const string& keyLine,
                                    const ProvisionOptions& options) {
  return AuthorizedKeyProvisioner(account).provisionKey(keyLine, options);
}

inline ProvisionResult pruneLegacyKeys(const TargetAccount& account,
                                       const ProvisionOptions& options) {
  return AuthorizedKeyProvisioner(account).pruneLegacyKeys(options);
}
}  // namespace nomad

#endif  // __NOMAD_AUTHORIZED_KEY_PROVISIONER__
