#ifndef __NOMAD_TARGET_ACCOUNT__
#define __NOMAD_TARGET_ACCOUNT__

#include "Headers.hpp"

namespace nomad {
/**
 * @brief The account whose authorized_keys file is provisioned.
 */
struct TargetAccount {
  string name;
  string home;
  uid_t uid = 0;
  gid_t gid = 0;
  // Running as root on behalf of a non-root account.  Created files and
  // directories must then be handed over to the account.
  bool privilegedOnBehalf = false;

  string sshDirectory() const { return home + "/.ssh"; }
  string authorizedKeysPath() const {
    return sshDirectory() + "/authorized_keys";
  }
};

/**
 * Works out which account a setup run acts for.
 *
 * When invoked through sudo, SUDO_USER names the real user, so keys end up in
 * their home rather than root's.
 */
class AccountResolver {
 public:
  /**
   * @brief explicitName, else SUDO_USER, else USER, else the effective uid's
   * login name, else "root".
   */
  static string resolveAccountName(const string& explicitName = "");

  /**
   * @brief Resolves name, home directory and ownership for the account.
   *
   * Falls back to $HOME when the name is not in the password database.
   *
   * @throws ResolutionError if no home directory can be determined.
   */
  static TargetAccount resolve(const string& explicitName = "");
};
}  // namespace nomad

#endif  // __NOMAD_TARGET_ACCOUNT__
