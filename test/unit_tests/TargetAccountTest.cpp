#include "SetupErrors.hpp"
#include "TargetAccount.hpp"
#include "TestEnvironment.hpp"

using namespace nomad;

namespace {
const string UNKNOWN_ACCOUNT = "nomad-test-no-such-account";
}

TEST_CASE("Account name resolution order", "[TargetAccount]") {
  TestEnvironment env;
  env.setEnv("SUDO_USER", "sudoer");
  env.setEnv("USER", "plain");

  REQUIRE(AccountResolver::resolveAccountName("explicit") == "explicit");
  REQUIRE(AccountResolver::resolveAccountName() == "sudoer");

  env.unsetEnv("SUDO_USER");
  REQUIRE(AccountResolver::resolveAccountName() == "plain");

  SECTION("An empty variable counts as unset") {
    env.setEnv("SUDO_USER", "");
    REQUIRE(AccountResolver::resolveAccountName() == "plain");
  }

  SECTION("Without variables the effective user's login name is used") {
    env.unsetEnv("USER");
    passwd* pwd = getpwuid(geteuid());
    string expected = (pwd != NULL) ? string(pwd->pw_name) : "root";
    REQUIRE(AccountResolver::resolveAccountName() == expected);
  }
}

TEST_CASE("Known accounts resolve through the password database",
          "[TargetAccount]") {
  passwd* pwd = getpwuid(geteuid());
  if (pwd == NULL || pwd->pw_dir == NULL || pwd->pw_dir[0] == '\0') {
    WARN("Effective user has no password entry, skipping");
    return;
  }
  const string name = pwd->pw_name;
  const string home = pwd->pw_dir;

  auto account = AccountResolver::resolve(name);
  REQUIRE(account.name == name);
  REQUIRE(account.home == home);
  REQUIRE(account.uid == geteuid());
  // Acting for ourselves is never on behalf of someone else
  REQUIRE_FALSE(account.privilegedOnBehalf);
  REQUIRE(account.sshDirectory() == home + "/.ssh");
  REQUIRE(account.authorizedKeysPath() == home + "/.ssh/authorized_keys");
}

TEST_CASE("Unknown accounts fall back to HOME", "[TargetAccount]") {
  TestEnvironment env;
  string home = env.createTempDir();
  env.setEnv("HOME", home);

  auto account = AccountResolver::resolve(UNKNOWN_ACCOUNT);
  REQUIRE(account.name == UNKNOWN_ACCOUNT);
  REQUIRE(account.home == home);
  REQUIRE(account.uid == geteuid());
  REQUIRE(account.gid == getegid());
  REQUIRE_FALSE(account.privilegedOnBehalf);
}

TEST_CASE("Resolution fails without any home directory", "[TargetAccount]") {
  TestEnvironment env;
  env.unsetEnv("HOME");
  REQUIRE_THROWS_AS(AccountResolver::resolve(UNKNOWN_ACCOUNT),
                    ResolutionError);

  env.setEnv("HOME", "");
  REQUIRE_THROWS_AS(AccountResolver::resolve(UNKNOWN_ACCOUNT),
                    ResolutionError);
}
