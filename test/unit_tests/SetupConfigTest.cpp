#include "SetupConfig.hpp"
#include "SetupErrors.hpp"
#include "TestEnvironment.hpp"

using namespace nomad;

TEST_CASE("Defaults", "[SetupConfig]") {
  SetupConfig config;
  REQUIRE(config.port == 22);
  REQUIRE(config.prunePrefix == "Nomad-");
  REQUIRE(config.prune);
  REQUIRE_FALSE(config.pruneOnly);
  REQUIRE(config.openBrowser);
  REQUIRE(config.htmlPath == GetTempDirectory() + "nomad-qr.html");
  REQUIRE(SetupConfig::defaultConfigPath().size() >
          string("/nomad/nomad.ini").size());
}

TEST_CASE("INI files override defaults", "[SetupConfig]") {
  TestEnvironment env;
  string path = env.createTempDir() + "/nomad.ini";
  TestEnvironment::writeFile(path,
                             "[Connection]\n"
                             "host = studio.local\n"
                             "user = alice\n"
                             "port = 2222\n"
                             "\n"
                             "[Keys]\n"
                             "comment_prefix = Phone-\n"
                             "prune = 0\n"
                             "\n"
                             "[Display]\n"
                             "open_browser = 0\n"
                             "html_path = /var/tmp/qr.html\n"
                             "\n"
                             "[Debug]\n"
                             "verbose = 3\n"
                             "silent = 1\n"
                             "logsize = 1048576\n");

  SetupConfig config;
  REQUIRE(config.loadIniFile(path));
  REQUIRE(config.host == "studio.local");
  REQUIRE(config.user == "alice");
  REQUIRE(config.port == 2222);
  REQUIRE(config.prunePrefix == "Phone-");
  REQUIRE_FALSE(config.prune);
  REQUIRE_FALSE(config.openBrowser);
  REQUIRE(config.htmlPath == "/var/tmp/qr.html");
  REQUIRE(config.verbose == 3);
  REQUIRE(config.silent);
  REQUIRE(config.maxLogSize == "1048576");
}

TEST_CASE("Partial INI files keep the other defaults", "[SetupConfig]") {
  TestEnvironment env;
  string path = env.createTempDir() + "/nomad.ini";
  TestEnvironment::writeFile(path, "[Connection]\nport = 8022\n");

  SetupConfig config;
  REQUIRE(config.loadIniFile(path));
  REQUIRE(config.port == 8022);
  REQUIRE(config.host.empty());
  REQUIRE(config.prune);
  REQUIRE(config.maxLogSize == "20971520");
}

TEST_CASE("Bad INI input", "[SetupConfig]") {
  TestEnvironment env;
  string dir = env.createTempDir();

  SetupConfig config;
  REQUIRE_FALSE(config.loadIniFile(dir + "/does-not-exist.ini"));

  string path = dir + "/nomad.ini";
  TestEnvironment::writeFile(path, "[Connection]\nport = twenty-two\n");
  REQUIRE_THROWS_AS(config.loadIniFile(path), InvalidArgument);

  TestEnvironment::writeFile(path, "[Keys]\nprune = 1x\n");
  REQUIRE_THROWS_AS(config.loadIniFile(path), InvalidArgument);
}

TEST_CASE("The public key can come from the environment", "[SetupConfig]") {
  TestEnvironment env;
  SetupConfig config;

  env.unsetEnv("NOMAD_PUBKEY_B64");
  config.loadEnvironment();
  REQUIRE(config.pubkeyB64.empty());

  env.setEnv("NOMAD_PUBKEY_B64", "");
  config.loadEnvironment();
  REQUIRE(config.pubkeyB64.empty());

  env.setEnv("NOMAD_PUBKEY_B64", "c3NoLWVkMjU1MTk=");
  config.loadEnvironment();
  REQUIRE(config.pubkeyB64 == "c3NoLWVkMjU1MTk=");
}
