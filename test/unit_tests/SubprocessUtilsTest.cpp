#include "SubprocessUtils.hpp"
#include "TestHeaders.hpp"

using namespace nomad;

TEST_CASE("subprocessToString captures stdout", "[SubprocessUtils]") {
  SubprocessUtils utils;
  auto result = utils.subprocessToString("printf", {"test123"});

  REQUIRE(result.succeeded());
  REQUIRE(result.output == "test123");
}

TEST_CASE("subprocessToString with no args", "[SubprocessUtils]") {
  SubprocessUtils utils;
  auto result = utils.subprocessToString("pwd", {});

  // pwd should return a path (containing at least a forward slash)
  REQUIRE(result.output.find("/") != string::npos);
}

TEST_CASE("subprocessToString reports the exit code", "[SubprocessUtils]") {
  SubprocessUtils utils;
  REQUIRE(utils.subprocessToString("sh", {"-c", "exit 3"}).exitCode == 3);

  // stderr is not captured
  auto noisy = utils.subprocessToString("sh", {"-c", "echo out; echo err >&2"});
  REQUIRE(noisy.output == "out\n");
}

TEST_CASE("A missing command fails with 127", "[SubprocessUtils]") {
  SubprocessUtils utils;
  auto result =
      utils.subprocessToString("nomad-test-command-that-does-not-exist", {});
  REQUIRE_FALSE(result.succeeded());
  REQUIRE(result.exitCode == 127);
  REQUIRE(result.output.empty());
}

TEST_CASE("subprocessInteractive returns the exit code", "[SubprocessUtils]") {
  SubprocessUtils utils;
  REQUIRE(utils.subprocessInteractive("true", {}) == 0);
  REQUIRE(utils.subprocessInteractive("sh", {"-c", "exit 7"}) == 7);
}

TEST_CASE("commandExists searches PATH", "[SubprocessUtils]") {
  SubprocessUtils utils;
  REQUIRE(utils.commandExists("sh"));
  REQUIRE(utils.commandExists("/bin/sh"));
  REQUIRE_FALSE(utils.commandExists("nomad-test-command-that-does-not-exist"));
  REQUIRE_FALSE(utils.commandExists(""));
}
