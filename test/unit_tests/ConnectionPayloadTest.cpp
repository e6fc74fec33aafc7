#include "ConnectionPayload.hpp"
#include "SetupErrors.hpp"
#include "SetupToken.hpp"
#include "TestHeaders.hpp"

using namespace nomad;

TEST_CASE("buildPayload produces the documented URI", "[ConnectionPayload]") {
  auto payload = buildPayload("192.168.1.42", "pi", 22,
                              "123e4567-e89b-12d3-a456-426614174000");
  REQUIRE(payload ==
          "nomad://connect?host=192.168.1.42&port=22&user=pi&mosh=true&"
          "setup_token=123e4567-e89b-12d3-a456-426614174000");
}

TEST_CASE("buildPayload trims host and user", "[ConnectionPayload]") {
  auto payload = buildPayload("  example.local\t", " alice \n", 2222, "t");
  REQUIRE(payload ==
          "nomad://connect?host=example.local&port=2222&user=alice&mosh=true&"
          "setup_token=t");
}

TEST_CASE("buildPayload form-encodes every field", "[ConnectionPayload]") {
  auto payload = buildPayload("fe80::1%en0", "bob smith", 22, "a&b=c#d");
  REQUIRE(payload ==
          "nomad://connect?host=fe80%3A%3A1%25en0&port=22&user=bob+smith&"
          "mosh=true&setup_token=a%26b%3Dc%23d");

  SECTION("Non-ASCII values are encoded byte by byte") {
    auto unicode = buildPayload("h", "j\xC3\xBCrgen", 22, "t");
    REQUIRE(unicode.find("user=j%C3%BCrgen&") != string::npos);
  }
}

TEST_CASE("buildPayload rejects invalid input", "[ConnectionPayload]") {
  REQUIRE_THROWS_AS(buildPayload("", "alice", 22, "t"), InvalidArgument);
  REQUIRE_THROWS_AS(buildPayload("h", "", 22, "t"), InvalidArgument);
  REQUIRE_THROWS_AS(buildPayload("   ", "alice", 22, "t"), InvalidArgument);
  REQUIRE_THROWS_AS(buildPayload("h", " \t", 22, "t"), InvalidArgument);
  REQUIRE_THROWS_AS(buildPayload("h", "alice", 22, ""), InvalidArgument);
  REQUIRE_THROWS_AS(buildPayload("h", "alice", 0, "t"), InvalidArgument);
  REQUIRE_THROWS_AS(buildPayload("h", "alice", -22, "t"), InvalidArgument);
  REQUIRE_THROWS_AS(buildPayload("h", "alice", 65536, "t"), InvalidArgument);
  REQUIRE_NOTHROW(buildPayload("h", "alice", 65535, "t"));
  REQUIRE_NOTHROW(buildPayload("h", "alice", 1, "t"));
}

TEST_CASE("mosh is always the literal true", "[ConnectionPayload]") {
  ConnectionRequest request;
  request.host = "h";
  request.user = "u";
  request.token = "t";
  request.mosh = false;
  auto payload = buildPayload(request);
  REQUIRE(payload.find("&mosh=true&") != string::npos);
  REQUIRE(parsePayload(payload).mosh);
}

TEST_CASE("parsePayload recovers the original values", "[ConnectionPayload]") {
  struct Case {
    string host;
    string user;
    int port;
    string token;
  };
  vector<Case> cases = {
      {"192.168.1.42", "pi", 22, newToken()},
      {"host name", "us&er", 2222, "to=ken#1"},
      {"[::1]", "m\xC3\xA9lanie", 65535, "+%20+"},
      {"a?b/c", "x=y&z", 1, "tok en"},
  };
  for (const auto& c : cases) {
    auto request = parsePayload(buildPayload(c.host, c.user, c.port, c.token));
    REQUIRE(request.host == c.host);
    REQUIRE(request.user == c.user);
    REQUIRE(request.port == c.port);
    REQUIRE(request.token == c.token);
  }
}

TEST_CASE("parsePayload rejects foreign or broken URIs", "[ConnectionPayload]") {
  REQUIRE_THROWS_AS(parsePayload("https://connect?host=h"), InvalidArgument);
  REQUIRE_THROWS_AS(
      parsePayload("nomad://connect?host=h&port=22&user=u&mosh=true"),
      InvalidArgument);
  REQUIRE_THROWS_AS(parsePayload("nomad://connect?host=h&port=abc&user=u&"
                                 "mosh=true&setup_token=t"),
                    InvalidArgument);
  REQUIRE_THROWS_AS(parsePayload("nomad://connect?host=%G1&port=22&user=u&"
                                 "mosh=true&setup_token=t"),
                    InvalidArgument);
  REQUIRE_THROWS_AS(parsePayload("nomad://connect?host=h%2&port=22&user=u&"
                                 "mosh=true&setup_token=t"),
                    InvalidArgument);
  REQUIRE_THROWS_AS(parsePayload("nomad://connect?host=h&host=i&port=22&"
                                 "user=u&mosh=true&setup_token=t"),
                    InvalidArgument);
}
