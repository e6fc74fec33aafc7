#include "PublicKeyDecoder.hpp"
#include "TestHeaders.hpp"

using namespace nomad;

namespace {
const string KEY_LINE = "ssh-ed25519 AAAAC3NzaC1lZDI1NTE5AAAAIK0 nomad@phone";
const string KEY_LINE_B64 =
    "c3NoLWVkMjU1MTkgQUFBQUMzTnphQzFsWkRJMU5URTVBQUFBSUswIG5vbWFkQHBob25l";
}  // namespace

TEST_CASE("decodeKey returns the decoded key line", "[PublicKeyDecoder]") {
  auto key = decodeKey(KEY_LINE_B64);
  REQUIRE(key);
  REQUIRE(*key == KEY_LINE);

  SECTION("Surrounding whitespace in the blob is ignored") {
    auto padded = decodeKey("  " + KEY_LINE_B64 + "\n");
    REQUIRE(padded);
    REQUIRE(*padded == KEY_LINE);
  }
}

TEST_CASE("decodeKey accepts wrapped base64", "[PublicKeyDecoder]") {
  const string longKey =
      "ssh-ed25519 AAAAC3NzaC1lZDI1NTE5AAAAIGq3fC0ZpPLnLJ4wBv1rSxS6dXw8mZ0uYk9T"
      "qHc2eF7a nomad-wrapped@phone";
  const string firstLine =
      "c3NoLWVkMjU1MTkgQUFBQUMzTnphQzFsWkRJMU5URTVBQUFBSUdxM2ZDMFpwUExuTEo0d0J2"
      "MXJT";
  const string secondLine =
      "eFM2ZFh3OG1aMHVZazlUcUhjMmVGN2Egbm9tYWQtd3JhcHBlZEBwaG9uZQ==";

  auto key = decodeKey(firstLine + "\n" + secondLine + "\n");
  REQUIRE(key);
  REQUIRE(*key == longKey);

  SECTION("CRLF line breaks") {
    auto crlf = decodeKey(firstLine + "\r\n" + secondLine + "\r\n");
    REQUIRE(crlf);
    REQUIRE(*crlf == longKey);
  }

  SECTION("Interior spaces and tabs") {
    auto spaced = decodeKey(firstLine.substr(0, 40) + " \t" +
                            firstLine.substr(40) + " " + secondLine);
    REQUIRE(spaced);
    REQUIRE(*spaced == longKey);
  }
}

TEST_CASE("decodeKey strips CR and trailing newlines", "[PublicKeyDecoder]") {
  auto key = decodeKey(
      "c3NoLWVkMjU1MTkgQUFBQUMzTnphQzFsWkRJMU5URTVBQUFBSUswIG5vbWFkQHBob25l"
      "DQo=");
  REQUIRE(key);
  REQUIRE(*key == KEY_LINE);
}

TEST_CASE("decodeKey rejects bad blobs", "[PublicKeyDecoder]") {
  REQUIRE_FALSE(decodeKey("not-base64!!"));
  REQUIRE_FALSE(decodeKey(""));
  REQUIRE_FALSE(decodeKey("abc"));
  // Valid base64, invalid UTF-8
  REQUIRE_FALSE(decodeKey("//79"));
  // Only line breaks
  REQUIRE_FALSE(decodeKey("Cg0K"));
  // Two keys
  REQUIRE_FALSE(
      decodeKey("c3NoLWVkMjU1MTkgQUFBQSBvbmUKc3NoLXJzYSBCQkJCIHR3bwo="));
}

TEST_CASE("isValidUtf8", "[PublicKeyDecoder]") {
  REQUIRE(isValidUtf8(""));
  REQUIRE(isValidUtf8("plain ascii"));
  REQUIRE(isValidUtf8("caf\xC3\xA9"));
  REQUIRE(isValidUtf8("\xE2\x82\xAC"));
  REQUIRE(isValidUtf8("\xF0\x9F\x98\x80"));

  // Truncated sequences
  REQUIRE_FALSE(isValidUtf8("\xC3"));
  REQUIRE_FALSE(isValidUtf8("\xE2\x82"));
  // Overlong encoding of '/'
  REQUIRE_FALSE(isValidUtf8("\xC0\xAF"));
  // UTF-16 surrogate
  REQUIRE_FALSE(isValidUtf8("\xED\xA0\x80"));
  // Stray continuation byte
  REQUIRE_FALSE(isValidUtf8("\x80"));
}
