#include "SetupErrors.hpp"
#include "TestHeaders.hpp"
#include "UrlEncoding.hpp"

using namespace nomad;

TEST_CASE("formEncode leaves unreserved characters alone", "[UrlEncoding]") {
  REQUIRE(formEncode("AZaz09-._~") == "AZaz09-._~");
  REQUIRE(formEncode("") == "");
}

TEST_CASE("formEncode uses plus for space and upper-case escapes",
          "[UrlEncoding]") {
  REQUIRE(formEncode("a b") == "a+b");
  REQUIRE(formEncode("a+b") == "a%2Bb");
  REQUIRE(formEncode("/?:@") == "%2F%3F%3A%40");
  REQUIRE(formEncode("\xE2\x82\xAC") == "%E2%82%AC");
}

TEST_CASE("formDecode accepts either hex case", "[UrlEncoding]") {
  REQUIRE(formDecode("a+b%2bc%2Fd") == "a b+c/d");
  REQUIRE(formDecode("%e2%82%ac") == "\xE2\x82\xAC");
}

TEST_CASE("formDecode rejects broken escapes", "[UrlEncoding]") {
  REQUIRE_THROWS_AS(formDecode("%"), InvalidArgument);
  REQUIRE_THROWS_AS(formDecode("abc%4"), InvalidArgument);
  REQUIRE_THROWS_AS(formDecode("%zz"), InvalidArgument);
}

TEST_CASE("percentEncode keeps the safe set", "[UrlEncoding]") {
  REQUIRE(percentEncode("nomad://connect?host=h&port=22") ==
          "nomad%3A//connect%3Fhost%3Dh%26port%3D22");
  REQUIRE(percentEncode("a b") == "a%20b");
  REQUIRE(percentEncode("a/b", "") == "a%2Fb");
}
