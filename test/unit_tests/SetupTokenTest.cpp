#include "SetupToken.hpp"
#include "TestHeaders.hpp"

using namespace nomad;

TEST_CASE("newToken is a canonical version 4 UUID", "[SetupToken]") {
  string token = newToken();
  REQUIRE(token.size() == 36);
  for (size_t i = 0; i < token.size(); i++) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      REQUIRE(token[i] == '-');
    } else {
      INFO("token=" << token << " index=" << i);
      REQUIRE(string("0123456789abcdef").find(token[i]) != string::npos);
    }
  }
  REQUIRE(token[14] == '4');
  REQUIRE(string("89ab").find(token[19]) != string::npos);
}

TEST_CASE("newToken does not repeat", "[SetupToken]") {
  set<string> tokens;
  for (int i = 0; i < 10000; i++) {
    tokens.insert(newToken());
  }
  REQUIRE(tokens.size() == 10000);
}
