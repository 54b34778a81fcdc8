#include "Headers.hpp"
#include "TestHeaders.hpp"

using namespace agt;

TEST_CASE("split breaks on the delimiter", "[StringUtils]") {
  REQUIRE(split("/usr/local/bin:/usr/bin:/bin", ':') ==
          vector<string>({"/usr/local/bin", "/usr/bin", "/bin"}));
  REQUIRE(split("/ws/terminal/demo/claude", '/') ==
          vector<string>({"", "ws", "terminal", "demo", "claude"}));
}

TEST_CASE("split keeps inner empty fields and drops a trailing one",
          "[StringUtils]") {
  REQUIRE(split("a::b", ':') == vector<string>({"a", "", "b"}));
  REQUIRE(split("a:", ':') == vector<string>({"a"}));
  REQUIRE(split("", ':').empty());
}

TEST_CASE("toLower only touches ascii letters", "[StringUtils]") {
  REQUIRE(toLower("SIGTerm") == "sigterm");
  REQUIRE(toLower("Claude-Sonnet-4") == "claude-sonnet-4");
  REQUIRE(toLower("caf\xC3\x89") == "caf\xC3\x89");
}
