#include "miniocpp/utils/string-utils.hpp"

#include <catch2/catch.hpp>

namespace miniocpp::tests {

CATCH_TEST_CASE("StrUtils", "[str-utils]") {
  CATCH_SECTION("explode") {

    CATCH_REQUIRE(explode("", '/').size() == 1);

    {
      const auto parts = explode("one/two//three/", '/');
      CATCH_REQUIRE(parts.size() == 5);
      CATCH_REQUIRE(parts[0] == "one");
      CATCH_REQUIRE(parts[1] == "two");
      CATCH_REQUIRE(parts[2] == "");
      CATCH_REQUIRE(parts[3] == "three");
      CATCH_REQUIRE(parts[4] == "");
    }
  }

  CATCH_SECTION("trim") {
    CATCH_REQUIRE(trim_copy("") == "");
    CATCH_REQUIRE(trim_copy("  \t ") == "");
    CATCH_REQUIRE(trim_copy(" 60 ") == "60");
    CATCH_REQUIRE(trim_copy("a b") == "a b");

    std::string s = "\n value\t";
    CATCH_REQUIRE(trim(s) == "value");
    CATCH_REQUIRE(s == "value");
  }

  CATCH_SECTION("url_decode") {
    CATCH_REQUIRE(url_decode("") == std::string{});
    CATCH_REQUIRE(url_decode("HeartbeatInterval") == std::string{"HeartbeatInterval"});
    CATCH_REQUIRE(url_decode("CP%2D1") == std::string{"CP-1"});
    CATCH_REQUIRE(url_decode("a+b%20c") == std::string{"a b c"});
    CATCH_REQUIRE(url_decode("%2f%2F") == std::string{"//"});

    // Truncated or non-hex escapes
    CATCH_REQUIRE_FALSE(url_decode("%").has_value());
    CATCH_REQUIRE_FALSE(url_decode("abc%2").has_value());
    CATCH_REQUIRE_FALSE(url_decode("%zz").has_value());
  }
}

} // namespace miniocpp::tests
