#include "miniocpp/utils/cli-utils.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace miniocpp::cli::tests {

CATCH_TEST_CASE("CliUtils", "[cli-utils]") {
  std::vector<std::string> args = {"exec-name", "1", "two", "--port", "x9000", "-17"};
  std::vector<char*> argv_s;
  int argc = int(args.size());
  for (auto i = 0; i < argc; ++i)
    argv_s.push_back(args[i].data());
  char** argv = argv_s.data();

  CATCH_SECTION("cli-utils") {
    int i = 0;
    CATCH_REQUIRE(safe_arg_int(argc, argv, i) == 1);
    CATCH_REQUIRE(i == 1);
    CATCH_REQUIRE(safe_arg_str(argc, argv, i) == "two");
    CATCH_REQUIRE(i == 2);
    CATCH_REQUIRE(safe_arg_str(argc, argv, i) == "--port");
    CATCH_REQUIRE(i == 3);
  }

  CATCH_SECTION("bad integer") {
    int i = 3;
    CATCH_REQUIRE_THROWS_AS(safe_arg_int(argc, argv, i), std::runtime_error);
  }

  CATCH_SECTION("negative integer") {
    int i = 4;
    CATCH_REQUIRE(safe_arg_int(argc, argv, i) == -17);
    CATCH_REQUIRE(i == 5);
  }

  CATCH_SECTION("missing argument") {
    int i = argc - 1;
    CATCH_REQUIRE_THROWS_AS(safe_arg_str(argc, argv, i), std::runtime_error);
    i = argc - 1;
    CATCH_REQUIRE_THROWS_AS(safe_arg_int(argc, argv, i), std::runtime_error);
  }

  CATCH_SECTION("help") {
    CATCH_REQUIRE(is_help_switch("-h"));
    CATCH_REQUIRE(is_help_switch("--help"));
    CATCH_REQUIRE_FALSE(is_help_switch("help"));
    CATCH_REQUIRE_FALSE(is_help_switch("-help"));
  }
}

} // namespace miniocpp::cli::tests
