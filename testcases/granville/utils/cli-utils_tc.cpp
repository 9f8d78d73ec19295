
#include "stdinc.hpp"

#include "granville/utils/cli-utils.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace granville::cli::tests {

// Holds the strings behind a mutable argv
struct ArgV {
  std::vector<std::string> args;
  std::vector<char*> argv;

  ArgV(std::initializer_list<std::string> list) : args{list} {
    for (auto& arg : args)
      argv.push_back(arg.data());
  }

  int argc() const { return int(argv.size()); }
  char** data() { return argv.data(); }
};

CATCH_TEST_CASE("CliUtils", "[cli-utils]") {
  CATCH_SECTION("safe-arg") {
    ArgV args{"exec-name", "1", "two", "three"};
    const int argc = args.argc();
    char** argv = args.data();

    int i = 0;
    CATCH_REQUIRE(safe_arg_int(argc, argv, i) == 1);
    CATCH_REQUIRE(i == 1);
    CATCH_REQUIRE(safe_arg_str(argc, argv, i) == "two");
    CATCH_REQUIRE(i == 2);
    CATCH_REQUIRE(safe_arg_str(argc, argv, i) == "three");
    CATCH_REQUIRE(i == 3);
  }

  CATCH_SECTION("missing-value") {
    ArgV args{"exec-name", "--server"};
    int i = 1;
    CATCH_REQUIRE_THROWS_AS(safe_arg_str(args.argc(), args.data(), i), std::runtime_error);
  }

  CATCH_SECTION("range") {
    ArgV args{"exec-name", "--retries", "7", "--retries", "-1", "--retries", "3x"};
    int i = 1;
    CATCH_REQUIRE(safe_arg_int(args.argc(), args.data(), i, 0, 10) == 7);
    i = 3;
    CATCH_REQUIRE_THROWS_AS(safe_arg_int(args.argc(), args.data(), i, 0, 10), std::runtime_error);
    i = 5;
    CATCH_REQUIRE_THROWS_AS(safe_arg_int(args.argc(), args.data(), i, 0, 10), std::runtime_error);
  }

  CATCH_SECTION("help") {
    CATCH_REQUIRE(is_help_flag("-h"));
    CATCH_REQUIRE(is_help_flag("--help"));
    CATCH_REQUIRE(!is_help_flag("--heartbeat"));
  }
}

} // namespace granville::cli::tests
