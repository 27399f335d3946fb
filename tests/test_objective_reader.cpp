#include <catch2/catch.hpp>

#include <cmath>
#include <sstream>
#include <string>
#include <vector>

#include "tools/objective_reader.h"

using namespace frontrank;

TEST_CASE("commas and whitespace both separate objectives", "[reader]") {
    std::istringstream in("1,4\n2 3\n3,\t2\n  4 ,1  \n");
    std::vector<std::vector<double>> rows = read_objectives(in);

    REQUIRE(rows.size() == 4);
    REQUIRE(rows[0] == std::vector<double>{1, 4});
    REQUIRE(rows[1] == std::vector<double>{2, 3});
    REQUIRE(rows[2] == std::vector<double>{3, 2});
    REQUIRE(rows[3] == std::vector<double>{4, 1});
}

TEST_CASE("comments and blank lines are skipped", "[reader]") {
    std::istringstream in("# f1, f2\n\n1, 1   # best\n   \n# trailing\n2,2\n");
    std::vector<std::vector<double>> rows = read_objectives(in);

    REQUIRE(rows.size() == 2);
    REQUIRE(rows[0] == std::vector<double>{1, 1});
    REQUIRE(rows[1] == std::vector<double>{2, 2});
}

TEST_CASE("nan tokens read as NaN", "[reader][nan]") {
    std::istringstream in("nan,2\nNaN NAN\n-1.5e2,inf\n");
    std::vector<std::vector<double>> rows = read_objectives(in);

    REQUIRE(rows.size() == 3);
    REQUIRE(std::isnan(rows[0][0]));
    REQUIRE(rows[0][1] == 2.0);
    REQUIRE(std::isnan(rows[1][0]));
    REQUIRE(std::isnan(rows[1][1]));
    REQUIRE(rows[2][0] == -150.0);
    REQUIRE(std::isinf(rows[2][1]));
}

TEST_CASE("a bad token reports its line", "[reader][errors]") {
    std::istringstream in("1,2\n\n3,abc\n");
    try {
        read_objectives(in);
        FAIL("expected rank_error");
    } catch (const rank_error& e) {
        REQUIRE(e.code() == error_code::invalid_input);
        REQUIRE(e.message().find("line 3") != std::string::npos);
        REQUIRE(e.message().find("'abc'") != std::string::npos);
    }
}

TEST_CASE("partially numeric tokens are rejected", "[reader][errors]") {
    double v = 0.0;
    REQUIRE_FALSE(parse_value("1.5x", v));
    REQUIRE(parse_value("1.5", v));
    REQUIRE(v == 1.5);
}

TEST_CASE("integer flags must be whole numbers", "[reader]") {
    int v = 7;
    REQUIRE(parse_int("4", v));
    REQUIRE(v == 4);
    REQUIRE_FALSE(parse_int("4threads", v));
    REQUIRE_FALSE(parse_int("", v));
    REQUIRE(v == 4);
}

TEST_CASE("unknown log level names are rejected", "[reader][logging]") {
    spdlog::level::level_enum lvl = spdlog::level::info;
    REQUIRE_FALSE(parse_log_level("bogus", lvl));
    REQUIRE(lvl == spdlog::level::info);

    REQUIRE(parse_log_level("debug", lvl));
    REQUIRE(lvl == spdlog::level::debug);
    REQUIRE(parse_log_level("off", lvl));
    REQUIRE(lvl == spdlog::level::off);
}
