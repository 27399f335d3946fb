#include <catch2/catch.hpp>

#include <string>

#include "frontrank/utils/moo/ndsort.h"
#include "frontrank/utils/moo/options.h"

using namespace frontrank;

TEST_CASE("default options are serial and valid", "[options]") {
    rank_options options;
    REQUIRE(options.threads == 1);
    REQUIRE_NOTHROW(options.validate_or_throw());
}

TEST_CASE("negative thread count is invalid input", "[options]") {
    rank_options options;
    options.threads = -2;
    try {
        options.validate_or_throw();
        FAIL("expected rank_error");
    } catch (const rank_error& e) {
        REQUIRE(e.code() == error_code::invalid_input);
        REQUIRE(std::string(e.what()).find("threads") != std::string::npos);
    }
}

TEST_CASE("negative threshold is invalid input", "[options]") {
    rank_options options;
    options.parallel_threshold = -1;
    REQUIRE_THROWS_AS(options.validate_or_throw(), rank_error);
}

TEST_CASE("ranking validates options before touching the population", "[options]") {
    rank_options options;
    options.threads = -1;
    std::vector<individual> population = {individual({1, 1})};
    REQUIRE_THROWS_AS(assign_ranks(population, options), rank_error);
    REQUIRE_FALSE(population[0].ranked());
}

TEST_CASE("error message carries the error kind", "[errors]") {
    try {
        FRONTRANK_THROW(error_code::internal, "broken");
        FAIL("expected rank_error");
    } catch (const rank_error& e) {
        REQUIRE(e.message() == "broken");
        REQUIRE(std::string(e.what()).find("Internal") != std::string::npos);
    }
}
