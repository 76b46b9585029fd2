/** \file recipe_test.cpp
 *  \brief Unit tests for the recipe record helpers.
 */

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>

#include "saffron/log.hpp"
#include "saffron/recipe.hpp"
#include "tests/support/recipe_fixtures.hpp"

using namespace saffron;

TEST_CASE("difficulty parsing", "[recipe]") {
    REQUIRE(parse_difficulty("Beginner") == Difficulty::Beginner);
    REQUIRE(parse_difficulty("INTERMEDIATE") == Difficulty::Intermediate);
    REQUIRE(parse_difficulty("advanced") == Difficulty::Advanced);
    REQUIRE(to_string(Difficulty::Advanced) == "Advanced");

    auto bad = parse_difficulty("hard");
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == core::error_code::invalid_argument);
    REQUIRE_FALSE(parse_difficulty("").has_value());
}

TEST_CASE("total time needs both components", "[recipe]") {
    auto m = recipe_fixtures::make_doc("r", "Soup", {"leek"}, {}, Difficulty::Beginner, 10, 25).metadata;
    REQUIRE(m.total_time_minutes() == 35);
    m.cook_time_minutes.reset();
    REQUIRE_FALSE(m.total_time_minutes().has_value());

    m.cook_time_minutes = std::numeric_limits<std::int64_t>::max();
    REQUIRE_FALSE(m.total_time_minutes().has_value());
    m.cook_time_minutes = -1;
    REQUIRE_FALSE(m.total_time_minutes().has_value());
}

TEST_CASE("searchable text joins title, ingredients and instructions", "[recipe]") {
    auto d = recipe_fixtures::make_doc("r", "Soup", {"leek", "potato"}, {"Boil."});
    REQUIRE(d.searchable_text() == "Soup leek potato Boil.");
}

TEST_CASE("metadata integers parse strictly", "[recipe]") {
    REQUIRE(parse_metadata_int("45") == 45);
    REQUIRE(parse_metadata_int(" +30 ") == 30);
    REQUIRE_FALSE(parse_metadata_int("-5").has_value());
    REQUIRE_FALSE(parse_metadata_int("+-5").has_value());
    REQUIRE_FALSE(parse_metadata_int("++5").has_value());
    REQUIRE_FALSE(parse_metadata_int("+").has_value());
    REQUIRE_FALSE(parse_metadata_int("").has_value());
    REQUIRE_FALSE(parse_metadata_int("30 min").has_value());
    REQUIRE_FALSE(parse_metadata_int("2.5").has_value());
    REQUIRE_FALSE(parse_metadata_int("99999999999999999999").has_value());
}

TEST_CASE("log levels", "[log]") {
    REQUIRE(log::is_valid_level("debug"));
    REQUIRE(log::is_valid_level("warning"));
    REQUIRE_FALSE(log::is_valid_level("verbose"));
    REQUIRE(log::set_level("warn"));
    REQUIRE(log::logger()->level() == spdlog::level::warn);
    REQUIRE_FALSE(log::set_level("verbose"));
    REQUIRE(log::logger()->level() == spdlog::level::warn);
    REQUIRE(log::set_level("info"));
    REQUIRE(log::logger() == log::logger());
}
