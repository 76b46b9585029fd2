#include <saffron/error.hpp>
#include <catch2/catch_all.hpp>

TEST_CASE("error codes stable subset", "[errors]") {
  using saffron::core::error_code;
  REQUIRE(static_cast<unsigned>(error_code::ok) == 0u);
  REQUIRE(static_cast<unsigned>(error_code::config_invalid) == 2001u);
  REQUIRE(static_cast<unsigned>(error_code::retrieval_failed) == 7002u);
  REQUIRE(static_cast<unsigned>(error_code::all_retrieval_failed) == 7003u);
  REQUIRE(static_cast<unsigned>(error_code::timed_out) == 8002u);
  REQUIRE(static_cast<unsigned>(error_code::internal) == 9001u);
  REQUIRE(static_cast<unsigned>(error_code::invalid_argument) == 9002u);
}

TEST_CASE("error code names", "[errors]") {
  using namespace saffron::core;
  REQUIRE(to_string(error_code::invalid_argument) == "invalid_argument");
  REQUIRE(to_string(error_code::all_retrieval_failed) == "all_retrieval_failed");
  REQUIRE(to_string(error_code::not_initialized) == "not_initialized");
  STATIC_REQUIRE(to_string(error_code::unavailable) == "unavailable");

  auto e = make_unexpected(error_code::timed_out, "slow", "search.dense");
  REQUIRE(e.error().code == error_code::timed_out);
  REQUIRE(e.error().message == "slow");
  REQUIRE(e.error().component == "search.dense");
}
