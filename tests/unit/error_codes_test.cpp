#include <visage/error.hpp>
#include <catch2/catch_all.hpp>

TEST_CASE("error codes stable subset", "[errors]") {
  using visage::core::error_code;
  REQUIRE(static_cast<unsigned>(error_code::ok) == 0u);
  REQUIRE(static_cast<unsigned>(error_code::store_failure) == 1001u);
  REQUIRE(static_cast<unsigned>(error_code::config_invalid) == 2001u);
  REQUIRE(static_cast<unsigned>(error_code::data_integrity) == 3001u);
  REQUIRE(static_cast<unsigned>(error_code::validation_failed) == 4001u);
  REQUIRE(static_cast<unsigned>(error_code::not_found) == 6001u);
  REQUIRE(static_cast<unsigned>(error_code::index_unavailable) == 7001u);
  REQUIRE(static_cast<unsigned>(error_code::cancelled) == 8001u);
  REQUIRE(static_cast<unsigned>(error_code::internal) == 9001u);
  REQUIRE(static_cast<unsigned>(error_code::invalid_argument) == 9002u);
}

TEST_CASE("error code names", "[errors]") {
  using visage::core::error_code;
  using visage::core::to_string;
  STATIC_REQUIRE(to_string(error_code::not_found) == "not_found");
  REQUIRE(to_string(error_code::validation_failed) == "validation_failed");
  REQUIRE(to_string(error_code::index_unavailable) == "index_unavailable");
}

TEST_CASE("make_error carries offending ids", "[errors]") {
  using namespace visage::core;
  std::expected<int, error> r = make_error(error_code::validation_failed, "bad faces", "test", {7, 9});
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == error_code::validation_failed);
  CHECK(r.error().component == "test");
  CHECK(r.error().ids == std::vector<std::uint64_t>{7, 9});
}
