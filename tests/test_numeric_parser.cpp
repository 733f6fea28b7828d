#include "rxrecon/normalize/numeric_parser.h"

#include <catch2/catch.hpp>

using namespace rxrecon;
using Catch::Matchers::WithinAbs;

TEST_CASE("parse_decimal reads printed amounts", "[normalize][numeric]") {
  REQUIRE(normalize::parse_decimal("$1,141.92").has_value());
  CHECK_THAT(*normalize::parse_decimal("$1,141.92"), WithinAbs(1141.92, 1e-9));
  CHECK_THAT(*normalize::parse_decimal(" 23.790 "), WithinAbs(23.79, 1e-9));
  CHECK_THAT(*normalize::parse_decimal("-4.5"), WithinAbs(-4.5, 1e-9));
  CHECK_THAT(*normalize::parse_decimal(".5"), WithinAbs(0.5, 1e-9));
  CHECK_THAT(*normalize::parse_decimal("48"), WithinAbs(48.0, 1e-9));
}

TEST_CASE("parse_decimal rejects non-numbers", "[normalize][numeric]") {
  CHECK_FALSE(normalize::parse_decimal("").has_value());
  CHECK_FALSE(normalize::parse_decimal("$").has_value());
  CHECK_FALSE(normalize::parse_decimal("12.3.4").has_value());
  CHECK_FALSE(normalize::parse_decimal("1e5").has_value());
  CHECK_FALSE(normalize::parse_decimal("twelve").has_value());
  CHECK_FALSE(normalize::parse_decimal("-").has_value());
}

TEST_CASE("parse_quantity accepts whole numbers only", "[normalize][numeric]") {
  CHECK(normalize::parse_quantity("48") == 48);
  CHECK(normalize::parse_quantity("1,200") == 1200);
  CHECK(normalize::parse_quantity("48.0") == 48);
  CHECK(normalize::parse_quantity("-3") == -3);
  CHECK_FALSE(normalize::parse_quantity("48.5").has_value());
  CHECK_FALSE(normalize::parse_quantity("n/a").has_value());
}

TEST_CASE("parse_quantity rejects values outside int64", "[normalize][numeric]") {
  CHECK_FALSE(normalize::parse_quantity("99999999999999999999").has_value());
  CHECK_FALSE(normalize::parse_quantity("-99999999999999999999").has_value());
  CHECK_FALSE(normalize::parse_quantity("9223372036854775808").has_value());
  CHECK(normalize::parse_quantity("1,000,000,000,000") == 1000000000000);
}
