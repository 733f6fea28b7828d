#include "rxrecon/matching/config.h"
#include "rxrecon/matching/presets.h"

#include <nlohmann/json.hpp>

#include <catch2/catch.hpp>

using namespace rxrecon;
using Catch::Matchers::WithinAbs;

TEST_CASE("Default config is valid", "[config]") {
  const auto config = matching::default_config();
  REQUIRE(config.validate().has_value());
  CHECK_THAT(config.line_match_floor, WithinAbs(0.35, 1e-12));
  CHECK_THAT(config.acceptance_threshold, WithinAbs(0.50, 1e-12));
  CHECK_THAT(config.field_weights.identifier, WithinAbs(0.45, 1e-12));
  CHECK(config.candidate_window == 10);
}

TEST_CASE("Strict preset raises the bar", "[config][presets]") {
  const auto strict = matching::strict_compliance_preset();
  const auto defaults = matching::default_config();
  REQUIRE(strict.validate().has_value());
  CHECK(strict.acceptance_threshold > defaults.acceptance_threshold);
  CHECK(strict.line_match_floor > defaults.line_match_floor);
  CHECK(strict.field_weights.identifier > defaults.field_weights.identifier);
  CHECK(strict.price_variance_tolerance < defaults.price_variance_tolerance);
}

TEST_CASE("ReconciliationConfig::validate rejects bad values", "[config]") {
  auto config = matching::default_config();

  SECTION("negative weight") {
    config.field_weights.lot = -0.1;
    auto result = config.validate();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().find("field_weights.lot") != std::string::npos);
  }

  SECTION("all-zero field weights") {
    config.field_weights = matching::FieldWeights{0.0, 0.0, 0.0, 0.0};
    CHECK_FALSE(config.validate().has_value());
  }

  SECTION("all-zero aggregate weights") {
    config.aggregate_weights = matching::AggregateWeights{0.0, 0.0, 0.0};
    CHECK_FALSE(config.validate().has_value());
  }

  SECTION("threshold above 1") {
    config.acceptance_threshold = 1.5;
    auto result = config.validate();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().find("acceptance_threshold") != std::string::npos);
  }

  SECTION("empty candidate window") {
    config.candidate_window = 0;
    CHECK_FALSE(config.validate().has_value());
  }
}

TEST_CASE("config_to_json writes sorted keys", "[config][json]") {
  const std::string text = matching::config_to_json(matching::default_config());
  const auto j = nlohmann::json::parse(text);

  CHECK(j.at("candidate_window").get<int>() == 10);
  CHECK_THAT(j.at("field_weights").at("price").get<double>(), WithinAbs(0.20, 1e-12));
  CHECK(text.find("\"acceptance_threshold\"") < text.find("\"vendor_match_threshold\""));
}

TEST_CASE("config_from_json overlays onto a base", "[config][json]") {
  SECTION("partial file keeps the remaining values") {
    const auto config = matching::config_from_json(
        R"({"acceptance_threshold": 0.8, "field_weights": {"lot": 0.0}, "unknown_key": 1})");
    CHECK_THAT(config.acceptance_threshold, WithinAbs(0.8, 1e-12));
    CHECK_THAT(config.field_weights.lot, WithinAbs(0.0, 1e-12));
    CHECK_THAT(config.field_weights.identifier, WithinAbs(0.45, 1e-12));
    CHECK_THAT(config.line_match_floor, WithinAbs(0.35, 1e-12));
  }

  SECTION("base preset values survive") {
    const auto config = matching::config_from_json(R"({"candidate_window": 3})",
                                                   matching::strict_compliance_preset());
    CHECK(config.candidate_window == 3);
    CHECK_THAT(config.acceptance_threshold, WithinAbs(0.75, 1e-12));
  }

  SECTION("round trip") {
    auto original = matching::strict_compliance_preset();
    original.amount_tolerance = 0.05;
    const auto restored = matching::config_from_json(matching::config_to_json(original));
    CHECK(matching::config_to_json(restored) == matching::config_to_json(original));
  }

  SECTION("malformed input throws") {
    CHECK_THROWS_AS(matching::config_from_json("{not json"), nlohmann::json::parse_error);
    CHECK_THROWS_AS(matching::config_from_json(R"({"line_match_floor": "high"})"),
                    nlohmann::json::type_error);
  }
}
