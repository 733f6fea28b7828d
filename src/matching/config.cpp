#include "rxrecon/matching/config.h"

#include <nlohmann/json.hpp>

#include <utility>
#include <vector>

namespace rxrecon::matching {

namespace {

using json = nlohmann::json;

template <typename T>
void overlay(const json& j, const char* key, T& field) {
  if (j.contains(key)) {
    field = j.at(key).get<T>();
  }
}

bool in_unit_interval(const double value) {
  return value >= 0.0 && value <= 1.0;
}

}  // namespace

core::Result<bool, std::string> ReconciliationConfig::validate() const {
  using R = core::Result<bool, std::string>;

  const std::vector<std::pair<const char*, double>> weights = {
      {"field_weights.identifier", field_weights.identifier},
      {"field_weights.lot", field_weights.lot},
      {"field_weights.quantity", field_weights.quantity},
      {"field_weights.price", field_weights.price},
      {"aggregate_weights.line_similarity", aggregate_weights.line_similarity},
      {"aggregate_weights.header", aggregate_weights.header},
      {"aggregate_weights.coverage", aggregate_weights.coverage},
  };
  for (const auto& [name, value] : weights) {
    if (value < 0.0) {
      return R::err(std::string(name) + " must not be negative");
    }
  }

  if (field_weights.identifier + field_weights.lot + field_weights.quantity +
          field_weights.price <=
      0.0) {
    return R::err("field_weights must not all be zero");
  }
  if (aggregate_weights.line_similarity + aggregate_weights.header + aggregate_weights.coverage <=
      0.0) {
    return R::err("aggregate_weights must not all be zero");
  }

  const std::vector<std::pair<const char*, double>> thresholds = {
      {"line_match_floor", line_match_floor},
      {"acceptance_threshold", acceptance_threshold},
      {"description_match_threshold", description_match_threshold},
      {"vendor_match_threshold", vendor_match_threshold},
      {"price_variance_tolerance", price_variance_tolerance},
      {"variance_error_threshold", variance_error_threshold},
      {"subtotal_relative_tolerance", subtotal_relative_tolerance},
      {"amount_tolerance", amount_tolerance},
  };
  for (const auto& [name, value] : thresholds) {
    if (!in_unit_interval(value)) {
      return R::err(std::string(name) + " must be within [0, 1]");
    }
  }

  if (candidate_window == 0) {
    return R::err("candidate_window must be at least 1");
  }

  return R::ok(true);
}

std::string config_to_json(const ReconciliationConfig& config) {
  // nlohmann::json objects are std::map backed, so dump() emits keys in sorted order.
  json j;
  j["acceptance_threshold"] = config.acceptance_threshold;
  j["aggregate_weights"] = {{"coverage", config.aggregate_weights.coverage},
                            {"header", config.aggregate_weights.header},
                            {"line_similarity", config.aggregate_weights.line_similarity}};
  j["amount_tolerance"] = config.amount_tolerance;
  j["candidate_window"] = config.candidate_window;
  j["description_match_threshold"] = config.description_match_threshold;
  j["field_weights"] = {{"identifier", config.field_weights.identifier},
                        {"lot", config.field_weights.lot},
                        {"price", config.field_weights.price},
                        {"quantity", config.field_weights.quantity}};
  j["line_match_floor"] = config.line_match_floor;
  j["price_variance_tolerance"] = config.price_variance_tolerance;
  j["subtotal_relative_tolerance"] = config.subtotal_relative_tolerance;
  j["variance_error_threshold"] = config.variance_error_threshold;
  j["vendor_match_threshold"] = config.vendor_match_threshold;
  return j.dump();
}

ReconciliationConfig config_from_json(const std::string& json_str, ReconciliationConfig base) {
  const json j = json::parse(json_str);

  if (j.contains("field_weights")) {
    const json& fw = j.at("field_weights");
    overlay(fw, "identifier", base.field_weights.identifier);
    overlay(fw, "lot", base.field_weights.lot);
    overlay(fw, "quantity", base.field_weights.quantity);
    overlay(fw, "price", base.field_weights.price);
  }
  if (j.contains("aggregate_weights")) {
    const json& aw = j.at("aggregate_weights");
    overlay(aw, "line_similarity", base.aggregate_weights.line_similarity);
    overlay(aw, "header", base.aggregate_weights.header);
    overlay(aw, "coverage", base.aggregate_weights.coverage);
  }

  overlay(j, "line_match_floor", base.line_match_floor);
  overlay(j, "acceptance_threshold", base.acceptance_threshold);
  overlay(j, "description_match_threshold", base.description_match_threshold);
  overlay(j, "vendor_match_threshold", base.vendor_match_threshold);
  overlay(j, "price_variance_tolerance", base.price_variance_tolerance);
  overlay(j, "variance_error_threshold", base.variance_error_threshold);
  overlay(j, "subtotal_relative_tolerance", base.subtotal_relative_tolerance);
  overlay(j, "amount_tolerance", base.amount_tolerance);
  overlay(j, "candidate_window", base.candidate_window);

  return base;
}

}  // namespace rxrecon::matching
