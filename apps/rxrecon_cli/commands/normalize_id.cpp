#include "normalize_id.h"

#include "rxrecon/domain/reconciliation_json.h"
#include "rxrecon/normalize/identifier_normalizer.h"

#include <nlohmann/json.hpp>

#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct NormalizeIdCliConfig {};

}  // namespace

int cmd_normalize_id(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<rxrecon::apps::Option<NormalizeIdCliConfig>> options;
  const auto parsed = rxrecon::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok() || parsed.positionals.empty()) {
    std::cerr << "Usage: rxrecon_cli normalize-id <identifier>...\n";
    return 1;
  }

  nlohmann::json out = nlohmann::json::array();
  for (const auto& raw : parsed.positionals) {
    auto entry = rxrecon::domain::canonical_identifier_to_json(
        rxrecon::normalize::normalize_identifier(raw));
    entry["raw"] = raw;
    out.push_back(entry);
  }
  std::cout << out.dump(2) << "\n";
  return 0;
}
