#include "import_po.h"

#include "rxrecon/domain/purchase_order.h"
#include "rxrecon/domain/reconciliation_json.h"
#include "rxrecon/storage/sqlite/sqlite_db.h"
#include "rxrecon/storage/sqlite/sqlite_purchase_order_repository.h"

#include <nlohmann/json.hpp>

#include "shared/arg_parser.h"
#include "shared/json_file.h"
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct ImportPoCliConfig {
  std::optional<std::string> db_path;
  std::optional<std::string> file_path;
};

}  // namespace

int cmd_import_po(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<rxrecon::apps::Option<ImportPoCliConfig>> options = {
      {"--db", true, "Path to SQLite database file (required)",
       [](ImportPoCliConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
      {"--file", true, "Purchase order JSON file (required)",
       [](ImportPoCliConfig& c, const std::string& v) {
         c.file_path = v;
         return true;
       }},
  };
  const auto parsed = rxrecon::apps::parse_options(argc, argv, options, 2);
  const auto& cli = parsed.config;
  if (!parsed.ok() || !cli.db_path || !cli.file_path) {
    rxrecon::apps::print_usage(std::cerr, "rxrecon_cli import-po --db <path> --file <pos.json>",
                               options);
    return 1;
  }

  std::vector<rxrecon::domain::PurchaseOrder> purchase_orders;
  try {
    purchase_orders = rxrecon::domain::purchase_orders_from_json(
        rxrecon::apps::read_json_file(*cli.file_path));
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  // Nothing is written unless every order is valid.
  for (const auto& purchase_order : purchase_orders) {
    if (auto valid = purchase_order.validate(); !valid.has_value()) {
      std::cerr << "Rejected purchase order " << purchase_order.id.value << ": "
                << rxrecon::domain::input_error_to_json(valid.error()).dump() << "\n";
      return 1;
    }
  }

  auto db_result = rxrecon::storage::sqlite::SqliteDb::open(cli.db_path.value());
  if (!db_result.has_value()) {
    std::cerr << "Failed to open database: " << db_result.error() << "\n";
    return 1;
  }
  auto db = db_result.value();
  auto schema_result = db->ensure_schema_v1();
  if (!schema_result.has_value()) {
    std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
    return 1;
  }

  rxrecon::storage::sqlite::SqlitePurchaseOrderRepository po_repo(db);
  nlohmann::json imported = nlohmann::json::array();
  for (const auto& purchase_order : purchase_orders) {
    auto stored = po_repo.upsert(purchase_order);
    if (!stored.has_value()) {
      std::cerr << "Failed to store purchase order " << purchase_order.id.value << ": "
                << stored.error() << "\n";
      return 1;
    }
    imported.push_back(purchase_order.id.value);
  }

  nlohmann::json out;
  out["database"] = cli.db_path.value();
  out["imported"] = imported;
  std::cout << out.dump(2) << "\n";
  return 0;
}
