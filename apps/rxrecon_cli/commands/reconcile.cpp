#include "reconcile.h"

#include "reconcile_logic.h"
#include "rxrecon/app/app_service.h"
#include "rxrecon/core/clock.h"
#include "rxrecon/core/id_generator.h"
#include "rxrecon/core/ids.h"
#include "rxrecon/core/services.h"
#include "rxrecon/domain/purchase_order.h"
#include "rxrecon/domain/reconciliation_json.h"
#include "rxrecon/matching/config.h"
#include "rxrecon/matching/presets.h"
#include "rxrecon/normalize/date_normalizer.h"
#include "rxrecon/normalize/numeric_parser.h"
#include "rxrecon/storage/audit_log.h"
#include "rxrecon/storage/inmemory_purchase_order_repository.h"
#include "rxrecon/storage/sqlite/sqlite_audit_log.h"
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

struct ReconcileCliConfig {
  std::optional<std::string> db_path;
  std::optional<std::string> invoice_path;
  std::optional<std::string> purchase_orders_path;
  std::vector<std::string> po_ids;
  std::optional<rxrecon::domain::CalendarDate> as_of;
  std::optional<std::string> config_path;
  std::string preset{"default"};
  std::optional<double> min_score;
  std::optional<double> line_floor;
  bool show_audit{false};
};

bool set_fraction(std::optional<double>& target, const std::string& flag, const std::string& v) {
  const auto parsed = rxrecon::normalize::parse_decimal(v);
  if (!parsed || *parsed < 0.0 || *parsed > 1.0) {
    std::cerr << "Invalid " << flag << ": " << v << " (expected a number in [0, 1])\n";
    return false;
  }
  target = *parsed;
  return true;
}

const std::vector<rxrecon::apps::Option<ReconcileCliConfig>>& reconcile_options() {
  static const std::vector<rxrecon::apps::Option<ReconcileCliConfig>> options = {
      {"--invoice", true, "Extracted invoice JSON file (required)",
       [](ReconcileCliConfig& c, const std::string& v) {
         c.invoice_path = v;
         return true;
       }},
      {"--purchase-orders", true, "Purchase order JSON file, stored before matching",
       [](ReconcileCliConfig& c, const std::string& v) {
         c.purchase_orders_path = v;
         return true;
       }},
      {"--db", true, "Path to SQLite database file (default: in-memory)",
       [](ReconcileCliConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
      {"--po-id", true, "Candidate purchase order id (repeatable; default: infer)",
       [](ReconcileCliConfig& c, const std::string& v) {
         c.po_ids.push_back(v);
         return true;
       }},
      {"--as-of", true, "Reference date for lot expiry (default: today, UTC)",
       [](ReconcileCliConfig& c, const std::string& v) {
         c.as_of = rxrecon::normalize::normalize_date(v);
         if (!c.as_of) {
           std::cerr << "Invalid --as-of: " << v << "\n";
           return false;
         }
         return true;
       }},
      {"--config", true, "JSON file overlaid onto the preset",
       [](ReconcileCliConfig& c, const std::string& v) {
         c.config_path = v;
         return true;
       }},
      {"--preset", true, "Base configuration (default|strict)",
       [](ReconcileCliConfig& c, const std::string& v) {
         if (v == "default" || v == "strict") {
           c.preset = v;
           return true;
         }
         std::cerr << "Invalid --preset: " << v << " (valid: default, strict)\n";
         return false;
       }},
      {"--min-score", true, "Acceptance threshold override",
       [](ReconcileCliConfig& c, const std::string& v) {
         return set_fraction(c.min_score, "--min-score", v);
       }},
      {"--line-floor", true, "Line match floor override",
       [](ReconcileCliConfig& c, const std::string& v) {
         return set_fraction(c.line_floor, "--line-floor", v);
       }},
      {"--show-audit", false, "Print the audit trail after the result",
       [](ReconcileCliConfig& c, const std::string&) {
         c.show_audit = true;
         return true;
       }},
  };
  return options;
}

// Preset, then config file, then individual flags.
rxrecon::matching::ReconciliationConfig build_config(const ReconcileCliConfig& cli) {
  auto config = cli.preset == "strict" ? rxrecon::matching::strict_compliance_preset()
                                       : rxrecon::matching::default_config();
  if (cli.config_path) {
    config = rxrecon::matching::config_from_json(rxrecon::apps::read_text_file(*cli.config_path),
                                                 config);
  }
  if (cli.min_score) {
    config.acceptance_threshold = *cli.min_score;
  }
  if (cli.line_floor) {
    config.line_match_floor = *cli.line_floor;
  }
  return config;
}

}  // namespace

int cmd_reconcile(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto& options = reconcile_options();
  const auto parsed = rxrecon::apps::parse_options(argc, argv, options, 2);
  const auto& cli = parsed.config;

  if (!parsed.ok() || !cli.invoice_path) {
    if (!cli.invoice_path) {
      std::cerr << "Error: --invoice <file> is required\n";
    }
    rxrecon::apps::print_usage(std::cerr, "rxrecon_cli reconcile --invoice <file> [options]",
                               options);
    return kExitInputError;
  }

  rxrecon::app::ReconciliationRequest request;
  std::vector<rxrecon::domain::PurchaseOrder> purchase_orders;
  try {
    request.invoice =
        rxrecon::domain::invoice_from_json(rxrecon::apps::read_json_file(*cli.invoice_path));
    if (cli.purchase_orders_path) {
      purchase_orders = rxrecon::domain::purchase_orders_from_json(
          rxrecon::apps::read_json_file(*cli.purchase_orders_path));
    }
    request.config = build_config(cli);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return kExitInputError;
  }
  for (const auto& id : cli.po_ids) {
    request.explicit_po_ids.push_back(rxrecon::core::PurchaseOrderId{id});
  }
  request.as_of = cli.as_of;

  rxrecon::core::SystemIdGenerator id_gen;
  rxrecon::core::SystemClock clock;

  try {
    if (cli.db_path.has_value()) {
      auto db_result = rxrecon::storage::sqlite::SqliteDb::open(cli.db_path.value());
      if (!db_result.has_value()) {
        std::cerr << "Failed to open database: " << db_result.error() << "\n";
        return kExitInputError;
      }

      auto db = db_result.value();
      auto schema_result = db->ensure_schema_v1();
      if (!schema_result.has_value()) {
        std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
        return kExitInputError;
      }

      rxrecon::storage::sqlite::SqlitePurchaseOrderRepository po_repo(db);
      rxrecon::storage::sqlite::SqliteAuditLog audit_log(db);
      rxrecon::core::Services services{po_repo, audit_log};
      return run_reconcile(services, id_gen, clock, purchase_orders, request, cli.show_audit);
    }

    rxrecon::storage::InMemoryPurchaseOrderRepository po_repo;
    rxrecon::storage::InMemoryAuditLog audit_log;
    rxrecon::core::Services services{po_repo, audit_log};
    return run_reconcile(services, id_gen, clock, purchase_orders, request, cli.show_audit);
  } catch (const std::exception& e) {
    // SqliteAuditLog::append throws when the audit record cannot be written.
    std::cerr << "Error: " << e.what() << "\n";
    return kExitInputError;
  }
}
