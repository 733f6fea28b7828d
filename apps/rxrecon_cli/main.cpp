#include "commands/import_po.h"
#include "commands/normalize_id.h"
#include "commands/reconcile.h"
#include "rxrecon/core/version.h"

#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "rxrecon v" << rxrecon::core::kBuildVersion << "\n"
            << "Usage: rxrecon_cli <command> [options]\n"
            << "Commands:\n"
            << "  reconcile     Match an invoice against candidate purchase orders\n"
            << "  import-po     Store purchase orders in a SQLite database\n"
            << "  normalize-id  Print the canonical form of NDC/GTIN identifiers\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "reconcile") {
    return cmd_reconcile(argc, argv);
  }
  if (subcommand == "import-po") {
    return cmd_import_po(argc, argv);
  }
  if (subcommand == "normalize-id") {
    return cmd_normalize_id(argc, argv);
  }
  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
