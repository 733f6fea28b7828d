#pragma once

// import-po: upsert purchase orders from a JSON file into a SQLite database.
int cmd_import_po(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
