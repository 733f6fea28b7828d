#pragma once

// normalize-id: print the canonical form of each identifier argument.
int cmd_normalize_id(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
