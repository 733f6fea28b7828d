#pragma once

// reconcile: match one invoice against stored or supplied purchase orders.
int cmd_reconcile(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
