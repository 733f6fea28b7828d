#pragma once

#include <optional>
#include <string>

namespace rxrecon::domain {

// DiscrepancyKind enumerators are declared in report order: header kinds first,
// then the per-line kinds in the order they are listed for one invoice line.
enum class DiscrepancyKind {
  kNoConfidentMatch,
  kSubtotalMismatch,
  kPoNumberMismatch,
  kQuantityMismatch,
  kPriceVariance,
  kIdentifierMismatch,
  kLotMismatch,
  kLineTotalMismatch,
  kLowConfidenceIdentifier,
  kLotExpired,
  kUnmatchedInvoiceLine,
  kUnmatchedPoLine,
};

enum class Severity {
  kInfo,
  kWarning,
  kError,
};

[[nodiscard]] const char* discrepancy_kind_to_string(DiscrepancyKind kind);
[[nodiscard]] const char* severity_to_string(Severity severity);

// is_header_kind is true for issues that concern the whole document pair
// rather than a single line.
[[nodiscard]] bool is_header_kind(DiscrepancyKind kind);

struct Discrepancy {
  DiscrepancyKind kind{DiscrepancyKind::kNoConfidentMatch};
  Severity severity{Severity::kInfo};
  std::optional<int> invoice_line;
  std::optional<int> po_line;
  std::string detail;
};

}  // namespace rxrecon::domain
