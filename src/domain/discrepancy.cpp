#include "rxrecon/domain/discrepancy.h"

namespace rxrecon::domain {

const char* discrepancy_kind_to_string(const DiscrepancyKind kind) {
  switch (kind) {
    case DiscrepancyKind::kNoConfidentMatch:
      return "no-confident-match";
    case DiscrepancyKind::kSubtotalMismatch:
      return "subtotal-mismatch";
    case DiscrepancyKind::kPoNumberMismatch:
      return "po-number-mismatch";
    case DiscrepancyKind::kQuantityMismatch:
      return "quantity-mismatch";
    case DiscrepancyKind::kPriceVariance:
      return "price-variance";
    case DiscrepancyKind::kIdentifierMismatch:
      return "identifier-mismatch";
    case DiscrepancyKind::kLotMismatch:
      return "lot-mismatch";
    case DiscrepancyKind::kLineTotalMismatch:
      return "line-total-mismatch";
    case DiscrepancyKind::kLowConfidenceIdentifier:
      return "low-confidence-identifier";
    case DiscrepancyKind::kLotExpired:
      return "lot-expired";
    case DiscrepancyKind::kUnmatchedInvoiceLine:
      return "unmatched-invoice-line";
    case DiscrepancyKind::kUnmatchedPoLine:
      return "unmatched-po-line";
  }
  return "unknown";
}

const char* severity_to_string(const Severity severity) {
  switch (severity) {
    case Severity::kInfo:
      return "info";
    case Severity::kWarning:
      return "warning";
    case Severity::kError:
      return "error";
  }
  return "unknown";
}

bool is_header_kind(const DiscrepancyKind kind) {
  return kind == DiscrepancyKind::kNoConfidentMatch || kind == DiscrepancyKind::kSubtotalMismatch ||
         kind == DiscrepancyKind::kPoNumberMismatch;
}

}  // namespace rxrecon::domain
