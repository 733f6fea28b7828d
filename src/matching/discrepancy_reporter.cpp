#include "rxrecon/matching/discrepancy_reporter.h"

#include "rxrecon/matching/line_item_matcher.h"
#include "rxrecon/matching/score_aggregator.h"
#include "rxrecon/normalize/identifier_normalizer.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <map>

namespace rxrecon::matching {

namespace {

using domain::Discrepancy;
using domain::DiscrepancyKind;
using domain::Severity;

std::string format_amount(const double value) {
  char buffer[48];
  std::snprintf(buffer, sizeof(buffer), "%.2f", value);
  return buffer;
}

std::string format_percent(const double ratio) {
  char buffer[48];
  std::snprintf(buffer, sizeof(buffer), "%.1f%%", ratio * 100.0);
  return buffer;
}

Discrepancy line_issue(const DiscrepancyKind kind, const Severity severity,
                       const std::optional<int> invoice_line, const std::optional<int> po_line,
                       std::string detail) {
  return Discrepancy{.kind = kind,
                     .severity = severity,
                     .invoice_line = invoice_line,
                     .po_line = po_line,
                     .detail = std::move(detail)};
}

bool has_text(const std::optional<std::string>& value) {
  return value.has_value() && !lot_key(*value).empty();
}

}  // namespace

DiscrepancyReporter::DiscrepancyReporter(ReconciliationConfig config)
    : config_(std::move(config)) {}

std::vector<Discrepancy> DiscrepancyReporter::report(
    const std::vector<domain::LineItemMatch>& line_matches, const domain::Invoice& invoice,
    const domain::PurchaseOrder* candidate, const domain::CalendarDate& as_of) const {
  std::vector<Discrepancy> issues;

  // Header
  const double subtotal = invoice.totals.subtotal;
  if (subtotal > 0.0) {
    const double item_sum = invoice.item_total_sum();
    const double tolerance =
        std::max(config_.amount_tolerance, config_.subtotal_relative_tolerance * subtotal);
    if (std::fabs(item_sum - subtotal) > tolerance) {
      issues.push_back(Discrepancy{
          .kind = DiscrepancyKind::kSubtotalMismatch,
          .severity = Severity::kWarning,
          .detail = "line totals sum to " + format_amount(item_sum) + " but subtotal is " +
                    format_amount(subtotal)});
    }
  }

  if (candidate != nullptr && invoice.po_number && !invoice.po_number->empty() &&
      !po_numbers_equal(*invoice.po_number, candidate->po_number)) {
    issues.push_back(Discrepancy{.kind = DiscrepancyKind::kPoNumberMismatch,
                                 .severity = Severity::kInfo,
                                 .detail = "invoice references PO '" + *invoice.po_number +
                                           "' but matched PO number is '" +
                                           candidate->po_number + "'"});
  }

  // Invoice lines
  std::map<int, const domain::LineItemMatch*> by_invoice_line;
  for (const auto& match : line_matches) {
    if (match.invoice_line) {
      by_invoice_line[*match.invoice_line] = &match;
    }
  }

  std::map<int, const domain::PurchaseOrderLineItem*> po_lines;
  if (candidate != nullptr) {
    for (const auto& item : candidate->items) {
      po_lines[item.line_number] = &item;
    }
  }

  std::vector<const domain::InvoiceLineItem*> invoice_lines;
  invoice_lines.reserve(invoice.items.size());
  for (const auto& item : invoice.items) {
    invoice_lines.push_back(&item);
  }
  std::stable_sort(invoice_lines.begin(), invoice_lines.end(),
                   [](const auto* a, const auto* b) { return a->line_number < b->line_number; });

  for (const auto* invoice_item : invoice_lines) {
    std::vector<Discrepancy> line_issues;

    const domain::PurchaseOrderLineItem* po_item = nullptr;
    const auto found = by_invoice_line.find(invoice_item->line_number);
    if (found != by_invoice_line.end() && found->second->po_line) {
      const auto po_it = po_lines.find(*found->second->po_line);
      if (po_it != po_lines.end()) {
        po_item = po_it->second;
      }
    }

    if (po_item != nullptr) {
      report_pair(*invoice_item, *po_item, line_issues);
    }
    report_invoice_only(*invoice_item, as_of, line_issues);
    if (candidate != nullptr && po_item == nullptr) {
      line_issues.push_back(line_issue(DiscrepancyKind::kUnmatchedInvoiceLine, Severity::kError,
                                       invoice_item->line_number, std::nullopt,
                                       "no purchase-order line matches '" +
                                           invoice_item->description + "'"));
    }

    std::stable_sort(line_issues.begin(), line_issues.end(),
                     [](const Discrepancy& a, const Discrepancy& b) { return a.kind < b.kind; });
    issues.insert(issues.end(), line_issues.begin(), line_issues.end());
  }

  // Unmatched PO lines
  if (candidate != nullptr) {
    std::vector<int> unmatched;
    for (const auto& match : line_matches) {
      if (!match.invoice_line && match.po_line) {
        unmatched.push_back(*match.po_line);
      }
    }
    std::sort(unmatched.begin(), unmatched.end());
    for (const int line : unmatched) {
      const auto po_it = po_lines.find(line);
      const std::string description =
          po_it != po_lines.end() ? po_it->second->description : std::string{};
      issues.push_back(line_issue(DiscrepancyKind::kUnmatchedPoLine, Severity::kError,
                                  std::nullopt, line,
                                  "ordered line '" + description + "' was not invoiced"));
    }
  }

  return issues;
}

void DiscrepancyReporter::report_pair(const domain::InvoiceLineItem& invoice_item,
                                      const domain::PurchaseOrderLineItem& po_item,
                                      std::vector<Discrepancy>& out) const {
  const int inv_line = invoice_item.line_number;
  const int po_line = po_item.line_number;

  if (invoice_item.quantity != po_item.quantity) {
    const double variance =
        std::fabs(static_cast<double>(invoice_item.quantity - po_item.quantity)) /
        std::max(static_cast<double>(po_item.quantity), 1.0);
    const Severity severity =
        variance > config_.variance_error_threshold ? Severity::kError : Severity::kWarning;
    out.push_back(line_issue(DiscrepancyKind::kQuantityMismatch, severity, inv_line, po_line,
                             "invoiced " + std::to_string(invoice_item.quantity) + ", ordered " +
                                 std::to_string(po_item.quantity) + " (" +
                                 format_percent(variance) + ")"));
  }

  const double price_variance = std::fabs(invoice_item.unit_price - po_item.unit_price) /
                                std::max(po_item.unit_price, 0.01);
  if (price_variance > config_.price_variance_tolerance) {
    const Severity severity =
        price_variance > config_.variance_error_threshold ? Severity::kError : Severity::kWarning;
    out.push_back(line_issue(DiscrepancyKind::kPriceVariance, severity, inv_line, po_line,
                             "unit price " + format_amount(invoice_item.unit_price) + " vs " +
                                 format_amount(po_item.unit_price) + " (" +
                                 format_percent(price_variance) + ")"));
  }

  const auto invoice_id = normalize::normalize_optional_identifier(invoice_item.identifier);
  const auto po_id = normalize::normalize_optional_identifier(po_item.identifier);
  if (invoice_id && po_id && invoice_id->is_canonical() && po_id->is_canonical() &&
      invoice_id->key() != po_id->key()) {
    out.push_back(line_issue(DiscrepancyKind::kIdentifierMismatch, Severity::kWarning, inv_line,
                             po_line, "invoice NDC " + invoice_id->key() + ", ordered NDC " +
                                          po_id->key()));
  }

  if (has_text(invoice_item.lot_number) && has_text(po_item.lot_number) &&
      lot_key(*invoice_item.lot_number) != lot_key(*po_item.lot_number)) {
    out.push_back(line_issue(DiscrepancyKind::kLotMismatch, Severity::kWarning, inv_line, po_line,
                             "lot " + *invoice_item.lot_number + " vs ordered lot " +
                                 *po_item.lot_number));
  }
}

void DiscrepancyReporter::report_invoice_only(const domain::InvoiceLineItem& invoice_item,
                                              const domain::CalendarDate& as_of,
                                              std::vector<Discrepancy>& out) const {
  const int inv_line = invoice_item.line_number;

  const double extended = static_cast<double>(invoice_item.quantity) * invoice_item.unit_price;
  if (std::fabs(extended - invoice_item.total_price) > config_.amount_tolerance) {
    out.push_back(line_issue(DiscrepancyKind::kLineTotalMismatch, Severity::kInfo, inv_line,
                             std::nullopt,
                             "quantity x unit price is " + format_amount(extended) +
                                 " but line total is " + format_amount(invoice_item.total_price)));
  }

  if (const auto id = normalize::normalize_optional_identifier(invoice_item.identifier);
      id && !id->is_canonical()) {
    out.push_back(line_issue(DiscrepancyKind::kLowConfidenceIdentifier, Severity::kInfo, inv_line,
                             std::nullopt,
                             "identifier '" + *invoice_item.identifier +
                                 "' is not a recognizable NDC or GTIN"));
  }

  if (invoice_item.expiry_date && *invoice_item.expiry_date < as_of) {
    out.push_back(line_issue(DiscrepancyKind::kLotExpired, Severity::kError, inv_line,
                             std::nullopt,
                             "expired " + invoice_item.expiry_date->to_iso() + ", before " +
                                 as_of.to_iso()));
  }
}

}  // namespace rxrecon::matching
