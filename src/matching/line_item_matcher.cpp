#include "rxrecon/matching/line_item_matcher.h"

#include "rxrecon/core/normalization.h"
#include "rxrecon/core/similarity.h"
#include "rxrecon/normalize/identifier_normalizer.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace rxrecon::matching {

namespace {

struct Candidate {
  std::size_t invoice_index;
  std::size_t po_index;
  double similarity;
  domain::FieldScores scores;
};

bool has_lot(const std::optional<std::string>& lot) {
  return lot.has_value() && !lot_key(*lot).empty();
}

// Indices of items sorted by line number.
template <typename Item>
std::vector<std::size_t> line_order(const std::vector<Item>& items) {
  std::vector<std::size_t> order(items.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&items](std::size_t a, std::size_t b) {
    return items[a].line_number < items[b].line_number;
  });
  return order;
}

}  // namespace

std::string lot_key(const std::string& lot) {
  std::string key;
  key.reserve(lot.size());
  for (const char ch : lot) {
    if (ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r') {
      continue;
    }
    key.push_back(core::ascii_lower(ch));
  }
  return key;
}

LineItemMatcher::LineItemMatcher(ReconciliationConfig config) : config_(std::move(config)) {}

domain::FieldScores LineItemMatcher::field_scores(
    const domain::InvoiceLineItem& invoice_item,
    const domain::PurchaseOrderLineItem& po_item) const {
  domain::FieldScores scores;
  scores.description = core::text_similarity(invoice_item.description, po_item.description);

  const auto invoice_id = normalize::normalize_optional_identifier(invoice_item.identifier);
  const auto po_id = normalize::normalize_optional_identifier(po_item.identifier);
  if (invoice_id && po_id && invoice_id->is_canonical() && po_id->is_canonical()) {
    scores.identifier = invoice_id->key() == po_id->key() ? 1.0 : 0.0;
  } else {
    // Missing or unparseable on at least one side: partial credit on a strong description.
    scores.identifier = scores.description >= config_.description_match_threshold ? 0.5 : 0.0;
  }

  if (has_lot(po_item.lot_number)) {
    scores.lot = has_lot(invoice_item.lot_number) &&
                         lot_key(*invoice_item.lot_number) == lot_key(*po_item.lot_number)
                     ? 1.0
                     : 0.0;
  }

  const double quantity_delta =
      std::fabs(static_cast<double>(invoice_item.quantity - po_item.quantity));
  const double quantity_base = std::max(static_cast<double>(po_item.quantity), 1.0);
  scores.quantity = 1.0 - std::min(1.0, quantity_delta / quantity_base);

  const double price_delta = std::fabs(invoice_item.unit_price - po_item.unit_price);
  const double price_base = std::max(po_item.unit_price, 0.01);
  scores.price = 1.0 - std::min(1.0, price_delta / price_base);

  return scores;
}

double LineItemMatcher::pair_similarity(const domain::FieldScores& scores) const {
  const FieldWeights& w = config_.field_weights;
  double weighted = w.identifier * scores.identifier + w.quantity * scores.quantity +
                    w.price * scores.price;
  double total_weight = w.identifier + w.quantity + w.price;
  if (scores.lot) {
    weighted += w.lot * *scores.lot;
    total_weight += w.lot;
  }
  if (total_weight <= 0.0) {
    return 0.0;
  }
  return weighted / total_weight;
}

std::vector<domain::LineItemMatch> LineItemMatcher::align(
    const std::vector<domain::InvoiceLineItem>& invoice_items,
    const std::vector<domain::PurchaseOrderLineItem>& po_items) const {
  // Full matrix, keeping only pairs that clear the floor.
  std::vector<Candidate> candidates;
  candidates.reserve(invoice_items.size() * po_items.size());
  for (std::size_t i = 0; i < invoice_items.size(); ++i) {
    for (std::size_t j = 0; j < po_items.size(); ++j) {
      auto scores = field_scores(invoice_items[i], po_items[j]);
      const double similarity = pair_similarity(scores);
      if (similarity >= config_.line_match_floor) {
        candidates.push_back(Candidate{i, j, similarity, scores});
      }
    }
  }

  // Taking candidates in this order is the same as repeatedly picking the global best.
  std::sort(candidates.begin(), candidates.end(),
            [&invoice_items, &po_items](const Candidate& a, const Candidate& b) {
              if (a.similarity != b.similarity) {
                return a.similarity > b.similarity;
              }
              const int a_inv = invoice_items[a.invoice_index].line_number;
              const int b_inv = invoice_items[b.invoice_index].line_number;
              if (a_inv != b_inv) {
                return a_inv < b_inv;
              }
              return po_items[a.po_index].line_number < po_items[b.po_index].line_number;
            });

  std::vector<const Candidate*> assigned_for_invoice(invoice_items.size(), nullptr);
  std::vector<bool> po_taken(po_items.size(), false);
  for (const auto& candidate : candidates) {
    if (assigned_for_invoice[candidate.invoice_index] != nullptr || po_taken[candidate.po_index]) {
      continue;
    }
    assigned_for_invoice[candidate.invoice_index] = &candidate;
    po_taken[candidate.po_index] = true;
  }

  std::vector<domain::LineItemMatch> matches;
  matches.reserve(invoice_items.size() + po_items.size());

  for (const std::size_t i : line_order(invoice_items)) {
    domain::LineItemMatch match;
    match.invoice_line = invoice_items[i].line_number;
    if (const Candidate* pair = assigned_for_invoice[i]) {
      match.po_line = po_items[pair->po_index].line_number;
      match.similarity = pair->similarity;
      match.breakdown = pair->scores;
    } else {
      match.issues.push_back(domain::DiscrepancyKind::kUnmatchedInvoiceLine);
    }
    matches.push_back(std::move(match));
  }

  for (const std::size_t j : line_order(po_items)) {
    if (po_taken[j]) {
      continue;
    }
    domain::LineItemMatch match;
    match.po_line = po_items[j].line_number;
    match.issues.push_back(domain::DiscrepancyKind::kUnmatchedPoLine);
    matches.push_back(std::move(match));
  }

  return matches;
}

}  // namespace rxrecon::matching
