#include "rxrecon/matching/candidate_selector.h"

#include "rxrecon/core/similarity.h"
#include "rxrecon/matching/score_aggregator.h"

#include <algorithm>
#include <set>

namespace rxrecon::matching {

CandidateSelector::CandidateSelector(const storage::IPurchaseOrderRepository& repository,
                                     ReconciliationConfig config)
    : repository_(repository), config_(std::move(config)) {}

CandidateSelection CandidateSelector::select(
    const domain::Invoice& invoice, const std::vector<core::PurchaseOrderId>& explicit_po_ids) const {
  if (!explicit_po_ids.empty()) {
    return select_explicit(explicit_po_ids);
  }
  return select_inferred(invoice);
}

CandidateSelection CandidateSelector::select_explicit(
    const std::vector<core::PurchaseOrderId>& explicit_po_ids) const {
  std::vector<core::PurchaseOrderId> unique_ids;
  std::set<core::PurchaseOrderId> seen;
  for (const auto& id : explicit_po_ids) {
    if (seen.insert(id).second) {
      unique_ids.push_back(id);
    }
  }

  CandidateSelection selection;
  selection.candidates = repository_.load(unique_ids);

  std::set<core::PurchaseOrderId> loaded;
  for (const auto& purchase_order : selection.candidates) {
    loaded.insert(purchase_order.id);
  }
  for (const auto& id : unique_ids) {
    if (loaded.count(id) == 0) {
      selection.missing_ids.push_back(id);
    }
  }
  return selection;
}

CandidateSelection CandidateSelector::select_inferred(const domain::Invoice& invoice) const {
  auto found = repository_.find_by_number_or_vendor(invoice.po_number, invoice.vendor.name,
                                                    config_.vendor_match_threshold);

  struct Ranked {
    bool exact_number;
    double vendor_similarity;
    std::size_t index;
  };

  std::vector<Ranked> ranked;
  ranked.reserve(found.size());
  for (std::size_t i = 0; i < found.size(); ++i) {
    ranked.push_back(Ranked{
        invoice.po_number.has_value() && po_numbers_equal(*invoice.po_number, found[i].po_number),
        core::party_name_similarity(invoice.vendor.name, found[i].vendor), i});
  }

  std::sort(ranked.begin(), ranked.end(), [&found](const Ranked& a, const Ranked& b) {
    if (a.exact_number != b.exact_number) {
      return a.exact_number;
    }
    if (a.vendor_similarity != b.vendor_similarity) {
      return a.vendor_similarity > b.vendor_similarity;
    }
    return found[a.index].id < found[b.index].id;
  });

  CandidateSelection selection;
  const std::size_t keep = std::min(ranked.size(), config_.candidate_window);
  selection.candidates.reserve(keep);
  for (std::size_t i = 0; i < keep; ++i) {
    selection.candidates.push_back(std::move(found[ranked[i].index]));
  }
  return selection;
}

}  // namespace rxrecon::matching
