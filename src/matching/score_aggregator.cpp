#include "rxrecon/matching/score_aggregator.h"

#include "rxrecon/core/normalization.h"
#include "rxrecon/core/similarity.h"

#include <algorithm>

namespace rxrecon::matching {

bool po_numbers_equal(const std::string& a, const std::string& b) {
  const std::string key_a = core::alnum_key(a);
  return !key_a.empty() && key_a == core::alnum_key(b);
}

ScoreAggregator::ScoreAggregator(ReconciliationConfig config) : config_(std::move(config)) {}

double ScoreAggregator::header_agreement(const domain::Invoice& invoice,
                                         const domain::PurchaseOrder& candidate) const {
  const double vendor = core::party_name_similarity(invoice.vendor.name, candidate.vendor);
  if (!invoice.po_number || core::alnum_key(*invoice.po_number).empty()) {
    return vendor;
  }
  const double number = po_numbers_equal(*invoice.po_number, candidate.po_number) ? 1.0 : 0.0;
  return (vendor + number) / 2.0;
}

domain::CandidateScore ScoreAggregator::score(
    const domain::Invoice& invoice, const domain::PurchaseOrder& candidate,
    const std::vector<domain::LineItemMatch>& line_matches) const {
  domain::CandidateScore result;
  result.id = candidate.id;

  double similarity_sum = 0.0;
  for (const auto& match : line_matches) {
    if (match.is_pair()) {
      similarity_sum += match.similarity;
      ++result.matched_lines;
    }
  }
  if (result.matched_lines > 0) {
    result.mean_similarity = similarity_sum / static_cast<double>(result.matched_lines);
  }

  const std::size_t larger_side = std::max(invoice.items.size(), candidate.items.size());
  if (larger_side > 0) {
    result.coverage =
        static_cast<double>(result.matched_lines) / static_cast<double>(larger_side);
  }

  result.header_agreement = header_agreement(invoice, candidate);

  const AggregateWeights& w = config_.aggregate_weights;
  const double total_weight = w.line_similarity + w.header + w.coverage;
  if (total_weight > 0.0) {
    result.overall = (w.line_similarity * result.mean_similarity +
                      w.header * result.header_agreement + w.coverage * result.coverage) /
                     total_weight;
  }
  return result;
}

CandidateChoice ScoreAggregator::choose(const std::vector<domain::CandidateScore>& scores) const {
  CandidateChoice choice;
  for (std::size_t i = 0; i < scores.size(); ++i) {
    if (!choice.best_index) {
      choice.best_index = i;
      continue;
    }
    const auto& best = scores[*choice.best_index];
    const auto& current = scores[i];
    if (current.overall > best.overall ||
        (current.overall == best.overall && current.id < best.id)) {
      choice.best_index = i;
    }
  }
  if (choice.best_index) {
    choice.accepted = scores[*choice.best_index].overall >= config_.acceptance_threshold;
  }
  return choice;
}

}  // namespace rxrecon::matching
