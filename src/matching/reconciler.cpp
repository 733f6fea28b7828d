#include "rxrecon/matching/reconciler.h"

#include <algorithm>
#include <cstdio>

namespace rxrecon::matching {

namespace {

using R = core::Result<domain::MatchResult, core::InputError>;

std::string format_score(const double value) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.2f", value);
  return buffer;
}

domain::Discrepancy no_confident_match(std::string detail) {
  return domain::Discrepancy{.kind = domain::DiscrepancyKind::kNoConfidentMatch,
                             .severity = domain::Severity::kWarning,
                             .detail = std::move(detail)};
}

void add_issue(domain::LineItemMatch& match, const domain::DiscrepancyKind kind) {
  const auto pos = std::lower_bound(match.issues.begin(), match.issues.end(), kind);
  if (pos == match.issues.end() || *pos != kind) {
    match.issues.insert(pos, kind);
  }
}

// Copies each line-level discrepancy kind onto the LineItemMatch it concerns.
void fold_issues(const std::vector<domain::Discrepancy>& issues,
                 std::vector<domain::LineItemMatch>& line_matches) {
  for (const auto& issue : issues) {
    if (domain::is_header_kind(issue.kind)) {
      continue;
    }
    for (auto& match : line_matches) {
      const bool same_invoice_line = issue.invoice_line && match.invoice_line == issue.invoice_line;
      const bool same_po_only_line = !issue.invoice_line && !match.invoice_line && issue.po_line &&
                                     match.po_line == issue.po_line;
      if (same_invoice_line || same_po_only_line) {
        add_issue(match, issue.kind);
        break;
      }
    }
  }
}

}  // namespace

Reconciler::Reconciler(ReconciliationConfig config)
    : config_(std::move(config)), matcher_(config_), aggregator_(config_), reporter_(config_) {}

R Reconciler::reconcile(const domain::Invoice& invoice,
                        const std::vector<domain::PurchaseOrder>& candidates,
                        const domain::CalendarDate& as_of) const {
  if (auto valid = config_.validate(); !valid.has_value()) {
    return R::err(core::InputError{.code = core::InputErrorCode::kInvalidConfig,
                                   .message = valid.error()});
  }
  if (auto valid = invoice.validate(); !valid.has_value()) {
    return R::err(valid.error());
  }
  for (const auto& candidate : candidates) {
    if (auto valid = candidate.validate(); !valid.has_value()) {
      return R::err(valid.error());
    }
  }

  domain::MatchResult result;

  if (candidates.empty()) {
    result.issues.push_back(no_confident_match("no candidate purchase orders"));
    auto invoice_only = reporter_.report({}, invoice, nullptr, as_of);
    result.issues.insert(result.issues.end(), invoice_only.begin(), invoice_only.end());
    return R::ok(std::move(result));
  }

  std::vector<std::vector<domain::LineItemMatch>> alignments;
  alignments.reserve(candidates.size());
  result.candidate_scores.reserve(candidates.size());
  for (const auto& candidate : candidates) {
    alignments.push_back(matcher_.align(invoice.items, candidate.items));
    result.candidate_scores.push_back(aggregator_.score(invoice, candidate, alignments.back()));
  }

  const CandidateChoice choice = aggregator_.choose(result.candidate_scores);
  const std::size_t best = *choice.best_index;
  const domain::PurchaseOrder& winner = candidates[best];
  const domain::CandidateScore& winner_score = result.candidate_scores[best];

  result.best_candidate_id = winner.id;
  result.match_score = winner_score.overall;
  if (choice.accepted) {
    result.matched_purchase_order_id = winner.id;
  } else {
    result.issues.push_back(no_confident_match(
        "best candidate '" + winner.id.value + "' scored " + format_score(winner_score.overall) +
        ", below acceptance threshold " + format_score(config_.acceptance_threshold)));
  }

  result.line_item_matches = std::move(alignments[best]);
  auto reported = reporter_.report(result.line_item_matches, invoice, &winner, as_of);
  fold_issues(reported, result.line_item_matches);
  result.issues.insert(result.issues.end(), reported.begin(), reported.end());

  return R::ok(std::move(result));
}

}  // namespace rxrecon::matching
