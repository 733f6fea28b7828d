#include "rxrecon/core/similarity.h"

#include "rxrecon/core/normalization.h"

#include <algorithm>
#include <iterator>
#include <string>
#include <vector>

namespace rxrecon::core {

std::size_t levenshtein_distance(const std::string_view a, const std::string_view b) {
  if (a.empty()) {
    return b.size();
  }
  if (b.empty()) {
    return a.size();
  }

  // Two-row dynamic programming table
  std::vector<std::size_t> previous(b.size() + 1);
  std::vector<std::size_t> current(b.size() + 1);
  for (std::size_t j = 0; j <= b.size(); ++j) {
    previous[j] = j;
  }

  for (std::size_t i = 1; i <= a.size(); ++i) {
    current[0] = i;
    for (std::size_t j = 1; j <= b.size(); ++j) {
      const std::size_t substitution = previous[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
      current[j] = std::min({previous[j] + 1, current[j - 1] + 1, substitution});
    }
    std::swap(previous, current);
  }

  return previous[b.size()];
}

double edit_similarity(const std::string_view a, const std::string_view b) {
  const std::size_t longest = std::max(a.size(), b.size());
  if (longest == 0) {
    return 1.0;
  }
  const auto distance = static_cast<double>(levenshtein_distance(a, b));
  return 1.0 - distance / static_cast<double>(longest);
}

double token_overlap(const std::string_view a, const std::string_view b) {
  const auto tokens_a = sorted_unique_tokens(a);
  const auto tokens_b = sorted_unique_tokens(b);
  if (tokens_a.empty() || tokens_b.empty()) {
    return 0.0;
  }

  std::vector<std::string> intersection;
  std::set_intersection(tokens_a.begin(), tokens_a.end(), tokens_b.begin(), tokens_b.end(),
                        std::back_inserter(intersection));

  const auto smaller = std::min(tokens_a.size(), tokens_b.size());
  return static_cast<double>(intersection.size()) / static_cast<double>(smaller);
}

double text_similarity(const std::string_view a, const std::string_view b) {
  const std::string key_a = spaced_key(a);
  const std::string key_b = spaced_key(b);
  if (key_a.empty() || key_b.empty()) {
    return 0.0;
  }
  return std::max(edit_similarity(key_a, key_b), token_overlap(key_a, key_b));
}

double party_name_similarity(const std::string_view a, const std::string_view b) {
  const std::string key_a = alnum_key(a);
  const std::string key_b = alnum_key(b);
  if (key_a.empty() || key_b.empty()) {
    return 0.0;
  }
  if (key_a.find(key_b) != std::string::npos || key_b.find(key_a) != std::string::npos) {
    return 1.0;
  }
  return edit_similarity(key_a, key_b);
}

bool names_match(const std::string_view a, const std::string_view b, const double threshold) {
  if (alnum_key(a).empty() || alnum_key(b).empty()) {
    return false;
  }
  return party_name_similarity(a, b) >= threshold;
}

}  // namespace rxrecon::core
