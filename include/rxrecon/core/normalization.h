#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace rxrecon::core {

// Deterministic ASCII-only text normalization.
// These functions are locale-independent and produce byte-stable output
// across all platforms and compilers.
//
// - ASCII lowercasing: A-Z → a-z via explicit char math (no std::tolower)
// - Non-alphanumeric → delimiter
// - No locale dependence, no undefined behavior

inline bool is_ascii_digit(const char ch) {
  return ch >= '0' && ch <= '9';
}

inline bool is_ascii_alnum(const char ch) {
  return is_ascii_digit(ch) || (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

inline char ascii_lower(const char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    constexpr char kCaseOffset = 'a' - 'A';
    return static_cast<char>(ch + kCaseOffset);
  }
  return ch;
}

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
// Non-ASCII characters are preserved unchanged.
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());
  for (const char ch : input) {
    result.push_back(ascii_lower(ch));
  }
  return result;
}

// tokenize_ascii splits input on non-alphanumeric delimiters into lowercase tokens.
// Drops tokens shorter than min_length. Returns tokens in encounter order.
inline std::vector<std::string> tokenize_ascii(const std::string_view input,
                                               const std::size_t min_length = 1) {
  std::vector<std::string> tokens;
  std::string current_token;
  current_token.reserve(32);

  for (const char ch : input) {
    if (is_ascii_alnum(ch)) {
      current_token.push_back(ascii_lower(ch));
      continue;
    }
    if (!current_token.empty() && current_token.size() >= min_length) {
      tokens.push_back(std::move(current_token));
    }
    current_token.clear();
  }

  if (!current_token.empty() && current_token.size() >= min_length) {
    tokens.push_back(std::move(current_token));
  }

  return tokens;
}

// alnum_key lowercases and drops every non-alphanumeric character.
// "Eugia US LLC (f/k/a AuroMedics)" → "eugiausllcfkaauromedics".
// Used for case- and punctuation-insensitive comparison of PO numbers, lots and vendor names.
inline std::string alnum_key(const std::string_view input) {
  std::string key;
  key.reserve(input.size());
  for (const char ch : input) {
    if (is_ascii_alnum(ch)) {
      key.push_back(ascii_lower(ch));
    }
  }
  return key;
}

// spaced_key lowercases, maps non-alphanumeric runs to a single space and trims.
// Keeps word boundaries so edit distance is not dominated by missing separators.
inline std::string spaced_key(const std::string_view input) {
  std::string key;
  key.reserve(input.size());
  bool pending_space = false;
  for (const char ch : input) {
    if (is_ascii_alnum(ch)) {
      if (pending_space && !key.empty()) {
        key.push_back(' ');
      }
      pending_space = false;
      key.push_back(ascii_lower(ch));
    } else {
      pending_space = true;
    }
  }
  return key;
}

// trim removes leading and trailing whitespace (ASCII space/tab/newline)
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && (input[start] == ' ' || input[start] == '\t' ||
                                  input[start] == '\n' || input[start] == '\r')) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && (input[end - 1] == ' ' || input[end - 1] == '\t' ||
                         input[end - 1] == '\n' || input[end - 1] == '\r')) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

// sorted_unique_tokens tokenizes and returns a sorted, deduplicated token list.
inline std::vector<std::string> sorted_unique_tokens(const std::string_view input) {
  auto tokens = tokenize_ascii(input);
  std::sort(tokens.begin(), tokens.end());
  auto unique_end = std::unique(tokens.begin(), tokens.end());
  tokens.erase(unique_end, tokens.end());
  return tokens;
}

}  // namespace rxrecon::core
