#include "rxrecon/core/normalization.h"
#include "rxrecon/core/similarity.h"

#include <catch2/catch.hpp>

using namespace rxrecon;
using Catch::Matchers::WithinAbs;

TEST_CASE("Normalization keys", "[similarity][normalization]") {
  CHECK(core::alnum_key("Eugia US, LLC") == "eugiausllc");
  CHECK(core::spaced_key("  Cefazolin -- 1 g/vial ") == "cefazolin 1 g vial");
  CHECK(core::trim("\t lot 42 \n") == "lot 42");
  CHECK(core::sorted_unique_tokens("b a b") == std::vector<std::string>{"a", "b"});
}

TEST_CASE("levenshtein_distance", "[similarity]") {
  CHECK(core::levenshtein_distance("", "") == 0);
  CHECK(core::levenshtein_distance("abc", "") == 3);
  CHECK(core::levenshtein_distance("kitten", "sitting") == 3);
  CHECK(core::levenshtein_distance("flaw", "lawn") == 2);
}

TEST_CASE("edit_similarity is normalized by the longer string", "[similarity]") {
  CHECK_THAT(core::edit_similarity("", ""), WithinAbs(1.0, 1e-12));
  CHECK_THAT(core::edit_similarity("abcd", "abcd"), WithinAbs(1.0, 1e-12));
  CHECK_THAT(core::edit_similarity("abcd", "abce"), WithinAbs(0.75, 1e-12));
  CHECK_THAT(core::edit_similarity("abc", "xyz"), WithinAbs(0.0, 1e-12));
}

TEST_CASE("text_similarity rewards contained product names", "[similarity]") {
  // Every PO token appears in the invoice description.
  CHECK_THAT(core::text_similarity("Cefazolin for Injection USP 1 g", "cefazolin 1 g"),
             WithinAbs(1.0, 1e-12));
  CHECK_THAT(core::text_similarity("", "cefazolin"), WithinAbs(0.0, 1e-12));
  CHECK(core::text_similarity("Heparin Sodium", "Vancomycin HCl") < 0.5);
}

TEST_CASE("party_name_similarity ignores case and punctuation", "[similarity]") {
  CHECK_THAT(core::party_name_similarity("Eugia US LLC", "EUGIA US, LLC (f/k/a AuroMedics)"),
             WithinAbs(1.0, 1e-12));
  CHECK_THAT(core::party_name_similarity("", "Eugia"), WithinAbs(0.0, 1e-12));
  CHECK(core::party_name_similarity("Cardinal Health", "McKesson") < 0.5);
}

TEST_CASE("names_match never matches blank names", "[similarity]") {
  CHECK(core::names_match("Eugia US LLC", "eugia us llc", 0.8));
  CHECK_FALSE(core::names_match("", "", 0.0));
  CHECK_FALSE(core::names_match("---", "Eugia", 0.0));
  CHECK_FALSE(core::names_match("Cardinal Health", "McKesson", 0.8));
}
