#include "swagcheck/exceptions.hpp"
#include "swagcheck/validation/issue.hpp"

#include <cassert>
#include <iostream>

using namespace swagcheck;
using namespace swagcheck::validation;

int main() {
  // Normalized paths collapse array indices
  Issue a(IssueCategory::InvalidEnum, "TradeItem.Items[3].Code", "'Q' not in [\"A\"]");
  assert(a.normalized_path() == "TradeItem.Items[*].Code");
  assert(normalize_path("Items[0].X") == normalize_path("Items[17].X"));
  assert(normalize_path("A[1].B[22][3]") == "A[*].B[*][*]");

  // Idempotent, and non-numeric brackets are untouched
  assert(normalize_path(a.normalized_path()) == a.normalized_path());
  assert(normalize_path("Items[x].Y") == "Items[x].Y");
  assert(normalize_path("") == "");

  // Rendering
  assert(a.to_string() == "INVALID_ENUM TradeItem.Items[3].Code: 'Q' not in [\"A\"]");
  Issue parse(IssueCategory::ParseError, "", "unexpected end of input");
  assert(parse.to_string() == "PARSE_ERROR : unexpected end of input");

  // Category names round-trip
  for (auto c : {IssueCategory::SchemaNotFound, IssueCategory::UnknownField,
                 IssueCategory::TypeMismatch, IssueCategory::InvalidEnum,
                 IssueCategory::ParseError})
    assert(category_from_string(to_string(c)) == c);
  assert(!category_from_string("BOGUS"));
  assert(to_string(IssueCategory::UnknownField) == "UNKNOWN_FIELD");

  // JSON adapters
  Json j = a;
  assert(j["category"] == "INVALID_ENUM");
  assert(j["path"] == "TradeItem.Items[3].Code");
  assert(j["normalized_path"] == "TradeItem.Items[*].Code");
  auto back = j.get<Issue>();
  assert(back == a);
  assert(back != parse);

  bool threw = false;
  try {
    Json{{"category", "BOGUS"}, {"path", ""}, {"message", ""}}.get<Issue>();
  } catch (const Error&) {
    threw = true;
  }
  assert(threw);

  std::cout << "issue: [PASS]\n";
  return 0;
}
