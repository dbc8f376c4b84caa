#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "model/extracted_query.hpp"
#include "query/gazetteer.hpp"

namespace wx_agent::query {

// Turns free text into a city candidate and an intent. Implementations never
// throw; a failed extraction yields no candidate and low confidence.
class QueryInterpreter {
 public:
  virtual model::extracted_query interpret(const std::string& text) const = 0;
  virtual ~QueryInterpreter() = default;
};

std::unique_ptr<QueryInterpreter> make_rule_based_interpreter(Gazetteer gazetteer = {});

// Lowercases, drops punctuation (hyphens between word characters survive)
// and collapses whitespace.
std::string normalize_text(const std::string& text);

// Keyword classification over normalized words; precipitation wins over
// general weather.
model::query_intent classify_intent(const std::vector<std::string>& normalized_words);

// Capitalized run after the last "in"/"for" that has one, read from the unnormalized
// casing of `text`.
std::optional<std::string> extract_prepositional_city(const std::string& text);

}  // namespace wx_agent::query
