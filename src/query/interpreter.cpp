#include "query/interpreter.hpp"

#include <array>
#include <cctype>
#include <string_view>
#include <utility>

#include "core/text.hpp"

namespace wx_agent::query {
namespace {

constexpr std::array<std::string_view, 3> kPrecipitationKeywords = {"rain", "precipitation", "snow"};
constexpr std::array<std::string_view, 5> kWeatherKeywords = {"weather", "temperature", "climate", "hot", "cold"};
constexpr std::array<std::string_view, 3> kTemporalWords = {"today", "tomorrow", "now"};
constexpr std::array<std::string_view, 2> kPossessiveSuffixes = {"'s", "\xE2\x80\x99s"};

bool is_word_char(const char c) {
  const auto uc = static_cast<unsigned char>(c);
  return std::isalnum(uc) != 0 || uc >= 0x80;
}

template <std::size_t N>
bool any_word_starts_with(const std::vector<std::string>& words, const std::array<std::string_view, N>& keywords) {
  for (const auto& word : words) {
    for (const auto keyword : keywords) {
      if (std::string_view(word).substr(0, keyword.size()) == keyword) {
        return true;
      }
    }
  }
  return false;
}

bool is_temporal(const std::string& word) {
  const auto lower = core::to_lower(word);
  for (const auto temporal : kTemporalWords) {
    if (lower == temporal) {
      return true;
    }
  }
  return false;
}

struct Token {
  std::string core;
  bool ends_run{false};
};

// Strips surrounding punctuation from a whitespace token. A trailing
// sentence terminator, comma or possessive closes a capitalized run.
Token strip_token(const std::string& raw) {
  std::size_t begin = 0;
  std::size_t end = raw.size();
  while (begin < end && !is_word_char(raw[begin])) {
    ++begin;
  }
  while (end > begin && !is_word_char(raw[end - 1])) {
    --end;
  }

  Token token{.core = raw.substr(begin, end - begin), .ends_run = false};
  for (std::size_t i = end; i < raw.size(); ++i) {
    const char c = raw[i];
    if (c == '.' || c == '?' || c == '!' || c == ',' || c == ';' || c == ':') {
      token.ends_run = true;
    }
  }

  for (const std::string_view possessive : kPossessiveSuffixes) {
    if (token.core.size() > possessive.size() &&
        token.core.compare(token.core.size() - possessive.size(), possessive.size(), possessive) == 0) {
      token.core.resize(token.core.size() - possessive.size());
      token.ends_run = true;
      break;
    }
  }
  return token;
}

// ASCII A-Z, or a two-byte UTF-8 sequence for an uppercase letter in
// Latin-1 Supplement (U+00C0..U+00DE except U+00D7) or Latin Extended-A,
// where uppercase code points are the even ones of each pair.
bool is_capitalized(const std::string& word) {
  if (word.empty()) {
    return false;
  }
  const auto lead = static_cast<unsigned char>(word[0]);
  if (lead < 0x80) {
    return std::isupper(lead) != 0;
  }
  if (word.size() < 2) {
    return false;
  }
  const auto next = static_cast<unsigned char>(word[1]);
  if ((next & 0xC0) != 0x80) {
    return false;
  }
  const unsigned code_point = ((lead & 0x1FU) << 6U) | (next & 0x3FU);
  if (lead == 0xC3) {
    return code_point >= 0xC0 && code_point <= 0xDE && code_point != 0xD7;
  }
  if (lead == 0xC4 || lead == 0xC5) {
    // Capitals sit on odd code points in U+0139..U+0148 and U+0179..U+017E.
    if (code_point == 0x138 || code_point == 0x149 || code_point == 0x17F) {
      return false;
    }
    if ((code_point >= 0x139 && code_point <= 0x148) || code_point == 0x179 || code_point == 0x17B ||
        code_point == 0x17D) {
      return (code_point & 1U) == 1U;
    }
    if (code_point == 0x17A || code_point == 0x17C || code_point == 0x17E) {
      return false;
    }
    return (code_point & 1U) == 0U;
  }
  return false;
}

class RuleBasedInterpreter final : public QueryInterpreter {
 public:
  explicit RuleBasedInterpreter(Gazetteer gazetteer) : gazetteer_(std::move(gazetteer)) {}

  model::extracted_query interpret(const std::string& text) const override {
    model::extracted_query query{.raw_text = text,
                                 .candidate_city = std::nullopt,
                                 .intent = model::query_intent::UNKNOWN,
                                 .confidence = model::extraction_confidence::LOW};

    const auto words = core::split_whitespace(normalize_text(text));
    query.intent = classify_intent(words);

    if (auto city = extract_prepositional_city(text); city.has_value()) {
      query.candidate_city = std::move(city);
    } else {
      query.candidate_city = gazetteer_.find_last(words);
    }

    if (query.candidate_city.has_value()) {
      query.confidence = model::extraction_confidence::HIGH;
    }
    return query;
  }

 private:
  Gazetteer gazetteer_;
};

}  // namespace

std::unique_ptr<QueryInterpreter> make_rule_based_interpreter(Gazetteer gazetteer) {
  return std::make_unique<RuleBasedInterpreter>(std::move(gazetteer));
}

std::string normalize_text(const std::string& text) {
  std::string cleaned;
  cleaned.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (is_word_char(c)) {
      cleaned.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    } else if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      cleaned.push_back(' ');
    } else if (c == '-' && i > 0 && i + 1 < text.size() && is_word_char(text[i - 1]) && is_word_char(text[i + 1])) {
      cleaned.push_back('-');
    }
  }

  std::string normalized;
  for (const auto& word : core::split_whitespace(cleaned)) {
    if (!normalized.empty()) {
      normalized.push_back(' ');
    }
    normalized += word;
  }
  return normalized;
}

model::query_intent classify_intent(const std::vector<std::string>& normalized_words) {
  if (any_word_starts_with(normalized_words, kPrecipitationKeywords)) {
    return model::query_intent::FORECAST_PRECIPITATION;
  }
  if (any_word_starts_with(normalized_words, kWeatherKeywords)) {
    return model::query_intent::CURRENT_WEATHER;
  }
  return model::query_intent::UNKNOWN;
}

std::optional<std::string> extract_prepositional_city(const std::string& text) {
  const auto raw_words = core::split_whitespace(text);
  std::optional<std::string> last_match;

  for (std::size_t i = 0; i < raw_words.size(); ++i) {
    const auto preposition = strip_token(raw_words[i]);
    if (preposition.ends_run) {
      continue;
    }
    const auto lower = core::to_lower(preposition.core);
    if (lower != "in" && lower != "for") {
      continue;
    }

    std::string run;
    for (std::size_t j = i + 1; j < raw_words.size(); ++j) {
      const auto token = strip_token(raw_words[j]);
      if (!is_capitalized(token.core) || is_temporal(token.core)) {
        break;
      }
      if (!run.empty()) {
        run.push_back(' ');
      }
      run += token.core;
      if (token.ends_run) {
        break;
      }
    }

    if (!run.empty()) {
      last_match = core::canonical_city_name(run);
    }
  }

  return last_match;
}

}  // namespace wx_agent::query
