#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace wx_agent::model {

enum class query_intent : std::uint8_t {
    CURRENT_WEATHER = 0,
    FORECAST_PRECIPITATION = 1,
    UNKNOWN = 2,
};

enum class extraction_confidence : std::uint8_t {
    HIGH = 0,
    LOW = 1,
};

struct extracted_query {
    std::string raw_text;
    std::optional<std::string> candidate_city;
    query_intent intent{query_intent::UNKNOWN};
    extraction_confidence confidence{extraction_confidence::LOW};
};

const char* to_string(query_intent intent);
const char* to_string(extraction_confidence confidence);

nlohmann::json to_json(const extracted_query& query);

}  // namespace wx_agent::model
