#include "model/extracted_query.hpp"

namespace wx_agent::model {

const char* to_string(const query_intent intent) {
    switch (intent) {
        case query_intent::CURRENT_WEATHER: return "current_weather";
        case query_intent::FORECAST_PRECIPITATION: return "forecast_precipitation";
        case query_intent::UNKNOWN: break;
    }
    return "unknown";
}

const char* to_string(const extraction_confidence confidence) {
    return confidence == extraction_confidence::HIGH ? "high" : "low";
}

nlohmann::json to_json(const extracted_query& query) {
    nlohmann::json out{{"raw_text", query.raw_text},
                       {"candidate_city", nullptr},
                       {"intent", to_string(query.intent)},
                       {"confidence", to_string(query.confidence)}};
    if (query.candidate_city.has_value()) {
        out["candidate_city"] = *query.candidate_city;
    }
    return out;
}

}  // namespace wx_agent::model
