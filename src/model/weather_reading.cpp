#include "model/weather_reading.hpp"

namespace wx_agent::model {

const char* to_string(const weather_condition condition) {
    switch (condition) {
        case weather_condition::CLEAR: return "clear";
        case weather_condition::CLOUDS: return "clouds";
        case weather_condition::RAIN: return "rain";
        case weather_condition::SNOW: return "snow";
        case weather_condition::STORM: return "storm";
        case weather_condition::MIST: return "mist";
        case weather_condition::UNKNOWN: break;
    }
    return "unknown";
}

const char* to_string(const reading_source source) {
    return source == reading_source::LIVE ? "live" : "mock";
}

nlohmann::json to_json(const weather_reading& reading) {
    return nlohmann::json{{"city", reading.city},
                          {"temperature_celsius", reading.temperature_celsius},
                          {"condition", to_string(reading.condition)},
                          {"humidity_percent", static_cast<int>(reading.humidity_percent)},
                          {"source", to_string(reading.source)},
                          {"timestamp", reading.timestamp_ms}};
}

}  // namespace wx_agent::model
