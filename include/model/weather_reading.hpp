#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace wx_agent::model {

// Closed set; provider strings never leak into a reading.
enum class weather_condition : std::uint8_t {
    CLEAR = 0,
    CLOUDS = 1,
    RAIN = 2,
    SNOW = 3,
    STORM = 4,
    MIST = 5,
    UNKNOWN = 6,
};

enum class reading_source : std::uint8_t {
    LIVE = 0,
    MOCK = 1,
};

struct weather_reading {
    std::string city;
    double temperature_celsius{0.0};
    weather_condition condition{weather_condition::UNKNOWN};
    std::uint8_t humidity_percent{0};
    reading_source source{reading_source::MOCK};
    std::uint64_t timestamp_ms{0};

    bool operator==(const weather_reading&) const = default;
};

const char* to_string(weather_condition condition);
const char* to_string(reading_source source);

nlohmann::json to_json(const weather_reading& reading);

}  // namespace wx_agent::model
