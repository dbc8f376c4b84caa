#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "model/weather_reading.hpp"

namespace wx_agent::weather {

// FNV-1a, 64 bit. Stable across runs, platforms and builds.
std::uint64_t stable_hash(std::string_view bytes) noexcept;

// Synthetic readings keyed by canonical city name and calendar day. Pure: the
// same (city, day) always yields the same reading, stamped at 00:00 UTC.
class MockWeatherGenerator {
 public:
  // Throws std::invalid_argument when `city` canonicalizes to nothing.
  model::weather_reading generate(const std::string& city, const std::chrono::year_month_day& day) const;
};

}  // namespace wx_agent::weather
