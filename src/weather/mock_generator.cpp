#include "weather/mock_generator.hpp"

#include <array>
#include <stdexcept>

#include "core/text.hpp"
#include "core/timestamp.hpp"

namespace wx_agent::weather {
namespace {

using model::weather_condition;

struct ConditionProfile {
  weather_condition condition;
  int min_temp_tenths;
  int max_temp_tenths;
  int min_humidity;
  int max_humidity;
};

constexpr std::array<ConditionProfile, 6> kProfiles = {{
    {weather_condition::CLEAR, 180, 380, 20, 55},
    {weather_condition::CLOUDS, 140, 310, 45, 80},
    {weather_condition::RAIN, 120, 270, 70, 98},
    {weather_condition::SNOW, -120, 20, 60, 95},
    {weather_condition::STORM, 170, 310, 75, 100},
    {weather_condition::MIST, 50, 190, 80, 100},
}};

// Index into kProfiles; clear and cloudy days dominate.
constexpr std::array<std::uint8_t, 11> kConditionWheel = {0, 0, 0, 1, 1, 1, 2, 2, 3, 4, 5};

// splitmix64 step: spreads one seed over successive draws.
class SeedSequence {
 public:
  explicit SeedSequence(const std::uint64_t seed) : state_(seed) {}

  std::uint64_t next() noexcept {
    state_ += 0x9E3779B97F4A7C15ULL;
    std::uint64_t z = state_;
    z = (z ^ (z >> 30U)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27U)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31U);
  }

  int in_range(const int min, const int max) noexcept {
    const auto span = static_cast<std::uint64_t>(max - min + 1);
    return min + static_cast<int>(next() % span);
  }

 private:
  std::uint64_t state_;
};

}  // namespace

std::uint64_t stable_hash(const std::string_view bytes) noexcept {
  std::uint64_t hash = 0xCBF29CE484222325ULL;
  for (const char c : bytes) {
    hash ^= static_cast<unsigned char>(c);
    hash *= 0x100000001B3ULL;
  }
  return hash;
}

model::weather_reading MockWeatherGenerator::generate(const std::string& city,
                                                      const std::chrono::year_month_day& day) const {
  const auto canonical = core::canonical_city_name(city);
  if (canonical.empty()) {
    throw std::invalid_argument("mock weather requires a city name");
  }

  SeedSequence seeds(stable_hash(canonical + "|" + core::iso_date(day)));
  const auto& profile = kProfiles[kConditionWheel[seeds.next() % kConditionWheel.size()]];

  model::weather_reading reading{};
  reading.city = canonical;
  reading.condition = profile.condition;
  reading.temperature_celsius = static_cast<double>(seeds.in_range(profile.min_temp_tenths, profile.max_temp_tenths)) / 10.0;
  reading.humidity_percent = static_cast<std::uint8_t>(seeds.in_range(profile.min_humidity, profile.max_humidity));
  reading.source = model::reading_source::MOCK;
  reading.timestamp_ms = core::unix_timestamp_ms(day);
  return reading;
}

}  // namespace wx_agent::weather
