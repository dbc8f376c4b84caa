#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "core/cancellation.hpp"
#include "core/config.hpp"
#include "model/weather_reading.hpp"
#include "weather/mock_generator.hpp"
#include "weather/provider.hpp"

namespace wx_agent::weather {

struct RetryPolicy {
  std::chrono::milliseconds attempt_timeout{5000};
  std::uint32_t max_retries{2};
  // Fixed delay between attempts, not exponential.
  std::chrono::milliseconds backoff{250};

  static RetryPolicy from_config(const core::ProviderConfig& config);
};

using DaySource = std::function<std::chrono::year_month_day()>;

// Resolves a city to a reading. Tries the live provider with bounded retries
// and falls back to MockWeatherGenerator on exhaustion, terminal failure,
// cancellation or when no provider is configured. Never throws for provider
// failures. Holds no mutable state; safe for concurrent callers.
class WeatherResolver {
 public:
  WeatherResolver(std::string default_city, RetryPolicy policy, std::shared_ptr<const DataProvider> provider,
                  DaySource today = {});
  WeatherResolver(const core::ServiceConfig& config, std::shared_ptr<const DataProvider> provider);

  // An absent or blank city resolves the default city.
  model::weather_reading resolve(const std::optional<std::string>& city,
                                 const core::Cancellation& cancellation = {}) const;

  [[nodiscard]] const std::string& default_city() const { return default_city_; }
  [[nodiscard]] bool live_enabled() const { return provider_ != nullptr; }
  [[nodiscard]] std::uint32_t max_attempts() const { return policy_.max_retries + 1U; }

 private:
  std::optional<model::weather_reading> resolve_live(const std::string& city,
                                                     const core::Cancellation& cancellation) const;
  FetchOutcome fetch_once(const std::string& city, std::chrono::milliseconds timeout,
                          const core::Cancellation& cancellation) const;
  bool wait_backoff(const core::Cancellation& cancellation) const;

  std::string default_city_;
  RetryPolicy policy_;
  std::shared_ptr<const DataProvider> provider_;
  DaySource today_;
  MockWeatherGenerator mock_{};
};

}  // namespace wx_agent::weather
