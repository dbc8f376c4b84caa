#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>

#include "core/cancellation.hpp"
#include "model/weather_reading.hpp"

namespace wx_agent::weather {

struct LiveObservation {
  double temperature_celsius{0.0};
  model::weather_condition condition{model::weather_condition::UNKNOWN};
  std::uint8_t humidity_percent{0};
  std::string description{};
};

// Timeout, 5xx, connection reset: worth another attempt.
struct ProviderTransientError {
  std::string detail;
};

// 4xx, unusable body, misconfiguration: the live path is over for this call.
struct ProviderTerminalError {
  std::string detail;
};

struct ProviderCancelled {};

using FetchOutcome = std::variant<LiveObservation, ProviderTransientError, ProviderTerminalError, ProviderCancelled>;

// Live weather source. Implementations must be safe for concurrent calls.
class DataProvider {
 public:
  virtual FetchOutcome fetch(const std::string& city, std::chrono::milliseconds timeout,
                             const core::Cancellation& cancellation) const = 0;
  virtual ~DataProvider() = default;
};

}  // namespace wx_agent::weather
