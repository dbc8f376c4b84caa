#include "weather/resolver.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>
#include <variant>

#include "core/text.hpp"
#include "core/timestamp.hpp"

namespace wx_agent::weather {
namespace {

constexpr std::chrono::milliseconds kBackoffSlice{10};

void log_line(const std::string& line) {
  // One write per line keeps concurrent resolvers from interleaving.
  std::cerr << ("[resolver] " + line + '\n');
}

}  // namespace

RetryPolicy RetryPolicy::from_config(const core::ProviderConfig& config) {
  return RetryPolicy{.attempt_timeout = config.timeout, .max_retries = config.max_retries, .backoff = config.backoff};
}

WeatherResolver::WeatherResolver(std::string default_city, RetryPolicy policy,
                                 std::shared_ptr<const DataProvider> provider, DaySource today)
    : default_city_(core::canonical_city_name(default_city)),
      policy_(policy),
      provider_(std::move(provider)),
      today_(today ? std::move(today) : DaySource(core::utc_today)) {
  if (default_city_.empty()) {
    throw std::invalid_argument("default city must not be empty");
  }
  if (policy_.attempt_timeout.count() <= 0) {
    throw std::invalid_argument("attempt timeout must be positive");
  }
}

WeatherResolver::WeatherResolver(const core::ServiceConfig& config, std::shared_ptr<const DataProvider> provider)
    : WeatherResolver(config.default_city, RetryPolicy::from_config(config.provider), std::move(provider)) {}

model::weather_reading WeatherResolver::resolve(const std::optional<std::string>& city,
                                                const core::Cancellation& cancellation) const {
  std::string canonical = city.has_value() ? core::canonical_city_name(*city) : std::string{};
  if (canonical.empty()) {
    canonical = default_city_;
  }

  if (provider_ != nullptr) {
    if (auto live = resolve_live(canonical, cancellation); live.has_value()) {
      return *std::move(live);
    }
  }

  return mock_.generate(canonical, today_());
}

std::optional<model::weather_reading> WeatherResolver::resolve_live(const std::string& city,
                                                                    const core::Cancellation& cancellation) const {
  const auto attempts = max_attempts();

  for (std::uint32_t attempt = 1; attempt <= attempts; ++attempt) {
    const auto timeout = cancellation.bound(policy_.attempt_timeout);
    if (cancellation.requested() || timeout.count() <= 0) {
      log_line("caller cancelled before attempt " + std::to_string(attempt) + " for " + city + "; using mock data");
      return std::nullopt;
    }

    const auto outcome = fetch_once(city, timeout, cancellation);

    if (const auto* observation = std::get_if<LiveObservation>(&outcome); observation != nullptr) {
      model::weather_reading reading{};
      reading.city = city;
      reading.temperature_celsius = observation->temperature_celsius;
      reading.condition = observation->condition;
      reading.humidity_percent = std::min<std::uint8_t>(observation->humidity_percent, 100);
      reading.source = model::reading_source::LIVE;
      reading.timestamp_ms = core::unix_timestamp_now_ms();
      return reading;
    }

    if (const auto* transient = std::get_if<ProviderTransientError>(&outcome); transient != nullptr) {
      std::ostringstream line;
      line << "attempt " << attempt << '/' << attempts << " for " << city << " failed (transient): " << transient->detail;
      log_line(line.str());
      if (attempt < attempts && !wait_backoff(cancellation)) {
        log_line("caller cancelled during backoff for " + city + "; using mock data");
        return std::nullopt;
      }
      continue;
    }

    if (const auto* terminal = std::get_if<ProviderTerminalError>(&outcome); terminal != nullptr) {
      std::ostringstream line;
      line << "attempt " << attempt << '/' << attempts << " for " << city << " failed (terminal): " << terminal->detail
           << "; using mock data";
      log_line(line.str());
      return std::nullopt;
    }

    log_line("live request for " + city + " cancelled; using mock data");
    return std::nullopt;
  }

  log_line("retries exhausted for " + city + "; using mock data");
  return std::nullopt;
}

FetchOutcome WeatherResolver::fetch_once(const std::string& city, const std::chrono::milliseconds timeout,
                                         const core::Cancellation& cancellation) const {
  try {
    return provider_->fetch(city, timeout, cancellation);
  } catch (const std::exception& ex) {
    return ProviderTerminalError{std::string("provider raised: ") + ex.what()};
  }
}

bool WeatherResolver::wait_backoff(const core::Cancellation& cancellation) const {
  const auto until = std::chrono::steady_clock::now() + policy_.backoff;
  while (std::chrono::steady_clock::now() < until) {
    if (cancellation.requested()) {
      return false;
    }
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - std::chrono::steady_clock::now());
    std::this_thread::sleep_for(std::clamp(left, std::chrono::milliseconds(1), kBackoffSlice));
  }
  return !cancellation.requested();
}

}  // namespace wx_agent::weather
