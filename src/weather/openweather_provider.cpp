#include "weather/openweather_provider.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

namespace wx_agent::weather {
namespace {

std::string error_message_from_body(const std::string& body) {
  const auto parsed = nlohmann::json::parse(body, nullptr, false);
  if (!parsed.is_discarded() && parsed.is_object()) {
    const auto message_it = parsed.find("message");
    if (message_it != parsed.end() && message_it->is_string()) {
      return message_it->get<std::string>();
    }
  }
  return "no detail";
}

}  // namespace

OpenWeatherProvider::OpenWeatherProvider(core::ProviderConfig config, std::shared_ptr<const net::HttpClient> http)
    : config_(std::move(config)), http_(std::move(http)) {
  if (http_ == nullptr) {
    throw std::invalid_argument("OpenWeatherProvider requires an HTTP client");
  }
  if (!config_.live_enabled()) {
    throw std::invalid_argument("OpenWeatherProvider requires an API key");
  }
}

FetchOutcome OpenWeatherProvider::fetch(const std::string& city, const std::chrono::milliseconds timeout,
                                        const core::Cancellation& cancellation) const {
  const char separator = config_.base_url.find('?') == std::string::npos ? '?' : '&';
  const std::string url = config_.base_url + separator + "q=" + http_->escape(city) +
                          "&appid=" + http_->escape(config_.api_key) + "&units=metric";

  return classify_transfer(http_->get(url, timeout, cancellation));
}

std::shared_ptr<const DataProvider> make_live_provider(const core::ProviderConfig& config) {
  if (!config.live_enabled()) {
    return nullptr;
  }
  auto http = std::make_shared<const net::HttpClient>(net::HttpClientOptions{.pool_size = config.pool_size});
  return std::make_shared<const OpenWeatherProvider>(config, std::move(http));
}

FetchOutcome classify_transfer(const net::HttpResponse& response) {
  switch (response.error) {
    case net::TransferError::NONE:
      return parse_openweather_response(response.status, response.body);
    case net::TransferError::TIMEOUT:
      return ProviderTransientError{"timed out: " + response.error_message};
    case net::TransferError::CONNECTION:
      return ProviderTransientError{"connection failed: " + response.error_message};
    case net::TransferError::CANCELLED:
      return ProviderCancelled{};
    case net::TransferError::OTHER:
      break;
  }
  return ProviderTerminalError{"transfer failed: " + response.error_message};
}

model::weather_condition condition_from_owm_code(const int code) {
  using model::weather_condition;
  if (code == 800) {
    return weather_condition::CLEAR;
  }
  switch (code / 100) {
    case 2: return weather_condition::STORM;
    case 3:
    case 5: return weather_condition::RAIN;
    case 6: return weather_condition::SNOW;
    case 7: return weather_condition::MIST;
    case 8: return weather_condition::CLOUDS;
    default: return weather_condition::UNKNOWN;
  }
}

FetchOutcome parse_openweather_response(const long status, const std::string& body) {
  if (status >= 500 && status <= 599) {
    return ProviderTransientError{"HTTP " + std::to_string(status) + ": " + error_message_from_body(body)};
  }
  if (status < 200 || status > 299) {
    return ProviderTerminalError{"HTTP " + std::to_string(status) + ": " + error_message_from_body(body)};
  }

  const auto parsed = nlohmann::json::parse(body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return ProviderTerminalError{"response body is not a JSON object"};
  }

  const auto main_it = parsed.find("main");
  if (main_it == parsed.end() || !main_it->is_object()) {
    return ProviderTerminalError{"response is missing main"};
  }

  const auto temp_it = main_it->find("temp");
  if (temp_it == main_it->end() || !temp_it->is_number() || !std::isfinite(temp_it->get<double>())) {
    return ProviderTerminalError{"response is missing main.temp"};
  }

  const auto humidity_it = main_it->find("humidity");
  if (humidity_it == main_it->end() || !humidity_it->is_number()) {
    return ProviderTerminalError{"response is missing main.humidity"};
  }

  LiveObservation observation{};
  observation.temperature_celsius = temp_it->get<double>();
  const auto humidity = std::clamp(std::lround(humidity_it->get<double>()), 0L, 100L);
  observation.humidity_percent = static_cast<std::uint8_t>(humidity);

  const auto weather_it = parsed.find("weather");
  if (weather_it != parsed.end() && weather_it->is_array() && !weather_it->empty() && weather_it->front().is_object()) {
    const auto& first = weather_it->front();
    const auto id_it = first.find("id");
    if (id_it != first.end() && id_it->is_number_integer()) {
      observation.condition = condition_from_owm_code(id_it->get<int>());
    }
    const auto description_it = first.find("description");
    if (description_it != first.end() && description_it->is_string()) {
      observation.description = description_it->get<std::string>();
    }
  }

  return observation;
}

}  // namespace wx_agent::weather
