#pragma once

#include <memory>
#include <string>

#include "core/config.hpp"
#include "net/http_client.hpp"
#include "weather/provider.hpp"

namespace wx_agent::weather {

// OpenWeatherMap current-weather endpoint, metric units.
class OpenWeatherProvider final : public DataProvider {
 public:
  OpenWeatherProvider(core::ProviderConfig config, std::shared_ptr<const net::HttpClient> http);

  FetchOutcome fetch(const std::string& city, std::chrono::milliseconds timeout,
                     const core::Cancellation& cancellation) const override;

 private:
  core::ProviderConfig config_;
  std::shared_ptr<const net::HttpClient> http_;
};

// Null when no API key is configured: the resolver then always uses mock data.
std::shared_ptr<const DataProvider> make_live_provider(const core::ProviderConfig& config);

// Maps an OWM condition id (e.g. 501 "moderate rain") onto the closed enum.
model::weather_condition condition_from_owm_code(int code);

// Classifies a completed HTTP exchange: 2xx parses, 5xx is transient, any
// other status or an unusable body is terminal.
FetchOutcome parse_openweather_response(long status, const std::string& body);

FetchOutcome classify_transfer(const net::HttpResponse& response);

}  // namespace wx_agent::weather
