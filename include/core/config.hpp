#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace wx_agent::core {

struct ProviderConfig {
  std::string api_key{};
  std::string base_url{"http://api.openweathermap.org/data/2.5/weather"};
  std::chrono::milliseconds timeout{5000};
  std::uint32_t max_retries{2};
  std::chrono::milliseconds backoff{250};
  std::uint32_t pool_size{4};

  [[nodiscard]] bool live_enabled() const { return api_key.find_first_not_of(" \t\r\n") != std::string::npos; }
};

struct ServerConfig {
  std::uint32_t workers{4};
  // Zero disables the caller-side timeout.
  std::chrono::milliseconds invoke_timeout{0};
};

struct ServiceConfig {
  std::string default_city{"Hyderabad"};
  std::string gazetteer_path{};
  ProviderConfig provider{};
  ServerConfig server{};
};

ServiceConfig load_service_config(const std::string& path);

// Applies OPENWEATHER_API_KEY, WX_AGENT_DEFAULT_CITY and WX_AGENT_PROVIDER_URL.
void apply_environment_overrides(ServiceConfig& config);

std::string format_config_settings(const ServiceConfig& config, const std::string& source);

}  // namespace wx_agent::core
