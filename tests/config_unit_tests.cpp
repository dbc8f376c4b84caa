#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "core/config.hpp"

using wx_agent::core::ServiceConfig;
using wx_agent::core::apply_environment_overrides;
using wx_agent::core::format_config_settings;
using wx_agent::core::load_service_config;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

std::filesystem::path write_config(const std::string& file_name, const std::string& contents) {
  const auto path = std::filesystem::temp_directory_path() / file_name;
  std::ofstream out(path);
  out << contents;
  return path;
}

bool load_throws(const std::string& file_name, const std::string& contents) {
  const auto path = write_config(file_name, contents);
  bool threw = false;
  try {
    (void)load_service_config(path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  std::filesystem::remove(path);
  return threw;
}

void clear_environment() {
  unsetenv("OPENWEATHER_API_KEY");
  unsetenv("WX_AGENT_DEFAULT_CITY");
  unsetenv("WX_AGENT_PROVIDER_URL");
}

int test_defaults() {
  const ServiceConfig config{};
  if (config.default_city != "Hyderabad" || config.provider.live_enabled()) {
    return fail("test_defaults", "expected Hyderabad with no live provider");
  }
  if (config.provider.timeout != std::chrono::milliseconds(5000) || config.provider.max_retries != 2) {
    return fail("test_defaults", "expected 5s timeout and two retries");
  }
  return 0;
}

int test_load_nested_sections() {
  const auto path = write_config("wx_agent_config_full.yaml",
                                 "# service settings\n"
                                 "default_city: \"New York\"\n"
                                 "provider:\n"
                                 "  api_key: 'abc123'   # inline comment\n"
                                 "  base_url: https://example.test/weather\n"
                                 "  timeout_ms: 1500\n"
                                 "  max_retries: 0\n"
                                 "  backoff_ms: 50\n"
                                 "  pool_size: 8\n"
                                 "server:\n"
                                 "  workers: 2\n"
                                 "  invoke_timeout_ms: 3000\n"
                                 "gazetteer:\n"
                                 "  path: /etc/wx-agent/cities.txt\n");

  const auto config = load_service_config(path.string());
  std::filesystem::remove(path);

  if (config.default_city != "New York") {
    return fail("test_load_nested_sections", "default_city not parsed");
  }
  if (config.provider.api_key != "abc123" || config.provider.base_url != "https://example.test/weather") {
    return fail("test_load_nested_sections", "provider credentials not parsed");
  }
  if (config.provider.timeout != std::chrono::milliseconds(1500) || config.provider.max_retries != 0 ||
      config.provider.backoff != std::chrono::milliseconds(50) || config.provider.pool_size != 8) {
    return fail("test_load_nested_sections", "provider limits not parsed");
  }
  if (config.server.workers != 2 || config.server.invoke_timeout != std::chrono::milliseconds(3000)) {
    return fail("test_load_nested_sections", "server section not parsed");
  }
  if (config.gazetteer_path != "/etc/wx-agent/cities.txt") {
    return fail("test_load_nested_sections", "gazetteer path not parsed");
  }
  return 0;
}

int test_rejects_invalid_values() {
  if (!load_throws("wx_agent_config_timeout.yaml", "provider:\n  timeout_ms: 0\n")) {
    return fail("test_rejects_invalid_values", "expected zero timeout to be rejected");
  }
  if (!load_throws("wx_agent_config_retries.yaml", "provider:\n  max_retries: 11\n")) {
    return fail("test_rejects_invalid_values", "expected excessive retries to be rejected");
  }
  if (!load_throws("wx_agent_config_integer.yaml", "server:\n  workers: four\n")) {
    return fail("test_rejects_invalid_values", "expected non-integer workers to be rejected");
  }
  if (!load_throws("wx_agent_config_url.yaml", "provider:\n  base_url: ftp://example.test\n")) {
    return fail("test_rejects_invalid_values", "expected non-http base_url to be rejected");
  }
  if (!load_throws("wx_agent_config_unknown.yaml", "redis:\n  address: localhost:6379\n")) {
    return fail("test_rejects_invalid_values", "expected unknown key to be rejected");
  }
  if (!load_throws("wx_agent_config_city.yaml", "default_city: \"  \"\n")) {
    return fail("test_rejects_invalid_values", "expected blank default_city to be rejected");
  }
  if (!load_throws("wx_agent_config_indent.yaml", "    provider:\n      timeout_ms: 100\n")) {
    return fail("test_rejects_invalid_values", "expected over-indented section to be rejected");
  }
  if (!load_throws("wx_agent_config_indent_value.yaml", "provider:\n      timeout_ms: 100\n")) {
    return fail("test_rejects_invalid_values", "expected key indented past its section to be rejected");
  }

  bool threw = false;
  try {
    (void)load_service_config("/nonexistent/wx-agent.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_rejects_invalid_values", "expected missing file to be rejected");
  }
  return 0;
}

int test_environment_overrides() {
  clear_environment();

  ServiceConfig config{};
  setenv("OPENWEATHER_API_KEY", "  secret-key  ", 1);
  setenv("WX_AGENT_DEFAULT_CITY", "  london ", 1);
  setenv("WX_AGENT_PROVIDER_URL", "http://localhost:8080/weather", 1);
  apply_environment_overrides(config);

  if (config.provider.api_key != "secret-key" || !config.provider.live_enabled()) {
    return fail("test_environment_overrides", "api key override not applied");
  }
  if (config.default_city != "london") {
    return fail("test_environment_overrides", "default city override not applied");
  }
  if (config.provider.base_url != "http://localhost:8080/weather") {
    return fail("test_environment_overrides", "provider url override not applied");
  }

  const auto settings = format_config_settings(config, "test");
  if (settings.find("secret-key") != std::string::npos) {
    return fail("test_environment_overrides", "settings line must not print the api key");
  }
  if (settings.find("provider=live") == std::string::npos) {
    return fail("test_environment_overrides", "settings line should report the live provider");
  }

  ServiceConfig untouched{};
  setenv("WX_AGENT_DEFAULT_CITY", "   ", 1);
  unsetenv("WX_AGENT_PROVIDER_URL");
  apply_environment_overrides(untouched);
  if (untouched.default_city != "Hyderabad") {
    return fail("test_environment_overrides", "blank default city override should be ignored");
  }

  setenv("WX_AGENT_PROVIDER_URL", "gopher://example.test", 1);
  bool threw = false;
  try {
    apply_environment_overrides(untouched);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  clear_environment();
  if (!threw) {
    return fail("test_environment_overrides", "invalid provider url override should be rejected");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_defaults(); rc != 0) {
    return rc;
  }
  if (int rc = test_load_nested_sections(); rc != 0) {
    return rc;
  }
  if (int rc = test_rejects_invalid_values(); rc != 0) {
    return rc;
  }
  if (int rc = test_environment_overrides(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] config unit tests\n";
  return 0;
}
