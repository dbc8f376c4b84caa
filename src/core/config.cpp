#include "core/config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/text.hpp"

namespace wx_agent::core {
namespace {

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

long long parse_integer(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be an integer");
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be an integer");
  }
  return parsed;
}

long long parse_in_range(const std::string& key, const std::string& value, const long long min, const long long max) {
  const auto parsed = parse_integer(key, value);
  if (parsed < min || parsed > max) {
    throw std::runtime_error(key + " must be in range " + std::to_string(min) + ".." + std::to_string(max));
  }
  return parsed;
}

void apply_key_value(ServiceConfig& config, const std::string& key, const std::string& raw_value) {
  const std::string value = unquote(raw_value);

  if (key == "default_city") {
    if (trim(value).empty()) {
      throw std::runtime_error("default_city must not be empty");
    }
    config.default_city = trim(value);
    return;
  }

  if (key == "provider.api_key") {
    config.provider.api_key = value;
    return;
  }

  if (key == "provider.base_url") {
    if (value.rfind("http://", 0) != 0 && value.rfind("https://", 0) != 0) {
      throw std::runtime_error("provider.base_url must start with http:// or https://");
    }
    config.provider.base_url = value;
    return;
  }

  if (key == "provider.timeout_ms") {
    config.provider.timeout = std::chrono::milliseconds(parse_in_range(key, value, 1, 600000));
    return;
  }

  if (key == "provider.max_retries") {
    config.provider.max_retries = static_cast<std::uint32_t>(parse_in_range(key, value, 0, 10));
    return;
  }

  if (key == "provider.backoff_ms") {
    config.provider.backoff = std::chrono::milliseconds(parse_in_range(key, value, 0, 60000));
    return;
  }

  if (key == "provider.pool_size") {
    config.provider.pool_size = static_cast<std::uint32_t>(parse_in_range(key, value, 1, 64));
    return;
  }

  if (key == "server.workers") {
    config.server.workers = static_cast<std::uint32_t>(parse_in_range(key, value, 1, 64));
    return;
  }

  if (key == "server.invoke_timeout_ms") {
    config.server.invoke_timeout = std::chrono::milliseconds(parse_in_range(key, value, 0, 600000));
    return;
  }

  if (key == "gazetteer.path") {
    config.gazetteer_path = value;
    return;
  }

  throw std::runtime_error("unknown config key: " + key);
}

}  // namespace

ServiceConfig load_service_config(const std::string& path) {
  ServiceConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (depth > sections.size()) {
      throw std::runtime_error("line " + std::to_string(line_number) + ": indentation skips a section level");
    }
    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  return config;
}

void apply_environment_overrides(ServiceConfig& config) {
  if (const auto* value = std::getenv("OPENWEATHER_API_KEY"); value != nullptr) {
    config.provider.api_key = trim(value);
  }
  if (const auto* value = std::getenv("WX_AGENT_DEFAULT_CITY"); value != nullptr && !trim(value).empty()) {
    config.default_city = trim(value);
  }
  if (const auto* value = std::getenv("WX_AGENT_PROVIDER_URL"); value != nullptr && *value != '\0') {
    apply_key_value(config, "provider.base_url", value);
  }
}

std::string format_config_settings(const ServiceConfig& config, const std::string& source) {
  std::ostringstream output;
  output << "[config] loaded from " << source
         << " | provider=" << (config.provider.live_enabled() ? "live" : "mock")
         << " | default_city=" << config.default_city
         << " | timeout_ms=" << config.provider.timeout.count()
         << " | max_retries=" << config.provider.max_retries
         << " | backoff_ms=" << config.provider.backoff.count()
         << " | pool_size=" << config.provider.pool_size
         << " | workers=" << config.server.workers
         << " | invoke_timeout_ms=" << config.server.invoke_timeout.count()
         << " | gazetteer=" << (config.gazetteer_path.empty() ? "built-in" : config.gazetteer_path);
  return output.str();
}

}  // namespace wx_agent::core
