#include "mcp/tools.hpp"

#include <optional>
#include <stdexcept>
#include <string>

#include "model/weather_reading.hpp"
#include "weather/resolver.hpp"

namespace wx::mcp {

namespace {

nlohmann::json handle_get_weather(const wx_agent::weather::WeatherResolver& resolver, const nlohmann::json& arguments,
                                  const wx_agent::core::Cancellation& cancellation) {
  std::optional<std::string> city;
  const auto city_it = arguments.find("city");
  if (city_it != arguments.end() && city_it->is_string()) {
    city = city_it->get<std::string>();
  }

  return wx_agent::model::to_json(resolver.resolve(city, cancellation));
}

}  // namespace

ToolDefinition get_weather_definition() {
  return ToolDefinition{
      .name = "get_weather",
      .description = "Get current weather for a city: temperature in Celsius, condition, humidity and whether the "
                     "reading is live or synthetic. Omitting city uses the configured default city.",
      .version = "1.0.0",
      .input_schema = {{"city", ParamSpec{.type = "string", .required = false, .description = "City name, e.g. London"}}}};
}

ToolRegistry build_tool_registry(std::shared_ptr<const wx_agent::weather::WeatherResolver> resolver) {
  if (resolver == nullptr) {
    throw std::invalid_argument("get_weather requires a resolver");
  }

  ToolRegistry registry;
  registry.register_tool(get_weather_definition(),
                         [resolver](const nlohmann::json& arguments, const wx_agent::core::Cancellation& cancellation) {
                           return handle_get_weather(*resolver, arguments, cancellation);
                         });
  return registry;
}

}  // namespace wx::mcp
