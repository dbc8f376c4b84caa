#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "agent/query_session.hpp"
#include "core/config.hpp"
#include "mcp/tool_server.hpp"
#include "mcp/tools.hpp"
#include "query/gazetteer.hpp"
#include "query/interpreter.hpp"
#include "weather/openweather_provider.hpp"
#include "weather/resolver.hpp"

int main(int argc, char** argv) {
  const std::string config_source = argc > 1 ? argv[1] : "defaults";

  wx_agent::core::ServiceConfig config{};
  std::optional<wx_agent::agent::QuerySession> session;
  try {
    if (argc > 1) {
      config = wx_agent::core::load_service_config(argv[1]);
    }
    wx_agent::core::apply_environment_overrides(config);

    auto gazetteer = config.gazetteer_path.empty() ? wx_agent::query::Gazetteer{}
                                                   : wx_agent::query::Gazetteer::load(config.gazetteer_path);
    const auto resolver = std::make_shared<const wx_agent::weather::WeatherResolver>(
        config, wx_agent::weather::make_live_provider(config.provider));
    session.emplace(wx_agent::query::make_rule_based_interpreter(std::move(gazetteer)),
                    wx::mcp::ToolServer(wx::mcp::build_tool_registry(resolver)), config.server.invoke_timeout);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << wx_agent::core::format_config_settings(config, config_source) << '\n';

  session->run(std::cin, std::cout, std::cerr);
  return 0;
}
