#include <iostream>
#include <memory>
#include <string>

#include "core/config.hpp"
#include "mcp/server.hpp"
#include "mcp/tool_server.hpp"
#include "mcp/tools.hpp"
#include "weather/openweather_provider.hpp"
#include "weather/resolver.hpp"

int main(int argc, char** argv) {
  const std::string config_source = argc > 1 ? argv[1] : "defaults";

  wx_agent::core::ServiceConfig config{};
  std::shared_ptr<const wx_agent::weather::WeatherResolver> resolver;
  try {
    if (argc > 1) {
      config = wx_agent::core::load_service_config(argv[1]);
    }
    wx_agent::core::apply_environment_overrides(config);
    resolver = std::make_shared<const wx_agent::weather::WeatherResolver>(
        config, wx_agent::weather::make_live_provider(config.provider));
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << wx_agent::core::format_config_settings(config, config_source) << '\n';

  wx::mcp::Server server(wx::mcp::ToolServer(wx::mcp::build_tool_registry(resolver)),
                         wx::mcp::ServerOptions{.name = "wx-agent-mcp",
                                                .version = "1.0.0",
                                                .workers = config.server.workers,
                                                .invoke_timeout = config.server.invoke_timeout});
  return server.run(std::cin, std::cout, std::cerr);
}
