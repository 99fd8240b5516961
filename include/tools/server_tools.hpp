#pragma once

#include "capability_provider.hpp"
#include "common/config.hpp"

namespace rc_mcp {

class ToolRegistry;

// Tools about the server itself: echo, server info, a paginated catalog
// view and address parsing.
class ServerToolsProvider : public ICapabilityProvider {
public:
    ServerToolsProvider(const ToolRegistry &registry, ServerConfig config);

    std::string get_name() const override { return "server"; }

    std::vector<ToolDefinition> get_tools() override;

    nlohmann::json echo(const nlohmann::json &args) const;
    nlohmann::json get_server_info(const nlohmann::json &args) const;
    nlohmann::json list_tools(const nlohmann::json &args) const;
    nlohmann::json parse_address(const nlohmann::json &args) const;

private:
    const ToolRegistry &registry_;
    ServerConfig config_;
};

} // namespace rc_mcp
