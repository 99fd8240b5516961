#pragma once

#include "tool_interface.hpp"
#include "capability_provider.hpp"

#include <memory>
#include <string>
#include <vector>
#include <unordered_map>

namespace rc_mcp {

// Catalog of invocable tools, keyed by case-insensitive name.
// Populated once at startup; afterwards it is only read, so concurrent
// lookups from transport workers need no locking.
class ToolRegistry {
public:
    ToolRegistry() = default;

    ToolRegistry(const ToolRegistry &) = delete;
    ToolRegistry &operator=(const ToolRegistry &) = delete;

    // Registers every tool the provider declares. A tool whose name matches
    // an existing one replaces it in place; the last registration wins.
    void register_provider(ICapabilityProvider &provider);

    void register_tool(std::unique_ptr<ITool> tool);

    // nullptr when no tool has that name.
    ITool *get(const std::string &name) const;

    // {"tools": [{name, description, inputSchema}, ...]} in registration order.
    nlohmann::json get_tools_list() const;

    size_t size() const { return tools_.size(); }

    std::vector<std::string> names() const;

private:
    std::vector<std::unique_ptr<ITool>> tools_;
    std::unordered_map<std::string, size_t> tool_map_;
};

std::string normalize_tool_name(const std::string &name);

} // namespace rc_mcp
