#pragma once

#include "generic_tool.hpp"

#include <string>
#include <vector>

namespace rc_mcp {

// External collaborator exposing zero or more tools. The registry reads the
// manifest once at registration time and does not own the provider; the
// provider must outlive every call into the tools it declared.
class ICapabilityProvider {
public:
    virtual ~ICapabilityProvider() = default;

    virtual std::string get_name() const = 0;

    virtual std::vector<ToolDefinition> get_tools() = 0;
};

} // namespace rc_mcp
