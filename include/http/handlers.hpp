#pragma once

#include "protocol/jsonrpc.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace rc_mcp {

class ToolRegistry;
class AffinityExecutor;

constexpr const char *kProtocolVersion = "2024-11-05";
constexpr const char *kServerName = "rcmcp";
constexpr const char *kServerVersion = "1.0.0";

// Decodes one message body, routes it by method and encodes the outcome.
// Safe to call from any transport worker: tool bodies are handed to the
// affinity executor, the registry is only read.
class McpHandlers {
public:
    McpHandlers(ToolRegistry &registry, AffinityExecutor &executor);

    // Response body to send, or nullopt when the message was a notification
    // that owes no response.
    std::optional<std::string> handle_message(const std::string &body);

    nlohmann::json dispatch(const CallEnvelope &call);

    nlohmann::json handle_initialize(const nlohmann::json &params) const;

    nlohmann::json handle_tools_list(const nlohmann::json &params) const;

    nlohmann::json handle_tool_call(const nlohmann::json &params);

private:
    ToolRegistry &registry_;
    AffinityExecutor &executor_;
};

} // namespace rc_mcp
