#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace rc_mcp {

// Domain failures travel inside a successful tools/call result.

// Query that could not be answered.
inline nlohmann::json tool_error(const std::string &message) {
    return {{"error", message}};
}

// Mutation that did not happen.
inline nlohmann::json tool_failure(const std::string &message) {
    return {{"ok", false}, {"error", message}};
}

inline nlohmann::json tool_ok(nlohmann::json extra = nlohmann::json::object()) {
    extra["ok"] = true;
    return extra;
}

} // namespace rc_mcp
