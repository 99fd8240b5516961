#pragma once

#include <nlohmann/json.hpp>
#include <functional>

namespace rc_mcp {

// Every tool receives one coerced argument bag and returns one structured result.
using ToolHandler = std::function<nlohmann::json(const nlohmann::json &)>;

} // namespace rc_mcp
