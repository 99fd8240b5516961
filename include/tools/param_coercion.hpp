#pragma once

#include "tool_param.hpp"

#include <nlohmann/json.hpp>
#include <vector>

namespace rc_mcp {

// Value a target kind falls back to when the input cannot be converted.
nlohmann::json zero_value(const ValueType &type);

// Best-effort conversion of a loosely-typed value to the target type.
// Never throws: unconvertible scalars become zero_value(type).
nlohmann::json coerce_value(const nlohmann::json &value, const ValueType &type);

// Builds the argument bag for a tool from the raw client bag, walking the
// declared parameters in order. A missing value is filled from the default,
// then from nullability; otherwise McpError(kInvalidParams) names the parameter.
// Keys the tool did not declare are dropped.
nlohmann::json bind_arguments(const std::vector<ToolParam> &params, const nlohmann::json &bag);

} // namespace rc_mcp
