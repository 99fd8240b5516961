#pragma once

#include "tool_param.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace rc_mcp {

class ITool {
public:
    virtual ~ITool() = default;

    virtual std::string get_name() const = 0;

    virtual std::string get_description() const = 0;

    virtual const std::vector<ToolParam> &get_params() const = 0;

    virtual nlohmann::json get_input_schema() const = 0;

    // args holds one coerced value per declared parameter.
    // Must only be called on the affinity context.
    virtual nlohmann::json execute(const nlohmann::json &args) = 0;
};

} // namespace rc_mcp
