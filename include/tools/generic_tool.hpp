#pragma once

#include "tool_interface.hpp"
#include "common/types.hpp"

namespace rc_mcp {

// Manifest entry a capability provider hands to the registry.
struct ToolDefinition {
    std::string name;
    std::string description;
    std::vector<ToolParam> params;
    ToolHandler function;
};

// Generic tool wrapper for function-based tools
class GenericTool : public ITool {
private:
    std::string name_;
    std::string description_;
    std::vector<ToolParam> params_;
    ToolHandler func_;

public:
    explicit GenericTool(ToolDefinition definition)
        : name_(std::move(definition.name)),
          description_(std::move(definition.description)),
          params_(std::move(definition.params)),
          func_(std::move(definition.function)) {
    }

    std::string get_name() const override { return name_; }
    std::string get_description() const override { return description_; }
    const std::vector<ToolParam> &get_params() const override { return params_; }

    nlohmann::json get_input_schema() const override;

    nlohmann::json execute(const nlohmann::json &args) override;
};

} // namespace rc_mcp
