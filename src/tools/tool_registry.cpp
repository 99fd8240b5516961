#include "tools/tool_registry.hpp"
#include "tools/generic_tool.hpp"
#include "common/log.hpp"
#include "common/string_util.hpp"

#include <stdexcept>

namespace rc_mcp {

std::string normalize_tool_name(const std::string &name) {
    return to_lower(name);
}

nlohmann::json GenericTool::get_input_schema() const {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();

    for (const auto &param: params_) {
        properties[param.name] = param.schema();
        if (param.is_required()) {
            required.push_back(param.name);
        }
    }

    return {
        {"type", "object"},
        {"properties", properties},
        {"required", required}
    };
}

nlohmann::json GenericTool::execute(const nlohmann::json &args) {
    if (!func_) {
        throw std::runtime_error("Tool has no handler: " + name_);
    }
    return func_(args);
}

void ToolRegistry::register_provider(ICapabilityProvider &provider) {
    auto definitions = provider.get_tools();
    for (auto &def: definitions) {
        register_tool(std::make_unique<GenericTool>(std::move(def)));
    }
    log_msg("Registered provider %s (%lu tools)\n", provider.get_name().c_str(),
            static_cast<unsigned long>(definitions.size()));
}

void ToolRegistry::register_tool(std::unique_ptr<ITool> tool) {
    if (!tool) {
        return;
    }

    const std::string key = normalize_tool_name(tool->get_name());
    auto it = tool_map_.find(key);
    if (it != tool_map_.end()) {
        tools_[it->second] = std::move(tool);
        return;
    }

    tool_map_[key] = tools_.size();
    tools_.push_back(std::move(tool));
}

ITool *ToolRegistry::get(const std::string &name) const {
    auto it = tool_map_.find(normalize_tool_name(name));
    if (it == tool_map_.end()) {
        return nullptr;
    }
    return tools_[it->second].get();
}

nlohmann::json ToolRegistry::get_tools_list() const {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto &tool: tools_) {
        nlohmann::json tool_def;
        tool_def["name"] = tool->get_name();
        tool_def["description"] = tool->get_description();
        tool_def["inputSchema"] = tool->get_input_schema();
        tools.push_back(tool_def);
    }

    log_debug("Returning %lu tools\n", static_cast<unsigned long>(tools.size()));

    nlohmann::json result;
    result["tools"] = tools;
    return result;
}

std::vector<std::string> ToolRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(tools_.size());
    for (const auto &tool: tools_) {
        result.push_back(tool->get_name());
    }
    return result;
}

} // namespace rc_mcp
