#include "tools/server_tools.hpp"
#include "tools/tool_registry.hpp"
#include "tools/tool_result.hpp"
#include "http/handlers.hpp"
#include "common/address.hpp"
#include "common/pagination.hpp"

#include <stdexcept>

namespace rc_mcp {

namespace {
    constexpr int64_t kMaxEchoRepeat = 1000;
}

ServerToolsProvider::ServerToolsProvider(const ToolRegistry &registry, ServerConfig config)
    : registry_(registry), config_(std::move(config)) {
}

std::vector<ToolDefinition> ServerToolsProvider::get_tools() {
    return {
        {
            "echo",
            "Echo text back, optionally repeated",
            {
                required_param("text", ValueType::of(ValueKind::String), "Text to echo"),
                optional_param("times", ValueType::of(ValueKind::Integer), 1, "Number of repetitions")
            },
            [this](const nlohmann::json &args) { return echo(args); }
        },
        {
            "get_server_info",
            "Get server name, version and endpoint information",
            {},
            [this](const nlohmann::json &args) { return get_server_info(args); }
        },
        {
            "list_tools",
            "List registered tools with optional filter and pagination",
            {
                optional_param("filter", ValueType::of(ValueKind::String), nullptr,
                               "Substring or glob pattern (* and ?) on the tool name"),
                optional_param("offset", ValueType::of(ValueKind::Integer), 0, "Index of the first tool"),
                optional_param("count", ValueType::of(ValueKind::Integer), kDefaultPageSize, "Page size (max 1000)")
            },
            [this](const nlohmann::json &args) { return list_tools(args); }
        },
        {
            "parse_address",
            "Parse an address string (0x-prefixed hex or decimal)",
            {
                required_param("address", ValueType::of(ValueKind::String), "Address text")
            },
            [this](const nlohmann::json &args) { return parse_address(args); }
        }
    };
}

nlohmann::json ServerToolsProvider::echo(const nlohmann::json &args) const {
    const std::string text = args.at("text").get<std::string>();
    const int64_t times = args.at("times").get<int64_t>();

    if (times < 0 || times > kMaxEchoRepeat) {
        return tool_error("times must be between 0 and " + std::to_string(kMaxEchoRepeat));
    }

    std::string message;
    for (int64_t i = 0; i < times; ++i) {
        if (i > 0) message += " ";
        message += text;
    }

    nlohmann::json result;
    result["text"] = text;
    result["times"] = times;
    result["message"] = message;
    return result;
}

nlohmann::json ServerToolsProvider::get_server_info(const nlohmann::json &) const {
    nlohmann::json result;
    result["name"] = kServerName;
    result["version"] = kServerVersion;
    result["protocolVersion"] = kProtocolVersion;
    result["messageUrl"] = config_.message_url();
    result["toolCount"] = registry_.size();
    return result;
}

nlohmann::json ServerToolsProvider::list_tools(const nlohmann::json &args) const {
    const nlohmann::json &filter = args.at("filter");
    const std::string pattern = filter.is_string() ? filter.get<std::string>() : "";

    const nlohmann::json catalog = registry_.get_tools_list();
    nlohmann::json tools = nlohmann::json::array();
    for (const auto &tool: catalog["tools"]) {
        tools.push_back({{"name", tool["name"]}, {"description", tool["description"]}});
    }

    tools = filter_items(tools, pattern, [](const nlohmann::json &item) {
        return item["name"].get<std::string>();
    });

    return paginate(tools, args.at("offset").get<int64_t>(), args.at("count").get<int64_t>());
}

nlohmann::json ServerToolsProvider::parse_address(const nlohmann::json &args) const {
    const std::string text = args.at("address").get<std::string>();
    try {
        uint64_t value = rc_mcp::parse_address(text);
        return {{"address", format_address(value)}, {"value", value}};
    } catch (const std::invalid_argument &e) {
        return tool_error(e.what());
    }
}

} // namespace rc_mcp
