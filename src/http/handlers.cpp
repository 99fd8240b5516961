#include "http/handlers.hpp"
#include "tools/tool_registry.hpp"
#include "tools/param_coercion.hpp"
#include "dispatch/affinity_executor.hpp"
#include "common/log.hpp"

namespace rc_mcp {

namespace {
    bool is_notification_method(const std::string &method) {
        return method.rfind("notifications/", 0) == 0;
    }
}

McpHandlers::McpHandlers(ToolRegistry &registry, AffinityExecutor &executor)
    : registry_(registry), executor_(executor) {
}

std::optional<std::string> McpHandlers::handle_message(const std::string &body) {
    CallEnvelope call;
    try {
        call = parse_request(body);
    } catch (const McpError &e) {
        log_warn("Rejected request: %s\n", e.what());
        return encode_error(nullptr, e.code(), e.what());
    }

    log_debug("Request: method=%s\n", call.method.c_str());

    if (call.is_notification() && is_notification_method(call.method)) {
        log_msg("Notification: %s\n", call.method.c_str());
        return std::nullopt;
    }

    try {
        nlohmann::json result = dispatch(call);
        std::string response = encode_success(call.response_id(), result);
        log_debug("Response size: %lu bytes\n", static_cast<unsigned long>(response.size()));
        return response;
    } catch (const McpError &e) {
        log_warn("Error %d for %s: %s\n", e.code(), call.method.c_str(), e.what());
        return encode_error(call.response_id(), e.code(), e.what());
    } catch (const std::exception &e) {
        log_error("Internal error for %s: %s\n", call.method.c_str(), e.what());
        return encode_error(call.response_id(), rpc_error::kInternalError, e.what());
    }
}

nlohmann::json McpHandlers::dispatch(const CallEnvelope &call) {
    const std::string &method = call.method;

    if (method == "initialize") {
        return handle_initialize(call.params);
    }
    if (method == "initialized" || method == "notifications/initialized") {
        log_msg("Client initialized\n");
        return nlohmann::json::object();
    }
    if (method == "ping") {
        return nlohmann::json::object();
    }
    if (method == "tools/list") {
        return handle_tools_list(call.params);
    }
    if (method == "tools/call") {
        return handle_tool_call(call.params);
    }

    throw McpError(rpc_error::kMethodNotFound, "Unknown method: " + method);
}

nlohmann::json McpHandlers::handle_initialize(const nlohmann::json &params) const {
    if (params.is_object() && params.contains("clientInfo") && params["clientInfo"].is_object()) {
        log_msg("Received initialize request from %s\n",
                params["clientInfo"].value("name", "unknown client").c_str());
    } else {
        log_msg("Received initialize request\n");
    }

    nlohmann::json response;
    response["protocolVersion"] = kProtocolVersion;
    response["capabilities"] = {
        {"tools", {{"listChanged", false}}}
    };
    response["serverInfo"] = {
        {"name", kServerName},
        {"version", kServerVersion}
    };
    return response;
}

nlohmann::json McpHandlers::handle_tools_list(const nlohmann::json &) const {
    return registry_.get_tools_list();
}

nlohmann::json McpHandlers::handle_tool_call(const nlohmann::json &params) {
    std::string tool_name;
    if (params.is_object() && params.contains("name") && params["name"].is_string()) {
        tool_name = params["name"].get<std::string>();
    }
    if (tool_name.empty()) {
        throw McpError(rpc_error::kInvalidParams, "Missing tool name");
    }

    ITool *tool = registry_.get(tool_name);
    if (tool == nullptr) {
        throw McpError(rpc_error::kMethodNotFound, "Unknown tool: " + tool_name);
    }

    nlohmann::json bag = nlohmann::json::object();
    if (params.contains("arguments") && params["arguments"].is_object()) {
        bag = params["arguments"];
    }

    // Coercion runs on the caller's thread so parameter errors stay -32602.
    nlohmann::json args = bind_arguments(tool->get_params(), bag);

    log_msg("Tool call: %s\n", tool->get_name().c_str());
    nlohmann::json result = executor_.invoke([tool, &args]() { return tool->execute(args); });

    nlohmann::json content_item;
    content_item["type"] = "text";
    content_item["text"] = result.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);

    nlohmann::json response;
    response["content"] = nlohmann::json::array({content_item});
    response["isError"] = false;
    return response;
}

} // namespace rc_mcp
