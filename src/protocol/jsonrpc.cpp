#include "protocol/jsonrpc.hpp"

namespace rc_mcp {

namespace {
    bool is_blank(const std::string &s) {
        return s.find_first_not_of(" \t\r\n") == std::string::npos;
    }

    nlohmann::json parse_payload(const std::string &body) {
        if (is_blank(body)) {
            throw McpError(rpc_error::kParseError, "Empty request");
        }
        try {
            return nlohmann::json::parse(body);
        } catch (const nlohmann::json::parse_error &e) {
            throw McpError(rpc_error::kParseError, std::string("Parse error: ") + e.what());
        }
    }
}

CallEnvelope parse_request(const std::string &body) {
    nlohmann::json request = parse_payload(body);

    if (!request.is_object()) {
        throw McpError(rpc_error::kInvalidRequest, "Invalid request: missing method");
    }

    const auto method_it = request.find("method");
    if (method_it == request.end() || !method_it->is_string()) {
        throw McpError(rpc_error::kInvalidRequest, "Invalid request: missing method");
    }

    CallEnvelope call;
    call.method = method_it->get<std::string>();

    const auto params_it = request.find("params");
    if (params_it != request.end() && params_it->is_object()) {
        call.params = *params_it;
    }

    const auto id_it = request.find("id");
    if (id_it != request.end()) {
        call.id = *id_it;
    }

    return call;
}

nlohmann::json make_result_response(const nlohmann::json &id, const nlohmann::json &result) {
    return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

nlohmann::json make_error_response(const nlohmann::json &id, int code, const std::string &message) {
    return nlohmann::json{{"jsonrpc", kJsonRpcVersion},
                          {"id", id},
                          {"error", {{"code", code}, {"message", message}}}};
}

std::string encode_success(const nlohmann::json &id, const nlohmann::json &result) {
    return make_result_response(id, result).dump();
}

std::string encode_error(const nlohmann::json &id, int code, const std::string &message) {
    return make_error_response(id, code, message).dump();
}

ResponseEnvelope decode_response(const std::string &body) {
    nlohmann::json response = parse_payload(body);
    if (!response.is_object()) {
        throw McpError(rpc_error::kInvalidRequest, "Response must be a JSON object");
    }

    ResponseEnvelope envelope;
    envelope.id = response.value("id", nlohmann::json());

    const bool has_result = response.contains("result");
    const bool has_error = response.contains("error");
    if (has_result == has_error) {
        throw McpError(rpc_error::kInvalidRequest, "Response must carry exactly one of result or error");
    }

    if (has_result) {
        envelope.result = response["result"];
    } else {
        const auto &error = response["error"];
        if (!error.is_object() || !error.contains("code") || !error["code"].is_number_integer()) {
            throw McpError(rpc_error::kInvalidRequest, "Malformed error object");
        }
        RpcErrorInfo info;
        info.code = error["code"].get<int>();
        info.message = error.value("message", "");
        envelope.error = info;
    }

    return envelope;
}

} // namespace rc_mcp
