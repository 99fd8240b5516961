#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace rc_mcp {

constexpr const char *kJsonRpcVersion = "2.0";

namespace rpc_error {
    constexpr int kParseError = -32700;
    constexpr int kInvalidRequest = -32600;
    constexpr int kMethodNotFound = -32601;
    constexpr int kInvalidParams = -32602;
    constexpr int kInternalError = -32603;
}

// Protocol-level failure. Always reported as an error envelope, never as a tool result.
class McpError : public std::runtime_error {
public:
    McpError(int code, const std::string &message)
        : std::runtime_error(message), code_(code) {
    }

    int code() const { return code_; }

private:
    int code_;
};

struct CallEnvelope {
    std::string method;
    nlohmann::json params = nlohmann::json::object();
    // Absent for notifications. When present it is echoed back untouched.
    std::optional<nlohmann::json> id;

    bool is_notification() const { return !id.has_value(); }
    nlohmann::json response_id() const { return id.value_or(nlohmann::json()); }
};

struct RpcErrorInfo {
    int code = 0;
    std::string message;
};

struct ResponseEnvelope {
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcErrorInfo> error;

    bool is_error() const { return error.has_value(); }
};

// Throws McpError(kParseError) for empty or malformed payloads and
// McpError(kInvalidRequest) when the decoded value has no string "method".
CallEnvelope parse_request(const std::string &body);

nlohmann::json make_result_response(const nlohmann::json &id, const nlohmann::json &result);
nlohmann::json make_error_response(const nlohmann::json &id, int code, const std::string &message);

std::string encode_success(const nlohmann::json &id, const nlohmann::json &result);
std::string encode_error(const nlohmann::json &id, int code, const std::string &message);

// Inverse of encode_success/encode_error. Throws McpError(kParseError) on malformed
// input and McpError(kInvalidRequest) when neither or both of result/error are present.
ResponseEnvelope decode_response(const std::string &body);

} // namespace rc_mcp
