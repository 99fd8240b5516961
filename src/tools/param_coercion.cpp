#include "tools/param_coercion.hpp"
#include "protocol/jsonrpc.hpp"
#include "common/address.hpp"
#include "common/string_util.hpp"

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>

namespace rc_mcp {

namespace {
    bool parse_int64(const std::string &text, int64_t &out) {
        std::string s = trim(text);
        if (s.empty()) {
            return false;
        }
        errno = 0;
        char *end = nullptr;
        long long value = std::strtoll(s.c_str(), &end, 10);
        if (errno == ERANGE || end == nullptr || *end != '\0') {
            return false;
        }
        out = static_cast<int64_t>(value);
        return true;
    }

    bool parse_double(const std::string &text, double &out) {
        std::string s = trim(text);
        if (s.empty()) {
            return false;
        }
        errno = 0;
        char *end = nullptr;
        double value = std::strtod(s.c_str(), &end);
        if (errno == ERANGE || end == nullptr || *end != '\0' || !std::isfinite(value)) {
            return false;
        }
        out = value;
        return true;
    }

    bool double_fits_int64(double d) {
        return std::isfinite(d) &&
               d >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
               d < static_cast<double>(std::numeric_limits<int64_t>::max());
    }

    nlohmann::json to_string_value(const nlohmann::json &value) {
        if (value.is_string()) return value;
        if (value.is_number() || value.is_boolean()) return value.dump();
        return "";
    }

    nlohmann::json to_boolean(const nlohmann::json &value) {
        if (value.is_boolean()) return value;
        if (value.is_number_integer()) return value.get<int64_t>() != 0;
        if (value.is_number_unsigned()) return value.get<uint64_t>() != 0;
        if (value.is_number_float()) return value.get<double>() != 0.0;
        if (value.is_string()) {
            return to_lower(trim(value.get<std::string>())) == "true";
        }
        return false;
    }

    nlohmann::json to_integer(const nlohmann::json &value) {
        if (value.is_number_unsigned()) {
            // Values above INT64_MAX fall back to zero.
            return value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())
                   ? nlohmann::json(value.get<int64_t>()) : nlohmann::json(0);
        }
        if (value.is_number_integer()) return value;
        if (value.is_number_float()) {
            double d = value.get<double>();
            if (!double_fits_int64(d)) return 0;
            // nearbyint under the default rounding mode: halves go to the even neighbour.
            return static_cast<int64_t>(std::nearbyint(d));
        }
        if (value.is_boolean()) return value.get<bool>() ? 1 : 0;
        if (value.is_string()) {
            int64_t parsed = 0;
            return parse_int64(value.get<std::string>(), parsed) ? nlohmann::json(parsed) : nlohmann::json(0);
        }
        return 0;
    }

    nlohmann::json to_number(const nlohmann::json &value) {
        if (value.is_number()) return value.get<double>();
        if (value.is_boolean()) return value.get<bool>() ? 1.0 : 0.0;
        if (value.is_string()) {
            double parsed = 0.0;
            return parse_double(value.get<std::string>(), parsed) ? parsed : 0.0;
        }
        return 0.0;
    }

    // Signed values are reinterpreted as two's complement addresses.
    nlohmann::json to_address(const nlohmann::json &value) {
        if (value.is_number_unsigned()) return value;
        if (value.is_number_integer()) return static_cast<uint64_t>(value.get<int64_t>());
        if (value.is_number_float()) {
            double d = value.get<double>();
            if (double_fits_int64(d) && std::floor(d) == d) {
                return static_cast<uint64_t>(static_cast<int64_t>(d));
            }
            return static_cast<uint64_t>(0);
        }
        if (value.is_boolean()) return static_cast<uint64_t>(value.get<bool>() ? 1 : 0);
        if (value.is_string()) {
            uint64_t address = 0;
            if (try_parse_address(value.get<std::string>(), address)) {
                return address;
            }
            int64_t signed_value = 0;
            if (parse_int64(value.get<std::string>(), signed_value)) {
                return static_cast<uint64_t>(signed_value);
            }
        }
        return static_cast<uint64_t>(0);
    }
}

nlohmann::json zero_value(const ValueType &type) {
    switch (type.kind) {
        case ValueKind::String: return "";
        case ValueKind::Boolean: return false;
        case ValueKind::Integer: return 0;
        case ValueKind::Number: return 0.0;
        case ValueKind::Address: return static_cast<uint64_t>(0);
        case ValueKind::Array: return nlohmann::json::array();
        case ValueKind::Object:
        case ValueKind::IntegerMap: return nlohmann::json::object();
    }
    return nullptr;
}

nlohmann::json coerce_value(const nlohmann::json &value, const ValueType &type) {
    if (value.is_null()) {
        return zero_value(type);
    }

    switch (type.kind) {
        case ValueKind::String:
            return to_string_value(value);
        case ValueKind::Boolean:
            return to_boolean(value);
        case ValueKind::Integer:
            return to_integer(value);
        case ValueKind::Number:
            return to_number(value);
        case ValueKind::Address:
            return to_address(value);
        case ValueKind::Array: {
            if (!value.is_array()) {
                return nlohmann::json::array();
            }
            nlohmann::json result = nlohmann::json::array();
            for (const auto &item: value) {
                result.push_back(coerce_value(item, type.element_type()));
            }
            return result;
        }
        case ValueKind::Object:
            return value.is_object() ? value : nlohmann::json::object();
        case ValueKind::IntegerMap: {
            if (!value.is_object()) {
                return nlohmann::json::object();
            }
            nlohmann::json result = nlohmann::json::object();
            for (auto it = value.begin(); it != value.end(); ++it) {
                result[it.key()] = to_integer(it.value());
            }
            return result;
        }
    }
    return zero_value(type);
}

nlohmann::json bind_arguments(const std::vector<ToolParam> &params, const nlohmann::json &bag) {
    nlohmann::json args = nlohmann::json::object();

    for (const auto &param: params) {
        const nlohmann::json *supplied = nullptr;
        if (bag.is_object()) {
            auto it = bag.find(param.name);
            // An explicit null counts as not supplied.
            if (it != bag.end() && !it->is_null()) {
                supplied = &*it;
            }
        }

        if (supplied) {
            args[param.name] = coerce_value(*supplied, param.type);
        } else if (param.default_value.has_value()) {
            args[param.name] = *param.default_value;
        } else if (param.nullable) {
            args[param.name] = nullptr;
        } else {
            throw McpError(rpc_error::kInvalidParams, "Missing required parameter: " + param.name);
        }
    }

    return args;
}

} // namespace rc_mcp
