#include "tools/tool_param.hpp"

namespace rc_mcp {

ValueType ValueType::of(ValueKind kind) {
    ValueType type;
    type.kind = kind;
    if (kind == ValueKind::Array) {
        type.element = std::make_shared<const ValueType>();
    }
    return type;
}

ValueType ValueType::array_of(const ValueType &element) {
    ValueType type;
    type.kind = ValueKind::Array;
    type.element = std::make_shared<const ValueType>(element);
    return type;
}

const ValueType &ValueType::element_type() const {
    static const ValueType fallback;
    return element ? *element : fallback;
}

const char *schema_type_name(ValueKind kind) {
    switch (kind) {
        case ValueKind::String: return "string";
        case ValueKind::Boolean: return "boolean";
        case ValueKind::Integer:
        case ValueKind::Address: return "integer";
        case ValueKind::Number: return "number";
        case ValueKind::Array: return "array";
        case ValueKind::Object:
        case ValueKind::IntegerMap: return "object";
    }
    return "object";
}

namespace {
    nlohmann::json type_schema(const ValueType &type) {
        nlohmann::json schema;
        schema["type"] = schema_type_name(type.kind);
        if (type.kind == ValueKind::Array) {
            schema["items"] = type_schema(type.element_type());
        } else if (type.kind == ValueKind::IntegerMap) {
            schema["additionalProperties"] = {{"type", "integer"}};
        }
        return schema;
    }
}

nlohmann::json ToolParam::schema() const {
    nlohmann::json property = type_schema(type);
    property["description"] = description.empty() ? name : description;
    if (default_value.has_value() && !default_value->is_null()) {
        property["default"] = *default_value;
    }
    return property;
}

ToolParam required_param(std::string name, ValueType type, std::string description) {
    ToolParam param;
    param.name = std::move(name);
    param.type = std::move(type);
    param.description = std::move(description);
    return param;
}

ToolParam optional_param(std::string name, ValueType type, nlohmann::json default_value,
                         std::string description) {
    ToolParam param = required_param(std::move(name), std::move(type), std::move(description));
    param.default_value = std::move(default_value);
    return param;
}

ToolParam nullable_param(std::string name, ValueType type, std::string description) {
    ToolParam param = required_param(std::move(name), std::move(type), std::move(description));
    param.nullable = true;
    return param;
}

} // namespace rc_mcp
