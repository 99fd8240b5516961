#pragma once

#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace rc_mcp {

enum class ValueKind {
    String,
    Boolean,
    Integer,
    Number,
    Address,     // fixed-width 64-bit address, advertised as "integer"
    Array,
    Object,
    IntegerMap   // string -> integer map, advertised as "object"
};

struct ValueType {
    ValueKind kind = ValueKind::String;
    std::shared_ptr<const ValueType> element;  // arrays only

    static ValueType of(ValueKind kind);
    static ValueType array_of(const ValueType &element);

    const ValueType &element_type() const;
};

const char *schema_type_name(ValueKind kind);

struct ToolParam {
    std::string name;
    ValueType type;
    std::string description;
    // Present -> parameter is optional. May hold null, the explicit "no value" default.
    std::optional<nlohmann::json> default_value;
    // Accepts absence without a default; the handler then sees null.
    bool nullable = false;

    bool is_required() const { return !default_value.has_value(); }

    // Property entry for the tool's inputSchema.
    nlohmann::json schema() const;
};

ToolParam required_param(std::string name, ValueType type, std::string description = "");
ToolParam optional_param(std::string name, ValueType type, nlohmann::json default_value,
                         std::string description = "");
ToolParam nullable_param(std::string name, ValueType type, std::string description = "");

} // namespace rc_mcp
