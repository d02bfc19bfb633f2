#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/tool_errors.hpp"

namespace cloudctx::protocol {

enum class SchemaType {
    Object,
    String,
    Number,
    Boolean,
    Array
};

struct SchemaProperty;

// A JSON-Schema subset: enough to describe tool inputs to the host and to
// check an argument bag before a handler sees it.
struct SchemaNode {
    SchemaType type = SchemaType::Object;
    std::string description;
    std::vector<SchemaProperty> properties;  // declaration order
    std::shared_ptr<const SchemaNode> items;
    std::vector<std::string> required;
    std::vector<nlohmann::json> enum_values;
    std::optional<std::string> pattern;
    std::optional<double> minimum;
    std::optional<double> maximum;
    std::optional<nlohmann::json> default_value;

    const SchemaNode* property(const std::string& name) const;
};

struct SchemaProperty {
    std::string name;
    SchemaNode node;
};

std::string to_string(SchemaType type);

SchemaNode object_schema();
SchemaNode string_schema(std::string description);
SchemaNode number_schema(std::string description);
SchemaNode boolean_schema(std::string description);
SchemaNode array_schema(std::string description, SchemaNode items);

// Appends a property in declaration order, optionally marking it required.
SchemaNode& add_property(SchemaNode& object, std::string name, SchemaNode node,
                         bool required = false);

// JSON-Schema rendering for the host's tool catalog.
nlohmann::json to_json(const SchemaNode& node);

// Checks the argument bag against the schema and returns a copy with schema
// defaults filled in and null-valued members dropped. Reports
// MissingRequiredArgument, TypeMismatch or InvalidArgument.
core::errors::Result<nlohmann::json> validate_arguments(
    const SchemaNode& schema, const nlohmann::json& arguments);

}  // namespace cloudctx::protocol
