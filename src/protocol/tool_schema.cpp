#include "protocol/tool_schema.hpp"

#include <algorithm>
#include <regex>
#include <sstream>
#include <utility>

namespace cloudctx::protocol {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using nlohmann::json;

namespace {

bool matches_type(const SchemaType type, const json& value) {
    switch (type) {
        case SchemaType::Object:
            return value.is_object();
        case SchemaType::String:
            return value.is_string();
        case SchemaType::Number:
            return value.is_number();
        case SchemaType::Boolean:
            return value.is_boolean();
        case SchemaType::Array:
            return value.is_array();
        default:
            return false;
    }
}

std::string describe_json_type(const json& value) {
    if (value.is_number()) {
        return "number";
    }
    return value.type_name();
}

std::string enum_text(const std::vector<json>& values) {
    std::ostringstream out;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << (values[i].is_string() ? values[i].get<std::string>() : values[i].dump());
    }
    return out.str();
}

core::errors::Status validate_value(const SchemaNode& node, const json& value,
                                    const std::string& path) {
    if (!matches_type(node.type, value)) {
        return ToolError{ErrorCategory::TypeMismatch,
                         "Argument '" + path + "' must be of type " +
                             to_string(node.type) + ", got " + describe_json_type(value),
                         "type_mismatch"};
    }

    if (!node.enum_values.empty() &&
        std::find(node.enum_values.begin(), node.enum_values.end(), value) ==
            node.enum_values.end()) {
        return ToolError{ErrorCategory::InvalidArgument,
                         "Argument '" + path + "' must be one of: " +
                             enum_text(node.enum_values),
                         "invalid_enum_value"};
    }

    if (node.pattern.has_value() && value.is_string()) {
        try {
            const std::regex re(node.pattern.value(), std::regex::ECMAScript);
            if (!std::regex_search(value.get<std::string>(), re)) {
                return ToolError{ErrorCategory::InvalidArgument,
                                 "Argument '" + path + "' does not match pattern " +
                                     node.pattern.value(),
                                 "pattern_mismatch"};
            }
        } catch (const std::regex_error& e) {
            return ToolError{ErrorCategory::Internal,
                             "Invalid schema pattern for '" + path + "': " + e.what(),
                             "invalid_schema_pattern"};
        }
    }

    if (value.is_number()) {
        const double number = value.get<double>();
        if (node.minimum.has_value() && number < node.minimum.value()) {
            return ToolError{ErrorCategory::InvalidArgument,
                             "Argument '" + path + "' must be >= " +
                                 json(node.minimum.value()).dump(),
                             "below_minimum"};
        }
        if (node.maximum.has_value() && number > node.maximum.value()) {
            return ToolError{ErrorCategory::InvalidArgument,
                             "Argument '" + path + "' must be <= " +
                                 json(node.maximum.value()).dump(),
                             "above_maximum"};
        }
    }

    if (node.type == SchemaType::Array && node.items) {
        for (std::size_t i = 0; i < value.size(); ++i) {
            auto item_status = validate_value(*node.items, value[i],
                                              path + "[" + std::to_string(i) + "]");
            if (core::errors::is_error(item_status)) {
                return item_status;
            }
        }
    }

    if (node.type == SchemaType::Object) {
        for (const auto& name : node.required) {
            if (!value.contains(name) || value[name].is_null()) {
                return ToolError{ErrorCategory::MissingRequiredArgument,
                                 "Missing required argument: " + path + "." + name,
                                 "missing_required_argument"};
            }
        }
        for (const auto& property : node.properties) {
            const auto it = value.find(property.name);
            if (it == value.end() || it->is_null()) {
                continue;
            }
            auto member_status =
                validate_value(property.node, *it, path + "." + property.name);
            if (core::errors::is_error(member_status)) {
                return member_status;
            }
        }
    }

    return core::errors::ok();
}

}  // namespace

const SchemaNode* SchemaNode::property(const std::string& name) const {
    for (const auto& entry : properties) {
        if (entry.name == name) {
            return &entry.node;
        }
    }
    return nullptr;
}

std::string to_string(const SchemaType type) {
    switch (type) {
        case SchemaType::Object:
            return "object";
        case SchemaType::String:
            return "string";
        case SchemaType::Number:
            return "number";
        case SchemaType::Boolean:
            return "boolean";
        case SchemaType::Array:
            return "array";
        default:
            return "unknown";
    }
}

SchemaNode object_schema() {
    SchemaNode node;
    node.type = SchemaType::Object;
    return node;
}

SchemaNode string_schema(std::string description) {
    SchemaNode node;
    node.type = SchemaType::String;
    node.description = std::move(description);
    return node;
}

SchemaNode number_schema(std::string description) {
    SchemaNode node;
    node.type = SchemaType::Number;
    node.description = std::move(description);
    return node;
}

SchemaNode boolean_schema(std::string description) {
    SchemaNode node;
    node.type = SchemaType::Boolean;
    node.description = std::move(description);
    return node;
}

SchemaNode array_schema(std::string description, SchemaNode items) {
    SchemaNode node;
    node.type = SchemaType::Array;
    node.description = std::move(description);
    node.items = std::make_shared<const SchemaNode>(std::move(items));
    return node;
}

SchemaNode& add_property(SchemaNode& object, std::string name, SchemaNode node,
                         const bool required) {
    if (required) {
        object.required.push_back(name);
    }
    object.properties.push_back(SchemaProperty{std::move(name), std::move(node)});
    return object;
}

json to_json(const SchemaNode& node) {
    json out;
    out["type"] = to_string(node.type);
    if (!node.description.empty()) {
        out["description"] = node.description;
    }
    if (node.type == SchemaType::Object) {
        json properties = json::object();
        for (const auto& property : node.properties) {
            properties[property.name] = to_json(property.node);
        }
        out["properties"] = std::move(properties);
        if (!node.required.empty()) {
            out["required"] = node.required;
        }
    }
    if (node.items) {
        out["items"] = to_json(*node.items);
    }
    if (!node.enum_values.empty()) {
        out["enum"] = node.enum_values;
    }
    if (node.pattern.has_value()) {
        out["pattern"] = node.pattern.value();
    }
    if (node.minimum.has_value()) {
        out["minimum"] = node.minimum.value();
    }
    if (node.maximum.has_value()) {
        out["maximum"] = node.maximum.value();
    }
    if (node.default_value.has_value()) {
        out["default"] = node.default_value.value();
    }
    return out;
}

core::errors::Result<json> validate_arguments(const SchemaNode& schema,
                                              const json& arguments) {
    if (!arguments.is_null() && !arguments.is_object()) {
        return ToolError{ErrorCategory::TypeMismatch,
                         "Tool arguments must be a JSON object, got " +
                             describe_json_type(arguments),
                         "type_mismatch"};
    }

    json normalized = json::object();
    if (arguments.is_object()) {
        for (auto it = arguments.begin(); it != arguments.end(); ++it) {
            if (!it.value().is_null()) {
                normalized[it.key()] = it.value();
            }
        }
    }

    for (const auto& name : schema.required) {
        if (!normalized.contains(name)) {
            return ToolError{ErrorCategory::MissingRequiredArgument,
                             "Missing required argument: " + name,
                             "missing_required_argument"};
        }
    }

    for (const auto& property : schema.properties) {
        const auto it = normalized.find(property.name);
        if (it == normalized.end()) {
            continue;
        }
        auto status = validate_value(property.node, *it, property.name);
        if (core::errors::is_error(status)) {
            return core::errors::get_error(status);
        }
    }

    for (const auto& property : schema.properties) {
        if (!normalized.contains(property.name) &&
            property.node.default_value.has_value()) {
            normalized[property.name] = property.node.default_value.value();
        }
    }

    return normalized;
}

}  // namespace cloudctx::protocol
