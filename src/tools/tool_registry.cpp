#include "tools/tool_registry.hpp"

#include <utility>

namespace cloudctx::tools {

using core::errors::ErrorCategory;
using core::errors::ToolError;

core::errors::Status ToolRegistry::register_tool(protocol::ToolDescriptor descriptor,
                                                 ToolHandler handler) {
    if (descriptor.name.empty()) {
        return ToolError{ErrorCategory::Internal, "Tool name cannot be empty.",
                         "invalid_tool_name"};
    }
    if (index_.find(descriptor.name) != index_.end()) {
        return ToolError{ErrorCategory::Internal,
                         "Tool already registered: " + descriptor.name,
                         "duplicate_tool"};
    }
    if (descriptor.description.empty()) {
        return ToolError{ErrorCategory::Internal,
                         "Tool description cannot be empty: " + descriptor.name,
                         "missing_description"};
    }
    if (descriptor.input_schema.type != protocol::SchemaType::Object) {
        return ToolError{ErrorCategory::Internal,
                         "Tool input schema must be an object: " + descriptor.name,
                         "invalid_schema"};
    }
    for (const auto& required : descriptor.input_schema.required) {
        if (descriptor.input_schema.property(required) == nullptr) {
            return ToolError{ErrorCategory::Internal,
                             "Required field '" + required +
                                 "' is not a declared property of " + descriptor.name,
                             "invalid_schema"};
        }
    }
    if (!handler) {
        return ToolError{ErrorCategory::Internal,
                         "Tool handler cannot be empty: " + descriptor.name,
                         "missing_handler"};
    }

    index_.emplace(descriptor.name, tools_.size());
    tools_.push_back(RegisteredTool{std::move(descriptor), std::move(handler)});
    return core::errors::ok();
}

std::vector<protocol::ToolDescriptor> ToolRegistry::list_tools() const {
    std::vector<protocol::ToolDescriptor> descriptors;
    descriptors.reserve(tools_.size());
    for (const auto& tool : tools_) {
        descriptors.push_back(tool.descriptor);
    }
    return descriptors;
}

const RegisteredTool* ToolRegistry::find(const std::string& name) const {
    const auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &tools_[it->second];
}

}  // namespace cloudctx::tools
