#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/tool_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace cloudctx::tools {

// Receives the validated argument bag and returns the JSON payload that is
// rendered into the tool's single text block.
using ToolHandler =
    std::function<core::errors::Result<nlohmann::json>(const nlohmann::json& arguments)>;

struct RegisteredTool {
    protocol::ToolDescriptor descriptor;
    ToolHandler handler;
};

class ToolRegistry {
public:
    // Rejects duplicate names, empty descriptions, missing handlers and
    // required fields that are not declared properties.
    core::errors::Status register_tool(protocol::ToolDescriptor descriptor,
                                       ToolHandler handler);

    // Declaration order.
    std::vector<protocol::ToolDescriptor> list_tools() const;

    const RegisteredTool* find(const std::string& name) const;

    std::size_t size() const { return tools_.size(); }

private:
    std::vector<RegisteredTool> tools_;
    std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace cloudctx::tools
