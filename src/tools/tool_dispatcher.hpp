#pragma once

#include <nlohmann/json.hpp>
#include "core/errors/tool_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool_registry.hpp"

namespace cloudctx::tools {

class ToolDispatcher {
public:
    explicit ToolDispatcher(const ToolRegistry& registry);

    // Looks up the tool, validates the arguments against its schema and runs
    // the handler. Exceptions thrown by the handler come back as Internal
    // errors.
    core::errors::Result<nlohmann::json> dispatch(
        const protocol::ToolInvocation& invocation) const;

    // dispatch() flattened into the wire shape: the rendered payload on
    // success, a single "Error: " text block on any failure.
    protocol::ToolResponse invoke(const protocol::ToolInvocation& invocation) const;

    static protocol::ToolResponse success_response(const nlohmann::json& payload);
    static protocol::ToolResponse error_response(const core::errors::ToolError& error);

private:
    const ToolRegistry& registry_;
};

}  // namespace cloudctx::tools
