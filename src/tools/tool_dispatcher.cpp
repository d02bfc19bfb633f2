#include "tools/tool_dispatcher.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <string>
#include "core/logging/logger.hpp"

namespace cloudctx::tools {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using nlohmann::json;

ToolDispatcher::ToolDispatcher(const ToolRegistry& registry) : registry_(registry) {}

core::errors::Result<json> ToolDispatcher::dispatch(
    const protocol::ToolInvocation& invocation) const {
    const RegisteredTool* tool = registry_.find(invocation.tool_name);
    if (tool == nullptr) {
        return ToolError{ErrorCategory::UnknownTool,
                         "Unknown tool: " + invocation.tool_name, "unknown_tool"};
    }

    auto validated =
        protocol::validate_arguments(tool->descriptor.input_schema, invocation.arguments);
    if (core::errors::is_error(validated)) {
        return core::errors::get_error(validated);
    }

    try {
        return tool->handler(core::errors::get_value(validated));
    } catch (const std::exception& e) {
        return ToolError{ErrorCategory::Internal,
                         std::string("Unexpected failure in ") + invocation.tool_name +
                             ": " + e.what(),
                         "handler_exception"};
    }
}

protocol::ToolResponse ToolDispatcher::invoke(
    const protocol::ToolInvocation& invocation) const {
    const auto started = std::chrono::steady_clock::now();
    auto outcome = dispatch(invocation);
    const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - started)
                                .count();

    if (core::errors::is_error(outcome)) {
        const auto& err = core::errors::get_error(outcome);
        LOG_WARN("Tool " + invocation.tool_name + " failed [" +
                 core::errors::to_string(err.category) + "/" + err.code + "] after " +
                 std::to_string(static_cast<std::int64_t>(elapsed_ms)) + "ms: " +
                 err.message);
        return error_response(err);
    }

    LOG_INFO("Tool " + invocation.tool_name + " completed in " +
             std::to_string(static_cast<std::int64_t>(elapsed_ms)) + "ms");
    return success_response(core::errors::get_value(outcome));
}

protocol::ToolResponse ToolDispatcher::success_response(const json& payload) {
    protocol::ToolResponse response;
    response.content.push_back(protocol::ContentBlock{
        "text", payload.dump(2, ' ', false, json::error_handler_t::replace)});
    return response;
}

protocol::ToolResponse ToolDispatcher::error_response(const ToolError& error) {
    protocol::ToolResponse response;
    response.content.push_back(
        protocol::ContentBlock{"text", std::string(protocol::kErrorPrefix) + error.message});
    return response;
}

}  // namespace cloudctx::tools
