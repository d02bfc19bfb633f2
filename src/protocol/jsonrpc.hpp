#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace cloudctx::protocol::jsonrpc {

    // Standard JSON-RPC 2.0 codes plus the MCP "not initialized" code.
    inline constexpr int kParseError = -32700;
    inline constexpr int kInvalidRequest = -32600;
    inline constexpr int kMethodNotFound = -32601;
    inline constexpr int kInvalidParams = -32602;
    inline constexpr int kInternalError = -32603;
    inline constexpr int kServerNotInitialized = -32002;

    inline nlohmann::json make_result(const nlohmann::json& id,
                                      const nlohmann::json& result) {
        return nlohmann::json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
    }

    inline nlohmann::json make_error(const nlohmann::json& id, const int code,
                                     const std::string& message) {
        return nlohmann::json{{"jsonrpc", "2.0"},
                              {"id", id},
                              {"error", {{"code", code}, {"message", message}}}};
    }

} // namespace cloudctx::protocol::jsonrpc
