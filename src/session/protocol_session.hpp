#pragma once

#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "tools/tool_dispatcher.hpp"
#include "tools/tool_registry.hpp"

namespace cloudctx::session {

struct ServerInfo {
    std::string name;
    std::string version;
};

// Newest first; the first entry is offered when the client asks for a
// version we do not speak.
inline const std::vector<std::string>& supported_protocol_versions() {
    static const std::vector<std::string> kVersions = {"2025-06-18", "2025-03-26",
                                                       "2024-11-05"};
    return kVersions;
}

// One stdio session with one peer: newline-delimited JSON-RPC 2.0 messages,
// answered strictly in arrival order. Ends at end of input.
class ProtocolSession {
public:
    ProtocolSession(const tools::ToolRegistry& registry, ServerInfo info,
                    std::istream& in = std::cin, std::ostream& out = std::cout);

    // Blocks until the input stream closes. Returns the number of frames
    // written.
    std::size_t run();

    // Returns the response frame, or nullopt for notifications and blank
    // lines.
    std::optional<nlohmann::json> handle_line(const std::string& line);
    std::optional<nlohmann::json> handle_message(const nlohmann::json& message);

    bool initialized() const { return initialized_; }

private:
    nlohmann::json handle_initialize(const nlohmann::json& id,
                                     const nlohmann::json& params);
    nlohmann::json handle_tools_list(const nlohmann::json& id) const;
    nlohmann::json handle_tools_call(const nlohmann::json& id,
                                     const nlohmann::json& params) const;

    const tools::ToolRegistry& registry_;
    tools::ToolDispatcher dispatcher_;
    ServerInfo info_;
    std::istream& in_;
    std::ostream& out_;
    bool initialized_ = false;
};

}  // namespace cloudctx::session
