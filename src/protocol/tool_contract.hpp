#pragma once
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "tool_schema.hpp"

namespace cloudctx::protocol {

    // Prefix that marks a tool response as a failure. Hosts detect errors by
    // this prefix; the response shape has no separate error variant.
    inline constexpr const char* kErrorPrefix = "Error: ";

    struct ToolDescriptor {
        std::string name;
        std::string description;
        SchemaNode input_schema;
    };

    // How the host asks for a tool to run
    struct ToolInvocation {
        std::string tool_name;
        nlohmann::json arguments = nlohmann::json::object();
    };

    struct ContentBlock {
        std::string kind = "text";
        std::string payload;
    };

    // How the server replies back
    struct ToolResponse {
        std::vector<ContentBlock> content;

        bool is_error() const {
            return content.size() == 1 &&
                   content.front().payload.rfind(kErrorPrefix, 0) == 0;
        }
    };

    inline nlohmann::json to_json(const ToolDescriptor& descriptor) {
        nlohmann::json out;
        out["name"] = descriptor.name;
        out["description"] = descriptor.description;
        out["inputSchema"] = to_json(descriptor.input_schema);
        return out;
    }

    inline nlohmann::json to_json(const ToolResponse& response) {
        nlohmann::json content = nlohmann::json::array();
        for (const auto& block : response.content) {
            content.push_back({{"type", block.kind}, {"text", block.payload}});
        }
        return nlohmann::json{{"content", std::move(content)}, {"isError", false}};
    }

} // namespace cloudctx::protocol
