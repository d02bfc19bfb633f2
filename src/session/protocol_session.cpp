#include "session/protocol_session.hpp"

#include <algorithm>
#include <exception>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/jsonrpc.hpp"
#include "protocol/tool_contract.hpp"

namespace cloudctx::session {

using nlohmann::json;
namespace jsonrpc = protocol::jsonrpc;

namespace {

std::string trim(const std::string& line) {
    const auto first = line.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = line.find_last_not_of(" \t\r\n");
    return line.substr(first, last - first + 1);
}

std::string negotiate_version(const json& params) {
    const auto& versions = supported_protocol_versions();
    if (params.is_object()) {
        const auto it = params.find("protocolVersion");
        if (it != params.end() && it->is_string()) {
            const auto requested = it->get<std::string>();
            if (std::find(versions.begin(), versions.end(), requested) != versions.end()) {
                return requested;
            }
            LOG_WARN("Client requested unsupported protocol version " + requested);
        }
    }
    return versions.front();
}

}  // namespace

ProtocolSession::ProtocolSession(const tools::ToolRegistry& registry, ServerInfo info,
                                 std::istream& in, std::ostream& out)
    : registry_(registry),
      dispatcher_(registry),
      info_(std::move(info)),
      in_(in),
      out_(out) {}

std::size_t ProtocolSession::run() {
    LOG_INFO("Session started for server " + info_.name + " with " +
             std::to_string(registry_.size()) + " tool(s)");
    std::size_t frames = 0;
    std::string line;
    while (std::getline(in_, line)) {
        auto response = handle_line(line);
        if (!response.has_value()) {
            continue;
        }
        out_ << response->dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
        out_.flush();
        ++frames;
    }
    LOG_INFO("Input closed; session ended after " + std::to_string(frames) +
             " response(s)");
    return frames;
}

std::optional<json> ProtocolSession::handle_line(const std::string& line) {
    const auto text = trim(line);
    if (text.empty()) {
        return std::nullopt;
    }

    json message;
    try {
        message = json::parse(text);
    } catch (const json::parse_error& e) {
        LOG_WARN(std::string("Dropping unparseable frame: ") + e.what());
        return jsonrpc::make_error(nullptr, jsonrpc::kParseError,
                                   std::string("Parse error: ") + e.what());
    }

    // A single bad frame must not end the session.
    try {
        return handle_message(message);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Internal error while handling frame: ") + e.what());
        const bool has_id = message.is_object() && message.contains("id");
        if (!has_id && message.is_object() && message.contains("method")) {
            return std::nullopt;
        }
        return jsonrpc::make_error(has_id ? message["id"] : json(nullptr),
                                   jsonrpc::kInternalError,
                                   std::string("Internal error: ") + e.what());
    }
}

std::optional<json> ProtocolSession::handle_message(const json& message) {
    if (!message.is_object()) {
        return jsonrpc::make_error(nullptr, jsonrpc::kInvalidRequest,
                                   "Invalid Request: expected a JSON object");
    }

    const bool has_id = message.contains("id");
    const json id = has_id ? message["id"] : json(nullptr);

    const auto method_it = message.find("method");
    if (method_it == message.end()) {
        if (has_id && (message.contains("result") || message.contains("error"))) {
            // A reply to a server-initiated request; this server sends none.
            LOG_DEBUG("Ignoring client response frame");
            return std::nullopt;
        }
        return jsonrpc::make_error(id, jsonrpc::kInvalidRequest,
                                   "Invalid Request: missing method");
    }
    if (!method_it->is_string()) {
        return jsonrpc::make_error(id, jsonrpc::kInvalidRequest,
                                   "Invalid Request: method must be a string");
    }

    const auto method = method_it->get<std::string>();
    const json params = message.contains("params") ? message["params"] : json::object();

    if (!has_id) {
        if (method == "notifications/initialized") {
            LOG_DEBUG("Client confirmed initialization");
        } else {
            LOG_DEBUG("Ignoring notification " + method);
        }
        return std::nullopt;
    }

    LOG_DEBUG("Request " + id.dump() + ": " + method);

    if (method == "initialize") {
        if (initialized_) {
            return jsonrpc::make_error(id, jsonrpc::kInvalidRequest,
                                       "Session already initialized");
        }
        return handle_initialize(id, params);
    }
    if (method == "ping") {
        return jsonrpc::make_result(id, json::object());
    }
    if (method == "tools/list" || method == "tools/call") {
        if (!initialized_) {
            return jsonrpc::make_error(id, jsonrpc::kServerNotInitialized,
                                       "Server not initialized");
        }
        if (method == "tools/list") {
            return handle_tools_list(id);
        }
        return handle_tools_call(id, params);
    }

    return jsonrpc::make_error(id, jsonrpc::kMethodNotFound, "Method not found: " + method);
}

json ProtocolSession::handle_initialize(const json& id, const json& params) {
    const auto version = negotiate_version(params);
    initialized_ = true;

    std::string client = "unknown";
    if (params.is_object() && params.contains("clientInfo") &&
        params["clientInfo"].is_object()) {
        const auto& client_info = params["clientInfo"];
        const auto name = client_info.find("name");
        if (name != client_info.end() && name->is_string()) {
            client = name->get<std::string>();
        }
    }
    LOG_INFO("Handshake complete with " + client + " (protocol " + version + ")");

    json result;
    result["protocolVersion"] = version;
    result["capabilities"] = {{"tools", {{"listChanged", false}}}};
    result["serverInfo"] = {{"name", info_.name}, {"version", info_.version}};
    return jsonrpc::make_result(id, result);
}

json ProtocolSession::handle_tools_list(const json& id) const {
    json tools = json::array();
    for (const auto& descriptor : registry_.list_tools()) {
        tools.push_back(protocol::to_json(descriptor));
    }
    return jsonrpc::make_result(id, {{"tools", std::move(tools)}});
}

json ProtocolSession::handle_tools_call(const json& id, const json& params) const {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return jsonrpc::make_error(id, jsonrpc::kInvalidParams,
                                   "Invalid params: tools/call requires a string 'name'");
    }

    protocol::ToolInvocation invocation;
    invocation.tool_name = params["name"].get<std::string>();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        invocation.arguments = params["arguments"];
    }

    LOG_INFO("Calling tool " + invocation.tool_name);
    const auto response = dispatcher_.invoke(invocation);
    return jsonrpc::make_result(id, protocol::to_json(response));
}

}  // namespace cloudctx::session
