#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/tool_errors.hpp"
#include "protocol/jsonrpc.hpp"
#include "protocol/tool_contract.hpp"
#include "session/protocol_session.hpp"
#include "tools/tool_registry.hpp"

namespace {

using cloudctx::core::errors::Result;
using cloudctx::core::errors::is_error;
using cloudctx::session::ProtocolSession;
using cloudctx::session::ServerInfo;
using cloudctx::tools::ToolRegistry;
using nlohmann::json;
namespace jsonrpc = cloudctx::protocol::jsonrpc;

const json kInitialize = {
    {"jsonrpc", "2.0"},
    {"id", 1},
    {"method", "initialize"},
    {"params",
     {{"protocolVersion", "2025-03-26"},
      {"capabilities", json::object()},
      {"clientInfo", {{"name", "test-host"}, {"version", "0.1"}}}}}};

class ProtocolSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        cloudctx::protocol::ToolDescriptor descriptor;
        descriptor.name = "echo";
        descriptor.description = "Echoes its message";
        descriptor.input_schema = cloudctx::protocol::object_schema();
        cloudctx::protocol::add_property(descriptor.input_schema, "message",
                                         cloudctx::protocol::string_schema("Text"), true);
        ASSERT_FALSE(is_error(registry_.register_tool(
            descriptor, [](const json& arguments) -> Result<json> {
                return json{{"message", arguments.at("message")}};
            })));
    }

    ProtocolSession make_session() {
        return ProtocolSession(registry_, ServerInfo{"aws", "1.0.0"}, in_, out_);
    }

    static json request(int id, const std::string& method, json params = json::object()) {
        return json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
    }

    ToolRegistry registry_;
    std::istringstream in_;
    std::ostringstream out_;
};

TEST_F(ProtocolSessionTest, InitializeEchoesSupportedVersion) {
    auto session = make_session();
    const auto response = session.handle_message(kInitialize);
    ASSERT_TRUE(response.has_value());

    EXPECT_EQ((*response)["jsonrpc"], "2.0");
    EXPECT_EQ((*response)["id"], 1);
    const auto& result = (*response)["result"];
    EXPECT_EQ(result["protocolVersion"], "2025-03-26");
    EXPECT_EQ(result["capabilities"]["tools"]["listChanged"], false);
    EXPECT_EQ(result["serverInfo"]["name"], "aws");
    EXPECT_EQ(result["serverInfo"]["version"], "1.0.0");
    EXPECT_TRUE(session.initialized());
}

TEST_F(ProtocolSessionTest, InitializeFallsBackToLatestVersion) {
    auto session = make_session();
    auto message = kInitialize;
    message["params"]["protocolVersion"] = "1999-01-01";

    const auto response = session.handle_message(message);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ((*response)["result"]["protocolVersion"],
              cloudctx::session::supported_protocol_versions().front());
}

TEST_F(ProtocolSessionTest, SecondInitializeIsRejected) {
    auto session = make_session();
    ASSERT_TRUE(session.handle_message(kInitialize).has_value());

    const auto again = session.handle_message(kInitialize);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ((*again)["error"]["code"], jsonrpc::kInvalidRequest);
}

TEST_F(ProtocolSessionTest, ToolTrafficRequiresHandshake) {
    auto session = make_session();
    const auto response = session.handle_message(request(2, "tools/list"));
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ((*response)["id"], 2);
    EXPECT_EQ((*response)["error"]["code"], jsonrpc::kServerNotInitialized);

    const auto ping = session.handle_message(request(3, "ping"));
    ASSERT_TRUE(ping.has_value());
    EXPECT_EQ((*ping)["result"], json::object());
}

TEST_F(ProtocolSessionTest, ListsRegisteredTools) {
    auto session = make_session();
    ASSERT_TRUE(session.handle_message(kInitialize).has_value());

    const auto response = session.handle_message(request(2, "tools/list"));
    ASSERT_TRUE(response.has_value());
    const auto& tools = (*response)["result"]["tools"];
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(tools[0]["name"], "echo");
    EXPECT_EQ(tools[0]["inputSchema"]["required"], json::array({"message"}));
}

TEST_F(ProtocolSessionTest, CallsToolAndWrapsTextContent) {
    auto session = make_session();
    ASSERT_TRUE(session.handle_message(kInitialize).has_value());

    const auto response = session.handle_message(
        request(4, "tools/call", {{"name", "echo"}, {"arguments", {{"message", "hi"}}}}));
    ASSERT_TRUE(response.has_value());
    const auto& result = (*response)["result"];
    EXPECT_EQ(result["isError"], false);
    ASSERT_EQ(result["content"].size(), 1u);
    EXPECT_EQ(result["content"][0]["type"], "text");
    EXPECT_EQ(json::parse(result["content"][0]["text"].get<std::string>()),
              json({{"message", "hi"}}));
}

TEST_F(ProtocolSessionTest, ToolFailuresStayInsideResult) {
    auto session = make_session();
    ASSERT_TRUE(session.handle_message(kInitialize).has_value());

    const auto unknown = session.handle_message(
        request(5, "tools/call", {{"name", "nope"}, {"arguments", json::object()}}));
    ASSERT_TRUE(unknown.has_value());
    EXPECT_FALSE(unknown->contains("error"));
    EXPECT_EQ((*unknown)["result"]["content"][0]["text"], "Error: Unknown tool: nope");

    const auto missing = session.handle_message(request(6, "tools/call", {{"name", "echo"}}));
    ASSERT_TRUE(missing.has_value());
    EXPECT_EQ((*missing)["result"]["content"][0]["text"],
              "Error: Missing required argument: message");
}

TEST_F(ProtocolSessionTest, RejectsMalformedToolCall) {
    auto session = make_session();
    ASSERT_TRUE(session.handle_message(kInitialize).has_value());

    const auto response =
        session.handle_message(request(7, "tools/call", {{"arguments", json::object()}}));
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ((*response)["error"]["code"], jsonrpc::kInvalidParams);
}

TEST_F(ProtocolSessionTest, ReportsProtocolErrors) {
    auto session = make_session();

    const auto parse = session.handle_line("{not json");
    ASSERT_TRUE(parse.has_value());
    EXPECT_TRUE((*parse)["id"].is_null());
    EXPECT_EQ((*parse)["error"]["code"], jsonrpc::kParseError);

    const auto not_object = session.handle_line("[1, 2]");
    ASSERT_TRUE(not_object.has_value());
    EXPECT_EQ((*not_object)["error"]["code"], jsonrpc::kInvalidRequest);

    const auto no_method = session.handle_message({{"jsonrpc", "2.0"}, {"id", 9}});
    ASSERT_TRUE(no_method.has_value());
    EXPECT_EQ((*no_method)["error"]["code"], jsonrpc::kInvalidRequest);

    const auto unknown = session.handle_message(request(10, "resources/list"));
    ASSERT_TRUE(unknown.has_value());
    EXPECT_EQ((*unknown)["error"]["code"], jsonrpc::kMethodNotFound);
    EXPECT_EQ((*unknown)["error"]["message"], "Method not found: resources/list");
}

TEST_F(ProtocolSessionTest, NotificationsAndBlankLinesGetNoReply) {
    auto session = make_session();
    EXPECT_FALSE(session.handle_line("").has_value());
    EXPECT_FALSE(session.handle_line("   \r").has_value());
    EXPECT_FALSE(session
                     .handle_message({{"jsonrpc", "2.0"},
                                      {"method", "notifications/initialized"}})
                     .has_value());
    EXPECT_FALSE(
        session.handle_message({{"jsonrpc", "2.0"}, {"id", 3}, {"result", json::object()}})
            .has_value());
}

TEST_F(ProtocolSessionTest, NonStringClientNameDoesNotEndSession) {
    auto message = kInitialize;
    message["params"]["clientInfo"]["name"] = 5;
    in_.str(message.dump() + "\n" + request(2, "tools/list").dump() + "\n");

    auto session = make_session();
    EXPECT_EQ(session.run(), 2u);
    EXPECT_TRUE(session.initialized());

    std::istringstream written(out_.str());
    std::vector<json> frames;
    std::string line;
    while (std::getline(written, line)) {
        frames.push_back(json::parse(line));
    }
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0]["id"], 1);
    EXPECT_EQ(frames[0]["result"]["protocolVersion"], "2025-03-26");
    EXPECT_EQ(frames[1]["id"], 2);
    EXPECT_EQ(frames[1]["result"]["tools"].size(), 1u);
}

TEST_F(ProtocolSessionTest, RunAnswersFramesInOrderUntilEof) {
    const json initialized = {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}};
    in_.str(kInitialize.dump() + "\n" + initialized.dump() + "\n\n" +
            request(2, "tools/list").dump() + "\n" +
            request(3, "tools/call", {{"name", "echo"}, {"arguments", {{"message", "x"}}}})
                .dump() +
            "\n");

    auto session = make_session();
    EXPECT_EQ(session.run(), 3u);

    std::istringstream written(out_.str());
    std::vector<json> frames;
    std::string line;
    while (std::getline(written, line)) {
        frames.push_back(json::parse(line));
    }
    ASSERT_EQ(frames.size(), 3u);
    EXPECT_EQ(frames[0]["id"], 1);
    EXPECT_EQ(frames[1]["id"], 2);
    EXPECT_EQ(frames[2]["id"], 3);
    EXPECT_EQ(frames[2]["result"]["isError"], false);
}

}  // namespace
