#include <stdexcept>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/tool_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool_dispatcher.hpp"
#include "tools/tool_registry.hpp"

namespace {

using cloudctx::core::errors::ErrorCategory;
using cloudctx::core::errors::Result;
using cloudctx::core::errors::ToolError;
using cloudctx::core::errors::get_error;
using cloudctx::core::errors::get_value;
using cloudctx::core::errors::is_error;
using cloudctx::protocol::ToolDescriptor;
using cloudctx::protocol::ToolInvocation;
using cloudctx::tools::ToolDispatcher;
using cloudctx::tools::ToolHandler;
using cloudctx::tools::ToolRegistry;
using nlohmann::json;

ToolDescriptor make_descriptor(const std::string& name) {
    ToolDescriptor descriptor;
    descriptor.name = name;
    descriptor.description = "Test tool " + name;
    descriptor.input_schema = cloudctx::protocol::object_schema();
    return descriptor;
}

ToolHandler echo_handler() {
    return [](const json& arguments) -> Result<json> {
        return json{{"echo", arguments}};
    };
}

TEST(ToolRegistryTest, ListsToolsInRegistrationOrder) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.register_tool(make_descriptor("zeta"), echo_handler())));
    ASSERT_FALSE(is_error(registry.register_tool(make_descriptor("alpha"), echo_handler())));

    const auto tools = registry.list_tools();
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "zeta");
    EXPECT_EQ(tools[1].name, "alpha");
    EXPECT_NE(registry.find("alpha"), nullptr);
    EXPECT_EQ(registry.find("beta"), nullptr);
}

TEST(ToolRegistryTest, RejectsDuplicateNames) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.register_tool(make_descriptor("dup"), echo_handler())));

    auto status = registry.register_tool(make_descriptor("dup"), echo_handler());
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).code, "duplicate_tool");
    EXPECT_EQ(registry.size(), 1u);
}

TEST(ToolRegistryTest, RejectsIncompleteDescriptors) {
    ToolRegistry registry;

    auto unnamed = registry.register_tool(make_descriptor(""), echo_handler());
    ASSERT_TRUE(is_error(unnamed));
    EXPECT_EQ(get_error(unnamed).code, "invalid_tool_name");

    auto undocumented = make_descriptor("quiet");
    undocumented.description.clear();
    auto no_description = registry.register_tool(undocumented, echo_handler());
    ASSERT_TRUE(is_error(no_description));
    EXPECT_EQ(get_error(no_description).code, "missing_description");

    auto no_handler = registry.register_tool(make_descriptor("idle"), ToolHandler{});
    ASSERT_TRUE(is_error(no_handler));
    EXPECT_EQ(get_error(no_handler).code, "missing_handler");

    EXPECT_EQ(registry.size(), 0u);
}

TEST(ToolRegistryTest, RejectsRequiredFieldWithoutProperty) {
    ToolRegistry registry;
    auto descriptor = make_descriptor("lookup");
    descriptor.input_schema.required.push_back("instance_id");

    auto status = registry.register_tool(descriptor, echo_handler());
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).code, "invalid_schema");

    auto scalar = make_descriptor("scalar");
    scalar.input_schema = cloudctx::protocol::string_schema("not an object");
    auto scalar_status = registry.register_tool(scalar, echo_handler());
    ASSERT_TRUE(is_error(scalar_status));
    EXPECT_EQ(get_error(scalar_status).code, "invalid_schema");
}

TEST(ToolDispatcherTest, RendersPayloadAsIndentedText) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.register_tool(make_descriptor("echo"), echo_handler())));
    const ToolDispatcher dispatcher(registry);

    const auto response = dispatcher.invoke(ToolInvocation{"echo", json{{"a", 1}}});
    ASSERT_EQ(response.content.size(), 1u);
    EXPECT_FALSE(response.is_error());
    EXPECT_EQ(response.content[0].kind, "text");
    EXPECT_EQ(json::parse(response.content[0].payload), json({{"echo", {{"a", 1}}}}));
    EXPECT_NE(response.content[0].payload.find("\n  \"echo\""), std::string::npos);

    const auto wire = cloudctx::protocol::to_json(response);
    EXPECT_EQ(wire["content"][0]["type"], "text");
    EXPECT_EQ(wire["isError"], false);
}

TEST(ToolDispatcherTest, ReportsUnknownTool) {
    ToolRegistry registry;
    const ToolDispatcher dispatcher(registry);

    auto outcome = dispatcher.dispatch(ToolInvocation{"x", json::object()});
    ASSERT_TRUE(is_error(outcome));
    EXPECT_EQ(get_error(outcome).category, ErrorCategory::UnknownTool);

    const auto response = dispatcher.invoke(ToolInvocation{"x", json::object()});
    ASSERT_EQ(response.content.size(), 1u);
    EXPECT_TRUE(response.is_error());
    EXPECT_EQ(response.content[0].payload, "Error: Unknown tool: x");
}

TEST(ToolDispatcherTest, ValidatesBeforeRunningHandler) {
    ToolRegistry registry;
    auto descriptor = make_descriptor("guarded");
    cloudctx::protocol::add_property(descriptor.input_schema, "cve_id",
                                     cloudctx::protocol::string_schema("CVE"), true);

    int calls = 0;
    ASSERT_FALSE(is_error(registry.register_tool(
        descriptor, [&calls](const json&) -> Result<json> {
            ++calls;
            return json::object();
        })));
    const ToolDispatcher dispatcher(registry);

    const auto response = dispatcher.invoke(ToolInvocation{"guarded", json::object()});
    EXPECT_TRUE(response.is_error());
    EXPECT_EQ(response.content[0].payload, "Error: Missing required argument: cve_id");
    EXPECT_EQ(calls, 0);
}

TEST(ToolDispatcherTest, ConvertsHandlerErrorsAndExceptions) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.register_tool(
        make_descriptor("failing"), [](const json&) -> Result<json> {
            return ToolError{ErrorCategory::CommandNonZeroExit, "AWS CLI command failed: denied"};
        })));
    ASSERT_FALSE(is_error(registry.register_tool(
        make_descriptor("throwing"), [](const json&) -> Result<json> {
            throw std::runtime_error("boom");
        })));
    const ToolDispatcher dispatcher(registry);

    const auto failed = dispatcher.invoke(ToolInvocation{"failing", json::object()});
    EXPECT_EQ(failed.content[0].payload, "Error: AWS CLI command failed: denied");

    auto thrown = dispatcher.dispatch(ToolInvocation{"throwing", json::object()});
    ASSERT_TRUE(is_error(thrown));
    EXPECT_EQ(get_error(thrown).category, ErrorCategory::Internal);
    EXPECT_NE(get_error(thrown).message.find("boom"), std::string::npos);

    const auto response = dispatcher.invoke(ToolInvocation{"throwing", json::object()});
    ASSERT_EQ(response.content.size(), 1u);
    EXPECT_TRUE(response.is_error());
}

TEST(ToolDispatcherTest, ReplacesInvalidUtf8InPayload) {
    const auto response =
        ToolDispatcher::success_response(json{{"name", std::string("web\xff")}});
    ASSERT_EQ(response.content.size(), 1u);
    EXPECT_NO_THROW(json::parse(response.content[0].payload));
}

}  // namespace
