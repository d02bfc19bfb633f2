#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/tool_errors.hpp"
#include "protocol/tool_schema.hpp"

namespace {

using cloudctx::core::errors::ErrorCategory;
using cloudctx::core::errors::get_error;
using cloudctx::core::errors::get_value;
using cloudctx::core::errors::is_error;
using cloudctx::protocol::SchemaNode;
using cloudctx::protocol::add_property;
using cloudctx::protocol::array_schema;
using cloudctx::protocol::boolean_schema;
using cloudctx::protocol::number_schema;
using cloudctx::protocol::object_schema;
using cloudctx::protocol::string_schema;
using cloudctx::protocol::validate_arguments;
using nlohmann::json;

SchemaNode lookup_schema() {
    auto schema = object_schema();

    auto instance_id = string_schema("Instance ID");
    instance_id.pattern = "^i-[a-f0-9]+$";
    add_property(schema, "instance_id", instance_id, true);

    auto include_raw = boolean_schema("Include raw output");
    include_raw.default_value = false;
    add_property(schema, "include_raw", include_raw);

    auto severity = string_schema("Severity");
    severity.enum_values = {"Critical", "High"};
    add_property(schema, "severity", severity);

    auto score = number_schema("Score");
    score.minimum = 0.0;
    score.maximum = 10.0;
    add_property(schema, "score", score);

    add_property(schema, "group_ids", array_schema("Group IDs", string_schema("Group ID")));
    return schema;
}

TEST(ToolSchemaTest, RendersJsonSchemaInDeclarationOrder) {
    const auto rendered = cloudctx::protocol::to_json(lookup_schema());

    EXPECT_EQ(rendered["type"], "object");
    EXPECT_EQ(rendered["required"], json::array({"instance_id"}));
    EXPECT_EQ(rendered["properties"]["instance_id"]["pattern"], "^i-[a-f0-9]+$");
    EXPECT_EQ(rendered["properties"]["include_raw"]["default"], false);
    EXPECT_EQ(rendered["properties"]["severity"]["enum"], json::array({"Critical", "High"}));
    EXPECT_EQ(rendered["properties"]["score"]["maximum"], 10.0);
    EXPECT_EQ(rendered["properties"]["group_ids"]["items"]["type"], "string");
}

TEST(ToolSchemaTest, FillsDefaultsAndDropsNulls) {
    auto result = validate_arguments(lookup_schema(),
                                     json{{"instance_id", "i-0abc"}, {"severity", nullptr}});
    ASSERT_FALSE(is_error(result));

    const auto& normalized = get_value(result);
    EXPECT_EQ(normalized["instance_id"], "i-0abc");
    EXPECT_EQ(normalized["include_raw"], false);
    EXPECT_FALSE(normalized.contains("severity"));
}

TEST(ToolSchemaTest, KeepsExplicitValueOverDefault) {
    auto result = validate_arguments(lookup_schema(),
                                     json{{"instance_id", "i-0abc"}, {"include_raw", true}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result)["include_raw"], true);
}

TEST(ToolSchemaTest, ReportsMissingRequiredArgument) {
    auto missing = validate_arguments(lookup_schema(), json::object());
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).category, ErrorCategory::MissingRequiredArgument);
    EXPECT_EQ(get_error(missing).message, "Missing required argument: instance_id");

    auto null_value = validate_arguments(lookup_schema(), json{{"instance_id", nullptr}});
    ASSERT_TRUE(is_error(null_value));
    EXPECT_EQ(get_error(null_value).category, ErrorCategory::MissingRequiredArgument);
}

TEST(ToolSchemaTest, ReportsTypeMismatch) {
    auto result = validate_arguments(lookup_schema(),
                                     json{{"instance_id", "i-0abc"}, {"include_raw", "yes"}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::TypeMismatch);
    EXPECT_EQ(get_error(result).message,
              "Argument 'include_raw' must be of type boolean, got string");

    auto not_object = validate_arguments(lookup_schema(), json::array());
    ASSERT_TRUE(is_error(not_object));
    EXPECT_EQ(get_error(not_object).category, ErrorCategory::TypeMismatch);
}

TEST(ToolSchemaTest, RejectsPatternMismatch) {
    auto result = validate_arguments(lookup_schema(), json{{"instance_id", "web-1"}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::InvalidArgument);
    EXPECT_EQ(get_error(result).code, "pattern_mismatch");
}

TEST(ToolSchemaTest, RejectsValueOutsideEnum) {
    auto result = validate_arguments(lookup_schema(),
                                     json{{"instance_id", "i-0abc"}, {"severity", "Low"}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::InvalidArgument);
    EXPECT_EQ(get_error(result).message, "Argument 'severity' must be one of: Critical, High");
}

TEST(ToolSchemaTest, EnforcesNumericBounds) {
    auto above = validate_arguments(lookup_schema(),
                                    json{{"instance_id", "i-0abc"}, {"score", 10.5}});
    ASSERT_TRUE(is_error(above));
    EXPECT_EQ(get_error(above).code, "above_maximum");

    auto below = validate_arguments(lookup_schema(),
                                    json{{"instance_id", "i-0abc"}, {"score", -1}});
    ASSERT_TRUE(is_error(below));
    EXPECT_EQ(get_error(below).code, "below_minimum");

    auto edge = validate_arguments(lookup_schema(),
                                   json{{"instance_id", "i-0abc"}, {"score", 10}});
    EXPECT_FALSE(is_error(edge));
}

TEST(ToolSchemaTest, ChecksArrayItems) {
    auto result = validate_arguments(
        lookup_schema(),
        json{{"instance_id", "i-0abc"}, {"group_ids", json::array({"sg-1", 7})}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::TypeMismatch);
    EXPECT_EQ(get_error(result).message,
              "Argument 'group_ids[1]' must be of type string, got number");
}

TEST(ToolSchemaTest, KeepsUndeclaredArguments) {
    auto result = validate_arguments(lookup_schema(),
                                     json{{"instance_id", "i-0abc"}, {"extra", 1}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result)["extra"], 1);
}

}  // namespace
