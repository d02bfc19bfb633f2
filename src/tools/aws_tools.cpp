#include "tools/aws_tools.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "normalize/aws_normalizer.hpp"
#include "tools/tool_arguments.hpp"

namespace cloudctx::tools {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using nlohmann::json;

namespace {

constexpr const char* kRegionDescription =
    "AWS region (e.g., us-east-1). If not specified, uses default AWS CLI region.";
constexpr const char* kIncludeRawDescription =
    "Include raw AWS API response in addition to simplified summary (default: false)";

std::vector<std::string> describe_instances_args(const std::string& instance_id,
                                                 const std::optional<std::string>& region) {
    std::vector<std::string> args = {"ec2", "describe-instances", "--instance-ids",
                                     instance_id};
    if (region.has_value()) {
        args.push_back("--region");
        args.push_back(region.value());
    }
    return args;
}

protocol::SchemaNode instance_id_schema(std::string description) {
    auto node = protocol::string_schema(std::move(description));
    node.pattern = kInstanceIdPattern;
    return node;
}

protocol::SchemaNode include_raw_schema() {
    auto node = protocol::boolean_schema(kIncludeRawDescription);
    node.default_value = false;
    return node;
}

}  // namespace

core::errors::Result<ResolvedGroupIds> resolve_group_ids(
    const exec::CliProgram& aws, const GroupLookupRequest& request) {
    if (!request.security_group_ids.empty()) {
        return ResolvedGroupIds{request.security_group_ids, std::nullopt};
    }
    if (!request.instance_id.has_value()) {
        return ToolError{ErrorCategory::MissingRequiredArgument,
                         "Must provide either instance_id or security_group_ids",
                         "missing_group_source"};
    }

    const auto& instance_id = request.instance_id.value();
    auto raw = aws.run_json(describe_instances_args(instance_id, request.region));
    if (core::errors::is_error(raw)) {
        return core::errors::get_error(raw);
    }

    auto instance = normalize::normalize_instance(core::errors::get_value(raw));
    if (core::errors::is_error(instance)) {
        return ToolError{ErrorCategory::ResolutionError,
                         "Instance " + instance_id + " not found", "instance_not_found"};
    }

    auto group_ids = core::errors::get_value(instance).security_group_ids;
    if (group_ids.empty()) {
        return ToolError{ErrorCategory::ResolutionError,
                         "Instance " + instance_id + " has no security groups attached",
                         "no_security_groups"};
    }
    LOG_DEBUG("Resolved " + std::to_string(group_ids.size()) +
              " security group(s) from " + instance_id);
    return ResolvedGroupIds{std::move(group_ids), instance_id};
}

core::errors::Result<json> describe_instance(const exec::CliProgram& aws,
                                             const json& arguments) {
    const auto instance_id = string_argument(arguments, "instance_id");
    if (!instance_id.has_value()) {
        return ToolError{ErrorCategory::MissingRequiredArgument,
                         "Missing required argument: instance_id",
                         "missing_required_argument"};
    }
    const auto region = string_argument(arguments, "region");
    const bool include_raw = bool_argument(arguments, "include_raw", false);

    auto raw = aws.run_json(describe_instances_args(instance_id.value(), region));
    if (core::errors::is_error(raw)) {
        return core::errors::get_error(raw);
    }
    const auto& raw_json = core::errors::get_value(raw);

    auto summary = normalize::normalize_instance(raw_json);
    if (core::errors::is_error(summary)) {
        return core::errors::get_error(summary);
    }

    json response;
    response["instance_id"] = instance_id.value();
    response["summary"] = normalize::to_json(core::errors::get_value(summary));
    if (include_raw) {
        response["raw"] = raw_json;
    }
    return response;
}

core::errors::Result<json> get_security_groups(const exec::CliProgram& aws,
                                               const json& arguments) {
    GroupLookupRequest lookup;
    lookup.instance_id = string_argument(arguments, "instance_id");
    lookup.security_group_ids = string_list_argument(arguments, "security_group_ids");
    lookup.region = string_argument(arguments, "region");
    const bool include_raw = bool_argument(arguments, "include_raw", false);

    // Step 1: a non-empty id list, or a terminal failure.
    auto resolved = resolve_group_ids(aws, lookup);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto& group_ids = core::errors::get_value(resolved).group_ids;

    // Step 2: group details. A failure here discards step 1 entirely.
    std::vector<std::string> args = {"ec2", "describe-security-groups", "--group-ids"};
    args.insert(args.end(), group_ids.begin(), group_ids.end());
    if (lookup.region.has_value()) {
        args.push_back("--region");
        args.push_back(lookup.region.value());
    }

    auto raw = aws.run_json(args);
    if (core::errors::is_error(raw)) {
        return core::errors::get_error(raw);
    }
    const auto& raw_json = core::errors::get_value(raw);

    auto groups = normalize::normalize_security_groups(raw_json);
    if (core::errors::is_error(groups)) {
        return core::errors::get_error(groups);
    }

    json summaries = json::array();
    for (const auto& group : core::errors::get_value(groups)) {
        summaries.push_back(normalize::to_json(group));
    }

    json response;
    response["security_group_count"] = summaries.size();
    response["security_groups"] = std::move(summaries);
    if (include_raw) {
        response["raw"] = raw_json;
    }
    if (lookup.instance_id.has_value()) {
        response["instance_id"] = lookup.instance_id.value();
    }
    return response;
}

protocol::ToolDescriptor describe_instance_descriptor() {
    auto schema = protocol::object_schema();
    protocol::add_property(schema, "instance_id",
                           instance_id_schema("EC2 instance ID (e.g., i-1234567890abcdef0)"),
                           true);
    protocol::add_property(schema, "region", protocol::string_schema(kRegionDescription));
    protocol::add_property(schema, "include_raw", include_raw_schema());

    return protocol::ToolDescriptor{
        "describe_instance",
        "Get comprehensive metadata for an EC2 instance by instance ID. "
        "Returns instance details including IPs, DNS names, VPC info, security groups, "
        "tags, IAM role, state, and more. Essential for gathering context about "
        "vulnerable instances before onboarding to security tools.",
        std::move(schema)};
}

protocol::ToolDescriptor get_security_groups_descriptor() {
    auto schema = protocol::object_schema();
    protocol::add_property(
        schema, "instance_id",
        instance_id_schema(
            "EC2 instance ID to get security groups from (e.g., i-1234567890abcdef0)"));
    protocol::add_property(
        schema, "security_group_ids",
        protocol::array_schema("List of security group IDs (e.g., ['sg-12345', 'sg-67890'])",
                               protocol::string_schema("")));
    protocol::add_property(schema, "region", protocol::string_schema(kRegionDescription));
    protocol::add_property(schema, "include_raw", include_raw_schema());

    return protocol::ToolDescriptor{
        "get_security_groups",
        "Get detailed security group rules and configurations. Can fetch by security group "
        "IDs or automatically extract and fetch from an instance ID. Returns inbound/outbound "
        "rules with ports, protocols, and source/destination IPs. Critical for understanding "
        "what services are exposed and need protection.",
        std::move(schema)};
}

core::errors::Status register_aws_tools(ToolRegistry& registry,
                                        const exec::CliProgram& aws) {
    auto status = registry.register_tool(
        describe_instance_descriptor(),
        [aws](const json& arguments) { return describe_instance(aws, arguments); });
    if (core::errors::is_error(status)) {
        return status;
    }
    return registry.register_tool(
        get_security_groups_descriptor(),
        [aws](const json& arguments) { return get_security_groups(aws, arguments); });
}

}  // namespace cloudctx::tools
