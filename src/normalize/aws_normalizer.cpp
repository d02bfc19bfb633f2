#include "normalize/aws_normalizer.hpp"

#include <utility>
#include "normalize/json_access.hpp"

namespace cloudctx::normalize {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using nlohmann::json;

namespace {

std::vector<std::string> project_strings(const json& records, const std::string& key) {
    std::vector<std::string> values;
    values.reserve(records.size());
    for (const auto& record : records) {
        auto value = string_at(record, key);
        if (value.has_value()) {
            values.push_back(std::move(value.value()));
        }
    }
    return values;
}

json strings_to_json(const std::vector<std::string>& values) {
    json out = json::array();
    for (const auto& value : values) {
        out.push_back(value);
    }
    return out;
}

json tags_to_json(const TagMap& tags) {
    json out = json::object();
    for (const auto& [key, value] : tags) {
        out[key] = value;
    }
    return out;
}

}  // namespace

TagMap fold_tags(const json& tag_list) {
    TagMap tags;
    if (!tag_list.is_array()) {
        return tags;
    }
    for (const auto& entry : tag_list) {
        const auto key = string_at(entry, "Key");
        if (!key.has_value()) {
            continue;
        }
        tags[key.value()] = string_at(entry, "Value").value_or("");
    }
    return tags;
}

core::errors::Result<InstanceSummary> normalize_instance(const json& raw) {
    const auto& reservations = array_at(raw, "Reservations");
    if (reservations.empty()) {
        return ToolError{ErrorCategory::ExtractionError, "No instance data found",
                         "no_instance_data"};
    }
    const auto& instances = array_at(reservations.front(), "Instances");
    if (instances.empty() || !instances.front().is_object()) {
        return ToolError{ErrorCategory::ExtractionError, "No instance data found",
                         "no_instance_data"};
    }
    const json& instance = instances.front();

    InstanceSummary summary;
    summary.instance_id = string_at(instance, "InstanceId");
    summary.instance_type = string_at(instance, "InstanceType");
    summary.state = nested_string_at(instance, "State", "Name");
    summary.availability_zone =
        nested_string_at(instance, "Placement", "AvailabilityZone");
    summary.platform = string_at(instance, "Platform").value_or(kDefaultPlatform);

    summary.public_ip = string_at(instance, "PublicIpAddress");
    summary.private_ip = string_at(instance, "PrivateIpAddress");
    summary.public_dns = string_at(instance, "PublicDnsName");
    summary.private_dns = string_at(instance, "PrivateDnsName");

    summary.vpc_id = string_at(instance, "VpcId");
    summary.subnet_id = string_at(instance, "SubnetId");

    summary.security_group_ids =
        project_strings(array_at(instance, "SecurityGroups"), "GroupId");
    summary.iam_instance_profile =
        nested_string_at(instance, "IamInstanceProfile", "Arn");

    summary.tags = fold_tags(array_at(instance, "Tags"));
    summary.launch_time = string_at(instance, "LaunchTime");
    summary.architecture = string_at(instance, "Architecture");
    summary.virtualization_type = string_at(instance, "VirtualizationType");
    return summary;
}

SecurityGroupRule normalize_rule(const json& permission) {
    SecurityGroupRule rule;
    rule.protocol = string_at(permission, "IpProtocol").value_or("all");
    rule.from_port = integer_at(permission, "FromPort");
    rule.to_port = integer_at(permission, "ToPort");

    const auto& ip_ranges = array_at(permission, "IpRanges");
    rule.ip_ranges = project_strings(ip_ranges, "CidrIp");
    rule.ipv6_ranges = project_strings(array_at(permission, "Ipv6Ranges"), "CidrIpv6");
    rule.peer_group_ids = project_strings(array_at(permission, "UserIdGroupPairs"), "GroupId");
    if (!ip_ranges.empty()) {
        rule.description = string_at(ip_ranges.front(), "Description").value_or("");
    }
    return rule;
}

core::errors::Result<std::vector<SecurityGroupSummary>> normalize_security_groups(
    const json& raw) {
    if (!raw.is_object()) {
        return ToolError{ErrorCategory::ExtractionError,
                         "Unexpected security group response shape",
                         "unexpected_shape"};
    }

    std::vector<SecurityGroupSummary> groups;
    for (const auto& group : array_at(raw, "SecurityGroups")) {
        SecurityGroupSummary summary;
        summary.group_id = string_at(group, "GroupId");
        summary.group_name = string_at(group, "GroupName");
        summary.description = string_at(group, "Description");
        summary.vpc_id = string_at(group, "VpcId");
        for (const auto& permission : array_at(group, "IpPermissions")) {
            summary.inbound_rules.push_back(normalize_rule(permission));
        }
        for (const auto& permission : array_at(group, "IpPermissionsEgress")) {
            summary.outbound_rules.push_back(normalize_rule(permission));
        }
        summary.tags = fold_tags(array_at(group, "Tags"));
        groups.push_back(std::move(summary));
    }
    return groups;
}

json to_json(const InstanceSummary& summary) {
    json out;
    out["instance_id"] = optional_to_json(summary.instance_id);
    out["instance_type"] = optional_to_json(summary.instance_type);
    out["state"] = optional_to_json(summary.state);
    out["availability_zone"] = optional_to_json(summary.availability_zone);
    out["platform"] = summary.platform;
    out["public_ip"] = optional_to_json(summary.public_ip);
    out["private_ip"] = optional_to_json(summary.private_ip);
    out["public_dns"] = optional_to_json(summary.public_dns);
    out["private_dns"] = optional_to_json(summary.private_dns);
    out["vpc_id"] = optional_to_json(summary.vpc_id);
    out["subnet_id"] = optional_to_json(summary.subnet_id);
    out["security_group_ids"] = strings_to_json(summary.security_group_ids);
    out["iam_instance_profile"] = optional_to_json(summary.iam_instance_profile);
    out["tags"] = tags_to_json(summary.tags);
    out["launch_time"] = optional_to_json(summary.launch_time);
    out["architecture"] = optional_to_json(summary.architecture);
    out["virtualization_type"] = optional_to_json(summary.virtualization_type);
    return out;
}

json to_json(const SecurityGroupRule& rule, const RuleDirection direction) {
    json out;
    out["protocol"] = rule.protocol;
    out["from_port"] = optional_to_json(rule.from_port);
    out["to_port"] = optional_to_json(rule.to_port);
    out["ip_ranges"] = strings_to_json(rule.ip_ranges);
    out["ipv6_ranges"] = strings_to_json(rule.ipv6_ranges);
    const char* peer_key = direction == RuleDirection::Inbound
                               ? "source_security_groups"
                               : "destination_security_groups";
    out[peer_key] = strings_to_json(rule.peer_group_ids);
    out["description"] = rule.description;
    return out;
}

json to_json(const SecurityGroupSummary& group) {
    json inbound = json::array();
    for (const auto& rule : group.inbound_rules) {
        inbound.push_back(to_json(rule, RuleDirection::Inbound));
    }
    json outbound = json::array();
    for (const auto& rule : group.outbound_rules) {
        outbound.push_back(to_json(rule, RuleDirection::Outbound));
    }

    json out;
    out["group_id"] = optional_to_json(group.group_id);
    out["group_name"] = optional_to_json(group.group_name);
    out["description"] = optional_to_json(group.description);
    out["vpc_id"] = optional_to_json(group.vpc_id);
    out["inbound_rules"] = std::move(inbound);
    out["outbound_rules"] = std::move(outbound);
    out["tags"] = tags_to_json(group.tags);
    return out;
}

}  // namespace cloudctx::normalize
