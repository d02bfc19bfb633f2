#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/tool_errors.hpp"

namespace cloudctx::normalize {

using TagMap = std::map<std::string, std::string>;

// Platform reported when the vendor record leaves it out.
inline constexpr const char* kDefaultPlatform = "linux";

struct InstanceSummary {
    std::optional<std::string> instance_id;
    std::optional<std::string> instance_type;
    std::optional<std::string> state;
    std::optional<std::string> availability_zone;
    std::string platform = kDefaultPlatform;

    std::optional<std::string> public_ip;
    std::optional<std::string> private_ip;
    std::optional<std::string> public_dns;
    std::optional<std::string> private_dns;

    std::optional<std::string> vpc_id;
    std::optional<std::string> subnet_id;

    std::vector<std::string> security_group_ids;
    std::optional<std::string> iam_instance_profile;

    TagMap tags;
    std::optional<std::string> launch_time;
    std::optional<std::string> architecture;
    std::optional<std::string> virtualization_type;
};

enum class RuleDirection {
    Inbound,
    Outbound
};

struct SecurityGroupRule {
    std::string protocol = "all";
    // Both absent when the rule covers every port.
    std::optional<std::int64_t> from_port;
    std::optional<std::int64_t> to_port;
    std::vector<std::string> ip_ranges;
    std::vector<std::string> ipv6_ranges;
    std::vector<std::string> peer_group_ids;
    std::string description;
};

struct SecurityGroupSummary {
    std::optional<std::string> group_id;
    std::optional<std::string> group_name;
    std::optional<std::string> description;
    std::optional<std::string> vpc_id;
    std::vector<SecurityGroupRule> inbound_rules;
    std::vector<SecurityGroupRule> outbound_rules;
    TagMap tags;
};

// Folds a vendor [{Key, Value}, ...] list into a map; the last duplicate wins.
TagMap fold_tags(const nlohmann::json& tag_list);

// Summarizes the first instance of the first reservation of a
// describe-instances document.
core::errors::Result<InstanceSummary> normalize_instance(const nlohmann::json& raw);

core::errors::Result<std::vector<SecurityGroupSummary>> normalize_security_groups(
    const nlohmann::json& raw);

SecurityGroupRule normalize_rule(const nlohmann::json& permission);

nlohmann::json to_json(const InstanceSummary& summary);
nlohmann::json to_json(const SecurityGroupRule& rule, RuleDirection direction);
nlohmann::json to_json(const SecurityGroupSummary& group);

}  // namespace cloudctx::normalize
