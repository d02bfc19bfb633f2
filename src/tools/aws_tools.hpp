#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/tool_errors.hpp"
#include "exec/cli_program.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool_registry.hpp"

namespace cloudctx::tools {

inline constexpr const char* kInstanceIdPattern = "^i-[a-f0-9]+$";

struct GroupLookupRequest {
    std::optional<std::string> instance_id;
    std::vector<std::string> security_group_ids;
    std::optional<std::string> region;
};

// Output of the first get_security_groups step. Never empty.
struct ResolvedGroupIds {
    std::vector<std::string> group_ids;
    // Set when the ids were read off an instance.
    std::optional<std::string> source_instance_id;
};

// Explicit ids win; otherwise they are read from the instance with one
// describe-instances call. Yields ResolutionError when nothing resolves.
core::errors::Result<ResolvedGroupIds> resolve_group_ids(
    const exec::CliProgram& aws, const GroupLookupRequest& request);

core::errors::Result<nlohmann::json> describe_instance(
    const exec::CliProgram& aws, const nlohmann::json& arguments);

core::errors::Result<nlohmann::json> get_security_groups(
    const exec::CliProgram& aws, const nlohmann::json& arguments);

protocol::ToolDescriptor describe_instance_descriptor();
protocol::ToolDescriptor get_security_groups_descriptor();

core::errors::Status register_aws_tools(ToolRegistry& registry,
                                        const exec::CliProgram& aws);

}  // namespace cloudctx::tools
