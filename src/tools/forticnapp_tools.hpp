#pragma once

#include <nlohmann/json.hpp>
#include "core/errors/tool_errors.hpp"
#include "exec/cli_program.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool_registry.hpp"

namespace cloudctx::tools {

inline constexpr const char* kCveIdPattern = "^CVE-\\d{4}-\\d+$";
inline constexpr double kDefaultCriticalThreshold = 9.0;

core::errors::Result<nlohmann::json> list_cves(const exec::CliProgram& lacework,
                                               const nlohmann::json& arguments);

core::errors::Result<nlohmann::json> list_hosts_by_cve(const exec::CliProgram& lacework,
                                                       const nlohmann::json& arguments);

core::errors::Result<nlohmann::json> get_critical_cves(const exec::CliProgram& lacework,
                                                       const nlohmann::json& arguments);

protocol::ToolDescriptor list_cves_descriptor();
protocol::ToolDescriptor list_hosts_by_cve_descriptor();
protocol::ToolDescriptor get_critical_cves_descriptor();

core::errors::Status register_forticnapp_tools(ToolRegistry& registry,
                                               const exec::CliProgram& lacework);

}  // namespace cloudctx::tools
