#include "tools/forticnapp_tools.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "normalize/vulnerability_normalizer.hpp"
#include "tools/tool_arguments.hpp"

namespace cloudctx::tools {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using nlohmann::json;

namespace {

void append_time_range(std::vector<std::string>& args, const json& arguments,
                       const bool include_end) {
    if (const auto start = string_argument(arguments, "start_time")) {
        args.push_back("--start");
        args.push_back(start.value());
    }
    if (!include_end) {
        return;
    }
    if (const auto end = string_argument(arguments, "end_time")) {
        args.push_back("--end");
        args.push_back(end.value());
    }
}

protocol::SchemaNode score_schema(std::string description) {
    auto node = protocol::number_schema(std::move(description));
    node.minimum = 0.0;
    node.maximum = 10.0;
    return node;
}

core::errors::Result<normalize::CveList> fetch_cves(const exec::CliProgram& lacework,
                                                    const json& arguments,
                                                    const bool include_end) {
    std::vector<std::string> args = {"vulnerability", "host", "list-cves"};
    append_time_range(args, arguments, include_end);

    auto raw = lacework.run_json(args);
    if (core::errors::is_error(raw)) {
        return core::errors::get_error(raw);
    }
    return normalize::normalize_cve_list(core::errors::get_value(raw));
}

}  // namespace

core::errors::Result<json> list_cves(const exec::CliProgram& lacework,
                                     const json& arguments) {
    auto fetched = fetch_cves(lacework, arguments, true);
    if (core::errors::is_error(fetched)) {
        return core::errors::get_error(fetched);
    }
    auto cves = core::errors::get_value(fetched).records;

    if (const auto severity = string_argument(arguments, "severity_filter")) {
        cves = normalize::filter_by_severity(cves, severity.value());
    }
    const auto min_score = number_argument(arguments, "min_cvss_score");
    if (min_score.has_value() && min_score.value() > 0.0) {
        cves = normalize::filter_by_min_score(cves, min_score.value());
    }

    json response;
    response["total_cves"] = cves.size();
    response["filters_applied"] = arguments.is_object() ? arguments : json::object();
    response["cves"] = normalize::to_json_array(cves);
    return response;
}

core::errors::Result<json> list_hosts_by_cve(const exec::CliProgram& lacework,
                                             const json& arguments) {
    const auto cve_id = string_argument(arguments, "cve_id");
    if (!cve_id.has_value()) {
        return ToolError{ErrorCategory::MissingRequiredArgument,
                         "Missing required argument: cve_id", "missing_required_argument"};
    }

    std::vector<std::string> args = {"vulnerability", "host", "list-hosts", cve_id.value()};
    append_time_range(args, arguments, true);

    auto raw = lacework.run_json(args);
    if (core::errors::is_error(raw)) {
        return core::errors::get_error(raw);
    }
    auto hosts = normalize::normalize_host_list(core::errors::get_value(raw));
    if (core::errors::is_error(hosts)) {
        return core::errors::get_error(hosts);
    }
    const auto& host_records = core::errors::get_value(hosts).hosts;

    json response;
    response["cve_id"] = cve_id.value();
    response["affected_hosts_count"] = host_records.size();
    response["hosts"] = normalize::to_json_array(host_records);
    return response;
}

core::errors::Result<json> get_critical_cves(const exec::CliProgram& lacework,
                                             const json& arguments) {
    const double threshold =
        number_argument(arguments, "min_cvss_score").value_or(kDefaultCriticalThreshold);

    // This tool only honours the start of the time range.
    auto fetched = fetch_cves(lacework, arguments, false);
    if (core::errors::is_error(fetched)) {
        return core::errors::get_error(fetched);
    }
    const auto& all_cves = core::errors::get_value(fetched).records;
    const auto critical = normalize::select_critical(all_cves, threshold);

    json response;
    response["threshold"] = threshold;
    response["critical_cves_count"] = critical.size();
    response["total_cves_scanned"] = all_cves.size();
    response["critical_cves"] = normalize::to_json_array(critical);
    return response;
}

protocol::ToolDescriptor list_cves_descriptor() {
    auto severity = protocol::string_schema("Filter by severity (Critical, High, Medium, Low)");
    severity.enum_values = {"Critical", "High", "Medium", "Low"};

    auto schema = protocol::object_schema();
    protocol::add_property(schema, "severity_filter", std::move(severity));
    protocol::add_property(schema, "min_cvss_score",
                           score_schema("Minimum CVSS score (0.0-10.0)"));
    protocol::add_property(
        schema, "start_time",
        protocol::string_schema(
            "Start of time range (default: -24h). Examples: -7d, -1w, 2024-01-01T00:00:00Z"));
    protocol::add_property(
        schema, "end_time",
        protocol::string_schema(
            "End of time range (default: now). Examples: now, 2024-01-31T23:59:59Z"));

    return protocol::ToolDescriptor{
        "list_cves",
        "List all CVEs found in hosts in your environment. "
        "Returns CVE ID, severity, CVSS scores, affected packages, and host count. "
        "Optionally filter by severity level (Critical, High, Medium, Low) or CVSS threshold.",
        std::move(schema)};
}

protocol::ToolDescriptor list_hosts_by_cve_descriptor() {
    auto cve_id = protocol::string_schema("CVE identifier (e.g., CVE-2024-1234)");
    cve_id.pattern = kCveIdPattern;

    auto schema = protocol::object_schema();
    protocol::add_property(schema, "cve_id", std::move(cve_id), true);
    protocol::add_property(schema, "start_time",
                           protocol::string_schema("Start of time range (default: -24h)"));
    protocol::add_property(schema, "end_time",
                           protocol::string_schema("End of time range (default: now)"));

    return protocol::ToolDescriptor{
        "list_hosts_by_cve",
        "List all hosts that contain a specific CVE ID. "
        "Returns machine ID, hostname, IP addresses, OS, cloud provider, instance ID, and "
        "status. Useful for identifying which instances need patching or remediation.",
        std::move(schema)};
}

protocol::ToolDescriptor get_critical_cves_descriptor() {
    auto threshold =
        score_schema("Minimum CVSS score threshold (default: 9.0 for Critical)");
    threshold.default_value = kDefaultCriticalThreshold;

    auto schema = protocol::object_schema();
    protocol::add_property(schema, "min_cvss_score", std::move(threshold));
    protocol::add_property(schema, "start_time",
                           protocol::string_schema("Start of time range (default: -24h)"));

    return protocol::ToolDescriptor{
        "get_critical_cves",
        "Get high-priority CVEs that need immediate attention. "
        "Returns CVEs with CVSS score >= 9.0 (Critical) or as specified. "
        "Includes host count and severity details for prioritization.",
        std::move(schema)};
}

core::errors::Status register_forticnapp_tools(ToolRegistry& registry,
                                               const exec::CliProgram& lacework) {
    auto status = registry.register_tool(
        list_cves_descriptor(),
        [lacework](const json& arguments) { return list_cves(lacework, arguments); });
    if (core::errors::is_error(status)) {
        return status;
    }
    status = registry.register_tool(
        list_hosts_by_cve_descriptor(),
        [lacework](const json& arguments) { return list_hosts_by_cve(lacework, arguments); });
    if (core::errors::is_error(status)) {
        return status;
    }
    return registry.register_tool(
        get_critical_cves_descriptor(),
        [lacework](const json& arguments) { return get_critical_cves(lacework, arguments); });
}

}  // namespace cloudctx::tools
