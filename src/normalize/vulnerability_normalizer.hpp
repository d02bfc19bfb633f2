#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/tool_errors.hpp"

namespace cloudctx::normalize {

// CVE and host records are passed through as the vendor reports them; only
// the envelope is unwrapped and the score/severity fields are interpreted.
struct CveList {
    std::vector<nlohmann::json> records;
};

struct HostList {
    std::vector<nlohmann::json> hosts;
};

core::errors::Result<CveList> normalize_cve_list(const nlohmann::json& raw);
core::errors::Result<HostList> normalize_host_list(const nlohmann::json& raw);

// Reads `cvss_score` as a number or numeric string; anything else is 0.0.
double cvss_score(const nlohmann::json& record);

std::vector<nlohmann::json> filter_by_severity(
    const std::vector<nlohmann::json>& records, const std::string& severity);

std::vector<nlohmann::json> filter_by_min_score(
    const std::vector<nlohmann::json>& records, double min_score);

// Records scoring at least `threshold`, highest score first. Ties keep their
// original relative order.
std::vector<nlohmann::json> select_critical(
    const std::vector<nlohmann::json>& records, double threshold);

nlohmann::json to_json_array(const std::vector<nlohmann::json>& records);

}  // namespace cloudctx::normalize
