#include "normalize/vulnerability_normalizer.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <utility>
#include "normalize/json_access.hpp"

namespace cloudctx::normalize {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using nlohmann::json;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

core::errors::Result<std::vector<json>> unwrap_data(const json& raw,
                                                    const std::string& what) {
    if (!raw.is_object()) {
        return ToolError{ErrorCategory::ExtractionError,
                         "Unexpected " + what + " response shape: expected a JSON object",
                         "unexpected_shape"};
    }
    const auto* data = find_member(raw, "data");
    if (data == nullptr) {
        return std::vector<json>{};
    }
    if (!data->is_array()) {
        return ToolError{ErrorCategory::ExtractionError,
                         "Unexpected " + what + " response shape: 'data' is not a list",
                         "unexpected_shape"};
    }
    return std::vector<json>(data->begin(), data->end());
}

}  // namespace

core::errors::Result<CveList> normalize_cve_list(const json& raw) {
    auto records = unwrap_data(raw, "CVE list");
    if (core::errors::is_error(records)) {
        return core::errors::get_error(records);
    }
    return CveList{core::errors::take_value(std::move(records))};
}

core::errors::Result<HostList> normalize_host_list(const json& raw) {
    auto hosts = unwrap_data(raw, "host list");
    if (core::errors::is_error(hosts)) {
        return core::errors::get_error(hosts);
    }
    return HostList{core::errors::take_value(std::move(hosts))};
}

double cvss_score(const json& record) {
    const auto* score = find_member(record, "cvss_score");
    if (score == nullptr) {
        return 0.0;
    }
    if (score->is_number()) {
        return score->get<double>();
    }
    if (score->is_string()) {
        const auto text = score->get<std::string>();
        if (text.empty()) {
            return 0.0;
        }
        char* end = nullptr;
        const double parsed = std::strtod(text.c_str(), &end);
        if (end != text.c_str() + text.size()) {
            return 0.0;
        }
        return parsed;
    }
    return 0.0;
}

std::vector<json> filter_by_severity(const std::vector<json>& records,
                                     const std::string& severity) {
    const auto wanted = lowercase(severity);
    std::vector<json> matched;
    for (const auto& record : records) {
        if (lowercase(string_at(record, "severity").value_or("")) == wanted) {
            matched.push_back(record);
        }
    }
    return matched;
}

std::vector<json> filter_by_min_score(const std::vector<json>& records,
                                      const double min_score) {
    std::vector<json> matched;
    for (const auto& record : records) {
        if (cvss_score(record) >= min_score) {
            matched.push_back(record);
        }
    }
    return matched;
}

std::vector<json> select_critical(const std::vector<json>& records,
                                  const double threshold) {
    auto critical = filter_by_min_score(records, threshold);
    std::stable_sort(critical.begin(), critical.end(),
                     [](const json& lhs, const json& rhs) {
                         return cvss_score(lhs) > cvss_score(rhs);
                     });
    return critical;
}

json to_json_array(const std::vector<json>& records) {
    json out = json::array();
    for (const auto& record : records) {
        out.push_back(record);
    }
    return out;
}

}  // namespace cloudctx::normalize
