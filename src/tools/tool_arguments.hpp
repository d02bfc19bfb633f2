#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cloudctx::tools {

// Accessors over an argument bag that already passed schema validation.
// Empty strings count as "not provided".

inline std::optional<std::string> string_argument(const nlohmann::json& arguments,
                                                  const std::string& key) {
    const auto it = arguments.find(key);
    if (it == arguments.end() || !it->is_string()) {
        return std::nullopt;
    }
    auto value = it->get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

inline std::optional<double> number_argument(const nlohmann::json& arguments,
                                             const std::string& key) {
    const auto it = arguments.find(key);
    if (it == arguments.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<double>();
}

inline bool bool_argument(const nlohmann::json& arguments, const std::string& key,
                          const bool fallback) {
    const auto it = arguments.find(key);
    if (it == arguments.end() || !it->is_boolean()) {
        return fallback;
    }
    return it->get<bool>();
}

inline std::vector<std::string> string_list_argument(const nlohmann::json& arguments,
                                                     const std::string& key) {
    std::vector<std::string> values;
    const auto it = arguments.find(key);
    if (it == arguments.end() || !it->is_array()) {
        return values;
    }
    for (const auto& item : *it) {
        if (item.is_string() && !item.get<std::string>().empty()) {
            values.push_back(item.get<std::string>());
        }
    }
    return values;
}

}  // namespace cloudctx::tools
