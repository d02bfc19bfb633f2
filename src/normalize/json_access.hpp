#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace cloudctx::normalize {

// Lookups over vendor documents never throw: a missing key, a wrong type or
// a non-object parent all read as "absent".

inline const nlohmann::json* find_member(const nlohmann::json& object,
                                         const std::string& key) {
    if (!object.is_object()) {
        return nullptr;
    }
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return nullptr;
    }
    return &(*it);
}

inline std::optional<std::string> string_at(const nlohmann::json& object,
                                            const std::string& key) {
    const auto* member = find_member(object, key);
    if (member == nullptr || !member->is_string()) {
        return std::nullopt;
    }
    return member->get<std::string>();
}

inline std::optional<std::string> nested_string_at(const nlohmann::json& object,
                                                   const std::string& outer,
                                                   const std::string& inner) {
    const auto* member = find_member(object, outer);
    if (member == nullptr) {
        return std::nullopt;
    }
    return string_at(*member, inner);
}

inline std::optional<std::int64_t> integer_at(const nlohmann::json& object,
                                              const std::string& key) {
    // Integral values within int64 only; floats and oversized values read as absent.
    const auto* member = find_member(object, key);
    if (member == nullptr || !member->is_number_integer()) {
        return std::nullopt;
    }
    if (member->is_number_unsigned() &&
        member->get<std::uint64_t>() >
            static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return std::nullopt;
    }
    return member->get<std::int64_t>();
}

// Returns a shared empty array when the member is absent or not an array.
inline const nlohmann::json& array_at(const nlohmann::json& object,
                                      const std::string& key) {
    static const nlohmann::json kEmpty = nlohmann::json::array();
    const auto* member = find_member(object, key);
    if (member == nullptr || !member->is_array()) {
        return kEmpty;
    }
    return *member;
}

inline nlohmann::json optional_to_json(const std::optional<std::string>& value) {
    return value.has_value() ? nlohmann::json(value.value()) : nlohmann::json(nullptr);
}

inline nlohmann::json optional_to_json(const std::optional<std::int64_t>& value) {
    return value.has_value() ? nlohmann::json(value.value()) : nlohmann::json(nullptr);
}

}  // namespace cloudctx::normalize
