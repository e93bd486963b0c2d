// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace agentlink::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @return The parsed JSON object or an Error.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::StreamParseError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Extracts an optional string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @return The string value, or std::nullopt if missing or not a string.
[[nodiscard]] inline auto getOptionalString(const nlohmann::json& obj, std::string_view key)
    -> std::optional<std::string>
{
    auto keyStr = std::string(key);
    if (obj.contains(keyStr) && obj[keyStr].is_string())
        return obj[keyStr].get<std::string>();
    return std::nullopt;
}

/// @brief Extracts an optional string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The string value or the default.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto keyStr = std::string(key);
    if (obj.contains(keyStr) && obj[keyStr].is_string())
        return obj[keyStr].get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional integer field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The integer value or the default.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    auto keyStr = std::string(key);
    if (obj.contains(keyStr) && obj[keyStr].is_number_integer())
        return obj[keyStr].get<int>();
    return defaultValue;
}

/// @brief Extracts an optional non-negative 64-bit counter from a JSON object.
///
/// Negative or non-integer values yield the default.
[[nodiscard]] inline auto getUint64Or(const nlohmann::json& obj, std::string_view key, uint64_t defaultValue)
    -> uint64_t
{
    auto keyStr = std::string(key);
    if (obj.contains(keyStr) && obj[keyStr].is_number_unsigned())
        return obj[keyStr].get<uint64_t>();
    if (obj.contains(keyStr) && obj[keyStr].is_number_integer() && obj[keyStr].get<int64_t>() >= 0)
        return static_cast<uint64_t>(obj[keyStr].get<int64_t>());
    return defaultValue;
}

/// @brief Extracts an optional 64-bit signed integer field from a JSON object.
[[nodiscard]] inline auto getInt64Or(const nlohmann::json& obj, std::string_view key, int64_t defaultValue)
    -> int64_t
{
    auto keyStr = std::string(key);
    if (obj.contains(keyStr) && obj[keyStr].is_number_integer())
        return obj[keyStr].get<int64_t>();
    return defaultValue;
}

/// @brief Extracts an optional floating point field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The value or the default.
[[nodiscard]] inline auto getDoubleOr(const nlohmann::json& obj, std::string_view key, double defaultValue)
    -> double
{
    auto keyStr = std::string(key);
    if (obj.contains(keyStr) && obj[keyStr].is_number())
        return obj[keyStr].get<double>();
    return defaultValue;
}

/// @brief Extracts an optional boolean field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The boolean value or the default.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto keyStr = std::string(key);
    if (obj.contains(keyStr) && obj[keyStr].is_boolean())
        return obj[keyStr].get<bool>();
    return defaultValue;
}

/// @brief Extracts the string elements of an array field, skipping non-string entries.
[[nodiscard]] inline auto getStringArray(const nlohmann::json& obj, std::string_view key)
    -> std::vector<std::string>
{
    auto result = std::vector<std::string> {};
    auto keyStr = std::string(key);
    if (!obj.contains(keyStr) || !obj[keyStr].is_array())
        return result;

    for (const auto& item: obj[keyStr])
    {
        if (item.is_string())
            result.push_back(item.get<std::string>());
    }
    return result;
}

} // namespace agentlink::json
