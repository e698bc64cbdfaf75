/**
 * @file JsonFields.hpp
 * @brief Total accessors for loosely shaped JSON documents
 *
 * jsoncpp asserts (throws Json::LogicError) when a member lookup or a
 * conversion does not match the value's type. These helpers never throw:
 * a missing member, a member of the wrong type, or a value that is not a
 * finite number yields nullptr / std::nullopt.
 */

#pragma once

#include <json/json.h>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace util::json {

/**
 * @brief Look up an object member
 * @return Pointer to the member, nullptr if value is not an object or lacks key
 */
[[nodiscard]] auto member(const Json::Value& value, std::string_view key) -> const Json::Value*;

/**
 * @brief Follow a path of object members (e.g. {"power_on_time", "hours"})
 */
[[nodiscard]] auto path(const Json::Value& value, std::initializer_list<std::string_view> keys)
    -> const Json::Value*;

/**
 * @brief Numeric coercion of a JSON value
 *
 * Numbers convert directly, booleans to 0/1, strings when the whole
 * (whitespace-trimmed) text is a decimal number. Everything else, and any
 * non-finite result, is absent.
 */
[[nodiscard]] auto to_number(const Json::Value* value) -> std::optional<double>;

/**
 * @brief String member, absent unless the value is a JSON string
 */
[[nodiscard]] auto to_string(const Json::Value* value) -> std::optional<std::string>;

/**
 * @brief Boolean member, absent unless the value is a JSON boolean
 */
[[nodiscard]] auto to_bool(const Json::Value* value) -> std::optional<bool>;

/**
 * @brief Numeric-or-default coercion clamped to the unsigned range
 *
 * Absent values become fallback; negative values floor at 0.
 */
[[nodiscard]] auto to_counter(std::optional<double> value, uint64_t fallback = 0) -> uint64_t;

/**
 * @brief Parse a complete JSON document
 * @return Root value, nullopt if the text is not well-formed JSON
 */
[[nodiscard]] auto parse_document(std::string_view text, std::string* errors = nullptr)
    -> std::optional<Json::Value>;

/**
 * @brief Serialize compactly (no indentation), doubles with 2 decimals
 */
[[nodiscard]] auto write_compact(const Json::Value& value) -> std::string;

/**
 * @brief Serialize with two-space indentation, for terminal output
 */
[[nodiscard]] auto write_pretty(const Json::Value& value) -> std::string;

}  // namespace util::json
