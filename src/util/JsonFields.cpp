/**
 * @file JsonFields.cpp
 * @brief Total accessors for loosely shaped JSON documents
 */

#include "util/JsonFields.hpp"

#include <charconv>
#include <cmath>
#include <limits>
#include <memory>

namespace util::json {

namespace {

auto trim(std::string_view text) -> std::string_view {
    constexpr std::string_view WHITESPACE = " \t\r\n";
    const auto first = text.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(WHITESPACE);
    return text.substr(first, last - first + 1);
}

auto parse_decimal(std::string_view text) -> std::optional<double> {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    if (text.front() == '+') {
        text.remove_prefix(1);
    }

    double result = 0.0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, result);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return result;
}

}  // namespace

auto member(const Json::Value& value, std::string_view key) -> const Json::Value* {
    if (!value.isObject()) {
        return nullptr;
    }
    return value.find(key.data(), key.data() + key.size());
}

auto path(const Json::Value& value, std::initializer_list<std::string_view> keys)
    -> const Json::Value* {
    const Json::Value* current = &value;
    for (const auto key : keys) {
        current = member(*current, key);
        if (current == nullptr) {
            return nullptr;
        }
    }
    return current;
}

auto to_number(const Json::Value* value) -> std::optional<double> {
    if (value == nullptr) {
        return std::nullopt;
    }

    std::optional<double> result;
    if (value->isBool()) {
        result = value->asBool() ? 1.0 : 0.0;
    } else if (value->isInt64()) {
        result = static_cast<double>(value->asInt64());
    } else if (value->isUInt64()) {
        result = static_cast<double>(value->asUInt64());
    } else if (value->isDouble()) {
        result = value->asDouble();
    } else if (value->isString()) {
        result = parse_decimal(value->asString());
    }

    if (result && !std::isfinite(*result)) {
        return std::nullopt;
    }
    return result;
}

auto to_string(const Json::Value* value) -> std::optional<std::string> {
    if (value == nullptr || !value->isString()) {
        return std::nullopt;
    }
    return value->asString();
}

auto to_bool(const Json::Value* value) -> std::optional<bool> {
    if (value == nullptr || !value->isBool()) {
        return std::nullopt;
    }
    return value->asBool();
}

auto to_counter(std::optional<double> value, uint64_t fallback) -> uint64_t {
    if (!value) {
        return fallback;
    }
    if (*value <= 0.0) {
        return 0;
    }
    constexpr auto MAX_COUNTER = static_cast<double>(std::numeric_limits<uint64_t>::max());
    if (*value >= MAX_COUNTER) {
        return std::numeric_limits<uint64_t>::max();
    }
    return static_cast<uint64_t>(*value);
}

auto parse_document(std::string_view text, std::string* errors) -> std::optional<Json::Value> {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["failIfExtra"] = true;
    builder["rejectDupKeys"] = false;

    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string parse_errors;

    try {
        if (!reader->parse(text.data(), text.data() + text.size(), &root, &parse_errors)) {
            if (errors != nullptr) {
                *errors = parse_errors;
            }
            return std::nullopt;
        }
    } catch (const Json::Exception& e) {
        // Nesting deeper than the reader's stack limit
        if (errors != nullptr) {
            *errors = e.what();
        }
        return std::nullopt;
    }
    return root;
}

auto write_compact(const Json::Value& value) -> std::string {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["precision"] = 2;
    builder["precisionType"] = "decimal";
    return Json::writeString(builder, value);
}

auto write_pretty(const Json::Value& value) -> std::string {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["precision"] = 2;
    builder["precisionType"] = "decimal";
    return Json::writeString(builder, value);
}

}  // namespace util::json
