/**
 * @file Error.hpp
 * @brief Error value carried through std::expected returns
 *
 * Fallible operations return std::expected<T, util::Error>. The code is a
 * component-specific integer (see ProbeErrorCode), 0 when unclassified.
 */

#pragma once

#include <string>
#include <utility>

namespace util {

/**
 * @struct Error
 * @brief Represents an error with a message and optional code
 */
struct Error {
    std::string message;
    int code = 0;

    Error() = default;
    explicit Error(std::string msg, int err_code = 0)
        : message(std::move(msg)), code(err_code) {}

    auto operator==(const Error&) const -> bool = default;
};

}  // namespace util
