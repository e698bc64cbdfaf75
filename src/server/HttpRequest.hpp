/**
 * @file HttpRequest.hpp
 * @brief Minimal HTTP/1.x request-line parsing
 *
 * The API only routes on method, path and query string; headers and bodies
 * are read off the socket but not interpreted.
 */

#pragma once

#include "util/Error.hpp"

#include <chrono>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace server {

/**
 * @struct HttpRequest
 * @brief Parsed request line
 */
struct HttpRequest {
    std::string method;                        ///< Upper case, e.g. "GET"
    std::string path;                          ///< Decoded, without query string
    std::map<std::string, std::string> query;  ///< Decoded; last occurrence of a key wins

    [[nodiscard]] auto query_value(std::string_view key) const -> std::optional<std::string>;
};

constexpr auto DEFAULT_STREAM_INTERVAL = std::chrono::milliseconds{10'000};
constexpr auto MIN_STREAM_INTERVAL = std::chrono::milliseconds{1'000};
constexpr auto MAX_STREAM_INTERVAL = std::chrono::milliseconds{24 * 60 * 60 * 1000};

/**
 * @brief Parse the request line at the start of a request head
 * @param head Bytes received so far (at least the first line)
 * @return Request, or an error for anything that is not "METHOD target HTTP/x.y"
 */
[[nodiscard]] auto parse_request_head(std::string_view head)
    -> std::expected<HttpRequest, util::Error>;

/**
 * @brief Split "a=1&b=two" into decoded key/value pairs
 */
[[nodiscard]] auto parse_query_string(std::string_view query) -> std::map<std::string, std::string>;

/**
 * @brief Decode %XX escapes and '+' (as space); malformed escapes are kept verbatim
 */
[[nodiscard]] auto percent_decode(std::string_view text) -> std::string;

/**
 * @brief Push interval for the stream endpoint
 * @param seconds Value of the "interval" query parameter, in seconds
 *
 * Absent, non-numeric, non-finite or non-positive values give
 * DEFAULT_STREAM_INTERVAL. Others are floored to whole milliseconds and
 * clamped to [MIN_STREAM_INTERVAL, MAX_STREAM_INTERVAL].
 */
[[nodiscard]] auto parse_stream_interval(const std::optional<std::string>& seconds)
    -> std::chrono::milliseconds;

}  // namespace server
