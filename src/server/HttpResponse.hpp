/**
 * @file HttpResponse.hpp
 * @brief Buffered HTTP responses with the API's common headers
 */

#pragma once

#include <json/json.h>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace server {

/**
 * @struct HttpResponse
 * @brief Status, body and extra headers; serialize() adds CORS and caching headers
 */
struct HttpResponse {
    int status = 200;
    std::string content_type = "text/plain";
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;  ///< Extra headers

    [[nodiscard]] static auto json(int status, const Json::Value& document) -> HttpResponse;
    [[nodiscard]] static auto text(int status, std::string body) -> HttpResponse;
    [[nodiscard]] static auto no_content() -> HttpResponse;

    /**
     * @brief Full response including status line and Content-Length
     */
    [[nodiscard]] auto serialize() const -> std::string;
};

[[nodiscard]] auto reason_phrase(int status) -> std::string_view;

/**
 * @brief Status line and headers that open a Server-Sent Events stream
 */
[[nodiscard]] auto event_stream_head() -> std::string;

}  // namespace server
