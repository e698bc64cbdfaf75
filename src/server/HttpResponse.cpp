/**
 * @file HttpResponse.cpp
 * @brief Buffered HTTP responses with the API's common headers
 */

#include "server/HttpResponse.hpp"

#include "util/JsonFields.hpp"

#include <format>

namespace server {

namespace {

constexpr std::string_view COMMON_HEADERS =
    "Access-Control-Allow-Origin: *\r\n"
    "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n"
    "Access-Control-Allow-Headers: Content-Type\r\n"
    "Cache-Control: no-store\r\n";

}  // namespace

auto HttpResponse::json(int status, const Json::Value& document) -> HttpResponse {
    return HttpResponse{
        .status = status,
        .content_type = "application/json",
        .body = util::json::write_compact(document),
        .headers = {},
    };
}

auto HttpResponse::text(int status, std::string body) -> HttpResponse {
    return HttpResponse{
        .status = status,
        .content_type = "text/plain",
        .body = std::move(body),
        .headers = {},
    };
}

auto HttpResponse::no_content() -> HttpResponse {
    return HttpResponse{.status = 204, .content_type = {}, .body = {}, .headers = {}};
}

auto HttpResponse::serialize() const -> std::string {
    std::string out = std::format("HTTP/1.1 {} {}\r\n", status, reason_phrase(status));
    out += COMMON_HEADERS;
    if (!content_type.empty()) {
        out += std::format("Content-Type: {}; charset=utf-8\r\n", content_type);
    }
    for (const auto& [name, value] : headers) {
        out += std::format("{}: {}\r\n", name, value);
    }
    out += std::format("Content-Length: {}\r\nConnection: close\r\n\r\n", body.size());
    out += body;
    return out;
}

auto reason_phrase(int status) -> std::string_view {
    switch (status) {
        case 200:
            return "OK";
        case 202:
            return "Accepted";
        case 204:
            return "No Content";
        case 400:
            return "Bad Request";
        case 404:
            return "Not Found";
        case 405:
            return "Method Not Allowed";
        case 431:
            return "Request Header Fields Too Large";
        case 500:
            return "Internal Server Error";
        case 503:
            return "Service Unavailable";
        default:
            return "Unknown";
    }
}

auto event_stream_head() -> std::string {
    std::string out = "HTTP/1.1 200 OK\r\n";
    out += COMMON_HEADERS;
    out += "Content-Type: text/event-stream\r\n"
           "Connection: keep-alive\r\n"
           "X-Accel-Buffering: no\r\n\r\n";
    return out;
}

}  // namespace server
