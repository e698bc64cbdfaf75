/**
 * @file HttpRequest.cpp
 * @brief Minimal HTTP/1.x request-line parsing
 */

#include "server/HttpRequest.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <format>

namespace server {

namespace {

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

auto is_token(std::string_view text) -> bool {
    return !text.empty() && std::ranges::all_of(text, [](unsigned char c) {
        return std::isupper(c) != 0 || c == '-' || c == '_';
    });
}

}  // namespace

auto HttpRequest::query_value(std::string_view key) const -> std::optional<std::string> {
    if (auto it = query.find(std::string(key)); it != query.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto parse_request_head(std::string_view head) -> std::expected<HttpRequest, util::Error> {
    auto line_end = head.find_first_of("\r\n");
    const auto line = head.substr(0, line_end);

    const auto first_space = line.find(' ');
    const auto last_space = line.rfind(' ');
    if (first_space == std::string_view::npos || last_space == first_space) {
        return std::unexpected(util::Error{"Malformed request line"});
    }

    const auto method = line.substr(0, first_space);
    const auto target = line.substr(first_space + 1, last_space - first_space - 1);
    const auto version = line.substr(last_space + 1);

    if (!is_token(method)) {
        return std::unexpected(util::Error{std::format("Invalid method '{}'", method)});
    }
    if (!version.starts_with("HTTP/1.")) {
        return std::unexpected(util::Error{std::format("Unsupported protocol '{}'", version)});
    }
    if (target.empty() || (target.front() != '/' && target != "*")) {
        return std::unexpected(util::Error{"Request target must be an absolute path"});
    }

    auto path_part = target.substr(0, target.find('#'));
    std::string_view query_part;
    if (const auto question = path_part.find('?'); question != std::string_view::npos) {
        query_part = path_part.substr(question + 1);
        path_part = path_part.substr(0, question);
    }

    HttpRequest request;
    request.method = std::string(method);
    request.path = percent_decode(path_part);
    request.query = parse_query_string(query_part);
    return request;
}

auto parse_query_string(std::string_view query) -> std::map<std::string, std::string> {
    std::map<std::string, std::string> params;
    while (!query.empty()) {
        const auto amp = query.find('&');
        const auto pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);

        if (pair.empty()) {
            continue;
        }
        const auto eq = pair.find('=');
        auto key = percent_decode(pair.substr(0, eq));
        auto value = eq == std::string_view::npos ? std::string{} : percent_decode(pair.substr(eq + 1));
        params.insert_or_assign(std::move(key), std::move(value));
    }
    return params;
}

auto percent_decode(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < text.size() && hex_value(text[i + 1]) >= 0 &&
                   hex_value(text[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hex_value(text[i + 1]) * 16 + hex_value(text[i + 2])));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

auto parse_stream_interval(const std::optional<std::string>& seconds)
    -> std::chrono::milliseconds {
    if (!seconds) {
        return DEFAULT_STREAM_INTERVAL;
    }

    const auto* begin = seconds->data();
    const auto* end = begin + seconds->size();
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end || !std::isfinite(value) || value <= 0.0) {
        return DEFAULT_STREAM_INTERVAL;
    }

    const double millis = std::floor(value * 1000.0);
    if (millis >= static_cast<double>(MAX_STREAM_INTERVAL.count())) {
        return MAX_STREAM_INTERVAL;
    }
    const std::chrono::milliseconds interval{
        static_cast<std::chrono::milliseconds::rep>(millis)};
    return std::max(interval, MIN_STREAM_INTERVAL);
}

}  // namespace server
