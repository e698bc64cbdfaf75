/**
 * @file ApiRouter.cpp
 * @brief Maps requests to responses over the current snapshot
 */

#include "server/ApiRouter.hpp"

#include "serialization/SnapshotJson.hpp"
#include "util/JsonFields.hpp"

#include <array>
#include <format>
#include <string_view>
#include <utility>

namespace server {

namespace {

constexpr std::string_view NOT_READY_MESSAGE = "No snapshot available yet; first poll in progress";

}  // namespace

ApiRouter::ApiRouter(std::shared_ptr<SnapshotStore> store, std::shared_ptr<SnapshotPoller> poller)
    : store_(std::move(store)), poller_(std::move(poller)) {}

auto ApiRouter::route(const HttpRequest& request) const -> RouteResult {
    struct Route {
        std::string_view method;
        std::string_view path;
        Endpoint endpoint;
    };
    static constexpr std::array ROUTES{
        Route{.method = "GET", .path = "/", .endpoint = Endpoint::DRIVES},
        Route{.method = "GET", .path = "/api/drives", .endpoint = Endpoint::DRIVES},
        Route{.method = "GET", .path = "/api/drives/volumes", .endpoint = Endpoint::VOLUMES},
        Route{.method = "GET", .path = "/api/drives/all", .endpoint = Endpoint::ALL},
        Route{.method = "GET", .path = "/api/drives/stream", .endpoint = Endpoint::STREAM},
        Route{.method = "GET", .path = "/api/status", .endpoint = Endpoint::STATUS},
        Route{.method = "POST", .path = "/api/drives/refresh", .endpoint = Endpoint::REFRESH},
    };

    if (request.method == "OPTIONS") {
        return HttpResponse::no_content();
    }

    std::string_view path = request.path;
    if (path.size() > 1 && path.ends_with('/')) {
        path.remove_suffix(1);
    }

    std::string allowed;
    for (const auto& route : ROUTES) {
        if (route.path != path) {
            continue;
        }
        if (route.method == request.method) {
            return handle(route.endpoint, request);
        }
        allowed += allowed.empty() ? "" : ", ";
        allowed += route.method;
    }

    if (!allowed.empty()) {
        auto response = HttpResponse::text(405, "Method Not Allowed\n");
        response.headers.emplace_back("Allow", std::format("{}, OPTIONS", allowed));
        return response;
    }
    return HttpResponse::text(404, "Not Found\n");
}

auto ApiRouter::handle(Endpoint endpoint, const HttpRequest& request) const -> RouteResult {
    switch (endpoint) {
        case Endpoint::STREAM:
            return StreamRequest{.interval = parse_stream_interval(request.query_value("interval"))};
        case Endpoint::STATUS:
            return status_response();
        case Endpoint::REFRESH:
            return refresh_response();
        case Endpoint::DRIVES:
        case Endpoint::VOLUMES:
        case Endpoint::ALL:
            break;
    }
    return snapshot_response(endpoint);
}

auto ApiRouter::snapshot_response(Endpoint endpoint) const -> HttpResponse {
    const auto snapshot = store_->current();
    if (!snapshot) {
        return HttpResponse::json(503, SnapshotJson::error_document(NOT_READY_MESSAGE));
    }

    switch (endpoint) {
        case Endpoint::VOLUMES:
            return HttpResponse::json(200, SnapshotJson::volumes_document(*snapshot));
        case Endpoint::ALL:
            return HttpResponse::json(200, SnapshotJson::full_document(*snapshot));
        default:
            return HttpResponse::json(200, SnapshotJson::drives_document(*snapshot));
    }
}

auto ApiRouter::status_response() const -> HttpResponse {
    const auto snapshot = store_->current();
    const auto status = poller_ ? poller_->status() : PollerStatus{};
    return HttpResponse::json(200, SnapshotJson::status_document(status, snapshot.get()));
}

auto ApiRouter::refresh_response() const -> HttpResponse {
    const auto result = poller_ ? poller_->trigger() : TriggerResult{};
    if (!result.accepted) {
        return HttpResponse::json(503, SnapshotJson::error_document("Poller is not running"));
    }

    Json::Value document(Json::objectValue);
    document["accepted"] = true;
    document["coalesced"] = result.coalesced;
    return HttpResponse::json(202, document);
}

auto ApiRouter::stream_frame() const -> std::string {
    const auto snapshot = store_->current();
    if (!snapshot) {
        return std::format(
            "event: error\ndata: {}\n\n",
            util::json::write_compact(SnapshotJson::error_document(NOT_READY_MESSAGE)));
    }
    return std::format("data: {}\n\n",
                       util::json::write_compact(SnapshotJson::drives_document(*snapshot)));
}

}  // namespace server
