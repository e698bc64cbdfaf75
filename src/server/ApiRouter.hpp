/**
 * @file ApiRouter.hpp
 * @brief Maps requests to responses over the current snapshot
 */

#pragma once

#include "server/HttpRequest.hpp"
#include "server/HttpResponse.hpp"
#include "services/SnapshotPoller.hpp"
#include "services/SnapshotStore.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <variant>

namespace server {

/**
 * @struct StreamRequest
 * @brief The request asked for the push stream; the server owns the connection from here on
 */
struct StreamRequest {
    std::chrono::milliseconds interval;
};

using RouteResult = std::variant<HttpResponse, StreamRequest>;

/**
 * @class ApiRouter
 * @brief Stateless request handling; safe to call from any number of threads
 *
 * Routes:
 * - GET  /, /api/drives          {"Drives": [...]}
 * - GET  /api/drives/volumes     {"Volumes": [...]}
 * - GET  /api/drives/all         {"Drives": [...], "Volumes": [...]}
 * - GET  /api/drives/stream      Server-Sent Events, see stream_frame()
 * - GET  /api/status             poller counters and snapshot metadata
 * - POST /api/drives/refresh     schedule a poll cycle
 * - OPTIONS *                    CORS preflight, 204
 */
class ApiRouter {
public:
    /**
     * @param poller May be null; refresh then answers 503 and status reports idle
     */
    ApiRouter(std::shared_ptr<SnapshotStore> store, std::shared_ptr<SnapshotPoller> poller);

    [[nodiscard]] auto route(const HttpRequest& request) const -> RouteResult;

    /**
     * @brief One SSE frame for the current snapshot
     *
     * "data: {"Drives":[...]}\n\n", or an "event: error" frame while no
     * snapshot has been published.
     */
    [[nodiscard]] auto stream_frame() const -> std::string;

private:
    enum class Endpoint {
        DRIVES,
        VOLUMES,
        ALL,
        STREAM,
        STATUS,
        REFRESH
    };

    [[nodiscard]] auto handle(Endpoint endpoint, const HttpRequest& request) const -> RouteResult;
    [[nodiscard]] auto snapshot_response(Endpoint endpoint) const -> HttpResponse;
    [[nodiscard]] auto status_response() const -> HttpResponse;
    [[nodiscard]] auto refresh_response() const -> HttpResponse;

    std::shared_ptr<SnapshotStore> store_;
    std::shared_ptr<SnapshotPoller> poller_;
};

}  // namespace server
