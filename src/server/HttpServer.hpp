/**
 * @file HttpServer.hpp
 * @brief HTTP/1.1 listener on a GIO threaded socket service
 */

#pragma once

#include "server/ApiRouter.hpp"
#include "util/Error.hpp"

#include <gio/gio.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace server {

/**
 * @struct ServerOptions
 * @brief Listening address and connection limits
 */
struct ServerOptions {
    std::string bind_address = "0.0.0.0";
    uint16_t port = 3000;
    int max_threads = 64;  ///< Concurrent connections, open streams included
    int max_streams = 48;  ///< Open event streams; further stream requests get 503
    std::chrono::seconds io_timeout{5};
};

/**
 * @class HttpServer
 * @brief Serves ApiRouter over plain HTTP, one connection per request
 *
 * Each accepted connection is handled on a GThreadedSocketService worker
 * thread, so a long-lived stream only occupies its own thread. Streams are
 * capped below max_threads so that plain requests always find a worker. The service
 * dispatches connections from the thread-default GMainContext at start(),
 * which must be iterated (e.g. by a GMainLoop).
 */
class HttpServer {
public:
    HttpServer(std::shared_ptr<ApiRouter> router, ServerOptions options);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;
    HttpServer(HttpServer&&) = delete;
    HttpServer& operator=(HttpServer&&) = delete;

    /**
     * @brief Bind and start accepting
     * @return Error if the address is invalid or the port cannot be bound
     */
    auto start() -> std::expected<void, util::Error>;

    /**
     * @brief Stop accepting, end all open streams and wait for their threads
     */
    void stop();

    /**
     * @brief Port actually bound; differs from the configured port when 0 was requested
     */
    [[nodiscard]] auto port() const -> uint16_t { return bound_port_; }

private:
    static constexpr size_t MAX_REQUEST_HEAD_BYTES = 8 * 1024;

    static auto on_run(GThreadedSocketService* service, GSocketConnection* connection,
                       GObject* source_object, gpointer user_data) -> gboolean;

    void handle_connection(GSocketConnection* connection);

    /**
     * @brief Read until the blank line ending the request head
     */
    auto read_request_head(GInputStream* input) -> std::expected<std::string, util::Error>;

    void serve_stream(GSocketConnection* connection, std::chrono::milliseconds interval);

    auto acquire_stream_slot() -> bool;
    void release_stream_slot();

    auto write_all(GOutputStream* output, std::string_view data) -> bool;

    std::shared_ptr<ApiRouter> router_;
    ServerOptions options_;
    GSocketService* service_ = nullptr;
    GCancellable* cancellable_ = nullptr;  // Cancelled by stop(); shared by every connection
    uint16_t bound_port_ = 0;

    std::mutex connections_mutex_;
    std::condition_variable connections_cv_;
    int active_connections_ = 0;
    int active_streams_ = 0;
};

}  // namespace server
