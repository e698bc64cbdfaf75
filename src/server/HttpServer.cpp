/**
 * @file HttpServer.cpp
 * @brief HTTP/1.1 listener on a GIO threaded socket service
 */

#include "server/HttpServer.hpp"

#include "serialization/SnapshotJson.hpp"
#include "util/Logger.hpp"

#include <array>
#include <chrono>
#include <format>
#include <utility>
#include <variant>

namespace server {

namespace {

auto take_error_message(GError*& error) -> std::string {
    std::string message = error ? error->message : "unknown error";
    g_clear_error(&error);
    return message;
}

}  // namespace

HttpServer::HttpServer(std::shared_ptr<ApiRouter> router, ServerOptions options)
    : router_(std::move(router)), options_(std::move(options)) {}

HttpServer::~HttpServer() {
    stop();
    if (service_) {
        g_object_unref(service_);
    }
    if (cancellable_) {
        g_object_unref(cancellable_);
    }
}

auto HttpServer::start() -> std::expected<void, util::Error> {
    if (service_) {
        return {};
    }

    GInetAddress* address = g_inet_address_new_from_string(options_.bind_address.c_str());
    if (!address) {
        return std::unexpected(
            util::Error{std::format("Invalid bind address '{}'", options_.bind_address)});
    }
    GSocketAddress* socket_address = g_inet_socket_address_new(address, options_.port);
    g_object_unref(address);

    if (!cancellable_) {
        cancellable_ = g_cancellable_new();
    }
    service_ = g_threaded_socket_service_new(options_.max_threads);

    GError* error = nullptr;
    GSocketAddress* effective_address = nullptr;
    const gboolean added = g_socket_listener_add_address(
        G_SOCKET_LISTENER(service_), socket_address, G_SOCKET_TYPE_STREAM, G_SOCKET_PROTOCOL_TCP,
        nullptr,  // source_object
        &effective_address, &error);
    g_object_unref(socket_address);

    if (!added) {
        auto message = std::format("Cannot listen on {}:{}: {}", options_.bind_address,
                                   options_.port, take_error_message(error));
        g_object_unref(service_);
        service_ = nullptr;
        return std::unexpected(util::Error{std::move(message)});
    }

    bound_port_ = g_inet_socket_address_get_port(G_INET_SOCKET_ADDRESS(effective_address));
    g_object_unref(effective_address);

    g_signal_connect(service_, "run", G_CALLBACK(on_run), this);
    g_socket_service_start(service_);

    LOG_INFO("HttpServer",
             std::format("Listening on {}:{}", options_.bind_address, bound_port_));
    return {};
}

void HttpServer::stop() {
    if (!service_ || !g_socket_service_is_active(service_)) {
        return;
    }
    g_cancellable_cancel(cancellable_);
    g_socket_service_stop(service_);
    g_socket_listener_close(G_SOCKET_LISTENER(service_));

    // Handlers reference this object, so it must outlive them. All their I/O
    // uses cancellable_, so the unbounded wait ends once they notice.
    std::unique_lock lock(connections_mutex_);
    const auto drained = [this]() { return active_connections_ == 0; };
    if (!connections_cv_.wait_for(lock, options_.io_timeout * 2, drained)) {
        LOG_WARNING("HttpServer", std::format("{} connection(s) still open at shutdown, waiting",
                                              active_connections_));
        connections_cv_.wait(lock, drained);
    }
    LOG_INFO("HttpServer", "Stopped");
}

auto HttpServer::on_run(GThreadedSocketService* /*service*/, GSocketConnection* connection,
                        GObject* /*source_object*/, gpointer user_data) -> gboolean {
    auto* self = static_cast<HttpServer*>(user_data);
    {
        std::lock_guard lock(self->connections_mutex_);
        ++self->active_connections_;
    }
    self->handle_connection(connection);

    // Notify under the lock: once stop() sees zero, self may be destroyed
    std::lock_guard lock(self->connections_mutex_);
    --self->active_connections_;
    self->connections_cv_.notify_all();
    return TRUE;
}

void HttpServer::handle_connection(GSocketConnection* connection) {
    GSocket* socket = g_socket_connection_get_socket(connection);
    g_socket_set_timeout(socket, static_cast<guint>(options_.io_timeout.count()));

    GInputStream* input = g_io_stream_get_input_stream(G_IO_STREAM(connection));
    GOutputStream* output = g_io_stream_get_output_stream(G_IO_STREAM(connection));

    auto head = read_request_head(input);
    if (!head) {
        LOG_DEBUG("HttpServer", std::format("Dropping connection: {}", head.error().message));
        return;
    }

    auto request = parse_request_head(*head);
    if (!request) {
        LOG_DEBUG("HttpServer", std::format("Bad request: {}", request.error().message));
        (void)write_all(output, HttpResponse::text(400, "Bad Request\n").serialize());
        return;
    }

    auto result = router_->route(*request);
    if (auto* stream = std::get_if<StreamRequest>(&result)) {
        if (!acquire_stream_slot()) {
            LOG_WARNING("HttpServer", std::format("Refusing stream: {} already open",
                                                  options_.max_streams));
            auto busy = HttpResponse::json(
                503, SnapshotJson::error_document("Too many open streams"));
            busy.headers.emplace_back("Retry-After", "5");
            (void)write_all(output, busy.serialize());
            return;
        }
        serve_stream(connection, stream->interval);
        release_stream_slot();
        return;
    }

    const auto& response = std::get<HttpResponse>(result);
    LOG_DEBUG("HttpServer",
              std::format("{} {} -> {}", request->method, request->path, response.status));
    (void)write_all(output, response.serialize());
}

auto HttpServer::read_request_head(GInputStream* input)
    -> std::expected<std::string, util::Error> {
    std::string head;
    std::array<char, 2048> buffer{};

    while (head.find("\r\n\r\n") == std::string::npos && head.find("\n\n") == std::string::npos) {
        if (head.size() >= MAX_REQUEST_HEAD_BYTES) {
            return std::unexpected(util::Error{"Request head too large"});
        }

        GError* error = nullptr;
        const gssize n =
            g_input_stream_read(input, buffer.data(), buffer.size(), cancellable_, &error);
        if (n < 0) {
            return std::unexpected(util::Error{take_error_message(error)});
        }
        if (n == 0) {
            if (head.empty()) {
                return std::unexpected(util::Error{"Connection closed before request"});
            }
            break;  // Half-closed after a request line without the blank line
        }
        head.append(buffer.data(), static_cast<size_t>(n));
    }
    return head;
}

void HttpServer::serve_stream(GSocketConnection* connection, std::chrono::milliseconds interval) {
    GSocket* socket = g_socket_connection_get_socket(connection);
    GInputStream* input = g_io_stream_get_input_stream(G_IO_STREAM(connection));
    GOutputStream* output = g_io_stream_get_output_stream(G_IO_STREAM(connection));

    // The socket timeout caps g_socket_condition_timed_wait; frames are paced by interval
    g_socket_set_timeout(socket, 0);

    LOG_DEBUG("HttpServer", std::format("Stream opened, interval {} ms", interval.count()));
    if (!write_all(output, event_stream_head())) {
        return;
    }

    std::array<char, 512> discard{};
    auto next_frame = std::chrono::steady_clock::now();

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= next_frame) {
            if (!write_all(output, router_->stream_frame())) {
                break;
            }
            next_frame = now + interval;
        }

        const auto wait_us =
            std::chrono::duration_cast<std::chrono::microseconds>(next_frame - now).count();
        GError* error = nullptr;
        if (g_socket_condition_timed_wait(socket, G_IO_IN, wait_us, cancellable_, &error)) {
            // Readable: either stray bytes from the client or EOF
            const gssize n = g_input_stream_read(input, discard.data(), discard.size(),
                                                 cancellable_, &error);
            if (n <= 0) {
                g_clear_error(&error);
                break;
            }
            continue;
        }

        const bool timed_out = g_error_matches(error, G_IO_ERROR, G_IO_ERROR_TIMED_OUT);
        g_clear_error(&error);
        if (!timed_out) {
            break;  // Cancelled by stop() or socket error
        }
    }
    LOG_DEBUG("HttpServer", "Stream closed");
}

auto HttpServer::acquire_stream_slot() -> bool {
    std::lock_guard lock(connections_mutex_);
    if (active_streams_ >= options_.max_streams) {
        return false;
    }
    ++active_streams_;
    return true;
}

void HttpServer::release_stream_slot() {
    std::lock_guard lock(connections_mutex_);
    --active_streams_;
}

auto HttpServer::write_all(GOutputStream* output, std::string_view data) -> bool {
    GError* error = nullptr;
    gsize written = 0;
    if (!g_output_stream_write_all(output, data.data(), data.size(), &written, cancellable_,
                                   &error)) {
        LOG_DEBUG("HttpServer", std::format("Write failed: {}", take_error_message(error)));
        return false;
    }
    return true;
}

}  // namespace server
