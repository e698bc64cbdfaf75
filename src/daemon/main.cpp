/**
 * @file main.cpp
 * @brief drivewatchd: polls smartctl and serves normalized telemetry over HTTP
 *
 * Startup order: options, logging, HTTP server, poller (first cycle starts
 * at once). The GMainLoop dispatches incoming connections and
 * SIGINT/SIGTERM; shutdown stops the server before the poller.
 */

#include "server/ApiRouter.hpp"
#include "server/DaemonOptions.hpp"
#include "server/HttpServer.hpp"
#include "services/DeviceEnumerator.hpp"
#include "services/DeviceReader.hpp"
#include "services/ProbeExecutor.hpp"
#include "services/SnapshotPoller.hpp"
#include "services/SnapshotStore.hpp"
#include "services/VolumeCollector.hpp"
#include "util/Logger.hpp"

#include <glib-unix.h>
#include <glib.h>

#include <csignal>
#include <format>
#include <iostream>
#include <memory>

namespace {

constexpr auto APP_NAME = "drivewatchd";

auto on_quit_signal(gpointer user_data) -> gboolean {
    LOG_INFO("Daemon", "Shutdown requested");
    g_main_loop_quit(static_cast<GMainLoop*>(user_data));
    return G_SOURCE_CONTINUE;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto options = server::parse_daemon_options(argc, argv);
    if (!options) {
        std::cerr << "Error: " << options.error().message << "\n"
                  << "Run with --help for usage.\n";
        return 1;
    }
    if (options->show_help) {
        server::print_daemon_help();
        return 0;
    }
    if (options->show_version) {
        server::print_daemon_version();
        return 0;
    }

    // Peers closing a stream mid-write must not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    auto& logger = util::Logger::instance();
    logger.set_console_output(options->verbose);
    if (!logger.initialize(options->log_dir, APP_NAME, options->log_level)) {
        std::cerr << "Warning: cannot write logs to " << options->log_dir.string() << "\n";
    }
    for (const auto& warning : options->warnings) {
        LOG_WARNING("Daemon", warning);
    }
    LOG_INFO("Daemon", std::format("Starting, smartctl '{}', timeout {} s",
                                   options->smartctl_path, options->probe_timeout.count()));

    auto executor =
        std::make_shared<ProbeExecutor>(options->smartctl_path, options->probe_timeout);
    auto store = std::make_shared<SnapshotStore>();
    auto poller = std::make_shared<SnapshotPoller>(
        std::make_shared<DeviceEnumerator>(executor), std::make_shared<DeviceReader>(executor),
        options->collect_volumes ? std::make_shared<VolumeCollector>() : nullptr, store,
        PollerOptions{.interval = options->poll_interval,
                      .parallel_probes = options->parallel_probes});

    GMainLoop* loop = g_main_loop_new(nullptr, FALSE);

    auto router = std::make_shared<server::ApiRouter>(store, poller);
    server::HttpServer http_server(router, options->server);
    if (auto started = http_server.start(); !started) {
        LOG_ERROR("Daemon", started.error().message);
        std::cerr << "Error: " << started.error().message << "\n";
        g_main_loop_unref(loop);
        logger.shutdown();
        return 1;
    }

    poller->start();

    const guint sigint_id = g_unix_signal_add(SIGINT, on_quit_signal, loop);
    const guint sigterm_id = g_unix_signal_add(SIGTERM, on_quit_signal, loop);

    g_main_loop_run(loop);

    g_source_remove(sigint_id);
    g_source_remove(sigterm_id);

    http_server.stop();
    poller->stop();
    g_main_loop_unref(loop);

    LOG_INFO("Daemon", "Stopped");
    logger.shutdown();
    return 0;
}
