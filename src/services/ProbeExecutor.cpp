/**
 * @file ProbeExecutor.cpp
 * @brief Bounded execution of the diagnostic tool
 */

#include "services/ProbeExecutor.hpp"

#include "util/FileDescriptor.hpp"
#include "util/Logger.hpp"

#include <glib.h>

#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <thread>
#include <utility>

namespace {

using Clock = std::chrono::steady_clock;

constexpr size_t READ_CHUNK_SIZE = 64 * 1024;
constexpr auto REAP_POLL_INTERVAL = std::chrono::milliseconds{10};

auto join_args(const std::string& tool, const std::vector<std::string>& args) -> std::string {
    std::string joined = tool;
    for (const auto& arg : args) {
        joined += ' ';
        joined += arg;
    }
    return joined;
}


auto remaining_ms(Clock::time_point deadline) -> int {
    const auto left =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

/**
 * Append a chunk to a captured stream, dropping anything past the cap
 */
void append_capped(std::string& target, const char* data, size_t size) {
    if (target.size() >= ProbeExecutor::MAX_OUTPUT_BYTES) {
        return;
    }
    target.append(data, std::min(size, ProbeExecutor::MAX_OUTPUT_BYTES - target.size()));
}

/**
 * Kill and reap a child that is still running
 */
void kill_and_reap(GPid pid) {
    ::kill(pid, SIGKILL);
    int wait_status = 0;
    while (::waitpid(pid, &wait_status, 0) < 0 && errno == EINTR) {
    }
}

}  // namespace

ProbeExecutor::ProbeExecutor(std::string tool_path, std::chrono::milliseconds timeout)
    : tool_path_(std::move(tool_path)), timeout_(timeout) {}

auto ProbeExecutor::run(const std::vector<std::string>& args)
    -> std::expected<ProbeOutput, util::Error> {
    const auto command_line = join_args(tool_path_, args);
    LOG_DEBUG("ProbeExecutor", std::format("Running: {}", command_line));

    std::vector<gchar*> argv_vec;
    argv_vec.reserve(args.size() + 2);
    argv_vec.push_back(const_cast<gchar*>(tool_path_.c_str()));
    for (const auto& arg : args) {
        argv_vec.push_back(const_cast<gchar*>(arg.c_str()));
    }
    argv_vec.push_back(nullptr);

    gint stdout_raw = -1;
    gint stderr_raw = -1;
    GPid child_pid = 0;
    GError* error = nullptr;

    const gboolean spawned = g_spawn_async_with_pipes(
        nullptr,  // working directory
        argv_vec.data(),
        nullptr,  // environment (inherit)
        static_cast<GSpawnFlags>(G_SPAWN_SEARCH_PATH | G_SPAWN_DO_NOT_REAP_CHILD |
                                 G_SPAWN_CLOEXEC_PIPES),
        nullptr,  // child setup
        nullptr,  // user data
        &child_pid,
        nullptr,  // stdin
        &stdout_raw,
        &stderr_raw,
        &error);

    if (!spawned) {
        const bool not_found = error != nullptr &&
                               (g_error_matches(error, G_SPAWN_ERROR, G_SPAWN_ERROR_NOENT) ||
                                g_error_matches(error, G_SPAWN_ERROR, G_SPAWN_ERROR_NOTDIR));
        auto message = std::format("Failed to start {}: {}", tool_path_,
                                   error != nullptr ? error->message : "unknown error");
        g_clear_error(&error);
        LOG_WARNING("ProbeExecutor", message);
        return std::unexpected(probe_error(
            not_found ? ProbeErrorCode::TOOL_NOT_FOUND : ProbeErrorCode::LAUNCH_FAILED,
            std::move(message)));
    }

    util::FileDescriptor stdout_fd{stdout_raw};
    util::FileDescriptor stderr_fd{stderr_raw};
    const auto deadline = Clock::now() + timeout_;

    ProbeOutput output;
    std::array<char, READ_CHUNK_SIZE> buffer{};
    bool io_failed = false;
    bool timed_out = false;
    int io_errno = 0;

    // Drain both pipes together so a child filling stderr cannot stall on a full pipe
    while (stdout_fd || stderr_fd) {
        std::array<pollfd, 2> fds{};
        std::array<std::pair<util::FileDescriptor*, std::string*>, 2> targets{};
        nfds_t count = 0;
        if (stdout_fd) {
            fds[count] = pollfd{.fd = stdout_fd.get(), .events = POLLIN, .revents = 0};
            targets[count++] = {&stdout_fd, &output.stdout_text};
        }
        if (stderr_fd) {
            fds[count] = pollfd{.fd = stderr_fd.get(), .events = POLLIN, .revents = 0};
            targets[count++] = {&stderr_fd, &output.stderr_text};
        }

        const int wait_ms = remaining_ms(deadline);
        if (wait_ms == 0) {
            timed_out = true;
            break;
        }

        const int ready = ::poll(fds.data(), count, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            io_failed = true;
            io_errno = errno;
            break;
        }
        if (ready == 0) {
            timed_out = true;
            break;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            auto& [fd, text] = targets[i];
            const auto n = ::read(fd->get(), buffer.data(), buffer.size());
            if (n > 0) {
                append_capped(*text, buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                fd->reset();
            }
        }
    }

    stdout_fd.reset();
    stderr_fd.reset();

    if (timed_out || io_failed) {
        kill_and_reap(child_pid);
        g_spawn_close_pid(child_pid);
        if (timed_out) {
            auto message = std::format("{} timed out after {} ms", command_line, timeout_.count());
            LOG_WARNING("ProbeExecutor", message);
            return std::unexpected(probe_error(ProbeErrorCode::TIMED_OUT, std::move(message)));
        }
        return std::unexpected(probe_error(
            ProbeErrorCode::IO_FAILED,
            std::format("Reading output of {} failed: {}", command_line, std::strerror(io_errno))));
    }

    // Both pipes are closed; the child may still be exiting
    int wait_status = 0;
    while (true) {
        const pid_t result = ::waitpid(child_pid, &wait_status, WNOHANG);
        if (result == child_pid) {
            break;
        }
        if (result < 0 && errno != EINTR) {
            g_spawn_close_pid(child_pid);
            return std::unexpected(probe_error(
                ProbeErrorCode::IO_FAILED,
                std::format("waitpid for {} failed: {}", command_line, std::strerror(errno))));
        }
        if (remaining_ms(deadline) == 0) {
            kill_and_reap(child_pid);
            g_spawn_close_pid(child_pid);
            auto message = std::format("{} did not exit within {} ms", command_line,
                                       timeout_.count());
            LOG_WARNING("ProbeExecutor", message);
            return std::unexpected(probe_error(ProbeErrorCode::TIMED_OUT, std::move(message)));
        }
        std::this_thread::sleep_for(REAP_POLL_INTERVAL);
    }
    g_spawn_close_pid(child_pid);

    if (!WIFEXITED(wait_status)) {
        auto message = WIFSIGNALED(wait_status)
                           ? std::format("{} was killed by signal {}", command_line,
                                         WTERMSIG(wait_status))
                           : std::format("{} ended with wait status {:#x}", command_line,
                                         wait_status);
        LOG_WARNING("ProbeExecutor", message);
        return std::unexpected(probe_error(ProbeErrorCode::KILLED_BY_SIGNAL, std::move(message)));
    }

    output.exit_status = WEXITSTATUS(wait_status);
    LOG_DEBUG("ProbeExecutor", std::format("{} exited with status {} ({} bytes of output)",
                                           command_line, output.exit_status,
                                           output.stdout_text.size()));
    return output;
}
