/**
 * @file ProbeExecutor.hpp
 * @brief IProbeExecutor implementation spawning the tool through GLib
 */

#pragma once

#include "services/IProbeExecutor.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

class ProbeExecutor : public IProbeExecutor {
public:
    static constexpr auto DEFAULT_TIMEOUT = std::chrono::seconds{20};
    static constexpr size_t MAX_OUTPUT_BYTES = 4 * 1024 * 1024;  ///< Per stream; excess is discarded

    /**
     * @param tool_path Executable name (looked up in PATH) or absolute path
     * @param timeout Upper bound for one invocation, including process exit
     */
    explicit ProbeExecutor(std::string tool_path,
                           std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);
    ~ProbeExecutor() override = default;

    ProbeExecutor(const ProbeExecutor&) = delete;
    ProbeExecutor& operator=(const ProbeExecutor&) = delete;

    [[nodiscard]] auto run(const std::vector<std::string>& args)
        -> std::expected<ProbeOutput, util::Error> override;

    [[nodiscard]] auto tool_path() const -> const std::string& { return tool_path_; }
    [[nodiscard]] auto timeout() const -> std::chrono::milliseconds { return timeout_; }

private:
    std::string tool_path_;
    std::chrono::milliseconds timeout_;
};
