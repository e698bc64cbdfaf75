/**
 * @file IProbeExecutor.hpp
 * @brief Capability interface for running the external diagnostic tool
 *
 * Readers and the enumerator only see this interface, so they can be
 * exercised against canned tool output in tests.
 */

#pragma once

#include "util/Error.hpp"

#include <expected>
#include <string>
#include <utility>
#include <vector>

/**
 * @enum ProbeErrorCode
 * @brief util::Error::code values reported by IProbeExecutor::run
 */
enum class ProbeErrorCode {
    LAUNCH_FAILED = 1,  ///< Process could not be started
    TOOL_NOT_FOUND,     ///< Executable missing from the path
    TIMED_OUT,          ///< Killed after exceeding the execution timeout
    IO_FAILED,          ///< Reading the child's output or status failed
    KILLED_BY_SIGNAL    ///< Process died from a signal it did not get from us
};

/**
 * @struct ProbeOutput
 * @brief Everything a finished process produced; never interpreted here
 */
struct ProbeOutput {
    int exit_status = 0;  ///< Exit code of a process that exited normally
    std::string stdout_text;
    std::string stderr_text;
};

/**
 * @class IProbeExecutor
 * @brief Runs the diagnostic tool with an argument list, bounded by a timeout
 */
class IProbeExecutor {
public:
    virtual ~IProbeExecutor() = default;

    /**
     * @brief Run the tool and collect its output
     * @param args Arguments, not including the executable itself
     * @return Output of the finished process, or an error whose code is a ProbeErrorCode
     *
     * A non-zero exit status is not an error at this level.
     */
    [[nodiscard]] virtual auto run(const std::vector<std::string>& args)
        -> std::expected<ProbeOutput, util::Error> = 0;
};

[[nodiscard]] inline auto probe_error(ProbeErrorCode code, std::string message) -> util::Error {
    return util::Error{std::move(message), static_cast<int>(code)};
}

[[nodiscard]] inline auto has_probe_code(const util::Error& error, ProbeErrorCode code) -> bool {
    return error.code == static_cast<int>(code);
}
