/**
 * @file FileDescriptor.hpp
 * @brief RAII owner for POSIX file descriptors
 *
 * Used for the stdout/stderr pipes of spawned probe processes.
 */

#pragma once

#include <unistd.h>

#include <utility>

namespace util {

/**
 * @class FileDescriptor
 * @brief Closes the owned descriptor on destruction or reset
 */
class FileDescriptor {
public:
    FileDescriptor() noexcept = default;
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}

    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset(std::exchange(other.fd_, -1));
        }
        return *this;
    }

    [[nodiscard]] constexpr auto get() const noexcept -> int { return fd_; }

    [[nodiscard]] constexpr auto is_valid() const noexcept -> bool { return fd_ >= 0; }

    explicit operator bool() const noexcept { return is_valid(); }

    /**
     * @brief Close the current descriptor (if any) and take ownership of fd
     */
    void reset(int fd = -1) noexcept {
        if (is_valid()) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

}  // namespace util
