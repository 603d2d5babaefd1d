//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MQDEVD_COMMON_IO_HPP_INCLUDED
#define MQDEVD_COMMON_IO_HPP_INCLUDED

#include <cstddef>
#include <utility>

namespace mqdevd
{
namespace common
{
namespace io
{

/// RAII wrapper for a file descriptor.
///
class OwnFd final
{
public:
    OwnFd()
        : fd_{-1}
    {
    }

    explicit OwnFd(const int fd)
        : fd_{fd}
    {
    }

    OwnFd(OwnFd&& other) noexcept
        : fd_{std::exchange(other.fd_, -1)}
    {
    }

    OwnFd& operator=(OwnFd&& other) noexcept
    {
        const OwnFd old{std::move(*this)};
        fd_ = std::exchange(other.fd_, -1);
        return *this;
    }

    OwnFd& operator=(std::nullptr_t)
    {
        const OwnFd old{std::move(*this)};
        return *this;
    }

    // Disallow copy.
    OwnFd(const OwnFd&)            = delete;
    OwnFd& operator=(const OwnFd&) = delete;

    int get() const noexcept
    {
        return fd_;
    }

    /// Closes the descriptor explicitly.
    ///
    /// @return Zero on success, otherwise `errno` of the failed `close`.
    ///         Unlike `reset`, the failure is reported to the caller (f.e. delayed write errors).
    ///
    int close() noexcept;

    void reset() noexcept;

    ~OwnFd();

private:
    int fd_;

};  // OwnFd

}  // namespace io
}  // namespace common
}  // namespace mqdevd

#endif  // MQDEVD_COMMON_IO_HPP_INCLUDED
