//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "io.hpp"

#include "logging.hpp"

#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <utility>

namespace mqdevd
{
namespace common
{
namespace io
{

int OwnFd::close() noexcept
{
    const int fd = std::exchange(fd_, -1);
    if (fd < 0)
    {
        return EBADF;
    }

    // Do not use `posixSyscallError` here b/c `close` should not be repeated on `EINTR`.
    if (::close(fd) < 0)
    {
        return errno;
    }
    return 0;
}

void OwnFd::reset() noexcept
{
    if (fd_ >= 0)
    {
        const int fd = fd_;
        if (const int err = close())
        {
            getLogger("io")->error("Failed to close file descriptor {}: {}.", fd, std::strerror(err));
        }
    }
}

OwnFd::~OwnFd()
{
    reset();
}

}  // namespace io
}  // namespace common
}  // namespace mqdevd
