// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "internal.h"
#include "pulljson/reader.h"
#include "status_internal.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace pulljson
{

namespace
{

constexpr size_t kInterruptTimeout = 100;

[[nodiscard]] auto posix_error(int error, const char *filename) -> Status
{
    PULLJSON_EXPECT_NE(error, 0);
    switch (error) {
        case ENOENT:
            return StatusBuilder::not_found("{}: {}", filename, std::strerror(error));
        case EACCES:
        case EISDIR:
        case ENAMETOOLONG:
        case ENOTDIR:
            return StatusBuilder::invalid_argument("{}: {}", filename, std::strerror(error));
        default:
            return StatusBuilder::io_error("{}: {}", filename, std::strerror(error));
    }
}

[[nodiscard]] auto posix_open(const char *filename) -> int
{
    for (size_t t = 0; t < kInterruptTimeout; ++t) {
        const auto fd = ::open(filename, O_RDONLY | O_CLOEXEC);
        if (fd < 0 && errno == EINTR) {
            continue;
        }
        return fd;
    }
    return -1;
}

auto posix_close(int fd) -> int
{
    for (size_t t = 0; t < kInterruptTimeout; ++t) {
        const auto rc = ::close(fd);
        if (rc < 0 && errno == EINTR) {
            continue;
        }
        return rc;
    }
    return -1;
}

// Unlike a database page read, a short read is fine here: the buffer asks for
// more when it needs it.
[[nodiscard]] auto posix_read(int fd, size_t size, char *scratch) -> ssize_t
{
    for (;;) {
        const auto n = ::read(fd, scratch, size);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return n;
    }
}

class PosixReader : public Reader
{
public:
    explicit PosixReader(std::string filename, int fd)
        : m_filename(std::move(filename)),
          m_fd(fd)
    {
    }

    ~PosixReader() override
    {
        posix_close(m_fd);
    }

    auto read(size_t size, char *scratch, Slice *out) -> Status override
    {
        PULLJSON_EXPECT_NE(out, nullptr);
        out->clear();
        const auto n = posix_read(m_fd, size, scratch);
        if (n < 0) {
            return posix_error(errno, m_filename.c_str());
        } else if (n == 0 && size > 0) {
            return Status::end_of_input();
        }
        *out = Slice(scratch, static_cast<size_t>(n));
        return Status::ok();
    }

private:
    const std::string m_filename;
    const int m_fd;
};

} // namespace

auto new_file_reader(const char *filename, Reader *&out) -> Status
{
    out = nullptr;
    const auto fd = posix_open(filename);
    if (fd < 0) {
        return posix_error(errno, filename);
    }
    out = new PosixReader(filename, fd);
    return Status::ok();
}

} // namespace pulljson
