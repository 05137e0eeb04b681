// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef PULLJSON_STATUS_INTERNAL_H
#define PULLJSON_STATUS_INTERNAL_H

#include "internal.h"
#include "pulljson/slice.h"
#include "pulljson/status.h"
#include <spdlog/fmt/fmt.h>
#include <string>

namespace pulljson
{

struct HeapStatusHdr {
    uint16_t refs;
    Status::Code code;
    Status::SubCode subc;
};

static_assert(sizeof(HeapStatusHdr) == sizeof(uint32_t));

// Helper for creating Status objects that carry a message
// A failure status is either inline or heap-allocated. Inline statuses keep
// the code and subcode packed into the state pointer value and cannot hold a
// message. Heap statuses store their fields followed by a NULL-terminated
// message:
//
//      Offset | Size | Field
//     --------|------|----------
//      0      | 2    | Refcount
//      2      | 1    | Code
//      3      | 1    | SubCode
//      4      | N    | Message
//
// The least-significant bit of the state pointer distinguishes the two: it is
// always set for inline statuses and never set for addresses returned by
// std::malloc().
class StatusBuilder final
{
    std::string m_message;
    const Status::Code m_code;
    const Status::SubCode m_subc;

public:
    explicit StatusBuilder(Status::Code code, Status::SubCode subc = Status::kNone)
        : m_code(code),
          m_subc(subc)
    {
    }

    [[nodiscard]] auto append(const Slice &s) -> StatusBuilder &
    {
        m_message.append(s.data(), s.size());
        return *this;
    }

    [[nodiscard]] auto append(char c) -> StatusBuilder &
    {
        m_message.push_back(c);
        return *this;
    }

    template <class... Args>
    [[nodiscard]] auto append_format(const char *format, Args &&...args) -> StatusBuilder &
    {
        m_message.append(fmt::format(fmt::runtime(format), std::forward<Args>(args)...));
        return *this;
    }

    // Falls back to an inline status if the allocation fails.
    auto build() -> Status;

    template <class... Args>
    static auto invalid_argument(const char *format, Args &&...args) -> Status
    {
        return StatusBuilder(Status::kInvalidArgument)
            .append_format(format, std::forward<Args>(args)...)
            .build();
    }

    template <class... Args>
    static auto corruption(Status::SubCode subc, const char *format, Args &&...args) -> Status
    {
        return StatusBuilder(Status::kCorruption, subc)
            .append_format(format, std::forward<Args>(args)...)
            .build();
    }

    template <class... Args>
    static auto io_error(const char *format, Args &&...args) -> Status
    {
        return StatusBuilder(Status::kIOError)
            .append_format(format, std::forward<Args>(args)...)
            .build();
    }

    template <class... Args>
    static auto not_found(const char *format, Args &&...args) -> Status
    {
        return StatusBuilder(Status::kNotFound)
            .append_format(format, std::forward<Args>(args)...)
            .build();
    }
};

} // namespace pulljson

#endif // PULLJSON_STATUS_INTERNAL_H
