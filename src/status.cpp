// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "pulljson/status.h"
#include "status_internal.h"
#include <cstdlib>
#include <cstring>
#include <utility>

namespace pulljson
{

namespace
{

auto make_inline_state(Status::Code code, Status::SubCode subc) -> char *
{
    PULLJSON_EXPECT_GT(code, Status::kOK);
    PULLJSON_EXPECT_LT(code, Status::kMaxCode);
    PULLJSON_EXPECT_LT(subc, Status::kMaxSubCode);

    uintptr_t state = 1;
    state |= static_cast<uintptr_t>(code) << 1;
    state |= static_cast<uintptr_t>(subc) << 8;
    return reinterpret_cast<char *>(state);
}

auto is_inline(const char *state) -> bool
{
    static constexpr uintptr_t kInlineBit = 0x0001;
    return reinterpret_cast<uintptr_t>(state) & kInlineBit;
}

auto is_heap(const char *state) -> bool
{
    return state && !is_inline(state);
}

auto inline_code(const char *state) -> Status::Code
{
    static constexpr uintptr_t kCodeMask = 0x00FE;
    return static_cast<Status::Code>(
        (reinterpret_cast<uintptr_t>(state) & kCodeMask) >> 1);
}

auto inline_subcode(const char *state) -> Status::SubCode
{
    static constexpr uintptr_t kSubCodeMask = 0xFF00;
    return static_cast<Status::SubCode>(
        (reinterpret_cast<uintptr_t>(state) & kSubCodeMask) >> 8);
}

auto heap_header(char *state) -> HeapStatusHdr *
{
    return reinterpret_cast<HeapStatusHdr *>(state);
}

auto heap_message(const char *state) -> const char *
{
    return state + sizeof(HeapStatusHdr);
}

auto incref(char *state) -> int
{
    if (is_heap(state)) {
        auto *hdr = heap_header(state);
        if (hdr->refs == UINT16_MAX) {
            return -1;
        }
        ++hdr->refs;
    }
    return 0;
}

auto decref(char *state) -> void
{
    if (is_heap(state)) {
        auto *hdr = heap_header(state);
        PULLJSON_EXPECT_GT(hdr->refs, 0);
        if (--hdr->refs == 0) {
            std::free(state);
        }
    }
}

} // namespace

auto StatusBuilder::build() -> Status
{
    const auto total = sizeof(HeapStatusHdr) + m_message.size() + 1;
    auto *state = static_cast<char *>(std::malloc(total));
    if (state == nullptr) {
        return Status(m_code, m_subc);
    }
    PULLJSON_EXPECT_FALSE(is_inline(state));
    const HeapStatusHdr hdr = {1, m_code, m_subc};
    std::memcpy(state, &hdr, sizeof(hdr));
    std::memcpy(state + sizeof(hdr), m_message.c_str(), m_message.size() + 1);
    return Status(state);
}

Status::Status(Code code, SubCode subc)
    : m_state(make_inline_state(code, subc))
{
}

Status::~Status()
{
    decref(m_state);
}

Status::Status(const Status &rhs)
    : m_state(rhs.m_state)
{
    if (incref(m_state)) {
        m_state = make_inline_state(rhs.code(), rhs.subcode());
    }
}

auto Status::operator=(const Status &rhs) -> Status &
{
    if (&rhs != this) {
        decref(m_state);
        m_state = incref(rhs.m_state)
                      ? make_inline_state(rhs.code(), rhs.subcode())
                      : rhs.m_state;
    }
    return *this;
}

Status::Status(Status &&rhs) noexcept
    : m_state(std::exchange(rhs.m_state, nullptr))
{
}

auto Status::operator=(Status &&rhs) noexcept -> Status &
{
    auto *state = std::exchange(m_state, rhs.m_state);
    rhs.m_state = state;
    return *this;
}

auto Status::code() const -> Code
{
    if (is_ok()) {
        return kOK;
    } else if (is_inline(m_state)) {
        return inline_code(m_state);
    } else {
        return heap_header(m_state)->code;
    }
}

auto Status::subcode() const -> SubCode
{
    if (is_ok()) {
        return kNone;
    } else if (is_inline(m_state)) {
        return inline_subcode(m_state);
    } else {
        return heap_header(m_state)->subc;
    }
}

auto Status::message() const -> const char *
{
    if (is_heap(m_state)) {
        return heap_message(m_state);
    }
    switch (subcode()) {
        case kEndOfInput:
            return "I/O error: end of input";
        case kBufferExceeded:
            return "aborted: buffer exceeded";
        case kBadComma:
            return "corruption: unexpected comma";
        case kNoComma:
            return "corruption: expected comma";
        case kBadArrayEnding:
            return "corruption: unexpected array ending";
        case kBadObjectEnding:
            return "corruption: unexpected object ending";
        case kBadObjectKey:
            return "corruption: bad object key";
        case kBadObjectDeclaration:
            return "corruption: bad object declaration";
        case kUnexpectedNul:
            return "corruption: unexpected NUL character";
        case kUnexpectedCharacter:
            return "corruption: unexpected character";
        default:
            break;
    }
    switch (code()) {
        case Status::kOK:
            return "OK";
        case Status::kInvalidArgument:
            return "invalid argument";
        case Status::kIOError:
            return "I/O error";
        case Status::kCorruption:
            return "corruption";
        case Status::kNotFound:
            return "not found";
        case Status::kAborted:
            return "aborted";
        default:
            // Not reachable unless a constructor taking a Code is exposed.
            PULLJSON_DEBUG_TRAP;
            return "unrecognized code";
    }
}

auto Status::invalid_argument(const char *msg) -> Status
{
    return StatusBuilder(kInvalidArgument)
        .append(msg)
        .build();
}

auto Status::corruption(const char *msg) -> Status
{
    return StatusBuilder(kCorruption)
        .append(msg)
        .build();
}

auto Status::not_found(const char *msg) -> Status
{
    return StatusBuilder(kNotFound)
        .append(msg)
        .build();
}

auto Status::io_error(const char *msg) -> Status
{
    return StatusBuilder(kIOError)
        .append(msg)
        .build();
}

auto Status::aborted(const char *msg) -> Status
{
    return StatusBuilder(kAborted)
        .append(msg)
        .build();
}

auto Status::end_of_input(const char *msg) -> Status
{
    return StatusBuilder(kIOError, kEndOfInput)
        .append(msg)
        .build();
}

auto Status::buffer_exceeded(const char *msg) -> Status
{
    return StatusBuilder(kAborted, kBufferExceeded)
        .append(msg)
        .build();
}

auto Status::syntax_error(SubCode subc, const char *msg) -> Status
{
    PULLJSON_EXPECT_GE(subc, kBadComma);
    PULLJSON_EXPECT_LE(subc, kUnexpectedCharacter);
    return StatusBuilder(kCorruption, subc)
        .append(msg)
        .build();
}

} // namespace pulljson
