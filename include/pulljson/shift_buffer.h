// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef PULLJSON_SHIFT_BUFFER_H
#define PULLJSON_SHIFT_BUFFER_H

#include "options.h"
#include "slice.h"
#include "status.h"
#include <cassert>
#include <cstddef>
#include <memory>

namespace pulljson
{

class Reader;

// Window over a byte sequence with a "current lexeme" cursor
// The lexeme starts at pos and has length n. Scanners extend the lexeme with
// move() after inspecting bytes with peek(), then either shift() it out as a
// token or skip() it. Backtracking is done by remembering pos() and calling
// rewind().
//
// This class holds the window state shared by the concrete buffers below. It
// has no virtual functions: the tokenizer takes the concrete buffer type as a
// template parameter.
class ShiftBuffer
{
public:
    // Extend the lexeme by "k" bytes. "k" may be negative.
    auto move(ptrdiff_t k) -> void
    {
        assert(k >= 0 || static_cast<size_t>(-k) <= m_len);
        m_len = static_cast<size_t>(static_cast<ptrdiff_t>(m_len) + k);
    }

    // Set the lexeme length to "n"
    auto move_to(size_t n) -> void
    {
        m_len = n;
    }

    // Length of the current lexeme
    [[nodiscard]] auto pos() const -> size_t
    {
        return m_len;
    }

    // Restore the lexeme length recorded by an earlier call to pos()
    auto rewind(size_t mark) -> void
    {
        assert(mark <= m_len);
        m_len = mark;
    }

    [[nodiscard]] auto lexeme() const -> Slice
    {
        return Slice(m_data + m_pos, m_len);
    }

    // Return the current lexeme and start a new, empty one right after it
    auto shift() -> Slice
    {
        const auto out = lexeme();
        skip();
        return out;
    }

    // Discard the current lexeme
    auto skip() -> void
    {
        m_pos += m_len;
        m_len = 0;
    }

    // Absolute position of the start of the lexeme within the whole input
    [[nodiscard]] auto offset() const -> size_t
    {
        return m_base + m_pos;
    }

    // Absolute position of the first byte still held by the buffer
    // Always 0 for an in-memory buffer.
    [[nodiscard]] auto base_offset() const -> size_t
    {
        return m_base;
    }

    // All bytes currently held by the buffer
    [[nodiscard]] auto window() const -> Slice
    {
        return Slice(m_data, m_end);
    }

protected:
    explicit ShiftBuffer() = default;
    ~ShiftBuffer() = default;

    ShiftBuffer(ShiftBuffer &&) noexcept = default;
    auto operator=(ShiftBuffer &&) noexcept -> ShiftBuffer & = default;

    const char *m_data = "";
    size_t m_end = 0;
    size_t m_pos = 0;
    size_t m_len = 0;
    size_t m_base = 0;
};

// ShiftBuffer over a complete, caller-owned byte slice
class SliceBuffer : public ShiftBuffer
{
public:
    using Source = const Slice &;

    // "options" only affects reader-backed buffers. It is accepted here so that
    // both buffers can be constructed the same way.
    explicit SliceBuffer(const Slice &input, const Options &options = Options());

    SliceBuffer(const SliceBuffer &) = delete;
    auto operator=(const SliceBuffer &) -> SliceBuffer & = delete;
    SliceBuffer(SliceBuffer &&) noexcept = default;
    auto operator=(SliceBuffer &&) noexcept -> SliceBuffer & = default;

    // Return the byte "i" positions past the end of the lexeme, or '\0' if
    // that position is past the end of the input.
    [[nodiscard]] auto peek(size_t i) const -> char
    {
        const auto index = m_pos + m_len + i;
        return index < m_end ? m_data[index] : '\0';
    }

    // Status::end_of_input() once the lexeme reaches the end of the input,
    // OK otherwise.
    [[nodiscard]] auto err() const -> Status;

    [[nodiscard]] auto is_eof() const -> bool
    {
        return true;
    }

    // The input is never modified, so there is nothing to restore.
    auto restore() -> void
    {
    }
};

// ShiftBuffer that pulls bytes from a Reader into an owned, growable array
// The array starts at Options::min_buffer_size bytes and doubles when the
// bytes that must be kept take up more than half of it, up to
// Options::max_buffer_size. A lexeme that cannot fit latches
// Status::buffer_exceeded().
class ReaderBuffer : public ShiftBuffer
{
public:
    using Source = Reader &;

    // "reader" must outlive the buffer.
    explicit ReaderBuffer(Reader &reader, const Options &options = Options());

    ReaderBuffer(const ReaderBuffer &) = delete;
    auto operator=(const ReaderBuffer &) -> ReaderBuffer & = delete;
    ReaderBuffer(ReaderBuffer &&) noexcept = default;
    auto operator=(ReaderBuffer &&) noexcept -> ReaderBuffer & = default;

    // Return the byte "i" positions past the end of the lexeme, reading more
    // input if necessary. Returns '\0' once the reader is exhausted or has
    // failed, or if the lexeme plus lookahead exceeds the maximum capacity.
    [[nodiscard]] auto peek(size_t i) -> char
    {
        const auto index = m_pos + m_len + i;
        if (index < m_end) {
            return m_data[index];
        }
        return refill(i);
    }

    // Errors from the reader, including end-of-input, are reported only after
    // every buffered byte has been consumed. Status::buffer_exceeded() is
    // reported immediately.
    [[nodiscard]] auto err() const -> Status;

    // True once the reader has reported end-of-input
    [[nodiscard]] auto is_eof() const -> bool
    {
        return m_status.is_end_of_input();
    }

    // The buffer owns its bytes, so there is nothing to restore.
    auto restore() -> void
    {
    }

    [[nodiscard]] auto capacity() const -> size_t
    {
        return m_capacity;
    }

private:
    auto refill(size_t i) -> char;
    auto grow(size_t capacity) -> void;

    std::unique_ptr<char[]> m_storage;
    Status m_status;
    Reader *m_reader;
    size_t m_capacity;
    size_t m_max_capacity;
};

} // namespace pulljson

#endif // PULLJSON_SHIFT_BUFFER_H
