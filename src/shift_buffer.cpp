// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "pulljson/shift_buffer.h"
#include "internal.h"
#include "pulljson/reader.h"
#include <cstring>

namespace pulljson
{

SliceBuffer::SliceBuffer(const Slice &input, const Options &)
{
    m_data = input.data();
    m_end = input.size();
}

auto SliceBuffer::err() const -> Status
{
    if (m_pos + m_len >= m_end) {
        return Status::end_of_input();
    }
    return Status::ok();
}

ReaderBuffer::ReaderBuffer(Reader &reader, const Options &options)
    : m_reader(&reader)
{
    const auto sanitized = sanitize_options(options);
    m_capacity = sanitized.min_buffer_size;
    m_max_capacity = sanitized.max_buffer_size;
    m_storage.reset(new char[m_capacity]);
    m_data = m_storage.get();
}

auto ReaderBuffer::err() const -> Status
{
    // A failed read is reported once the bytes read before it are used up.
    // A lexeme that does not fit is the lexeme's own failure.
    if (!m_status.is_buffer_exceeded() && m_pos + m_len < m_end) {
        return Status::ok();
    }
    return m_status;
}

// Move the unconsumed bytes to the front of a (possibly larger) array.
auto ReaderBuffer::grow(size_t capacity) -> void
{
    PULLJSON_EXPECT_GE(capacity, m_capacity);
    const auto keep = m_end - m_pos;
    if (capacity > m_capacity) {
        std::unique_ptr<char[]> storage(new char[capacity]);
        std::memcpy(storage.get(), m_storage.get() + m_pos, keep);
        m_storage = std::move(storage);
        m_capacity = capacity;
    } else if (m_pos > 0) {
        std::memmove(m_storage.get(), m_storage.get() + m_pos, keep);
    }
    m_data = m_storage.get();
    m_base += m_pos;
    m_end = keep;
    m_pos = 0;
}

auto ReaderBuffer::refill(size_t i) -> char
{
    // Number of bytes, starting at the lexeme, that must be present.
    const auto need = m_len + i + 1;
    while (m_status.is_ok()) {
        const auto keep = m_end - m_pos;
        auto capacity = m_capacity;
        if (2 * keep > capacity || need > capacity) {
            while ((2 * keep > capacity || need > capacity) && 2 * capacity <= m_max_capacity) {
                capacity *= 2;
            }
            if (need > capacity) {
                m_status = Status::buffer_exceeded();
                return '\0';
            }
        }
        grow(capacity);

        Slice out;
        auto *scratch = m_storage.get() + m_end;
        auto s = m_reader->read(m_capacity - m_end, scratch, &out);
        if (!out.is_empty()) {
            if (out.data() != scratch) {
                std::memmove(scratch, out.data(), out.size());
            }
            m_end += out.size();
        }
        if (!s.is_ok()) {
            m_status = std::move(s);
        }

        const auto index = m_pos + m_len + i;
        if (index < m_end) {
            return m_data[index];
        } else if (out.is_empty()) {
            // The reader made no progress. Let the caller try again later.
            break;
        }
    }
    return '\0';
}

} // namespace pulljson
