// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef PULLJSON_SLICE_H
#define PULLJSON_SLICE_H

#include <cassert>
#include <cstring>
#include <string>

namespace pulljson
{

// Non-owning view of a contiguous range of bytes
// Tokens produced by the tokenizer are Slices into the tokenizer's buffer, so
// they remain valid only until the next call that may refill the buffer.
class Slice final
{
public:
    constexpr Slice() = default;

    constexpr Slice(const char *data, size_t size)
        : m_data(data),
          m_size(size)
    {
        assert(m_data);
    }

    constexpr Slice(const char *data)
        : m_data(data)
    {
        assert(m_data);
        m_size = __builtin_strlen(m_data);
    }

    Slice(const std::string &str)
        : m_data(str.data()),
          m_size(str.size())
    {
    }

    [[nodiscard]] constexpr auto is_empty() const -> bool
    {
        return m_size == 0;
    }

    [[nodiscard]] constexpr auto data() const -> const char *
    {
        return m_data;
    }

    [[nodiscard]] constexpr auto size() const -> size_t
    {
        return m_size;
    }

    constexpr auto operator[](size_t index) const -> const char &
    {
        assert(index < m_size);
        return m_data[index];
    }

    [[nodiscard]] constexpr auto range(size_t offset, size_t size) const -> Slice
    {
        assert(offset <= m_size);
        assert(offset + size <= m_size);
        return {m_data + offset, size};
    }

    [[nodiscard]] constexpr auto range(size_t offset) const -> Slice
    {
        assert(offset <= m_size);
        return range(offset, m_size - offset);
    }

    constexpr auto clear() -> void
    {
        m_data = "";
        m_size = 0;
    }

    constexpr auto advance(size_t n = 1) -> Slice
    {
        assert(n <= m_size);
        m_data += n;
        m_size -= n;
        return *this;
    }

    constexpr auto truncate(size_t size) -> Slice
    {
        assert(size <= m_size);
        m_size = size;
        return *this;
    }

    [[nodiscard]] auto starts_with(const Slice &rhs) const -> bool
    {
        if (rhs.size() > m_size) {
            return false;
        }
        return std::memcmp(m_data, rhs.data(), rhs.size()) == 0;
    }

    [[nodiscard]] auto to_string() const -> std::string
    {
        return {m_data, m_size};
    }

private:
    const char *m_data = "";
    size_t m_size = 0;
};

inline auto operator==(const Slice &lhs, const Slice &rhs) -> bool
{
    return lhs.size() == rhs.size() && lhs.starts_with(rhs);
}

inline auto operator!=(const Slice &lhs, const Slice &rhs) -> bool
{
    return !(lhs == rhs);
}

} // namespace pulljson

#endif // PULLJSON_SLICE_H
