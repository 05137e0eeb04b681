// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.
//
// Some code was modified from https://github.com/CodeIntelligenceTesting/cifuzz.

#ifndef PULLJSON_FUZZERS_FUZZER_H
#define PULLJSON_FUZZERS_FUZZER_H

#include "pulljson/slice.h"
#include <climits>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <type_traits>

namespace pulljson
{

#define CHECK_TRUE(cond)                                 \
    do {                                                 \
        if (!(cond)) {                                   \
            std::cerr << "expected `" << #cond << "`\n"; \
            std::abort();                                \
        }                                                \
    } while (0)

#define CHECK_FALSE(cond) \
    CHECK_TRUE(!(cond))

#define CHECK_EQ(lhs, rhs)                                                                             \
    do {                                                                                               \
        if ((lhs) != (rhs)) {                                                                          \
            std::cerr << "expected `" << #lhs "` (" << (lhs) << ") == `" #rhs "` (" << (rhs) << ")\n"; \
            std::abort();                                                                              \
        }                                                                                              \
    } while (0)

class FuzzedInputProvider
{
    const uint8_t *m_ptr;
    size_t m_len;

public:
    explicit FuzzedInputProvider(const uint8_t *ptr, size_t len)
        : m_ptr(ptr),
          m_len(len)
    {
    }

    [[nodiscard]] auto is_empty() const -> bool
    {
        return m_len == 0;
    }

    [[nodiscard]] auto length() const -> size_t
    {
        return m_len;
    }

    // Produces a value in range [min, max]. Bytes are taken from the end of
    // the input, so that the front of the input can be used as a document.
    template <class T>
    auto extract_integral_in_range(T min, T max) -> T
    {
        static_assert(std::is_integral<T>::value, "An integral type is required.");
        static_assert(sizeof(T) <= sizeof(uint64_t), "Unsupported integral type.");
        CHECK_TRUE(min <= max);

        auto range = static_cast<uint64_t>(max) - min;
        uint64_t result = 0;
        size_t offset = 0;
        while (offset < sizeof(T) * CHAR_BIT && (range >> offset) > 0 && m_len != 0) {
            --m_len;
            result = (result << CHAR_BIT) | m_ptr[m_len];
            offset += CHAR_BIT;
        }
        if (range != std::numeric_limits<decltype(range)>::max()) {
            result = result % (range + 1);
        }
        return static_cast<T>(min + result);
    }

    // Take the rest of the input
    [[nodiscard]] auto extract_rest() -> Slice
    {
        const Slice rest(reinterpret_cast<const char *>(m_ptr), m_len);
        m_ptr += m_len;
        m_len = 0;
        return rest;
    }
};

} // namespace pulljson

#endif // PULLJSON_FUZZERS_FUZZER_H
