// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef PULLJSON_INTERNAL_H
#define PULLJSON_INTERNAL_H

#include <cassert>
#include <cstddef>
#include <cstdint>

#define PULLJSON_EXPECT_TRUE(expr) assert(expr)
#define PULLJSON_EXPECT_FALSE(expr) PULLJSON_EXPECT_TRUE(!(expr))
#define PULLJSON_EXPECT_EQ(lhs, rhs) PULLJSON_EXPECT_TRUE((lhs) == (rhs))
#define PULLJSON_EXPECT_NE(lhs, rhs) PULLJSON_EXPECT_TRUE((lhs) != (rhs))
#define PULLJSON_EXPECT_LT(lhs, rhs) PULLJSON_EXPECT_TRUE((lhs) < (rhs))
#define PULLJSON_EXPECT_LE(lhs, rhs) PULLJSON_EXPECT_TRUE((lhs) <= (rhs))
#define PULLJSON_EXPECT_GT(lhs, rhs) PULLJSON_EXPECT_TRUE((lhs) > (rhs))
#define PULLJSON_EXPECT_GE(lhs, rhs) PULLJSON_EXPECT_TRUE((lhs) >= (rhs))
#define PULLJSON_DEBUG_TRAP assert(false && __FUNCTION__)

#define ARRAY_SIZE(x) (sizeof(x) / sizeof((x)[0]))

namespace pulljson
{

[[nodiscard]] constexpr auto is_digit(char c) -> bool
{
    return c >= '0' && c <= '9';
}

// JSON insignificant whitespace (ECMA-404 section 4)
[[nodiscard]] constexpr auto is_space(char c) -> bool
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

} // namespace pulljson

#endif // PULLJSON_INTERNAL_H
