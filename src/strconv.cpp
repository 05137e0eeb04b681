// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "pulljson/strconv.h"
#include "internal.h"
#include <cmath>

namespace pulljson
{

namespace
{

// Absolute value of "i" that works for INT64_MIN
auto magnitude(int64_t i) -> uint64_t
{
    return i < 0 ? 0 - static_cast<uint64_t>(i) : static_cast<uint64_t>(i);
}

auto len_uint(uint64_t u) -> size_t
{
    size_t n = 1;
    for (; u >= 10; u /= 10) {
        ++n;
    }
    return n;
}

auto append_uint(std::string &out, uint64_t u) -> void
{
    char buffer[20];
    auto *end = buffer + sizeof(buffer);
    auto *ptr = end;
    do {
        *--ptr = static_cast<char>('0' + u % 10);
        u /= 10;
    } while (u);
    out.append(ptr, static_cast<size_t>(end - ptr));
}

auto matches(char c, int sep) -> bool
{
    return sep >= 0 && static_cast<unsigned char>(c) == static_cast<unsigned>(sep);
}

constexpr double kPowersOf10[] = {
    1e0, 1e1, 1e2, 1e3, 1e4, 1e5, 1e6, 1e7, 1e8,
    1e9, 1e10, 1e11, 1e12, 1e13, 1e14, 1e15, 1e16, 1e17};

constexpr int kMaxDecimalPrecision = static_cast<int>(ARRAY_SIZE(kPowersOf10)) - 1;

} // namespace

auto parse_int(const Slice &in, int64_t &out) -> size_t
{
    // Accumulate the magnitude, which may be 1 larger than INT64_MAX.
    static constexpr auto kMaxMagnitude = static_cast<uint64_t>(INT64_MAX) + 1;

    out = 0;
    size_t i = 0;
    auto neg = false;
    if (i < in.size() && (in[i] == '+' || in[i] == '-')) {
        neg = in[i] == '-';
        ++i;
    }
    const auto start = i;
    uint64_t value = 0;
    for (; i < in.size() && is_digit(in[i]); ++i) {
        const auto digit = static_cast<uint64_t>(in[i] - '0');
        if (value > kMaxMagnitude / 10 || value * 10 > kMaxMagnitude - digit) {
            return 0;
        }
        value = value * 10 + digit;
    }
    if (i == start || (!neg && value > static_cast<uint64_t>(INT64_MAX))) {
        return 0;
    }
    out = neg ? static_cast<int64_t>(0 - value) : static_cast<int64_t>(value);
    return i;
}

auto parse_uint(const Slice &in, uint64_t &out) -> size_t
{
    static constexpr char kLastDigitOfMaxUint64 = '0' + static_cast<char>(UINT64_MAX % 10);

    out = 0;
    uint64_t value = 0;
    size_t i = 0;
    for (; i < in.size() && is_digit(in[i]); ++i) {
        const auto ch = in[i];
        if (value > UINT64_MAX / 10 || (value == UINT64_MAX / 10 && ch > kLastDigitOfMaxUint64)) {
            return 0;
        }
        value = value * 10 + static_cast<uint64_t>(ch - '0');
    }
    out = value;
    return i;
}

auto parse_number(const Slice &in, int64_t &num, int &dec, int group_sep, int dec_sep) -> size_t
{
    num = 0;
    dec = 0;
    size_t i = 0;
    const auto neg = !in.is_empty() && in[0] == '-';
    if (neg) {
        ++i;
    }
    int64_t value = 0;
    auto has_digits = false;
    auto has_decimals = false;
    for (; i < in.size(); ++i) {
        const auto c = in[i];
        if (is_digit(c)) {
            const auto digit = c - '0';
            if (!neg && value > (INT64_MAX - digit) / 10) {
                value = INT64_MAX;
                break;
            } else if (neg && value < (INT64_MIN + digit) / 10) {
                value = INT64_MIN;
                break;
            }
            value = value * 10 + (neg ? -digit : digit);
            has_digits = true;
            if (has_decimals) {
                ++dec;
            }
        } else if (!has_decimals && matches(c, dec_sep)) {
            has_decimals = true;
        } else if (!has_decimals && matches(c, group_sep)) {
            // Grouping is only meaningful in the integer part.
        } else {
            break;
        }
    }
    if (!has_digits) {
        dec = 0;
        return 0;
    }
    num = value;
    return i;
}

auto len_int(int64_t i) -> size_t
{
    return len_uint(magnitude(i)) + (i < 0);
}

auto append_int(std::string &out, int64_t i) -> void
{
    if (i < 0) {
        out.push_back('-');
    }
    append_uint(out, magnitude(i));
}

auto append_decimal(std::string &out, double f, int prec) -> void
{
    if (!std::isfinite(f)) {
        return;
    }
    if (prec < 0) {
        prec = 0;
    } else if (prec > kMaxDecimalPrecision) {
        prec = kMaxDecimalPrecision;
    }
    const auto scaled = std::round(f * kPowersOf10[prec]);
    if (std::fabs(scaled) >= 9.2e18) {
        // Too many digits for a fixed-point mantissa.
        append_float(out, f, prec);
        return;
    }
    const auto mantissa = static_cast<int64_t>(scaled);
    if (mantissa == 0) {
        out.push_back('0');
        return;
    }
    std::string digits;
    append_uint(digits, magnitude(mantissa));
    const auto width = static_cast<size_t>(prec) + 1;
    if (digits.size() < width) {
        digits.insert(0, width - digits.size(), '0');
    }
    auto split = digits.size() - static_cast<size_t>(prec);
    auto end = digits.size();
    while (end > split && digits[end - 1] == '0') {
        --end;
    }
    if (mantissa < 0) {
        out.push_back('-');
    }
    out.append(digits, 0, split);
    if (end > split) {
        out.push_back('.');
        out.append(digits, split, end - split);
    }
}

auto append_number(std::string &out, int64_t num, int dec, int group_size, int group_sep, int dec_sep) -> void
{
    if (dec < 0) {
        dec = 0;
    }
    if (group_sep < 0) {
        group_sep = '.';
    }
    if (dec_sep < 0) {
        dec_sep = ',';
    }

    std::string digits;
    append_uint(digits, magnitude(num));
    const auto width = static_cast<size_t>(dec) + 1;
    if (digits.size() < width) {
        digits.insert(0, width - digits.size(), '0');
    }
    const auto split = digits.size() - static_cast<size_t>(dec);

    if (num < 0) {
        out.push_back('-');
    }
    for (size_t i = 0; i < split; ++i) {
        if (i > 0 && group_size > 0 && (split - i) % static_cast<size_t>(group_size) == 0) {
            out.push_back(static_cast<char>(group_sep));
        }
        out.push_back(digits[i]);
    }
    if (dec > 0) {
        out.push_back(static_cast<char>(dec_sep));
        out.append(digits, split, std::string::npos);
    }
}

} // namespace pulljson
