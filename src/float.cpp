// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "internal.h"
#include "pulljson/strconv.h"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

namespace pulljson
{

namespace
{

// Length of a run of digits starting at "i"
auto count_digits(const Slice &in, size_t i) -> size_t
{
    const auto start = i;
    while (i < in.size() && is_digit(in[i])) {
        ++i;
    }
    return i - start;
}

// Convert a prefix that has already been validated. The bytes are copied so
// that strtod() sees a NULL-terminated string that ends where the prefix ends.
auto convert(const Slice &in, size_t n, double &out) -> bool
{
    char small[64];
    std::string large;
    const char *text;
    if (n < sizeof(small)) {
        std::memcpy(small, in.data(), n);
        small[n] = '\0';
        text = small;
    } else {
        large.assign(in.data(), n);
        text = large.c_str();
    }
    const auto value = std::strtod(text, nullptr);
    if (std::isinf(value)) {
        return false;
    }
    out = value;
    return true;
}

// Decompose a positive, finite number into significant digits and the
// decimal exponent of the first digit, such that f ~= 0.d1d2d3... * 10^(exp + 1).
// Any double is identified by its first 17 significant digits.
constexpr size_t kMaxSignificantDigits = 17;

struct DecimalDigits {
    std::string digits;
    int exponent = 0;
};

// Shortest digit string that converts back to "f" exactly
auto shortest_digits(double f, DecimalDigits &out) -> void
{
    char buffer[32];
    for (int precision = 0;; ++precision) {
        std::snprintf(buffer, sizeof(buffer), "%.*e", precision, f);
        if (precision >= 16 || std::strtod(buffer, nullptr) == f) {
            break;
        }
    }
    // buffer looks like "d[.ddd]e[+-]xx"
    const char *ptr = buffer;
    for (; *ptr != 'e'; ++ptr) {
        if (is_digit(*ptr)) {
            out.digits.push_back(*ptr);
        }
    }
    out.exponent = std::atoi(ptr + 1);
}

// Digits of "f" after rounding to "prec" places after the decimal point.
// Returns false if the rounded value is 0.
auto rounded_digits(double f, int prec, DecimalDigits &out) -> bool
{
    // Enough room for 309 integer digits plus the fraction.
    char buffer[352];
    std::snprintf(buffer, sizeof(buffer), "%.*f", prec, f);
    int point = -1;
    int n = 0;
    for (const char *ptr = buffer; *ptr != '\0'; ++ptr) {
        if (*ptr == '.') {
            point = n;
        } else if (is_digit(*ptr)) {
            if (!out.digits.empty() || *ptr != '0') {
                out.digits.push_back(*ptr);
            } else {
                // Leading zero. Shifts the exponent of the first digit.
                --out.exponent;
            }
            ++n;
        }
    }
    if (out.digits.empty()) {
        return false;
    }
    if (point < 0) {
        point = n;
    }
    out.exponent += point - 1;
    return true;
}

} // namespace

auto parse_decimal(const Slice &in, double &out) -> size_t
{
    out = 0.0;
    size_t i = 0;
    if (i < in.size() && in[i] == '-') {
        ++i;
    }
    if (i < in.size() && in[i] == '0') {
        ++i;
    } else if (const auto n = count_digits(in, i)) {
        i += n;
    } else {
        return 0;
    }
    if (i < in.size() && in[i] == '.') {
        if (const auto n = count_digits(in, i + 1)) {
            i += 1 + n;
        }
    }
    return convert(in, i, out) ? i : 0;
}

auto parse_float(const Slice &in, double &out) -> size_t
{
    out = 0.0;
    size_t i = 0;
    if (i < in.size() && (in[i] == '+' || in[i] == '-')) {
        ++i;
    }
    if (const auto n = count_digits(in, i)) {
        i += n;
    } else {
        return 0;
    }
    if (i < in.size() && in[i] == '.') {
        if (const auto n = count_digits(in, i + 1)) {
            i += 1 + n;
        }
    }
    if (i < in.size() && (in[i] == 'e' || in[i] == 'E')) {
        auto j = i + 1;
        if (j < in.size() && (in[j] == '+' || in[j] == '-')) {
            ++j;
        }
        if (const auto n = count_digits(in, j)) {
            i = j + n;
        }
    }
    return convert(in, i, out) ? i : 0;
}

auto append_float(std::string &out, double f, int prec) -> bool
{
    if (!std::isfinite(f)) {
        return false;
    }
    DecimalDigits d;
    const auto neg = std::signbit(f);
    if (f == 0.0) {
        out.push_back('0');
        return true;
    } else if (prec < 0 || prec > 17) {
        shortest_digits(std::fabs(f), d);
    } else if (!rounded_digits(std::fabs(f), prec, d)) {
        out.push_back('0');
        return true;
    }
    auto &digits = d.digits;
    while (digits.size() > 1 && digits.back() == '0') {
        digits.pop_back();
    }
    if (digits.size() > kMaxSignificantDigits) {
        // Digits past the 17th come from the binary expansion, not the value.
        d = DecimalDigits();
        shortest_digits(std::fabs(f), d);
    }
    const auto k = static_cast<int>(digits.size());
    const auto exp = d.exponent;

    if (neg) {
        out.push_back('-');
    }
    if (exp >= -4 && exp < 18) {
        if (exp < 0) {
            out.append("0.");
            out.append(static_cast<size_t>(-exp - 1), '0');
            out.append(digits);
        } else if (k <= exp + 1) {
            out.append(digits);
            out.append(static_cast<size_t>(exp + 1 - k), '0');
        } else {
            out.append(digits, 0, static_cast<size_t>(exp + 1));
            out.push_back('.');
            out.append(digits, static_cast<size_t>(exp + 1), std::string::npos);
        }
    } else {
        out.push_back(digits[0]);
        if (k > 1) {
            out.push_back('.');
            out.append(digits, 1, std::string::npos);
        }
        out.push_back('e');
        append_int(out, exp);
    }
    return true;
}

} // namespace pulljson
