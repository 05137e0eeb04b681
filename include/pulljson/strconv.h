// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef PULLJSON_STRCONV_H
#define PULLJSON_STRCONV_H

#include "slice.h"
#include <cstdint>
#include <string>

namespace pulljson
{

// Numeric scanners
// Each scanner parses the longest valid prefix of "in", stores the value in
// "out" and returns the number of bytes consumed. A return value of 0 means
// that no valid prefix was found, in which case "out" is set to 0. Scanners
// never read past the end of "in".

// Parse [+-]?[0-9]+ into a signed 64-bit integer. Fails on overflow.
auto parse_int(const Slice &in, int64_t &out) -> size_t;

// Parse [0-9]+ into an unsigned 64-bit integer. Fails on overflow.
auto parse_uint(const Slice &in, uint64_t &out) -> size_t;

// Parse -?(0|[1-9][0-9]*)(\.[0-9]+)? with no exponent. A '.' that is not
// followed by a digit is not consumed.
auto parse_decimal(const Slice &in, double &out) -> size_t;

// Parse [+-]?[0-9]+(\.[0-9]+)?([eE][+-]?[0-9]+)? into a double. An exponent
// marker without digits is not consumed. Fails if the value overflows.
auto parse_float(const Slice &in, double &out) -> size_t;

// Parse a locale-formatted number such as "-1.000,25" into an integer
// mantissa "num" and a count of fraction digits "dec", so that the value is
// num * 10^-dec. Bytes equal to "group_sep" are skipped until "dec_sep" is
// seen. If the mantissa overflows, consumption stops and "num" is clamped to
// INT64_MAX or INT64_MIN. Pass -1 to disable a separator.
auto parse_number(const Slice &in, int64_t &num, int &dec, int group_sep, int dec_sep) -> size_t;

// Formatters
// Each formatter appends text to "out".

// Number of bytes append_int() would write for "i", including the sign
[[nodiscard]] auto len_int(int64_t i) -> size_t;

auto append_int(std::string &out, int64_t i) -> void;

// Append "f" in the shortest form that parse_float() reads back exactly when
// "prec" is negative (or greater than 17), otherwise after rounding to "prec"
// digits after the decimal point. Uses scientific notation when the decimal
// exponent is outside [-4, 18). Returns false without writing anything if "f"
// is NaN or infinite.
auto append_float(std::string &out, double f, int prec) -> bool;

// Append "f" with at most "prec" digits after the decimal point, rounding
// half away from zero. Trailing zeros are dropped.
auto append_decimal(std::string &out, double f, int prec) -> void;

// Append num * 10^-dec using "dec" fraction digits, placing "group_sep"
// between every "group_size" integer digits. A separator of -1 selects the
// default: '.' for grouping and ',' for the decimal mark.
auto append_number(std::string &out, int64_t num, int dec, int group_size, int group_sep, int dec_sep) -> void;

} // namespace pulljson

#endif // PULLJSON_STRCONV_H
