// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef PULLJSON_OPTIONS_H
#define PULLJSON_OPTIONS_H

#include <cstddef>
#include <cstdint>

#ifndef PULLJSON_DEFAULT_MIN_BUFFER_SIZE
#define PULLJSON_DEFAULT_MIN_BUFFER_SIZE 1'024U
#endif // PULLJSON_DEFAULT_MIN_BUFFER_SIZE

#ifndef PULLJSON_DEFAULT_MAX_BUFFER_SIZE
#define PULLJSON_DEFAULT_MAX_BUFFER_SIZE 4'096U
#endif // PULLJSON_DEFAULT_MAX_BUFFER_SIZE

namespace pulljson
{

// Bounds on the size of a reader-backed buffer
static constexpr size_t kMinBufferSize = 4;
static constexpr size_t kMaxBufferSize = 1 << 20;

// What to do with a ',' that is not followed by another array element or
// object member, e.g. "[1,]" or "{"a":1,}".
enum class TrailingComma {
    kReject,
    kAllow,
};

enum class LogLevel {
    kTrace,
    kDebug,
    kInfo,
    kWarn,
    kError,
    kOff,
};

enum class LogTarget {
    kStdout,
    kStderr,
    kStdoutColor,
    kStderrColor,
    kFile,
};

// Options to control the behavior of a tokenizer
struct Options final {
    // Initial capacity of a reader-backed buffer. Ignored when tokenizing an
    // in-memory slice.
    size_t min_buffer_size = PULLJSON_DEFAULT_MIN_BUFFER_SIZE;

    // Hard cap on the capacity of a reader-backed buffer. A single token
    // longer than this causes the tokenizer to fail with a "buffer exceeded"
    // status.
    size_t max_buffer_size = PULLJSON_DEFAULT_MAX_BUFFER_SIZE;

    TrailingComma trailing_comma = TrailingComma::kReject;

    LogLevel log_level = LogLevel::kOff;
    LogTarget log_target = LogTarget::kStderrColor;

    // Log file to append to when log_target is LogTarget::kFile.
    const char *log_filename = "pulljson.log";
};

// Return a copy of "options" with out-of-range sizes clamped into
// [kMinBufferSize, kMaxBufferSize], and min_buffer_size no greater than
// max_buffer_size.
[[nodiscard]] auto sanitize_options(const Options &options) -> Options;

} // namespace pulljson

#endif // PULLJSON_OPTIONS_H
