// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "pulljson/options.h"
#include <algorithm>

namespace pulljson
{

auto sanitize_options(const Options &options) -> Options
{
    auto sanitized = options;
    sanitized.max_buffer_size = std::clamp(
        sanitized.max_buffer_size, kMinBufferSize, kMaxBufferSize);
    sanitized.min_buffer_size = std::clamp(
        sanitized.min_buffer_size, kMinBufferSize, sanitized.max_buffer_size);
    if (sanitized.log_filename == nullptr || *sanitized.log_filename == '\0') {
        sanitized.log_filename = Options().log_filename;
    }
    return sanitized;
}

} // namespace pulljson
