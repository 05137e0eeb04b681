// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef PULLJSON_POSITION_H
#define PULLJSON_POSITION_H

#include "slice.h"
#include "status.h"
#include <cstdint>
#include <string>

namespace pulljson
{

class Reader;

struct PositionInfo {
    // 1-based line and column. "\n", "\r" and "\r\n" each end a line.
    size_t line = 0;
    size_t column = 0;

    // Excerpt of the line containing the position, followed by a second line
    // with a caret under the column:
    //
    //         1: {"a": tru}
    //                      ^
    std::string context;
};

// Convert a byte offset into a line, column and context excerpt
// Returns Status::end_of_input() if "offset" lies past the end of the input,
// in which case "out" describes the end of the input. A negative "offset"
// always describes the end of the input. Other non-OK statuses come from the
// reader.
auto position(Reader &reader, int64_t offset, PositionInfo &out) -> Status;
auto position(const Slice &input, int64_t offset, PositionInfo &out) -> Status;

// Render "<what> on line L and column C" followed by the context excerpt
[[nodiscard]] auto format_syntax_error(const Slice &what, const PositionInfo &info) -> std::string;

} // namespace pulljson

#endif // PULLJSON_POSITION_H
