// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "pulljson/position.h"
#include "internal.h"
#include "pulljson/reader.h"
#include "pulljson/shift_buffer.h"
#include <spdlog/fmt/fmt.h>

namespace pulljson
{

namespace
{

// Lines longer than kContextLimit bytes are cut down to a window around the
// column.
constexpr size_t kContextLimit = 60;
constexpr size_t kContextRadius = 20;
constexpr size_t kEllipsisSize = 3;

// Extend the lexeme, which starts at the beginning of the current line, to the
// end of that line, and render it with a caret under "column".
template <class Buffer>
auto line_context(Buffer &buf, size_t line, size_t column) -> std::string
{
    for (;;) {
        const auto c = buf.peek(0);
        if (c == '\0' || c == '\n' || c == '\r') {
            break;
        }
        buf.move(1);
    }
    auto text = buf.lexeme().to_string();

    const char *front = "";
    const char *rear = "";
    if (text.size() > kContextLimit) {
        const auto size = text.size();
        if (column <= kContextLimit - kContextRadius) {
            rear = "...";
            text.resize(kContextLimit - kEllipsisSize);
        } else if (column + kContextRadius + kEllipsisSize >= size) {
            const auto start = size - 2 * kContextRadius - kEllipsisSize - 1;
            front = "...";
            text.erase(0, start);
            column -= start - kEllipsisSize;
        } else {
            const auto start = column - kContextRadius - 1;
            front = "...";
            rear = "...";
            text = text.substr(start, 2 * kContextRadius + 1);
            column = kContextRadius + 1 + kEllipsisSize;
        }
    }
    for (auto &c : text) {
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F) {
            c = ' ';
        }
    }
    // The line number takes up 5 columns, followed by ": ".
    return fmt::format("{:5d}: {}{}{}\n{}^", line, front, text, rear,
                       std::string(column + 6, ' '));
}

template <class Buffer>
auto find_position(Buffer &buf, int64_t offset, PositionInfo &out) -> Status
{
    out.line = 1;
    for (;;) {
        const auto c = buf.peek(0);
        if (c == '\0') {
            out.column = buf.pos() + 1;
            out.context = line_context(buf, out.line, out.column);
            auto s = buf.err();
            if (s.is_ok()) {
                // Stray NUL byte. Treat it as the end of the input.
                s = Status::end_of_input();
            }
            return s;
        } else if (offset == static_cast<int64_t>(buf.pos())) {
            out.column = buf.pos() + 1;
            out.context = line_context(buf, out.line, out.column);
            return Status::ok();
        } else if (c == '\n') {
            buf.move(1);
        } else if (c == '\r') {
            if (buf.peek(1) == '\n') {
                if (offset == static_cast<int64_t>(buf.pos()) + 1) {
                    // Pointing at the "\n" of a "\r\n" pair.
                    buf.move(1);
                    continue;
                }
                buf.move(2);
            } else {
                buf.move(1);
            }
        } else {
            buf.move(1);
            continue;
        }
        ++out.line;
        offset -= static_cast<int64_t>(buf.pos());
        buf.skip();
    }
}

} // namespace

auto position(Reader &reader, int64_t offset, PositionInfo &out) -> Status
{
    // Only the current line is kept in memory, so allow long lines.
    Options options;
    options.max_buffer_size = kMaxBufferSize;
    ReaderBuffer buf(reader, options);
    return find_position(buf, offset, out);
}

auto position(const Slice &input, int64_t offset, PositionInfo &out) -> Status
{
    SliceBuffer buf(input);
    return find_position(buf, offset, out);
}

auto format_syntax_error(const Slice &what, const PositionInfo &info) -> std::string
{
    return fmt::format("{} on line {} and column {}\n{}",
                       fmt::string_view(what.data(), what.size()),
                       info.line, info.column, info.context);
}

} // namespace pulljson
