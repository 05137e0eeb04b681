// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef PULLJSON_TOKENIZER_H
#define PULLJSON_TOKENIZER_H

#include "options.h"
#include "shift_buffer.h"
#include "slice.h"
#include "status.h"
#include <memory>
#include <string>
#include <vector>

namespace spdlog
{
class logger;
} // namespace spdlog

namespace pulljson
{

// Grammar events emitted by a tokenizer. The ordering is only used when
// displaying events.
enum class GrammarType {
    kError,
    kWhitespace,
    kLiteral,
    kNumber,
    kString,
    kStartObject,
    kEndObject,
    kStartArray,
    kEndArray,
};

// Structural context the tokenizer is in
enum class State {
    kValue,
    kObjectKey,
    kObjectValue,
    kArray,
};

// Return a display name, such as "StartObject", or "Invalid(N)" for a value
// outside of the enumeration.
[[nodiscard]] auto grammar_type_name(GrammarType type) -> std::string;
[[nodiscard]] auto state_name(State state) -> std::string;

// Pull-style JSON tokenizer
//
// Each call to next() returns the next grammar event, along with the bytes
// that make it up. Strings are returned with their quotes and escape sequences
// intact, and object keys are returned as kString events. Whitespace and the
// ',' and ':' separators are consumed silently.
//
// Once next() returns kError, every subsequent call returns kError. err()
// then describes the problem: Status::end_of_input() (or the reader's status)
// when the input ran out, Status::buffer_exceeded() when a token did not fit
// in the buffer, or a kCorruption status for a syntax error. Reaching the end
// of the input does not mean that the document was complete: the caller should
// also check that state() is State::kValue and depth() is 1.
//
// "Buffer" is SliceBuffer or ReaderBuffer. Use the Tokenizer and
// StreamTokenizer aliases below.
template <class Buffer>
class BasicTokenizer final
{
public:
    using Source = typename Buffer::Source;

    explicit BasicTokenizer(Source source, const Options &options = Options());
    ~BasicTokenizer();

    BasicTokenizer(const BasicTokenizer &) = delete;
    auto operator=(const BasicTokenizer &) -> BasicTokenizer & = delete;

    // Read the next grammar event. "data" is set to the bytes of the event,
    // which stay valid until the next call to next(). For kError, "data" is
    // empty.
    auto next(Slice &data) -> GrammarType;

    [[nodiscard]] auto err() const -> Status;

    [[nodiscard]] auto state() const -> State
    {
        return m_states.back();
    }

    // Number of entries on the state stack. 1 at the top level.
    [[nodiscard]] auto depth() const -> size_t
    {
        return m_states.size();
    }

    // Absolute byte offset of the next unread byte
    [[nodiscard]] auto offset() const -> size_t
    {
        return m_buf.offset() + m_buf.pos();
    }

    [[nodiscard]] auto is_eof() const -> bool
    {
        return m_buf.is_eof();
    }

    // Give back any changes made to the input. Safe to call at any time.
    auto restore() -> void
    {
        m_buf.restore();
    }

private:
    auto skip_whitespace() -> void;
    auto consume_whitespace() -> void;
    auto consume_literal() -> bool;
    auto consume_number() -> bool;
    auto consume_string() -> bool;
    auto pop_state() -> void;
    auto set_error(Status::SubCode subc, const char *what) -> GrammarType;
    auto set_status(Status s) -> GrammarType;

    const Options m_options;
    Buffer m_buf;
    std::shared_ptr<spdlog::logger> m_log;
    std::vector<State> m_states;
    Status m_status;
    bool m_need_comma = false;
};

using Tokenizer = BasicTokenizer<SliceBuffer>;
using StreamTokenizer = BasicTokenizer<ReaderBuffer>;

extern template class BasicTokenizer<SliceBuffer>;
extern template class BasicTokenizer<ReaderBuffer>;

} // namespace pulljson

#endif // PULLJSON_TOKENIZER_H
