// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "pulljson/tokenizer.h"
#include "internal.h"
#include "logging.h"
#include "pulljson/position.h"

namespace pulljson
{

auto grammar_type_name(GrammarType type) -> std::string
{
    static constexpr const char *kNames[] = {
        "Error",
        "Whitespace",
        "Literal",
        "Number",
        "String",
        "StartObject",
        "EndObject",
        "StartArray",
        "EndArray",
    };
    const auto index = static_cast<int>(type);
    if (index < 0 || static_cast<size_t>(index) >= ARRAY_SIZE(kNames)) {
        return fmt::format("Invalid({})", index);
    }
    return kNames[index];
}

auto state_name(State state) -> std::string
{
    static constexpr const char *kNames[] = {
        "Value",
        "ObjectKey",
        "ObjectValue",
        "Array",
    };
    const auto index = static_cast<int>(state);
    if (index < 0 || static_cast<size_t>(index) >= ARRAY_SIZE(kNames)) {
        return fmt::format("Invalid({})", index);
    }
    return kNames[index];
}

template <class Buffer>
BasicTokenizer<Buffer>::BasicTokenizer(Source source, const Options &options)
    : m_options(sanitize_options(options)),
      m_buf(source, m_options)
{
    LogSink sink;
    m_status = create_sink(m_options, sink);
    m_log = create_log(std::move(sink), "tokenizer");
    m_states.push_back(State::kValue);
    m_log->debug("created tokenizer (buffer size {} to {}, trailing commas {})",
                 m_options.min_buffer_size, m_options.max_buffer_size,
                 m_options.trailing_comma == TrailingComma::kAllow ? "allowed" : "rejected");
}

template <class Buffer>
BasicTokenizer<Buffer>::~BasicTokenizer() = default;

template <class Buffer>
auto BasicTokenizer<Buffer>::err() const -> Status
{
    if (!m_status.is_ok()) {
        return m_status;
    }
    return m_buf.err();
}

template <class Buffer>
auto BasicTokenizer<Buffer>::next(Slice &data) -> GrammarType
{
    data.clear();
    if (!m_status.is_ok()) {
        return GrammarType::kError;
    }
    const auto reject_trailing = m_options.trailing_comma == TrailingComma::kReject;

    skip_whitespace();
    auto c = m_buf.peek(0);
    const auto state = m_states.back();
    if (c == ',') {
        if (state != State::kArray && state != State::kObjectKey) {
            return set_error(Status::kBadComma, "unexpected comma character");
        } else if (reject_trailing && !m_need_comma) {
            return set_error(Status::kBadComma, "unexpected comma character");
        }
        m_buf.move(1);
        m_buf.skip();
        skip_whitespace();
        m_need_comma = false;
        c = m_buf.peek(0);
        if (c == ',') {
            return set_error(Status::kBadComma, "unexpected comma character");
        } else if (reject_trailing && (c == ']' || c == '}')) {
            return set_error(Status::kBadComma, "unexpected comma character before closing bracket");
        }
    }
    m_buf.skip();

    if (m_need_comma && c != '}' && c != ']' && c != '\0') {
        return set_error(Status::kNoComma, "expected comma character or an array or object ending");
    }

    if (c == '{') {
        m_states.push_back(State::kObjectKey);
        m_need_comma = false;
        m_buf.move(1);
        data = m_buf.shift();
        return GrammarType::kStartObject;
    } else if (c == '}') {
        if (state != State::kObjectKey) {
            return set_error(Status::kBadObjectEnding, "unexpected right brace character");
        }
        pop_state();
        m_need_comma = true;
        m_buf.move(1);
        data = m_buf.shift();
        return GrammarType::kEndObject;
    } else if (c == '[') {
        m_states.push_back(State::kArray);
        m_need_comma = false;
        m_buf.move(1);
        data = m_buf.shift();
        return GrammarType::kStartArray;
    } else if (c == ']') {
        if (state != State::kArray) {
            return set_error(Status::kBadArrayEnding, "unexpected right bracket character");
        }
        pop_state();
        m_need_comma = true;
        m_buf.move(1);
        data = m_buf.shift();
        return GrammarType::kEndArray;
    } else if (state == State::kObjectKey && c != '\0') {
        if (c != '"' || !consume_string()) {
            if (c == '"') {
                auto s = m_buf.err();
                if (!s.is_ok() && !s.is_end_of_input()) {
                    return set_status(std::move(s));
                }
            }
            return set_error(Status::kBadObjectKey, "expected object key to be a quoted string");
        }
        const auto key_length = m_buf.pos();
        consume_whitespace();
        if (m_buf.peek(0) != ':') {
            if (auto s = m_buf.err(); !s.is_ok() && !s.is_end_of_input()) {
                return set_status(std::move(s));
            }
            return set_error(Status::kBadObjectDeclaration, "expected colon character after object key");
        }
        m_buf.move(1);
        m_states.back() = State::kObjectValue;
        data = m_buf.shift().truncate(key_length);
        return GrammarType::kString;
    }

    auto type = GrammarType::kError;
    if (c == '"') {
        if (consume_string()) {
            type = GrammarType::kString;
        } else {
            auto s = m_buf.err();
            if (s.is_ok()) {
                // The string was cut short by a NUL byte.
                return set_error(Status::kUnexpectedNul, "unexpected NUL character");
            } else if (!s.is_end_of_input()) {
                return set_status(std::move(s));
            }
            // The input ends inside the string. Return what is there and
            // report the end of the input on the next call.
            m_status = std::move(s);
            m_log->trace("end of input inside a string at offset {}", offset());
            data = m_buf.shift();
            return GrammarType::kString;
        }
    } else if (consume_number()) {
        type = GrammarType::kNumber;
    } else if (consume_literal()) {
        type = GrammarType::kLiteral;
    }
    if (type != GrammarType::kError) {
        // A number can be cut short by a lexeme that does not fit.
        if (auto s = m_buf.err(); !s.is_ok() && !s.is_end_of_input()) {
            return set_status(std::move(s));
        }
        m_need_comma = true;
        if (state == State::kObjectValue) {
            m_states.back() = State::kObjectKey;
        }
        data = m_buf.shift();
        return type;
    }

    if (c == '\0') {
        auto s = m_buf.err();
        if (s.is_ok()) {
            return set_error(Status::kUnexpectedNul, "unexpected NUL character");
        } else if (!s.is_end_of_input()) {
            return set_status(std::move(s));
        }
        m_log->trace("end of input at offset {} (depth {})", offset(), depth());
        return GrammarType::kError;
    } else if (auto s = m_buf.err(); !s.is_ok() && !s.is_end_of_input()) {
        return set_status(std::move(s));
    }
    return set_error(Status::kUnexpectedCharacter, "unexpected character");
}

// Whitespace before a token is dropped as it is read, so that it never counts
// toward the size of a lexeme.
template <class Buffer>
auto BasicTokenizer<Buffer>::skip_whitespace() -> void
{
    while (is_space(m_buf.peek(0))) {
        m_buf.move(1);
        m_buf.skip();
    }
}

template <class Buffer>
auto BasicTokenizer<Buffer>::consume_whitespace() -> void
{
    while (is_space(m_buf.peek(0))) {
        m_buf.move(1);
    }
}

template <class Buffer>
auto BasicTokenizer<Buffer>::consume_literal() -> bool
{
    static constexpr const char *kLiterals[] = {"null", "true", "false"};
    for (const auto *literal : kLiterals) {
        size_t i = 0;
        for (; literal[i] != '\0'; ++i) {
            if (m_buf.peek(i) != literal[i]) {
                break;
            }
        }
        if (literal[i] == '\0') {
            m_buf.move(static_cast<ptrdiff_t>(i));
            return true;
        }
    }
    return false;
}

template <class Buffer>
auto BasicTokenizer<Buffer>::consume_number() -> bool
{
    const auto mark = m_buf.pos();
    if (m_buf.peek(0) == '-') {
        m_buf.move(1);
    }
    const auto c = m_buf.peek(0);
    if (c == '0') {
        m_buf.move(1);
    } else if (c >= '1' && c <= '9') {
        m_buf.move(1);
        while (is_digit(m_buf.peek(0))) {
            m_buf.move(1);
        }
    } else {
        m_buf.rewind(mark);
        return false;
    }
    if (m_buf.peek(0) == '.') {
        if (!is_digit(m_buf.peek(1))) {
            return true;
        }
        m_buf.move(2);
        while (is_digit(m_buf.peek(0))) {
            m_buf.move(1);
        }
    }
    const auto e = m_buf.peek(0);
    if (e == 'e' || e == 'E') {
        // Sign and first digit of the exponent.
        const auto sign = m_buf.peek(1);
        const size_t first = sign == '+' || sign == '-' ? 2 : 1;
        if (!is_digit(m_buf.peek(first))) {
            return true;
        }
        m_buf.move(static_cast<ptrdiff_t>(first + 1));
        while (is_digit(m_buf.peek(0))) {
            m_buf.move(1);
        }
    }
    return true;
}

// The lexeme is assumed to start at the opening quote.
template <class Buffer>
auto BasicTokenizer<Buffer>::consume_string() -> bool
{
    m_buf.move(1);
    for (;;) {
        const auto c = m_buf.peek(0);
        if (c == '"') {
            // The quote is escaped if it follows an odd number of backslashes.
            const auto lexeme = m_buf.lexeme();
            auto escaped = false;
            for (auto i = lexeme.size(); i > 1 && lexeme[i - 1] == '\\'; --i) {
                escaped = !escaped;
            }
            if (!escaped) {
                m_buf.move(1);
                return true;
            }
        } else if (c == '\0') {
            return false;
        }
        m_buf.move(1);
    }
}

template <class Buffer>
auto BasicTokenizer<Buffer>::pop_state() -> void
{
    PULLJSON_EXPECT_GT(m_states.size(), 1);
    m_states.pop_back();
    if (m_states.back() == State::kObjectValue) {
        m_states.back() = State::kObjectKey;
    }
}

template <class Buffer>
auto BasicTokenizer<Buffer>::set_error(Status::SubCode subc, const char *what) -> GrammarType
{
    const auto error_offset = offset();
    LogMessage message(*m_log);
    PositionInfo info;
    // Lines and columns can only be computed while the buffer still holds the
    // input from its first byte.
    const auto s = m_buf.base_offset() == 0
                       ? position(m_buf.window(), static_cast<int64_t>(error_offset), info)
                       : Status::not_found();
    if (s.is_ok() || s.is_end_of_input()) {
        message.set_primary("{}", format_syntax_error(what, info));
    } else {
        message.set_primary("{}", what);
        message.set_detail("at byte offset {}", error_offset);
        message.set_hint("line numbers are unavailable once input has been discarded ({} bytes so far)",
                         m_buf.base_offset());
    }
    return set_status(message.syntax_error(subc));
}

template <class Buffer>
auto BasicTokenizer<Buffer>::set_status(Status s) -> GrammarType
{
    PULLJSON_EXPECT_FALSE(s.is_ok());
    if (m_status.is_ok()) {
        if (!s.is_corruption()) {
            m_log->debug("stopped at offset {}: {}", offset(), s.message());
        }
        m_status = std::move(s);
    }
    return GrammarType::kError;
}

template class BasicTokenizer<SliceBuffer>;
template class BasicTokenizer<ReaderBuffer>;

} // namespace pulljson
