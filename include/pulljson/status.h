// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef PULLJSON_STATUS_H
#define PULLJSON_STATUS_H

namespace pulljson
{

class [[nodiscard]] Status final
{
public:
    enum Code : char {
        kOK,
        kInvalidArgument,
        kIOError,
        kCorruption,
        kNotFound,
        kAborted,
        kMaxCode
    };

    enum SubCode : char {
        kNone,
        kEndOfInput,
        kBufferExceeded,
        kBadComma,
        kNoComma,
        kBadArrayEnding,
        kBadObjectEnding,
        kBadObjectKey,
        kBadObjectDeclaration,
        kUnexpectedNul,
        kUnexpectedCharacter,
        kMaxSubCode
    };

    // Construct an OK status
    explicit Status()
        : m_state(nullptr)
    {
    }

    ~Status();

    // Create an OK status
    static auto ok() -> Status
    {
        return Status();
    }

    static auto invalid_argument(SubCode subc = kNone) -> Status
    {
        return Status(kInvalidArgument, subc);
    }

    static auto corruption(SubCode subc = kNone) -> Status
    {
        return Status(kCorruption, subc);
    }

    static auto not_found(SubCode subc = kNone) -> Status
    {
        return Status(kNotFound, subc);
    }

    static auto io_error(SubCode subc = kNone) -> Status
    {
        return Status(kIOError, subc);
    }

    static auto aborted(SubCode subc = kNone) -> Status
    {
        return Status(kAborted, subc);
    }

    // Terminal status of a byte source that has no more data
    static auto end_of_input() -> Status
    {
        return io_error(kEndOfInput);
    }

    // A single lexeme did not fit in the largest allowed buffer
    static auto buffer_exceeded() -> Status
    {
        return aborted(kBufferExceeded);
    }

    static auto invalid_argument(const char *msg) -> Status;
    static auto corruption(const char *msg) -> Status;
    static auto not_found(const char *msg) -> Status;
    static auto io_error(const char *msg) -> Status;
    static auto aborted(const char *msg) -> Status;
    static auto end_of_input(const char *msg) -> Status;
    static auto buffer_exceeded(const char *msg) -> Status;

    // Syntax errors detected by the tokenizer. All have code kCorruption.
    static auto syntax_error(SubCode subc, const char *msg) -> Status;

    // Return true if the status is OK, false otherwise
    [[nodiscard]] auto is_ok() const -> bool
    {
        return m_state == nullptr;
    }

    [[nodiscard]] auto is_invalid_argument() const -> bool
    {
        return code() == kInvalidArgument;
    }

    [[nodiscard]] auto is_io_error() const -> bool
    {
        return code() == kIOError;
    }

    [[nodiscard]] auto is_corruption() const -> bool
    {
        return code() == kCorruption;
    }

    [[nodiscard]] auto is_not_found() const -> bool
    {
        return code() == kNotFound;
    }

    [[nodiscard]] auto is_aborted() const -> bool
    {
        return code() == kAborted;
    }

    [[nodiscard]] auto is_end_of_input() const -> bool
    {
        return is_io_error() && subcode() == kEndOfInput;
    }

    [[nodiscard]] auto is_buffer_exceeded() const -> bool
    {
        return is_aborted() && subcode() == kBufferExceeded;
    }

    [[nodiscard]] auto is_bad_comma() const -> bool
    {
        return is_corruption() && subcode() == kBadComma;
    }

    [[nodiscard]] auto is_no_comma() const -> bool
    {
        return is_corruption() && subcode() == kNoComma;
    }

    [[nodiscard]] auto is_bad_array_ending() const -> bool
    {
        return is_corruption() && subcode() == kBadArrayEnding;
    }

    [[nodiscard]] auto is_bad_object_ending() const -> bool
    {
        return is_corruption() && subcode() == kBadObjectEnding;
    }

    [[nodiscard]] auto is_bad_object_key() const -> bool
    {
        return is_corruption() && subcode() == kBadObjectKey;
    }

    [[nodiscard]] auto is_bad_object_declaration() const -> bool
    {
        return is_corruption() && subcode() == kBadObjectDeclaration;
    }

    [[nodiscard]] auto is_unexpected_nul() const -> bool
    {
        return is_corruption() && subcode() == kUnexpectedNul;
    }

    [[nodiscard]] auto is_unexpected_character() const -> bool
    {
        return is_corruption() && subcode() == kUnexpectedCharacter;
    }

    [[nodiscard]] auto code() const -> Code;
    [[nodiscard]] auto subcode() const -> SubCode;
    [[nodiscard]] auto message() const -> const char *;

    auto operator==(const Status &rhs) const -> bool
    {
        return code() == rhs.code();
    }
    auto operator!=(const Status &rhs) const -> bool
    {
        return !(*this == rhs);
    }

    // Status can be copied and moved.
    Status(const Status &rhs);
    auto operator=(const Status &rhs) -> Status &;
    Status(Status &&rhs) noexcept;
    auto operator=(Status &&rhs) noexcept -> Status &;

private:
    friend class StatusBuilder;

    explicit Status(char *state)
        : m_state(state)
    {
    }

    explicit Status(Code code, SubCode subc);

    char *m_state;
};

} // namespace pulljson

#endif // PULLJSON_STATUS_H
