// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef PULLJSON_READER_H
#define PULLJSON_READER_H

#include "slice.h"
#include "status.h"

namespace pulljson
{

// Source of bytes for a ReaderBuffer
class Reader
{
public:
    explicit Reader();
    virtual ~Reader();

    Reader(Reader &) = delete;
    void operator=(Reader &) = delete;

    // Attempt to read up to `size` bytes from the source.
    //
    // Reads into `scratch`, which must point to at least `size` bytes of
    // available memory. On success, sets "*out" to point to the data that was
    // read, which may be less than what was requested. Once the source is
    // exhausted, returns Status::end_of_input(), possibly together with the
    // final bytes. Any other non-OK status is a read error and is reported
    // verbatim by the tokenizer.
    virtual auto read(size_t size, char *scratch, Slice *out) -> Status = 0;
};

// Create a reader over an in-memory buffer
// The bytes referred to by "input" must outlive the reader. The caller owns
// the returned object and must delete it when finished.
[[nodiscard]] auto new_string_reader(const Slice &input) -> Reader *;

// Open "filename" for sequential reading
// On success, sets "out" to a new reader that the caller must delete.
auto new_file_reader(const char *filename, Reader *&out) -> Status;

} // namespace pulljson

#endif // PULLJSON_READER_H
