// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "pulljson/reader.h"
#include "internal.h"
#include <cstring>

namespace pulljson
{

Reader::Reader() = default;

Reader::~Reader() = default;

namespace
{

class StringReader : public Reader
{
public:
    explicit StringReader(const Slice &input)
        : m_input(input)
    {
    }

    ~StringReader() override = default;

    auto read(size_t size, char *scratch, Slice *out) -> Status override
    {
        PULLJSON_EXPECT_NE(out, nullptr);
        if (m_input.is_empty()) {
            out->clear();
            return Status::end_of_input();
        }
        const auto n = size < m_input.size() ? size : m_input.size();
        std::memcpy(scratch, m_input.data(), n);
        m_input.advance(n);
        *out = Slice(scratch, n);
        return Status::ok();
    }

private:
    Slice m_input;
};

} // namespace

auto new_string_reader(const Slice &input) -> Reader *
{
    return new StringReader(input);
}

} // namespace pulljson
