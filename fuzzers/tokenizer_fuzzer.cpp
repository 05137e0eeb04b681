// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.
//
// tokenizer_fuzzer: Tokenize arbitrary bytes using libFuzzer
//
// The input is tokenized twice: once in memory, and once through a reader that
// hands out small chunks. Both passes must produce the same events and finish
// with the same status. Syntax errors must map back to a line and column.

#include "fuzzer.h"
#include "pulljson/position.h"
#include "pulljson/reader.h"
#include "pulljson/tokenizer.h"
#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

namespace pulljson
{

class ChunkReader : public Reader
{
public:
    explicit ChunkReader(const Slice &data, size_t chunk_size)
        : m_data(data),
          m_chunk_size(chunk_size)
    {
    }

    ~ChunkReader() override = default;

    auto read(size_t size, char *scratch, Slice *out) -> Status override
    {
        if (m_data.is_empty()) {
            out->clear();
            return Status::end_of_input();
        }
        size = std::min(size, std::min(m_chunk_size, m_data.size()));
        std::memcpy(scratch, m_data.data(), size);
        *out = Slice(scratch, size);
        m_data.advance(size);
        return Status::ok();
    }

private:
    Slice m_data;
    size_t m_chunk_size;
};

struct Event {
    GrammarType type;
    std::string data;
    size_t depth;
};

template <class Tokenizer>
static auto tokenize(Tokenizer &tokenizer) -> std::vector<Event>
{
    std::vector<Event> events;
    Slice data;
    for (auto type = tokenizer.next(data); type != GrammarType::kError; type = tokenizer.next(data)) {
        CHECK_FALSE(type == GrammarType::kWhitespace);
        events.push_back({type, data.to_string(), tokenizer.depth()});
    }
    CHECK_TRUE(data.is_empty());
    CHECK_TRUE(tokenizer.next(data) == GrammarType::kError);
    return events;
}

static auto check_events(const std::vector<Event> &lhs, const std::vector<Event> &rhs) -> void
{
    CHECK_EQ(lhs.size(), rhs.size());
    for (size_t i = 0; i < lhs.size(); ++i) {
        CHECK_TRUE(lhs[i].type == rhs[i].type);
        CHECK_EQ(lhs[i].data, rhs[i].data);
        CHECK_EQ(lhs[i].depth, rhs[i].depth);
    }
}

} // namespace pulljson

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size)
{
    using namespace pulljson;
    static constexpr size_t kMaxInputSize = 65'536;

    FuzzedInputProvider stream(data, size);
    Options options;
    options.min_buffer_size = stream.extract_integral_in_range<size_t>(kMinBufferSize, 64);
    options.max_buffer_size = kMaxBufferSize;
    options.trailing_comma = stream.extract_integral_in_range<int>(0, 1)
                                 ? TrailingComma::kAllow
                                 : TrailingComma::kReject;
    const auto chunk_size = stream.extract_integral_in_range<size_t>(1, 128);
    auto input = stream.extract_rest();
    if (input.size() > kMaxInputSize) {
        input.truncate(kMaxInputSize);
    }

    Tokenizer tokenizer(input, options);
    const auto expected = tokenize(tokenizer);
    const auto s = tokenizer.err();
    CHECK_FALSE(s.is_ok());

    ChunkReader reader(input, chunk_size);
    StreamTokenizer stream_tokenizer(reader, options);
    check_events(expected, tokenize(stream_tokenizer));
    const auto t = stream_tokenizer.err();
    CHECK_EQ(static_cast<int>(s.code()), static_cast<int>(t.code()));
    CHECK_EQ(static_cast<int>(s.subcode()), static_cast<int>(t.subcode()));
    CHECK_EQ(tokenizer.offset(), stream_tokenizer.offset());

    if (s.is_corruption()) {
        PositionInfo info;
        const auto p = position(input, static_cast<int64_t>(tokenizer.offset()), info);
        CHECK_TRUE(p.is_ok() || p.is_end_of_input());
        CHECK_TRUE(info.line >= 1);
        CHECK_TRUE(info.column >= 1);
    }
    return 0;
}
