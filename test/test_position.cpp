// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "pulljson/position.h"
#include "test.h"
#include <cstdio>
#include <fstream>

namespace pulljson::test
{

struct PositionCase {
    int64_t offset;
    std::string input;
    size_t line;
    size_t column;
    bool end_of_input;
};

static auto digits(size_t n) -> std::string
{
    std::string out;
    for (size_t i = 0; i < n; ++i) {
        out.push_back(static_cast<char>('0' + i % 10));
    }
    return out;
}

class PositionTests : public testing::Test
{
public:
    explicit PositionTests() = default;
    ~PositionTests() override = default;

    static auto context_of(const Slice &input, int64_t offset) -> std::string
    {
        PositionInfo info;
        EXPECT_OK(position(input, offset, info));
        return info.context;
    }
};

TEST_F(PositionTests, LinesAndColumns)
{
    const PositionCase cases[] = {
        {0, "", 1, 1, true},
        {0, "\n", 1, 1, false},
        {1, "\n", 2, 1, true},
        {1, "\r\n", 1, 2, false},
        {-1, "x", 1, 2, true},
        {5, "x", 1, 2, true},
        {0, std::string("\0a", 2), 1, 1, true},
        {1, "\rx", 2, 1, false},
        {2, "\r\nx", 2, 1, false},
        {3, "ab\ncd", 2, 1, false},
        {4, "ab\ncd", 2, 2, false},
        {6, "a\n\n\r\nbc", 4, 2, false},
    };
    for (const auto &c : cases) {
        PositionInfo info;
        const auto s = position(c.input, c.offset, info);
        if (c.end_of_input) {
            ASSERT_TRUE(s.is_end_of_input()) << c.offset << ' ' << c.input << ": " << s.message();
        } else {
            ASSERT_OK(s);
        }
        ASSERT_EQ(info.line, c.line) << c.offset << ' ' << c.input;
        ASSERT_EQ(info.column, c.column) << c.offset << ' ' << c.input;
    }
}

TEST_F(PositionTests, Context)
{
    ASSERT_EQ(context_of("buffer", 3), "    1: buffer\n"
                                       "          ^");
    ASSERT_EQ(context_of("first\nsecond\nthird", 9), "    2: second\n"
                                                     "          ^");
    ASSERT_EQ(context_of("\n", 0), "    1: \n"
                                   "       ^");
    // Control characters are blanked out.
    ASSERT_EQ(context_of("a\tb", 2), "    1: a b\n"
                                     "         ^");
}

TEST_F(PositionTests, ShortLinesAreNotCut)
{
    ASSERT_EQ(context_of(digits(60), 59),
              "    1: 012345678901234567890123456789012345678901234567890123456789\n"
              "                                                                  ^");
}

TEST_F(PositionTests, LongLineRear)
{
    ASSERT_EQ(context_of(digits(80), 10),
              "    1: 012345678901234567890123456789012345678901234567890123456...\n"
              "                 ^");
}

TEST_F(PositionTests, LongLineMiddle)
{
    ASSERT_EQ(context_of(digits(80), 40),
              "    1: ...01234567890123456789012345678901234567890...\n"
              "                              ^");
    ASSERT_EQ(context_of(digits(85), 60),
              "    1: ...01234567890123456789012345678901234567890...\n"
              "                              ^");
}

TEST_F(PositionTests, LongLineFront)
{
    ASSERT_EQ(context_of(digits(80), 70),
              "    1: ...67890123456789012345678901234567890123456789\n"
              "                                            ^");
    ASSERT_EQ(context_of(digits(81), 60),
              "    1: ...78901234567890123456789012345678901234567890\n"
              "                                 ^");
    ASSERT_EQ(context_of(digits(84), 60),
              "    1: ...01234567890123456789012345678901234567890123\n"
              "                              ^");
}

TEST_F(PositionTests, FormatSyntaxError)
{
    PositionInfo info;
    ASSERT_OK(position("true, false", 4, info));
    ASSERT_EQ(format_syntax_error("unexpected comma character", info),
              "unexpected comma character on line 1 and column 5\n"
              "    1: true, false\n"
              "           ^");
}

TEST_F(PositionTests, Reader)
{
    std::string input;
    for (int i = 0; i < 100; ++i) {
        input.append(digits(50)).append("\n");
    }
    input.append("[1, 2 3]");
    const auto offset = static_cast<int64_t>(input.size() - 3);

    PositionInfo expected;
    ASSERT_OK(position(input, offset, expected));
    ASSERT_EQ(expected.line, 101);
    ASSERT_EQ(expected.column, 6);

    for (const size_t chunk_size : {1, 7, 4'096}) {
        ChunkedReader reader(input, chunk_size);
        PositionInfo info;
        ASSERT_OK(position(reader, offset, info));
        ASSERT_EQ(info.line, expected.line);
        ASSERT_EQ(info.column, expected.column);
        ASSERT_EQ(info.context, expected.context);
    }
}

TEST_F(PositionTests, ReaderPastEnd)
{
    ChunkedReader reader("ab\nc", 2);
    PositionInfo info;
    ASSERT_TRUE(position(reader, 100, info).is_end_of_input());
    ASSERT_EQ(info.line, 2);
    ASSERT_EQ(info.column, 2);
}

TEST_F(PositionTests, ReaderError)
{
    FailingReader reader("ab\nc", Status::io_error("disk on fire"));
    PositionInfo info;
    const auto s = position(reader, 100, info);
    ASSERT_TRUE(s.is_io_error());
    ASSERT_FALSE(s.is_end_of_input());
}

class FileReaderTests : public testing::Test
{
public:
    const std::string m_filename = testing::TempDir() + "pulljson_file_reader";

    explicit FileReaderTests() = default;

    ~FileReaderTests() override
    {
        std::remove(m_filename.c_str());
    }

    auto write_file(const std::string &data) const -> void
    {
        std::ofstream ofs(m_filename, std::ios::binary | std::ios::trunc);
        ofs << data;
    }
};

TEST_F(FileReaderTests, NotFound)
{
    Reader *reader = nullptr;
    const auto s = new_file_reader(m_filename.c_str(), reader);
    ASSERT_TRUE(s.is_not_found()) << s.message();
    ASSERT_EQ(reader, nullptr);
}

TEST_F(FileReaderTests, TokenizesFile)
{
    write_file("{\"a\": [1, 2],\n \"b\": null}\n");
    Reader *reader = nullptr;
    ASSERT_OK(new_file_reader(m_filename.c_str(), reader));
    std::unique_ptr<Reader> owned(reader);

    StreamTokenizer tokenizer(*owned);
    const auto tokens = collect_tokens(tokenizer);
    ASSERT_EQ(tokens, (std::vector<Token>{
                          {GrammarType::kStartObject, "{"},
                          {GrammarType::kString, R"("a")"},
                          {GrammarType::kStartArray, "["},
                          {GrammarType::kNumber, "1"},
                          {GrammarType::kNumber, "2"},
                          {GrammarType::kEndArray, "]"},
                          {GrammarType::kString, R"("b")"},
                          {GrammarType::kLiteral, "null"},
                          {GrammarType::kEndObject, "}"},
                      }));
    ASSERT_TRUE(tokenizer.err().is_end_of_input());
}

TEST_F(FileReaderTests, Position)
{
    write_file("[\n  1,\n  2 3\n]");
    Reader *reader = nullptr;
    ASSERT_OK(new_file_reader(m_filename.c_str(), reader));
    std::unique_ptr<Reader> owned(reader);

    PositionInfo info;
    ASSERT_OK(position(*owned, 11, info));
    ASSERT_EQ(info.line, 3);
    ASSERT_EQ(info.column, 5);
    ASSERT_EQ(info.context, "    3:   2 3\n"
                            "           ^");
}

} // namespace pulljson::test
