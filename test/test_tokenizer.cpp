// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "pulljson/tokenizer.h"
#include "test.h"

namespace pulljson::test
{

using Type = GrammarType;

class TokenizerTests : public testing::Test
{
public:
    Options m_options;

    explicit TokenizerTests() = default;
    ~TokenizerTests() override = default;

    auto assert_tokens(const Slice &input, const std::vector<Token> &target) -> void
    {
        Tokenizer tokenizer(input, m_options);
        ASSERT_EQ(collect_tokens(tokenizer), target) << input.to_string();
        ASSERT_TRUE(tokenizer.err().is_end_of_input()) << input.to_string() << ": " << tokenizer.err().message();
    }

    auto assert_types(const Slice &input, const std::vector<Type> &target) -> void
    {
        Tokenizer tokenizer(input, m_options);
        std::vector<Type> types;
        for (const auto &token : collect_tokens(tokenizer)) {
            types.push_back(token.type);
        }
        ASSERT_EQ(types, target) << input.to_string();
        ASSERT_TRUE(tokenizer.err().is_end_of_input()) << input.to_string() << ": " << tokenizer.err().message();
    }

    // Run until kError and return the latched status
    auto tokenize_error(const Slice &input) -> Status
    {
        Tokenizer tokenizer(input, m_options);
        (void)collect_tokens(tokenizer);
        return tokenizer.err();
    }

    auto assert_states(const Slice &input, const std::vector<State> &target) -> void
    {
        Tokenizer tokenizer(input, m_options);
        std::vector<State> states;
        for (;;) {
            Slice data;
            if (tokenizer.next(data) == Type::kError) {
                break;
            }
            states.push_back(tokenizer.state());
        }
        ASSERT_EQ(states, target) << input.to_string();
        ASSERT_TRUE(tokenizer.err().is_end_of_input());
    }
};

TEST_F(TokenizerTests, Empty)
{
    assert_types("", {});
    assert_types(" \t\n\r", {});
}

TEST_F(TokenizerTests, Literals)
{
    assert_tokens("null", {{Type::kLiteral, "null"}});
    assert_tokens(" true ", {{Type::kLiteral, "true"}});
    assert_tokens("[true, false, null]", {
                                             {Type::kStartArray, "["},
                                             {Type::kLiteral, "true"},
                                             {Type::kLiteral, "false"},
                                             {Type::kLiteral, "null"},
                                             {Type::kEndArray, "]"},
                                         });
}

TEST_F(TokenizerTests, Numbers)
{
    assert_tokens("[15.2, 0.4, 5e9, -4E-3]", {
                                                 {Type::kStartArray, "["},
                                                 {Type::kNumber, "15.2"},
                                                 {Type::kNumber, "0.4"},
                                                 {Type::kNumber, "5e9"},
                                                 {Type::kNumber, "-4E-3"},
                                                 {Type::kEndArray, "]"},
                                             });
    assert_tokens("-0", {{Type::kNumber, "-0"}});
    assert_tokens("1e+10", {{Type::kNumber, "1e+10"}});
    assert_tokens("123.456e-789", {{Type::kNumber, "123.456e-789"}});
}

TEST_F(TokenizerTests, Strings)
{
    assert_tokens(R"(["", "abc", "\"", "\\"])", {
                                                    {Type::kStartArray, "["},
                                                    {Type::kString, R"("")"},
                                                    {Type::kString, R"("abc")"},
                                                    {Type::kString, R"("\"")"},
                                                    {Type::kString, R"("\\")"},
                                                    {Type::kEndArray, "]"},
                                                });
    assert_tokens(R"("a\\\"b")", {{Type::kString, R"("a\\\"b")"}});
    assert_tokens(R"("\u00e9 caf\u00e9")", {{Type::kString, R"("\u00e9 caf\u00e9")"}});
}

TEST_F(TokenizerTests, Objects)
{
    assert_types("{}", {Type::kStartObject, Type::kEndObject});
    assert_tokens(R"({"a": "b", "c": "d"})", {
                                                 {Type::kStartObject, "{"},
                                                 {Type::kString, R"("a")"},
                                                 {Type::kString, R"("b")"},
                                                 {Type::kString, R"("c")"},
                                                 {Type::kString, R"("d")"},
                                                 {Type::kEndObject, "}"},
                                             });
}

TEST_F(TokenizerTests, Nested)
{
    assert_tokens(R"({"a": [1, 2], "b": {"c": 3}})", {
                                                         {Type::kStartObject, "{"},
                                                         {Type::kString, R"("a")"},
                                                         {Type::kStartArray, "["},
                                                         {Type::kNumber, "1"},
                                                         {Type::kNumber, "2"},
                                                         {Type::kEndArray, "]"},
                                                         {Type::kString, R"("b")"},
                                                         {Type::kStartObject, "{"},
                                                         {Type::kString, R"("c")"},
                                                         {Type::kNumber, "3"},
                                                         {Type::kEndObject, "}"},
                                                         {Type::kEndObject, "}"},
                                                     });
}

TEST_F(TokenizerTests, KeyExcludesWhitespaceAndColon)
{
    assert_tokens("{ \"key\" \t:\n 5 }", {
                                             {Type::kStartObject, "{"},
                                             {Type::kString, R"("key")"},
                                             {Type::kNumber, "5"},
                                             {Type::kEndObject, "}"},
                                         });
}

TEST_F(TokenizerTests, EarlyEndings)
{
    // The partial string is returned, then the end of the input is reported.
    assert_tokens(R"("a)", {{Type::kString, R"("a)"}});
    assert_tokens(R"("a\)", {{Type::kString, R"("a\)"}});
    assert_tokens(R"(["abc)", {{Type::kStartArray, "["}, {Type::kString, R"("abc)"}});
}

TEST_F(TokenizerTests, UnbalancedDocumentsEndCleanly)
{
    for (const auto *input : {"[", "[1,", "{", R"({"a":)", R"({"a":1)", "[[[]"}) {
        Tokenizer tokenizer(input);
        (void)collect_tokens(tokenizer);
        ASSERT_TRUE(tokenizer.err().is_end_of_input()) << input << ": " << tokenizer.err().message();
        ASSERT_GT(tokenizer.depth(), 1) << input;
    }
    Tokenizer tokenizer("[[]]");
    (void)collect_tokens(tokenizer);
    ASSERT_TRUE(tokenizer.err().is_end_of_input());
    ASSERT_EQ(tokenizer.depth(), 1);
    ASSERT_EQ(tokenizer.state(), State::kValue);
}

TEST_F(TokenizerTests, SyntaxErrors)
{
    ASSERT_TRUE(tokenize_error("true, false").is_bad_comma());
    ASSERT_TRUE(tokenize_error("[true false]").is_no_comma());
    ASSERT_TRUE(tokenize_error("]").is_bad_array_ending());
    ASSERT_TRUE(tokenize_error("}").is_bad_object_ending());
    ASSERT_TRUE(tokenize_error("{0: 1}").is_bad_object_key());
    ASSERT_TRUE(tokenize_error(R"({"a" 1})").is_bad_object_declaration());
    ASSERT_TRUE(tokenize_error("1.").is_no_comma());
    ASSERT_TRUE(tokenize_error("1e+").is_no_comma());
    ASSERT_TRUE(tokenize_error(Slice("[1, \0]", 6)).is_unexpected_nul());
    ASSERT_TRUE(tokenize_error(Slice("\"a\0b\"", 5)).is_unexpected_nul());
    ASSERT_TRUE(tokenize_error("[nul]").is_unexpected_character());
    ASSERT_TRUE(tokenize_error("+1").is_unexpected_character());
    ASSERT_TRUE(tokenize_error("-").is_unexpected_character());
    ASSERT_TRUE(tokenize_error("[1}").is_bad_object_ending());
    ASSERT_TRUE(tokenize_error(R"({"a":1])").is_bad_array_ending());
    ASSERT_TRUE(tokenize_error(R"({"a":})").is_bad_object_ending());
    ASSERT_TRUE(tokenize_error(R"({"a)").is_bad_object_key());
}

TEST_F(TokenizerTests, OnlyAllowsSingleValue)
{
    for (const auto *input : {"0, 1", "[], {}", "{}, []", "[0], {}", "{}, [0]"}) {
        ASSERT_TRUE(tokenize_error(input).is_bad_comma()) << input;
    }
    for (const auto *input : {"0 1", "[] {}", "{} []", "\"a\" \"b\""}) {
        ASSERT_TRUE(tokenize_error(input).is_no_comma()) << input;
    }
}

TEST_F(TokenizerTests, HandlesMissingSeparators)
{
    ASSERT_TRUE(tokenize_error(R"({"k""v"})").is_bad_object_declaration());
    ASSERT_TRUE(tokenize_error(R"({"k1":"v1""k2":2})").is_no_comma());
    ASSERT_TRUE(tokenize_error(R"({"k1":"v1","k2"2})").is_bad_object_declaration());
    ASSERT_TRUE(tokenize_error(R"(["1""2"])").is_no_comma());
    ASSERT_TRUE(tokenize_error(R"(["1"2])").is_no_comma());
    ASSERT_TRUE(tokenize_error(R"([1"2"])").is_no_comma());
    ASSERT_TRUE(tokenize_error(R"([1,"2"3])").is_no_comma());
}

TEST_F(TokenizerTests, TrailingCommasAreRejectedByDefault)
{
    for (const auto *input : {"[null,]", "[,1]", "[1,,2]", R"({"a":1,})", R"({,"a":1})", "[1 , ]"}) {
        ASSERT_TRUE(tokenize_error(input).is_bad_comma()) << input;
    }
}

TEST_F(TokenizerTests, TrailingCommasCanBeAllowed)
{
    m_options.trailing_comma = TrailingComma::kAllow;
    assert_types("[null,]", {Type::kStartArray, Type::kLiteral, Type::kEndArray});
    assert_types(R"({"a":1,})", {Type::kStartObject, Type::kString, Type::kNumber, Type::kEndObject});
    ASSERT_TRUE(tokenize_error("1,").is_bad_comma());
}

TEST_F(TokenizerTests, ErrorIsSticky)
{
    Tokenizer tokenizer("[1 2] [3]");
    Slice data;
    ASSERT_EQ(tokenizer.next(data), Type::kStartArray);
    ASSERT_EQ(tokenizer.next(data), Type::kNumber);
    ASSERT_EQ(tokenizer.next(data), Type::kError);
    ASSERT_TRUE(data.is_empty());
    const auto s = tokenizer.err();
    ASSERT_TRUE(s.is_no_comma());
    for (int i = 0; i < 3; ++i) {
        ASSERT_EQ(tokenizer.next(data), Type::kError);
        ASSERT_TRUE(data.is_empty());
        ASSERT_TRUE(tokenizer.err().is_no_comma());
    }
}

TEST_F(TokenizerTests, ErrorMessageHasPosition)
{
    const auto s = tokenize_error("[1,\n  true false]");
    ASSERT_TRUE(s.is_no_comma());
    ASSERT_EQ(Slice(s.message()),
              Slice("expected comma character or an array or object ending on line 2 and column 8\n"
                    "    2:   true false]\n"
                    "              ^"));
}

TEST_F(TokenizerTests, States)
{
    assert_states("null", {State::kValue});
    assert_states("[null]", {State::kArray, State::kArray, State::kValue});
    assert_states(R"({"":null})", {State::kObjectKey, State::kObjectValue, State::kObjectKey, State::kValue});
    assert_states(R"([{"a":[]}])", {
                                       State::kArray,
                                       State::kObjectKey,
                                       State::kObjectValue,
                                       State::kArray,
                                       State::kObjectKey,
                                       State::kArray,
                                       State::kValue,
                                   });
}

TEST_F(TokenizerTests, Depth)
{
    Tokenizer tokenizer("[[{}]]");
    Slice data;
    ASSERT_EQ(tokenizer.depth(), 1);
    ASSERT_EQ(tokenizer.next(data), Type::kStartArray);
    ASSERT_EQ(tokenizer.next(data), Type::kStartArray);
    ASSERT_EQ(tokenizer.next(data), Type::kStartObject);
    ASSERT_EQ(tokenizer.depth(), 4);
    ASSERT_EQ(tokenizer.next(data), Type::kEndObject);
    ASSERT_EQ(tokenizer.next(data), Type::kEndArray);
    ASSERT_EQ(tokenizer.next(data), Type::kEndArray);
    ASSERT_EQ(tokenizer.depth(), 1);
}

TEST_F(TokenizerTests, DeepNestingUsesNoRecursion)
{
    std::string input;
    for (int i = 0; i < 50'000; ++i) {
        input.append(R"({"a":[)");
    }
    for (int i = 0; i < 50'000; ++i) {
        input.append("]}");
    }
    Tokenizer tokenizer(input);
    const auto tokens = collect_tokens(tokenizer);
    ASSERT_EQ(tokens.size(), 250'000);
    ASSERT_TRUE(tokenizer.err().is_end_of_input());
    ASSERT_EQ(tokenizer.depth(), 1);
}

// Tokens are views into the input, and only whitespace and the ',' and ':'
// separators lie between them.
TEST_F(TokenizerTests, TokensReconstructInput)
{
    const std::string input = R"( {"a" : [1, -2.5e3, "x\"y"], "b":{ }, "c" :[ true,false , null ]} )";
    Tokenizer tokenizer(input);
    const auto *cursor = input.data();
    const auto *end = input.data() + input.size();
    for (;;) {
        Slice data;
        if (tokenizer.next(data) == Type::kError) {
            break;
        }
        ASSERT_GE(data.data(), cursor);
        ASSERT_LE(data.data() + data.size(), end);
        for (const auto *p = cursor; p < data.data(); ++p) {
            ASSERT_TRUE(*p == ' ' || *p == ',' || *p == ':') << "unexpected '" << *p << '\'';
        }
        cursor = data.data() + data.size();
    }
    ASSERT_TRUE(tokenizer.err().is_end_of_input());
    for (const auto *p = cursor; p < end; ++p) {
        ASSERT_EQ(*p, ' ');
    }
}

TEST_F(TokenizerTests, NeedCommaFollowsLastEvent)
{
    // A value directly after a complete value is always an error, and a value
    // directly after '[', '{' or ':' never is.
    ASSERT_TRUE(tokenize_error(R"([[] 1])").is_no_comma());
    ASSERT_TRUE(tokenize_error(R"([{} 1])").is_no_comma());
    ASSERT_TRUE(tokenize_error(R"(["s" 1])").is_no_comma());
    ASSERT_TRUE(tokenize_error(R"([null 1])").is_no_comma());
    assert_types("[[1]]", {Type::kStartArray, Type::kStartArray, Type::kNumber, Type::kEndArray, Type::kEndArray});
}

TEST_F(TokenizerTests, Offset)
{
    Tokenizer tokenizer("  [ 12 ]");
    Slice data;
    ASSERT_EQ(tokenizer.next(data), Type::kStartArray);
    ASSERT_EQ(tokenizer.offset(), 3);
    ASSERT_EQ(tokenizer.next(data), Type::kNumber);
    ASSERT_EQ(tokenizer.offset(), 6);
    ASSERT_TRUE(tokenizer.is_eof());
    tokenizer.restore();
}

TEST(GrammarType, Names)
{
    ASSERT_EQ(grammar_type_name(GrammarType::kError), "Error");
    ASSERT_EQ(grammar_type_name(GrammarType::kWhitespace), "Whitespace");
    ASSERT_EQ(grammar_type_name(GrammarType::kStartObject), "StartObject");
    ASSERT_EQ(grammar_type_name(GrammarType::kEndArray), "EndArray");
    ASSERT_EQ(grammar_type_name(static_cast<GrammarType>(100)), "Invalid(100)");
    ASSERT_EQ(state_name(State::kValue), "Value");
    ASSERT_EQ(state_name(State::kObjectKey), "ObjectKey");
    ASSERT_EQ(state_name(State::kObjectValue), "ObjectValue");
    ASSERT_EQ(state_name(State::kArray), "Array");
    ASSERT_EQ(state_name(static_cast<State>(100)), "Invalid(100)");
}

class StreamTokenizerTests : public testing::Test
{
public:
    Options m_options;

    explicit StreamTokenizerTests()
    {
        m_options.min_buffer_size = 16;
        m_options.max_buffer_size = 64;
    }

    ~StreamTokenizerTests() override = default;

    auto tokenize(const std::string &input, size_t chunk_size) -> std::vector<Token>
    {
        ChunkedReader reader(input, chunk_size);
        StreamTokenizer tokenizer(reader, m_options);
        auto tokens = collect_tokens(tokenizer);
        EXPECT_TRUE(tokenizer.err().is_end_of_input()) << tokenizer.err().message();
        return tokens;
    }
};

TEST_F(StreamTokenizerTests, MatchesSliceTokenizer)
{
    std::string input("[");
    for (int i = 0; i < 200; ++i) {
        input.append(R"({"key":"value\"", "n": -12.5e+3, "l": [true, false, null]}, )");
    }
    input.append("{}]");

    Tokenizer tokenizer(input, m_options);
    const auto expected = collect_tokens(tokenizer);
    ASSERT_TRUE(tokenizer.err().is_end_of_input());
    ASSERT_EQ(expected.size(), 2 + 200 * 12 + 2);

    for (const size_t chunk_size : {1, 2, 3, 7, 64, 1'024}) {
        ASSERT_EQ(tokenize(input, chunk_size), expected) << "chunk size " << chunk_size;
    }
}

TEST_F(StreamTokenizerTests, TokenTooLarge)
{
    const auto input = "[\"" + std::string(100, 'x') + "\"]";
    ChunkedReader reader(input, 16);
    StreamTokenizer tokenizer(reader, m_options);
    Slice data;
    ASSERT_EQ(tokenizer.next(data), Type::kStartArray);
    ASSERT_EQ(tokenizer.next(data), Type::kError);
    ASSERT_TRUE(tokenizer.err().is_buffer_exceeded());
    ASSERT_EQ(tokenizer.next(data), Type::kError);
    ASSERT_TRUE(tokenizer.err().is_buffer_exceeded());
}

TEST_F(StreamTokenizerTests, NumberTooLarge)
{
    const auto input = "[" + std::string(100, '1') + "]";
    ChunkedReader reader(input, 16);
    StreamTokenizer tokenizer(reader, m_options);
    const auto tokens = collect_tokens(tokenizer);
    ASSERT_EQ(tokens, (std::vector<Token>{{Type::kStartArray, "["}}));
    ASSERT_TRUE(tokenizer.err().is_buffer_exceeded()) << tokenizer.err().message();
}

TEST_F(StreamTokenizerTests, KeyAndColonTooFarApart)
{
    const auto input = "{\"" + std::string(30, 'k') + "\"" + std::string(40, ' ') + ": 1}";
    ChunkedReader reader(input, 16);
    StreamTokenizer tokenizer(reader, m_options);
    const auto tokens = collect_tokens(tokenizer);
    ASSERT_EQ(tokens, (std::vector<Token>{{Type::kStartObject, "{"}}));
    const auto s = tokenizer.err();
    ASSERT_TRUE(s.is_buffer_exceeded()) << s.message();
    ASSERT_FALSE(s.is_bad_object_declaration());
}

TEST_F(StreamTokenizerTests, WhitespaceBetweenTokensIsNotBuffered)
{
    const std::string padding(200, ' ');
    const auto input = padding + "[" + padding + "1," + padding + "\"a\"" + padding + "]" + padding;
    ASSERT_EQ(tokenize(input, 16), (std::vector<Token>{
                                       {Type::kStartArray, "["},
                                       {Type::kNumber, "1"},
                                       {Type::kString, R"("a")"},
                                       {Type::kEndArray, "]"},
                                   }));
}

TEST_F(StreamTokenizerTests, BufferedTokensPrecedeReadError)
{
    FailingReader reader("[1, 2]", Status::io_error("connection reset"));
    StreamTokenizer tokenizer(reader, m_options);
    const auto tokens = collect_tokens(tokenizer);
    ASSERT_EQ(tokens.size(), 4U);
    ASSERT_EQ(tokens.back(), (Token{Type::kEndArray, "]"}));
    ASSERT_TRUE(tokenizer.err().is_io_error());
    ASSERT_FALSE(tokenizer.err().is_end_of_input());
}

TEST_F(StreamTokenizerTests, ReadError)
{
    FailingReader reader("[1, 2, ", Status::io_error("connection reset"));
    StreamTokenizer tokenizer(reader, m_options);
    const auto tokens = collect_tokens(tokenizer);
    ASSERT_EQ(tokens.size(), 3);
    const auto s = tokenizer.err();
    ASSERT_TRUE(s.is_io_error());
    ASSERT_FALSE(s.is_end_of_input());
    ASSERT_EQ(Slice(s.message()), Slice("connection reset"));
}

TEST_F(StreamTokenizerTests, ReadErrorInsideString)
{
    FailingReader reader("[\"abc", Status::io_error("connection reset"));
    StreamTokenizer tokenizer(reader, m_options);
    Slice data;
    ASSERT_EQ(tokenizer.next(data), Type::kStartArray);
    ASSERT_EQ(tokenizer.next(data), Type::kError);
    ASSERT_EQ(Slice(tokenizer.err().message()), Slice("connection reset"));
}

TEST_F(StreamTokenizerTests, ErrorPastFirstWindowHasOffset)
{
    std::string input("[");
    for (int i = 0; i < 100; ++i) {
        input.append("1, ");
    }
    input.append("1 1]");
    ChunkedReader reader(input, 16);
    StreamTokenizer tokenizer(reader, m_options);
    (void)collect_tokens(tokenizer);
    const auto s = tokenizer.err();
    ASSERT_TRUE(s.is_no_comma());
    const auto expected = "expected comma character or an array or object ending: at byte offset " +
                          std::to_string(input.size() - 2);
    ASSERT_TRUE(Slice(s.message()).starts_with(expected)) << s.message();
    ASSERT_NE(std::string(s.message()).find("(line numbers are unavailable once input has been discarded"),
              std::string::npos)
        << s.message();
}

TEST_F(StreamTokenizerTests, StringReader)
{
    const std::string input(R"({"a": [1, 2], "b": {"c": 3}})");
    std::unique_ptr<Reader> reader(new_string_reader(input));
    StreamTokenizer tokenizer(*reader);
    const auto tokens = collect_tokens(tokenizer);
    ASSERT_EQ(tokens.size(), 12);
    ASSERT_TRUE(tokenizer.err().is_end_of_input());
    ASSERT_TRUE(tokenizer.is_eof());
}

} // namespace pulljson::test
