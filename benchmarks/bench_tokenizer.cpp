// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "benchmark.h"
#include "benchmark/benchmark.h"
#include "pulljson/reader.h"
#include "pulljson/strconv.h"
#include "pulljson/tokenizer.h"
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <vector>

#define CHECK_END_OF_INPUT(expr)                             \
    do {                                                     \
        auto check_s = (expr);                               \
        if (!check_s.is_end_of_input()) {                    \
            std::fprintf(stderr, "%s\n", check_s.message()); \
            std::abort();                                    \
        }                                                    \
    } while (0)

using namespace pulljson;
using namespace pulljson::benchmarks;

static constexpr size_t kDocumentSize = 1'024 * 1'024;

static auto document() -> const std::string &
{
    static const auto s_document = DocumentGenerator().generate(kDocumentSize);
    return s_document;
}

template <class Tokenizer>
static auto drain(Tokenizer &tokenizer) -> size_t
{
    size_t num_tokens = 0;
    Slice data;
    while (tokenizer.next(data) != GrammarType::kError) {
        benchmark::DoNotOptimize(data.data());
        ++num_tokens;
    }
    CHECK_END_OF_INPUT(tokenizer.err());
    return num_tokens;
}

static auto BM_Tokenizer(benchmark::State &state) -> void
{
    const auto &input = document();
    size_t num_tokens = 0;
    for (auto _ : state) {
        Tokenizer tokenizer(input);
        num_tokens = drain(tokenizer);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * input.size()));
    state.counters["tokens"] = static_cast<double>(num_tokens);
}

BENCHMARK(BM_Tokenizer);

static auto BM_StreamTokenizer(benchmark::State &state) -> void
{
    const auto &input = document();
    Options options;
    options.min_buffer_size = static_cast<size_t>(state.range(0));
    options.max_buffer_size = static_cast<size_t>(state.range(0));
    for (auto _ : state) {
        std::unique_ptr<Reader> reader(new_string_reader(input));
        StreamTokenizer tokenizer(*reader, options);
        benchmark::DoNotOptimize(drain(tokenizer));
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * input.size()));
}

BENCHMARK(BM_StreamTokenizer)
    ->Arg(256)
    ->Arg(4'096)
    ->Arg(65'536);

static auto BM_ParseFloat(benchmark::State &state) -> void
{
    static const char *const kInputs[] = {
        "0",
        "-1.5",
        "3.141592653589793",
        "6.02214076e23",
        "-2.2250738585072014e-308",
        "12345.678",
    };
    constexpr size_t kNumInputs = sizeof(kInputs) / sizeof(kInputs[0]);
    size_t i = 0;
    for (auto _ : state) {
        double f;
        benchmark::DoNotOptimize(parse_float(kInputs[i++ % kNumInputs], f));
        benchmark::DoNotOptimize(f);
    }
}

BENCHMARK(BM_ParseFloat);

static auto BM_AppendFloat(benchmark::State &state) -> void
{
    const auto prec = static_cast<int>(state.range(0));
    std::vector<double> values;
    for (int i = 1; i <= 64; ++i) {
        values.push_back(i % 2 ? 1.0 / i : -1e6 / i);
    }
    std::string out;
    size_t i = 0;
    for (auto _ : state) {
        out.clear();
        benchmark::DoNotOptimize(append_float(out, values[i++ % values.size()], prec));
    }
}

BENCHMARK(BM_AppendFloat)
    ->Arg(-1)
    ->Arg(3);
