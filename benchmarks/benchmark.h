// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef PULLJSON_BENCHMARKS_BENCHMARK_H
#define PULLJSON_BENCHMARKS_BENCHMARK_H

#include <cstdint>
#include <random>
#include <string>

namespace pulljson::benchmarks
{

// Generates pseudorandom JSON documents. The same seed always produces the
// same document.
class DocumentGenerator
{
public:
    explicit DocumentGenerator(uint32_t seed = 42)
        : m_rng(seed)
    {
    }

    // Build an array of records until the document is at least "size" bytes
    auto generate(size_t size) -> std::string
    {
        std::string out("[");
        while (out.size() < size) {
            if (out.size() > 1) {
                out.append(",\n");
            }
            append_record(out);
        }
        out.append("]");
        return out;
    }

private:
    auto next(uint64_t t_max) -> uint64_t
    {
        std::uniform_int_distribution<uint64_t> dist(0, t_max);
        return dist(m_rng);
    }

    auto append_string(std::string &out, size_t length) -> void
    {
        out.push_back('"');
        for (size_t i = 0; i < length; ++i) {
            if (next(31) == 0) {
                out.append("\\\"");
            } else {
                out.push_back(static_cast<char>('a' + next(25)));
            }
        }
        out.push_back('"');
    }

    auto append_record(std::string &out) -> void
    {
        out.append("{\"id\": ");
        out.append(std::to_string(next(1'000'000)));
        out.append(", \"name\": ");
        append_string(out, 4 + next(12));
        out.append(", \"score\": -");
        out.append(std::to_string(next(1'000)));
        out.append(".");
        out.append(std::to_string(next(99)));
        out.append("e-3, \"tags\": [");
        const auto num_tags = next(4);
        for (uint64_t i = 0; i < num_tags; ++i) {
            if (i != 0) {
                out.append(", ");
            }
            append_string(out, 2 + next(6));
        }
        out.append("], \"active\": ");
        out.append(next(1) ? "true" : "false");
        out.append(", \"parent\": null}");
    }

    std::default_random_engine m_rng;
};

} // namespace pulljson::benchmarks

#endif // PULLJSON_BENCHMARKS_BENCHMARK_H
