// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.
//
// strconv_fuzzer: Fuzz the numeric scanners and formatters using libFuzzer
//
// Whatever the scanners accept must survive a trip through the matching
// formatter.

#include "fuzzer.h"
#include "pulljson/strconv.h"
#include <cmath>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size)
{
    using namespace pulljson;

    FuzzedInputProvider stream(data, size);
    const auto input = stream.extract_rest();
    std::string out;

    int64_t i;
    if (const auto n = parse_int(input, i); n > 0) {
        CHECK_TRUE(n <= input.size());
        append_int(out, i);
        int64_t j;
        CHECK_EQ(parse_int(out, j), out.size());
        CHECK_EQ(i, j);
    }

    double f;
    if (const auto n = parse_float(input, f); n > 0) {
        CHECK_TRUE(n <= input.size());
        CHECK_TRUE(std::isfinite(f));
        out.clear();
        CHECK_TRUE(append_float(out, f, -1));
        double g;
        CHECK_EQ(parse_float(out, g), out.size());
        CHECK_EQ(f, g);
    }

    int64_t num;
    int dec;
    if (const auto n = parse_number(input, num, dec, ',', '.'); n > 0) {
        CHECK_TRUE(n <= input.size());
        CHECK_TRUE(dec >= 0);
    }
    return 0;
}
