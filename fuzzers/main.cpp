// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.
//
// Replays corpus files through a fuzz target when libFuzzer is not linked in.
// Each argument is either a file or a directory, which is walked recursively.

#include "fuzzer.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size);

namespace
{

namespace fs = std::filesystem;

auto replay(const fs::path &path) -> void
{
    std::ifstream file(path, std::ios::binary);
    CHECK_TRUE(file.is_open());
    const std::string input((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
    CHECK_FALSE(file.bad());

    LLVMFuzzerTestOneInput(reinterpret_cast<const uint8_t *>(input.data()), input.size());
    std::cerr << "replayed " << path.string() << " (" << input.size() << " bytes)\n";
}

} // namespace

auto main(int argc, const char *argv[]) -> int
{
    std::vector<fs::path> corpus;
    for (int i = 1; i < argc; ++i) {
        if (fs::is_directory(argv[i])) {
            for (const auto &entry : fs::recursive_directory_iterator(argv[i])) {
                if (entry.is_regular_file()) {
                    corpus.push_back(entry.path());
                }
            }
        } else {
            corpus.emplace_back(argv[i]);
        }
    }

    for (const auto &path : corpus) {
        replay(path);
    }
    std::cerr << "replayed " << corpus.size() << " input(s)\n";
    return 0;
}
