// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

// Print the grammar events in a JSON file, one per line
//
//     dump_tokens [-v] <filename>
//
// Exits with status 1 if the file could not be tokenized, or if the document
// is incomplete.

#include "pulljson/reader.h"
#include "pulljson/tokenizer.h"
#include <cstdio>
#include <cstring>
#include <memory>

using namespace pulljson;

static auto usage() -> int
{
    std::fputs("usage: dump_tokens [-v] <filename>\n", stderr);
    return 2;
}

auto main(int argc, const char *argv[]) -> int
{
    Options options;
    const char *filename = nullptr;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-v") == 0) {
            options.log_level = LogLevel::kTrace;
        } else if (filename == nullptr) {
            filename = argv[i];
        } else {
            return usage();
        }
    }
    if (filename == nullptr) {
        return usage();
    }

    Reader *file;
    auto s = new_file_reader(filename, file);
    if (!s.is_ok()) {
        std::fprintf(stderr, "%s\n", s.message());
        return 1;
    }
    std::unique_ptr<Reader> reader(file);

    StreamTokenizer tokenizer(*reader, options);
    Slice data;
    for (auto type = tokenizer.next(data); type != GrammarType::kError; type = tokenizer.next(data)) {
        std::printf("%*s%s %.*s\n", static_cast<int>(2 * (tokenizer.depth() - 1)), "",
                    grammar_type_name(type).c_str(), static_cast<int>(data.size()), data.data());
    }
    s = tokenizer.err();
    if (!s.is_end_of_input()) {
        std::fprintf(stderr, "%s\n", s.message());
        return 1;
    } else if (tokenizer.depth() != 1 || tokenizer.state() != State::kValue) {
        std::fprintf(stderr, "%s: document ends at depth %zu\n", filename, tokenizer.depth());
        return 1;
    }
    return 0;
}
