// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <unistd.h>
#include <vector>

#define AFL_LOOP_ITERATIONS 1000

namespace validbr_afl {

using fuzz_function = std::function<int(const uint8_t *, size_t)>;

// Standalone mode, reads a single input from a file or stdin
inline int run_standalone(const char *name, const fuzz_function &fuzz_func, int argc, char **argv)
{
    std::vector<uint8_t> data;

    if (argc > 1) {
        std::ifstream file(argv[1], std::ios::binary);
        if (!file) {
            std::cerr << "Failed to open file: " << argv[1] << '\n';
            return 1;
        }
        data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    } else {
        data.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    if (data.empty()) {
        std::cerr << "No input data provided\n";
        return 1;
    }

    std::cout << "Running " << name << " with " << data.size() << " bytes of input\n";
    int result = fuzz_func(data.data(), data.size());
    std::cout << "Fuzzer returned: " << result << '\n';
    return result;
}

inline int run_afl_iteration(const fuzz_function &fuzz_func)
{
    static uint8_t input_buffer[64 * 1024];

    ssize_t len = read(STDIN_FILENO, input_buffer, sizeof(input_buffer));
    if (len <= 0) {
        return 0;
    }

    fuzz_func(input_buffer, static_cast<size_t>(len));
    return 1;
}

} // namespace validbr_afl

// AFL++ persistent mode entry point, falls back to standalone mode when an
// input file is given on the command line.
#define AFL_FUZZ_TARGET(name, fuzz_func)                                                           \
    int main(int argc, char **argv)                                                                \
    {                                                                                              \
        if (argc > 1) {                                                                            \
            return validbr_afl::run_standalone(name, fuzz_func, argc, argv);                       \
        }                                                                                          \
                                                                                                   \
        while (__AFL_LOOP(AFL_LOOP_ITERATIONS)) {                                                  \
            if (!validbr_afl::run_afl_iteration(fuzz_func)) {                                      \
                break;                                                                             \
            }                                                                                      \
        }                                                                                          \
                                                                                                   \
        return 0;                                                                                  \
    }
