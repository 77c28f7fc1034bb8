// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstdint>
#include <cstdlib>

#include "../common/afl_wrapper.hpp"
#include "../common/utils.hpp"
#include "document/scanner.hpp"

using namespace validbr_afl;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size)
{
    static const validbr::document_scanner scanner;

    auto input = bytes_to_string_view(data, size);
    auto matches = scanner.scan(input);
    for (const auto &match : matches) {
        if (match.offset + match.length > input.size()) {
            abort();
        }
    }

    prevent_optimization(matches);
    return 0;
}

AFL_FUZZ_TARGET("document_scanner_fuzz", LLVMFuzzerTestOneInput)
