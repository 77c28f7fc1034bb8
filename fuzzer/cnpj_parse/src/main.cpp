// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstdint>
#include <cstdlib>

#include "../common/afl_wrapper.hpp"
#include "../common/utils.hpp"
#include "document/cnpj.hpp"
#include "exception.hpp"

using namespace validbr_afl;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size)
{
    auto input = bytes_to_string_view(data, size);
    auto valid = validbr::cnpj::is_valid(input);

    try {
        auto value = validbr::cnpj::parse(input);
        // Parsing and validation must always agree, and formatting must round-trip
        if (!valid || validbr::cnpj::parse(value.to_string()) != value) {
            abort();
        }
    } catch (const validbr::document_error &) {
        if (valid) {
            abort();
        }
    }

    prevent_optimization(valid);
    return 0;
}

AFL_FUZZ_TARGET("cnpj_parse_fuzz", LLVMFuzzerTestOneInput)
