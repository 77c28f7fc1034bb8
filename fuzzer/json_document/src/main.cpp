// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstdint>
#include <cstdlib>

#include "../common/afl_wrapper.hpp"
#include "../common/utils.hpp"
#include "exception.hpp"
#include "json_utils.hpp"

using namespace validbr_afl;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size)
{
    auto input = bytes_to_string_view(data, size);

    try {
        auto value = validbr::cpf_from_json(input);
        if (validbr::cpf_from_json(validbr::to_json(value)) != value) {
            abort();
        }
    } catch (const validbr::document_error &) {
    } catch (const validbr::serialization_error &) {}

    try {
        auto value = validbr::cnpj_from_json(input);
        if (validbr::cnpj_from_json(validbr::to_json(value)) != value) {
            abort();
        }
    } catch (const validbr::document_error &) {
    } catch (const validbr::serialization_error &) {}

    return 0;
}

AFL_FUZZ_TARGET("json_document_fuzz", LLVMFuzzerTestOneInput)
