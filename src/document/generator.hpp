// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>
#include <optional>
#include <random>

#include "document/cnpj.hpp"
#include "document/cpf.hpp"

namespace validbr {

enum class branch_policy : uint8_t {
    // Four uniformly distributed digits
    random,
    // Always 0001
    first,
    // Always generator_config::fixed_branch
    fixed,
};

struct generator_config {
    // Seeded from the system clock when empty
    std::optional<uint64_t> seed{std::nullopt};
    branch_policy branch{branch_policy::random};
    cnpj_branch fixed_branch{cnpj_branch::first()};
};

// Produces checksum-valid documents for test fixtures. Verifier digits are
// always computed, never compared, so generation cannot fail.
class document_generator {
public:
    explicit document_generator(const generator_config &config = {});

    document_generator(const document_generator &) = delete;
    document_generator &operator=(const document_generator &) = delete;
    document_generator(document_generator &&) noexcept = default;
    document_generator &operator=(document_generator &&) noexcept = default;
    ~document_generator() = default;

    cpf next_cpf();
    cnpj next_cnpj();
    cnpj next_cnpj(const cnpj_branch &branch);

protected:
    template <typename T> void fill(T &digits);

    std::mt19937_64 rng_;
    std::uniform_int_distribution<unsigned> digit_dist_{0, 9};
    branch_policy branch_;
    cnpj_branch fixed_branch_;
};

// Thread-local generator with the default configuration
cpf random_cpf();
cnpj random_cnpj();
cnpj random_cnpj(const cnpj_branch &branch);

} // namespace validbr
