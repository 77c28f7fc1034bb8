// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <chrono>
#include <cstdint>
#include <random>

#include "checksum/mod11_checksum.hpp"
#include "document/cnpj.hpp"
#include "document/common.hpp"
#include "document/cpf.hpp"
#include "document/generator.hpp"
#include "log.hpp"

namespace validbr {

namespace {
// System clock is used to provide a more unique seed compared to the
// monotonic clock.
using clock = std::chrono::system_clock;

uint64_t clock_seed() { return static_cast<uint64_t>(clock::now().time_since_epoch().count()); }

document_generator &local_generator()
{
    static thread_local document_generator generator;
    return generator;
}

} // namespace

document_generator::document_generator(const generator_config &config)
    : rng_(config.seed.value_or(clock_seed())), branch_(config.branch),
      fixed_branch_(config.fixed_branch)
{
    VALIDBR_DEBUG("Document generator initialised, seeded: {}, branch policy: {}",
        config.seed.has_value(), static_cast<unsigned>(config.branch));
}

template <typename T> void document_generator::fill(T &digits)
{
    for (auto &d : digits) { d = static_cast<uint8_t>(digit_dist_(rng_)); }
}

cpf document_generator::next_cpf()
{
    // Repeated digit sequences are not valid documents, draw again
    cpf::digits_type digits{};
    do {
        fill(digits);
    } while (mod11_checksum::is_uniform(digits));
    return cpf::from_digits(digits);
}

cnpj document_generator::next_cnpj()
{
    switch (branch_) {
    case branch_policy::first:
        return next_cnpj(cnpj_branch::first());
    case branch_policy::fixed:
        return next_cnpj(fixed_branch_);
    case branch_policy::random:
        break;
    }

    cnpj::digits_type digits{};
    cnpj::branch_type branch{};
    do {
        fill(digits);
        fill(branch);
    } while (mod11_checksum::is_uniform(detail::concat(digits, branch)));
    return cnpj::from_digits(digits, branch);
}

cnpj document_generator::next_cnpj(const cnpj_branch &branch)
{
    cnpj::digits_type digits{};
    do {
        fill(digits);
    } while (mod11_checksum::is_uniform(detail::concat(digits, branch.digits())));
    return cnpj::from_digits(digits, branch);
}

cpf random_cpf() { return local_generator().next_cpf(); }

cnpj random_cnpj() { return local_generator().next_cnpj(); }

cnpj random_cnpj(const cnpj_branch &branch) { return local_generator().next_cnpj(branch); }

} // namespace validbr
