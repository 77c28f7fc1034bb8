// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <memory>
#include <re2/re2.h>
#include <string_view>
#include <variant>
#include <vector>

#include "document/cnpj.hpp"
#include "document/cpf.hpp"
#include "exception.hpp"

namespace validbr {

struct scanner_config {
    bool cpf{true};
    bool cnpj{true};
    // Stop scanning once this many valid documents have been found
    std::size_t max_matches{64};
};

struct scan_match {
    document_type type;
    // Byte offset and length of the document within the scanned text
    std::size_t offset;
    std::size_t length;
    std::variant<cpf, cnpj> value;
};

// Finds documents written in canonical form or as bare digits within free
// text. Candidates with inconsistent verifier digits are skipped.
class document_scanner {
public:
    explicit document_scanner(const scanner_config &config = {});
    ~document_scanner() = default;
    document_scanner(const document_scanner &) = delete;
    document_scanner(document_scanner &&) noexcept = default;
    document_scanner &operator=(const document_scanner &) = delete;
    document_scanner &operator=(document_scanner &&) noexcept = default;

    [[nodiscard]] std::vector<scan_match> scan(std::string_view text) const;
    [[nodiscard]] std::string_view pattern() const { return regex_->pattern(); }

protected:
    scanner_config config_;
    std::unique_ptr<re2::RE2> regex_{nullptr};
};

} // namespace validbr
