// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <vector>

#include <re2/re2.h>

#include "document/cnpj.hpp"
#include "document/cpf.hpp"
#include "document/scanner.hpp"
#include "exception.hpp"
#include "log.hpp"

namespace validbr {

namespace {

// Group 1 captures a CNPJ, group 2 a CPF. The CNPJ alternative comes first so
// that a 14 digit run is never split into a CPF candidate.
constexpr std::string_view document_regex =
    R"(\b(?:(\d{2}\.\d{3}\.\d{3}/\d{4}-\d{2}|\d{14})|(\d{3}\.\d{3}\.\d{3}-\d{2}|\d{11}))\b)";

} // namespace

document_scanner::document_scanner(const scanner_config &config) : config_(config)
{
    if (!config_.cpf && !config_.cnpj) {
        throw std::invalid_argument("document scanner requires at least one document type");
    }

    constexpr unsigned regex_max_mem = 512 * 1024;

    re2::RE2::Options options;
    options.set_max_mem(regex_max_mem);
    options.set_log_errors(false);

    regex_ = std::make_unique<re2::RE2>(document_regex, options);
    if (!regex_->ok()) {
        throw std::runtime_error("invalid document regular expression: " + regex_->error_arg());
    }
}

std::vector<scan_match> document_scanner::scan(std::string_view text) const
{
    std::vector<scan_match> matches;
    if (text.data() == nullptr || config_.max_matches == 0) {
        return matches;
    }

    std::array<re2::StringPiece, 3> groups{};
    std::size_t start = 0;
    while (start < text.size() &&
           regex_->Match(text, start, text.size(), re2::RE2::UNANCHORED, groups.data(),
               static_cast<int>(groups.size()))) {
        const std::string_view whole = groups[0];
        const std::string_view cnpj_group = groups[1];
        const std::string_view cpf_group = groups[2];
        const auto offset = static_cast<std::size_t>(whole.data() - text.data());
        start = offset + whole.size();
        if (whole.empty()) {
            break;
        }

        if (!cnpj_group.empty()) {
            if (config_.cnpj && cnpj::is_valid(cnpj_group)) {
                matches.push_back(
                    {document_type::cnpj, offset, whole.size(), cnpj::parse(cnpj_group)});
            }
        } else if (!cpf_group.empty()) {
            if (config_.cpf && cpf::is_valid(cpf_group)) {
                matches.push_back(
                    {document_type::cpf, offset, whole.size(), cpf::parse(cpf_group)});
            }
        }

        if (matches.size() >= config_.max_matches) {
            break;
        }
    }

    VALIDBR_DEBUG("Document scan found {} valid documents in {} bytes", matches.size(),
        text.size());
    return matches;
}

} // namespace validbr
