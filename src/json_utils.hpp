// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>

#include "document/cnpj.hpp"
#include "document/cpf.hpp"

namespace validbr {

// Serialises the digit groups as arrays of integers, e.g.
//   {"digits":[1,2,3,4,5,6,7,8,9],"verifier_digits":[0,9]}
std::string to_json(const cpf &value);
//   {"digits":[...],"branch_digits":[0,0,0,1],"verifier_digits":[9,5]}
std::string to_json(const cnpj &value);

// Deserialisation always verifies the checksum: a structurally valid object with
// inconsistent digits throws invalid_verifier_digit, a malformed one throws
// serialization_error.
cpf cpf_from_json(std::string_view json);
cnpj cnpj_from_json(std::string_view json);

} // namespace validbr
