// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "document/cnpj.hpp"
#include "document/cpf.hpp"
#include "exception.hpp"
#include "json_utils.hpp"
#include "log.hpp"

namespace validbr {

namespace {

template <std::size_t N>
void write_digits(rapidjson::Writer<rapidjson::StringBuffer> &writer, std::string_view key,
    const std::array<uint8_t, N> &digits)
{
    writer.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
    writer.StartArray();
    for (auto d : digits) { writer.Uint(d); }
    writer.EndArray();
}

rapidjson::Document parse_json(std::string_view json)
{
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError()) {
        throw serialization_error(fmt::format("invalid json at offset {}: {}",
            doc.GetErrorOffset(), rapidjson::GetParseError_En(doc.GetParseError())));
    }

    if (!doc.IsObject()) {
        throw serialization_error("invalid json: expected an object");
    }

    return doc;
}

// Values above 9 are kept as-is so that the validating constructor reports
// them as out of bounds.
template <std::size_t N>
std::array<uint8_t, N> read_digits(const rapidjson::Value &object, std::string_view key)
{
    auto it = object.FindMember(rapidjson::StringRef(key.data(), key.size()));
    if (it == object.MemberEnd()) {
        throw serialization_error(fmt::format("missing member '{}'", key));
    }

    const auto &array = it->value;
    if (!array.IsArray()) {
        throw serialization_error(fmt::format("member '{}' is not an array", key));
    }

    if (array.Size() != N) {
        throw serialization_error(fmt::format(
            "member '{}' has {} elements, expected {}", key, array.Size(), N));
    }

    std::array<uint8_t, N> digits{};
    for (rapidjson::SizeType i = 0; i < N; ++i) {
        const auto &element = array[i];
        if (!element.IsUint() || element.GetUint() > UINT8_MAX) {
            throw serialization_error(
                fmt::format("member '{}' element {} is not a digit", key, i));
        }
        digits[i] = static_cast<uint8_t>(element.GetUint());
    }
    return digits;
}

} // namespace

std::string to_json(const cpf &value)
{
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    write_digits(writer, "digits", value.digits());
    write_digits(writer, "verifier_digits", value.verifier_digits());
    writer.EndObject();

    return {buffer.GetString(), buffer.GetSize()};
}

std::string to_json(const cnpj &value)
{
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    write_digits(writer, "digits", value.digits());
    write_digits(writer, "branch_digits", value.branch_digits());
    write_digits(writer, "verifier_digits", value.verifier_digits());
    writer.EndObject();

    return {buffer.GetString(), buffer.GetSize()};
}

cpf cpf_from_json(std::string_view json)
{
    auto doc = parse_json(json);
    auto digits = read_digits<cpf::digit_count>(doc, "digits");
    auto verifier_digits = read_digits<cpf::verifier_count>(doc, "verifier_digits");

    VALIDBR_TRACE("Deserialised cpf candidate, verifying checksum");
    return cpf::make(digits, verifier_digits);
}

cnpj cnpj_from_json(std::string_view json)
{
    auto doc = parse_json(json);
    auto digits = read_digits<cnpj::digit_count>(doc, "digits");
    auto branch_digits = read_digits<cnpj::branch_count>(doc, "branch_digits");
    auto verifier_digits = read_digits<cnpj::verifier_count>(doc, "verifier_digits");

    VALIDBR_TRACE("Deserialised cnpj candidate, verifying checksum");
    return cnpj::make(digits, branch_digits, verifier_digits);
}

} // namespace validbr
