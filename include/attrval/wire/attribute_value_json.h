// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright 2025 attrval Contributors

#pragma once

#include <attrval/core/types.h>
#include <attrval/wire/attribute_value.h>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace attrval::wire {

// DynamoDB-JSON rendering of an attribute value: one member per populated field,
// named BOOL/N/S/B/NULL/L/M, with B carried as base64.
nlohmann::json toJson(const AttributeValue& value);

// Inverse of toJson. Set types (SS/NS/BS) and unknown members are rejected.
Result<AttributeValue> fromJson(const nlohmann::json& json);

// RFC 4648 base64 with padding
std::string encodeBase64(const ByteVector& data);
Result<ByteVector> decodeBase64(std::string_view text);

} // namespace attrval::wire
