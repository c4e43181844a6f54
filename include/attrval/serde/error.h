// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright 2025 attrval Contributors

#pragma once

#include <attrval/core/types.h>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace attrval::serde {

// Errors raised by the value side of the visitation protocol. All of them carry
// ErrorCode::Custom; only the message differs.

Error custom(std::string message);

// "invalid type: <unexpected>, expected <expected>"
Error invalidType(std::string_view unexpected, std::string_view expected);

// "invalid value: <unexpected>, expected <expected>"
Error invalidValue(std::string_view unexpected, std::string_view expected);

// "invalid length <length>, expected <expected>"
Error invalidLength(std::size_t length, std::string_view expected);

// "unknown variant `<variant>`, expected one of `A`, `B`, `C`"
Error unknownVariant(std::string_view variant, std::span<const std::string_view> expected);

Error missingField(std::string_view field);
Error duplicateField(std::string_view field);

} // namespace attrval::serde
