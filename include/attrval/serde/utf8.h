// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright 2025 attrval Contributors

#pragma once

#include <attrval/core/types.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace attrval::serde {

struct CodePoint {
    char32_t value = 0;
    std::size_t length = 0; ///< bytes consumed from the input
};

// False for surrogates and values above U+10FFFF
bool isScalarValue(char32_t c);

/**
 * @brief Decode the first UTF-8 code point of a string
 *
 * Overlong forms, surrogates and truncated sequences fail with InvalidData; an
 * empty string fails with EmptyCharacter.
 */
Result<CodePoint> decodeFirstCodePoint(std::string_view text);

// Append c as UTF-8; c must be a scalar value
void appendUtf8(std::string& out, char32_t c);

} // namespace attrval::serde
