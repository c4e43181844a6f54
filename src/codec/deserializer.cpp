// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright 2025 attrval Contributors

#include <attrval/codec/deserializer.h>
#include <attrval/serde/utf8.h>

#include <charconv>
#include <system_error>

namespace attrval::codec {

namespace detail {

Result<std::variant<int64_t, double>> parseNumber(std::string_view text) {
    // from_chars has no leading '+'
    if (text.size() > 1 && text.front() == '+' && text[1] != '-' && text[1] != '+') {
        text.remove_prefix(1);
    }
    const char* first = text.data();
    const char* last = text.data() + text.size();

    int64_t integer = 0;
    if (auto [ptr, ec] = std::from_chars(first, last, integer); ec == std::errc{} && ptr == last) {
        return std::variant<int64_t, double>{integer};
    }

    double floating = 0.0;
    if (auto [ptr, ec] = std::from_chars(first, last, floating); ec == std::errc{} && ptr == last) {
        return std::variant<int64_t, double>{floating};
    }

    return Error{ErrorCode::InvalidNumber, "Numeric Value Expected"};
}

Result<char32_t> firstCharacter(std::string_view text) {
    auto first = serde::decodeFirstCodePoint(text);
    if (!first) {
        return first.error();
    }
    return first.value().value;
}

} // namespace detail

Result<void> VariantAccess::unitVariant() const {
    if (value_->null && *value_->null) {
        return {};
    }
    return Error{ErrorCode::TypeMismatch, "Null Value Expected"};
}

} // namespace attrval::codec
