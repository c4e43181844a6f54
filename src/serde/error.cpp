// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright 2025 attrval Contributors

#include <attrval/serde/error.h>

#include <fmt/format.h>

namespace attrval::serde {

namespace {

std::string oneOf(std::span<const std::string_view> names) {
    switch (names.size()) {
        case 0:
            return "";
        case 1:
            return fmt::format("`{}`", names[0]);
        case 2:
            return fmt::format("`{}` or `{}`", names[0], names[1]);
        default:
            break;
    }
    std::string out = "one of ";
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            out.append(", ");
        }
        out.append(fmt::format("`{}`", names[i]));
    }
    return out;
}

} // namespace

Error custom(std::string message) {
    return Error{ErrorCode::Custom, std::move(message)};
}

Error invalidType(std::string_view unexpected, std::string_view expected) {
    return custom(fmt::format("invalid type: {}, expected {}", unexpected, expected));
}

Error invalidValue(std::string_view unexpected, std::string_view expected) {
    return custom(fmt::format("invalid value: {}, expected {}", unexpected, expected));
}

Error invalidLength(std::size_t length, std::string_view expected) {
    return custom(fmt::format("invalid length {}, expected {}", length, expected));
}

Error unknownVariant(std::string_view variant, std::span<const std::string_view> expected) {
    if (expected.empty()) {
        return custom(fmt::format("unknown variant `{}`, there are no variants", variant));
    }
    return custom(fmt::format("unknown variant `{}`, expected {}", variant, oneOf(expected)));
}

Error missingField(std::string_view field) {
    return custom(fmt::format("missing field `{}`", field));
}

Error duplicateField(std::string_view field) {
    return custom(fmt::format("duplicate field `{}`", field));
}

} // namespace attrval::serde
