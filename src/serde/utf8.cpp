// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright 2025 attrval Contributors

#include <attrval/serde/utf8.h>

namespace attrval::serde {

namespace {

Error invalidUtf8() {
    return Error{ErrorCode::InvalidData, "Invalid UTF-8 String Value"};
}

} // namespace

bool isScalarValue(char32_t c) {
    return c <= 0x10FFFF && (c < 0xD800 || c > 0xDFFF);
}

Result<CodePoint> decodeFirstCodePoint(std::string_view text) {
    if (text.empty()) {
        return Error{ErrorCode::EmptyCharacter, "Non-Zero Length String Expected"};
    }

    const auto lead = static_cast<unsigned char>(text[0]);
    std::size_t length = 0;
    char32_t c = 0;
    if (lead < 0x80) {
        return CodePoint{static_cast<char32_t>(lead), 1};
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        c = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        c = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        c = lead & 0x07;
    } else {
        return invalidUtf8();
    }

    if (text.size() < length) {
        return invalidUtf8();
    }
    for (std::size_t i = 1; i < length; ++i) {
        const auto continuation = static_cast<unsigned char>(text[i]);
        if ((continuation & 0xC0) != 0x80) {
            return invalidUtf8();
        }
        c = (c << 6) | (continuation & 0x3F);
    }

    static constexpr char32_t kMinimum[] = {0, 0, 0x80, 0x800, 0x10000};
    if (c < kMinimum[length] || !isScalarValue(c)) {
        return invalidUtf8();
    }
    return CodePoint{c, length};
}

void appendUtf8(std::string& out, char32_t c) {
    if (c < 0x80) {
        out.push_back(static_cast<char>(c));
    } else if (c < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (c >> 6)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else if (c < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (c >> 12)));
        out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (c >> 18)));
        out.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    }
}

} // namespace attrval::serde
