// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright 2025 attrval Contributors

#include <attrval/wire/attribute_value_json.h>

#include <spdlog/spdlog.h>

#include <array>
#include <cstdint>

namespace attrval::wire {

namespace {

constexpr char kBase64Chars[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::array<int8_t, 256> makeDecodeTable() {
    std::array<int8_t, 256> table{};
    for (auto& entry : table) {
        entry = -1;
    }
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kBase64Chars[i])] = static_cast<int8_t>(i);
    }
    return table;
}

constexpr auto kBase64Decode = makeDecodeTable();

Error invalidJson(std::string message) {
    spdlog::debug("AttributeValue JSON: {}", message);
    return Error{ErrorCode::InvalidData, std::move(message)};
}

} // namespace

std::string encodeBase64(const ByteVector& data) {
    std::string base64;
    base64.reserve(((data.size() + 2) / 3) * 4);

    const auto* bytes = reinterpret_cast<const uint8_t*>(data.data());
    const std::size_t len = data.size();

    for (std::size_t i = 0; i < len; i += 3) {
        uint32_t n = static_cast<uint32_t>(bytes[i]) << 16;
        if (i + 1 < len)
            n |= static_cast<uint32_t>(bytes[i + 1]) << 8;
        if (i + 2 < len)
            n |= static_cast<uint32_t>(bytes[i + 2]);

        base64 += kBase64Chars[(n >> 18) & 0x3F];
        base64 += kBase64Chars[(n >> 12) & 0x3F];
        base64 += (i + 1 < len) ? kBase64Chars[(n >> 6) & 0x3F] : '=';
        base64 += (i + 2 < len) ? kBase64Chars[n & 0x3F] : '=';
    }
    return base64;
}

Result<ByteVector> decodeBase64(std::string_view text) {
    if (text.size() % 4 != 0) {
        return invalidJson("Invalid base64 length");
    }

    ByteVector out;
    out.reserve((text.size() / 4) * 3);

    for (std::size_t i = 0; i < text.size(); i += 4) {
        const bool last = i + 4 == text.size();
        uint32_t n = 0;
        int padding = 0;
        for (std::size_t j = 0; j < 4; ++j) {
            const char c = text[i + j];
            if (c == '=' && last && j >= 2) {
                ++padding;
                n <<= 6;
                continue;
            }
            const int8_t v = kBase64Decode[static_cast<unsigned char>(c)];
            if (v < 0 || padding > 0) {
                return invalidJson("Invalid base64 character");
            }
            n = (n << 6) | static_cast<uint32_t>(v);
        }
        // Bits below the last encoded byte must be zero so the text is canonical
        const uint32_t discarded = padding == 2 ? 0xFFFF : padding == 1 ? 0xFF : 0;
        if ((n & discarded) != 0) {
            return invalidJson("Invalid base64 padding");
        }
        out.push_back(static_cast<std::byte>((n >> 16) & 0xFF));
        if (padding < 2)
            out.push_back(static_cast<std::byte>((n >> 8) & 0xFF));
        if (padding < 1)
            out.push_back(static_cast<std::byte>(n & 0xFF));
    }
    return out;
}

nlohmann::json toJson(const AttributeValue& value) {
    nlohmann::json json = nlohmann::json::object();
    if (value.boolean) {
        json[std::string(kBoolField)] = *value.boolean;
    }
    if (value.number) {
        json[std::string(kNumberField)] = *value.number;
    }
    if (value.string) {
        json[std::string(kStringField)] = *value.string;
    }
    if (value.bytes) {
        json[std::string(kBytesField)] = encodeBase64(*value.bytes);
    }
    if (value.null) {
        json[std::string(kNullField)] = *value.null;
    }
    if (value.list) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& element : *value.list) {
            arr.push_back(toJson(element));
        }
        json[std::string(kListField)] = std::move(arr);
    }
    if (value.map) {
        nlohmann::json obj = nlohmann::json::object();
        for (const auto& [key, entry] : *value.map) {
            obj[key] = toJson(entry);
        }
        json[std::string(kMapField)] = std::move(obj);
    }
    return json;
}

Result<AttributeValue> fromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        return invalidJson("Attribute value must be a JSON object");
    }

    AttributeValue value;
    for (const auto& [name, member] : json.items()) {
        if (name == kBoolField) {
            if (!member.is_boolean()) {
                return invalidJson("BOOL must be a boolean");
            }
            value.boolean = member.get<bool>();
        } else if (name == kNumberField) {
            if (!member.is_string()) {
                return invalidJson("N must be a string");
            }
            value.number = member.get<std::string>();
        } else if (name == kStringField) {
            if (!member.is_string()) {
                return invalidJson("S must be a string");
            }
            value.string = member.get<std::string>();
        } else if (name == kBytesField) {
            if (!member.is_string()) {
                return invalidJson("B must be a base64 string");
            }
            auto decoded = decodeBase64(member.get<std::string>());
            if (!decoded) {
                return decoded.error();
            }
            value.bytes = std::move(decoded).value();
        } else if (name == kNullField) {
            if (!member.is_boolean()) {
                return invalidJson("NULL must be a boolean");
            }
            value.null = member.get<bool>();
        } else if (name == kListField) {
            if (!member.is_array()) {
                return invalidJson("L must be an array");
            }
            std::vector<AttributeValue> elements;
            elements.reserve(member.size());
            for (const auto& element : member) {
                auto parsed = fromJson(element);
                if (!parsed) {
                    return parsed.error();
                }
                elements.push_back(std::move(parsed).value());
            }
            value.list = std::move(elements);
        } else if (name == kMapField) {
            if (!member.is_object()) {
                return invalidJson("M must be an object");
            }
            std::map<std::string, AttributeValue> entries;
            for (const auto& [key, entry] : member.items()) {
                auto parsed = fromJson(entry);
                if (!parsed) {
                    return parsed.error();
                }
                entries.emplace(key, std::move(parsed).value());
            }
            value.map = std::move(entries);
        } else {
            return invalidJson("Unsupported attribute type " + name);
        }
    }
    return value;
}

} // namespace attrval::wire
