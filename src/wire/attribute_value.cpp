// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright 2025 attrval Contributors

#include <attrval/wire/attribute_value.h>

#include <algorithm>
#include <fmt/format.h>

namespace attrval::wire {

namespace {

void appendQuoted(std::string& out, std::string_view text) {
    out.push_back('"');
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('"');
}

void appendDescription(std::string& out, const AttributeValue& value) {
    out.push_back('{');
    bool first = true;
    auto separator = [&]() {
        if (!first) {
            out.append(", ");
        }
        first = false;
    };

    if (value.boolean) {
        separator();
        out.append(kBoolField).append(":").append(*value.boolean ? "true" : "false");
    }
    if (value.number) {
        separator();
        out.append(kNumberField).append(":");
        appendQuoted(out, *value.number);
    }
    if (value.string) {
        separator();
        out.append(kStringField).append(":");
        appendQuoted(out, *value.string);
    }
    if (value.bytes) {
        separator();
        out.append(kBytesField).append(":<");
        for (std::size_t i = 0; i < value.bytes->size(); ++i) {
            if (i > 0) {
                out.push_back(' ');
            }
            out.append(fmt::format("{:02x}", std::to_integer<unsigned>((*value.bytes)[i])));
        }
        out.push_back('>');
    }
    if (value.null) {
        separator();
        out.append(kNullField).append(":").append(*value.null ? "true" : "false");
    }
    if (value.list) {
        separator();
        out.append(kListField).append(":[");
        for (std::size_t i = 0; i < value.list->size(); ++i) {
            if (i > 0) {
                out.append(", ");
            }
            appendDescription(out, (*value.list)[i]);
        }
        out.push_back(']');
    }
    if (value.map) {
        separator();
        out.append(kMapField).append(":{");
        bool firstEntry = true;
        for (const auto& [key, entry] : *value.map) {
            if (!firstEntry) {
                out.append(", ");
            }
            firstEntry = false;
            appendQuoted(out, key);
            out.push_back(':');
            appendDescription(out, entry);
        }
        out.push_back('}');
    }
    out.push_back('}');
}

} // namespace

const char* kindToString(AttributeKind kind) {
    switch (kind) {
        case AttributeKind::Bool:
            return "BOOL";
        case AttributeKind::List:
            return "L";
        case AttributeKind::Map:
            return "M";
        case AttributeKind::Number:
            return "N";
        case AttributeKind::Null:
            return "NULL";
        case AttributeKind::String:
            return "S";
        case AttributeKind::Bytes:
            return "B";
        case AttributeKind::None:
            return "none";
    }
    return "none";
}

AttributeValue AttributeValue::fromBool(bool value) {
    AttributeValue av;
    av.boolean = value;
    return av;
}

AttributeValue AttributeValue::fromNumber(std::string text) {
    AttributeValue av;
    av.number = std::move(text);
    return av;
}

AttributeValue AttributeValue::fromString(std::string text) {
    AttributeValue av;
    av.string = std::move(text);
    return av;
}

AttributeValue AttributeValue::fromBytes(ByteVector data) {
    AttributeValue av;
    av.bytes = std::move(data);
    return av;
}

AttributeValue AttributeValue::fromNull() {
    AttributeValue av;
    av.null = true;
    return av;
}

AttributeValue AttributeValue::fromList(std::vector<AttributeValue> values) {
    AttributeValue av;
    av.list = std::move(values);
    return av;
}

AttributeValue AttributeValue::fromMap(std::map<std::string, AttributeValue> values) {
    AttributeValue av;
    av.map = std::move(values);
    return av;
}

AttributeKind kindOf(const AttributeValue& value) noexcept {
    if (value.boolean) {
        return AttributeKind::Bool;
    }
    if (value.list) {
        return AttributeKind::List;
    }
    if (value.map) {
        return AttributeKind::Map;
    }
    if (value.number) {
        return AttributeKind::Number;
    }
    if (value.null) {
        return AttributeKind::Null;
    }
    if (value.string) {
        return AttributeKind::String;
    }
    if (value.bytes) {
        return AttributeKind::Bytes;
    }
    return AttributeKind::None;
}

bool isWellFormed(const AttributeValue& value) noexcept {
    int populated = 0;
    populated += value.boolean.has_value();
    populated += value.number.has_value();
    populated += value.string.has_value();
    populated += value.bytes.has_value();
    populated += value.null.has_value();
    populated += value.list.has_value();
    populated += value.map.has_value();
    return populated == 1;
}

std::size_t depth(const AttributeValue& value) {
    std::size_t deepest = 0;
    if (value.list) {
        for (const auto& element : *value.list) {
            deepest = std::max(deepest, depth(element));
        }
    }
    if (value.map) {
        for (const auto& [_, entry] : *value.map) {
            deepest = std::max(deepest, depth(entry));
        }
    }
    return deepest + 1;
}

std::string describe(const AttributeValue& value) {
    std::string out;
    appendDescription(out, value);
    return out;
}

std::ostream& operator<<(std::ostream& os, const AttributeValue& value) {
    return os << describe(value);
}

} // namespace attrval::wire
