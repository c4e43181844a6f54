// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright 2025 attrval Contributors

#pragma once

#include <attrval/core/types.h>

#include <cstddef>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace attrval::wire {

// Field names of the store's attribute value record
inline constexpr std::string_view kBoolField = "BOOL";
inline constexpr std::string_view kNumberField = "N";
inline constexpr std::string_view kStringField = "S";
inline constexpr std::string_view kBytesField = "B";
inline constexpr std::string_view kNullField = "NULL";
inline constexpr std::string_view kListField = "L";
inline constexpr std::string_view kMapField = "M";

/**
 * @brief Populated field of an attribute value
 */
enum class AttributeKind { Bool, List, Map, Number, Null, String, Bytes, None };

const char* kindToString(AttributeKind kind);

/**
 * @brief Tagged-union value exchanged with the key/attribute store
 *
 * Each member mirrors one optional field of the wire record. A value produced by
 * the codec has exactly one member populated; values received from elsewhere are
 * not trusted to follow that rule.
 */
struct AttributeValue {
    std::optional<bool> boolean;                              ///< BOOL
    std::optional<std::string> number;                        ///< N (decimal text)
    std::optional<std::string> string;                        ///< S
    std::optional<ByteVector> bytes;                          ///< B
    std::optional<bool> null;                                 ///< NULL (true when null)
    std::optional<std::vector<AttributeValue>> list;          ///< L
    std::optional<std::map<std::string, AttributeValue>> map; ///< M

    static AttributeValue fromBool(bool value);
    static AttributeValue fromNumber(std::string text);
    static AttributeValue fromString(std::string text);
    static AttributeValue fromBytes(ByteVector data);
    static AttributeValue fromNull();
    static AttributeValue fromList(std::vector<AttributeValue> values);
    static AttributeValue fromMap(std::map<std::string, AttributeValue> values);

    bool operator==(const AttributeValue& other) const = default;
};

/**
 * @brief First populated field, in self-describing dispatch order
 */
[[nodiscard]] AttributeKind kindOf(const AttributeValue& value) noexcept;

/**
 * @brief True when exactly one field is populated
 */
[[nodiscard]] bool isWellFormed(const AttributeValue& value) noexcept;

/**
 * @brief Nesting depth; scalars are depth 1
 *
 * Recursion in the codec follows this depth, so callers that need a hard bound
 * check it before encoding or decoding.
 */
[[nodiscard]] std::size_t depth(const AttributeValue& value);

// Compact rendering, e.g. {M:{"a":{S:"hello"}}}
[[nodiscard]] std::string describe(const AttributeValue& value);

std::ostream& operator<<(std::ostream& os, const AttributeValue& value);

} // namespace attrval::wire
