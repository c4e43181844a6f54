// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright 2025 attrval Contributors

#pragma once

#include <attrval/core/types.h>
#include <attrval/serde/de.h>
#include <attrval/wire/attribute_value.h>

#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace attrval::codec {

class SeqAccess;
class MapAccess;
class EnumAccess;
class VariantAccess;

namespace detail {

// Whole-text parse: signed 64-bit integer first, then double
Result<std::variant<int64_t, double>> parseNumber(std::string_view text);

// First UTF-8 code point of a non-empty string
Result<char32_t> firstCharacter(std::string_view text);

} // namespace detail

/**
 * @brief Drives a visitor from one AttributeValue
 *
 * Self-describing reads (deserializeAny and everything forwarded to it) look at
 * the populated field in the order BOOL, L, M, N, NULL, S. Character, byte,
 * option, newtype and enum reads are shape-directed and require their own
 * field. The input tree is never modified.
 */
class AttributeValueDeserializer {
public:
    explicit AttributeValueDeserializer(const wire::AttributeValue& value) : value_(value) {}

    template <typename V> Result<typename V::Value> deserializeAny(V visitor);

    template <typename V> Result<typename V::Value> deserializeBool(V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V> Result<typename V::Value> deserializeInteger(V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V> Result<typename V::Value> deserializeFloat(V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V> Result<typename V::Value> deserializeString(V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V> Result<typename V::Value> deserializeUnit(V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V>
    Result<typename V::Value> deserializeUnitStruct(std::string_view, V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V> Result<typename V::Value> deserializeSeq(V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V> Result<typename V::Value> deserializeTuple(std::size_t, V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V>
    Result<typename V::Value> deserializeTupleStruct(std::string_view, std::size_t, V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V> Result<typename V::Value> deserializeMap(V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V>
    Result<typename V::Value> deserializeStruct(std::string_view, std::span<const std::string_view>,
                                                V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V> Result<typename V::Value> deserializeIgnoredAny(V visitor) {
        return deserializeAny(std::move(visitor));
    }

    template <typename V> Result<typename V::Value> deserializeChar(V visitor);
    template <typename V> Result<typename V::Value> deserializeBytes(V visitor);
    template <typename V> Result<typename V::Value> deserializeByteBuf(V visitor);
    template <typename V> Result<typename V::Value> deserializeOption(V visitor);
    template <typename V>
    Result<typename V::Value> deserializeNewtypeStruct(std::string_view name, V visitor);
    template <typename V>
    Result<typename V::Value> deserializeEnum(std::string_view name,
                                              std::span<const std::string_view> variants,
                                              V visitor);

private:
    const wire::AttributeValue& value_;
};

/**
 * @brief Map keys as the visitor sees them
 *
 * Every read yields the key as an owned string, whatever shape was asked for.
 */
class KeyDeserializer {
public:
    explicit KeyDeserializer(std::string_view key) : key_(key) {}

    template <typename V> Result<typename V::Value> deserializeAny(V visitor) {
        return visitor.visitString(std::string(key_));
    }

    template <typename V> Result<typename V::Value> deserializeBool(V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V> Result<typename V::Value> deserializeInteger(V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V> Result<typename V::Value> deserializeFloat(V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V> Result<typename V::Value> deserializeChar(V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V> Result<typename V::Value> deserializeString(V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V> Result<typename V::Value> deserializeBytes(V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V> Result<typename V::Value> deserializeByteBuf(V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V> Result<typename V::Value> deserializeOption(V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V> Result<typename V::Value> deserializeUnit(V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V>
    Result<typename V::Value> deserializeUnitStruct(std::string_view, V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V>
    Result<typename V::Value> deserializeNewtypeStruct(std::string_view, V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V> Result<typename V::Value> deserializeSeq(V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V> Result<typename V::Value> deserializeTuple(std::size_t, V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V>
    Result<typename V::Value> deserializeTupleStruct(std::string_view, std::size_t, V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V> Result<typename V::Value> deserializeMap(V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V>
    Result<typename V::Value> deserializeStruct(std::string_view, std::span<const std::string_view>,
                                                V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V>
    Result<typename V::Value> deserializeEnum(std::string_view, std::span<const std::string_view>,
                                              V visitor) {
        return deserializeAny(std::move(visitor));
    }
    template <typename V> Result<typename V::Value> deserializeIgnoredAny(V visitor) {
        return deserializeAny(std::move(visitor));
    }

private:
    std::string_view key_;
};

/**
 * @brief Cursor over the elements of an L value
 */
class SeqAccess {
public:
    explicit SeqAccess(const std::vector<wire::AttributeValue>& values)
        : next_(values.begin()), end_(values.end()) {}

    // nullopt once every element has been read
    template <typename T> Result<std::optional<T>> nextElement();

    std::size_t sizeHint() const { return static_cast<std::size_t>(end_ - next_); }

private:
    std::vector<wire::AttributeValue>::const_iterator next_;
    std::vector<wire::AttributeValue>::const_iterator end_;
};

/**
 * @brief Key and value cursors over the entries of an M value
 *
 * The two cursors walk the same entries in step. Each nextValue() must be
 * preceded by its own nextKey().
 */
class MapAccess {
public:
    using Entries = std::map<std::string, wire::AttributeValue>;

    explicit MapAccess(const Entries& entries)
        : keys_(entries.begin()), values_(entries.begin()), end_(entries.end()) {}

    template <typename K> Result<std::optional<K>> nextKey();
    template <typename V> Result<V> nextValue();

private:
    Entries::const_iterator keys_;
    Entries::const_iterator values_;
    Entries::const_iterator end_;
    std::size_t pendingKeys_ = 0;
};

// Payload of a variant, read according to the variant's kind
class VariantAccess {
public:
    explicit VariantAccess(const wire::AttributeValue& value) : value_(&value) {}

    Result<void> unitVariant() const;

    template <typename T> Result<T> newtypeVariant() const;

    template <typename V> Result<typename V::Value> tupleVariant(std::size_t len, V visitor) const;

    template <typename V>
    Result<typename V::Value> structVariant(std::span<const std::string_view> fields,
                                            V visitor) const;

private:
    const wire::AttributeValue* value_;
};

// Tag and payload of the single entry of a variant's M value
class EnumAccess {
public:
    EnumAccess(std::string_view key, const wire::AttributeValue& value)
        : key_(key), value_(value) {}

    template <typename T> Result<std::pair<T, VariantAccess>> variant();

private:
    std::string_view key_;
    const wire::AttributeValue& value_;
};

// =============================================================================
// Template definitions
// =============================================================================

template <typename V>
Result<typename V::Value> AttributeValueDeserializer::deserializeAny(V visitor) {
    if (value_.boolean) {
        return visitor.visitBool(*value_.boolean);
    }
    if (value_.list) {
        SeqAccess seq(*value_.list);
        return visitor.visitSeq(seq);
    }
    if (value_.map) {
        MapAccess map(*value_.map);
        return visitor.visitMap(map);
    }
    if (value_.number) {
        auto number = detail::parseNumber(*value_.number);
        if (!number) {
            return number.error();
        }
        if (const auto* integer = std::get_if<int64_t>(&number.value())) {
            return visitor.visitI64(*integer);
        }
        return visitor.visitF64(std::get<double>(number.value()));
    }
    if (value_.null) {
        return visitor.visitUnit();
    }
    if (value_.string) {
        return visitor.visitStr(*value_.string);
    }
    return Error{ErrorCode::UnsupportedValue, "Supported Value Expected"};
}

template <typename V>
Result<typename V::Value> AttributeValueDeserializer::deserializeChar(V visitor) {
    if (!value_.string) {
        return Error{ErrorCode::TypeMismatch, "String Value Expected"};
    }
    auto character = detail::firstCharacter(*value_.string);
    if (!character) {
        return character.error();
    }
    return visitor.visitChar(character.value());
}

template <typename V>
Result<typename V::Value> AttributeValueDeserializer::deserializeBytes(V visitor) {
    if (!value_.bytes) {
        return Error{ErrorCode::TypeMismatch, "Byte Vector Value Expected"};
    }
    return visitor.visitBytes(std::span<const std::byte>(*value_.bytes));
}

template <typename V>
Result<typename V::Value> AttributeValueDeserializer::deserializeByteBuf(V visitor) {
    if (!value_.bytes) {
        return Error{ErrorCode::TypeMismatch, "Byte Vector Value Expected"};
    }
    return visitor.visitByteBuf(*value_.bytes);
}

template <typename V>
Result<typename V::Value> AttributeValueDeserializer::deserializeOption(V visitor) {
    // Only an explicit NULL:true is absent
    if (value_.null && *value_.null) {
        return visitor.visitNone();
    }
    return visitor.visitSome(*this);
}

template <typename V>
Result<typename V::Value> AttributeValueDeserializer::deserializeNewtypeStruct(std::string_view,
                                                                             V visitor) {
    return visitor.visitNewtypeStruct(*this);
}

template <typename V>
Result<typename V::Value>
AttributeValueDeserializer::deserializeEnum(std::string_view name,
                                            std::span<const std::string_view>, V visitor) {
    if (!value_.map) {
        return Error{ErrorCode::TypeMismatch, "Map Value Expected"};
    }
    if (value_.map->empty()) {
        return Error{ErrorCode::MissingValue, "Key/Value Expected"};
    }
    const auto& [key, payload] = *value_.map->begin();
    if (value_.map->size() > 1) {
        spdlog::debug("AttributeValue decode: {} tagged by a map of {} entries, using `{}`", name,
                      value_.map->size(), key);
    }
    EnumAccess access(key, payload);
    return visitor.visitEnum(access);
}

template <typename T> Result<std::optional<T>> SeqAccess::nextElement() {
    if (next_ == end_) {
        return std::optional<T>{};
    }
    AttributeValueDeserializer element(*next_);
    ++next_;
    auto value = serde::deserialize<T>(element);
    if (!value) {
        return value.error();
    }
    return std::optional<T>{std::move(value).value()};
}

template <typename K> Result<std::optional<K>> MapAccess::nextKey() {
    if (keys_ == end_) {
        return std::optional<K>{};
    }
    KeyDeserializer key(keys_->first);
    ++keys_;
    ++pendingKeys_;
    auto value = serde::deserialize<K>(key);
    if (!value) {
        return value.error();
    }
    return std::optional<K>{std::move(value).value()};
}

template <typename V> Result<V> MapAccess::nextValue() {
    if (pendingKeys_ == 0 || values_ == end_) {
        return Error{ErrorCode::MissingValue, "Value Expected"};
    }
    --pendingKeys_;
    AttributeValueDeserializer value(values_->second);
    ++values_;
    return serde::deserialize<V>(value);
}

template <typename T> Result<T> VariantAccess::newtypeVariant() const {
    AttributeValueDeserializer payload(*value_);
    return serde::deserialize<T>(payload);
}

template <typename V>
Result<typename V::Value> VariantAccess::tupleVariant(std::size_t, V visitor) const {
    if (!value_->list) {
        return Error{ErrorCode::TypeMismatch, "List Value Expected"};
    }
    SeqAccess seq(*value_->list);
    return visitor.visitSeq(seq);
}

template <typename V>
Result<typename V::Value> VariantAccess::structVariant(std::span<const std::string_view>,
                                                       V visitor) const {
    if (!value_->map) {
        return Error{ErrorCode::TypeMismatch, "Map Value Expected"};
    }
    MapAccess map(*value_->map);
    return visitor.visitMap(map);
}

template <typename T> Result<std::pair<T, VariantAccess>> EnumAccess::variant() {
    KeyDeserializer key(key_);
    auto tag = serde::deserialize<T>(key);
    if (!tag) {
        return tag.error();
    }
    return std::pair<T, VariantAccess>{std::move(tag).value(), VariantAccess(value_)};
}

} // namespace attrval::codec
