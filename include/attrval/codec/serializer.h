// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright 2025 attrval Contributors

#pragma once

#include <attrval/core/types.h>
#include <attrval/serde/ser.h>
#include <attrval/wire/attribute_value.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace attrval::codec {

// Builders accumulate the children of one compound value and are consumed by
// end(). They are move-only in practice and never shared between walks.

/**
 * @brief Ordered list accumulator for sequences, tuples and tuple structs
 */
class SeqBuilder {
public:
    explicit SeqBuilder(std::size_t capacity);

    template <typename T> Result<void> serializeElement(const T& value);

    Result<wire::AttributeValue> end() &&;

private:
    std::vector<wire::AttributeValue> values_;
};

/**
 * @brief String-keyed map accumulator
 *
 * Keys must encode to a wire string. A key is held until its value arrives; a
 * value without a key, or a key left without a value at end(), is an error.
 */
class MapBuilder {
public:
    template <typename K> Result<void> serializeKey(const K& key);
    template <typename V> Result<void> serializeValue(const V& value);
    template <typename K, typename V> Result<void> serializeEntry(const K& key, const V& value);

    Result<wire::AttributeValue> end() &&;

private:
    Result<void> acceptKey(Result<wire::AttributeValue> key);
    Result<void> acceptValue(Result<wire::AttributeValue> value);

    std::map<std::string, wire::AttributeValue> values_;
    std::optional<std::string> key_;
};

// Record with named fields
class StructBuilder {
public:
    template <typename T> Result<void> serializeField(std::string_view name, const T& value);

    Result<wire::AttributeValue> end() &&;

private:
    Result<void> acceptField(std::string_view name, Result<wire::AttributeValue> value);

    std::map<std::string, wire::AttributeValue> values_;
};

// {M:{variant:{L:[...]}}}
class TupleVariantBuilder {
public:
    TupleVariantBuilder(std::string_view variant, std::size_t len);

    template <typename T> Result<void> serializeField(const T& value) {
        return elements_.serializeElement(value);
    }

    Result<wire::AttributeValue> end() &&;

private:
    std::string variant_;
    SeqBuilder elements_;
};

// {M:{variant:{M:{...}}}}
class StructVariantBuilder {
public:
    explicit StructVariantBuilder(std::string_view variant);

    template <typename T> Result<void> serializeField(std::string_view name, const T& value) {
        return fields_.serializeField(name, value);
    }

    Result<wire::AttributeValue> end() &&;

private:
    std::string variant_;
    StructBuilder fields_;
};

/**
 * @brief Serializer producing one AttributeValue per described value
 *
 * Stateless: every call builds a fresh tree and nothing is retained between
 * calls, so one instance may be shared freely across threads.
 */
class AttributeValueSerializer {
public:
    using Ok = wire::AttributeValue;

    Result<Ok> serializeBool(bool value) const;

    template <typename I> Result<Ok> serializeInteger(I value) const {
        static_assert(std::is_integral_v<I>);
        if constexpr (std::is_signed_v<I>) {
            return signedNumber(static_cast<int64_t>(value));
        } else {
            return unsignedNumber(static_cast<uint64_t>(value));
        }
    }

    Result<Ok> serializeFloat(float value) const;
    Result<Ok> serializeFloat(double value) const;
    Result<Ok> serializeChar(char32_t value) const;
    Result<Ok> serializeString(std::string_view value) const;
    Result<Ok> serializeBytes(std::span<const std::byte> value) const;
    Result<Ok> serializeNone() const;

    template <typename T> Result<Ok> serializeSome(const T& value) const;

    Result<Ok> serializeUnit() const;
    Result<Ok> serializeUnitStruct(std::string_view name) const;
    Result<Ok> serializeUnitVariant(std::string_view name, uint32_t index,
                                    std::string_view variant) const;

    template <typename T>
    Result<Ok> serializeNewtypeStruct(std::string_view name, const T& value) const;

    template <typename T>
    Result<Ok> serializeNewtypeVariant(std::string_view name, uint32_t index,
                                       std::string_view variant, const T& value) const;

    Result<SeqBuilder> serializeSeq(std::optional<std::size_t> len) const;
    Result<SeqBuilder> serializeTuple(std::size_t len) const;
    Result<SeqBuilder> serializeTupleStruct(std::string_view name, std::size_t len) const;
    Result<TupleVariantBuilder> serializeTupleVariant(std::string_view name, uint32_t index,
                                                      std::string_view variant,
                                                      std::size_t len) const;
    Result<MapBuilder> serializeMap(std::optional<std::size_t> len) const;
    Result<StructBuilder> serializeStruct(std::string_view name, std::size_t len) const;
    Result<StructVariantBuilder> serializeStructVariant(std::string_view name, uint32_t index,
                                                       std::string_view variant,
                                                       std::size_t len) const;

private:
    static Ok signedNumber(int64_t value);
    static Ok unsignedNumber(uint64_t value);
};

namespace detail {

template <typename T> Result<wire::AttributeValue> encode(const T& value) {
    AttributeValueSerializer serializer;
    return serde::serialize(serializer, value);
}

// Single-entry map keyed by the variant name
wire::AttributeValue wrapVariant(std::string_view variant, wire::AttributeValue payload);

} // namespace detail

// =============================================================================
// Template definitions
// =============================================================================

template <typename T> Result<void> SeqBuilder::serializeElement(const T& value) {
    auto element = detail::encode(value);
    if (!element) {
        return element.error();
    }
    values_.push_back(std::move(element).value());
    return {};
}

template <typename K> Result<void> MapBuilder::serializeKey(const K& key) {
    return acceptKey(detail::encode(key));
}

template <typename V> Result<void> MapBuilder::serializeValue(const V& value) {
    return acceptValue(detail::encode(value));
}

template <typename K, typename V>
Result<void> MapBuilder::serializeEntry(const K& key, const V& value) {
    auto status = serializeKey(key);
    if (!status) {
        return status;
    }
    return serializeValue(value);
}

template <typename T>
Result<void> StructBuilder::serializeField(std::string_view name, const T& value) {
    return acceptField(name, detail::encode(value));
}

template <typename T>
Result<AttributeValueSerializer::Ok> AttributeValueSerializer::serializeSome(const T& value) const {
    return detail::encode(value);
}

template <typename T>
Result<AttributeValueSerializer::Ok>
AttributeValueSerializer::serializeNewtypeStruct(std::string_view, const T& value) const {
    return detail::encode(value);
}

template <typename T>
Result<AttributeValueSerializer::Ok>
AttributeValueSerializer::serializeNewtypeVariant(std::string_view, uint32_t,
                                                  std::string_view variant, const T& value) const {
    auto payload = detail::encode(value);
    if (!payload) {
        return payload.error();
    }
    return detail::wrapVariant(variant, std::move(payload).value());
}

} // namespace attrval::codec
