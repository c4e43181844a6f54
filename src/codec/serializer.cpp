// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright 2025 attrval Contributors

#include <attrval/codec/serializer.h>
#include <attrval/serde/utf8.h>

#include <fmt/format.h>

namespace attrval::codec {

namespace {

constexpr std::string_view kKeyMustBeString = "Key Must Be String";
constexpr std::string_view kKeyMustBeSet = "Key Must Be Set and Value Must Be Serializable";

} // namespace

namespace detail {

wire::AttributeValue wrapVariant(std::string_view variant, wire::AttributeValue payload) {
    std::map<std::string, wire::AttributeValue> entries;
    entries.emplace(std::string(variant), std::move(payload));
    return wire::AttributeValue::fromMap(std::move(entries));
}

} // namespace detail

// -----------------------------------------------------------------------------
// Builders
// -----------------------------------------------------------------------------

SeqBuilder::SeqBuilder(std::size_t capacity) {
    values_.reserve(capacity);
}

Result<wire::AttributeValue> SeqBuilder::end() && {
    return wire::AttributeValue::fromList(std::move(values_));
}

Result<void> MapBuilder::acceptKey(Result<wire::AttributeValue> key) {
    if (!key) {
        return key.error();
    }
    auto& encoded = key.value();
    if (!encoded.string) {
        return Error{ErrorCode::InvalidKey, std::string(kKeyMustBeString)};
    }
    key_ = std::move(*encoded.string);
    return {};
}

Result<void> MapBuilder::acceptValue(Result<wire::AttributeValue> value) {
    if (!key_) {
        return Error{ErrorCode::MissingValue, std::string(kKeyMustBeSet)};
    }
    if (!value) {
        return value.error();
    }
    values_.insert_or_assign(std::move(*key_), std::move(value).value());
    key_.reset();
    return {};
}

Result<wire::AttributeValue> MapBuilder::end() && {
    if (key_) {
        return Error{ErrorCode::MissingValue, std::string(kKeyMustBeSet)};
    }
    return wire::AttributeValue::fromMap(std::move(values_));
}

Result<void> StructBuilder::acceptField(std::string_view name, Result<wire::AttributeValue> value) {
    if (!value) {
        return value.error();
    }
    values_.insert_or_assign(std::string(name), std::move(value).value());
    return {};
}

Result<wire::AttributeValue> StructBuilder::end() && {
    return wire::AttributeValue::fromMap(std::move(values_));
}

TupleVariantBuilder::TupleVariantBuilder(std::string_view variant, std::size_t len)
    : variant_(variant), elements_(len) {}

Result<wire::AttributeValue> TupleVariantBuilder::end() && {
    auto list = std::move(elements_).end();
    if (!list) {
        return list.error();
    }
    return detail::wrapVariant(variant_, std::move(list).value());
}

StructVariantBuilder::StructVariantBuilder(std::string_view variant) : variant_(variant) {}

Result<wire::AttributeValue> StructVariantBuilder::end() && {
    auto map = std::move(fields_).end();
    if (!map) {
        return map.error();
    }
    return detail::wrapVariant(variant_, std::move(map).value());
}

// -----------------------------------------------------------------------------
// Scalars
// -----------------------------------------------------------------------------

wire::AttributeValue AttributeValueSerializer::signedNumber(int64_t value) {
    return wire::AttributeValue::fromNumber(fmt::format_int(value).str());
}

wire::AttributeValue AttributeValueSerializer::unsignedNumber(uint64_t value) {
    return wire::AttributeValue::fromNumber(fmt::format_int(value).str());
}

Result<wire::AttributeValue> AttributeValueSerializer::serializeBool(bool value) const {
    return wire::AttributeValue::fromBool(value);
}

Result<wire::AttributeValue> AttributeValueSerializer::serializeFloat(float value) const {
    return wire::AttributeValue::fromNumber(fmt::format("{}", value));
}

Result<wire::AttributeValue> AttributeValueSerializer::serializeFloat(double value) const {
    return wire::AttributeValue::fromNumber(fmt::format("{}", value));
}

Result<wire::AttributeValue> AttributeValueSerializer::serializeChar(char32_t value) const {
    if (!serde::isScalarValue(value)) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("Invalid Unicode Scalar Value U+{:04X}", static_cast<uint32_t>(value))};
    }
    std::string text;
    serde::appendUtf8(text, value);
    return wire::AttributeValue::fromString(std::move(text));
}

Result<wire::AttributeValue> AttributeValueSerializer::serializeString(std::string_view value) const {
    return wire::AttributeValue::fromString(std::string(value));
}

Result<wire::AttributeValue>
AttributeValueSerializer::serializeBytes(std::span<const std::byte> value) const {
    return wire::AttributeValue::fromBytes(ByteVector(value.begin(), value.end()));
}

Result<wire::AttributeValue> AttributeValueSerializer::serializeNone() const {
    return wire::AttributeValue::fromNull();
}

Result<wire::AttributeValue> AttributeValueSerializer::serializeUnit() const {
    return wire::AttributeValue::fromNull();
}

Result<wire::AttributeValue> AttributeValueSerializer::serializeUnitStruct(std::string_view) const {
    return serializeUnit();
}

Result<wire::AttributeValue>
AttributeValueSerializer::serializeUnitVariant(std::string_view, uint32_t,
                                               std::string_view variant) const {
    return detail::wrapVariant(variant, wire::AttributeValue::fromNull());
}

// -----------------------------------------------------------------------------
// Compounds
// -----------------------------------------------------------------------------

Result<SeqBuilder> AttributeValueSerializer::serializeSeq(std::optional<std::size_t> len) const {
    return SeqBuilder(len.value_or(0));
}

Result<SeqBuilder> AttributeValueSerializer::serializeTuple(std::size_t len) const {
    return SeqBuilder(len);
}

Result<SeqBuilder> AttributeValueSerializer::serializeTupleStruct(std::string_view,
                                                                  std::size_t len) const {
    return SeqBuilder(len);
}

Result<TupleVariantBuilder>
AttributeValueSerializer::serializeTupleVariant(std::string_view, uint32_t, std::string_view variant,
                                                std::size_t len) const {
    return TupleVariantBuilder(variant, len);
}

Result<MapBuilder> AttributeValueSerializer::serializeMap(std::optional<std::size_t>) const {
    return MapBuilder{};
}

Result<StructBuilder> AttributeValueSerializer::serializeStruct(std::string_view,
                                                                std::size_t) const {
    return StructBuilder{};
}

Result<StructVariantBuilder>
AttributeValueSerializer::serializeStructVariant(std::string_view, uint32_t,
                                                 std::string_view variant, std::size_t) const {
    return StructVariantBuilder(variant);
}

} // namespace attrval::codec
