// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright 2025 attrval Contributors

#pragma once

#include <attrval/codec/deserializer.h>
#include <attrval/codec/serializer.h>
#include <attrval/core/types.h>
#include <attrval/wire/attribute_value.h>

#include <spdlog/spdlog.h>

namespace attrval {

/**
 * @brief Encode a value as an AttributeValue tree
 *
 * Fails only when the value's own description fails (custom errors, map keys
 * that do not encode to strings, unpaired map keys).
 */
template <typename T> Result<wire::AttributeValue> toAttributeValue(const T& value) {
    codec::AttributeValueSerializer serializer;
    auto encoded = serde::serialize(serializer, value);
    if (!encoded) {
        spdlog::debug("AttributeValue encode: {} failed: {}", serde::typeName<T>(),
                      encoded.error().message);
        return encoded;
    }
    if (spdlog::should_log(spdlog::level::trace)) {
        spdlog::trace("AttributeValue encode: {} -> {}", serde::typeName<T>(),
                      wire::describe(encoded.value()));
    }
    return encoded;
}

/**
 * @brief Decode a T from an AttributeValue tree
 */
template <typename T> Result<T> fromAttributeValue(const wire::AttributeValue& value) {
    codec::AttributeValueDeserializer deserializer(value);
    auto decoded = serde::deserialize<T>(deserializer);
    if (!decoded && spdlog::should_log(spdlog::level::debug)) {
        spdlog::debug("AttributeValue decode: {} from {} failed: {}", serde::typeName<T>(),
                      wire::describe(value), decoded.error().message);
    }
    return decoded;
}

} // namespace attrval
