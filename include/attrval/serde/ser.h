// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright 2025 attrval Contributors

#pragma once

#include <attrval/serde/error.h>
#include <attrval/serde/traits.h>

#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace attrval::serde {

/**
 * @brief Describe a value to a serializer
 *
 * The value's shape is classified at compile time and exactly one serializer
 * entry point is invoked for it; compound shapes continue through the builder
 * the serializer hands back. A serializer S provides:
 *
 *   - serializeBool, serializeInteger, serializeFloat, serializeChar,
 *     serializeString, serializeBytes, serializeNone, serializeSome,
 *     serializeUnit, serializeUnitStruct, serializeUnitVariant,
 *     serializeNewtypeStruct, serializeNewtypeVariant returning Result<S::Ok>
 *   - serializeSeq, serializeTuple, serializeTupleStruct, serializeMap,
 *     serializeStruct, serializeTupleVariant, serializeStructVariant returning a
 *     builder whose end() && yields Result<S::Ok>
 */
template <typename S, typename T> Result<typename S::Ok> serialize(S& serializer, const T& value);

namespace detail {

template <typename S, typename Elements>
Result<typename S::Ok> serializeElements(S& serializer, Elements&& elements) {
    auto builder = serializer.serializeTuple(std::tuple_size_v<std::remove_cvref_t<Elements>>);
    if (!builder) {
        return builder.error();
    }
    auto status = forEachUntilError(std::forward<Elements>(elements), [&](const auto& element) {
        return builder.value().serializeElement(element);
    });
    if (!status) {
        return status.error();
    }
    return std::move(builder).value().end();
}

template <typename S, typename Case>
Result<typename S::Ok> serializeCase(S& serializer, std::string_view name, uint32_t index,
                                     const Case& alt) {
    constexpr std::string_view variant = Case::variantName;
    if constexpr (HasConstInner<Case>) {
        return serializer.serializeNewtypeVariant(name, index, variant, alt.inner());
    } else if constexpr (HasConstElements<Case>) {
        auto elements = alt.elements();
        auto builder = serializer.serializeTupleVariant(name, index, variant,
                                                        std::tuple_size_v<decltype(elements)>);
        if (!builder) {
            return builder.error();
        }
        auto status = forEachUntilError(elements, [&](const auto& element) {
            return builder.value().serializeField(element);
        });
        if (!status) {
            return status.error();
        }
        return std::move(builder).value().end();
    } else if constexpr (HasConstFields<Case>) {
        auto fields = alt.fields();
        auto builder = serializer.serializeStructVariant(name, index, variant,
                                                         std::tuple_size_v<decltype(fields)>);
        if (!builder) {
            return builder.error();
        }
        auto status = forEachUntilError(fields, [&](const auto& f) {
            return builder.value().serializeField(f.name, f.value);
        });
        if (!status) {
            return status.error();
        }
        return std::move(builder).value().end();
    } else {
        return serializer.serializeUnitVariant(name, index, variant);
    }
}

} // namespace detail

template <typename S, typename T> Result<typename S::Ok> serialize(S& serializer, const T& value) {
    if constexpr (CustomSerialize<T, S>) {
        return value.serialize(serializer);
    } else if constexpr (std::is_same_v<T, bool>) {
        return serializer.serializeBool(value);
    } else if constexpr (is_narrow_character_v<T>) {
        const auto c = static_cast<char32_t>(static_cast<unsigned char>(value));
        if (c > 0x7F) {
            return invalidValue(fmt::format("character `U+{:04X}`", static_cast<uint32_t>(c)),
                                "an ASCII character");
        }
        return serializer.serializeChar(c);
    } else if constexpr (is_character_v<T>) {
        return serializer.serializeChar(static_cast<char32_t>(value));
    } else if constexpr (std::is_integral_v<T>) {
        return serializer.serializeInteger(value);
    } else if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>) {
        return serializer.serializeFloat(value);
    } else if constexpr (std::is_convertible_v<const T&, std::string_view>) {
        return serializer.serializeString(std::string_view(value));
    } else if constexpr (std::is_same_v<T, ByteVector>) {
        return serializer.serializeBytes(std::span<const std::byte>(value));
    } else if constexpr (is_optional_v<T>) {
        if (!value) {
            return serializer.serializeNone();
        }
        return serializer.serializeSome(*value);
    } else if constexpr (std::is_same_v<T, std::monostate>) {
        return serializer.serializeUnit();
    } else if constexpr (HasEnumStrings<T>) {
        return serializer.serializeUnitVariant(
            typeName<T>(), static_cast<uint32_t>(static_cast<std::underlying_type_t<T>>(value)),
            std::string_view(to_string(value)));
    } else if constexpr (is_tagged_union_v<T>) {
        const auto index = static_cast<uint32_t>(value.index());
        return std::visit(
            [&](const auto& alt) -> Result<typename S::Ok> {
                return detail::serializeCase(serializer, typeName<T>(), index, alt);
            },
            value);
    } else if constexpr (HasConstInner<T>) {
        return serializer.serializeNewtypeStruct(typeName<T>(), value.inner());
    } else if constexpr (HasConstElements<T>) {
        auto elements = value.elements();
        auto builder =
            serializer.serializeTupleStruct(typeName<T>(), std::tuple_size_v<decltype(elements)>);
        if (!builder) {
            return builder.error();
        }
        auto status = forEachUntilError(elements, [&](const auto& element) {
            return builder.value().serializeElement(element);
        });
        if (!status) {
            return status.error();
        }
        return std::move(builder).value().end();
    } else if constexpr (HasConstFields<T>) {
        auto fields = value.fields();
        auto builder =
            serializer.serializeStruct(typeName<T>(), std::tuple_size_v<decltype(fields)>);
        if (!builder) {
            return builder.error();
        }
        auto status = forEachUntilError(fields, [&](const auto& f) {
            return builder.value().serializeField(f.name, f.value);
        });
        if (!status) {
            return status.error();
        }
        return std::move(builder).value().end();
    } else if constexpr (UnitStruct<T>) {
        return serializer.serializeUnitStruct(typeName<T>());
    } else if constexpr (is_sequence_v<T>) {
        auto builder = serializer.serializeSeq(std::optional<std::size_t>{value.size()});
        if (!builder) {
            return builder.error();
        }
        for (const auto& element : value) {
            auto status = builder.value().serializeElement(element);
            if (!status) {
                return status.error();
            }
        }
        return std::move(builder).value().end();
    } else if constexpr (is_std_array_v<T> || is_tuple_like_v<T>) {
        return detail::serializeElements(serializer, value);
    } else if constexpr (is_string_map_v<T>) {
        auto builder = serializer.serializeMap(std::optional<std::size_t>{value.size()});
        if (!builder) {
            return builder.error();
        }
        for (const auto& [key, entry] : value) {
            auto status = builder.value().serializeEntry(key, entry);
            if (!status) {
                return status.error();
            }
        }
        return std::move(builder).value().end();
    } else {
        static_assert(always_false_v<T>, "type has no serializable shape");
    }
}

} // namespace attrval::serde
