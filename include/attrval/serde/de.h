// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright 2025 attrval Contributors

#pragma once

#include <attrval/serde/error.h>
#include <attrval/serde/traits.h>
#include <attrval/serde/utf8.h>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace attrval::serde {

/**
 * @brief Reconstruct a T from a deserializer
 *
 * Mirror of serialize(): T's shape picks one deserializer entry point, which is
 * handed the visitor for that shape. The deserializer answers with exactly one
 * visit callback. A deserializer D provides deserializeAny, deserializeBool,
 * deserializeInteger, deserializeFloat, deserializeChar, deserializeString,
 * deserializeBytes, deserializeByteBuf, deserializeOption, deserializeUnit,
 * deserializeUnitStruct, deserializeNewtypeStruct, deserializeSeq,
 * deserializeTuple, deserializeTupleStruct, deserializeMap, deserializeStruct,
 * deserializeEnum and deserializeIgnoredAny.
 */
template <typename T, typename D> Result<T> deserialize(D& deserializer);

// Accepts any value and discards it
struct IgnoredAny {
    bool operator==(const IgnoredAny&) const = default;
};

/**
 * @brief Base for the receiving side of the protocol
 *
 * Every callback fails with "invalid type: <what arrived>, expected <what the
 * visitor wants>". Derived visitors hide the callbacks they accept and supply
 * expecting().
 */
template <typename Derived, typename T> class Visitor {
public:
    using Value = T;

    Result<T> visitBool(bool value) { return unexpected(value ? "boolean `true`" : "boolean `false`"); }
    Result<T> visitI64(int64_t value) { return unexpected(fmt::format("integer `{}`", value)); }
    Result<T> visitU64(uint64_t value) { return unexpected(fmt::format("integer `{}`", value)); }
    Result<T> visitF64(double value) { return unexpected(fmt::format("floating point `{}`", value)); }
    Result<T> visitChar(char32_t) { return unexpected("character"); }
    Result<T> visitStr(std::string_view value) { return unexpected(fmt::format("string \"{}\"", value)); }
    Result<T> visitString(std::string value) { return self().visitStr(value); }
    Result<T> visitBytes(std::span<const std::byte>) { return unexpected("byte array"); }
    Result<T> visitByteBuf(ByteVector value) { return self().visitBytes(std::span<const std::byte>(value)); }
    Result<T> visitNone() { return unexpected("Option value"); }
    template <typename D> Result<T> visitSome(D&) { return unexpected("Option value"); }
    Result<T> visitUnit() { return unexpected("unit value"); }
    template <typename D> Result<T> visitNewtypeStruct(D&) { return unexpected("newtype struct"); }
    template <typename A> Result<T> visitSeq(A&) { return unexpected("sequence"); }
    template <typename A> Result<T> visitMap(A&) { return unexpected("map"); }
    template <typename A> Result<T> visitEnum(A&) { return unexpected("enum"); }

protected:
    Derived& self() { return static_cast<Derived&>(*this); }

    Error unexpected(std::string_view what) { return invalidType(what, self().expecting()); }
};

// =============================================================================
// Scalar visitors
// =============================================================================

class BoolVisitor : public Visitor<BoolVisitor, bool> {
public:
    std::string expecting() const { return "a boolean"; }

    Result<bool> visitBool(bool value) { return value; }
};

template <typename I> constexpr std::string_view integerName() {
    constexpr bool isSigned = std::is_signed_v<I>;
    switch (sizeof(I)) {
        case 1:
            return isSigned ? "i8" : "u8";
        case 2:
            return isSigned ? "i16" : "u16";
        case 4:
            return isSigned ? "i32" : "u32";
        default:
            return isSigned ? "i64" : "u64";
    }
}

template <typename I> class IntegerVisitor : public Visitor<IntegerVisitor<I>, I> {
public:
    std::string expecting() const { return std::string(integerName<I>()); }

    Result<I> visitI64(int64_t value) {
        if (!std::in_range<I>(value)) {
            return invalidValue(fmt::format("integer `{}`", value), expecting());
        }
        return static_cast<I>(value);
    }

    Result<I> visitU64(uint64_t value) {
        if (!std::in_range<I>(value)) {
            return invalidValue(fmt::format("integer `{}`", value), expecting());
        }
        return static_cast<I>(value);
    }
};

template <typename F> class FloatVisitor : public Visitor<FloatVisitor<F>, F> {
public:
    std::string expecting() const { return sizeof(F) == 4 ? "f32" : "f64"; }

    Result<F> visitI64(int64_t value) { return static_cast<F>(value); }
    Result<F> visitU64(uint64_t value) { return static_cast<F>(value); }
    Result<F> visitF64(double value) { return static_cast<F>(value); }
};

template <typename C> class CharVisitor : public Visitor<CharVisitor<C>, C> {
public:
    std::string expecting() const {
        if constexpr (is_narrow_character_v<C>) {
            return "an ASCII character";
        } else if constexpr (sizeof(C) < 4) {
            return "a Basic Multilingual Plane character";
        } else {
            return "a character";
        }
    }

    Result<C> visitChar(char32_t value) {
        if (value > maximum()) {
            return invalidValue(fmt::format("character `U+{:04X}`", static_cast<uint32_t>(value)),
                                expecting());
        }
        return static_cast<C>(value);
    }

    // Map keys arrive as strings holding exactly one code point
    Result<C> visitStr(std::string_view value) {
        auto first = decodeFirstCodePoint(value);
        if (!first || first.value().length != value.size()) {
            return invalidType(fmt::format("string \"{}\"", value), expecting());
        }
        return visitChar(first.value().value);
    }

private:
    static constexpr char32_t maximum() {
        if constexpr (is_narrow_character_v<C>) {
            return 0x7F;
        } else if constexpr (sizeof(C) < 4) {
            return 0xFFFF;
        } else {
            return 0x10FFFF;
        }
    }
};

class StringVisitor : public Visitor<StringVisitor, std::string> {
public:
    std::string expecting() const { return "a string"; }

    Result<std::string> visitStr(std::string_view value) { return std::string(value); }
    Result<std::string> visitString(std::string value) { return value; }
};

class ByteVectorVisitor : public Visitor<ByteVectorVisitor, ByteVector> {
public:
    std::string expecting() const { return "a byte array"; }

    Result<ByteVector> visitBytes(std::span<const std::byte> value) {
        return ByteVector(value.begin(), value.end());
    }
    Result<ByteVector> visitByteBuf(ByteVector value) { return value; }
};

class UnitVisitor : public Visitor<UnitVisitor, std::monostate> {
public:
    std::string expecting() const { return "unit"; }

    Result<std::monostate> visitUnit() { return std::monostate{}; }
};

template <typename T> class UnitStructVisitor : public Visitor<UnitStructVisitor<T>, T> {
public:
    std::string expecting() const { return fmt::format("unit struct {}", typeName<T>()); }

    Result<T> visitUnit() { return T{}; }
};

class IgnoredAnyVisitor : public Visitor<IgnoredAnyVisitor, IgnoredAny> {
public:
    std::string expecting() const { return "anything at all"; }

    Result<IgnoredAny> visitBool(bool) { return IgnoredAny{}; }
    Result<IgnoredAny> visitI64(int64_t) { return IgnoredAny{}; }
    Result<IgnoredAny> visitU64(uint64_t) { return IgnoredAny{}; }
    Result<IgnoredAny> visitF64(double) { return IgnoredAny{}; }
    Result<IgnoredAny> visitChar(char32_t) { return IgnoredAny{}; }
    Result<IgnoredAny> visitStr(std::string_view) { return IgnoredAny{}; }
    Result<IgnoredAny> visitBytes(std::span<const std::byte>) { return IgnoredAny{}; }
    Result<IgnoredAny> visitNone() { return IgnoredAny{}; }
    Result<IgnoredAny> visitUnit() { return IgnoredAny{}; }

    template <typename D> Result<IgnoredAny> visitSome(D& deserializer) {
        return deserialize<IgnoredAny>(deserializer);
    }

    template <typename D> Result<IgnoredAny> visitNewtypeStruct(D& deserializer) {
        return deserialize<IgnoredAny>(deserializer);
    }

    template <typename A> Result<IgnoredAny> visitSeq(A& seq) {
        while (true) {
            auto next = seq.template nextElement<IgnoredAny>();
            if (!next) {
                return next.error();
            }
            if (!next.value()) {
                return IgnoredAny{};
            }
        }
    }

    template <typename A> Result<IgnoredAny> visitMap(A& map) {
        while (true) {
            auto key = map.template nextKey<IgnoredAny>();
            if (!key) {
                return key.error();
            }
            if (!key.value()) {
                return IgnoredAny{};
            }
            auto value = map.template nextValue<IgnoredAny>();
            if (!value) {
                return value.error();
            }
        }
    }

    template <typename A> Result<IgnoredAny> visitEnum(A& access) {
        auto tagged = access.template variant<IgnoredAny>();
        if (!tagged) {
            return tagged.error();
        }
        return tagged.value().second.template newtypeVariant<IgnoredAny>();
    }
};

// =============================================================================
// Compound visitors
// =============================================================================

template <typename O> class OptionVisitor : public Visitor<OptionVisitor<O>, O> {
    using Inner = typename O::value_type;

public:
    std::string expecting() const { return "option"; }

    Result<O> visitNone() { return O{}; }
    Result<O> visitUnit() { return O{}; }

    template <typename D> Result<O> visitSome(D& deserializer) {
        auto inner = deserialize<Inner>(deserializer);
        if (!inner) {
            return inner.error();
        }
        return O{std::move(inner).value()};
    }
};

template <typename T> class NewtypeVisitor : public Visitor<NewtypeVisitor<T>, T> {
    using Inner = std::remove_cvref_t<decltype(std::declval<T&>().inner())>;

public:
    std::string expecting() const { return fmt::format("tuple struct {}", typeName<T>()); }

    template <typename D> Result<T> visitNewtypeStruct(D& deserializer) {
        auto inner = deserialize<Inner>(deserializer);
        if (!inner) {
            return inner.error();
        }
        T out{};
        out.inner() = std::move(inner).value();
        return out;
    }
};

template <typename C> class SequenceVisitor : public Visitor<SequenceVisitor<C>, C> {
    using Element = typename C::value_type;

public:
    std::string expecting() const { return "a sequence"; }

    template <typename A> Result<C> visitSeq(A& seq) {
        C out;
        if constexpr (requires(C& c) { c.reserve(std::size_t{}); }) {
            out.reserve(seq.sizeHint());
        }
        while (true) {
            auto next = seq.template nextElement<Element>();
            if (!next) {
                return next.error();
            }
            if (!next.value()) {
                break;
            }
            if constexpr (requires(C& c, Element e) { c.push_back(std::move(e)); }) {
                out.push_back(std::move(*next.value()));
            } else {
                out.insert(std::move(*next.value()));
            }
        }
        return out;
    }
};

namespace detail {

// Fill each slot of a tuple of lvalues from consecutive sequence elements
template <typename A, typename Slots>
Result<void> readPositional(A& seq, Slots&& slots, const std::string& expecting) {
    std::size_t index = 0;
    return forEachUntilError(std::forward<Slots>(slots), [&](auto& slot) -> Result<void> {
        using Element = std::remove_cvref_t<decltype(slot)>;
        auto next = seq.template nextElement<Element>();
        if (!next) {
            return next.error();
        }
        if (!next.value()) {
            return invalidLength(index, expecting);
        }
        slot = std::move(*next.value());
        ++index;
        return {};
    });
}

} // namespace detail

// std::array, std::tuple and std::pair
template <typename T> class TupleVisitor : public Visitor<TupleVisitor<T>, T> {
public:
    std::string expecting() const {
        if constexpr (is_std_array_v<T>) {
            return fmt::format("an array of length {}", std::tuple_size_v<T>);
        } else {
            return fmt::format("a tuple of size {}", std::tuple_size_v<T>);
        }
    }

    template <typename A> Result<T> visitSeq(A& seq) {
        T out{};
        auto status = detail::readPositional(seq, out, expecting());
        if (!status) {
            return status.error();
        }
        return out;
    }
};

template <typename T> class TupleStructVisitor : public Visitor<TupleStructVisitor<T>, T> {
public:
    std::string expecting() const { return fmt::format("tuple struct {}", typeName<T>()); }

    template <typename A> Result<T> visitSeq(A& seq) {
        T out{};
        auto status = detail::readPositional(seq, out.elements(), expecting());
        if (!status) {
            return status.error();
        }
        return out;
    }
};

template <typename M> class MapVisitor : public Visitor<MapVisitor<M>, M> {
    using Key = typename M::key_type;
    using Mapped = typename M::mapped_type;

public:
    std::string expecting() const { return "a map"; }

    template <typename A> Result<M> visitMap(A& map) {
        M out;
        while (true) {
            auto key = map.template nextKey<Key>();
            if (!key) {
                return key.error();
            }
            if (!key.value()) {
                break;
            }
            auto value = map.template nextValue<Mapped>();
            if (!value) {
                return value.error();
            }
            out.insert_or_assign(std::move(*key.value()), std::move(value).value());
        }
        return out;
    }
};

/**
 * @brief Record with named fields
 *
 * Keys are matched to fields() names. Unknown keys are skipped, repeated keys
 * and absent non-optional fields are errors, absent std::optional fields stay
 * empty. A list is accepted as the positional form of the same record.
 */
template <typename T> class RecordVisitor : public Visitor<RecordVisitor<T>, T> {
public:
    std::string expecting() const { return fmt::format("struct {}", typeName<T>()); }

    template <typename A> Result<T> visitMap(A& map) {
        T out{};
        auto fields = out.fields();
        const auto names = fieldNames(fields);
        std::array<bool, std::tuple_size_v<decltype(fields)>> seen{};

        while (true) {
            auto key = map.template nextKey<std::string>();
            if (!key) {
                return key.error();
            }
            if (!key.value()) {
                break;
            }
            const std::string& name = *key.value();
            const auto it = std::find(names.begin(), names.end(), name);
            if (it == names.end()) {
                auto skipped = map.template nextValue<IgnoredAny>();
                if (!skipped) {
                    return skipped.error();
                }
                continue;
            }
            const auto slot = static_cast<std::size_t>(it - names.begin());
            if (seen[slot]) {
                return duplicateField(names[slot]);
            }
            seen[slot] = true;
            auto status = applyAt(fields, slot, [&](auto& f) -> Result<void> {
                using Field = std::remove_cvref_t<decltype(f.value)>;
                auto value = map.template nextValue<Field>();
                if (!value) {
                    return value.error();
                }
                f.value = std::move(value).value();
                return {};
            });
            if (!status) {
                return status.error();
            }
        }

        std::size_t index = 0;
        auto status = forEachUntilError(fields, [&](auto& f) -> Result<void> {
            using Field = std::remove_cvref_t<decltype(f.value)>;
            if (seen[index++] || is_optional_v<Field>) {
                return {};
            }
            return missingField(f.name);
        });
        if (!status) {
            return status.error();
        }
        return out;
    }

    template <typename A> Result<T> visitSeq(A& seq) {
        T out{};
        std::size_t index = 0;
        auto status = forEachUntilError(out.fields(), [&](auto& f) -> Result<void> {
            using Field = std::remove_cvref_t<decltype(f.value)>;
            auto next = seq.template nextElement<Field>();
            if (!next) {
                return next.error();
            }
            if (!next.value()) {
                return invalidLength(index, expecting());
            }
            f.value = std::move(*next.value());
            ++index;
            return {};
        });
        if (!status) {
            return status.error();
        }
        return out;
    }
};

// Enum with ADL to_string/from_string; every case is a unit variant
template <typename E> class EnumVisitor : public Visitor<EnumVisitor<E>, E> {
public:
    std::string expecting() const { return "an enum variant"; }

    template <typename A> Result<E> visitEnum(A& access) {
        auto tagged = access.template variant<std::string>();
        if (!tagged) {
            return tagged.error();
        }
        auto& [tag, variant] = tagged.value();
        auto value = from_string(std::type_identity<E>{}, std::string_view(tag));
        if (!value) {
            return invalidValue(fmt::format("unknown variant `{}`", tag), expecting());
        }
        auto unit = variant.unitVariant();
        if (!unit) {
            return unit.error();
        }
        return *value;
    }
};

// std::variant whose cases declare variantName
template <typename T> class VariantVisitor : public Visitor<VariantVisitor<T>, T> {
public:
    std::string expecting() const { return fmt::format("enum {}", typeName<T>()); }

    template <typename A> Result<T> visitEnum(A& access) {
        auto tagged = access.template variant<std::string>();
        if (!tagged) {
            return tagged.error();
        }
        auto& [tag, variant] = tagged.value();
        return readCase<0>(tag, variant);
    }

private:
    template <std::size_t I, typename VA> Result<T> readCase(const std::string& tag, VA& variant) {
        if constexpr (I == std::variant_size_v<T>) {
            return unknownVariant(tag, variantNames<T>());
        } else {
            using Case = std::variant_alternative_t<I, T>;
            if (tag != Case::variantName) {
                return readCase<I + 1>(tag, variant);
            }
            auto value = readPayload<Case>(variant);
            if (!value) {
                return value.error();
            }
            return T{std::in_place_index<I>, std::move(value).value()};
        }
    }

    template <typename Case, typename VA> Result<Case> readPayload(VA& variant) {
        if constexpr (HasInner<Case>) {
            using Inner = std::remove_cvref_t<decltype(std::declval<Case&>().inner())>;
            auto inner = variant.template newtypeVariant<Inner>();
            if (!inner) {
                return inner.error();
            }
            Case out{};
            out.inner() = std::move(inner).value();
            return out;
        } else if constexpr (HasElements<Case>) {
            return variant.tupleVariant(std::tuple_size_v<decltype(std::declval<Case&>().elements())>,
                                        TupleStructVisitor<Case>{});
        } else if constexpr (HasFields<Case>) {
            Case probe{};
            const auto names = fieldNames(probe.fields());
            return variant.structVariant(std::span<const std::string_view>(names),
                                         RecordVisitor<Case>{});
        } else {
            auto unit = variant.unitVariant();
            if (!unit) {
                return unit.error();
            }
            return Case{};
        }
    }
};

// =============================================================================
// Dispatch
// =============================================================================

template <typename T, typename D> Result<T> deserialize(D& deserializer) {
    if constexpr (CustomDeserialize<T, D>) {
        return T::deserialize(deserializer);
    } else if constexpr (std::is_same_v<T, IgnoredAny>) {
        return deserializer.deserializeIgnoredAny(IgnoredAnyVisitor{});
    } else if constexpr (std::is_same_v<T, bool>) {
        return deserializer.deserializeBool(BoolVisitor{});
    } else if constexpr (is_character_v<T>) {
        return deserializer.deserializeChar(CharVisitor<T>{});
    } else if constexpr (std::is_integral_v<T>) {
        return deserializer.deserializeInteger(IntegerVisitor<T>{});
    } else if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>) {
        return deserializer.deserializeFloat(FloatVisitor<T>{});
    } else if constexpr (std::is_same_v<T, std::string>) {
        return deserializer.deserializeString(StringVisitor{});
    } else if constexpr (std::is_same_v<T, ByteVector>) {
        return deserializer.deserializeByteBuf(ByteVectorVisitor{});
    } else if constexpr (is_optional_v<T>) {
        return deserializer.deserializeOption(OptionVisitor<T>{});
    } else if constexpr (std::is_same_v<T, std::monostate>) {
        return deserializer.deserializeUnit(UnitVisitor{});
    } else if constexpr (HasEnumStrings<T>) {
        return deserializer.deserializeEnum(typeName<T>(), std::span<const std::string_view>{},
                                            EnumVisitor<T>{});
    } else if constexpr (is_tagged_union_v<T>) {
        return deserializer.deserializeEnum(typeName<T>(), variantNames<T>(), VariantVisitor<T>{});
    } else if constexpr (HasInner<T>) {
        return deserializer.deserializeNewtypeStruct(typeName<T>(), NewtypeVisitor<T>{});
    } else if constexpr (HasElements<T>) {
        return deserializer.deserializeTupleStruct(
            typeName<T>(), std::tuple_size_v<decltype(std::declval<T&>().elements())>,
            TupleStructVisitor<T>{});
    } else if constexpr (HasFields<T>) {
        T probe{};
        const auto names = fieldNames(probe.fields());
        return deserializer.deserializeStruct(typeName<T>(), std::span<const std::string_view>(names),
                                              RecordVisitor<T>{});
    } else if constexpr (UnitStruct<T>) {
        return deserializer.deserializeUnitStruct(typeName<T>(), UnitStructVisitor<T>{});
    } else if constexpr (is_sequence_v<T>) {
        return deserializer.deserializeSeq(SequenceVisitor<T>{});
    } else if constexpr (is_std_array_v<T> || is_tuple_like_v<T>) {
        return deserializer.deserializeTuple(std::tuple_size_v<T>, TupleVisitor<T>{});
    } else if constexpr (is_string_map_v<T>) {
        return deserializer.deserializeMap(MapVisitor<T>{});
    } else {
        static_assert(always_false_v<T>, "type has no deserializable shape");
    }
}

} // namespace attrval::serde
