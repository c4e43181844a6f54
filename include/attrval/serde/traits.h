// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright 2025 attrval Contributors

#pragma once

#include <attrval/core/types.h>

#include <array>
#include <concepts>
#include <cstddef>
#include <deque>
#include <list>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace attrval::serde {

// =============================================================================
// Field wrapper for named serialization
// =============================================================================

template <typename T> struct field_t {
    const char* name;
    T& value;
};

template <typename T> constexpr field_t<T> field(const char* name, T& value) {
    return field_t<T>{name, value};
}

template <typename T> constexpr field_t<const T> field(const char* name, const T& value) {
    return field_t<const T>{name, value};
}

// =============================================================================
// Type traits
// =============================================================================

template <typename T> inline constexpr bool always_false_v = false;

template <typename T> struct is_optional : std::false_type {};
template <typename T> struct is_optional<std::optional<T>> : std::true_type {};
template <typename T> inline constexpr bool is_optional_v = is_optional<T>::value;

// Growable containers encoded as a list
template <typename T> struct is_sequence : std::false_type {};
template <typename T, typename A> struct is_sequence<std::vector<T, A>> : std::true_type {};
template <typename T, typename A> struct is_sequence<std::deque<T, A>> : std::true_type {};
template <typename T, typename A> struct is_sequence<std::list<T, A>> : std::true_type {};
template <typename T, typename C, typename A>
struct is_sequence<std::set<T, C, A>> : std::true_type {};
template <typename T, typename H, typename E, typename A>
struct is_sequence<std::unordered_set<T, H, E, A>> : std::true_type {};
template <typename T> inline constexpr bool is_sequence_v = is_sequence<T>::value;

template <typename T> struct is_std_array : std::false_type {};
template <typename T, std::size_t N> struct is_std_array<std::array<T, N>> : std::true_type {};
template <typename T> inline constexpr bool is_std_array_v = is_std_array<T>::value;

// Fixed-arity heterogeneous values encoded as a list
template <typename T> struct is_tuple_like : std::false_type {};
template <typename... Ts> struct is_tuple_like<std::tuple<Ts...>> : std::true_type {};
template <typename A, typename B> struct is_tuple_like<std::pair<A, B>> : std::true_type {};
template <typename T> inline constexpr bool is_tuple_like_v = is_tuple_like<T>::value;

template <typename T> struct is_string_map : std::false_type {};
template <typename K, typename V, typename C, typename A>
struct is_string_map<std::map<K, V, C, A>> : std::true_type {};
template <typename K, typename V, typename H, typename E, typename A>
struct is_string_map<std::unordered_map<K, V, H, E, A>> : std::true_type {};
template <typename T> inline constexpr bool is_string_map_v = is_string_map<T>::value;

// Character types encode as one-character strings, never as numbers
template <typename T>
inline constexpr bool is_character_v =
    std::is_same_v<T, char> || std::is_same_v<T, char8_t> || std::is_same_v<T, char16_t> ||
    std::is_same_v<T, char32_t> || std::is_same_v<T, wchar_t>;

// Narrow character types hold a whole code point only below U+0080
template <typename T>
inline constexpr bool is_narrow_character_v =
    std::is_same_v<T, char> || std::is_same_v<T, char8_t>;

// =============================================================================
// Shape concepts
// =============================================================================

template <typename T>
concept HasFields = requires(T& t) { std::tuple_size<decltype(t.fields())>::value; };

template <typename T>
concept HasConstFields = requires(const T& t) { std::tuple_size<decltype(t.fields())>::value; };

// Tuple struct: elements() returns std::tie of the members
template <typename T>
concept HasElements = requires(T& t) { std::tuple_size<decltype(t.elements())>::value; };

template <typename T>
concept HasConstElements =
    requires(const T& t) { std::tuple_size<decltype(t.elements())>::value; };

// Newtype: a single wrapped member exposed through inner()
template <typename T>
concept HasInner = requires(T& t) {
    { t.inner() } -> std::same_as<std::remove_cvref_t<decltype(t.inner())>&>;
};

template <typename T>
concept HasConstInner = requires(const T& t) { t.inner(); };

template <typename T>
concept NamedShape = requires {
    { T::serdeName } -> std::convertible_to<std::string_view>;
};

// A case of a tagged union
template <typename T>
concept VariantCase = requires {
    { T::variantName } -> std::convertible_to<std::string_view>;
};

template <typename T>
concept UnitStruct = NamedShape<T> && !HasConstFields<T> && !HasConstElements<T> &&
                     !HasConstInner<T> && !VariantCase<T>;

// Enum with ADL to_string(E) and from_string(std::type_identity<E>, std::string_view)
template <typename E>
concept HasEnumStrings = std::is_enum_v<E> && requires(E e, std::string_view s) {
    { to_string(e) } -> std::convertible_to<std::string_view>;
    { from_string(std::type_identity<E>{}, s) } -> std::same_as<std::optional<E>>;
};

template <typename T> struct is_tagged_union : std::false_type {};
template <typename... Cases>
struct is_tagged_union<std::variant<Cases...>>
    : std::bool_constant<(sizeof...(Cases) > 0) && (VariantCase<Cases> && ...)> {};
template <typename T> inline constexpr bool is_tagged_union_v = is_tagged_union<T>::value;

template <typename T, typename S>
concept CustomSerialize = requires(const T& t, S& s) {
    { t.serialize(s) } -> std::same_as<Result<typename S::Ok>>;
};

template <typename T, typename D>
concept CustomDeserialize = requires(D& d) {
    { T::deserialize(d) } -> std::same_as<Result<T>>;
};

// =============================================================================
// Names
// =============================================================================

template <typename T> constexpr std::string_view typeName() {
    if constexpr (NamedShape<T>) {
        return T::serdeName;
    } else if constexpr (VariantCase<T>) {
        return T::variantName;
    } else {
        return "value";
    }
}

template <typename T> struct variant_names;

template <typename... Cases> struct variant_names<std::variant<Cases...>> {
    static constexpr std::array<std::string_view, sizeof...(Cases)> value{
        std::string_view{Cases::variantName}...};
};

template <typename T> constexpr std::span<const std::string_view> variantNames() {
    return variant_names<T>::value;
}

template <typename Fields> auto fieldNames(const Fields& fields) {
    return std::apply(
        [](const auto&... f) {
            return std::array<std::string_view, sizeof...(f)>{std::string_view{f.name}...};
        },
        fields);
}

// =============================================================================
// Tuple helpers
// =============================================================================

// Invoke fn on each element in order, stopping at the first failure
template <typename Tuple, typename Fn> Result<void> forEachUntilError(Tuple&& tuple, Fn&& fn) {
    Result<void> status;
    std::apply([&](auto&&... elems) { ((status = fn(elems), status.has_value()) && ...); },
               std::forward<Tuple>(tuple));
    return status;
}

// Invoke fn on the element at a runtime index
template <typename Tuple, typename Fn>
Result<void> applyAt(Tuple&& tuple, std::size_t index, Fn&& fn) {
    Result<void> status;
    std::size_t i = 0;
    std::apply([&](auto&&... elems) { ((i++ == index ? (status = fn(elems), true) : false) || ...); },
               std::forward<Tuple>(tuple));
    return status;
}

} // namespace attrval::serde
