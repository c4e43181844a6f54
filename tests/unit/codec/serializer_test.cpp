// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright 2025 attrval Contributors

#include <gtest/gtest.h>

#include <attrval/codec/codec.h>

#include "common/test_types.h"

#include <array>
#include <cstdint>
#include <deque>
#include <limits>
#include <set>

using namespace attrval;
using namespace attrval::test;

namespace {

template <typename T> AttributeValue encode(const T& value) {
    auto result = toAttributeValue(value);
    EXPECT_TRUE(result) << (result ? "" : result.error().message);
    return result ? result.value() : AttributeValue{};
}

} // namespace

TEST(SerializerTest, Booleans) {
    EXPECT_EQ(encode(true), AttributeValue::fromBool(true));
    EXPECT_EQ(encode(false), AttributeValue::fromBool(false));
}

TEST(SerializerTest, IntegersOfEveryWidthShareOneEncoding) {
    EXPECT_EQ(encode(int8_t{1}), N("1"));
    EXPECT_EQ(encode(uint8_t{1}), N("1"));
    EXPECT_EQ(encode(int16_t{1}), N("1"));
    EXPECT_EQ(encode(uint32_t{1}), N("1"));
    EXPECT_EQ(encode(uint64_t{1}), N("1"));
    EXPECT_EQ(encode(-42), N("-42"));
    EXPECT_EQ(encode(std::numeric_limits<int64_t>::min()), N("-9223372036854775808"));
    EXPECT_EQ(encode(std::numeric_limits<uint64_t>::max()), N("18446744073709551615"));
}

TEST(SerializerTest, FloatsUseShortestText) {
    EXPECT_EQ(encode(1.234f), N("1.234"));
    EXPECT_EQ(encode(2.345), N("2.345"));
    EXPECT_EQ(encode(-0.5), N("-0.5"));
}

TEST(SerializerTest, CharactersBecomeSingleCharacterStrings) {
    EXPECT_EQ(encode('a'), S("a"));
    EXPECT_EQ(encode(U'\u00E9'), S("\xC3\xA9"));
    EXPECT_EQ(encode(U'\U0001F600'), S("\xF0\x9F\x98\x80"));
}

TEST(SerializerTest, NonAsciiNarrowCharacterIsRejected) {
    auto result = toAttributeValue(static_cast<char>(0xE9));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), Error(ErrorCode::Custom,
                                    "invalid value: character `U+00E9`, expected an ASCII character"));
    EXPECT_FALSE(toAttributeValue(static_cast<char8_t>(0x80)));
    EXPECT_FALSE(toAttributeValue(std::map<char, int>{{static_cast<char>(0xFF), 1}}));
}

TEST(SerializerTest, OtherCharacterWidthsAreStrings) {
    EXPECT_EQ(encode(u'\u00E9'), S("\xC3\xA9"));
    EXPECT_EQ(encode(u8'z'), S("z"));
    EXPECT_EQ(encode(L'\u00E9'), S("\xC3\xA9"));
    EXPECT_FALSE(toAttributeValue(static_cast<char16_t>(0xDC00)));
}

TEST(SerializerTest, SurrogateCodePointIsRejected) {
    auto result = toAttributeValue(static_cast<char32_t>(0xD800));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InvalidData);
}

TEST(SerializerTest, Strings) {
    EXPECT_EQ(encode(std::string("hello")), S("hello"));
    EXPECT_EQ(encode(std::string_view("hello")), S("hello"));
    EXPECT_EQ(encode("hello"), S("hello"));
    EXPECT_EQ(encode(std::string()), S(""));
}

TEST(SerializerTest, BytesAreCopiedRaw) {
    EXPECT_EQ(encode(bytes({0x00, 0x0a, 0xff})), AttributeValue::fromBytes(bytes({0x00, 0x0a, 0xff})));
}

TEST(SerializerTest, OptionalsAreUnwrapped) {
    EXPECT_EQ(encode(std::optional<bool>(true)), AttributeValue::fromBool(true));
    EXPECT_EQ(encode(std::optional<bool>()), Null());
    EXPECT_EQ(encode(std::optional<std::optional<int>>(std::optional<int>())), Null());
}

TEST(SerializerTest, UnitShapes) {
    EXPECT_EQ(encode(std::monostate{}), Null());
    EXPECT_EQ(encode(Marker{}), Null());
}

TEST(SerializerTest, Sequences) {
    EXPECT_EQ(encode(std::vector<int>{1, 2, 3}), L({N("1"), N("2"), N("3")}));
    EXPECT_EQ(encode(std::deque<std::string>{"x"}), L({S("x")}));
    EXPECT_EQ(encode(std::set<int>{3, 1, 2}), L({N("1"), N("2"), N("3")}));
    EXPECT_EQ(encode(std::vector<int>{}), L({}));
}

TEST(SerializerTest, TuplesAndArrays) {
    EXPECT_EQ(encode(std::make_tuple(std::string("hello"), 37)), L({S("hello"), N("37")}));
    EXPECT_EQ(encode(std::make_pair(true, 'z')), L({AttributeValue::fromBool(true), S("z")}));
    EXPECT_EQ(encode(std::array<int, 2>{7, 8}), L({N("7"), N("8")}));
}

TEST(SerializerTest, RecordBecomesMapKeyedByFieldName) {
    EXPECT_EQ(encode(Record{"hello", 1}), M({{"a", S("hello")}, {"b", N("1")}}));
}

TEST(SerializerTest, AbsentOptionalFieldIsNull) {
    Profile profile;
    profile.name = "ada";
    auto encoded = encode(profile);
    ASSERT_TRUE(encoded.map);
    EXPECT_EQ(encoded.map->at("nickname"), Null());
    EXPECT_EQ(encoded.map->at("scores"), L({}));
    EXPECT_EQ(encoded.map->at("records"), M({}));
}

TEST(SerializerTest, NewtypeIsTransparent) {
    EXPECT_EQ(encode(UserId{"u-1"}), S("u-1"));
}

TEST(SerializerTest, TupleStructIsList) {
    EXPECT_EQ(encode(Point{3, 4}), L({N("3"), N("4")}));
}

TEST(SerializerTest, StringKeyedMap) {
    std::map<std::string, int> counts{{"x", 1}, {"y", 2}};
    EXPECT_EQ(encode(counts), M({{"x", N("1")}, {"y", N("2")}}));
}

TEST(SerializerTest, CharacterKeysEncodeAsStrings) {
    std::map<char, bool> flags{{'k', true}};
    EXPECT_EQ(encode(flags), M({{"k", AttributeValue::fromBool(true)}}));
}

TEST(SerializerTest, NonStringKeyIsRejected) {
    std::map<int, int> numbers{{1, 2}};
    auto result = toAttributeValue(numbers);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), Error(ErrorCode::InvalidKey, "Key Must Be String"));
}

TEST(SerializerTest, MapBuilderRequiresKeyBeforeValue) {
    codec::AttributeValueSerializer serializer;
    auto builder = serializer.serializeMap(std::nullopt);
    ASSERT_TRUE(builder);
    auto status = builder.value().serializeValue(1);
    ASSERT_FALSE(status);
    EXPECT_EQ(status.error().message, "Key Must Be Set and Value Must Be Serializable");
}

TEST(SerializerTest, MapBuilderRejectsDanglingKey) {
    codec::AttributeValueSerializer serializer;
    auto builder = serializer.serializeMap(std::nullopt);
    ASSERT_TRUE(builder);
    ASSERT_TRUE(builder.value().serializeKey(std::string("orphan")));
    auto finished = std::move(builder).value().end();
    ASSERT_FALSE(finished);
    EXPECT_EQ(finished.error().message, "Key Must Be Set and Value Must Be Serializable");
}

TEST(SerializerTest, MapBuilderConsumesEachKeyOnce) {
    codec::AttributeValueSerializer serializer;
    auto builder = serializer.serializeMap(std::nullopt);
    ASSERT_TRUE(builder);
    ASSERT_TRUE(builder.value().serializeKey(std::string("k")));
    ASSERT_TRUE(builder.value().serializeValue(1));
    EXPECT_FALSE(builder.value().serializeValue(2));
}

TEST(SerializerTest, CustomDescriptionIsUsed) {
    EXPECT_EQ(encode(Celsius{21.5}), S("21.5C"));
}

TEST(SerializerTest, CustomErrorAbortsTheWalk) {
    std::vector<Celsius> readings{{20.0}, {-300.0}, {22.0}};
    auto result = toAttributeValue(readings);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), Error(ErrorCode::Custom, "temperature below absolute zero"));
}

TEST(SerializerTest, CustomErrorInsideMapValueIsReported) {
    std::map<std::string, Celsius> readings{{"lab", {-300.0}}};
    auto result = toAttributeValue(readings);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().message, "temperature below absolute zero");
}
