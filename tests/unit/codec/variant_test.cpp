// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright 2025 attrval Contributors

#include <gtest/gtest.h>

#include <attrval/codec/codec.h>

#include "common/test_types.h"

using namespace attrval;
using namespace attrval::test;

namespace {

AttributeValue tagged(std::string tag, AttributeValue payload) {
    return M({{std::move(tag), std::move(payload)}});
}

} // namespace

class VariantTest : public ::testing::Test {
protected:
    AttributeValue encode(const Shape& shape) {
        auto result = toAttributeValue(shape);
        EXPECT_TRUE(result) << (result ? "" : result.error().message);
        return result ? result.value() : AttributeValue{};
    }

    Result<Shape> decode(const AttributeValue& value) { return fromAttributeValue<Shape>(value); }
};

TEST_F(VariantTest, UnitVariantIsTagOverNull) {
    EXPECT_EQ(encode(Empty{}), tagged("Empty", Null()));
}

TEST_F(VariantTest, NewtypeVariantIsTagOverPayload) {
    EXPECT_EQ(encode(Circle{1.5}), tagged("Circle", N("1.5")));
}

TEST_F(VariantTest, TupleVariantIsTagOverList) {
    EXPECT_EQ(encode(Segment{1, 2}), tagged("Segment", L({N("1"), N("2")})));
}

TEST_F(VariantTest, StructVariantIsTagOverMap) {
    EXPECT_EQ(encode(Rect{3, 4}), tagged("Rect", M({{"width", N("3")}, {"height", N("4")}})));
}

TEST_F(VariantTest, EachKindDecodes) {
    for (const Shape& shape : {Shape{Empty{}}, Shape{Circle{2.25}}, Shape{Segment{-1, 9}},
                               Shape{Rect{640, 480}}}) {
        auto decoded = decode(encode(shape));
        ASSERT_TRUE(decoded) << decoded.error().message;
        EXPECT_EQ(decoded.value(), shape);
    }
}

TEST_F(VariantTest, UnknownTag) {
    auto decoded = decode(tagged("Hexagon", Null()));
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error(),
              Error(ErrorCode::Custom,
                    "unknown variant `Hexagon`, expected one of `Empty`, `Circle`, `Segment`, `Rect`"));
}

TEST_F(VariantTest, RequiresMap) {
    auto decoded = decode(S("Empty"));
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error(), Error(ErrorCode::TypeMismatch, "Map Value Expected"));
}

TEST_F(VariantTest, EmptyMapHasNoTag) {
    auto decoded = decode(M({}));
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().message, "Key/Value Expected");
}

TEST_F(VariantTest, UnitVariantRequiresNullTrue) {
    AttributeValue nullFalse;
    nullFalse.null = false;
    for (const auto& payload : {N("1"), nullFalse}) {
        auto decoded = decode(tagged("Empty", payload));
        ASSERT_FALSE(decoded);
        EXPECT_EQ(decoded.error(), Error(ErrorCode::TypeMismatch, "Null Value Expected"));
    }
}

TEST_F(VariantTest, TupleVariantRequiresList) {
    auto decoded = decode(tagged("Segment", M({})));
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().message, "List Value Expected");
}

TEST_F(VariantTest, StructVariantRequiresMap) {
    auto decoded = decode(tagged("Rect", L({N("3"), N("4")})));
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().message, "Map Value Expected");
}

TEST_F(VariantTest, ShortTupleVariant) {
    auto decoded = decode(tagged("Segment", L({N("1")})));
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().message, "invalid length 1, expected tuple struct Segment");
}

TEST_F(VariantTest, StructVariantMissingField) {
    auto decoded = decode(tagged("Rect", M({{"width", N("3")}})));
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().message, "missing field `height`");
}

TEST_F(VariantTest, MultiEntryMapUsesFirstKeyInOrder) {
    auto decoded = decode(M({{"Empty", Null()}, {"Circle", N("2")}}));
    ASSERT_TRUE(decoded) << decoded.error().message;
    EXPECT_EQ(decoded.value(), Shape{Circle{2.0}});
}

TEST_F(VariantTest, VariantsNestInsideContainers) {
    std::map<std::string, std::vector<Shape>> layers{
        {"background", {Rect{10, 20}}},
        {"foreground", {Circle{1.0}, Empty{}}},
    };
    auto encoded = toAttributeValue(layers);
    ASSERT_TRUE(encoded);
    auto decoded = fromAttributeValue<std::map<std::string, std::vector<Shape>>>(encoded.value());
    ASSERT_TRUE(decoded) << decoded.error().message;
    EXPECT_EQ(decoded.value(), layers);
}

TEST(EnumTest, EnumEncodesAsUnitVariant) {
    auto encoded = toAttributeValue(Color::Green);
    ASSERT_TRUE(encoded);
    EXPECT_EQ(encoded.value(), tagged("Green", Null()));
}

TEST(EnumTest, EnumDecodes) {
    auto decoded = fromAttributeValue<Color>(tagged("Blue", Null()));
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded.value(), Color::Blue);
}

TEST(EnumTest, UnknownEnumName) {
    auto decoded = fromAttributeValue<Color>(tagged("Purple", Null()));
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().message,
              "invalid value: unknown variant `Purple`, expected an enum variant");
}

TEST(EnumTest, EnumPayloadMustBeNull) {
    auto decoded = fromAttributeValue<Color>(tagged("Red", S("x")));
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().message, "Null Value Expected");
}
