// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright 2025 attrval Contributors

#include <gtest/gtest.h>

#include <attrval/wire/attribute_value.h>

#include "common/test_types.h"

#include <sstream>

using namespace attrval;
using namespace attrval::test;
using wire::AttributeKind;

TEST(AttributeValueTest, FactoriesPopulateOneField) {
    EXPECT_EQ(wire::kindOf(AttributeValue::fromBool(false)), AttributeKind::Bool);
    EXPECT_EQ(wire::kindOf(N("1")), AttributeKind::Number);
    EXPECT_EQ(wire::kindOf(S("x")), AttributeKind::String);
    EXPECT_EQ(wire::kindOf(AttributeValue::fromBytes({})), AttributeKind::Bytes);
    EXPECT_EQ(wire::kindOf(Null()), AttributeKind::Null);
    EXPECT_EQ(wire::kindOf(L({})), AttributeKind::List);
    EXPECT_EQ(wire::kindOf(M({})), AttributeKind::Map);
    EXPECT_EQ(wire::kindOf(AttributeValue{}), AttributeKind::None);

    for (const auto& value : {AttributeValue::fromBool(true), N("1"), S(""), Null(), L({}), M({})}) {
        EXPECT_TRUE(wire::isWellFormed(value)) << value;
    }
}

TEST(AttributeValueTest, KindFollowsDispatchOrder) {
    AttributeValue mixed;
    mixed.string = "s";
    mixed.null = true;
    mixed.number = "1";
    EXPECT_EQ(wire::kindOf(mixed), AttributeKind::Number);
    EXPECT_FALSE(wire::isWellFormed(mixed));
    EXPECT_FALSE(wire::isWellFormed(AttributeValue{}));
}

TEST(AttributeValueTest, KindNames) {
    EXPECT_STREQ(wire::kindToString(AttributeKind::Bool), "BOOL");
    EXPECT_STREQ(wire::kindToString(AttributeKind::Null), "NULL");
    EXPECT_STREQ(wire::kindToString(AttributeKind::None), "none");
}

TEST(AttributeValueTest, Depth) {
    EXPECT_EQ(wire::depth(S("x")), 1u);
    EXPECT_EQ(wire::depth(L({})), 1u);
    EXPECT_EQ(wire::depth(L({S("x")})), 2u);
    EXPECT_EQ(wire::depth(M({{"a", L({L({N("1")})})}, {"b", Null()}})), 4u);
}

TEST(AttributeValueTest, Describe) {
    EXPECT_EQ(wire::describe(M({{"a", S("hello")}, {"b", N("1")}})),
              "{M:{\"a\":{S:\"hello\"}, \"b\":{N:\"1\"}}}");
    EXPECT_EQ(wire::describe(AttributeValue::fromBytes(bytes({0x0a, 0xff}))), "{B:<0a ff>}");
    EXPECT_EQ(wire::describe(L({Null(), AttributeValue::fromBool(true)})),
              "{L:[{NULL:true}, {BOOL:true}]}");
    EXPECT_EQ(wire::describe(S("say \"hi\"")), "{S:\"say \\\"hi\\\"\"}");
    EXPECT_EQ(wire::describe(AttributeValue{}), "{}");
}

TEST(AttributeValueTest, DescribeShowsEveryPopulatedField) {
    AttributeValue mixed;
    mixed.boolean = false;
    mixed.string = "s";
    EXPECT_EQ(wire::describe(mixed), "{BOOL:false, S:\"s\"}");
}

TEST(AttributeValueTest, StreamOperator) {
    std::ostringstream os;
    os << L({N("1")});
    EXPECT_EQ(os.str(), "{L:[{N:\"1\"}]}");
}

TEST(AttributeValueTest, Equality) {
    EXPECT_EQ(M({{"a", N("1")}}), M({{"a", N("1")}}));
    EXPECT_NE(N("1"), S("1"));
    EXPECT_NE(N("1"), N("1.0"));
}
