// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright 2025 attrval Contributors

#include <gtest/gtest.h>

#include <attrval/codec/deserializer.h>
#include <attrval/serde/de.h>

#include "common/test_types.h"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

using namespace attrval;
using namespace attrval::test;

namespace {

// Entry stream that, unlike an M value, may repeat a key
class EntryListAccess {
public:
    explicit EntryListAccess(std::vector<std::pair<std::string, AttributeValue>> entries)
        : entries_(std::move(entries)) {}

    template <typename K> Result<std::optional<K>> nextKey() {
        if (next_ == entries_.size()) {
            return std::optional<K>{};
        }
        codec::KeyDeserializer key(entries_[next_].first);
        auto value = serde::deserialize<K>(key);
        if (!value) {
            return value.error();
        }
        return std::optional<K>{std::move(value).value()};
    }

    template <typename V> Result<V> nextValue() {
        codec::AttributeValueDeserializer value(entries_[next_++].second);
        return serde::deserialize<V>(value);
    }

private:
    std::vector<std::pair<std::string, AttributeValue>> entries_;
    std::size_t next_ = 0;
};

} // namespace

TEST(RecordVisitorTest, RepeatedKeyIsDuplicateField) {
    EntryListAccess access({{"a", S("x")}, {"b", N("1")}, {"a", S("y")}});
    serde::RecordVisitor<Record> visitor;
    auto result = visitor.visitMap(access);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), Error(ErrorCode::Custom, "duplicate field `a`"));
}

TEST(RecordVisitorTest, RepeatedUnknownKeyIsSkipped) {
    EntryListAccess access({{"z", Null()}, {"a", S("x")}, {"z", N("9")}, {"b", N("1")}});
    serde::RecordVisitor<Record> visitor;
    auto result = visitor.visitMap(access);
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result.value(), (Record{"x", 1}));
}

TEST(RecordVisitorTest, ExpectingNamesTheStruct) {
    EXPECT_EQ(serde::RecordVisitor<Record>{}.expecting(), "struct Record");
    EXPECT_EQ(serde::RecordVisitor<Profile>{}.expecting(), "struct Profile");
}

TEST(MapVisitorTest, LaterEntryWins) {
    EntryListAccess access({{"k", N("1")}, {"k", N("2")}});
    serde::MapVisitor<std::map<std::string, int>> visitor;
    auto result = visitor.visitMap(access);
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result.value(), (std::map<std::string, int>{{"k", 2}}));
}

TEST(VisitorTest, UnhandledInputIsInvalidType) {
    serde::BoolVisitor visitor;
    EXPECT_EQ(visitor.visitI64(5).error().message, "invalid type: integer `5`, expected a boolean");
    EXPECT_EQ(visitor.visitStr("yes").error().message,
              "invalid type: string \"yes\", expected a boolean");
    EXPECT_EQ(visitor.visitUnit().error().message, "invalid type: unit value, expected a boolean");
}

TEST(VisitorTest, IntegerVisitorChecksRange) {
    serde::IntegerVisitor<int16_t> visitor;
    EXPECT_EQ(visitor.visitI64(-32768).value(), -32768);
    EXPECT_EQ(visitor.visitI64(40000).error().message,
              "invalid value: integer `40000`, expected i16");
}
