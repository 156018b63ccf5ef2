// Unit tests for domain value types

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "accumulo/structs.h"

using accumulo::Key;
using accumulo::KeyValue;
using accumulo::Range;

namespace {

std::string with_byte(const std::string& s, char c) {
    return s + std::string(1, c);
}

}  // namespace

TEST(RangeTest, ExactRow) {
    auto range = Range::exact("row1");
    ASSERT_TRUE(range.start_key && range.end_key);
    EXPECT_EQ(*range.start_key, Key{"row1"});
    EXPECT_TRUE(range.start_inclusive);
    EXPECT_EQ(range.end_key->row, with_byte("row1", '\x00'));
    EXPECT_FALSE(range.end_key->cf.has_value());
    EXPECT_FALSE(range.end_inclusive);
}

TEST(RangeTest, ExactRowAndFamily) {
    auto range = Range::exact("row1", "fam");
    EXPECT_EQ(*range.start_key, (Key{"row1", "fam"}));
    EXPECT_EQ(range.end_key->row, "row1");
    EXPECT_EQ(range.end_key->cf, with_byte("fam", '\x00'));
    EXPECT_FALSE(range.end_key->cq.has_value());
    EXPECT_FALSE(range.end_inclusive);
}

TEST(RangeTest, ExactRowFamilyQualifier) {
    auto range = Range::exact("row1", "fam", "qual");
    EXPECT_EQ(*range.start_key, (Key{"row1", "fam", "qual"}));
    EXPECT_EQ(*range.end_key, (Key{"row1", "fam", with_byte("qual", '\x00')}));
    EXPECT_FALSE(range.end_inclusive);
}

TEST(RangeTest, PrefixRow) {
    auto range = Range::prefix("ab");
    EXPECT_EQ(*range.start_key, Key{"ab"});
    EXPECT_EQ(range.end_key->row, with_byte("ab", '\xff'));
    EXPECT_TRUE(range.start_inclusive);
    EXPECT_TRUE(range.end_inclusive);
}

TEST(RangeTest, PrefixFamilyAndQualifier) {
    auto by_family = Range::prefix("ab", "f");
    EXPECT_EQ(*by_family.end_key, (Key{"ab", with_byte("f", '\xff')}));
    EXPECT_TRUE(by_family.end_inclusive);

    auto by_qualifier = Range::prefix("ab", "f", "q");
    EXPECT_EQ(*by_qualifier.start_key, (Key{"ab", "f", "q"}));
    EXPECT_EQ(*by_qualifier.end_key, (Key{"ab", "f", with_byte("q", '\xff')}));
}

TEST(RangeTest, DefaultIsUnbounded) {
    Range range;
    EXPECT_FALSE(range.start_key.has_value());
    EXPECT_FALSE(range.end_key.has_value());
}

TEST(KeyValueTest, AccessorsExposeKeyParts) {
    KeyValue kv(Key{"r", "cf", "cq", "vis", 42}, "value");
    EXPECT_EQ(kv.row(), "r");
    EXPECT_EQ(kv.cf(), "cf");
    EXPECT_EQ(kv.cq(), "cq");
    EXPECT_EQ(kv.visibility(), "vis");
    EXPECT_EQ(kv.timestamp(), 42);
    EXPECT_EQ(kv.value(), "value");
}

TEST(KeyValueTest, MissingPartsReadAsEmpty) {
    KeyValue kv(Key{"r"}, "");
    EXPECT_EQ(kv.cf(), "");
    EXPECT_EQ(kv.cq(), "");
    EXPECT_EQ(kv.visibility(), "");
    EXPECT_EQ(kv.timestamp(), 0);
}

TEST(KeyValueTest, StreamsReadably) {
    std::ostringstream os;
    os << KeyValue(Key{"r", "cf", "cq", "vis", 7}, "v");
    EXPECT_EQ(os.str(), "r cf:cq [vis] 7 -> v");
}

TEST(EnumTest, Names) {
    EXPECT_STREQ(accumulo::to_string(accumulo::TimeType::Millis), "MILLIS");
    EXPECT_STREQ(accumulo::to_string(accumulo::TimeType::Logical), "LOGICAL");
    EXPECT_STREQ(accumulo::to_string(accumulo::Durability::Flush), "FLUSH");
}
