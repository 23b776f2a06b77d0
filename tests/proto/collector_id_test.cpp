#include "hostwatch/proto/collector_id.hpp"

#include <gtest/gtest.h>

#include <unordered_set>

namespace hostwatch::proto::test {

TEST(CollectorIdTest, ToStringIsCanonicalUuid) {
    EXPECT_EQ(CollectorId::from_u64(42).to_string(), "00000000-0000-0000-0000-00000000002a");
    EXPECT_EQ((CollectorId{0x0123456789ABCDEFull, 0xFEDCBA9876543210ull}).to_string(),
              "01234567-89ab-cdef-fedc-ba9876543210");
}

TEST(CollectorIdTest, ParseUuid) {
    auto id = CollectorId::parse("01234567-89AB-cdef-FEDC-ba9876543210");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->hi, 0x0123456789ABCDEFull);
    EXPECT_EQ(id->lo, 0xFEDCBA9876543210ull);
}

TEST(CollectorIdTest, ParseDecimal) {
    auto small = CollectorId::parse("42");
    ASSERT_TRUE(small.has_value());
    EXPECT_EQ(*small, CollectorId::from_u64(42));

    // 2^64
    auto carry = CollectorId::parse("18446744073709551616");
    ASSERT_TRUE(carry.has_value());
    EXPECT_EQ(*carry, (CollectorId{1, 0}));

    // 2^128 - 1
    auto max = CollectorId::parse("340282366920938463463374607431768211455");
    ASSERT_TRUE(max.has_value());
    EXPECT_EQ(*max, (CollectorId{~0ull, ~0ull}));
}

TEST(CollectorIdTest, ParseRejectsGarbage) {
    EXPECT_FALSE(CollectorId::parse("").has_value());
    EXPECT_FALSE(CollectorId::parse("abc").has_value());
    EXPECT_FALSE(CollectorId::parse("12 34").has_value());
    EXPECT_FALSE(CollectorId::parse("340282366920938463463374607431768211456").has_value());
    EXPECT_FALSE(CollectorId::parse("01234567-89ab-cdef-fedc-ba987654321").has_value());
    EXPECT_FALSE(CollectorId::parse("0123456789ab-cdef-fedc-ba98-76543210").has_value());
    EXPECT_FALSE(CollectorId::parse("01234567-89ab-cdef-fedc-ba987654321g").has_value());
}

TEST(CollectorIdTest, TextRoundTrip) {
    auto id = CollectorId::generate();
    auto parsed = CollectorId::parse(id.to_string());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, id);
}

TEST(CollectorIdTest, GenerateIsVersion4) {
    auto text = CollectorId::generate().to_string();
    ASSERT_EQ(text.size(), 36u);
    EXPECT_EQ(text[14], '4');
    EXPECT_NE(std::string("89ab").find(text[19]), std::string::npos);
}

TEST(CollectorIdTest, GenerateIsUnique) {
    std::unordered_set<CollectorId, CollectorIdHash> seen;
    for (int i = 0; i < 1000; ++i) {
        EXPECT_TRUE(seen.insert(CollectorId::generate()).second);
    }
}

}  // namespace hostwatch::proto::test
