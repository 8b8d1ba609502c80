// STAKEVAULT - Core Types Tests
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include <gtest/gtest.h>
#include "stakevault/core/types.h"

#include <stdexcept>
#include <unordered_set>

namespace stakevault {
namespace test {

// ============================================================================
// Address Tests
// ============================================================================

TEST(AddressTest, DefaultConstructorCreatesNullAddress) {
    Address addr;
    EXPECT_TRUE(addr.IsNull());
    EXPECT_EQ(addr.size(), 20u);
    for (size_t i = 0; i < Address::SIZE; ++i) {
        EXPECT_EQ(addr[i], 0);
    }
}

TEST(AddressTest, HexRoundTrip) {
    const std::string hex = "000000000000000000005354414b455641554c54";
    Address addr = Address::FromHex(hex);
    EXPECT_FALSE(addr.IsNull());
    EXPECT_EQ(addr[10], 0x53);
    EXPECT_EQ(addr.ToHex(), hex);
}

TEST(AddressTest, FromHexRejectsMalformed) {
    EXPECT_THROW(Address::FromHex("zz"), std::invalid_argument);
    EXPECT_THROW(Address::FromHex("abc"), std::invalid_argument);
}

TEST(AddressTest, Ordering) {
    Address a;
    Address b;
    b[19] = 1;
    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);
    EXPECT_NE(a, b);

    b.SetNull();
    EXPECT_EQ(a, b);
}

TEST(AddressTest, HasherDistinguishesAddresses) {
    std::unordered_set<Address, AddressHasher> set;
    for (uint8_t i = 0; i < 50; ++i) {
        Address addr;
        addr[0] = i;
        set.insert(addr);
    }
    EXPECT_EQ(set.size(), 50u);
}

TEST(AddressTest, ParseAddressAcceptsPrefix) {
    Address out;
    EXPECT_TRUE(ParseAddress("0x0101010101010101010101010101010101010101", out));
    EXPECT_EQ(out[0], 0x01);

    EXPECT_TRUE(ParseAddress("ABABABABABABABABABABABABABABABABABABABAB", out));
    EXPECT_EQ(out[19], 0xAB);
}

TEST(AddressTest, ParseAddressRejectsBadInput) {
    Address out;
    EXPECT_FALSE(ParseAddress("", out));
    EXPECT_FALSE(ParseAddress("0x", out));
    EXPECT_FALSE(ParseAddress("0x1234", out));
    EXPECT_FALSE(ParseAddress("0x010101010101010101010101010101010101010g", out));
    EXPECT_FALSE(ParseAddress("0x010101010101010101010101010101010101010101", out));
}

// ============================================================================
// Amount Tests
// ============================================================================

TEST(AmountTest, MoneyRange) {
    EXPECT_TRUE(MoneyRange(0));
    EXPECT_TRUE(MoneyRange(MAX_MONEY));
    EXPECT_FALSE(MoneyRange(-1));
    EXPECT_FALSE(MoneyRange(MAX_MONEY + 1));
}

TEST(AmountTest, FormatAmount) {
    EXPECT_EQ(FormatAmount(0), "0 SVT");
    EXPECT_EQ(FormatAmount(COIN), "1 SVT");
    EXPECT_EQ(FormatAmount(COIN + COIN / 2), "1.5 SVT");
    EXPECT_EQ(FormatAmount(1), "0.00000001 SVT");
    EXPECT_EQ(FormatAmount(-COIN / 4), "-0.25 SVT");
}

// ============================================================================
// Hex Helper Tests
// ============================================================================

TEST(HexTest, BytesToHex) {
    const Byte data[] = {0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(BytesToHex(data, sizeof(data)), "000fabff");
    EXPECT_EQ(BytesToHex(data, 0), "");
}

TEST(HexTest, HexToBytes) {
    std::vector<Byte> out;
    ASSERT_TRUE(HexToBytes("000FabfF", out));
    EXPECT_EQ(out, (std::vector<Byte>{0x00, 0x0f, 0xab, 0xff}));

    EXPECT_FALSE(HexToBytes("abc", out));
    EXPECT_FALSE(HexToBytes("xx", out));
}

TEST(HexTest, IsValidHex) {
    EXPECT_FALSE(IsValidHex(""));
    EXPECT_TRUE(IsValidHex("00ff"));
    EXPECT_FALSE(IsValidHex("0"));
    EXPECT_FALSE(IsValidHex("0g"));
}

} // namespace test
} // namespace stakevault
