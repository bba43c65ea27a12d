// DADBS - Core Types Tests
// Copyright (c) 2024 DADBS Developers
// MIT License

#include <gtest/gtest.h>
#include <dadbs/core/types.h>
#include <dadbs/core/hex.h>

#include <stdexcept>

namespace dadbs {
namespace test {

// ============================================================================
// Amount Tests
// ============================================================================

TEST(AmountTest, BaseUnitsPerToken) {
    EXPECT_EQ(BASE_UNITS_PER_TOKEN, 1000000000ULL);
    EXPECT_EQ(10 * BASE_UNITS_PER_TOKEN, 10000000000ULL);
}

TEST(AmountTest, AddWouldOverflow) {
    EXPECT_FALSE(AddWouldOverflow(0, 0));
    EXPECT_FALSE(AddWouldOverflow(UINT64_MAX, 0));
    EXPECT_FALSE(AddWouldOverflow(UINT64_MAX - 1, 1));
    EXPECT_TRUE(AddWouldOverflow(UINT64_MAX, 1));
    EXPECT_TRUE(AddWouldOverflow(UINT64_MAX / 2 + 1, UINT64_MAX / 2 + 1));
}

// ============================================================================
// Hash256 Tests
// ============================================================================

TEST(Hash256Test, DefaultConstructorCreatesZeroHash) {
    Hash256 h;
    EXPECT_TRUE(h.IsNull());
    for (size_t i = 0; i < Hash256::SIZE; ++i) {
        EXPECT_EQ(h[i], 0);
    }
}

TEST(Hash256Test, SizeIs32Bytes) {
    EXPECT_EQ(Hash256::SIZE, 32u);
    Hash256 h;
    EXPECT_EQ(h.size(), 32u);
}

TEST(Hash256Test, ConstructFromBytes) {
    std::array<Byte, 32> data;
    for (size_t i = 0; i < 32; ++i) {
        data[i] = static_cast<Byte>(i);
    }

    Hash256 h(data);
    for (size_t i = 0; i < 32; ++i) {
        EXPECT_EQ(h[i], i);
    }
    EXPECT_FALSE(h.IsNull());
}

TEST(Hash256Test, ShortInputIsZeroPadded) {
    const Byte bytes[] = {0xaa, 0xbb};
    Hash256 h(bytes, sizeof(bytes));
    EXPECT_EQ(h[0], 0xaa);
    EXPECT_EQ(h[1], 0xbb);
    EXPECT_EQ(h[2], 0);
    EXPECT_EQ(h[31], 0);
}

TEST(Hash256Test, EqualityAndOrdering) {
    std::array<Byte, 32> low{};
    std::array<Byte, 32> high{};
    high[0] = 0x01;

    Hash256 a(low);
    Hash256 b(high);
    EXPECT_EQ(a, Hash256(low));
    EXPECT_NE(a, b);
    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);
}

TEST(Hash256Test, SetNull) {
    std::array<Byte, 32> data;
    data.fill(0x42);
    Hash256 h(data);
    h.SetNull();
    EXPECT_TRUE(h.IsNull());
}

TEST(Hash256Test, HexKeepsStoredByteOrder) {
    std::array<Byte, 32> data{};
    data[0] = 0x01;
    data[31] = 0xff;
    Hash256 h(data);

    std::string hex = h.ToHex();
    ASSERT_EQ(hex.size(), 64u);
    EXPECT_EQ(hex.substr(0, 2), "01");
    EXPECT_EQ(hex.substr(62, 2), "ff");
    EXPECT_EQ(Hash256(Hash256::FromHex(hex)), h);
}

TEST(Hash256Test, FromHexRejectsBadInput) {
    EXPECT_THROW(Hash256::FromHex("abcd"), std::invalid_argument);
    EXPECT_THROW(Hash256::FromHex(std::string(64, 'g')), std::invalid_argument);
}

// ============================================================================
// Hex Utility Tests
// ============================================================================

TEST(HexTest, BytesToHex) {
    std::vector<uint8_t> bytes = {0x00, 0x0f, 0xa5, 0xff};
    EXPECT_EQ(BytesToHex(bytes), "000fa5ff");
    EXPECT_EQ(BytesToHex(bytes.data(), 2), "000f");
    EXPECT_EQ(BytesToHex(std::vector<uint8_t>{}), "");
}

TEST(HexTest, HexToBytesAcceptsBothCases) {
    EXPECT_EQ(HexToBytes("00FFa5"), (std::vector<uint8_t>{0x00, 0xff, 0xa5}));
}

TEST(HexTest, HexToBytesRejectsMalformed) {
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("zz"), std::invalid_argument);
}

TEST(HexTest, IsValidHex) {
    EXPECT_TRUE(IsValidHex("deadBEEF"));
    EXPECT_FALSE(IsValidHex(""));
    EXPECT_FALSE(IsValidHex("abc"));
    EXPECT_FALSE(IsValidHex("0x12"));
}

TEST(HexTest, IsLowerHex) {
    EXPECT_TRUE(IsLowerHex("0123456789abcdef"));
    EXPECT_FALSE(IsLowerHex("ABCDEF"));
    EXPECT_FALSE(IsLowerHex("12g4"));
}

TEST(HexTest, FormatHex64PadsToSixteenDigits) {
    EXPECT_EQ(FormatHex64(0), "0000000000000000");
    EXPECT_EQ(FormatHex64(0x1505), "0000000000001505");
    EXPECT_EQ(FormatHex64(UINT64_MAX), "ffffffffffffffff");
}

} // namespace test
} // namespace dadbs
