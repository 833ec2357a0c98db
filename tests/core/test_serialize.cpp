// HYDROSTAKE - Serialization Tests
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#include <gtest/gtest.h>
#include <hydrostake/core/serialize.h>
#include <hydrostake/core/types.h>
#include <hydrostake/core/uint256.h>

#include <ios>
#include <string>
#include <vector>

using namespace hydrostake;

// ============================================================================
// DataStream Tests
// ============================================================================

TEST(DataStreamTest, DefaultConstructor) {
    DataStream ds;
    EXPECT_TRUE(ds.empty());
    EXPECT_EQ(ds.size(), 0u);
}

TEST(DataStreamTest, WriteAndRead) {
    DataStream ds;
    std::vector<uint8_t> data = {0x01, 0x02, 0x03, 0x04};
    ds.Write(data.data(), data.size());
    EXPECT_EQ(ds.size(), 4u);

    std::vector<uint8_t> result(4);
    ds.Read(result.data(), result.size());
    EXPECT_EQ(result, data);
    EXPECT_TRUE(ds.empty());
}

TEST(DataStreamTest, ReadPastEndThrows) {
    DataStream ds;
    ds << uint8_t(7);
    uint64_t value = 0;
    EXPECT_THROW(ds >> value, std::ios_base::failure);
}

TEST(DataStreamTest, ConstructFromString) {
    DataStream ds(std::string("\xDE\xAD", 2));
    uint8_t a = 0, b = 0;
    ds >> a >> b;
    EXPECT_EQ(a, 0xDE);
    EXPECT_EQ(b, 0xAD);
}

TEST(DataStreamTest, StrReturnsUnreadBytes) {
    DataStream ds;
    ds << uint8_t(1) << uint8_t(2) << uint8_t(3);
    uint8_t first = 0;
    ds >> first;
    EXPECT_EQ(ds.str(), std::string("\x02\x03", 2));
    EXPECT_EQ(ds.ToHex(), "0203");
}

// ============================================================================
// Integer Tests (little-endian)
// ============================================================================

TEST(SerializeTest, Uint64LittleEndian) {
    DataStream ds;
    ds << uint64_t(0x0102030405060708ULL);
    EXPECT_EQ(ds.ToHex(), "0807060504030201");

    uint64_t result = 0;
    ds >> result;
    EXPECT_EQ(result, 0x0102030405060708ULL);
}

TEST(SerializeTest, NegativeInt64) {
    DataStream ds;
    ds << int64_t(-2);
    EXPECT_EQ(ds.ToHex(), "feffffffffffffff");

    int64_t result = 0;
    ds >> result;
    EXPECT_EQ(result, -2);
}

TEST(SerializeTest, BoolRejectsOutOfRange) {
    DataStream ds;
    ds << true << false << uint8_t(2);

    bool a = false, b = true, c = false;
    ds >> a >> b;
    EXPECT_TRUE(a);
    EXPECT_FALSE(b);
    EXPECT_THROW(ds >> c, std::ios_base::failure);
}

// ============================================================================
// CompactSize Tests
// ============================================================================

TEST(CompactSizeTest, SmallValuesUseOneByte) {
    DataStream ds;
    WriteCompactSize(ds, 252);
    EXPECT_EQ(ds.size(), 1u);
    EXPECT_EQ(ReadCompactSize(ds), 252u);
}

TEST(CompactSizeTest, LargeValuesUseMarker) {
    DataStream ds;
    WriteCompactSize(ds, 253);
    EXPECT_EQ(ds.size(), 9u);
    EXPECT_EQ(ds.ToHex(), "fffd00000000000000");
    EXPECT_EQ(ReadCompactSize(ds), 253u);
}

TEST(CompactSizeTest, RejectsNonCanonical) {
    DataStream ds;
    ds << uint8_t(0xFF) << uint64_t(5);
    EXPECT_THROW(ReadCompactSize(ds), std::ios_base::failure);
}

TEST(CompactSizeTest, RejectsUnknownMarker) {
    DataStream ds;
    ds << uint8_t(0xFD) << uint8_t(0) << uint8_t(1);
    EXPECT_THROW(ReadCompactSize(ds), std::ios_base::failure);
}

TEST(CompactSizeTest, RejectsOversized) {
    DataStream ds;
    ds << uint8_t(0xFF) << uint64_t(MAX_SIZE + 1);
    EXPECT_THROW(ReadCompactSize(ds), std::ios_base::failure);
}

// ============================================================================
// String, Vector and Hash Tests
// ============================================================================

TEST(SerializeTest, StringWithLengthPrefix) {
    DataStream ds;
    ds << std::string("hydro");
    EXPECT_EQ(ds.size(), 6u);

    std::string result;
    ds >> result;
    EXPECT_EQ(result, "hydro");
}

TEST(SerializeTest, VectorOfIntegers) {
    DataStream ds;
    std::vector<uint64_t> values = {1, 2, 3};
    ds << values;
    EXPECT_EQ(ds.size(), 1u + 3 * 8);

    std::vector<uint64_t> result;
    ds >> result;
    EXPECT_EQ(result, values);
}

TEST(SerializeTest, AddressIsRawBytes) {
    Address addr = Address::FromId(0xAB);
    DataStream ds;
    ds << addr;
    EXPECT_EQ(ds.size(), 20u);

    Address result;
    ds >> result;
    EXPECT_EQ(result, addr);
}

// ============================================================================
// Uint256 Tests
// ============================================================================

TEST(SerializeTest, Uint256ZeroIsOneByte) {
    DataStream ds;
    ds << Uint256();
    EXPECT_EQ(ds.ToHex(), "00");

    Uint256 result(99);
    ds >> result;
    EXPECT_TRUE(result.IsZero());
}

TEST(SerializeTest, Uint256MinimalBigEndian) {
    DataStream ds;
    ds << Uint256(0x0102);
    EXPECT_EQ(ds.ToHex(), "020102");

    Uint256 result;
    ds >> result;
    EXPECT_EQ(result, Uint256(0x0102));
}

TEST(SerializeTest, Uint256MaxUsesFullWidth) {
    DataStream ds;
    ds << Uint256::Max();
    EXPECT_EQ(ds.size(), 33u);

    Uint256 result;
    ds >> result;
    EXPECT_EQ(result, Uint256::Max());
}

TEST(SerializeTest, Uint256RejectsLeadingZero) {
    DataStream ds;
    ds << uint8_t(2) << uint8_t(0) << uint8_t(1);
    Uint256 result;
    EXPECT_THROW(ds >> result, std::ios_base::failure);
}

TEST(SerializeTest, Uint256RejectsOverlongLength) {
    DataStream ds;
    ds << uint8_t(33);
    Uint256 result;
    EXPECT_THROW(ds >> result, std::ios_base::failure);
}
