// NOCKLEDGER - Serialization Tests
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include <gtest/gtest.h>

#include "nockledger/core/serialize.h"
#include "nockledger/core/types.h"
#include "nockledger/crypto/keys.h"

#include <optional>
#include <string>
#include <vector>

namespace nockledger {
namespace {

TEST(SerializeTest, IntegersAreLittleEndian) {
    DataStream ss;
    ss << uint32_t{0x01020304} << uint64_t{0x0a0b0c0d0e0f1011ULL};

    std::vector<uint8_t> expected = {
        0x04, 0x03, 0x02, 0x01,
        0x11, 0x10, 0x0f, 0x0e, 0x0d, 0x0c, 0x0b, 0x0a,
    };
    EXPECT_EQ(ss.Data(), expected);

    uint32_t a = 0;
    uint64_t b = 0;
    ss >> a >> b;
    EXPECT_EQ(a, 0x01020304u);
    EXPECT_EQ(b, 0x0a0b0c0d0e0f1011ULL);
    EXPECT_TRUE(ss.empty());
}

TEST(SerializeTest, CompactSizeBoundaries) {
    DataStream small;
    WriteCompactSize(small, 252);
    EXPECT_EQ(small.size(), 1u);

    DataStream medium;
    WriteCompactSize(medium, 253);
    ASSERT_EQ(medium.size(), 3u);
    EXPECT_EQ(medium.Data()[0], 0xFD);
    EXPECT_EQ(ReadCompactSize(medium), 253u);

    DataStream large;
    WriteCompactSize(large, 0x10000);
    ASSERT_EQ(large.size(), 5u);
    EXPECT_EQ(large.Data()[0], 0xFE);
}

TEST(SerializeTest, NonCanonicalCompactSizeRejected) {
    DataStream ss(std::vector<uint8_t>{0xFD, 0x10, 0x00});
    EXPECT_THROW(ReadCompactSize(ss), std::ios_base::failure);
}

TEST(SerializeTest, StringsAndBytesAreLengthPrefixed) {
    DataStream ss;
    ss << std::string("abc") << std::vector<uint8_t>{0xff, 0xee};
    std::vector<uint8_t> expected = {3, 'a', 'b', 'c', 2, 0xff, 0xee};
    EXPECT_EQ(ss.Data(), expected);

    std::string s;
    std::vector<uint8_t> v;
    ss >> s >> v;
    EXPECT_EQ(s, "abc");
    EXPECT_EQ(v, (std::vector<uint8_t>{0xff, 0xee}));
}

TEST(SerializeTest, OptionalUsesPresenceByte) {
    DataStream ss;
    std::optional<uint64_t> none;
    std::optional<uint64_t> some = 9;
    ss << none << some;
    EXPECT_EQ(ss.size(), 1u + 1u + 8u);

    std::optional<uint64_t> a = 5;
    std::optional<uint64_t> b;
    ss >> a >> b;
    EXPECT_FALSE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*b, 9u);
}

TEST(SerializeTest, OptionalRejectsBadFlag) {
    DataStream ss(std::vector<uint8_t>{2});
    std::optional<uint64_t> value;
    EXPECT_THROW(ss >> value, std::ios_base::failure);
}

TEST(SerializeTest, AddressIsRawBytes) {
    std::array<Byte, Address::SIZE> raw{};
    raw[0] = 0x42;
    raw[31] = 0x24;
    Address address(raw);

    DataStream ss;
    ss << address;
    EXPECT_EQ(ss.size(), Address::SIZE);

    Address decoded;
    ss >> decoded;
    EXPECT_EQ(decoded, address);
}

TEST(SerializeTest, ReadPastEndThrows) {
    DataStream ss(std::vector<uint8_t>{1, 2, 3});
    uint64_t value = 0;
    EXPECT_THROW(ss >> value, std::ios_base::failure);
}

TEST(SerializeTest, SerializeSizeMatchesStream) {
    std::vector<std::string> words = {"alpha", "beta", "gamma"};
    DataStream ss;
    ss << words;
    EXPECT_EQ(GetSerializeSize(words), ss.size());
}

} // namespace
} // namespace nockledger
