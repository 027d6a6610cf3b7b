// NOCKLEDGER - Keys and Address Tests
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include <gtest/gtest.h>

#include "nockledger/core/hex.h"
#include "nockledger/crypto/keys.h"

#include <string>
#include <vector>

namespace nockledger {
namespace {

// ============================================================================
// Base58
// ============================================================================

TEST(Base58Test, KnownVectors) {
    EXPECT_EQ(EncodeBase58(std::vector<uint8_t>{}), "");
    EXPECT_EQ(EncodeBase58(HexToBytes("61")), "2g");
    EXPECT_EQ(EncodeBase58(HexToBytes("626262")), "a3gV");
    EXPECT_EQ(EncodeBase58(HexToBytes("636363")), "aPEr");
    EXPECT_EQ(EncodeBase58(HexToBytes("0000287fb4cd")), "11233QC4");
}

TEST(Base58Test, DecodeInvertsEncode) {
    auto decoded = DecodeBase58("11233QC4");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(BytesToHex(*decoded), "0000287fb4cd");
}

TEST(Base58Test, RejectsCharactersOutsideAlphabet) {
    EXPECT_FALSE(DecodeBase58("0OIl").has_value());
    EXPECT_FALSE(DecodeBase58("abc!").has_value());
}

// ============================================================================
// Address
// ============================================================================

TEST(AddressTest, NullAddressEncodesAsOnes) {
    Address null;
    EXPECT_TRUE(null.IsNull());
    EXPECT_EQ(null.ToString(), std::string(32, '1'));
}

TEST(AddressTest, StringRoundTrip) {
    for (int i = 0; i < 20; ++i) {
        auto key = KeyPair::Generate();
        ASSERT_TRUE(key.ok());
        const Address& address = key->GetAddress();

        auto parsed = Address::FromString(address.ToString());
        ASSERT_TRUE(parsed.ok()) << parsed.status().ToString();
        EXPECT_EQ(*parsed, address);
    }
}

TEST(AddressTest, FromBytesRequires32Bytes) {
    auto tooShort = Address::FromBytes(std::vector<Byte>(31, 0x01));
    EXPECT_FALSE(tooShort.ok());
    EXPECT_EQ(tooShort.status().code(), Status::ADDRESS);

    auto tooLong = Address::FromBytes(std::vector<Byte>(33, 0x01));
    EXPECT_EQ(tooLong.status().code(), Status::ADDRESS);

    auto exact = Address::FromBytes(std::vector<Byte>(32, 0x01));
    ASSERT_TRUE(exact.ok());
    EXPECT_EQ(exact->bytes()[0], 0x01);
}

TEST(AddressTest, FromStringRejectsWrongLength) {
    // Valid base58, but decodes to 3 bytes
    auto r = Address::FromString("a3gV");
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.status().code(), Status::ADDRESS);
}

TEST(AddressTest, FromStringRejectsInvalidBase58) {
    auto r = Address::FromString("not-base58!");
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.status().code(), Status::ADDRESS);
}

// ============================================================================
// KeyPair
// ============================================================================

TEST(KeyPairTest, Rfc8032PublicKey) {
    auto key = KeyPair::FromSecret(
        HexToBytes("9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60"));
    ASSERT_TRUE(key.ok());
    EXPECT_EQ(BytesToHex(key->GetPublicKey()),
              "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");
}

TEST(KeyPairTest, FromSecretIsDeterministic) {
    std::vector<Byte> secret(32, 0x07);
    auto a = KeyPair::FromSecret(secret);
    auto b = KeyPair::FromSecret(secret);
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_EQ(a->GetAddress(), b->GetAddress());
    EXPECT_EQ(a->GetSecret(), secret);
}

TEST(KeyPairTest, RejectsWrongSecretLength) {
    auto r = KeyPair::FromSecret(std::vector<Byte>(16, 0x01));
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.status().code(), Status::CRYPTO);
}

TEST(KeyPairTest, AddressIsPublicKey) {
    auto key = KeyPair::Generate();
    ASSERT_TRUE(key.ok());
    auto pub = key->GetPublicKey();
    ASSERT_EQ(pub.size(), KeyPair::PUBLIC_KEY_SIZE);
    auto fromPub = Address::FromBytes(pub);
    ASSERT_TRUE(fromPub.ok());
    EXPECT_EQ(*fromPub, key->GetAddress());
}

TEST(KeyPairTest, SignAndVerify) {
    auto key = KeyPair::Generate();
    ASSERT_TRUE(key.ok());

    std::vector<Byte> message = {'n', 'o', 'c', 'k'};
    auto sig = key->Sign(message);
    ASSERT_TRUE(sig.ok());
    EXPECT_EQ(sig->size(), KeyPair::SIGNATURE_SIZE);
    EXPECT_TRUE(key->Verify(message, *sig));

    std::vector<Byte> other = {'n', 'o', 'c', 'x'};
    EXPECT_FALSE(key->Verify(other, *sig));

    auto tampered = *sig;
    tampered[10] ^= 0x80;
    EXPECT_FALSE(key->Verify(message, tampered));
}

TEST(KeyPairTest, VerifyRejectsOtherKey) {
    auto a = KeyPair::Generate();
    auto b = KeyPair::Generate();
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());

    std::vector<Byte> message = {1, 2, 3};
    auto sig = a->Sign(message);
    ASSERT_TRUE(sig.ok());
    EXPECT_FALSE(KeyPair::VerifySignature(b->GetAddress(), message, *sig));
    EXPECT_TRUE(KeyPair::VerifySignature(a->GetAddress(), message, *sig));
}

TEST(KeyPairTest, VerifyRejectsShortSignature) {
    auto key = KeyPair::Generate();
    ASSERT_TRUE(key.ok());
    std::vector<Byte> message = {1};
    EXPECT_FALSE(key->Verify(message, std::vector<Byte>(10, 0)));
}

TEST(KeyPairTest, MoveClearsSource) {
    auto key = KeyPair::Generate();
    ASSERT_TRUE(key.ok());
    KeyPair original = key.Take();
    Address address = original.GetAddress();

    KeyPair moved(std::move(original));
    EXPECT_EQ(moved.GetAddress(), address);
    EXPECT_EQ(original.GetSecret(), std::vector<Byte>(32, 0));
}

} // namespace
} // namespace nockledger
