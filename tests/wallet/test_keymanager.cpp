// NOCKLEDGER - Key Manager Tests
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include <gtest/gtest.h>

#include "nockledger/wallet/keymanager.h"
#include "nockledger/wallet/mnemonic.h"

#include <string>
#include <vector>

namespace nockledger {
namespace wallet {
namespace {

const std::string PHRASE =
    "legal winner thank year wave sausage worth useful legal winner thank yellow";

class KeyManagerTest : public ::testing::Test {
protected:
    KeyManager keys_;
};

TEST_F(KeyManagerTest, GenerateRegistersKey) {
    auto address = keys_.GenerateKey("main");
    ASSERT_TRUE(address.ok()) << address.status().ToString();
    EXPECT_FALSE(address->IsNull());
    EXPECT_TRUE(keys_.HasKey("main"));
    EXPECT_EQ(keys_.Size(), 1u);
    EXPECT_TRUE(keys_.IsMine(*address));
}

TEST_F(KeyManagerTest, DuplicateNameRejected) {
    ASSERT_TRUE(keys_.GenerateKey("main").ok());

    auto again = keys_.GenerateKey("main");
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.status().code(), Status::KEY_EXISTS);
    EXPECT_EQ(again.status().message(), "Key already exists: main");

    EXPECT_EQ(keys_.ImportKey("main", std::vector<Byte>(32, 0x01)).status().code(),
              Status::KEY_EXISTS);
    EXPECT_EQ(keys_.ImportMnemonic("main", PHRASE).status().code(), Status::KEY_EXISTS);
    EXPECT_EQ(keys_.Size(), 1u);
}

TEST_F(KeyManagerTest, ImportKeyIsDeterministic) {
    std::vector<Byte> secret(32, 0x42);
    auto address = keys_.ImportKey("imported", secret);
    ASSERT_TRUE(address.ok());

    auto expected = KeyPair::FromSecret(secret);
    ASSERT_TRUE(expected.ok());
    EXPECT_EQ(*address, expected->GetAddress());
}

TEST_F(KeyManagerTest, ImportKeyRejectsBadSecret) {
    auto r = keys_.ImportKey("short", std::vector<Byte>(31, 0x01));
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.status().code(), Status::CRYPTO);
    EXPECT_FALSE(keys_.HasKey("short"));
}

TEST_F(KeyManagerTest, ImportMnemonicMatchesWalletSeed) {
    auto address = keys_.ImportMnemonic("restored", PHRASE);
    ASSERT_TRUE(address.ok()) << address.status().ToString();

    auto seed = Mnemonic::DeriveWalletSeed(PHRASE);
    ASSERT_TRUE(seed.ok());
    auto expected = KeyPair::FromSecret(*seed);
    ASSERT_TRUE(expected.ok());
    EXPECT_EQ(*address, expected->GetAddress());

    KeyManager other;
    auto same = other.ImportMnemonic("again", PHRASE);
    ASSERT_TRUE(same.ok());
    EXPECT_EQ(*same, *address);
}

TEST_F(KeyManagerTest, ImportMnemonicRejectsInvalidPhrase) {
    auto r = keys_.ImportMnemonic("bad", "legal winner thank");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.status().code(), Status::CRYPTO);
    EXPECT_EQ(keys_.Size(), 0u);
}

TEST_F(KeyManagerTest, GetKeyAndUnknownName) {
    auto address = keys_.GenerateKey("main");
    ASSERT_TRUE(address.ok());

    auto key = keys_.GetKey("main");
    ASSERT_TRUE(key.ok());
    EXPECT_EQ((*key)->GetAddress(), *address);

    auto missing = keys_.GetKey("nobody");
    ASSERT_FALSE(missing.ok());
    EXPECT_TRUE(missing.status().IsKeyNotFound());
    EXPECT_EQ(missing.status().message(), "Key not found: nobody");
}

TEST_F(KeyManagerTest, SignAndVerify) {
    ASSERT_TRUE(keys_.GenerateKey("a").ok());
    ASSERT_TRUE(keys_.GenerateKey("b").ok());

    std::vector<Byte> message = {0xde, 0xad, 0xbe, 0xef};
    auto sig = keys_.SignWithKey("a", message);
    ASSERT_TRUE(sig.ok());

    auto good = keys_.VerifyWithKey("a", message, *sig);
    ASSERT_TRUE(good.ok());
    EXPECT_TRUE(*good);

    auto wrongKey = keys_.VerifyWithKey("b", message, *sig);
    ASSERT_TRUE(wrongKey.ok());
    EXPECT_FALSE(*wrongKey);

    EXPECT_TRUE(keys_.SignWithKey("c", message).status().IsKeyNotFound());
    EXPECT_TRUE(keys_.VerifyWithKey("c", message, *sig).status().IsKeyNotFound());
}

TEST_F(KeyManagerTest, RemoveKey) {
    auto address = keys_.GenerateKey("temp");
    ASSERT_TRUE(address.ok());
    ASSERT_TRUE(keys_.RemoveKey("temp").ok());
    EXPECT_FALSE(keys_.HasKey("temp"));
    EXPECT_FALSE(keys_.IsMine(*address));
    EXPECT_TRUE(keys_.RemoveKey("temp").IsKeyNotFound());
}

TEST_F(KeyManagerTest, ListingIsSortedByName) {
    auto c = keys_.GenerateKey("charlie");
    auto a = keys_.GenerateKey("alpha");
    auto b = keys_.GenerateKey("bravo");
    ASSERT_TRUE(a.ok() && b.ok() && c.ok());

    EXPECT_EQ(keys_.ListKeys(), (std::vector<std::string>{"alpha", "bravo", "charlie"}));
    EXPECT_EQ(keys_.GetAddresses(), (std::vector<Address>{*a, *b, *c}));
}

TEST_F(KeyManagerTest, FindKeyByAddress) {
    auto address = keys_.GenerateKey("main");
    ASSERT_TRUE(address.ok());
    EXPECT_EQ(keys_.FindKeyByAddress(*address), std::optional<std::string>("main"));

    auto stranger = KeyPair::Generate();
    ASSERT_TRUE(stranger.ok());
    EXPECT_FALSE(keys_.FindKeyByAddress(stranger->GetAddress()).has_value());
    EXPECT_FALSE(keys_.IsMine(stranger->GetAddress()));
}

} // namespace
} // namespace wallet
} // namespace nockledger
