// NOCKLEDGER - Transaction Builder Tests
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include <gtest/gtest.h>

#include "nockledger/crypto/sha256.h"
#include "nockledger/wallet/txbuilder.h"

#include <cstdint>
#include <string>
#include <vector>

namespace nockledger {
namespace wallet {
namespace {

class TransactionBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto address = keys_.ImportKey("main", std::vector<Byte>(32, 0x11));
        ASSERT_TRUE(address.ok());
        owner_ = *address;

        auto key = keys_.GetKey("main");
        ASSERT_TRUE(key.ok());
        publicKey_ = (*key)->GetPublicKey();

        auto other = KeyPair::FromSecret(std::vector<Byte>(32, 0x22));
        ASSERT_TRUE(other.ok());
        recipient_ = other->GetAddress();
    }

    Note MakeNote(Amount amount, uint32_t index) {
        return Note::Create(owner_, amount, "funding", index, BlockHeight(1));
    }

    KeyManager keys_;
    Address owner_;
    Address recipient_;
    std::vector<Byte> publicKey_;
};

TEST_F(TransactionBuilderTest, BuildsAndSignsSpend) {
    TransactionBuilder builder;
    builder.AddInputFromNote(MakeNote(100, 0), publicKey_)
           .AddInputFromNote(MakeNote(50, 1), publicKey_)
           .AddOutput(TransactionOutput(140, recipient_))
           .SetFee(10);

    ASSERT_TRUE(builder.Validate().ok());
    auto tx = builder.BuildAndSign(keys_, "main");
    ASSERT_TRUE(tx.ok()) << tx.status().ToString();

    EXPECT_EQ(tx->inputs.size(), 2u);
    EXPECT_EQ(tx->outputs.size(), 1u);
    EXPECT_EQ(tx->fee, 10u);
    EXPECT_EQ(tx->TotalInput(), 150u);
    EXPECT_EQ(tx->TotalOutput(), 140u);

    Hash256 expected = CreateTransactionHash(tx->inputs, tx->outputs, tx->fee);
    EXPECT_EQ(tx->id, expected.ToHex());
    EXPECT_EQ(tx->id, "735c44f8dc241100b0284d1f06ff62f63a68383d62fc10d1583e52bc9827d887");
    EXPECT_EQ(tx->hash, expected.ToVector());
    EXPECT_EQ(tx->signature.size(), KeyPair::SIGNATURE_SIZE);
    EXPECT_TRUE(KeyPair::VerifySignature(owner_, tx->hash, tx->signature));
    EXPECT_TRUE(tx->Verify().ok());
}

TEST_F(TransactionBuilderTest, InputsCarryNoteOutPoints) {
    Note note = MakeNote(75, 3);
    TransactionBuilder builder;
    builder.AddInputFromNote(note, publicKey_);

    ASSERT_EQ(builder.GetInputs().size(), 1u);
    const TransactionInput& in = builder.GetInputs()[0];
    EXPECT_EQ(in.previousOutput, OutPoint("funding", 3));
    EXPECT_EQ(in.amount, 75u);
    EXPECT_EQ(in.publicKey, publicKey_);
    EXPECT_TRUE(in.signature.empty());
}

TEST_F(TransactionBuilderTest, ExactSpendWithoutChangeIsValid) {
    TransactionBuilder builder;
    builder.AddInputFromNote(MakeNote(60, 0), publicKey_)
           .AddOutput(TransactionOutput(55, recipient_))
           .SetFee(5);
    EXPECT_TRUE(builder.Validate().ok());
}

TEST_F(TransactionBuilderTest, MissingInputsOrOutputs) {
    TransactionBuilder empty;
    Status noInputs = empty.Validate();
    EXPECT_EQ(noInputs.code(), Status::TRANSACTION);
    EXPECT_EQ(noInputs.message(), "No inputs provided");

    TransactionBuilder inputsOnly;
    inputsOnly.AddInputFromNote(MakeNote(10, 0), publicKey_);
    Status noOutputs = inputsOnly.Validate();
    EXPECT_EQ(noOutputs.code(), Status::TRANSACTION);
    EXPECT_EQ(noOutputs.message(), "No outputs provided");

    EXPECT_FALSE(inputsOnly.BuildAndSign(keys_, "main").ok());
}

TEST_F(TransactionBuilderTest, InsufficientFundsReportsAmounts) {
    TransactionBuilder builder;
    builder.AddInputFromNote(MakeNote(100, 0), publicKey_)
           .AddOutput(TransactionOutput(95, recipient_))
           .SetFee(10);

    Status s = builder.Validate();
    ASSERT_TRUE(s.IsInsufficientFunds());
    EXPECT_EQ(s.required(), 105u);
    EXPECT_EQ(s.available(), 100u);
    EXPECT_EQ(s.message(), "Insufficient funds: required 105, available 100");

    auto tx = builder.BuildAndSign(keys_, "main");
    ASSERT_FALSE(tx.ok());
    EXPECT_TRUE(tx.status().IsInsufficientFunds());
}

TEST_F(TransactionBuilderTest, OverflowingTotals) {
    TransactionBuilder inputs;
    inputs.AddInputFromNote(MakeNote(UINT64_MAX, 0), publicKey_)
          .AddInputFromNote(MakeNote(1, 1), publicKey_)
          .AddOutput(TransactionOutput(1, recipient_));
    EXPECT_EQ(inputs.TotalInput().status().message(), "Input total overflows");
    EXPECT_EQ(inputs.Validate().message(), "Input total overflows");

    TransactionBuilder outputs;
    outputs.AddInputFromNote(MakeNote(10, 0), publicKey_)
           .AddOutput(TransactionOutput(UINT64_MAX, recipient_))
           .AddOutput(TransactionOutput(1, recipient_));
    EXPECT_EQ(outputs.TotalOutput().status().message(), "Output total overflows");

    TransactionBuilder fee;
    fee.AddInputFromNote(MakeNote(10, 0), publicKey_)
       .AddOutput(TransactionOutput(UINT64_MAX, recipient_))
       .SetFee(1);
    EXPECT_EQ(fee.Validate().message(), "Output total plus fee overflows");
}

TEST_F(TransactionBuilderTest, UnknownSigningKey) {
    TransactionBuilder builder;
    builder.AddInputFromNote(MakeNote(10, 0), publicKey_)
           .AddOutput(TransactionOutput(10, recipient_));

    auto tx = builder.BuildAndSign(keys_, "missing");
    ASSERT_FALSE(tx.ok());
    EXPECT_TRUE(tx.status().IsKeyNotFound());
}

TEST_F(TransactionBuilderTest, FeeChangesId) {
    TransactionBuilder builder;
    builder.AddInputFromNote(MakeNote(100, 0), publicKey_)
           .AddOutput(TransactionOutput(90, recipient_));

    auto noFee = builder.BuildAndSign(keys_, "main");
    builder.SetFee(5);
    auto withFee = builder.BuildAndSign(keys_, "main");
    ASSERT_TRUE(noFee.ok());
    ASSERT_TRUE(withFee.ok());
    EXPECT_NE(noFee->id, withFee->id);
}

TEST_F(TransactionBuilderTest, ClearResets) {
    TransactionBuilder builder;
    builder.AddInputFromNote(MakeNote(10, 0), publicKey_)
           .AddOutput(TransactionOutput(5, recipient_))
           .SetFee(1);
    builder.Clear();
    EXPECT_TRUE(builder.GetInputs().empty());
    EXPECT_TRUE(builder.GetOutputs().empty());
    EXPECT_EQ(builder.GetFee(), 0u);
}

} // namespace
} // namespace wallet
} // namespace nockledger
