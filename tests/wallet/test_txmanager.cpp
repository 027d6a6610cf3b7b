// NOCKLEDGER - Transaction Manager Tests
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include <gtest/gtest.h>

#include "nockledger/core/serialize.h"
#include "nockledger/wallet/txbuilder.h"
#include "nockledger/wallet/txmanager.h"

#include <string>
#include <vector>

namespace nockledger {
namespace wallet {
namespace {

class TransactionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto address = keys_.ImportKey("main", std::vector<Byte>(32, 0x33));
        ASSERT_TRUE(address.ok());
        owner_ = *address;
        auto other = KeyPair::FromSecret(std::vector<Byte>(32, 0x44));
        ASSERT_TRUE(other.ok());
        recipient_ = other->GetAddress();
    }

    /// Signed transaction spending one note of `amount`; `index` keeps ids unique
    SignedTransaction MakeTx(Amount amount, uint32_t index) {
        auto key = keys_.GetKey("main");
        EXPECT_TRUE(key.ok());
        Note note = Note::Create(owner_, amount, "funding", index, BlockHeight(1));

        TransactionBuilder builder;
        builder.AddInputFromNote(note, (*key)->GetPublicKey())
               .AddOutput(TransactionOutput(amount - 2, recipient_))
               .SetFee(2);
        auto tx = builder.BuildAndSign(keys_, "main");
        EXPECT_TRUE(tx.ok()) << tx.status().ToString();
        return tx.Take();
    }

    TransactionRecord MakeRecord(const std::string& id, TransactionStatus status,
                                 TimestampMillis createdAt) {
        TransactionRecord record;
        record.id = id;
        record.status = status;
        record.createdAt = createdAt;
        return record;
    }

    std::vector<std::string> Ids(const std::vector<TransactionRecord>& records) {
        std::vector<std::string> ids;
        for (const auto& r : records) ids.push_back(r.id);
        return ids;
    }

    KeyManager keys_;
    Address owner_;
    Address recipient_;
    TransactionManager manager_;
};

TEST_F(TransactionManagerTest, AddPendingBuildsRecord) {
    SignedTransaction tx = MakeTx(100, 0);
    auto record = manager_.AddPendingTransaction(tx, true);
    ASSERT_TRUE(record.ok()) << record.status().ToString();

    EXPECT_EQ(record->id, tx.id);
    EXPECT_TRUE(record->status.IsPending());
    EXPECT_EQ(record->amount, 98u);
    EXPECT_EQ(record->fee, 2u);
    EXPECT_EQ(record->fromAddress, std::optional<Address>(owner_));
    EXPECT_EQ(record->toAddress, std::optional<Address>(recipient_));
    EXPECT_TRUE(record->isOutgoing);
    EXPECT_GT(record->createdAt, 0);
    EXPECT_FALSE(record->confirmedAt.has_value());

    EXPECT_EQ(manager_.GetPending().size(), 1u);
    auto stored = manager_.GetSignedTransaction(tx.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, tx);
}

TEST_F(TransactionManagerTest, DuplicateIdRejected) {
    SignedTransaction tx = MakeTx(100, 0);
    ASSERT_TRUE(manager_.AddPendingTransaction(tx, true).ok());

    auto again = manager_.AddPendingTransaction(tx, false);
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.status().code(), Status::TRANSACTION);
    EXPECT_EQ(again.status().message(), "Transaction " + tx.id + " already recorded");
    EXPECT_EQ(manager_.Size(), 1u);

    // Still rejected once it has moved on from pending
    ASSERT_TRUE(manager_.ConfirmTransaction(tx.id, 5).ok());
    EXPECT_FALSE(manager_.AddPendingTransaction(tx, true).ok());
}

TEST_F(TransactionManagerTest, ConfirmMovesRecord) {
    SignedTransaction tx = MakeTx(100, 0);
    ASSERT_TRUE(manager_.AddPendingTransaction(tx, true).ok());
    ASSERT_TRUE(manager_.ConfirmTransaction(tx.id, 42).ok());

    EXPECT_TRUE(manager_.GetPending().empty());
    ASSERT_EQ(manager_.GetConfirmed().size(), 1u);
    const TransactionRecord& record = manager_.GetConfirmed()[0];
    EXPECT_TRUE(record.status.IsConfirmed());
    EXPECT_EQ(record.status.blockHeight, std::optional<BlockHeight>(42));
    EXPECT_TRUE(record.confirmedAt.has_value());
}

TEST_F(TransactionManagerTest, ConfirmUnknownOrTwice) {
    Status missing = manager_.ConfirmTransaction("deadbeef", 1);
    EXPECT_EQ(missing.code(), Status::TRANSACTION);
    EXPECT_EQ(missing.message(), "Transaction deadbeef not found");

    SignedTransaction tx = MakeTx(100, 0);
    ASSERT_TRUE(manager_.AddPendingTransaction(tx, true).ok());
    ASSERT_TRUE(manager_.ConfirmTransaction(tx.id, 1).ok());
    EXPECT_EQ(manager_.ConfirmTransaction(tx.id, 2).message(),
              "Transaction " + tx.id + " not found");
    EXPECT_EQ(manager_.GetConfirmed().size(), 1u);
}

TEST_F(TransactionManagerTest, MarkFailed) {
    SignedTransaction tx = MakeTx(100, 0);
    ASSERT_TRUE(manager_.AddPendingTransaction(tx, true).ok());
    ASSERT_TRUE(manager_.MarkFailed(tx.id, "rejected by peer").ok());

    EXPECT_TRUE(manager_.GetPending().empty());
    ASSERT_EQ(manager_.GetFailed().size(), 1u);
    EXPECT_TRUE(manager_.GetFailed()[0].status.IsFailed());
    EXPECT_EQ(manager_.GetFailed()[0].status.reason, "rejected by peer");
    EXPECT_TRUE(manager_.GetAllTransactions().empty());

    auto record = manager_.GetTransaction(tx.id);
    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(record->status.IsFailed());

    EXPECT_EQ(manager_.MarkFailed(tx.id, "again").code(), Status::TRANSACTION);
    EXPECT_EQ(manager_.ConfirmTransaction(tx.id, 3).code(), Status::TRANSACTION);
}

TEST_F(TransactionManagerTest, AllTransactionsNewestFirst) {
    std::vector<TransactionRecord> records = {
        MakeRecord("a", TransactionStatus::Confirmed(1), 100),
        MakeRecord("b", TransactionStatus::Pending(), 300),
        MakeRecord("c", TransactionStatus::Confirmed(2), 200),
        MakeRecord("d", TransactionStatus::Failed("x"), 400),
    };
    ASSERT_TRUE(manager_.Restore(records, {}).ok());

    EXPECT_EQ(Ids(manager_.GetAllTransactions()), (std::vector<std::string>{"b", "c", "a"}));
    EXPECT_EQ(Ids(manager_.GetPending()), (std::vector<std::string>{"b"}));
    EXPECT_EQ(Ids(manager_.GetConfirmed()), (std::vector<std::string>{"a", "c"}));
    EXPECT_EQ(Ids(manager_.GetFailed()), (std::vector<std::string>{"d"}));
    EXPECT_EQ(manager_.Size(), 4u);
}

TEST_F(TransactionManagerTest, RestoreReplacesState) {
    SignedTransaction tx = MakeTx(100, 0);
    ASSERT_TRUE(manager_.AddPendingTransaction(tx, true).ok());

    SignedTransaction other = MakeTx(50, 1);
    std::vector<TransactionRecord> records = {
        MakeRecord(other.id, TransactionStatus::Pending(), 10),
    };
    ASSERT_TRUE(manager_.Restore(records, {other}).ok());

    EXPECT_EQ(manager_.Size(), 1u);
    EXPECT_FALSE(manager_.GetTransaction(tx.id).has_value());
    EXPECT_FALSE(manager_.GetSignedTransaction(tx.id).has_value());
    ASSERT_EQ(manager_.GetSignedTransactions().size(), 1u);
    EXPECT_EQ(manager_.GetSignedTransactions()[0], other);
}

TEST_F(TransactionManagerTest, RestoreRejectsDuplicates) {
    SignedTransaction tx = MakeTx(100, 0);
    ASSERT_TRUE(manager_.AddPendingTransaction(tx, true).ok());

    std::vector<TransactionRecord> records = {
        MakeRecord("same", TransactionStatus::Pending(), 1),
        MakeRecord("same", TransactionStatus::Confirmed(1), 2),
    };
    Status s = manager_.Restore(records, {});
    EXPECT_EQ(s.code(), Status::SERIALIZATION);
    EXPECT_TRUE(manager_.GetTransaction(tx.id).has_value());
}

TEST_F(TransactionManagerTest, ClearEmptiesEverything) {
    ASSERT_TRUE(manager_.AddPendingTransaction(MakeTx(100, 0), true).ok());
    manager_.Clear();
    EXPECT_EQ(manager_.Size(), 0u);
    EXPECT_TRUE(manager_.GetSignedTransactions().empty());
}

TEST_F(TransactionManagerTest, RecordSerializationRoundTrip) {
    SignedTransaction tx = MakeTx(100, 0);
    auto record = manager_.AddPendingTransaction(tx, false);
    ASSERT_TRUE(record.ok());
    ASSERT_TRUE(manager_.MarkFailed(tx.id, "timeout").ok());
    TransactionRecord failed = manager_.GetFailed()[0];

    DataStream ss;
    ss << failed;
    TransactionRecord decoded;
    ss >> decoded;

    EXPECT_EQ(decoded.id, failed.id);
    EXPECT_TRUE(decoded.status.IsFailed());
    EXPECT_EQ(decoded.status.reason, "timeout");
    EXPECT_EQ(decoded.fromAddress, failed.fromAddress);
    EXPECT_EQ(decoded.createdAt, failed.createdAt);
    EXPECT_FALSE(decoded.isOutgoing);
}

TEST(TransactionStatusTest, Rendering) {
    EXPECT_EQ(TransactionStatus::Pending().ToString(), "pending");
    EXPECT_EQ(TransactionStatus::Confirmed(7).ToString(), "confirmed@7");
    EXPECT_EQ(TransactionStatus::Failed("boom").ToString(), "failed (boom)");
}

} // namespace
} // namespace wallet
} // namespace nockledger
