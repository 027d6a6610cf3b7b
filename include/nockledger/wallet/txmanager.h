// NOCKLEDGER - Transaction Manager
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License
//
// Lifecycle of the wallet's transactions: pending until a block confirms
// them, or failed when the network rejects them.

#ifndef NOCKLEDGER_WALLET_TXMANAGER_H
#define NOCKLEDGER_WALLET_TXMANAGER_H

#include "nockledger/core/serialize.h"
#include "nockledger/core/status.h"
#include "nockledger/core/transaction.h"
#include "nockledger/core/types.h"
#include "nockledger/crypto/keys.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nockledger {
namespace wallet {

// ============================================================================
// Transaction Status
// ============================================================================

enum class TransactionState : uint8_t {
    Pending = 0,
    Confirmed = 1,
    Failed = 2,
};

const char* TransactionStateToString(TransactionState state);

struct TransactionStatus {
    TransactionState state{TransactionState::Pending};
    /// Set when Confirmed
    std::optional<BlockHeight> blockHeight;
    /// Set when Failed
    std::string reason;

    static TransactionStatus Pending() { return {}; }
    static TransactionStatus Confirmed(BlockHeight height) {
        return {TransactionState::Confirmed, height, ""};
    }
    static TransactionStatus Failed(const std::string& why) {
        return {TransactionState::Failed, std::nullopt, why};
    }

    bool IsPending() const { return state == TransactionState::Pending; }
    bool IsConfirmed() const { return state == TransactionState::Confirmed; }
    bool IsFailed() const { return state == TransactionState::Failed; }

    std::string ToString() const;
};

template<typename Stream>
void Serialize(Stream& s, const TransactionStatus& status) {
    ser_writedata8(s, static_cast<uint8_t>(status.state));
    Serialize(s, status.blockHeight);
    Serialize(s, status.reason);
}

template<typename Stream>
void Unserialize(Stream& s, TransactionStatus& status) {
    uint8_t state = ser_readdata8(s);
    if (state > static_cast<uint8_t>(TransactionState::Failed)) {
        throw std::ios_base::failure("Unserialize(TransactionStatus): bad state");
    }
    status.state = static_cast<TransactionState>(state);
    Unserialize(s, status.blockHeight);
    Unserialize(s, status.reason);
}

// ============================================================================
// Transaction Record
// ============================================================================

/// User-facing history entry for one transaction
struct TransactionRecord {
    std::string id;
    TransactionStatus status;
    /// Sum of the output amounts
    Amount amount{0};
    Amount fee{0};
    std::optional<Address> fromAddress;
    std::optional<Address> toAddress;
    TimestampMillis createdAt{0};
    std::optional<TimestampMillis> confirmedAt;
    bool isOutgoing{false};
};

template<typename Stream>
void Serialize(Stream& s, const TransactionRecord& rec) {
    Serialize(s, rec.id);
    Serialize(s, rec.status);
    Serialize(s, rec.amount);
    Serialize(s, rec.fee);
    Serialize(s, rec.fromAddress);
    Serialize(s, rec.toAddress);
    Serialize(s, rec.createdAt);
    Serialize(s, rec.confirmedAt);
    Serialize(s, rec.isOutgoing);
}

template<typename Stream>
void Unserialize(Stream& s, TransactionRecord& rec) {
    Unserialize(s, rec.id);
    Unserialize(s, rec.status);
    Unserialize(s, rec.amount);
    Unserialize(s, rec.fee);
    Unserialize(s, rec.fromAddress);
    Unserialize(s, rec.toAddress);
    Unserialize(s, rec.createdAt);
    Unserialize(s, rec.confirmedAt);
    Unserialize(s, rec.isOutgoing);
}

// ============================================================================
// Transaction Manager
// ============================================================================

/**
 * Pending, confirmed and failed transaction records.
 *
 * Each id lives in exactly one collection. Failing operations leave every
 * collection unchanged. Not internally synchronized; the owning Wallet
 * serializes access.
 */
class TransactionManager {
public:
    TransactionManager() = default;

    /**
     * Record a signed transaction as pending.
     *
     * amount = sum of outputs, toAddress = first output's recipient,
     * fromAddress = address of the first input's public key,
     * createdAt = now. Fails with a Transaction error if the id is known.
     */
    Result<TransactionRecord> AddPendingTransaction(const SignedTransaction& tx,
                                                    bool isOutgoing);

    /// Move a pending record to confirmed at `height`.
    /// Fails with Transaction("Transaction <id> not found") otherwise.
    Status ConfirmTransaction(const std::string& txId, BlockHeight height);

    /// Move a pending record to failed
    Status MarkFailed(const std::string& txId, const std::string& reason);

    /// Confirmed and pending records, newest first
    std::vector<TransactionRecord> GetAllTransactions() const;

    std::optional<TransactionRecord> GetTransaction(const std::string& txId) const;

    /// The signed transaction behind a record
    std::optional<SignedTransaction> GetSignedTransaction(const std::string& txId) const;

    const std::vector<TransactionRecord>& GetPending() const { return pending_; }
    const std::vector<TransactionRecord>& GetConfirmed() const { return confirmed_; }
    const std::vector<TransactionRecord>& GetFailed() const { return failed_; }

    /// Every signed transaction the manager has seen
    std::vector<SignedTransaction> GetSignedTransactions() const;

    /// Replace all state with previously saved records
    Status Restore(const std::vector<TransactionRecord>& records,
                   const std::vector<SignedTransaction>& signedTxs);

    size_t Size() const { return pending_.size() + confirmed_.size() + failed_.size(); }

    void Clear();

private:
    bool Contains(const std::string& txId) const;

    std::vector<TransactionRecord> pending_;
    std::vector<TransactionRecord> confirmed_;
    std::vector<TransactionRecord> failed_;
    std::map<std::string, SignedTransaction> signed_;
};

} // namespace wallet
} // namespace nockledger

#endif // NOCKLEDGER_WALLET_TXMANAGER_H
