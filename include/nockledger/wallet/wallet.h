// NOCKLEDGER - Wallet
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License
//
// The wallet context: keys, notes and transaction history behind one
// reader/writer lock, wired to optional storage and broadcast collaborators.

#ifndef NOCKLEDGER_WALLET_WALLET_H
#define NOCKLEDGER_WALLET_WALLET_H

#include "nockledger/consensus/params.h"
#include "nockledger/core/block.h"
#include "nockledger/core/status.h"
#include "nockledger/core/transaction.h"
#include "nockledger/core/types.h"
#include "nockledger/crypto/keys.h"
#include "nockledger/network/broadcaster.h"
#include "nockledger/storage/storage.h"
#include "nockledger/wallet/keymanager.h"
#include "nockledger/wallet/ledger.h"
#include "nockledger/wallet/txmanager.h"

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace nockledger {
namespace wallet {

/// Storage keys used by SaveState()/LoadState()
namespace records {
constexpr const char* NOTES = "notes";
constexpr const char* TRANSACTIONS = "transactions";
constexpr const char* SIGNED_TRANSACTIONS = "signed_transactions";
} // namespace records

/**
 * Thread-safe wallet.
 *
 * Mutations hold the exclusive lock; queries hold the shared lock and
 * return copies. Storage and the broadcaster are only called after the
 * lock is released, so they may call back into the wallet.
 *
 * Key material is held in memory only; SaveState() persists notes and
 * transaction history.
 */
class Wallet {
public:
    explicit Wallet(const consensus::ChainParams& params = consensus::ChainParams::Main(),
                    std::shared_ptr<storage::Storage> storage = nullptr,
                    std::shared_ptr<network::Broadcaster> broadcaster = nullptr);

    Wallet(const Wallet&) = delete;
    Wallet& operator=(const Wallet&) = delete;

    // ========================================================================
    // Keys
    // ========================================================================

    Result<Address> GenerateKey(const std::string& name);

    Result<Address> ImportKey(const std::string& name, const std::vector<Byte>& secret);

    Result<Address> ImportMnemonic(const std::string& name,
                                   const std::string& phrase,
                                   const std::string& passphrase = "");

    std::vector<std::string> ListKeys() const;

    /// Address of a named key
    Result<Address> GetAddress(const std::string& name) const;

    bool IsMine(const Address& address) const;

    // ========================================================================
    // Notes and Balances
    // ========================================================================

    /// Track an incoming output. Fails on a duplicate note id.
    Status ReceiveNote(const Note& note);

    Balance GetBalance(const Address& address) const;

    /// Balance of a named key's address
    Result<Balance> GetBalance(const std::string& keyName) const;

    Balance GetTotalBalance() const;

    std::vector<Note> GetNotes(const Address& address) const;

    std::vector<Note> GetSpendableNotes(const Address& address, Amount amount) const;

    // ========================================================================
    // Transactions
    // ========================================================================

    /**
     * Pay `amount` to `recipient` from the named key's notes.
     *
     * Selects notes for amount + fee, returns any excess to the sender's
     * address as a change output, signs, locks the selected notes, adds
     * unconfirmed notes for outputs paid to this wallet's addresses and
     * records the transaction as pending. The transaction is then broadcast;
     * a broadcast failure marks it failed, releases the notes and is
     * returned as the error.
     *
     * Fails with InsufficientFunds when the spendable notes cannot cover
     * amount + fee; the wallet is unchanged in that case.
     */
    Result<SignedTransaction> Send(const std::string& keyName,
                                   const Address& recipient,
                                   Amount amount,
                                   Amount fee);

    /**
     * A block at `height` included the transaction.
     *
     * Confirms the record, spends the notes its inputs consumed and confirms
     * the notes for its outputs to this wallet's addresses, adding any that
     * are missing. On error the wallet is unchanged.
     */
    Status OnTransactionConfirmed(const std::string& txId, BlockHeight height);

    /// The network rejected the transaction; its input notes become spendable
    /// and its unconfirmed output notes are retired as spent
    Status MarkTransactionFailed(const std::string& txId, const std::string& reason);

    std::vector<TransactionRecord> GetAllTransactions() const;

    std::optional<TransactionRecord> GetTransaction(const std::string& txId) const;

    std::vector<TransactionRecord> GetPendingTransactions() const;

    // ========================================================================
    // Blocks
    // ========================================================================

    /// Unmined block carrying every pending transaction at the chain's bits
    Block CreateBlockTemplate(const Hash256& previousHash, BlockHeight height) const;

    /**
     * Validate a block and confirm every pending transaction it carries.
     * Transactions unknown to the wallet are skipped.
     */
    Status OnBlockConnected(const Block& block);

    // ========================================================================
    // Persistence
    // ========================================================================

    /// Write notes and transaction history to storage
    Status SaveState() const;

    /// Replace notes and transaction history with the stored records.
    /// Missing records load as empty.
    Status LoadState();

    const consensus::ChainParams& GetChainParams() const { return params_; }

private:
    Status ConfirmLocked(const std::string& txId, BlockHeight height);

    /// SaveState() when storage is configured; failures are logged
    void Persist() const;

    consensus::ChainParams params_;
    std::shared_ptr<storage::Storage> storage_;
    std::shared_ptr<network::Broadcaster> broadcaster_;

    mutable std::mutex persistMutex_;
    mutable std::shared_mutex mutex_;
    KeyManager keys_;
    Ledger ledger_;
    TransactionManager transactions_;
};

} // namespace wallet
} // namespace nockledger

#endif // NOCKLEDGER_WALLET_WALLET_H
