// NOCKLEDGER - Wallet Implementation
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include "nockledger/wallet/wallet.h"
#include "nockledger/util/logging.h"
#include "nockledger/wallet/txbuilder.h"

#include <mutex>

namespace nockledger {
namespace wallet {

Wallet::Wallet(const consensus::ChainParams& params,
               std::shared_ptr<storage::Storage> storage,
               std::shared_ptr<network::Broadcaster> broadcaster)
    : params_(params),
      storage_(std::move(storage)),
      broadcaster_(std::move(broadcaster)) {}

// ============================================================================
// Keys
// ============================================================================

Result<Address> Wallet::GenerateKey(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return keys_.GenerateKey(name);
}

Result<Address> Wallet::ImportKey(const std::string& name, const std::vector<Byte>& secret) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return keys_.ImportKey(name, secret);
}

Result<Address> Wallet::ImportMnemonic(const std::string& name,
                                       const std::string& phrase,
                                       const std::string& passphrase) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return keys_.ImportMnemonic(name, phrase, passphrase);
}

std::vector<std::string> Wallet::ListKeys() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return keys_.ListKeys();
}

Result<Address> Wallet::GetAddress(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto key = keys_.GetKey(name);
    if (!key) {
        return key.status();
    }
    return (*key)->GetAddress();
}

bool Wallet::IsMine(const Address& address) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return keys_.IsMine(address);
}

// ============================================================================
// Notes and Balances
// ============================================================================

Status Wallet::ReceiveNote(const Note& note) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        Status s = ledger_.AddNote(note);
        if (!s.ok()) {
            return s;
        }
    }
    LOG_INFO(util::LogCategory::WALLET) << "Received note " << note.id
        << " of " << note.amount << " for " << note.address.ToString();
    Persist();
    return Status::Ok();
}

Balance Wallet::GetBalance(const Address& address) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return ledger_.GetBalance(address);
}

Result<Balance> Wallet::GetBalance(const std::string& keyName) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto key = keys_.GetKey(keyName);
    if (!key) {
        return key.status();
    }
    return ledger_.GetBalance((*key)->GetAddress());
}

Balance Wallet::GetTotalBalance() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return ledger_.GetTotalBalance();
}

std::vector<Note> Wallet::GetNotes(const Address& address) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return ledger_.GetNotes(address);
}

std::vector<Note> Wallet::GetSpendableNotes(const Address& address, Amount amount) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return ledger_.GetSpendableNotes(address, amount);
}

// ============================================================================
// Transactions
// ============================================================================

Result<SignedTransaction> Wallet::Send(const std::string& keyName,
                                       const Address& recipient,
                                       Amount amount,
                                       Amount fee) {
    if (amount == 0) {
        return Status::Transaction("Send amount must be positive");
    }
    Amount required = 0;
    if (!CheckedAdd(amount, fee, required)) {
        return Status::Transaction("Amount plus fee overflows");
    }

    SignedTransaction tx;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto key = keys_.GetKey(keyName);
        if (!key) {
            return key.status();
        }
        const Address sender = (*key)->GetAddress();
        const std::vector<Byte> publicKey = (*key)->GetPublicKey();

        std::vector<Note> selected = ledger_.GetSpendableNotes(sender, required);
        Amount available = 0;
        for (const auto& note : selected) {
            if (!CheckedAdd(available, note.amount, available)) {
                return Status::Transaction("Selected notes overflow");
            }
        }
        if (available < required) {
            return Status::InsufficientFunds(required, available);
        }

        TransactionBuilder builder;
        for (const auto& note : selected) {
            builder.AddInputFromNote(note, publicKey);
        }
        builder.AddOutput(TransactionOutput(amount, recipient));
        if (available > required) {
            builder.AddOutput(TransactionOutput(available - required, sender));
        }
        builder.SetFee(fee);

        auto built = builder.BuildAndSign(keys_, keyName);
        if (!built) {
            return built.status();
        }
        tx = built.Take();

        // Stage note changes so a rejected record leaves the ledger untouched
        Ledger staged = ledger_;
        for (const auto& note : selected) {
            Status s = staged.LockNote(note.id);
            if (!s.ok()) {
                return s;
            }
        }
        for (uint32_t i = 0; i < tx.outputs.size(); ++i) {
            const auto& output = tx.outputs[i];
            if (!keys_.IsMine(output.recipient)) {
                continue;
            }
            Status s = staged.AddNote(Note::Create(output.recipient, output.amount, tx.id, i));
            if (!s.ok()) {
                return s;
            }
        }

        auto record = transactions_.AddPendingTransaction(tx, true);
        if (!record) {
            return record.status();
        }
        ledger_ = std::move(staged);
    }

    LOG_INFO(util::LogCategory::WALLET) << "Sending " << amount << " to "
        << recipient.ToString() << " in " << tx.id;

    if (broadcaster_) {
        Status sent = broadcaster_->Broadcast(tx.ToBytes());
        if (!sent.ok()) {
            LOG_WARN(util::LogCategory::NET) << "Broadcast of " << tx.id
                << " failed: " << sent.message();
            Status failed = MarkTransactionFailed(tx.id, sent.message());
            if (!failed.ok()) {
                LOG_ERROR(util::LogCategory::WALLET) << failed.ToString();
            }
            return sent;
        }
    }

    Persist();
    return tx;
}

Status Wallet::ConfirmLocked(const std::string& txId, BlockHeight height) {
    auto tx = transactions_.GetSignedTransaction(txId);
    Ledger staged = ledger_;

    if (tx) {
        for (const auto& input : tx->inputs) {
            auto note = staged.FindByOutPoint(input.previousOutput);
            if (!note || note->spent) {
                continue;
            }
            Status s = staged.SpendNote(note->id);
            if (!s.ok()) {
                return s;
            }
        }

        for (uint32_t i = 0; i < tx->outputs.size(); ++i) {
            const auto& output = tx->outputs[i];
            auto existing = staged.FindByOutPoint(OutPoint(txId, i));
            if (existing) {
                if (!existing->IsConfirmed()) {
                    Status s = staged.ConfirmNote(existing->id, height);
                    if (!s.ok()) {
                        return s;
                    }
                }
                continue;
            }
            if (!keys_.IsMine(output.recipient)) {
                continue;
            }
            Status s = staged.AddNote(Note::Create(output.recipient, output.amount,
                                                   txId, i, height));
            if (!s.ok()) {
                return s;
            }
        }
    }

    Status s = transactions_.ConfirmTransaction(txId, height);
    if (!s.ok()) {
        return s;
    }
    ledger_ = std::move(staged);

    LOG_INFO(util::LogCategory::WALLET) << "Transaction " << txId
        << " confirmed at height " << height;
    return Status::Ok();
}

Status Wallet::OnTransactionConfirmed(const std::string& txId, BlockHeight height) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        Status s = ConfirmLocked(txId, height);
        if (!s.ok()) {
            return s;
        }
    }
    Persist();
    return Status::Ok();
}

Status Wallet::MarkTransactionFailed(const std::string& txId, const std::string& reason) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto tx = transactions_.GetSignedTransaction(txId);
        Ledger staged = ledger_;
        if (tx) {
            for (const auto& input : tx->inputs) {
                auto note = staged.FindByOutPoint(input.previousOutput);
                if (!note || note->spent) {
                    continue;
                }
                Status s = staged.UnlockNote(note->id);
                if (!s.ok()) {
                    return s;
                }
            }
            // Outputs that will never confirm are retired, not deleted
            for (uint32_t i = 0; i < tx->outputs.size(); ++i) {
                auto note = staged.FindByOutPoint(OutPoint(txId, i));
                if (!note || note->spent || note->IsConfirmed()) {
                    continue;
                }
                Status s = staged.SpendNote(note->id);
                if (!s.ok()) {
                    return s;
                }
            }
        }

        Status s = transactions_.MarkFailed(txId, reason);
        if (!s.ok()) {
            return s;
        }
        ledger_ = std::move(staged);
    }
    Persist();
    return Status::Ok();
}

std::vector<TransactionRecord> Wallet::GetAllTransactions() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return transactions_.GetAllTransactions();
}

std::optional<TransactionRecord> Wallet::GetTransaction(const std::string& txId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return transactions_.GetTransaction(txId);
}

std::vector<TransactionRecord> Wallet::GetPendingTransactions() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return transactions_.GetPending();
}

// ============================================================================
// Blocks
// ============================================================================

Block Wallet::CreateBlockTemplate(const Hash256& previousHash, BlockHeight height) const {
    std::vector<SignedTransaction> txs;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& record : transactions_.GetPending()) {
            auto tx = transactions_.GetSignedTransaction(record.id);
            if (tx) {
                txs.push_back(std::move(*tx));
            }
        }
    }
    return Block::Create(previousHash, std::move(txs), params_.initialBits, height);
}

Status Wallet::OnBlockConnected(const Block& block) {
    Status valid = block.Validate(params_);
    if (!valid.ok()) {
        LOG_WARN(util::LogCategory::CONSENSUS) << "Rejected block at height "
            << block.header.height << ": " << valid.message();
        return valid;
    }

    size_t confirmed = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (const auto& tx : block.transactions) {
            auto record = transactions_.GetTransaction(tx.id);
            if (!record || !record->status.IsPending()) {
                continue;
            }
            Status s = ConfirmLocked(tx.id, block.header.height);
            if (!s.ok()) {
                return s;
            }
            ++confirmed;
        }
    }

    LOG_INFO(util::LogCategory::CONSENSUS) << "Connected block "
        << block.GetHash().ToHex().substr(0, 16) << "... at height "
        << block.header.height << " (" << confirmed << " wallet transaction(s))";
    if (confirmed > 0) {
        Persist();
    }
    return Status::Ok();
}

// ============================================================================
// Persistence
// ============================================================================

Status Wallet::SaveState() const {
    if (!storage_) {
        return Status::Storage("No storage configured");
    }

    // Held across snapshot and writes so saves land in snapshot order
    std::lock_guard<std::mutex> persistLock(persistMutex_);

    std::vector<Note> notes;
    std::vector<TransactionRecord> history;
    std::vector<SignedTransaction> signedTxs;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        notes = ledger_.GetAllNotes();
        const auto& pending = transactions_.GetPending();
        const auto& confirmed = transactions_.GetConfirmed();
        const auto& failed = transactions_.GetFailed();
        history.insert(history.end(), confirmed.begin(), confirmed.end());
        history.insert(history.end(), pending.begin(), pending.end());
        history.insert(history.end(), failed.begin(), failed.end());
        signedTxs = transactions_.GetSignedTransactions();
    }

    util::ScopedLogTimer timer(util::LogCategory::STORAGE, "SaveState");
    Status s = storage::SaveRecord(*storage_, records::NOTES, notes);
    if (!s.ok()) return s;
    s = storage::SaveRecord(*storage_, records::TRANSACTIONS, history);
    if (!s.ok()) return s;
    return storage::SaveRecord(*storage_, records::SIGNED_TRANSACTIONS, signedTxs);
}

Status Wallet::LoadState() {
    if (!storage_) {
        return Status::Storage("No storage configured");
    }

    std::vector<Note> notes;
    std::vector<TransactionRecord> history;
    std::vector<SignedTransaction> signedTxs;

    if (storage_->Exists(records::NOTES)) {
        auto loaded = storage::LoadRecord<std::vector<Note>>(*storage_, records::NOTES);
        if (!loaded) return loaded.status();
        notes = loaded.Take();
    }
    if (storage_->Exists(records::TRANSACTIONS)) {
        auto loaded = storage::LoadRecord<std::vector<TransactionRecord>>(
            *storage_, records::TRANSACTIONS);
        if (!loaded) return loaded.status();
        history = loaded.Take();
    }
    if (storage_->Exists(records::SIGNED_TRANSACTIONS)) {
        auto loaded = storage::LoadRecord<std::vector<SignedTransaction>>(
            *storage_, records::SIGNED_TRANSACTIONS);
        if (!loaded) return loaded.status();
        signedTxs = loaded.Take();
    }

    Ledger ledger;
    for (const auto& note : notes) {
        Status s = ledger.AddNote(note);
        if (!s.ok()) {
            return Status::Serialization("Corrupt note record: " + s.message());
        }
    }
    TransactionManager transactions;
    Status s = transactions.Restore(history, signedTxs);
    if (!s.ok()) {
        return s;
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        ledger_ = std::move(ledger);
        transactions_ = std::move(transactions);
    }

    LOG_INFO(util::LogCategory::STORAGE) << "Loaded " << notes.size() << " note(s), "
        << history.size() << " transaction record(s)";
    return Status::Ok();
}

void Wallet::Persist() const {
    if (!storage_) {
        return;
    }
    Status s = SaveState();
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::STORAGE) << "Failed to persist wallet: " << s.message();
    }
}

} // namespace wallet
} // namespace nockledger
