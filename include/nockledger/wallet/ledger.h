// NOCKLEDGER - Note Ledger
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License
//
// Unspent-output bookkeeping. Every Note is one output owned by an address;
// the ledger keeps a per-address Balance in step with its Notes.

#ifndef NOCKLEDGER_WALLET_LEDGER_H
#define NOCKLEDGER_WALLET_LEDGER_H

#include "nockledger/core/serialize.h"
#include "nockledger/core/status.h"
#include "nockledger/core/transaction.h"
#include "nockledger/core/types.h"
#include "nockledger/crypto/keys.h"

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace nockledger {
namespace wallet {

// ============================================================================
// Balance
// ============================================================================

struct Balance {
    Amount confirmed{0};
    Amount unconfirmed{0};
    /// Portion of `confirmed` reserved by pending spends
    Amount locked{0};

    /// confirmed + unconfirmed (saturating)
    Amount Total() const;

    /// confirmed - locked, never below zero
    Amount Available() const { return SaturatingSub(confirmed, locked); }

    bool IsZero() const { return confirmed == 0 && unconfirmed == 0 && locked == 0; }

    bool operator==(const Balance& other) const {
        return confirmed == other.confirmed && unconfirmed == other.unconfirmed &&
               locked == other.locked;
    }
    bool operator!=(const Balance& other) const { return !(*this == other); }

    std::string ToString() const;
};

// ============================================================================
// Note
// ============================================================================

/**
 * One transaction output as seen by the wallet.
 *
 * A note is confirmed when blockHeight is set. Notes are never removed;
 * `spent` only ever goes from false to true.
 */
struct Note {
    std::string id;
    Address address;
    Amount amount{0};
    std::optional<BlockHeight> blockHeight;
    std::string sourceTxId;
    uint32_t outputIndex{0};
    bool spent{false};
    bool locked{false};
    TimestampMillis createdAt{0};

    /// New unspent note with a random id and createdAt = now
    static Note Create(const Address& address, Amount amount,
                       const std::string& sourceTxId, uint32_t outputIndex,
                       std::optional<BlockHeight> blockHeight = std::nullopt);

    bool IsConfirmed() const { return blockHeight.has_value(); }

    OutPoint GetOutPoint() const { return OutPoint(sourceTxId, outputIndex); }

    std::string ToString() const;
};

template<typename Stream>
void Serialize(Stream& s, const Note& note) {
    Serialize(s, note.id);
    Serialize(s, note.address);
    Serialize(s, note.amount);
    Serialize(s, note.blockHeight);
    Serialize(s, note.sourceTxId);
    Serialize(s, note.outputIndex);
    Serialize(s, note.spent);
    Serialize(s, note.locked);
    Serialize(s, note.createdAt);
}

template<typename Stream>
void Unserialize(Stream& s, Note& note) {
    Unserialize(s, note.id);
    Unserialize(s, note.address);
    Unserialize(s, note.amount);
    Unserialize(s, note.blockHeight);
    Unserialize(s, note.sourceTxId);
    Unserialize(s, note.outputIndex);
    Unserialize(s, note.spent);
    Unserialize(s, note.locked);
    Unserialize(s, note.createdAt);
}

// ============================================================================
// Ledger
// ============================================================================

/**
 * Note store with per-address balances.
 *
 * For every address, at all times:
 *   confirmed   = sum of unspent notes with a block height
 *   unconfirmed = sum of unspent notes without one
 *   locked      = sum of unspent, locked notes with a block height
 *
 * Every failing operation leaves the ledger unchanged. Not internally
 * synchronized; the owning Wallet serializes access.
 */
class Ledger {
public:
    Ledger() = default;

    /// Insert a note. Fails with a Transaction error on a duplicate id or
    /// if a balance would overflow.
    Status AddNote(const Note& note);

    /// Mark a note spent. NoteNotFound if unknown, Transaction("Note already
    /// spent") if it was spent before.
    Status SpendNote(const std::string& id);

    /// Give an unconfirmed note its block height
    Status ConfirmNote(const std::string& id, BlockHeight height);

    /// Reserve a note for a pending spend (idempotent)
    Status LockNote(const std::string& id);

    /// Release a reservation (idempotent)
    Status UnlockNote(const std::string& id);

    /// Balance of an address; all zero if the address was never seen
    Balance GetBalance(const Address& address) const;

    /// Component-wise sum over all addresses
    Balance GetTotalBalance() const;

    /**
     * Select notes to cover `amount`.
     *
     * Candidates are the address's unspent, unlocked, confirmed notes,
     * ordered largest first (ties: older createdAt, then id). Returns the
     * shortest prefix whose sum reaches `amount`, or every candidate if
     * they cannot cover it. An amount of zero selects nothing.
     */
    std::vector<Note> GetSpendableNotes(const Address& address, Amount amount) const;

    std::optional<Note> GetNote(const std::string& id) const;

    /// Notes of an address in insertion order, spent ones included
    std::vector<Note> GetNotes(const Address& address) const;

    /// Every note in insertion order
    std::vector<Note> GetAllNotes() const;

    /// Note created by the given output, if tracked
    std::optional<Note> FindByOutPoint(const OutPoint& outpoint) const;

    size_t Size() const { return notes_.size(); }

    void Clear();

private:
    std::map<std::string, Note> notes_;
    std::vector<std::string> order_;
    std::unordered_map<Address, std::vector<std::string>> byAddress_;
    std::unordered_map<Address, Balance> balances_;
};

} // namespace wallet
} // namespace nockledger

#endif // NOCKLEDGER_WALLET_LEDGER_H
