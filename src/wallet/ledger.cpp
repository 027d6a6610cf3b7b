// NOCKLEDGER - Note Ledger Implementation
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include "nockledger/wallet/ledger.h"
#include "nockledger/core/random.h"
#include "nockledger/util/logging.h"

#include <algorithm>
#include <sstream>

namespace nockledger {
namespace wallet {

namespace {

Amount SaturatingAdd(Amount a, Amount b) {
    Amount out;
    return CheckedAdd(a, b, out) ? out : UINT64_MAX;
}

} // namespace

// ============================================================================
// Balance
// ============================================================================

Amount Balance::Total() const {
    return SaturatingAdd(confirmed, unconfirmed);
}

std::string Balance::ToString() const {
    std::ostringstream ss;
    ss << "Balance(confirmed=" << confirmed
       << ", unconfirmed=" << unconfirmed
       << ", locked=" << locked << ")";
    return ss.str();
}

// ============================================================================
// Note
// ============================================================================

Note Note::Create(const Address& address, Amount amount,
                  const std::string& sourceTxId, uint32_t outputIndex,
                  std::optional<BlockHeight> blockHeight) {
    Note note;
    note.id = GenerateUuid();
    note.address = address;
    note.amount = amount;
    note.blockHeight = blockHeight;
    note.sourceTxId = sourceTxId;
    note.outputIndex = outputIndex;
    note.createdAt = GetTimeMillis();
    return note;
}

std::string Note::ToString() const {
    std::ostringstream ss;
    ss << "Note(id=" << id
       << ", amount=" << amount
       << ", height=";
    if (blockHeight) {
        ss << *blockHeight;
    } else {
        ss << "none";
    }
    ss << ", spent=" << (spent ? "yes" : "no")
       << ", locked=" << (locked ? "yes" : "no") << ")";
    return ss.str();
}

// ============================================================================
// Ledger - Mutation
// ============================================================================

Status Ledger::AddNote(const Note& note) {
    if (notes_.count(note.id) > 0) {
        return Status::Transaction("Duplicate note id: " + note.id);
    }

    Balance updated = balances_[note.address];
    if (!note.spent) {
        bool ok = true;
        if (note.IsConfirmed()) {
            ok = CheckedAdd(updated.confirmed, note.amount, updated.confirmed);
            if (ok && note.locked) {
                ok = CheckedAdd(updated.locked, note.amount, updated.locked);
            }
        } else {
            ok = CheckedAdd(updated.unconfirmed, note.amount, updated.unconfirmed);
        }
        if (!ok) {
            if (byAddress_.count(note.address) == 0) {
                balances_.erase(note.address);
            }
            return Status::Transaction("Balance overflow adding note " + note.id);
        }
    }

    balances_[note.address] = updated;
    notes_.emplace(note.id, note);
    order_.push_back(note.id);
    byAddress_[note.address].push_back(note.id);

    LOG_DEBUG(util::LogCategory::LEDGER) << "Added " << note.ToString()
        << " for " << note.address.ToString();
    return Status::Ok();
}

Status Ledger::SpendNote(const std::string& id) {
    auto it = notes_.find(id);
    if (it == notes_.end()) {
        return Status::NoteNotFound(id);
    }
    Note& note = it->second;
    if (note.spent) {
        return Status::Transaction("Note already spent");
    }

    Balance& balance = balances_[note.address];
    if (note.IsConfirmed()) {
        balance.confirmed = SaturatingSub(balance.confirmed, note.amount);
        if (note.locked) {
            balance.locked = SaturatingSub(balance.locked, note.amount);
        }
    } else {
        balance.unconfirmed = SaturatingSub(balance.unconfirmed, note.amount);
    }
    note.spent = true;
    note.locked = false;

    LOG_DEBUG(util::LogCategory::LEDGER) << "Spent note " << id << " (" << note.amount << ")";
    return Status::Ok();
}

Status Ledger::ConfirmNote(const std::string& id, BlockHeight height) {
    auto it = notes_.find(id);
    if (it == notes_.end()) {
        return Status::NoteNotFound(id);
    }
    Note& note = it->second;
    if (note.IsConfirmed()) {
        return Status::Transaction("Note already confirmed: " + id);
    }

    if (!note.spent) {
        Balance updated = balances_[note.address];
        updated.unconfirmed = SaturatingSub(updated.unconfirmed, note.amount);
        if (!CheckedAdd(updated.confirmed, note.amount, updated.confirmed) ||
            (note.locked && !CheckedAdd(updated.locked, note.amount, updated.locked))) {
            return Status::Transaction("Balance overflow confirming note " + id);
        }
        balances_[note.address] = updated;
    }
    note.blockHeight = height;
    return Status::Ok();
}

Status Ledger::LockNote(const std::string& id) {
    auto it = notes_.find(id);
    if (it == notes_.end()) {
        return Status::NoteNotFound(id);
    }
    Note& note = it->second;
    if (note.spent) {
        return Status::Transaction("Cannot lock spent note: " + id);
    }
    if (note.locked) {
        return Status::Ok();
    }
    if (note.IsConfirmed()) {
        Balance& balance = balances_[note.address];
        if (!CheckedAdd(balance.locked, note.amount, balance.locked)) {
            return Status::Transaction("Balance overflow locking note " + id);
        }
    }
    note.locked = true;
    return Status::Ok();
}

Status Ledger::UnlockNote(const std::string& id) {
    auto it = notes_.find(id);
    if (it == notes_.end()) {
        return Status::NoteNotFound(id);
    }
    Note& note = it->second;
    if (!note.locked) {
        return Status::Ok();
    }
    if (note.IsConfirmed() && !note.spent) {
        Balance& balance = balances_[note.address];
        balance.locked = SaturatingSub(balance.locked, note.amount);
    }
    note.locked = false;
    return Status::Ok();
}

void Ledger::Clear() {
    notes_.clear();
    order_.clear();
    byAddress_.clear();
    balances_.clear();
}

// ============================================================================
// Ledger - Queries
// ============================================================================

Balance Ledger::GetBalance(const Address& address) const {
    auto it = balances_.find(address);
    if (it == balances_.end()) {
        return Balance{};
    }
    return it->second;
}

Balance Ledger::GetTotalBalance() const {
    Balance total;
    for (const auto& entry : balances_) {
        total.confirmed = SaturatingAdd(total.confirmed, entry.second.confirmed);
        total.unconfirmed = SaturatingAdd(total.unconfirmed, entry.second.unconfirmed);
        total.locked = SaturatingAdd(total.locked, entry.second.locked);
    }
    return total;
}

std::vector<Note> Ledger::GetSpendableNotes(const Address& address, Amount amount) const {
    std::vector<Note> selected;
    if (amount == 0) {
        return selected;
    }

    auto ids = byAddress_.find(address);
    if (ids == byAddress_.end()) {
        return selected;
    }

    std::vector<const Note*> candidates;
    for (const auto& id : ids->second) {
        const Note& note = notes_.at(id);
        if (!note.spent && !note.locked && note.IsConfirmed()) {
            candidates.push_back(&note);
        }
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const Note* a, const Note* b) {
                  if (a->amount != b->amount) return a->amount > b->amount;
                  if (a->createdAt != b->createdAt) return a->createdAt < b->createdAt;
                  return a->id < b->id;
              });

    Amount sum = 0;
    for (const Note* note : candidates) {
        selected.push_back(*note);
        sum = SaturatingAdd(sum, note->amount);
        if (sum >= amount) {
            break;
        }
    }
    return selected;
}

std::optional<Note> Ledger::GetNote(const std::string& id) const {
    auto it = notes_.find(id);
    if (it == notes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Note> Ledger::GetNotes(const Address& address) const {
    std::vector<Note> result;
    auto ids = byAddress_.find(address);
    if (ids == byAddress_.end()) {
        return result;
    }
    result.reserve(ids->second.size());
    for (const auto& id : ids->second) {
        result.push_back(notes_.at(id));
    }
    return result;
}

std::vector<Note> Ledger::GetAllNotes() const {
    std::vector<Note> result;
    result.reserve(order_.size());
    for (const auto& id : order_) {
        result.push_back(notes_.at(id));
    }
    return result;
}

std::optional<Note> Ledger::FindByOutPoint(const OutPoint& outpoint) const {
    for (const auto& entry : notes_) {
        if (entry.second.GetOutPoint() == outpoint) {
            return entry.second;
        }
    }
    return std::nullopt;
}

} // namespace wallet
} // namespace nockledger
