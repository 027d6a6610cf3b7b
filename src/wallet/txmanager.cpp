// NOCKLEDGER - Transaction Manager Implementation
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include "nockledger/wallet/txmanager.h"
#include "nockledger/util/logging.h"

#include <algorithm>
#include <sstream>

namespace nockledger {
namespace wallet {

namespace {

std::vector<TransactionRecord>::iterator FindRecord(std::vector<TransactionRecord>& records,
                                                    const std::string& txId) {
    return std::find_if(records.begin(), records.end(),
                        [&](const TransactionRecord& r) { return r.id == txId; });
}

const TransactionRecord* FindRecord(const std::vector<TransactionRecord>& records,
                                    const std::string& txId) {
    for (const auto& r : records) {
        if (r.id == txId) {
            return &r;
        }
    }
    return nullptr;
}

Status NotFound(const std::string& txId) {
    return Status::Transaction("Transaction " + txId + " not found");
}

} // namespace

// ============================================================================
// Transaction Status
// ============================================================================

const char* TransactionStateToString(TransactionState state) {
    switch (state) {
        case TransactionState::Pending:   return "pending";
        case TransactionState::Confirmed: return "confirmed";
        case TransactionState::Failed:    return "failed";
        default:                          return "unknown";
    }
}

std::string TransactionStatus::ToString() const {
    std::ostringstream ss;
    ss << TransactionStateToString(state);
    if (blockHeight) {
        ss << "@" << *blockHeight;
    }
    if (!reason.empty()) {
        ss << " (" << reason << ")";
    }
    return ss.str();
}

// ============================================================================
// Transaction Manager
// ============================================================================

bool TransactionManager::Contains(const std::string& txId) const {
    return FindRecord(pending_, txId) || FindRecord(confirmed_, txId) ||
           FindRecord(failed_, txId);
}

Result<TransactionRecord> TransactionManager::AddPendingTransaction(const SignedTransaction& tx,
                                                                    bool isOutgoing) {
    if (Contains(tx.id)) {
        return Status::Transaction("Transaction " + tx.id + " already recorded");
    }

    TransactionRecord record;
    record.id = tx.id;
    record.status = TransactionStatus::Pending();
    record.amount = tx.TotalOutput();
    record.fee = tx.fee;
    if (!tx.inputs.empty()) {
        auto from = Address::FromBytes(tx.inputs.front().publicKey);
        if (from) {
            record.fromAddress = *from;
        }
    }
    if (!tx.outputs.empty()) {
        record.toAddress = tx.outputs.front().recipient;
    }
    record.createdAt = GetTimeMillis();
    record.isOutgoing = isOutgoing;

    pending_.push_back(record);
    signed_[tx.id] = tx;

    LOG_INFO(util::LogCategory::WALLET) << "Pending transaction " << tx.id
        << " amount " << record.amount << " fee " << record.fee;
    return record;
}

Status TransactionManager::ConfirmTransaction(const std::string& txId, BlockHeight height) {
    auto it = FindRecord(pending_, txId);
    if (it == pending_.end()) {
        return NotFound(txId);
    }

    TransactionRecord record = std::move(*it);
    pending_.erase(it);
    record.status = TransactionStatus::Confirmed(height);
    record.confirmedAt = GetTimeMillis();
    confirmed_.push_back(std::move(record));

    LOG_INFO(util::LogCategory::WALLET) << "Confirmed transaction " << txId
        << " at height " << height;
    return Status::Ok();
}

Status TransactionManager::MarkFailed(const std::string& txId, const std::string& reason) {
    auto it = FindRecord(pending_, txId);
    if (it == pending_.end()) {
        return NotFound(txId);
    }

    TransactionRecord record = std::move(*it);
    pending_.erase(it);
    record.status = TransactionStatus::Failed(reason);
    failed_.push_back(std::move(record));

    LOG_WARN(util::LogCategory::WALLET) << "Transaction " << txId << " failed: " << reason;
    return Status::Ok();
}

std::vector<TransactionRecord> TransactionManager::GetAllTransactions() const {
    std::vector<TransactionRecord> all;
    all.reserve(confirmed_.size() + pending_.size());
    all.insert(all.end(), confirmed_.begin(), confirmed_.end());
    all.insert(all.end(), pending_.begin(), pending_.end());
    std::stable_sort(all.begin(), all.end(),
                     [](const TransactionRecord& a, const TransactionRecord& b) {
                         return a.createdAt > b.createdAt;
                     });
    return all;
}

std::optional<TransactionRecord> TransactionManager::GetTransaction(const std::string& txId) const {
    for (const auto* records : {&pending_, &confirmed_, &failed_}) {
        if (const TransactionRecord* r = FindRecord(*records, txId)) {
            return *r;
        }
    }
    return std::nullopt;
}

std::optional<SignedTransaction> TransactionManager::GetSignedTransaction(
    const std::string& txId) const {
    auto it = signed_.find(txId);
    if (it == signed_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<SignedTransaction> TransactionManager::GetSignedTransactions() const {
    std::vector<SignedTransaction> result;
    result.reserve(signed_.size());
    for (const auto& entry : signed_) {
        result.push_back(entry.second);
    }
    return result;
}

Status TransactionManager::Restore(const std::vector<TransactionRecord>& records,
                                   const std::vector<SignedTransaction>& signedTxs) {
    TransactionManager restored;
    for (const auto& record : records) {
        if (restored.Contains(record.id)) {
            return Status::Serialization("Duplicate transaction record: " + record.id);
        }
        switch (record.status.state) {
            case TransactionState::Pending:   restored.pending_.push_back(record); break;
            case TransactionState::Confirmed: restored.confirmed_.push_back(record); break;
            case TransactionState::Failed:    restored.failed_.push_back(record); break;
        }
    }
    for (const auto& tx : signedTxs) {
        restored.signed_[tx.id] = tx;
    }

    *this = std::move(restored);
    return Status::Ok();
}

void TransactionManager::Clear() {
    pending_.clear();
    confirmed_.clear();
    failed_.clear();
    signed_.clear();
}

} // namespace wallet
} // namespace nockledger
