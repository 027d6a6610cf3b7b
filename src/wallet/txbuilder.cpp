// NOCKLEDGER - Transaction Builder Implementation
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include "nockledger/wallet/txbuilder.h"
#include "nockledger/util/logging.h"

namespace nockledger {
namespace wallet {

TransactionBuilder& TransactionBuilder::AddInput(TransactionInput input) {
    inputs_.push_back(std::move(input));
    return *this;
}

TransactionBuilder& TransactionBuilder::AddOutput(TransactionOutput output) {
    outputs_.push_back(std::move(output));
    return *this;
}

TransactionBuilder& TransactionBuilder::SetFee(Amount fee) {
    fee_ = fee;
    return *this;
}

TransactionBuilder& TransactionBuilder::AddInputFromNote(const Note& note,
                                                         const std::vector<Byte>& publicKey) {
    TransactionInput input;
    input.previousOutput = note.GetOutPoint();
    input.publicKey = publicKey;
    input.amount = note.amount;
    return AddInput(std::move(input));
}

Result<Amount> TransactionBuilder::TotalInput() const {
    Amount total = 0;
    for (const auto& in : inputs_) {
        if (!CheckedAdd(total, in.amount, total)) {
            return Status::Transaction("Input total overflows");
        }
    }
    return total;
}

Result<Amount> TransactionBuilder::TotalOutput() const {
    Amount total = 0;
    for (const auto& out : outputs_) {
        if (!CheckedAdd(total, out.amount, total)) {
            return Status::Transaction("Output total overflows");
        }
    }
    return total;
}

Status TransactionBuilder::Validate() const {
    if (inputs_.empty()) {
        return Status::Transaction("No inputs provided");
    }
    if (outputs_.empty()) {
        return Status::Transaction("No outputs provided");
    }

    auto totalIn = TotalInput();
    if (!totalIn) {
        return totalIn.status();
    }
    auto totalOut = TotalOutput();
    if (!totalOut) {
        return totalOut.status();
    }

    Amount required;
    if (!CheckedAdd(*totalOut, fee_, required)) {
        return Status::Transaction("Output total plus fee overflows");
    }
    if (*totalIn < required) {
        return Status::InsufficientFunds(required, *totalIn);
    }
    return Status::Ok();
}

Result<SignedTransaction> TransactionBuilder::BuildAndSign(const KeyManager& keys,
                                                           const std::string& keyName) const {
    Status valid = Validate();
    if (!valid.ok()) {
        return valid;
    }

    Hash256 hash = CreateTransactionHash(inputs_, outputs_, fee_);
    std::vector<Byte> hashBytes = hash.ToVector();

    auto signature = keys.SignWithKey(keyName, hashBytes);
    if (!signature) {
        return signature.status();
    }

    SignedTransaction tx;
    tx.id = hash.ToHex();
    tx.inputs = inputs_;
    tx.outputs = outputs_;
    tx.fee = fee_;
    tx.signature = signature.Take();
    tx.hash = std::move(hashBytes);

    LOG_INFO(util::LogCategory::WALLET) << "Built transaction " << tx.id
        << " (" << inputs_.size() << " in, " << outputs_.size()
        << " out, fee " << fee_ << ")";
    return tx;
}

void TransactionBuilder::Clear() {
    inputs_.clear();
    outputs_.clear();
    fee_ = 0;
}

} // namespace wallet
} // namespace nockledger
