// NOCKLEDGER - Transaction Implementation
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include "nockledger/core/transaction.h"
#include "nockledger/crypto/sha256.h"

#include <sstream>

namespace nockledger {

namespace {

Amount SaturatingSum(Amount total, Amount value) {
    Amount out;
    return CheckedAdd(total, value, out) ? out : UINT64_MAX;
}

} // namespace

std::string OutPoint::ToString() const {
    std::ostringstream ss;
    ss << "OutPoint(" << (txId.size() > 16 ? txId.substr(0, 16) : txId)
       << ", " << outputIndex << ")";
    return ss.str();
}

// ============================================================================
// Transaction Hash
// ============================================================================

Hash256 CreateTransactionHash(const std::vector<TransactionInput>& inputs,
                              const std::vector<TransactionOutput>& outputs,
                              Amount fee) {
    SHA256 hasher;

    for (const auto& in : inputs) {
        hasher.Write(in.previousOutput.txId);
        ser_writedata32(hasher, in.previousOutput.outputIndex);
        hasher.Write(in.signature);
        hasher.Write(in.publicKey);
        ser_writedata64(hasher, in.amount);
    }

    for (const auto& out : outputs) {
        ser_writedata64(hasher, out.amount);
        hasher.Write(out.recipient.ToString());
        hasher.Write(out.script);
    }

    ser_writedata64(hasher, fee);
    return hasher.Finalize();
}

// ============================================================================
// SignedTransaction
// ============================================================================

Amount SignedTransaction::TotalInput() const {
    Amount total = 0;
    for (const auto& in : inputs) {
        total = SaturatingSum(total, in.amount);
    }
    return total;
}

Amount SignedTransaction::TotalOutput() const {
    Amount total = 0;
    for (const auto& out : outputs) {
        total = SaturatingSum(total, out.amount);
    }
    return total;
}

Status SignedTransaction::Verify() const {
    if (inputs.empty()) {
        return Status::Transaction("Transaction has no inputs");
    }
    if (outputs.empty()) {
        return Status::Transaction("Transaction has no outputs");
    }

    Hash256 expected = CreateTransactionHash(inputs, outputs, fee);
    if (hash != expected.ToVector()) {
        return Status::Transaction("Transaction hash mismatch");
    }
    if (id != expected.ToHex()) {
        return Status::Transaction("Transaction id does not match hash");
    }

    auto signer = Address::FromBytes(inputs.front().publicKey);
    if (!signer) {
        return Status::Crypto("Invalid signer public key: " + signer.status().message());
    }
    if (!KeyPair::VerifySignature(*signer, hash, signature)) {
        return Status::Crypto("Invalid transaction signature");
    }
    return Status::Ok();
}

std::vector<Byte> SignedTransaction::ToBytes() const {
    DataStream ss;
    ss << *this;
    return ss.Data();
}

Result<SignedTransaction> SignedTransaction::FromBytes(const std::vector<Byte>& bytes) {
    DataStream ss(bytes);
    SignedTransaction tx;
    try {
        ss >> tx;
    } catch (const std::ios_base::failure& e) {
        return Status::Serialization(std::string("Malformed transaction: ") + e.what());
    }
    if (!ss.empty()) {
        return Status::Serialization("Malformed transaction: trailing bytes");
    }
    return tx;
}

std::string SignedTransaction::ToString() const {
    std::ostringstream ss;
    ss << "SignedTransaction(id=" << id
       << ", inputs=" << inputs.size()
       << ", outputs=" << outputs.size()
       << ", fee=" << fee << ")";
    return ss.str();
}

} // namespace nockledger
