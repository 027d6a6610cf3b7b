// NOCKLEDGER - Transaction Header
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License
//
// Transaction primitives: outpoints, inputs, outputs and the signed
// transaction, plus the canonical transaction hash.

#ifndef NOCKLEDGER_CORE_TRANSACTION_H
#define NOCKLEDGER_CORE_TRANSACTION_H

#include "nockledger/core/serialize.h"
#include "nockledger/core/status.h"
#include "nockledger/core/types.h"
#include "nockledger/crypto/keys.h"

#include <cstdint>
#include <string>
#include <vector>

namespace nockledger {

// ============================================================================
// OutPoint - Reference to a previous transaction output
// ============================================================================

struct OutPoint {
    /// Hex id of the transaction that created the output
    std::string txId;
    uint32_t outputIndex{0};

    OutPoint() = default;
    OutPoint(std::string txIdIn, uint32_t indexIn)
        : txId(std::move(txIdIn)), outputIndex(indexIn) {}

    friend bool operator==(const OutPoint& a, const OutPoint& b) {
        return a.txId == b.txId && a.outputIndex == b.outputIndex;
    }
    friend bool operator!=(const OutPoint& a, const OutPoint& b) {
        return !(a == b);
    }
    friend bool operator<(const OutPoint& a, const OutPoint& b) {
        if (a.txId != b.txId) return a.txId < b.txId;
        return a.outputIndex < b.outputIndex;
    }

    std::string ToString() const;
};

template<typename Stream>
void Serialize(Stream& s, const OutPoint& outpoint) {
    Serialize(s, outpoint.txId);
    Serialize(s, outpoint.outputIndex);
}

template<typename Stream>
void Unserialize(Stream& s, OutPoint& outpoint) {
    Unserialize(s, outpoint.txId);
    Unserialize(s, outpoint.outputIndex);
}

// ============================================================================
// TransactionInput
// ============================================================================

/// Spends one previous output. `amount` is the value taken from it and
/// takes part in hashing and fee arithmetic.
struct TransactionInput {
    OutPoint previousOutput;
    std::vector<Byte> signature;
    std::vector<Byte> publicKey;
    Amount amount{0};

    friend bool operator==(const TransactionInput& a, const TransactionInput& b) {
        return a.previousOutput == b.previousOutput && a.signature == b.signature &&
               a.publicKey == b.publicKey && a.amount == b.amount;
    }
};

template<typename Stream>
void Serialize(Stream& s, const TransactionInput& in) {
    Serialize(s, in.previousOutput);
    Serialize(s, in.signature);
    Serialize(s, in.publicKey);
    Serialize(s, in.amount);
}

template<typename Stream>
void Unserialize(Stream& s, TransactionInput& in) {
    Unserialize(s, in.previousOutput);
    Unserialize(s, in.signature);
    Unserialize(s, in.publicKey);
    Unserialize(s, in.amount);
}

// ============================================================================
// TransactionOutput
// ============================================================================

struct TransactionOutput {
    Amount amount{0};
    Address recipient;
    std::vector<Byte> script;

    TransactionOutput() = default;
    TransactionOutput(Amount amountIn, const Address& recipientIn,
                      std::vector<Byte> scriptIn = {})
        : amount(amountIn), recipient(recipientIn), script(std::move(scriptIn)) {}

    friend bool operator==(const TransactionOutput& a, const TransactionOutput& b) {
        return a.amount == b.amount && a.recipient == b.recipient && a.script == b.script;
    }
};

template<typename Stream>
void Serialize(Stream& s, const TransactionOutput& out) {
    Serialize(s, out.amount);
    Serialize(s, out.recipient);
    Serialize(s, out.script);
}

template<typename Stream>
void Unserialize(Stream& s, TransactionOutput& out) {
    Unserialize(s, out.amount);
    Unserialize(s, out.recipient);
    Unserialize(s, out.script);
}

// ============================================================================
// Transaction Hash
// ============================================================================

/**
 * Canonical transaction hash: one running SHA-256 over
 *
 *   for each input:  txId bytes | outputIndex u32le | signature | publicKey | amount u64le
 *   for each output: amount u64le | recipient Base58 text | script
 *   fee u64le
 *
 * Variable-length fields are written without length prefixes.
 */
Hash256 CreateTransactionHash(const std::vector<TransactionInput>& inputs,
                              const std::vector<TransactionOutput>& outputs,
                              Amount fee);

// ============================================================================
// SignedTransaction
// ============================================================================

/**
 * A built and signed transaction.
 *
 * `hash` is CreateTransactionHash() of the inputs, outputs and fee; `id` is
 * its lowercase hex; `signature` is the owner's Ed25519 signature over the
 * 32 hash bytes.
 */
struct SignedTransaction {
    std::string id;
    std::vector<TransactionInput> inputs;
    std::vector<TransactionOutput> outputs;
    Amount fee{0};
    std::vector<Byte> signature;
    std::vector<Byte> hash;

    /// Sum of input amounts (saturates at the Amount maximum)
    Amount TotalInput() const;

    /// Sum of output amounts (saturates at the Amount maximum)
    Amount TotalOutput() const;

    /// Hash as a 32-byte value (zero-padded or truncated)
    Hash256 GetHash() const { return Hash256(hash.data(), hash.size()); }

    /**
     * Check that the hash and id match the contents and that the signature
     * verifies against the first input's public key.
     */
    Status Verify() const;

    /// Compact-size framed wire encoding used for broadcast
    std::vector<Byte> ToBytes() const;

    /// Decode the wire encoding (Serialization error on malformed input)
    static Result<SignedTransaction> FromBytes(const std::vector<Byte>& bytes);

    std::string ToString() const;

    friend bool operator==(const SignedTransaction& a, const SignedTransaction& b) {
        return a.id == b.id && a.inputs == b.inputs && a.outputs == b.outputs &&
               a.fee == b.fee && a.signature == b.signature && a.hash == b.hash;
    }
};

template<typename Stream>
void Serialize(Stream& s, const SignedTransaction& tx) {
    Serialize(s, tx.id);
    Serialize(s, tx.inputs);
    Serialize(s, tx.outputs);
    Serialize(s, tx.fee);
    Serialize(s, tx.signature);
    Serialize(s, tx.hash);
}

template<typename Stream>
void Unserialize(Stream& s, SignedTransaction& tx) {
    Unserialize(s, tx.id);
    Unserialize(s, tx.inputs);
    Unserialize(s, tx.outputs);
    Unserialize(s, tx.fee);
    Unserialize(s, tx.signature);
    Unserialize(s, tx.hash);
}

} // namespace nockledger

#endif // NOCKLEDGER_CORE_TRANSACTION_H
