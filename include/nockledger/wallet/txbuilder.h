// NOCKLEDGER - Transaction Builder
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#ifndef NOCKLEDGER_WALLET_TXBUILDER_H
#define NOCKLEDGER_WALLET_TXBUILDER_H

#include "nockledger/core/status.h"
#include "nockledger/core/transaction.h"
#include "nockledger/core/types.h"
#include "nockledger/wallet/keymanager.h"
#include "nockledger/wallet/ledger.h"

#include <string>
#include <vector>

namespace nockledger {
namespace wallet {

/**
 * Collects inputs, outputs and a fee, then hashes and signs them.
 *
 * Usage:
 *   TransactionBuilder builder;
 *   builder.AddInputFromNote(note, key->GetPublicKey());
 *   builder.AddOutput(TransactionOutput(140, recipient));
 *   builder.SetFee(10);
 *   auto tx = builder.BuildAndSign(keys, "main");
 */
class TransactionBuilder {
public:
    TransactionBuilder() = default;

    TransactionBuilder& AddInput(TransactionInput input);
    TransactionBuilder& AddOutput(TransactionOutput output);
    TransactionBuilder& SetFee(Amount fee);

    /// Spend a ledger note; the input carries the note's outpoint and amount
    TransactionBuilder& AddInputFromNote(const Note& note, const std::vector<Byte>& publicKey);

    /// Sum of input amounts. Fails with a Transaction error on overflow.
    Result<Amount> TotalInput() const;

    /// Sum of output amounts. Fails with a Transaction error on overflow.
    Result<Amount> TotalOutput() const;

    const std::vector<TransactionInput>& GetInputs() const { return inputs_; }
    const std::vector<TransactionOutput>& GetOutputs() const { return outputs_; }
    Amount GetFee() const { return fee_; }

    /**
     * Check the transaction is spendable.
     *
     * Fails with Transaction("No inputs provided"), Transaction("No outputs
     * provided"), or InsufficientFunds{required = outputs + fee,
     * available = inputs} when inputs < outputs + fee.
     */
    Status Validate() const;

    /**
     * Validate, hash and sign with the named key.
     *
     * The signature covers the 32 raw hash bytes; the id is the lowercase
     * hex of the hash.
     */
    Result<SignedTransaction> BuildAndSign(const KeyManager& keys,
                                           const std::string& keyName) const;

    void Clear();

private:
    std::vector<TransactionInput> inputs_;
    std::vector<TransactionOutput> outputs_;
    Amount fee_{0};
};

} // namespace wallet
} // namespace nockledger

#endif // NOCKLEDGER_WALLET_TXBUILDER_H
