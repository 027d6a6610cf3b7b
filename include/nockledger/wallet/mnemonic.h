// NOCKLEDGER - BIP39 Mnemonics and Seed Derivation
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License
//
// Stateless helpers that turn entropy into BIP39 phrases and phrases into
// wallet key material:
//
//   phrase --PBKDF2-HMAC-SHA512(2048)--> 64-byte BIP39 seed
//          --HKDF-SHA512("nockchain-wallet-seed")--> 32-byte wallet seed
//   parent --HKDF-SHA512("nockchain-child-key-<i>")--> 32-byte child key
//
// Child derivation is flat: every child is derived directly from the parent.

#ifndef NOCKLEDGER_WALLET_MNEMONIC_H
#define NOCKLEDGER_WALLET_MNEMONIC_H

#include "nockledger/core/status.h"
#include "nockledger/core/types.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace nockledger {
namespace wallet {

/// BIP39 seed size in bytes
constexpr size_t BIP39_SEED_SIZE = 64;

/// Derived wallet seed / child key size in bytes
constexpr size_t WALLET_SEED_SIZE = 32;

/// PBKDF2 iteration count fixed by BIP39
constexpr uint32_t BIP39_PBKDF2_ROUNDS = 2048;

/// HKDF info label for the wallet seed
constexpr const char* WALLET_SEED_INFO = "nockchain-wallet-seed";

/// HKDF info prefix for child keys; the decimal index is appended
constexpr const char* CHILD_KEY_INFO_PREFIX = "nockchain-child-key-";

class Mnemonic {
public:
    static constexpr size_t WORD_COUNT = 2048;

    /// Entropy size in bits; word count = bits * 3 / 32
    enum class Strength {
        Words12 = 128,
        Words15 = 160,
        Words18 = 192,
        Words21 = 224,
        Words24 = 256
    };

    /// New phrase from OS randomness. The wallet uses 12 words.
    static Result<std::string> Generate(Strength strength = Strength::Words12);

    /// Encode 16/20/24/28/32 bytes of entropy as a phrase
    static Result<std::string> FromEntropy(const std::vector<Byte>& entropy);

    /// Decode a phrase back to its entropy, verifying the word count,
    /// every word and the checksum.
    static Result<std::vector<Byte>> ToEntropy(const std::string& phrase);

    /// True iff ToEntropy() succeeds
    static bool Validate(const std::string& phrase);

    /// BIP39 seed: PBKDF2-HMAC-SHA512(phrase, "mnemonic" + passphrase, 2048).
    /// Whitespace between words is normalised to single spaces.
    static std::vector<Byte> ToSeed(const std::string& phrase,
                                    const std::string& passphrase = "");

    /// Validate the phrase, then derive the 32-byte wallet seed from its
    /// BIP39 seed. Fails with a Crypto error on an invalid phrase.
    static Result<std::vector<Byte>> DeriveWalletSeed(const std::string& phrase,
                                                      const std::string& passphrase = "");

    /// Derive child key `index` from a 32-byte parent seed
    static Result<std::vector<Byte>> DeriveChildKey(const std::vector<Byte>& parentSeed,
                                                    uint32_t index);

    /// Random 32-byte master seed
    static Result<std::vector<Byte>> GenerateMasterSeed();

    /// Word at index, or nullptr if out of range
    static const char* GetWord(uint16_t index);

    /// Index of a (lowercase) word, or -1 if not in the list
    static int GetWordIndex(const std::string& word);

private:
    static const char* const WORDLIST[WORD_COUNT];
};

} // namespace wallet
} // namespace nockledger

#endif // NOCKLEDGER_WALLET_MNEMONIC_H
