// NOCKLEDGER - BIP39 Mnemonics and Seed Derivation Implementation
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include "nockledger/wallet/mnemonic.h"
#include "nockledger/core/random.h"
#include "nockledger/crypto/hmac.h"
#include "nockledger/crypto/sha256.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace nockledger {
namespace wallet {

namespace {

std::vector<std::string> SplitWords(const std::string& phrase) {
    std::vector<std::string> words;
    std::istringstream stream(phrase);
    std::string word;
    while (stream >> word) {
        std::transform(word.begin(), word.end(), word.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        words.push_back(word);
    }
    return words;
}

std::string JoinWords(const std::vector<std::string>& words) {
    std::string out;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) out += ' ';
        out += words[i];
    }
    return out;
}

bool GetBit(const std::vector<Byte>& data, size_t bit) {
    return (data[bit / 8] >> (7 - bit % 8)) & 1;
}

void SetBit(std::vector<Byte>& data, size_t bit) {
    data[bit / 8] |= static_cast<Byte>(1 << (7 - bit % 8));
}

std::vector<Byte> ToBytes(const std::string& s) {
    return std::vector<Byte>(s.begin(), s.end());
}

} // namespace

// ============================================================================
// Phrase Encoding
// ============================================================================

Result<std::string> Mnemonic::Generate(Strength strength) {
    std::vector<Byte> entropy(static_cast<size_t>(strength) / 8);
    try {
        GetRandBytes(entropy.data(), entropy.size());
    } catch (const std::runtime_error& e) {
        return Status::Crypto(e.what());
    }
    auto phrase = FromEntropy(entropy);
    SecureClear(entropy.data(), entropy.size());
    return phrase;
}

Result<std::string> Mnemonic::FromEntropy(const std::vector<Byte>& entropy) {
    size_t len = entropy.size();
    if (len < 16 || len > 32 || len % 4 != 0) {
        return Status::Crypto("Invalid entropy length: " + std::to_string(len));
    }

    // Entropy followed by the first ENT/32 bits of its SHA-256
    std::vector<Byte> bits(entropy);
    bits.push_back(SHA256Hash(entropy)[0]);

    size_t wordCount = (len * 8 + len / 4) / 11;
    std::vector<std::string> words;
    words.reserve(wordCount);
    for (size_t w = 0; w < wordCount; ++w) {
        uint16_t index = 0;
        for (size_t b = 0; b < 11; ++b) {
            index = static_cast<uint16_t>((index << 1) | (GetBit(bits, w * 11 + b) ? 1 : 0));
        }
        words.emplace_back(WORDLIST[index]);
    }
    return JoinWords(words);
}

Result<std::vector<Byte>> Mnemonic::ToEntropy(const std::string& phrase) {
    std::vector<std::string> words = SplitWords(phrase);
    if (words.size() < 12 || words.size() > 24 || words.size() % 3 != 0) {
        return Status::Crypto("Invalid mnemonic word count: " + std::to_string(words.size()));
    }

    size_t totalBits = words.size() * 11;
    size_t checksumBits = words.size() / 3;
    size_t entropyBits = totalBits - checksumBits;

    std::vector<Byte> packed((totalBits + 7) / 8, 0);
    for (size_t w = 0; w < words.size(); ++w) {
        int index = GetWordIndex(words[w]);
        if (index < 0) {
            return Status::Crypto("Unknown mnemonic word: " + words[w]);
        }
        for (size_t b = 0; b < 11; ++b) {
            if (index & (1 << (10 - b))) {
                SetBit(packed, w * 11 + b);
            }
        }
    }

    std::vector<Byte> entropy(packed.begin(), packed.begin() + entropyBits / 8);
    Hash256 digest = SHA256Hash(entropy);
    for (size_t b = 0; b < checksumBits; ++b) {
        bool expected = (digest[0] >> (7 - b)) & 1;
        if (GetBit(packed, entropyBits + b) != expected) {
            SecureClear(entropy.data(), entropy.size());
            return Status::Crypto("Invalid mnemonic checksum");
        }
    }
    return entropy;
}

bool Mnemonic::Validate(const std::string& phrase) {
    return ToEntropy(phrase).ok();
}

// ============================================================================
// Seed Derivation
// ============================================================================

std::vector<Byte> Mnemonic::ToSeed(const std::string& phrase,
                                   const std::string& passphrase) {
    std::string normalized = JoinWords(SplitWords(phrase));
    return PBKDF2_SHA512(normalized, ToBytes("mnemonic" + passphrase),
                         BIP39_PBKDF2_ROUNDS, BIP39_SEED_SIZE);
}

Result<std::vector<Byte>> Mnemonic::DeriveWalletSeed(const std::string& phrase,
                                                     const std::string& passphrase) {
    auto entropy = ToEntropy(phrase);
    if (!entropy) {
        return entropy.status();
    }
    SecureClear(entropy->data(), entropy->size());

    try {
        std::vector<Byte> seed = ToSeed(phrase, passphrase);
        std::vector<Byte> walletSeed = HKDF_SHA512({}, seed, ToBytes(WALLET_SEED_INFO),
                                                   WALLET_SEED_SIZE);
        SecureClear(seed.data(), seed.size());
        return walletSeed;
    } catch (const std::exception& e) {
        return Status::Crypto(std::string("Wallet seed derivation failed: ") + e.what());
    }
}

Result<std::vector<Byte>> Mnemonic::DeriveChildKey(const std::vector<Byte>& parentSeed,
                                                   uint32_t index) {
    if (parentSeed.size() != WALLET_SEED_SIZE) {
        return Status::Crypto("Invalid parent seed length: " +
                              std::to_string(parentSeed.size()));
    }
    std::string info = CHILD_KEY_INFO_PREFIX + std::to_string(index);
    try {
        return HKDF_SHA512({}, parentSeed, ToBytes(info), WALLET_SEED_SIZE);
    } catch (const std::exception& e) {
        return Status::Crypto(std::string("Child key derivation failed: ") + e.what());
    }
}

Result<std::vector<Byte>> Mnemonic::GenerateMasterSeed() {
    std::vector<Byte> seed(WALLET_SEED_SIZE);
    try {
        GetRandBytes(seed.data(), seed.size());
    } catch (const std::runtime_error& e) {
        return Status::Crypto(e.what());
    }
    return seed;
}

// ============================================================================
// Wordlist Lookup
// ============================================================================

const char* Mnemonic::GetWord(uint16_t index) {
    return index < WORD_COUNT ? WORDLIST[index] : nullptr;
}

int Mnemonic::GetWordIndex(const std::string& word) {
    // The English list is sorted
    auto first = WORDLIST;
    auto last = WORDLIST + WORD_COUNT;
    auto it = std::lower_bound(first, last, word,
        [](const char* entry, const std::string& w) {
            return std::strcmp(entry, w.c_str()) < 0;
        });
    if (it == last || word != *it) {
        return -1;
    }
    return static_cast<int>(it - first);
}

} // namespace wallet
} // namespace nockledger
