// NOCKLEDGER - Operation Status Implementation
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include "nockledger/core/status.h"

namespace nockledger {

const char* StatusCodeToString(Status::Code code) {
    switch (code) {
        case Status::OK:                 return "OK";
        case Status::CRYPTO:             return "Crypto";
        case Status::ADDRESS:            return "Address";
        case Status::INSUFFICIENT_FUNDS: return "InsufficientFunds";
        case Status::TRANSACTION:        return "Transaction";
        case Status::BLOCK_VALIDATION:   return "BlockValidation";
        case Status::CONSENSUS:          return "Consensus";
        case Status::KEY_NOT_FOUND:      return "KeyNotFound";
        case Status::KEY_EXISTS:         return "KeyExists";
        case Status::NOTE_NOT_FOUND:     return "NoteNotFound";
        case Status::STORAGE:            return "Storage";
        case Status::NETWORK:            return "Network";
        case Status::SERIALIZATION:      return "Serialization";
        case Status::CONFIG:             return "Config";
        default:                         return "Unknown";
    }
}

std::string Status::ToString() const {
    if (ok()) return "OK";
    return std::string(StatusCodeToString(code_)) + ": " + message_;
}

} // namespace nockledger
