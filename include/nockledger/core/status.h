// NOCKLEDGER - Operation Status and Result Types
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License
//
// Every fallible ledger, wallet and consensus operation reports failure as a
// value: a Status (code + message) or a Result<T> carrying either a value or
// a non-OK Status.

#ifndef NOCKLEDGER_CORE_STATUS_H
#define NOCKLEDGER_CORE_STATUS_H

#include "nockledger/core/types.h"

#include <optional>
#include <string>
#include <utility>

namespace nockledger {

// ============================================================================
// Status
// ============================================================================

class Status {
public:
    enum Code {
        OK = 0,
        CRYPTO,              // bad key length, signing failure, bad mnemonic
        ADDRESS,             // malformed base58 or wrong decoded length
        INSUFFICIENT_FUNDS,  // recoverable, carries required/available
        TRANSACTION,         // missing inputs/outputs, double spend, not found
        BLOCK_VALIDATION,    // bad proof of work, merkle root, empty tx
        CONSENSUS,           // mining search exhausted or cancelled
        KEY_NOT_FOUND,
        KEY_EXISTS,
        NOTE_NOT_FOUND,
        STORAGE,
        NETWORK,
        SERIALIZATION,
        CONFIG,
    };

    Status() : code_(OK) {}
    Status(Code code, std::string msg) : code_(code), message_(std::move(msg)) {}

    static Status Ok() { return Status(); }
    static Status Crypto(const std::string& msg) { return Status(CRYPTO, msg); }
    static Status Address(const std::string& msg) { return Status(ADDRESS, msg); }
    static Status Transaction(const std::string& msg) { return Status(TRANSACTION, msg); }
    static Status BlockValidation(const std::string& msg) { return Status(BLOCK_VALIDATION, msg); }
    static Status Consensus(const std::string& msg) { return Status(CONSENSUS, msg); }
    static Status Storage(const std::string& msg) { return Status(STORAGE, msg); }
    static Status Network(const std::string& msg) { return Status(NETWORK, msg); }
    static Status Serialization(const std::string& msg) { return Status(SERIALIZATION, msg); }
    static Status Config(const std::string& msg) { return Status(CONFIG, msg); }

    static Status KeyNotFound(const std::string& name) {
        return Status(KEY_NOT_FOUND, "Key not found: " + name);
    }
    static Status KeyExists(const std::string& name) {
        return Status(KEY_EXISTS, "Key already exists: " + name);
    }
    static Status NoteNotFound(const std::string& id) {
        return Status(NOTE_NOT_FOUND, "Note not found: " + id);
    }
    static Status InsufficientFunds(Amount required, Amount available) {
        Status s(INSUFFICIENT_FUNDS, "Insufficient funds: required " +
                 std::to_string(required) + ", available " + std::to_string(available));
        s.required_ = required;
        s.available_ = available;
        return s;
    }

    bool ok() const { return code_ == OK; }
    bool IsInsufficientFunds() const { return code_ == INSUFFICIENT_FUNDS; }
    bool IsKeyNotFound() const { return code_ == KEY_NOT_FOUND; }
    bool IsNoteNotFound() const { return code_ == NOTE_NOT_FOUND; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    /// Only meaningful for INSUFFICIENT_FUNDS
    Amount required() const { return required_; }
    Amount available() const { return available_; }

    std::string ToString() const;

    bool operator==(const Status& other) const {
        return code_ == other.code_ && message_ == other.message_;
    }

private:
    Code code_;
    std::string message_;
    Amount required_{0};
    Amount available_{0};
};

/// Name of a status code ("Transaction", "KeyNotFound", ...)
const char* StatusCodeToString(Status::Code code);

// ============================================================================
// Result<T>
// ============================================================================

/// Either a value or an error Status.
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(Status status) : status_(std::move(status)) {
        if (status_.ok()) {
            status_ = Status(Status::SERIALIZATION, "Result constructed without a value");
        }
    }

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Status& status() const { return status_; }

    T& value() { return *value_; }
    const T& value() const { return *value_; }

    T* operator->() { return &*value_; }
    const T* operator->() const { return &*value_; }
    T& operator*() { return *value_; }
    const T& operator*() const { return *value_; }

    /// Move the value out (only valid when ok())
    T Take() { return std::move(*value_); }

private:
    std::optional<T> value_;
    Status status_;
};

} // namespace nockledger

#endif // NOCKLEDGER_CORE_STATUS_H
