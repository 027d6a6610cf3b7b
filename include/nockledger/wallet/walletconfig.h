// NOCKLEDGER - Wallet Configuration
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License
//
// Typed wallet settings read from an INI file:
//
//   [network]
//   nodes = 10.0.0.1:9000, 10.0.0.2:9000
//   timeout = 30
//
//   [security]
//   require_pin = yes
//
//   [blockchain]
//   network = regtest
//   initial_difficulty = 0x1fffffff
//
//   [logging]
//   level = debug
//   file = wallet.log

#ifndef NOCKLEDGER_WALLET_WALLETCONFIG_H
#define NOCKLEDGER_WALLET_WALLETCONFIG_H

#include "nockledger/consensus/params.h"
#include "nockledger/core/status.h"
#include "nockledger/util/config.h"
#include "nockledger/util/logging.h"

#include <cstdint>
#include <string>
#include <vector>

namespace nockledger {
namespace wallet {

// ============================================================================
// Configuration Sections
// ============================================================================

struct NetworkConfig {
    /// host:port of the nodes to broadcast to
    std::vector<std::string> nodeAddresses;
    uint32_t timeoutSeconds{30};
    uint32_t retryAttempts{3};
    uint16_t p2pPort{9000};
    uint16_t rpcPort{9001};
};

struct SecurityConfig {
    bool requirePin{false};
    uint32_t pinTimeoutMinutes{5};
    bool enableBiometrics{false};
    uint32_t autoLockMinutes{15};
};

struct LoggingConfig {
    util::LogLevel level{util::LogLevel::Info};
    /// Log file path; empty logs to the console only
    std::string file;
};

// ============================================================================
// Wallet Configuration
// ============================================================================

struct WalletConfig {
    NetworkConfig network;
    SecurityConfig security;
    consensus::ChainParams chain;
    LoggingConfig logging;

    /**
     * Build a configuration from parsed INI content.
     *
     * Missing keys keep their defaults. A key that is present with a
     * malformed or out-of-range value fails with a Config error naming it.
     * `[blockchain] network = regtest` starts from the regtest parameters
     * before individual keys are applied.
     */
    static Result<WalletConfig> FromConfig(const util::ConfigManager& config);

    /// Parse `path` and build a configuration from it
    static Result<WalletConfig> Load(const std::string& path);

    /// Point the global logger at the configured level and sinks
    Status ApplyLogging() const;
};

} // namespace wallet
} // namespace nockledger

#endif // NOCKLEDGER_WALLET_WALLETCONFIG_H
