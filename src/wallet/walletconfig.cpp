// NOCKLEDGER - Wallet Configuration Implementation
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include "nockledger/wallet/walletconfig.h"

#include <algorithm>
#include <cctype>
#include <limits>
#include <memory>
#include <stdexcept>

namespace nockledger {
namespace wallet {

namespace {

const char* const SECTION_NETWORK = "network";
const char* const SECTION_SECURITY = "security";
const char* const SECTION_BLOCKCHAIN = "blockchain";
const char* const SECTION_LOGGING = "logging";

Status Malformed(const std::string& section, const std::string& key,
                 const std::string& what) {
    return Status::Config("Invalid value for [" + section + "] " + key + ": " + what);
}

/// Read an unsigned key bounded by `max`, leaving `out` alone when absent
template<typename T>
Status ReadUInt(const util::ConfigManager& config, const std::string& section,
                const std::string& key, T& out,
                uint64_t max = std::numeric_limits<T>::max()) {
    if (!config.HasKey(key, section)) {
        return Status::Ok();
    }
    auto value = config.TryGetUInt(key, section);
    if (!value) {
        return Malformed(section, key, "expected an unsigned integer, got '" +
                         config.GetString(key, "", section) + "'");
    }
    if (*value > max) {
        return Malformed(section, key, std::to_string(*value) + " is out of range");
    }
    out = static_cast<T>(*value);
    return Status::Ok();
}

Status ReadBool(const util::ConfigManager& config, const std::string& section,
                const std::string& key, bool& out) {
    if (!config.HasKey(key, section)) {
        return Status::Ok();
    }
    auto value = config.TryGetBool(key, section);
    if (!value) {
        return Malformed(section, key, "expected a boolean, got '" +
                         config.GetString(key, "", section) + "'");
    }
    out = *value;
    return Status::Ok();
}

bool IsKnownLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "trace" || lower == "debug" || lower == "info" ||
           lower == "warn" || lower == "warning" || lower == "error" ||
           lower == "fatal" || lower == "off";
}

Status ReadNetwork(const util::ConfigManager& config, NetworkConfig& net) {
    if (config.HasKey("nodes", SECTION_NETWORK)) {
        net.nodeAddresses = config.GetList("nodes", SECTION_NETWORK);
    }
    Status s = ReadUInt(config, SECTION_NETWORK, "timeout", net.timeoutSeconds);
    if (!s.ok()) return s;
    s = ReadUInt(config, SECTION_NETWORK, "retry_attempts", net.retryAttempts);
    if (!s.ok()) return s;
    s = ReadUInt(config, SECTION_NETWORK, "p2p_port", net.p2pPort);
    if (!s.ok()) return s;
    return ReadUInt(config, SECTION_NETWORK, "rpc_port", net.rpcPort);
}

Status ReadSecurity(const util::ConfigManager& config, SecurityConfig& sec) {
    Status s = ReadBool(config, SECTION_SECURITY, "require_pin", sec.requirePin);
    if (!s.ok()) return s;
    s = ReadUInt(config, SECTION_SECURITY, "pin_timeout", sec.pinTimeoutMinutes);
    if (!s.ok()) return s;
    s = ReadBool(config, SECTION_SECURITY, "enable_biometrics", sec.enableBiometrics);
    if (!s.ok()) return s;
    return ReadUInt(config, SECTION_SECURITY, "auto_lock", sec.autoLockMinutes);
}

Status ReadChain(const util::ConfigManager& config, consensus::ChainParams& chain) {
    if (config.HasKey("network", SECTION_BLOCKCHAIN)) {
        std::string id = config.GetString("network", "", SECTION_BLOCKCHAIN);
        if (id == "main") {
            chain = consensus::ChainParams::Main();
        } else if (id == "regtest") {
            chain = consensus::ChainParams::Regtest();
        } else {
            return Malformed(SECTION_BLOCKCHAIN, "network", "unknown network '" + id + "'");
        }
    }

    Status s = ReadUInt(config, SECTION_BLOCKCHAIN, "initial_difficulty", chain.initialBits);
    if (!s.ok()) return s;
    s = ReadUInt(config, SECTION_BLOCKCHAIN, "target_block_time", chain.targetBlockTime);
    if (!s.ok()) return s;
    s = ReadUInt(config, SECTION_BLOCKCHAIN, "difficulty_adjustment_interval",
                 chain.difficultyAdjustmentInterval);
    if (!s.ok()) return s;
    s = ReadUInt(config, SECTION_BLOCKCHAIN, "max_block_size", chain.maxBlockSize);
    if (!s.ok()) return s;

    if (chain.targetBlockTime == 0) {
        return Malformed(SECTION_BLOCKCHAIN, "target_block_time", "must be positive");
    }
    if (chain.difficultyAdjustmentInterval == 0) {
        return Malformed(SECTION_BLOCKCHAIN, "difficulty_adjustment_interval",
                         "must be positive");
    }

    if (config.HasKey("genesis_hash", SECTION_BLOCKCHAIN)) {
        std::string hex = config.GetString("genesis_hash", "", SECTION_BLOCKCHAIN);
        try {
            chain.genesisHash = Hash256::FromHex(hex);
        } catch (const std::invalid_argument& e) {
            return Malformed(SECTION_BLOCKCHAIN, "genesis_hash", e.what());
        }
    }
    return Status::Ok();
}

Status ReadLogging(const util::ConfigManager& config, LoggingConfig& logging) {
    if (config.HasKey("level", SECTION_LOGGING)) {
        std::string name = config.GetString("level", "", SECTION_LOGGING);
        if (!IsKnownLevel(name)) {
            return Malformed(SECTION_LOGGING, "level", "unknown level '" + name + "'");
        }
        logging.level = util::LogLevelFromString(name);
    }
    logging.file = config.GetString("file", logging.file, SECTION_LOGGING);
    return Status::Ok();
}

} // namespace

// ============================================================================
// WalletConfig
// ============================================================================

Result<WalletConfig> WalletConfig::FromConfig(const util::ConfigManager& config) {
    WalletConfig result;

    Status s = ReadNetwork(config, result.network);
    if (!s.ok()) return s;
    s = ReadSecurity(config, result.security);
    if (!s.ok()) return s;
    s = ReadChain(config, result.chain);
    if (!s.ok()) return s;
    s = ReadLogging(config, result.logging);
    if (!s.ok()) return s;

    return result;
}

Result<WalletConfig> WalletConfig::Load(const std::string& path) {
    util::ConfigManager config;
    auto parsed = config.ParseFile(path);
    if (!parsed.success) {
        return Status::Config(parsed.ToString());
    }
    return FromConfig(config);
}

Status WalletConfig::ApplyLogging() const {
    auto& logger = util::Logger::Instance();
    logger.Initialize();
    logger.SetLevel(logging.level);

    if (!logging.file.empty()) {
        auto sink = std::make_shared<util::FileSink>(logging.file, logging.level);
        if (!sink->IsOpen()) {
            return Status::Config("Cannot open log file: " + logging.file);
        }
        logger.AddSink(sink);
    }

    LOG_INFO(util::LogCategory::WALLET) << "Logging at level "
        << util::LogLevelToString(logging.level)
        << (logging.file.empty() ? "" : " to " + logging.file);
    return Status::Ok();
}

} // namespace wallet
} // namespace nockledger
