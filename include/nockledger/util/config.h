// NOCKLEDGER - Configuration File Parser
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License
//
// Parses INI-style configuration for wallet and chain settings.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - Section headers: [section]
// - key=value pairs; a bare key is a flag set to "true"
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Repeating a key collects its values into a list

#ifndef NOCKLEDGER_UTIL_CONFIG_H
#define NOCKLEDGER_UTIL_CONFIG_H

#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nockledger {
namespace util {

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "nockledger.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string section;   // Empty for global section
    std::string source;    // File path or source name
    int lineNumber{0};
    /// Every value assigned to the key, in file order
    std::vector<std::string> values;

    /// Last assigned value
    const std::string& Value() const { return values.back(); }
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }

    /// "file:line: message" (file and line omitted when unknown)
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Key/value store populated from INI text.
 *
 * Keys are addressed as (key, section); the global section is "".
 * Later assignments of the same key win for scalar lookups and are all
 * kept for GetList().
 */
class ConfigManager {
public:
    ConfigManager() = default;

    /**
     * Parse a configuration file.
     *
     * @param filePath Path to the config file
     * @return Parse result; on failure nothing after the bad line is applied
     */
    ConfigParseResult ParseFile(const std::string& filePath);

    /**
     * Parse configuration from a string.
     *
     * @param content Config text
     * @param sourceName Name used in error messages
     */
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Signed decimal value (nullopt if missing or not a whole number)
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    /// Unsigned value; decimal or 0x-prefixed hex (nullopt if missing,
    /// negative or malformed)
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;

    uint64_t GetUInt(const std::string& key, uint64_t defaultValue,
                     const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    /// All values of a key: repeated assignments plus comma-separated items
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    /// Set a value programmatically (replaces any list)
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    // ========================================================================
    // Utilities
    // ========================================================================

    /// Section names in sorted order (the global section is omitted)
    std::vector<std::string> GetSections() const;

    void Clear() { entries_.clear(); }

    size_t Size() const { return entries_.size(); }

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);

private:
    static std::string MakeKey(const std::string& key, const std::string& section);

    ConfigParseResult ParseStream(std::istream& in, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    std::map<std::string, ConfigEntry> entries_;
};

} // namespace util
} // namespace nockledger

#endif // NOCKLEDGER_UTIL_CONFIG_H
