// NOCKLEDGER - Configuration File Parser Implementation
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include "nockledger/util/config.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>

namespace nockledger {
namespace util {

std::string ConfigParseResult::ToString() const {
    std::string out;
    if (!errorFile.empty()) {
        out += errorFile + ":";
        if (errorLine > 0) {
            out += std::to_string(errorLine) + ":";
        }
        out += " ";
    }
    return out + errorMessage;
}

// ============================================================================
// Static Helper Functions
// ============================================================================

std::string ConfigManager::Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

std::string ConfigManager::Unquote(const std::string& str) {
    if (str.length() < 2) {
        return str;
    }

    char first = str.front();
    char last = str.back();
    if (first != last || (first != '"' && first != '\'')) {
        return str;
    }

    std::string inner = str.substr(1, str.length() - 2);
    if (first == '\'') {
        return inner;
    }

    // Double quotes honour \n \t \\ \"
    std::string unescaped;
    unescaped.reserve(inner.length());
    for (size_t i = 0; i < inner.length(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.length()) {
            char next = inner[i + 1];
            switch (next) {
                case 'n': unescaped += '\n'; ++i; continue;
                case 't': unescaped += '\t'; ++i; continue;
                case '\\': unescaped += '\\'; ++i; continue;
                case '"': unescaped += '"'; ++i; continue;
                default: break;
            }
        }
        unescaped += inner[i];
    }
    return unescaped;
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) {
    if (section.empty()) {
        return key;
    }
    return section + ":" + key;
}

// ============================================================================
// Parsing
// ============================================================================

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, std::string& currentSection,
                              ConfigParseResult& result) {
    std::string trimmed = Trim(line);

    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return true;
    }

    if (trimmed[0] == '[') {
        size_t end = trimmed.find(']');
        if (end == std::string::npos) {
            result = ConfigParseResult::Error(
                "Missing closing bracket in section header", source, lineNum);
            return false;
        }
        currentSection = Trim(trimmed.substr(1, end - 1));
        if (currentSection.empty()) {
            result = ConfigParseResult::Error("Empty section name", source, lineNum);
            return false;
        }
        return true;
    }

    std::string key;
    std::string value;
    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        key = trimmed;
        value = "true";
    } else {
        key = Trim(trimmed.substr(0, eqPos));
        value = Unquote(Trim(trimmed.substr(eqPos + 1)));
    }

    if (key.empty()) {
        result = ConfigParseResult::Error("Empty key", source, lineNum);
        return false;
    }
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            result = ConfigParseResult::Error(
                "Invalid character in key: " + std::string(1, c), source, lineNum);
            return false;
        }
    }

    ConfigEntry& entry = entries_[MakeKey(key, currentSection)];
    if (entry.values.empty()) {
        entry.key = key;
        entry.section = currentSection;
    }
    entry.source = source;
    entry.lineNumber = lineNum;
    entry.values.push_back(value);
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& source) {
    std::string currentSection;
    std::string line;
    int lineNum = 0;
    ConfigParseResult result = ConfigParseResult::Success();

    while (std::getline(in, line)) {
        ++lineNum;
        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                source, lineNum);
        }
        if (!ParseLine(line, source, lineNum, currentSection, result)) {
            return result;
        }
    }
    return result;
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + filePath);
    }

    file.seekg(0, std::ios::end);
    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);
    if (fileSize > static_cast<std::streampos>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            filePath);
    }

    return ParseStream(file, filePath);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName);
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return entries_.count(MakeKey(key, section)) > 0;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.Value();
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str || str->empty()) {
        return std::nullopt;
    }
    try {
        size_t pos = 0;
        int64_t value = std::stoll(*str, &pos, 10);
        if (pos != str->size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key,
                                                  const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str || str->empty() || (*str)[0] == '-' || (*str)[0] == '+') {
        return std::nullopt;
    }
    int base = 10;
    std::string digits = *str;
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        base = 16;
        digits = digits.substr(2);
    }
    try {
        size_t pos = 0;
        uint64_t value = std::stoull(digits, &pos, base);
        if (pos != digits.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

uint64_t ConfigManager::GetUInt(const std::string& key, uint64_t defaultValue,
                                const std::string& section) const {
    return TryGetUInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }
    return ParseBool(*str);
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::vector<std::string> ConfigManager::GetList(const std::string& key,
                                                const std::string& section) const {
    std::vector<std::string> result;
    auto it = entries_.find(MakeKey(key, section));
    if (it == entries_.end()) {
        return result;
    }
    for (const auto& value : it->second.values) {
        std::istringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = Trim(item);
            if (!item.empty()) {
                result.push_back(item);
            }
        }
    }
    return result;
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    ConfigEntry entry;
    entry.key = key;
    entry.section = section;
    entry.source = "<set>";
    entry.values.push_back(value);
    entries_[MakeKey(key, section)] = std::move(entry);
}

std::vector<std::string> ConfigManager::GetSections() const {
    std::set<std::string> sections;
    for (const auto& kv : entries_) {
        if (!kv.second.section.empty()) {
            sections.insert(kv.second.section);
        }
    }
    return std::vector<std::string>(sections.begin(), sections.end());
}

} // namespace util
} // namespace nockledger
