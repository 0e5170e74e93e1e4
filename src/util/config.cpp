// BADPATH - Configuration File Parser Implementation
// Copyright (c) 2024 BADPATH Developers
// MIT License

#include "badpath/util/config.h"

#include "badpath/util/fs.h"
#include "badpath/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace badpath {
namespace util {

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

// ============================================================================
// ConfigEntry / ConfigParseResult
// ============================================================================

bool ConfigEntry::IsTrue() const {
    auto parsed = ConfigManager::ParseBool(value);
    return parsed && *parsed;
}

bool ConfigEntry::IsFalse() const {
    auto parsed = ConfigManager::ParseBool(value);
    return parsed && !*parsed;
}

std::string ConfigParseResult::Describe() const {
    if (success) {
        return "ok";
    }
    std::ostringstream oss;
    if (!errorFile.empty()) {
        oss << errorFile;
        if (errorLine > 0) {
            oss << ":" << errorLine;
        }
        oss << ": ";
    }
    oss << errorMessage;
    return oss.str();
}

// ============================================================================
// ConfigManager Implementation
// ============================================================================

ConfigManager::ConfigManager() = default;

ConfigManager::~ConfigManager() = default;

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

    if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
        std::string result = str.substr(1, str.length() - 2);

        // Escape sequences only apply to double-quoted strings
        if (first == '"') {
            std::string unescaped;
            unescaped.reserve(result.length());

            for (size_t i = 0; i < result.length(); ++i) {
                if (result[i] == '\\' && i + 1 < result.length()) {
                    char next = result[i + 1];
                    switch (next) {
                        case 'n': unescaped += '\n'; ++i; break;
                        case 't': unescaped += '\t'; ++i; break;
                        case '\\': unescaped += '\\'; ++i; break;
                        case '"': unescaped += '"'; ++i; break;
                        default: unescaped += result[i]; break;
                    }
                } else {
                    unescaped += result[i];
                }
            }
            return unescaped;
        }

        return result;
    }

    return str;
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = ToLower(str);

    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }

    return std::nullopt;
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());

    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$') {
            if (i + 1 < value.length() && value[i + 1] == '{') {
                size_t end = value.find('}', i + 2);
                if (end != std::string::npos) {
                    std::string varName = value.substr(i + 2, end - i - 2);
                    const char* envValue = std::getenv(varName.c_str());
                    if (envValue) {
                        result += envValue;
                    }
                    i = end + 1;
                    continue;
                }
            } else if (i + 1 < value.length()) {
                size_t start = i + 1;
                size_t end = start;
                while (end < value.length() &&
                       (std::isalnum(static_cast<unsigned char>(value[end])) ||
                        value[end] == '_')) {
                    ++end;
                }
                if (end > start) {
                    std::string varName = value.substr(start, end - start);
                    const char* envValue = std::getenv(varName.c_str());
                    if (envValue) {
                        result += envValue;
                    }
                    i = end;
                    continue;
                }
            }
        }

        result += value[i];
        ++i;
    }

    return result;
}

// ============================================================================
// Internal Key Management
// ============================================================================

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) const {
    if (section.empty()) {
        return key;
    }
    return section + ":" + key;
}

bool ConfigManager::ValidKey(const std::string& key, const std::string& source,
                             int lineNum, ConfigParseResult& result) const {
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
    return true;
}

void ConfigManager::Store(const std::string& key, const std::string& value,
                          const std::string& section, const std::string& source,
                          int lineNum) {
    std::string fullKey = MakeKey(key, section);

    // A repeated key from a file accumulates instead of replacing
    auto it = entries_.find(fullKey);
    if (it != entries_.end() && !it->second.isDefault) {
        lists_[fullKey].push_back(value);
        return;
    }

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = source;
    entry.lineNumber = lineNum;
    entry.isDefault = false;

    entries_[fullKey] = entry;
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

    // Section header [section]
    if (trimmed[0] == '[') {
        size_t end = trimmed.find(']');
        if (end == std::string::npos) {
            result = ConfigParseResult::Error(
                "Missing closing bracket in section header", source, lineNum);
            return false;
        }
        currentSection = Trim(trimmed.substr(1, end - 1));
        return true;
    }

    // Include directive
    if (trimmed.compare(0, 8, "include ") == 0) {
        if (includeDepth_ >= MAX_INCLUDE_DEPTH) {
            result = ConfigParseResult::Error(
                "Maximum include depth exceeded", source, lineNum);
            return false;
        }

        std::string includePath = Unquote(Trim(trimmed.substr(8)));

        ++includeDepth_;
        ConfigParseResult includeResult = ParseFile(includePath);
        --includeDepth_;

        if (!includeResult.success) {
            result = includeResult;
            return false;
        }
        return true;
    }

    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        // Bare flag, "noflag" negates
        std::string key = trimmed;
        bool negated = false;
        if (key.length() > 2 && key.compare(0, 2, "no") == 0) {
            std::string baseKey = key.substr(2);
            if (std::islower(static_cast<unsigned char>(baseKey[0]))) {
                key = baseKey;
                negated = true;
            }
        }

        if (!ValidKey(key, source, lineNum, result)) {
            return false;
        }

        Store(key, negated ? "false" : "true", currentSection, source, lineNum);
        return true;
    }

    std::string key = Trim(trimmed.substr(0, eqPos));
    std::string value = Trim(trimmed.substr(eqPos + 1));

    if (!ValidKey(key, source, lineNum, result)) {
        return false;
    }

    value = ExpandEnvVars(Unquote(value));

    Store(key, value, currentSection, source, lineNum);
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& stream,
                                             const std::string& sourceName) {
    std::string currentSection;
    std::string line;
    std::string continuationLine;
    int lineNum = 0;

    ConfigParseResult result = ConfigParseResult::Success();

    while (std::getline(stream, line)) {
        ++lineNum;

        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                sourceName, lineNum);
        }

        if (!line.empty() && line.back() == '\\') {
            continuationLine += line.substr(0, line.length() - 1);
            continue;
        }

        if (!continuationLine.empty()) {
            line = continuationLine + line;
            continuationLine.clear();
        }

        if (!ParseLine(line, sourceName, lineNum, currentSection, result)) {
            return result;
        }
    }

    if (!continuationLine.empty()) {
        if (!ParseLine(continuationLine, sourceName, lineNum, currentSection, result)) {
            return result;
        }
    }

    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string expandedPath = ExpandEnvVars(fs::ExpandUser(filePath));

    std::ifstream file(expandedPath);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + expandedPath);
    }

    file.seekg(0, std::ios::end);
    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);

    if (fileSize > static_cast<std::streampos>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            expandedPath);
    }

    LOG_DEBUG(LogCategory::CONFIG) << "Parsing " << expandedPath;
    return ParseStream(file, expandedPath);
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
    return entries_.find(MakeKey(key, section)) != entries_.end();
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    if (it != entries_.end()) {
        return it->second.value;
    }
    return std::nullopt;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return ParseBool(it->second.value);
}

bool ConfigManager::GetBool(const std::string& key,
                            bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::vector<std::string> ConfigManager::GetList(const std::string& key,
                                                const std::string& section,
                                                bool splitCommas) const {
    std::string fullKey = MakeKey(key, section);
    std::vector<std::string> result;

    auto entryIt = entries_.find(fullKey);
    if (entryIt != entries_.end()) {
        const std::string& value = entryIt->second.value;
        if (splitCommas && value.find(',') != std::string::npos) {
            std::istringstream ss(value);
            std::string item;
            while (std::getline(ss, item, ',')) {
                item = Trim(item);
                if (!item.empty()) {
                    result.push_back(item);
                }
            }
        } else if (!value.empty()) {
            result.push_back(value);
        }
    }

    auto listIt = lists_.find(fullKey);
    if (listIt != lists_.end()) {
        result.insert(result.end(), listIt->second.begin(), listIt->second.end());
    }

    return result;
}

std::string ConfigManager::GetPath(const std::string& key,
                                   const std::string& defaultValue,
                                   const std::string& section) const {
    return ExpandEnvVars(fs::ExpandUser(GetString(key, defaultValue, section)));
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<programmatic>";
    entry.isDefault = false;

    std::string fullKey = MakeKey(key, section);
    entries_[fullKey] = entry;
    lists_.erase(fullKey);
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    std::string fullKey = MakeKey(key, section);
    if (entries_.find(fullKey) != entries_.end()) {
        return;
    }

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<default>";
    entry.isDefault = true;

    entries_[fullKey] = entry;
}

// ============================================================================
// Sections
// ============================================================================

std::vector<std::string> ConfigManager::GetSections() const {
    std::set<std::string> sections;
    for (const auto& [fullKey, entry] : entries_) {
        if (!entry.section.empty()) {
            sections.insert(entry.section);
        }
    }
    return std::vector<std::string>(sections.begin(), sections.end());
}

std::vector<std::string> ConfigManager::GetKeys(const std::string& section) const {
    std::vector<std::string> keys;
    for (const auto& [fullKey, entry] : entries_) {
        if (entry.section == section) {
            keys.push_back(entry.key);
        }
    }
    return keys;
}

// ============================================================================
// Validation
// ============================================================================

void ConfigManager::AllowKey(const std::string& key, const std::string& section) {
    allowedKeys_.insert(MakeKey(key, section));
}

std::vector<std::string> ConfigManager::Validate() const {
    std::vector<std::string> warnings;
    if (allowedKeys_.empty()) {
        return warnings;
    }

    for (const auto& [fullKey, entry] : entries_) {
        if (allowedKeys_.count(fullKey) == 0) {
            std::ostringstream oss;
            oss << "Unknown key '" << fullKey << "'";
            if (!entry.source.empty()) {
                oss << " in " << entry.source;
                if (entry.lineNumber > 0) {
                    oss << ":" << entry.lineNumber;
                }
            }
            warnings.push_back(oss.str());
        }
    }
    return warnings;
}

// ============================================================================
// Utilities
// ============================================================================

void ConfigManager::Clear() {
    entries_.clear();
    lists_.clear();
    allowedKeys_.clear();
    includeDepth_ = 0;
}

size_t ConfigManager::Size() const {
    return entries_.size();
}

} // namespace util
} // namespace badpath
