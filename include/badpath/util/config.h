// BADPATH - Configuration File Parser
// Copyright (c) 2024 BADPATH Developers
// MIT License
//
// Parses INI-style configuration files for the path checker.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Bare "flag" means flag=true, "noflag" means flag=false
// - Repeated keys accumulate into a list
// - Environment variable expansion: ${VAR_NAME} or $VAR_NAME
// - "include <file>" pulls in another file

#ifndef BADPATH_UTIL_CONFIG_H
#define BADPATH_UTIL_CONFIG_H

#include <cstddef>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace badpath {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "badpath.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

/// Maximum include depth
constexpr int MAX_INCLUDE_DEPTH = 10;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path where this was defined
    int lineNumber{0};
    bool isDefault{false};

    bool IsTrue() const;
    bool IsFalse() const;
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};
    std::vector<std::string> warnings;

    static ConfigParseResult Success() {
        return {true, "", "", 0, {}};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line, {}};
    }

    /// "file:line: message" style description
    std::string Describe() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // ========================================================================
    // Parsing
    // ========================================================================

    /**
     * Parse a configuration file.
     *
     * @param filePath Path to the config file (~ and $VAR are expanded)
     * @return Parse result
     */
    ConfigParseResult ParseFile(const std::string& filePath);

    /**
     * Parse configuration from a string.
     *
     * @param content Config file content
     * @param sourceName Name for error messages
     * @return Parse result
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

    /// Returns nullopt if the key is missing or not a boolean word
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;

    /// All values given for the key, in file order. With splitCommas, a
    /// single comma-separated value is split into items.
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "",
                                     bool splitCommas = true) const;

    /// Get path value (with ~ expansion)
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set a value that config files may override
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Sections
    // ========================================================================

    std::vector<std::string> GetSections() const;

    std::vector<std::string> GetKeys(const std::string& section = "") const;

    // ========================================================================
    // Validation
    // ========================================================================

    /// Register an allowed key
    void AllowKey(const std::string& key, const std::string& section = "");

    /// Warnings for keys that were not registered with AllowKey
    std::vector<std::string> Validate() const;

    // ========================================================================
    // Utilities
    // ========================================================================

    void Clear();

    size_t Size() const;

    /// Expand environment variables in a string
    static std::string ExpandEnvVars(const std::string& value);

    /// Parse boolean string
    static std::optional<bool> ParseBool(const std::string& str);

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseStream(std::istream& stream, const std::string& sourceName);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    bool ValidKey(const std::string& key, const std::string& source, int lineNum,
                  ConfigParseResult& result) const;

    void Store(const std::string& key, const std::string& value,
               const std::string& section, const std::string& source, int lineNum);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);

    std::map<std::string, ConfigEntry> entries_;
    std::map<std::string, std::vector<std::string>> lists_;  // Repeated values

    std::set<std::string> allowedKeys_;

    int includeDepth_{0};
};

} // namespace util
} // namespace badpath

#endif // BADPATH_UTIL_CONFIG_H
