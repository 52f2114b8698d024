// COINKEY - Configuration Parser
// Copyright (c) 2024 COINKEY Developers
// MIT License
//
// Parses INI-style configuration for the coinkey tool and key policy.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - A bare key is a boolean flag; "nokey" negates it

#ifndef COINKEY_UTIL_CONFIG_H
#define COINKEY_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace coinkey {
namespace util {

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path, "<string>" or "<command-line>"
    int lineNumber{0};
    bool isDefault{false}; // True if set through SetDefault
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
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration from files, strings and command-line arguments.
 * 
 * Later sources overwrite earlier ones, except that values set with
 * SetDefault never overwrite an explicit value. Command-line options
 * always win.
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();
    
    // ========================================================================
    // Parsing
    // ========================================================================
    
    /// Parse a configuration file
    ConfigParseResult ParseFile(const std::string& filePath);
    
    /// Parse configuration from a string
    ConfigParseResult ParseString(const std::string& content, 
                                  const std::string& sourceName = "<string>");
    
    /**
     * Parse "--key=value", "--flag" and "--noflag" options (one or two
     * leading dashes). A flag never consumes the following argument.
     * Non-option arguments are collected in order and returned through
     * GetPositionalArgs().
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);
    
    // ========================================================================
    // Value Retrieval
    // ========================================================================
    
    std::optional<std::string> TryGetString(const std::string& key, 
                                             const std::string& section = "") const;
    std::string GetString(const std::string& key, 
                         const std::string& defaultValue,
                         const std::string& section = "") const;
    
    /// Integer value; nullopt if missing or not a number
    std::optional<int64_t> TryGetInt(const std::string& key, 
                                      const std::string& section = "") const;
    int64_t GetInt(const std::string& key, 
                   int64_t defaultValue,
                   const std::string& section = "") const;
    
    /// Boolean value; nullopt if missing or not a recognised boolean
    std::optional<bool> TryGetBool(const std::string& key, 
                                    const std::string& section = "") const;
    bool GetBool(const std::string& key, 
                 bool defaultValue,
                 const std::string& section = "") const;
    
    /// Entry metadata (source and line) for a key
    std::optional<ConfigEntry> GetEntry(const std::string& key,
                                        const std::string& section = "") const;
    
    /// Non-option command-line arguments, in order
    const std::vector<std::string>& GetPositionalArgs() const { return positional_; }
    
    // ========================================================================
    // Value Setting
    // ========================================================================
    
    void Set(const std::string& key, const std::string& value, 
             const std::string& section = "");
    
    /// Set a value that only applies when nothing else sets the key
    void SetDefault(const std::string& key, const std::string& value, 
                   const std::string& section = "");
    
    // ========================================================================
    // Sections and Utilities
    // ========================================================================
    
    std::vector<std::string> GetSections() const;
    
    void Clear();
    size_t Size() const;
    
    /// One "section:key=value  # origin" line per entry, origin being the
    /// file and line, "<command-line>" or "default"
    std::string Dump() const;
    
    static std::optional<bool> ParseBool(const std::string& str);

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;
    
    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);
    
    void Store(const std::string& key, const std::string& value,
               const std::string& section, const std::string& source,
               int lineNum, bool isDefault);
    
    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static bool IsValidKey(const std::string& key);
    
    std::map<std::string, ConfigEntry> entries_;
    std::vector<std::string> positional_;
};

// ============================================================================
// Global Configuration
// ============================================================================

/// Get global configuration manager
ConfigManager& GetConfig();

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* CONF = "conf";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* DEBUG = "debug";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* STRICTSENTINEL = "strictsentinel";
    constexpr const char* STRICT = "strict";
    constexpr const char* UNCOMPRESSED = "uncompressed";
}

} // namespace util
} // namespace coinkey

#endif // COINKEY_UTIL_CONFIG_H
