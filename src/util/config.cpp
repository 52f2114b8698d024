// COINKEY - Configuration Parser Implementation
// Copyright (c) 2024 COINKEY Developers
// MIT License

#include "coinkey/util/config.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>

namespace coinkey {
namespace util {

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
        
        // Escapes are only honoured inside double quotes
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

bool ConfigManager::IsValidKey(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) const {
    if (section.empty()) {
        return key;
    }
    return section + ":" + key;
}

void ConfigManager::Store(const std::string& key, const std::string& value,
                          const std::string& section, const std::string& source,
                          int lineNum, bool isDefault) {
    std::string fullKey = MakeKey(key, section);
    
    auto it = entries_.find(fullKey);
    if (isDefault && it != entries_.end() && !it->second.isDefault) {
        return;
    }
    
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = source;
    entry.lineNumber = lineNum;
    entry.isDefault = isDefault;
    
    entries_[fullKey] = entry;
}

// ============================================================================
// Parsing
// ============================================================================

bool ConfigManager::ParseLine(const std::string& line, const std::string& source, 
                              int lineNum, std::string& currentSection, 
                              ConfigParseResult& result) {
    std::string trimmed = Trim(line);
    
    // Empty line or comment
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
    
    size_t eqPos = trimmed.find('=');
    std::string key = Trim(eqPos == std::string::npos ? trimmed : trimmed.substr(0, eqPos));
    std::string value;
    
    if (eqPos == std::string::npos) {
        // Bare flag; "nokey" negates
        value = "true";
        if (key.length() > 2 && key.compare(0, 2, "no") == 0 &&
            std::islower(static_cast<unsigned char>(key[2]))) {
            key = key.substr(2);
            value = "false";
        }
    } else {
        value = Unquote(Trim(trimmed.substr(eqPos + 1)));
    }
    
    if (!IsValidKey(key)) {
        result = ConfigParseResult::Error("Invalid key: '" + key + "'", source, lineNum);
        return false;
    }
    
    Store(key, value, currentSection, source, lineNum, false);
    return true;
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + filePath);
    }
    
    file.seekg(0, std::ios::end);
    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);
    
    if (fileSize > static_cast<std::streamoff>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            filePath);
    }
    
    std::ostringstream content;
    content << file.rdbuf();
    return ParseString(content.str(), filePath);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    std::string currentSection;
    std::string line;
    int lineNum = 0;
    
    ConfigParseResult result = ConfigParseResult::Success();
    
    while (std::getline(stream, line)) {
        ++lineNum;
        
        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                sourceName, lineNum);
        }
        
        if (!ParseLine(line, sourceName, lineNum, currentSection, result)) {
            return result;
        }
    }
    
    return result;
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    positional_.clear();
    
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        
        if (arg.size() < 2 || arg[0] != '-') {
            positional_.push_back(arg);
            continue;
        }
        
        size_t dashes = (arg[1] == '-') ? 2 : 1;
        arg = arg.substr(dashes);
        
        std::string key;
        std::string value;
        
        size_t eqPos = arg.find('=');
        if (eqPos != std::string::npos) {
            key = arg.substr(0, eqPos);
            value = arg.substr(eqPos + 1);
        } else {
            key = arg;
            value = "true";
            if (key.length() > 2 && key.compare(0, 2, "no") == 0 &&
                std::islower(static_cast<unsigned char>(key[2]))) {
                key = key.substr(2);
                value = "false";
            }
        }
        
        if (!IsValidKey(key)) {
            return ConfigParseResult::Error("Invalid option: " + std::string(argv[i]),
                                            "<command-line>", i);
        }
        
        Store(key, value, "", "<command-line>", 0, false);
    }
    
    return ConfigParseResult::Success();
}

// ============================================================================
// Value Retrieval
// ============================================================================

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

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    auto value = TryGetString(key, section);
    if (!value) {
        return std::nullopt;
    }
    
    try {
        size_t pos;
        int64_t result = std::stoll(*value, &pos);
        if (!Trim(value->substr(pos)).empty()) {
            return std::nullopt;
        }
        return result;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int64_t ConfigManager::GetInt(const std::string& key,
                              int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    auto value = TryGetString(key, section);
    if (!value) {
        return std::nullopt;
    }
    return ParseBool(*value);
}

bool ConfigManager::GetBool(const std::string& key,
                            bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::optional<ConfigEntry> ConfigManager::GetEntry(const std::string& key,
                                                   const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    if (it != entries_.end()) {
        return it->second;
    }
    return std::nullopt;
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    Store(key, value, section, "<set>", 0, false);
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    Store(key, value, section, "<default>", 0, true);
}

// ============================================================================
// Sections and Utilities
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

void ConfigManager::Clear() {
    entries_.clear();
    positional_.clear();
}

size_t ConfigManager::Size() const {
    return entries_.size();
}

std::string ConfigManager::Dump() const {
    std::ostringstream oss;
    for (const auto& [fullKey, entry] : entries_) {
        oss << fullKey << "=" << entry.value;
        if (entry.isDefault) {
            oss << "  # default";
        } else if (entry.lineNumber > 0) {
            oss << "  # " << entry.source << ":" << entry.lineNumber;
        } else {
            oss << "  # " << entry.source;
        }
        oss << "\n";
    }
    return oss.str();
}

// ============================================================================
// Global Configuration
// ============================================================================

ConfigManager& GetConfig() {
    static ConfigManager instance;
    return instance;
}

} // namespace util
} // namespace coinkey
