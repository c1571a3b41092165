// POWERBOND - Configuration File Parser
// Copyright (c) 2024 POWERBOND Developers
// MIT License
//
// Parses INI-style configuration files.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - A bare key is a true flag, "nokey" a false one
// - Environment variable expansion: ${VAR_NAME}
//
// Sectioned keys can also be addressed as "section.key" on the command line.

#ifndef POWERBOND_UTIL_CONFIG_H
#define POWERBOND_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace powerbond {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default data directory name (under $HOME)
constexpr const char* DEFAULT_DATADIR_NAME = ".powerbond";

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "powerbond.conf";

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
    std::string source;    // File path where this was defined
    int lineNumber{0};
    bool isDefault{false};
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
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Manages configuration from files and command-line arguments.
 *
 * Priority order (highest to lowest):
 * 1. Command-line arguments
 * 2. Config file (-conf, or <datadir>/powerbond.conf)
 * 3. Built-in defaults
 */
class ConfigManager {
public:
    ConfigManager() = default;

    // ========================================================================
    // Parsing
    // ========================================================================

    /// Parse a configuration file
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Parse configuration from a string
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /**
     * Parse "-key=value", "-flag" and "-noflag" arguments.
     * Non-option arguments are left for the caller. A key of the form
     * "section.key" is stored in that section.
     */
    ConfigParseResult ParseCommandLine(int argc, char* argv[]);

    /// Load the conf file named by -conf, or the one in the data directory
    ConfigParseResult LoadConfigFile();

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Integer value (nullopt if missing or not a number)
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    /// Boolean value (nullopt if missing or not a boolean)
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    /// Path value with ~ and ${VAR} expansion
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set a value only if none is present
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    /// All keys defined in a section (empty for global)
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    // ========================================================================
    // Validation
    // ========================================================================

    void RequireKey(const std::string& key, const std::string& section = "");
    void AllowKey(const std::string& key, const std::string& section = "");

    /// Missing required keys, and unknown keys when any key was allowed
    std::vector<std::string> Validate() const;

    // ========================================================================
    // Utilities
    // ========================================================================

    void Clear();
    size_t Size() const { return entries_.size(); }

    std::string GetDataDir() const;
    void SetDataDir(const std::string& dir);
    static std::string GetDefaultDataDir();

    static std::string ExpandEnvVars(const std::string& value);
    static std::string ExpandTilde(const std::string& path);

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseStream(std::istream& in, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    void Store(const std::string& key, const std::string& value,
               const std::string& section, const std::string& source,
               int lineNum, bool isDefault);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    static bool IsValidKey(const std::string& key);

    std::map<std::string, ConfigEntry> entries_;
    std::set<std::string> requiredKeys_;
    std::set<std::string> allowedKeys_;
    std::string dataDir_;
};

// ============================================================================
// Global Configuration
// ============================================================================

/// Process-wide configuration manager
ConfigManager& GetConfig();

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // General
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* DEBUG = "debug";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";

    // [domain]
    constexpr const char* DOMAIN_SECTION = "domain";
    constexpr const char* DOMAIN_NAME = "name";
    constexpr const char* DOMAIN_VERSION = "version";
    constexpr const char* DOMAIN_CHAINID = "chainid";
    constexpr const char* DOMAIN_CONTRACT = "contract";

    // [exchange]
    constexpr const char* EXCHANGE_SECTION = "exchange";
    constexpr const char* EXCHANGE_CAP = "cap";
    constexpr const char* EXCHANGE_UTILTOKEN = "utiltoken";
    constexpr const char* EXCHANGE_GOVTOKEN = "govtoken";
}

} // namespace util
} // namespace powerbond

#endif // POWERBOND_UTIL_CONFIG_H
