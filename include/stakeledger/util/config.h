// StakeLedger - Configuration File Parser
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// Parses INI-style configuration for a ledger service instance.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs, optionally under [section] headers
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}
// - Repeating a key builds a list (see GetList)

#ifndef STAKELEDGER_UTIL_CONFIG_H
#define STAKELEDGER_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace stakeledger {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

constexpr const char* DEFAULT_DATADIR_NAME = ".stakeledger";

constexpr const char* DEFAULT_CONFIG_FILENAME = "stakeledger.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path, "<string>", "<command-line>"...
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

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }

    /// "file:line: message" for display
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration collected from files, strings and the command line.
 *
 * Later sources override earlier ones for scalar lookups; command-line
 * arguments always win.
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // ========================================================================
    // Parsing
    // ========================================================================

    ConfigParseResult ParseFile(const std::string& filePath);

    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /**
     * Parse "-key=value", "--key value", "-flag" and "-noflag" arguments.
     * A "section.key" argument addresses a key inside [section].
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Integer value; accepts k/m/g suffixes (powers of 1024).
    /// Returns nullopt when missing, malformed, or out of range.
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    int64_t GetInt(const std::string& key,
                   int64_t defaultValue,
                   const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;

    /// All values given for a key (repeated entries and comma-separated)
    std::vector<std::string> GetList(const std::string& key,
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

    /// Set only if the key has no value yet
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Sections / Validation
    // ========================================================================

    std::vector<std::string> GetSections() const;

    std::vector<std::string> GetKeys(const std::string& section = "") const;

    /// Register a known key; Validate() reports keys never registered
    void AllowKey(const std::string& key, const std::string& section = "");

    std::vector<std::string> Validate() const;

    // ========================================================================
    // Utilities
    // ========================================================================

    void Clear();

    size_t Size() const { return entries_.size(); }

    static std::string GetDefaultDataDir();

    static std::string ExpandEnvVars(const std::string& value);

    static std::string ExpandTilde(const std::string& path);

    /// Commented sample file listing every ledger option
    static std::string GenerateSampleConfig();

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseStream(std::istream& in, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    void Store(const std::string& key, const std::string& value,
               const std::string& section, const std::string& source,
               int lineNum, bool appendToList);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    static bool IsValidKey(const std::string& key, char* badChar);

    std::map<std::string, ConfigEntry> entries_;
    std::map<std::string, std::vector<std::string>> lists_;
    std::set<std::string> allowedKeys_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // Global
    constexpr const char* DATADIR = "datadir";
    constexpr const char* DB = "db";
    constexpr const char* DBCACHE = "dbcache";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* IDEMPOTENCYCACHE = "idempotencycache";

    // [pool] defaults for new pools
    constexpr const char* SECTION_POOL = "pool";
    constexpr const char* LOCKUP = "lockup";
    constexpr const char* MINSTAKE = "minstake";

    // [admin]
    constexpr const char* SECTION_ADMIN = "admin";
    constexpr const char* ACCOUNT = "account";
}

} // namespace util
} // namespace stakeledger

#endif // STAKELEDGER_UTIL_CONFIG_H
