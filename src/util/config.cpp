// StakeLedger - Configuration File Parser Implementation
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include "stakeledger/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

#include <pwd.h>
#include <unistd.h>

namespace stakeledger {
namespace util {

std::string ConfigParseResult::ToString() const {
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
    if (first == '\'' && last == '\'') {
        return str.substr(1, str.length() - 2);
    }
    if (first != '"' || last != '"') {
        return str;
    }

    // Double quotes honour \n \t \\ \" escapes
    std::string inner = str.substr(1, str.length() - 2);
    std::string out;
    out.reserve(inner.length());
    for (size_t i = 0; i < inner.length(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.length()) {
            char next = inner[i + 1];
            switch (next) {
                case 'n': out += '\n'; ++i; continue;
                case 't': out += '\t'; ++i; continue;
                case '\\': out += '\\'; ++i; continue;
                case '"': out += '"'; ++i; continue;
                default: break;
            }
        }
        out += inner[i];
    }
    return out;
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

bool ConfigManager::IsValidKey(const std::string& key, char* badChar) {
    if (key.empty()) {
        return false;
    }
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            if (badChar) *badChar = c;
            return false;
        }
    }
    return true;
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());

    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$' && i + 1 < value.length() && value[i + 1] == '{') {
            size_t end = value.find('}', i + 2);
            if (end != std::string::npos) {
                std::string varName = value.substr(i + 2, end - i - 2);
                if (const char* env = std::getenv(varName.c_str())) {
                    result += env;
                }
                i = end + 1;
                continue;
            }
        }
        result += value[i];
        ++i;
    }
    return result;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.length() > 1 && path[1] != '/') {
        return path;  // ~user is not expanded
    }

    std::string home;
    if (const char* homeEnv = std::getenv("HOME")) {
        home = homeEnv;
    } else if (struct passwd* pw = getpwuid(getuid())) {
        home = pw->pw_dir;
    }
    return home.empty() ? path : home + path.substr(1);
}

std::string ConfigManager::GetDefaultDataDir() {
    const char* home = std::getenv("HOME");
    if (!home) {
        return DEFAULT_DATADIR_NAME;
    }
    return std::string(home) + "/" + DEFAULT_DATADIR_NAME;
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

void ConfigManager::Store(const std::string& key, const std::string& value,
                          const std::string& section, const std::string& source,
                          int lineNum, bool appendToList) {
    std::string fullKey = MakeKey(key, section);

    auto it = entries_.find(fullKey);
    if (it != entries_.end() && it->second.source == "<command-line>" &&
        source != "<command-line>" && source != "<programmatic>") {
        return;
    }
    bool replaceList = !appendToList || it == entries_.end() || it->second.isDefault;

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = source;
    entry.lineNumber = lineNum;
    entry.isDefault = false;
    entries_[fullKey] = entry;

    if (replaceList) {
        lists_[fullKey] = {value};
    } else {
        lists_[fullKey].push_back(value);
    }
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
        return true;
    }

    std::string key;
    std::string value;
    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        // Bare flag: "key" means true, "nokey" means false
        key = trimmed;
        value = "true";
        if (key.length() > 2 && key.compare(0, 2, "no") == 0 &&
            std::islower(static_cast<unsigned char>(key[2]))) {
            key = key.substr(2);
            value = "false";
        }
    } else {
        key = Trim(trimmed.substr(0, eqPos));
        value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    }

    char bad = 0;
    if (!IsValidKey(key, &bad)) {
        result = ConfigParseResult::Error(
            key.empty() ? "Empty key" : "Invalid character in key: " + std::string(1, bad),
            source, lineNum);
        return false;
    }

    Store(key, value, currentSection, source, lineNum, true);
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& source) {
    std::string currentSection;
    std::string line;
    std::string continuation;
    int lineNum = 0;

    ConfigParseResult result = ConfigParseResult::Success();

    while (std::getline(in, line)) {
        ++lineNum;

        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                source, lineNum);
        }

        if (!line.empty() && line.back() == '\\') {
            continuation += line.substr(0, line.length() - 1);
            continue;
        }
        if (!continuation.empty()) {
            line = continuation + line;
            continuation.clear();
        }

        if (!ParseLine(line, source, lineNum, currentSection, result)) {
            return result;
        }
    }

    if (!continuation.empty() &&
        !ParseLine(continuation, source, lineNum, currentSection, result)) {
        return result;
    }

    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string path = ExpandEnvVars(ExpandTilde(filePath));

    std::ifstream file(path);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + path);
    }

    file.seekg(0, std::ios::end);
    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);
    if (fileSize > static_cast<std::streampos>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            path);
    }

    return ParseStream(file, path);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.empty() || arg[0] != '-') {
            continue;
        }

        size_t start = arg.find_first_not_of('-');
        if (start == std::string::npos) {
            continue;
        }
        arg = arg.substr(start);

        std::string key;
        std::string value;
        size_t eqPos = arg.find('=');
        if (eqPos != std::string::npos) {
            key = arg.substr(0, eqPos);
            value = arg.substr(eqPos + 1);
        } else if (arg.length() > 2 && arg.compare(0, 2, "no") == 0 &&
                   std::islower(static_cast<unsigned char>(arg[2]))) {
            key = arg.substr(2);
            value = "false";
        } else if (i + 1 < argc && argv[i + 1][0] != '-') {
            key = arg;
            value = argv[++i];
        } else {
            key = arg;
            value = "true";
        }

        std::string section;
        size_t dot = key.find('.');
        if (dot != std::string::npos) {
            section = key.substr(0, dot);
            key = key.substr(dot + 1);
        }

        char bad = 0;
        if (!IsValidKey(key, &bad)) {
            return ConfigParseResult::Error("Invalid command-line option: " + std::string(argv[i]),
                                            "<command-line>");
        }

        Store(key, value, section, "<command-line>", 0, false);
    }

    return ConfigParseResult::Success();
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
    return it->second.value;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }

    int64_t value = 0;
    size_t pos = 0;
    try {
        value = std::stoll(*str, &pos);
    } catch (const std::exception&) {
        return std::nullopt;
    }

    std::string suffix = Trim(str->substr(pos));
    if (suffix.empty()) {
        return value;
    }
    if (suffix.length() != 1) {
        return std::nullopt;
    }

    int64_t multiplier = 1;
    switch (std::tolower(static_cast<unsigned char>(suffix[0]))) {
        case 'k': multiplier = 1024; break;
        case 'm': multiplier = 1024 * 1024; break;
        case 'g': multiplier = 1024LL * 1024 * 1024; break;
        default: return std::nullopt;
    }

    int64_t scaled = 0;
    if (__builtin_mul_overflow(value, multiplier, &scaled)) {
        return std::nullopt;
    }
    return scaled;
}

int64_t ConfigManager::GetInt(const std::string& key,
                              int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }
    return ParseBool(*str);
}

bool ConfigManager::GetBool(const std::string& key,
                            bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::vector<std::string> ConfigManager::GetList(const std::string& key,
                                                const std::string& section) const {
    std::vector<std::string> result;
    auto it = lists_.find(MakeKey(key, section));
    if (it == lists_.end()) {
        return result;
    }

    for (const auto& value : it->second) {
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

std::string ConfigManager::GetPath(const std::string& key,
                                   const std::string& defaultValue,
                                   const std::string& section) const {
    return ExpandEnvVars(ExpandTilde(GetString(key, defaultValue, section)));
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    Store(key, value, section, "<programmatic>", 0, false);
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    std::string fullKey = MakeKey(key, section);
    if (entries_.count(fullKey) > 0) {
        return;
    }

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<default>";
    entry.isDefault = true;
    entries_[fullKey] = entry;
    lists_[fullKey] = {value};
}

// ============================================================================
// Sections / Validation
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

void ConfigManager::AllowKey(const std::string& key, const std::string& section) {
    allowedKeys_.insert(MakeKey(key, section));
}

std::vector<std::string> ConfigManager::Validate() const {
    std::vector<std::string> errors;
    if (allowedKeys_.empty()) {
        return errors;
    }
    for (const auto& [fullKey, entry] : entries_) {
        if (allowedKeys_.count(fullKey) == 0) {
            errors.push_back("Unknown key: " + fullKey + " (defined in " + entry.source + ")");
        }
    }
    return errors;
}

// ============================================================================
// Utilities
// ============================================================================

void ConfigManager::Clear() {
    entries_.clear();
    lists_.clear();
    allowedKeys_.clear();
}

std::string ConfigManager::GenerateSampleConfig() {
    std::ostringstream oss;

    oss << "# StakeLedger configuration\n\n";

    oss << "# Data directory (default: ~/" << DEFAULT_DATADIR_NAME << ")\n";
    oss << "#datadir=~/" << DEFAULT_DATADIR_NAME << "\n\n";

    oss << "# Storage backend: leveldb or memory\n";
    oss << "#db=leveldb\n\n";

    oss << "# Storage cache size (k/m/g suffixes allowed)\n";
    oss << "#dbcache=8m\n\n";

    oss << "# trace, debug, info, warn, error, off\n";
    oss << "#loglevel=info\n";
    oss << "#logfile=ledger.log\n";
    oss << "#printtoconsole=1\n\n";

    oss << "# Number of idempotency keys remembered by the service\n";
    oss << "#idempotencycache=10000\n\n";

    oss << "[pool]\n";
    oss << "# Defaults applied to pools created without explicit limits\n";
    oss << "#lockup=0\n";
    oss << "#minstake=1\n\n";

    oss << "[admin]\n";
    oss << "# Hex account ids granted the pool-admin role (repeatable)\n";
    oss << "#account=0000000000000000000000000000000000000000\n";

    return oss.str();
}

} // namespace util
} // namespace stakeledger
