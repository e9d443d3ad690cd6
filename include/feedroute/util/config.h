// FEEDROUTE - Configuration File Parser
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License
//
// Parses INI-style configuration files and command-line options.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}
// - A repeated key accumulates into a list

#ifndef FEEDROUTE_UTIL_CONFIG_H
#define FEEDROUTE_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace feedroute {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "feedroute.conf";

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
    std::string source;    // File path, "<command-line>", ...
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

    /// "file:line: message" (location parts omitted when unknown)
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration from files and command-line arguments.
 *
 * Command-line values always overwrite file values; files parsed later
 * overwrite earlier ones only when `overwrite` is set.
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // ========================================================================
    // Parsing
    // ========================================================================

    ConfigParseResult ParseFile(const std::string& filePath, bool overwrite = false);

    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>",
                                  bool overwrite = false);

    /**
     * Parse command-line arguments of the form -key=value, -flag and
     * -noflag. The first argument not starting with '-' and everything
     * after it are kept as positional arguments in order.
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

    /// Integer value; nullopt if missing or not a whole number
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

    /// All values of a key: repeated entries and comma-separated items
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    /// Entry metadata (source, line) for diagnostics
    std::optional<ConfigEntry> GetEntry(const std::string& key,
                                        const std::string& section = "") const;

    /// Positional command-line arguments
    const std::vector<std::string>& GetPositionalArgs() const { return positional_; }

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set a value only if the key is not present yet
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Utilities
    // ========================================================================

    void Clear();
    size_t Size() const;

    static std::string ExpandEnvVars(const std::string& value);
    static std::optional<bool> ParseBool(const std::string& str);

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseStream(std::istream& in, const std::string& source, bool overwrite);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   bool overwrite, std::string& currentSection, ConfigParseResult& result);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static bool IsValidKey(const std::string& key);

    std::map<std::string, ConfigEntry> entries_;
    std::map<std::string, std::vector<std::string>> lists_;
    std::vector<std::string> positional_;
};

} // namespace util
} // namespace feedroute

#endif // FEEDROUTE_UTIL_CONFIG_H
