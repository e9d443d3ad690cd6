// FEEDROUTE - Configuration File Parser Implementation
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License

#include "feedroute/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace feedroute {
namespace util {

std::string ConfigParseResult::ToString() const {
    std::ostringstream oss;
    if (!errorFile.empty()) {
        oss << errorFile << ":";
        if (errorLine > 0) {
            oss << errorLine << ":";
        }
        oss << " ";
    }
    oss << errorMessage;
    return oss.str();
}

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
        std::string inner = str.substr(1, str.length() - 2);
        if (first == '\'') {
            return inner;
        }

        std::string unescaped;
        unescaped.reserve(inner.length());
        for (size_t i = 0; i < inner.length(); ++i) {
            if (inner[i] == '\\' && i + 1 < inner.length()) {
                switch (inner[i + 1]) {
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

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());

    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$' && i + 1 < value.length() && value[i + 1] == '{') {
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
        }
        result += value[i];
        ++i;
    }

    return result;
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

// ============================================================================
// Parsing
// ============================================================================

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, bool overwrite, std::string& currentSection,
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
        // Bare key is a flag
        key = trimmed;
        value = "true";
    } else {
        key = Trim(trimmed.substr(0, eqPos));
        value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    }

    if (!IsValidKey(key)) {
        result = ConfigParseResult::Error("Invalid key: '" + key + "'", source, lineNum);
        return false;
    }

    std::string fullKey = MakeKey(key, currentSection);
    auto it = entries_.find(fullKey);
    if (it != entries_.end() && !it->second.isDefault) {
        if (it->second.source == source) {
            // Repeated key within one source accumulates
            lists_[fullKey].push_back(value);
            return true;
        }
        if (!overwrite) {
            return true;
        }
        lists_.erase(fullKey);
    }

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = currentSection;
    entry.source = source;
    entry.lineNumber = lineNum;
    entry.isDefault = false;
    entries_[fullKey] = entry;
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& source,
                                             bool overwrite) {
    std::string currentSection;
    std::string line;
    std::string continuationLine;
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
            continuationLine += line.substr(0, line.length() - 1);
            continue;
        }

        if (!continuationLine.empty()) {
            line = continuationLine + line;
            continuationLine.clear();
        }

        if (!ParseLine(line, source, lineNum, overwrite, currentSection, result)) {
            return result;
        }
    }

    if (!continuationLine.empty()) {
        if (!ParseLine(continuationLine, source, lineNum, overwrite, currentSection, result)) {
            return result;
        }
    }

    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath, bool overwrite) {
    std::string expandedPath = ExpandEnvVars(filePath);

    std::ifstream file(expandedPath);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + expandedPath);
    }

    file.seekg(0, std::ios::end);
    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);

    if (fileSize > static_cast<std::streamoff>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            expandedPath);
    }

    return ParseStream(file, expandedPath, overwrite);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName,
                                             bool overwrite) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName, overwrite);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        // Options end at the first positional argument
        if (!positional_.empty() || arg.empty() || arg[0] != '-' || arg == "-") {
            positional_.push_back(arg);
            continue;
        }

        while (!arg.empty() && arg[0] == '-') {
            arg = arg.substr(1);
        }

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
        } else {
            key = arg;
            value = "true";
        }

        if (!IsValidKey(key)) {
            return ConfigParseResult::Error("Invalid option: '" + std::string(argv[i]) + "'",
                                            "<command-line>", i);
        }

        ConfigEntry entry;
        entry.key = key;
        entry.value = value;
        entry.source = "<command-line>";
        entry.lineNumber = i;
        entries_[key] = entry;
        lists_.erase(key);
    }

    return ConfigParseResult::Success();
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

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }

    try {
        size_t pos = 0;
        int64_t value = std::stoll(*str, &pos);
        if (!Trim(str->substr(pos)).empty()) {
            return std::nullopt;
        }
        return value;
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
    std::string fullKey = MakeKey(key, section);
    std::vector<std::string> raw;

    auto entryIt = entries_.find(fullKey);
    if (entryIt != entries_.end()) {
        raw.push_back(entryIt->second.value);
    }
    auto listIt = lists_.find(fullKey);
    if (listIt != lists_.end()) {
        raw.insert(raw.end(), listIt->second.begin(), listIt->second.end());
    }

    std::vector<std::string> result;
    for (const auto& value : raw) {
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

std::optional<ConfigEntry> ConfigManager::GetEntry(const std::string& key,
                                                   const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    std::string fullKey = MakeKey(key, section);

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<programmatic>";
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
// Utilities
// ============================================================================

void ConfigManager::Clear() {
    entries_.clear();
    lists_.clear();
    positional_.clear();
}

size_t ConfigManager::Size() const {
    return entries_.size();
}

} // namespace util
} // namespace feedroute
