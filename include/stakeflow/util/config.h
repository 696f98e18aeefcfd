// STAKEFLOW - Configuration File Parser
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License
//
// Parses INI-style configuration for the staking engine and simulator.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs, optionally grouped under [section] headers
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}
//
// Command-line arguments (-key=value or -section.key=value) take priority
// over anything read from files.

#ifndef STAKEFLOW_UTIL_CONFIG_H
#define STAKEFLOW_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stakeflow {
namespace util {

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "stakeflow.conf";

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
    std::string source;    // File path or "<command-line>"
    int lineNumber{0};
    bool isDefault{false};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorSource;
    int errorLine{0};
    std::vector<std::string> warnings;

    static ConfigParseResult Success() {
        ConfigParseResult r;
        r.success = true;
        return r;
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& source = "",
                                   int line = 0) {
        ConfigParseResult r;
        r.errorMessage = msg;
        r.errorSource = source;
        r.errorLine = line;
        return r;
    }

    /// "source:line: message"
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration read from files, strings and the command line.
 *
 * Priority order (highest to lowest):
 * 1. Command-line arguments
 * 2. Values read from files or strings (later reads replace earlier ones)
 * 3. Defaults registered with SetDefault()
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
     * Parse command-line arguments.
     *
     * Accepts -key=value, --key=value and bare -flag (true).
     * A dotted key (-staking.maxapr=500) targets a section. Arguments that
     * do not start with '-' are returned in positional order.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[],
                                       std::vector<std::string>* positional = nullptr);

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

    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    /// Unsigned value; nullopt if missing, negative or malformed
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    /// Entry with provenance, for error messages
    std::optional<ConfigEntry> GetEntry(const std::string& key,
                                        const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Introspection
    // ========================================================================

    std::vector<std::string> GetSections() const;
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    void Clear();
    size_t Size() const;

    /// Dump all configuration as INI text
    std::string Dump() const;

    /// Expand ${VAR} references from the environment
    static std::string ExpandEnvVars(const std::string& value);

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseStream(std::istream& in, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    const ConfigEntry* Find(const std::string& key, const std::string& section) const;

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    static bool IsValidKey(const std::string& key);

    std::map<std::string, ConfigEntry> entries_;
    std::map<std::string, ConfigEntry> commandLine_;
};

} // namespace util
} // namespace stakeflow

#endif // STAKEFLOW_UTIL_CONFIG_H
