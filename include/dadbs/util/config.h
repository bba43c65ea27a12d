// DADBS - Configuration File Parser
// Copyright (c) 2024 DADBS Developers
// MIT License
//
// Parses INI-style configuration files and command-line overrides.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs, optionally grouped under [section] headers
// - Values can be quoted: key="value with spaces"
// - A bare key is a boolean flag; "nokey" negates it
// - Repeating a key collects a list (e.g. several bootstrapnode lines)
// - Environment variable expansion: ${VAR_NAME}
//
// Command-line arguments use -key=value (or -section.key=value) and replace
// any value read from a file.

#ifndef DADBS_UTIL_CONFIG_H
#define DADBS_UTIL_CONFIG_H

#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dadbs {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default config file name inside the data directory
constexpr const char* DEFAULT_CONFIG_FILENAME = "dadbs.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

/**
 * All values recorded for one key. Scalars read the last value; lists read
 * every value in definition order.
 */
struct ConfigEntry {
    std::string key;
    std::string section;   // Empty for global section
    std::vector<std::string> values;
    std::string source;    // File path or <command-line>
    int lineNumber{0};
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

class ConfigManager {
public:
    ConfigManager() = default;

    // ========================================================================
    // Parsing
    // ========================================================================

    /// Parse a configuration file
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Parse configuration text; sourceName is used in error messages
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /// Parse -key=value arguments; these replace file values
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    bool HasSection(const std::string& section) const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Decimal integer; nullopt if missing or not entirely numeric
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;

    /// true/false, yes/no, on/off, 1/0
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    /// Every value of a repeated key (comma-separated values are split)
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    /// String value with ~ and ${VAR} expanded
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    /// Replace all values of a key
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Append a value to a key
    void AddToList(const std::string& key, const std::string& value,
                   const std::string& section = "");

    // ========================================================================
    // Inspection
    // ========================================================================

    std::vector<std::string> GetSections() const;

    std::vector<std::string> GetKeys(const std::string& section = "") const;

    /// Entry for a key, if present
    std::optional<ConfigEntry> GetEntry(const std::string& key,
                                        const std::string& section = "") const;

    void Clear();

    size_t Size() const { return entries_.size(); }

    /// Render as INI text (global keys first, then one block per section)
    std::string ToIniString() const;

    // ========================================================================
    // Helpers
    // ========================================================================

    static std::string ExpandEnvVars(const std::string& value);

    static std::string ExpandTilde(const std::string& path);

    static std::optional<bool> ParseBool(const std::string& str);

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseStream(std::istream& in, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    void Record(const std::string& key, const std::string& section,
                const std::string& value, const std::string& source, int lineNum);

    static std::string Trim(const std::string& str);

    static std::string Unquote(const std::string& str);

    static bool IsValidKey(const std::string& key);

    std::map<std::string, ConfigEntry> entries_;
    std::vector<std::string> sections_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // Command line
    constexpr const char* CONF = "conf";
    constexpr const char* DATADIR = "datadir";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* DERIVE = "derive";

    // Node
    constexpr const char* NODEID = "nodeid";
    constexpr const char* HOST = "host";
    constexpr const char* PORT = "port";
    constexpr const char* STORAGEPATH = "storagepath";
    constexpr const char* MAXCONNECTIONS = "maxconnections";
    constexpr const char* CONSENSUSTIMEOUT = "consensustimeout";
    constexpr const char* VALIDATORTHREADS = "validatorthreads";
    constexpr const char* BOOTSTRAPNODE = "bootstrapnode";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";

    // [llm] section
    constexpr const char* LLM_SECTION = "llm";
    constexpr const char* LLM_ENABLED = "enabled";
    constexpr const char* LLM_MODELPATH = "modelpath";
    constexpr const char* LLM_TOKENIZERPATH = "tokenizerpath";
    constexpr const char* LLM_MAXBATCHSIZE = "maxbatchsize";
    constexpr const char* LLM_USEGPU = "usegpu";
}

} // namespace util
} // namespace dadbs

#endif // DADBS_UTIL_CONFIG_H
