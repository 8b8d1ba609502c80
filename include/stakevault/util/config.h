// STAKEVAULT - Configuration File Parser
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// Settings come from three places, highest priority first: command-line
// options, the config file, and the defaults each caller passes to Get*.
//
// File syntax is INI-like:
//   # or ; starts a comment        [section] opens a section
//   key=value, key="quoted\tvalue"  a bare key is a flag, "nokey" clears it
//   trailing \ joins the next line  ${VAR} and $VAR expand from the environment
//   include <path> reads another file in place

#ifndef STAKEVAULT_UTIL_CONFIG_H
#define STAKEVAULT_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stakevault {
namespace util {

/// Data directory name under $HOME
constexpr const char* DEFAULT_DATADIR_NAME = ".stakevault";

/// Config file name inside the data directory
constexpr const char* DEFAULT_CONFIG_FILENAME = "stakevault.conf";

constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;
constexpr size_t MAX_LINE_LENGTH = 4096;
constexpr int MAX_INCLUDE_DEPTH = 10;

/// One stored setting and where it came from
struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;
    std::string source;
    int lineNumber{0};
};

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

    /**
     * Parse a configuration file. Keys already set by another source are
     * kept unless overwrite is true.
     */
    ConfigParseResult ParseFile(const std::string& filePath, bool overwrite = false);

    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>",
                                  bool overwrite = false);

    /**
     * Parse command-line arguments.
     *
     * Options take the form -key=value (or --key=value); a bare -key is a
     * boolean flag and -nokey negates it. Every argument that does not start
     * with '-' is kept, in order, as a positional argument.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    const std::vector<std::string>& GetPositionalArgs() const { return positional_; }

    /**
     * Load the config file for a data directory. Uses the "conf" key when set,
     * otherwise <dataDir>/stakevault.conf. A missing default file is not an
     * error; a missing explicit file is.
     */
    ConfigParseResult LoadConfigFile(const std::string& dataDir = "");

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// nullopt unless the whole (trimmed) value is a base-10 int64
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    int64_t GetInt(const std::string& key,
                   int64_t defaultValue,
                   const std::string& section = "") const;

    /// Accepts true/false, yes/no, on/off, 1/0 in any case
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;

    /// String value with ~ and environment variables expanded
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    void Clear();
    size_t Size() const { return entries_.size(); }

    /// "datadir" key, or $HOME/.stakevault
    std::string GetDataDir() const;
    static std::string GetDefaultDataDir();

    static std::string ExpandEnvVars(const std::string& value);

    /// Expands a leading "~" or "~/" only
    static std::string ExpandTilde(const std::string& path);

    /// Commented-out stakevault.conf listing every key
    static std::string GenerateSampleConfig();

private:
    ConfigParseResult ParseStream(std::istream& in, const std::string& source,
                                  bool overwrite);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   bool overwrite, std::string& section, ConfigParseResult& result);

    void Store(ConfigEntry entry, bool overwrite);

    /// "section:key", or "key" in the global section
    static std::string MakeKey(const std::string& key, const std::string& section);

    std::map<std::string, ConfigEntry> entries_;
    std::vector<std::string> positional_;
    int includeDepth_{0};
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // General
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* DEBUG = "debug";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* LOGCATEGORIES = "logcategories";
    constexpr const char* HELP = "help";
    constexpr const char* VERSION = "version";
    constexpr const char* SAMPLECONFIG = "sampleconfig";

    // Vault initialization
    constexpr const char* COLLECTION = "collection";
    constexpr const char* REWARDTOKEN = "rewardtoken";
    constexpr const char* REWARDPERBLOCK = "rewardperblock";
    constexpr const char* EARLYEXITTAX = "earlyexittax";
    constexpr const char* STAKELIMIT = "stakelimit";
    constexpr const char* CARRYAMOUNT = "carryamount";
    constexpr const char* STAKINGHOURS = "stakinghours";
    constexpr const char* UNBONDINGHOURS = "unbondinghours";
    constexpr const char* BLOCKTIME = "blocktime";

    // CLI
    constexpr const char* FROM = "from";
}

} // namespace util
} // namespace stakevault

#endif // STAKEVAULT_UTIL_CONFIG_H
