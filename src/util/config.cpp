// STAKEVAULT - Configuration File Parser Implementation
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include "stakevault/util/config.h"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <pwd.h>
#include <unistd.h>

namespace stakevault {
namespace util {

namespace {

const char* const WHITESPACE = " \t\r\n";

std::string Trim(const std::string& str) {
    size_t first = str.find_first_not_of(WHITESPACE);
    if (first == std::string::npos) {
        return "";
    }
    return str.substr(first, str.find_last_not_of(WHITESPACE) - first + 1);
}

std::string Lower(std::string str) {
    for (char& c : str) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return str;
}

std::optional<bool> ParseBool(const std::string& str) {
    static const char* const TRUE_WORDS[] = {"true", "yes", "on", "1"};
    static const char* const FALSE_WORDS[] = {"false", "no", "off", "0"};

    std::string word = Lower(str);
    for (const char* t : TRUE_WORDS) {
        if (word == t) return true;
    }
    for (const char* f : FALSE_WORDS) {
        if (word == f) return false;
    }
    return std::nullopt;
}

bool IsValidKey(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    for (unsigned char c : key) {
        if (!std::isalnum(c) && c != '_' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

/// "nokey" -> {key, "false"}, "key" -> {key, "true"}
ConfigEntry FlagEntry(const std::string& word) {
    ConfigEntry entry;
    bool negated = word.size() > 2 && word.compare(0, 2, "no") == 0 &&
                   std::islower(static_cast<unsigned char>(word[2]));
    entry.key = negated ? word.substr(2) : word;
    entry.value = negated ? "false" : "true";
    return entry;
}

/// Strips matching quotes; double quotes also understand \n \t \\ \"
std::string Unquote(const std::string& str) {
    if (str.size() < 2 || str.front() != str.back() ||
        (str.front() != '"' && str.front() != '\'')) {
        return str;
    }

    std::string inner = str.substr(1, str.size() - 2);
    if (str.front() == '\'') {
        return inner;
    }

    std::string out;
    for (size_t i = 0; i < inner.size(); ++i) {
        char c = inner[i];
        if (c == '\\' && i + 1 < inner.size()) {
            switch (inner[i + 1]) {
                case 'n':  c = '\n'; ++i; break;
                case 't':  c = '\t'; ++i; break;
                case '\\': c = '\\'; ++i; break;
                case '"':  c = '"';  ++i; break;
                default: break;
            }
        }
        out += c;
    }
    return out;
}

std::string HomeDir() {
    if (const char* home = std::getenv("HOME")) {
        return home;
    }
    if (struct passwd* pw = getpwuid(getuid())) {
        return pw->pw_dir;
    }
    return "";
}

} // namespace

// ============================================================================
// Expansion
// ============================================================================

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    auto isNameChar = [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    };
    auto lookup = [](const std::string& name) -> std::string {
        const char* env = std::getenv(name.c_str());
        return env ? env : "";
    };

    std::string out;
    size_t i = 0;
    while (i < value.size()) {
        if (value[i] != '$' || i + 1 == value.size()) {
            out += value[i++];
            continue;
        }

        if (value[i + 1] == '{') {
            size_t close = value.find('}', i + 2);
            if (close == std::string::npos) {
                out += value[i++];
                continue;
            }
            out += lookup(value.substr(i + 2, close - i - 2));
            i = close + 1;
            continue;
        }

        size_t end = i + 1;
        while (end < value.size() && isNameChar(value[end])) {
            ++end;
        }
        if (end == i + 1) {
            out += value[i++];
            continue;
        }
        out += lookup(value.substr(i + 1, end - i - 1));
        i = end;
    }
    return out;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    bool expandable = !path.empty() && path[0] == '~' &&
                      (path.size() == 1 || path[1] == '/');
    if (!expandable) {
        return path;
    }

    std::string home = HomeDir();
    return home.empty() ? path : home + path.substr(1);
}

std::string ConfigManager::GetDefaultDataDir() {
    const char* home = std::getenv("HOME");
    return home ? std::string(home) + "/" + DEFAULT_DATADIR_NAME : DEFAULT_DATADIR_NAME;
}

std::string ConfigManager::GetDataDir() const {
    std::string dir = GetString(ConfigKeys::DATADIR, "");
    return dir.empty() ? GetDefaultDataDir() : ExpandEnvVars(ExpandTilde(dir));
}

// ============================================================================
// Storage
// ============================================================================

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) {
    return section.empty() ? key : section + ":" + key;
}

void ConfigManager::Store(ConfigEntry entry, bool overwrite) {
    std::string fullKey = MakeKey(entry.key, entry.section);

    // A key already set by another source keeps its value
    auto it = entries_.find(fullKey);
    if (!overwrite && it != entries_.end() && it->second.source != entry.source) {
        return;
    }
    entries_[fullKey] = std::move(entry);
}

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<programmatic>";
    Store(std::move(entry), true);
}

void ConfigManager::Clear() {
    entries_.clear();
    positional_.clear();
    includeDepth_ = 0;
}

// ============================================================================
// Parsing
// ============================================================================

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, bool overwrite, std::string& section,
                              ConfigParseResult& result) {
    std::string text = Trim(line);
    if (text.empty() || text[0] == '#' || text[0] == ';') {
        return true;
    }

    if (text[0] == '[') {
        size_t close = text.find(']');
        if (close == std::string::npos) {
            result = ConfigParseResult::Error("Unterminated section header", source, lineNum);
            return false;
        }
        section = Trim(text.substr(1, close - 1));
        return true;
    }

    if (text.compare(0, 8, "include ") == 0) {
        if (includeDepth_ >= MAX_INCLUDE_DEPTH) {
            result = ConfigParseResult::Error("Includes nested too deeply", source, lineNum);
            return false;
        }
        ++includeDepth_;
        ConfigParseResult included = ParseFile(Unquote(Trim(text.substr(8))), overwrite);
        --includeDepth_;
        if (!included.success) {
            result = included;
            return false;
        }
        return true;
    }

    ConfigEntry entry;
    size_t eq = text.find('=');
    if (eq == std::string::npos) {
        entry = FlagEntry(text);
    } else {
        entry.key = Trim(text.substr(0, eq));
        entry.value = ExpandEnvVars(Unquote(Trim(text.substr(eq + 1))));
    }
    entry.section = section;
    entry.source = source;
    entry.lineNumber = lineNum;

    if (!IsValidKey(entry.key)) {
        result = ConfigParseResult::Error("Invalid key: '" + entry.key + "'", source, lineNum);
        return false;
    }
    Store(std::move(entry), overwrite);
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& source,
                                             bool overwrite) {
    ConfigParseResult result = ConfigParseResult::Success();
    std::string section;
    std::string pending;
    std::string line;
    int lineNum = 0;

    while (std::getline(in, line)) {
        ++lineNum;
        if (line.size() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line longer than " + std::to_string(MAX_LINE_LENGTH) + " characters",
                source, lineNum);
        }

        if (!line.empty() && line.back() == '\\') {
            pending += line.substr(0, line.size() - 1);
            continue;
        }
        pending += line;

        if (!ParseLine(pending, source, lineNum, overwrite, section, result)) {
            return result;
        }
        pending.clear();
    }

    // File ended on a continuation
    if (!pending.empty() &&
        !ParseLine(pending, source, lineNum, overwrite, section, result)) {
        return result;
    }
    return result;
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath, bool overwrite) {
    std::string path = ExpandEnvVars(ExpandTilde(filePath));

    std::ifstream file(path, std::ios::ate);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + path);
    }
    if (file.tellg() > static_cast<std::streamoff>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file larger than " + std::to_string(MAX_CONFIG_SIZE) + " bytes", path);
    }
    file.seekg(0);

    return ParseStream(file, path, overwrite);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName,
                                             bool overwrite) {
    std::istringstream in(content);
    return ParseStream(in, sourceName, overwrite);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    positional_.clear();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.size() < 2 || arg[0] != '-') {
            positional_.push_back(arg);
            continue;
        }

        std::string option = arg.substr(arg.compare(0, 2, "--") == 0 ? 2 : 1);
        ConfigEntry entry;
        size_t eq = option.find('=');
        if (eq == std::string::npos) {
            entry = FlagEntry(option);
        } else {
            entry.key = option.substr(0, eq);
            entry.value = option.substr(eq + 1);
        }
        entry.source = "<command-line>";

        if (!IsValidKey(entry.key)) {
            return ConfigParseResult::Error("Invalid option: " + arg, "<command-line>");
        }
        Store(std::move(entry), true);
    }

    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::LoadConfigFile(const std::string& dataDir) {
    if (auto conf = TryGetString(ConfigKeys::CONF)) {
        return ParseFile(*conf, false);
    }

    std::string path = (dataDir.empty() ? GetDataDir() : dataDir) + "/" +
                       DEFAULT_CONFIG_FILENAME;
    if (!std::ifstream(path).is_open()) {
        ConfigParseResult result = ConfigParseResult::Success();
        result.warnings.push_back("No config file at " + path + ", using defaults");
        return result;
    }
    return ParseFile(path, false);
}

// ============================================================================
// Lookup
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
    auto raw = TryGetString(key, section);
    if (!raw) {
        return std::nullopt;
    }

    std::string text = Trim(*raw);
    size_t used = 0;
    int64_t value = 0;
    try {
        value = std::stoll(text, &used);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    if (used != text.size()) {
        return std::nullopt;
    }
    return value;
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    auto raw = TryGetString(key, section);
    return raw ? ParseBool(Trim(*raw)) : std::nullopt;
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::string ConfigManager::GetPath(const std::string& key,
                                   const std::string& defaultValue,
                                   const std::string& section) const {
    return ExpandEnvVars(ExpandTilde(GetString(key, defaultValue, section)));
}

// ============================================================================
// Sample File
// ============================================================================

std::string ConfigManager::GenerateSampleConfig() {
    struct SampleKey {
        const char* comment;
        const char* line;
    };
    static const SampleKey KEYS[] = {
        {"Data directory", "#datadir=~/.stakevault"},
        {"Log level: trace, debug, info, warn, error, off", "#loglevel=info"},
        {"Log file (default: <datadir>/debug.log)", "#logfile=~/.stakevault/debug.log"},
        {"Only log these categories: staking, reward, registry, custody, db, config, cli",
         "#logcategories=staking,reward"},
        {"Collection and reward token identities (40 hex chars, read by 'init')",
         "#collection=\n#rewardtoken="},
        {"Reward per block, split between all active stakes (base units)",
         "#rewardperblock=100000000"},
        {"Fixed tax charged for an early exit (base units)", "#earlyexittax=50000000"},
        {"Maximum number of active stakes", "#stakelimit=1000"},
        {"Deposit taken at stake time and returned at withdrawal (base units)",
         "#carryamount=10000000"},
        {"Staking and unbonding periods in hours", "#stakinghours=720\n#unbondinghours=72"},
        {"Average block time in seconds", "#blocktime=12"},
        {"Default caller identity", "#from="},
    };

    std::ostringstream oss;
    oss << "# STAKEVAULT Configuration File\n";
    for (const auto& key : KEYS) {
        oss << "\n# " << key.comment << "\n" << key.line << "\n";
    }
    return oss.str();
}

} // namespace util
} // namespace stakevault
