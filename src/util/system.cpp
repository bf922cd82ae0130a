// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2018 The Bitcoin Core developers
// Copyright (c) 2026 The Agora Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.

#include "util/system.h"

#include <sstream>

const char * const AGORA_CONF_FILENAME = "agora.conf";

ArgsManager gArgs;

/** Interpret a string argument as a boolean. An empty string means true. */
static bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    int64_t n = 0;
    if (!ParseInt64(strValue, &n)) return false;
    return n != 0;
}

/** Turn -noX into -X=0 */
static void InterpretNegatedOption(std::string& key, std::string& val)
{
    if (key.substr(0, 3) == "-no") {
        bool bool_val = InterpretBool(val);
        key.erase(1, 2);
        val = bool_val ? "0" : "1";
    }
}

ArgsManager::ArgsManager() {}

bool ArgsManager::ParseParameters(int argc, const char* const argv[], std::string& error)
{
    LOCK(cs_args);
    m_override_args.clear();

    for (int i = 1; i < argc; i++) {
        std::string key(argv[i]);
        std::string val;
        size_t is_index = key.find('=');
        if (is_index != std::string::npos) {
            val = key.substr(is_index + 1);
            key.erase(is_index);
        }

        if (key.empty() || key[0] != '-') {
            error = strprintf("Invalid parameter %s", argv[i]);
            return false;
        }

        // Transform --foo to -foo
        if (key.length() > 1 && key[1] == '-')
            key = key.substr(1);

        InterpretNegatedOption(key, val);
        m_override_args[key].push_back(val.empty() ? "1" : val);
    }
    return true;
}

bool ArgsManager::ReadConfigStream(std::istream& stream, std::string& error)
{
    LOCK(cs_args);
    int linenumber = 1;
    for (std::string line; std::getline(stream, line); linenumber++) {
        size_t pos = line.find('#');
        if (pos != std::string::npos) {
            line = line.substr(0, pos);
        }
        line = TrimString(line);
        if (line.empty()) continue;

        pos = line.find('=');
        if (pos == std::string::npos) {
            error = strprintf("parse error on line %i: %s", linenumber, line);
            return false;
        }
        std::string key = "-" + TrimString(line.substr(0, pos));
        std::string val = TrimString(line.substr(pos + 1));
        if (key.size() < 2) {
            error = strprintf("parse error on line %i: empty option name", linenumber);
            return false;
        }
        InterpretNegatedOption(key, val);
        m_config_args[key].push_back(val);
    }
    return true;
}

bool ArgsManager::ReadConfigFile(const fs::path& path, std::string& error)
{
    {
        LOCK(cs_args);
        m_config_args.clear();
    }

    fsbridge::ifstream stream(path);
    if (!stream.good()) {
        // ok to not have a config file
        LogPrint(BCLog::CONFIG, "%s: no config file at %s\n", __func__, path.string());
        return true;
    }
    if (!ReadConfigStream(stream, error)) {
        error = strprintf("%s: %s", path.string(), error);
        return false;
    }
    LogPrint(BCLog::CONFIG, "%s: read %s\n", __func__, path.string());
    return true;
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    LOCK(cs_args);
    auto it = m_override_args.find(strArg);
    if (it != m_override_args.end()) return it->second;
    it = m_config_args.find(strArg);
    if (it != m_config_args.end()) return it->second;
    return {};
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    LOCK(cs_args);
    return m_override_args.count(strArg) || m_config_args.count(strArg);
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    const std::vector<std::string> values = GetArgs(strArg);
    // The last value given wins.
    if (values.empty()) return strDefault;
    return values.back();
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    const std::vector<std::string> values = GetArgs(strArg);
    if (values.empty()) return nDefault;
    int64_t n = 0;
    if (!ParseInt64(values.back(), &n)) return 0;
    return n;
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    const std::vector<std::string> values = GetArgs(strArg);
    if (values.empty()) return fDefault;
    return InterpretBool(values.back());
}

bool ArgsManager::SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    if (IsArgSet(strArg)) return false;
    ForceSetArg(strArg, strValue);
    return true;
}

void ArgsManager::ForceSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    m_override_args[strArg] = {strValue};
}

void ArgsManager::ClearArgs()
{
    LOCK(cs_args);
    m_override_args.clear();
    m_config_args.clear();
}

static const int screenWidth = 79;
static const int optIndent = 2;
static const int msgIndent = 7;

std::string HelpMessageGroup(const std::string& message)
{
    return std::string(message) + std::string("\n\n");
}

std::string HelpMessageOpt(const std::string& option, const std::string& message)
{
    std::ostringstream ret;
    ret << std::string(optIndent, ' ') << option << "\n";

    // Wrap the description at screenWidth on word boundaries
    std::istringstream words(message);
    std::string line = std::string(msgIndent, ' ');
    std::string word;
    bool fEmptyLine = true;
    while (words >> word) {
        if (!fEmptyLine && line.size() + 1 + word.size() > (size_t)screenWidth) {
            ret << line << "\n";
            line = std::string(msgIndent, ' ');
            fEmptyLine = true;
        }
        if (!fEmptyLine) line += ' ';
        line += word;
        fEmptyLine = false;
    }
    ret << line << "\n\n";
    return ret.str();
}

bool InitLogging(const ArgsManager& args, std::string& strError)
{
    g_logger->m_print_to_console = args.GetBoolArg("-printtoconsole", DEFAULT_PRINTTOCONSOLE);
    g_logger->m_log_timestamps = args.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);
    // -nodebuglogfile is stored as -debuglogfile=0
    g_logger->m_print_to_file = args.IsArgSet("-debuglogfile") && args.GetArg("-debuglogfile", "") != "0";

    for (const std::string& cat : args.GetArgs("-debug")) {
        if (!g_logger->EnableCategory(cat)) {
            strError = strprintf("Unsupported logging category -debug=%s. Valid categories: %s", cat, ListLogCategories());
            return false;
        }
    }
    for (const std::string& cat : args.GetArgs("-debugexclude")) {
        if (!g_logger->DisableCategory(cat)) {
            strError = strprintf("Unsupported logging category -debugexclude=%s. Valid categories: %s", cat, ListLogCategories());
            return false;
        }
    }

    if (g_logger->m_print_to_file) {
        g_logger->m_file_path = fs::absolute(args.GetArg("-debuglogfile", DEFAULT_DEBUGLOGFILE));
        if (!g_logger->OpenDebugLog()) {
            strError = strprintf("Could not open debug log file %s", g_logger->m_file_path.string());
            return false;
        }
    }
    return true;
}
