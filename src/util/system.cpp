// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2018 The Bitcoin Core developers
// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/system.h"

#include "utilstrencodings.h"

#include <istream>
#include <stdlib.h>
#include <string.h>

const char * const LINKEDTOKEN_CONF_FILENAME = "linkedtoken.conf";

ArgsManager gArgs;

namespace {

/** Interpret a string argument as a boolean: empty means true, otherwise a number. */
bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (atoi(strValue) != 0);
}

/** Turn -noX into -X=0 */
void InterpretNegatedOption(std::string& key, std::string& val)
{
    if (key.substr(0, 3) == "-no") {
        bool bool_val = InterpretBool(val);
        key.erase(1, 2);
        if (!bool_val) {
            LogPrintf("Warning: parsed potentially confusing double-negative %s=%s\n", key, val);
            val = "1";
        } else {
            val = "0";
        }
    }
}

} // anonymous namespace

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

        // Stop at the first positional argument
        if (key[0] != '-')
            break;

        // Transform --foo to -foo
        if (key.length() > 1 && key[1] == '-')
            key.erase(0, 1);

        if (key.length() < 2) {
            error = strprintf("Invalid parameter %s", argv[i]);
            return false;
        }

        InterpretNegatedOption(key, val);
        m_override_args[key].push_back(val);
    }

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

bool ArgsManager::IsArgNegated(const std::string& strArg) const
{
    const std::vector<std::string> values = GetArgs(strArg);
    return !values.empty() && values.back() == "0";
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    const std::vector<std::string> values = GetArgs(strArg);
    if (values.empty()) return strDefault;
    return values.back();
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    const std::vector<std::string> values = GetArgs(strArg);
    if (values.empty()) return nDefault;
    return atoi64(values.back());
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

bool ArgsManager::SoftSetBoolArg(const std::string& strArg, bool fValue)
{
    if (fValue)
        return SoftSetArg(strArg, std::string("1"));
    else
        return SoftSetArg(strArg, std::string("0"));
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

bool ArgsManager::ReadConfigStream(std::istream& stream, std::string& error)
{
    LOCK(cs_args);
    std::string str;
    int linenr = 1;
    while (std::getline(stream, str)) {
        std::string::size_type pos;
        if ((pos = str.find('#')) != std::string::npos) {
            str = str.substr(0, pos);
        }
        const static std::string pattern = " \t\r\n";
        str = TrimString(str, pattern);
        if (!str.empty()) {
            if ((pos = str.find('=')) != std::string::npos) {
                std::string name = "-" + TrimString(str.substr(0, pos), pattern);
                std::string value = TrimString(str.substr(pos + 1), pattern);
                InterpretNegatedOption(name, value);
                m_config_args[name].push_back(value);
            } else {
                error = strprintf("parse error on line %i: %s", linenr, str);
                return false;
            }
        }
        ++linenr;
    }
    return true;
}

bool ArgsManager::ReadConfigFile(const std::string& confPath, std::string& error)
{
    {
        LOCK(cs_args);
        m_config_args.clear();
    }

    fs::ifstream stream(GetConfigFile(confPath));

    // ok to not have a config file
    if (stream.good()) {
        if (!ReadConfigStream(stream, error)) {
            return false;
        }
    }

    // If datadir is changed in .conf file:
    ClearDatadirCache();
    if (!fs::is_directory(GetDataDir())) {
        error = strprintf("specified data directory \"%s\" does not exist.", gArgs.GetArg("-datadir", "").c_str());
        return false;
    }
    return true;
}

fs::path GetDefaultDataDir()
{
    // Unix: ~/.linkedtoken
    fs::path pathRet;
    char* pszHome = getenv("HOME");
    if (pszHome == nullptr || strlen(pszHome) == 0)
        pathRet = fs::path("/");
    else
        pathRet = fs::path(pszHome);
    return pathRet / ".linkedtoken";
}

static fs::path g_datadir_path_cached;
static RecursiveMutex csPathCached;

const fs::path& GetDataDir()
{
    LOCK(csPathCached);

    fs::path& path = g_datadir_path_cached;

    // This can be called during exceptions by LogPrintf(), so we cache the
    // value so we don't have to do memory allocations after that.
    if (!path.empty())
        return path;

    if (gArgs.IsArgSet("-datadir")) {
        path = fs::absolute(gArgs.GetArg("-datadir", ""));
        if (!fs::is_directory(path)) {
            path = "";
            return path;
        }
    } else {
        path = GetDefaultDataDir();
    }

    fs::create_directories(path);

    return path;
}

void ClearDatadirCache()
{
    LOCK(csPathCached);
    g_datadir_path_cached = fs::path();
}

fs::path GetConfigFile(const std::string& confPath)
{
    fs::path pathConfigFile(confPath);
    if (!pathConfigFile.is_absolute())
        pathConfigFile = GetDataDir() / pathConfigFile;

    return pathConfigFile;
}

bool TryCreateDirectories(const fs::path& p)
{
    try {
        return fs::create_directories(p);
    } catch (const fs::filesystem_error&) {
        if (!fs::exists(p) || !fs::is_directory(p))
            throw;
    }

    // create_directories didn't create the directory, it had to have existed already
    return false;
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
    return std::string(optIndent, ' ') + std::string(option) +
           std::string("\n") + std::string(msgIndent, ' ') +
           FormatParagraph(message, screenWidth - msgIndent, msgIndent) +
           std::string("\n\n");
}
