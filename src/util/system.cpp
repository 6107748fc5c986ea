// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/system.h"

#include "logging.h"

#include <istream>
#include <stdlib.h>
#include <string.h>

#include <boost/algorithm/string/trim.hpp>

const char * const STAKEPOOL_CONF_FILENAME = "stakepool.conf";

ArgsManager gArgs;

static int atoi(const std::string& str)
{
    return ::atoi(str.c_str());
}

/** Interpret a string argument as a boolean ("" and anything but "0" are true) */
static bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (atoi(strValue) != 0);
}

bool ArgsManager::ParseParameters(int argc, const char* const argv[], std::string& error)
{
    LOCK(cs_args);
    m_command_line_args.clear();

    for (int i = 1; i < argc; i++) {
        std::string key(argv[i]);
        std::string val;
        size_t is_index = key.find('=');
        if (is_index != std::string::npos) {
            val = key.substr(is_index + 1);
            key.erase(is_index);
        }

        // Non-option arguments are not supported
        if (key.empty() || key[0] != '-') {
            error = strprintf("Invalid parameter %s", argv[i]);
            return false;
        }

        // Transform --foo to -foo
        if (key.length() > 1 && key[1] == '-')
            key.erase(0, 1);

        if (key.length() < 2) {
            error = strprintf("Invalid parameter %s", argv[i]);
            return false;
        }

        // Transform -nofoo to -foo=0
        if (key.compare(0, 3, "-no") == 0 && key.length() > 3) {
            key = "-" + key.substr(3);
            val = InterpretBool(val) ? "0" : "1";
        }

        m_command_line_args[key].push_back(val);
    }

    return true;
}

bool ArgsManager::ReadConfigStream(std::istream& stream, std::string& error)
{
    LOCK(cs_args);
    std::string str;
    int linenr = 1;
    while (std::getline(stream, str)) {
        size_t pos = str.find('#');
        if (pos != std::string::npos) {
            str = str.substr(0, pos);
        }
        boost::algorithm::trim(str);
        if (!str.empty()) {
            pos = str.find('=');
            if (pos == std::string::npos) {
                error = strprintf("parse error on line %i: %s", linenr, str);
                return false;
            }
            std::string name = str.substr(0, pos);
            std::string value = str.substr(pos + 1);
            boost::algorithm::trim(name);
            boost::algorithm::trim(value);
            if (name.empty()) {
                error = strprintf("parse error on line %i: empty option name", linenr);
                return false;
            }
            // Transform nofoo=1 to foo=0
            if (name.compare(0, 2, "no") == 0 && name.length() > 2) {
                name = name.substr(2);
                value = InterpretBool(value) ? "0" : "1";
            }
            m_config_args["-" + name].push_back(value);
        }
        ++linenr;
    }
    return true;
}

bool ArgsManager::ReadConfigFile(const std::string& conf_path, std::string& error)
{
    {
        LOCK(cs_args);
        m_config_args.clear();
    }

    fs::ifstream stream(GetConfigFile(conf_path));

    // ok to not have a config file
    if (!stream.good()) {
        return true;
    }
    if (!ReadConfigStream(stream, error)) {
        return false;
    }
    // datadir may have changed
    ClearDatadirCache();
    return true;
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    LOCK(cs_args);
    std::vector<std::string> result;
    auto it = m_command_line_args.find(strArg);
    if (it != m_command_line_args.end()) {
        result.insert(result.end(), it->second.begin(), it->second.end());
    }
    it = m_config_args.find(strArg);
    if (it != m_config_args.end()) {
        result.insert(result.end(), it->second.begin(), it->second.end());
    }
    return result;
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    LOCK(cs_args);
    return m_command_line_args.count(strArg) || m_config_args.count(strArg);
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    // Command line wins over the config file; the last occurrence wins within each
    LOCK(cs_args);
    auto it = m_command_line_args.find(strArg);
    if (it != m_command_line_args.end() && !it->second.empty()) {
        return it->second.back();
    }
    it = m_config_args.find(strArg);
    if (it != m_config_args.end() && !it->second.empty()) {
        return it->second.back();
    }
    return strDefault;
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    if (!IsArgSet(strArg)) return nDefault;
    return atoll(GetArg(strArg, std::string()).c_str());
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    if (!IsArgSet(strArg)) return fDefault;
    return InterpretBool(GetArg(strArg, std::string()));
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
    m_command_line_args[strArg] = {strValue};
    if (strArg == "-datadir" || strArg == "-network") {
        ClearDatadirCache();
    }
}

void ArgsManager::ClearArgs()
{
    LOCK(cs_args);
    m_command_line_args.clear();
    m_config_args.clear();
    ClearDatadirCache();
}

fs::path GetDefaultDataDir()
{
    // Unix: ~/.stakepool
    char* pszHome = getenv("HOME");
    fs::path pathRet;
    if (pszHome == nullptr || strlen(pszHome) == 0)
        pathRet = fs::path("/");
    else
        pathRet = fs::path(pszHome);
    return pathRet / ".stakepool";
}

static fs::path g_data_dir_cached;
static RecursiveMutex csPathCached;

const fs::path& GetDataDir()
{
    LOCK(csPathCached);

    fs::path& path = g_data_dir_cached;

    // This can be called during exceptions by LogPrintf(), so we cache the
    // value so we don't have to do memory allocations after that.
    if (!path.empty())
        return path;

    if (gArgs.IsArgSet("-datadir")) {
        path = fs::system_complete(gArgs.GetArg("-datadir", ""));
    } else {
        path = GetDefaultDataDir();
    }
    const std::string network = gArgs.GetArg("-network", "main");
    if (network != "main") {
        path /= network;
    }

    fs::create_directories(path);
    return path;
}

void ClearDatadirCache()
{
    LOCK(csPathCached);
    g_data_dir_cached = fs::path();
}

fs::path GetConfigFile(const std::string& confPath)
{
    fs::path pathConfigFile(confPath);
    if (!pathConfigFile.is_complete())
        pathConfigFile = GetDataDir() / pathConfigFile;

    return pathConfigFile;
}
