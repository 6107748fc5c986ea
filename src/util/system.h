// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Server/client environment: argument handling, config file parsing,
 * data directory.
 */
#ifndef STAKEPOOL_UTIL_SYSTEM_H
#define STAKEPOOL_UTIL_SYSTEM_H

#include "fs.h"
#include "sync.h"

#include <map>
#include <stdint.h>
#include <string>
#include <vector>

extern const char * const STAKEPOOL_CONF_FILENAME;

fs::path GetDefaultDataDir();
/** Return the configured data directory, honouring -datadir and -network */
const fs::path& GetDataDir();
void ClearDatadirCache();
fs::path GetConfigFile(const std::string& confPath);

class ArgsManager
{
protected:
    mutable RecursiveMutex cs_args;
    std::map<std::string, std::vector<std::string>> m_command_line_args;
    std::map<std::string, std::vector<std::string>> m_config_args;

public:
    /**
     * Parse "-name=value" style arguments. Returns false and fills error on
     * a malformed argument.
     */
    bool ParseParameters(int argc, const char* const argv[], std::string& error);

    /**
     * Read "name=value" lines from the config file. A missing file is not an
     * error; a malformed line is.
     */
    bool ReadConfigFile(const std::string& conf_path, std::string& error);

    /** Read config lines from an already-open stream (exposed for tests) */
    bool ReadConfigStream(std::istream& stream, std::string& error);

    /**
     * Return a vector of strings of the given argument
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return command-line arguments first, then config file values
     */
    std::vector<std::string> GetArgs(const std::string& strArg) const;

    /**
     * Return true if the given argument has been manually set
     */
    bool IsArgSet(const std::string& strArg) const;

    /**
     * Return string argument or default value
     */
    std::string GetArg(const std::string& strArg, const std::string& strDefault) const;

    /**
     * Return integer argument or default value
     */
    int64_t GetArg(const std::string& strArg, int64_t nDefault) const;

    /**
     * Return boolean argument or default value
     */
    bool GetBoolArg(const std::string& strArg, bool fDefault) const;

    /**
     * Set an argument if it doesn't already have a value
     */
    bool SoftSetArg(const std::string& strArg, const std::string& strValue);

    /** Forces an arg setting. Called by tests. */
    void ForceSetArg(const std::string& strArg, const std::string& strValue);

    /** Drop every parsed argument. Called by tests. */
    void ClearArgs();
};

extern ArgsManager gArgs;

#endif // STAKEPOOL_UTIL_SYSTEM_H
