// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Server/client environment: argument handling, config file parsing,
 * string parsing helpers.
 */
#ifndef CALLGUARD_UTIL_H
#define CALLGUARD_UTIL_H

#include <logging.h>
#include <sync.h>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>

static const char* const CALLGUARD_CONF_FILENAME = "callguard.conf";

class ArgsManager
{
protected:
    mutable CCriticalSection cs_args;
    std::map<std::string, std::string> mapArgs;
    std::map<std::string, std::vector<std::string>> mapMultiArgs;

public:
    /**
     * Parse "-name=value" pairs; a bare "-name" means "-name=1" and
     * "-noname" means "-name=0". Parsing stops at the first non-dash
     * argument.
     */
    void ParseParameters(int argc, const char* const argv[]);

    /**
     * Read "key=value" lines from a config file. Values already set on the
     * command line win for single-valued lookups; multi-valued lookups see
     * both. Throws std::runtime_error when the file cannot be opened.
     */
    void ReadConfigFile(const std::string& confPath);

    /**
     * Return a vector of strings of the given argument
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return command-line arguments
     */
    std::vector<std::string> GetArgs(const std::string& strArg) const;

    /**
     * Return true if the given argument has been manually set
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return true if the argument has been set
     */
    bool IsArgSet(const std::string& strArg) const;

    /**
     * Return string argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param strDefault (e.g. "1")
     * @return command-line argument or default value
     */
    std::string GetArg(const std::string& strArg, const std::string& strDefault) const;

    /**
     * Return integer argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param nDefault (e.g. 1)
     * @return command-line argument (0 if invalid number) or default value
     */
    int64_t GetArg(const std::string& strArg, int64_t nDefault) const;

    /**
     * Return boolean argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param fDefault (true or false)
     * @return command-line argument or default value
     */
    bool GetBoolArg(const std::string& strArg, bool fDefault) const;

    /**
     * Set an argument if it doesn't already have a value
     *
     * @param strArg Argument to set (e.g. "-foo")
     * @param strValue Value (e.g. "1")
     * @return true if argument gets set, false if it already had a value
     */
    bool SoftSetArg(const std::string& strArg, const std::string& strValue);

    /**
     * Set a boolean argument if it doesn't already have a value
     *
     * @param strArg Argument to set (e.g. "-foo")
     * @param fValue Value (e.g. false)
     * @return true if argument gets set, false if it already had a value
     */
    bool SoftSetBoolArg(const std::string& strArg, bool fValue);

    // Forces an arg setting. Called by SoftSetArg() if the arg hasn't already
    // been set. Also called directly in testing.
    void ForceSetArg(const std::string& strArg, const std::string& strValue);

    // Appends a value to a multi-valued argument. Used in testing.
    void ForceSetMultiArg(const std::string& strArg, const std::string& strValue);

    // Drop every parsed argument.
    void ClearArgs();
};

extern ArgsManager gArgs;

/**
 * Format a string to be used as group of options in help messages
 *
 * @param message Group name (e.g. "Circuit breaker options:")
 * @return the formatted string
 */
std::string HelpMessageGroup(const std::string& message);

/**
 * Format a string to be used as option description in help messages
 *
 * @param option Option message (e.g. "-recoverytimeout=<n>")
 * @param message Option description (e.g. "Seconds an open breaker waits")
 * @return the formatted string
 */
std::string HelpMessageOpt(const std::string& option, const std::string& message);

boost::filesystem::path GetConfigFile(const std::string& confPath);

bool ParseInt64(const std::string& str, int64_t* out);
bool ParseDouble(const std::string& str, double* out);

/** Split on a single delimiter character, keeping empty fields. */
std::vector<std::string> SplitString(const std::string& str, char delimiter);

std::string TrimString(const std::string& str);

#endif // CALLGUARD_UTIL_H
