// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Server/client environment: argument handling, config file parsing,
 * logging.
 */
#ifndef XFACTORY_UTIL_H
#define XFACTORY_UTIL_H

#include <fs.h>
#include <sync.h>

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

// tinyformat asserts on malformed format strings unless told otherwise
#ifndef TINYFORMAT_ERROR
#define TINYFORMAT_ERROR(reason) throw std::runtime_error(reason)
#endif
#include <tinyformat.h>

static const bool DEFAULT_LOGTIMESTAMPS = true;
static const bool DEFAULT_PRINTTOCONSOLE = false;
extern const char * const DEFAULT_DEBUGLOGFILE;

namespace BCLog {

enum LogFlags : uint32_t {
    NONE        = 0,
    FACTORY     = (1 <<  0),
    CHAIN       = (1 <<  1),
    TOKEN       = (1 <<  2),
    CONFIG      = (1 <<  3),
    ALL         = ~(uint32_t)0,
};

class Logger
{
private:
    FILE* m_fileout = nullptr;
    std::mutex m_file_mutex;

    /**
     * m_started_new_line is a state variable that will suppress printing of
     * the timestamp when multiple calls are made that don't end in a
     * newline.
     */
    std::atomic_bool m_started_new_line{true};

    /** Log categories bitfield. */
    std::atomic<uint32_t> m_categories{0};

    std::string LogTimestampStr(const std::string& str);

public:
    bool m_print_to_console = false;
    bool m_print_to_file = false;
    bool m_log_timestamps = DEFAULT_LOGTIMESTAMPS;

    fs::path m_file_path;

    ~Logger();

    /** Send a string to the log output */
    void LogPrintStr(const std::string& str);

    /** Returns whether logs will be written to any output */
    bool Enabled() const { return m_print_to_console || m_print_to_file; }

    bool OpenDebugLog();
    void CloseDebugLog();

    uint32_t GetCategoryMask() const { return m_categories.load(); }

    void EnableCategory(LogFlags flag);
    bool EnableCategory(const std::string& str);
    void DisableCategory(LogFlags flag);
    bool DisableCategory(const std::string& str);

    bool WillLogCategory(LogFlags category) const;
};

} // namespace BCLog

extern BCLog::Logger* const g_logger;

/** Return true if log accepts specified category */
static inline bool LogAcceptCategory(BCLog::LogFlags category)
{
    return g_logger->WillLogCategory(category);
}

/** Returns a string with the log categories. */
std::string ListLogCategories();

/** Return true if str parses as a log category and set the flag */
bool GetLogCategory(BCLog::LogFlags& flag, const std::string& str);

#define strprintf tfm::format

template <typename... Args>
static inline void LogPrintf(const char* fmt, const Args&... args)
{
    if (g_logger->Enabled()) {
        std::string log_msg;
        try {
            log_msg = tfm::format(fmt, args...);
        } catch (const std::runtime_error& fmterr) {
            /* Original format string will have newline so don't add one here */
            log_msg = "Error \"" + std::string(fmterr.what()) + "\" while formatting log message: " + fmt;
        }
        g_logger->LogPrintStr(log_msg);
    }
}

#define LogPrint(category, ...) do { \
    if (LogAcceptCategory((category))) { \
        LogPrintf(__VA_ARGS__); \
    } \
} while(0)

class ArgsManager
{
protected:
    mutable CCriticalSection cs_args;
    std::map<std::string, std::string> mapArgs;
    std::map<std::string, std::vector<std::string>> mapMultiArgs;

public:
    /**
     * Parse "-name[=value]" arguments. A "-noname" argument is stored as
     * "-name=0". Returns false and sets error on a malformed argument.
     */
    bool ParseParameters(int argc, const char* const argv[], std::string& error);

    /**
     * Read "name=value" lines from a config file. Options already set on
     * the command line take precedence. A missing file is not an error.
     */
    bool ReadConfigFile(const std::string& confPath, std::string& error);

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

    void ClearArgs();

private:
    void AddArg(const std::string& key, const std::string& value);
};

extern ArgsManager gArgs;

/**
 * Format a string to be used as group of options in help messages
 */
std::string HelpMessageGroup(const std::string& message);

/**
 * Format a string to be used as option description in help messages
 */
std::string HelpMessageOpt(const std::string& option, const std::string& message);

#endif // XFACTORY_UTIL_H
