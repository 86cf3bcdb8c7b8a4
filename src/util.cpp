// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <util.h>

#include <utilstrencodings.h>

#include <algorithm>
#include <chrono>
#include <ctime>

const char * const DEFAULT_DEBUGLOGFILE = "debug.log";

/**
 * The Logger object is never destructed so that it remains usable from
 * static destructors of other translation units.
 */
BCLog::Logger* const g_logger = new BCLog::Logger();

ArgsManager gArgs;

struct CLogCategoryDesc
{
    BCLog::LogFlags flag;
    std::string category;
};

const CLogCategoryDesc LogCategories[] =
{
    {BCLog::NONE, "0"},
    {BCLog::NONE, "none"},
    {BCLog::FACTORY, "factory"},
    {BCLog::CHAIN, "chain"},
    {BCLog::TOKEN, "token"},
    {BCLog::CONFIG, "config"},
    {BCLog::ALL, "1"},
    {BCLog::ALL, "all"},
};

bool GetLogCategory(BCLog::LogFlags& flag, const std::string& str)
{
    if (str.empty()) {
        flag = BCLog::ALL;
        return true;
    }
    for (const CLogCategoryDesc& category_desc : LogCategories) {
        if (category_desc.category == str) {
            flag = category_desc.flag;
            return true;
        }
    }
    return false;
}

std::string ListLogCategories()
{
    std::string ret;
    int outcount = 0;
    for (const CLogCategoryDesc& category_desc : LogCategories) {
        // Omit the special cases.
        if (category_desc.flag != BCLog::NONE && category_desc.flag != BCLog::ALL) {
            if (outcount != 0) ret += ", ";
            ret += category_desc.category;
            outcount++;
        }
    }
    return ret;
}

namespace BCLog {

Logger::~Logger()
{
    CloseDebugLog();
}

bool Logger::OpenDebugLog()
{
    std::lock_guard<std::mutex> scoped_lock(m_file_mutex);

    if (m_fileout) {
        return true;
    }
    m_fileout = fsbridge::fopen(m_file_path, "a");
    if (!m_fileout) {
        return false;
    }
    setbuf(m_fileout, nullptr); // unbuffered
    return true;
}

void Logger::CloseDebugLog()
{
    std::lock_guard<std::mutex> scoped_lock(m_file_mutex);
    if (m_fileout) {
        fclose(m_fileout);
        m_fileout = nullptr;
    }
}

void Logger::EnableCategory(LogFlags flag)
{
    m_categories |= flag;
}

bool Logger::EnableCategory(const std::string& str)
{
    LogFlags flag;
    if (!GetLogCategory(flag, str)) return false;
    EnableCategory(flag);
    return true;
}

void Logger::DisableCategory(LogFlags flag)
{
    m_categories &= ~flag;
}

bool Logger::DisableCategory(const std::string& str)
{
    LogFlags flag;
    if (!GetLogCategory(flag, str)) return false;
    DisableCategory(flag);
    return true;
}

bool Logger::WillLogCategory(LogFlags category) const
{
    return (m_categories.load(std::memory_order_relaxed) & category) != 0;
}

std::string Logger::LogTimestampStr(const std::string& str)
{
    std::string strStamped;

    if (!m_log_timestamps)
        return str;

    if (m_started_new_line) {
        std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm ts;
        gmtime_r(&now, &ts);
        char buf[32];
        strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &ts);
        strStamped = std::string(buf) + ' ' + str;
    } else {
        strStamped = str;
    }

    return strStamped;
}

void Logger::LogPrintStr(const std::string& str)
{
    std::string strTimestamped = LogTimestampStr(str);

    if (!str.empty() && str[str.size()-1] == '\n')
        m_started_new_line = true;
    else
        m_started_new_line = false;

    if (m_print_to_console) {
        // print to console
        fwrite(strTimestamped.data(), 1, strTimestamped.size(), stdout);
        fflush(stdout);
    }
    if (m_print_to_file) {
        std::lock_guard<std::mutex> scoped_lock(m_file_mutex);
        if (m_fileout) {
            fwrite(strTimestamped.data(), 1, strTimestamped.size(), m_fileout);
        }
    }
}

} // namespace BCLog

/** Turn -noX into -X=0 */
static void InterpretNegatedOption(std::string& key, std::string& val)
{
    if (key.substr(0, 3) == "-no") {
        bool bool_val = (val.empty() || val != "0");
        key.erase(1, 2);
        val = bool_val ? "0" : "1";
    }
}

static bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    int64_t n = 0;
    if (!ParseInt64(strValue, &n))
        return strValue == "true";
    return n != 0;
}

void ArgsManager::AddArg(const std::string& key, const std::string& value)
{
    mapArgs[key] = value;
    mapMultiArgs[key].push_back(value);
}

bool ArgsManager::ParseParameters(int argc, const char* const argv[], std::string& error)
{
    LOCK(cs_args);
    mapArgs.clear();
    mapMultiArgs.clear();

    for (int i = 1; i < argc; i++) {
        std::string key(argv[i]);
        std::string val;
        size_t is_index = key.find('=');
        if (is_index != std::string::npos) {
            val = key.substr(is_index + 1);
            key.erase(is_index);
        }

        if (key.size() < 2 || key[0] != '-') {
            error = strprintf("Invalid parameter %s", argv[i]);
            return false;
        }

        // Interpret --foo as -foo.
        if (key.size() > 2 && key[1] == '-')
            key = key.substr(1);

        InterpretNegatedOption(key, val);
        AddArg(key, val);
    }
    return true;
}

bool ArgsManager::ReadConfigFile(const std::string& confPath, std::string& error)
{
    fs::path confFile(confPath);
    fs::ifstream streamConfig(confFile);
    if (!streamConfig.good()) {
        // Missing config file is ok
        return true;
    }

    LOCK(cs_args);
    std::string line;
    int lineno = 0;
    while (std::getline(streamConfig, line)) {
        lineno++;
        size_t comment = line.find('#');
        if (comment != std::string::npos) {
            line.erase(comment);
        }
        line.erase(0, line.find_first_not_of(" \t\r"));
        line.erase(line.find_last_not_of(" \t\r") + 1);
        if (line.empty()) {
            continue;
        }

        size_t is_index = line.find('=');
        if (is_index == std::string::npos) {
            error = strprintf("Malformed line %d in config file %s: %s", lineno, confPath, line);
            return false;
        }
        std::string key = "-" + line.substr(0, is_index);
        std::string val = line.substr(is_index + 1);
        key.erase(key.find_last_not_of(" \t") + 1);
        val.erase(0, val.find_first_not_of(" \t"));
        InterpretNegatedOption(key, val);

        // Command line settings override the config file; -debug accumulates
        if (key == "-debug") {
            mapMultiArgs[key].push_back(val);
            if (mapArgs.count(key) == 0) mapArgs[key] = val;
        } else if (mapArgs.count(key) == 0) {
            AddArg(key, val);
        }
    }
    return true;
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    LOCK(cs_args);
    auto it = mapMultiArgs.find(strArg);
    if (it != mapMultiArgs.end()) return it->second;
    return {};
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    LOCK(cs_args);
    return mapArgs.count(strArg);
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    LOCK(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return it->second;
    return strDefault;
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    LOCK(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) {
        int64_t n = 0;
        return ParseInt64(it->second, &n) ? n : 0;
    }
    return nDefault;
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    LOCK(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return InterpretBool(it->second);
    return fDefault;
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
    mapArgs[strArg] = strValue;
    mapMultiArgs[strArg] = {strValue};
}

void ArgsManager::ClearArgs()
{
    LOCK(cs_args);
    mapArgs.clear();
    mapMultiArgs.clear();
}

static const int screenWidth = 79;
static const int optIndent = 2;
static const int msgIndent = 7;

std::string HelpMessageGroup(const std::string &message) {
    return std::string(message) + std::string("\n\n");
}

std::string HelpMessageOpt(const std::string &option, const std::string &message) {
    std::string out = std::string(optIndent, ' ') + option + "\n";
    std::string indent(msgIndent, ' ');
    std::string line = indent;
    size_t pos = 0;
    while (pos < message.size()) {
        size_t next = message.find(' ', pos);
        if (next == std::string::npos) next = message.size();
        std::string word = message.substr(pos, next - pos);
        if (line.size() > (size_t)msgIndent && line.size() + word.size() + 1 > (size_t)screenWidth) {
            out += line + "\n";
            line = indent;
        }
        if (line.size() > (size_t)msgIndent) line += ' ';
        line += word;
        pos = next + 1;
    }
    return out + line + "\n\n";
}
