// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <util.h>

#include <cstdio>
#include <cstdlib>
#include <ctime>

bool fPrintToConsole = DEFAULT_PRINTTOCONSOLE;
bool fLogTimestamps = DEFAULT_LOGTIMESTAMPS;

/** Log categories bitfield. */
std::atomic<uint32_t> logCategories(0);

ArgsManager gArgs;

static std::mutex cs_log;
static FILE* fileout = nullptr;
static std::atomic_bool fStartedNewLine(true);

struct CLogCategoryDesc
{
    uint32_t flag;
    std::string category;
};

const CLogCategoryDesc LogCategories[] =
{
    {BCLog::NONE, "0"},
    {BCLog::CONTRACTS, "contracts"},
    {BCLog::METADATA, "metadata"},
    {BCLog::SLOTS, "slots"},
    {BCLog::EXECUTOR, "executor"},
    {BCLog::SYSTEM, "system"},
    {BCLog::ALL, "1"},
    {BCLog::ALL, "all"},
};

bool GetLogCategory(uint32_t *f, const std::string *str)
{
    if (f && str) {
        if (*str == "") {
            *f = BCLog::ALL;
            return true;
        }
        for (const CLogCategoryDesc& category_desc : LogCategories) {
            if (category_desc.category == *str) {
                *f = category_desc.flag;
                return true;
            }
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

static std::string LogTimestampStr(const std::string &str)
{
    if (!fLogTimestamps)
        return str;

    std::string strStamped;
    if (fStartedNewLine) {
        char buf[32];
        std::time_t now = std::time(nullptr);
        std::tm tmNow;
        gmtime_r(&now, &tmNow);
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tmNow);
        strStamped = std::string(buf) + ' ' + str;
    } else {
        strStamped = str;
    }

    if (!str.empty() && str[str.size()-1] == '\n')
        fStartedNewLine = true;
    else
        fStartedNewLine = false;

    return strStamped;
}

int LogPrintStr(const std::string &str)
{
    int ret = 0;
    std::string strTimestamped = LogTimestampStr(str);

    std::lock_guard<std::mutex> lock(cs_log);
    if (fPrintToConsole) {
        ret = fwrite(strTimestamped.data(), 1, strTimestamped.size(), stdout);
        fflush(stdout);
    }
    if (fileout != nullptr) {
        ret = fwrite(strTimestamped.data(), 1, strTimestamped.size(), fileout);
    }
    return ret;
}

bool OpenDebugLog(const std::string& path)
{
    std::lock_guard<std::mutex> lock(cs_log);
    if (fileout != nullptr) {
        fclose(fileout);
    }
    fileout = fopen(path.c_str(), "a");
    if (fileout == nullptr) {
        return false;
    }
    setbuf(fileout, nullptr); // unbuffered
    return true;
}

void CloseDebugLog()
{
    std::lock_guard<std::mutex> lock(cs_log);
    if (fileout != nullptr) {
        fclose(fileout);
        fileout = nullptr;
    }
}

/** Interpret string as boolean, for argument parsing */
static bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (std::atoi(strValue.c_str()) != 0);
}

/** Turn -noX into -X=0 */
static void InterpretNegativeSetting(std::string& strKey, std::string& strValue)
{
    if (strKey.length()>3 && strKey[0]=='-' && strKey[1]=='n' && strKey[2]=='o')
    {
        strKey = "-" + strKey.substr(3);
        strValue = InterpretBool(strValue) ? "0" : "1";
    }
}

bool ArgsManager::ParseParameters(int argc, const char* const argv[], std::string& error)
{
    std::lock_guard<std::mutex> lock(cs_args);
    mapArgs.clear();
    mapMultiArgs.clear();

    for (int i = 1; i < argc; i++)
    {
        std::string str(argv[i]);
        std::string strValue;
        size_t is_index = str.find('=');
        if (is_index != std::string::npos)
        {
            strValue = str.substr(is_index+1);
            str = str.substr(0, is_index);
        }

        if (str.empty() || str[0] != '-') {
            error = strprintf("Invalid parameter %s", argv[i]);
            return false;
        }

        // Interpret --foo as -foo.
        if (str.length() > 1 && str[1] == '-')
            str = str.substr(1);
        InterpretNegativeSetting(str, strValue);

        mapArgs[str] = strValue;
        mapMultiArgs[str].push_back(strValue);
    }
    return true;
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    auto it = mapMultiArgs.find(strArg);
    if (it != mapMultiArgs.end()) return it->second;
    return {};
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    return mapArgs.count(strArg);
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return it->second;
    return strDefault;
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return std::strtoll(it->second.c_str(), nullptr, 10);
    return nDefault;
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return InterpretBool(it->second);
    return fDefault;
}

bool ArgsManager::SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    {
        std::lock_guard<std::mutex> lock(cs_args);
        if (mapArgs.count(strArg))
            return false;
    }
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
    std::lock_guard<std::mutex> lock(cs_args);
    mapArgs[strArg] = strValue;
    mapMultiArgs[strArg] = {strValue};
}

void ArgsManager::ClearArgs()
{
    std::lock_guard<std::mutex> lock(cs_args);
    mapArgs.clear();
    mapMultiArgs.clear();
}

bool InitLogging()
{
    fPrintToConsole = gArgs.GetBoolArg("-printtoconsole", DEFAULT_PRINTTOCONSOLE);
    fLogTimestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);

    uint32_t flags = BCLog::NONE;
    if (gArgs.IsArgSet("-debug")) {
        // Special-case: if -debug=0/-nodebug is set, turn off debugging messages
        const std::vector<std::string> categories = gArgs.GetArgs("-debug");
        bool disabled = false;
        for (const std::string& cat : categories) {
            if (cat == "0") disabled = true;
        }
        if (!disabled) {
            for (const std::string& cat : categories) {
                uint32_t flag = 0;
                if (!GetLogCategory(&flag, &cat)) {
                    return error("Unsupported logging category -debug=%s. Valid categories: %s", cat, ListLogCategories());
                }
                flags |= flag;
            }
        }
    }
    logCategories = flags;

    if (gArgs.IsArgSet("-logfile")) {
        const std::string path = gArgs.GetArg("-logfile", "");
        if (!OpenDebugLog(path)) {
            return error("Cannot open log file %s", path);
        }
    }
    return true;
}
