// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <logging.h>
#include <utiltime.h>

#include <cassert>
#include <cstdio>

/**
 * NOTE: the logger instance is leaked on exit. This is ugly, but will be
 * cleaned up by the OS/libc. Defining a logger as a global object doesn't
 * work since the order of destruction of static/global objects is undefined.
 * Consider if the logger gets destroyed, and then some later destructor calls
 * LogPrintf, maybe indirectly, and you get a core dump at shutdown trying to
 * access the logger.
 */
CGLog::Logger* const g_logger = new CGLog::Logger();

static int FileWriteStr(const std::string& str, FILE* fp)
{
    return fwrite(str.data(), 1, str.size(), fp);
}

CGLog::Logger::~Logger()
{
    if (m_fileout) {
        fclose(m_fileout);
    }
}

bool CGLog::Logger::OpenDebugLog()
{
    std::lock_guard<std::mutex> scoped_lock(m_file_mutex);

    assert(m_fileout == nullptr);
    assert(!m_file_path.empty());

    m_fileout = fopen(m_file_path.string().c_str(), "a");
    if (!m_fileout) {
        return false;
    }

    setbuf(m_fileout, nullptr); // unbuffered
    // dump buffered messages from before we opened the log
    while (!m_msgs_before_open.empty()) {
        FileWriteStr(m_msgs_before_open.front(), m_fileout);
        m_msgs_before_open.pop_front();
    }

    return true;
}

void CGLog::Logger::EnableCategory(CGLog::LogFlags flag)
{
    m_categories |= flag;
}

bool CGLog::Logger::EnableCategory(const std::string& str)
{
    CGLog::LogFlags flag;
    if (!GetLogCategory(flag, str)) return false;
    EnableCategory(flag);
    return true;
}

void CGLog::Logger::DisableCategory(CGLog::LogFlags flag)
{
    m_categories &= ~flag;
}

bool CGLog::Logger::DisableCategory(const std::string& str)
{
    CGLog::LogFlags flag;
    if (!GetLogCategory(flag, str)) return false;
    DisableCategory(flag);
    return true;
}

bool CGLog::Logger::WillLogCategory(CGLog::LogFlags category) const
{
    return (m_categories.load(std::memory_order_relaxed) & category) != 0;
}

struct CLogCategoryDesc
{
    CGLog::LogFlags flag;
    std::string category;
};

const CLogCategoryDesc LogCategories[] =
{
    {CGLog::NONE, "0"},
    {CGLog::NONE, "none"},
    {CGLog::BREAKER, "breaker"},
    {CGLog::LIMITER, "limiter"},
    {CGLog::CACHE, "cache"},
    {CGLog::BUDGET, "budget"},
    {CGLog::ROUTER, "router"},
    {CGLog::FALLBACK, "fallback"},
    {CGLog::EVENTS, "events"},
    {CGLog::CONFIG, "config"},
    {CGLog::PROVIDER, "provider"},
    {CGLog::ALL, "1"},
    {CGLog::ALL, "all"},
};

bool GetLogCategory(CGLog::LogFlags& flag, const std::string& str)
{
    if (str == "") {
        flag = CGLog::ALL;
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
        if (category_desc.flag != CGLog::NONE && category_desc.flag != CGLog::ALL) {
            if (outcount != 0) ret += ", ";
            ret += category_desc.category;
            outcount++;
        }
    }
    return ret;
}

std::vector<CLogCategoryActive> ListActiveLogCategories()
{
    std::vector<CLogCategoryActive> ret;
    for (const CLogCategoryDesc& category_desc : LogCategories) {
        // Omit the special cases.
        if (category_desc.flag != CGLog::NONE && category_desc.flag != CGLog::ALL) {
            CLogCategoryActive catActive;
            catActive.category = category_desc.category;
            catActive.active = LogAcceptCategory(category_desc.flag);
            ret.push_back(catActive);
        }
    }
    return ret;
}

std::string CGLog::Logger::LogTimestampStr(const std::string& str)
{
    std::string strStamped;

    if (!m_log_timestamps)
        return str;

    if (m_started_new_line) {
        int64_t nTimeMicros = GetTimeMicros();
        strStamped = DateTimeStrFormat("%Y-%m-%dT%H:%M:%SZ", nTimeMicros / 1000000);
        int64_t mocktime = GetMockTime();
        if (mocktime) {
            strStamped += " (mocktime: " + DateTimeStrFormat("%Y-%m-%dT%H:%M:%SZ", mocktime) + ")";
        }
        strStamped += ' ' + str;
    } else
        strStamped = str;

    if (!str.empty() && str[str.size() - 1] == '\n')
        m_started_new_line = true;
    else
        m_started_new_line = false;

    return strStamped;
}

int CGLog::Logger::LogPrintStr(const std::string& str)
{
    int ret = 0; // Returns total number of characters written
    std::string strTimestamped = LogTimestampStr(str);

    if (m_print_to_console) {
        // print to console
        std::lock_guard<std::mutex> scoped_lock(m_file_mutex);
        ret = fwrite(strTimestamped.data(), 1, strTimestamped.size(), stdout);
        fflush(stdout);
    }
    if (m_print_to_file) {
        std::lock_guard<std::mutex> scoped_lock(m_file_mutex);

        // buffer if we haven't opened the log yet
        if (m_fileout == nullptr) {
            ret = strTimestamped.length();
            m_msgs_before_open.push_back(strTimestamped);
        } else {
            // reopen the log file, if requested
            if (m_reopen_file) {
                m_reopen_file = false;
                FILE* new_fileout = fopen(m_file_path.string().c_str(), "a");
                if (new_fileout) {
                    setbuf(new_fileout, nullptr); // unbuffered
                    fclose(m_fileout);
                    m_fileout = new_fileout;
                }
            }
            ret = FileWriteStr(strTimestamped, m_fileout);
        }
    }
    return ret;
}
