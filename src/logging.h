// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CALLGUARD_LOGGING_H
#define CALLGUARD_LOGGING_H

#include <atomic>
#include <cstdint>
#include <list>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>

// Format errors surface as exceptions so a bad log format string never aborts
// the process.
#ifndef TINYFORMAT_ERROR
#define TINYFORMAT_ERROR(reason) throw std::runtime_error(reason)
#endif
#include <tinyformat.h>

#ifndef strprintf
#define strprintf tfm::format
#endif

static const bool DEFAULT_LOGTIMESTAMPS = true;
static const bool DEFAULT_PRINTTOCONSOLE = false;

struct CLogCategoryActive
{
    std::string category;
    bool active;
};

namespace CGLog {
    enum LogFlags : uint32_t {
        NONE        = 0,
        BREAKER     = (1 <<  0),
        LIMITER     = (1 <<  1),
        CACHE       = (1 <<  2),
        BUDGET      = (1 <<  3),
        ROUTER      = (1 <<  4),
        FALLBACK    = (1 <<  5),
        EVENTS      = (1 <<  6),
        CONFIG      = (1 <<  7),
        PROVIDER    = (1 <<  8),
        ALL         = ~(uint32_t)0,
    };

    class Logger
    {
    private:
        FILE* m_fileout = nullptr;
        std::mutex m_file_mutex;
        std::list<std::string> m_msgs_before_open;

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
        bool m_print_to_console = DEFAULT_PRINTTOCONSOLE;
        bool m_print_to_file = false;

        bool m_log_timestamps = DEFAULT_LOGTIMESTAMPS;

        boost::filesystem::path m_file_path;
        std::atomic<bool> m_reopen_file{false};

        ~Logger();

        /** Send a string to the log output */
        int LogPrintStr(const std::string& str);

        /** Returns whether logs will be written to any output */
        bool Enabled() const { return m_print_to_console || m_print_to_file; }

        bool OpenDebugLog();

        uint32_t GetCategoryMask() const { return m_categories.load(); }

        void EnableCategory(LogFlags flag);
        bool EnableCategory(const std::string& str);
        void DisableCategory(LogFlags flag);
        bool DisableCategory(const std::string& str);

        bool WillLogCategory(LogFlags category) const;
    };

} // namespace CGLog

extern CGLog::Logger* const g_logger;

/** Return true if log accepts specified category */
static inline bool LogAcceptCategory(CGLog::LogFlags category)
{
    return g_logger->WillLogCategory(category);
}

/** Returns a string with the log categories. */
std::string ListLogCategories();

/** Returns a vector of the active log categories. */
std::vector<CLogCategoryActive> ListActiveLogCategories();

/** Return true if str parses as a log category and set the flag */
bool GetLogCategory(CGLog::LogFlags& flag, const std::string& str);

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

// Use a macro instead of a function for conditional logging to prevent
// evaluating arguments when logging for the category is not enabled.
#define LogPrint(category, ...) do { \
    if (LogAcceptCategory((category))) { \
        LogPrintf(__VA_ARGS__); \
    } \
} while(0)

/** Log a failure and return false, for functions reporting success as bool. */
template <typename... Args>
bool error(const char* fmt, const Args&... args)
{
    LogPrintf("ERROR: %s\n", tfm::format(fmt, args...));
    return false;
}

#endif // CALLGUARD_LOGGING_H
