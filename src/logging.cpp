// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "logging.h"

#include <ctime>

BCLog::Logger& LogInstance()
{
    // Leaked on purpose: log calls may happen during static destruction.
    static BCLog::Logger* g_logger{new BCLog::Logger()};
    return *g_logger;
}

struct CLogCategoryDesc
{
    BCLog::LogFlags flag;
    std::string category;
};

const CLogCategoryDesc LogCategories[] =
{
    {BCLog::NONE, "0"},
    {BCLog::NONE, "none"},
    {BCLog::SILO, "silo"},
    {BCLog::WELL, "well"},
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

BCLog::Logger::~Logger()
{
    CloseDebugLog();
}

bool BCLog::Logger::OpenDebugLog(const std::string& path)
{
    std::lock_guard<std::mutex> scoped_lock(m_file_mutex);

    if (m_fileout) {
        fclose(m_fileout);
    }
    m_fileout = fopen(path.c_str(), "a");
    if (!m_fileout) {
        m_print_to_file = false;
        return false;
    }
    setbuf(m_fileout, nullptr); // unbuffered
    m_print_to_file = true;
    return true;
}

void BCLog::Logger::CloseDebugLog()
{
    std::lock_guard<std::mutex> scoped_lock(m_file_mutex);
    if (m_fileout) {
        fclose(m_fileout);
        m_fileout = nullptr;
    }
    m_print_to_file = false;
}

void BCLog::Logger::EnableCategory(BCLog::LogFlags flag)
{
    m_categories |= flag;
}

bool BCLog::Logger::EnableCategory(const std::string& str)
{
    BCLog::LogFlags flag;
    if (!GetLogCategory(flag, str)) return false;
    EnableCategory(flag);
    return true;
}

void BCLog::Logger::DisableCategory(BCLog::LogFlags flag)
{
    m_categories &= ~flag;
}

bool BCLog::Logger::DisableCategory(const std::string& str)
{
    BCLog::LogFlags flag;
    if (!GetLogCategory(flag, str)) return false;
    DisableCategory(flag);
    return true;
}

bool BCLog::Logger::WillLogCategory(BCLog::LogFlags category) const
{
    return (m_categories.load(std::memory_order_relaxed) & category) != 0;
}

std::string BCLog::Logger::LogTimestampStr(const std::string& str) const
{
    if (!m_log_timestamps)
        return str;

    time_t now = time(nullptr);
    struct tm ts;
    char buf[32];
    gmtime_r(&now, &ts);
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &ts);
    return std::string(buf) + " " + str;
}

void BCLog::Logger::LogPrintStr(const std::string& str)
{
    std::string str_prefixed = LogTimestampStr(str);

    if (m_print_to_console) {
        // print to console
        fwrite(str_prefixed.data(), 1, str_prefixed.size(), stdout);
        fflush(stdout);
    }
    if (m_print_to_file) {
        std::lock_guard<std::mutex> scoped_lock(m_file_mutex);
        if (m_fileout) {
            fwrite(str_prefixed.data(), 1, str_prefixed.size(), m_fileout);
        }
    }
}
