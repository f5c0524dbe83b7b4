#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace {
    const int MAX_LOG_FILESIZE = 1024 * 1024;
    const unsigned int MAX_LOG_COUNT = 16;
}

Logger::Logger():
m_dir(),
m_index(0),
m_file(),
m_mutex(),
m_level(LOG_INFO),
m_console(true)
{
}

Logger& Logger::instance()
{
    static Logger l;
    return l;
}

void Logger::err(const std::string &s)
{
    Logger::instance().log(LOG_ERR, "ERR", s);
}

void Logger::warn(const std::string &s)
{
    Logger::instance().log(LOG_WARN, "WARN", s);
}

void Logger::info(const std::string &s)
{
    Logger::instance().log(LOG_INFO, "INFO", s);
}

void Logger::debug(const std::string &s)
{
    Logger::instance().log(LOG_DEBUG, "DEBUG", s);
}

void Logger::startLogging(const std::string &dir)
{
    std::lock_guard<std::mutex> guard(m_mutex);

    m_dir = dir;
    m_index = 0;

    std::stringstream ss;
    ss << m_dir << "/log-" << m_index << ".txt";
    m_file.open(ss.str(), std::fstream::out | std::fstream::trunc);
    if (!m_file)
        std::cerr << "Could not open log file " << ss.str() << std::endl;
}

void Logger::stopLogging()
{
    std::lock_guard<std::mutex> guard(m_mutex);
    m_file.close();
}

void Logger::setLevel(enum LogLevel level)
{
    std::lock_guard<std::mutex> guard(m_mutex);
    m_level = level;
}

void Logger::setConsoleOutput(bool enabled)
{
    std::lock_guard<std::mutex> guard(m_mutex);
    m_console = enabled;
}

void Logger::log(enum LogLevel level, const char *prefix, const std::string &s)
{
    std::lock_guard<std::mutex> guard(m_mutex);

    if (level < m_level)
        return;

    std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    char buffer[64];
    struct tm tm_now;
    localtime_r(&tt, &tm_now);
    strftime(buffer, sizeof(buffer), "%F %T", &tm_now);

    if (m_console)
        std::cout << '[' << buffer << "][" << prefix << "] " << s << std::endl;

    if (!m_file.is_open())
        return;

    m_file << '[' << buffer << "][" << prefix << "] " << s << '\n';
    m_file.flush();

    if (m_file.tellp() >= MAX_LOG_FILESIZE)
        rotate();
}

void Logger::rotate()
{
    m_file.close();
    m_index++;

    /* Do not keep too much logs */
    if (m_index >= MAX_LOG_COUNT) {
        std::stringstream ss;
        ss << m_dir << "/log-" << m_index - MAX_LOG_COUNT << ".txt";
        unlink(ss.str().c_str());
    }

    std::stringstream ss;
    ss << m_dir << "/log-" << m_index << ".txt";
    m_file.open(ss.str(), std::fstream::out | std::fstream::trunc);
}

bool parse_log_level(const std::string &str, enum LogLevel &level)
{
    if (str == "debug")
        level = LOG_DEBUG;
    else if (str == "info")
        level = LOG_INFO;
    else if (str == "warn")
        level = LOG_WARN;
    else if (str == "err" || str == "error")
        level = LOG_ERR;
    else
        return false;

    return true;
}

const char* log_level_name(enum LogLevel level)
{
    switch (level) {
    case LOG_DEBUG: return "debug";
    case LOG_INFO:  return "info";
    case LOG_WARN:  return "warn";
    case LOG_ERR:   return "err";
    }

    return "info";
}
