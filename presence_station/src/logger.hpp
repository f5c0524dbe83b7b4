#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <fstream>
#include <mutex>
#include <string>

enum LogLevel {
    LOG_DEBUG,
    LOG_INFO,
    LOG_WARN,
    LOG_ERR,
};

class Logger {
public:
    Logger(const Logger &l) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(const Logger &l) = delete;
    Logger& operator=(Logger&&) = delete;

    static Logger& instance();

    static void err(const std::string &s);
    static void warn(const std::string &s);
    static void info(const std::string &s);
    static void debug(const std::string &s);

    /**
     * @brief Start writing log files in directory
     *
     * Files are named log-0.txt, log-1.txt... A new file is
     * opened each time the current one exceeds 1MiB.
     *
     * @param dir
     */
    void startLogging(const std::string &dir);
    void stopLogging();

    void setLevel(enum LogLevel level);

    /**
     * @brief Enable or disable printing to stdout
     *
     * CLI commands such as list or log disable it so that
     * their output is not interleaved with log lines.
     */
    void setConsoleOutput(bool enabled);

private:
    Logger();
    ~Logger() = default;
    void log(enum LogLevel level, const char *prefix, const std::string &s);
    void rotate();

    std::string m_dir;
    unsigned long long m_index;
    std::ofstream m_file;
    std::mutex m_mutex;
    enum LogLevel m_level;
    bool m_console;
};

bool parse_log_level(const std::string &str, enum LogLevel &level);
const char* log_level_name(enum LogLevel level);

#endif
