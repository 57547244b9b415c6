#pragma once

#include <string>

namespace blamer {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide leveled logger
 *
 * The initial level is read from the BLAMER_LOG environment variable
 * ("error", "warn", "info", "debug" or 0-3). Errors and warnings go to
 * stderr so they never mix with rendered blame output on stdout.
 */
class Logger {
public:
    static Logger& instance();
    void setLevel(LogLevel level);
    LogLevel level() const;
    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

    /// Parse a BLAMER_LOG style value; unknown values yield Info
    static LogLevel parseLevel(const std::string& value);

private:
    Logger();
    LogLevel currentLevel;
};

}
