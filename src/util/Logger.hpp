#pragma once

#include <optional>
#include <string>

namespace ctxpack {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide status logger
 *
 * Info and debug lines go to stdout, warnings and errors to stderr.
 * Initial level comes from the CTXPACK_LOG environment variable
 * (debug|info|warn|error in any case, or 3..0), defaulting to info.
 * An unrecognised value is reported once and falls back to info.
 */
class Logger {
public:
    static Logger& instance();

    /// Parse a CTXPACK_LOG value; nullopt if it names no level
    static std::optional<LogLevel> parseLevel(const std::string& value);

    void setLevel(LogLevel level);
    LogLevel level() const;
    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

private:
    Logger();
    LogLevel currentLevel;
};

}
