#include "util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>

namespace ctxpack {

static constexpr const char* LEVEL_ENV_VAR = "CTXPACK_LOG";

std::optional<LogLevel> Logger::parseLevel(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "debug" || v == "3") return LogLevel::Debug;
    if (v == "info" || v == "2") return LogLevel::Info;
    if (v == "warn" || v == "warning" || v == "1") return LogLevel::Warn;
    if (v == "error" || v == "0") return LogLevel::Error;
    return std::nullopt;
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger() : currentLevel(LogLevel::Info) {
    const char* env = std::getenv(LEVEL_ENV_VAR);
    if (!env || !*env) return;
    auto parsed = parseLevel(env);
    if (parsed) {
        currentLevel = *parsed;
    } else {
        warn(std::string("Unknown ") + LEVEL_ENV_VAR + " value '" + env + "', using info");
    }
}

void Logger::setLevel(LogLevel level) { currentLevel = level; }
LogLevel Logger::level() const { return currentLevel; }

void Logger::error(const std::string& msg) const { if (currentLevel >= LogLevel::Error) std::cerr << "[error] " << msg << "\n"; }
void Logger::warn(const std::string& msg) const { if (currentLevel >= LogLevel::Warn) std::cerr << "[warn ] " << msg << "\n"; }
void Logger::info(const std::string& msg) const { if (currentLevel >= LogLevel::Info) std::cout << "[info ] " << msg << "\n"; }
void Logger::debug(const std::string& msg) const { if (currentLevel >= LogLevel::Debug) std::cout << "[debug] " << msg << "\n"; }

}
