#ifndef LOG_HPP
#define LOG_HPP

#include <string>
#include <initializer_list>
#include <sstream>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Process-wide log sink. Lines look like "[Component] [LEVEL] message".
void setLogLevel(LogLevel level);
LogLevel logLevel();

// Mirrors every line into a file as well. Empty path closes it.
bool setLogFile(const std::string& path);

bool parseLogLevel(const std::string& name, LogLevel& out);

void logMessage(LogLevel level, const std::string& component, const std::string& msg);

inline void logDebug(const std::string& component, const std::string& msg) { logMessage(LogLevel::Debug, component, msg); }
inline void logInfo(const std::string& component, const std::string& msg) { logMessage(LogLevel::Info, component, msg); }
inline void logWarn(const std::string& component, const std::string& msg) { logMessage(LogLevel::Warn, component, msg); }
inline void logError(const std::string& component, const std::string& msg) { logMessage(LogLevel::Error, component, msg); }

// Builds a message from streamable pieces: strCat("a=", 1, " b=", 2.0)
template <typename... Args>
std::string strCat(const Args&... args) {
    std::ostringstream ss;
    (void)std::initializer_list<int>{(ss << args, 0)...};
    return ss.str();
}

#endif
