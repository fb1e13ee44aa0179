#include "core/log.hpp"

#include <atomic>
#include <fstream>
#include <iostream>
#include <mutex>

static std::mutex g_logMutex;
static std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
static std::ofstream g_logFile;

static const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

void setLogLevel(LogLevel level) { g_level.store(static_cast<int>(level)); }

LogLevel logLevel() { return static_cast<LogLevel>(g_level.load()); }

bool setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_logFile.is_open()) g_logFile.close();
    if (path.empty()) return true;

    g_logFile.open(path, std::ios::out | std::ios::app);
    return g_logFile.is_open();
}

bool parseLogLevel(const std::string& name, LogLevel& out) {
    if (name == "debug") out = LogLevel::Debug;
    else if (name == "info") out = LogLevel::Info;
    else if (name == "warn" || name == "warning") out = LogLevel::Warn;
    else if (name == "error") out = LogLevel::Error;
    else return false;
    return true;
}

void logMessage(LogLevel level, const std::string& component, const std::string& msg) {
    if (static_cast<int>(level) < g_level.load()) return;

    std::lock_guard<std::mutex> lock(g_logMutex);
    std::ostream& os = (level >= LogLevel::Warn) ? std::cerr : std::cout;
    os << "[" << component << "] [" << levelName(level) << "] " << msg << std::endl;

    if (g_logFile.is_open()) {
        g_logFile << "[" << component << "] [" << levelName(level) << "] " << msg << "\n";
        g_logFile.flush();
    }
}
