#include "utils/logger.h"
#include <fstream>
#include <ctime>
#include <iostream>
#include <mutex>
#include <atomic>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace cryptotrade {
namespace utils {

static std::atomic<LogLevel> currentLevel{LogLevel::INFO};
static std::ofstream logFile;
static std::string logPath;
static std::recursive_mutex logMutex;
static std::atomic<bool> consoleEnabled{true};
static uint64_t maxFileSize = 10 * 1024 * 1024;
static uint32_t maxFiles = 5;
static std::atomic<uint64_t> errorCount{0};

static const char* levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "?????";
    }
}

static void writeLog(LogLevel level, const std::string& category, const std::string& msg) {
    if (level < currentLevel.load() || level == LogLevel::OFF) return;

    std::lock_guard<std::recursive_mutex> lock(logMutex);

    time_t now = std::time(nullptr);
    std::tm tmBuf{};
    localtime_r(&now, &tmBuf);
    char timeBuf[64];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmBuf);

    std::ostringstream oss;
    oss << timeBuf << " [" << levelToString(level) << "]";
    if (!category.empty()) {
        oss << " [" << category << "]";
    }
    oss << " " << msg << "\n";

    std::string line = oss.str();

    if (consoleEnabled) {
        if (level >= LogLevel::ERROR) {
            std::cerr << line;
        } else {
            std::cout << line;
        }
    }

    if (logFile.is_open()) {
        logFile << line;
        logFile.flush();

        if (logFile.tellp() > static_cast<std::streampos>(maxFileSize)) {
            Logger::rotate();
        }
    }

    if (level >= LogLevel::ERROR) errorCount++;
}

void Logger::init(const std::string& path) {
    std::lock_guard<std::recursive_mutex> lock(logMutex);
    if (logFile.is_open()) logFile.close();
    logPath = path;

    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
    }

    logFile.open(path, std::ios::app);
    const char* env = std::getenv("CRYPTOTRADE_LOG_LEVEL");
    LogLevel envLevel;
    if (env && *env && parseLevel(env, envLevel)) {
        currentLevel = envLevel;
    }
}

void Logger::shutdown() {
    std::lock_guard<std::recursive_mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile.flush();
        logFile.close();
    }
    logPath.clear();
}

void Logger::setLevel(LogLevel level) {
    currentLevel = level;
}

LogLevel Logger::getLevel() {
    return currentLevel;
}

bool Logger::parseLevel(const std::string& name, LogLevel& out) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "trace") out = LogLevel::TRACE;
    else if (s == "debug") out = LogLevel::DEBUG;
    else if (s == "info") out = LogLevel::INFO;
    else if (s == "warn" || s == "warning") out = LogLevel::WARN;
    else if (s == "error") out = LogLevel::ERROR;
    else if (s == "fatal") out = LogLevel::FATAL;
    else if (s == "off" || s == "none") out = LogLevel::OFF;
    else return false;
    return true;
}

void Logger::enableConsole(bool enable) {
    consoleEnabled = enable;
}

void Logger::setMaxFileSize(uint64_t bytes) {
    std::lock_guard<std::recursive_mutex> lock(logMutex);
    maxFileSize = bytes;
}

void Logger::setMaxFiles(uint32_t count) {
    std::lock_guard<std::recursive_mutex> lock(logMutex);
    maxFiles = std::max<uint32_t>(1, count);
}

void Logger::log(LogLevel level, const std::string& category, const std::string& msg) {
    writeLog(level, category, msg);
}

void Logger::flush() {
    std::lock_guard<std::recursive_mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile.flush();
    }
}

// ledger.log -> ledger.log.1 -> ... -> ledger.log.<maxFiles>, oldest dropped.
void Logger::rotate() {
    std::lock_guard<std::recursive_mutex> lock(logMutex);
    if (logPath.empty()) return;

    if (logFile.is_open()) {
        logFile.close();
    }

    std::error_code ec;
    std::filesystem::remove(logPath + "." + std::to_string(maxFiles), ec);
    for (uint32_t i = maxFiles; i > 1; i--) {
        std::string oldPath = logPath + "." + std::to_string(i - 1);
        if (std::filesystem::exists(oldPath, ec)) {
            std::filesystem::rename(oldPath, logPath + "." + std::to_string(i), ec);
        }
    }

    if (std::filesystem::exists(logPath, ec)) {
        std::filesystem::rename(logPath, logPath + ".1", ec);
    }

    logFile.open(logPath, std::ios::app);
}

uint64_t Logger::getErrorCount() {
    return errorCount;
}

}
}
