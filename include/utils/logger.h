#pragma once

#include <string>
#include <cstdint>

namespace cryptotrade {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

// Process-wide logger shared by every ledger component. Lines go to the
// console (ERROR and above on stderr) and, after init(), to a size-rotated file.
class Logger {
public:
    static void init(const std::string& path);
    static void shutdown();
    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static bool parseLevel(const std::string& name, LogLevel& out);
    static void enableConsole(bool enable);
    static void setMaxFileSize(uint64_t bytes);
    static void setMaxFiles(uint32_t count);

    static void log(LogLevel level, const std::string& category, const std::string& msg);

    static void flush();
    static void rotate();

    static uint64_t getErrorCount();
};

#define LOG_CAT(level, category, msg) do { if (cryptotrade::utils::Logger::getLevel() <= cryptotrade::utils::LogLevel::level) cryptotrade::utils::Logger::log(cryptotrade::utils::LogLevel::level, category, msg); } while(0)

}
}
