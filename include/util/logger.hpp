#pragma once

#include <cstdarg>
#include <string>

namespace fwfleet {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts "debug", "info", "warn"/"warning", "error", "none". Returns false
// and leaves |out| untouched for anything else.
bool ParseLogLevel(const std::string& s, LogLevel& out);

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // printf-style logging
    void Log(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    void VLog(LogLevel lvl, const char* fmt, va_list ap);
    void LogWithSource(LogLevel lvl,
                       const char* file,
                       int line,
                       const char* fmt,
                       ...) __attribute__((format(printf, 5, 6)));
    void VLogWithSource(LogLevel lvl,
                        const char* file,
                        int line,
                        const char* fmt,
                        va_list ap);

private:
    Logger() = default;
};

#define LogDebug(...) ::fwfleet::Logger::Instance().LogWithSource(::fwfleet::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::fwfleet::Logger::Instance().LogWithSource(::fwfleet::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::fwfleet::Logger::Instance().LogWithSource(::fwfleet::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::fwfleet::Logger::Instance().LogWithSource(::fwfleet::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace fwfleet
