#pragma once

#include <cstdarg>
#include <optional>
#include <string_view>

namespace swi {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts "debug", "info", "warn"/"warning", "error", "none" (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view name);

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);

    // printf-style logging; use the LogDebug/LogInfo/LogWarn/LogError macros.
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

#define LogDebug(...) ::swi::Logger::Instance().LogWithSource(::swi::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::swi::Logger::Instance().LogWithSource(::swi::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::swi::Logger::Instance().LogWithSource(::swi::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::swi::Logger::Instance().LogWithSource(::swi::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace swi
