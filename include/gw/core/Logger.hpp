#pragma once
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <fmt/std.h>

namespace gw {
namespace core {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * @brief Process-wide logger.
 *
 * Lines are timestamped and written to stderr, to an optional log file and to
 * every registered listener. Debug output only exists in builds that define
 * GW_DEBUG and can be silenced at runtime with GW_LOG_DEBUG=0.
 */
class Logger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    template<typename... Args>
    static void Debug(fmt::format_string<Args...> format, Args&&... args) {
#ifdef GW_DEBUG
        if (!IsDebugEnabled()) {
            return;
        }
        Write(LogLevel::Debug, fmt::format(format, std::forward<Args>(args)...));
#else
        (void)format;
        ((void)args, ...);
#endif
    }

    template<typename... Args>
    static void Info(fmt::format_string<Args...> format, Args&&... args) {
        Log(LogLevel::Info, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Warning(fmt::format_string<Args...> format, Args&&... args) {
        Log(LogLevel::Warning, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Error(fmt::format_string<Args...> format, Args&&... args) {
        Log(LogLevel::Error, format, std::forward<Args>(args)...);
    }

    // Messages below this level are dropped. Defaults to Debug.
    static void SetMinimumLevel(LogLevel level);
    static LogLevel GetMinimumLevel();

    static void SetDebugEnabled(bool enabled);
    static bool IsDebugEnabled();
    static void ConfigureFromEnvironment();

    // An empty path closes the current log file.
    static void SetLogFile(const std::filesystem::path& path);

    // Returns 0 for an empty callback; tokens are never reused.
    static std::size_t RegisterListener(LogCallback callback);
    static void UnregisterListener(std::size_t token);

private:
    template<typename... Args>
    static void Log(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
        if (level < GetMinimumLevel()) {
            return;
        }
        Write(level, fmt::format(format, std::forward<Args>(args)...));
    }

    static void Write(LogLevel level, const std::string& message);
};

}} // namespace gw::core
