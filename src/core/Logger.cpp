#include "gw/core/Logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <mutex>
#include <system_error>
#include <vector>

namespace gw::core {

namespace {

struct LoggerState {
    std::mutex mutex;
    std::filesystem::path logFilePath;
    std::ofstream logStream;
    std::vector<std::pair<std::size_t, Logger::LogCallback>> listeners;
    std::atomic<std::size_t> listenerCounter{1};
    std::atomic<int> minimumLevel{static_cast<int>(LogLevel::Debug)};
    std::atomic<bool> debugEnabled{true};
    std::atomic<bool> debugConfigured{false};
};

LoggerState& State() {
    static LoggerState state;
    return state;
}

constexpr const char* LogLevelPrefix(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "[Debug] ";
        case LogLevel::Info:    return "[Info] ";
        case LogLevel::Warning: return "[Warning] ";
        case LogLevel::Error:   return "[Error] ";
    }
    return "";
}

std::string FormatTimestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto timeT = system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &timeT);
#else
    localtime_r(&timeT, &tm);
#endif
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03}",
                       tm.tm_year + 1900,
                       tm.tm_mon + 1,
                       tm.tm_mday,
                       tm.tm_hour,
                       tm.tm_min,
                       tm.tm_sec,
                       ms.count());
}

void ApplyDebugEnvironment(LoggerState& state) {
    const char* env = std::getenv("GW_LOG_DEBUG");
    if (!env) {
        return;
    }
    std::string value(env);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "1" || value == "true" || value == "on" || value == "yes") {
        state.debugEnabled.store(true, std::memory_order_release);
    } else if (value == "0" || value == "false" || value == "off" || value == "no") {
        state.debugEnabled.store(false, std::memory_order_release);
    }
}

} // namespace

void Logger::SetMinimumLevel(LogLevel level) {
    State().minimumLevel.store(static_cast<int>(level), std::memory_order_release);
}

LogLevel Logger::GetMinimumLevel() {
    return static_cast<LogLevel>(State().minimumLevel.load(std::memory_order_acquire));
}

void Logger::SetDebugEnabled(bool enabled) {
    auto& state = State();
    state.debugEnabled.store(enabled, std::memory_order_release);
    state.debugConfigured.store(true, std::memory_order_release);
}

bool Logger::IsDebugEnabled() {
#ifdef GW_DEBUG
    auto& state = State();
    bool expected = false;
    if (state.debugConfigured.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        ApplyDebugEnvironment(state);
    }
    return state.debugEnabled.load(std::memory_order_acquire) &&
           GetMinimumLevel() <= LogLevel::Debug;
#else
    return false;
#endif
}

void Logger::ConfigureFromEnvironment() {
    auto& state = State();
    ApplyDebugEnvironment(state);
    state.debugConfigured.store(true, std::memory_order_release);
}

void Logger::SetLogFile(const std::filesystem::path& path) {
    auto& state = State();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.logStream.is_open()) {
        state.logStream.close();
    }
    state.logFilePath = path;
    if (path.empty()) {
        return;
    }
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    state.logStream.open(path, std::ios::out | std::ios::app);
    if (!state.logStream.is_open()) {
        fmt::print(stderr, "[Logger] Failed to open log file '{}'\n", path.string());
    }
}

std::size_t Logger::RegisterListener(LogCallback callback) {
    if (!callback) {
        return 0;
    }
    auto& state = State();
    std::lock_guard<std::mutex> lock(state.mutex);
    const std::size_t token = state.listenerCounter.fetch_add(1, std::memory_order_relaxed);
    state.listeners.emplace_back(token, std::move(callback));
    return token;
}

void Logger::UnregisterListener(std::size_t token) {
    if (token == 0) {
        return;
    }
    auto& state = State();
    std::lock_guard<std::mutex> lock(state.mutex);
    auto it = std::remove_if(state.listeners.begin(), state.listeners.end(),
                             [token](const auto& entry) { return entry.first == token; });
    state.listeners.erase(it, state.listeners.end());
}

void Logger::Write(LogLevel level, const std::string& message) {
    const std::string line = fmt::format("[{}] {}{}", FormatTimestamp(), LogLevelPrefix(level), message);

    fmt::print(stderr, "{}\n", line);

    auto& state = State();
    std::vector<LogCallback> listenersCopy;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (state.logStream.is_open()) {
            state.logStream << line << '\n';
            state.logStream.flush();
        }
        listenersCopy.reserve(state.listeners.size());
        for (const auto& [token, callback] : state.listeners) {
            if (callback) {
                listenersCopy.push_back(callback);
            }
        }
    }

    // Listeners run outside the lock so they may log themselves.
    for (auto& callback : listenersCopy) {
        callback(level, line);
    }
}

} // namespace gw::core
