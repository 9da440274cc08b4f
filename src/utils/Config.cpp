#include "gw/utils/Config.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "gw/core/Logger.hpp"

namespace gw::utils {

namespace {

constexpr int kMinWindowWidth = 160;
constexpr int kMaxWindowWidth = 7680;
constexpr int kMinWindowHeight = 120;
constexpr int kMaxWindowHeight = 4320;
constexpr double kMinFramesPerSecond = 1.0;
constexpr double kMaxFramesPerSecond = 1000.0;

std::filesystem::path NormalizePath(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path normalized = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        normalized = std::filesystem::absolute(path, ec);
    }
    return normalized.lexically_normal();
}

std::filesystem::path ResolvePath(const std::filesystem::path& baseDir, const std::string& value) {
    if (value.empty()) {
        return NormalizePath(baseDir);
    }
    std::filesystem::path raw(value);
    if (raw.is_relative()) {
        return NormalizePath(baseDir / raw);
    }
    return NormalizePath(raw);
}

template <typename T>
T GetOrDefault(const nlohmann::json& obj, const char* key, const T& fallback) {
    if (!obj.is_object()) {
        return fallback;
    }
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        core::Logger::Warning("[ConfigLoader] Failed to parse key '{}': {}", key, e.what());
        return fallback;
    }
}

nlohmann::json Section(const nlohmann::json& json, const char* name) {
    if (json.is_object() && json.contains(name) && json[name].is_object()) {
        return json[name];
    }
    return nlohmann::json::object();
}

} // namespace

AppConfig ConfigLoader::CreateDefault(const std::filesystem::path& baseDir) {
    AppConfig config{};
    config.configDirectory = baseDir;
    config.paths.content = NormalizePath(baseDir / "Content");
    return config;
}

ConfigLoadResult ConfigLoader::Load(const std::filesystem::path& path) {
    const std::filesystem::path baseDir = path.empty() || path.parent_path().empty()
                                              ? std::filesystem::current_path()
                                              : path.parent_path();

    ConfigLoadResult result;
    result.config = CreateDefault(baseDir);

    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        core::Logger::Warning("[ConfigLoader] Config file '{}' not found, using defaults",
                              path.empty() ? "<none>" : path.string());
        return result;
    }

    std::ifstream file(path);
    if (!file) {
        core::Logger::Error("[ConfigLoader] Failed to open config file '{}'", path.string());
        result.errors.push_back(fmt::format("Cannot open '{}'", path.string()));
        return result;
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::exception& e) {
        core::Logger::Error("[ConfigLoader] Failed to parse JSON '{}': {}", path.string(), e.what());
        result.errors.push_back(fmt::format("Invalid JSON: {}", e.what()));
        return result;
    }

    auto& config = result.config;

    const auto windowObj = Section(json, "window");
    config.window.title = GetOrDefault<std::string>(windowObj, "title", config.window.title);
    config.window.width = GetOrDefault<int>(windowObj, "width", config.window.width);
    config.window.height = GetOrDefault<int>(windowObj, "height", config.window.height);
    config.window.fullScreen = GetOrDefault<bool>(windowObj, "fullScreen", config.window.fullScreen);
    config.window.vsync = GetOrDefault<bool>(windowObj, "vsync", config.window.vsync);
    config.window.mouseVisible = GetOrDefault<bool>(windowObj, "mouseVisible", config.window.mouseVisible);

    const auto gameObj = Section(json, "game");
    config.game.exitOnEscape = GetOrDefault<bool>(gameObj, "exitOnEscape", config.game.exitOnEscape);
    config.game.fixedTimeStep = GetOrDefault<bool>(gameObj, "fixedTimeStep", config.game.fixedTimeStep);
    config.game.targetFramesPerSecond =
        GetOrDefault<double>(gameObj, "targetFramesPerSecond", config.game.targetFramesPerSecond);

    const auto pathsObj = Section(json, "paths");
    if (pathsObj.contains("content") && pathsObj["content"].is_string()) {
        config.paths.content = ResolvePath(baseDir, pathsObj["content"].get<std::string>());
    }
    if (pathsObj.contains("logFile") && pathsObj["logFile"].is_string()) {
        const auto logFile = pathsObj["logFile"].get<std::string>();
        if (!logFile.empty()) {
            config.paths.logFile = ResolvePath(baseDir, logFile);
        }
    }

    result.loadedFromFile = true;

    ValidateConfig(config, result);

    for (const auto& warning : result.warnings) {
        core::Logger::Warning("[ConfigLoader] {}", warning);
    }
    for (const auto& error : result.errors) {
        core::Logger::Error("[ConfigLoader] {}", error);
    }

    core::Logger::Info("[ConfigLoader] Loaded config from '{}'", path.string());
    return result;
}

void ConfigLoader::ValidateConfig(AppConfig& config, ConfigLoadResult& result) {
    ValidateWindowConfig(config.window, result);
    ValidateGameConfig(config.game, result);

    std::error_code ec;
    if (!std::filesystem::exists(config.paths.content, ec)) {
        result.warnings.push_back(
            fmt::format("Content directory does not exist: {}", config.paths.content.string()));
    }
}

void ConfigLoader::ValidateWindowConfig(WindowConfig& window, ConfigLoadResult& result) {
    if (window.width < kMinWindowWidth || window.width > kMaxWindowWidth) {
        result.errors.push_back(
            fmt::format("Window width ({}) must be between {} and {}",
                        window.width, kMinWindowWidth, kMaxWindowWidth));
        window.width = std::clamp(window.width, kMinWindowWidth, kMaxWindowWidth);
    }

    if (window.height < kMinWindowHeight || window.height > kMaxWindowHeight) {
        result.errors.push_back(
            fmt::format("Window height ({}) must be between {} and {}",
                        window.height, kMinWindowHeight, kMaxWindowHeight));
        window.height = std::clamp(window.height, kMinWindowHeight, kMaxWindowHeight);
    }

    if (window.title.empty()) {
        result.warnings.push_back("Window title is empty, using default");
        window.title = WindowConfig{}.title;
    }
}

void ConfigLoader::ValidateGameConfig(GameConfig& game, ConfigLoadResult& result) {
    if (game.targetFramesPerSecond < kMinFramesPerSecond ||
        game.targetFramesPerSecond > kMaxFramesPerSecond) {
        result.warnings.push_back(
            fmt::format("game.targetFramesPerSecond ({:.1f}) should be between {:.1f} and {:.1f}, clamping",
                        game.targetFramesPerSecond, kMinFramesPerSecond, kMaxFramesPerSecond));
        game.targetFramesPerSecond = std::clamp(game.targetFramesPerSecond,
                                                kMinFramesPerSecond,
                                                kMaxFramesPerSecond);
    }
}

} // namespace gw::utils
