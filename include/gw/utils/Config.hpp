#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace gw::utils {

struct WindowConfig {
    std::string title = "Groundwork";
    int width = 800;
    int height = 480;
    bool fullScreen = false;
    bool vsync = true;
    bool mouseVisible = true;
};

struct GameConfig {
    bool exitOnEscape = true;
    bool fixedTimeStep = true;
    double targetFramesPerSecond = 60.0;
};

struct PathsConfig {
    std::filesystem::path content;
    // Empty means no log file.
    std::filesystem::path logFile;
};

struct AppConfig {
    WindowConfig window;
    GameConfig game;
    PathsConfig paths;
    std::filesystem::path configDirectory;
};

struct ConfigLoadResult {
    AppConfig config;
    bool loadedFromFile = false;
    std::vector<std::string> errors;      // Values that were invalid and got replaced
    std::vector<std::string> warnings;    // Non-critical issues that should be logged

    bool HasErrors() const { return !errors.empty(); }
    bool HasWarnings() const { return !warnings.empty(); }
};

class ConfigLoader {
public:
    // Never throws. A missing or malformed file yields the defaults.
    static ConfigLoadResult Load(const std::filesystem::path& path);

private:
    static AppConfig CreateDefault(const std::filesystem::path& baseDir);
    static void ValidateConfig(AppConfig& config, ConfigLoadResult& result);
    static void ValidateWindowConfig(WindowConfig& window, ConfigLoadResult& result);
    static void ValidateGameConfig(GameConfig& game, ConfigLoadResult& result);
};

} // namespace gw::utils
