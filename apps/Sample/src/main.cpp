#include <exception>
#include <filesystem>

#include "SampleGame.hpp"
#include "gw/core/Logger.hpp"
#include "gw/utils/Config.hpp"

int main() {
  try {
    gw::core::Logger::ConfigureFromEnvironment();

    const std::filesystem::path configPath = std::filesystem::path(GW_CONFIG_PATH);
    auto configResult = gw::utils::ConfigLoader::Load(configPath);

    if (configResult.HasErrors()) {
      gw::core::Logger::Error("[main] Configuration errors detected. Please fix the following:");
      for (const auto& error : configResult.errors) {
        gw::core::Logger::Error("[main]   - {}", error);
      }
      return 1;
    }

    const gw::utils::AppConfig& appConfig = configResult.config;
    if (!appConfig.paths.logFile.empty()) {
      gw::core::Logger::SetLogFile(appConfig.paths.logFile);
    }

    SampleGame game(appConfig);
    return game.Run();
  } catch (const std::exception& ex) {
    gw::core::Logger::Error("[main] Fatal exception: {}", ex.what());
    return 1;
  }
}
