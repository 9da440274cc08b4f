#pragma once

#include "gw/core/Core.hpp"
#include "gw/utils/Config.hpp"

class SampleGame : public gw::core::Core {
public:
    explicit SampleGame(const gw::utils::AppConfig& config);

protected:
    void LoadContent() override;
    void OnUpdate(const gw::core::GameTime& gameTime) override;
    void OnUnloadContent() override;
};
