#pragma once

namespace gw {
namespace core {

struct GameTime {
    double elapsedSeconds = 0.0;
    double totalSeconds = 0.0;
    bool isRunningSlowly = false;

    float DeltaSeconds() const { return static_cast<float>(elapsedSeconds); }
};

}} // namespace gw::core
