#include "gw/core/GameClock.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "gw/core/Logger.hpp"

namespace gw::core {

GameClock::GameClock(double targetElapsedSeconds)
    : m_targetElapsed(kDefaultTargetElapsedSeconds) {
    SetTargetElapsedSeconds(targetElapsedSeconds);
}

void GameClock::SetTargetElapsedSeconds(double seconds) {
    if (!(seconds > 0.0)) {
        throw std::invalid_argument("GameClock target elapsed time must be positive");
    }
    m_targetElapsed = seconds;
    if (m_maxElapsed < m_targetElapsed) {
        m_maxElapsed = m_targetElapsed;
    }
}

void GameClock::SetMaxElapsedSeconds(double seconds) {
    if (seconds < m_targetElapsed) {
        Logger::Warning("[GameClock] Max elapsed {:.4f}s is below the target step {:.4f}s, clamping",
                        seconds, m_targetElapsed);
        seconds = m_targetElapsed;
    }
    m_maxElapsed = seconds;
}

int GameClock::Accumulate(double realElapsedSeconds) {
    double elapsed = std::max(0.0, realElapsedSeconds);
    if (elapsed > m_maxElapsed) {
        Logger::Debug("[GameClock] Frame took {:.3f}s, clamping to {:.3f}s", elapsed, m_maxElapsed);
        elapsed = m_maxElapsed;
    }

    if (!m_fixedTimeStep) {
        m_lastRealElapsed = elapsed;
        m_runningSlowly = false;
        m_pendingSteps = 1;
        return m_pendingSteps;
    }

    constexpr double kEpsilon = 1e-9;
    m_accumulator += elapsed;
    const int steps = static_cast<int>(std::floor((m_accumulator + kEpsilon) / m_targetElapsed));
    m_accumulator = std::max(0.0, m_accumulator - steps * m_targetElapsed);
    m_runningSlowly = steps > 1;
    m_pendingSteps = steps;
    return steps;
}

GameTime GameClock::ConsumeStep() {
    if (m_pendingSteps > 0) {
        --m_pendingSteps;
    }
    const double step = m_fixedTimeStep ? m_targetElapsed : m_lastRealElapsed;
    m_current.elapsedSeconds = step;
    m_current.totalSeconds += step;
    m_current.isRunningSlowly = m_runningSlowly;
    return m_current;
}

double GameClock::SecondsUntilNextStep() const {
    if (!m_fixedTimeStep) {
        return 0.0;
    }
    return std::max(0.0, m_targetElapsed - m_accumulator);
}

void GameClock::Reset() {
    m_accumulator = 0.0;
    m_lastRealElapsed = 0.0;
    m_pendingSteps = 0;
    m_runningSlowly = false;
    m_current = GameTime{};
}

} // namespace gw::core
