#pragma once

#include "gw/core/GameTime.hpp"

namespace gw::core {

/**
 * @brief Turns wall-clock frame durations into update steps.
 *
 * In fixed mode the clock accumulates real time and hands out whole steps of
 * TargetElapsedSeconds(); a frame that needs more than one step to catch up is
 * flagged as running slowly. In variable mode every frame is exactly one step
 * carrying the real elapsed time.
 */
class GameClock {
public:
    static constexpr double kDefaultTargetElapsedSeconds = 1.0 / 60.0;
    static constexpr double kDefaultMaxElapsedSeconds = 0.5;

    explicit GameClock(double targetElapsedSeconds = kDefaultTargetElapsedSeconds);

    void SetFixedTimeStep(bool enabled) { m_fixedTimeStep = enabled; }
    bool IsFixedTimeStep() const { return m_fixedTimeStep; }

    // Throws std::invalid_argument for non-positive values.
    void SetTargetElapsedSeconds(double seconds);
    double TargetElapsedSeconds() const { return m_targetElapsed; }

    void SetMaxElapsedSeconds(double seconds);
    double MaxElapsedSeconds() const { return m_maxElapsed; }

    // Feeds real time since the previous tick and returns the number of
    // update steps due this frame. Negative input counts as zero.
    int Accumulate(double realElapsedSeconds);

    // Consumes one scheduled step and returns its time.
    GameTime ConsumeStep();

    // Time of the most recently consumed step; used for Draw.
    const GameTime& CurrentTime() const { return m_current; }

    // Fixed mode only: time left before the next step is due.
    double SecondsUntilNextStep() const;

    void Reset();

private:
    double m_targetElapsed;
    double m_maxElapsed = kDefaultMaxElapsedSeconds;
    bool m_fixedTimeStep = true;

    double m_accumulator = 0.0;
    double m_lastRealElapsed = 0.0;
    int m_pendingSteps = 0;
    bool m_runningSlowly = false;
    GameTime m_current;
};

} // namespace gw::core
