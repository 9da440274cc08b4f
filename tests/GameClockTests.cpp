#include "gw/core/GameClock.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

TEST_CASE("GameClock schedules whole fixed steps", "[clock]") {
    gw::core::GameClock clock;
    const double step = clock.TargetElapsedSeconds();
    REQUIRE(step == Catch::Approx(1.0 / 60.0));

    REQUIRE(clock.Accumulate(step * 0.5) == 0);
    REQUIRE(clock.SecondsUntilNextStep() == Catch::Approx(step * 0.5));

    REQUIRE(clock.Accumulate(step * 0.5) == 1);
    const auto time = clock.ConsumeStep();
    REQUIRE(time.elapsedSeconds == Catch::Approx(step));
    REQUIRE(time.totalSeconds == Catch::Approx(step));
    REQUIRE_FALSE(time.isRunningSlowly);
}

TEST_CASE("GameClock flags catch-up frames as running slowly", "[clock]") {
    gw::core::GameClock clock;
    const double step = clock.TargetElapsedSeconds();

    REQUIRE(clock.Accumulate(step * 3.0) == 3);
    for (int i = 0; i < 3; ++i) {
        REQUIRE(clock.ConsumeStep().isRunningSlowly);
    }
    REQUIRE(clock.CurrentTime().totalSeconds == Catch::Approx(step * 3.0));

    REQUIRE(clock.Accumulate(step) == 1);
    REQUIRE_FALSE(clock.ConsumeStep().isRunningSlowly);
}

TEST_CASE("GameClock clamps long and negative frames", "[clock]") {
    gw::core::GameClock clock;
    const double step = clock.TargetElapsedSeconds();

    // A five second stall is limited to the 0.5 s maximum.
    const int steps = clock.Accumulate(5.0);
    REQUIRE(steps == static_cast<int>(gw::core::GameClock::kDefaultMaxElapsedSeconds / step + 1e-6));

    REQUIRE(clock.Accumulate(-1.0) == 0);
}

TEST_CASE("GameClock variable step runs once per frame with real time", "[clock]") {
    gw::core::GameClock clock;
    clock.SetFixedTimeStep(false);

    REQUIRE(clock.Accumulate(0.004) == 1);
    auto time = clock.ConsumeStep();
    REQUIRE(time.elapsedSeconds == Catch::Approx(0.004));
    REQUIRE_FALSE(time.isRunningSlowly);

    REQUIRE(clock.Accumulate(0.1) == 1);
    time = clock.ConsumeStep();
    REQUIRE(time.elapsedSeconds == Catch::Approx(0.1));
    REQUIRE(time.totalSeconds == Catch::Approx(0.104));
    REQUIRE(clock.SecondsUntilNextStep() == 0.0);
}

TEST_CASE("GameClock rejects a non-positive target", "[clock]") {
    gw::core::GameClock clock;
    REQUIRE_THROWS_AS(clock.SetTargetElapsedSeconds(0.0), std::invalid_argument);
    REQUIRE_THROWS_AS(clock.SetTargetElapsedSeconds(-0.5), std::invalid_argument);
    REQUIRE_THROWS_AS(gw::core::GameClock(0.0), std::invalid_argument);

    clock.SetTargetElapsedSeconds(0.02);
    clock.SetMaxElapsedSeconds(0.001);
    REQUIRE(clock.MaxElapsedSeconds() == Catch::Approx(0.02));
}

TEST_CASE("GameClock Reset clears accumulated time", "[clock]") {
    gw::core::GameClock clock;
    const double step = clock.TargetElapsedSeconds();
    clock.Accumulate(step * 0.9);
    REQUIRE(clock.Accumulate(step * 2.0) == 2);
    clock.ConsumeStep();

    clock.Reset();
    REQUIRE(clock.CurrentTime().totalSeconds == 0.0);
    REQUIRE(clock.Accumulate(step * 0.9) == 0);
}
