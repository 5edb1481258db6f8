/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef FIXED_STEP_CLOCK_HPP
#define FIXED_STEP_CLOCK_HPP

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace BumperEngine {

/**
 * FixedStepClock turns wall-clock frame time into a whole number of fixed
 * simulation steps.
 *
 * Frame times close to a standard refresh interval are snapped to it, which
 * keeps the step count steady under VSync. A frame longer than
 * maxStepsPerTick steps drops the backlog and simulates a single step, so
 * one slow frame can never snowball into a death spiral.
 *
 * Usage:
 *   FixedStepClock clock(1.0f / 60.0f, 0.002f, 5);
 *   while (running) {
 *       for (size_t i = clock.tick(); i > 0; --i) world.step(clock.getDeltaTime(), game);
 *       render(clock.getInterpolationAlpha());
 *   }
 */
class FixedStepClock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    // Refresh rates (Hz) that frame intervals snap to
    static constexpr std::array<float, 5> TIME_SNAPS{15.0f, 30.0f, 60.0f, 120.0f, 144.0f};

    /**
     * @param dt fixed simulation step in seconds
     * @param fudgeAmount snapping tolerance in seconds, 0 disables snapping
     * @param maxStepsPerTick largest backlog simulated at once
     * @throws std::invalid_argument for a non-positive dt or step limit
     */
    FixedStepClock(float dt = 1.0f / 60.0f, float fudgeAmount = 0.002f, size_t maxStepsPerTick = 5);

    /**
     * Advances by the wall-clock time since the previous tick.
     * @return number of fixed steps to simulate now
     */
    size_t tick();

    /**
     * Advances by an explicit frame duration; tick() in terms of this.
     * @return number of fixed steps to simulate now
     */
    size_t advance(float elapsedSeconds);

    // Restart timing from the given instant with an empty accumulator
    void setNow(TimePoint now);
    void reset();

    float getDeltaTime() const { return m_dt; }
    float getFudgeAmount() const { return m_fudgeAmount; }
    size_t getMaxStepsPerTick() const { return m_maxStepsPerTick; }
    float getAccumulator() const { return m_accumulator; }

    // Fraction of a step left in the accumulator, for render interpolation
    float getInterpolationAlpha() const;

    // Ticks that hit the stall guard since construction or reset()
    uint64_t getStallCount() const { return m_stallCount; }

    // Frame length after snapping; elapsed unchanged when nothing is close
    float snap(float elapsedSeconds) const;

    /**
     * Sleeps until frameSeconds after the last tick, using SDL's hybrid
     * sleep/spin delay. Returns immediately if the frame is already over.
     */
    void waitForFrame(float frameSeconds) const;

private:
    float m_dt;
    float m_fudgeAmount;
    size_t m_maxStepsPerTick;
    float m_accumulator{0.0f};
    uint64_t m_stallCount{0};
    TimePoint m_lastTick;
};

} // namespace BumperEngine

#endif // FIXED_STEP_CLOCK_HPP
