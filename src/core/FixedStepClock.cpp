/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/FixedStepClock.hpp"
#include "core/Logger.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

namespace BumperEngine {

FixedStepClock::FixedStepClock(float dt, float fudgeAmount, size_t maxStepsPerTick)
    : m_dt(dt)
    , m_fudgeAmount(fudgeAmount)
    , m_maxStepsPerTick(maxStepsPerTick)
    , m_lastTick(std::chrono::steady_clock::now())
{
    if (!(dt > 0.0f) || !std::isfinite(dt)) {
        throw std::invalid_argument(std::format("FixedStepClock step must be positive: {}", dt));
    }
    if (maxStepsPerTick == 0) {
        throw std::invalid_argument("FixedStepClock needs at least one step per tick");
    }
    if (fudgeAmount < 0.0f) {
        m_fudgeAmount = 0.0f;
    }
}

size_t FixedStepClock::tick() {
    auto now = std::chrono::steady_clock::now();
    auto elapsedNs = std::chrono::duration_cast<std::chrono::nanoseconds>(now - m_lastTick);
    m_lastTick = now;
    return advance(static_cast<float>(static_cast<double>(elapsedNs.count()) / 1e9));
}

size_t FixedStepClock::advance(float elapsedSeconds) {
    float elapsed = snap(std::max(elapsedSeconds, 0.0f));

    // Death spiral guard: drop the backlog and run a single step
    if (elapsed > static_cast<float>(m_maxStepsPerTick) * m_dt) {
        CLOCK_DEBUG(std::format("Frame took {:.3f}s, resetting accumulator", elapsed));
        ++m_stallCount;
        m_accumulator = 0.0f;
        elapsed = m_dt;
    }

    m_accumulator += elapsed;
    auto steps = static_cast<size_t>(m_accumulator / m_dt);
    m_accumulator -= static_cast<float>(steps) * m_dt;
    return steps;
}

float FixedStepClock::snap(float elapsedSeconds) const {
    float elapsed = elapsedSeconds;
    if (m_fudgeAmount <= 0.0f) {
        return elapsed;
    }
    for (float hz : TIME_SNAPS) {
        if (std::abs(elapsedSeconds - 1.0f / hz) < m_fudgeAmount) {
            elapsed = 1.0f / hz;
        }
    }
    return elapsed;
}

void FixedStepClock::setNow(TimePoint now) {
    m_lastTick = now;
    m_accumulator = 0.0f;
}

void FixedStepClock::reset() {
    setNow(std::chrono::steady_clock::now());
    m_stallCount = 0;
}

float FixedStepClock::getInterpolationAlpha() const {
    return std::clamp(m_accumulator / m_dt, 0.0f, 1.0f);
}

void FixedStepClock::waitForFrame(float frameSeconds) const {
    auto target = m_lastTick + std::chrono::nanoseconds(static_cast<int64_t>(frameSeconds * 1e9));
    auto remainingNs = std::chrono::duration_cast<std::chrono::nanoseconds>(
        target - std::chrono::steady_clock::now());

    if (remainingNs.count() > 0) {
        SDL_DelayPrecise(static_cast<Uint64>(remainingNs.count()));
    }
}

} // namespace BumperEngine
