/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/SimulationClock.hpp"
#include "core/Logger.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

namespace Deadlock {

SimulationClock::SimulationClock(const ClockConfig& config)
    : m_config(config)
    , m_fixedTimestep(config.tickRate > 0.0f ? 1.0f / config.tickRate : 0.0f)
{
    validateConfig(config);

    auto currentTime = std::chrono::high_resolution_clock::now();
    m_frameStart = currentTime;
    m_lastFrameTime = currentTime;

    CLOCK_INFO(std::format("Fixed timestep {:.4f}s ({} Hz), frame limiting {}",
                           m_fixedTimestep, config.tickRate, config.frameLimiting ? "on" : "off"));
}

void SimulationClock::validateConfig(const ClockConfig& config) {
    if (!std::isfinite(config.tickRate) || config.tickRate <= 0.0f) {
        throw std::invalid_argument(std::format("Clock tick rate must be positive, got {}", config.tickRate));
    }
    if (!std::isfinite(config.targetFPS) || config.targetFPS <= 0.0f) {
        throw std::invalid_argument(std::format("Clock target FPS must be positive, got {}", config.targetFPS));
    }
    if (!std::isfinite(config.maxFrameTime) || config.maxFrameTime <= 0.0f) {
        throw std::invalid_argument(std::format("Clock max frame time must be positive, got {}", config.maxFrameTime));
    }
}

void SimulationClock::startFrame() {
    auto currentTime = std::chrono::high_resolution_clock::now();

    if (m_firstFrame) {
        m_firstFrame = false;
        m_lastFrameTime = currentTime;
        m_frameStart = currentTime;
        return;
    }

    auto deltaTimeNs = std::chrono::duration_cast<std::chrono::nanoseconds>(currentTime - m_lastFrameTime);
    m_lastFrameTime = currentTime;
    m_frameStart = currentTime;

    const double deltaTime = static_cast<double>(deltaTimeNs.count()) / 1e9;
    updateFPS(deltaTime);
    advance(deltaTime);
}

void SimulationClock::advance(double frameSeconds) {
    if (m_paused || !(frameSeconds > 0.0)) {
        return;
    }
    // Clamp to prevent a spiral of death after a long stall
    m_accumulator += std::min(frameSeconds, static_cast<double>(m_config.maxFrameTime));
}

bool SimulationClock::shouldUpdate() {
    if (m_paused) {
        return false;
    }
    // Tolerance absorbs float/double rounding of 1/tickRate
    if (m_accumulator + 1e-6 >= m_fixedTimestep) {
        m_accumulator = std::max(0.0, m_accumulator - m_fixedTimestep);
        ++m_tickCount;
        return true;
    }
    return false;
}

double SimulationClock::getInterpolationAlpha() const {
    return std::clamp(m_accumulator / m_fixedTimestep, 0.0, 1.0);
}

void SimulationClock::endFrame() const {
    if (!m_config.frameLimiting) {
        return;
    }

    const int64_t targetFrameNs = static_cast<int64_t>(1e9 / m_config.targetFPS);
    auto targetEndTime = m_frameStart + std::chrono::nanoseconds(targetFrameNs);

    auto now = std::chrono::high_resolution_clock::now();
    auto remainingNs = std::chrono::duration_cast<std::chrono::nanoseconds>(targetEndTime - now);

    if (remainingNs.count() > 0) {
        SDL_DelayPrecise(static_cast<Uint64>(remainingNs.count()));
    }
}

void SimulationClock::pause() {
    if (!m_paused) {
        m_paused = true;
        CLOCK_INFO(std::format("Paused at tick {}", m_tickCount));
    }
}

void SimulationClock::resume() {
    if (m_paused) {
        m_paused = false;
        // Time spent paused must not be replayed as catch-up ticks
        reset();
        CLOCK_INFO(std::format("Resumed at tick {}", m_tickCount));
    }
}

void SimulationClock::reset() {
    m_accumulator = 0.0;
    m_firstFrame = true;
    m_currentFPS = 0.0f;

    auto currentTime = std::chrono::high_resolution_clock::now();
    m_frameStart = currentTime;
    m_lastFrameTime = currentTime;
}

void SimulationClock::updateFPS(double deltaSeconds) {
    if (deltaSeconds <= 0.0) {
        return;
    }
    float instantFPS = static_cast<float>(1.0 / deltaSeconds);
    instantFPS = std::clamp(instantFPS, 0.1f, 1000.0f);

    if (m_currentFPS <= 0.0f) {
        m_currentFPS = instantFPS;
    } else {
        m_currentFPS = m_smoothingAlpha * instantFPS + (1.0f - m_smoothingAlpha) * m_currentFPS;
    }
}

} // namespace Deadlock
