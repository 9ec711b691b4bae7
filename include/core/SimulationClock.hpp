/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SIMULATION_CLOCK_HPP
#define SIMULATION_CLOCK_HPP

#include <chrono>
#include <cstdint>

namespace Deadlock {

struct ClockConfig
{
    float tickRate = 60.0f;                       // Fixed simulation ticks per second
    float maxFrameTime = 0.25f;                   // Longest frame (s) fed to the accumulator
    float targetFPS = 60.0f;                      // Frame pacing target when limiting
    bool frameLimiting = false;                   // Sleep in endFrame() until the frame budget is spent
};

/**
 * SimulationClock drives the fixed-timestep loop.
 *
 * Wall-clock frame time is added to an accumulator (clamped to maxFrameTime
 * so a long stall cannot trigger a spiral of death) and drained one fixed
 * step per shouldUpdate(). Ticks therefore never depend on the frame rate.
 *
 * advance() feeds an explicit frame duration instead of measuring one, which
 * makes headless runs and tests fully deterministic.
 */
class SimulationClock {
public:
    /**
     * @throws std::invalid_argument if tickRate, targetFPS or maxFrameTime
     *         is not positive
     */
    explicit SimulationClock(const ClockConfig& config = ClockConfig{});

    // Same checks as the constructor, without building a clock
    static void validateConfig(const ClockConfig& config);

    /**
     * Call this at the start of each frame; measures the time since the last
     * frame and accumulates it.
     */
    void startFrame();

    /**
     * Accumulates an explicit frame duration (seconds), clamped like a
     * measured one. Ignored while paused.
     */
    void advance(double frameSeconds);

    /**
     * Returns true if one fixed tick should run, consuming it from the
     * accumulator. May return true several times per frame for catch-up.
     */
    bool shouldUpdate();

    /**
     * Call this at the end of each frame. Sleeps out the rest of the frame
     * budget when frame limiting is enabled.
     */
    void endFrame() const;

    float getFixedTimestep() const { return m_fixedTimestep; }
    float getTickRate() const { return m_config.tickRate; }

    // Fraction of the next tick already accumulated, in [0, 1]
    double getInterpolationAlpha() const;

    uint64_t getTickCount() const { return m_tickCount; }
    double getElapsedSeconds() const { return static_cast<double>(m_tickCount) * m_fixedTimestep; }
    float getCurrentFPS() const { return m_currentFPS; }

    void pause();
    void resume();
    bool isPaused() const { return m_paused; }

    // Drops accumulated time and restarts frame measurement; tick count is kept
    void reset();

private:
    void updateFPS(double deltaSeconds);

    ClockConfig m_config;
    float m_fixedTimestep;

    std::chrono::high_resolution_clock::time_point m_frameStart;
    std::chrono::high_resolution_clock::time_point m_lastFrameTime;

    double m_accumulator{0.0};
    uint64_t m_tickCount{0};
    float m_currentFPS{0.0f};
    float m_smoothingAlpha{0.03f};
    bool m_firstFrame{true};
    bool m_paused{false};
};

} // namespace Deadlock

#endif // SIMULATION_CLOCK_HPP
