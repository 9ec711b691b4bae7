/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RANDOM_HPP
#define RANDOM_HPP

#include <cstdint>
#include <random>

namespace Deadlock {

/**
 * @brief Seedable random source shared by spawn-point sampling and type draws.
 *
 * One instance lives in the SimulationContext; two simulations built with the
 * same seed and inputs produce identical spawn sequences.
 */
class Random {
public:
    explicit Random(uint64_t seed = 0x5EEDu) : m_seed(seed), m_engine(seed) {}

    void reseed(uint64_t seed) {
        m_seed = seed;
        m_engine.seed(seed);
    }

    uint64_t getSeed() const { return m_seed; }

    // Uniform in [min, max)
    float uniform(float min, float max) {
        if (max <= min) return min;
        std::uniform_real_distribution<float> dist(min, max);
        return dist(m_engine);
    }

    // Uniform in [0, 1)
    float unit() { return uniform(0.0f, 1.0f); }

private:
    uint64_t m_seed;
    std::mt19937_64 m_engine;
};

} // namespace Deadlock

#endif // RANDOM_HPP
