/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MAZE_RANDOM_HPP
#define MAZE_RANDOM_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>

namespace NightCage {

/**
 * Linear congruential stream driving maze generation.
 *
 * state' = (state * 9301 + 49297) mod 233280, sample = state' / 233280.
 * Small and fully reproducible across platforms; every generator call
 * threads one of these by reference so two mazes never share a stream.
 */
class MazeRandom {
public:
    static constexpr uint64_t MULTIPLIER = 9301;
    static constexpr uint64_t INCREMENT = 49297;
    static constexpr uint64_t MODULUS = 233280;

    explicit MazeRandom(uint64_t seed) : m_state(seed) {}

    // Uniform sample in [0, 1)
    double next() {
        m_state = (m_state * MULTIPLIER + INCREMENT) % MODULUS;
        return static_cast<double>(m_state) / static_cast<double>(MODULUS);
    }

    // Seeded Fisher-Yates, consumes N - 1 samples
    template<typename T, size_t N>
    void shuffle(std::array<T, N>& values) {
        for (size_t i = N - 1; i > 0; --i) {
            const size_t j = static_cast<size_t>(next() * static_cast<double>(i + 1));
            std::swap(values[i], values[j]);
        }
    }

    uint64_t getState() const { return m_state; }

private:
    uint64_t m_state;
};

} // namespace NightCage

#endif // MAZE_RANDOM_HPP
