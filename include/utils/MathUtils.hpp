/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef MATH_UTILS_HPP
#define MATH_UTILS_HPP

#include <algorithm>
#include <cmath>
#include <numbers>

namespace NightCage {

constexpr float PI = std::numbers::pi_v<float>;
constexpr float TWO_PI = 2.0f * PI;

// Wraps an angle into (-PI, PI]
inline float normalizeAngle(float angle) {
    angle = std::fmod(angle, TWO_PI);
    if (angle <= -PI) {
        angle += TWO_PI;
    } else if (angle > PI) {
        angle -= TWO_PI;
    }
    return angle;
}

inline float lerp(float a, float b, float t) {
    return a + (b - a) * t;
}

inline float degreesToRadians(float degrees) {
    return degrees * PI / 180.0f;
}

// Scales a per-frame factor tuned at 60 Hz to an arbitrary step
// e.g. a decay of 0.95 per frame becomes pow(0.95, dt * 60)
inline float perFrameFactor(float factorPerFrame, float deltaTime) {
    return std::pow(factorPerFrame, std::max(0.0f, deltaTime) * 60.0f);
}

} // namespace NightCage

#endif // MATH_UTILS_HPP
