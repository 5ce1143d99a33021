/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/TimestepManager.hpp"
#include <SDL3/SDL.h>
#include <algorithm>

TimestepManager::TimestepManager(float targetFPS)
    : m_targetFPS(targetFPS > 0.0f ? targetFPS : 60.0f)
    , m_targetFrameTime(1.0f / m_targetFPS)
    , m_deltaTime(0.0f)
    , m_lastFrameTimeMs(0)
    , m_lastDeltaSeconds(0.0)
    , m_currentFPS(0.0f)
    , m_smoothingAlpha(0.03f)
    , m_shouldRender(true)
    , m_firstFrame(true)
    , m_usingSoftwareFrameLimiting(false)
{
    auto currentTime = Clock::now();
    m_frameStart = currentTime;
    m_lastFrameTime = currentTime;
}

void TimestepManager::startFrame() {
    startFrame(Clock::now());
}

void TimestepManager::startFrame(Clock::time_point currentTime) {
    m_shouldRender = true;

    if (m_firstFrame) {
        m_firstFrame = false;
        m_lastFrameTime = currentTime;
        m_frameStart = currentTime;
        m_deltaTime = 0.0f;
        return;
    }

    // Calculate frame delta time in seconds
    auto deltaTimeNs = std::chrono::duration_cast<std::chrono::nanoseconds>(currentTime - m_lastFrameTime);
    double deltaTimeMs = static_cast<double>(std::max<int64_t>(0, deltaTimeNs.count())) / 1000000.0;
    m_lastFrameTime = currentTime;
    m_frameStart = currentTime;

    m_lastFrameTimeMs = static_cast<uint32_t>(deltaTimeMs);
    m_lastDeltaSeconds = deltaTimeMs / 1000.0;

    // Clamp so a hitch never turns into one long step through geometry
    m_deltaTime = std::min(static_cast<float>(m_lastDeltaSeconds), MAX_DELTA_SECONDS);

    updateFPS();
}

bool TimestepManager::shouldRender() const {
    return m_shouldRender;
}

float TimestepManager::getUpdateDeltaTime() const {
    return m_deltaTime;
}

void TimestepManager::endFrame() {
    // Mark render as completed for this frame
    m_shouldRender = false;

    limitFrameRate();
}

float TimestepManager::getCurrentFPS() const {
    return m_currentFPS;
}

float TimestepManager::getTargetFPS() const {
    return m_targetFPS;
}

uint32_t TimestepManager::getFrameTimeMs() const {
    return m_lastFrameTimeMs;
}

bool TimestepManager::isFrameTimeExcessive() const {
    // Consider frame time excessive if it's more than 2x target frame time
    return m_lastFrameTimeMs > static_cast<uint32_t>(m_targetFrameTime * 2000.0f);
}

void TimestepManager::setTargetFPS(float fps) {
    if (fps > 0.0f) {
        m_targetFPS = fps;
        m_targetFrameTime = 1.0f / fps;
    }
}

void TimestepManager::reset() {
    m_firstFrame = true;
    m_shouldRender = true;
    m_currentFPS = 0.0f;
    m_deltaTime = 0.0f;
    m_lastDeltaSeconds = 0.0;

    auto currentTime = Clock::now();
    m_frameStart = currentTime;
    m_lastFrameTime = currentTime;
}

void TimestepManager::updateFPS() {
    // EMA-based FPS calculation using high-precision delta time
    if (m_lastDeltaSeconds > 0.0) {
        float instantFPS = static_cast<float>(1.0 / m_lastDeltaSeconds);
        instantFPS = std::clamp(instantFPS, 0.1f, 1000.0f);

        if (m_currentFPS <= 0.0f) {
            m_currentFPS = instantFPS;
        } else {
            m_currentFPS = m_smoothingAlpha * instantFPS + (1.0f - m_smoothingAlpha) * m_currentFPS;
        }
    }
}

void TimestepManager::limitFrameRate() const {
    // With hardware VSync, SDL_RenderPresent() already paces the loop
    if (!m_usingSoftwareFrameLimiting) {
        return;
    }

    int64_t targetFrameNs = static_cast<int64_t>(m_targetFrameTime * 1e9);
    auto targetEndTime = m_frameStart + std::chrono::nanoseconds(targetFrameNs);

    auto now = Clock::now();
    auto remainingNs = std::chrono::duration_cast<std::chrono::nanoseconds>(targetEndTime - now);

    if (remainingNs.count() > 0) {
        SDL_DelayPrecise(static_cast<Uint64>(remainingNs.count()));
    }
}

void TimestepManager::setSoftwareFrameLimiting(bool useSoftwareLimiting) {
    m_usingSoftwareFrameLimiting = useSoftwareLimiting;
}
