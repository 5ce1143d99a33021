/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TIMESTEP_MANAGER_HPP
#define TIMESTEP_MANAGER_HPP

#include <cstdint>
#include <chrono>

/**
 * TimestepManager measures frame time and hands out the step used by updates.
 *
 * The game runs one variable update per frame. The step is the measured frame
 * delta clamped to MAX_DELTA_SECONDS, so a stalled frame never moves an entity
 * further than one short step (no tunnelling through thin walls).
 */
class TimestepManager {
public:
    using Clock = std::chrono::high_resolution_clock;

    static constexpr float MAX_DELTA_SECONDS = 0.033f;

    /**
     * Constructor
     * @param targetFPS Target frames per second for software frame limiting
     */
    explicit TimestepManager(float targetFPS = 60.0f);

    /**
     * Call this at the start of each frame
     */
    void startFrame();

    /**
     * Same as startFrame() with an explicit timestamp (deterministic tests)
     */
    void startFrame(Clock::time_point currentTime);

    /**
     * Returns true if rendering should be performed.
     * Typically once per frame.
     */
    bool shouldRender() const;

    /**
     * Gets the clamped delta time for this frame's update
     * @return step in seconds, 0 on the very first frame
     */
    float getUpdateDeltaTime() const;

    /**
     * Unclamped duration of the last frame in seconds
     */
    double getRawDeltaSeconds() const { return m_lastDeltaSeconds; }

    /**
     * Call this at the end of each frame.
     * Handles frame rate limiting via delay when software limiting is active.
     */
    void endFrame();

    /**
     * Get current measured FPS
     * @return current frames per second
     */
    float getCurrentFPS() const;

    /**
     * Get target FPS
     * @return target frames per second
     */
    float getTargetFPS() const;

    /**
     * Get last frame time in milliseconds
     * @return frame time in ms
     */
    uint32_t getFrameTimeMs() const;

    /**
     * Check if the last frame exceeded target time significantly
     * @return true if frame time was excessive
     */
    bool isFrameTimeExcessive() const;

    /**
     * Set new target FPS (updates frame time target)
     * @param fps new target frames per second
     */
    void setTargetFPS(float fps);

    /**
     * Reset timing state (useful when pausing/unpausing)
     */
    void reset();

    /**
     * Explicitly set software frame limiting mode (called from GameEngine)
     * @param useSoftwareLimiting true when VSync is unavailable
     */
    void setSoftwareFrameLimiting(bool useSoftwareLimiting);

    /**
     * Check if software frame limiting is active
     * @return true if using software limiting, false if using hardware VSync
     */
    bool isUsingSoftwareFrameLimiting() const { return m_usingSoftwareFrameLimiting; }

private:
    // Timing configuration
    float m_targetFPS;                    // Target frames per second
    float m_targetFrameTime;              // Target frame time (1/targetFPS)

    Clock::time_point m_frameStart;
    Clock::time_point m_lastFrameTime;

    // Frame statistics
    float m_deltaTime;                    // Clamped step handed to updates
    uint32_t m_lastFrameTimeMs;           // Last frame duration in milliseconds
    double m_lastDeltaSeconds;            // Last frame duration in seconds (high precision for FPS)
    float m_currentFPS;                   // Current measured FPS (EMA smoothed)
    float m_smoothingAlpha;               // EMA smoothing factor (0.05 = stable, 0.1 = responsive)

    // State flags
    bool m_shouldRender;                  // True when render should happen this frame
    bool m_firstFrame;                    // True for the very first frame
    bool m_usingSoftwareFrameLimiting;

    // Helper methods
    void updateFPS();
    void limitFrameRate() const;
};

#endif // TIMESTEP_MANAGER_HPP
