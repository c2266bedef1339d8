/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef FRAME_CLOCK_HPP
#define FRAME_CLOCK_HPP

#include "world/WorldInterfaces.hpp"
#include <SDL3/SDL.h>
#include <cstdint>

namespace HiveEngine {

/**
 * FrameClock drives the simulation loop with a fixed update step and
 * measures the achieved frame rate.
 *
 * Each frame: startFrame(), then shouldUpdate() until it returns false,
 * then endFrame(), which sleeps off the rest of the frame budget. The
 * smoothed fps it measures is what the PerformanceGovernor reads.
 */
class FrameClock : public IFrameRateSource {
public:
    /**
     * Constructor
     * @param targetFPS Frame rate endFrame() limits to (e.g., 60.0f)
     * @param fixedTimestep Simulation step handed out per update in seconds
     */
    explicit FrameClock(float targetFPS = 60.0f, float fixedTimestep = 1.0f / 60.0f);

    /**
     * Call this at the start of each frame
     */
    void startFrame();

    /**
     * Returns true while a fixed update is due. May return true several
     * times per frame to catch up after a slow frame.
     */
    bool shouldUpdate();

    /**
     * Call this at the end of each frame. Delays until the frame budget is used.
     */
    void endFrame();

    /**
     * Feeds one measured frame duration into the fps average.
     * startFrame() calls this; exposed for replaying recorded timings.
     * @param deltaSeconds Frame duration in seconds
     */
    void recordFrameDuration(double deltaSeconds);

    // IFrameRateSource
    float getCurrentFPS() const override { return m_currentFPS; }

    float getUpdateDeltaTime() const { return m_fixedTimestep; }
    float getTargetFPS() const { return m_targetFPS; }
    double getLastFrameSeconds() const { return m_lastDeltaSeconds; }
    uint64_t getFrameCount() const { return m_frameCount; }

    /**
     * Set new target FPS; non-positive values are ignored
     */
    void setTargetFPS(float fps);

    /**
     * Reset timing state (useful when pausing/unpausing)
     */
    void reset();

private:
    float m_targetFPS;
    float m_fixedTimestep;

    Uint64 m_frameStartNs{0};
    Uint64 m_lastFrameNs{0};
    bool m_firstFrame{true};

    double m_accumulator{0.0};
    static constexpr double MAX_ACCUMULATOR = 0.25;   // Clamp against the spiral of death

    double m_lastDeltaSeconds{0.0};
    float m_currentFPS{0.0f};                        // EMA smoothed
    float m_smoothingAlpha{0.03f};
    uint64_t m_frameCount{0};
};

} // namespace HiveEngine

#endif // FRAME_CLOCK_HPP
