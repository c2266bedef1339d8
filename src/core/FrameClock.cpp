/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/FrameClock.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>

namespace HiveEngine {

FrameClock::FrameClock(float targetFPS, float fixedTimestep)
    : m_targetFPS(targetFPS)
    , m_fixedTimestep(fixedTimestep)
{
    if (targetFPS <= 0.0f || fixedTimestep <= 0.0f) {
        throw std::invalid_argument(std::format(
            "FrameClock needs positive target fps and timestep, got {} / {}",
            targetFPS, fixedTimestep));
    }
    m_frameStartNs = SDL_GetTicksNS();
    m_lastFrameNs = m_frameStartNs;
}

void FrameClock::startFrame() {
    const Uint64 now = SDL_GetTicksNS();
    ++m_frameCount;

    if (m_firstFrame) {
        m_firstFrame = false;
        m_lastFrameNs = now;
        m_frameStartNs = now;
        return;
    }

    const double deltaSeconds = static_cast<double>(now - m_lastFrameNs) / 1e9;
    m_lastFrameNs = now;
    m_frameStartNs = now;

    m_accumulator += std::min(deltaSeconds, MAX_ACCUMULATOR);
    recordFrameDuration(deltaSeconds);
}

bool FrameClock::shouldUpdate() {
    if (m_accumulator >= m_fixedTimestep) {
        m_accumulator -= m_fixedTimestep;
        return true;
    }
    return false;
}

void FrameClock::endFrame() {
    const Uint64 targetFrameNs = static_cast<Uint64>(1e9 / m_targetFPS);
    const Uint64 elapsed = SDL_GetTicksNS() - m_frameStartNs;
    if (elapsed < targetFrameNs) {
        SDL_DelayPrecise(targetFrameNs - elapsed);
    }
}

void FrameClock::recordFrameDuration(double deltaSeconds) {
    if (deltaSeconds <= 0.0) {
        return;
    }
    m_lastDeltaSeconds = deltaSeconds;

    const float instantFPS = std::clamp(static_cast<float>(1.0 / deltaSeconds), 0.1f, 1000.0f);
    if (m_currentFPS <= 0.0f) {
        m_currentFPS = instantFPS;
    } else {
        m_currentFPS = m_smoothingAlpha * instantFPS + (1.0f - m_smoothingAlpha) * m_currentFPS;
    }
}

void FrameClock::setTargetFPS(float fps) {
    if (fps > 0.0f) {
        m_targetFPS = fps;
    } else {
        FRAMECLOCK_WARN(std::format("Ignoring non-positive target fps {}", fps));
    }
}

void FrameClock::reset() {
    m_accumulator = 0.0;
    m_firstFrame = true;
    m_currentFPS = 0.0f;
    m_lastDeltaSeconds = 0.0;
    m_frameCount = 0;
    m_frameStartNs = SDL_GetTicksNS();
    m_lastFrameNs = m_frameStartNs;
}

} // namespace HiveEngine
