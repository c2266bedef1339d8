/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PERFORMANCE_GOVERNOR_HPP
#define PERFORMANCE_GOVERNOR_HPP

/**
 * @file PerformanceGovernor.hpp
 * @brief Trades agent rendering fidelity for frame rate
 *
 * Every checkInterval seconds the governor reads the current fps and the
 * number of living agents and picks an optimization level:
 * - 0 (None): every agent at Full fidelity
 * - 1 (Basic): fidelity by distance to the viewpoint
 * - 2 (Aggressive): only the top maxActiveAgents by priority stay visible,
 *   where priority is minus the distance plus a bonus for tactical agents
 *
 * The visible-agent cap shrinks while fps stays low and grows back by one
 * per check once fps recovers.
 */

#include "ai/AgentConfig.hpp"
#include "world/WorldInterfaces.hpp"
#include <string>
#include <vector>

namespace HiveEngine {

class AgentRegistry;
class ParasiteAgent;

class PerformanceGovernor {
public:
    struct Stats {
        int optimizationLevel{0};
        std::string levelName;
        int maxActiveAgents{0};
        float lastFps{0.0f};
        size_t aliveAgents{0};
        size_t hiddenAgents{0};      // As of the last fidelity pass
        uint64_t checksPerformed{0};
        uint64_t fidelityPasses{0};
    };

    explicit PerformanceGovernor(const GovernorConfig& config = GovernorConfig{});

    /**
     * @brief Accumulates time and runs a check every checkInterval
     *
     * No-op without a frame-rate source or a viewpoint.
     */
    void update(float deltaTime, AgentRegistry& registry);

    /**
     * @brief Runs a check immediately and restarts the interval
     */
    void forceCheck(AgentRegistry& registry);

    /**
     * @brief Sets the visible-agent cap, clamped to [absoluteMinCap, absoluteMaxCap]
     */
    void setMaxActiveAgents(int maxAgents);

    void setFrameRateSource(const IFrameRateSource* source) { mp_frameRate = source; }
    void setViewpointProvider(const IViewpointProvider* provider) { mp_viewpoint = provider; }

    [[nodiscard]] int getOptimizationLevel() const { return m_level; }
    [[nodiscard]] int getMaxActiveAgents() const { return m_maxActiveAgents; }
    [[nodiscard]] Stats getStats() const;
    [[nodiscard]] const GovernorConfig& getConfig() const { return m_config; }

    static const char* levelName(int level);

private:
    void runCheck(AgentRegistry& registry);
    void applyFidelity(AgentRegistry& registry, const Vector3D& viewpoint);
    FidelityTier tierForDistance(float distance, float reducedBeyond, float minimalBeyond) const;
    int shrunkCap(size_t alive, int floor, float factor) const;

    GovernorConfig m_config;
    const IFrameRateSource* mp_frameRate{nullptr};
    const IViewpointProvider* mp_viewpoint{nullptr};

    int m_level{0};
    int m_maxActiveAgents;
    float m_timer{0.0f};

    float m_lastFps{0.0f};
    size_t m_lastAlive{0};
    size_t m_lastHidden{0};
    uint64_t m_checks{0};
    uint64_t m_fidelityPasses{0};

    struct Ranked {
        ParasiteAgent* agent;
        float priority;
        float distance;
    };
    std::vector<Ranked> m_ranking;   // Reused between passes
};

} // namespace HiveEngine

#endif // PERFORMANCE_GOVERNOR_HPP
