/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/PerformanceGovernor.hpp"
#include "ai/ParasiteAgent.hpp"
#include "core/Logger.hpp"
#include "managers/AgentRegistry.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

namespace HiveEngine {

PerformanceGovernor::PerformanceGovernor(const GovernorConfig& config)
    : m_config(config),
      m_maxActiveAgents(std::clamp(config.initialCap, config.absoluteMinCap,
                                   config.absoluteMaxCap)) {
    if (m_config.checkInterval <= 0.0f) {
        throw std::invalid_argument(std::format(
            "Governor check interval must be positive, got {}", m_config.checkInterval));
    }
}

const char* PerformanceGovernor::levelName(int level) {
    switch (level) {
    case 0:
        return "None";
    case 1:
        return "Basic";
    case 2:
        return "Aggressive";
    default:
        return "Unknown";
    }
}

void PerformanceGovernor::update(float deltaTime, AgentRegistry& registry) {
    m_timer += deltaTime;
    if (m_timer < m_config.checkInterval) {
        return;
    }
    m_timer = 0.0f;
    runCheck(registry);
}

void PerformanceGovernor::forceCheck(AgentRegistry& registry) {
    m_timer = 0.0f;
    runCheck(registry);
}

void PerformanceGovernor::setMaxActiveAgents(int maxAgents) {
    m_maxActiveAgents = std::clamp(maxAgents, m_config.absoluteMinCap, m_config.absoluteMaxCap);
}

int PerformanceGovernor::shrunkCap(size_t alive, int floor, float factor) const {
    const int scaled = static_cast<int>(std::floor(static_cast<float>(alive) * factor));
    const int candidate = std::max(floor, std::min(m_maxActiveAgents - 1, scaled));
    return std::min(m_maxActiveAgents, candidate);
}

void PerformanceGovernor::runCheck(AgentRegistry& registry) {
    if (!mp_frameRate || !mp_viewpoint) {
        return;
    }
    const std::optional<Vector3D> viewpoint = mp_viewpoint->getViewpoint();
    if (!viewpoint) {
        return;
    }

    ++m_checks;
    const float fps = mp_frameRate->getCurrentFPS();
    const size_t alive = registry.getAliveCount();
    m_lastFps = fps;
    m_lastAlive = alive;

    const int previousLevel = m_level;
    const int previousCap = m_maxActiveAgents;

    if (fps < m_config.aggressiveFps &&
        alive > static_cast<size_t>(m_config.aggressiveMinAgents)) {
        m_level = 2;
        m_maxActiveAgents =
            shrunkCap(alive, m_config.aggressiveFloor, m_config.aggressiveCapFactor);
    } else if (fps < m_config.basicFps &&
               alive > static_cast<size_t>(m_config.basicMinAgents)) {
        m_level = 1;
        m_maxActiveAgents = shrunkCap(alive, m_config.basicFloor, m_config.basicCapFactor);
    } else if (fps >= m_config.recoveredFps) {
        m_level = 0;
        if (m_maxActiveAgents < m_config.recoveryCeiling) {
            ++m_maxActiveAgents;
        }
    }
    // Between thresholds the level holds

    if (m_level != previousLevel) {
        GOVERNOR_INFO(std::format("Optimization level {} -> {} at {:.1f} fps with {} agents (cap {})",
                                  levelName(previousLevel), levelName(m_level), fps, alive,
                                  m_maxActiveAgents));
    }

    if (m_level != previousLevel || (m_level == 2 && m_maxActiveAgents != previousCap)) {
        applyFidelity(registry, *viewpoint);
    }
}

FidelityTier PerformanceGovernor::tierForDistance(float distance, float reducedBeyond,
                                                  float minimalBeyond) const {
    if (distance > minimalBeyond) {
        return FidelityTier::Minimal;
    }
    if (distance > reducedBeyond) {
        return FidelityTier::Reduced;
    }
    return FidelityTier::Full;
}

void PerformanceGovernor::applyFidelity(AgentRegistry& registry, const Vector3D& viewpoint) {
    ++m_fidelityPasses;
    m_lastHidden = 0;

    if (m_level == 0) {
        registry.forEachAgent([](ParasiteAgent& agent) { agent.setFidelityTier(FidelityTier::Full); });
        return;
    }

    if (m_level == 1) {
        registry.forEachAgent([&](ParasiteAgent& agent) {
            if (!agent.isAlive()) {
                return;
            }
            const float distance = Vector3D::planarDistance(agent.getPosition(), viewpoint);
            agent.setFidelityTier(tierForDistance(distance, m_config.basicReducedDistance,
                                                  m_config.basicMinimalDistance));
        });
        return;
    }

    m_ranking.clear();
    registry.forEachAgent([&](ParasiteAgent& agent) {
        if (!agent.isAlive()) {
            return;
        }
        const float distance = Vector3D::planarDistance(agent.getPosition(), viewpoint);
        const float bonus =
            agent.getVariant() == AgentVariant::Tactical ? m_config.tacticalPriorityBonus : 0.0f;
        m_ranking.push_back({&agent, bonus - distance, distance});
    });

    std::sort(m_ranking.begin(), m_ranking.end(), [](const Ranked& a, const Ranked& b) {
        if (a.priority != b.priority) {
            return a.priority > b.priority;
        }
        return a.agent->getId() < b.agent->getId();
    });

    const size_t visible = static_cast<size_t>(std::max(0, m_maxActiveAgents));
    for (size_t i = 0; i < m_ranking.size(); ++i) {
        ParasiteAgent& agent = *m_ranking[i].agent;
        if (i < visible) {
            agent.setFidelityTier(tierForDistance(m_ranking[i].distance,
                                                  m_config.aggressiveReducedDistance,
                                                  m_config.aggressiveMinimalDistance));
        } else {
            agent.setFidelityTier(FidelityTier::Hidden);
            ++m_lastHidden;
        }
    }

    GOVERNOR_DEBUG(std::format("Aggressive pass: {} visible, {} hidden",
                               m_ranking.size() - m_lastHidden, m_lastHidden));
}

PerformanceGovernor::Stats PerformanceGovernor::getStats() const {
    Stats stats;
    stats.optimizationLevel = m_level;
    stats.levelName = levelName(m_level);
    stats.maxActiveAgents = m_maxActiveAgents;
    stats.lastFps = m_lastFps;
    stats.aliveAgents = m_lastAlive;
    stats.hiddenAgents = m_lastHidden;
    stats.checksPerformed = m_checks;
    stats.fidelityPasses = m_fidelityPasses;
    return stats;
}

} // namespace HiveEngine
