/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/AgentUpdateScheduler.hpp"
#include "ai/ParasiteAgent.hpp"
#include "core/Logger.hpp"
#include "managers/AgentRegistry.hpp"
#include <array>
#include <format>
#include <stdexcept>

namespace HiveEngine {

namespace {
constexpr std::array<SpatialTag, 2> AGENT_TAGS{SpatialTag::BasicAgent,
                                               SpatialTag::TacticalAgent};
}

AgentUpdateScheduler::AgentUpdateScheduler(const SchedulerConfig& config)
    : m_config(config) {
    if (m_config.viewRadius <= 0.0f) {
        throw std::invalid_argument(
            std::format("Scheduler view radius must be positive, got {}", m_config.viewRadius));
    }
}

void AgentUpdateScheduler::update(AgentRegistry& registry,
                                  std::span<IWorkerUnit* const> workers,
                                  std::span<IProtectorUnit* const> protectors,
                                  float deltaTime) {
    if (registry.empty() || !mp_viewpoint) {
        return;
    }
    const std::optional<Vector3D> viewpoint = mp_viewpoint->getViewpoint();
    if (!viewpoint) {
        return;
    }

    const uint64_t ticks = m_stats.totalTicks + 1;
    m_stats = TickStats{};
    m_stats.totalTicks = ticks;
    m_stats.usedSpatialIndex = mp_spatialIndex != nullptr;

    rebuildLookup(workers, protectors);
    buildWorkingSet(registry, *viewpoint);
    m_stats.workingSetSize = m_workingSet.size();

    for (ParasiteAgent* agent : m_workingSet) {
        if (!agent->isAlive()) {
            continue;
        }

        gatherCandidates(*agent, workers, protectors);
        m_stats.candidatesGathered += m_candidates.total();

        const AgentUpdateContext ctx{m_candidates, m_units, mp_terrain, deltaTime};
        agent->update(ctx);
        ++m_stats.agentsUpdated;

        if (mp_spatialIndex) {
            mp_spatialIndex->updatePosition(agent->getId(), spatialTagFor(agent->getVariant()),
                                            agent->getPosition());
        }
    }

    SCHEDULER_DEBUG(std::format("Tick {}: {} in working set, {} updated, {} candidates",
                                m_stats.totalTicks, m_stats.workingSetSize,
                                m_stats.agentsUpdated, m_stats.candidatesGathered));
}

void AgentUpdateScheduler::rebuildLookup(std::span<IWorkerUnit* const> workers,
                                         std::span<IProtectorUnit* const> protectors) {
    m_units.clear();
    for (IWorkerUnit* worker : workers) {
        if (worker) {
            m_units.workers[worker->getId()] = worker;
        }
    }
    for (IProtectorUnit* protector : protectors) {
        if (protector) {
            m_units.protectors[protector->getId()] = protector;
        }
    }
}

void AgentUpdateScheduler::buildWorkingSet(AgentRegistry& registry, const Vector3D& viewpoint) {
    m_workingSet.clear();

    if (!mp_spatialIndex) {
        registry.forEachAgent([this](ParasiteAgent& agent) { m_workingSet.push_back(&agent); });
        return;
    }

    m_queryBuffer.clear();
    mp_spatialIndex->queryInRadius(viewpoint, m_config.viewRadius, AGENT_TAGS, m_queryBuffer);
    for (const SpatialEntry& entry : m_queryBuffer) {
        if (ParasiteAgent* agent = registry.getAgent(entry.id)) {
            m_workingSet.push_back(agent);
        }
    }
}

void AgentUpdateScheduler::gatherCandidates(const ParasiteAgent& agent,
                                            std::span<IWorkerUnit* const> workers,
                                            std::span<IProtectorUnit* const> protectors) {
    m_candidates.clear();

    const Vector3D& center = agent.getTerritoryCenter();
    const float searchRadius =
        agent.getTerritoryRadius() * agent.getTuning().searchRadiusMultiplier;

    for (UnitClass unitClass : agent.getStrategy().targetPriorityClasses()) {
        if (mp_spatialIndex) {
            const std::array<SpatialTag, 1> tag{spatialTagFor(unitClass)};
            m_queryBuffer.clear();
            mp_spatialIndex->queryInRadius(center, searchRadius, tag, m_queryBuffer);
            for (const SpatialEntry& entry : m_queryBuffer) {
                if (auto ref = m_units.resolve(TargetKey{unitClass, entry.id})) {
                    if (unitClass == UnitClass::Protector) {
                        m_candidates.protectors.push_back(*ref);
                    } else {
                        m_candidates.workers.push_back(*ref);
                    }
                }
            }
            continue;
        }

        if (unitClass == UnitClass::Protector) {
            for (IProtectorUnit* protector : protectors) {
                if (protector &&
                    Vector3D::planarDistance(protector->getPosition(), center) <= searchRadius) {
                    m_candidates.protectors.push_back(TargetRef::protector(*protector));
                }
            }
        } else {
            for (IWorkerUnit* worker : workers) {
                if (worker &&
                    Vector3D::planarDistance(worker->getPosition(), center) <= searchRadius) {
                    m_candidates.workers.push_back(TargetRef::worker(*worker));
                }
            }
        }
    }
}

} // namespace HiveEngine
