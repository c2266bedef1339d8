/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/SwarmSimulation.hpp"
#include "core/Logger.hpp"
#include <format>

namespace HiveEngine {

SwarmSimulation::SwarmSimulation(const SimulationConfig& config, ITerritoryAuthority& authority)
    : m_config(config),
      m_authority(authority),
      m_registry(config),
      m_scheduler(config.scheduler),
      m_reconciler(authority, config.control),
      m_governor(config.governor) {
    SIMULATION_INFO(std::format("Swarm simulation ready: reconcile every {:.1f}s, autoCorrect {}",
                                m_config.control.reconcileInterval,
                                m_config.control.autoCorrect ? "on" : "off"));
}

void SwarmSimulation::update(float deltaTime, std::span<IWorkerUnit* const> workers,
                             std::span<IProtectorUnit* const> protectors) {
    if (deltaTime < 0.0f) {
        SIMULATION_WARN(std::format("Ignoring negative delta time {}", deltaTime));
        return;
    }
    m_simTime += deltaTime;

    syncUnitsToIndex(workers, protectors);
    m_scheduler.update(m_registry, workers, protectors, deltaTime);

    m_reconcileTimer += deltaTime;
    if (m_reconcileTimer >= m_config.control.reconcileInterval) {
        m_reconcileTimer = 0.0f;
        reconcileNow();
    }

    m_governor.update(deltaTime, m_registry);
    m_registry.reapDeadAgents(m_reapPolicy);
}

const ConsistencyReport& SwarmSimulation::reconcileNow() {
    m_lastReport = m_reconciler.validateConsistency(m_registry);
    if (!m_lastReport.isConsistent()) {
        TERRITORY_WARN(std::format(
            "Control inconsistencies: {} orphaned, {} wrongly controlled, {} duplicated, {} unattributed",
            m_lastReport.orphaned.size(), m_lastReport.wronglyControlled.size(),
            m_lastReport.duplicates.size(), m_lastReport.unattributed.size()));
        if (m_config.control.autoCorrect) {
            m_reconciler.recalculate(m_registry);
        }
    }
    return m_lastReport;
}

ParasiteAgent& SwarmSimulation::spawnAgent(AgentVariant variant, const Vector3D& position) {
    Territory* territory = m_authority.getTerritoryAt(position.getX(), position.getZ());
    const TerritoryID territoryId = territory ? territory->id : INVALID_TERRITORY;

    ParasiteAgent& agent = m_registry.spawnAgent(variant, position, territoryId);
    if (territory && territory->controller && territory->controller->isActive()) {
        territory->controller->addControlledAgent(agent.getId());
    }
    return agent;
}

size_t SwarmSimulation::onControllerDestroyed(TerritoryID territoryId) {
    Territory* territory = m_reconciler.findTerritory(territoryId);
    if (!territory) {
        SIMULATION_WARN(std::format("onControllerDestroyed: unknown territory {}", territoryId));
        return 0;
    }

    const size_t destroyed = m_registry.destroyAgentsInTerritory(m_authority, territoryId);
    if (territory->controller) {
        territory->controller->clearControlledAgents();
        territory->controller->setActive(false);
    }
    territory->status = ControlStatus::Liberated;

    SIMULATION_INFO(std::format("Territory {} liberated, {} agents destroyed", territoryId,
                                destroyed));
    return destroyed;
}

void SwarmSimulation::syncUnitsToIndex(std::span<IWorkerUnit* const> workers,
                                       std::span<IProtectorUnit* const> protectors) {
    if (!mp_spatialIndex) {
        return;
    }

    m_seenWorkers.clear();
    for (IWorkerUnit* worker : workers) {
        if (worker) {
            mp_spatialIndex->updatePosition(worker->getId(), SpatialTag::Worker,
                                            worker->getPosition());
            m_seenWorkers.insert(worker->getId());
        }
    }
    m_seenProtectors.clear();
    for (IProtectorUnit* protector : protectors) {
        if (protector) {
            mp_spatialIndex->updatePosition(protector->getId(), SpatialTag::Protector,
                                            protector->getPosition());
            m_seenProtectors.insert(protector->getId());
        }
    }

    // Units missing from this tick's lists are gone
    dropStaleUnits(m_indexedWorkers, m_seenWorkers, SpatialTag::Worker);
    dropStaleUnits(m_indexedProtectors, m_seenProtectors, SpatialTag::Protector);
}

void SwarmSimulation::dropStaleUnits(UnitSet& indexed, UnitSet& seen, SpatialTag tag) {
    for (UnitID id : indexed) {
        if (seen.count(id) == 0) {
            mp_spatialIndex->remove(id, tag);
        }
    }
    indexed.swap(seen);
}

void SwarmSimulation::clearIndexedUnits() {
    if (mp_spatialIndex) {
        for (UnitID id : m_indexedWorkers) {
            mp_spatialIndex->remove(id, SpatialTag::Worker);
        }
        for (UnitID id : m_indexedProtectors) {
            mp_spatialIndex->remove(id, SpatialTag::Protector);
        }
    }
    m_indexedWorkers.clear();
    m_indexedProtectors.clear();
}

void SwarmSimulation::setSpatialIndex(ChunkSpatialIndex* index) {
    clearIndexedUnits();
    mp_spatialIndex = index;
    m_registry.setSpatialIndex(index);
    m_scheduler.setSpatialIndex(index);
    if (index) {
        m_registry.forEachAgent([index](const ParasiteAgent& agent) {
            index->insert(agent.getId(), spatialTagFor(agent.getVariant()), agent.getPosition());
        });
    }
}

void SwarmSimulation::setViewpointProvider(const IViewpointProvider* provider) {
    m_scheduler.setViewpointProvider(provider);
    m_governor.setViewpointProvider(provider);
}

void SwarmSimulation::setFrameRateSource(const IFrameRateSource* source) {
    m_governor.setFrameRateSource(source);
}

void SwarmSimulation::setTerrainProvider(const ITerrainHeightProvider* terrain) {
    m_scheduler.setTerrainProvider(terrain);
}

SimulationSnapshot SwarmSimulation::collectStatistics() const {
    return m_statistics.collect(m_registry, &m_governor, &m_authority, mp_spatialIndex);
}

} // namespace HiveEngine
