/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/AgentRegistry.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>

namespace HiveEngine {

AgentRegistry::AgentRegistry(const SimulationConfig& config) : m_config(config) {
    validateConfig(m_config);
}

ParasiteAgent& AgentRegistry::spawnAgent(AgentVariant variant, const Vector3D& position,
                                         TerritoryID territoryId) {
    const AgentTuning& tuning = m_config.tuningFor(variant);
    const AgentID id = m_idGenerator.generate();

    auto agent = std::make_unique<ParasiteAgent>(id, variant, position, tuning,
                                                 createStrategy(variant, tuning));
    agent->setTerritory(territoryId, position, tuning.territoryRadius);

    ParasiteAgent& ref = *agent;
    m_slotById.emplace(id, m_agents.size());
    m_agents.push_back(std::move(agent));
    ++m_variantCounts[static_cast<size_t>(variant)];
    ++m_counters.spawned;

    if (mp_spatialIndex) {
        mp_spatialIndex->insert(id, spatialTagFor(variant), position);
    }

    REGISTRY_DEBUG(std::format("Spawned {} agent {} at ({:.1f}, {:.1f}) in territory {}",
                               toString(variant), id, position.getX(), position.getZ(),
                               territoryId));
    return ref;
}

bool AgentRegistry::removeAgent(AgentID agentId) {
    auto it = m_slotById.find(agentId);
    if (it == m_slotById.end()) {
        REGISTRY_DEBUG(std::format("removeAgent: unknown agent {}", agentId));
        return false;
    }
    eraseAt(it->second);
    ++m_counters.removed;
    return true;
}

void AgentRegistry::eraseAt(size_t slot) {
    const ParasiteAgent& agent = *m_agents[slot];
    const AgentID id = agent.getId();

    if (mp_spatialIndex) {
        mp_spatialIndex->remove(id, spatialTagFor(agent.getVariant()));
    }
    --m_variantCounts[static_cast<size_t>(agent.getVariant())];
    m_slotById.erase(id);

    // Swap-and-pop, then repair the moved agent's slot
    const size_t last = m_agents.size() - 1;
    if (slot != last) {
        m_agents[slot] = std::move(m_agents[last]);
        m_slotById[m_agents[slot]->getId()] = slot;
    }
    m_agents.pop_back();
}

ParasiteAgent* AgentRegistry::getAgent(AgentID agentId) {
    auto it = m_slotById.find(agentId);
    return it != m_slotById.end() ? m_agents[it->second].get() : nullptr;
}

const ParasiteAgent* AgentRegistry::getAgent(AgentID agentId) const {
    auto it = m_slotById.find(agentId);
    return it != m_slotById.end() ? m_agents[it->second].get() : nullptr;
}

size_t AgentRegistry::reapDeadAgents(ReapPolicy policy) {
    size_t handled = 0;
    size_t slot = 0;
    while (slot < m_agents.size()) {
        ParasiteAgent& agent = *m_agents[slot];
        if (agent.isAlive()) {
            ++slot;
            continue;
        }

        ++handled;
        ++m_counters.destroyed;
        if (agent.hasStarved()) {
            ++m_counters.starved;
        }

        if (policy == ReapPolicy::RespawnAtHome) {
            const Vector3D home = agent.getTerritoryCenter();
            agent.respawn(home);
            if (mp_spatialIndex) {
                mp_spatialIndex->updatePosition(agent.getId(),
                                                spatialTagFor(agent.getVariant()), home);
            }
            ++m_counters.respawned;
            ++slot;
        } else {
            // eraseAt moves the last agent into this slot, so do not advance
            eraseAt(slot);
            ++m_counters.removed;
        }
    }

    if (handled > 0) {
        REGISTRY_DEBUG(std::format("Reaped {} dead agents ({})", handled,
                                   policy == ReapPolicy::Remove ? "removed" : "respawned"));
    }
    return handled;
}

size_t AgentRegistry::destroyAgentsInTerritory(ITerritoryAuthority& authority,
                                               TerritoryID territoryId) {
    size_t killed = 0;
    for (auto& agent : m_agents) {
        if (!agent->isAlive()) {
            continue;
        }
        const Vector3D& pos = agent->getPosition();
        Territory* territory = authority.getTerritoryAt(pos.getX(), pos.getZ());
        if (territory && territory->id == territoryId) {
            agent->takeDamage(agent->getMaxHealth());
            ++killed;
        }
    }

    REGISTRY_INFO(std::format("Destroyed {} agents in territory {}", killed, territoryId));
    return killed;
}

AgentVariant AgentRegistry::selectSpawnVariant(float roll, float adjustment) const {
    const float share = std::clamp(
        m_config.tacticalSpawnShare +
            std::clamp(adjustment, -MAX_SPAWN_ADJUSTMENT, MAX_SPAWN_ADJUSTMENT),
        0.0f, 1.0f);
    return roll < share ? AgentVariant::Tactical : AgentVariant::Basic;
}

size_t AgentRegistry::getAliveCount() const {
    return static_cast<size_t>(std::count_if(
        m_agents.begin(), m_agents.end(),
        [](const std::unique_ptr<ParasiteAgent>& agent) { return agent->isAlive(); }));
}

size_t AgentRegistry::getCountByVariant(AgentVariant variant) const {
    if (variant >= AgentVariant::COUNT) {
        return 0;
    }
    return m_variantCounts[static_cast<size_t>(variant)];
}

void AgentRegistry::clear() {
    if (mp_spatialIndex) {
        for (const auto& agent : m_agents) {
            mp_spatialIndex->remove(agent->getId(), spatialTagFor(agent->getVariant()));
        }
    }
    m_agents.clear();
    m_slotById.clear();
    m_variantCounts.fill(0);
}

} // namespace HiveEngine
