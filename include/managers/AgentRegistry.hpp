/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AGENT_REGISTRY_HPP
#define AGENT_REGISTRY_HPP

/**
 * @file AgentRegistry.hpp
 * @brief Owner of every live ParasiteAgent
 *
 * Agents are created through spawnAgent() and destroyed through
 * removeAgent() or a reapDeadAgents() pass. Everything else (scheduler,
 * reconciler, governor, statistics) holds agent ids or iterates through
 * forEachAgent().
 *
 * When a spatial index is attached, spawned agents are inserted under their
 * variant tag and removed agents are deleted from it.
 */

#include "ai/AgentConfig.hpp"
#include "ai/ParasiteAgent.hpp"
#include "spatial/SpatialIndex.hpp"
#include "utils/UniqueID.hpp"
#include "world/Territory.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

namespace HiveEngine {

class AgentRegistry {
public:
    enum class ReapPolicy : uint8_t {
        Remove,          // Dead agents are deleted
        RespawnAtHome    // Dead agents respawn at their territory center
    };

    struct LifecycleCounters {
        uint64_t spawned{0};
        uint64_t destroyed{0};   // Dead agents collected by reapDeadAgents()
        uint64_t respawned{0};
        uint64_t removed{0};
        uint64_t starved{0};     // Subset of destroyed
    };

    explicit AgentRegistry(const SimulationConfig& config = SimulationConfig{});

    AgentRegistry(const AgentRegistry&) = delete;
    AgentRegistry& operator=(const AgentRegistry&) = delete;

    /**
     * @brief Creates an agent of the given variant with its configured tuning
     * @param variant Basic or Tactical
     * @param position Spawn point, also the agent's territory center
     * @param territoryId Control territory the agent belongs to
     * @return Reference to the new agent, valid until it is removed
     */
    ParasiteAgent& spawnAgent(AgentVariant variant, const Vector3D& position,
                              TerritoryID territoryId = INVALID_TERRITORY);

    /**
     * @brief Deletes an agent
     * @return false if no agent has that id
     */
    bool removeAgent(AgentID agentId);

    [[nodiscard]] ParasiteAgent* getAgent(AgentID agentId);
    [[nodiscard]] const ParasiteAgent* getAgent(AgentID agentId) const;

    /**
     * @brief Collects agents whose health reached zero
     * @param policy Remove them or respawn them at their territory center
     * @return Number of dead agents handled
     */
    size_t reapDeadAgents(ReapPolicy policy);

    /**
     * @brief Kills every living agent standing inside a territory
     *
     * Used when the territory's controller is destroyed. Agents are left in
     * place with zero health for the next reap pass.
     * @return Number of agents killed
     */
    size_t destroyAgentsInTerritory(ITerritoryAuthority& authority, TerritoryID territoryId);

    /**
     * @brief Picks a variant for a new spawn
     * @param roll Uniform sample in [0, 1)
     * @param adjustment Shift of the tactical share, clamped to [-0.1, 0.1]
     */
    [[nodiscard]] AgentVariant selectSpawnVariant(float roll, float adjustment = 0.0f) const;

    template <typename Func>
    void forEachAgent(Func&& func) {
        for (auto& agent : m_agents) {
            func(*agent);
        }
    }

    template <typename Func>
    void forEachAgent(Func&& func) const {
        for (const auto& agent : m_agents) {
            func(static_cast<const ParasiteAgent&>(*agent));
        }
    }

    [[nodiscard]] size_t getAgentCount() const { return m_agents.size(); }
    [[nodiscard]] size_t getAliveCount() const;
    [[nodiscard]] size_t getCountByVariant(AgentVariant variant) const;
    [[nodiscard]] bool empty() const { return m_agents.empty(); }

    [[nodiscard]] const LifecycleCounters& getCounters() const { return m_counters; }
    [[nodiscard]] const SimulationConfig& getConfig() const { return m_config; }

    void setSpatialIndex(ISpatialIndex* index) { mp_spatialIndex = index; }
    [[nodiscard]] ISpatialIndex* getSpatialIndex() const { return mp_spatialIndex; }

    /**
     * @brief Removes all agents without touching the lifecycle counters
     */
    void clear();

private:
    void eraseAt(size_t slot);

    SimulationConfig m_config;
    UniqueID m_idGenerator;

    std::vector<std::unique_ptr<ParasiteAgent>> m_agents;
    std::unordered_map<AgentID, size_t> m_slotById;
    std::array<size_t, static_cast<size_t>(AgentVariant::COUNT)> m_variantCounts{};

    LifecycleCounters m_counters;
    ISpatialIndex* mp_spatialIndex{nullptr};

    static constexpr float MAX_SPAWN_ADJUSTMENT = 0.1f;
};

} // namespace HiveEngine

#endif // AGENT_REGISTRY_HPP
