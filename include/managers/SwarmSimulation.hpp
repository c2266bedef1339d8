/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SWARM_SIMULATION_HPP
#define SWARM_SIMULATION_HPP

/**
 * @file SwarmSimulation.hpp
 * @brief Top-level facade wiring the swarm subsystems into one tick
 *
 * update() order:
 * 1. Sync worker/protector positions into the spatial index (if attached),
 *    removing units absent from this tick's lists
 * 2. AgentUpdateScheduler pass
 * 3. Every reconcileInterval: validate control, log findings, recalculate
 *    when autoCorrect is set
 * 4. PerformanceGovernor
 * 5. Reap dead agents with the configured policy
 */

#include "ai/AgentConfig.hpp"
#include "managers/AgentRegistry.hpp"
#include "managers/AgentUpdateScheduler.hpp"
#include "managers/PerformanceGovernor.hpp"
#include "managers/StatisticsCollector.hpp"
#include "managers/TerritoryControlReconciler.hpp"
#include <boost/container/flat_set.hpp>
#include <span>

namespace HiveEngine {

class SwarmSimulation {
public:
    /**
     * @param config Validated on construction
     * @param authority Territory source, must outlive the simulation
     * @throws std::invalid_argument on invalid configuration
     */
    SwarmSimulation(const SimulationConfig& config, ITerritoryAuthority& authority);

    SwarmSimulation(const SwarmSimulation&) = delete;
    SwarmSimulation& operator=(const SwarmSimulation&) = delete;

    void update(float deltaTime, std::span<IWorkerUnit* const> workers,
                std::span<IProtectorUnit* const> protectors);

    /**
     * @brief Spawns an agent and attaches it to the active controller of the
     * territory it lands in
     */
    ParasiteAgent& spawnAgent(AgentVariant variant, const Vector3D& position);

    /**
     * @brief Handles the death of a territory's controller
     *
     * Every agent standing in the territory is destroyed, the controller is
     * emptied and deactivated and the territory becomes Liberated. Deleting
     * the controller object is left to the authority's owner.
     * @return Number of agents destroyed
     */
    size_t onControllerDestroyed(TerritoryID territoryId);

    /**
     * @brief Runs a validation pass now, correcting when autoCorrect is set
     */
    const ConsistencyReport& reconcileNow();

    // Collaborators are optional and not owned
    void setSpatialIndex(ChunkSpatialIndex* index);
    void setViewpointProvider(const IViewpointProvider* provider);
    void setFrameRateSource(const IFrameRateSource* source);
    void setTerrainProvider(const ITerrainHeightProvider* terrain);

    void setReapPolicy(AgentRegistry::ReapPolicy policy) { m_reapPolicy = policy; }

    [[nodiscard]] SimulationSnapshot collectStatistics() const;

    [[nodiscard]] AgentRegistry& getRegistry() { return m_registry; }
    [[nodiscard]] const AgentRegistry& getRegistry() const { return m_registry; }
    [[nodiscard]] AgentUpdateScheduler& getScheduler() { return m_scheduler; }
    [[nodiscard]] TerritoryControlReconciler& getReconciler() { return m_reconciler; }
    [[nodiscard]] PerformanceGovernor& getGovernor() { return m_governor; }
    [[nodiscard]] const ConsistencyReport& getLastReport() const { return m_lastReport; }
    [[nodiscard]] float getSimTime() const { return m_simTime; }
    [[nodiscard]] const SimulationConfig& getConfig() const { return m_config; }

private:
    using UnitSet = boost::container::flat_set<UnitID>;

    void syncUnitsToIndex(std::span<IWorkerUnit* const> workers,
                          std::span<IProtectorUnit* const> protectors);
    void dropStaleUnits(UnitSet& indexed, UnitSet& seen, SpatialTag tag);
    void clearIndexedUnits();

    SimulationConfig m_config;
    ITerritoryAuthority& m_authority;

    AgentRegistry m_registry;
    AgentUpdateScheduler m_scheduler;
    TerritoryControlReconciler m_reconciler;
    PerformanceGovernor m_governor;
    StatisticsCollector m_statistics;

    ChunkSpatialIndex* mp_spatialIndex{nullptr};
    UnitSet m_indexedWorkers;       // Units synced into the index last tick
    UnitSet m_indexedProtectors;
    UnitSet m_seenWorkers;
    UnitSet m_seenProtectors;
    AgentRegistry::ReapPolicy m_reapPolicy{AgentRegistry::ReapPolicy::Remove};

    ConsistencyReport m_lastReport;
    float m_reconcileTimer{0.0f};
    float m_simTime{0.0f};
};

} // namespace HiveEngine

#endif // SWARM_SIMULATION_HPP
