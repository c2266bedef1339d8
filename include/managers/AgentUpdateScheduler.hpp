/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AGENT_UPDATE_SCHEDULER_HPP
#define AGENT_UPDATE_SCHEDULER_HPP

/**
 * @file AgentUpdateScheduler.hpp
 * @brief Per-tick driver that decides which agents update and what they see
 *
 * Each tick:
 * 1. Rebuild the id -> unit lookup for workers and protectors
 * 2. Pick the working set: agents within viewRadius of the viewpoint through
 *    the spatial index, or every agent when no index is attached
 * 3. For each living agent in the working set, gather candidates of the
 *    classes its strategy targets within territoryRadius * searchRadiusMultiplier
 *    of its territory center, then run its update
 * 4. Push the agent's new position back into the index
 *
 * All buffers are owned here and reused across ticks; nothing is retained
 * from one tick to the next.
 */

#include "ai/AgentConfig.hpp"
#include "ai/TargetUnit.hpp"
#include "spatial/SpatialIndex.hpp"
#include "world/WorldInterfaces.hpp"
#include <span>
#include <vector>

namespace HiveEngine {

class AgentRegistry;
class ParasiteAgent;

class AgentUpdateScheduler {
public:
    struct TickStats {
        size_t workingSetSize{0};
        size_t agentsUpdated{0};
        size_t candidatesGathered{0};
        bool usedSpatialIndex{false};
        uint64_t totalTicks{0};
    };

    explicit AgentUpdateScheduler(const SchedulerConfig& config = SchedulerConfig{});

    /**
     * @brief Runs one scheduling pass
     *
     * No-op when the registry is empty or no viewpoint is available.
     * @param registry Agents to update
     * @param workers Worker units alive this tick
     * @param protectors Protector units alive this tick
     * @param deltaTime Simulation seconds to advance
     */
    void update(AgentRegistry& registry, std::span<IWorkerUnit* const> workers,
                std::span<IProtectorUnit* const> protectors, float deltaTime);

    void setSpatialIndex(ISpatialIndex* index) { mp_spatialIndex = index; }
    void setViewpointProvider(const IViewpointProvider* provider) { mp_viewpoint = provider; }
    void setTerrainProvider(const ITerrainHeightProvider* terrain) { mp_terrain = terrain; }

    [[nodiscard]] const TickStats& getLastTickStats() const { return m_stats; }
    [[nodiscard]] const SchedulerConfig& getConfig() const { return m_config; }

private:
    void rebuildLookup(std::span<IWorkerUnit* const> workers,
                       std::span<IProtectorUnit* const> protectors);
    void buildWorkingSet(AgentRegistry& registry, const Vector3D& viewpoint);
    void gatherCandidates(const ParasiteAgent& agent,
                          std::span<IWorkerUnit* const> workers,
                          std::span<IProtectorUnit* const> protectors);

    SchedulerConfig m_config;

    ISpatialIndex* mp_spatialIndex{nullptr};
    const IViewpointProvider* mp_viewpoint{nullptr};
    const ITerrainHeightProvider* mp_terrain{nullptr};

    // Tick-scoped working storage
    UnitLookup m_units;
    CandidateSet m_candidates;
    std::vector<SpatialEntry> m_queryBuffer;
    std::vector<ParasiteAgent*> m_workingSet;

    TickStats m_stats;
};

} // namespace HiveEngine

#endif // AGENT_UPDATE_SCHEDULER_HPP
